#pragma once

#include "sync/model/PlanEntry.hpp"

#include <cstddef>
#include <iostream>
#include <string>
#include <vector>
#include <fmt/color.h>

namespace ferry::cli {

constexpr size_t PREVIEW_DISPLAY_LIMIT = 50;

// User-facing output. Logging goes through LogRegistry, never through here.
class Console {
public:
    explicit Console(std::ostream& out = std::cout, std::istream& in = std::cin, bool color = false);

    void title(const std::string& message);
    void section(const std::string& message);
    void text(const std::string& message);
    void newLine();

    void success(const std::vector<std::string>& lines);
    void warning(const std::vector<std::string>& lines);
    void note(const std::vector<std::string>& lines);
    void error(const std::vector<std::string>& lines);
    void listing(const std::vector<std::string>& items);

    // "Total files to sync: N" followed by at most limit rows and "... and N more"
    void planPreview(const std::vector<sync::model::PlanEntry>& entries, size_t limit = PREVIEW_DISPLAY_LIMIT);

    // "<question> [y/N] "; anything but y/yes (or EOF) answers no
    bool confirm(const std::string& question, bool defaultYes = false);

    [[nodiscard]] bool colored() const { return color_; }

private:
    std::ostream& out_;
    std::istream& in_;
    bool color_;

    [[nodiscard]] std::string styled(const std::string& s, fmt::text_style style) const;
    void block(const std::vector<std::string>& lines, const std::string& prefix);
};

}
