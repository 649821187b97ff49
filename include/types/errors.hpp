#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace ferry::types {

struct ConfigError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

class MissingFieldError : public ConfigError {
public:
    MissingFieldError(const std::string& context, std::string field)
        : ConfigError(context + " missing required field: " + field), field_(std::move(field)) {}

    [[nodiscard]] const std::string& field() const noexcept { return field_; }

private:
    std::string field_;
};

struct StagingError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

class TransferError : public std::runtime_error {
public:
    TransferError(const std::string& what, const int exitCode, std::string stderrText)
        : std::runtime_error(stderrText.empty() ? what + " (exit code " + std::to_string(exitCode) + ")"
                                                : what + " (exit code " + std::to_string(exitCode) + "): " + stderrText),
          exit_code_(exitCode), stderr_text_(std::move(stderrText)) {}

    [[nodiscard]] int exitCode() const noexcept { return exit_code_; }
    [[nodiscard]] const std::string& stderrText() const noexcept { return stderr_text_; }

private:
    int exit_code_;
    std::string stderr_text_;
};

}
