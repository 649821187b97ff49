#pragma once

#include "process/Executor.hpp"

#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace ferry::test {

// Records every command line and answers from a list of (substring, result) rules.
// The first rule whose substring occurs in the command wins; unmatched commands succeed silently.
class FakeExecutor final : public process::Executor {
public:
    std::vector<std::string> commands;
    std::function<void(const std::string&)> onRun;

    void when(std::string needle, process::ProcessResult result) {
        rules_.emplace_back(std::move(needle), std::move(result));
    }

    process::ProcessResult run(const std::string& commandLine) override {
        commands.push_back(commandLine);
        if (onRun) onRun(commandLine);
        for (const auto& [needle, result] : rules_)
            if (commandLine.find(needle) != std::string::npos) return result;
        return {};
    }

    [[nodiscard]] bool ran(const std::string& needle) const {
        for (const auto& c : commands)
            if (c.find(needle) != std::string::npos) return true;
        return false;
    }

private:
    std::vector<std::pair<std::string, process::ProcessResult>> rules_;
};

}
