#pragma once

#include <string>
#include <vector>

namespace ferry::process {

// Exit code reported when the child could not be started at all
constexpr int EC_CHILD_LAUNCH_FAILED = 120;

struct ProcessResult {
    int exit_code = 0;
    std::string stdout_text;
    std::string stderr_text;

    [[nodiscard]] bool ok() const { return exit_code == 0; }
};

class Executor {
public:
    virtual ~Executor() = default;

    // Runs a fully quoted command line through the shell and blocks until it exits.
    virtual ProcessResult run(const std::string& commandLine) = 0;

    // run() that throws TransferError("<what> failed ...") on a non-zero exit
    ProcessResult check(const std::string& commandLine, const std::string& what);

    // Registers a password whose --password= argument is masked in logged command lines
    void addSecret(const std::string& secret);

    // commandLine as it may appear in logs
    [[nodiscard]] std::string redacted(const std::string& commandLine) const;

private:
    std::vector<std::string> secrets_;
};

class ShellExecutor final : public Executor {
public:
    ProcessResult run(const std::string& commandLine) override;
};

// Masks the value of every --password=... argument for logging. Known secrets are
// also found inside commands that were quoted again for a remote shell.
std::string redact(const std::string& commandLine, const std::vector<std::string>& secrets = {});

}
