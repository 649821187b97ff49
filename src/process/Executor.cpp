#include "process/Executor.hpp"
#include "logging/LogRegistry.hpp"
#include "types/errors.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <regex>
#include <stdexcept>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

using namespace ferry::process;
using namespace ferry::logging;
using namespace ferry::types;

namespace {

const std::regex PASSWORD_ARG{R"(--password=('[^']*'|\S*))"};
constexpr auto MASKED_PASSWORD = "--password=***";

// ssh wrapping nests at most a couple of levels
constexpr int MAX_QUOTING_DEPTH = 4;

// What one more level of single-quoting turns text into
std::string requote(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (const char c : text) {
        if (c == '\'') out += "'\\''";
        else out += c;
    }
    return out;
}

void replaceAll(std::string& text, const std::string& from, const std::string& to) {
    for (size_t pos = text.find(from); pos != std::string::npos; pos = text.find(from, pos + to.size()))
        text.replace(pos, from.size(), to);
}

struct Pipe {
    int fds[2]{-1, -1};

    Pipe() {
        if (pipe2(fds, O_CLOEXEC) != 0)
            throw std::runtime_error(std::string("pipe2 failed: ") + std::strerror(errno));
    }

    ~Pipe() {
        closeRead();
        closeWrite();
    }

    Pipe(const Pipe&) = delete;
    Pipe& operator=(const Pipe&) = delete;

    [[nodiscard]] int readEnd() const { return fds[0]; }
    [[nodiscard]] int writeEnd() const { return fds[1]; }

    void closeRead() { if (fds[0] >= 0) { ::close(fds[0]); fds[0] = -1; } }
    void closeWrite() { if (fds[1] >= 0) { ::close(fds[1]); fds[1] = -1; } }
};

void drain(Pipe& out, Pipe& err, std::string& outText, std::string& errText) {
    std::array<pollfd, 2> fds{{{out.readEnd(), POLLIN, 0}, {err.readEnd(), POLLIN, 0}}};
    std::array<std::string*, 2> sinks{&outText, &errText};
    std::array<char, 4096> buf{};

    size_t open = 2;
    while (open > 0) {
        const int rc = ::poll(fds.data(), fds.size(), -1);
        if (rc < 0) {
            if (errno == EINTR) continue;
            throw std::runtime_error(std::string("poll failed: ") + std::strerror(errno));
        }

        for (size_t i = 0; i < fds.size(); ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0) continue;

            const ssize_t n = ::read(fds[i].fd, buf.data(), buf.size());
            if (n > 0) {
                sinks[i]->append(buf.data(), static_cast<size_t>(n));
                continue;
            }
            if (n < 0 && (errno == EINTR || errno == EAGAIN)) continue;

            fds[i].fd = -1;  // EOF or error, stop watching
            --open;
        }
    }
}

}

std::string ferry::process::redact(const std::string& commandLine, const std::vector<std::string>& secrets) {
    auto out = commandLine;
    for (const auto& secret : secrets) {
        if (secret.empty()) continue;
        auto arg = "--password='" + requote(secret) + "'";
        for (int depth = 0; depth < MAX_QUOTING_DEPTH; ++depth) {
            replaceAll(out, arg, MASKED_PASSWORD);
            arg = requote(arg);
        }
    }
    return std::regex_replace(out, PASSWORD_ARG, MASKED_PASSWORD);
}

void Executor::addSecret(const std::string& secret) {
    if (secret.empty() || std::ranges::find(secrets_, secret) != secrets_.end()) return;
    secrets_.push_back(secret);
}

std::string Executor::redacted(const std::string& commandLine) const {
    return redact(commandLine, secrets_);
}

ProcessResult Executor::check(const std::string& commandLine, const std::string& what) {
    auto result = run(commandLine);
    if (!result.ok()) {
        LogRegistry::cmd()->error("[Executor] {} failed with exit code {}: {}", what, result.exit_code, result.stderr_text);
        throw TransferError(what, result.exit_code, result.stderr_text);
    }
    return result;
}

ProcessResult ShellExecutor::run(const std::string& commandLine) {
    LogRegistry::cmd()->debug("[ShellExecutor] Running: {}", redacted(commandLine));

    Pipe out, err;

    const pid_t pid = ::fork();
    if (pid < 0) throw std::runtime_error(std::string("fork failed: ") + std::strerror(errno));

    if (pid == 0) {
        // child: stdin from /dev/null, stdout/stderr into the pipes
        const int devNull = ::open("/dev/null", O_RDONLY);
        if (devNull < 0 || ::dup2(devNull, STDIN_FILENO) < 0) _exit(EC_CHILD_LAUNCH_FAILED);
        if (::dup2(out.writeEnd(), STDOUT_FILENO) < 0) _exit(EC_CHILD_LAUNCH_FAILED);
        if (::dup2(err.writeEnd(), STDERR_FILENO) < 0) _exit(EC_CHILD_LAUNCH_FAILED);

        ::execl("/bin/sh", "sh", "-c", commandLine.c_str(), static_cast<char*>(nullptr));
        _exit(EC_CHILD_LAUNCH_FAILED);
    }

    out.closeWrite();
    err.closeWrite();

    ProcessResult result;
    drain(out, err, result.stdout_text, result.stderr_text);

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) throw std::runtime_error(std::string("waitpid failed: ") + std::strerror(errno));
    }

    if (WIFEXITED(status)) result.exit_code = WEXITSTATUS(status);
    else if (WIFSIGNALED(status)) result.exit_code = 128 + WTERMSIG(status);
    else result.exit_code = EC_CHILD_LAUNCH_FAILED;

    LogRegistry::cmd()->debug("[ShellExecutor] Exit code {}", result.exit_code);
    return result;
}
