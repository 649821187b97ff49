#include "sync/SyncLock.hpp"
#include "logging/LogRegistry.hpp"

#include <cerrno>
#include <cctype>
#include <cstring>
#include <stdexcept>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

using namespace ferry::sync;
using namespace ferry::logging;

namespace {

// Environment names go into the file name as-is, anything else becomes '_'
std::string sanitize(const std::string& name) {
    std::string out = name;
    for (auto& c : out)
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-' && c != '_') c = '_';
    return out;
}

}

SyncLock::SyncLock(const std::string& source, const std::string& destination, const std::filesystem::path& lockDir)
    : path_(lockDir / ("ferry-" + sanitize(source) + "-" + sanitize(destination) + ".lock")) {
    fd_ = ::open(path_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0600);
    if (fd_ < 0) throw std::runtime_error("Failed to open lock file " + path_.string() + ": " + std::strerror(errno));

    if (::flock(fd_, LOCK_EX | LOCK_NB) != 0) {
        const int err = errno;
        ::close(fd_);
        fd_ = -1;
        if (err == EWOULDBLOCK)
            throw std::runtime_error("Another sync between " + source + " and " + destination + " is already running");
        throw std::runtime_error("Failed to lock " + path_.string() + ": " + std::strerror(err));
    }

    LogRegistry::sync()->debug("[SyncLock] Acquired {}", path_.string());
}

SyncLock::~SyncLock() {
    if (fd_ < 0) return;
    ::flock(fd_, LOCK_UN);
    ::close(fd_);
}
