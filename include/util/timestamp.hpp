#pragma once

#include <atomic>
#include <chrono>
#include <ctime>
#include <string>

#include <unistd.h>

namespace ferry::util {

// Local time as "YYYY-mm-dd_HH-MM-SS", used in backup file names
inline std::string getBackupTimestamp() {
    const auto now = std::chrono::system_clock::now();
    const std::time_t now_c = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    localtime_r(&now_c, &tm);
    char buffer[20];
    strftime(buffer, sizeof(buffer), "%Y-%m-%d_%H-%M-%S", &tm);
    return {buffer};
}

// Unique within this host for temp file names: <epoch-us>_<pid>_<counter>
inline std::string getUniqueSuffix() {
    static std::atomic<unsigned int> counter{0};
    const auto us = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return std::to_string(us) + "_" + std::to_string(::getpid()) + "_" + std::to_string(counter++);
}

}
