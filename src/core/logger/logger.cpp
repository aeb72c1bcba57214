#include "logger.hpp"
#include <iostream>

namespace Sightline {
namespace Core {

int Logger::level_ = LogLevel::LOG_DEFAULT;

std::mutex Logger::mutex_;

namespace {
constexpr const char* RESET  = "\033[0m";
constexpr const char* GREY   = "\033[90m";
constexpr const char* RED    = "\033[31m";
constexpr const char* GREEN  = "\033[32m";
constexpr const char* YELLOW = "\033[33m";
constexpr const char* BLUE   = "\033[34m";
}  // namespace

void Logger::set_level(int level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
}

int Logger::level() {
    std::lock_guard<std::mutex> lock(mutex_);
    return level_;
}

void Logger::write(int level, const char* color, const char* tag, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level_ & level) {
        std::cerr << color << tag << RESET << message << std::endl;
    }
}

void Logger::debug(const std::string& message) {
    write(LOG_DEBUG, GREY, "[DEBUG] ", message);
}

void Logger::info(const std::string& message) {
    write(LOG_INFO, BLUE, "[INFO] ", message);
}

void Logger::success(const std::string& message) {
    write(LOG_SUCCESS, GREEN, "[SUCCESS] ", message);
}

void Logger::warn(const std::string& message) {
    write(LOG_WARN, YELLOW, "[WARN] ", message);
}

void Logger::error(const std::string& message) {
    write(LOG_ERROR, RED, "[ERROR] ", message);
}

}  // namespace Core
}  // namespace Sightline
