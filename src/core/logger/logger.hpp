#pragma once
#include <mutex>
#include <string>

namespace Sightline {
namespace Core {

enum LogLevel {
    LOG_NONE    = 0,
    LOG_DEBUG   = 1 << 0,
    LOG_INFO    = 1 << 1,
    LOG_WARN    = 1 << 2,
    LOG_ERROR   = 1 << 3,
    LOG_SUCCESS = 1 << 4,
    LOG_DEFAULT = LOG_INFO | LOG_WARN | LOG_ERROR | LOG_SUCCESS,
    LOG_ALL     = LOG_DEBUG | LOG_DEFAULT
};

// All output goes to stderr; stdout is reserved for the report.
class Logger {
public:
    static void set_level(int level);
    static int  level();

    static void debug(const std::string& message);
    static void info(const std::string& message);
    static void success(const std::string& message);
    static void warn(const std::string& message);
    static void error(const std::string& message);

private:
    static void write(int level, const char* color, const char* tag, const std::string& message);

    static int        level_;
    static std::mutex mutex_;
};

}  // namespace Core
}  // namespace Sightline
