#pragma once

#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace blobstrip {

/// Logging system wrapper around spdlog.
class Logger {
public:
    /// Initialize the logging system.
    /// @param level     trace, debug, info, warn, error, critical or off
    /// @param log_file  Also log to this file when non-empty.
    static void init(const std::string& level = "warn",
                     const std::string& log_file = {});

    /// Get the logger instance, initializing it on first use.
    static std::shared_ptr<spdlog::logger> get();

private:
    static std::shared_ptr<spdlog::logger> logger_;
};

} // namespace blobstrip

// Convenience macros
#define BLOBSTRIP_LOG_TRACE(...)    ::blobstrip::Logger::get()->trace(__VA_ARGS__)
#define BLOBSTRIP_LOG_DEBUG(...)    ::blobstrip::Logger::get()->debug(__VA_ARGS__)
#define BLOBSTRIP_LOG_INFO(...)     ::blobstrip::Logger::get()->info(__VA_ARGS__)
#define BLOBSTRIP_LOG_WARN(...)     ::blobstrip::Logger::get()->warn(__VA_ARGS__)
#define BLOBSTRIP_LOG_ERROR(...)    ::blobstrip::Logger::get()->error(__VA_ARGS__)
