#include "blobstrip/log.h"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>
#include <vector>

namespace blobstrip {

namespace {
std::mutex& logger_mutex() {
    static std::mutex m;
    return m;
}
} // anonymous namespace

std::shared_ptr<spdlog::logger> Logger::logger_;

void Logger::init(const std::string& level, const std::string& log_file) {
    std::vector<spdlog::sink_ptr> sinks;

    // Console sink on stderr; stdout carries reports
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
    sinks.push_back(console_sink);

    // File sink (optional)
    if (!log_file.empty()) {
        auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file);
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
        sinks.push_back(file_sink);
    }

    auto logger = std::make_shared<spdlog::logger>("blobstrip", sinks.begin(), sinks.end());

    if (level == "trace") {
        logger->set_level(spdlog::level::trace);
    } else if (level == "debug") {
        logger->set_level(spdlog::level::debug);
    } else if (level == "info") {
        logger->set_level(spdlog::level::info);
    } else if (level == "error") {
        logger->set_level(spdlog::level::err);
    } else if (level == "critical") {
        logger->set_level(spdlog::level::critical);
    } else if (level == "off") {
        logger->set_level(spdlog::level::off);
    } else {
        logger->set_level(spdlog::level::warn);
    }

    // Flush on error or higher
    logger->flush_on(spdlog::level::err);

    std::lock_guard<std::mutex> lk(logger_mutex());
    logger_ = std::move(logger);
}

std::shared_ptr<spdlog::logger> Logger::get() {
    {
        std::lock_guard<std::mutex> lk(logger_mutex());
        if (logger_) return logger_;
    }
    init();
    std::lock_guard<std::mutex> lk(logger_mutex());
    return logger_;
}

} // namespace blobstrip
