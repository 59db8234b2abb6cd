#include "loom/log.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <filesystem>
#include <mutex>
#include <optional>

namespace loom {
namespace log {

namespace {

constexpr const char* kLoggerName = "loom";
constexpr const char* kPattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v";

std::mutex g_mutex;
std::shared_ptr<spdlog::logger> g_logger;

std::optional<spdlog::level::level_enum> parse_level(const std::string& level) {
    if (level == "trace") return spdlog::level::trace;
    if (level == "debug") return spdlog::level::debug;
    if (level == "info") return spdlog::level::info;
    if (level == "warn") return spdlog::level::warn;
    if (level == "error" || level == "err") return spdlog::level::err;
    if (level == "critical") return spdlog::level::critical;
    if (level == "off") return spdlog::level::off;
    return std::nullopt;
}

Error unknown_level(const std::string& level) {
    return Error{ErrorCode::InvalidConfig, "Unknown log level: " + level};
}

}  // namespace

std::shared_ptr<spdlog::logger> get_logger() {
    std::lock_guard<std::mutex> lock(g_mutex);
    if (!g_logger) {
        g_logger = spdlog::get(kLoggerName);
        if (!g_logger) {
            g_logger = spdlog::stderr_color_mt(kLoggerName);
            g_logger->set_pattern(kPattern);
            g_logger->set_level(spdlog::level::warn);
        }
    }
    return g_logger;
}

Expected<void> init_log(const std::string& path, const std::string& level) {
    auto log_level = parse_level(level);
    if (!log_level) {
        return tl::unexpected(unknown_level(level));
    }

    try {
        namespace fs = std::filesystem;
        const fs::path log_path(path);
        if (log_path.has_parent_path()) {
            std::error_code ec;
            fs::create_directories(log_path.parent_path(), ec);
            if (ec) {
                return tl::unexpected(Error{
                    ErrorCode::InvalidConfig,
                    "Cannot create log directory",
                    log_path.parent_path().string() + ": " + ec.message()
                });
            }
        }

        auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path, true);
        auto logger = std::make_shared<spdlog::logger>(kLoggerName, file_sink);
        logger->set_level(*log_level);
        logger->set_pattern(kPattern);
        logger->flush_on(spdlog::level::warn);

        std::lock_guard<std::mutex> lock(g_mutex);
        spdlog::drop(kLoggerName);
        spdlog::register_logger(logger);
        spdlog::set_default_logger(logger);
        g_logger = logger;
    } catch (const spdlog::spdlog_ex& ex) {
        return tl::unexpected(Error{ErrorCode::InvalidConfig, "Failed to initialize logging", ex.what()});
    }

    get_logger()->info("logging to {}", path);
    return {};
}

Expected<void> set_level(const std::string& level) {
    auto log_level = parse_level(level);
    if (!log_level) {
        return tl::unexpected(unknown_level(level));
    }
    get_logger()->set_level(*log_level);
    return {};
}

}  // namespace log
}  // namespace loom
