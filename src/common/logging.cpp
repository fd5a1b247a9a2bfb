#include "logging.h"

#include <atomic>
#include <mutex>
#include <vector>

#include <absl/strings/ascii.h>
#include <absl/strings/str_cat.h>

namespace ipishield {

namespace {

std::shared_ptr<spdlog::logger> g_logger;
std::mutex g_init_mutex;

}  // namespace

void InitLogging(const LogConfig& config) {
    std::lock_guard<std::mutex> lock(g_init_mutex);
    if (std::atomic_load(&g_logger)) {
        return;
    }
    std::vector<spdlog::sink_ptr> sinks;
    const auto level = static_cast<spdlog::level::level_enum>(config.level);

    spdlog::sink_ptr console_sink;
    if (config.console_to_stderr) {
        console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    } else {
        console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    }
    console_sink->set_level(level);
    sinks.push_back(console_sink);

    if (config.enable_file) {
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.file_path,
            config.max_file_size,
            config.max_files
        );
        file_sink->set_level(level);
        sinks.push_back(file_sink);
    }

    auto logger = std::make_shared<spdlog::logger>(config.name, sinks.begin(), sinks.end());
    logger->set_level(level);
    logger->set_pattern(config.pattern);

    // Flush on warn and above
    logger->flush_on(spdlog::level::warn);

    spdlog::set_default_logger(logger);
    std::atomic_store(&g_logger, logger);
}

std::shared_ptr<spdlog::logger> GetLogger() {
    auto logger = std::atomic_load(&g_logger);
    if (!logger) {
        InitLogging();
        logger = std::atomic_load(&g_logger);
    }
    return logger;
}

void SetLogLevel(LogLevel level) {
    auto logger = GetLogger();
    const auto spd_level = static_cast<spdlog::level::level_enum>(level);
    logger->set_level(spd_level);
    for (auto& sink : logger->sinks()) {
        sink->set_level(spd_level);
    }
}

absl::StatusOr<LogLevel> ParseLogLevel(std::string_view name) {
    const std::string lowered = absl::AsciiStrToLower(std::string(name));
    if (lowered == "trace") return LogLevel::kTrace;
    if (lowered == "debug") return LogLevel::kDebug;
    if (lowered == "info") return LogLevel::kInfo;
    if (lowered == "warn" || lowered == "warning") return LogLevel::kWarn;
    if (lowered == "error") return LogLevel::kError;
    if (lowered == "critical") return LogLevel::kCritical;
    if (lowered == "off") return LogLevel::kOff;
    return absl::InvalidArgumentError(absl::StrCat("Unknown log level: ", std::string(name)));
}

void FlushLogs() {
    if (auto logger = std::atomic_load(&g_logger)) {
        logger->flush();
    }
}

void ShutdownLogging() {
    std::lock_guard<std::mutex> lock(g_init_mutex);
    if (auto logger = std::atomic_load(&g_logger)) {
        logger->flush();
        spdlog::shutdown();
        std::atomic_store(&g_logger, std::shared_ptr<spdlog::logger>());
    }
}

}  // namespace ipishield
