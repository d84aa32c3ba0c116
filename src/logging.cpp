// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <mutex>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <vector>
#include <wsbridge/logging.hpp>

namespace wsbridge
{

namespace
{

constexpr size_t kMaxLogFileSize = 10 * 1024 * 1024;
constexpr size_t kMaxLogFiles = 3;
constexpr const char* kLogPattern = "%Y-%m-%d %H:%M:%S.%e [%n] [%^%l%$] [t%t] %v";

std::mutex& logger_mutex()
{
    static std::mutex mutex;
    return mutex;
}

std::shared_ptr<spdlog::logger>& logger_slot()
{
    static std::shared_ptr<spdlog::logger> instance;
    return instance;
}

std::shared_ptr<spdlog::logger> make_stderr_logger()
{
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto log = std::make_shared<spdlog::logger>(kLoggerName, sink);
    log->set_pattern(kLogPattern);
    log->set_level(spdlog::level::info);
    return log;
}

} // namespace

std::shared_ptr<spdlog::logger> logger()
{
    std::lock_guard<std::mutex> lock(logger_mutex());
    auto& slot = logger_slot();
    if (!slot)
        slot = make_stderr_logger();
    return slot;
}

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& name)
{
    // spdlog maps unknown names to "off"; only accept "off" when asked for
    auto level = spdlog::level::from_str(name);
    if (level == spdlog::level::off && name != "off")
        return std::nullopt;
    return level;
}

void init_logging(const LoggingOptions& options)
{
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    if (options.file)
        sinks.push_back(
            std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                *options.file, kMaxLogFileSize, kMaxLogFiles
            )
        );

    auto log = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
    log->set_pattern(kLogPattern);

    auto level = parse_log_level(options.level);
    log->set_level(level.value_or(spdlog::level::info));
    log->flush_on(spdlog::level::warn);

    {
        std::lock_guard<std::mutex> lock(logger_mutex());
        logger_slot() = log;
    }

    if (!level)
        log->warn("Unknown log level '{}', using info", options.level);
}

} // namespace wsbridge
