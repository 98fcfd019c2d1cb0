/// @file log.cpp
/// @brief Channel logger registry for vigil_core

#include <vigil/core/log.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include <array>
#include <filesystem>
#include <mutex>
#include <vector>

namespace vigil_core {

namespace {

constexpr std::size_t k_channel_count = 3;

constexpr std::array<LogChannel, k_channel_count> k_channels = {
    LogChannel::Core,
    LogChannel::Observe,
    LogChannel::Source,
};

struct ChannelRegistry {
    std::mutex mutex;
    LogConfig config;
    std::array<std::shared_ptr<spdlog::logger>, k_channel_count> loggers;
};

ChannelRegistry& registry() {
    static ChannelRegistry instance;
    return instance;
}

std::string logger_name(LogChannel channel) {
    return std::string("vigil.") + channel_name(channel);
}

spdlog::level::level_enum level_for(const LogConfig& config, LogChannel channel) {
    auto it = config.channel_levels.find(channel);
    return it != config.channel_levels.end() ? it->second : config.level;
}

/// One sink set per channel; file output goes to <directory>/<logger name>.log
std::vector<spdlog::sink_ptr> make_sinks(const LogConfig& config, const std::string& name) {
    std::vector<spdlog::sink_ptr> sinks;

    if (config.console_enabled) {
        auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console->set_pattern("[%H:%M:%S.%e] [%^%l%$] [%n] %v");
        sinks.push_back(std::move(console));
    }

    if (config.file_enabled && !config.log_directory.empty()) {
        auto path = std::filesystem::path(config.log_directory) / (name + ".log");
        try {
            auto file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                path.string(), config.max_file_size, config.max_files);
            file->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v");
            sinks.push_back(std::move(file));
        } catch (const spdlog::spdlog_ex& e) {
            spdlog::warn("Logging to '{}' disabled: {}", path.string(), e.what());
        }
    }

    return sinks;
}

std::shared_ptr<spdlog::logger> make_logger(const LogConfig& config, LogChannel channel) {
    auto name = logger_name(channel);
    auto sinks = make_sinks(config, name);
    auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_level(level_for(config, channel));

    spdlog::drop(name);
    spdlog::register_logger(logger);
    return logger;
}

} // anonymous namespace

// =============================================================================
// Channels
// =============================================================================

const char* channel_name(LogChannel channel) {
    switch (channel) {
        case LogChannel::Core: return "core";
        case LogChannel::Observe: return "observe";
        case LogChannel::Source: return "source";
    }
    return "unknown";
}

std::optional<LogChannel> parse_log_channel(const std::string& str) {
    for (LogChannel channel : k_channels) {
        if (str == channel_name(channel)) {
            return channel;
        }
    }
    return std::nullopt;
}

// =============================================================================
// Configuration
// =============================================================================

void configure_logging(const LogConfig& config) {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    bool sinks_changed = reg.config.console_enabled != config.console_enabled
        || reg.config.file_enabled != config.file_enabled
        || reg.config.log_directory != config.log_directory
        || reg.config.max_file_size != config.max_file_size
        || reg.config.max_files != config.max_files;
    reg.config = config;

    for (LogChannel channel : k_channels) {
        auto& logger = reg.loggers[static_cast<std::size_t>(channel)];
        if (!logger) {
            continue;
        }
        // Loggers already handed out keep their old sinks; new lookups get the new ones
        if (sinks_changed) {
            logger = make_logger(reg.config, channel);
        } else {
            logger->set_level(level_for(reg.config, channel));
        }
    }
}

std::shared_ptr<spdlog::logger> channel_logger(LogChannel channel) {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    auto& logger = reg.loggers[static_cast<std::size_t>(channel)];
    if (!logger) {
        logger = make_logger(reg.config, channel);
    }
    return logger;
}

// =============================================================================
// Levels
// =============================================================================

void set_channel_level(LogChannel channel, spdlog::level::level_enum level) {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    reg.config.channel_levels[channel] = level;
    if (auto& logger = reg.loggers[static_cast<std::size_t>(channel)]) {
        logger->set_level(level);
    }
}

spdlog::level::level_enum current_log_level() {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);
    return reg.config.level;
}

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str) {
    if (str == "trace") return spdlog::level::trace;
    if (str == "debug") return spdlog::level::debug;
    if (str == "info") return spdlog::level::info;
    if (str == "warn" || str == "warning") return spdlog::level::warn;
    if (str == "error") return spdlog::level::err;
    if (str == "critical") return spdlog::level::critical;
    if (str == "off") return spdlog::level::off;
    return std::nullopt;
}

const char* log_level_name(spdlog::level::level_enum level) {
    switch (level) {
        case spdlog::level::trace: return "trace";
        case spdlog::level::debug: return "debug";
        case spdlog::level::info: return "info";
        case spdlog::level::warn: return "warn";
        case spdlog::level::err: return "error";
        case spdlog::level::critical: return "critical";
        case spdlog::level::off: return "off";
        default: return "unknown";
    }
}

} // namespace vigil_core
