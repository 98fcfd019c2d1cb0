#pragma once

/// @file log.hpp
/// @brief Per-module spdlog channels for vigil
///
/// Every library module logs through its own channel ("vigil.core",
/// "vigil.observe", "vigil.source"). Channels share one sink set built from
/// LogConfig and can be leveled independently, so observer delivery tracing
/// can be turned on without flooding the rest of the output.

#include <spdlog/spdlog.h>

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace vigil_core {

// =============================================================================
// Channels
// =============================================================================

/// Library module that owns a logger
enum class LogChannel : std::uint8_t {
    Core,
    Observe,
    Source,
};

/// Short channel name as used in configuration ("core", "observe", "source")
[[nodiscard]] const char* channel_name(LogChannel channel);

/// Parse a short channel name
[[nodiscard]] std::optional<LogChannel> parse_log_channel(const std::string& str);

// =============================================================================
// Configuration
// =============================================================================

/// Sink and level settings shared by every channel
struct LogConfig {
    spdlog::level::level_enum level = spdlog::level::info;
    /// Overrides of `level` for single channels
    std::map<LogChannel, spdlog::level::level_enum> channel_levels;

    bool console_enabled = true;
    bool file_enabled = false;
    std::string log_directory;
    std::size_t max_file_size = 10 * 1024 * 1024;  // 10 MB
    std::size_t max_files = 5;
};

/// Rebuild the channel sinks and levels from @p config
void configure_logging(const LogConfig& config);

// =============================================================================
// Loggers
// =============================================================================

/// Logger for @p channel, created on first use
[[nodiscard]] std::shared_ptr<spdlog::logger> channel_logger(LogChannel channel);

inline std::shared_ptr<spdlog::logger> core_logger() { return channel_logger(LogChannel::Core); }

/// Observer lifecycle and delivery
inline std::shared_ptr<spdlog::logger> observe_logger() { return channel_logger(LogChannel::Observe); }

/// Property objects and the notification center
inline std::shared_ptr<spdlog::logger> source_logger() { return channel_logger(LogChannel::Source); }

// =============================================================================
// Levels
// =============================================================================

/// Override the level of one channel until the next configure_logging()
void set_channel_level(LogChannel channel, spdlog::level::level_enum level);

/// Level configured for channels without an override
[[nodiscard]] spdlog::level::level_enum current_log_level();

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str);

const char* log_level_name(spdlog::level::level_enum level);

} // namespace vigil_core
