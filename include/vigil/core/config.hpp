#pragma once

/// @file config.hpp
/// @brief Runtime configuration for vigil
///
/// Configuration is read from a JSON document:
/// @code
/// {
///   "logging": { "level": "debug", "console": true, "file": false,
///                "directory": "logs", "max_file_size": 1048576, "max_files": 3,
///                "channels": { "observe": "trace" } },
///   "observe": { "dispatch": "immediate", "trace_deliveries": false }
/// }
/// @endcode
/// Every section and key is optional. Unknown keys are ignored.

#include "fwd.hpp"
#include "error.hpp"
#include "log.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <string>

namespace vigil_core {

// =============================================================================
// DispatchMode
// =============================================================================

/// Where observers deliver when no dispatcher is injected
enum class DispatchMode : std::uint8_t {
    Immediate,  ///< On the thread that emitted the event
    Queued,     ///< Deferred until the owning queue is drained
};

[[nodiscard]] const char* dispatch_mode_name(DispatchMode mode);

// =============================================================================
// Config Sections
// =============================================================================

/// Observer defaults
struct ObserveConfig {
    DispatchMode dispatch = DispatchMode::Immediate;
    /// Log every delivery at trace level
    bool trace_deliveries = false;
};

/// Complete runtime configuration
struct RuntimeConfig {
    LogConfig logging;
    ObserveConfig observe;

    /// Parse from a JSON document
    [[nodiscard]] static Result<RuntimeConfig> from_json(const nlohmann::json& j);

    /// Parse from JSON text
    [[nodiscard]] static Result<RuntimeConfig> from_json_string(const std::string& text);

    /// Load from a JSON file
    [[nodiscard]] static Result<RuntimeConfig> load(const std::filesystem::path& path);

    /// Serialize to JSON
    [[nodiscard]] nlohmann::json to_json() const;

    /// Override values from environment variables (<prefix>LOG_LEVEL, <prefix>DISPATCH)
    Result<void> apply_environment(const std::string& prefix = "VIGIL_");

    /// Apply logging settings and install this config as the process default
    void apply() const;
};

/// Get the config installed by the last RuntimeConfig::apply() (defaults otherwise)
[[nodiscard]] RuntimeConfig current_config();

} // namespace vigil_core
