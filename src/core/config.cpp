/// @file config.cpp
/// @brief Runtime configuration loading for vigil_core

#include <vigil/core/config.hpp>

#include <cstdlib>
#include <fstream>
#include <iterator>
#include <mutex>

namespace vigil_core {

namespace {

std::mutex s_config_mutex;
RuntimeConfig s_current_config;

std::optional<DispatchMode> parse_dispatch_mode(const std::string& str) {
    if (str == "immediate") return DispatchMode::Immediate;
    if (str == "queued") return DispatchMode::Queued;
    return std::nullopt;
}

Result<void> parse_logging(const nlohmann::json& j, LogConfig& out) {
    if (!j.is_object()) {
        return Err(ConfigError::invalid_value("logging", "must be an object"));
    }

    if (j.contains("level")) {
        if (!j["level"].is_string()) {
            return Err(ConfigError::invalid_value("logging.level", "must be a string"));
        }
        auto level = parse_log_level(j["level"].get<std::string>());
        if (!level) {
            return Err(ConfigError::invalid_value("logging.level",
                "unknown level '" + j["level"].get<std::string>() + "'"));
        }
        out.level = *level;
    }
    if (j.contains("console")) {
        if (!j["console"].is_boolean()) {
            return Err(ConfigError::invalid_value("logging.console", "must be a boolean"));
        }
        out.console_enabled = j["console"].get<bool>();
    }
    if (j.contains("file")) {
        if (!j["file"].is_boolean()) {
            return Err(ConfigError::invalid_value("logging.file", "must be a boolean"));
        }
        out.file_enabled = j["file"].get<bool>();
    }
    if (j.contains("directory")) {
        if (!j["directory"].is_string()) {
            return Err(ConfigError::invalid_value("logging.directory", "must be a string"));
        }
        out.log_directory = j["directory"].get<std::string>();
    }
    if (j.contains("max_file_size")) {
        if (!j["max_file_size"].is_number_unsigned()) {
            return Err(ConfigError::invalid_value("logging.max_file_size", "must be a positive integer"));
        }
        out.max_file_size = j["max_file_size"].get<std::size_t>();
    }
    if (j.contains("max_files")) {
        if (!j["max_files"].is_number_unsigned()) {
            return Err(ConfigError::invalid_value("logging.max_files", "must be a positive integer"));
        }
        out.max_files = j["max_files"].get<std::size_t>();
    }
    if (j.contains("channels")) {
        const auto& channels = j["channels"];
        if (!channels.is_object()) {
            return Err(ConfigError::invalid_value("logging.channels", "must be an object"));
        }
        for (const auto& [name, value] : channels.items()) {
            std::string key = "logging.channels." + name;
            auto channel = parse_log_channel(name);
            if (!channel) {
                return Err(ConfigError::invalid_value(key, "unknown channel"));
            }
            if (!value.is_string()) {
                return Err(ConfigError::invalid_value(key, "must be a string"));
            }
            auto level = parse_log_level(value.get<std::string>());
            if (!level) {
                return Err(ConfigError::invalid_value(key,
                    "unknown level '" + value.get<std::string>() + "'"));
            }
            out.channel_levels[*channel] = *level;
        }
    }

    return Ok();
}

Result<void> parse_observe(const nlohmann::json& j, ObserveConfig& out) {
    if (!j.is_object()) {
        return Err(ConfigError::invalid_value("observe", "must be an object"));
    }

    if (j.contains("dispatch")) {
        if (!j["dispatch"].is_string()) {
            return Err(ConfigError::invalid_value("observe.dispatch", "must be a string"));
        }
        auto mode = parse_dispatch_mode(j["dispatch"].get<std::string>());
        if (!mode) {
            return Err(ConfigError::invalid_value("observe.dispatch",
                "expected 'immediate' or 'queued'"));
        }
        out.dispatch = *mode;
    }
    if (j.contains("trace_deliveries")) {
        if (!j["trace_deliveries"].is_boolean()) {
            return Err(ConfigError::invalid_value("observe.trace_deliveries", "must be a boolean"));
        }
        out.trace_deliveries = j["trace_deliveries"].get<bool>();
    }

    return Ok();
}

} // anonymous namespace

const char* dispatch_mode_name(DispatchMode mode) {
    switch (mode) {
        case DispatchMode::Immediate: return "immediate";
        case DispatchMode::Queued: return "queued";
    }
    return "unknown";
}

// =============================================================================
// RuntimeConfig
// =============================================================================

Result<RuntimeConfig> RuntimeConfig::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        return Err<RuntimeConfig>(ConfigError::parse_error("top-level value must be an object"));
    }

    RuntimeConfig config;

    if (j.contains("logging")) {
        auto result = parse_logging(j["logging"], config.logging);
        if (!result) {
            return Err<RuntimeConfig>(result.error());
        }
    }

    if (j.contains("observe")) {
        auto result = parse_observe(j["observe"], config.observe);
        if (!result) {
            return Err<RuntimeConfig>(result.error());
        }
    }

    return config;
}

Result<RuntimeConfig> RuntimeConfig::from_json_string(const std::string& text) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(text);
    } catch (const nlohmann::json::exception& e) {
        return Err<RuntimeConfig>(ConfigError::parse_error(e.what()));
    }
    return from_json(j);
}

Result<RuntimeConfig> RuntimeConfig::load(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        return Err<RuntimeConfig>(ConfigError::io_error(path.string()));
    }

    std::string content((std::istreambuf_iterator<char>(file)),
                        std::istreambuf_iterator<char>());

    auto result = from_json_string(content);
    if (!result) {
        result.error().with_context("path", path.string());
    }
    return result;
}

nlohmann::json RuntimeConfig::to_json() const {
    nlohmann::json channels = nlohmann::json::object();
    for (const auto& [channel, level] : logging.channel_levels) {
        channels[channel_name(channel)] = log_level_name(level);
    }

    nlohmann::json j;
    j["logging"] = {
        {"level", log_level_name(logging.level)},
        {"console", logging.console_enabled},
        {"file", logging.file_enabled},
        {"directory", logging.log_directory},
        {"max_file_size", logging.max_file_size},
        {"max_files", logging.max_files},
        {"channels", channels},
    };
    j["observe"] = {
        {"dispatch", dispatch_mode_name(observe.dispatch)},
        {"trace_deliveries", observe.trace_deliveries},
    };
    return j;
}

Result<void> RuntimeConfig::apply_environment(const std::string& prefix) {
    if (const char* level_str = std::getenv((prefix + "LOG_LEVEL").c_str())) {
        auto level = parse_log_level(level_str);
        if (!level) {
            return Err(ConfigError::invalid_value(prefix + "LOG_LEVEL",
                "unknown level '" + std::string(level_str) + "'"));
        }
        logging.level = *level;
    }

    if (const char* mode_str = std::getenv((prefix + "DISPATCH").c_str())) {
        auto mode = parse_dispatch_mode(mode_str);
        if (!mode) {
            return Err(ConfigError::invalid_value(prefix + "DISPATCH",
                "expected 'immediate' or 'queued'"));
        }
        observe.dispatch = *mode;
    }

    return Ok();
}

void RuntimeConfig::apply() const {
    configure_logging(logging);

    {
        std::lock_guard<std::mutex> lock(s_config_mutex);
        s_current_config = *this;
    }

    core_logger()->debug("Runtime config applied (level={}, dispatch={})",
        log_level_name(logging.level), dispatch_mode_name(observe.dispatch));
}

RuntimeConfig current_config() {
    std::lock_guard<std::mutex> lock(s_config_mutex);
    return s_current_config;
}

} // namespace vigil_core
