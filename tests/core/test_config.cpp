// vigil_core RuntimeConfig tests

#include <catch2/catch_test_macros.hpp>
#include <vigil/core/config.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace vigil_core;

TEST_CASE("RuntimeConfig defaults", "[core][config]") {
    RuntimeConfig config;
    REQUIRE(config.logging.console_enabled);
    REQUIRE_FALSE(config.logging.file_enabled);
    REQUIRE(config.logging.level == spdlog::level::info);
    REQUIRE(config.observe.dispatch == DispatchMode::Immediate);
    REQUIRE_FALSE(config.observe.trace_deliveries);
}

TEST_CASE("RuntimeConfig parsing", "[core][config]") {
    SECTION("full document") {
        auto result = RuntimeConfig::from_json_string(R"({
            "logging": { "level": "debug", "console": false, "max_files": 2 },
            "observe": { "dispatch": "queued", "trace_deliveries": true }
        })");
        REQUIRE(result.is_ok());
        REQUIRE(result->logging.level == spdlog::level::debug);
        REQUIRE_FALSE(result->logging.console_enabled);
        REQUIRE(result->logging.max_files == 2);
        REQUIRE(result->observe.dispatch == DispatchMode::Queued);
        REQUIRE(result->observe.trace_deliveries);
    }

    SECTION("empty object keeps defaults") {
        auto result = RuntimeConfig::from_json_string("{}");
        REQUIRE(result.is_ok());
        REQUIRE(result->observe.dispatch == DispatchMode::Immediate);
    }

    SECTION("unknown keys are ignored") {
        auto result = RuntimeConfig::from_json_string(R"({"extra": 1, "observe": {"other": true}})");
        REQUIRE(result.is_ok());
    }

    SECTION("malformed text") {
        auto result = RuntimeConfig::from_json_string("{ not json");
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::ParseError);
    }

    SECTION("top level must be an object") {
        auto result = RuntimeConfig::from_json_string("[1, 2]");
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::ParseError);
    }

    SECTION("wrong type") {
        auto result = RuntimeConfig::from_json_string(R"({"logging": {"console": "yes"}})");
        REQUIRE(result.is_err());
        REQUIRE(result.error().as<ConfigError>()->key == "logging.console");
    }

    SECTION("unknown dispatch mode") {
        auto result = RuntimeConfig::from_json_string(R"({"observe": {"dispatch": "later"}})");
        REQUIRE(result.is_err());
        REQUIRE(result.error().as<ConfigError>()->kind == ConfigError::Kind::InvalidValue);
    }

    SECTION("channel levels") {
        auto result = RuntimeConfig::from_json_string(
            R"({"logging": {"level": "warn", "channels": {"observe": "trace"}}})");
        REQUIRE(result.is_ok());
        REQUIRE(result->logging.level == spdlog::level::warn);
        REQUIRE(result->logging.channel_levels.at(LogChannel::Observe) == spdlog::level::trace);
        REQUIRE(result->logging.channel_levels.count(LogChannel::Core) == 0);
    }

    SECTION("unknown channel") {
        auto result = RuntimeConfig::from_json_string(
            R"({"logging": {"channels": {"render": "debug"}}})");
        REQUIRE(result.is_err());
        REQUIRE(result.error().as<ConfigError>()->key == "logging.channels.render");
    }

    SECTION("unknown log level") {
        auto result = RuntimeConfig::from_json_string(R"({"logging": {"level": "loud"}})");
        REQUIRE(result.is_err());
        REQUIRE(result.error().as<ConfigError>()->key == "logging.level");
    }
}

TEST_CASE("RuntimeConfig serialization", "[core][config]") {
    RuntimeConfig config;
    config.logging.level = spdlog::level::warn;
    config.logging.channel_levels[LogChannel::Source] = spdlog::level::debug;
    config.observe.dispatch = DispatchMode::Queued;

    auto reparsed = RuntimeConfig::from_json(config.to_json());
    REQUIRE(reparsed.is_ok());
    REQUIRE(reparsed->logging.level == spdlog::level::warn);
    REQUIRE(reparsed->logging.channel_levels == config.logging.channel_levels);
    REQUIRE(reparsed->observe.dispatch == DispatchMode::Queued);
}

TEST_CASE("RuntimeConfig file loading", "[core][config]") {
    SECTION("missing file") {
        auto result = RuntimeConfig::load("/nonexistent/vigil.json");
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::IOError);
    }

    SECTION("file with parse error carries its path") {
        auto path = std::filesystem::temp_directory_path() / "vigil_config_test_bad.json";
        {
            std::ofstream out(path);
            out << "{ broken";
        }
        auto result = RuntimeConfig::load(path);
        REQUIRE(result.is_err());
        REQUIRE(result.error().get_context("path") != nullptr);
        std::filesystem::remove(path);
    }

    SECTION("valid file") {
        auto path = std::filesystem::temp_directory_path() / "vigil_config_test_ok.json";
        {
            std::ofstream out(path);
            out << R"({"observe": {"dispatch": "queued"}})";
        }
        auto result = RuntimeConfig::load(path);
        REQUIRE(result.is_ok());
        REQUIRE(result->observe.dispatch == DispatchMode::Queued);
        std::filesystem::remove(path);
    }
}

TEST_CASE("RuntimeConfig environment overrides", "[core][config]") {
    RuntimeConfig config;

    SECTION("valid values") {
        ::setenv("VIGILTEST_LOG_LEVEL", "error", 1);
        ::setenv("VIGILTEST_DISPATCH", "queued", 1);
        REQUIRE(config.apply_environment("VIGILTEST_").is_ok());
        REQUIRE(config.logging.level == spdlog::level::err);
        REQUIRE(config.observe.dispatch == DispatchMode::Queued);
    }

    SECTION("invalid value") {
        ::setenv("VIGILTEST_LOG_LEVEL", "shouting", 1);
        ::unsetenv("VIGILTEST_DISPATCH");
        auto result = config.apply_environment("VIGILTEST_");
        REQUIRE(result.is_err());
        REQUIRE(config.logging.level == spdlog::level::info);
    }

    ::unsetenv("VIGILTEST_LOG_LEVEL");
    ::unsetenv("VIGILTEST_DISPATCH");
}

TEST_CASE("RuntimeConfig apply installs current config", "[core][config]") {
    RuntimeConfig config;
    config.observe.trace_deliveries = true;
    config.apply();
    REQUIRE(current_config().observe.trace_deliveries);

    RuntimeConfig{}.apply();
    REQUIRE_FALSE(current_config().observe.trace_deliveries);
}
