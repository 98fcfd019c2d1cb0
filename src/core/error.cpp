/// @file error.cpp
/// @brief Error handling implementation for vigil_core
///
/// The error system is primarily template-based and header-only.
/// This file provides:
/// - Explicit template instantiations for common Result types
/// - Error formatting utilities
/// - Error statistics

#include <vigil/core/error.hpp>
#include <atomic>
#include <sstream>
#include <vector>

namespace vigil_core {

// =============================================================================
// Error Message Formatting
// =============================================================================

namespace detail {

const char* observe_kind_name(ObserveError::Kind kind) {
    switch (kind) {
        case ObserveError::Kind::SourceInvalid: return "SourceInvalid";
        case ObserveError::Kind::DoubleRegistration: return "DoubleRegistration";
        case ObserveError::Kind::UseAfterTeardown: return "UseAfterTeardown";
    }
    return "Unknown";
}

/// Format observation error with full context
std::string format_observe_error(const ObserveError& err) {
    std::ostringstream oss;
    oss << "[ObserveError:" << observe_kind_name(err.kind) << "] " << err.message;

    if (!err.selector.empty()) {
        oss << " (selector: " << err.selector << ")";
    }

    return oss.str();
}

/// Format property error with full context
std::string format_property_error(const PropertyError& err) {
    std::ostringstream oss;
    oss << "[PropertyError] " << err.message;

    if (!err.key.empty()) {
        oss << " (key: " << err.key << ")";
    }

    return oss.str();
}

/// Format config error with full context
std::string format_config_error(const ConfigError& err) {
    std::ostringstream oss;
    oss << "[ConfigError] " << err.message;

    if (!err.key.empty()) {
        oss << " (key: " << err.key << ")";
    }

    return oss.str();
}

} // namespace detail

// =============================================================================
// Error Chain Support
// =============================================================================

/// Build a full error message with context chain
std::string build_error_chain(const Error& error) {
    std::ostringstream oss;

    oss << "[" << error_code_name(error.code()) << "] ";

    std::visit([&oss](const auto& err) {
        using T = std::decay_t<decltype(err)>;
        if constexpr (std::is_same_v<T, std::string>) {
            oss << err;
        } else if constexpr (std::is_same_v<T, ObserveError>) {
            oss << detail::format_observe_error(err);
        } else if constexpr (std::is_same_v<T, PropertyError>) {
            oss << detail::format_property_error(err);
        } else if constexpr (std::is_same_v<T, ConfigError>) {
            oss << detail::format_config_error(err);
        }
    }, error.variant());

    for (const auto& [key, value] : error.context()) {
        oss << " {" << key << "=" << value << "}";
    }

    return oss.str();
}

// =============================================================================
// Explicit Template Instantiations
// =============================================================================

template class Result<void, Error>;
template class Result<bool, Error>;
template class Result<int, Error>;
template class Result<std::int64_t, Error>;
template class Result<double, Error>;
template class Result<std::string, Error>;

// =============================================================================
// Error Statistics (Debug/Development)
// =============================================================================

namespace debug {

/// Global error statistics for debugging
struct ErrorStats {
    std::atomic<std::uint64_t> total_errors{0};
    std::atomic<std::uint64_t> observe_errors{0};
    std::atomic<std::uint64_t> property_errors{0};
    std::atomic<std::uint64_t> config_errors{0};
    std::atomic<std::uint64_t> generic_errors{0};
};

static ErrorStats s_error_stats;

/// Record error occurrence
void record_error(const Error& error) {
    s_error_stats.total_errors.fetch_add(1, std::memory_order_relaxed);

    if (error.is<ObserveError>()) {
        s_error_stats.observe_errors.fetch_add(1, std::memory_order_relaxed);
    } else if (error.is<PropertyError>()) {
        s_error_stats.property_errors.fetch_add(1, std::memory_order_relaxed);
    } else if (error.is<ConfigError>()) {
        s_error_stats.config_errors.fetch_add(1, std::memory_order_relaxed);
    } else {
        s_error_stats.generic_errors.fetch_add(1, std::memory_order_relaxed);
    }
}

/// Get total error count
std::uint64_t total_error_count() {
    return s_error_stats.total_errors.load(std::memory_order_relaxed);
}

std::uint64_t observe_error_count() {
    return s_error_stats.observe_errors.load(std::memory_order_relaxed);
}

/// Reset error statistics
void reset_error_stats() {
    s_error_stats.total_errors.store(0, std::memory_order_relaxed);
    s_error_stats.observe_errors.store(0, std::memory_order_relaxed);
    s_error_stats.property_errors.store(0, std::memory_order_relaxed);
    s_error_stats.config_errors.store(0, std::memory_order_relaxed);
    s_error_stats.generic_errors.store(0, std::memory_order_relaxed);
}

/// Get error statistics as formatted string
std::string error_stats_summary() {
    std::ostringstream oss;
    oss << "Error Statistics:\n"
        << "  Total: " << s_error_stats.total_errors.load() << "\n"
        << "  Observe: " << s_error_stats.observe_errors.load() << "\n"
        << "  Property: " << s_error_stats.property_errors.load() << "\n"
        << "  Config: " << s_error_stats.config_errors.load() << "\n"
        << "  Generic: " << s_error_stats.generic_errors.load() << "\n";
    return oss.str();
}

} // namespace debug

} // namespace vigil_core
