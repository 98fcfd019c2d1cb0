#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for vigil_core module

#include <cstdint>

namespace vigil_core {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorCode : std::uint8_t;
struct ObserveError;
struct PropertyError;
struct ConfigError;
class Error;

template<typename T, typename E = Error>
class Result;

// =============================================================================
// Logging
// =============================================================================

struct LogConfig;

// =============================================================================
// Configuration
// =============================================================================

enum class DispatchMode : std::uint8_t;
struct ObserveConfig;
struct RuntimeConfig;

} // namespace vigil_core
