#pragma once

/// @file selector.hpp
/// @brief What an observer watches on a source

#include "fwd.hpp"
#include <spdlog/fmt/fmt.h>

#include <optional>
#include <string>
#include <utility>

namespace vigil_observe {

// =============================================================================
// SenderId
// =============================================================================

/// Identity of an event origin. Compares by address, never by payload.
struct SenderId {
    const void* address = nullptr;

    constexpr SenderId() = default;
    constexpr explicit SenderId(const void* ptr) : address(ptr) {}

    /// Identity of an object
    template<typename T>
    [[nodiscard]] static SenderId of(const T& object) noexcept {
        return SenderId(static_cast<const void*>(&object));
    }

    [[nodiscard]] constexpr bool is_null() const noexcept { return address == nullptr; }

    constexpr bool operator==(const SenderId&) const noexcept = default;
};

// =============================================================================
// Selector
// =============================================================================

/// Property key or event name, plus an optional sender filter
struct Selector {
    std::string key;
    std::optional<SenderId> sender;

    Selector() = default;
    Selector(std::string k) : key(std::move(k)) {}
    Selector(const char* k) : key(k) {}
    Selector(std::string k, SenderId from) : key(std::move(k)), sender(from) {}
    Selector(std::string k, std::optional<SenderId> from) : key(std::move(k)), sender(from) {}

    /// True when an event from @p origin passes the sender filter
    [[nodiscard]] bool accepts(SenderId origin) const noexcept {
        return !sender.has_value() || *sender == origin;
    }

    /// Human-readable form for logs and errors
    [[nodiscard]] std::string describe() const {
        if (!sender) {
            return key;
        }
        return fmt::format("{}@{}", key, sender->address);
    }
};

} // namespace vigil_observe
