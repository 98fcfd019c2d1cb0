#pragma once

/// @file subscription.hpp
/// @brief Registration tokens, delivery gates and the RAII subscription handle

#include "fwd.hpp"
#include <vigil/core/error.hpp>

#include <atomic>
#include <compare>
#include <cstdint>
#include <functional>
#include <memory>
#include <utility>

namespace vigil_observe {

// =============================================================================
// RegistrationToken
// =============================================================================

/// Opaque identifier returned by an event source for one registration
struct RegistrationToken {
    std::uint64_t id = 0;

    constexpr RegistrationToken() = default;
    constexpr explicit RegistrationToken(std::uint64_t value) : id(value) {}

    [[nodiscard]] constexpr bool is_valid() const noexcept { return id != 0; }

    constexpr auto operator<=>(const RegistrationToken&) const noexcept = default;
    constexpr bool operator==(const RegistrationToken&) const noexcept = default;
};

// =============================================================================
// DeliveryGate
// =============================================================================

/// Liveness flag for one registration (one generation of an observer).
///
/// Every delivery runs through deliver(). Once close() has returned no new
/// delivery begins. A delivery already past the check may still complete;
/// close() never waits for it, so no lock is held while user code runs.
class DeliveryGate {
public:
    DeliveryGate() = default;

    DeliveryGate(const DeliveryGate&) = delete;
    DeliveryGate& operator=(const DeliveryGate&) = delete;

    /// Run @p func if the gate is still open
    /// @return true if @p func ran
    template<typename F>
    bool deliver(F&& func) {
        if (!m_open.load(std::memory_order_acquire)) {
            return false;
        }
        std::forward<F>(func)();
        return true;
    }

    /// Refuse new deliveries. Never blocks.
    void close() noexcept {
        m_open.store(false, std::memory_order_release);
    }

    [[nodiscard]] bool is_open() const noexcept {
        return m_open.load(std::memory_order_acquire);
    }

private:
    std::atomic<bool> m_open{true};
};

// =============================================================================
// SubscriptionHandle
// =============================================================================

/// Owns one live registration: its token, its gate, and the means to cancel it.
///
/// Move-only. Destruction cancels. Cancelling closes the gate before the
/// source is asked to unregister, so no delivery begins once cancel()
/// returns even if the source's own unregistration is asynchronous.
class SubscriptionHandle {
public:
    using CancelFn = std::function<void(RegistrationToken)>;

    SubscriptionHandle() = default;
    SubscriptionHandle(RegistrationToken token, std::shared_ptr<DeliveryGate> gate, CancelFn cancel);
    ~SubscriptionHandle();

    SubscriptionHandle(SubscriptionHandle&& other) noexcept;
    SubscriptionHandle& operator=(SubscriptionHandle&& other) noexcept;

    SubscriptionHandle(const SubscriptionHandle&) = delete;
    SubscriptionHandle& operator=(const SubscriptionHandle&) = delete;

    /// Take over @p other's registration.
    /// Fails with DoubleRegistration (and cancels @p other) if this handle is
    /// still active.
    [[nodiscard]] vigil_core::Result<void> adopt(SubscriptionHandle&& other);

    /// Cancel the registration. Idempotent.
    void cancel();

    /// True while a registration is held
    [[nodiscard]] bool is_active() const noexcept { return m_token.is_valid(); }

    [[nodiscard]] RegistrationToken token() const noexcept { return m_token; }

    [[nodiscard]] const std::shared_ptr<DeliveryGate>& gate() const noexcept { return m_gate; }

    explicit operator bool() const noexcept { return is_active(); }

private:
    RegistrationToken m_token;
    std::shared_ptr<DeliveryGate> m_gate;
    CancelFn m_cancel;
};

} // namespace vigil_observe
