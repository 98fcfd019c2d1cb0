/// @file subscription.cpp
/// @brief SubscriptionHandle implementation

#include <vigil/observe/subscription.hpp>
#include <vigil/core/log.hpp>

#include <utility>

namespace vigil_observe {

SubscriptionHandle::SubscriptionHandle(
    RegistrationToken token,
    std::shared_ptr<DeliveryGate> gate,
    CancelFn cancel)
    : m_token(token)
    , m_gate(std::move(gate))
    , m_cancel(std::move(cancel))
{}

SubscriptionHandle::~SubscriptionHandle() {
    cancel();
}

SubscriptionHandle::SubscriptionHandle(SubscriptionHandle&& other) noexcept
    : m_token(std::exchange(other.m_token, RegistrationToken{}))
    , m_gate(std::move(other.m_gate))
    , m_cancel(std::move(other.m_cancel))
{
    other.m_cancel = nullptr;
}

SubscriptionHandle& SubscriptionHandle::operator=(SubscriptionHandle&& other) noexcept {
    if (this != &other) {
        cancel();
        m_token = std::exchange(other.m_token, RegistrationToken{});
        m_gate = std::move(other.m_gate);
        m_cancel = std::move(other.m_cancel);
        other.m_cancel = nullptr;
    }
    return *this;
}

vigil_core::Result<void> SubscriptionHandle::adopt(SubscriptionHandle&& other) {
    if (is_active()) {
        auto err = vigil_core::Error(vigil_core::ObserveError::double_registration(
            "token " + std::to_string(other.token().id)));
        vigil_core::observe_logger()->error("{}", vigil_core::build_error_chain(err));
        vigil_core::debug::record_error(err);
        other.cancel();
        return vigil_core::Err(std::move(err));
    }

    m_token = std::exchange(other.m_token, RegistrationToken{});
    m_gate = std::move(other.m_gate);
    m_cancel = std::move(other.m_cancel);
    other.m_cancel = nullptr;
    return vigil_core::Ok();
}

void SubscriptionHandle::cancel() {
    if (!m_token.is_valid()) {
        return;
    }

    RegistrationToken token = std::exchange(m_token, RegistrationToken{});
    std::shared_ptr<DeliveryGate> gate = std::move(m_gate);
    CancelFn cancel_fn = std::move(m_cancel);
    m_cancel = nullptr;

    if (gate) {
        gate->close();
    }

    if (cancel_fn) {
        try {
            cancel_fn(token);
        } catch (const std::exception& e) {
            vigil_core::observe_logger()->error("Unregistering token {} failed: {}", token.id, e.what());
        }
    }
}

} // namespace vigil_observe
