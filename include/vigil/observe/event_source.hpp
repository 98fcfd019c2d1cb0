#pragma once

/// @file event_source.hpp
/// @brief Capability interface implemented by every event source adapter

#include "fwd.hpp"
#include "selector.hpp"
#include "subscription.hpp"
#include <vigil/core/error.hpp>

#include <functional>

namespace vigil_observe {

/// Adapter between an observer and a concrete change-notification mechanism.
///
/// Adapters must not keep the watched object alive. Implementations hold a
/// weak reference and treat a vanished object as "cannot register" and
/// "nothing to unregister".
/// @tparam T Value delivered for each matching event
template<typename T>
class EventSource {
public:
    using value_type = T;
    using Handler = std::function<void(const T&)>;

    virtual ~EventSource() = default;

    /// Begin delivering events matching @p selector to @p handler.
    /// The sender filter, when present, is applied here and not by the caller.
    /// @return Token for unregister(), or SourceInvalid
    [[nodiscard]] virtual vigil_core::Result<RegistrationToken> register_handler(
        const Selector& selector, Handler handler) = 0;

    /// Stop delivery for @p token. Idempotent; safe with events in flight.
    virtual void unregister(RegistrationToken token) = 0;
};

} // namespace vigil_observe
