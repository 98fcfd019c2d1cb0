#pragma once

/// @file property_adapter.hpp
/// @brief EventSource over one typed property of a PropertyObject

#include "fwd.hpp"
#include "property_object.hpp"
#include <vigil/core/log.hpp>
#include <vigil/observe/event_source.hpp>

#include <memory>
#include <typeinfo>
#include <utility>

namespace vigil_source {

/// Adapts PropertyObject listeners to EventSource<T>.
/// Holds the object weakly; a destroyed object cannot be registered on and
/// has nothing left to unregister.
template<typename T>
class PropertyAdapter final : public vigil_observe::EventSource<T> {
public:
    using Handler = typename vigil_observe::EventSource<T>::Handler;

    explicit PropertyAdapter(std::weak_ptr<PropertyObject> object)
        : m_object(std::move(object)) {}

    [[nodiscard]] vigil_core::Result<vigil_observe::RegistrationToken> register_handler(
        const vigil_observe::Selector& selector, Handler handler) override
    {
        auto object = m_object.lock();
        if (!object) {
            return invalid(selector, "object destroyed");
        }
        if (selector.sender) {
            return invalid(selector, "properties have no sender");
        }

        auto id = object->template add_listener<T>(selector.key, std::move(handler));
        if (!id) {
            return invalid(selector, id.error().message());
        }

        if (!object->is_notifying(selector.key)) {
            vigil_core::source_logger()->debug(
                "Property '{}' does not notify; observer will never fire", selector.key);
        }
        return vigil_observe::RegistrationToken{*id};
    }

    void unregister(vigil_observe::RegistrationToken token) override {
        if (auto object = m_object.lock()) {
            object->remove_listener(token.id);
        }
    }

    /// True while the watched object is alive
    [[nodiscard]] bool is_valid() const noexcept { return !m_object.expired(); }

private:
    static vigil_core::Error invalid(const vigil_observe::Selector& selector, const std::string& reason) {
        vigil_core::Error err(vigil_core::ObserveError::source_invalid(selector.describe(), reason));
        err.with_context("type", typeid(T).name());
        vigil_core::source_logger()->warn("{}", vigil_core::build_error_chain(err));
        return err;
    }

    std::weak_ptr<PropertyObject> m_object;
};

/// Create an adapter for @p object
template<typename T>
[[nodiscard]] std::shared_ptr<PropertyAdapter<T>> property_source(const std::shared_ptr<PropertyObject>& object) {
    return std::make_shared<PropertyAdapter<T>>(object);
}

} // namespace vigil_source
