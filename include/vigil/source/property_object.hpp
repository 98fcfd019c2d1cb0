#pragma once

/// @file property_object.hpp
/// @brief Object with typed, observable named properties
///
/// PropertyObject is the key/value observation target: each property is
/// declared once with a type and an initial value, and every set() of a
/// notifying property reports the new value to its listeners. Listeners run
/// on the mutating thread, after the object's lock has been released.
///
/// @code
/// auto object = std::make_shared<vigil_source::PropertyObject>();
/// (void)object->declare<int>("counter", 0);
/// (void)object->set<int>("counter", 10);
/// @endcode

#include "fwd.hpp"
#include <vigil/core/error.hpp>

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <typeindex>
#include <typeinfo>
#include <utility>
#include <vector>

namespace vigil_source {

class PropertyObject : public std::enable_shared_from_this<PropertyObject> {
public:
    template<typename T>
    using Listener = std::function<void(const T&)>;

    PropertyObject() = default;
    virtual ~PropertyObject() = default;

    // Non-copyable
    PropertyObject(const PropertyObject&) = delete;
    PropertyObject& operator=(const PropertyObject&) = delete;

    // =========================================================================
    // Declaration
    // =========================================================================

    /// Declare a property
    /// @param notifies false declares a property whose changes are never reported
    /// @return AlreadyDeclared if @p key exists
    template<typename T>
    [[nodiscard]] vigil_core::Result<void> declare(const std::string& key, T initial, bool notifies = true) {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_slots.count(key) != 0) {
            return report(vigil_core::PropertyError::already_declared(key));
        }
        m_slots.emplace(key, std::make_unique<Slot<T>>(std::move(initial), notifies));
        return vigil_core::Ok();
    }

    // =========================================================================
    // Access
    // =========================================================================

    /// Assign @p value and report it to listeners
    /// @return NotFound or TypeMismatch
    template<typename T>
    [[nodiscard]] vigil_core::Result<void> set(const std::string& key, T value) {
        std::vector<Listener<T>> listeners;
        std::optional<T> delivered;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto slot = find_slot<T>(key);
            if (!slot) {
                return slot.error();
            }
            (*slot)->value = std::move(value);
            if (!(*slot)->notifies) {
                return vigil_core::Ok();
            }
            delivered.emplace((*slot)->value);
            listeners.reserve((*slot)->listeners.size());
            for (const auto& entry : (*slot)->listeners) {
                listeners.push_back(entry.second);
            }
        }

        for (const auto& listener : listeners) {
            invoke_listener(key, [&]() { listener(*delivered); });
        }
        return vigil_core::Ok();
    }

    /// Read the current value
    template<typename T>
    [[nodiscard]] vigil_core::Result<T> get(const std::string& key) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto slot = find_slot<T>(key);
        if (!slot) {
            return slot.error();
        }
        return (*slot)->value;
    }

    [[nodiscard]] bool has_property(const std::string& key) const;

    /// True if the property exists and reports its changes
    [[nodiscard]] bool is_notifying(const std::string& key) const;

    /// Declared keys in sorted order
    [[nodiscard]] std::vector<std::string> keys() const;

    // =========================================================================
    // Listeners
    // =========================================================================

    /// Register a change listener on @p key
    /// @return Listener id (never 0), or NotFound / TypeMismatch
    template<typename T>
    [[nodiscard]] vigil_core::Result<ListenerId> add_listener(const std::string& key, Listener<T> listener) {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto slot = find_slot<T>(key);
        if (!slot) {
            return slot.error();
        }
        ListenerId id = m_next_listener_id++;
        (*slot)->listeners.emplace(id, std::move(listener));
        m_listener_keys.emplace(id, key);
        return id;
    }

    /// Remove a listener. Idempotent.
    /// @return true if the listener was registered
    bool remove_listener(ListenerId id);

    /// Listeners registered on @p key
    [[nodiscard]] std::size_t listener_count(const std::string& key) const;

    /// Listeners registered on all keys
    [[nodiscard]] std::size_t listener_count() const;

private:
    struct SlotBase {
        explicit SlotBase(bool notify) : notifies(notify) {}
        virtual ~SlotBase() = default;
        [[nodiscard]] virtual std::type_index type() const = 0;
        [[nodiscard]] virtual std::size_t listener_count() const = 0;
        virtual bool erase_listener(ListenerId id) = 0;

        bool notifies;
    };

    template<typename T>
    struct Slot final : SlotBase {
        Slot(T initial, bool notify) : SlotBase(notify), value(std::move(initial)) {}

        [[nodiscard]] std::type_index type() const override { return typeid(T); }
        [[nodiscard]] std::size_t listener_count() const override { return listeners.size(); }
        bool erase_listener(ListenerId id) override { return listeners.erase(id) != 0; }

        T value;
        std::map<ListenerId, Listener<T>> listeners;
    };

    /// Caller holds m_mutex
    template<typename T>
    vigil_core::Result<Slot<T>*> find_slot(const std::string& key) const {
        auto it = m_slots.find(key);
        if (it == m_slots.end()) {
            return report(vigil_core::PropertyError::not_found(key));
        }
        if (it->second->type() != std::type_index(typeid(T))) {
            return report(vigil_core::PropertyError::type_mismatch(key, it->second->type().name()));
        }
        return static_cast<Slot<T>*>(it->second.get());
    }

    /// Log and record a property error
    static vigil_core::Error report(vigil_core::PropertyError err);

    /// Run one listener; exceptions are logged and do not stop the fan-out
    static void invoke_listener(const std::string& key, const std::function<void()>& call);

    mutable std::mutex m_mutex;
    std::map<std::string, std::unique_ptr<SlotBase>> m_slots;
    std::map<ListenerId, std::string> m_listener_keys;
    ListenerId m_next_listener_id = 1;
};

} // namespace vigil_source
