#pragma once

/// @file key_value.hpp
/// @brief Observers and publishers bound to one property of a PropertyObject
///
/// @code
/// auto object = std::make_shared<vigil_source::PropertyObject>();
/// (void)object->declare<int>("counter", 0);
///
/// auto observer = vigil_source::KeyValueObserver<int>::create(object, "counter",
///     [](const int& value) { spdlog::info("counter = {}", value); });
///
/// auto publisher = vigil_source::KeyValuePublisher<int>::create(object, "counter");
/// auto receiver = (*publisher)->value().create_receiver();
/// @endcode

#include "fwd.hpp"
#include "property_adapter.hpp"
#include "property_object.hpp"
#include <vigil/observe/broadcast_publisher.hpp>
#include <vigil/observe/resumable_observer.hpp>

#include <functional>
#include <memory>
#include <string>
#include <utility>

namespace vigil_source {

// =============================================================================
// KeyValueObserver
// =============================================================================

/// Delivers each new value of one property to a callback.
/// Does not keep the object alive.
template<typename T>
class KeyValueObserver {
    struct Key {
        explicit Key() = default;
    };

public:
    using Callback = std::function<void(const T&)>;
    using Observer = vigil_observe::Observer<T>;

    /// Create a running observer
    /// @return SourceInvalid for an unknown key, a type mismatch or a destroyed object
    [[nodiscard]] static vigil_core::Result<std::unique_ptr<KeyValueObserver>> create(
        const std::shared_ptr<PropertyObject>& object,
        std::string key,
        Callback callback,
        vigil_observe::ObserverOptions options = {})
    {
        auto observer = vigil_observe::make_observer<T>(
            property_source<T>(object), vigil_observe::Selector(std::move(key)),
            std::move(callback), std::move(options));
        if (!observer) {
            return observer.error();
        }
        return std::make_unique<KeyValueObserver>(Key{}, std::move(*observer));
    }

    KeyValueObserver(Key, std::unique_ptr<Observer> observer)
        : m_observer(std::move(observer)) {}

    KeyValueObserver(const KeyValueObserver&) = delete;
    KeyValueObserver& operator=(const KeyValueObserver&) = delete;

    vigil_core::Result<void> resume() { return m_observer->resume(); }
    void pause() { m_observer->pause(); }
    void teardown() { m_observer->teardown(); }

    [[nodiscard]] vigil_observe::ObserverState state() const { return m_observer->state(); }
    [[nodiscard]] bool is_running() const { return m_observer->is_running(); }
    [[nodiscard]] const std::string& key() const noexcept { return m_observer->selector().key; }

private:
    std::unique_ptr<Observer> m_observer;
};

// =============================================================================
// KeyValuePublisher
// =============================================================================

/// Multicasts each new value of one property
template<typename T>
class KeyValuePublisher {
    struct Key {
        explicit Key() = default;
    };

public:
    using Publisher = vigil_observe::BroadcastPublisher<T>;

    [[nodiscard]] static vigil_core::Result<std::unique_ptr<KeyValuePublisher>> create(
        const std::shared_ptr<PropertyObject>& object,
        std::string key,
        vigil_observe::ObserverOptions options = {})
    {
        auto publisher = Publisher::create(
            property_source<T>(object), vigil_observe::Selector(std::move(key)), std::move(options));
        if (!publisher) {
            return publisher.error();
        }
        return std::make_unique<KeyValuePublisher>(Key{}, std::move(*publisher));
    }

    KeyValuePublisher(Key, std::unique_ptr<Publisher> publisher)
        : m_publisher(std::move(publisher)) {}

    KeyValuePublisher(const KeyValuePublisher&) = delete;
    KeyValuePublisher& operator=(const KeyValuePublisher&) = delete;

    /// The multicast stream of new values
    [[nodiscard]] Publisher& value() noexcept { return *m_publisher; }

    vigil_core::Result<void> resume() { return m_publisher->resume(); }
    void pause() { m_publisher->pause(); }
    void teardown() { m_publisher->teardown(); }

    [[nodiscard]] bool is_running() const { return m_publisher->is_running(); }
    [[nodiscard]] const std::string& key() const noexcept { return m_publisher->selector().key; }

private:
    std::unique_ptr<Publisher> m_publisher;
};

} // namespace vigil_source
