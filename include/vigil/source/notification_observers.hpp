#pragma once

/// @file notification_observers.hpp
/// @brief Observers and publishers bound to one notification name

#include "fwd.hpp"
#include "notification_center.hpp"
#include <vigil/observe/broadcast_publisher.hpp>
#include <vigil/observe/resumable_observer.hpp>

#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace vigil_source {

/// Where and how a notification observer registers
struct NotificationOptions {
    /// Center to observe; null selects NotificationCenter::default_center()
    std::shared_ptr<NotificationCenter> center;

    /// Deliver only notifications posted by this sender
    std::optional<vigil_observe::SenderId> sender;

    /// Where deliveries run; null selects the configured default
    std::shared_ptr<vigil_observe::Dispatcher> dispatcher;
};

// =============================================================================
// NotificationObserver
// =============================================================================

/// Delivers each matching notification to a callback
class NotificationObserver {
    struct Key {
        explicit Key() = default;
    };

public:
    using Callback = std::function<void(const Notification&)>;
    using Observer = vigil_observe::Observer<Notification>;

    /// Create a running observer
    /// @return SourceInvalid for an empty name
    [[nodiscard]] static vigil_core::Result<std::unique_ptr<NotificationObserver>> create(
        std::string name,
        Callback callback,
        NotificationOptions options = {});

    NotificationObserver(Key, std::unique_ptr<Observer> observer)
        : m_observer(std::move(observer)) {}

    NotificationObserver(const NotificationObserver&) = delete;
    NotificationObserver& operator=(const NotificationObserver&) = delete;

    vigil_core::Result<void> resume() { return m_observer->resume(); }
    void pause() { m_observer->pause(); }
    void teardown() { m_observer->teardown(); }

    [[nodiscard]] vigil_observe::ObserverState state() const { return m_observer->state(); }
    [[nodiscard]] bool is_running() const { return m_observer->is_running(); }
    [[nodiscard]] const std::string& name() const noexcept { return m_observer->selector().key; }

private:
    std::unique_ptr<Observer> m_observer;
};

// =============================================================================
// NotificationPublisher
// =============================================================================

/// Multicasts each matching notification
class NotificationPublisher {
    struct Key {
        explicit Key() = default;
    };

public:
    using Publisher = vigil_observe::BroadcastPublisher<Notification>;

    [[nodiscard]] static vigil_core::Result<std::unique_ptr<NotificationPublisher>> create(
        std::string name,
        NotificationOptions options = {});

    NotificationPublisher(Key, std::unique_ptr<Publisher> publisher)
        : m_publisher(std::move(publisher)) {}

    NotificationPublisher(const NotificationPublisher&) = delete;
    NotificationPublisher& operator=(const NotificationPublisher&) = delete;

    /// The multicast stream of notifications
    [[nodiscard]] Publisher& notification() noexcept { return *m_publisher; }

    vigil_core::Result<void> resume() { return m_publisher->resume(); }
    void pause() { m_publisher->pause(); }
    void teardown() { m_publisher->teardown(); }

    [[nodiscard]] bool is_running() const { return m_publisher->is_running(); }
    [[nodiscard]] const std::string& name() const noexcept { return m_publisher->selector().key; }

private:
    std::unique_ptr<Publisher> m_publisher;
};

} // namespace vigil_source
