#pragma once

/// @file notification_center.hpp
/// @brief Named-event bus with sender filtering
///
/// Notifications are posted by name, optionally carrying the identity of the
/// posting object and a string payload. Observers register for one name and
/// may restrict delivery to a single sender. Handlers run synchronously on the
/// posting thread, outside the center's lock.

#include "fwd.hpp"
#include <vigil/core/error.hpp>
#include <vigil/observe/event_source.hpp>
#include <vigil/observe/selector.hpp>

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace vigil_source {

// =============================================================================
// Notification
// =============================================================================

/// One posted notification
struct Notification {
    std::string name;
    vigil_observe::SenderId sender;
    std::map<std::string, std::string> user_info;

    /// Payload entry for @p key, or nullptr
    [[nodiscard]] const std::string* info(const std::string& key) const {
        auto it = user_info.find(key);
        return it != user_info.end() ? &it->second : nullptr;
    }
};

/// Identifies one registration with a NotificationCenter
struct ObserverToken {
    std::uint64_t id = 0;

    [[nodiscard]] constexpr bool is_valid() const noexcept { return id != 0; }

    constexpr bool operator==(const ObserverToken&) const noexcept = default;
};

// =============================================================================
// NotificationCenter
// =============================================================================

class NotificationCenter : public std::enable_shared_from_this<NotificationCenter> {
public:
    using Handler = std::function<void(const Notification&)>;
    using UserInfo = std::map<std::string, std::string>;

    NotificationCenter() = default;
    ~NotificationCenter() = default;

    // Non-copyable
    NotificationCenter(const NotificationCenter&) = delete;
    NotificationCenter& operator=(const NotificationCenter&) = delete;

    /// Process-wide center
    [[nodiscard]] static std::shared_ptr<NotificationCenter> default_center();

    // =========================================================================
    // Observers
    // =========================================================================

    /// Register @p handler for notifications named @p name
    /// @param sender When set, only notifications from this sender are delivered
    [[nodiscard]] ObserverToken add_observer(
        std::string name,
        std::optional<vigil_observe::SenderId> sender,
        Handler handler);

    /// Remove a registration. Idempotent.
    /// @return true if the registration existed
    bool remove_observer(ObserverToken token);

    [[nodiscard]] std::size_t observer_count() const;

    /// Registrations for @p name
    [[nodiscard]] std::size_t observer_count(const std::string& name) const;

    // =========================================================================
    // Posting
    // =========================================================================

    /// Deliver @p notification to every matching observer
    /// @return Number of handlers invoked
    std::size_t post(const Notification& notification);

    std::size_t post(std::string name, vigil_observe::SenderId sender = {}, UserInfo user_info = {});

private:
    struct Entry {
        ObserverToken token;
        std::string name;
        std::optional<vigil_observe::SenderId> sender;
        std::shared_ptr<Handler> handler;
    };

    mutable std::mutex m_mutex;
    std::vector<Entry> m_entries;
    std::uint64_t m_next_id = 1;
};

// =============================================================================
// NotificationAdapter
// =============================================================================

/// Adapts a NotificationCenter to EventSource<Notification>.
/// The selector key is the notification name; the sender filter is passed
/// through to the center.
class NotificationAdapter final : public vigil_observe::EventSource<Notification> {
public:
    explicit NotificationAdapter(std::weak_ptr<NotificationCenter> center)
        : m_center(std::move(center)) {}

    [[nodiscard]] vigil_core::Result<vigil_observe::RegistrationToken> register_handler(
        const vigil_observe::Selector& selector, Handler handler) override;

    void unregister(vigil_observe::RegistrationToken token) override;

    [[nodiscard]] bool is_valid() const noexcept { return !m_center.expired(); }

private:
    std::weak_ptr<NotificationCenter> m_center;
};

} // namespace vigil_source
