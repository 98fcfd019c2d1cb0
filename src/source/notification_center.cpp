/// @file notification_center.cpp
/// @brief NotificationCenter and NotificationAdapter implementation

#include <vigil/source/notification_center.hpp>
#include <vigil/core/log.hpp>

#include <algorithm>

namespace vigil_source {

// =============================================================================
// NotificationCenter
// =============================================================================

std::shared_ptr<NotificationCenter> NotificationCenter::default_center() {
    static std::shared_ptr<NotificationCenter> center = std::make_shared<NotificationCenter>();
    return center;
}

ObserverToken NotificationCenter::add_observer(
    std::string name,
    std::optional<vigil_observe::SenderId> sender,
    Handler handler)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    ObserverToken token{m_next_id++};
    m_entries.push_back(Entry{
        token,
        std::move(name),
        sender,
        std::make_shared<Handler>(std::move(handler))});
    return token;
}

bool NotificationCenter::remove_observer(ObserverToken token) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = std::find_if(m_entries.begin(), m_entries.end(),
        [token](const Entry& e) { return e.token == token; });
    if (it == m_entries.end()) {
        return false;
    }
    m_entries.erase(it);
    return true;
}

std::size_t NotificationCenter::observer_count() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entries.size();
}

std::size_t NotificationCenter::observer_count(const std::string& name) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return static_cast<std::size_t>(std::count_if(m_entries.begin(), m_entries.end(),
        [&name](const Entry& e) { return e.name == name; }));
}

std::size_t NotificationCenter::post(const Notification& notification) {
    std::vector<std::shared_ptr<Handler>> handlers;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto& entry : m_entries) {
            if (entry.name != notification.name) continue;
            if (entry.sender && !(*entry.sender == notification.sender)) continue;
            handlers.push_back(entry.handler);
        }
    }

    vigil_core::source_logger()->trace("Posting '{}' to {} observers",
        notification.name, handlers.size());

    for (const auto& handler : handlers) {
        try {
            (*handler)(notification);
        } catch (const std::exception& e) {
            vigil_core::source_logger()->error("Observer of '{}' threw: {}", notification.name, e.what());
        }
    }
    return handlers.size();
}

std::size_t NotificationCenter::post(std::string name, vigil_observe::SenderId sender, UserInfo user_info) {
    return post(Notification{std::move(name), sender, std::move(user_info)});
}

// =============================================================================
// NotificationAdapter
// =============================================================================

vigil_core::Result<vigil_observe::RegistrationToken> NotificationAdapter::register_handler(
    const vigil_observe::Selector& selector, Handler handler)
{
    auto center = m_center.lock();
    const char* reason = nullptr;
    if (!center) {
        reason = "notification center destroyed";
    } else if (selector.key.empty()) {
        reason = "empty notification name";
    }

    if (reason) {
        vigil_core::Error err(vigil_core::ObserveError::source_invalid(selector.describe(), reason));
        vigil_core::source_logger()->warn("{}", err.message());
        return err;
    }

    auto token = center->add_observer(selector.key, selector.sender, std::move(handler));
    return vigil_observe::RegistrationToken{token.id};
}

void NotificationAdapter::unregister(vigil_observe::RegistrationToken token) {
    if (auto center = m_center.lock()) {
        center->remove_observer(ObserverToken{token.id});
    }
}

} // namespace vigil_source
