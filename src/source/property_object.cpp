/// @file property_object.cpp
/// @brief PropertyObject non-template members

#include <vigil/source/property_object.hpp>
#include <vigil/core/log.hpp>

namespace vigil_source {

bool PropertyObject::has_property(const std::string& key) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_slots.count(key) != 0;
}

bool PropertyObject::is_notifying(const std::string& key) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_slots.find(key);
    return it != m_slots.end() && it->second->notifies;
}

std::vector<std::string> PropertyObject::keys() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<std::string> result;
    result.reserve(m_slots.size());
    for (const auto& [key, slot] : m_slots) {
        result.push_back(key);
    }
    return result;
}

bool PropertyObject::remove_listener(ListenerId id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_listener_keys.find(id);
    if (it == m_listener_keys.end()) {
        return false;
    }

    auto slot = m_slots.find(it->second);
    m_listener_keys.erase(it);
    return slot != m_slots.end() && slot->second->erase_listener(id);
}

std::size_t PropertyObject::listener_count(const std::string& key) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_slots.find(key);
    return it != m_slots.end() ? it->second->listener_count() : 0;
}

std::size_t PropertyObject::listener_count() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_listener_keys.size();
}

vigil_core::Error PropertyObject::report(vigil_core::PropertyError err) {
    vigil_core::Error error(std::move(err));
    vigil_core::source_logger()->debug("{}", error.message());
    vigil_core::debug::record_error(error);
    return error;
}

void PropertyObject::invoke_listener(const std::string& key, const std::function<void()>& call) {
    try {
        call();
    } catch (const std::exception& e) {
        vigil_core::source_logger()->error("Listener on '{}' threw: {}", key, e.what());
    }
}

} // namespace vigil_source
