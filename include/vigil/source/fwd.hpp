#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for vigil_source

#include <cstdint>

namespace vigil_source {

using ListenerId = std::uint64_t;

// Key/value properties
class PropertyObject;

template<typename T>
class PropertyAdapter;

template<typename T>
class KeyValueObserver;

template<typename T>
class KeyValuePublisher;

// Named notifications
struct Notification;
struct ObserverToken;
class NotificationCenter;
class NotificationAdapter;
struct NotificationOptions;
class NotificationObserver;
class NotificationPublisher;

} // namespace vigil_source
