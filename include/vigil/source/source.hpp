#pragma once

/// @file source.hpp
/// @brief Main header for vigil_source
///
/// Reference event sources and the observer types bound to them:
/// - PropertyObject / PropertyAdapter: typed key/value properties
/// - NotificationCenter / NotificationAdapter: named notifications
/// - KeyValueObserver, KeyValuePublisher, NotificationObserver, NotificationPublisher

#include "fwd.hpp"
#include "property_object.hpp"
#include "property_adapter.hpp"
#include "key_value.hpp"
#include "notification_center.hpp"
#include "notification_observers.hpp"
