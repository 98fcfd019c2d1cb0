#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for vigil_observe

#include <cstdint>

namespace vigil_observe {

// Identity and selection
struct SenderId;
struct Selector;

// Registration
struct RegistrationToken;
class DeliveryGate;
class SubscriptionHandle;

// Dispatch
class Dispatcher;
class ImmediateDispatcher;
class QueueDispatcher;

// Sources
template<typename T>
class EventSource;

// Observers
enum class ObserverState : std::uint8_t;
struct ObserverOptions;

template<typename T>
class CallbackSink;

template<typename T>
class MulticastSink;

template<typename T>
class StreamReceiver;

template<typename T>
class BroadcastPublisher;

} // namespace vigil_observe
