#pragma once

/// @file observe.hpp
/// @brief Main header for vigil_observe
///
/// Resumable, self-cancelling observation of event sources:
/// - ResumableObserver: register on construct, pause/resume, teardown on destroy
/// - BroadcastPublisher: one upstream registration, many consumers
/// - EventSource: adapter interface implemented by concrete sources
/// - Dispatcher: where deliveries run (immediate or queued)

#include "fwd.hpp"
#include "selector.hpp"
#include "subscription.hpp"
#include "event_source.hpp"
#include "dispatcher.hpp"
#include "resumable_observer.hpp"
#include "multicast.hpp"
#include "broadcast_publisher.hpp"
