#pragma once

/// @file broadcast_publisher.hpp
/// @brief Resumable observer exposing a multicast stream of values
///
/// One upstream registration, any number of downstream consumers. Consumers
/// come and go without touching the upstream registration; only the
/// publisher's own pause()/resume() do.

#include "fwd.hpp"
#include "multicast.hpp"
#include "resumable_observer.hpp"

#include <memory>
#include <utility>

namespace vigil_observe {

/// Broadcast publisher over an EventSource
/// @tparam T Value type
template<typename T>
class BroadcastPublisher {
    struct Key {
        explicit Key() = default;
    };

public:
    using value_type = T;
    using Sink = MulticastSink<T>;
    using Attachment = typename Sink::Attachment;
    using Receiver = typename Sink::Receiver;
    using Observer = ResumableObserver<T, Sink>;

    /// Create a running publisher
    [[nodiscard]] static vigil_core::Result<std::unique_ptr<BroadcastPublisher>> create(
        std::shared_ptr<EventSource<T>> source,
        Selector selector,
        ObserverOptions options = {})
    {
        auto sink = std::make_shared<Sink>();
        auto observer = Observer::create(std::move(source), std::move(selector), sink, std::move(options));
        if (!observer) {
            return observer.error();
        }
        return std::make_unique<BroadcastPublisher>(Key{}, std::move(sink), std::move(*observer));
    }

    BroadcastPublisher(Key, std::shared_ptr<Sink> sink, std::unique_ptr<Observer> observer)
        : m_sink(std::move(sink))
        , m_observer(std::move(observer))
    {}

    BroadcastPublisher(const BroadcastPublisher&) = delete;
    BroadcastPublisher& operator=(const BroadcastPublisher&) = delete;

    // =========================================================================
    // Lifecycle
    // =========================================================================

    vigil_core::Result<void> resume() { return m_observer->resume(); }

    void pause() { m_observer->pause(); }

    /// Stop permanently; every consumer observes end-of-stream
    void teardown() { m_observer->teardown(); }

    [[nodiscard]] ObserverState state() const { return m_observer->state(); }
    [[nodiscard]] bool is_running() const { return m_observer->is_running(); }
    [[nodiscard]] bool is_torn_down() const { return m_observer->is_torn_down(); }
    [[nodiscard]] const Selector& selector() const noexcept { return m_observer->selector(); }

    // =========================================================================
    // Consumers
    // =========================================================================

    /// Attach a push consumer; it sees values delivered from now on
    [[nodiscard]] Attachment attach(typename Sink::ValueFn on_value,
                                    typename Sink::CompleteFn on_complete = {}) {
        return m_sink->attach(std::move(on_value), std::move(on_complete));
    }

    /// Create a pull consumer
    [[nodiscard]] Receiver create_receiver() { return m_sink->create_receiver(); }

    [[nodiscard]] std::size_t consumer_count() const { return m_sink->consumer_count(); }

private:
    // Declaration order matters: the observer tears down (completing the
    // sink) before the sink is released
    std::shared_ptr<Sink> m_sink;
    std::unique_ptr<Observer> m_observer;
};

} // namespace vigil_observe
