#pragma once

/// @file multicast.hpp
/// @brief Fan-out sink with push consumers and pull receivers
///
/// MulticastSink is the delivery sink behind BroadcastPublisher. Consumers
/// either attach callbacks (push) or hold a StreamReceiver queue (pull). Each
/// sees only values delivered after it joined, and each observes the
/// end-of-stream signal exactly once.

#include "fwd.hpp"
#include <vigil/core/error.hpp>
#include <vigil/core/log.hpp>

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace vigil_observe {

// =============================================================================
// StreamReceiver
// =============================================================================

/// Pull-style queue fed by a MulticastSink
/// @tparam T Value type
template<typename T>
class StreamReceiver {
public:
    using value_type = T;
    using size_type = std::size_t;

    StreamReceiver() = default;

    StreamReceiver(const StreamReceiver&) = delete;
    StreamReceiver& operator=(const StreamReceiver&) = delete;

    // =========================================================================
    // Send / Receive
    // =========================================================================

    /// Queue a value. Ignored once closed.
    void send(T value) {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_closed) return;
        m_queue.push_back(std::move(value));
    }

    /// Receive the oldest queued value
    /// @return Value if available, nullopt if empty
    [[nodiscard]] std::optional<T> receive() {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_queue.empty()) {
            return std::nullopt;
        }
        T value = std::move(m_queue.front());
        m_queue.pop_front();
        return value;
    }

    /// Drain all queued values
    [[nodiscard]] std::vector<T> drain() {
        std::deque<T> queue;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            std::swap(queue, m_queue);
        }
        return std::vector<T>(std::make_move_iterator(queue.begin()),
                              std::make_move_iterator(queue.end()));
    }

    /// Mark end-of-stream. Values already queued stay receivable.
    void close() {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_closed = true;
    }

    // =========================================================================
    // State
    // =========================================================================

    [[nodiscard]] bool empty() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_queue.empty();
    }

    [[nodiscard]] size_type size() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_queue.size();
    }

    /// True once the producer signalled end-of-stream
    [[nodiscard]] bool is_closed() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_closed;
    }

    /// True once closed and fully drained
    [[nodiscard]] bool is_completed() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_closed && m_queue.empty();
    }

private:
    mutable std::mutex m_mutex;
    std::deque<T> m_queue;
    bool m_closed = false;
};

// =============================================================================
// MulticastSink
// =============================================================================

/// Delivery sink that fans each value out to every attached consumer.
/// Must be owned by std::shared_ptr; attachments refer back to it weakly.
/// @tparam T Value type
template<typename T>
class MulticastSink : public std::enable_shared_from_this<MulticastSink<T>> {
public:
    using value_type = T;
    using ValueFn = std::function<void(const T&)>;
    using CompleteFn = std::function<void()>;
    using Receiver = std::shared_ptr<StreamReceiver<T>>;

    // =========================================================================
    // Attachment
    // =========================================================================

    /// RAII consumer registration. Destruction detaches.
    class Attachment {
    public:
        Attachment() = default;

        Attachment(std::weak_ptr<MulticastSink> sink, std::uint64_t id)
            : m_sink(std::move(sink)), m_id(id) {}

        ~Attachment() { detach(); }

        Attachment(Attachment&& other) noexcept
            : m_sink(std::move(other.m_sink))
            , m_id(std::exchange(other.m_id, 0)) {}

        Attachment& operator=(Attachment&& other) noexcept {
            if (this != &other) {
                detach();
                m_sink = std::move(other.m_sink);
                m_id = std::exchange(other.m_id, 0);
            }
            return *this;
        }

        Attachment(const Attachment&) = delete;
        Attachment& operator=(const Attachment&) = delete;

        /// Stop receiving values. Idempotent; never touches the upstream
        /// registration.
        void detach() {
            std::uint64_t id = std::exchange(m_id, 0);
            if (id == 0) return;
            if (auto sink = m_sink.lock()) {
                sink->detach(id);
            }
            m_sink.reset();
        }

        [[nodiscard]] bool is_attached() const {
            if (m_id == 0) return false;
            auto sink = m_sink.lock();
            return sink && sink->is_attached(m_id);
        }

        explicit operator bool() const { return is_attached(); }

    private:
        std::weak_ptr<MulticastSink> m_sink;
        std::uint64_t m_id = 0;
    };

    MulticastSink() = default;

    MulticastSink(const MulticastSink&) = delete;
    MulticastSink& operator=(const MulticastSink&) = delete;

    // =========================================================================
    // Consumers
    // =========================================================================

    /// Attach a push consumer.
    /// After completion @p on_complete runs immediately and the returned
    /// attachment is inert.
    [[nodiscard]] Attachment attach(ValueFn on_value, CompleteFn on_complete = {}) {
        auto consumer = std::make_shared<Consumer>();
        consumer->on_value = std::move(on_value);
        consumer->on_complete = std::move(on_complete);
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (!m_completed) {
                consumer->id = m_next_id++;
                m_consumers.push_back(consumer);
                return Attachment(this->weak_from_this(), consumer->id);
            }
        }

        if (consumer->on_complete) {
            consumer->on_complete();
        }
        return Attachment();
    }

    /// Create a pull consumer. After completion the receiver is already closed.
    [[nodiscard]] Receiver create_receiver() {
        auto receiver = std::make_shared<StreamReceiver<T>>();
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_completed) {
            receiver->close();
        } else {
            m_receivers.push_back(receiver);
        }
        return receiver;
    }

    /// Number of attached consumers plus live receivers
    [[nodiscard]] std::size_t consumer_count() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto live = std::count_if(m_receivers.begin(), m_receivers.end(),
            [](const std::weak_ptr<StreamReceiver<T>>& wp) { return !wp.expired(); });
        return m_consumers.size() + static_cast<std::size_t>(live);
    }

    [[nodiscard]] bool is_completed() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_completed;
    }

    // =========================================================================
    // DeliverySink
    // =========================================================================

    /// Fan @p value out to every consumer attached at this moment
    void deliver(const T& value) {
        std::vector<std::shared_ptr<Consumer>> consumers;
        std::vector<Receiver> receivers;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_completed) return;

            // Remove dead receivers
            m_receivers.erase(
                std::remove_if(m_receivers.begin(), m_receivers.end(),
                    [](const std::weak_ptr<StreamReceiver<T>>& wp) {
                        return wp.expired();
                    }),
                m_receivers.end());

            consumers = m_consumers;
            receivers.reserve(m_receivers.size());
            for (auto& weak_recv : m_receivers) {
                if (auto recv = weak_recv.lock()) {
                    receivers.push_back(std::move(recv));
                }
            }
        }

        for (auto& consumer : consumers) {
            if (!consumer->attached.load(std::memory_order_acquire) || !consumer->on_value) {
                continue;
            }
            try {
                consumer->on_value(value);
            } catch (const std::exception& e) {
                vigil_core::observe_logger()->error("Multicast consumer {} threw: {}",
                    consumer->id, e.what());
                vigil_core::debug::record_error(vigil_core::Error(
                    std::string("Multicast consumer threw: ") + e.what()));
            }
        }

        for (auto& receiver : receivers) {
            receiver->send(value);
        }
    }

    /// Signal end-of-stream to every consumer. Runs once.
    void complete() {
        std::vector<std::shared_ptr<Consumer>> consumers;
        std::vector<std::weak_ptr<StreamReceiver<T>>> receivers;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_completed) return;
            m_completed = true;
            consumers = std::move(m_consumers);
            receivers = std::move(m_receivers);
            m_consumers.clear();
            m_receivers.clear();
        }

        for (auto& consumer : consumers) {
            if (!consumer->attached.exchange(false, std::memory_order_acq_rel)) {
                continue;
            }
            if (!consumer->on_complete) {
                continue;
            }
            try {
                consumer->on_complete();
            } catch (const std::exception& e) {
                vigil_core::observe_logger()->error("Multicast consumer {} completion threw: {}",
                    consumer->id, e.what());
            }
        }

        for (auto& weak_recv : receivers) {
            if (auto recv = weak_recv.lock()) {
                recv->close();
            }
        }

        vigil_core::observe_logger()->debug("Multicast completed ({} consumers)", consumers.size());
    }

private:
    struct Consumer {
        std::uint64_t id = 0;
        ValueFn on_value;
        CompleteFn on_complete;
        std::atomic<bool> attached{true};
    };

    void detach(std::uint64_t id) {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = std::find_if(m_consumers.begin(), m_consumers.end(),
            [id](const std::shared_ptr<Consumer>& c) { return c->id == id; });
        if (it != m_consumers.end()) {
            (*it)->attached.store(false, std::memory_order_release);
            m_consumers.erase(it);
        }
    }

    [[nodiscard]] bool is_attached(std::uint64_t id) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return std::any_of(m_consumers.begin(), m_consumers.end(),
            [id](const std::shared_ptr<Consumer>& c) { return c->id == id; });
    }

    mutable std::mutex m_mutex;
    std::vector<std::shared_ptr<Consumer>> m_consumers;
    std::vector<std::weak_ptr<StreamReceiver<T>>> m_receivers;
    std::uint64_t m_next_id = 1;
    bool m_completed = false;
};

} // namespace vigil_observe
