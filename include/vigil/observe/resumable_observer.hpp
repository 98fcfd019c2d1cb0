#pragma once

/// @file resumable_observer.hpp
/// @brief Pause/resume state machine shared by every observer kind
///
/// A ResumableObserver binds one (source, selector) pair to a delivery sink.
/// It registers on creation, can be paused and resumed any number of times,
/// and tears down in its destructor. After teardown nothing reaches the sink,
/// including events the source emits concurrently on other threads.
///
/// @code
/// auto observer = vigil_observe::make_observer<int>(source, "counter",
///     [](const int& v) { spdlog::info("counter = {}", v); });
/// if (!observer) { /* SourceInvalid */ }
/// (*observer)->pause();
/// (*observer)->resume();
/// @endcode

#include "fwd.hpp"
#include "dispatcher.hpp"
#include "event_source.hpp"
#include "selector.hpp"
#include "subscription.hpp"
#include <vigil/core/config.hpp>
#include <vigil/core/error.hpp>
#include <vigil/core/log.hpp>

#include <concepts>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

namespace vigil_observe {

// =============================================================================
// DeliverySink Concept
// =============================================================================

/// Where an observer sends values. complete() is called once, on teardown.
template<typename S, typename T>
concept DeliverySink = requires(S sink, const T& value) {
    { sink.deliver(value) };
    { sink.complete() };
};

// =============================================================================
// CallbackSink
// =============================================================================

/// Sink that forwards every value to one callback
template<typename T>
class CallbackSink {
public:
    using Callback = std::function<void(const T&)>;

    explicit CallbackSink(Callback callback) : m_callback(std::move(callback)) {}

    void deliver(const T& value) {
        if (m_callback) {
            m_callback(value);
        }
    }

    /// Single-callback observers have no end-of-stream signal
    void complete() noexcept {}

private:
    Callback m_callback;
};

// =============================================================================
// Observer State
// =============================================================================

/// Lifecycle state of a ResumableObserver
enum class ObserverState : std::uint8_t {
    Paused,    ///< No registration held
    Running,   ///< Registration held, deliveries flow
    TornDown,  ///< Terminal; resume() is refused
};

[[nodiscard]] inline const char* to_string(ObserverState state) {
    switch (state) {
        case ObserverState::Paused: return "Paused";
        case ObserverState::Running: return "Running";
        case ObserverState::TornDown: return "TornDown";
    }
    return "Unknown";
}

/// Construction options shared by every observer kind
struct ObserverOptions {
    /// Where deliveries run; null selects default_dispatcher()
    std::shared_ptr<Dispatcher> dispatcher;
};

// =============================================================================
// ResumableObserver
// =============================================================================

/// Resumable, self-cancelling subscription to an EventSource
/// @tparam T Delivered value type
/// @tparam Sink Delivery sink (CallbackSink, MulticastSink, ...)
template<typename T, typename Sink>
    requires DeliverySink<Sink, T>
class ResumableObserver {
    struct Key {
        explicit Key() = default;
    };

public:
    using value_type = T;
    using sink_type = Sink;
    using Source = EventSource<T>;

    /// Create an observer and start it.
    /// @return The running observer, or SourceInvalid if registration fails
    [[nodiscard]] static vigil_core::Result<std::unique_ptr<ResumableObserver>> create(
        std::shared_ptr<Source> source,
        Selector selector,
        std::shared_ptr<Sink> sink,
        ObserverOptions options = {})
    {
        if (!source || !sink) {
            auto err = vigil_core::Error(vigil_core::ObserveError::source_invalid(
                selector.key, source ? "no delivery sink" : "no event source"));
            vigil_core::debug::record_error(err);
            return err;
        }

        auto observer = std::make_unique<ResumableObserver>(Key{},
            std::move(source), std::move(selector), std::move(sink), std::move(options));

        auto started = observer->resume();
        if (!started) {
            vigil_core::observe_logger()->warn("Observer construction failed: {}",
                vigil_core::build_error_chain(started.error()));
            return started.error();
        }
        return observer;
    }

    ResumableObserver(
        Key,
        std::shared_ptr<Source> source,
        Selector selector,
        std::shared_ptr<Sink> sink,
        ObserverOptions options)
        : m_source(std::move(source))
        , m_selector(std::move(selector))
        , m_sink(std::move(sink))
        , m_dispatcher(options.dispatcher ? std::move(options.dispatcher) : default_dispatcher())
        , m_trace(vigil_core::current_config().observe.trace_deliveries)
    {}

    ~ResumableObserver() {
        teardown();
    }

    ResumableObserver(const ResumableObserver&) = delete;
    ResumableObserver& operator=(const ResumableObserver&) = delete;
    ResumableObserver(ResumableObserver&&) = delete;
    ResumableObserver& operator=(ResumableObserver&&) = delete;

    // =========================================================================
    // Lifecycle
    // =========================================================================

    /// Start delivering. No-op while running.
    /// @return UseAfterTeardown after teardown, SourceInvalid if the source
    ///         refuses the registration
    vigil_core::Result<void> resume() {
        std::lock_guard<std::mutex> lock(m_mutex);

        if (m_torn_down) {
            auto err = vigil_core::Error(
                vigil_core::ObserveError::use_after_teardown(m_selector.describe()));
            vigil_core::debug::record_error(err);
            return err;
        }
        if (m_handle.is_active()) {
            return vigil_core::Ok();
        }

        auto gate = std::make_shared<DeliveryGate>();
        auto token = m_source->register_handler(m_selector, make_handler(gate));
        if (!token) {
            vigil_core::debug::record_error(token.error());
            return token.error();
        }

        std::weak_ptr<Source> weak_source = m_source;
        SubscriptionHandle handle(*token, std::move(gate),
            [weak_source](RegistrationToken t) {
                if (auto source = weak_source.lock()) {
                    source->unregister(t);
                }
            });

        auto adopted = m_handle.adopt(std::move(handle));
        if (!adopted) {
            return adopted;
        }

        vigil_core::observe_logger()->debug("Observer running: {} (token {}, {})",
            m_selector.describe(), m_handle.token().id, m_dispatcher->name());
        return vigil_core::Ok();
    }

    /// Stop delivering. No-op while paused. Never blocks: a delivery already
    /// running on another thread may finish, but none begins after return.
    /// Safe from any thread, including from inside this observer's own callback.
    void pause() {
        SubscriptionHandle handle;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (!m_handle.is_active()) {
                return;
            }
            // A concurrent pause() that finds the handle gone must still see
            // the gate refusing deliveries
            m_handle.gate()->close();
            handle = std::move(m_handle);
        }

        // Sources take their own lock in unregister(); never nest it in ours
        auto token = handle.token();
        handle.cancel();

        vigil_core::observe_logger()->debug("Observer paused: {} (token {})",
            m_selector.describe(), token.id);
    }

    /// Pause permanently and signal completion to the sink. Idempotent.
    void teardown() {
        SubscriptionHandle handle;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_torn_down) {
                return;
            }
            m_torn_down = true;
            if (m_handle.is_active()) {
                m_handle.gate()->close();
            }
            handle = std::move(m_handle);
        }

        handle.cancel();
        m_sink->complete();

        vigil_core::observe_logger()->debug("Observer torn down: {}", m_selector.describe());
    }

    // =========================================================================
    // Queries
    // =========================================================================

    [[nodiscard]] ObserverState state() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_torn_down) return ObserverState::TornDown;
        return m_handle.is_active() ? ObserverState::Running : ObserverState::Paused;
    }

    [[nodiscard]] bool is_running() const { return state() == ObserverState::Running; }

    [[nodiscard]] bool is_torn_down() const { return state() == ObserverState::TornDown; }

    [[nodiscard]] const Selector& selector() const noexcept { return m_selector; }

    [[nodiscard]] Sink& sink() noexcept { return *m_sink; }

    [[nodiscard]] const std::shared_ptr<Dispatcher>& dispatcher() const noexcept { return m_dispatcher; }

private:
    /// Handler registered with the source for one generation.
    /// Holds the gate and only a weak reference to the sink.
    typename Source::Handler make_handler(std::shared_ptr<DeliveryGate> gate) {
        std::weak_ptr<Sink> weak_sink = m_sink;
        std::shared_ptr<Dispatcher> dispatcher = m_dispatcher;
        bool trace = m_trace;
        std::string label = m_selector.describe();

        return [gate = std::move(gate), weak_sink, dispatcher, trace, label](const T& value) {
            if (!gate->is_open()) {
                return;
            }
            dispatcher->dispatch([gate, weak_sink, trace, label, value]() {
                gate->deliver([&]() {
                    auto sink = weak_sink.lock();
                    if (!sink) {
                        return;
                    }
                    if (trace) {
                        vigil_core::observe_logger()->trace("Delivering {}", label);
                    }
                    try {
                        sink->deliver(value);
                    } catch (const std::exception& e) {
                        vigil_core::observe_logger()->error("Observer callback for {} threw: {}",
                            label, e.what());
                        vigil_core::debug::record_error(vigil_core::Error(
                            std::string("Observer callback threw: ") + e.what()));
                    }
                });
            });
        };
    }

    std::shared_ptr<Source> m_source;
    Selector m_selector;
    std::shared_ptr<Sink> m_sink;
    std::shared_ptr<Dispatcher> m_dispatcher;
    bool m_trace = false;

    mutable std::mutex m_mutex;
    SubscriptionHandle m_handle;
    bool m_torn_down = false;
};

// =============================================================================
// Single-Callback Observer
// =============================================================================

/// Observer delivering to one callback
template<typename T>
using Observer = ResumableObserver<T, CallbackSink<T>>;

/// Create a running single-callback observer
template<typename T>
[[nodiscard]] vigil_core::Result<std::unique_ptr<Observer<T>>> make_observer(
    std::shared_ptr<EventSource<T>> source,
    Selector selector,
    typename CallbackSink<T>::Callback callback,
    ObserverOptions options = {})
{
    return Observer<T>::create(
        std::move(source),
        std::move(selector),
        std::make_shared<CallbackSink<T>>(std::move(callback)),
        std::move(options));
}

// =============================================================================
// Weak Owner Binding
// =============================================================================

/// Bind @p fn to @p owner without keeping the owner alive.
///
/// Use when the observer is stored inside the object that created it; a
/// strong capture would form a cycle. @p fn is called as fn(owner, value) only
/// while the owner is alive.
template<typename Owner, typename F>
[[nodiscard]] auto weak_callback(const std::shared_ptr<Owner>& owner, F&& fn) {
    return [weak = std::weak_ptr<Owner>(owner), fn = std::forward<F>(fn)](const auto& value) {
        if (auto strong = weak.lock()) {
            fn(*strong, value);
        }
    };
}

} // namespace vigil_observe
