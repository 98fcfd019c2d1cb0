#pragma once

/// @file dispatcher.hpp
/// @brief Dispatch targets for observer deliveries
///
/// A Dispatcher decides where a delivery runs. ImmediateDispatcher runs it on
/// the emitting thread. QueueDispatcher holds deliveries until its owner calls
/// run_pending(), the way a main-loop queue would.

#include "fwd.hpp"
#include <vigil/core/config.hpp>

#include <deque>
#include <functional>
#include <memory>
#include <mutex>

namespace vigil_observe {

// =============================================================================
// Dispatcher
// =============================================================================

/// Target on which observer deliveries execute
class Dispatcher {
public:
    using Task = std::function<void()>;

    virtual ~Dispatcher() = default;

    /// Schedule @p task. Tasks from one producer run in submission order.
    virtual void dispatch(Task task) = 0;

    /// Name for logging
    [[nodiscard]] virtual const char* name() const noexcept = 0;
};

// =============================================================================
// ImmediateDispatcher
// =============================================================================

/// Runs tasks synchronously on the calling thread
class ImmediateDispatcher final : public Dispatcher {
public:
    void dispatch(Task task) override { task(); }

    [[nodiscard]] const char* name() const noexcept override { return "immediate"; }
};

// =============================================================================
// QueueDispatcher
// =============================================================================

/// FIFO queue drained explicitly by its owner
class QueueDispatcher final : public Dispatcher {
public:
    QueueDispatcher() = default;

    QueueDispatcher(const QueueDispatcher&) = delete;
    QueueDispatcher& operator=(const QueueDispatcher&) = delete;

    void dispatch(Task task) override;

    [[nodiscard]] const char* name() const noexcept override { return "queued"; }

    /// Run every task queued before this call.
    /// Tasks queued while running are left for the next call.
    /// @return Number of tasks run
    std::size_t run_pending();

    /// Number of queued tasks
    [[nodiscard]] std::size_t pending_count() const;

    [[nodiscard]] bool has_pending() const { return pending_count() != 0; }

    /// Drop queued tasks without running them
    void clear();

private:
    mutable std::mutex m_mutex;
    std::deque<Task> m_tasks;
};

// =============================================================================
// Shared Dispatchers
// =============================================================================

/// Process-wide immediate dispatcher
[[nodiscard]] std::shared_ptr<Dispatcher> immediate_dispatcher();

/// Process-wide queue, drained by the application's main loop
[[nodiscard]] std::shared_ptr<QueueDispatcher> main_queue();

/// Dispatcher for @p mode
[[nodiscard]] std::shared_ptr<Dispatcher> dispatcher_for(vigil_core::DispatchMode mode);

/// Dispatcher selected by the current runtime config
[[nodiscard]] std::shared_ptr<Dispatcher> default_dispatcher();

} // namespace vigil_observe
