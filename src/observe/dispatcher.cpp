/// @file dispatcher.cpp
/// @brief Dispatcher implementations

#include <vigil/observe/dispatcher.hpp>
#include <vigil/core/log.hpp>

namespace vigil_observe {

// =============================================================================
// QueueDispatcher
// =============================================================================

void QueueDispatcher::dispatch(Task task) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_tasks.push_back(std::move(task));
}

std::size_t QueueDispatcher::run_pending() {
    std::deque<Task> tasks;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::swap(tasks, m_tasks);
    }

    // Run outside the lock so tasks may dispatch again
    std::size_t count = 0;
    for (auto& task : tasks) {
        try {
            task();
        } catch (const std::exception& e) {
            vigil_core::observe_logger()->error("Queued task failed: {}", e.what());
        }
        ++count;
    }
    return count;
}

std::size_t QueueDispatcher::pending_count() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_tasks.size();
}

void QueueDispatcher::clear() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_tasks.clear();
}

// =============================================================================
// Shared Dispatchers
// =============================================================================

std::shared_ptr<Dispatcher> immediate_dispatcher() {
    static std::shared_ptr<Dispatcher> dispatcher = std::make_shared<ImmediateDispatcher>();
    return dispatcher;
}

std::shared_ptr<QueueDispatcher> main_queue() {
    static std::shared_ptr<QueueDispatcher> queue = std::make_shared<QueueDispatcher>();
    return queue;
}

std::shared_ptr<Dispatcher> dispatcher_for(vigil_core::DispatchMode mode) {
    switch (mode) {
        case vigil_core::DispatchMode::Immediate: return immediate_dispatcher();
        case vigil_core::DispatchMode::Queued: return main_queue();
    }
    return immediate_dispatcher();
}

std::shared_ptr<Dispatcher> default_dispatcher() {
    return dispatcher_for(vigil_core::current_config().observe.dispatch);
}

} // namespace vigil_observe
