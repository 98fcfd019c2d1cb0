// vigil_observe ResumableObserver tests

#include <catch2/catch_test_macros.hpp>
#include <vigil/observe/resumable_observer.hpp>
#include "fake_source.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace vigil_observe;
using vigil_test::FakeSource;

namespace {

struct Recorder {
    std::vector<int> values;

    auto callback() {
        return [this](const int& v) { values.push_back(v); };
    }
};

} // namespace

// =============================================================================
// Lifecycle
// =============================================================================

TEST_CASE("ResumableObserver: starts on construction", "[observe][observer]") {
    auto source = std::make_shared<FakeSource<int>>();
    Recorder rec;

    auto observer = make_observer<int>(source, "counter", rec.callback());
    REQUIRE(observer.is_ok());
    REQUIRE((*observer)->is_running());
    REQUIRE((*observer)->state() == ObserverState::Running);
    REQUIRE(source->active_count() == 1);

    source->emit(10);
    REQUIRE(rec.values == std::vector<int>{10});
}

TEST_CASE("ResumableObserver: pause suppresses and resume re-enables", "[observe][observer]") {
    auto source = std::make_shared<FakeSource<int>>();
    Recorder rec;
    auto observer = std::move(make_observer<int>(source, "counter", rec.callback()).unwrap());

    observer->pause();
    REQUIRE(observer->state() == ObserverState::Paused);
    REQUIRE(source->active_count() == 0);

    source->emit(10);
    REQUIRE(rec.values.empty());

    REQUIRE(observer->resume().is_ok());
    source->emit(20);
    REQUIRE(rec.values == std::vector<int>{20});
}

TEST_CASE("ResumableObserver: pause and resume are idempotent", "[observe][observer]") {
    auto source = std::make_shared<FakeSource<int>>();
    Recorder rec;
    auto observer = std::move(make_observer<int>(source, "counter", rec.callback()).unwrap());

    SECTION("resume twice registers once") {
        REQUIRE(observer->resume().is_ok());
        REQUIRE(observer->resume().is_ok());
        REQUIRE(source->register_calls() == 1);
        source->emit(1);
        REQUIRE(rec.values.size() == 1);
    }

    SECTION("pause twice unregisters once") {
        observer->pause();
        observer->pause();
        REQUIRE(source->unregister_calls() == 1);
        REQUIRE(observer->resume().is_ok());
        source->emit(2);
        REQUIRE(rec.values == std::vector<int>{2});
    }
}

TEST_CASE("ResumableObserver: teardown is terminal", "[observe][observer]") {
    auto source = std::make_shared<FakeSource<int>>();
    Recorder rec;
    auto observer = std::move(make_observer<int>(source, "counter", rec.callback()).unwrap());

    observer->teardown();
    REQUIRE(observer->is_torn_down());
    REQUIRE(source->active_count() == 0);

    auto result = observer->resume();
    REQUIRE(result.is_err());
    REQUIRE(result.error().is_observe(vigil_core::ObserveError::Kind::UseAfterTeardown));
    REQUIRE(source->active_count() == 0);

    source->emit(5);
    REQUIRE(rec.values.empty());

    observer->teardown();
    observer->pause();
    REQUIRE(source->unregister_calls() == 1);
}

TEST_CASE("ResumableObserver: destruction unregisters", "[observe][observer]") {
    auto source = std::make_shared<FakeSource<int>>();
    Recorder rec;
    {
        auto observer = make_observer<int>(source, "counter", rec.callback());
        REQUIRE(source->active_count() == 1);
    }
    REQUIRE(source->active_count() == 0);
    source->emit(1);
    REQUIRE(rec.values.empty());
}

TEST_CASE("ResumableObserver: stale handler is discarded", "[observe][observer]") {
    auto source = std::make_shared<FakeSource<int>>();
    Recorder rec;
    auto observer = std::move(make_observer<int>(source, "counter", rec.callback()).unwrap());

    // A handler captured before pause() models an event already in flight
    auto stale = source->handlers();
    REQUIRE(stale.size() == 1);

    observer->pause();
    REQUIRE(observer->resume().is_ok());

    stale.front()(7);
    REQUIRE(rec.values.empty());

    source->emit(8);
    REQUIRE(rec.values == std::vector<int>{8});
}

// =============================================================================
// Construction errors
// =============================================================================

TEST_CASE("ResumableObserver: invalid sources", "[observe][observer]") {
    Recorder rec;

    SECTION("null source") {
        auto observer = make_observer<int>(nullptr, "counter", rec.callback());
        REQUIRE(observer.is_err());
        REQUIRE(observer.error().is_observe(vigil_core::ObserveError::Kind::SourceInvalid));
    }

    SECTION("source refuses registration") {
        auto source = std::make_shared<FakeSource<int>>();
        source->set_valid(false);
        auto observer = make_observer<int>(source, "counter", rec.callback());
        REQUIRE(observer.is_err());
        REQUIRE(observer.error().is_observe(vigil_core::ObserveError::Kind::SourceInvalid));
        REQUIRE(source->active_count() == 0);
    }
}

// =============================================================================
// Sender filter
// =============================================================================

TEST_CASE("ResumableObserver: sender filter", "[observe][observer]") {
    auto source = std::make_shared<FakeSource<int>>();
    int x = 0;
    int y = 0;
    Recorder rec;

    auto observer = std::move(make_observer<int>(
        source, Selector("evt", SenderId::of(x)), rec.callback()).unwrap());

    source->emit(1, SenderId::of(y));
    source->emit(2, SenderId::of(x));
    source->emit(3, SenderId{});
    source->emit(4, SenderId::of(x));

    REQUIRE(rec.values == std::vector<int>{2, 4});
}

// =============================================================================
// Re-entrancy and threads
// =============================================================================

TEST_CASE("ResumableObserver: pause from inside the callback", "[observe][observer][threading]") {
    auto source = std::make_shared<FakeSource<int>>();
    std::unique_ptr<Observer<int>> observer;
    std::vector<int> values;

    observer = std::move(make_observer<int>(source, "counter", [&](const int& v) {
        values.push_back(v);
        observer->pause();
    }).unwrap());

    source->emit(1);
    source->emit(2);
    REQUIRE(values == std::vector<int>{1});
    REQUIRE(observer->state() == ObserverState::Paused);

    REQUIRE(observer->resume().is_ok());
    source->emit(3);
    REQUIRE(values == std::vector<int>{1, 3});
}

TEST_CASE("ResumableObserver: teardown from inside the callback", "[observe][observer][threading]") {
    auto source = std::make_shared<FakeSource<int>>();
    std::unique_ptr<Observer<int>> observer;
    int calls = 0;

    observer = std::move(make_observer<int>(source, "counter", [&](const int&) {
        ++calls;
        observer->teardown();
    }).unwrap());

    source->emit(1);
    source->emit(2);
    REQUIRE(calls == 1);
    REQUIRE(observer->is_torn_down());
}

TEST_CASE("ResumableObserver: no delivery begins after teardown races with emission", "[observe][observer][threading]") {
    auto source = std::make_shared<FakeSource<int>>();
    std::atomic<int> calls{0};
    std::atomic<int> in_callback{0};
    std::atomic<bool> stop{false};

    auto observer = std::move(make_observer<int>(source, "counter", [&](const int&) {
        ++in_callback;
        ++calls;
        --in_callback;
    }).unwrap());

    std::thread emitter([&] {
        int i = 0;
        while (!stop.load()) {
            source->emit(i++);
        }
    });

    while (calls.load() < 100) {
        std::this_thread::yield();
    }

    observer.reset();
    REQUIRE(source->active_count() == 0);

    // A delivery that passed the gate before teardown may still finish
    while (in_callback.load() != 0) {
        std::this_thread::yield();
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
    const int settled = calls.load();

    // Keep emitting for a while after teardown
    for (int i = 0; i < 1000; ++i) {
        std::this_thread::yield();
    }
    stop = true;
    emitter.join();

    REQUIRE(calls.load() == settled);
}

TEST_CASE("ResumableObserver: pause does not wait for an in-flight delivery", "[observe][observer][threading]") {
    auto source = std::make_shared<FakeSource<int>>();
    std::mutex owner_mutex;
    std::atomic<bool> entered{false};
    std::atomic<int> calls{0};

    auto observer = std::move(make_observer<int>(source, "counter", [&](const int&) {
        entered = true;
        // The owner holds this lock while it pauses or destroys the observer
        std::lock_guard<std::mutex> lock(owner_mutex);
        ++calls;
    }).unwrap());

    SECTION("pause under the owner's lock") {
        std::thread emitter;
        {
            std::lock_guard<std::mutex> lock(owner_mutex);
            emitter = std::thread([&] { source->emit(1); });
            while (!entered) {
                std::this_thread::yield();
            }
            observer->pause();
            REQUIRE(observer->state() == ObserverState::Paused);
            REQUIRE(calls.load() == 0);
        }
        emitter.join();
        REQUIRE(calls.load() == 1);

        source->emit(2);
        REQUIRE(calls.load() == 1);
    }

    SECTION("destruction under the owner's lock") {
        std::thread emitter;
        {
            std::lock_guard<std::mutex> lock(owner_mutex);
            emitter = std::thread([&] { source->emit(1); });
            while (!entered) {
                std::this_thread::yield();
            }
            observer.reset();
            REQUIRE(source->active_count() == 0);
        }
        emitter.join();
        REQUIRE(calls.load() == 1);
    }
}

TEST_CASE("ResumableObserver: concurrent pause and resume", "[observe][observer][threading]") {
    auto source = std::make_shared<FakeSource<int>>();
    std::atomic<int> calls{0};
    auto observer = std::move(make_observer<int>(source, "counter", [&](const int&) { ++calls; }).unwrap());

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&, t] {
            for (int i = 0; i < 200; ++i) {
                if ((i + t) % 2 == 0) {
                    observer->pause();
                } else {
                    (void)observer->resume();
                }
                source->emit(i);
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    REQUIRE(source->active_count() <= 1);
    observer->pause();
    REQUIRE(source->active_count() == 0);
}

// =============================================================================
// Dispatch
// =============================================================================

TEST_CASE("ResumableObserver: queued dispatch", "[observe][observer][dispatcher]") {
    auto source = std::make_shared<FakeSource<int>>();
    auto queue = std::make_shared<QueueDispatcher>();
    Recorder rec;

    auto observer = std::move(make_observer<int>(source, "counter", rec.callback(),
        ObserverOptions{queue}).unwrap());

    SECTION("delivery waits for the queue") {
        source->emit(1);
        source->emit(2);
        REQUIRE(rec.values.empty());
        REQUIRE(queue->run_pending() == 2);
        REQUIRE(rec.values == std::vector<int>{1, 2});
    }

    SECTION("pause before drain suppresses queued deliveries") {
        source->emit(1);
        observer->pause();
        queue->run_pending();
        REQUIRE(rec.values.empty());
    }

    SECTION("queued deliveries from a previous registration are dropped") {
        source->emit(1);
        observer->pause();
        REQUIRE(observer->resume().is_ok());
        source->emit(2);
        queue->run_pending();
        REQUIRE(rec.values == std::vector<int>{2});
    }

    SECTION("teardown before drain suppresses queued deliveries") {
        source->emit(1);
        observer.reset();
        queue->run_pending();
        REQUIRE(rec.values.empty());
    }
}

// =============================================================================
// Callback failures
// =============================================================================

TEST_CASE("ResumableObserver: throwing callback is contained", "[observe][observer]") {
    auto source = std::make_shared<FakeSource<int>>();
    int calls = 0;
    vigil_core::debug::reset_error_stats();

    auto observer = std::move(make_observer<int>(source, "counter", [&](const int& v) {
        ++calls;
        if (v == 1) {
            throw std::runtime_error("bad value");
        }
    }).unwrap());

    REQUIRE_NOTHROW(source->emit(1));
    source->emit(2);
    REQUIRE(calls == 2);
    REQUIRE(vigil_core::debug::total_error_count() == 1);
    REQUIRE(observer->is_running());
}

// =============================================================================
// Ownership
// =============================================================================

TEST_CASE("ResumableObserver: releases the source on destruction", "[observe][observer]") {
    auto source = std::make_shared<FakeSource<int>>();
    std::weak_ptr<FakeSource<int>> weak = source;
    Recorder rec;
    auto observer = std::move(make_observer<int>(source, "counter", rec.callback()).unwrap());

    // Registered handlers must not reference the source
    REQUIRE(weak.use_count() == 2);
    observer.reset();
    REQUIRE(weak.use_count() == 1);
}

TEST_CASE("ResumableObserver: weak owner binding", "[observe][observer]") {
    struct Owner {
        int last = 0;
        std::unique_ptr<Observer<int>> observer;
    };

    auto source = std::make_shared<FakeSource<int>>();
    auto owner = std::make_shared<Owner>();
    std::weak_ptr<Owner> weak_owner = owner;

    owner->observer = std::move(make_observer<int>(source, "counter",
        weak_callback(owner, [](Owner& self, const int& v) { self.last = v; })).unwrap());

    source->emit(42);
    REQUIRE(owner->last == 42);

    owner.reset();
    REQUIRE(weak_owner.expired());
    REQUIRE(source->active_count() == 0);
}

TEST_CASE("ObserverState names", "[observe][observer]") {
    REQUIRE(std::string(to_string(ObserverState::Paused)) == "Paused");
    REQUIRE(std::string(to_string(ObserverState::Running)) == "Running");
    REQUIRE(std::string(to_string(ObserverState::TornDown)) == "TornDown");
}
