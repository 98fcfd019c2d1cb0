// vigil_observe DeliveryGate and SubscriptionHandle tests

#include <catch2/catch_test_macros.hpp>
#include <vigil/observe/selector.hpp>
#include <vigil/observe/subscription.hpp>

#include <atomic>
#include <thread>
#include <vector>

using namespace vigil_observe;

// =============================================================================
// Selector
// =============================================================================

TEST_CASE("Selector sender filter", "[observe][selector]") {
    int x = 0;
    int y = 0;

    SECTION("no filter accepts every sender") {
        Selector selector("evt");
        REQUIRE(selector.accepts(SenderId::of(x)));
        REQUIRE(selector.accepts(SenderId{}));
        REQUIRE(selector.describe() == "evt");
    }

    SECTION("filter compares identity") {
        Selector selector("evt", SenderId::of(x));
        REQUIRE(selector.accepts(SenderId::of(x)));
        REQUIRE_FALSE(selector.accepts(SenderId::of(y)));
        REQUIRE_FALSE(selector.accepts(SenderId{}));
        REQUIRE(selector.describe().rfind("evt@0x", 0) == 0);
        REQUIRE(selector.describe() == "evt@" + fmt::format("{}", static_cast<const void*>(&x)));
    }
}

// =============================================================================
// DeliveryGate
// =============================================================================

TEST_CASE("DeliveryGate", "[observe][gate]") {
    auto gate = std::make_shared<DeliveryGate>();
    int runs = 0;

    SECTION("open gate runs deliveries") {
        REQUIRE(gate->deliver([&] { ++runs; }));
        REQUIRE(runs == 1);
    }

    SECTION("closed gate refuses deliveries") {
        gate->close();
        REQUIRE_FALSE(gate->is_open());
        REQUIRE_FALSE(gate->deliver([&] { ++runs; }));
        REQUIRE(runs == 0);
    }

    SECTION("close from inside a delivery does not deadlock") {
        REQUIRE(gate->deliver([&] {
            gate->close();
            ++runs;
        }));
        REQUIRE(runs == 1);
        REQUIRE_FALSE(gate->deliver([&] { ++runs; }));
    }

    SECTION("close does not wait for an in-flight delivery on another thread") {
        std::atomic<bool> entered{false};
        std::atomic<bool> release{false};
        std::atomic<bool> finished{false};

        std::thread worker([&] {
            gate->deliver([&] {
                entered = true;
                while (!release) {
                    std::this_thread::yield();
                }
                finished = true;
            });
        });

        while (!entered) {
            std::this_thread::yield();
        }
        gate->close();
        REQUIRE_FALSE(finished.load());
        REQUIRE_FALSE(gate->deliver([&] { ++runs; }));

        release = true;
        worker.join();
        REQUIRE(finished.load());
        REQUIRE(runs == 0);
    }
}

// =============================================================================
// SubscriptionHandle
// =============================================================================

TEST_CASE("SubscriptionHandle lifecycle", "[observe][subscription]") {
    std::vector<std::uint64_t> cancelled;
    auto make = [&](std::uint64_t id) {
        return SubscriptionHandle(RegistrationToken{id}, std::make_shared<DeliveryGate>(),
            [&cancelled](RegistrationToken t) { cancelled.push_back(t.id); });
    };

    SECTION("default handle is inactive") {
        SubscriptionHandle handle;
        REQUIRE_FALSE(handle.is_active());
        REQUIRE_FALSE(static_cast<bool>(handle));
        handle.cancel();
    }

    SECTION("destruction cancels once") {
        {
            auto handle = make(1);
            REQUIRE(handle.is_active());
        }
        REQUIRE(cancelled == std::vector<std::uint64_t>{1});
    }

    SECTION("cancel closes the gate and is idempotent") {
        auto handle = make(2);
        auto gate = handle.gate();
        handle.cancel();
        handle.cancel();
        REQUIRE_FALSE(gate->is_open());
        REQUIRE_FALSE(handle.is_active());
        REQUIRE(cancelled.size() == 1);
    }

    SECTION("move transfers ownership") {
        auto a = make(3);
        SubscriptionHandle b = std::move(a);
        REQUIRE_FALSE(a.is_active());
        REQUIRE(b.is_active());
        REQUIRE(b.token().id == 3);
        REQUIRE(cancelled.empty());
    }

    SECTION("move assignment cancels the previous registration") {
        auto a = make(4);
        a = make(5);
        REQUIRE(cancelled == std::vector<std::uint64_t>{4});
        REQUIRE(a.token().id == 5);
    }
}

TEST_CASE("SubscriptionHandle adopt", "[observe][subscription]") {
    std::vector<std::uint64_t> cancelled;
    auto make = [&](std::uint64_t id) {
        return SubscriptionHandle(RegistrationToken{id}, std::make_shared<DeliveryGate>(),
            [&cancelled](RegistrationToken t) { cancelled.push_back(t.id); });
    };

    SECTION("inactive handle adopts") {
        SubscriptionHandle handle;
        REQUIRE(handle.adopt(make(1)).is_ok());
        REQUIRE(handle.token().id == 1);
        REQUIRE(cancelled.empty());
    }

    SECTION("active handle refuses with DoubleRegistration") {
        auto handle = make(1);
        auto result = handle.adopt(make(2));
        REQUIRE(result.is_err());
        REQUIRE(result.error().is_observe(vigil_core::ObserveError::Kind::DoubleRegistration));
        REQUIRE(handle.token().id == 1);
        REQUIRE(cancelled == std::vector<std::uint64_t>{2});
    }
}
