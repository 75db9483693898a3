/**
 * Expiry Sweeper Tests
 *
 * Validates the background sweep over all tubes of a registry:
 * 1. Delayed jobs are promoted once their delay elapses
 * 2. Expired reservations return to READY
 * 3. Promoted jobs are handed to consumers already blocked on reserve
 * 4. The sweep thread starts, cycles and stops cleanly
 */

#include "test_helpers.hpp"
#include "tubeq/expiry_sweeper.hpp"
#include "tubeq/tube_registry.hpp"
#include <spdlog/spdlog.h>
#include <atomic>
#include <chrono>
#include <thread>

using namespace tubeq;
using namespace std::chrono_literals;
using tubeq_test::RecordingListener;

namespace {

struct RegistryFixture {
    std::shared_ptr<ManualClock> clock = std::make_shared<ManualClock>();
    std::shared_ptr<RecordingListener> listener = std::make_shared<RecordingListener>();
    std::shared_ptr<TubeRegistry> registry;

    RegistryFixture() {
        registry = std::make_shared<TubeRegistry>(TubeConfig(), clock,
                                                  std::make_shared<SequentialIdGenerator>(),
                                                  listener);
    }
};

bool wait_for_waiters(Tube& tube, size_t count) {
    for (int i = 0; i < 1000; ++i) {
        if (tube.counts().waiting >= count) return true;
        std::this_thread::sleep_for(1ms);
    }
    return false;
}

} // namespace

// Test 1: one pass promotes due delayed jobs in every tube
bool test_sweep_promotes_delayed() {
    std::cout << "\n=== Test 1: Sweep Promotes Delayed Jobs ===" << std::endl;

    RegistryFixture f;
    auto emails = f.registry->get_or_create("emails");
    auto reports = f.registry->get_or_create("reports");

    JobId e1 = emails->put(1, 2, 60, "e1");
    JobId e2 = emails->put(1, 10, 60, "e2");
    JobId r1 = reports->put(1, 3, 60, "r1");

    ExpirySweeper sweeper(f.registry, 1000);

    SweepResult first = sweeper.run_once();
    TEST_ASSERT(first.promoted == 0, "nothing promoted before any delay elapsed");

    f.clock->advance(3s);
    SweepResult second = sweeper.run_once();
    TEST_ASSERT(second.promoted == 2, "two due jobs promoted across tubes");
    TEST_ASSERT(emails->peek(e1)->state() == JobState::READY, "emails job e1 READY");
    TEST_ASSERT(emails->peek(e2)->state() == JobState::DELAYED, "emails job e2 still DELAYED");
    TEST_ASSERT(reports->peek(r1)->state() == JobState::READY, "reports job READY");
    TEST_ASSERT(sweeper.cycles() == 2, "two cycles counted");

    auto events = f.listener->events();
    TEST_ASSERT(events.back().kind == TransitionKind::PROMOTE, "promotion recorded as PROMOTE");

    return true;
}

// Test 2: expired reservations time out back to READY
bool test_sweep_times_out_reservations() {
    std::cout << "\n=== Test 2: Sweep Times Out Reservations ===" << std::endl;

    RegistryFixture f;
    auto tube = f.registry->get_or_create("work");
    JobId short_ttr = tube->put(1, 0, 5, "short");
    JobId long_ttr = tube->put(2, 0, 30, "long");

    tube->reserve(0ms, "w1");
    tube->reserve(0ms, "w2");
    TEST_ASSERT(tube->counts().reserved == 2, "both jobs reserved");

    ExpirySweeper sweeper(f.registry, 1000);

    f.clock->advance(5s);
    SweepResult result = sweeper.run_once();
    TEST_ASSERT(result.timed_out == 1, "only the short TTR job timed out");
    TEST_ASSERT(tube->peek(short_ttr)->state() == JobState::READY, "short TTR job READY");
    TEST_ASSERT(tube->peek(long_ttr)->state() == JobState::RESERVED, "long TTR job still RESERVED");

    auto again = tube->reserve(0ms, "w3");
    TEST_ASSERT(again.job && again.job->id() == short_ttr, "timed out job reservable again");
    TEST_ASSERT(again.job->counters().timeouts == 1, "timeout counted on the job");

    return true;
}

// Test 3: put(pri=1, delay=2) then a blocked reserve gets it after the sweep
bool test_blocked_reserve_receives_promoted_job() {
    std::cout << "\n=== Test 3: Blocked Reserve Receives Promoted Job ===" << std::endl;

    RegistryFixture f;
    auto tube = f.registry->get_or_create("default");
    JobId id = tube->put(1, 2, 60, "y");

    TEST_ASSERT(tube->reserve(0ms).timed_out(), "delayed job not reservable right after put");

    ExpirySweeper sweeper(f.registry, 10);
    sweeper.start();

    ReserveResult result;
    std::thread consumer([&] {
        result = tube->reserve(5000ms, "patient");
    });

    bool registered = wait_for_waiters(*tube, 1);
    f.clock->advance(2s);

    consumer.join();
    sweeper.stop();

    TEST_ASSERT(registered, "consumer blocked while job delayed");
    TEST_ASSERT(!result.timed_out(), "consumer received a job");
    TEST_ASSERT(result.job->id() == id, "consumer received the promoted job");
    TEST_ASSERT(result.job->reserved_by() == "patient", "job reserved by the blocked consumer");

    return true;
}

// Test 4: real clock, delay measured in wall time
bool test_real_clock_delay() {
    std::cout << "\n=== Test 4: Real Clock Delay ===" << std::endl;

    auto registry = std::make_shared<TubeRegistry>(TubeConfig());
    auto tube = registry->get_or_create("realtime");

    ExpirySweeper sweeper(registry, 20);
    sweeper.start();

    auto start = std::chrono::steady_clock::now();
    JobId id = tube->put(1, 1, 60, "soon");
    auto result = tube->reserve(3000ms);
    auto elapsed = std::chrono::steady_clock::now() - start;

    sweeper.stop();

    TEST_ASSERT(!result.timed_out() && result.job->id() == id, "delayed job delivered");
    TEST_ASSERT(elapsed >= 1s, "delivery not before the delay elapsed");
    TEST_ASSERT(elapsed < 3s, "delivery within sweep granularity of the delay");

    return true;
}

// Test 5: start / stop lifecycle
bool test_start_stop() {
    std::cout << "\n=== Test 5: Start / Stop ===" << std::endl;

    RegistryFixture f;
    f.registry->get_or_create("idle");

    ExpirySweeper sweeper(f.registry, 5);
    TEST_ASSERT(!sweeper.is_running(), "sweeper idle before start");

    sweeper.start();
    sweeper.start();  // second start is a no-op
    TEST_ASSERT(sweeper.is_running(), "sweeper running after start");

    for (int i = 0; i < 1000 && sweeper.cycles() < 3; ++i) {
        std::this_thread::sleep_for(1ms);
    }
    uint64_t cycles = sweeper.cycles();

    sweeper.stop();
    sweeper.stop();  // second stop is a no-op
    TEST_ASSERT(cycles >= 3, "sweeper cycled while running");
    TEST_ASSERT(!sweeper.is_running(), "sweeper stopped");

    return true;
}

// Main test runner
int main() {
    spdlog::set_level(spdlog::level::warn);  // Reduce noise during tests

    bool all_passed = true;

    all_passed &= test_sweep_promotes_delayed();
    all_passed &= test_sweep_times_out_reservations();
    all_passed &= test_blocked_reserve_receives_promoted_job();
    all_passed &= test_real_clock_delay();
    all_passed &= test_start_stop();

    std::cout << "\n" << std::string(60, '=') << std::endl;
    if (all_passed) {
        std::cout << "✅ ALL TESTS PASSED!" << std::endl;
        return 0;
    } else {
        std::cout << "❌ SOME TESTS FAILED" << std::endl;
        return 1;
    }
}
