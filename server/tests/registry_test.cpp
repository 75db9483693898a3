/**
 * Registry, Configuration and Transition Log Tests
 *
 * Validates:
 * 1. Tubes are created once per name and share one id space
 * 2. Tubes are isolated from each other
 * 3. Config::load() reads the environment, with defaults when unset
 * 4. Transition events and job snapshots serialize to JSON
 * 5. UUID ids are well formed
 */

#include "test_helpers.hpp"
#include "tubeq/config.hpp"
#include "tubeq/tube_registry.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <set>
#include <thread>
#include <vector>

using namespace tubeq;
using namespace std::chrono_literals;
using tubeq_test::RecordingListener;
using tubeq_test::throws_code;

// Test 1: get_or_create / find / names
bool test_registry_lookup() {
    std::cout << "\n=== Test 1: Registry Lookup ===" << std::endl;

    TubeRegistry registry(TubeConfig(), std::make_shared<ManualClock>());
    TEST_ASSERT(registry.size() == 0, "registry starts empty");
    TEST_ASSERT(registry.find("emails") == nullptr, "find of unknown tube returns null");

    auto emails = registry.get_or_create("emails");
    auto again = registry.get_or_create("emails");
    auto reports = registry.get_or_create("reports");

    TEST_ASSERT(emails == again, "same name yields same tube");
    TEST_ASSERT(emails != reports, "different names yield different tubes");
    TEST_ASSERT(registry.find("reports") == reports, "find returns the created tube");
    TEST_ASSERT(registry.size() == 2, "two tubes registered");

    auto names = registry.names();
    TEST_ASSERT(names.size() == 2 && names[0] == "emails" && names[1] == "reports",
                "names listed in order");

    return true;
}

// Test 2: concurrent creation of the same tube
bool test_concurrent_get_or_create() {
    std::cout << "\n=== Test 2: Concurrent Creation ===" << std::endl;

    TubeRegistry registry{TubeConfig()};
    std::vector<std::shared_ptr<Tube>> seen(8);
    std::vector<std::thread> threads;

    for (size_t i = 0; i < seen.size(); ++i) {
        threads.emplace_back([&, i] {
            seen[i] = registry.get_or_create("shared");
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    bool all_same = true;
    for (const auto& tube : seen) {
        all_same = all_same && tube == seen[0];
    }
    TEST_ASSERT(all_same, "every thread got the same tube");
    TEST_ASSERT(registry.size() == 1, "tube created exactly once");

    return true;
}

// Test 3: shared ids, isolated jobs
bool test_tube_isolation() {
    std::cout << "\n=== Test 3: Tube Isolation ===" << std::endl;

    TubeRegistry registry(TubeConfig(), std::make_shared<ManualClock>());
    auto a = registry.get_or_create("a");
    auto b = registry.get_or_create("b");

    std::set<JobId> ids;
    for (int i = 0; i < 5; ++i) {
        ids.insert(a->put(1, 0, 60, "a"));
        ids.insert(b->put(1, 0, 60, "b"));
    }
    TEST_ASSERT(ids.size() == 10, "job ids unique across tubes");

    auto job = a->reserve(0ms);
    TEST_ASSERT(job.job && job.job->payload() == "a", "reserve only sees its own tube");
    TEST_ASSERT(throws_code([&] { b->touch(job.job->id()); }, ErrorCode::NOT_FOUND),
                "other tube does not know the job");
    TEST_ASSERT(b->counts().ready == 5, "other tube unaffected");

    return true;
}

// Test 4: configuration from the environment
bool test_config_from_env() {
    std::cout << "\n=== Test 4: Config From Environment ===" << std::endl;

    unsetenv("TUBE_MAX_JOBS");
    unsetenv("TUBE_DEFAULT_TTR");
    unsetenv("TUBE_ALLOW_UNRESERVED_DELETE");
    unsetenv("SWEEP_INTERVAL_MS");
    unsetenv("LOG_LEVEL");

    Config defaults = Config::load();
    TEST_ASSERT(defaults.tube.max_jobs == 0, "max_jobs defaults to unlimited");
    TEST_ASSERT(defaults.tube.default_ttr == 60, "default TTR is 60s");
    TEST_ASSERT(!defaults.tube.allow_unreserved_delete, "unreserved delete off by default");
    TEST_ASSERT(defaults.sweeper.interval_ms == 1000, "sweep interval defaults to 1s");
    TEST_ASSERT(defaults.logging.log_level == "info", "log level defaults to info");

    setenv("TUBE_MAX_JOBS", "500", 1);
    setenv("TUBE_DEFAULT_TTR", "120", 1);
    setenv("TUBE_ALLOW_UNRESERVED_DELETE", "true", 1);
    setenv("SWEEP_INTERVAL_MS", "250", 1);
    setenv("LOG_LEVEL", "debug", 1);

    Config config = Config::load();
    TEST_ASSERT(config.tube.max_jobs == 500, "TUBE_MAX_JOBS read");
    TEST_ASSERT(config.tube.default_ttr == 120, "TUBE_DEFAULT_TTR read");
    TEST_ASSERT(config.tube.allow_unreserved_delete, "TUBE_ALLOW_UNRESERVED_DELETE read");
    TEST_ASSERT(config.sweeper.interval_ms == 250, "SWEEP_INTERVAL_MS read");

    setenv("TUBE_DEFAULT_TTR", "0", 1);
    TEST_ASSERT(TubeConfig::from_env().default_ttr == 60, "TUBE_DEFAULT_TTR=0 falls back to 60");
    setenv("TUBE_DEFAULT_TTR", "-5", 1);
    TEST_ASSERT(TubeConfig::from_env().default_ttr == 60, "negative TUBE_DEFAULT_TTR falls back to 60");

    configure_logging(config.logging);
    TEST_ASSERT(spdlog::get_level() == spdlog::level::debug, "log level applied");

    LoggingConfig bogus;
    bogus.log_level = "chatty";
    configure_logging(bogus);
    TEST_ASSERT(spdlog::get_level() == spdlog::level::info, "unknown level falls back to info");

    unsetenv("TUBE_MAX_JOBS");
    unsetenv("TUBE_DEFAULT_TTR");
    unsetenv("TUBE_ALLOW_UNRESERVED_DELETE");
    unsetenv("SWEEP_INTERVAL_MS");
    unsetenv("LOG_LEVEL");
    spdlog::set_level(spdlog::level::warn);

    return true;
}

// Test 5: JSON form of events and jobs
bool test_json_serialization() {
    std::cout << "\n=== Test 5: JSON Serialization ===" << std::endl;

    auto clock = std::make_shared<ManualClock>();
    auto listener = std::make_shared<RecordingListener>();
    Tube tube("mail", TubeConfig(), clock, std::make_shared<SequentialIdGenerator>("job-"), listener);

    JobId id = tube.put(3, 0, 30, "hello");
    tube.reserve(0ms, "worker-1");

    auto events = listener->events();
    TEST_ASSERT(events.size() == 2, "put and reserve recorded");

    nlohmann::json put = events[0].to_json();
    TEST_ASSERT(put["kind"] == "put", "put event kind");
    TEST_ASSERT(put["tube"] == "mail", "put event tube");
    TEST_ASSERT(put["id"] == id, "put event id");
    TEST_ASSERT(put["from"].is_null(), "put has no source state");
    TEST_ASSERT(put["to"] == "ready", "put lands in ready");
    TEST_ASSERT(put["pri"] == 3 && put["ttr"] == 30 && put["bytes"] == 5, "put event job fields");
    TEST_ASSERT(!put.contains("consumer"), "no consumer on put");

    nlohmann::json reserve = events[1].to_json();
    TEST_ASSERT(reserve["from"] == "ready" && reserve["to"] == "reserved", "reserve edge");
    TEST_ASSERT(reserve["consumer"] == "worker-1", "reserve event names the consumer");

    nlohmann::json snapshot = job_to_json(*tube.peek(id));
    TEST_ASSERT(snapshot["state"] == "reserved", "snapshot state");
    TEST_ASSERT(snapshot["reserves"] == 1, "snapshot counters");
    TEST_ASSERT(snapshot["reserved_by"] == "worker-1", "snapshot holder");
    TEST_ASSERT(snapshot.contains("expires_at_ms"), "snapshot deadline");
    TEST_ASSERT(!snapshot.contains("payload"), "snapshot omits payload body");

    // The logging listener must accept any event
    LoggingTransitionListener logging;
    logging.on_transition(events[1]);

    return true;
}

// Test 6: UUID job ids
bool test_uuid_ids() {
    std::cout << "\n=== Test 6: UUID Job Ids ===" << std::endl;

    TubeRegistry registry(TubeConfig(), nullptr, std::make_shared<UuidGenerator>());
    auto tube = registry.get_or_create("uuids");

    std::set<JobId> ids;
    for (int i = 0; i < 100; ++i) {
        ids.insert(tube->put(1, 0, 60, "x"));
    }
    TEST_ASSERT(ids.size() == 100, "uuid ids unique");

    const JobId& sample = *ids.begin();
    TEST_ASSERT(sample.size() == 36, "uuid is 36 characters");
    TEST_ASSERT(sample[8] == '-' && sample[13] == '-' && sample[18] == '-' && sample[23] == '-',
                "uuid has dashes in canonical positions");
    TEST_ASSERT(sample[14] == '4', "uuid is version 4");
    bool variant_ok = true;
    for (const auto& id : ids) {
        char v = id[19];
        variant_ok = variant_ok && (v == '8' || v == '9' || v == 'a' || v == 'b') && id[14] == '4';
    }
    TEST_ASSERT(variant_ok, "every uuid carries version 4 and the RFC 4122 variant");

    return true;
}

// Main test runner
int main() {
    spdlog::set_level(spdlog::level::warn);  // Reduce noise during tests

    bool all_passed = true;

    all_passed &= test_registry_lookup();
    all_passed &= test_concurrent_get_or_create();
    all_passed &= test_tube_isolation();
    all_passed &= test_config_from_env();
    all_passed &= test_json_serialization();
    all_passed &= test_uuid_ids();

    std::cout << "\n" << std::string(60, '=') << std::endl;
    if (all_passed) {
        std::cout << "✅ ALL TESTS PASSED!" << std::endl;
        return 0;
    } else {
        std::cout << "❌ SOME TESTS FAILED" << std::endl;
        return 1;
    }
}
