#include <catch2/catch_test_macros.hpp>

#include "test_support.hpp"
#include "tts_queue/jobs/job_manager.hpp"
#include "tts_queue/metrics.hpp"
#include "tts_queue/storage/artifact_store.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using tts_queue::ArtifactStore;
using tts_queue::CapacityExceeded;
using tts_queue::JobManager;
using tts_queue::JobStatus;
using tts_queue::testing::FakeEngine;
using tts_queue::testing::TempDir;
using tts_queue::testing::make_request;
using tts_queue::testing::wait_until;

namespace {

struct Fixture {
    explicit Fixture(int max_concurrent, int admission_factor = 2)
        : store(dir.path()),
          manager({max_concurrent, admission_factor}, store, engine) {
        store.reload();
    }

    bool wait_for_status(const std::string& job_id, JobStatus status) {
        return wait_until([&]() { return manager.job_status(job_id) == status; });
    }

    TempDir dir;
    FakeEngine engine;
    ArtifactStore store;
    JobManager manager;
};

}

TEST_CASE("submit returns unique ids and queues jobs without waiting for workers") {
    Fixture fx(2);
    std::set<std::string> ids;
    for (int i = 0; i < 4; ++i) {
        const auto id = fx.manager.submit(make_request("job " + std::to_string(i)));
        REQUIRE(fx.manager.job_status(id) == JobStatus::Queued);
        ids.insert(id);
    }
    REQUIRE(ids.size() == 4);
    REQUIRE(fx.manager.queue_size() == 4);
    REQUIRE(fx.manager.memory_jobs_count() == 4);
    for (const auto& id : ids) {
        REQUIRE(id.size() == 36);
        REQUIRE(id[14] == '4');
        REQUIRE(ArtifactStore::is_valid_job_id(id));
    }
}

TEST_CASE("submit rejects empty text without touching the queue") {
    Fixture fx(1);
    REQUIRE_THROWS_AS(fx.manager.submit(make_request("")), tts_queue::ValidationError);
    REQUIRE(fx.manager.queue_size() == 0);
    REQUIRE(fx.manager.memory_jobs_count() == 0);
}

TEST_CASE("admission control refuses work beyond twice the worker count") {
    Fixture fx(1);
    REQUIRE(fx.manager.capacity_limit() == 2);

    // Workers not started: everything stays queued.
    for (int i = 0; i < 3; ++i) {
        fx.manager.submit(make_request("filler " + std::to_string(i)));
    }
    REQUIRE(fx.manager.queue_size() == 3);

    const auto rejected_before =
        tts_queue::Metrics::instance().counter_value(tts_queue::metric::kJobsRejected);
    try {
        fx.manager.submit(make_request("one too many"));
        FAIL("expected CapacityExceeded");
    } catch (const CapacityExceeded& ex) {
        REQUIRE(ex.queue_size() == 3);
        REQUIRE(ex.limit() == 2);
    }
    REQUIRE(fx.manager.queue_size() == 3);
    REQUIRE(fx.manager.memory_jobs_count() == 3);
    REQUIRE(tts_queue::Metrics::instance().counter_value(tts_queue::metric::kJobsRejected) ==
            rejected_before + 1);

    fx.manager.start();
    REQUIRE(wait_until([&]() { return fx.manager.queue_size() <= 2; }));
    REQUIRE_NOTHROW(fx.manager.submit(make_request("welcome back")));
}

TEST_CASE("concurrent submitters never overshoot the admission limit") {
    Fixture fx(2);
    const auto limit = fx.manager.capacity_limit();
    constexpr int kThreads = 16;
    constexpr int kPerThread = 4;

    std::atomic<bool> go{false};
    std::atomic<int> accepted{0};
    std::atomic<int> rejected{0};
    std::atomic<int> other_errors{0};
    std::vector<std::thread> submitters;
    for (int t = 0; t < kThreads; ++t) {
        submitters.emplace_back([&, t]() {
            while (!go.load()) {
                std::this_thread::yield();
            }
            for (int i = 0; i < kPerThread; ++i) {
                try {
                    fx.manager.submit(make_request("t" + std::to_string(t) + "-" +
                                                   std::to_string(i)));
                    ++accepted;
                } catch (const CapacityExceeded&) {
                    ++rejected;
                } catch (const std::exception&) {
                    ++other_errors;
                }
            }
        });
    }
    go.store(true);
    for (auto& submitter : submitters) {
        submitter.join();
    }

    REQUIRE(other_errors.load() == 0);
    REQUIRE(accepted.load() == static_cast<int>(limit) + 1);
    REQUIRE(rejected.load() == kThreads * kPerThread - accepted.load());
    REQUIRE(fx.manager.queue_size() == static_cast<std::size_t>(accepted.load()));
    REQUIRE(fx.manager.memory_jobs_count() == static_cast<std::size_t>(accepted.load()));
}

TEST_CASE("admission factor is configurable") {
    Fixture fx(2, 1);
    REQUIRE(fx.manager.capacity_limit() == 2);
    for (int i = 0; i < 3; ++i) {
        fx.manager.submit(make_request("x"));
    }
    REQUIRE_THROWS_AS(fx.manager.submit(make_request("x")), CapacityExceeded);
}

TEST_CASE("jobs are claimed in submission order") {
    Fixture fx(1, 10);
    std::vector<std::string> ids;
    for (const auto* text : {"first", "second", "third", "fourth"}) {
        ids.push_back(fx.manager.submit(make_request(text)));
    }
    fx.manager.start();
    REQUIRE(wait_until([&]() { return fx.manager.queue_size() == 0; }));

    const std::vector<std::string> expected{"first", "second", "third", "fourth"};
    REQUIRE(fx.engine.calls() == expected);
    for (const auto& id : ids) {
        REQUIRE(fx.manager.job_status(id) == JobStatus::Completed);
        REQUIRE(fx.store.exists(id));
    }
}

TEST_CASE("a claimed job is processing and a worker pool runs in parallel") {
    Fixture fx(3);
    fx.engine.hold();
    fx.manager.start();

    std::vector<std::string> ids;
    for (int i = 0; i < 5; ++i) {
        ids.push_back(fx.manager.submit(make_request("parallel " + std::to_string(i))));
    }
    REQUIRE(fx.engine.wait_for_in_flight(3));

    int processing = 0;
    int queued = 0;
    for (const auto& id : ids) {
        const auto status = fx.manager.job_status(id);
        REQUIRE(status.has_value());
        if (*status == JobStatus::Processing) ++processing;
        if (*status == JobStatus::Queued) ++queued;
    }
    REQUIRE(processing == 3);
    REQUIRE(queued == 2);
    REQUIRE(fx.manager.queue_size() == 5);

    // Oldest jobs are the ones running.
    REQUIRE(fx.manager.job_status(ids[0]) == JobStatus::Processing);
    REQUIRE(fx.manager.job_status(ids[4]) == JobStatus::Queued);

    fx.engine.release();
    REQUIRE(wait_until([&]() { return fx.manager.queue_size() == 0; }));
}

TEST_CASE("synthesis failure is terminal and does not stop the worker") {
    Fixture fx(1);
    fx.manager.start();

    const auto failing = fx.manager.submit(make_request("fail loudly"));
    const auto healthy = fx.manager.submit(make_request("all good"));

    REQUIRE(fx.wait_for_status(failing, JobStatus::Failed));
    REQUIRE(fx.wait_for_status(healthy, JobStatus::Completed));

    const auto info = fx.manager.job_info(failing);
    REQUIRE(info.has_value());
    REQUIRE(info->error == "engine rejected text");
    REQUIRE(info->finished_at.has_value());
    REQUIRE_FALSE(fx.store.exists(failing));

    // Not retried.
    const auto calls = fx.engine.calls();
    REQUIRE(std::count(calls.begin(), calls.end(), std::string("fail loudly")) == 1);
    REQUIRE(fx.manager.queue_size() == 0);
}

TEST_CASE("empty engine output fails the job") {
    Fixture fx(1);
    fx.engine.set_audio_size(0);
    fx.manager.start();
    const auto id = fx.manager.submit(make_request("silence"));
    REQUIRE(fx.wait_for_status(id, JobStatus::Failed));
    REQUIRE_FALSE(fx.store.exists(id));
}

TEST_CASE("an artifact outranks the in-memory status") {
    Fixture fx(1);
    fx.engine.hold();
    fx.manager.start();

    const auto id = fx.manager.submit(make_request("race"));
    REQUIRE(fx.engine.wait_for_in_flight(1));
    REQUIRE(fx.manager.job_status(id) == JobStatus::Processing);

    fx.store.save(id, make_request("race"), std::chrono::system_clock::now(),
                  std::string(256, 'z'));
    REQUIRE(fx.manager.resolve_status(id) == JobStatus::Completed);
    REQUIRE(fx.manager.job_status(id) == JobStatus::Processing);

    fx.engine.release();
    REQUIRE(fx.wait_for_status(id, JobStatus::Completed));
}

TEST_CASE("cleanup is idempotent") {
    Fixture fx(1);
    fx.manager.start();
    const auto id = fx.manager.submit(make_request("tidy"));
    REQUIRE(fx.wait_for_status(id, JobStatus::Completed));

    fx.manager.cleanup(id);
    REQUIRE_FALSE(fx.manager.job_status(id).has_value());
    REQUIRE_NOTHROW(fx.manager.cleanup(id));
    REQUIRE_FALSE(fx.manager.contains(id));
    REQUIRE_NOTHROW(fx.manager.cleanup("never-existed"));
    REQUIRE(fx.manager.memory_jobs_count() == 0);
}

TEST_CASE("cleaning up a queued job keeps it from running") {
    Fixture fx(1);
    const auto dropped = fx.manager.submit(make_request("dropped"));
    const auto kept = fx.manager.submit(make_request("kept"));
    fx.manager.cleanup(dropped);
    REQUIRE(fx.manager.queue_size() == 1);

    fx.manager.start();
    REQUIRE(fx.wait_for_status(kept, JobStatus::Completed));
    REQUIRE(fx.engine.calls() == std::vector<std::string>{"kept"});
    REQUIRE(fx.manager.queue_size() == 0);
}

TEST_CASE("active_jobs lists in-memory records in submission order") {
    Fixture fx(1);
    const auto a = fx.manager.submit(make_request("a"));
    const auto b = fx.manager.submit(make_request("b"));
    const auto records = fx.manager.active_jobs();
    REQUIRE(records.size() == 2);
    REQUIRE(records[0].id == a);
    REQUIRE(records[1].id == b);
    REQUIRE(records[0].request.text == "a");
}

TEST_CASE("stop leaves queued jobs queued and start resumes them") {
    Fixture fx(1);
    fx.engine.hold();
    fx.manager.start();
    const auto running = fx.manager.submit(make_request("running"));
    const auto waiting = fx.manager.submit(make_request("waiting"));
    REQUIRE(fx.engine.wait_for_in_flight(1));

    std::thread stopper([&]() { fx.manager.stop(); });
    REQUIRE(wait_until([&]() { return !fx.manager.is_running(); }));
    fx.engine.release();
    stopper.join();
    REQUIRE_FALSE(fx.manager.is_running());
    REQUIRE(fx.manager.job_status(running) == JobStatus::Completed);
    REQUIRE(fx.manager.job_status(waiting) == JobStatus::Queued);

    fx.manager.start();
    REQUIRE(fx.wait_for_status(waiting, JobStatus::Completed));
}

TEST_CASE("start while a stop is still joining does not strand the stopping call") {
    Fixture fx(1);
    fx.engine.hold();
    fx.manager.start();
    const auto first = fx.manager.submit(make_request("first"));
    REQUIRE(fx.engine.wait_for_in_flight(1));

    std::atomic<bool> stop_returned{false};
    std::thread stopper([&]() {
        fx.manager.stop();
        stop_returned = true;
    });
    REQUIRE(wait_until([&]() { return !fx.manager.is_running(); }));

    fx.manager.start();
    const auto second = fx.manager.submit(make_request("second"));
    REQUIRE(fx.engine.wait_for_in_flight(2));
    fx.engine.release();

    REQUIRE(wait_until([&]() { return stop_returned.load(); }));
    stopper.join();
    REQUIRE(fx.manager.is_running());
    REQUIRE(fx.wait_for_status(first, JobStatus::Completed));
    REQUIRE(fx.wait_for_status(second, JobStatus::Completed));
}
