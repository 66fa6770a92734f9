#include <catch2/catch_test_macros.hpp>

#include "test_support.hpp"
#include "tts_queue/jobs/job_lister.hpp"
#include "tts_queue/jobs/job_manager.hpp"
#include "tts_queue/storage/artifact_store.hpp"

#include <chrono>
#include <string>

using tts_queue::ArtifactStore;
using tts_queue::JobLister;
using tts_queue::JobManager;
using tts_queue::JobStatus;
using tts_queue::testing::FakeEngine;
using tts_queue::testing::TempDir;
using tts_queue::testing::make_request;

namespace {

struct Fixture {
    Fixture()
        : store(dir.path()),
          manager({1, 100}, store, engine),
          lister(store, manager) {
        store.reload();
    }

    TempDir dir;
    FakeEngine engine;
    ArtifactStore store;
    JobManager manager;
    JobLister lister;
};

}

TEST_CASE("listing merges artifacts and in-memory jobs newest first") {
    Fixture fx;
    const auto now = std::chrono::system_clock::now();
    fx.store.save("old", make_request("old one"), now - std::chrono::hours(2),
                  std::string(200, 'x'));
    fx.store.save("older", make_request("older one"), now - std::chrono::hours(3),
                  std::string(200, 'x'));
    const auto active = fx.manager.submit(make_request("fresh"));

    const auto jobs = fx.lister.list();
    REQUIRE(jobs.size() == 3);
    REQUIRE(jobs[0].job_id == active);
    REQUIRE(jobs[0].status == JobStatus::Queued);
    REQUIRE_FALSE(jobs[0].audio_exists);
    REQUIRE(jobs[1].job_id == "old");
    REQUIRE(jobs[1].status == JobStatus::Completed);
    REQUIRE(jobs[1].audio_exists);
    REQUIRE(jobs[1].text == "old one");
    REQUIRE(jobs[2].job_id == "older");
}

TEST_CASE("a job with an artifact is listed once, as completed") {
    Fixture fx;
    const auto id = fx.manager.submit(make_request("both places"));
    fx.store.save(id, make_request("both places"), std::chrono::system_clock::now(),
                  std::string(200, 'x'));

    const auto jobs = fx.lister.list();
    REQUIRE(jobs.size() == 1);
    REQUIRE(jobs[0].job_id == id);
    REQUIRE(jobs[0].status == JobStatus::Completed);
    REQUIRE(jobs[0].audio_exists);
}

TEST_CASE("listing is capped and ordered by creation time") {
    Fixture fx;
    const auto now = std::chrono::system_clock::now();
    for (int i = 0; i < 60; ++i) {
        fx.store.save("done-" + std::to_string(i), make_request("n"),
                      now - std::chrono::minutes(i * 7 % 60), std::string(200, 'x'));
    }
    for (int i = 0; i < 5; ++i) {
        fx.manager.submit(make_request("pending"));
    }

    const auto jobs = fx.lister.list(50);
    REQUIRE(jobs.size() == 50);
    for (size_t i = 1; i < jobs.size(); ++i) {
        REQUIRE(jobs[i - 1].created_at >= jobs[i].created_at);
    }
    REQUIRE(fx.lister.list(3).size() == 3);
}

TEST_CASE("listed text is a bounded preview") {
    Fixture fx;
    const std::string long_text(250, 'w');
    fx.manager.submit(make_request(long_text));

    const auto jobs = fx.lister.list();
    REQUIRE(jobs.size() == 1);
    REQUIRE(jobs[0].text == std::string(100, 'w') + "...");

    const auto json = tts_queue::to_json(jobs[0]);
    REQUIRE(json.at("status") == "queued");
    REQUIRE(json.at("audio_exists") == false);
    REQUIRE(json.at("created_at").get<std::string>().size() == 26);
}
