#include <catch2/catch_test_macros.hpp>

#include "tts_queue/jobs/job.hpp"
#include "tts_queue/logging.hpp"

#include <chrono>
#include <filesystem>
#include <string>

using tts_queue::logging::format_kv;
using tts_queue::logging::kv;

TEST_CASE("kv renders job status with its wire name") {
    const auto item = kv("status", tts_queue::JobStatus::Processing);
    REQUIRE(item.key == "status");
    REQUIRE(item.value == "processing");
}

TEST_CASE("kv renders elapsed time in seconds") {
    const auto item = kv("elapsed", std::chrono::duration<double>(1.25));
    REQUIRE(item.value == "1.250s");
}

TEST_CASE("kv renders paths without stream quoting") {
    const auto item = kv("dir", std::filesystem::path("/var/lib/tts"));
    REQUIRE(item.value == "/var/lib/tts");
}

TEST_CASE("format_kv joins plain values") {
    REQUIRE(format_kv({kv("job_id", "abc"), kv("worker", 2)}) == "job_id=abc, worker=2");
}

TEST_CASE("format_kv quotes values that would break the line") {
    REQUIRE(format_kv({kv("error", "engine said \"no\"")}) ==
            "error=\"engine said \\\"no\\\"\"");
    REQUIRE(format_kv({kv("voice", "")}) == "voice=\"\"");
    REQUIRE(format_kv({kv("pair", "a=b")}) == "pair=\"a=b\"");
}
