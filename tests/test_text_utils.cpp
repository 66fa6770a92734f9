#include <catch2/catch_test_macros.hpp>

#include "tts_queue/utils/text.hpp"

#include <string>

TEST_CASE("trim strips surrounding whitespace only") {
    REQUIRE(tts_queue::utils::trim("  Hello\tworld \n") == "Hello\tworld");
    REQUIRE(tts_queue::utils::trim(" \t\n ").empty());
}

TEST_CASE("preview leaves short text untouched") {
    const std::string exact(100, 'a');
    REQUIRE(tts_queue::utils::preview("Hello world", 100) == "Hello world");
    REQUIRE(tts_queue::utils::preview(exact, 100) == exact);
}

TEST_CASE("preview truncates long text and appends an ellipsis") {
    const std::string input(101, 'b');
    const std::string expected = std::string(100, 'b') + "...";
    REQUIRE(tts_queue::utils::preview(input, 100) == expected);
}

TEST_CASE("preview counts code points, not bytes") {
    const std::string e_acute = "\xC3\xA9";
    std::string input;
    for (int i = 0; i < 5; ++i) {
        input += e_acute;
    }
    REQUIRE(tts_queue::utils::utf8_length(input) == 5);
    REQUIRE(tts_queue::utils::preview(input, 5) == input);
    REQUIRE(tts_queue::utils::preview(input, 3) == e_acute + e_acute + e_acute + "...");
}
