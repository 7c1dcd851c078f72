#include <catch2/catch_test_macros.hpp>

#include "EventChannel.hpp"
#include "LLMResponseParser.hpp"

#include <thread>

TEST_CASE("Markdown fences are stripped") {
    CHECK(LLMResponseParser::strip_markdown_fences("```json\n{\"a\": 1}\n```") == "{\"a\": 1}");
    CHECK(LLMResponseParser::strip_markdown_fences("  plain text  ") == "plain text");
}

TEST_CASE("JSON objects are found inside model chatter") {
    const auto parsed = LLMResponseParser::parse_json_object("Here you go: {\"name\": \"Tricks\"} Enjoy!");
    REQUIRE(parsed.ok());
    CHECK((*parsed.value)["name"].asString() == "Tricks");

    CHECK_FALSE(LLMResponseParser::parse_json_object("").ok());
    CHECK_FALSE(LLMResponseParser::parse_json_object("no braces here").ok());
    CHECK_FALSE(LLMResponseParser::parse_json_object("{\"unterminated\": ").ok());

    const auto broken = LLMResponseParser::parse_json_object("{\"a\": [1, 2}");
    REQUIRE_FALSE(broken.ok());
    CHECK(broken.error.rfind("Invalid JSON", 0) == 0);
}

TEST_CASE("Single line answers are cleaned") {
    CHECK(LLMResponseParser::clean_single_line("\"Card Magic\".") == "Card Magic");
    CHECK(LLMResponseParser::clean_single_line("\n\n- Coin Tricks\nsecond line") == "Coin Tricks");
    CHECK(LLMResponseParser::clean_single_line("1. `Recipes`") == "Recipes");
    CHECK(LLMResponseParser::clean_single_line("```\nVideos\n```") == "Videos");
    CHECK(LLMResponseParser::clean_single_line("   ").empty());
}

TEST_CASE("Event channel drops the oldest events when full") {
    EventChannel<int> channel(3);
    for (int i = 1; i <= 5; ++i) {
        channel.push(i);
    }

    CHECK(channel.size() == 3);
    CHECK(channel.dropped() == 2);
    CHECK(channel.try_pop() == 3);
    CHECK(channel.drain() == std::vector<int>{4, 5});
    CHECK_FALSE(channel.try_pop());
}

TEST_CASE("Event channel wakes a waiting consumer") {
    EventChannel<std::string> channel;
    CHECK_FALSE(channel.wait_pop(std::chrono::milliseconds(10)));

    std::thread producer([&channel] {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        channel.push("ready");
    });
    const auto event = channel.wait_pop(std::chrono::seconds(5));
    producer.join();

    REQUIRE(event);
    CHECK(*event == "ready");
}
