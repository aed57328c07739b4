#include <catch2/catch_test_macros.hpp>

#include "chunker.hpp"
#include "test_support.hpp"
#include "util.hpp"
#include <stdexcept>

using testing_support::numbered_words;

TEST_CASE("chunk_words splits 450 words into three overlapping windows", "[unit][chunker]") {
    auto chunks = chunk_words(numbered_words(450), 200, 50);
    REQUIRE(chunks.size() == 3);

    auto first = split_words(chunks[0]);
    auto second = split_words(chunks[1]);
    auto third = split_words(chunks[2]);
    CHECK(first.size() == 200);
    CHECK(second.size() == 200);
    CHECK(third.size() == 150);

    CHECK(first.front() == "w0");
    CHECK(second.front() == "w150");
    CHECK(third.front() == "w300");
    CHECK(third.back() == "w449");

    // last 50 words of one window open the next
    std::vector<std::string> tail(first.end() - 50, first.end());
    std::vector<std::string> head(second.begin(), second.begin() + 50);
    CHECK(tail == head);
}

TEST_CASE("chunk_words keeps short text as one chunk", "[unit][chunker]") {
    auto chunks = chunk_words("  one\ttwo\n three  ", 200, 50);
    REQUIRE(chunks.size() == 1);
    CHECK(chunks[0] == "one two three");

    auto exact = chunk_words(numbered_words(200), 200, 50);
    REQUIRE(exact.size() == 1);
}

TEST_CASE("chunk_words yields nothing for blank text", "[unit][chunker]") {
    CHECK(chunk_words("", 200, 50).empty());
    CHECK(chunk_words(" \n\t ", 200, 50).empty());
}

TEST_CASE("chunk_words without overlap tiles the text", "[unit][chunker]") {
    auto chunks = chunk_words(numbered_words(10), 4, 0);
    REQUIRE(chunks.size() == 3);
    CHECK(chunks[0] == "w0 w1 w2 w3");
    CHECK(chunks[1] == "w4 w5 w6 w7");
    CHECK(chunks[2] == "w8 w9");
}

TEST_CASE("chunk_words with maximal overlap advances one word", "[unit][chunker]") {
    auto chunks = chunk_words(numbered_words(5), 3, 2);
    REQUIRE(chunks.size() == 3);
    CHECK(chunks[0] == "w0 w1 w2");
    CHECK(chunks[1] == "w1 w2 w3");
    CHECK(chunks[2] == "w2 w3 w4");
}

TEST_CASE("chunk_words rejects invalid window parameters", "[unit][chunker]") {
    CHECK_THROWS_AS(chunk_words("a b c", 0, 0), std::invalid_argument);
    CHECK_THROWS_AS(chunk_words("a b c", -5, 0), std::invalid_argument);
    CHECK_THROWS_AS(chunk_words("a b c", 10, 10), std::invalid_argument);
    CHECK_THROWS_AS(chunk_words("a b c", 10, 11), std::invalid_argument);
    CHECK_THROWS_AS(chunk_words("a b c", 10, -1), std::invalid_argument);
}
