#include <catch2/catch_test_macros.hpp>

#include "transcription/output_filter.hpp"

TEST_CASE("Output filter", "[filter]") {

    SECTION("PlainTextUntouched") {
        REQUIRE(output_filter::apply("Hello world.") == "Hello world.");
    }

    SECTION("BracketedAnnotationsRemoved") {
        REQUIRE(output_filter::apply("[BLANK_AUDIO]") == "");
        REQUIRE(output_filter::apply("(music) Hello {inaudible} there") == "Hello there");
    }

    SECTION("TagBlocksRemoved") {
        REQUIRE(output_filter::apply("<noise>rustling</noise> Send it") == "Send it");
    }

    SECTION("FillerWordsRemoved") {
        REQUIRE(output_filter::apply("Um, I think so.") == "I think so.");
        REQUIRE(output_filter::apply("so, uh, yes") == "so, yes");
        REQUIRE(output_filter::apply("UHM hello") == "hello");
    }

    SECTION("FillersInsideWordsKept") {
        REQUIRE(output_filter::apply("human umbrella") == "human umbrella");
    }

    SECTION("WhitespaceCollapsedAndTrimmed") {
        REQUIRE(output_filter::apply("  one \n\n two   three ") == "one two three");
    }

    SECTION("OnlyArtifactsBecomesEmpty") {
        REQUIRE(output_filter::apply(" [silence] (cough) um ") == "");
    }
}
