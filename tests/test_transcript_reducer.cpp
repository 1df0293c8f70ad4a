#include <catch2/catch_test_macros.hpp>

#include "transcript_reducer.hpp"

TEST_CASE("TranscriptAccumulator", "[reducer]") {

    SECTION("EmptyResult") {
        TranscriptAccumulator acc(ReductionPolicy::Concatenate);
        REQUIRE(acc.finals() == 0);
        REQUIRE(acc.partials() == 0);
        REQUIRE(acc.result().empty());
    }

    SECTION("ConcatenatePreservesArrivalOrder") {
        TranscriptAccumulator acc(ReductionPolicy::Concatenate);
        acc.apply(TranscriptEvent::partial("hel"));
        acc.apply(TranscriptEvent::final_text("hello "));
        acc.apply(TranscriptEvent::partial("wor"));
        acc.apply(TranscriptEvent::final_text("world"));
        REQUIRE(acc.result() == "hello world");
        REQUIRE(acc.finals() == 2);
        REQUIRE(acc.partials() == 2);
    }

    SECTION("LastFinalKeepsLatest") {
        TranscriptAccumulator acc(ReductionPolicy::LastFinal);
        acc.apply(TranscriptEvent::final_text("hello"));
        acc.apply(TranscriptEvent::final_text("hello world"));
        REQUIRE(acc.result() == "hello world");
    }

    SECTION("LatestPartialIsFallback") {
        TranscriptAccumulator acc(ReductionPolicy::Concatenate);
        acc.apply(TranscriptEvent::partial("test"));
        acc.apply(TranscriptEvent::partial("testing"));
        REQUIRE(acc.result() == "testing");
    }

    SECTION("FinalOutranksLaterPartial") {
        TranscriptAccumulator acc(ReductionPolicy::LastFinal);
        acc.apply(TranscriptEvent::final_text("kept"));
        acc.apply(TranscriptEvent::partial("kept and more"));
        REQUIRE(acc.result() == "kept");
    }

    SECTION("EndOfStreamChangesNothing") {
        TranscriptAccumulator acc(ReductionPolicy::Concatenate);
        acc.apply(TranscriptEvent::end_of_stream());
        REQUIRE(acc.finals() == 0);
        REQUIRE(acc.partials() == 0);
    }
}

TEST_CASE("parse_reduction", "[reducer]") {
    REQUIRE(parse_reduction("concatenate") == ReductionPolicy::Concatenate);
    REQUIRE(parse_reduction("last_final") == ReductionPolicy::LastFinal);
    REQUIRE_FALSE(parse_reduction("first").has_value());
}
