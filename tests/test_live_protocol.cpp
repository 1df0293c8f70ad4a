#include <catch2/catch_test_macros.hpp>

#include "transcription/live_protocol.hpp"

using Kind = TranscriptEvent::Kind;

TEST_CASE("LiveProtocolDecoder", "[protocol]") {
    LiveProtocolDecoder dec;

    SECTION("BufferOnlyBecomesPartial") {
        auto ev = dec.decode(R"({"status":"active_transcription","lines":[],"buffer_transcription":"hel"})");
        REQUIRE(ev.size() == 1);
        REQUIRE(ev[0] == TranscriptEvent::partial("hel"));
    }

    SECTION("CommittedLinesBecomeFinal") {
        auto ev = dec.decode(R"({"lines":[{"speaker":1,"text":"hello world"}],"buffer_transcription":""})");
        REQUIRE(ev.size() == 1);
        REQUIRE(ev[0].kind == Kind::Final);
        REQUIRE(ev[0].text == "hello world");
    }

    SECTION("UnchangedCommittedTextIsNotRepeated") {
        const char* msg = R"({"lines":[{"text":"hello"}],"buffer_transcription":""})";
        REQUIRE(dec.decode(msg).size() == 1);
        REQUIRE(dec.decode(msg).empty());
    }

    SECTION("FinalIsCumulativeAcrossLines") {
        dec.decode(R"({"lines":[{"text":"hello"}]})");
        auto ev = dec.decode(R"({"lines":[{"text":"hello"},{"text":" world "}]})");
        REQUIRE(ev.size() == 1);
        REQUIRE(ev[0] == TranscriptEvent::final_text("hello world"));
    }

    SECTION("PartialIncludesCommittedPrefix") {
        auto ev = dec.decode(
            R"({"lines":[{"speaker":2,"text":"hello"}],"buffer_transcription":"wor"})");
        REQUIRE(ev.size() == 2);
        REQUIRE(ev[0].kind == Kind::Final);
        REQUIRE(ev[1].kind == Kind::Partial);
        REQUIRE(ev[1].text == "hello wor");
        REQUIRE(ev[1].speaker == 2);
    }

    SECTION("ReadyToStopEndsStream") {
        auto ev = dec.decode(R"({"type":"ready_to_stop"})");
        REQUIRE(ev.size() == 1);
        REQUIRE(ev[0].kind == Kind::EndOfStream);
    }

    SECTION("ReadyToStopCarryingNewLines") {
        auto ev = dec.decode(R"({"type":"ready_to_stop","lines":[{"text":"done"}]})");
        REQUIRE(ev.size() == 2);
        REQUIRE(ev[0] == TranscriptEvent::final_text("done"));
        REQUIRE(ev[1].kind == Kind::EndOfStream);
    }

    SECTION("ConfigMessageIgnored") {
        REQUIRE(dec.decode(R"({"type":"config","useAudioWorklet":false})").empty());
    }

    SECTION("ErrorMessageIgnored") {
        REQUIRE(dec.decode(R"({"status":"error","error":"model not loaded"})").empty());
    }

    SECTION("UndecodableMessageSkipped") {
        REQUIRE(dec.decode("not json").empty());
        REQUIRE(dec.decode("[1,2,3]").empty());
        auto ev = dec.decode(R"({"buffer_transcription":"still works"})");
        REQUIRE(ev.size() == 1);
    }

    SECTION("WrongFieldTypesSkipped") {
        REQUIRE(dec.decode(R"({"lines":[{"text":5}]})").empty());
    }
}
