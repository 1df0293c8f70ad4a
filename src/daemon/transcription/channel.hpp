#pragma once

#include "audio_frame.hpp"
#include "errors.hpp"

#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <utility>

struct TranscriptEvent {
    enum class Kind { Partial, Final, EndOfStream };

    Kind kind = Kind::Partial;
    std::string text;
    std::optional<int> speaker;

    static TranscriptEvent partial(std::string text, std::optional<int> speaker = std::nullopt) {
        return {Kind::Partial, std::move(text), speaker};
    }
    static TranscriptEvent final_text(std::string text) {
        return {Kind::Final, std::move(text), std::nullopt};
    }
    static TranscriptEvent end_of_stream() {
        return {Kind::EndOfStream, {}, std::nullopt};
    }

    bool operator==(const TranscriptEvent&) const = default;
};

// Streaming connection to the remote recognizer.
//
// send() is called from the frame pump, next_event() from the event collector;
// implementations must allow the two to run concurrently. close() is only
// called once both have been joined.
class TranscriptionChannel {
public:
    virtual ~TranscriptionChannel() = default;

    // Fails with ErrorKind::Send once the connection is gone.
    virtual std::expected<void, Error> send(AudioFrame frame) = 0;

    // Blocks until the next event. std::nullopt once the peer closed, the
    // connection dropped, EndOfStream was delivered, or interrupt() was called.
    virtual std::optional<TranscriptEvent> next_event() = 0;

    // No more frames will follow. The channel stays open for reading.
    virtual std::expected<void, Error> signal_end_of_audio() = 0;

    // Wakes a blocked next_event() and makes every later call return nullopt.
    virtual void interrupt() = 0;

    // Idempotent.
    virtual void close() = 0;
};

class ChannelConnector {
public:
    virtual ~ChannelConnector() = default;

    // Fails with ErrorKind::Connect when the peer is unreachable or rejects
    // the handshake.
    virtual std::expected<std::unique_ptr<TranscriptionChannel>, Error>
        connect(const std::string& endpoint) = 0;
};
