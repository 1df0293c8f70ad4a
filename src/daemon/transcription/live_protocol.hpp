#pragma once

#include "transcription/channel.hpp"

#include <string>
#include <string_view>
#include <vector>

// Decodes the JSON status messages of a WhisperLiveKit style server.
//
// Every message carries the full list of committed lines so far plus the
// uncommitted "buffer_transcription". A message becomes:
//   - Final(committed)          when the committed text changed
//   - Partial(committed+buffer) when there is uncommitted text
//   - EndOfStream               for {"type": "ready_to_stop"}
class LiveProtocolDecoder {
public:
    std::vector<TranscriptEvent> decode(std::string_view message);

private:
    std::string last_committed_;
};
