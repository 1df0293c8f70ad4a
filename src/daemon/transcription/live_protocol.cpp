#include "transcription/live_protocol.hpp"

#include "text_util.hpp"

#include <nlohmann/json.hpp>
#include <print>

using json = nlohmann::json;

namespace {

std::string committed_text(const json& j, std::optional<int>& speaker) {
    std::string joined;
    if (!j.contains("lines") || !j["lines"].is_array()) return joined;

    for (auto& line : j["lines"]) {
        if (!line.is_object()) continue;
        auto text = line.value("text", std::string{});
        if (text.empty()) continue;
        if (!joined.empty()) joined += ' ';
        joined += text;
        if (line.contains("speaker") && line["speaker"].is_number_integer()) {
            speaker = line["speaker"].get<int>();
        }
    }
    return normalize_whitespace(joined);
}

} // namespace

std::vector<TranscriptEvent> LiveProtocolDecoder::decode(std::string_view message) {
    std::vector<TranscriptEvent> events;

    json j;
    try {
        j = json::parse(message);
    } catch (const json::exception& e) {
        std::println(stderr, "channel: undecodable message: {}", e.what());
        return events;
    }

    if (!j.is_object()) return events;

    auto type = j.value("type", std::string{});
    if (type == "config") return events;

    if (j.contains("error") || j.value("status", std::string{}) == "error") {
        std::println(stderr, "channel: server reported error: {}", j.dump());
        return events;
    }

    try {
        std::optional<int> speaker;
        auto committed = committed_text(j, speaker);
        if (!committed.empty() && committed != last_committed_) {
            last_committed_ = committed;
            events.push_back(TranscriptEvent::final_text(committed));
        }

        if (type == "ready_to_stop") {
            events.push_back(TranscriptEvent::end_of_stream());
            return events;
        }

        auto buffer = normalize_whitespace(j.value("buffer_transcription", std::string{}));
        if (!buffer.empty()) {
            auto text = last_committed_.empty() ? buffer : last_committed_ + " " + buffer;
            events.push_back(TranscriptEvent::partial(std::move(text), speaker));
        }
    } catch (const json::exception& e) {
        std::println(stderr, "channel: malformed transcript message: {}", e.what());
    }

    return events;
}
