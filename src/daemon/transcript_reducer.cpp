#include "transcript_reducer.hpp"

std::optional<ReductionPolicy> parse_reduction(std::string_view name) {
    if (name == "concatenate") return ReductionPolicy::Concatenate;
    if (name == "last_final") return ReductionPolicy::LastFinal;
    return std::nullopt;
}

void TranscriptAccumulator::apply(const TranscriptEvent& event) {
    switch (event.kind) {
        case TranscriptEvent::Kind::Final:
            if (policy_ == ReductionPolicy::Concatenate) {
                finals_text_ += event.text;
            } else {
                finals_text_ = event.text;
            }
            finals_++;
            break;
        case TranscriptEvent::Kind::Partial:
            latest_partial_ = event.text;
            partials_++;
            break;
        case TranscriptEvent::Kind::EndOfStream:
            break;
    }
}

std::string TranscriptAccumulator::result() const {
    if (finals_ > 0) return finals_text_;
    return latest_partial_;
}
