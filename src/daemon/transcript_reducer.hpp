#pragma once

#include "transcription/channel.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

enum class ReductionPolicy {
    Concatenate, // each Final is one utterance; join in arrival order
    LastFinal,   // each Final repeats the whole transcript; keep the latest
};

std::optional<ReductionPolicy> parse_reduction(std::string_view name);

// Collects one session's transcript events and reduces them to the text
// handed to the output sink. Partials only overwrite a single slot and are
// used when no Final arrived at all.
class TranscriptAccumulator {
public:
    explicit TranscriptAccumulator(ReductionPolicy policy = ReductionPolicy::LastFinal)
        : policy_(policy) {}

    void apply(const TranscriptEvent& event);
    std::string result() const;

    size_t finals() const { return finals_; }
    size_t partials() const { return partials_; }

private:
    ReductionPolicy policy_;
    std::string finals_text_;
    std::string latest_partial_;
    size_t finals_ = 0;
    size_t partials_ = 0;
};
