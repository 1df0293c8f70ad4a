#pragma once

#include <cstdint>
#include <vector>

// One fixed-duration block of interleaved S16 samples. Moved, never shared:
// the producer gives up the buffer when the frame is sent.
struct AudioFrame {
    uint64_t seq = 0;
    std::vector<int16_t> samples;
};
