#pragma once
#include <vector>

// One contiguous chunk of a single channel's samples, handed to the
// encoder as a unit.
struct Segment {
    int    channel    = 0;
    int    take       = 0;     // bumps every time the channel is (re)armed
    int    sequence   = 0;     // restarts at 0 for each take
    double sampleRate = 0.0;
    bool   final      = false; // flushed by stop(), may be short
    std::vector<float> samples;

    double durationSeconds() const {
        return sampleRate > 0 ? samples.size() / sampleRate : 0.0;
    }
};
