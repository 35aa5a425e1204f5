#pragma once
#include <array>
#include <atomic>
#include <cstdint>

// Input -> output monitoring routes, one bit per output channel.
// Written from the control thread, read from the stream callback.
// Every route starts muted.
class RoutingMatrix {
public:
    static constexpr int kMaxChannels = 64;

    RoutingMatrix() {
        for (auto& m : masks_) m.store(0, std::memory_order_relaxed);
    }

    static bool inRange(int input, int output) {
        return input >= 0 && input < kMaxChannels
            && output >= 0 && output < kMaxChannels;
    }

    bool unmute(int input, int output) {
        if (!inRange(input, output)) return false;
        masks_[input].fetch_or(bit(output), std::memory_order_release);
        return true;
    }

    bool mute(int input, int output) {
        if (!inRange(input, output)) return false;
        masks_[input].fetch_and(~bit(output), std::memory_order_release);
        return true;
    }

    bool isRouted(int input, int output) const {
        if (!inRange(input, output)) return false;
        return (routes(input) & bit(output)) != 0;
    }

    // Bitmask of outputs fed by this input
    uint64_t routes(int input) const {
        if (input < 0 || input >= kMaxChannels) return 0;
        return masks_[input].load(std::memory_order_acquire);
    }

    void muteAll() {
        for (auto& m : masks_) m.store(0, std::memory_order_release);
    }

private:
    static uint64_t bit(int output) { return uint64_t(1) << output; }

    std::array<std::atomic<uint64_t>, kMaxChannels> masks_;
};
