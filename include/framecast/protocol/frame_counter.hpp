#pragma once

#include <cstdint>

namespace framecast::protocol {

// Successor of a frame id; wraps 0xFFFFFFFF -> 0
constexpr uint32_t next_frame_id(uint32_t frame_id) {
    return static_cast<uint32_t>(frame_id + 1u);
}

// Sender-side frame id sequence
class FrameCounter {
public:
    constexpr explicit FrameCounter(uint32_t initial = 0) : current_(initial) {}

    [[nodiscard]] constexpr uint32_t current() const { return current_; }

    // Move to the next id and return it
    constexpr uint32_t advance() {
        current_ = next_frame_id(current_);
        return current_;
    }

    // Adopt the id returned by the fragmenter after a successful send
    constexpr void set(uint32_t frame_id) { current_ = frame_id; }

private:
    uint32_t current_;
};

}  // namespace framecast::protocol
