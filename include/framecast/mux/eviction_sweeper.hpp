#pragma once

#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>

#include "frame_reassembler.hpp"

namespace framecast::mux {

struct SweeperConfig {
    uint64_t sweep_interval_ms = 1000;   // Period between sweeps
};

// Periodically discards stale partial frames from a FrameReassembler.
// The reassembler must outlive the sweeper.
class EvictionSweeper {
public:
    using Clock = std::function<uint64_t()>;

    EvictionSweeper(FrameReassembler& reassembler, const SweeperConfig& config = {});
    ~EvictionSweeper();

    EvictionSweeper(const EvictionSweeper&) = delete;
    EvictionSweeper& operator=(const EvictionSweeper&) = delete;

    // Replace the monotonic clock (tests); call before start()
    void set_clock(Clock clock);

    // Start the background thread; false if already running
    bool start();

    // Wake and join the background thread
    void stop();

    // Run one sweep on the calling thread
    size_t tick();

    [[nodiscard]] bool is_running() const;
    [[nodiscard]] uint64_t sweeps() const;

private:
    FrameReassembler& reassembler_;
    SweeperConfig config_;
    Clock clock_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::thread thread_;
    bool running_{false};
    uint64_t sweeps_{0};

    void run();
};

}  // namespace framecast::mux
