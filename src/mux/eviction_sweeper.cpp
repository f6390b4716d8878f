#include "framecast/mux/eviction_sweeper.hpp"

#include <chrono>

#include <spdlog/spdlog.h>

#include "framecast/utils/time.hpp"

namespace framecast::mux {

EvictionSweeper::EvictionSweeper(FrameReassembler& reassembler, const SweeperConfig& config)
    : reassembler_(reassembler),
      config_(config),
      clock_(&utils::time_ms) {
}

EvictionSweeper::~EvictionSweeper() {
    stop();
}

void EvictionSweeper::set_clock(Clock clock) {
    std::lock_guard<std::mutex> lock(mutex_);
    clock_ = std::move(clock);
}

bool EvictionSweeper::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) {
        return false;
    }

    running_ = true;
    thread_ = std::thread([this]() { run(); });
    spdlog::debug("Eviction sweeper started (interval {} ms, timeout {} ms)",
                  config_.sweep_interval_ms, reassembler_.config().frame_timeout_ms);
    return true;
}

void EvictionSweeper::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            return;
        }
        running_ = false;
    }
    cv_.notify_all();

    if (thread_.joinable()) {
        thread_.join();
    }
    spdlog::debug("Eviction sweeper stopped");
}

size_t EvictionSweeper::tick() {
    Clock clock;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        clock = clock_;
        ++sweeps_;
    }
    return reassembler_.cleanup_expired(clock());
}

bool EvictionSweeper::is_running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}

uint64_t EvictionSweeper::sweeps() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sweeps_;
}

void EvictionSweeper::run() {
    const auto interval = std::chrono::milliseconds(config_.sweep_interval_ms);

    std::unique_lock<std::mutex> lock(mutex_);
    while (running_) {
        if (cv_.wait_for(lock, interval, [this] { return !running_; })) {
            break;
        }

        lock.unlock();
        size_t evicted = tick();
        if (evicted > 0) {
            spdlog::debug("Sweep discarded {} incomplete frames", evicted);
        }
        lock.lock();
    }
}

}  // namespace framecast::mux
