#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "framecast/mux/frame_reassembler.hpp"

namespace framecast::io {

// Destination for completed frames
class FrameSink {
public:
    virtual ~FrameSink() = default;

    // Persist one frame; false on failure
    virtual bool persist(const mux::CompletedFrame& frame) = 0;
};

struct FileFrameSinkConfig {
    std::string output_dir = "received_folder";
    std::string extension = ".ply";
};

// Writes each frame to <output_dir>/frame_<id>_<unix seconds><extension>
class FileFrameSink : public FrameSink {
public:
    explicit FileFrameSink(const FileFrameSinkConfig& config);

    // Create output_dir if it does not exist
    bool prepare();

    bool persist(const mux::CompletedFrame& frame) override;

    [[nodiscard]] std::filesystem::path path_for(uint32_t frame_id, uint64_t unix_seconds) const;

private:
    FileFrameSinkConfig config_;
};

struct AsyncFrameSinkStats {
    uint64_t frames_submitted{0};
    uint64_t frames_persisted{0};
    uint64_t persist_failures{0};
};

// Hands frames to a FrameSink on a worker thread so that slow writes never
// block chunk ingestion. Failures are logged and counted, never retried.
class AsyncFrameSink {
public:
    explicit AsyncFrameSink(std::shared_ptr<FrameSink> sink);
    ~AsyncFrameSink();

    AsyncFrameSink(const AsyncFrameSink&) = delete;
    AsyncFrameSink& operator=(const AsyncFrameSink&) = delete;

    bool start();

    // Persist what is already queued, then join the worker
    void stop();

    // Queue a frame; false if the sink is not running
    bool submit(mux::CompletedFrame frame);

    // Block until the queue is empty and the worker is idle
    void flush();

    [[nodiscard]] size_t queued() const;
    [[nodiscard]] AsyncFrameSinkStats stats() const;

private:
    std::shared_ptr<FrameSink> sink_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::condition_variable idle_cv_;
    std::deque<mux::CompletedFrame> queue_;
    std::thread worker_;
    bool running_{false};
    bool busy_{false};
    AsyncFrameSinkStats stats_{};

    void run();
};

}  // namespace framecast::io
