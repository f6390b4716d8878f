#include "framecast/io/frame_sink.hpp"

#include <fstream>
#include <system_error>

#include <spdlog/spdlog.h>

#include "framecast/utils/time.hpp"

namespace framecast::io {

FileFrameSink::FileFrameSink(const FileFrameSinkConfig& config)
    : config_(config) {
}

bool FileFrameSink::prepare() {
    std::error_code ec;
    if (std::filesystem::is_directory(config_.output_dir, ec)) {
        return true;
    }

    if (!std::filesystem::create_directories(config_.output_dir, ec) || ec) {
        spdlog::error("Cannot create output folder '{}': {}", config_.output_dir, ec.message());
        return false;
    }

    spdlog::info("Created folder '{}' for saving received files.", config_.output_dir);
    return true;
}

std::filesystem::path FileFrameSink::path_for(uint32_t frame_id, uint64_t unix_seconds) const {
    return std::filesystem::path(config_.output_dir) /
           fmt::format("frame_{}_{}{}", frame_id, unix_seconds, config_.extension);
}

bool FileFrameSink::persist(const mux::CompletedFrame& frame) {
    auto path = path_for(frame.frame_id, utils::unix_time());

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        spdlog::error("Error saving frame #{} to '{}': cannot open file", frame.frame_id,
                      path.string());
        return false;
    }

    file.write(reinterpret_cast<const char*>(frame.data.data()),
               static_cast<std::streamsize>(frame.data.size()));
    file.close();
    if (!file) {
        spdlog::error("Error saving frame #{} to '{}': write failed", frame.frame_id,
                      path.string());
        return false;
    }

    spdlog::info("Saved complete frame #{} to '{}'.", frame.frame_id, path.string());
    return true;
}

AsyncFrameSink::AsyncFrameSink(std::shared_ptr<FrameSink> sink)
    : sink_(std::move(sink)) {
}

AsyncFrameSink::~AsyncFrameSink() {
    stop();
}

bool AsyncFrameSink::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_ || !sink_) {
        return false;
    }
    running_ = true;
    worker_ = std::thread([this]() { run(); });
    return true;
}

void AsyncFrameSink::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            return;
        }
        running_ = false;
    }
    cv_.notify_all();

    if (worker_.joinable()) {
        worker_.join();
    }
}

bool AsyncFrameSink::submit(mux::CompletedFrame frame) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            return false;
        }
        queue_.push_back(std::move(frame));
        ++stats_.frames_submitted;
    }
    cv_.notify_one();
    return true;
}

void AsyncFrameSink::flush() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_cv_.wait(lock, [this] { return (queue_.empty() && !busy_) || !running_; });
}

size_t AsyncFrameSink::queued() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

AsyncFrameSinkStats AsyncFrameSink::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

void AsyncFrameSink::run() {
    std::unique_lock<std::mutex> lock(mutex_);
    for (;;) {
        cv_.wait(lock, [this] { return !queue_.empty() || !running_; });
        if (queue_.empty()) {
            break;  // stopped and drained
        }

        auto frame = std::move(queue_.front());
        queue_.pop_front();
        busy_ = true;
        lock.unlock();

        bool ok = sink_->persist(frame);

        lock.lock();
        busy_ = false;
        if (ok) {
            ++stats_.frames_persisted;
        } else {
            ++stats_.persist_failures;
            spdlog::error("Failed to persist frame #{} ({} bytes)", frame.frame_id,
                          frame.data.size());
        }
        if (queue_.empty()) {
            idle_cv_.notify_all();
        }
    }
    idle_cv_.notify_all();
}

}  // namespace framecast::io
