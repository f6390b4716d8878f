#include "framecast/mux/frame_fragmenter.hpp"

#include <algorithm>
#include <thread>

#include <spdlog/spdlog.h>

#include "framecast/protocol/frame_counter.hpp"

namespace framecast::mux {

namespace {

void set_error(FragmentError* error, FragmentError value) {
    if (error) {
        *error = value;
    }
}

}  // namespace

const char* fragment_error_to_string(FragmentError error) {
    switch (error) {
        case FragmentError::SUCCESS: return "success";
        case FragmentError::EMPTY_PAYLOAD: return "empty payload";
        case FragmentError::INVALID_CHUNK_SIZE: return "invalid chunk size";
        case FragmentError::TOO_MANY_CHUNKS: return "too many chunks";
        case FragmentError::CANCELLED: return "cancelled";
    }
    return "unknown";
}

FrameFragmenter::FrameFragmenter(const FragmenterConfig& config, SendCallback send)
    : config_(config),
      send_(std::move(send)) {
}

void FrameFragmenter::set_sleep_function(SleepFunction sleep) {
    sleep_ = std::move(sleep);
}

void FrameFragmenter::set_stop_predicate(StopPredicate stop) {
    stop_ = std::move(stop);
}

void FrameFragmenter::pace(std::chrono::microseconds interval) {
    if (sleep_) {
        sleep_(interval);
        return;
    }

    // Sleep in slices so a stop request cuts the pacing interval short
    constexpr std::chrono::microseconds kSlice{10'000};
    const auto deadline = std::chrono::steady_clock::now() + interval;
    while (!stop_requested()) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            break;
        }
        auto remaining = std::chrono::duration_cast<std::chrono::microseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(remaining, kSlice));
    }
}

std::chrono::microseconds FrameFragmenter::pacing_interval() const {
    if (config_.fps <= 0.0) {
        return std::chrono::microseconds{0};
    }
    return std::chrono::microseconds{static_cast<int64_t>(1'000'000.0 / config_.fps)};
}

std::optional<std::vector<Chunk>> FrameFragmenter::make_chunks(uint32_t frame_id,
                                                               std::span<const uint8_t> data,
                                                               size_t chunk_size,
                                                               FragmentError* error) {
    if (chunk_size == 0) {
        set_error(error, FragmentError::INVALID_CHUNK_SIZE);
        return std::nullopt;
    }
    if (data.empty()) {
        set_error(error, FragmentError::EMPTY_PAYLOAD);
        return std::nullopt;
    }

    const size_t total_chunks = (data.size() + chunk_size - 1) / chunk_size;
    if (total_chunks > MAX_CHUNKS) {
        set_error(error, FragmentError::TOO_MANY_CHUNKS);
        return std::nullopt;
    }

    std::vector<Chunk> chunks;
    chunks.reserve(total_chunks);

    for (size_t i = 0; i < total_chunks; ++i) {
        size_t offset = i * chunk_size;
        size_t len = std::min(chunk_size, data.size() - offset);

        Chunk chunk;
        chunk.header.frame_id = frame_id;
        chunk.header.total_chunks = static_cast<uint16_t>(total_chunks);
        chunk.header.chunk_index = static_cast<uint16_t>(i);
        chunk.payload.assign(data.begin() + offset, data.begin() + offset + len);
        chunks.push_back(std::move(chunk));
    }

    set_error(error, FragmentError::SUCCESS);
    return chunks;
}

std::optional<uint32_t> FrameFragmenter::send(uint32_t frame_id,
                                              std::span<const uint8_t> data,
                                              size_t chunk_size,
                                              std::chrono::microseconds pacing_interval,
                                              FragmentError* error) {
    FragmentError local_error = FragmentError::SUCCESS;
    auto chunks = make_chunks(frame_id, data, chunk_size, &local_error);
    set_error(error, local_error);

    if (!chunks) {
        ++stats_.frames_rejected;
        spdlog::error("Frame #{} rejected before transmission ({} bytes, chunk size {}): {}",
                      frame_id, data.size(), chunk_size, fragment_error_to_string(local_error));
        return std::nullopt;
    }

    spdlog::debug("Sending frame #{} ({} bytes) as {} chunks", frame_id, data.size(),
                  chunks->size());

    for (size_t i = 0; i < chunks->size(); ++i) {
        if (stop_requested()) {
            ++stats_.frames_cancelled;
            set_error(error, FragmentError::CANCELLED);
            spdlog::info("Frame #{}: stopped after {}/{} chunks", frame_id, i, chunks->size());
            return std::nullopt;
        }

        const auto& chunk = (*chunks)[i];
        auto datagram = protocol::encode_chunk(chunk.header, chunk.payload);

        if (send_ && send_(datagram)) {
            ++stats_.chunks_sent;
        } else {
            ++stats_.send_errors;
            spdlog::error("Frame #{}: failed to send chunk {}/{}", frame_id,
                          chunk.header.chunk_index, chunk.header.total_chunks);
        }

        if (i + 1 < chunks->size() && pacing_interval.count() > 0) {
            pace(pacing_interval);
        }
    }

    ++stats_.frames_sent;
    return protocol::next_frame_id(frame_id);
}

std::optional<uint32_t> FrameFragmenter::send(uint32_t frame_id,
                                              std::span<const uint8_t> data,
                                              FragmentError* error) {
    return send(frame_id, data, config_.chunk_size, pacing_interval(), error);
}

}  // namespace framecast::mux
