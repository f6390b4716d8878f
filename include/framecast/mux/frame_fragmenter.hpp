#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <vector>

#include "framecast/protocol/chunk_header.hpp"

namespace framecast::mux {

// Configuration for the send side
struct FragmenterConfig {
    size_t chunk_size = 8000;   // Payload bytes per datagram, excluding header
    double fps = 30.0;          // Pacing: one chunk every 1/fps seconds
};

// One outgoing chunk before encoding
struct Chunk {
    protocol::ChunkHeader header;
    std::vector<uint8_t> payload;
};

enum class FragmentError {
    SUCCESS,
    EMPTY_PAYLOAD,
    INVALID_CHUNK_SIZE,
    TOO_MANY_CHUNKS,
    CANCELLED
};

const char* fragment_error_to_string(FragmentError error);

struct FragmenterStats {
    uint64_t frames_sent{0};
    uint64_t frames_rejected{0};
    uint64_t frames_cancelled{0};
    uint64_t chunks_sent{0};
    uint64_t send_errors{0};
};

// Splits frames into headered chunks and emits them at a paced rate.
// Delivery is best effort: a chunk handed to the send callback is never re-sent.
class FrameFragmenter {
public:
    // Send one encoded datagram; false if the network layer refused it
    using SendCallback = std::function<bool(std::span<const uint8_t> datagram)>;
    using SleepFunction = std::function<void(std::chrono::microseconds)>;
    // True once the remaining chunks of the current frame should be abandoned
    using StopPredicate = std::function<bool()>;

    static constexpr size_t MAX_CHUNKS = UINT16_MAX;

    FrameFragmenter(const FragmenterConfig& config, SendCallback send);

    // Replace the pacing sleep (tests)
    void set_sleep_function(SleepFunction sleep);

    // Checked before every chunk and while pacing; an empty predicate never stops
    void set_stop_predicate(StopPredicate stop);

    // Split data into chunks without sending anything
    static std::optional<std::vector<Chunk>> make_chunks(uint32_t frame_id,
                                                         std::span<const uint8_t> data,
                                                         size_t chunk_size,
                                                         FragmentError* error = nullptr);

    // Fragment and transmit one frame.
    // Returns the frame id to use for the next frame, or nullopt if the frame
    // was rejected before transmission (no id consumed) or cancelled by the
    // stop predicate part way through (error is CANCELLED).
    std::optional<uint32_t> send(uint32_t frame_id,
                                 std::span<const uint8_t> data,
                                 size_t chunk_size,
                                 std::chrono::microseconds pacing_interval,
                                 FragmentError* error = nullptr);

    // Same, using the configured chunk size and fps
    std::optional<uint32_t> send(uint32_t frame_id,
                                 std::span<const uint8_t> data,
                                 FragmentError* error = nullptr);

    // 1/fps; zero when fps is not positive
    [[nodiscard]] std::chrono::microseconds pacing_interval() const;

    [[nodiscard]] const FragmenterConfig& config() const { return config_; }
    [[nodiscard]] const FragmenterStats& stats() const { return stats_; }

private:
    FragmenterConfig config_;
    SendCallback send_;
    SleepFunction sleep_;
    StopPredicate stop_;
    FragmenterStats stats_{};

    [[nodiscard]] bool stop_requested() const { return stop_ && stop_(); }
    void pace(std::chrono::microseconds interval);
};

}  // namespace framecast::mux
