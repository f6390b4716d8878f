#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <span>
#include <vector>

namespace framecast::mux {

// Configuration for the receive side
struct ReassemblerConfig {
    uint64_t frame_timeout_ms = 5000;   // Idle time before a partial frame is discarded
};

// A fully reassembled frame
struct CompletedFrame {
    uint32_t frame_id{0};
    std::vector<uint8_t> data;
};

// Outcome of a single ingest_chunk() call
enum class IngestStatus {
    ACCEPTED,          // Stored, frame still incomplete
    COMPLETED,         // Stored, frame complete and returned
    DUPLICATE,         // Slot already filled, ignored
    MALFORMED_PACKET,  // Shorter than the header
    INVALID_HEADER     // total_chunks == 0 or chunk_index >= total_chunks
};

const char* ingest_status_to_string(IngestStatus status);

struct ReassemblerStats {
    uint64_t chunks_received{0};
    uint64_t chunks_duplicate{0};
    uint64_t packets_malformed{0};
    uint64_t headers_invalid{0};
    uint64_t header_conflicts{0};
    uint64_t frames_completed{0};
    uint64_t frames_expired{0};
};

// Snapshot of one partial frame, for inspection
struct PartialFrameInfo {
    uint16_t total_chunks{0};
    size_t received_count{0};
    uint64_t last_update_ms{0};
};

// Per-frame reassembly table.
// ingest_chunk() and cleanup_expired() may be called from different threads;
// all access to the table is serialized by one mutex.
class FrameReassembler {
public:
    explicit FrameReassembler(const ReassemblerConfig& config = {});

    FrameReassembler(const FrameReassembler&) = delete;
    FrameReassembler& operator=(const FrameReassembler&) = delete;

    // Feed one raw datagram received at now_ms.
    // Returns the frame if this chunk completed it.
    std::optional<CompletedFrame> ingest_chunk(std::span<const uint8_t> datagram,
                                               uint64_t now_ms,
                                               IngestStatus* status = nullptr);

    // Discard partial frames idle for longer than frame_timeout_ms.
    // Returns the number of frames discarded.
    size_t cleanup_expired(uint64_t now_ms);

    // Drop every partial frame
    void reset();

    [[nodiscard]] size_t pending_frames() const;
    [[nodiscard]] std::optional<PartialFrameInfo> partial_frame(uint32_t frame_id) const;
    [[nodiscard]] ReassemblerStats stats() const;
    [[nodiscard]] const ReassemblerConfig& config() const { return config_; }

private:
    struct PartialFrame {
        uint16_t total_chunks{0};
        std::vector<std::optional<std::vector<uint8_t>>> slots;
        size_t received_count{0};
        size_t total_bytes{0};
        uint64_t last_update_ms{0};

        void reset(uint16_t total);
    };

    ReassemblerConfig config_;
    mutable std::mutex mutex_;
    std::map<uint32_t, PartialFrame> pending_;
    ReassemblerStats stats_{};

    static std::vector<uint8_t> assemble(const PartialFrame& frame);
};

}  // namespace framecast::mux
