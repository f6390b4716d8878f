#include "framecast/mux/frame_reassembler.hpp"

#include <spdlog/spdlog.h>

#include "framecast/protocol/chunk_header.hpp"
#include "framecast/utils/time.hpp"

namespace framecast::mux {

namespace {

void set_status(IngestStatus* status, IngestStatus value) {
    if (status) {
        *status = value;
    }
}

}  // namespace

const char* ingest_status_to_string(IngestStatus status) {
    switch (status) {
        case IngestStatus::ACCEPTED: return "accepted";
        case IngestStatus::COMPLETED: return "completed";
        case IngestStatus::DUPLICATE: return "duplicate";
        case IngestStatus::MALFORMED_PACKET: return "malformed packet";
        case IngestStatus::INVALID_HEADER: return "invalid header";
    }
    return "unknown";
}

void FrameReassembler::PartialFrame::reset(uint16_t total) {
    total_chunks = total;
    slots.assign(total, std::nullopt);
    received_count = 0;
    total_bytes = 0;
}

FrameReassembler::FrameReassembler(const ReassemblerConfig& config)
    : config_(config) {
}

std::optional<CompletedFrame> FrameReassembler::ingest_chunk(std::span<const uint8_t> datagram,
                                                             uint64_t now_ms,
                                                             IngestStatus* status) {
    protocol::ParseError parse_error = protocol::ParseError::SUCCESS;
    auto parsed = protocol::parse_chunk(datagram, &parse_error);

    std::lock_guard<std::mutex> lock(mutex_);

    if (!parsed) {
        if (parse_error == protocol::ParseError::PACKET_TOO_SHORT) {
            ++stats_.packets_malformed;
            spdlog::warn("Received packet too small ({} bytes). Ignoring.", datagram.size());
            set_status(status, IngestStatus::MALFORMED_PACKET);
        } else {
            ++stats_.headers_invalid;
            auto header = protocol::read_header(datagram);
            spdlog::warn("Invalid header (chunk {} of {}). Skipping packet.",
                         header ? header->chunk_index : 0, header ? header->total_chunks : 0);
            set_status(status, IngestStatus::INVALID_HEADER);
        }
        return std::nullopt;
    }

    ++stats_.chunks_received;

    const auto& header = parsed->header;
    auto it = pending_.find(header.frame_id);
    if (it == pending_.end()) {
        PartialFrame frame;
        frame.reset(header.total_chunks);
        frame.last_update_ms = now_ms;
        it = pending_.emplace(header.frame_id, std::move(frame)).first;
    }

    auto& frame = it->second;

    // Newest header wins: a different chunk count discards what was collected
    if (frame.total_chunks != header.total_chunks) {
        ++stats_.header_conflicts;
        spdlog::warn("Frame #{}: total_chunks mismatch ({} -> {}), discarding {} collected chunks",
                     header.frame_id, frame.total_chunks, header.total_chunks,
                     frame.received_count);
        frame.reset(header.total_chunks);
    }

    auto& slot = frame.slots[header.chunk_index];
    if (slot) {
        ++stats_.chunks_duplicate;
        spdlog::debug("Frame #{}: duplicate chunk {}", header.frame_id, header.chunk_index);
        set_status(status, IngestStatus::DUPLICATE);
        return std::nullopt;
    }

    slot.emplace(parsed->payload.begin(), parsed->payload.end());
    ++frame.received_count;
    frame.total_bytes += parsed->payload.size();
    frame.last_update_ms = now_ms;

    if (frame.received_count < frame.total_chunks) {
        set_status(status, IngestStatus::ACCEPTED);
        return std::nullopt;
    }

    CompletedFrame completed;
    completed.frame_id = header.frame_id;
    completed.data = assemble(frame);
    pending_.erase(it);
    ++stats_.frames_completed;

    set_status(status, IngestStatus::COMPLETED);
    return completed;
}

std::vector<uint8_t> FrameReassembler::assemble(const PartialFrame& frame) {
    std::vector<uint8_t> result;
    result.reserve(frame.total_bytes);

    for (const auto& slot : frame.slots) {
        result.insert(result.end(), slot->begin(), slot->end());
    }

    return result;
}

size_t FrameReassembler::cleanup_expired(uint64_t now_ms) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<uint32_t> expired;
    for (const auto& [frame_id, frame] : pending_) {
        if (utils::elapsed_ms(frame.last_update_ms, now_ms) > config_.frame_timeout_ms) {
            spdlog::warn("Discarding incomplete frame #{}: received {}/{} chunks.",
                         frame_id, frame.received_count, frame.total_chunks);
            expired.push_back(frame_id);
        }
    }

    for (uint32_t frame_id : expired) {
        pending_.erase(frame_id);
    }

    stats_.frames_expired += expired.size();
    return expired.size();
}

void FrameReassembler::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!pending_.empty()) {
        spdlog::debug("Dropping {} partial frames", pending_.size());
    }
    pending_.clear();
}

size_t FrameReassembler::pending_frames() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

std::optional<PartialFrameInfo> FrameReassembler::partial_frame(uint32_t frame_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_.find(frame_id);
    if (it == pending_.end()) {
        return std::nullopt;
    }
    return PartialFrameInfo{it->second.total_chunks, it->second.received_count,
                            it->second.last_update_ms};
}

ReassemblerStats FrameReassembler::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

}  // namespace framecast::mux
