#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "framecast/mux/frame_fragmenter.hpp"
#include "framecast/protocol/frame_counter.hpp"

namespace framecast::io {

struct SourceWatcherConfig {
    std::string source_dir = "send_folder";
    std::string pattern = "*.ply";               // fnmatch glob on the file name
    uint64_t poll_interval_ms = 1000;
    uint64_t cache_clear_interval_ms = 120000;  // Bounds the sent-file cache
};

struct SourceWatcherStats {
    uint64_t files_sent{0};
    uint64_t read_failures{0};
    uint64_t frames_rejected{0};
    uint64_t frames_cancelled{0};
    uint64_t cache_clears{0};
};

// Polls a directory and sends each newly observed matching file as one frame.
// Owns the frame id sequence: an id is consumed only by a frame that was sent.
class SourceWatcher {
public:
    SourceWatcher(const SourceWatcherConfig& config,
                  mux::FrameFragmenter& fragmenter,
                  uint32_t initial_frame_id = 0);

    // One scan at now_ms; returns the number of frames sent.
    // The scan ends early, abandoning the frame in flight, once stop returns true.
    size_t poll_once(uint64_t now_ms, const mux::FrameFragmenter::StopPredicate& stop = {});

    // Scan every poll_interval_ms until running becomes false. Clearing running
    // also interrupts a scan or a frame part way through.
    void run(const std::atomic<bool>& running);

    // Matching files in sorted order
    [[nodiscard]] std::vector<std::filesystem::path> list_sources() const;

    [[nodiscard]] uint32_t next_frame_id() const { return counter_.current(); }
    [[nodiscard]] size_t cached_files() const { return sent_files_.size(); }
    [[nodiscard]] const SourceWatcherStats& stats() const { return stats_; }

    static std::optional<std::vector<uint8_t>> read_file(const std::filesystem::path& path);

private:
    SourceWatcherConfig config_;
    mux::FrameFragmenter& fragmenter_;
    protocol::FrameCounter counter_;
    std::set<std::string> sent_files_;
    std::optional<uint64_t> last_clear_ms_;
    SourceWatcherStats stats_{};

    enum class SendResult {
        SENT,
        FAILED,
        CANCELLED
    };

    SendResult send_file(const std::filesystem::path& path);
};

}  // namespace framecast::io
