#include "framecast/io/source_watcher.hpp"

#include <fnmatch.h>

#include <algorithm>
#include <chrono>
#include <fstream>
#include <iterator>
#include <system_error>
#include <thread>

#include <spdlog/spdlog.h>

#include "framecast/utils/time.hpp"

namespace framecast::io {

SourceWatcher::SourceWatcher(const SourceWatcherConfig& config,
                             mux::FrameFragmenter& fragmenter,
                             uint32_t initial_frame_id)
    : config_(config),
      fragmenter_(fragmenter),
      counter_(initial_frame_id) {
}

std::vector<std::filesystem::path> SourceWatcher::list_sources() const {
    std::vector<std::filesystem::path> files;

    std::error_code ec;
    std::filesystem::directory_iterator it(config_.source_dir, ec);
    if (ec) {
        spdlog::error("Cannot list folder '{}': {}", config_.source_dir, ec.message());
        return files;
    }

    for (; it != std::filesystem::directory_iterator(); it.increment(ec)) {
        if (ec) {
            spdlog::error("Error while listing '{}': {}", config_.source_dir, ec.message());
            break;
        }
        std::error_code type_ec;
        if (!it->is_regular_file(type_ec)) {
            continue;
        }
        auto name = it->path().filename().string();
        if (fnmatch(config_.pattern.c_str(), name.c_str(), 0) == 0) {
            files.push_back(it->path());
        }
    }

    std::sort(files.begin(), files.end());
    return files;
}

std::optional<std::vector<uint8_t>> SourceWatcher::read_file(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::nullopt;
    }

    std::vector<uint8_t> data((std::istreambuf_iterator<char>(file)),
                              std::istreambuf_iterator<char>());
    if (file.bad()) {
        return std::nullopt;
    }
    return data;
}

size_t SourceWatcher::poll_once(uint64_t now_ms, const mux::FrameFragmenter::StopPredicate& stop) {
    if (!last_clear_ms_) {
        last_clear_ms_ = now_ms;
    } else if (utils::elapsed_ms(*last_clear_ms_, now_ms) >= config_.cache_clear_interval_ms) {
        sent_files_.clear();
        last_clear_ms_ = now_ms;
        ++stats_.cache_clears;
        spdlog::info("Cleared sent files cache.");
    }

    const uint64_t sent_before = stats_.files_sent;
    for (const auto& path : list_sources()) {
        if (stop && stop()) {
            break;
        }

        auto key = path.string();
        if (sent_files_.count(key) > 0) {
            continue;
        }

        spdlog::info("New file detected: '{}'", key);
        if (send_file(path) == SendResult::CANCELLED) {
            break;
        }
        // Recorded even on failure; the file is retried after the next cache clear
        sent_files_.insert(std::move(key));
    }

    return static_cast<size_t>(stats_.files_sent - sent_before);
}

SourceWatcher::SendResult SourceWatcher::send_file(const std::filesystem::path& path) {
    auto data = read_file(path);
    if (!data) {
        ++stats_.read_failures;
        spdlog::error("Error reading file '{}'", path.string());
        return SendResult::FAILED;
    }

    const uint32_t frame_id = counter_.current();
    spdlog::info("Sending file '{}' ({} bytes) as frame #{}.", path.filename().string(),
                 data->size(), frame_id);

    mux::FragmentError error = mux::FragmentError::SUCCESS;
    auto next = fragmenter_.send(frame_id, *data, &error);
    if (!next) {
        if (error == mux::FragmentError::CANCELLED) {
            ++stats_.frames_cancelled;
            return SendResult::CANCELLED;
        }
        ++stats_.frames_rejected;
        return SendResult::FAILED;
    }

    counter_.set(*next);
    ++stats_.files_sent;
    spdlog::info("Finished sending file '{}' as frame #{}.", path.filename().string(), frame_id);
    return SendResult::SENT;
}

void SourceWatcher::run(const std::atomic<bool>& running) {
    spdlog::info("Started monitoring folder '{}' for new {} files...", config_.source_dir,
                 config_.pattern);

    const mux::FrameFragmenter::StopPredicate stop = [&running] { return !running.load(); };
    fragmenter_.set_stop_predicate(stop);

    constexpr uint64_t kSleepSliceMs = 100;
    while (running) {
        poll_once(utils::time_ms(), stop);

        // Sleep in slices so shutdown is noticed promptly
        uint64_t waited = 0;
        while (running && waited < config_.poll_interval_ms) {
            uint64_t slice = std::min(kSleepSliceMs, config_.poll_interval_ms - waited);
            std::this_thread::sleep_for(std::chrono::milliseconds(slice));
            waited += slice;
        }
    }

    fragmenter_.set_stop_predicate({});
}

}  // namespace framecast::io
