#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <random>
#include <thread>
#include <vector>

#include "framecast/io/frame_sink.hpp"
#include "framecast/io/source_watcher.hpp"
#include "framecast/mux/frame_fragmenter.hpp"
#include "framecast/mux/frame_reassembler.hpp"
#include "framecast/protocol/chunk_header.hpp"

namespace framecast::io {
namespace {

namespace fs = std::filesystem;

using ::testing::_;
using ::testing::Field;
using ::testing::Return;

// Fresh directory under the system temp dir, removed on destruction
class TempDir {
public:
    TempDir() {
        std::random_device rd;
        path_ = fs::temp_directory_path() /
                ("framecast_test_" + std::to_string(rd()) + "_" + std::to_string(rd()));
        fs::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    const fs::path& path() const { return path_; }

    void write(const std::string& name, const std::vector<uint8_t>& data) const {
        std::ofstream file(path_ / name, std::ios::binary);
        file.write(reinterpret_cast<const char*>(data.data()),
                   static_cast<std::streamsize>(data.size()));
    }

private:
    fs::path path_;
};

std::vector<uint8_t> read_all(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    return {std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>()};
}

class MockFrameSink : public FrameSink {
public:
    MOCK_METHOD(bool, persist, (const mux::CompletedFrame& frame), (override));
};

TEST(FileFrameSinkTest, PathEmbedsFrameIdAndTimestamp) {
    FileFrameSink sink({.output_dir = "out", .extension = ".ply"});
    EXPECT_EQ(sink.path_for(42, 1700000000), fs::path("out") / "frame_42_1700000000.ply");
}

TEST(FileFrameSinkTest, PrepareCreatesFolder) {
    TempDir dir;
    auto out = dir.path() / "nested" / "received";

    FileFrameSink sink({.output_dir = out.string(), .extension = ".ply"});
    ASSERT_TRUE(sink.prepare());
    EXPECT_TRUE(fs::is_directory(out));
    EXPECT_TRUE(sink.prepare());
}

TEST(FileFrameSinkTest, PersistWritesBytes) {
    TempDir dir;
    FileFrameSink sink({.output_dir = dir.path().string(), .extension = ".bin"});

    mux::CompletedFrame frame{9, {0x00, 0x01, 0xFF, 0x7F}};
    ASSERT_TRUE(sink.persist(frame));

    std::vector<fs::path> files;
    for (const auto& entry : fs::directory_iterator(dir.path())) {
        files.push_back(entry.path());
    }
    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(files[0].extension(), ".bin");
    EXPECT_EQ(files[0].filename().string().rfind("frame_9_", 0), 0u);
    EXPECT_EQ(read_all(files[0]), frame.data);
}

TEST(FileFrameSinkTest, PersistFailsForMissingFolder) {
    TempDir dir;
    FileFrameSink sink({.output_dir = (dir.path() / "missing").string(), .extension = ".ply"});

    EXPECT_FALSE(sink.persist({1, {1, 2, 3}}));
}

TEST(AsyncFrameSinkTest, PersistsInSubmissionOrder) {
    auto mock = std::make_shared<MockFrameSink>();
    {
        ::testing::InSequence seq;
        EXPECT_CALL(*mock, persist(Field(&mux::CompletedFrame::frame_id, 1u))).WillOnce(Return(true));
        EXPECT_CALL(*mock, persist(Field(&mux::CompletedFrame::frame_id, 2u))).WillOnce(Return(true));
    }

    AsyncFrameSink sink(mock);
    ASSERT_TRUE(sink.start());
    EXPECT_TRUE(sink.submit({1, {1}}));
    EXPECT_TRUE(sink.submit({2, {2}}));
    sink.flush();

    auto stats = sink.stats();
    EXPECT_EQ(stats.frames_submitted, 2u);
    EXPECT_EQ(stats.frames_persisted, 2u);
    EXPECT_EQ(stats.persist_failures, 0u);
}

TEST(AsyncFrameSinkTest, FailuresAreCountedNotRetried) {
    auto mock = std::make_shared<MockFrameSink>();
    EXPECT_CALL(*mock, persist(_)).Times(1).WillOnce(Return(false));

    AsyncFrameSink sink(mock);
    ASSERT_TRUE(sink.start());
    sink.submit({5, {1, 2}});
    sink.flush();

    EXPECT_EQ(sink.stats().persist_failures, 1u);
    EXPECT_EQ(sink.stats().frames_persisted, 0u);
}

TEST(AsyncFrameSinkTest, SlowSinkDoesNotBlockSubmit) {
    auto mock = std::make_shared<MockFrameSink>();
    EXPECT_CALL(*mock, persist(_))
        .Times(3)
        .WillRepeatedly(::testing::Invoke([](const mux::CompletedFrame&) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
            return true;
        }));

    AsyncFrameSink sink(mock);
    ASSERT_TRUE(sink.start());

    auto begin = std::chrono::steady_clock::now();
    for (uint32_t id = 0; id < 3; ++id) {
        sink.submit({id, {1}});
    }
    auto elapsed = std::chrono::steady_clock::now() - begin;
    EXPECT_LT(elapsed, std::chrono::milliseconds(100));

    // stop() drains what was queued
    sink.stop();
    EXPECT_EQ(sink.stats().frames_persisted, 3u);
    EXPECT_EQ(sink.queued(), 0u);
}

TEST(AsyncFrameSinkTest, SubmitRejectedWhenStopped) {
    auto mock = std::make_shared<MockFrameSink>();
    EXPECT_CALL(*mock, persist(_)).Times(0);

    AsyncFrameSink sink(mock);
    EXPECT_FALSE(sink.submit({1, {1}}));
}

// Records datagrams instead of sending them
class SourceWatcherTest : public ::testing::Test {
protected:
    SourceWatcherConfig watcher_config() const {
        SourceWatcherConfig cfg;
        cfg.source_dir = dir.path().string();
        cfg.pattern = "*.ply";
        cfg.poll_interval_ms = 10;
        cfg.cache_clear_interval_ms = 1000;
        return cfg;
    }

    // Frame ids of every chunk-0 datagram sent so far
    std::vector<uint32_t> sent_frame_ids() const {
        std::vector<uint32_t> ids;
        for (const auto& d : datagrams) {
            auto parsed = protocol::parse_chunk(d);
            if (parsed && parsed->header.chunk_index == 0) {
                ids.push_back(parsed->header.frame_id);
            }
        }
        return ids;
    }

    TempDir dir;
    std::vector<std::vector<uint8_t>> datagrams;
    mux::FrameFragmenter fragmenter{{.chunk_size = 4, .fps = 0.0},
                                    [this](std::span<const uint8_t> d) {
                                        datagrams.emplace_back(d.begin(), d.end());
                                        return true;
                                    }};
};

TEST_F(SourceWatcherTest, SendsNewFilesInSortedOrder) {
    dir.write("b.ply", {2, 2, 2, 2, 2});
    dir.write("a.ply", {1, 1, 1});
    dir.write("ignored.txt", {9});

    SourceWatcher watcher(watcher_config(), fragmenter);
    EXPECT_EQ(watcher.poll_once(0), 2u);

    EXPECT_EQ(sent_frame_ids(), (std::vector<uint32_t>{0, 1}));
    // a.ply: 1 chunk, b.ply: 2 chunks
    EXPECT_EQ(datagrams.size(), 3u);
    EXPECT_EQ(watcher.next_frame_id(), 2u);
    EXPECT_EQ(watcher.cached_files(), 2u);
}

TEST_F(SourceWatcherTest, FilesAreSentOnce) {
    dir.write("a.ply", {1});

    SourceWatcher watcher(watcher_config(), fragmenter);
    watcher.poll_once(0);
    EXPECT_EQ(watcher.poll_once(10), 0u);

    dir.write("b.ply", {2});
    EXPECT_EQ(watcher.poll_once(20), 1u);
    EXPECT_EQ(sent_frame_ids(), (std::vector<uint32_t>{0, 1}));
}

TEST_F(SourceWatcherTest, CacheClearResendsExistingFiles) {
    dir.write("a.ply", {1});

    SourceWatcher watcher(watcher_config(), fragmenter);
    watcher.poll_once(0);
    EXPECT_EQ(watcher.poll_once(999), 0u);
    EXPECT_EQ(watcher.poll_once(1000), 1u);

    EXPECT_EQ(watcher.stats().cache_clears, 1u);
    EXPECT_EQ(sent_frame_ids(), (std::vector<uint32_t>{0, 1}));
}

TEST_F(SourceWatcherTest, RejectedFileKeepsFrameId) {
    // An empty file is read but rejected by the fragmenter
    dir.write("a.ply", {});
    dir.write("b.ply", {7, 7});

    SourceWatcher watcher(watcher_config(), fragmenter, 500);
    EXPECT_EQ(watcher.poll_once(0), 1u);

    EXPECT_EQ(sent_frame_ids(), (std::vector<uint32_t>{500}));
    EXPECT_EQ(watcher.next_frame_id(), 501u);
    EXPECT_EQ(watcher.stats().frames_rejected, 1u);
}

TEST_F(SourceWatcherTest, ReadFailureKeepsFrameId) {
    SourceWatcher watcher(watcher_config(), fragmenter, 3);
    EXPECT_FALSE(SourceWatcher::read_file(dir.path() / "nope.ply").has_value());

    dir.write("b.ply", {1});
    watcher.poll_once(0);
    EXPECT_EQ(sent_frame_ids(), (std::vector<uint32_t>{3}));
}

TEST_F(SourceWatcherTest, FrameIdWrapsAcrossFiles) {
    dir.write("a.ply", {1});
    dir.write("b.ply", {2});

    SourceWatcher watcher(watcher_config(), fragmenter, 0xFFFFFFFFu);
    watcher.poll_once(0);

    EXPECT_EQ(sent_frame_ids(), (std::vector<uint32_t>{0xFFFFFFFFu, 0u}));
    EXPECT_EQ(watcher.next_frame_id(), 1u);
}

TEST_F(SourceWatcherTest, MissingFolderSendsNothing) {
    auto cfg = watcher_config();
    cfg.source_dir = (dir.path() / "absent").string();

    SourceWatcher watcher(cfg, fragmenter);
    EXPECT_EQ(watcher.poll_once(0), 0u);
    EXPECT_TRUE(datagrams.empty());
}

TEST_F(SourceWatcherTest, RunStopsWhenFlagCleared) {
    dir.write("a.ply", {1, 2, 3});

    std::atomic<bool> running{true};
    mux::FrameFragmenter stopping{{.chunk_size = 4, .fps = 0.0},
                                  [&running](std::span<const uint8_t>) {
                                      running = false;
                                      return true;
                                  }};
    SourceWatcher watcher(watcher_config(), stopping);
    watcher.run(running);

    EXPECT_EQ(watcher.stats().files_sent, 1u);
    EXPECT_EQ(watcher.next_frame_id(), 1u);
}

TEST_F(SourceWatcherTest, StopEndsScanBetweenFiles) {
    dir.write("a.ply", {1});
    dir.write("b.ply", {2});

    SourceWatcher watcher(watcher_config(), fragmenter);
    EXPECT_EQ(watcher.poll_once(0, [this] { return !datagrams.empty(); }), 1u);
    EXPECT_EQ(watcher.cached_files(), 1u);

    // The skipped file is still picked up by the next scan
    EXPECT_EQ(watcher.poll_once(10), 1u);
    EXPECT_EQ(sent_frame_ids(), (std::vector<uint32_t>{0, 1}));
}

TEST_F(SourceWatcherTest, RunReturnsPromptlyWithBacklog) {
    constexpr int kFiles = 20;
    for (int i = 0; i < kFiles; ++i) {
        dir.write("frame_" + std::to_string(100 + i) + ".ply", std::vector<uint8_t>(20000, 0xAB));
    }

    // Real pacing: 3 chunks per file, 33 ms apart
    std::atomic<size_t> chunks{0};
    mux::FrameFragmenter paced{{.chunk_size = 8000, .fps = 30.0},
                               [&chunks](std::span<const uint8_t>) {
                                   ++chunks;
                                   return true;
                               }};
    SourceWatcher watcher(watcher_config(), paced);

    std::atomic<bool> running{true};
    std::thread runner([&] { watcher.run(running); });

    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    auto stop_requested = std::chrono::steady_clock::now();
    running = false;
    const size_t chunks_at_stop = chunks.load();
    runner.join();
    auto shutdown = std::chrono::steady_clock::now() - stop_requested;

    EXPECT_LT(shutdown, std::chrono::milliseconds(300));
    EXPECT_LT(watcher.stats().files_sent, static_cast<uint64_t>(kFiles));
    // At most the chunk that was already going out when the flag cleared
    EXPECT_LE(chunks.load(), chunks_at_stop + 1);
}

}  // namespace
}  // namespace framecast::io
