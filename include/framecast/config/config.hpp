#pragma once

#include <optional>
#include <string>
#include <vector>

#include "framecast/io/frame_sink.hpp"
#include "framecast/io/source_watcher.hpp"
#include "framecast/mux/eviction_sweeper.hpp"
#include "framecast/mux/frame_fragmenter.hpp"
#include "framecast/mux/frame_reassembler.hpp"
#include "framecast/transport/receiver_session.hpp"
#include "framecast/transport/udp_socket.hpp"

namespace framecast::config {

// Which executable the configuration is for
enum class Role {
    SENDER,
    RECEIVER
};

// Complete configuration shared by sender and receiver
struct FramecastConfig {
    transport::SocketAddress listen_address{"0.0.0.0", 5005};
    transport::SocketAddress target_address{"127.0.0.1", 5005};
    mux::FragmenterConfig fragmenter;
    mux::ReassemblerConfig reassembler;
    mux::SweeperConfig sweeper;
    io::SourceWatcherConfig watcher;
    io::FileFrameSinkConfig sink;
    std::string log_level = "info";
};

// Largest chunk payload that fits one UDP datagram with the 8-byte header
inline constexpr size_t MAX_CHUNK_SIZE = 65499;

// Chunks larger than this are IP-fragmented on most paths
inline constexpr size_t RECOMMENDED_MAX_CHUNK_SIZE = 8192;

// Parse an INI configuration file.
// Missing keys keep their defaults; error receives a message on failure.
std::optional<FramecastConfig> load_config(const std::string& path, std::string* error = nullptr);

// Parse command line arguments. "-c,--config <file>" loads an INI file first
// and options given on the command line override it. On --help or a parse
// error, returns nullopt and sets exit_code to the code the process should
// exit with.
std::optional<FramecastConfig> parse_cli(Role role, int argc, char* argv[],
                                         int* exit_code = nullptr,
                                         std::string* dump_path = nullptr);

// Write configuration as INI
bool save_config(const FramecastConfig& config, const std::string& path);

struct ValidationResult {
    bool valid{true};
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
};

ValidationResult validate_config(const FramecastConfig& config, Role role);

// Receiver-side view of the configuration
transport::ReceiverSessionConfig receiver_session_config(const FramecastConfig& config);

}  // namespace framecast::config
