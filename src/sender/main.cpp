#include <atomic>
#include <csignal>
#include <string>

#include <spdlog/spdlog.h>

#include "framecast/config/config.hpp"
#include "framecast/io/source_watcher.hpp"
#include "framecast/mux/frame_fragmenter.hpp"
#include "framecast/transport/udp_socket.hpp"
#include "framecast/utils/logging.hpp"

using namespace framecast;

namespace {

std::atomic<bool> g_running{true};

void signal_handler(int) {
    g_running = false;
}

}  // namespace

int main(int argc, char* argv[]) {
    int exit_code = 0;
    std::string dump_path;
    auto parsed = config::parse_cli(config::Role::SENDER, argc, argv, &exit_code, &dump_path);
    if (!parsed) {
        return exit_code;
    }
    const auto& cfg = *parsed;

    const auto level = utils::parse_log_level(cfg.log_level).value_or(utils::LogLevel::INFO);
    utils::init_logging(level);
    spdlog::debug("Log level {}", utils::log_level_name(level));

    auto validation = config::validate_config(cfg, config::Role::SENDER);
    for (const auto& warning : validation.warnings) {
        spdlog::warn("Config: {}", warning);
    }
    for (const auto& error : validation.errors) {
        spdlog::error("Config: {}", error);
    }
    if (!validation.valid) {
        return 1;
    }

    if (!dump_path.empty()) {
        if (!config::save_config(cfg, dump_path)) {
            spdlog::error("Cannot write configuration to '{}'", dump_path);
            return 1;
        }
        spdlog::info("Configuration written to '{}'", dump_path);
        return 0;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    transport::UdpSocket socket;
    socket.set_error_callback([](int code, const std::string& msg) {
        spdlog::error("Socket error {}: {}", code, msg);
    });

    transport::UdpSocketConfig socket_config;
    socket_config.bind_address = {"0.0.0.0", 0};
    if (!socket.open(socket_config)) {
        spdlog::error("Failed to open UDP socket");
        return 1;
    }

    // Resolved once so that per-chunk sends never block on a name lookup
    auto resolved = transport::UdpSocket::resolve_address(cfg.target_address);
    if (!resolved) {
        spdlog::error("Cannot resolve target host '{}'", cfg.target_address.host);
        return 1;
    }
    const transport::SocketAddress target = *resolved;
    spdlog::info("UDP connection established (sending to {}:{}).", target.host, target.port);

    mux::FrameFragmenter fragmenter(cfg.fragmenter,
        [&socket, &target](std::span<const uint8_t> datagram) {
            return socket.send_to(target, datagram);
        });

    io::SourceWatcher watcher(cfg.watcher, fragmenter);
    watcher.run(g_running);

    const auto& stats = fragmenter.stats();
    spdlog::info("Sender stopped: {} frames, {} chunks sent, {} send errors, {} frames rejected, "
                 "{} frames cancelled",
                 stats.frames_sent, stats.chunks_sent, stats.send_errors, stats.frames_rejected,
                 stats.frames_cancelled);
    return 0;
}
