#include <atomic>
#include <csignal>
#include <memory>
#include <string>

#include <spdlog/spdlog.h>

#include "framecast/config/config.hpp"
#include "framecast/io/frame_sink.hpp"
#include "framecast/transport/receiver_session.hpp"
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
    auto parsed = config::parse_cli(config::Role::RECEIVER, argc, argv, &exit_code, &dump_path);
    if (!parsed) {
        return exit_code;
    }
    const auto& cfg = *parsed;

    const auto level = utils::parse_log_level(cfg.log_level).value_or(utils::LogLevel::INFO);
    utils::init_logging(level);
    spdlog::debug("Log level {}", utils::log_level_name(level));

    auto validation = config::validate_config(cfg, config::Role::RECEIVER);
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

    auto file_sink = std::make_shared<io::FileFrameSink>(cfg.sink);
    if (!file_sink->prepare()) {
        return 1;
    }

    io::AsyncFrameSink sink(file_sink);
    if (!sink.start()) {
        spdlog::error("Failed to start frame writer");
        return 1;
    }

    transport::ReceiverSession session(config::receiver_session_config(cfg));
    session.set_frame_callback([&sink](mux::CompletedFrame frame) {
        const uint32_t frame_id = frame.frame_id;
        if (!sink.submit(std::move(frame))) {
            spdlog::warn("Frame #{} discarded: writer not running", frame_id);
        }
    });

    if (!session.start()) {
        spdlog::error("Failed to start receiver on {}:{}", cfg.listen_address.host,
                      cfg.listen_address.port);
        return 1;
    }

    while (g_running) {
        session.process(100);
    }

    session.stop();
    sink.stop();

    auto reassembly = session.reassembler().stats();
    auto persisted = sink.stats();
    spdlog::info("Receiver stopped: {} frames completed, {} expired, {} saved, {} save failures",
                 reassembly.frames_completed, reassembly.frames_expired,
                 persisted.frames_persisted, persisted.persist_failures);
    return 0;
}
