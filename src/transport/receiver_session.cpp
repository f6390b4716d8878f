#include "framecast/transport/receiver_session.hpp"

#include <spdlog/spdlog.h>

#include "framecast/utils/time.hpp"

namespace framecast::transport {

ReceiverSession::ReceiverSession(const ReceiverSessionConfig& config)
    : config_(config),
      reassembler_(std::make_unique<mux::FrameReassembler>(config.reassembler)),
      sweeper_(std::make_unique<mux::EvictionSweeper>(*reassembler_, config.sweeper)) {
}

ReceiverSession::~ReceiverSession() {
    stop();
}

void ReceiverSession::set_frame_callback(FrameCallback callback) {
    frame_callback_ = std::move(callback);
}

void ReceiverSession::set_error_callback(ErrorCallback callback) {
    error_callback_ = std::move(callback);
}

bool ReceiverSession::start() {
    if (state_ == ReceiverState::RUNNING) {
        return true;
    }

    socket_.set_error_callback([this](int code, const std::string& msg) {
        spdlog::error("Socket error {}: {}", code, msg);
        if (error_callback_) {
            error_callback_(msg);
        }
    });

    UdpSocketConfig socket_config;
    socket_config.bind_address = config_.listen_address;

    if (!socket_.open(socket_config)) {
        if (error_callback_) {
            error_callback_("Failed to open UDP socket");
        }
        return false;
    }

    socket_.set_recv_callback([this](ReceivedPacket pkt) {
        handle_received_packet(std::move(pkt));
    });

    if (!sweeper_->start()) {
        spdlog::warn("Eviction sweeper already running");
    }

    state_ = ReceiverState::RUNNING;
    spdlog::info("UDP receiver listening on {}:{}.", socket_.local_address().host,
                 socket_.local_address().port);
    return true;
}

void ReceiverSession::stop() {
    if (state_ == ReceiverState::STOPPED) {
        return;
    }

    sweeper_->stop();
    socket_.close();

    size_t dropped = reassembler_->pending_frames();
    reassembler_->reset();
    state_ = ReceiverState::STOPPED;

    spdlog::info("UDP receiver stopped ({} incomplete frames dropped)", dropped);
}

size_t ReceiverSession::process(int timeout_ms) {
    if (state_ != ReceiverState::RUNNING) {
        return 0;
    }
    return socket_.run_once(timeout_ms);
}

void ReceiverSession::handle_received_packet(ReceivedPacket packet) {
    mux::IngestStatus status = mux::IngestStatus::ACCEPTED;
    auto frame = reassembler_->ingest_chunk(packet.data, utils::time_ms(), &status);

    if (status == mux::IngestStatus::MALFORMED_PACKET ||
        status == mux::IngestStatus::INVALID_HEADER) {
        spdlog::debug("Rejected datagram from {}:{} ({})", packet.from.host, packet.from.port,
                      mux::ingest_status_to_string(status));
    }

    if (frame) {
        spdlog::debug("Frame #{} complete ({} bytes)", frame->frame_id, frame->data.size());
        if (frame_callback_) {
            frame_callback_(std::move(*frame));
        }
    }
}

void ReceiverSession::handle_datagram(std::span<const uint8_t> datagram) {
    handle_received_packet(
        ReceivedPacket{{}, std::vector<uint8_t>(datagram.begin(), datagram.end())});
}

}  // namespace framecast::transport
