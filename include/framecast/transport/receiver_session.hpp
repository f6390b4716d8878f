#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "udp_socket.hpp"
#include "framecast/mux/eviction_sweeper.hpp"
#include "framecast/mux/frame_reassembler.hpp"

namespace framecast::transport {

struct ReceiverSessionConfig {
    SocketAddress listen_address{"0.0.0.0", 5005};
    mux::ReassemblerConfig reassembler;
    mux::SweeperConfig sweeper;
};

enum class ReceiverState {
    STOPPED,
    RUNNING
};

// One listening endpoint: socket, reassembly table and its sweeper.
// stop() cancels the sweep and drops every partial frame.
class ReceiverSession {
public:
    using FrameCallback = std::function<void(mux::CompletedFrame frame)>;
    using ErrorCallback = std::function<void(const std::string& error)>;

    explicit ReceiverSession(const ReceiverSessionConfig& config);
    ~ReceiverSession();

    ReceiverSession(const ReceiverSession&) = delete;
    ReceiverSession& operator=(const ReceiverSession&) = delete;

    // Called on the receive thread for each completed frame; must not block
    void set_frame_callback(FrameCallback callback);
    void set_error_callback(ErrorCallback callback);

    // Bind the socket and start the sweeper
    bool start();

    void stop();

    // Wait up to timeout_ms for datagrams and ingest them.
    // Returns the number of datagrams processed.
    size_t process(int timeout_ms = 0);

    // Ingest one datagram as if it had arrived on the socket
    void handle_datagram(std::span<const uint8_t> datagram);

    [[nodiscard]] ReceiverState state() const { return state_; }
    [[nodiscard]] const SocketAddress& local_address() const { return socket_.local_address(); }
    [[nodiscard]] const mux::FrameReassembler& reassembler() const { return *reassembler_; }
    [[nodiscard]] const UdpSocket& socket() const { return socket_; }

private:
    ReceiverSessionConfig config_;
    ReceiverState state_{ReceiverState::STOPPED};

    UdpSocket socket_;
    std::unique_ptr<mux::FrameReassembler> reassembler_;
    std::unique_ptr<mux::EvictionSweeper> sweeper_;

    FrameCallback frame_callback_;
    ErrorCallback error_callback_;

    void handle_received_packet(ReceivedPacket packet);
};

}  // namespace framecast::transport
