#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace framecast::transport {

// IPv4 endpoint
struct SocketAddress {
    std::string host;
    uint16_t port{0};

    bool operator==(const SocketAddress& other) const {
        return host == other.host && port == other.port;
    }
};

struct UdpSocketConfig {
    SocketAddress bind_address;        // Address to bind to (port 0 = ephemeral)
    bool reuse_address = true;         // SO_REUSEADDR
    bool nonblocking = true;
    size_t recv_buffer_size = 4194304; // Large enough to absorb bursts of 8 KB chunks
    size_t send_buffer_size = 1048576;
};

struct ReceivedPacket {
    SocketAddress from;
    std::vector<uint8_t> data;
};

// Largest payload a UDP/IPv4 datagram can carry
inline constexpr size_t MAX_DATAGRAM_SIZE = 65507;

// Datagram socket with epoll-driven receive
class UdpSocket {
public:
    using RecvCallback = std::function<void(ReceivedPacket packet)>;
    using ErrorCallback = std::function<void(int error_code, const std::string& message)>;

    UdpSocket() = default;
    ~UdpSocket();

    UdpSocket(const UdpSocket&) = delete;
    UdpSocket& operator=(const UdpSocket&) = delete;

    UdpSocket(UdpSocket&& other) noexcept;
    UdpSocket& operator=(UdpSocket&& other) noexcept;

    // Create, configure and bind
    bool open(const UdpSocketConfig& config);

    void close();

    [[nodiscard]] bool is_open() const { return fd_ >= 0; }
    [[nodiscard]] int fd() const { return fd_; }

    void set_recv_callback(RecvCallback callback);
    void set_error_callback(ErrorCallback callback);

    // Send one datagram. A host name in `to` is looked up on every call;
    // pass the result of resolve_address() on hot paths.
    bool send_to(const SocketAddress& to, std::span<const uint8_t> data);

    // Look up host once and return it in dotted-quad form
    static std::optional<SocketAddress> resolve_address(const SocketAddress& address);

    // Receive one datagram (non-blocking)
    std::optional<ReceivedPacket> recv();

    // Receive up to max_packets datagrams with recvmmsg
    std::vector<ReceivedPacket> recv_many(size_t max_packets);

    // Wait for readability; returns >0 if readable, 0 on timeout, -1 on error
    int poll_recv(int timeout_ms);

    // Wait up to timeout_ms, then drain and dispatch to the recv callback.
    // Returns the number of packets dispatched.
    size_t run_once(int timeout_ms);

    [[nodiscard]] const SocketAddress& local_address() const { return local_addr_; }

    [[nodiscard]] uint64_t packets_sent() const { return packets_sent_; }
    [[nodiscard]] uint64_t packets_received() const { return packets_received_; }
    [[nodiscard]] uint64_t bytes_sent() const { return bytes_sent_; }
    [[nodiscard]] uint64_t bytes_received() const { return bytes_received_; }
    [[nodiscard]] uint64_t send_errors() const { return send_errors_; }
    [[nodiscard]] uint64_t recv_errors() const { return recv_errors_; }

private:
    int fd_{-1};
    int epoll_fd_{-1};
    SocketAddress local_addr_;
    UdpSocketConfig config_;

    RecvCallback recv_callback_;
    ErrorCallback error_callback_;

    // Reused by recv_many; grown on demand, one MAX_DATAGRAM_SIZE buffer per slot
    std::vector<std::vector<uint8_t>> batch_buffers_;

    uint64_t packets_sent_{0};
    uint64_t packets_received_{0};
    uint64_t bytes_sent_{0};
    uint64_t bytes_received_{0};
    uint64_t send_errors_{0};
    uint64_t recv_errors_{0};

    void handle_error(int error_code, const char* context);
};

}  // namespace framecast::transport
