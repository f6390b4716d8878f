#include "framecast/transport/udp_socket.hpp"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/epoll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

namespace framecast::transport {

namespace {

// Fill addr from host/port; empty host or 0.0.0.0 means INADDR_ANY
bool resolve(const SocketAddress& address, sockaddr_in& addr) {
    addr = {};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(address.port);

    if (address.host.empty() || address.host == "0.0.0.0") {
        addr.sin_addr.s_addr = INADDR_ANY;
        return true;
    }

    if (inet_pton(AF_INET, address.host.c_str(), &addr.sin_addr) == 1) {
        return true;
    }

    addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_DGRAM;

    addrinfo* result = nullptr;
    if (getaddrinfo(address.host.c_str(), nullptr, &hints, &result) != 0 || !result) {
        return false;
    }
    addr.sin_addr = reinterpret_cast<sockaddr_in*>(result->ai_addr)->sin_addr;
    freeaddrinfo(result);
    return true;
}

SocketAddress to_socket_address(const sockaddr_in& addr) {
    char ip_str[INET_ADDRSTRLEN] = {};
    inet_ntop(AF_INET, &addr.sin_addr, ip_str, sizeof(ip_str));
    return SocketAddress{ip_str, ntohs(addr.sin_port)};
}

}  // namespace

UdpSocket::~UdpSocket() {
    close();
}

UdpSocket::UdpSocket(UdpSocket&& other) noexcept
    : fd_(other.fd_),
      epoll_fd_(other.epoll_fd_),
      local_addr_(std::move(other.local_addr_)),
      config_(std::move(other.config_)),
      recv_callback_(std::move(other.recv_callback_)),
      error_callback_(std::move(other.error_callback_)),
      batch_buffers_(std::move(other.batch_buffers_)),
      packets_sent_(other.packets_sent_),
      packets_received_(other.packets_received_),
      bytes_sent_(other.bytes_sent_),
      bytes_received_(other.bytes_received_),
      send_errors_(other.send_errors_),
      recv_errors_(other.recv_errors_) {
    other.fd_ = -1;
    other.epoll_fd_ = -1;
}

UdpSocket& UdpSocket::operator=(UdpSocket&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = other.fd_;
        epoll_fd_ = other.epoll_fd_;
        local_addr_ = std::move(other.local_addr_);
        config_ = std::move(other.config_);
        recv_callback_ = std::move(other.recv_callback_);
        error_callback_ = std::move(other.error_callback_);
        batch_buffers_ = std::move(other.batch_buffers_);
        packets_sent_ = other.packets_sent_;
        packets_received_ = other.packets_received_;
        bytes_sent_ = other.bytes_sent_;
        bytes_received_ = other.bytes_received_;
        send_errors_ = other.send_errors_;
        recv_errors_ = other.recv_errors_;
        other.fd_ = -1;
        other.epoll_fd_ = -1;
    }
    return *this;
}

bool UdpSocket::open(const UdpSocketConfig& config) {
    close();
    config_ = config;

    fd_ = socket(AF_INET, SOCK_DGRAM, 0);
    if (fd_ < 0) {
        handle_error(errno, "socket()");
        return false;
    }

    int optval = 1;
    if (config.reuse_address &&
        setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &optval, sizeof(optval)) < 0) {
        handle_error(errno, "setsockopt(SO_REUSEADDR)");
    }

    // Kernel may clamp these; a smaller buffer is not fatal
    int recv_buf = static_cast<int>(config.recv_buffer_size);
    int send_buf = static_cast<int>(config.send_buffer_size);
    if (setsockopt(fd_, SOL_SOCKET, SO_RCVBUF, &recv_buf, sizeof(recv_buf)) < 0) {
        handle_error(errno, "setsockopt(SO_RCVBUF)");
    }
    if (setsockopt(fd_, SOL_SOCKET, SO_SNDBUF, &send_buf, sizeof(send_buf)) < 0) {
        handle_error(errno, "setsockopt(SO_SNDBUF)");
    }

    if (config.nonblocking) {
        int flags = fcntl(fd_, F_GETFL, 0);
        if (flags < 0 || fcntl(fd_, F_SETFL, flags | O_NONBLOCK) < 0) {
            handle_error(errno, "fcntl(O_NONBLOCK)");
            close();
            return false;
        }
    }

    sockaddr_in addr{};
    if (!resolve(config.bind_address, addr)) {
        handle_error(EINVAL, "resolve(bind address)");
        close();
        return false;
    }

    if (bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        handle_error(errno, "bind()");
        close();
        return false;
    }

    socklen_t addr_len = sizeof(addr);
    if (getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &addr_len) == 0) {
        local_addr_ = to_socket_address(addr);
    }

    epoll_fd_ = epoll_create1(0);
    if (epoll_fd_ < 0) {
        handle_error(errno, "epoll_create1()");
        close();
        return false;
    }

    epoll_event ev{};
    ev.events = EPOLLIN;
    ev.data.fd = fd_;
    if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd_, &ev) < 0) {
        handle_error(errno, "epoll_ctl()");
        close();
        return false;
    }

    return true;
}

void UdpSocket::close() {
    if (epoll_fd_ >= 0) {
        ::close(epoll_fd_);
        epoll_fd_ = -1;
    }

    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

void UdpSocket::set_recv_callback(RecvCallback callback) {
    recv_callback_ = std::move(callback);
}

void UdpSocket::set_error_callback(ErrorCallback callback) {
    error_callback_ = std::move(callback);
}

std::optional<SocketAddress> UdpSocket::resolve_address(const SocketAddress& address) {
    sockaddr_in addr{};
    if (address.host.empty() || !resolve(address, addr)) {
        return std::nullopt;
    }
    return to_socket_address(addr);
}

bool UdpSocket::send_to(const SocketAddress& to, std::span<const uint8_t> data) {
    if (fd_ < 0) {
        return false;
    }

    sockaddr_in addr{};
    if (to.host.empty() || !resolve(to, addr)) {
        ++send_errors_;
        handle_error(EINVAL, "resolve(destination)");
        return false;
    }

    ssize_t sent = sendto(fd_, data.data(), data.size(), 0,
                          reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    if (sent < 0) {
        ++send_errors_;
        handle_error(errno, "sendto()");
        return false;
    }

    ++packets_sent_;
    bytes_sent_ += static_cast<uint64_t>(sent);
    return true;
}

std::optional<ReceivedPacket> UdpSocket::recv() {
    if (fd_ < 0) {
        return std::nullopt;
    }

    std::vector<uint8_t> buffer(MAX_DATAGRAM_SIZE);
    sockaddr_in from_addr{};
    socklen_t from_len = sizeof(from_addr);

    ssize_t received = recvfrom(fd_, buffer.data(), buffer.size(), 0,
                                reinterpret_cast<sockaddr*>(&from_addr), &from_len);
    if (received < 0) {
        if (errno != EAGAIN && errno != EWOULDBLOCK) {
            ++recv_errors_;
            handle_error(errno, "recvfrom()");
        }
        return std::nullopt;
    }

    ++packets_received_;
    bytes_received_ += static_cast<uint64_t>(received);

    buffer.resize(static_cast<size_t>(received));
    return ReceivedPacket{to_socket_address(from_addr), std::move(buffer)};
}

std::vector<ReceivedPacket> UdpSocket::recv_many(size_t max_packets) {
    if (fd_ < 0 || max_packets == 0) {
        return {};
    }

    std::vector<mmsghdr> msgs(max_packets);
    std::vector<iovec> iovecs(max_packets);
    std::vector<sockaddr_in> addrs(max_packets);
    if (batch_buffers_.size() < max_packets) {
        batch_buffers_.resize(max_packets, std::vector<uint8_t>(MAX_DATAGRAM_SIZE));
    }

    for (size_t i = 0; i < max_packets; ++i) {
        iovecs[i].iov_base = batch_buffers_[i].data();
        iovecs[i].iov_len = batch_buffers_[i].size();

        msgs[i] = {};
        msgs[i].msg_hdr.msg_name = &addrs[i];
        msgs[i].msg_hdr.msg_namelen = sizeof(addrs[i]);
        msgs[i].msg_hdr.msg_iov = &iovecs[i];
        msgs[i].msg_hdr.msg_iovlen = 1;
    }

    int received = recvmmsg(fd_, msgs.data(), static_cast<unsigned int>(max_packets),
                            MSG_DONTWAIT, nullptr);
    if (received < 0) {
        if (errno != EAGAIN && errno != EWOULDBLOCK) {
            ++recv_errors_;
            handle_error(errno, "recvmmsg()");
        }
        return {};
    }

    std::vector<ReceivedPacket> packets;
    packets.reserve(static_cast<size_t>(received));

    for (int i = 0; i < received; ++i) {
        ++packets_received_;
        bytes_received_ += msgs[i].msg_len;

        const auto& buffer = batch_buffers_[static_cast<size_t>(i)];
        packets.push_back(ReceivedPacket{
            to_socket_address(addrs[i]),
            std::vector<uint8_t>(buffer.begin(), buffer.begin() + msgs[i].msg_len)});
    }

    return packets;
}

int UdpSocket::poll_recv(int timeout_ms) {
    if (epoll_fd_ < 0) {
        return -1;
    }

    epoll_event events[4];
    int nfds = epoll_wait(epoll_fd_, events, 4, timeout_ms);
    if (nfds < 0 && errno != EINTR) {
        handle_error(errno, "epoll_wait()");
    }
    return nfds < 0 ? -1 : nfds;
}

size_t UdpSocket::run_once(int timeout_ms) {
    if (poll_recv(timeout_ms) <= 0) {
        return 0;
    }

    size_t dispatched = 0;
    for (;;) {
        auto packets = recv_many(64);
        if (packets.empty()) {
            break;
        }
        for (auto& pkt : packets) {
            ++dispatched;
            if (recv_callback_) {
                recv_callback_(std::move(pkt));
            }
        }
        if (packets.size() < 64) {
            break;
        }
    }
    return dispatched;
}

void UdpSocket::handle_error(int error_code, const char* context) {
    if (error_callback_) {
        error_callback_(error_code, std::string(context) + ": " + std::strerror(error_code));
    }
}

}  // namespace framecast::transport
