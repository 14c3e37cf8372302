#include "network/framing.h"
#include "utils/serialize.h"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <unistd.h>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>

namespace liarslie {
namespace network {

namespace {

bool setNonBlocking(int fd, bool enable) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0) return false;
    flags = enable ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
    return fcntl(fd, F_SETFL, flags) == 0;
}

std::string errnoText(int err) {
    return std::string(std::strerror(err));
}

Result<in_addr> resolveIPv4(const std::string& address) {
    in_addr out{};
    if (inet_pton(AF_INET, address.c_str(), &out) == 1) {
        return out;
    }
    struct addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;
    struct addrinfo* res = nullptr;
    if (getaddrinfo(address.c_str(), nullptr, &hints, &res) != 0 || !res) {
        return makeError(ErrorCode::NETWORK_ERROR, "cannot resolve " + address);
    }
    out = reinterpret_cast<struct sockaddr_in*>(res->ai_addr)->sin_addr;
    freeaddrinfo(res);
    return out;
}

Result<void> readExact(int fd, uint8_t* dst, size_t len) {
    size_t got = 0;
    while (got < len) {
        ssize_t n = ::recv(fd, dst + got, len - got, 0);
        if (n > 0) {
            got += static_cast<size_t>(n);
            continue;
        }
        if (n == 0) {
            return makeError(ErrorCode::NETWORK_ERROR, "connection closed by peer");
        }
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return makeError(ErrorCode::NETWORK_ERROR, "read timed out");
        }
        return makeError(ErrorCode::NETWORK_ERROR, "recv failed: " + errnoText(errno));
    }
    return {};
}

}

Socket& Socket::operator=(Socket&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = other.release();
    }
    return *this;
}

Socket::~Socket() {
    close();
}

int Socket::release() {
    int fd = fd_;
    fd_ = -1;
    return fd;
}

void Socket::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

uint16_t Socket::localPort() const {
    if (fd_ < 0) return 0;
    struct sockaddr_in addr{};
    socklen_t len = sizeof(addr);
    if (getsockname(fd_, reinterpret_cast<struct sockaddr*>(&addr), &len) != 0) return 0;
    return ntohs(addr.sin_port);
}

std::vector<uint8_t> frame(const std::vector<uint8_t>& payload) {
    utils::ByteBuffer buf(FRAME_HEADER_SIZE + payload.size());
    buf.writeUint32(static_cast<uint32_t>(payload.size()));
    buf.writeFixedBytes(payload.data(), payload.size());
    return buf.data();
}

Result<uint32_t> parseFrameHeader(const uint8_t* header, uint32_t maxFrameSize) {
    uint32_t len = (static_cast<uint32_t>(header[0]) << 24) |
                   (static_cast<uint32_t>(header[1]) << 16) |
                   (static_cast<uint32_t>(header[2]) << 8) |
                   static_cast<uint32_t>(header[3]);
    if (len > maxFrameSize) {
        return makeError(ErrorCode::DECODE_ERROR,
                         "frame of " + std::to_string(len) + " bytes exceeds limit " +
                         std::to_string(maxFrameSize));
    }
    return len;
}

Result<void> setIoTimeout(int fd, uint32_t timeoutMs) {
    struct timeval tv;
    tv.tv_sec = timeoutMs / 1000;
    tv.tv_usec = static_cast<suseconds_t>((timeoutMs % 1000) * 1000);
    if (setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) != 0 ||
        setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) != 0) {
        return makeError(ErrorCode::NETWORK_ERROR, "setsockopt timeout: " + errnoText(errno));
    }
    return {};
}

Result<Socket> connectTo(const std::string& address, uint16_t port,
                         uint32_t connectTimeoutMs, uint32_t ioTimeoutMs) {
    auto ip = resolveIPv4(address);
    if (!ip.ok()) return ip.error();

    Socket sock(::socket(AF_INET, SOCK_STREAM, 0));
    if (!sock.valid()) {
        return makeError(ErrorCode::NETWORK_ERROR, "socket: " + errnoText(errno));
    }

    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    addr.sin_addr = ip.value();

    std::string target = address + ":" + std::to_string(port);
    if (!setNonBlocking(sock.fd(), true)) {
        return makeError(ErrorCode::NETWORK_ERROR, "fcntl failed for " + target);
    }
    if (::connect(sock.fd(), reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        if (errno != EINPROGRESS) {
            return makeError(ErrorCode::NETWORK_ERROR, "connect " + target + ": " + errnoText(errno));
        }
        struct pollfd pfd;
        pfd.fd = sock.fd();
        pfd.events = POLLOUT;
        int pr;
        do {
            pr = poll(&pfd, 1, static_cast<int>(connectTimeoutMs));
        } while (pr < 0 && errno == EINTR);
        if (pr == 0) {
            return makeError(ErrorCode::NETWORK_ERROR, "connect " + target + ": timed out");
        }
        if (pr < 0) {
            return makeError(ErrorCode::NETWORK_ERROR, "connect " + target + ": " + errnoText(errno));
        }
        int soErr = 0;
        socklen_t len = sizeof(soErr);
        if (getsockopt(sock.fd(), SOL_SOCKET, SO_ERROR, &soErr, &len) != 0 || soErr != 0) {
            return makeError(ErrorCode::NETWORK_ERROR, "connect " + target + ": " + errnoText(soErr));
        }
    }
    if (!setNonBlocking(sock.fd(), false)) {
        return makeError(ErrorCode::NETWORK_ERROR, "fcntl failed for " + target);
    }
    auto timeout = setIoTimeout(sock.fd(), ioTimeoutMs);
    if (!timeout.ok()) return timeout.error();
    return Result<Socket>(std::move(sock));
}

Result<Socket> listenOn(const std::string& address, uint16_t port, int backlog) {
    auto ip = resolveIPv4(address);
    if (!ip.ok()) return ip.error();

    Socket sock(::socket(AF_INET, SOCK_STREAM, 0));
    if (!sock.valid()) {
        return makeError(ErrorCode::NETWORK_ERROR, "socket: " + errnoText(errno));
    }
    int opt = 1;
    setsockopt(sock.fd(), SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    addr.sin_addr = ip.value();

    if (bind(sock.fd(), reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) != 0) {
        return makeError(ErrorCode::NETWORK_ERROR,
                         "bind " + address + ":" + std::to_string(port) + ": " + errnoText(errno));
    }
    if (listen(sock.fd(), backlog) != 0) {
        return makeError(ErrorCode::NETWORK_ERROR, "listen: " + errnoText(errno));
    }
    return Result<Socket>(std::move(sock));
}

Result<void> sendPacket(int fd, const std::vector<uint8_t>& payload) {
    std::vector<uint8_t> data = frame(payload);
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = ::send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n > 0) {
            sent += static_cast<size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return makeError(ErrorCode::NETWORK_ERROR, "write timed out");
        }
        return makeError(ErrorCode::NETWORK_ERROR, "send failed: " + errnoText(errno));
    }
    return {};
}

Result<std::vector<uint8_t>> recvPacket(int fd, uint32_t maxFrameSize) {
    uint8_t header[FRAME_HEADER_SIZE];
    auto hdr = readExact(fd, header, sizeof(header));
    if (!hdr.ok()) return hdr.error();

    auto len = parseFrameHeader(header, maxFrameSize);
    if (!len.ok()) return len.error();

    std::vector<uint8_t> payload(len.value());
    if (!payload.empty()) {
        auto body = readExact(fd, payload.data(), payload.size());
        if (!body.ok()) return body.error();
    }
    return payload;
}

}
}
