#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "infrastructure/error_handling.h"

namespace liarslie {
namespace network {

constexpr size_t FRAME_HEADER_SIZE = 4;
constexpr uint32_t DEFAULT_MAX_FRAME_SIZE = 4 * 1024 * 1024;

// Move-only owner of a socket descriptor.
class Socket {
public:
    Socket() : fd_(-1) {}
    explicit Socket(int fd) : fd_(fd) {}
    Socket(Socket&& other) noexcept : fd_(other.release()) {}
    Socket& operator=(Socket&& other) noexcept;
    Socket(const Socket&) = delete;
    Socket& operator=(const Socket&) = delete;
    ~Socket();

    int fd() const { return fd_; }
    bool valid() const { return fd_ >= 0; }
    int release();
    void close();

    // Port the socket is bound to, 0 if unknown.
    uint16_t localPort() const;

private:
    int fd_;
};

std::vector<uint8_t> frame(const std::vector<uint8_t>& payload);
// Length of a frame header; DECODE_ERROR when it exceeds maxFrameSize.
Result<uint32_t> parseFrameHeader(const uint8_t* header, uint32_t maxFrameSize);

Result<Socket> connectTo(const std::string& address, uint16_t port,
                         uint32_t connectTimeoutMs, uint32_t ioTimeoutMs);
// Port 0 binds an ephemeral port; read it back with Socket::localPort().
Result<Socket> listenOn(const std::string& address, uint16_t port, int backlog = 64);
Result<void> setIoTimeout(int fd, uint32_t timeoutMs);

Result<void> sendPacket(int fd, const std::vector<uint8_t>& payload);
Result<std::vector<uint8_t>> recvPacket(int fd, uint32_t maxFrameSize = DEFAULT_MAX_FRAME_SIZE);

}
}
