#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

// Owning wrapper around a POSIX socket descriptor.
class Socket {
public:
    Socket() = default;
    explicit Socket(int fd) : fd_(fd) {}
    ~Socket();

    Socket(Socket&& other) noexcept;
    Socket& operator=(Socket&& other) noexcept;
    Socket(const Socket&) = delete;
    Socket& operator=(const Socket&) = delete;

    // Resolves host and connects with a timeout. Throws TransferError.
    static Socket connectTo(const std::string& host, int port, std::chrono::milliseconds timeout);

    int fd() const { return fd_; }
    bool valid() const { return fd_ >= 0; }
    void close();

    // Throws TransferError when the peer goes away mid-write.
    void sendAll(const void* data, size_t length);
    // Reads until length bytes arrived or the peer closed. Returns the count read.
    size_t receiveExact(void* data, size_t length);
    // Waits up to timeout for readable data or EOF.
    bool waitReadable(std::chrono::milliseconds timeout) const;

    std::string peerAddress() const;

private:
    int fd_ = -1;
};

class TcpListener {
public:
    // Port 0 picks an ephemeral port. Throws TransferError.
    explicit TcpListener(int port, const std::string& bindAddress = "0.0.0.0");

    int port() const { return port_; }
    std::optional<Socket> accept(std::chrono::milliseconds timeout);

private:
    Socket socket_;
    int port_ = 0;
};

// First non-loopback IPv4 address of an interface that is up, or 127.0.0.1.
std::string localIPv4Address();

// Starts a non-blocking connect to every host and waits one window for them together.
// Returns the hosts that accepted.
std::vector<std::string> probeTcpPorts(const std::vector<std::string>& hosts, int port,
                                       std::chrono::milliseconds timeout);
