#include "network/socket.hpp"
#include "common/errors.hpp"
#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace {

void setBlocking(int fd, bool blocking) {
    int flags = fcntl(fd, F_GETFL, 0);
    fcntl(fd, F_SETFL, blocking ? (flags & ~O_NONBLOCK) : (flags | O_NONBLOCK));
}

std::string errnoText() {
    return strerror(errno);
}

} // namespace

Socket::~Socket() {
    close();
}

Socket::Socket(Socket&& other) noexcept
    : fd_(other.fd_) {
    other.fd_ = -1;
}

Socket& Socket::operator=(Socket&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = other.fd_;
        other.fd_ = -1;
    }
    return *this;
}

void Socket::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

Socket Socket::connectTo(const std::string& host, int port, std::chrono::milliseconds timeout) {
    addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo* result = nullptr;

    int rc = getaddrinfo(host.c_str(), std::to_string(port).c_str(), &hints, &result);
    if (rc != 0 || !result) {
        throw TransferError("Cannot resolve " + host + ": " + gai_strerror(rc));
    }

    Socket sock(::socket(result->ai_family, result->ai_socktype, result->ai_protocol));
    if (!sock.valid()) {
        freeaddrinfo(result);
        throw TransferError("socket() failed: " + errnoText());
    }

    setBlocking(sock.fd(), false);
    rc = ::connect(sock.fd(), result->ai_addr, result->ai_addrlen);
    freeaddrinfo(result);

    if (rc != 0 && errno != EINPROGRESS) {
        throw TransferError("Connect to " + host + ":" + std::to_string(port) + " failed: " + errnoText());
    }

    if (rc != 0) {
        pollfd pfd{sock.fd(), POLLOUT, 0};
        rc = poll(&pfd, 1, static_cast<int>(timeout.count()));
        if (rc <= 0) {
            throw TransferError("Connect to " + host + ":" + std::to_string(port) + " timed out");
        }
        int error = 0;
        socklen_t len = sizeof(error);
        getsockopt(sock.fd(), SOL_SOCKET, SO_ERROR, &error, &len);
        if (error != 0) {
            throw TransferError("Connect to " + host + ":" + std::to_string(port) + " failed: " + strerror(error));
        }
    }

    setBlocking(sock.fd(), true);
    int flag = 1;
    setsockopt(sock.fd(), IPPROTO_TCP, TCP_NODELAY, &flag, sizeof(flag));
    return sock;
}

void Socket::sendAll(const void* data, size_t length) {
    const char* cursor = static_cast<const char*>(data);
    while (length > 0) {
        ssize_t sent = ::send(fd_, cursor, length, MSG_NOSIGNAL);
        if (sent < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw TransferError("Send failed: " + errnoText());
        }
        cursor += sent;
        length -= static_cast<size_t>(sent);
    }
}

size_t Socket::receiveExact(void* data, size_t length) {
    char* cursor = static_cast<char*>(data);
    size_t received = 0;
    while (received < length) {
        ssize_t n = ::recv(fd_, cursor + received, length - received, 0);
        if (n == 0) {
            break;
        }
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw TransferError("Receive failed: " + errnoText());
        }
        received += static_cast<size_t>(n);
    }
    return received;
}

bool Socket::waitReadable(std::chrono::milliseconds timeout) const {
    pollfd pfd{fd_, POLLIN, 0};
    return poll(&pfd, 1, static_cast<int>(timeout.count())) > 0;
}

std::string Socket::peerAddress() const {
    sockaddr_in address{};
    socklen_t len = sizeof(address);
    if (getpeername(fd_, reinterpret_cast<sockaddr*>(&address), &len) != 0) {
        return "";
    }
    char buffer[INET_ADDRSTRLEN] = {0};
    inet_ntop(AF_INET, &address.sin_addr, buffer, sizeof(buffer));
    return buffer;
}

TcpListener::TcpListener(int port, const std::string& bindAddress) {
    socket_ = Socket(::socket(AF_INET, SOCK_STREAM, 0));
    if (!socket_.valid()) {
        throw TransferError("socket() failed: " + errnoText());
    }

    int reuse = 1;
    setsockopt(socket_.fd(), SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

    sockaddr_in address{};
    address.sin_family = AF_INET;
    address.sin_port = htons(static_cast<uint16_t>(port));
    if (inet_pton(AF_INET, bindAddress.c_str(), &address.sin_addr) != 1) {
        throw TransferError("Invalid bind address: " + bindAddress);
    }

    if (bind(socket_.fd(), reinterpret_cast<sockaddr*>(&address), sizeof(address)) != 0) {
        throw TransferError("Cannot bind port " + std::to_string(port) + ": " + errnoText());
    }
    if (listen(socket_.fd(), 4) != 0) {
        throw TransferError("listen() failed: " + errnoText());
    }

    socklen_t len = sizeof(address);
    getsockname(socket_.fd(), reinterpret_cast<sockaddr*>(&address), &len);
    port_ = ntohs(address.sin_port);
}

std::optional<Socket> TcpListener::accept(std::chrono::milliseconds timeout) {
    if (!socket_.waitReadable(timeout)) {
        return std::nullopt;
    }

    int fd = ::accept(socket_.fd(), nullptr, nullptr);
    if (fd < 0) {
        return std::nullopt;
    }
    return Socket(fd);
}

std::string localIPv4Address() {
    ifaddrs* interfaces = nullptr;
    if (getifaddrs(&interfaces) != 0) {
        return "127.0.0.1";
    }

    std::string result = "127.0.0.1";
    for (ifaddrs* it = interfaces; it; it = it->ifa_next) {
        if (!it->ifa_addr || it->ifa_addr->sa_family != AF_INET) {
            continue;
        }
        if (!(it->ifa_flags & IFF_UP) || (it->ifa_flags & IFF_LOOPBACK)) {
            continue;
        }
        char buffer[INET_ADDRSTRLEN] = {0};
        auto* address = reinterpret_cast<sockaddr_in*>(it->ifa_addr);
        inet_ntop(AF_INET, &address->sin_addr, buffer, sizeof(buffer));
        result = buffer;
        break;
    }

    freeifaddrs(interfaces);
    return result;
}

std::vector<std::string> probeTcpPorts(const std::vector<std::string>& hosts, int port,
                                       std::chrono::milliseconds timeout) {
    std::vector<Socket> sockets;
    std::vector<pollfd> pending;
    std::vector<std::string> pendingHosts;
    std::vector<std::string> accepted;

    for (const auto& host : hosts) {
        sockaddr_in address{};
        address.sin_family = AF_INET;
        address.sin_port = htons(static_cast<uint16_t>(port));
        if (inet_pton(AF_INET, host.c_str(), &address.sin_addr) != 1) {
            continue;
        }

        Socket sock(::socket(AF_INET, SOCK_STREAM, 0));
        if (!sock.valid()) {
            continue;
        }
        setBlocking(sock.fd(), false);
        int rc = ::connect(sock.fd(), reinterpret_cast<sockaddr*>(&address), sizeof(address));
        if (rc == 0) {
            accepted.push_back(host);
        } else if (errno == EINPROGRESS) {
            pending.push_back({sock.fd(), POLLOUT, 0});
            pendingHosts.push_back(host);
            sockets.push_back(std::move(sock));
        }
    }

    auto deadline = std::chrono::steady_clock::now() + timeout;
    size_t open = pending.size();
    while (open > 0) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            break;
        }
        int ready = poll(pending.data(), pending.size(), static_cast<int>(remaining.count()));
        if (ready <= 0) {
            break;
        }

        for (size_t i = 0; i < pending.size(); ++i) {
            if (pending[i].fd < 0 || pending[i].revents == 0) {
                continue;
            }
            int error = 0;
            socklen_t len = sizeof(error);
            getsockopt(pending[i].fd, SOL_SOCKET, SO_ERROR, &error, &len);
            if (error == 0 && (pending[i].revents & POLLOUT)) {
                accepted.push_back(pendingHosts[i]);
            }
            // Negative descriptors are ignored by poll
            pending[i].fd = -1;
            --open;
        }
    }

    return accepted;
}
