/**
 * @file TcpRelay.cpp
 * @brief Implementation of Socket and TcpRelay.
 */

#include "infrastructure/TcpRelay.hpp"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <iostream>
#include <thread>

namespace dualtap::infrastructure {

namespace {

constexpr std::size_t kChunkSize = 16 * 1024;

using Clock = std::chrono::steady_clock;

int RemainingMs(Clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
    return left > 0 ? static_cast<int>(left) : 0;
}

struct AddrInfoList {
    addrinfo* head = nullptr;
    ~AddrInfoList() {
        if (head) freeaddrinfo(head);
    }
};

bool Resolve(const std::string& host, int port, bool passive, AddrInfoList& out) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = passive ? AI_PASSIVE : 0;
    const std::string service = std::to_string(port);
    int rc = getaddrinfo(host.empty() ? nullptr : host.c_str(), service.c_str(), &hints, &out.head);
    if (rc != 0) {
        std::cerr << "[TcpRelay] Cannot resolve " << host << ": " << gai_strerror(rc) << std::endl;
        return false;
    }
    return true;
}

bool SetBlocking(int fd, bool blocking) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0) return false;
    flags = blocking ? (flags & ~O_NONBLOCK) : (flags | O_NONBLOCK);
    return fcntl(fd, F_SETFL, flags) == 0;
}

} // namespace

Socket::~Socket() {
    close();
}

Socket::Socket(Socket&& other) noexcept : m_fd(other.m_fd) {
    other.m_fd = -1;
}

Socket& Socket::operator=(Socket&& other) noexcept {
    if (this != &other) {
        close();
        m_fd = other.m_fd;
        other.m_fd = -1;
    }
    return *this;
}

void Socket::close() {
    if (m_fd >= 0) {
        ::close(m_fd);
        m_fd = -1;
    }
}

Socket TcpRelay::Listen(const std::string& host, int port, int backlog) {
    AddrInfoList addresses;
    if (!Resolve(host, port, true, addresses)) {
        return Socket();
    }

    for (addrinfo* ai = addresses.head; ai; ai = ai->ai_next) {
        Socket candidate(::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol));
        if (!candidate.valid()) continue;

        int yes = 1;
        setsockopt(candidate.fd(), SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes));
        if (::bind(candidate.fd(), ai->ai_addr, ai->ai_addrlen) == 0 &&
            ::listen(candidate.fd(), backlog) == 0) {
            return candidate;
        }
    }
    std::cerr << "[TcpRelay] Cannot listen on " << host << ":" << port << ": " << std::strerror(errno) << std::endl;
    return Socket();
}

int TcpRelay::LocalPort(const Socket& socket) {
    sockaddr_storage addr{};
    socklen_t length = sizeof(addr);
    if (getsockname(socket.fd(), reinterpret_cast<sockaddr*>(&addr), &length) != 0) {
        return -1;
    }
    if (addr.ss_family == AF_INET) {
        return ntohs(reinterpret_cast<sockaddr_in*>(&addr)->sin_port);
    }
    if (addr.ss_family == AF_INET6) {
        return ntohs(reinterpret_cast<sockaddr_in6*>(&addr)->sin6_port);
    }
    return -1;
}

Socket TcpRelay::Connect(const std::string& host, int port, std::chrono::milliseconds timeout) {
    AddrInfoList addresses;
    if (!Resolve(host, port, false, addresses)) {
        return Socket();
    }

    const auto deadline = Clock::now() + timeout;
    for (addrinfo* ai = addresses.head; ai; ai = ai->ai_next) {
        Socket candidate(::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol));
        if (!candidate.valid() || !SetBlocking(candidate.fd(), false)) continue;

        int rc = ::connect(candidate.fd(), ai->ai_addr, ai->ai_addrlen);
        if (rc != 0 && errno == EINPROGRESS) {
            pollfd p{candidate.fd(), POLLOUT, 0};
            if (::poll(&p, 1, RemainingMs(deadline)) == 1) {
                int error = 0;
                socklen_t length = sizeof(error);
                getsockopt(candidate.fd(), SOL_SOCKET, SO_ERROR, &error, &length);
                rc = error == 0 ? 0 : -1;
            }
        }
        if (rc == 0 && SetBlocking(candidate.fd(), true)) {
            return candidate;
        }
    }
    return Socket();
}

bool TcpRelay::SendAll(int fd, const std::string& data) {
    std::size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = ::send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        sent += static_cast<std::size_t>(n);
    }
    return true;
}

bool TcpRelay::PeekStartsWith(int fd, const std::string& prefix, std::chrono::milliseconds timeout) {
    const auto deadline = Clock::now() + timeout;
    std::string buffer(prefix.size(), '\0');

    while (true) {
        pollfd p{fd, POLLIN, 0};
        int rc = ::poll(&p, 1, RemainingMs(deadline));
        if (rc < 0 && errno == EINTR) continue;
        if (rc <= 0) return false;

        ssize_t n = ::recv(fd, &buffer[0], buffer.size(), MSG_PEEK);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;

        const auto available = static_cast<std::size_t>(n);
        if (buffer.compare(0, available, prefix, 0, available) != 0) return false;
        if (available == prefix.size()) return true;

        // Partial prefix: wait for the rest to arrive.
        if (RemainingMs(deadline) == 0) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
}

std::optional<RequestHead> TcpRelay::ReadHead(int fd, std::size_t maxBytes, std::chrono::milliseconds timeout) {
    const auto deadline = Clock::now() + timeout;
    std::string accumulated;
    char chunk[4096];

    while (accumulated.size() <= maxBytes) {
        auto end = accumulated.find("\r\n\r\n");
        if (end != std::string::npos) {
            return RequestHead{accumulated.substr(0, end + 4), accumulated.substr(end + 4)};
        }

        pollfd p{fd, POLLIN, 0};
        int rc = ::poll(&p, 1, RemainingMs(deadline));
        if (rc < 0 && errno == EINTR) continue;
        if (rc <= 0) return std::nullopt;

        ssize_t n = ::recv(fd, chunk, sizeof(chunk), 0);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return std::nullopt;
        accumulated.append(chunk, static_cast<std::size_t>(n));
    }
    return std::nullopt;
}

void TcpRelay::Pipe(int a, int b) {
    pollfd fds[2] = {{a, POLLIN, 0}, {b, POLLIN, 0}};
    bool open[2] = {true, true};
    std::string buffer(kChunkSize, '\0');

    while (open[0] || open[1]) {
        for (auto& p : fds) p.revents = 0;
        fds[0].fd = open[0] ? a : -1;
        fds[1].fd = open[1] ? b : -1;

        int rc = ::poll(fds, 2, -1);
        if (rc < 0) {
            if (errno == EINTR) continue;
            return;
        }

        for (int side = 0; side < 2; ++side) {
            if (!open[side] || fds[side].revents == 0) continue;
            const int from = side == 0 ? a : b;
            const int to = side == 0 ? b : a;

            ssize_t n = ::recv(from, &buffer[0], buffer.size(), 0);
            if (n < 0 && errno == EINTR) continue;
            if (n < 0) return;
            if (n == 0) {
                open[side] = false;
                ::shutdown(to, SHUT_WR);
                continue;
            }
            if (!SendAll(to, buffer.substr(0, static_cast<std::size_t>(n)))) return;
        }
    }
}

} // namespace dualtap::infrastructure
