/**
 * @file TcpRelay.hpp
 * @brief POSIX TCP helpers for the proxy front end: listen, connect, peek and byte relay.
 */

#pragma once
#include <chrono>
#include <optional>
#include <string>

namespace dualtap::infrastructure {

/**
 * @class Socket
 * @brief Owns one socket descriptor; closed on scope exit.
 */
class Socket {
public:
    Socket() = default;
    explicit Socket(int fd) : m_fd(fd) {}
    ~Socket();

    Socket(Socket&& other) noexcept;
    Socket& operator=(Socket&& other) noexcept;
    Socket(const Socket&) = delete;
    Socket& operator=(const Socket&) = delete;

    int fd() const { return m_fd; }
    bool valid() const { return m_fd >= 0; }
    void close();

private:
    int m_fd = -1;
};

/**
 * @struct RequestHead
 * @brief Request line and headers up to the blank line, plus any bytes read past it.
 */
struct RequestHead {
    std::string head;
    std::string rest;
};

class TcpRelay {
public:
    /** @return Listening socket, or an invalid one if the address cannot be bound. Port 0 picks one. */
    static Socket Listen(const std::string& host, int port, int backlog = 64);

    /** @brief Port a bound socket actually listens on, -1 on error. */
    static int LocalPort(const Socket& socket);

    /** @return Connected socket, or an invalid one on resolution, refusal or timeout. */
    static Socket Connect(const std::string& host, int port, std::chrono::milliseconds timeout);

    /** @brief Writes every byte. False if the peer went away. Never raises SIGPIPE. */
    static bool SendAll(int fd, const std::string& data);

    /**
     * @brief Checks whether the first bytes waiting on fd equal prefix, without consuming them.
     * @return False on mismatch, close or timeout.
     */
    static bool PeekStartsWith(int fd, const std::string& prefix, std::chrono::milliseconds timeout);

    /** @brief Reads through the first "\r\n\r\n". Nullopt on close, timeout or oversize head. */
    static std::optional<RequestHead> ReadHead(int fd, std::size_t maxBytes, std::chrono::milliseconds timeout);

    /**
     * @brief Copies bytes both ways until both directions are closed or either side fails.
     * A half-close on one side is forwarded as a write shutdown to the other.
     */
    static void Pipe(int a, int b);
};

} // namespace dualtap::infrastructure
