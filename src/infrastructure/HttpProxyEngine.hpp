/**
 * @file HttpProxyEngine.hpp
 * @brief Forward proxy that feeds observed plain-HTTP flows to a FlowHandler.
 */

#pragma once
#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <set>
#include "domain/TrafficInterceptionEngine.hpp"
#include "infrastructure/TcpRelay.hpp"

namespace httplib {
class Server;
struct Request;
struct Response;
} // namespace httplib

namespace dualtap::infrastructure {

/**
 * @class HttpProxyEngine
 * @brief Implements TrafficInterceptionEngine with cpp-httplib behind a raw TCP front end.
 *
 * The front listener owns the configured address. A connection that opens with
 * "CONNECT host:port" is tunnelled blindly to that endpoint; the bytes are never
 * decrypted or handed to the FlowHandler. Every other connection is relayed to an
 * internal loopback httplib::Server, which accepts absolute-form and origin-form
 * targets, forwards them upstream with httplib::Client and reports both halves of
 * the exchange. Absolute-form https targets are answered with 501.
 */
class HttpProxyEngine : public domain::TrafficInterceptionEngine {
public:
    HttpProxyEngine();
    ~HttpProxyEngine() override;

    bool run(const domain::ProxyConfig& config, domain::FlowHandler& handler) override;
    void shutdown() override;

    /** @brief True while run() is accepting connections. */
    bool isListening() const { return m_listening.load(); }

    /** @brief Port the front listener is bound to (useful with listenPort 0), 0 before run(). */
    int port() const { return m_boundPort.load(); }

private:
    void handle(const httplib::Request& req, httplib::Response& res, domain::FlowHandler& handler);

    void acceptLoop();
    void serveConnection(Socket client);
    void serveTunnel(Socket& client);
    void relayToInternal(Socket& client);
    void closeConnections();

    /** @return False once shutdown has begun; the caller must then drop the socket. */
    bool track(int fd);
    void untrack(int fd);

    std::unique_ptr<httplib::Server> m_server;
    Socket m_listener;
    int m_internalPort = 0;
    std::mutex m_mutex;
    std::atomic<bool> m_shutdownRequested{false};
    std::atomic<bool> m_listening{false};
    std::atomic<int> m_boundPort{0};

    std::mutex m_connMutex;
    std::condition_variable m_connCv;
    std::set<int> m_openFds;
    int m_activeConnections = 0;
};

} // namespace dualtap::infrastructure
