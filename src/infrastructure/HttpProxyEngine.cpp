/**
 * @file HttpProxyEngine.cpp
 * @brief Implementation of HttpProxyEngine.
 */

#include "infrastructure/HttpProxyEngine.hpp"
#include "infrastructure/UrlParts.hpp"
#include <httplib.h>

#include <poll.h>
#include <sys/socket.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <iostream>
#include <thread>

namespace dualtap::infrastructure {

namespace {

constexpr time_t kUpstreamConnectTimeoutSec = 10;
constexpr time_t kUpstreamReadTimeoutSec = 60;
constexpr auto kShutdownWait = std::chrono::seconds(2);

constexpr const char* kInternalHost = "127.0.0.1";
constexpr int kAcceptPollMs = 200;
constexpr std::size_t kMaxHeadBytes = 16 * 1024;
constexpr auto kPeekTimeout = std::chrono::seconds(5);
constexpr auto kHeadTimeout = std::chrono::seconds(10);
constexpr auto kLocalConnectTimeout = std::chrono::seconds(2);
constexpr auto kUpstreamConnectTimeout = std::chrono::seconds(kUpstreamConnectTimeoutSec);

std::string ToLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

// Hop-by-hop headers, framing headers httplib recomputes, and the pseudo headers
// httplib::Server adds to every request.
bool IsSkippedHeader(const std::string& name) {
    static const char* kSkipped[] = {
        "connection", "keep-alive", "proxy-connection", "proxy-authorization",
        "proxy-authenticate", "te", "trailer", "transfer-encoding", "upgrade",
        "content-length", "remote_addr", "remote_port", "local_addr", "local_port",
    };
    const std::string lowered = ToLower(name);
    return std::any_of(std::begin(kSkipped), std::end(kSkipped),
                       [&lowered](const char* skipped) { return lowered == skipped; });
}

domain::HeaderMap FoldHeaders(const httplib::Headers& headers) {
    domain::HeaderMap folded;
    for (const auto& [name, value] : headers) {
        if (IsSkippedHeader(name)) continue;
        auto it = folded.find(name);
        if (it == folded.end()) {
            folded.emplace(name, value);
        } else {
            it->second += ", " + value;
        }
    }
    return folded;
}

std::optional<UrlParts> ResolveTarget(const httplib::Request& req) {
    const std::string& target = req.target.empty() ? req.path : req.target;
    if (target.find("://") != std::string::npos) {
        return UrlParts::ParseAbsolute(target);
    }
    return UrlParts::FromOriginForm(req.get_header_value("Host"), target);
}

void Reject(httplib::Response& res, int status, const std::string& message) {
    res.status = status;
    res.set_content(message, "text/plain");
}

void Refuse(int fd, const std::string& status) {
    if (!TcpRelay::SendAll(fd, "HTTP/1.1 " + status + "\r\nContent-Length: 0\r\nConnection: close\r\n\r\n")) {
        std::cerr << "[HttpProxyEngine] Client left before " << status << " was sent" << std::endl;
    }
}

// stop() is a no-op until listen_after_bind has marked the server running.
void StopServer(httplib::Server& server) {
    auto deadline = std::chrono::steady_clock::now() + kShutdownWait;
    while (!server.is_running() && server.is_valid() &&
           std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    server.stop();
}

} // namespace

HttpProxyEngine::HttpProxyEngine() = default;

HttpProxyEngine::~HttpProxyEngine() {
    shutdown();
}

bool HttpProxyEngine::run(const domain::ProxyConfig& config, domain::FlowHandler& handler) {
    httplib::Server* server = nullptr;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_shutdownRequested) {
            return true;
        }
        m_server = std::make_unique<httplib::Server>();
        server = m_server.get();

        auto route = [this, &handler](const httplib::Request& req, httplib::Response& res) {
            handle(req, res, handler);
        };
        const std::string anyPath = ".*";
        server->Get(anyPath, route);
        server->Post(anyPath, route);
        server->Put(anyPath, route);
        server->Patch(anyPath, route);
        server->Delete(anyPath, route);
        server->Options(anyPath, route);

        m_internalPort = server->bind_to_any_port(kInternalHost);
        if (m_internalPort < 0) {
            std::cerr << "[HttpProxyEngine] Cannot bind internal HTTP listener" << std::endl;
            m_server.reset();
            return false;
        }
        m_listener = TcpRelay::Listen(config.listenHost, config.listenPort);
        if (!m_listener.valid()) {
            std::cerr << "[HttpProxyEngine] Cannot bind " << config.listenHost << ":"
                      << config.listenPort << std::endl;
            m_server.reset();
            return false;
        }
        m_boundPort = TcpRelay::LocalPort(m_listener);
    }

    bool internalOk = true;
    std::thread internal([server, &internalOk]() { internalOk = server->listen_after_bind(); });

    std::cout << "[HttpProxyEngine] Proxy running on http://" << config.listenHost << ":"
              << m_boundPort.load() << std::endl;
    m_listening = true;
    acceptLoop();
    m_listening = false;

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_listener.close();
    }
    StopServer(*server);
    closeConnections();
    internal.join();
    if (!internalOk) {
        std::cerr << "[HttpProxyEngine] Internal HTTP listener failed" << std::endl;
    }
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_server.reset();
    }
    std::cout << "[HttpProxyEngine] Proxy stopped." << std::endl;
    return internalOk && m_shutdownRequested;
}

void HttpProxyEngine::shutdown() {
    m_shutdownRequested = true;
}

void HttpProxyEngine::acceptLoop() {
    while (!m_shutdownRequested) {
        pollfd p{m_listener.fd(), POLLIN, 0};
        int rc = ::poll(&p, 1, kAcceptPollMs);
        if (rc < 0) {
            if (errno == EINTR) continue;
            std::cerr << "[HttpProxyEngine] Listener failed: " << std::strerror(errno) << std::endl;
            return;
        }
        if (rc == 0) continue;

        Socket client(::accept(m_listener.fd(), nullptr, nullptr));
        if (!client.valid()) continue;
        if (!track(client.fd())) return;
        {
            std::lock_guard<std::mutex> lock(m_connMutex);
            ++m_activeConnections;
        }
        std::thread(&HttpProxyEngine::serveConnection, this, std::move(client)).detach();
    }
}

void HttpProxyEngine::serveConnection(Socket client) {
    if (TcpRelay::PeekStartsWith(client.fd(), "CONNECT ", kPeekTimeout)) {
        serveTunnel(client);
    } else {
        relayToInternal(client);
    }

    untrack(client.fd());
    client.close();
    std::lock_guard<std::mutex> lock(m_connMutex);
    --m_activeConnections;
    m_connCv.notify_all();
}

void HttpProxyEngine::serveTunnel(Socket& client) {
    auto head = TcpRelay::ReadHead(client.fd(), kMaxHeadBytes, kHeadTimeout);
    if (!head) {
        std::cerr << "[HttpProxyEngine] Incomplete CONNECT request" << std::endl;
        return;
    }

    auto target = UrlParts::FromConnectLine(head->head.substr(0, head->head.find("\r\n")));
    if (!target) {
        Refuse(client.fd(), "400 Bad Request");
        return;
    }

    Socket upstream = TcpRelay::Connect(target->host, target->port, kUpstreamConnectTimeout);
    if (!upstream.valid()) {
        std::cerr << "[HttpProxyEngine] Tunnel to " << target->authority << " failed" << std::endl;
        Refuse(client.fd(), "502 Bad Gateway");
        return;
    }
    if (!track(upstream.fd())) return;

    std::cout << "[HttpProxyEngine] Tunnel to " << target->authority << std::endl;
    if (TcpRelay::SendAll(client.fd(), "HTTP/1.1 200 Connection Established\r\n\r\n") &&
        TcpRelay::SendAll(upstream.fd(), head->rest)) {
        TcpRelay::Pipe(client.fd(), upstream.fd());
    }
    untrack(upstream.fd());
}

void HttpProxyEngine::relayToInternal(Socket& client) {
    Socket internal = TcpRelay::Connect(kInternalHost, m_internalPort, kLocalConnectTimeout);
    if (!internal.valid()) {
        if (!m_shutdownRequested) {
            std::cerr << "[HttpProxyEngine] Internal HTTP listener unreachable" << std::endl;
        }
        return;
    }
    if (!track(internal.fd())) return;
    TcpRelay::Pipe(client.fd(), internal.fd());
    untrack(internal.fd());
}

bool HttpProxyEngine::track(int fd) {
    std::lock_guard<std::mutex> lock(m_connMutex);
    if (m_shutdownRequested) return false;
    m_openFds.insert(fd);
    return true;
}

void HttpProxyEngine::untrack(int fd) {
    std::lock_guard<std::mutex> lock(m_connMutex);
    m_openFds.erase(fd);
}

void HttpProxyEngine::closeConnections() {
    std::unique_lock<std::mutex> lock(m_connMutex);
    for (int fd : m_openFds) {
        ::shutdown(fd, SHUT_RDWR);
    }
    m_connCv.wait(lock, [this]() { return m_activeConnections == 0; });
}

void HttpProxyEngine::handle(const httplib::Request& req, httplib::Response& res,
                             domain::FlowHandler& handler) {
    auto target = ResolveTarget(req);
    if (!target) {
        Reject(res, 400, "Bad proxy request target");
        return;
    }
    if (target->scheme != "http") {
        Reject(res, 501, "Only plain HTTP is proxied");
        return;
    }

    domain::HttpFlow flow;
    flow.request.method = req.method;
    flow.request.url = target->url();
    flow.request.host = target->host;
    flow.request.headers = FoldHeaders(req.headers);
    if (!req.body.empty()) {
        flow.request.body = req.body;
    }

    handler.onRequest(flow);

    httplib::Request upstream;
    upstream.method = flow.request.method;
    upstream.path = target->path;
    for (const auto& [name, value] : flow.request.headers) {
        if (ToLower(name) == "accept-encoding") continue;
        upstream.headers.emplace(name, value);
    }
    // Bodies are handed to the handler as text; ask for them uncompressed.
    upstream.headers.emplace("Accept-Encoding", "identity");
    upstream.body = flow.request.body.value_or("");

    httplib::Client client(target->host, target->port);
    client.set_connection_timeout(kUpstreamConnectTimeoutSec, 0);
    client.set_read_timeout(kUpstreamReadTimeoutSec, 0);
    client.set_decompress(false);

    auto result = client.send(upstream);
    if (!result) {
        std::cerr << "[HttpProxyEngine] Upstream failed for " << flow.request.url << ": "
                  << static_cast<int>(result.error()) << std::endl;
        Reject(res, 502, "Upstream request failed");
        return;
    }

    domain::HttpResponse response;
    response.statusCode = result->status;
    response.headers = FoldHeaders(result->headers);
    if (!result->body.empty()) {
        response.body = result->body;
    }
    flow.response = std::move(response);

    handler.onResponse(flow);

    res.status = result->status;
    for (const auto& [name, value] : result->headers) {
        if (IsSkippedHeader(name)) continue;
        res.headers.emplace(name, value);
    }
    res.body = result->body;
}

} // namespace dualtap::infrastructure
