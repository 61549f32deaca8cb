/**
 * @file TrafficInterceptionEngine.hpp
 * @brief Port to the proxy engine that observes the target's network traffic.
 */

#pragma once
#include <string>
#include "domain/HttpFlow.hpp"

namespace dualtap::domain {

/**
 * @class FlowHandler
 * @brief Callbacks invoked by the engine on its own threads.
 *
 * onRequest is always called before onResponse for the same exchange. Handlers may
 * mutate the request in onRequest; the engine forwards whatever is left in it.
 * Implementations must not throw.
 */
class FlowHandler {
public:
    virtual ~FlowHandler() = default;

    virtual void onRequest(HttpFlow& flow) = 0;
    virtual void onResponse(HttpFlow& flow) = 0;
};

/**
 * @struct ProxyConfig
 * @brief Where the engine listens.
 */
struct ProxyConfig {
    std::string listenHost = "127.0.0.1";
    int listenPort = 8080;
};

/**
 * @class TrafficInterceptionEngine
 * @brief An interposed proxy that hands decoded flows to a FlowHandler.
 */
class TrafficInterceptionEngine {
public:
    virtual ~TrafficInterceptionEngine() = default;

    /**
     * @brief Serves until shutdown() is called. Blocks the calling thread.
     * @return False if the engine could not start (e.g. bind failure).
     */
    virtual bool run(const ProxyConfig& config, FlowHandler& handler) = 0;

    /** @brief Makes a running run() return. Safe to call from any thread, and more than once. */
    virtual void shutdown() = 0;
};

} // namespace dualtap::domain
