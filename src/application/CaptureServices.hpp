/**
 * @file CaptureServices.hpp
 * @brief Container for capture services to facilitate dependency injection.
 */

#pragma once

#include <memory>
#include "application/CaptureOrchestrator.hpp"
#include "application/InstrumentationAdapter.hpp"
#include "application/TrafficAdapter.hpp"
#include "domain/EventStore.hpp"
#include "domain/TrafficInterceptionEngine.hpp"

namespace dualtap::application {

struct CaptureServices {
    std::shared_ptr<domain::EventStore> eventStore;
    std::shared_ptr<domain::TrafficInterceptionEngine> trafficEngine;
    std::shared_ptr<TrafficAdapter> trafficAdapter;
    std::shared_ptr<InstrumentationAdapter> instrumentationAdapter; ///< Null in proxy-only mode.
    std::unique_ptr<CaptureOrchestrator> orchestrator;
};

} // namespace dualtap::application
