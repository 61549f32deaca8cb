#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <thread>
#include <vector>

#include "application/InstrumentationAdapter.hpp"
#include "application/TrafficAdapter.hpp"
#include "infrastructure/HtmlTitleExtractor.hpp"
#include "infrastructure/SqliteEventStore.hpp"

using namespace dualtap;

int main() {
    std::cout << "[Test] Starting Concurrency Stress Test..." << std::endl;

    // Use a test-specific directory to avoid touching real capture data
    const auto testRoot = std::filesystem::temp_directory_path() / "dualtap_concurrency_test";
    std::filesystem::remove_all(testRoot);
    auto store = std::make_shared<infrastructure::SqliteEventStore>((testRoot / "capture.db").string());

    application::TrafficAdapter traffic(store, std::make_shared<infrastructure::HtmlTitleExtractor>(), {});
    application::InstrumentationAdapter instrumentation(store, nullptr, "", {});

    // Both adapters write at once, as the proxy workers and the hook delivery thread do.
    const int NUM_FLOWS = 40;
    const int NUM_HOOKS = 40;
    std::vector<std::thread> threads;
    std::atomic<int> completed{0};

    std::cout << "[Test] Spawning " << NUM_FLOWS << " flow threads and " << NUM_HOOKS << " hook threads..." << std::endl;

    auto startTime = std::chrono::steady_clock::now();

    for (int i = 0; i < NUM_FLOWS; ++i) {
        threads.emplace_back([&traffic, &completed, i]() {
            domain::HttpFlow flow;
            flow.request.method = "GET";
            flow.request.host = "www.dawn.com";
            flow.request.url = "http://www.dawn.com/news/" + std::to_string(i);
            traffic.onRequest(flow);

            domain::HttpResponse response;
            response.statusCode = 200;
            response.headers["Content-Type"] = "text/html";
            response.body = "<title>Concurrent headline " + std::to_string(i) + "</title>";
            flow.response = response;
            traffic.onResponse(flow);
            completed++;
        });
    }
    for (int i = 0; i < NUM_HOOKS; ++i) {
        threads.emplace_back([&instrumentation, &completed, i]() {
            instrumentation.onMessage(
                R"({"type":"send","payload":{"type":"webview_load","url":"http://www.dawn.com/)" +
                std::to_string(i) + R"("}})");
            completed++;
        });
        // Slight stagger to make it realistic but still concurrent
        if (i % 5 == 0) std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }

    for (auto& t : threads) {
        if (t.joinable()) t.join();
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - startTime);
    std::cout << "[Test] " << completed.load() << " callbacks finished in " << elapsed.count() << " ms" << std::endl;

    // Appends are synchronous, so every row is visible once the callbacks return.
    auto trafficRows = store->count(domain::RecordKind::NetworkTraffic);
    auto hookRows = store->count(domain::RecordKind::Hook);
    auto artifactRows = store->count(domain::RecordKind::ScrapedArtifact);
    std::cout << "[Test] Rows: traffic=" << trafficRows << " hooks=" << hookRows << " artifacts=" << artifactRows << std::endl;

    assert(trafficRows == 2 * NUM_FLOWS);
    assert(hookRows == NUM_HOOKS);
    assert(artifactRows == NUM_FLOWS);
    assert(traffic.stats().failures == 0);
    std::cout << "[PASS] No writes lost or duplicated under concurrency." << std::endl;

    // Identifiers are unique and dense.
    auto recent = store->recentTraffic(static_cast<std::size_t>(2 * NUM_FLOWS));
    for (std::size_t i = 1; i < recent.size(); ++i) {
        assert(recent[i - 1].id == recent[i].id + 1);
    }
    std::cout << "[PASS] Row identifiers are strictly increasing." << std::endl;

    store->stop();
    std::filesystem::remove_all(testRoot);
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
