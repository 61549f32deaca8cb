#include <cassert>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>

#include "application/TrafficAdapter.hpp"
#include "infrastructure/HtmlTitleExtractor.hpp"
#include "infrastructure/SqliteEventStore.hpp"

using namespace dualtap;

// Store whose medium is permanently gone.
class UnavailableStore : public domain::EventStore {
public:
    std::int64_t append(const domain::NetworkTrafficRecord&) override { throw domain::StorageFault("disk full"); }
    std::int64_t append(const domain::HookRecord&) override { throw domain::StorageFault("disk full"); }
    std::int64_t append(const domain::ScrapedArtifactRecord&) override { throw domain::StorageFault("disk full"); }
    std::int64_t count(domain::RecordKind) override { throw domain::StorageFault("disk full"); }
    std::vector<domain::ArtifactSummary> recentArtifacts(std::size_t) override { throw domain::StorageFault("disk full"); }
    std::vector<domain::TrafficSummary> recentTraffic(std::size_t) override { throw domain::StorageFault("disk full"); }
};

// Extractor that blows up on every input.
class BrokenExtractor : public domain::TitleExtractor {
public:
    std::optional<domain::ExtractedTitle> extract(const std::string&) const override {
        throw std::runtime_error("extractor bug");
    }
};

domain::HttpFlow MakeFlow(const std::string& host, const std::string& path) {
    domain::HttpFlow flow;
    flow.request.method = "GET";
    flow.request.host = host;
    flow.request.url = "http://" + host + path;
    flow.request.headers["Accept"] = "text/html";
    return flow;
}

domain::HttpResponse MakeHtmlResponse(const std::string& body) {
    domain::HttpResponse response;
    response.statusCode = 200;
    response.headers["content-type"] = "text/html; charset=UTF-8";
    response.body = body;
    return response;
}

int main() {
    std::cout << "[Test] Starting Traffic Adapter Test..." << std::endl;

    const auto testRoot = std::filesystem::temp_directory_path() / "dualtap_traffic_adapter_test";
    std::filesystem::remove_all(testRoot);
    std::filesystem::create_directories(testRoot);

    auto store = std::make_shared<infrastructure::SqliteEventStore>((testRoot / "capture.db").string());
    auto extractor = std::make_shared<infrastructure::HtmlTitleExtractor>();

    domain::TrafficCaptureOptions options;
    options.targetDomains = {"dawn.com", "www.dawn.com", "Example.com"};
    application::TrafficAdapter adapter(store, extractor, options);

    // Host filter.
    assert(adapter.isTargetHost("dawn.com"));
    assert(adapter.isTargetHost("www.dawn.com:80"));
    assert(adapter.isTargetHost("images.DAWN.com"));
    assert(adapter.isTargetHost("example.com"));
    assert(!adapter.isTargetHost("notdawn.com"));
    assert(!adapter.isTargetHost("dawn.com.evil.org"));
    assert(!adapter.isTargetHost(""));
    std::cout << "[PASS] Host filter matches exact hosts and subdomains only." << std::endl;

    // Non-target hosts: no writes, request untouched.
    {
        auto flow = MakeFlow("news.ycombinator.com", "/");
        adapter.onRequest(flow);
        flow.response = MakeHtmlResponse("<title>Hacker News front page</title>");
        adapter.onResponse(flow);
        assert(flow.request.headers.count("X-MITM-Agent") == 0);
        assert(store->count(domain::RecordKind::NetworkTraffic) == 0);
        assert(store->count(domain::RecordKind::ScrapedArtifact) == 0);
    }
    std::cout << "[PASS] Non-target traffic is ignored." << std::endl;

    // Target host: request row without status, then exchange row with status, plus marker header.
    {
        auto flow = MakeFlow("www.dawn.com", "/api/feed");
        adapter.onRequest(flow);
        assert(flow.request.headers.at("X-MITM-Agent") == "MCP-Learn-Agent");

        domain::HttpResponse json;
        json.statusCode = 200;
        json.headers["Content-Type"] = "application/json";
        json.body = "{\"items\":[]}";
        flow.response = json;
        adapter.onResponse(flow);

        auto rows = store->recentTraffic(10);
        assert(rows.size() == 2);
        assert(rows[1].url == "http://www.dawn.com/api/feed" && !rows[1].statusCode);
        assert(rows[0].url == "http://www.dawn.com/api/feed" && rows[0].statusCode && *rows[0].statusCode == 200);
        assert(store->count(domain::RecordKind::ScrapedArtifact) == 0 && "Non-HTML bodies are not scraped.");
    }
    std::cout << "[PASS] Target exchange produces two rows and carries the marker header." << std::endl;

    // Example page end to end.
    {
        auto flow = MakeFlow("example.com", "/");
        adapter.onRequest(flow);
        flow.response = MakeHtmlResponse(
            "<!doctype html>\n<html>\n<head>\n    <title>Hello World Example</title>\n</head>\n"
            "<body>\n<div>\n    <h1>Example Domain</h1>\n</div>\n</body>\n</html>\n");
        adapter.onResponse(flow);

        auto artifacts = store->recentArtifacts(3);
        assert(artifacts.size() == 1);
        assert(artifacts[0].title == "Hello World Example");
        assert(artifacts[0].url == "http://example.com/");
        assert(artifacts[0].extractionMethod == "html_title_tag");
    }
    std::cout << "[PASS] HTML response yields an artifact." << std::endl;

    // HTML with no acceptable candidate: traffic stored, no artifact.
    {
        auto flow = MakeFlow("dawn.com", "/tiny");
        adapter.onRequest(flow);
        flow.response = MakeHtmlResponse("<title>Dawn</title>");
        adapter.onResponse(flow);
        assert(store->count(domain::RecordKind::ScrapedArtifact) == 1);
        assert(store->count(domain::RecordKind::NetworkTraffic) == 6);
    }
    std::cout << "[PASS] Unmatched HTML is not an error." << std::endl;

    auto stats = adapter.stats();
    assert(stats.requestsCaptured == 3);
    assert(stats.responsesCaptured == 3);
    assert(stats.artifactsExtracted == 1);
    assert(stats.failures == 0);

    // Storage failures never escape the callbacks, and the marker is still applied.
    {
        application::TrafficAdapter failing(std::make_shared<UnavailableStore>(), extractor, options);
        auto flow = MakeFlow("www.dawn.com", "/");
        failing.onRequest(flow);
        flow.response = MakeHtmlResponse("<title>Still forwarded to the client</title>");
        failing.onResponse(flow);
        assert(flow.request.headers.at("X-MITM-Agent") == "MCP-Learn-Agent");
        assert(failing.stats().failures == 3);
        assert(failing.stats().requestsCaptured == 0);
    }
    std::cout << "[PASS] Store failures are contained." << std::endl;

    // Extraction failures are contained too.
    {
        application::TrafficAdapter brokenScrape(store, std::make_shared<BrokenExtractor>(), options);
        auto flow = MakeFlow("www.dawn.com", "/broken");
        brokenScrape.onRequest(flow);
        flow.response = MakeHtmlResponse("<title>Whatever the title is</title>");
        brokenScrape.onResponse(flow);
        assert(brokenScrape.stats().failures == 1);
        assert(brokenScrape.stats().responsesCaptured == 1);
    }
    std::cout << "[PASS] Extractor failures are contained." << std::endl;

    store->stop();
    std::filesystem::remove_all(testRoot);
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
