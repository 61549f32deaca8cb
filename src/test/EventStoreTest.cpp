#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <string>

#include <sqlite3.h>
#include <nlohmann/json.hpp>

#include "infrastructure/SqliteEventStore.hpp"

using namespace dualtap::domain;
using dualtap::infrastructure::SqliteEventStore;

namespace {

// Runs a single-value query against the file with a separate connection.
std::string QueryText(const std::string& dbPath, const std::string& sql) {
    sqlite3* db = nullptr;
    int rc = sqlite3_open_v2(dbPath.c_str(), &db, SQLITE_OPEN_READONLY, nullptr);
    assert(rc == SQLITE_OK);
    sqlite3_stmt* stmt = nullptr;
    rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr);
    assert(rc == SQLITE_OK);

    std::string value = "<none>";
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        if (sqlite3_column_type(stmt, 0) == SQLITE_NULL) {
            value = "<null>";
        } else {
            value = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
        }
    }
    sqlite3_finalize(stmt);
    sqlite3_close(db);
    return value;
}

NetworkTrafficRecord MakeRequestRecord(const std::string& url) {
    HttpRequest request;
    request.method = "GET";
    request.url = url;
    request.host = "www.dawn.com";
    request.headers["User-Agent"] = "TestAgent";
    return NetworkTrafficRecord::FromRequest(request, std::chrono::system_clock::now());
}

} // namespace

int main() {
    std::cout << "[Test] Starting Event Store Test..." << std::endl;

    const auto testRoot = std::filesystem::temp_directory_path() / "dualtap_event_store_test";
    std::filesystem::remove_all(testRoot);
    const std::string dbPath = (testRoot / "nested" / "capture.db").string();

    {
        SqliteEventStore store(dbPath);
        assert(std::filesystem::exists(dbPath) && "Parent directories and file should be created.");
        assert(store.count(RecordKind::NetworkTraffic) == 0);
        assert(store.count(RecordKind::Hook) == 0);
        assert(store.count(RecordKind::ScrapedArtifact) == 0);
        std::cout << "[PASS] Fresh store has three empty tables." << std::endl;

        // Request-only then full exchange: two unlinked rows.
        auto requestRecord = MakeRequestRecord("http://www.dawn.com/news/1");
        std::int64_t firstId = store.append(requestRecord);

        HttpRequest request;
        request.method = "GET";
        request.url = "http://www.dawn.com/news/1";
        request.host = "www.dawn.com";
        HttpResponse response;
        response.statusCode = 200;
        response.headers["Content-Type"] = "text/html";
        response.body = "<html></html>";
        std::int64_t secondId = store.append(
            NetworkTrafficRecord::FromExchange(request, response, std::chrono::system_clock::now()));

        assert(secondId > firstId && "Identifiers are monotonically increasing.");
        assert(store.count(RecordKind::NetworkTraffic) == 2);

        assert(QueryText(dbPath, "SELECT status_code FROM network_traffic WHERE id = " + std::to_string(firstId)) == "<null>");
        assert(QueryText(dbPath, "SELECT status_code FROM network_traffic WHERE id = " + std::to_string(secondId)) == "200");
        assert(QueryText(dbPath, "SELECT source FROM network_traffic WHERE id = " + std::to_string(firstId)) == "mitm");
        assert(QueryText(dbPath, "SELECT response_body FROM network_traffic WHERE id = " + std::to_string(firstId)) == "<null>");
        assert(QueryText(dbPath, "SELECT request_headers FROM network_traffic WHERE id = " + std::to_string(secondId)) == "<null>");

        auto headers = nlohmann::json::parse(
            QueryText(dbPath, "SELECT request_headers FROM network_traffic WHERE id = " + std::to_string(firstId)));
        assert(headers["User-Agent"] == "TestAgent");

        auto timestamp = QueryText(dbPath, "SELECT timestamp FROM network_traffic WHERE id = " + std::to_string(firstId));
        assert(timestamp.size() == 27 && timestamp.back() == 'Z' && timestamp[10] == 'T');
        std::cout << "[PASS] Traffic rows stored with NULL status until the response, headers as JSON." << std::endl;

        auto recent = store.recentTraffic(5);
        assert(recent.size() == 2);
        assert(recent[0].id == secondId && recent[0].statusCode && *recent[0].statusCode == 200);
        assert(recent[1].id == firstId && !recent[1].statusCode);

        HookRecord hook;
        hook.timestamp = std::chrono::system_clock::now();
        hook.hookType = "webview_load";
        hook.functionName = "unknown";
        hook.parameters = nlohmann::json{{"url", "http://www.dawn.com/"}};
        hook.additionalData = nlohmann::json::object();
        std::int64_t hookId = store.append(hook);
        assert(store.count(RecordKind::Hook) == 1);
        auto params = nlohmann::json::parse(
            QueryText(dbPath, "SELECT parameters FROM frida_hooks WHERE id = " + std::to_string(hookId)));
        assert(params["url"] == "http://www.dawn.com/");
        assert(QueryText(dbPath, "SELECT return_value FROM frida_hooks WHERE id = " + std::to_string(hookId)) == "<null>");
        assert(QueryText(dbPath, "SELECT additional_data FROM frida_hooks WHERE id = " + std::to_string(hookId)) == "<null>");
        std::cout << "[PASS] Hook rows stored; empty payloads become NULL." << std::endl;

        for (int i = 0; i < 4; ++i) {
            ScrapedArtifactRecord artifact;
            artifact.timestamp = std::chrono::system_clock::now();
            artifact.title = "Headline number " + std::to_string(i);
            artifact.url = "http://www.dawn.com/news/" + std::to_string(i);
            artifact.extractionMethod = "html_title_tag";
            store.append(artifact);
        }
        auto artifacts = store.recentArtifacts(3);
        assert(artifacts.size() == 3);
        assert(artifacts[0].title == "Headline number 3");
        assert(artifacts[2].title == "Headline number 1");
        assert(artifacts[0].extractionMethod == "html_title_tag");
        assert(store.recentArtifacts(0).empty());
        std::cout << "[PASS] Recent artifacts are newest first and bounded by the limit." << std::endl;

        store.stop();
        store.stop();
        bool threw = false;
        try {
            store.append(requestRecord);
        } catch (const StorageFault&) {
            threw = true;
        }
        assert(threw && "Appending after stop() must fail with StorageFault.");
        std::cout << "[PASS] Stopped store rejects writes." << std::endl;
    }

    {
        // Reopening sees the previously persisted rows.
        SqliteEventStore reopened(dbPath);
        assert(reopened.count(RecordKind::NetworkTraffic) == 2);
        assert(reopened.count(RecordKind::Hook) == 1);
        assert(reopened.count(RecordKind::ScrapedArtifact) == 4);
        std::cout << "[PASS] Rows survive reopening the database." << std::endl;
    }

    bool faulted = false;
    try {
        SqliteEventStore unavailable("/proc/dualtap-test/capture.db");
    } catch (const StorageFault& e) {
        faulted = true;
        std::cout << "[Test] Expected fault: " << e.what() << std::endl;
    }
    assert(faulted && "An unusable location must raise StorageFault.");
    std::cout << "[PASS] Unavailable medium raises StorageFault." << std::endl;

    std::filesystem::remove_all(testRoot);
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
