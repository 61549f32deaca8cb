/**
 * @file SqliteEventStore.cpp
 * @brief Implementation of SqliteEventStore.
 */

#include "infrastructure/SqliteEventStore.hpp"
#include "infrastructure/TimeFormat.hpp"

#include <sqlite3.h>

#include <filesystem>
#include <future>
#include <iostream>
#include <memory>
#include <nlohmann/json.hpp>

namespace dualtap::infrastructure {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

constexpr int kBusyTimeoutMs = 5000;

const char* kSchema = R"SQL(
    CREATE TABLE IF NOT EXISTS network_traffic (
        id INTEGER PRIMARY KEY AUTOINCREMENT,
        timestamp TEXT,
        method TEXT,
        url TEXT,
        status_code INTEGER,
        request_headers TEXT,
        response_headers TEXT,
        request_body TEXT,
        response_body TEXT,
        source TEXT DEFAULT 'mitm'
    );
    CREATE TABLE IF NOT EXISTS frida_hooks (
        id INTEGER PRIMARY KEY AUTOINCREMENT,
        timestamp TEXT,
        hook_type TEXT,
        function_name TEXT,
        parameters TEXT,
        return_value TEXT,
        additional_data TEXT
    );
    CREATE TABLE IF NOT EXISTS scraped_articles (
        id INTEGER PRIMARY KEY AUTOINCREMENT,
        timestamp TEXT,
        title TEXT,
        url TEXT,
        content TEXT,
        metadata TEXT,
        extraction_method TEXT
    );
)SQL";

domain::StorageFault MakeFault(sqlite3* db, const std::string& context, int rc) {
    std::string detail = db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
    return domain::StorageFault(context + ": " + detail, rc);
}

/**
 * @class Statement
 * @brief Owns one prepared statement; finalized on scope exit.
 */
class Statement {
public:
    Statement(sqlite3* db, const char* sql) : m_db(db) {
        int rc = sqlite3_prepare_v2(db, sql, -1, &m_stmt, nullptr);
        if (rc != SQLITE_OK) {
            throw MakeFault(db, "prepare failed", rc);
        }
    }

    ~Statement() { sqlite3_finalize(m_stmt); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    void bind(int index, const std::string& value) {
        check(sqlite3_bind_text(m_stmt, index, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT));
    }

    void bind(int index, const std::optional<std::string>& value) {
        if (value) {
            bind(index, *value);
        } else {
            check(sqlite3_bind_null(m_stmt, index));
        }
    }

    void bind(int index, const std::optional<int>& value) {
        if (value) {
            check(sqlite3_bind_int(m_stmt, index, *value));
        } else {
            check(sqlite3_bind_null(m_stmt, index));
        }
    }

    void bind(int index, std::int64_t value) {
        check(sqlite3_bind_int64(m_stmt, index, value));
    }

    /** @return True while a row is available. */
    bool step() {
        int rc = sqlite3_step(m_stmt);
        if (rc == SQLITE_ROW) return true;
        if (rc == SQLITE_DONE) return false;
        throw MakeFault(m_db, "step failed", rc);
    }

    std::int64_t columnInt64(int col) const { return sqlite3_column_int64(m_stmt, col); }

    std::optional<int> columnOptionalInt(int col) const {
        if (sqlite3_column_type(m_stmt, col) == SQLITE_NULL) return std::nullopt;
        return sqlite3_column_int(m_stmt, col);
    }

    std::string columnText(int col) const {
        const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(m_stmt, col));
        if (!text) return {};
        return std::string(text, static_cast<std::size_t>(sqlite3_column_bytes(m_stmt, col)));
    }

private:
    void check(int rc) {
        if (rc != SQLITE_OK) {
            throw MakeFault(m_db, "bind failed", rc);
        }
    }

    sqlite3* m_db;
    sqlite3_stmt* m_stmt = nullptr;
};

// Invalid UTF-8 in captured data is replaced instead of failing the write.
std::string DumpJson(const json& value) {
    return value.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::optional<std::string> SerializeHeaders(const domain::HeaderMap& headers) {
    if (headers.empty()) return std::nullopt;
    json j = json::object();
    for (const auto& [name, value] : headers) {
        j[name] = value;
    }
    return DumpJson(j);
}

std::optional<std::string> SerializeHeaders(const std::optional<domain::HeaderMap>& headers) {
    if (!headers) return std::nullopt;
    return SerializeHeaders(*headers);
}

std::optional<std::string> SerializePayload(const std::optional<json>& payload) {
    if (!payload || payload->is_null()) return std::nullopt;
    if ((payload->is_object() || payload->is_array()) && payload->empty()) return std::nullopt;
    return DumpJson(*payload);
}

} // namespace

SqliteEventStore::SqliteEventStore(std::string databasePath)
    : m_path(std::move(databasePath)) {
    openDatabase();
    m_running = true;
    m_worker = std::thread(&SqliteEventStore::workerLoop, this);
}

SqliteEventStore::~SqliteEventStore() {
    stop();
}

const char* SqliteEventStore::TableName(domain::RecordKind kind) {
    switch (kind) {
        case domain::RecordKind::NetworkTraffic: return "network_traffic";
        case domain::RecordKind::Hook: return "frida_hooks";
        case domain::RecordKind::ScrapedArtifact: return "scraped_articles";
    }
    return "network_traffic";
}

void SqliteEventStore::openDatabase() {
    fs::path dbPath(m_path);
    try {
        if (dbPath.has_parent_path() && !fs::exists(dbPath.parent_path())) {
            fs::create_directories(dbPath.parent_path());
        }
    } catch (const fs::filesystem_error& e) {
        throw domain::StorageFault("Cannot create database directory: " + std::string(e.what()));
    }

    int rc = sqlite3_open_v2(m_path.c_str(), &m_db,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                             nullptr);
    if (rc != SQLITE_OK) {
        auto fault = MakeFault(m_db, "Cannot open " + m_path, rc);
        closeDatabase();
        throw fault;
    }

    sqlite3_busy_timeout(m_db, kBusyTimeoutMs);

    try {
        createSchema();
    } catch (const domain::StorageFault&) {
        closeDatabase();
        throw;
    }
}

void SqliteEventStore::createSchema() {
    char* error = nullptr;
    // WAL lets external readers (sqlite3 CLI, analysis scripts) run beside the writer.
    int rc = sqlite3_exec(m_db, "PRAGMA journal_mode=WAL;", nullptr, nullptr, &error);
    if (rc != SQLITE_OK) {
        std::cerr << "[SqliteEventStore] WAL unavailable, keeping default journal: "
                  << (error ? error : sqlite3_errstr(rc)) << std::endl;
        sqlite3_free(error);
        error = nullptr;
    }

    rc = sqlite3_exec(m_db, kSchema, nullptr, nullptr, &error);
    if (rc != SQLITE_OK) {
        std::string detail = error ? error : sqlite3_errstr(rc);
        sqlite3_free(error);
        throw domain::StorageFault("Schema creation failed for " + m_path + ": " + detail, rc);
    }
}

void SqliteEventStore::closeDatabase() {
    if (m_db) {
        sqlite3_close_v2(m_db);
        m_db = nullptr;
    }
}

void SqliteEventStore::stop() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running) return;
        m_running = false;
    }
    m_cv.notify_all();

    if (m_worker.joinable()) {
        m_worker.join();
    }
    closeDatabase();
}

void SqliteEventStore::workerLoop() {
    while (true) {
        std::function<void()> task;

        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [this] {
                return !m_queue.empty() || !m_running;
            });

            if (!m_running && m_queue.empty()) {
                return;
            }

            task = std::move(m_queue.front());
            m_queue.pop();
        }

        // Exceptions are captured by the packaged_task and surface in the caller.
        task();
    }
}

template <typename Fn>
auto SqliteEventStore::submit(Fn&& fn) -> decltype(fn()) {
    using Result = decltype(fn());
    auto task = std::make_shared<std::packaged_task<Result()>>(std::forward<Fn>(fn));
    std::future<Result> result = task->get_future();

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running) {
            throw domain::StorageFault("Event store is stopped: " + m_path);
        }
        m_queue.push([task]() { (*task)(); });
    }
    m_cv.notify_one();

    return result.get();
}

std::int64_t SqliteEventStore::append(const domain::NetworkTrafficRecord& record) {
    return submit([this, &record]() {
        Statement stmt(m_db, R"SQL(
            INSERT INTO network_traffic
            (timestamp, method, url, status_code, request_headers, response_headers,
             request_body, response_body, source)
            VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)
        )SQL");
        stmt.bind(1, TimeFormat::ToIso8601(record.timestamp));
        stmt.bind(2, record.method);
        stmt.bind(3, record.url);
        stmt.bind(4, record.statusCode);
        stmt.bind(5, SerializeHeaders(record.requestHeaders));
        stmt.bind(6, SerializeHeaders(record.responseHeaders));
        stmt.bind(7, record.requestBody);
        stmt.bind(8, record.responseBody);
        stmt.bind(9, record.source);
        stmt.step();
        return static_cast<std::int64_t>(sqlite3_last_insert_rowid(m_db));
    });
}

std::int64_t SqliteEventStore::append(const domain::HookRecord& record) {
    return submit([this, &record]() {
        Statement stmt(m_db, R"SQL(
            INSERT INTO frida_hooks
            (timestamp, hook_type, function_name, parameters, return_value, additional_data)
            VALUES (?, ?, ?, ?, ?, ?)
        )SQL");
        stmt.bind(1, TimeFormat::ToIso8601(record.timestamp));
        stmt.bind(2, record.hookType);
        stmt.bind(3, record.functionName);
        stmt.bind(4, SerializePayload(record.parameters));
        stmt.bind(5, record.returnValue);
        stmt.bind(6, SerializePayload(record.additionalData));
        stmt.step();
        return static_cast<std::int64_t>(sqlite3_last_insert_rowid(m_db));
    });
}

std::int64_t SqliteEventStore::append(const domain::ScrapedArtifactRecord& record) {
    return submit([this, &record]() {
        Statement stmt(m_db, R"SQL(
            INSERT INTO scraped_articles
            (timestamp, title, url, content, metadata, extraction_method)
            VALUES (?, ?, ?, ?, ?, ?)
        )SQL");
        stmt.bind(1, TimeFormat::ToIso8601(record.timestamp));
        stmt.bind(2, record.title);
        stmt.bind(3, record.url);
        stmt.bind(4, record.content);
        stmt.bind(5, record.metadata);
        stmt.bind(6, record.extractionMethod);
        stmt.step();
        return static_cast<std::int64_t>(sqlite3_last_insert_rowid(m_db));
    });
}

std::int64_t SqliteEventStore::count(domain::RecordKind kind) {
    const std::string sql = std::string("SELECT COUNT(*) FROM ") + TableName(kind);
    return submit([this, &sql]() {
        Statement stmt(m_db, sql.c_str());
        return stmt.step() ? stmt.columnInt64(0) : std::int64_t{0};
    });
}

std::vector<domain::ArtifactSummary> SqliteEventStore::recentArtifacts(std::size_t limit) {
    return submit([this, limit]() {
        Statement stmt(m_db, R"SQL(
            SELECT id, timestamp, title, url, extraction_method
            FROM scraped_articles ORDER BY id DESC LIMIT ?
        )SQL");
        stmt.bind(1, static_cast<std::int64_t>(limit));

        std::vector<domain::ArtifactSummary> rows;
        while (stmt.step()) {
            domain::ArtifactSummary row;
            row.id = stmt.columnInt64(0);
            row.timestamp = stmt.columnText(1);
            row.title = stmt.columnText(2);
            row.url = stmt.columnText(3);
            row.extractionMethod = stmt.columnText(4);
            rows.push_back(std::move(row));
        }
        return rows;
    });
}

std::vector<domain::TrafficSummary> SqliteEventStore::recentTraffic(std::size_t limit) {
    return submit([this, limit]() {
        Statement stmt(m_db, R"SQL(
            SELECT id, timestamp, method, url, status_code
            FROM network_traffic ORDER BY id DESC LIMIT ?
        )SQL");
        stmt.bind(1, static_cast<std::int64_t>(limit));

        std::vector<domain::TrafficSummary> rows;
        while (stmt.step()) {
            domain::TrafficSummary row;
            row.id = stmt.columnInt64(0);
            row.timestamp = stmt.columnText(1);
            row.method = stmt.columnText(2);
            row.url = stmt.columnText(3);
            row.statusCode = stmt.columnOptionalInt(4);
            rows.push_back(std::move(row));
        }
        return rows;
    });
}

} // namespace dualtap::infrastructure
