/**
 * @file SqliteEventStore.hpp
 * @brief SQLite-backed Event Store with a single serialized writer.
 */

#pragma once
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include "domain/EventStore.hpp"

struct sqlite3;

namespace dualtap::infrastructure {

/**
 * @class SqliteEventStore
 * @brief Implements EventStore on top of one SQLite database file.
 *
 * A background thread owns the only connection. Every operation, reads included,
 * is queued to that thread and the caller blocks until it completes, so the queue
 * is the single arbitration point between concurrent adapters. Errors raised on the
 * worker are re-thrown on the calling thread.
 */
class SqliteEventStore : public domain::EventStore {
public:
    /**
     * @brief Opens (or creates) the database and its schema.
     * @param databasePath File path; parent directories are created as needed.
     * @throws domain::StorageFault if the file cannot be opened or initialized.
     */
    explicit SqliteEventStore(std::string databasePath);
    ~SqliteEventStore() override;

    SqliteEventStore(const SqliteEventStore&) = delete;
    SqliteEventStore& operator=(const SqliteEventStore&) = delete;

    std::int64_t append(const domain::NetworkTrafficRecord& record) override;
    std::int64_t append(const domain::HookRecord& record) override;
    std::int64_t append(const domain::ScrapedArtifactRecord& record) override;

    std::int64_t count(domain::RecordKind kind) override;
    std::vector<domain::ArtifactSummary> recentArtifacts(std::size_t limit) override;
    std::vector<domain::TrafficSummary> recentTraffic(std::size_t limit) override;

    /**
     * @brief Processes every queued operation, then closes the connection.
     * Later calls fail with StorageFault. Safe to call more than once.
     */
    void stop();

    const std::string& path() const { return m_path; }

    /** @brief Table that stores the given record kind. */
    static const char* TableName(domain::RecordKind kind);

private:
    template <typename Fn>
    auto submit(Fn&& fn) -> decltype(fn());

    void workerLoop();
    void openDatabase();
    void createSchema();
    void closeDatabase();

    std::string m_path;
    sqlite3* m_db = nullptr;

    // Writer queue
    std::queue<std::function<void()>> m_queue;
    std::mutex m_mutex;
    std::condition_variable m_cv;
    std::thread m_worker;
    bool m_running = false;
};

} // namespace dualtap::infrastructure
