/**
 * @file EventStore.hpp
 * @brief Interface for durable, append-only persistence of captured events.
 */

#pragma once
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include "domain/HookRecord.hpp"
#include "domain/NetworkTrafficRecord.hpp"
#include "domain/ScrapedArtifactRecord.hpp"

namespace dualtap::domain {

/**
 * @enum RecordKind
 * @brief The three persisted record kinds.
 */
enum class RecordKind {
    NetworkTraffic,
    Hook,
    ScrapedArtifact
};

/**
 * @class StorageFault
 * @brief The persistence medium is unavailable (disk full, permission denied, corruption).
 *
 * Not retried by the store; the caller decides what to do with it.
 */
class StorageFault : public std::runtime_error {
public:
    explicit StorageFault(const std::string& message, int code = 0)
        : std::runtime_error(message), m_code(code) {}

    /** @brief Underlying medium error code (SQLite result code), 0 if unknown. */
    int code() const noexcept { return m_code; }

private:
    int m_code;
};

/**
 * @struct TrafficSummary
 * @brief Compact view of a network_traffic row for listings.
 */
struct TrafficSummary {
    std::int64_t id = 0;
    std::string timestamp;
    std::string method;
    std::string url;
    std::optional<int> statusCode;
};

/**
 * @struct ArtifactSummary
 * @brief Compact view of a scraped_articles row for listings.
 */
struct ArtifactSummary {
    std::int64_t id = 0;
    std::string timestamp;
    std::string title;
    std::string url;
    std::string extractionMethod;
};

/**
 * @class EventStore
 * @brief Abstract interface shared by every component that records or reports events.
 *
 * Implementations must be safe to call from several threads at once: each append
 * is a single atomic unit and writes never interleave.
 */
class EventStore {
public:
    virtual ~EventStore() = default;

    /**
     * @brief Persists one record.
     * @return Generated row identifier.
     * @throws StorageFault if the medium is unavailable.
     */
    virtual std::int64_t append(const NetworkTrafficRecord& record) = 0;
    virtual std::int64_t append(const HookRecord& record) = 0;
    virtual std::int64_t append(const ScrapedArtifactRecord& record) = 0;

    /** @brief Total number of rows of the given kind. */
    virtual std::int64_t count(RecordKind kind) = 0;

    /** @brief Most recently stored artifacts, newest first. */
    virtual std::vector<ArtifactSummary> recentArtifacts(std::size_t limit) = 0;

    /** @brief Most recently stored traffic rows, newest first. */
    virtual std::vector<TrafficSummary> recentTraffic(std::size_t limit) = 0;
};

} // namespace dualtap::domain
