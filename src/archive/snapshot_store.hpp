#pragma once

#include <chrono>
#include <cstddef>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "archive/change_detector.hpp"
#include "common/models.hpp"

namespace valgkronikk {

class SnapshotStore;

// Lazy, oldest-first view over one entity's snapshots. Pages are fetched from
// storage as the iterator advances; calling begin() again restarts from the
// oldest snapshot still stored.
class SnapshotHistory {
public:
    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = Snapshot;
        using difference_type = std::ptrdiff_t;
        using pointer = const Snapshot *;
        using reference = const Snapshot &;

        iterator() = default;

        reference operator*() const { return m_page[m_index]; }
        pointer operator->() const { return &m_page[m_index]; }
        iterator &operator++();

        bool operator==(const iterator &other) const;
        bool operator!=(const iterator &other) const { return !(*this == other); }

    private:
        friend class SnapshotHistory;
        explicit iterator(const SnapshotHistory *owner);

        void fetchAfter(std::optional<std::chrono::system_clock::time_point> after);

        const SnapshotHistory *m_owner = nullptr;
        std::vector<Snapshot> m_page;
        std::size_t m_index = 0;
    };

    SnapshotHistory(const SnapshotStore &store, std::string entityKey, std::size_t pageSize);

    iterator begin() const;
    iterator end() const;

    std::vector<Snapshot> toVector() const;
    const std::string &entityKey() const { return m_entityKey; }

private:
    const SnapshotStore &m_store;
    std::string m_entityKey;
    std::size_t m_pageSize;
};

struct SnapshotStoreOptions {
    std::string databasePath;
    int busyTimeoutMs = 5000;
    std::size_t historyPageSize = 64;
};

// SnapshotStore is the SQLite access layer for per-entity snapshot history
// and latest pointers. Writes for one entity are serialized by a per-entity
// mutex; different entities are written in parallel over pooled connections.
class SnapshotStore {
public:
    SnapshotStore(SnapshotStoreOptions options, ChangeDetector detector);
    ~SnapshotStore();

    SnapshotStore(const SnapshotStore &) = delete;
    SnapshotStore &operator=(const SnapshotStore &) = delete;

    // Persists the document as a new snapshot and advances the latest pointer
    // when it differs from the current latest. Throws OutOfOrderTimestamp when
    // the timestamp is not after the last one seen for the entity, and
    // StorageWriteFailure when nothing could be persisted.
    WriteResult writeIfChanged(const Entity &entity,
                               const nlohmann::json &document,
                               std::chrono::system_clock::time_point timestamp);

    std::optional<Snapshot> latest(const std::string &entityKey) const;
    std::optional<Snapshot> latest(const Entity &entity) const;

    SnapshotHistory history(const std::string &entityKey) const;
    SnapshotHistory history(const Entity &entity) const;

    std::optional<Snapshot> snapshotAt(const std::string &entityKey,
                                       std::chrono::system_clock::time_point timestamp) const;

    // Up to limit snapshots strictly after `after` (or from the oldest), oldest first.
    std::vector<Snapshot> page(const std::string &entityKey,
                               std::optional<std::chrono::system_clock::time_point> after,
                               std::size_t limit) const;

    // Every entity with at least one stored snapshot.
    std::vector<TrackedEntity> trackedEntities() const;

    // Deletes snapshots older than olderThan, or every snapshot when olderThan
    // is empty, always keeping the latest. Returns the number deleted.
    // Throws StorageDeleteFailure.
    std::size_t prune(const std::string &entityKey,
                      std::optional<std::chrono::system_clock::time_point> olderThan);

    SnapshotDiff diffSnapshots(const std::string &entityKey,
                               std::chrono::system_clock::time_point from,
                               std::chrono::system_clock::time_point to) const;

    void recordSweep(const SweepResult &result);
    std::vector<nlohmann::json> recentSweeps(std::size_t limit) const;

    std::optional<std::string> getMeta(const std::string &key) const;
    void setMeta(const std::string &key, const std::string &value);

    bool integrityCheck(std::string *message) const;

    const ChangeDetector &detector() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl;
};

} // namespace valgkronikk
