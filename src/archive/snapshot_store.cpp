#include "archive/snapshot_store.hpp"

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <limits>
#include <map>
#include <mutex>
#include <random>
#include <sstream>
#include <stdexcept>

#include <sqlite3.h>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace valgkronikk {

namespace {

constexpr const char *kSchemaVersion = "1";
constexpr std::size_t kMaxLoggedFields = 20;

constexpr const char *kCreateSnapshotsTable =
    "CREATE TABLE IF NOT EXISTS snapshots ("
    "    entity_key TEXT NOT NULL,"
    "    timestamp INTEGER NOT NULL,"
    "    content TEXT NOT NULL,"
    "    PRIMARY KEY (entity_key, timestamp)"
    ");";

constexpr const char *kCreateLatestTable =
    "CREATE TABLE IF NOT EXISTS latest ("
    "    entity_key TEXT PRIMARY KEY,"
    "    timestamp INTEGER NOT NULL,"
    "    last_observed INTEGER NOT NULL"
    ");";

constexpr const char *kCreateSweepLogTable =
    "CREATE TABLE IF NOT EXISTS sweep_log ("
    "    id TEXT PRIMARY KEY,"
    "    timestamp INTEGER NOT NULL,"
    "    period TEXT NOT NULL,"
    "    deleted TEXT NOT NULL,"
    "    failures TEXT NOT NULL"
    ");";

constexpr const char *kCreateMetaTable =
    "CREATE TABLE IF NOT EXISTS meta ("
    "    key TEXT PRIMARY KEY,"
    "    value TEXT NOT NULL"
    ");";

class Statement {
public:
    Statement(sqlite3 *db, const char *sql)
    {
        if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            throw ArchiveError(std::string("sqlite prepare failed: ") + sqlite3_errmsg(db));
        }
    }

    ~Statement()
    {
        if (stmt) {
            sqlite3_finalize(stmt);
        }
    }

    Statement(const Statement &) = delete;
    Statement &operator=(const Statement &) = delete;

    sqlite3_stmt *get() const
    {
        return stmt;
    }

private:
    sqlite3_stmt *stmt = nullptr;
};

int64_t toEpochSeconds(std::chrono::system_clock::time_point timestamp)
{
    return std::chrono::duration_cast<std::chrono::seconds>(
               timestamp.time_since_epoch())
        .count();
}

std::chrono::system_clock::time_point fromEpochSeconds(int64_t value)
{
    return std::chrono::system_clock::time_point{
        std::chrono::seconds{value}};
}

void execOrThrow(sqlite3 *db, const char *sql)
{
    char *error = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &error) != SQLITE_OK) {
        std::string message = error ? error : "sqlite exec failed";
        sqlite3_free(error);
        throw ArchiveError(message);
    }
}

void stepDone(sqlite3 *db, const Statement &stmt, const char *what)
{
    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        throw ArchiveError(std::string(what) + ": " + sqlite3_errmsg(db));
    }
}

// True for a row, false once the statement is done; anything else is an error.
bool stepRow(sqlite3 *db, const Statement &stmt, const char *what)
{
    const int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_ROW) {
        return true;
    }
    if (rc == SQLITE_DONE) {
        return false;
    }
    throw ArchiveError(std::string(what) + ": " + sqlite3_errmsg(db));
}

void bindText(sqlite3_stmt *stmt, int index, const std::string &value)
{
    sqlite3_bind_text(stmt, index, value.c_str(), -1, SQLITE_TRANSIENT);
}

std::string columnText(sqlite3_stmt *stmt, int index)
{
    const unsigned char *text = sqlite3_column_text(stmt, index);
    if (!text) {
        return {};
    }
    return reinterpret_cast<const char *>(text);
}

nlohmann::json columnJson(sqlite3_stmt *stmt, int index)
{
    const unsigned char *text = sqlite3_column_text(stmt, index);
    if (!text) {
        return nlohmann::json();
    }
    try {
        return nlohmann::json::parse(reinterpret_cast<const char *>(text));
    } catch (const nlohmann::json::parse_error &ex) {
        throw ArchiveError(std::string("stored document is not valid JSON: ") + ex.what());
    }
}

std::string generateUuid()
{
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::uniform_int_distribution<uint64_t> dist;

    const uint64_t part1 = dist(gen);
    const uint64_t part2 = dist(gen);

    std::ostringstream out;
    out << std::hex;
    out << (part1 >> 32);
    out << "-";
    out << ((part1 >> 16) & 0xFFFF);
    out << "-";
    out << (part1 & 0xFFFF);
    out << "-";
    out << (part2 >> 48);
    out << "-";
    out << (part2 & 0xFFFFFFFFFFFFULL);
    return out.str();
}

sqlite3 *openConnection(const std::string &path, int busyTimeoutMs)
{
    sqlite3 *db = nullptr;
    const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX;
    if (sqlite3_open_v2(path.c_str(), &db, flags, nullptr) != SQLITE_OK) {
        const std::string message = db ? sqlite3_errmsg(db) : "out of memory";
        sqlite3_close(db);
        throw ArchiveError("failed to open archive database '" + path + "': " + message);
    }

    sqlite3_busy_timeout(db, busyTimeoutMs);
    try {
        execOrThrow(db, "PRAGMA journal_mode=WAL;");
        execOrThrow(db, "PRAGMA synchronous=FULL;");
    } catch (const ArchiveError &) {
        sqlite3_close(db);
        throw;
    }
    return db;
}

// BEGIN IMMEDIATE takes the write lock up front, so state read inside the
// transaction cannot change under it, even from another process. Plain BEGIN
// gives readers one consistent view.
class Transaction {
public:
    explicit Transaction(sqlite3 *db, const char *begin = "BEGIN IMMEDIATE;")
        : m_db(db)
    {
        execOrThrow(m_db, begin);
    }

    ~Transaction()
    {
        if (m_committed) {
            return;
        }
        char *error = nullptr;
        if (sqlite3_exec(m_db, "ROLLBACK;", nullptr, nullptr, &error) != SQLITE_OK) {
            std::cerr << "valgkronikk: rollback failed: " << (error ? error : "unknown") << "\n";
            sqlite3_free(error);
        }
    }

    Transaction(const Transaction &) = delete;
    Transaction &operator=(const Transaction &) = delete;

    void commit()
    {
        execOrThrow(m_db, "COMMIT;");
        m_committed = true;
    }

private:
    sqlite3 *m_db;
    bool m_committed = false;
};

struct PointerState {
    int64_t latest = 0;
    int64_t lastObserved = 0;
};

std::optional<PointerState> readPointer(sqlite3 *db, const std::string &key)
{
    Statement stmt(db,
                   "SELECT timestamp, last_observed FROM latest WHERE entity_key = ? LIMIT 1;");
    bindText(stmt.get(), 1, key);

    if (!stepRow(db, stmt, "failed to read latest pointer")) {
        return std::nullopt;
    }
    PointerState state;
    state.latest = sqlite3_column_int64(stmt.get(), 0);
    state.lastObserved = sqlite3_column_int64(stmt.get(), 1);
    return state;
}

std::optional<Snapshot> loadSnapshot(sqlite3 *db, const std::string &key, int64_t timestamp)
{
    Statement stmt(db,
                   "SELECT content FROM snapshots WHERE entity_key = ? AND timestamp = ? LIMIT 1;");
    bindText(stmt.get(), 1, key);
    sqlite3_bind_int64(stmt.get(), 2, timestamp);

    if (!stepRow(db, stmt, "failed to read snapshot")) {
        return std::nullopt;
    }
    Snapshot snapshot;
    snapshot.entityKey = key;
    snapshot.timestamp = fromEpochSeconds(timestamp);
    snapshot.content = columnJson(stmt.get(), 0);
    return snapshot;
}

std::optional<Snapshot> loadNewest(sqlite3 *db, const std::string &key)
{
    Statement stmt(db,
                   "SELECT timestamp, content FROM snapshots WHERE entity_key = ? "
                   "ORDER BY timestamp DESC LIMIT 1;");
    bindText(stmt.get(), 1, key);

    if (!stepRow(db, stmt, "failed to read newest snapshot")) {
        return std::nullopt;
    }
    Snapshot snapshot;
    snapshot.entityKey = key;
    snapshot.timestamp = fromEpochSeconds(sqlite3_column_int64(stmt.get(), 0));
    snapshot.content = columnJson(stmt.get(), 1);
    return snapshot;
}

// The latest pointer's snapshot, or the newest stored body when the pointer is
// missing or references a body that is not there.
std::optional<Snapshot> resolveLatest(sqlite3 *db,
                                      const std::string &key,
                                      const std::optional<PointerState> &state)
{
    if (state.has_value()) {
        if (auto snapshot = loadSnapshot(db, key, state->latest)) {
            return snapshot;
        }
    }

    auto newest = loadNewest(db, key);
    if (newest.has_value()) {
        VKLOG_WARN(QStringLiteral("SnapshotStore"),
                   QStringLiteral("resolveLatest"),
                   QStringLiteral("latest_pointer_healed"),
                   QStringLiteral("pointer_missing_or_dangling"),
                   QStringLiteral("newest_body"),
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"entity", key},
                                   {"pointer", state ? nlohmann::json(state->latest) : nlohmann::json()},
                                   {"resolved", toIso8601Utc(newest->timestamp)}}));
    }
    return newest;
}

void writePointer(sqlite3 *db, const std::string &key, int64_t latest, int64_t lastObserved)
{
    Statement stmt(db,
                   "INSERT OR REPLACE INTO latest (entity_key, timestamp, last_observed) "
                   "VALUES (?, ?, ?);");
    bindText(stmt.get(), 1, key);
    sqlite3_bind_int64(stmt.get(), 2, latest);
    sqlite3_bind_int64(stmt.get(), 3, lastObserved);
    stepDone(db, stmt, "failed to update latest pointer");
}

} // namespace

struct SnapshotStore::Impl {
    SnapshotStoreOptions options;
    ChangeDetector detector;

    std::mutex poolMutex;
    std::vector<sqlite3 *> idle;
    std::vector<sqlite3 *> all;

    std::mutex locksMutex;
    std::map<std::string, std::unique_ptr<std::mutex>> entityLocks;

    Impl(SnapshotStoreOptions opts, ChangeDetector det)
        : options(std::move(opts))
        , detector(std::move(det))
    {
    }

    ~Impl()
    {
        for (sqlite3 *db : all) {
            sqlite3_close(db);
        }
    }

    sqlite3 *acquire()
    {
        {
            std::lock_guard<std::mutex> lock(poolMutex);
            if (!idle.empty()) {
                sqlite3 *db = idle.back();
                idle.pop_back();
                return db;
            }
        }

        sqlite3 *db = openConnection(options.databasePath, options.busyTimeoutMs);
        std::lock_guard<std::mutex> lock(poolMutex);
        all.push_back(db);
        return db;
    }

    void release(sqlite3 *db)
    {
        std::lock_guard<std::mutex> lock(poolMutex);
        idle.push_back(db);
    }

    std::mutex &entityMutex(const std::string &key)
    {
        std::lock_guard<std::mutex> lock(locksMutex);
        auto &slot = entityLocks[key];
        if (!slot) {
            slot = std::make_unique<std::mutex>();
        }
        return *slot;
    }

    // Borrows one pooled connection for the lifetime of the lease.
    class Lease {
    public:
        explicit Lease(Impl &impl)
            : m_impl(impl)
            , m_db(impl.acquire())
        {
        }

        ~Lease()
        {
            m_impl.release(m_db);
        }

        Lease(const Lease &) = delete;
        Lease &operator=(const Lease &) = delete;

        sqlite3 *get() const
        {
            return m_db;
        }

    private:
        Impl &m_impl;
        sqlite3 *m_db;
    };

    template <typename Error>
    std::unique_ptr<Lease> leaseOr()
    {
        try {
            return std::make_unique<Lease>(*this);
        } catch (const ArchiveError &ex) {
            throw Error(ex.what());
        }
    }
};

SnapshotHistory::iterator::iterator(const SnapshotHistory *owner)
    : m_owner(owner)
{
    fetchAfter(std::nullopt);
}

void SnapshotHistory::iterator::fetchAfter(
    std::optional<std::chrono::system_clock::time_point> after)
{
    m_page = m_owner->m_store.page(m_owner->m_entityKey, after, m_owner->m_pageSize);
    m_index = 0;
    if (m_page.empty()) {
        m_owner = nullptr;
    }
}

SnapshotHistory::iterator &SnapshotHistory::iterator::operator++()
{
    if (!m_owner) {
        return *this;
    }
    const auto current = m_page[m_index].timestamp;
    ++m_index;
    if (m_index >= m_page.size()) {
        fetchAfter(current);
    }
    return *this;
}

bool SnapshotHistory::iterator::operator==(const iterator &other) const
{
    if (!m_owner || !other.m_owner) {
        return m_owner == other.m_owner;
    }
    return m_owner == other.m_owner
        && m_page[m_index].timestamp == other.m_page[other.m_index].timestamp;
}

SnapshotHistory::SnapshotHistory(const SnapshotStore &store,
                                 std::string entityKey,
                                 std::size_t pageSize)
    : m_store(store)
    , m_entityKey(std::move(entityKey))
    , m_pageSize(pageSize == 0 ? 1 : pageSize)
{
}

SnapshotHistory::iterator SnapshotHistory::begin() const
{
    return iterator(this);
}

SnapshotHistory::iterator SnapshotHistory::end() const
{
    return iterator();
}

std::vector<Snapshot> SnapshotHistory::toVector() const
{
    std::vector<Snapshot> snapshots;
    for (const auto &snapshot : *this) {
        snapshots.push_back(snapshot);
    }
    return snapshots;
}

SnapshotStore::SnapshotStore(SnapshotStoreOptions options, ChangeDetector detector)
    : impl(std::make_unique<Impl>(std::move(options), std::move(detector)))
{
    const std::filesystem::path dbPath(impl->options.databasePath);
    if (dbPath.has_parent_path()) {
        std::error_code error;
        std::filesystem::create_directories(dbPath.parent_path(), error);
        if (error) {
            throw ArchiveError("cannot create archive directory '"
                               + dbPath.parent_path().string() + "': " + error.message());
        }
    }

    Impl::Lease conn(*impl);
    execOrThrow(conn.get(), kCreateSnapshotsTable);
    execOrThrow(conn.get(), kCreateLatestTable);
    execOrThrow(conn.get(), kCreateSweepLogTable);
    execOrThrow(conn.get(), kCreateMetaTable);

    if (!getMeta("schema_version").has_value()) {
        setMeta("schema_version", kSchemaVersion);
    }
}

SnapshotStore::~SnapshotStore() = default;

const ChangeDetector &SnapshotStore::detector() const
{
    return impl->detector;
}

WriteResult SnapshotStore::writeIfChanged(const Entity &entity,
                                          const nlohmann::json &document,
                                          std::chrono::system_clock::time_point timestamp)
{
    const std::string key = entityKey(entity);
    const int64_t ts = toEpochSeconds(timestamp);

    std::lock_guard<std::mutex> entityLock(impl->entityMutex(key));
    const auto conn = impl->leaseOr<StorageWriteFailure>();

    // Opened before any state is read so the ordering check and the write see
    // the same database, whichever process wrote last.
    std::optional<Transaction> tx;
    std::optional<Snapshot> previous;
    int64_t lastSeen = std::numeric_limits<int64_t>::min();
    try {
        tx.emplace(conn->get());
        const auto state = readPointer(conn->get(), key);
        previous = resolveLatest(conn->get(), key, state);
        if (state.has_value()) {
            lastSeen = std::max({lastSeen, state->latest, state->lastObserved});
        }
        Statement maxStmt(conn->get(),
                          "SELECT MAX(timestamp) FROM snapshots WHERE entity_key = ?;");
        bindText(maxStmt.get(), 1, key);
        if (stepRow(conn->get(), maxStmt, "failed to read newest timestamp")
            && sqlite3_column_type(maxStmt.get(), 0) != SQLITE_NULL) {
            lastSeen = std::max(lastSeen, static_cast<int64_t>(sqlite3_column_int64(maxStmt.get(), 0)));
        }
    } catch (const ArchiveError &ex) {
        throw StorageWriteFailure("cannot read state of '" + key + "': " + ex.what());
    }

    if (ts <= lastSeen) {
        VKLOG_WARN(QStringLiteral("SnapshotStore"),
                   QStringLiteral("writeIfChanged"),
                   QStringLiteral("ingest_out_of_order"),
                   QStringLiteral("timestamp_not_increasing"),
                   QStringLiteral("rejected"),
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"entity", key},
                                   {"timestamp", toIso8601Utc(fromEpochSeconds(ts))},
                                   {"lastSeen", toIso8601Utc(fromEpochSeconds(lastSeen))}}));
        throw OutOfOrderTimestamp("timestamp " + toIso8601Utc(fromEpochSeconds(ts))
                                  + " for '" + key + "' is not after "
                                  + toIso8601Utc(fromEpochSeconds(lastSeen)));
    }

    if (!impl->detector.hasChanged(previous, document)) {
        try {
            writePointer(conn->get(), key, toEpochSeconds(previous->timestamp), ts);
            tx->commit();
        } catch (const ArchiveError &ex) {
            throw StorageWriteFailure("cannot record observation for '" + key + "': " + ex.what());
        }
        VKLOG_DEBUG(QStringLiteral("SnapshotStore"),
                    QStringLiteral("writeIfChanged"),
                    QStringLiteral("snapshot_unchanged"),
                    QStringLiteral("no_material_change"),
                    QStringLiteral("normalized_compare"),
                    logging::defaultWho(),
                    QString(),
                    (nlohmann::json{{"entity", key},
                                    {"timestamp", toIso8601Utc(fromEpochSeconds(ts))},
                                    {"latest", toIso8601Utc(previous->timestamp)}}));
        return WriteResult{false, *previous};
    }

    Snapshot snapshot;
    snapshot.entityKey = key;
    snapshot.timestamp = fromEpochSeconds(ts);
    snapshot.content = document;

    try {
        // Body first, then the pointer; both land or neither does.
        Statement insert(conn->get(),
                         "INSERT INTO snapshots (entity_key, timestamp, content) VALUES (?, ?, ?);");
        bindText(insert.get(), 1, key);
        sqlite3_bind_int64(insert.get(), 2, ts);
        bindText(insert.get(), 3, document.dump());
        stepDone(conn->get(), insert, "failed to insert snapshot");

        writePointer(conn->get(), key, ts, ts);
        tx->commit();
    } catch (const ArchiveError &ex) {
        VKLOG_ERROR(QStringLiteral("SnapshotStore"),
                    QStringLiteral("writeIfChanged"),
                    QStringLiteral("snapshot_write_failed"),
                    QStringLiteral("storage_error"),
                    QStringLiteral("transaction_rolled_back"),
                    logging::defaultWho(),
                    QString(),
                    (nlohmann::json{{"entity", key}, {"error", ex.what()}}));
        throw StorageWriteFailure("cannot persist snapshot for '" + key + "': " + ex.what());
    }

    nlohmann::json changed = nlohmann::json::array();
    if (previous.has_value()) {
        for (const auto &field : impl->detector.diff(previous->content, document)) {
            if (changed.size() >= kMaxLoggedFields) {
                break;
            }
            changed.push_back(field.path);
        }
    }
    VKLOG_INFO(QStringLiteral("SnapshotStore"),
               QStringLiteral("writeIfChanged"),
               QStringLiteral("snapshot_written"),
               previous.has_value() ? QStringLiteral("material_change")
                                    : QStringLiteral("first_observation"),
               QStringLiteral("persist_then_repoint"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"entity", key},
                               {"timestamp", toIso8601Utc(snapshot.timestamp)},
                               {"changedFields", changed}}));

    return WriteResult{true, std::move(snapshot)};
}

std::optional<Snapshot> SnapshotStore::latest(const std::string &entityKey) const
{
    Impl::Lease conn(*impl);
    Transaction tx(conn.get(), "BEGIN;");
    auto snapshot = resolveLatest(conn.get(), entityKey, readPointer(conn.get(), entityKey));
    tx.commit();
    return snapshot;
}

std::optional<Snapshot> SnapshotStore::latest(const Entity &entity) const
{
    return latest(entityKey(entity));
}

SnapshotHistory SnapshotStore::history(const std::string &entityKey) const
{
    return SnapshotHistory(*this, entityKey, impl->options.historyPageSize);
}

SnapshotHistory SnapshotStore::history(const Entity &entity) const
{
    return history(entityKey(entity));
}

std::optional<Snapshot> SnapshotStore::snapshotAt(
    const std::string &entityKey,
    std::chrono::system_clock::time_point timestamp) const
{
    Impl::Lease conn(*impl);
    return loadSnapshot(conn.get(), entityKey, toEpochSeconds(timestamp));
}

std::vector<Snapshot> SnapshotStore::page(
    const std::string &entityKey,
    std::optional<std::chrono::system_clock::time_point> after,
    std::size_t limit) const
{
    Impl::Lease conn(*impl);
    Statement stmt(conn.get(),
                   "SELECT timestamp, content FROM snapshots WHERE entity_key = ? "
                   "AND timestamp > ? ORDER BY timestamp ASC LIMIT ?;");
    bindText(stmt.get(), 1, entityKey);
    sqlite3_bind_int64(stmt.get(), 2,
                       after ? toEpochSeconds(*after) : std::numeric_limits<int64_t>::min());
    sqlite3_bind_int64(stmt.get(), 3, static_cast<int64_t>(limit));

    std::vector<Snapshot> snapshots;
    while (stepRow(conn.get(), stmt, "failed to read history")) {
        Snapshot snapshot;
        snapshot.entityKey = entityKey;
        snapshot.timestamp = fromEpochSeconds(sqlite3_column_int64(stmt.get(), 0));
        snapshot.content = columnJson(stmt.get(), 1);
        snapshots.push_back(std::move(snapshot));
    }
    return snapshots;
}

std::vector<TrackedEntity> SnapshotStore::trackedEntities() const
{
    Impl::Lease conn(*impl);
    Statement stmt(conn.get(),
                   "SELECT s.entity_key, COALESCE(l.timestamp, MAX(s.timestamp)) "
                   "FROM snapshots s LEFT JOIN latest l ON l.entity_key = s.entity_key "
                   "GROUP BY s.entity_key ORDER BY s.entity_key ASC;");

    std::vector<TrackedEntity> entities;
    while (stepRow(conn.get(), stmt, "failed to enumerate tracked entities")) {
        const std::string key = columnText(stmt.get(), 0);
        const auto level = levelFromKey(key);
        if (!level.has_value()) {
            VKLOG_WARN(QStringLiteral("SnapshotStore"),
                       QStringLiteral("trackedEntities"),
                       QStringLiteral("entity_key_unrecognized"),
                       QStringLiteral("no_level_prefix"),
                       QStringLiteral("skipped"),
                       logging::defaultWho(),
                       QString(),
                       (nlohmann::json{{"entity", key}}));
            continue;
        }
        TrackedEntity entity;
        entity.entityKey = key;
        entity.level = *level;
        entity.latest = fromEpochSeconds(sqlite3_column_int64(stmt.get(), 1));
        entities.push_back(std::move(entity));
    }
    return entities;
}

std::size_t SnapshotStore::prune(const std::string &entityKey,
                                 std::optional<std::chrono::system_clock::time_point> olderThan)
{
    std::lock_guard<std::mutex> entityLock(impl->entityMutex(entityKey));
    const auto conn = impl->leaseOr<StorageDeleteFailure>();

    std::size_t deleted = 0;
    try {
        // The latest is resolved under the write lock so a snapshot written
        // by another process in the meantime cannot be taken for an old one.
        Transaction tx(conn->get());
        const auto latest = resolveLatest(conn->get(), entityKey, readPointer(conn->get(), entityKey));
        if (!latest.has_value()) {
            return 0;
        }

        Statement stmt(conn->get(),
                       "DELETE FROM snapshots WHERE entity_key = ? AND timestamp < ? "
                       "AND timestamp <> ?;");
        bindText(stmt.get(), 1, entityKey);
        sqlite3_bind_int64(stmt.get(), 2,
                           olderThan ? toEpochSeconds(*olderThan)
                                     : std::numeric_limits<int64_t>::max());
        sqlite3_bind_int64(stmt.get(), 3, toEpochSeconds(latest->timestamp));
        stepDone(conn->get(), stmt, "failed to delete snapshots");
        deleted = static_cast<std::size_t>(sqlite3_changes(conn->get()));
        tx.commit();
    } catch (const ArchiveError &ex) {
        throw StorageDeleteFailure("cannot prune '" + entityKey + "': " + ex.what());
    }

    VKLOG_DEBUG(QStringLiteral("SnapshotStore"),
                QStringLiteral("prune"),
                QStringLiteral("snapshots_pruned"),
                QStringLiteral("retention"),
                olderThan ? QStringLiteral("older_than_cutoff") : QStringLiteral("latest_only"),
                logging::defaultWho(),
                QString(),
                (nlohmann::json{{"entity", entityKey},
                                {"cutoff", olderThan ? nlohmann::json(toIso8601Utc(*olderThan))
                                                     : nlohmann::json()},
                                {"deleted", deleted}}));
    return deleted;
}

SnapshotDiff SnapshotStore::diffSnapshots(const std::string &entityKey,
                                          std::chrono::system_clock::time_point from,
                                          std::chrono::system_clock::time_point to) const
{
    const auto before = snapshotAt(entityKey, from);
    const auto after = snapshotAt(entityKey, to);
    if (!before) {
        throw ArchiveError("no snapshot of '" + entityKey + "' at " + toIso8601Utc(from));
    }
    if (!after) {
        throw ArchiveError("no snapshot of '" + entityKey + "' at " + toIso8601Utc(to));
    }

    SnapshotDiff diff;
    diff.entityKey = entityKey;
    diff.changedFields = impl->detector.diff(before->content, after->content);
    return diff;
}

void SnapshotStore::recordSweep(const SweepResult &result)
{
    const nlohmann::json summary = result;

    Impl::Lease conn(*impl);
    Statement stmt(conn.get(),
                   "INSERT INTO sweep_log (id, timestamp, period, deleted, failures) "
                   "VALUES (?, ?, ?, ?, ?);");
    bindText(stmt.get(), 1, generateUuid());
    sqlite3_bind_int64(stmt.get(), 2, toEpochSeconds(result.now));
    bindText(stmt.get(), 3, toPeriodString(result.period));
    bindText(stmt.get(), 4, summary.at("deleted").dump());
    bindText(stmt.get(), 5, summary.at("failures").dump());
    stepDone(conn.get(), stmt, "failed to record sweep");
}

std::vector<nlohmann::json> SnapshotStore::recentSweeps(std::size_t limit) const
{
    Impl::Lease conn(*impl);
    Statement stmt(conn.get(),
                   "SELECT id, timestamp, period, deleted, failures FROM sweep_log "
                   "ORDER BY timestamp DESC, rowid DESC LIMIT ?;");
    sqlite3_bind_int64(stmt.get(), 1, static_cast<int64_t>(limit));

    std::vector<nlohmann::json> sweeps;
    while (stepRow(conn.get(), stmt, "failed to read sweep log")) {
        sweeps.push_back(nlohmann::json{
            {"id", columnText(stmt.get(), 0)},
            {"now", toIso8601Utc(fromEpochSeconds(sqlite3_column_int64(stmt.get(), 1)))},
            {"period", columnText(stmt.get(), 2)},
            {"deleted", columnJson(stmt.get(), 3)},
            {"failures", columnJson(stmt.get(), 4)}
        });
    }
    return sweeps;
}

std::optional<std::string> SnapshotStore::getMeta(const std::string &key) const
{
    Impl::Lease conn(*impl);
    Statement stmt(conn.get(),
                   "SELECT value FROM meta WHERE key = ? LIMIT 1;");
    bindText(stmt.get(), 1, key);

    if (!stepRow(conn.get(), stmt, "failed to read meta value")) {
        return std::nullopt;
    }

    return columnText(stmt.get(), 0);
}

void SnapshotStore::setMeta(const std::string &key, const std::string &value)
{
    Impl::Lease conn(*impl);
    Statement stmt(conn.get(),
                   "INSERT OR REPLACE INTO meta (key, value) VALUES (?, ?);");
    bindText(stmt.get(), 1, key);
    bindText(stmt.get(), 2, value);
    stepDone(conn.get(), stmt, "failed to set meta value");
}

bool SnapshotStore::integrityCheck(std::string *message) const
{
    Impl::Lease conn(*impl);
    Statement stmt(conn.get(), "PRAGMA integrity_check;");

    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        if (message) {
            *message = "integrity_check failed to return a result";
        }
        return false;
    }

    const std::string result = columnText(stmt.get(), 0);
    if (message) {
        *message = result;
    }
    return result == "ok";
}

} // namespace valgkronikk
