#pragma once

#include <stdexcept>
#include <string>

namespace valgkronikk {

// Base of every error the archive reports to its callers.
class ArchiveError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Malformed entity registry, retention policy or detector configuration.
// Raised at startup only.
class ConfigError : public ArchiveError {
public:
    using ArchiveError::ArchiveError;
};

// Ingest rejected because its timestamp is not after the last one seen for
// the entity. The entity state is unchanged.
class OutOfOrderTimestamp : public ArchiveError {
public:
    using ArchiveError::ArchiveError;
};

// Snapshot body or latest pointer could not be persisted. The latest pointer
// still references the previous snapshot; the same ingest may be retried.
class StorageWriteFailure : public ArchiveError {
public:
    using ArchiveError::ArchiveError;
};

class StorageDeleteFailure : public ArchiveError {
public:
    using ArchiveError::ArchiveError;
};

class EntityNotFound : public ArchiveError {
public:
    using ArchiveError::ArchiveError;
};

} // namespace valgkronikk
