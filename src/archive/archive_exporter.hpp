#pragma once

#include <cstddef>
#include <string>

#include "archive/snapshot_store.hpp"

namespace valgkronikk {

struct ExportSummary {
    std::size_t entities = 0;
    std::size_t snapshots = 0;
};

// Writes the stored archive as a directory tree:
//   <root>/<level dir>/<entity key>/<label>.json   every stored snapshot
//   <root>/<level dir>/<entity key>.json           copy of the latest
// Level dirs are nasjonalt, fylke, kommune and kommune/krets.
class ArchiveExporter {
public:
    explicit ArchiveExporter(const SnapshotStore &store);

    // Throws ArchiveError when a directory or file cannot be written.
    ExportSummary exportTo(const std::string &root) const;

    static std::string levelDirectory(EntityLevel level);

private:
    const SnapshotStore &m_store;
};

} // namespace valgkronikk
