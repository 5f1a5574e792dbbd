#pragma once

#include "core/shared/search_result.h"
#include "core/shared/settings.h"
#include "core/shared/types.h"
#include <memory>
#include <mutex>
#include <vector>

class QFileInfo;

namespace vanta {

// In-memory index of the home directory tree used by "/" and "~/" queries.
//
// The walk runs once in the background (startup, config change) and the
// snapshot is replaced wholesale; queries only filter the held snapshot.
class FileIndex {
public:
    using Snapshot = std::shared_ptr<const std::vector<FileEntry>>;

    static constexpr uint32_t kBaseScore = 50;

    explicit FileIndex(QString root);

    // Depth-first walk below `root` (excluded). Entries at depth 1 are the
    // direct children. Symlinks are listed but never followed; dot-prefixed
    // names are pruned with their subtree unless includeHidden is set.
    static std::vector<FileEntry> build(const QString& root, int maxDepth, bool includeHidden);

    // Strips a leading "~/" or "/" and keeps entries whose lowercase name
    // contains the remaining lowercase term. An empty term matches all.
    static std::vector<SearchResult> search(const std::vector<FileEntry>& entries,
                                            const QString& query, int limit,
                                            uint32_t baseScore = kBaseScore);

    // build() with the given settings and replace the snapshot.
    int rebuild(const FilesSettings& settings);

    Snapshot snapshot() const;
    void replace(std::vector<FileEntry> entries);

    const QString& root() const { return m_root; }

    static QString iconTagFor(const QFileInfo& info);

private:
    static void walk(const QString& dirPath, int depth, int maxDepth, bool includeHidden,
                     std::vector<FileEntry>& entries);

    QString m_root;
    mutable std::mutex m_mutex;
    Snapshot m_snapshot;
    std::mutex m_buildMutex;
};

} // namespace vanta
