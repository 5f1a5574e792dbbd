#include "core/fs/file_index.h"
#include "core/shared/logging.h"

#include <QDir>
#include <QElapsedTimer>
#include <QFileInfo>

namespace vanta {

FileIndex::FileIndex(QString root)
    : m_root(std::move(root))
    , m_snapshot(std::make_shared<const std::vector<FileEntry>>())
{
}

std::vector<FileEntry> FileIndex::build(const QString& root, int maxDepth, bool includeHidden)
{
    std::vector<FileEntry> entries;
    if (!QFileInfo(root).isDir()) {
        LOG_WARN(vFiles, "File index root does not exist: %s", qUtf8Printable(root));
        return entries;
    }

    QElapsedTimer timer;
    timer.start();
    walk(root, 1, maxDepth, includeHidden, entries);
    LOG_INFO(vFiles, "File index built: %d entries (depth %d) in %lld ms",
             static_cast<int>(entries.size()), maxDepth, static_cast<long long>(timer.elapsed()));
    return entries;
}

void FileIndex::walk(const QString& dirPath, int depth, int maxDepth, bool includeHidden,
                     std::vector<FileEntry>& entries)
{
    if (depth > maxDepth) {
        return;
    }

    QDir dir(dirPath);
    QDir::Filters filters = QDir::AllEntries | QDir::NoDotAndDotDot | QDir::System;
    if (includeHidden) {
        filters |= QDir::Hidden;
    }
    const QFileInfoList children = dir.entryInfoList(filters, QDir::Name);

    for (const QFileInfo& info : children) {
        const QString name = info.fileName();
        if (!includeHidden && name.startsWith(QLatin1Char('.'))) {
            continue;
        }

        FileEntry entry;
        entry.nameDisplay = name;
        entry.nameLower = name.toLower();
        entry.fullPath = info.absoluteFilePath();
        entry.iconTag = iconTagFor(info);
        entries.push_back(std::move(entry));

        if (info.isDir() && !info.isSymLink()) {
            walk(info.absoluteFilePath(), depth + 1, maxDepth, includeHidden, entries);
        }
    }
}

std::vector<SearchResult> FileIndex::search(const std::vector<FileEntry>& entries,
                                            const QString& query, int limit,
                                            uint32_t baseScore)
{
    std::vector<SearchResult> results;
    if (limit <= 0) {
        return results;
    }

    QString term = query;
    if (term.startsWith(QLatin1String("~/"))) {
        term = term.mid(2);
    } else if (term.startsWith(QLatin1Char('/'))) {
        term = term.mid(1);
    }
    term = term.toLower();

    for (const FileEntry& entry : entries) {
        if (!term.isEmpty() && !entry.nameLower.contains(term)) {
            continue;
        }

        SearchResult result;
        result.title = entry.nameDisplay;
        result.subtitle = entry.fullPath;
        result.icon = entry.iconTag;
        result.exec = entry.fullPath;
        result.score = baseScore;
        result.source = ResultSource::File;
        result.actions.push_back({QStringLiteral("Open Containing Folder"),
                                  QFileInfo(entry.fullPath).absolutePath()});
        results.push_back(std::move(result));

        if (static_cast<int>(results.size()) >= limit) {
            break;
        }
    }
    return results;
}

int FileIndex::rebuild(const FilesSettings& settings)
{
    std::lock_guard<std::mutex> buildLock(m_buildMutex);
    std::vector<FileEntry> entries = build(m_root, settings.maxDepth, settings.includeHidden);
    const int count = static_cast<int>(entries.size());
    replace(std::move(entries));
    return count;
}

FileIndex::Snapshot FileIndex::snapshot() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_snapshot;
}

void FileIndex::replace(std::vector<FileEntry> entries)
{
    auto next = std::make_shared<const std::vector<FileEntry>>(std::move(entries));
    std::lock_guard<std::mutex> lock(m_mutex);
    m_snapshot = std::move(next);
}

QString FileIndex::iconTagFor(const QFileInfo& info)
{
    if (info.isDir()) {
        return QStringLiteral("dir");
    }
    const QString suffix = info.suffix();
    // ".bashrc" has no extension.
    if (suffix.isEmpty() || info.completeBaseName().isEmpty()) {
        return QStringLiteral("file");
    }
    return QStringLiteral("file:") + suffix.toLower();
}

} // namespace vanta
