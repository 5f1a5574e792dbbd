#pragma once

#include "core/shared/types.h"
#include <QStringList>
#include <memory>
#include <mutex>
#include <vector>

namespace vanta {

class IconResolver;

// Installed-application index built from .desktop descriptors.
//
// The current list is held as an immutable snapshot that rescans replace
// wholesale; readers take a reference-counted snapshot and never observe a
// partial list.
class AppIndex {
public:
    using Snapshot = std::shared_ptr<const std::vector<AppEntry>>;

    // Directories are scanned in priority order; the first directory that
    // provides a given name wins. `iconResolver` may be null (icons are then
    // dropped) and must outlive the index.
    explicit AppIndex(QStringList desktopDirs = defaultDesktopDirs(),
                      IconResolver* iconResolver = nullptr);

    // Walks the descriptor directories and returns the sorted entry list.
    // Does not touch the held snapshot.
    std::vector<AppEntry> scan() const;

    // scan() and replace the snapshot. Returns the new entry count.
    int rescan();

    Snapshot snapshot() const;
    void replace(std::vector<AppEntry> apps);

    // Directories that currently exist, for the filesystem watcher.
    QStringList existingDirectories() const;
    const QStringList& desktopDirs() const { return m_desktopDirs; }

    static QStringList defaultDesktopDirs();

    // The synthetic "install script" entry that is always present.
    static AppEntry installScriptEntry();

private:
    QStringList m_desktopDirs;
    IconResolver* m_iconResolver;

    mutable std::mutex m_mutex;
    Snapshot m_snapshot;

    // Serializes concurrent rescans so the newest scan always lands last.
    std::mutex m_scanMutex;
};

} // namespace vanta
