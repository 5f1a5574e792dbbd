#include "core/fs/debounced_watcher.h"
#include "core/shared/logging.h"

#include <QDir>
#include <QFileInfo>

#include <algorithm>

namespace vanta {

DebouncedWatcher::DebouncedWatcher(int minIntervalMs, int settleMs, QObject* parent)
    : QObject(parent)
    , m_minIntervalMs(minIntervalMs)
    , m_settleMs(settleMs)
{
    m_timer.setSingleShot(true);
    connect(&m_timer, &QTimer::timeout, this, &DebouncedWatcher::fire);
    connect(&m_watcher, &QFileSystemWatcher::fileChanged,
            this, &DebouncedWatcher::onFileChanged);
    connect(&m_watcher, &QFileSystemWatcher::directoryChanged,
            this, &DebouncedWatcher::onDirectoryChanged);
}

void DebouncedWatcher::setPaths(const QStringList& paths)
{
    m_paths = paths;
    m_listings.clear();
    if (!m_watcher.files().isEmpty()) {
        m_watcher.removePaths(m_watcher.files());
    }
    if (!m_watcher.directories().isEmpty()) {
        m_watcher.removePaths(m_watcher.directories());
    }
    refreshWatches();
}

void DebouncedWatcher::setNameFilters(const QStringList& filters)
{
    m_nameFilters = filters;
    setPaths(m_paths);
}

void DebouncedWatcher::onDirectoryChanged(const QString& path)
{
    LOG_DEBUG(vCore, "Watched directory changed: %s", qUtf8Printable(path));

    // Parents of missing paths always fire; the path may have appeared.
    const auto listing = m_listings.find(path);
    if (listing != m_listings.end()) {
        const QStringList current = matchingFiles(path);
        if (current == listing.value()) {
            return;
        }
        listing.value() = current;
    }
    schedule();
}

void DebouncedWatcher::onFileChanged(const QString& path)
{
    LOG_DEBUG(vCore, "Watched file changed: %s", qUtf8Printable(path));
    schedule();
}

void DebouncedWatcher::schedule()
{
    if (m_timer.isActive()) {
        return;
    }

    int delay = m_settleMs;
    if (m_sinceLastTrigger.isValid()) {
        const qint64 remaining = m_minIntervalMs - m_sinceLastTrigger.elapsed();
        delay = std::max<int>(delay, static_cast<int>(std::max<qint64>(remaining, 0)));
    }
    m_timer.start(delay);
}

void DebouncedWatcher::fire()
{
    m_sinceLastTrigger.start();
    // Editors that replace files on save drop the inotify watch.
    refreshWatches();
    emit triggered();
}

QStringList DebouncedWatcher::matchingFiles(const QString& dir) const
{
    return QDir(dir).entryList(m_nameFilters, QDir::Files | QDir::Hidden, QDir::Name);
}

void DebouncedWatcher::refreshWatches()
{
    QStringList targets;
    for (const QString& path : std::as_const(m_paths)) {
        const QFileInfo info(path);
        if (!info.exists()) {
            const QString parentDir = info.absolutePath();
            if (QFileInfo(parentDir).isDir()) {
                targets.append(parentDir);
            }
            continue;
        }
        targets.append(path);
        if (info.isDir()) {
            const QDir dir(path);
            const QStringList names = matchingFiles(path);
            m_listings.insert(path, names);
            for (const QString& name : names) {
                targets.append(dir.filePath(name));
            }
        }
    }

    const QStringList watchedFiles = m_watcher.files();
    const QStringList watchedDirs = m_watcher.directories();
    for (const QString& target : std::as_const(targets)) {
        if (watchedFiles.contains(target) || watchedDirs.contains(target)) {
            continue;
        }
        if (!m_watcher.addPath(target)) {
            LOG_WARN(vCore, "Could not watch %s", qUtf8Printable(target));
        }
    }
}

} // namespace vanta
