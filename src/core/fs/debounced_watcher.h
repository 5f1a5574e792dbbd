#pragma once

#include <QElapsedTimer>
#include <QFileSystemWatcher>
#include <QHash>
#include <QObject>
#include <QStringList>
#include <QTimer>

namespace vanta {

// QFileSystemWatcher with coalescing.
//
// A burst of change events produces exactly one triggered() signal. The
// signal fires `settleMs` after the first event of the burst, and never
// sooner than `minIntervalMs` after the previous trigger. Events arriving
// while a trigger is pending are folded into it, so the final state of a
// burst is always picked up.
//
// Paths that do not exist yet are covered by watching their parent
// directory; they are promoted to direct watches once they appear.
//
// For a watched directory the regular files inside it are watched too, so
// in-place edits fire. With name filters set, only files matching them are
// watched, and a directory event fires only when the set of matching file
// names changed.
class DebouncedWatcher : public QObject {
    Q_OBJECT
public:
    DebouncedWatcher(int minIntervalMs, int settleMs, QObject* parent = nullptr);

    void setPaths(const QStringList& paths);
    QStringList paths() const { return m_paths; }

    // Wildcard patterns such as "*.desktop"; empty matches every file.
    void setNameFilters(const QStringList& filters);
    QStringList nameFilters() const { return m_nameFilters; }

    int minIntervalMs() const { return m_minIntervalMs; }
    int settleMs() const { return m_settleMs; }

signals:
    void triggered();

private slots:
    void onDirectoryChanged(const QString& path);
    void onFileChanged(const QString& path);
    void fire();

private:
    void schedule();
    void refreshWatches();
    QStringList matchingFiles(const QString& dir) const;

    QFileSystemWatcher m_watcher;
    QTimer m_timer;
    QElapsedTimer m_sinceLastTrigger;
    QStringList m_paths;
    QStringList m_nameFilters;
    QHash<QString, QStringList> m_listings;
    int m_minIntervalMs;
    int m_settleMs;
};

} // namespace vanta
