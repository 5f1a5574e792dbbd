#include "core/apps/app_index.h"
#include "core/apps/desktop_entry.h"
#include "core/apps/icon_resolver.h"
#include "core/shared/logging.h"
#include "core/shared/paths.h"

#include <QDir>
#include <QElapsedTimer>
#include <QFileInfo>
#include <QSet>

#include <algorithm>

namespace vanta {

AppIndex::AppIndex(QStringList desktopDirs, IconResolver* iconResolver)
    : m_desktopDirs(std::move(desktopDirs))
    , m_iconResolver(iconResolver)
    , m_snapshot(std::make_shared<const std::vector<AppEntry>>())
{
}

std::vector<AppEntry> AppIndex::scan() const
{
    QElapsedTimer timer;
    timer.start();

    std::vector<AppEntry> entries;
    QSet<QString> seenNames;

    const AppEntry installEntry = installScriptEntry();
    seenNames.insert(installEntry.name);
    entries.push_back(installEntry);

    int skipped = 0;
    for (const QString& dirPath : m_desktopDirs) {
        QDir dir(dirPath);
        if (!dir.exists()) {
            continue;
        }
        if (!QFileInfo(dirPath).isReadable()) {
            LOG_WARN(vApps, "Could not read %s", qUtf8Printable(dirPath));
            continue;
        }

        const QFileInfoList files = dir.entryInfoList(
            {QStringLiteral("*.desktop")}, QDir::Files | QDir::Readable, QDir::Name);
        for (const QFileInfo& info : files) {
            std::optional<AppEntry> app = DesktopEntryParser::parseFile(info.absoluteFilePath());
            if (!app) {
                ++skipped;
                continue;
            }
            if (seenNames.contains(app->name)) {
                continue;
            }
            seenNames.insert(app->name);

            if (app->icon) {
                app->icon = m_iconResolver ? m_iconResolver->resolve(*app->icon) : std::nullopt;
            }
            entries.push_back(std::move(*app));
        }
    }

    if (m_iconResolver) {
        m_iconResolver->saveIfChanged();
    }

    std::stable_sort(entries.begin(), entries.end(), [](const AppEntry& a, const AppEntry& b) {
        return a.name.compare(b.name, Qt::CaseInsensitive) < 0;
    });

    LOG_INFO(vApps, "Desktop scan complete: %d entries (%d skipped) in %lld ms",
             static_cast<int>(entries.size()), skipped, static_cast<long long>(timer.elapsed()));
    return entries;
}

int AppIndex::rescan()
{
    std::lock_guard<std::mutex> scanLock(m_scanMutex);
    std::vector<AppEntry> apps = scan();
    const int count = static_cast<int>(apps.size());
    replace(std::move(apps));
    return count;
}

AppIndex::Snapshot AppIndex::snapshot() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_snapshot;
}

void AppIndex::replace(std::vector<AppEntry> apps)
{
    auto next = std::make_shared<const std::vector<AppEntry>>(std::move(apps));
    std::lock_guard<std::mutex> lock(m_mutex);
    m_snapshot = std::move(next);
}

QStringList AppIndex::existingDirectories() const
{
    QStringList dirs;
    for (const QString& dir : m_desktopDirs) {
        if (QFileInfo(dir).isDir()) {
            dirs.append(dir);
        }
    }
    return dirs;
}

QStringList AppIndex::defaultDesktopDirs()
{
    QStringList dirs = {
        QStringLiteral("/usr/share/applications"),
        QStringLiteral("/usr/local/share/applications"),
        QStringLiteral("/var/lib/flatpak/exports/share/applications"),
        QStringLiteral("/snap/gui"),
        QStringLiteral("/var/lib/snapd/desktop/applications"),
    };

    const QString home = Paths::homeDir();
    dirs.append(home + QStringLiteral("/.local/share/applications"));
    dirs.append(home + QStringLiteral("/.gnome/apps"));

    const QString dataDirs = qEnvironmentVariable("XDG_DATA_DIRS");
    for (const QString& dataDir : dataDirs.split(QLatin1Char(':'), Qt::SkipEmptyParts)) {
        const QString appDir = QDir::cleanPath(dataDir + QStringLiteral("/applications"));
        if (!dirs.contains(appDir)) {
            dirs.append(appDir);
        }
    }
    return dirs;
}

AppEntry AppIndex::installScriptEntry()
{
    AppEntry entry;
    entry.name = QStringLiteral("Install Script (Vanta Store)");
    entry.genericName = QStringLiteral("Type 'install <github-url>' or a local file path to fetch");
    entry.comment = QStringLiteral("Downloads and installs scripts directly into Vanta");
    entry.exec = QStringLiteral("install:");
    entry.icon = QStringLiteral("system-software-install");
    entry.sourcePath = QStringLiteral("vanta://store");
    return entry;
}

} // namespace vanta
