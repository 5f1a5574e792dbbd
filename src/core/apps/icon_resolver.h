#pragma once

#include <QHash>
#include <QString>
#include <QStringList>
#include <mutex>
#include <optional>
#include <vector>

namespace vanta {

// Resolves freedesktop icon names to concrete files.
//
// Lookup order: absolute path, persistent cache, the detected icon theme
// (with its Inherits chain), the hicolor fallback theme, then pixmap dirs.
// Results are cached by name; cached paths that disappeared are evicted and
// resolved again. Thread-safe.
class IconResolver {
public:
    struct Options {
        QString cacheFilePath;
        QStringList iconBaseDirs;   // roots that contain <theme>/index.theme
        QStringList pixmapDirs;
        QString themeName;          // empty = detectThemeName()
        int size = 48;
        int scale = 1;
    };

    explicit IconResolver(Options options);

    std::optional<QString> resolve(const QString& icon);

    // Loads {"icons": {name: path}} from the cache file. Missing or invalid
    // files leave the cache empty.
    void loadCache();

    // Writes the cache when entries were added or evicted since the last
    // load/save. Returns false only on write failure.
    bool saveIfChanged();

    int cacheSize() const;
    QString themeName() const { return m_options.themeName; }

    static QStringList defaultIconBaseDirs();
    static QStringList defaultPixmapDirs();

    // gtk-icon-theme-name from the GTK 3/4 settings.ini, else "hicolor".
    static QString detectThemeName();

private:
    struct ThemeDirectory {
        QString path;
        int size = 0;
        int scale = 1;
        int minSize = 0;
        int maxSize = 0;
        int threshold = 2;
        enum class Type { Fixed, Scalable, Threshold } type = Type::Threshold;
    };

    struct ThemeIndex {
        bool valid = false;
        std::vector<ThemeDirectory> directories;
        QStringList inherits;
    };

    std::optional<QString> lookupThemed(const QString& name);
    std::optional<QString> lookupInTheme(const QString& theme, const QString& name,
                                         QStringList& visited);
    std::optional<QString> lookupPixmap(const QString& name) const;
    const ThemeIndex& themeIndex(const QString& theme);

    bool directoryMatchesSize(const ThemeDirectory& dir) const;
    int directorySizeDistance(const ThemeDirectory& dir) const;

    static QString canonical(const QString& path);

    Options m_options;
    mutable std::mutex m_mutex;
    QHash<QString, QString> m_cache;
    QHash<QString, ThemeIndex> m_themes;
    bool m_dirty = false;
};

} // namespace vanta
