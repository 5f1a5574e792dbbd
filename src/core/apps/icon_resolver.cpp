#include "core/apps/icon_resolver.h"
#include "core/apps/key_file.h"
#include "core/shared/logging.h"
#include "core/shared/paths.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonObject>
#include <QSaveFile>

#include <climits>
#include <cstdlib>

namespace vanta {

namespace {

const QStringList& iconExtensions()
{
    static const QStringList extensions = {
        QStringLiteral("png"),
        QStringLiteral("svg"),
        QStringLiteral("xpm"),
    };
    return extensions;
}

const QString kFallbackTheme = QStringLiteral("hicolor");

QStringList xdgDataDirs()
{
    QStringList dirs;
    const QString raw = qEnvironmentVariable("XDG_DATA_DIRS");
    const QStringList parts = raw.isEmpty()
        ? QStringList{QStringLiteral("/usr/local/share"), QStringLiteral("/usr/share")}
        : raw.split(QLatin1Char(':'), Qt::SkipEmptyParts);
    for (const QString& part : parts) {
        dirs.append(QDir::cleanPath(part));
    }
    return dirs;
}

} // namespace

IconResolver::IconResolver(Options options)
    : m_options(std::move(options))
{
    if (m_options.themeName.isEmpty()) {
        m_options.themeName = detectThemeName();
    }
}

std::optional<QString> IconResolver::resolve(const QString& icon)
{
    if (icon.isEmpty()) {
        return std::nullopt;
    }

    if (QDir::isAbsolutePath(icon)) {
        if (QFileInfo::exists(icon)) {
            return canonical(icon);
        }
        LOG_WARN(vApps, "Icon path does not exist: %s", qUtf8Printable(icon));
        return std::nullopt;
    }

    std::lock_guard<std::mutex> lock(m_mutex);

    const auto cached = m_cache.constFind(icon);
    if (cached != m_cache.constEnd()) {
        if (QFileInfo::exists(*cached)) {
            return *cached;
        }
        m_cache.remove(icon);
        m_dirty = true;
    }

    std::optional<QString> found = lookupThemed(icon);
    if (!found) {
        found = lookupPixmap(icon);
    }
    if (!found) {
        LOG_WARN(vApps, "Could not find icon for '%s'", qUtf8Printable(icon));
        return std::nullopt;
    }

    const QString path = canonical(*found);
    m_cache.insert(icon, path);
    m_dirty = true;
    return path;
}

void IconResolver::loadCache()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_cache.clear();
    m_dirty = false;

    QFile file(m_options.cacheFilePath);
    if (!file.exists()) {
        return;
    }
    if (!file.open(QIODevice::ReadOnly)) {
        LOG_WARN(vApps, "Failed to open icon cache: %s", qUtf8Printable(m_options.cacheFilePath));
        return;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        LOG_WARN(vApps, "Ignoring malformed icon cache %s: %s",
                 qUtf8Printable(m_options.cacheFilePath),
                 qUtf8Printable(parseError.errorString()));
        return;
    }

    const QJsonObject icons = doc.object().value(QStringLiteral("icons")).toObject();
    for (auto it = icons.constBegin(); it != icons.constEnd(); ++it) {
        if (it.value().isString()) {
            m_cache.insert(it.key(), it.value().toString());
        }
    }
    LOG_DEBUG(vApps, "Loaded %d cached icon paths", static_cast<int>(m_cache.size()));
}

bool IconResolver::saveIfChanged()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_dirty) {
        return true;
    }

    QJsonObject icons;
    for (auto it = m_cache.constBegin(); it != m_cache.constEnd(); ++it) {
        icons.insert(it.key(), it.value());
    }
    QJsonObject root;
    root.insert(QStringLiteral("icons"), icons);

    const QString parentDir = QFileInfo(m_options.cacheFilePath).absolutePath();
    if (!QDir().mkpath(parentDir)) {
        LOG_WARN(vApps, "Failed to create icon cache directory: %s", qUtf8Printable(parentDir));
        return false;
    }

    QSaveFile file(m_options.cacheFilePath);
    if (!file.open(QIODevice::WriteOnly)
        || file.write(QJsonDocument(root).toJson(QJsonDocument::Compact)) < 0
        || !file.commit()) {
        LOG_WARN(vApps, "Failed to write icon cache: %s", qUtf8Printable(m_options.cacheFilePath));
        return false;
    }

    m_dirty = false;
    LOG_INFO(vApps, "Saved icon cache with %d entries", static_cast<int>(m_cache.size()));
    return true;
}

int IconResolver::cacheSize() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return static_cast<int>(m_cache.size());
}

QStringList IconResolver::defaultIconBaseDirs()
{
    const QString home = Paths::homeDir();
    QStringList dirs;
    dirs.append(home + QStringLiteral("/.icons"));
    dirs.append(home + QStringLiteral("/.local/share/icons"));
    for (const QString& dataDir : xdgDataDirs()) {
        const QString candidate = dataDir + QStringLiteral("/icons");
        if (!dirs.contains(candidate)) {
            dirs.append(candidate);
        }
    }
    return dirs;
}

QStringList IconResolver::defaultPixmapDirs()
{
    return {QStringLiteral("/usr/share/pixmaps")};
}

QString IconResolver::detectThemeName()
{
    const QString configHome = qEnvironmentVariableIsSet("XDG_CONFIG_HOME")
        ? qEnvironmentVariable("XDG_CONFIG_HOME")
        : Paths::homeDir() + QStringLiteral("/.config");

    for (const QString& gtk : {QStringLiteral("gtk-4.0"), QStringLiteral("gtk-3.0")}) {
        const std::optional<KeyFile> settings =
            KeyFile::load(configHome + QLatin1Char('/') + gtk + QStringLiteral("/settings.ini"));
        if (!settings) {
            continue;
        }
        QString theme = settings->value(QStringLiteral("Settings"),
                                        QStringLiteral("gtk-icon-theme-name"), QString());
        if (theme.size() >= 2 && theme.startsWith(QLatin1Char('"')) && theme.endsWith(QLatin1Char('"'))) {
            theme = theme.mid(1, theme.size() - 2);
        }
        if (!theme.isEmpty()) {
            return theme;
        }
    }
    return kFallbackTheme;
}

std::optional<QString> IconResolver::lookupThemed(const QString& name)
{
    QStringList visited;
    std::optional<QString> found = lookupInTheme(m_options.themeName, name, visited);
    if (!found && !visited.contains(kFallbackTheme)) {
        found = lookupInTheme(kFallbackTheme, name, visited);
    }
    return found;
}

std::optional<QString> IconResolver::lookupInTheme(const QString& theme, const QString& name,
                                                   QStringList& visited)
{
    if (visited.contains(theme)) {
        return std::nullopt;
    }
    visited.append(theme);

    const ThemeIndex& index = themeIndex(theme);
    if (!index.valid) {
        return std::nullopt;
    }

    for (const ThemeDirectory& dir : index.directories) {
        if (!directoryMatchesSize(dir)) {
            continue;
        }
        for (const QString& base : m_options.iconBaseDirs) {
            for (const QString& ext : iconExtensions()) {
                const QString candidate = QStringLiteral("%1/%2/%3/%4.%5")
                                              .arg(base, theme, dir.path, name, ext);
                if (QFileInfo::exists(candidate)) {
                    return candidate;
                }
            }
        }
    }

    std::optional<QString> closest;
    int minimalDistance = INT_MAX;
    for (const ThemeDirectory& dir : index.directories) {
        const int distance = directorySizeDistance(dir);
        if (distance >= minimalDistance) {
            continue;
        }
        for (const QString& base : m_options.iconBaseDirs) {
            for (const QString& ext : iconExtensions()) {
                const QString candidate = QStringLiteral("%1/%2/%3/%4.%5")
                                              .arg(base, theme, dir.path, name, ext);
                if (distance < minimalDistance && QFileInfo::exists(candidate)) {
                    closest = candidate;
                    minimalDistance = distance;
                }
            }
        }
    }
    if (closest) {
        return closest;
    }

    // Recursing may insert into m_themes and invalidate `index`.
    const QStringList parents = index.inherits;
    for (const QString& parent : parents) {
        std::optional<QString> inherited = lookupInTheme(parent, name, visited);
        if (inherited) {
            return inherited;
        }
    }
    return std::nullopt;
}

std::optional<QString> IconResolver::lookupPixmap(const QString& name) const
{
    for (const QString& dir : m_options.pixmapDirs) {
        for (const QString& ext : iconExtensions()) {
            const QString candidate = dir + QLatin1Char('/') + name + QLatin1Char('.') + ext;
            if (QFileInfo::exists(candidate)) {
                return candidate;
            }
        }
    }
    return std::nullopt;
}

const IconResolver::ThemeIndex& IconResolver::themeIndex(const QString& theme)
{
    auto it = m_themes.find(theme);
    if (it != m_themes.end()) {
        return *it;
    }

    ThemeIndex index;
    for (const QString& base : m_options.iconBaseDirs) {
        const std::optional<KeyFile> keyFile =
            KeyFile::load(base + QLatin1Char('/') + theme + QStringLiteral("/index.theme"));
        if (!keyFile || !keyFile->hasGroup(QStringLiteral("Icon Theme"))) {
            continue;
        }

        const QString group = QStringLiteral("Icon Theme");
        QStringList dirNames = keyFile->listValue(group, QStringLiteral("Directories"), QLatin1Char(','));
        dirNames.append(keyFile->listValue(group, QStringLiteral("ScaledDirectories"), QLatin1Char(',')));

        for (const QString& dirName : std::as_const(dirNames)) {
            if (!keyFile->hasGroup(dirName)) {
                continue;
            }
            ThemeDirectory dir;
            dir.path = dirName;
            dir.size = keyFile->intValue(dirName, QStringLiteral("Size"), 0);
            dir.scale = keyFile->intValue(dirName, QStringLiteral("Scale"), 1);
            dir.minSize = keyFile->intValue(dirName, QStringLiteral("MinSize"), dir.size);
            dir.maxSize = keyFile->intValue(dirName, QStringLiteral("MaxSize"), dir.size);
            dir.threshold = keyFile->intValue(dirName, QStringLiteral("Threshold"), 2);
            const QString type = keyFile->value(dirName, QStringLiteral("Type"), QStringLiteral("Threshold"));
            if (type == QLatin1String("Fixed")) {
                dir.type = ThemeDirectory::Type::Fixed;
            } else if (type == QLatin1String("Scalable")) {
                dir.type = ThemeDirectory::Type::Scalable;
            }
            index.directories.push_back(dir);
        }
        index.inherits = keyFile->listValue(group, QStringLiteral("Inherits"), QLatin1Char(','));
        index.valid = true;
        break;
    }

    if (!index.valid) {
        LOG_DEBUG(vApps, "Icon theme '%s' not found", qUtf8Printable(theme));
    }
    return *m_themes.insert(theme, index);
}

bool IconResolver::directoryMatchesSize(const ThemeDirectory& dir) const
{
    if (dir.scale != m_options.scale) {
        return false;
    }
    switch (dir.type) {
    case ThemeDirectory::Type::Fixed:
        return dir.size == m_options.size;
    case ThemeDirectory::Type::Scalable:
        return dir.minSize <= m_options.size && m_options.size <= dir.maxSize;
    case ThemeDirectory::Type::Threshold:
        return dir.size - dir.threshold <= m_options.size
            && m_options.size <= dir.size + dir.threshold;
    }
    return false;
}

int IconResolver::directorySizeDistance(const ThemeDirectory& dir) const
{
    const int wanted = m_options.size * m_options.scale;
    switch (dir.type) {
    case ThemeDirectory::Type::Fixed:
        return std::abs(dir.size * dir.scale - wanted);
    case ThemeDirectory::Type::Scalable:
        if (wanted < dir.minSize * dir.scale) {
            return dir.minSize * dir.scale - wanted;
        }
        if (wanted > dir.maxSize * dir.scale) {
            return wanted - dir.maxSize * dir.scale;
        }
        return 0;
    case ThemeDirectory::Type::Threshold:
        if (wanted < (dir.size - dir.threshold) * dir.scale) {
            return dir.minSize * dir.scale - wanted;
        }
        if (wanted > (dir.size + dir.threshold) * dir.scale) {
            return wanted - dir.maxSize * dir.scale;
        }
        return 0;
    }
    return INT_MAX;
}

QString IconResolver::canonical(const QString& path)
{
    const QString resolved = QFileInfo(path).canonicalFilePath();
    return resolved.isEmpty() ? path : resolved;
}

} // namespace vanta
