#include "core/shared/paths.h"

#include <QDir>
#include <QStandardPaths>

namespace vanta {

namespace {

QString envPath(const char* envName)
{
    const QString value = qEnvironmentVariable(envName).trimmed();
    if (value.isEmpty()) {
        return {};
    }
    return QDir::cleanPath(value);
}

} // namespace

QString Paths::configDir()
{
    const QString overridden = envPath("VANTA_CONFIG_DIR");
    if (!overridden.isEmpty()) {
        return overridden;
    }
    QString base = QStandardPaths::writableLocation(QStandardPaths::GenericConfigLocation);
    if (base.isEmpty()) {
        base = homeDir() + QStringLiteral("/.config");
    }
    return QDir::cleanPath(base + QStringLiteral("/vanta"));
}

QString Paths::homeDir()
{
    const QString overridden = envPath("VANTA_HOME_DIR");
    if (!overridden.isEmpty()) {
        return overridden;
    }
    return QDir::homePath();
}

QString Paths::configFilePath()
{
    return configDir() + QStringLiteral("/config.json");
}

QString Paths::historyFilePath()
{
    return configDir() + QStringLiteral("/vanta_history.json");
}

QString Paths::iconCacheFilePath()
{
    return configDir() + QStringLiteral("/icon-cache.json");
}

QString Paths::themesDir()
{
    return configDir() + QStringLiteral("/themes");
}

QString Paths::expandTilde(const QString& path)
{
    if (path == QLatin1String("~")) {
        return homeDir();
    }
    if (path.startsWith(QLatin1String("~/"))) {
        return homeDir() + path.mid(1);
    }
    return path;
}

} // namespace vanta
