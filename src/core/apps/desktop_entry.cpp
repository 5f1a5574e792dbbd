#include "core/apps/desktop_entry.h"
#include "core/apps/key_file.h"
#include "core/shared/logging.h"

namespace vanta {

namespace {

const QString kGroup = QStringLiteral("Desktop Entry");

} // namespace

std::optional<AppEntry> DesktopEntryParser::parseFile(const QString& filePath)
{
    const std::optional<KeyFile> keyFile = KeyFile::load(filePath);
    if (!keyFile) {
        LOG_DEBUG(vApps, "Unreadable desktop file: %s", qUtf8Printable(filePath));
        return std::nullopt;
    }
    return parse(*keyFile, filePath);
}

std::optional<AppEntry> DesktopEntryParser::parse(const QString& content, const QString& sourcePath)
{
    return parse(KeyFile::parse(content), sourcePath);
}

std::optional<AppEntry> DesktopEntryParser::parse(const KeyFile& keyFile, const QString& sourcePath)
{
    if (!keyFile.hasGroup(kGroup)) {
        return std::nullopt;
    }

    if (keyFile.boolValue(kGroup, QStringLiteral("NoDisplay"))
        || keyFile.boolValue(kGroup, QStringLiteral("Hidden"))) {
        return std::nullopt;
    }

    const std::optional<QString> name = keyFile.value(kGroup, QStringLiteral("Name"));
    const std::optional<QString> exec = keyFile.value(kGroup, QStringLiteral("Exec"));
    if (!name || !exec) {
        return std::nullopt;
    }

    AppEntry app;
    app.name = *name;
    app.exec = *exec;
    app.genericName = keyFile.value(kGroup, QStringLiteral("GenericName"));
    app.comment = keyFile.value(kGroup, QStringLiteral("Comment"));
    app.icon = keyFile.value(kGroup, QStringLiteral("Icon"));
    app.startupWmClass = keyFile.value(kGroup, QStringLiteral("StartupWMClass"));
    app.terminal = keyFile.boolValue(kGroup, QStringLiteral("Terminal"));
    app.categories = keyFile.listValue(kGroup, QStringLiteral("Categories"), QLatin1Char(';'));
    app.sourcePath = sourcePath;
    return app;
}

} // namespace vanta
