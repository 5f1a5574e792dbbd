#include "core/shared/settings_manager.h"
#include "core/shared/logging.h"
#include "core/shared/paths.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QSaveFile>

#include <limits>

namespace vanta {

namespace {

const QStringList& shellSectionKeys()
{
    static const QStringList keys = {
        QStringLiteral("appearance"),
        QStringLiteral("window"),
    };
    return keys;
}

QJsonObject providerToJson(const ProviderSettings& provider)
{
    QJsonObject json;
    json.insert(QStringLiteral("enabled"), provider.enabled);
    json.insert(QStringLiteral("weight"), static_cast<qint64>(provider.weight));
    return json;
}

ProviderSettings providerFromJson(const QJsonValue& value)
{
    ProviderSettings provider;
    const QJsonObject json = value.toObject();
    provider.enabled = json.value(QStringLiteral("enabled")).toBool(provider.enabled);
    if (json.contains(QStringLiteral("weight"))) {
        const qint64 weight = json.value(QStringLiteral("weight")).toInteger(provider.weight);
        provider.weight = weight < 0 ? 0u : static_cast<uint32_t>(qMin<qint64>(weight, UINT32_MAX));
    }
    return provider;
}

} // namespace

std::optional<Settings> SettingsManager::load(const QString& filePath)
{
    QFile file(filePath);
    if (!file.exists()) {
        return std::nullopt;
    }

    if (!file.open(QIODevice::ReadOnly)) {
        LOG_WARN(vCore, "Failed to open settings file for read: %s", qUtf8Printable(filePath));
        return std::nullopt;
    }

    const QByteArray rawJson = file.readAll();
    file.close();

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(rawJson, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        LOG_WARN(vCore,
                 "Failed to parse settings JSON (%s): %s",
                 qUtf8Printable(filePath),
                 qUtf8Printable(parseError.errorString()));
        return std::nullopt;
    }

    LOG_INFO(vCore, "Loaded settings from %s", qUtf8Printable(filePath));
    return fromJson(doc.object());
}

Settings SettingsManager::loadOrCreateDefault(const QString& filePath)
{
    if (QFileInfo::exists(filePath)) {
        auto loaded = load(filePath);
        if (loaded.has_value()) {
            return loaded.value();
        }
        LOG_WARN(vCore, "Invalid settings file, using defaults: %s", qUtf8Printable(filePath));
        return Settings{};
    }

    Settings defaults;
    if (save(defaults, filePath)) {
        LOG_INFO(vCore, "Created default settings at %s", qUtf8Printable(filePath));
    }

    const QString scriptsDir = Paths::expandTilde(defaults.scriptsDirectory);
    if (!QDir().mkpath(scriptsDir)) {
        LOG_WARN(vCore, "Could not create scripts directory: %s", qUtf8Printable(scriptsDir));
    }
    return defaults;
}

bool SettingsManager::save(const Settings& settings, const QString& filePath)
{
    const QString parentDir = QFileInfo(filePath).absolutePath();
    if (!QDir().mkpath(parentDir)) {
        LOG_ERROR(vCore, "Failed to create settings directory: %s", qUtf8Printable(parentDir));
        return false;
    }

    const QJsonDocument doc(toJson(settings));
    QSaveFile file(filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        LOG_ERROR(vCore, "Failed to open settings file for write: %s", qUtf8Printable(filePath));
        return false;
    }

    if (file.write(doc.toJson(QJsonDocument::Indented)) < 0 || !file.commit()) {
        LOG_ERROR(vCore, "Failed to write settings file: %s", qUtf8Printable(filePath));
        return false;
    }

    return true;
}

QString SettingsManager::settingsFilePath()
{
    return Paths::configFilePath();
}

QJsonObject SettingsManager::toJson(const Settings& settings)
{
    QJsonObject json;
    for (const QString& key : shellSectionKeys()) {
        if (settings.shellSections.contains(key)) {
            json.insert(key, settings.shellSections.value(key));
        }
    }

    QJsonObject general = settings.shellSections.value(QStringLiteral("general")).toObject();
    general.insert(QStringLiteral("max_results"), settings.maxResults);
    json.insert(QStringLiteral("general"), general);

    QJsonObject search;
    search.insert(QStringLiteral("applications"), providerToJson(settings.search.applications));
    search.insert(QStringLiteral("windows"), providerToJson(settings.search.windows));
    search.insert(QStringLiteral("calculator"), providerToJson(settings.search.calculator));
    search.insert(QStringLiteral("files"), providerToJson(settings.search.files));
    json.insert(QStringLiteral("search"), search);

    QJsonObject scripts;
    scripts.insert(QStringLiteral("directory"), settings.scriptsDirectory);
    scripts.insert(QStringLiteral("timeout_ms"), static_cast<qint64>(settings.scriptTimeoutMs));
    json.insert(QStringLiteral("scripts"), scripts);

    QJsonObject files;
    files.insert(QStringLiteral("include_hidden"), settings.files.includeHidden);
    files.insert(QStringLiteral("max_depth"), settings.files.maxDepth);
    files.insert(QStringLiteral("file_manager"), settings.files.fileManager);
    files.insert(QStringLiteral("file_editor"), settings.files.fileEditor);
    files.insert(QStringLiteral("open_docs_in_manager"), settings.files.openDocsInManager);
    json.insert(QStringLiteral("files"), files);

    return json;
}

Settings SettingsManager::fromJson(const QJsonObject& json)
{
    Settings settings;

    for (const QString& key : shellSectionKeys()) {
        if (json.contains(key)) {
            settings.shellSections.insert(key, json.value(key));
        }
    }

    const QJsonObject general = json.value(QStringLiteral("general")).toObject();
    settings.shellSections.insert(QStringLiteral("general"), general);
    settings.maxResults = general.value(QStringLiteral("max_results")).toInt(settings.maxResults);
    if (settings.maxResults < 1) {
        settings.maxResults = 1;
    }

    const QJsonObject search = json.value(QStringLiteral("search")).toObject();
    settings.search.applications = providerFromJson(search.value(QStringLiteral("applications")));
    settings.search.windows = providerFromJson(search.value(QStringLiteral("windows")));
    settings.search.calculator = providerFromJson(search.value(QStringLiteral("calculator")));
    settings.search.files = providerFromJson(search.value(QStringLiteral("files")));

    const QJsonObject scripts = json.value(QStringLiteral("scripts")).toObject();
    settings.scriptsDirectory = scripts.value(QStringLiteral("directory"))
                                    .toString(settings.scriptsDirectory);
    if (scripts.contains(QStringLiteral("timeout_ms"))) {
        const qint64 timeout = scripts.value(QStringLiteral("timeout_ms")).toInteger();
        if (timeout > 0) {
            // Timeouts are handed to QProcess/QElapsedTimer as int.
            settings.scriptTimeoutMs = static_cast<uint32_t>(
                qMin<qint64>(timeout, std::numeric_limits<int>::max()));
        }
    }

    const QJsonObject files = json.value(QStringLiteral("files")).toObject();
    settings.files.includeHidden = files.value(QStringLiteral("include_hidden"))
                                       .toBool(settings.files.includeHidden);
    settings.files.maxDepth = files.value(QStringLiteral("max_depth"))
                                  .toInt(settings.files.maxDepth);
    settings.files.fileManager = files.value(QStringLiteral("file_manager"))
                                     .toString(settings.files.fileManager);
    settings.files.fileEditor = files.value(QStringLiteral("file_editor"))
                                    .toString(settings.files.fileEditor);
    settings.files.openDocsInManager = files.value(QStringLiteral("open_docs_in_manager"))
                                           .toBool(settings.files.openDocsInManager);

    return settings;
}

} // namespace vanta
