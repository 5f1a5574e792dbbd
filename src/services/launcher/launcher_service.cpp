#include "launcher_service.h"
#include "core/fs/debounced_watcher.h"
#include "core/ipc/message.h"
#include "core/scripts/script_installer.h"
#include "core/scripts/script_runner.h"
#include "core/shared/logging.h"
#include "core/shared/paths.h"
#include "core/shared/settings_manager.h"

#include <QFileInfo>
#include <QJsonArray>
#include <QPointer>

namespace vanta {

namespace {

IconResolver::Options iconOptionsFor(const LauncherService::Options& options)
{
    IconResolver::Options iconOptions;
    iconOptions.cacheFilePath = options.iconCacheFilePath;
    iconOptions.iconBaseDirs = IconResolver::defaultIconBaseDirs();
    iconOptions.pixmapDirs = IconResolver::defaultPixmapDirs();
    return iconOptions;
}

std::vector<std::unique_ptr<WindowSource>> windowSourcesFor(const LauncherService::Options& options)
{
    if (!options.queryWindows) {
        return {};
    }
    return WindowSnapshot::defaultSources();
}

QJsonArray scriptsToJson(const std::vector<ScriptEntry>& scripts)
{
    QJsonArray array;
    for (const ScriptEntry& script : scripts) {
        array.append(scriptEntryToJson(script));
    }
    return array;
}

IpcErrorCode errorCodeFor(ScriptResult::Status status)
{
    switch (status) {
    case ScriptResult::Status::NotFound:         return IpcErrorCode::NotFound;
    case ScriptResult::Status::InvalidArguments: return IpcErrorCode::InvalidParams;
    case ScriptResult::Status::Timeout:          return IpcErrorCode::Timeout;
    default:                                     return IpcErrorCode::ScriptFailed;
    }
}

IpcErrorCode errorCodeFor(LaunchResult::Status status)
{
    switch (status) {
    case LaunchResult::Status::NotFound:       return IpcErrorCode::NotFound;
    case LaunchResult::Status::InvalidCommand: return IpcErrorCode::InvalidParams;
    case LaunchResult::Status::Unsupported:    return IpcErrorCode::Unsupported;
    default:                                   return IpcErrorCode::InternalError;
    }
}

IpcErrorCode errorCodeFor(InstallResult::Status status)
{
    switch (status) {
    case InstallResult::Status::NotFound:    return IpcErrorCode::NotFound;
    case InstallResult::Status::Unsupported: return IpcErrorCode::Unsupported;
    default:                                 return IpcErrorCode::InternalError;
    }
}

QJsonObject launchResponse(uint64_t id, const LaunchResult& launched)
{
    if (!launched.ok()) {
        return IpcMessage::makeError(id, errorCodeFor(launched.status), launched.errorMessage);
    }
    QJsonObject result;
    result[QStringLiteral("launched")] = launched.status == LaunchResult::Status::Launched;
    if (launched.status == LaunchResult::Status::Filled) {
        result[QStringLiteral("fillQuery")] = launched.fillQuery;
    }
    return IpcMessage::makeResponse(id, result);
}

const QString kInstallPrefix = QStringLiteral("install:");

} // namespace

LauncherService::Options LauncherService::Options::fromEnvironment()
{
    Options options;
    options.configFilePath = Paths::configFilePath();
    options.historyFilePath = Paths::historyFilePath();
    options.iconCacheFilePath = Paths::iconCacheFilePath();
    options.themesDir = Paths::themesDir();
    options.homeDir = Paths::homeDir();
    options.desktopDirs = AppIndex::defaultDesktopDirs();
    return options;
}

LauncherService::LauncherService(Options options, QObject* parent)
    : ServiceBase(QStringLiteral("launcher"), parent)
    , m_options(std::move(options))
    , m_iconResolver(iconOptionsFor(m_options))
    , m_appIndex(m_options.desktopDirs, &m_iconResolver)
    , m_fileIndex(m_options.homeDir)
    , m_windows(windowSourcesFor(m_options))
    , m_history(m_options.historyFilePath)
    , m_engine(std::make_unique<QueryEngine>(m_appIndex, m_fileIndex, m_windows,
                                             m_history, m_metrics, m_options.homeDir))
{
    m_historyTimer.setInterval(kHistoryFlushTimerMs);
    connect(&m_historyTimer, &QTimer::timeout, this, [this]() {
        m_history.flushIfDue();
    });
    LOG_INFO(vCore, "LauncherService created");
}

LauncherService::~LauncherService()
{
    m_stopping.store(true);
    reapWorkers(true);
}

void LauncherService::initialize()
{
    {
        const Settings loaded = SettingsManager::loadOrCreateDefault(m_options.configFilePath);
        std::lock_guard<std::mutex> lock(m_settingsMutex);
        m_settings = loaded;
    }

    m_history.load();
    m_iconResolver.loadCache();

    const int appCount = m_appIndex.rescan();
    LOG_INFO(vApps, "Indexed %d applications", appCount);

    refreshScripts();
    rebuildFileIndexInBackground(currentSettings().files);

    if (m_options.watchFilesystem) {
        configureWatchers();
    }
    m_historyTimer.start();
}

Settings LauncherService::currentSettings() const
{
    std::lock_guard<std::mutex> lock(m_settingsMutex);
    return m_settings;
}

QString LauncherService::scriptsDirectory() const
{
    return Paths::expandTilde(currentSettings().scriptsDirectory);
}

void LauncherService::configureWatchers()
{
    if (!m_desktopWatcher) {
        m_desktopWatcher = new DebouncedWatcher(kDesktopDebounceMs, kDesktopSettleMs, this);
        m_desktopWatcher->setNameFilters({QStringLiteral("*.desktop")});
        connect(m_desktopWatcher, &DebouncedWatcher::triggered, this, [this]() {
            runInBackground([this]() { rescanAppsAndNotify(); });
        });
    }
    m_desktopWatcher->setPaths(m_appIndex.existingDirectories());

    if (!m_scriptsWatcher) {
        m_scriptsWatcher = new DebouncedWatcher(kScriptsDebounceMs, 0, this);
        connect(m_scriptsWatcher, &DebouncedWatcher::triggered, this, [this]() {
            runInBackground([this]() { refreshScripts(); });
        });
    }
    m_scriptsWatcher->setPaths({scriptsDirectory()});

    if (!m_configWatcher) {
        m_configWatcher = new DebouncedWatcher(kConfigDebounceMs, 0, this);
        connect(m_configWatcher, &DebouncedWatcher::triggered, this, &LauncherService::reloadConfig);
    }
    m_configWatcher->setPaths({m_options.configFilePath});
}

void LauncherService::refreshScripts()
{
    const ScriptRunner runner(scriptsDirectory());
    std::vector<ScriptEntry> scripts = runner.discover();
    const QJsonArray json = scriptsToJson(scripts);
    {
        std::lock_guard<std::mutex> lock(m_scriptsMutex);
        m_scripts = std::move(scripts);
    }

    QJsonObject params;
    params[QStringLiteral("scripts")] = json;
    postNotification(QStringLiteral("scriptsChanged"), params);
}

void LauncherService::rescanAppsAndNotify()
{
    const int count = m_appIndex.rescan();
    LOG_INFO(vApps, "Desktop entries re-scanned: %d apps", count);

    QJsonObject params;
    params[QStringLiteral("count")] = count;
    postNotification(QStringLiteral("appsChanged"), params);
}

void LauncherService::rebuildFileIndexInBackground(const FilesSettings& files)
{
    runInBackground([this, files]() {
        m_fileIndex.rebuild(files);
    });
}

void LauncherService::reloadConfig()
{
    const std::optional<Settings> loaded = SettingsManager::load(m_options.configFilePath);
    if (!loaded) {
        LOG_WARN(vCore, "Config reload skipped: %s is missing or invalid",
                 qUtf8Printable(m_options.configFilePath));
        return;
    }
    applySettings(*loaded);
}

void LauncherService::applySettings(const Settings& updated)
{
    Settings previous;
    {
        std::lock_guard<std::mutex> lock(m_settingsMutex);
        previous = m_settings;
        m_settings = updated;
    }

    const QJsonObject updatedJson = SettingsManager::toJson(updated);
    if (SettingsManager::toJson(previous) == updatedJson) {
        return;
    }

    LOG_INFO(vCore, "Configuration changed");
    if (previous.files != updated.files) {
        rebuildFileIndexInBackground(updated.files);
    }
    if (previous.scriptsDirectory != updated.scriptsDirectory) {
        if (m_scriptsWatcher) {
            m_scriptsWatcher->setPaths({scriptsDirectory()});
        }
        runInBackground([this]() { refreshScripts(); });
    }

    QJsonObject params;
    params[QStringLiteral("config")] = updatedJson;
    sendNotification(QStringLiteral("configChanged"), params);
}

void LauncherService::runInBackground(std::function<void()> task)
{
    if (m_stopping.load()) {
        return;
    }
    reapWorkers(false);

    auto done = std::make_shared<std::atomic<bool>>(false);
    std::lock_guard<std::mutex> lock(m_workersMutex);
    m_workers.push_back(Worker{std::thread([task = std::move(task), done]() {
        task();
        done->store(true);
    }), done});
}

void LauncherService::reapWorkers(bool all)
{
    std::vector<Worker> finished;
    {
        std::lock_guard<std::mutex> lock(m_workersMutex);
        auto it = m_workers.begin();
        while (it != m_workers.end()) {
            if (all || it->done->load()) {
                finished.push_back(std::move(*it));
                it = m_workers.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (Worker& worker : finished) {
        if (worker.thread.joinable()) {
            worker.thread.join();
        }
    }
}

void LauncherService::postNotification(const QString& method, const QJsonObject& params)
{
    QPointer<LauncherService> self(this);
    QMetaObject::invokeMethod(this, [self, method, params]() {
        if (self) {
            self->sendNotification(method, params);
        }
    }, Qt::QueuedConnection);
}

void LauncherService::onShutdown()
{
    m_stopping.store(true);
    m_historyTimer.stop();
    reapWorkers(true);
    m_history.flush();
    m_iconResolver.saveIfChanged();
    LOG_INFO(vCore, "LauncherService stopped");
}

QJsonObject LauncherService::handleRequest(const QJsonObject& request)
{
    const QString method = request.value(QStringLiteral("method")).toString();
    const uint64_t id = IpcMessage::requestId(request);
    const QJsonObject params = IpcMessage::requestParams(request);

    if (method == QLatin1String("search"))               return handleSearch(id, params);
    if (method == QLatin1String("getSuggestions"))       return handleGetSuggestions(id);
    if (method == QLatin1String("launch"))               return handleLaunch(id, params);
    if (method == QLatin1String("getApps"))              return handleGetApps(id);
    if (method == QLatin1String("getScripts"))           return handleGetScripts(id);
    if (method == QLatin1String("getSearchDiagnostics")) return handleGetSearchDiagnostics(id);
    if (method == QLatin1String("getConfig"))            return handleGetConfig(id);
    if (method == QLatin1String("saveConfig"))           return handleSaveConfig(id, params);
    if (method == QLatin1String("openPath")
        || method == QLatin1String("revealInFileManager")
        || method == QLatin1String("openWithEditor")) {
        return handleOpenPath(id, params, method);
    }

    return ServiceBase::handleRequest(request);
}

bool LauncherService::handleAsyncRequest(const QJsonObject& request, SocketServer::ReplyCallback reply)
{
    const QString method = request.value(QStringLiteral("method")).toString();
    const uint64_t id = IpcMessage::requestId(request);
    const QJsonObject params = IpcMessage::requestParams(request);

    if (method == QLatin1String("executeScript")) {
        startExecuteScript(id, params, std::move(reply));
        return true;
    }
    if (method == QLatin1String("installScript")) {
        const QJsonValue source = params.value(QStringLiteral("source"));
        if (!source.isString() || source.toString().trimmed().isEmpty()) {
            reply(IpcMessage::makeError(id, IpcErrorCode::InvalidParams,
                                        QStringLiteral("Missing 'source' parameter")));
            return true;
        }
        startInstall(id, source.toString(), std::move(reply));
        return true;
    }
    if (method == QLatin1String("rescanApps")) {
        startRescanApps(id, std::move(reply));
        return true;
    }
    if (method == QLatin1String("launch")) {
        const QString exec = params.value(QStringLiteral("exec")).toString();
        if (!exec.startsWith(kInstallPrefix)) {
            return false;
        }
        ScopedLatency latency(&m_metrics.launch);
        m_history.increment(exec);
        startInstall(id, exec.mid(kInstallPrefix.size()), std::move(reply));
        return true;
    }
    return false;
}

QJsonObject LauncherService::handleSearch(uint64_t id, const QJsonObject& params)
{
    const QJsonValue query = params.value(QStringLiteral("query"));
    if (!query.isUndefined() && !query.isString()) {
        return IpcMessage::makeError(id, IpcErrorCode::InvalidParams,
                                     QStringLiteral("'query' must be a string"));
    }
    const std::vector<SearchResult> results = m_engine->resolve(query.toString(), currentSettings());
    return IpcMessage::makeResponse(id, searchResultsToJson(results));
}

QJsonObject LauncherService::handleGetSuggestions(uint64_t id)
{
    return IpcMessage::makeResponse(id, searchResultsToJson(m_engine->suggestions(currentSettings())));
}

QJsonObject LauncherService::handleLaunch(uint64_t id, const QJsonObject& params)
{
    const QJsonValue exec = params.value(QStringLiteral("exec"));
    if (!exec.isString() || exec.toString().isEmpty()) {
        return IpcMessage::makeError(id, IpcErrorCode::InvalidParams,
                                     QStringLiteral("Missing 'exec' parameter"));
    }

    ScopedLatency latency(&m_metrics.launch);
    m_history.increment(exec.toString());
    const LaunchResult launched = m_launcher.launch(exec.toString());
    if (!launched.ok()) {
        LOG_WARN(vCore, "Failed to launch: %s", qUtf8Printable(launched.errorMessage));
    }
    return launchResponse(id, launched);
}

QJsonObject LauncherService::handleGetApps(uint64_t id)
{
    const AppIndex::Snapshot apps = m_appIndex.snapshot();
    QJsonArray array;
    for (const AppEntry& app : *apps) {
        array.append(appEntryToJson(app));
    }
    return IpcMessage::makeResponse(id, array);
}

QJsonObject LauncherService::handleGetScripts(uint64_t id)
{
    std::lock_guard<std::mutex> lock(m_scriptsMutex);
    return IpcMessage::makeResponse(id, scriptsToJson(m_scripts));
}

QJsonObject LauncherService::handleGetSearchDiagnostics(uint64_t id)
{
    return IpcMessage::makeResponse(id, m_metrics.toJson());
}

QJsonObject LauncherService::handleGetConfig(uint64_t id)
{
    return IpcMessage::makeResponse(id, SettingsManager::toJson(currentSettings()));
}

QJsonObject LauncherService::handleSaveConfig(uint64_t id, const QJsonObject& params)
{
    const QJsonValue config = params.value(QStringLiteral("config"));
    if (!config.isObject()) {
        return IpcMessage::makeError(id, IpcErrorCode::InvalidParams,
                                     QStringLiteral("Missing 'config' object"));
    }

    const Settings updated = SettingsManager::fromJson(config.toObject());
    if (!SettingsManager::save(updated, m_options.configFilePath)) {
        return IpcMessage::makeError(id, IpcErrorCode::InternalError,
                                     QStringLiteral("Failed to save config"));
    }
    applySettings(updated);

    QJsonObject result;
    result[QStringLiteral("saved")] = true;
    return IpcMessage::makeResponse(id, result);
}

QJsonObject LauncherService::handleOpenPath(uint64_t id, const QJsonObject& params, const QString& method)
{
    const QString path = params.value(QStringLiteral("path")).toString();
    if (path.isEmpty()) {
        return IpcMessage::makeError(id, IpcErrorCode::InvalidParams,
                                     QStringLiteral("Missing 'path' parameter"));
    }

    const FilesSettings files = currentSettings().files;
    const AppIndex::Snapshot apps = m_appIndex.snapshot();

    LaunchResult opened;
    if (method == QLatin1String("revealInFileManager")) {
        opened = m_launcher.revealInFileManager(path, files, *apps);
    } else if (method == QLatin1String("openWithEditor")) {
        opened = m_launcher.openWithEditor(path, files, *apps);
    } else {
        opened = m_launcher.openPath(path, files, *apps);
    }
    return launchResponse(id, opened);
}

void LauncherService::startRescanApps(uint64_t id, SocketServer::ReplyCallback reply)
{
    runInBackground([this, id, reply = std::move(reply)]() {
        const int count = m_appIndex.rescan();
        reply(IpcMessage::makeResponse(id, count));

        QJsonObject params;
        params[QStringLiteral("count")] = count;
        postNotification(QStringLiteral("appsChanged"), params);
    });
}

void LauncherService::startExecuteScript(uint64_t id, const QJsonObject& params,
                                         SocketServer::ReplyCallback reply)
{
    const QString keyword = params.value(QStringLiteral("keyword")).toString();
    if (keyword.isEmpty()) {
        reply(IpcMessage::makeError(id, IpcErrorCode::InvalidParams,
                                    QStringLiteral("Missing 'keyword' parameter")));
        return;
    }
    const QString args = params.value(QStringLiteral("args")).toString();
    const Settings settings = currentSettings();
    const QString dir = Paths::expandTilde(settings.scriptsDirectory);
    const int timeoutMs = static_cast<int>(settings.scriptTimeoutMs);

    runInBackground([id, keyword, args, dir, timeoutMs, reply = std::move(reply)]() {
        const ScriptRunner runner(dir);
        const ScriptResult result = runner.execute(keyword, args, timeoutMs);
        if (!result.ok()) {
            LOG_WARN(vScripts, "%s", qUtf8Printable(result.errorMessage));
            reply(IpcMessage::makeError(id, errorCodeFor(result.status), result.errorMessage));
            return;
        }
        reply(IpcMessage::makeResponse(id, scriptOutputToJson(*result.output)));
    });
}

void LauncherService::startInstall(uint64_t id, const QString& source, SocketServer::ReplyCallback reply)
{
    const QString scriptsDir = scriptsDirectory();
    const QString themesDir = m_options.themesDir;

    runInBackground([this, id, source, scriptsDir, themesDir, reply = std::move(reply)]() {
        LocalScriptInstaller installer(scriptsDir, themesDir);
        const InstallResult installed = installer.install(source);
        if (!installed.ok()) {
            LOG_WARN(vScripts, "Install failed: %s", qUtf8Printable(installed.errorMessage));
            reply(IpcMessage::makeError(id, errorCodeFor(installed.status), installed.errorMessage));
            return;
        }

        QJsonObject result;
        result[QStringLiteral("installed")] = true;
        result[QStringLiteral("path")] = installed.installedPath;
        reply(IpcMessage::makeResponse(id, result));

        refreshScripts();
        m_fileIndex.rebuild(currentSettings().files);
    });
}

} // namespace vanta
