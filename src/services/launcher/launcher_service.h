#pragma once

#include "core/apps/app_index.h"
#include "core/apps/icon_resolver.h"
#include "core/fs/file_index.h"
#include "core/history/history_store.h"
#include "core/ipc/service_base.h"
#include "core/launch/launcher.h"
#include "core/query/latency_metrics.h"
#include "core/query/query_engine.h"
#include "core/shared/settings.h"
#include "core/windows/window_snapshot.h"

#include <QTimer>
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace vanta {

class DebouncedWatcher;

class LauncherService : public ServiceBase {
    Q_OBJECT
public:
    struct Options {
        QString configFilePath;
        QString historyFilePath;
        QString iconCacheFilePath;
        QString themesDir;
        QString homeDir;
        QStringList desktopDirs;
        bool queryWindows = true;
        bool watchFilesystem = true;

        static Options fromEnvironment();
    };

    static constexpr int kDesktopDebounceMs = 1000;
    static constexpr int kDesktopSettleMs = 200;
    static constexpr int kScriptsDebounceMs = 600;
    static constexpr int kConfigDebounceMs = 250;
    static constexpr int kHistoryFlushTimerMs = 2000;

    explicit LauncherService(Options options = Options::fromEnvironment(), QObject* parent = nullptr);
    ~LauncherService() override;

    // Loads settings and history, builds every index and arms the watchers.
    // Blocks until the initial scans are done.
    void initialize();

protected:
    QJsonObject handleRequest(const QJsonObject& request) override;
    bool handleAsyncRequest(const QJsonObject& request, SocketServer::ReplyCallback reply) override;
    void onShutdown() override;

private:
    QJsonObject handleSearch(uint64_t id, const QJsonObject& params);
    QJsonObject handleGetSuggestions(uint64_t id);
    QJsonObject handleLaunch(uint64_t id, const QJsonObject& params);
    QJsonObject handleGetApps(uint64_t id);
    QJsonObject handleGetScripts(uint64_t id);
    QJsonObject handleGetSearchDiagnostics(uint64_t id);
    QJsonObject handleGetConfig(uint64_t id);
    QJsonObject handleSaveConfig(uint64_t id, const QJsonObject& params);
    QJsonObject handleOpenPath(uint64_t id, const QJsonObject& params, const QString& method);

    void startRescanApps(uint64_t id, SocketServer::ReplyCallback reply);
    void startExecuteScript(uint64_t id, const QJsonObject& params, SocketServer::ReplyCallback reply);
    void startInstall(uint64_t id, const QString& source, SocketServer::ReplyCallback reply);

    Settings currentSettings() const;
    QString scriptsDirectory() const;
    void applySettings(const Settings& updated);
    void reloadConfig();
    void refreshScripts();
    void rescanAppsAndNotify();
    void rebuildFileIndexInBackground(const FilesSettings& files);
    void configureWatchers();

    // Runs `task` on a worker thread owned by the service.
    void runInBackground(std::function<void()> task);
    void reapWorkers(bool all);

    // Queues a notification broadcast onto the service thread.
    void postNotification(const QString& method, const QJsonObject& params);

    Options m_options;
    IconResolver m_iconResolver;
    AppIndex m_appIndex;
    FileIndex m_fileIndex;
    WindowSnapshot m_windows;
    HistoryStore m_history;
    SearchMetrics m_metrics;
    Launcher m_launcher;
    std::unique_ptr<QueryEngine> m_engine;

    mutable std::mutex m_settingsMutex;
    Settings m_settings;

    mutable std::mutex m_scriptsMutex;
    std::vector<ScriptEntry> m_scripts;

    DebouncedWatcher* m_desktopWatcher = nullptr;
    DebouncedWatcher* m_scriptsWatcher = nullptr;
    DebouncedWatcher* m_configWatcher = nullptr;
    QTimer m_historyTimer;

    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };
    std::mutex m_workersMutex;
    std::vector<Worker> m_workers;
    std::atomic<bool> m_stopping{false};
};

} // namespace vanta
