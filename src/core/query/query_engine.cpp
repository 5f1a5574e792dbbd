#include "core/query/query_engine.h"
#include "core/apps/app_index.h"
#include "core/fs/file_index.h"
#include "core/history/history_store.h"
#include "core/query/calculator.h"
#include "core/ranking/app_matcher.h"
#include "core/ranking/weighted_score.h"
#include "core/shared/logging.h"
#include "core/windows/window_snapshot.h"

#include <QDir>
#include <QFileInfo>

#include <algorithm>
#include <utility>

namespace vanta {

namespace {

const QString kInstallPrefix = QStringLiteral("install ");

void sortByScore(std::vector<SearchResult>& results)
{
    std::stable_sort(results.begin(), results.end(),
                     [](const SearchResult& a, const SearchResult& b) { return a.score > b.score; });
}

QString firstToken(const QString& command)
{
    return command.simplified().section(QLatin1Char(' '), 0, 0);
}

} // namespace

QueryEngine::QueryEngine(AppIndex& apps,
                         FileIndex& files,
                         WindowSnapshot& windows,
                         HistoryStore& history,
                         SearchMetrics& metrics,
                         QString homeDir)
    : m_apps(apps)
    , m_files(files)
    , m_windows(windows)
    , m_history(history)
    , m_metrics(metrics)
    , m_homeDir(QDir::cleanPath(std::move(homeDir)))
{
}

bool QueryEngine::isFileQuery(const QString& query)
{
    return query.startsWith(QLatin1Char('/')) || query.startsWith(QLatin1String("~/"));
}

std::vector<SearchResult> QueryEngine::resolve(const QString& query, const Settings& settings)
{
    ScopedLatency latency(&m_metrics.search);
    const SearchSettings& search = settings.search;

    if (isFileQuery(query)) {
        if (!search.files.enabled) {
            return {};
        }
        const FileIndex::Snapshot files = m_files.snapshot();
        std::vector<SearchResult> results = FileIndex::search(*files, query, kFileQueryLimit);
        for (SearchResult& result : results) {
            result.score = weightedScore(result.score, search.files.weight);
        }
        return results;
    }

    const AppIndex::Snapshot apps = m_apps.snapshot();
    std::vector<SearchResult> results;

    if (search.applications.enabled) {
        results = AppMatcher::search(query, *apps, settings.maxResults, m_history.usageMap());
        for (SearchResult& result : results) {
            result.score = weightedScore(result.score, search.applications.weight);
        }
    }

    if (search.windows.enabled) {
        appendWindowResults(query, *apps, search.windows, results);
    }

    if (search.calculator.enabled) {
        appendCalculatorResult(query, search.calculator, results);
    }

    if (query.startsWith(kInstallPrefix)) {
        QString argument = query;
        while (argument.startsWith(kInstallPrefix)) {
            argument = argument.mid(kInstallPrefix.size());
        }
        appendInstallResults(argument.trimmed(), results);
    }

    sortByScore(results);
    return results;
}

std::vector<SearchResult> QueryEngine::suggestions(const Settings& settings)
{
    ScopedLatency latency(&m_metrics.suggestions);
    if (!settings.search.applications.enabled || settings.maxResults <= 0) {
        return {};
    }

    const AppIndex::Snapshot apps = m_apps.snapshot();
    const QHash<QString, uint32_t> usage = m_history.usageMap();

    std::vector<std::pair<const AppEntry*, uint32_t>> ranked;
    ranked.reserve(apps->size());
    for (const AppEntry& app : *apps) {
        ranked.emplace_back(&app, usage.value(app.exec, 0));
    }
    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const auto& a, const auto& b) { return a.second > b.second; });

    const uint32_t score = weightedScore(kSuggestionBaseScore, settings.search.applications.weight);
    std::vector<SearchResult> results;
    for (const auto& entry : ranked) {
        if (static_cast<int>(results.size()) >= settings.maxResults) {
            break;
        }
        results.push_back(AppMatcher::toResult(*entry.first, score));
    }
    return results;
}

void QueryEngine::appendWindowResults(const QString& query, const std::vector<AppEntry>& apps,
                                      const ProviderSettings& provider,
                                      std::vector<SearchResult>& results)
{
    const QString needle = query.toLower();
    const std::vector<WindowEntry> windows = m_windows.list();
    for (const WindowEntry& window : windows) {
        if (!window.title.toLower().contains(needle) && !window.windowClass.toLower().contains(needle)) {
            continue;
        }

        SearchResult result;
        result.title = window.title;
        result.subtitle = QStringLiteral("Switch to Window (Workspace %1)").arg(window.workspace);
        result.icon = iconForWindow(window, apps);
        result.exec = QStringLiteral("focus:") + window.address;
        result.score = weightedScore(kWindowBaseScore, provider.weight);
        result.source = ResultSource::Window;
        results.push_back(std::move(result));
    }
}

void QueryEngine::appendCalculatorResult(const QString& query, const ProviderSettings& provider,
                                         std::vector<SearchResult>& results) const
{
    const std::optional<double> value = Calculator::evaluate(query);
    if (!value) {
        return;
    }

    const QString text = Calculator::format(*value);
    SearchResult result;
    result.title = QStringLiteral("= ") + text;
    result.subtitle = QStringLiteral("Click to Copy");
    result.icon = QStringLiteral("calculator");
    result.exec = QStringLiteral("copy:") + text;
    result.score = weightedScore(kCalculatorBaseScore, provider.weight);
    result.source = ResultSource::Calculator;
    results.push_back(std::move(result));
}

void QueryEngine::appendInstallResults(const QString& argument, std::vector<SearchResult>& results) const
{
    if (isFileQuery(argument)) {
        appendLocalPathCompletions(argument, results);
    } else if (!argument.isEmpty() && !argument.contains(QLatin1String("github.com"))
               && !argument.startsWith(QLatin1String("http"))) {
        appendIndexedInstallCandidates(argument, results);
    }

    if (argument.isEmpty()) {
        return;
    }

    const QFileInfo local(argument);
    const bool isLocal = local.exists();

    SearchResult action;
    if (isLocal) {
        action.title = QStringLiteral("Install Local File: ") + local.fileName();
        action.subtitle = QStringLiteral("Press Enter to extract/copy this file directly into the Vanta Store");
    } else {
        action.title = QStringLiteral("Install Web Script: ") + argument;
        action.subtitle = QStringLiteral("Press Enter to download and install this script from GitHub");
    }
    action.icon = QStringLiteral("system-software-install");
    action.exec = QStringLiteral("install:") + argument;
    action.score = kInstallActionScore;
    action.source = ResultSource::Application;
    results.insert(results.begin(), std::move(action));
}

void QueryEngine::appendLocalPathCompletions(const QString& argument,
                                             std::vector<SearchResult>& results) const
{
    // Paths are anchored at the home directory: "~/x" and "/x" both mean
    // <home>/x unless the argument already spells out the home path.
    QString expanded;
    if (argument.startsWith(QLatin1String("~/"))) {
        expanded = m_homeDir + QLatin1Char('/') + argument.mid(2);
    } else if (argument.startsWith(m_homeDir)) {
        expanded = argument;
    } else {
        expanded = m_homeDir + QLatin1Char('/') + argument.mid(1);
    }

    QString dirToRead;
    QString prefix;
    if (expanded.endsWith(QLatin1Char('/')) && QFileInfo(expanded).isDir()) {
        dirToRead = expanded;
    } else {
        QString trimmedPath = expanded;
        while (trimmedPath.size() > 1 && trimmedPath.endsWith(QLatin1Char('/'))) {
            trimmedPath.chop(1);
        }
        const QFileInfo info(trimmedPath);
        dirToRead = info.path();
        prefix = info.fileName();
    }

    const QDir dir(dirToRead);
    if (!dir.exists()) {
        return;
    }

    const bool showHidden = prefix.startsWith(QLatin1Char('.'));
    const QFileInfoList entries = dir.entryInfoList(
        QDir::AllEntries | QDir::NoDotAndDotDot | QDir::Hidden | QDir::System, QDir::Name);

    for (const QFileInfo& entry : entries) {
        const QString name = entry.fileName();
        if (name.startsWith(QLatin1Char('.')) && !showHidden) {
            continue;
        }
        if (!name.startsWith(prefix, Qt::CaseInsensitive)) {
            continue;
        }

        const bool isDir = entry.isDir() && !entry.isSymLink();
        QString suggestion = dir.filePath(name);
        if (isDir) {
            suggestion += QLatin1Char('/');
        }

        QString display = suggestion;
        if (argument.startsWith(QLatin1String("~/")) && display.startsWith(m_homeDir)) {
            display.replace(0, m_homeDir.size(), QStringLiteral("~"));
        } else if (!argument.startsWith(m_homeDir) && display.startsWith(m_homeDir)) {
            display.remove(0, m_homeDir.size());
        }

        SearchResult result;
        result.title = name;
        result.subtitle = isDir ? dirToRead + QStringLiteral(" (Dir)") : dirToRead;
        result.icon = isDir ? QStringLiteral("dir") : QStringLiteral("file:") + suggestion;
        result.exec = isDir ? QStringLiteral("fill:install ") + display
                            : QStringLiteral("install:") + suggestion;
        result.score = isDir ? kInstallDirScore : kInstallFileScore;
        result.source = ResultSource::File;
        results.push_back(std::move(result));
    }
}

void QueryEngine::appendIndexedInstallCandidates(const QString& argument,
                                                 std::vector<SearchResult>& results) const
{
    const FileIndex::Snapshot files = m_files.snapshot();
    std::vector<SearchResult> candidates = FileIndex::search(*files, argument, kInstallLookupLimit);
    for (SearchResult& candidate : candidates) {
        const QString path = candidate.exec;
        const bool isDir = QFileInfo(path).isDir();
        const QString parent = QFileInfo(path).path();

        candidate.subtitle = isDir ? parent + QStringLiteral(" (Dir)") : parent;
        candidate.actions.clear();
        if (isDir) {
            candidate.exec = QStringLiteral("fill:install ") + path + QLatin1Char('/');
            candidate.score = kInstallDirScore;
        } else {
            candidate.exec = QStringLiteral("install:") + path;
            candidate.score = kInstallFileScore;
        }
        results.push_back(std::move(candidate));
    }
}

std::optional<QString> QueryEngine::iconForWindow(const WindowEntry& window,
                                                  const std::vector<AppEntry>& apps)
{
    if (window.windowClass.isEmpty()) {
        return std::nullopt;
    }

    for (const AppEntry& app : apps) {
        if (app.startupWmClass
            && app.startupWmClass->compare(window.windowClass, Qt::CaseInsensitive) == 0) {
            return app.icon;
        }
    }
    for (const AppEntry& app : apps) {
        if (firstToken(app.exec).compare(window.windowClass, Qt::CaseInsensitive) == 0) {
            return app.icon;
        }
    }
    for (const AppEntry& app : apps) {
        if (app.name.compare(window.windowClass, Qt::CaseInsensitive) == 0) {
            return app.icon;
        }
    }
    return std::nullopt;
}

} // namespace vanta
