#pragma once

#include "core/query/latency_metrics.h"
#include "core/shared/search_result.h"
#include "core/shared/settings.h"
#include "core/shared/types.h"
#include <vector>

namespace vanta {

class AppIndex;
class FileIndex;
class HistoryStore;
class WindowSnapshot;

// Turns a typed query into one ranked result list.
//
// Providers contribute in a fixed order: applications, open windows,
// calculator. A query starting with "/" or "~/" is a file query and returns
// file results only. "install <arg>" adds path completions and a top
// "Install ..." action. Everything is merged with a stable sort on score.
//
// The engine only reads the held snapshots; it never scans the disk for the
// regular providers.
class QueryEngine {
public:
    static constexpr uint32_t kWindowBaseScore = 950000;
    static constexpr uint32_t kCalculatorBaseScore = 900000;
    static constexpr uint32_t kSuggestionBaseScore = 100;
    static constexpr uint32_t kInstallActionScore = 1000000;
    static constexpr uint32_t kInstallDirScore = 900000;
    static constexpr uint32_t kInstallFileScore = 800000;
    static constexpr int kFileQueryLimit = 20;
    static constexpr int kInstallLookupLimit = 15;

    QueryEngine(AppIndex& apps,
                FileIndex& files,
                WindowSnapshot& windows,
                HistoryStore& history,
                SearchMetrics& metrics,
                QString homeDir);

    std::vector<SearchResult> resolve(const QString& query, const Settings& settings);

    // Applications ranked by usage count, ignoring any query text.
    std::vector<SearchResult> suggestions(const Settings& settings);

    static bool isFileQuery(const QString& query);

private:
    void appendWindowResults(const QString& query, const std::vector<AppEntry>& apps,
                             const ProviderSettings& provider,
                             std::vector<SearchResult>& results);
    void appendCalculatorResult(const QString& query, const ProviderSettings& provider,
                                std::vector<SearchResult>& results) const;
    void appendInstallResults(const QString& argument, std::vector<SearchResult>& results) const;
    void appendLocalPathCompletions(const QString& argument, std::vector<SearchResult>& results) const;
    void appendIndexedInstallCandidates(const QString& argument, std::vector<SearchResult>& results) const;

    static std::optional<QString> iconForWindow(const WindowEntry& window,
                                                const std::vector<AppEntry>& apps);

    AppIndex& m_apps;
    FileIndex& m_files;
    WindowSnapshot& m_windows;
    HistoryStore& m_history;
    SearchMetrics& m_metrics;
    QString m_homeDir;
};

} // namespace vanta
