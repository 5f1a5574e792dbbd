#include "core/ranking/app_matcher.h"
#include "core/ranking/fuzzy_matcher.h"
#include "core/shared/logging.h"

#include <QElapsedTimer>

#include <algorithm>

namespace vanta {

namespace {

uint32_t saturatingSub(uint32_t value, uint32_t penalty)
{
    return value > penalty ? value - penalty : 0;
}

} // namespace

uint32_t AppMatcher::usageBonus(uint32_t usageCount)
{
    const uint64_t bonus = static_cast<uint64_t>(usageCount) * kUsageBonusPerLaunch;
    return static_cast<uint32_t>(std::min<uint64_t>(bonus, kMaxUsageBonus));
}

SearchResult AppMatcher::toResult(const AppEntry& app, uint32_t score)
{
    SearchResult result;
    result.title = app.name;
    result.subtitle = app.genericName ? app.genericName : app.comment;
    result.icon = app.icon;
    result.exec = app.exec;
    result.score = score;
    result.source = ResultSource::Application;
    return result;
}

std::vector<SearchResult> AppMatcher::search(const QString& query,
                                             const std::vector<AppEntry>& apps,
                                             int maxResults,
                                             const QHash<QString, uint32_t>& usage)
{
    std::vector<SearchResult> results;
    if (query.isEmpty() || maxResults <= 0) {
        return results;
    }

    QElapsedTimer timer;
    timer.start();

    const FuzzyMatcher matcher(query);
    for (const AppEntry& app : apps) {
        const uint32_t bonus = usageBonus(usage.value(app.exec, 0));

        uint32_t penalty = 0;
        std::optional<FuzzyMatch> match = matcher.match(app.name);
        if (!match && app.genericName) {
            match = matcher.match(*app.genericName);
            penalty = kGenericNamePenalty;
        }
        if (!match && app.comment) {
            match = matcher.match(*app.comment);
            penalty = kCommentPenalty;
        }
        if (!match) {
            continue;
        }

        SearchResult result = toResult(app, saturatingSub(match->score, penalty) + bonus);
        result.matchIndices = std::move(match->indices);
        results.push_back(std::move(result));
    }

    std::stable_sort(results.begin(), results.end(),
                     [](const SearchResult& a, const SearchResult& b) { return a.score > b.score; });
    if (static_cast<int>(results.size()) > maxResults) {
        results.resize(static_cast<size_t>(maxResults));
    }

    LOG_DEBUG(vQuery, "App match '%s': %d result(s) in %lld us",
              qUtf8Printable(query), static_cast<int>(results.size()),
              static_cast<long long>(timer.nsecsElapsed() / 1000));
    return results;
}

} // namespace vanta
