#pragma once

#include "core/shared/search_result.h"
#include "core/shared/types.h"
#include <QHash>
#include <vector>

namespace vanta {

// Fuzzy application search.
//
// Fields are tried in priority order and only the first matching field
// scores: name (raw score), generic name (raw - 10), comment (raw - 20).
// Usage adds min(count * 5, 200). Results are stable-sorted by score and
// truncated to maxResults.
class AppMatcher {
public:
    static constexpr uint32_t kGenericNamePenalty = 10;
    static constexpr uint32_t kCommentPenalty = 20;
    static constexpr uint32_t kUsageBonusPerLaunch = 5;
    static constexpr uint32_t kMaxUsageBonus = 200;

    static std::vector<SearchResult> search(const QString& query,
                                            const std::vector<AppEntry>& apps,
                                            int maxResults,
                                            const QHash<QString, uint32_t>& usage);

    static uint32_t usageBonus(uint32_t usageCount);

    static SearchResult toResult(const AppEntry& app, uint32_t score);
};

} // namespace vanta
