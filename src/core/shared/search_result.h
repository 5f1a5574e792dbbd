#pragma once

#include <QJsonArray>
#include <QJsonObject>
#include <QString>
#include <cstdint>
#include <optional>
#include <vector>

namespace vanta {

enum class ResultSource {
    Application,
    Window,
    Calculator,
    File,
};

QString resultSourceToString(ResultSource source);

// Secondary action offered next to a result (e.g. "Open Containing Folder").
struct ResultAction {
    QString label;
    QString exec;
};

// Unified record returned by every provider.
//
// `exec` is an action descriptor: "focus:<addr>", "copy:<value>",
// "install:<source>", "fill:<query>", or a literal command line / path.
struct SearchResult {
    QString title;
    std::optional<QString> subtitle;
    std::optional<QString> icon;
    QString exec;
    uint32_t score = 0;
    std::vector<uint32_t> matchIndices;
    ResultSource source = ResultSource::Application;
    std::vector<ResultAction> actions;
};

QJsonObject searchResultToJson(const SearchResult& result);
QJsonArray searchResultsToJson(const std::vector<SearchResult>& results);

} // namespace vanta
