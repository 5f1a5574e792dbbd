#include "core/shared/search_result.h"

namespace vanta {

QString resultSourceToString(ResultSource source)
{
    switch (source) {
    case ResultSource::Application: return QStringLiteral("Application");
    case ResultSource::Window:      return QStringLiteral("Window");
    case ResultSource::Calculator:  return QStringLiteral("Calculator");
    case ResultSource::File:        return QStringLiteral("File");
    }
    return QStringLiteral("Application");
}

QJsonObject searchResultToJson(const SearchResult& result)
{
    QJsonObject json;
    json[QStringLiteral("title")] = result.title;
    json[QStringLiteral("subtitle")] = result.subtitle.has_value()
        ? QJsonValue(result.subtitle.value()) : QJsonValue(QJsonValue::Null);
    json[QStringLiteral("icon")] = result.icon.has_value()
        ? QJsonValue(result.icon.value()) : QJsonValue(QJsonValue::Null);
    json[QStringLiteral("exec")] = result.exec;
    json[QStringLiteral("score")] = static_cast<qint64>(result.score);

    QJsonArray indices;
    for (uint32_t index : result.matchIndices) {
        indices.append(static_cast<qint64>(index));
    }
    json[QStringLiteral("match_indices")] = indices;
    json[QStringLiteral("source")] = resultSourceToString(result.source);

    if (result.actions.empty()) {
        json[QStringLiteral("actions")] = QJsonValue(QJsonValue::Null);
    } else {
        QJsonArray actions;
        for (const ResultAction& action : result.actions) {
            QJsonObject obj;
            obj[QStringLiteral("label")] = action.label;
            obj[QStringLiteral("exec")] = action.exec;
            actions.append(obj);
        }
        json[QStringLiteral("actions")] = actions;
    }
    return json;
}

QJsonArray searchResultsToJson(const std::vector<SearchResult>& results)
{
    QJsonArray array;
    for (const SearchResult& result : results) {
        array.append(searchResultToJson(result));
    }
    return array;
}

} // namespace vanta
