#include "core/shared/types.h"

#include <QJsonArray>

namespace vanta {

namespace {

void insertOptional(QJsonObject& json, const QString& key,
                    const std::optional<QString>& value)
{
    if (value.has_value()) {
        json.insert(key, value.value());
    }
}

} // namespace

QString scriptActionTypeToString(ScriptActionType type)
{
    switch (type) {
    case ScriptActionType::Copy: return QStringLiteral("copy");
    case ScriptActionType::Open: return QStringLiteral("open");
    case ScriptActionType::Run:  return QStringLiteral("run");
    }
    return QStringLiteral("copy");
}

std::optional<ScriptActionType> scriptActionTypeFromString(const QString& str)
{
    if (str == QLatin1String("copy")) return ScriptActionType::Copy;
    if (str == QLatin1String("open")) return ScriptActionType::Open;
    if (str == QLatin1String("run"))  return ScriptActionType::Run;
    return std::nullopt;
}

QString urgencyToString(Urgency urgency)
{
    switch (urgency) {
    case Urgency::Low:      return QStringLiteral("low");
    case Urgency::Normal:   return QStringLiteral("normal");
    case Urgency::Critical: return QStringLiteral("critical");
    }
    return QStringLiteral("normal");
}

std::optional<Urgency> urgencyFromString(const QString& str)
{
    if (str == QLatin1String("low"))      return Urgency::Low;
    if (str == QLatin1String("normal"))   return Urgency::Normal;
    if (str == QLatin1String("critical")) return Urgency::Critical;
    return std::nullopt;
}

QJsonObject appEntryToJson(const AppEntry& app)
{
    QJsonObject json;
    json.insert(QStringLiteral("name"), app.name);
    insertOptional(json, QStringLiteral("generic_name"), app.genericName);
    insertOptional(json, QStringLiteral("comment"), app.comment);
    json.insert(QStringLiteral("exec"), app.exec);
    insertOptional(json, QStringLiteral("icon"), app.icon);
    json.insert(QStringLiteral("categories"), QJsonArray::fromStringList(app.categories));
    json.insert(QStringLiteral("terminal"), app.terminal);
    insertOptional(json, QStringLiteral("startup_wm_class"), app.startupWmClass);
    json.insert(QStringLiteral("desktop_file_path"), app.sourcePath);
    return json;
}

QJsonObject scriptEntryToJson(const ScriptEntry& script)
{
    QJsonObject json;
    json.insert(QStringLiteral("keyword"), script.keyword);
    insertOptional(json, QStringLiteral("name"), script.name);
    insertOptional(json, QStringLiteral("description"), script.description);
    insertOptional(json, QStringLiteral("icon"), script.icon);
    json.insert(QStringLiteral("path"), script.path);
    return json;
}

QJsonObject scriptOutputToJson(const ScriptOutput& output)
{
    QJsonArray items;
    for (const ScriptItem& item : output.items) {
        QJsonObject obj;
        obj.insert(QStringLiteral("title"), item.title);
        insertOptional(obj, QStringLiteral("subtitle"), item.subtitle);
        insertOptional(obj, QStringLiteral("icon"), item.icon);
        if (item.action.has_value()) {
            QJsonObject action;
            action.insert(QStringLiteral("type"), scriptActionTypeToString(item.action->type));
            action.insert(QStringLiteral("value"), item.action->value);
            obj.insert(QStringLiteral("action"), action);
        }
        insertOptional(obj, QStringLiteral("badge"), item.badge);
        obj.insert(QStringLiteral("urgency"), urgencyToString(item.urgency));
        items.append(obj);
    }

    QJsonObject json;
    json.insert(QStringLiteral("items"), items);
    return json;
}

} // namespace vanta
