#include "core/scripts/script_output.h"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>

namespace vanta {

namespace {

bool fail(QString* error, const QString& message)
{
    if (error) {
        *error = message;
    }
    return false;
}

// Optional string field; null counts as absent.
bool readOptionalString(const QJsonObject& object, const QString& key,
                        std::optional<QString>& out, QString* error)
{
    const QJsonValue value = object.value(key);
    if (value.isUndefined() || value.isNull()) {
        return true;
    }
    if (!value.isString()) {
        return fail(error, QStringLiteral("'%1' must be a string").arg(key));
    }
    out = value.toString();
    return true;
}

bool parseAction(const QJsonValue& value, std::optional<ScriptAction>& out, QString* error)
{
    if (value.isUndefined() || value.isNull()) {
        return true;
    }
    if (!value.isObject()) {
        return fail(error, QStringLiteral("'action' must be an object"));
    }

    const QJsonObject object = value.toObject();
    const QJsonValue type = object.value(QStringLiteral("type"));
    const std::optional<ScriptActionType> actionType =
        type.isString() ? scriptActionTypeFromString(type.toString()) : std::nullopt;
    if (!actionType) {
        return fail(error, QStringLiteral("'action.type' must be one of copy, open, run"));
    }

    const QJsonValue actionValue = object.value(QStringLiteral("value"));
    if (!actionValue.isString()) {
        return fail(error, QStringLiteral("'action.value' must be a string"));
    }

    ScriptAction action;
    action.type = *actionType;
    action.value = actionValue.toString();
    out = action;
    return true;
}

bool parseItem(const QJsonValue& value, int index, ScriptItem& item, QString* error)
{
    if (!value.isObject()) {
        return fail(error, QStringLiteral("items[%1] must be an object").arg(index));
    }
    const QJsonObject object = value.toObject();

    const QJsonValue title = object.value(QStringLiteral("title"));
    if (!title.isString()) {
        return fail(error, QStringLiteral("items[%1].title is required").arg(index));
    }
    item.title = title.toString();

    if (!readOptionalString(object, QStringLiteral("subtitle"), item.subtitle, error)
        || !readOptionalString(object, QStringLiteral("icon"), item.icon, error)
        || !readOptionalString(object, QStringLiteral("badge"), item.badge, error)
        || !parseAction(object.value(QStringLiteral("action")), item.action, error)) {
        return false;
    }

    const QJsonValue urgency = object.value(QStringLiteral("urgency"));
    if (!urgency.isUndefined()) {
        const std::optional<Urgency> parsed =
            urgency.isString() ? urgencyFromString(urgency.toString()) : std::nullopt;
        if (!parsed) {
            return fail(error, QStringLiteral("items[%1].urgency must be one of low, normal, critical")
                                   .arg(index));
        }
        item.urgency = *parsed;
    }
    return true;
}

} // namespace

std::optional<ScriptOutput> parseScriptOutput(const QByteArray& json, QString* error)
{
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(json, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        fail(error, parseError.errorString());
        return std::nullopt;
    }
    if (!doc.isObject()) {
        fail(error, QStringLiteral("top-level value must be an object"));
        return std::nullopt;
    }

    const QJsonValue items = doc.object().value(QStringLiteral("items"));
    if (!items.isArray()) {
        fail(error, QStringLiteral("'items' must be an array"));
        return std::nullopt;
    }

    ScriptOutput output;
    const QJsonArray array = items.toArray();
    output.items.reserve(static_cast<size_t>(array.size()));
    for (int i = 0; i < array.size(); ++i) {
        ScriptItem item;
        if (!parseItem(array.at(i), i, item, error)) {
            return std::nullopt;
        }
        output.items.push_back(std::move(item));
    }
    return output;
}

} // namespace vanta
