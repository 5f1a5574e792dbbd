#pragma once

#include <QJsonObject>
#include <QString>
#include <QStringList>
#include <optional>
#include <vector>

namespace vanta {

// Installed application parsed from a .desktop descriptor.
// Identity is `name` (case-sensitive); unique within one scan.
struct AppEntry {
    QString name;
    std::optional<QString> genericName;
    std::optional<QString> comment;
    QString exec;
    std::optional<QString> icon;      // resolved icon file path
    QStringList categories;
    bool terminal = false;
    std::optional<QString> startupWmClass;
    QString sourcePath;
};

// One filesystem entry below the home directory.
// iconTag is "dir", "file:<ext>" (lowercase) or "file" for extensionless files.
struct FileEntry {
    QString nameLower;
    QString nameDisplay;
    QString fullPath;
    QString iconTag;
};

// Open window reported by the compositor.
struct WindowEntry {
    QString title;
    QString windowClass;
    QString address;
    QString workspace;
};

// Executable found in the scripts directory.
struct ScriptEntry {
    QString keyword;   // file stem, unique dispatch key
    std::optional<QString> name;
    std::optional<QString> description;
    std::optional<QString> icon;
    QString path;
};

enum class ScriptActionType {
    Copy,
    Open,
    Run,
};

enum class Urgency {
    Low,
    Normal,
    Critical,
};

QString scriptActionTypeToString(ScriptActionType type);
std::optional<ScriptActionType> scriptActionTypeFromString(const QString& str);
QString urgencyToString(Urgency urgency);
std::optional<Urgency> urgencyFromString(const QString& str);

struct ScriptAction {
    ScriptActionType type = ScriptActionType::Copy;
    QString value;
};

struct ScriptItem {
    QString title;
    std::optional<QString> subtitle;
    std::optional<QString> icon;
    std::optional<ScriptAction> action;
    std::optional<QString> badge;
    Urgency urgency = Urgency::Normal;
};

struct ScriptOutput {
    std::vector<ScriptItem> items;
};

QJsonObject appEntryToJson(const AppEntry& app);
QJsonObject scriptEntryToJson(const ScriptEntry& script);
QJsonObject scriptOutputToJson(const ScriptOutput& output);

} // namespace vanta
