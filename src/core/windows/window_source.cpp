#include "core/windows/window_source.h"
#include "core/shared/logging.h"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QProcess>

namespace vanta {

namespace {

const QString kUnknownWorkspace = QStringLiteral("Unknown");

void collectSwayWindows(const QJsonObject& node, const QString& workspace,
                        std::vector<WindowEntry>& windows)
{
    QString currentWorkspace = workspace;
    if (node.value(QStringLiteral("type")).toString() == QLatin1String("workspace")) {
        const QString name = node.value(QStringLiteral("name")).toString();
        currentWorkspace = (name.isEmpty() || name == QLatin1String("__i3_scratch"))
                               ? kUnknownWorkspace
                               : name;
    }

    const QJsonValue pid = node.value(QStringLiteral("pid"));
    if (!pid.isUndefined() && !pid.isNull()) {
        QString windowClass = node.value(QStringLiteral("app_id")).toString();
        if (windowClass.isEmpty()) {
            windowClass = node.value(QStringLiteral("window_properties")).toObject()
                              .value(QStringLiteral("class")).toString();
        }

        WindowEntry entry;
        entry.title = node.value(QStringLiteral("name")).toString();
        entry.windowClass = windowClass;
        entry.address = QString::number(node.value(QStringLiteral("id")).toInteger());
        entry.workspace = currentWorkspace;
        windows.push_back(std::move(entry));
    }

    for (const QString& key : {QStringLiteral("nodes"), QStringLiteral("floating_nodes")}) {
        const QJsonArray children = node.value(key).toArray();
        for (const QJsonValue& child : children) {
            collectSwayWindows(child.toObject(), currentWorkspace, windows);
        }
    }
}

} // namespace

CommandWindowSource::CommandWindowSource(QString program, QStringList arguments, int timeoutMs)
    : m_program(std::move(program))
    , m_arguments(std::move(arguments))
    , m_timeoutMs(timeoutMs)
{
}

std::optional<std::vector<WindowEntry>> CommandWindowSource::listWindows()
{
    QProcess process;
    process.start(m_program, m_arguments);

    if (!process.waitForStarted(m_timeoutMs)) {
        LOG_DEBUG(vWindows, "%s unavailable: %s",
                  qUtf8Printable(m_program), qUtf8Printable(process.errorString()));
        return std::nullopt;
    }

    if (!process.waitForFinished(m_timeoutMs)) {
        process.kill();
        process.waitForFinished();
        LOG_WARN(vWindows, "%s timed out after %d ms", qUtf8Printable(m_program), m_timeoutMs);
        return std::nullopt;
    }

    if (process.exitStatus() != QProcess::NormalExit || process.exitCode() != 0) {
        LOG_DEBUG(vWindows, "%s exited with code %d",
                  qUtf8Printable(m_program), process.exitCode());
        return std::nullopt;
    }

    return parse(process.readAllStandardOutput());
}

HyprlandWindowSource::HyprlandWindowSource(int timeoutMs)
    : CommandWindowSource(QStringLiteral("hyprctl"),
                          {QStringLiteral("clients"), QStringLiteral("-j")}, timeoutMs)
{
}

std::optional<std::vector<WindowEntry>> HyprlandWindowSource::parse(const QByteArray& output) const
{
    return parseClients(output);
}

std::optional<std::vector<WindowEntry>> HyprlandWindowSource::parseClients(const QByteArray& json)
{
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(json, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isArray()) {
        LOG_DEBUG(vWindows, "Unparseable hyprctl output: %s", qUtf8Printable(parseError.errorString()));
        return std::nullopt;
    }

    std::vector<WindowEntry> windows;
    const QJsonArray clients = doc.array();
    for (const QJsonValue& value : clients) {
        if (!value.isObject()) {
            return std::nullopt;
        }
        const QJsonObject client = value.toObject();

        WindowEntry entry;
        entry.title = client.value(QStringLiteral("title")).toString();
        entry.windowClass = client.value(QStringLiteral("class")).toString();
        entry.address = client.value(QStringLiteral("address")).toString();
        entry.workspace = client.value(QStringLiteral("workspace")).toObject()
                              .value(QStringLiteral("name")).toString();
        windows.push_back(std::move(entry));
    }
    return windows;
}

SwayWindowSource::SwayWindowSource(int timeoutMs)
    : CommandWindowSource(QStringLiteral("swaymsg"),
                          {QStringLiteral("-t"), QStringLiteral("get_tree")}, timeoutMs)
{
}

std::optional<std::vector<WindowEntry>> SwayWindowSource::parse(const QByteArray& output) const
{
    return parseTree(output);
}

std::optional<std::vector<WindowEntry>> SwayWindowSource::parseTree(const QByteArray& json)
{
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(json, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        LOG_DEBUG(vWindows, "Unparseable swaymsg output: %s", qUtf8Printable(parseError.errorString()));
        return std::nullopt;
    }

    std::vector<WindowEntry> windows;
    collectSwayWindows(doc.object(), kUnknownWorkspace, windows);
    return windows;
}

} // namespace vanta
