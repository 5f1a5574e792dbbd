#include "core/ipc/service_base.h"
#include "core/shared/logging.h"
#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFileInfo>
#include <QJsonObject>

#include <sys/types.h>
#include <unistd.h>

namespace vanta {

namespace {

QString defaultRuntimeRoot()
{
    const uid_t uid = getuid();
    return QStringLiteral("/tmp/vanta-%1").arg(uid);
}

QString normalizedEnvPath(const char* envName)
{
    const QString value = qEnvironmentVariable(envName).trimmed();
    if (value.isEmpty()) {
        return {};
    }
    return QDir::cleanPath(value);
}

} // namespace

ServiceBase::ServiceBase(const QString& serviceName, QObject* parent)
    : QObject(parent)
    , m_serviceName(serviceName)
    , m_server(std::make_unique<SocketServer>(this))
{
    m_server->setRequestHandler([this](const QJsonObject& request) {
        return handleRequest(request);
    });
    m_server->setAsyncRequestHandler([this](const QJsonObject& request,
                                            SocketServer::ReplyCallback reply) {
        return handleAsyncRequest(request, std::move(reply));
    });
}

ServiceBase::~ServiceBase() = default;

bool ServiceBase::startListening()
{
    const QString path = socketPath(m_serviceName);

    QDir dir = QFileInfo(path).dir();
    if (!dir.exists() && !dir.mkpath(QStringLiteral("."))) {
        LOG_ERROR(vIpc, "Failed to create socket directory: %s", qUtf8Printable(dir.path()));
        return false;
    }

    if (!m_server->listen(path)) {
        LOG_ERROR(vIpc, "Service '%s' failed to start", qUtf8Printable(m_serviceName));
        return false;
    }

    LOG_INFO(vIpc, "Service '%s' started on %s", qUtf8Printable(m_serviceName), qUtf8Printable(path));
    return true;
}

int ServiceBase::run()
{
    if (!startListening()) {
        return 1;
    }

    const int exitCode = QCoreApplication::exec();
    onShutdown();
    m_server->close();
    return exitCode;
}

QString ServiceBase::socketPath(const QString& serviceName)
{
    return QDir::cleanPath(socketDirectory() + QLatin1Char('/')
                           + serviceName + QStringLiteral(".sock"));
}

QString ServiceBase::runtimeDirectory()
{
    const QString runtimeDir = normalizedEnvPath("VANTA_RUNTIME_DIR");
    if (!runtimeDir.isEmpty()) {
        return runtimeDir;
    }
    return defaultRuntimeRoot();
}

QString ServiceBase::socketDirectory()
{
    const QString socketDir = normalizedEnvPath("VANTA_SOCKET_DIR");
    if (!socketDir.isEmpty()) {
        return socketDir;
    }
    return runtimeDirectory();
}

QJsonObject ServiceBase::handleRequest(const QJsonObject& request)
{
    const QString method = request.value(QStringLiteral("method")).toString();
    const uint64_t id = IpcMessage::requestId(request);

    if (method == QLatin1String("ping")) {
        return handlePing(request);
    }
    if (method == QLatin1String("shutdown")) {
        return handleShutdown(request);
    }

    LOG_WARN(vIpc, "Unknown method '%s' in service '%s'",
             qUtf8Printable(method), qUtf8Printable(m_serviceName));
    return IpcMessage::makeError(id, IpcErrorCode::NotFound,
                                 QStringLiteral("Unknown method: %1").arg(method));
}

bool ServiceBase::handleAsyncRequest(const QJsonObject& /*request*/,
                                     SocketServer::ReplyCallback /*reply*/)
{
    return false;
}

void ServiceBase::onShutdown()
{
}

QJsonObject ServiceBase::handlePing(const QJsonObject& request)
{
    QJsonObject result;
    result[QStringLiteral("pong")] = true;
    result[QStringLiteral("timestamp")] = QDateTime::currentMSecsSinceEpoch();
    result[QStringLiteral("service")] = m_serviceName;

    LOG_DEBUG(vIpc, "Ping received for service '%s'", qUtf8Printable(m_serviceName));
    return IpcMessage::makeResponse(IpcMessage::requestId(request), result);
}

QJsonObject ServiceBase::handleShutdown(const QJsonObject& request)
{
    LOG_INFO(vIpc, "Shutdown requested for service '%s'", qUtf8Printable(m_serviceName));

    QJsonObject result;
    result[QStringLiteral("shutting_down")] = true;

    // Quit after the response is written.
    QMetaObject::invokeMethod(QCoreApplication::instance(), &QCoreApplication::quit,
                              Qt::QueuedConnection);

    return IpcMessage::makeResponse(IpcMessage::requestId(request), result);
}

void ServiceBase::sendNotification(const QString& method, const QJsonObject& params)
{
    m_server->broadcast(IpcMessage::makeNotification(method, params));
}

} // namespace vanta
