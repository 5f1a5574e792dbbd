#include "core/ipc/socket_server.h"
#include "core/shared/logging.h"
#include <QJsonObject>
#include <QPointer>

namespace vanta {

namespace {

bool socketHasActivePeer(const QString& socketPath)
{
    QLocalSocket probe;
    probe.connectToServer(socketPath);
    const bool connected = probe.waitForConnected(150);
    if (connected) {
        probe.disconnectFromServer();
    }
    return connected;
}

} // namespace

SocketServer::SocketServer(QObject* parent)
    : QObject(parent)
    , m_server(std::make_unique<QLocalServer>())
{
    connect(m_server.get(), &QLocalServer::newConnection,
            this, &SocketServer::onNewConnection);
}

SocketServer::~SocketServer()
{
    close();
}

bool SocketServer::listen(const QString& socketPath)
{
    m_server->setSocketOptions(QLocalServer::UserAccessOption);

    if (m_server->listen(socketPath)) {
        LOG_INFO(vIpc, "Listening on %s", qUtf8Printable(socketPath));
        return true;
    }

    if (m_server->serverError() != QAbstractSocket::AddressInUseError) {
        const QString err = m_server->errorString();
        LOG_ERROR(vIpc, "Failed to listen on %s: %s",
                  qUtf8Printable(socketPath), qUtf8Printable(err));
        emit errorOccurred(err);
        return false;
    }

    if (socketHasActivePeer(socketPath)) {
        const QString err = QStringLiteral("Launcher already running on %1").arg(socketPath);
        LOG_ERROR(vIpc, "%s", qUtf8Printable(err));
        emit errorOccurred(err);
        return false;
    }

    LOG_WARN(vIpc, "Removing stale socket: %s", qUtf8Printable(socketPath));
    QLocalServer::removeServer(socketPath);
    if (!m_server->listen(socketPath)) {
        const QString err = m_server->errorString();
        LOG_ERROR(vIpc, "Failed to listen on %s after stale cleanup: %s",
                  qUtf8Printable(socketPath), qUtf8Printable(err));
        emit errorOccurred(err);
        return false;
    }

    LOG_INFO(vIpc, "Listening on %s", qUtf8Printable(socketPath));
    return true;
}

void SocketServer::close()
{
    if (m_closing) {
        return;
    }
    m_closing = true;

    const QList<QLocalSocket*> clients = m_clients;
    m_clients.clear();
    m_readBuffers.clear();

    for (QLocalSocket* client : clients) {
        client->disconnect(this);
        if (client->state() != QLocalSocket::UnconnectedState) {
            client->disconnectFromServer();
        }
        client->deleteLater();
    }

    if (m_server->isListening()) {
        const QString path = m_server->fullServerName();
        m_server->close();
        LOG_INFO(vIpc, "Server closed: %s", qUtf8Printable(path));
    }

    m_closing = false;
}

bool SocketServer::isListening() const
{
    return m_server->isListening();
}

void SocketServer::setRequestHandler(RequestHandler handler)
{
    m_handler = std::move(handler);
}

void SocketServer::setAsyncRequestHandler(AsyncRequestHandler handler)
{
    m_asyncHandler = std::move(handler);
}

void SocketServer::broadcast(const QJsonObject& notification)
{
    const QByteArray encoded = IpcMessage::encode(notification);
    if (encoded.isEmpty()) {
        LOG_WARN(vIpc, "Failed to encode broadcast notification");
        return;
    }

    for (QLocalSocket* client : std::as_const(m_clients)) {
        client->write(encoded);
        client->flush();
    }

    LOG_DEBUG(vIpc, "Broadcast %s to %d client(s)",
              qUtf8Printable(notification.value(QStringLiteral("method")).toString()),
              static_cast<int>(m_clients.size()));
}

void SocketServer::onNewConnection()
{
    while (QLocalSocket* client = m_server->nextPendingConnection()) {
        client->setParent(this);
        m_clients.append(client);
        m_readBuffers.insert(client, QByteArray());

        connect(client, &QLocalSocket::readyRead,
                this, &SocketServer::onClientReadyRead);
        connect(client, &QLocalSocket::disconnected,
                this, &SocketServer::onClientDisconnected);

        LOG_DEBUG(vIpc, "Client connected (%d total)", static_cast<int>(m_clients.size()));
        emit clientConnected();
    }
}

void SocketServer::onClientReadyRead()
{
    auto* client = qobject_cast<QLocalSocket*>(sender());
    if (!client || !m_readBuffers.contains(client)) {
        return;
    }

    QByteArray& buffer = m_readBuffers[client];
    buffer.append(client->readAll());
    if (buffer.size() > kMaxReadBufferSize) {
        LOG_ERROR(vIpc, "Client read buffer exceeded %d bytes, disconnecting", kMaxReadBufferSize);
        dropClient(client);
        return;
    }

    processBuffer(client);
}

void SocketServer::onClientDisconnected()
{
    auto* client = qobject_cast<QLocalSocket*>(sender());
    if (!client) {
        return;
    }

    if (detachClient(client)) {
        LOG_DEBUG(vIpc, "Client disconnected");
        client->deleteLater();
        emit clientDisconnected();
    }
}

bool SocketServer::detachClient(QLocalSocket* client)
{
    const bool removedClient = m_clients.removeOne(client);
    const bool removedBuffer = m_readBuffers.remove(client) > 0;
    return removedClient || removedBuffer;
}

void SocketServer::dropClient(QLocalSocket* client)
{
    const bool wasTracked = detachClient(client);
    client->disconnect(this);
    client->disconnectFromServer();
    if (wasTracked) {
        client->deleteLater();
        emit clientDisconnected();
    }
}

void SocketServer::processBuffer(QLocalSocket* client)
{
    while (m_readBuffers.contains(client)) {
        QByteArray& buffer = m_readBuffers[client];
        const IpcMessage::DecodeResult decoded = IpcMessage::decode(buffer);
        if (decoded.status == IpcMessage::DecodeResult::Status::Incomplete) {
            return;
        }
        if (decoded.status == IpcMessage::DecodeResult::Status::Invalid) {
            dropClient(client);
            return;
        }

        buffer.remove(0, decoded.bytesConsumed);

        const QString type = decoded.json.value(QStringLiteral("type")).toString();
        if (type == QLatin1String("request")) {
            dispatchRequest(client, decoded.json);
        } else {
            LOG_WARN(vIpc, "Ignoring message of type '%s'", qUtf8Printable(type));
        }
    }
}

void SocketServer::dispatchRequest(QLocalSocket* client, const QJsonObject& request)
{
    LOG_DEBUG(vIpc, "Request: method=%s id=%llu",
              qUtf8Printable(request.value(QStringLiteral("method")).toString()),
              static_cast<unsigned long long>(IpcMessage::requestId(request)));

    if (m_asyncHandler) {
        QPointer<SocketServer> self(this);
        QPointer<QLocalSocket> target(client);
        ReplyCallback reply = [self, target](const QJsonObject& response) {
            if (!self) {
                return;
            }
            QMetaObject::invokeMethod(self.data(), [self, target, response]() {
                if (self && target) {
                    self->writeFrame(target.data(), response);
                }
            }, Qt::QueuedConnection);
        };
        if (m_asyncHandler(request, std::move(reply))) {
            return;
        }
    }

    QJsonObject response;
    if (m_handler) {
        response = m_handler(request);
    } else {
        response = IpcMessage::makeError(IpcMessage::requestId(request), IpcErrorCode::InternalError,
                                         QStringLiteral("No request handler registered"));
    }
    writeFrame(client, response);
}

void SocketServer::writeFrame(QLocalSocket* client, const QJsonObject& message)
{
    if (!m_clients.contains(client)) {
        return;
    }
    const QByteArray encoded = IpcMessage::encode(message);
    if (encoded.isEmpty()) {
        return;
    }
    client->write(encoded);
    client->flush();
}

} // namespace vanta
