#pragma once

#include "core/ipc/message.h"
#include <QHash>
#include <QList>
#include <QLocalServer>
#include <QLocalSocket>
#include <QObject>
#include <functional>
#include <memory>

namespace vanta {

class SocketServer : public QObject {
    Q_OBJECT
public:
    explicit SocketServer(QObject* parent = nullptr);
    ~SocketServer() override;

    // Delivers a response for one request. Safe to call from any thread and
    // after the requesting client went away (the reply is then dropped).
    using ReplyCallback = std::function<void(const QJsonObject& response)>;

    // Returns true when the handler took ownership of the request and will
    // answer later through the reply callback; false to answer synchronously.
    using AsyncRequestHandler = std::function<bool(const QJsonObject& request, ReplyCallback reply)>;
    using RequestHandler = std::function<QJsonObject(const QJsonObject& request)>;

    bool listen(const QString& socketPath);
    void close();
    bool isListening() const;

    void setRequestHandler(RequestHandler handler);
    void setAsyncRequestHandler(AsyncRequestHandler handler);

    void broadcast(const QJsonObject& notification);

signals:
    void clientConnected();
    void clientDisconnected();
    void errorOccurred(const QString& error);

private slots:
    void onNewConnection();
    void onClientReadyRead();
    void onClientDisconnected();

private:
    std::unique_ptr<QLocalServer> m_server;
    QList<QLocalSocket*> m_clients;
    QHash<QLocalSocket*, QByteArray> m_readBuffers;
    RequestHandler m_handler;
    AsyncRequestHandler m_asyncHandler;
    bool m_closing = false;

    static constexpr int kMaxReadBufferSize = IpcMessage::kMaxMessageSize + IpcMessage::kHeaderSize;

    void processBuffer(QLocalSocket* client);
    void dispatchRequest(QLocalSocket* client, const QJsonObject& request);
    void writeFrame(QLocalSocket* client, const QJsonObject& message);
    bool detachClient(QLocalSocket* client);
    void dropClient(QLocalSocket* client);
};

} // namespace vanta
