#pragma once

#include "core/ipc/socket_server.h"
#include <QCoreApplication>
#include <QString>
#include <functional>

namespace vanta {

class ServiceBase : public QObject {
    Q_OBJECT
public:
    explicit ServiceBase(const QString& serviceName, QObject* parent = nullptr);
    ~ServiceBase() override;

    // Run the service (enters event loop, returns exit code)
    int run();

    // Binds the socket without entering the event loop.
    bool startListening();

    static QString socketPath(const QString& serviceName);
    static QString runtimeDirectory();
    static QString socketDirectory();

protected:
    // Override to handle specific methods
    virtual QJsonObject handleRequest(const QJsonObject& request);

    // Override to answer a request later from another thread. Return true
    // when the request was taken; `reply` must then be called exactly once.
    virtual bool handleAsyncRequest(const QJsonObject& request, SocketServer::ReplyCallback reply);

    // Called once before the event loop exits.
    virtual void onShutdown();

    // Built-in handlers
    QJsonObject handlePing(const QJsonObject& request);
    QJsonObject handleShutdown(const QJsonObject& request);

    // Send a notification to connected clients
    void sendNotification(const QString& method, const QJsonObject& params = {});

    QString m_serviceName;
    std::unique_ptr<SocketServer> m_server;
};

} // namespace vanta
