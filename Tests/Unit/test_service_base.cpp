#include <QtTest/QtTest>

#include "core/ipc/message.h"
#include "core/ipc/service_base.h"

#include <QDir>
#include <QLocalSocket>
#include <QTemporaryDir>
#include <QtEndian>

#include <thread>

namespace {

class ScopedEnvVar {
public:
    ScopedEnvVar(const char* key, const QByteArray& value)
        : m_key(key)
        , m_hadOriginal(qEnvironmentVariableIsSet(key))
        , m_original(qgetenv(key))
    {
        qputenv(m_key, value);
    }

    ~ScopedEnvVar()
    {
        if (m_hadOriginal) {
            qputenv(m_key, m_original);
        } else {
            qunsetenv(m_key);
        }
    }

private:
    const char* m_key;
    bool m_hadOriginal = false;
    QByteArray m_original;
};

class TestServiceBaseImpl final : public vanta::ServiceBase {
public:
    explicit TestServiceBaseImpl(const QString& serviceName)
        : vanta::ServiceBase(serviceName)
    {
    }

    ~TestServiceBaseImpl() override
    {
        for (std::thread& worker : m_workers) {
            worker.join();
        }
    }

    QJsonObject dispatch(const QJsonObject& request)
    {
        return handleRequest(request);
    }

    void notify(const QString& method)
    {
        sendNotification(method);
    }

protected:
    bool handleAsyncRequest(const QJsonObject& request,
                            vanta::SocketServer::ReplyCallback reply) override
    {
        if (request.value(QStringLiteral("method")).toString() != QLatin1String("slowEcho")) {
            return false;
        }
        const uint64_t id = vanta::IpcMessage::requestId(request);
        const QJsonObject params = vanta::IpcMessage::requestParams(request);
        m_workers.emplace_back([id, params, reply = std::move(reply)]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            reply(vanta::IpcMessage::makeResponse(id, params));
        });
        return true;
    }

private:
    std::vector<std::thread> m_workers;
};

bool writeRequest(QLocalSocket& socket, const QJsonObject& request)
{
    const QByteArray frame = vanta::IpcMessage::encode(request);
    return socket.write(frame) == frame.size() && socket.flush();
}

std::optional<QJsonObject> readMessage(QLocalSocket& socket, QByteArray& buffer)
{
    QElapsedTimer timer;
    timer.start();
    while (timer.elapsed() < 5000) {
        const vanta::IpcMessage::DecodeResult decoded = vanta::IpcMessage::decode(buffer);
        if (decoded.status == vanta::IpcMessage::DecodeResult::Status::Complete) {
            buffer.remove(0, decoded.bytesConsumed);
            return decoded.json;
        }
        QCoreApplication::processEvents(QEventLoop::AllEvents, 20);
        socket.waitForReadyRead(20);
        buffer.append(socket.readAll());
    }
    return std::nullopt;
}

} // namespace

class TestServiceBase : public QObject {
    Q_OBJECT

private slots:
    void testRuntimeDirectoryOverrideAndPathNormalization();
    void testSocketFallsBackToRuntimeDirectory();
    void testHandlePingRequest();
    void testUnknownMethodReturnsNotFoundError();
    void testSocketRoundTripWithAsyncReply();
};

void TestServiceBase::testRuntimeDirectoryOverrideAndPathNormalization()
{
    const QByteArray runtimeRaw = "/tmp/vanta-runtime/../vanta-runtime";
    const QByteArray socketRaw = "/tmp/vanta-sockets/./nested/..";

    ScopedEnvVar runtimeEnv("VANTA_RUNTIME_DIR", runtimeRaw);
    ScopedEnvVar socketEnv("VANTA_SOCKET_DIR", socketRaw);

    QCOMPARE(vanta::ServiceBase::runtimeDirectory(),
             QDir::cleanPath(QString::fromUtf8(runtimeRaw)));
    QCOMPARE(vanta::ServiceBase::socketDirectory(),
             QDir::cleanPath(QString::fromUtf8(socketRaw)));
    QCOMPARE(vanta::ServiceBase::socketPath(QStringLiteral("launcher")),
             QDir::cleanPath(QString::fromUtf8(socketRaw) + "/launcher.sock"));
}

void TestServiceBase::testSocketFallsBackToRuntimeDirectory()
{
    const QByteArray runtimeRaw = "/tmp/vanta-runtime-fallback/./nested/..";

    ScopedEnvVar runtimeEnv("VANTA_RUNTIME_DIR", runtimeRaw);
    ScopedEnvVar socketEnv("VANTA_SOCKET_DIR", QByteArray());

    const QString runtime = QDir::cleanPath(QString::fromUtf8(runtimeRaw));
    QCOMPARE(vanta::ServiceBase::runtimeDirectory(), runtime);
    QCOMPARE(vanta::ServiceBase::socketDirectory(), runtime);

    ScopedEnvVar noRuntime("VANTA_RUNTIME_DIR", QByteArray());
    QVERIFY(vanta::ServiceBase::runtimeDirectory().startsWith(QStringLiteral("/tmp/vanta-")));
}

void TestServiceBase::testHandlePingRequest()
{
    TestServiceBaseImpl service(QStringLiteral("service-base-unit"));
    const QJsonObject request = vanta::IpcMessage::makeRequest(11, QStringLiteral("ping"));

    const QJsonObject response = service.dispatch(request);
    QCOMPARE(response.value(QStringLiteral("type")).toString(), QStringLiteral("response"));
    QCOMPARE(response.value(QStringLiteral("id")).toInteger(), 11);

    const QJsonObject result = response.value(QStringLiteral("result")).toObject();
    QCOMPARE(result.value(QStringLiteral("pong")).toBool(), true);
    QCOMPARE(result.value(QStringLiteral("service")).toString(), QStringLiteral("service-base-unit"));
    QVERIFY(result.value(QStringLiteral("timestamp")).toInteger() > 0);
}

void TestServiceBase::testUnknownMethodReturnsNotFoundError()
{
    TestServiceBaseImpl service(QStringLiteral("service-base-unit"));
    const QJsonObject request =
        vanta::IpcMessage::makeRequest(27, QStringLiteral("unknown.method"));

    const QJsonObject response = service.dispatch(request);
    QCOMPARE(response.value(QStringLiteral("type")).toString(), QStringLiteral("error"));
    QCOMPARE(response.value(QStringLiteral("id")).toInteger(), 27);

    const QJsonObject error = response.value(QStringLiteral("error")).toObject();
    QCOMPARE(error.value(QStringLiteral("code")).toInt(),
             static_cast<int>(vanta::IpcErrorCode::NotFound));
    QCOMPARE(error.value(QStringLiteral("codeString")).toString(),
             vanta::ipcErrorCodeToString(vanta::IpcErrorCode::NotFound));
    QVERIFY(error.value(QStringLiteral("message"))
                .toString()
                .contains(QStringLiteral("unknown.method")));
}

void TestServiceBase::testSocketRoundTripWithAsyncReply()
{
    QTemporaryDir runtime;
    QVERIFY(runtime.isValid());
    ScopedEnvVar runtimeEnv("VANTA_RUNTIME_DIR", runtime.path().toUtf8());
    ScopedEnvVar socketEnv("VANTA_SOCKET_DIR", QByteArray());

    TestServiceBaseImpl service(QStringLiteral("roundtrip"));
    QVERIFY(service.startListening());

    QLocalSocket client;
    client.connectToServer(vanta::ServiceBase::socketPath(QStringLiteral("roundtrip")));
    QVERIFY(client.waitForConnected(2000));
    QTRY_VERIFY(client.state() == QLocalSocket::ConnectedState);

    QByteArray buffer;
    QVERIFY(writeRequest(client, vanta::IpcMessage::makeRequest(
        1, QStringLiteral("slowEcho"), QJsonObject{{QStringLiteral("value"), 5}})));
    QVERIFY(writeRequest(client, vanta::IpcMessage::makeRequest(2, QStringLiteral("ping"))));

    // The synchronous ping overtakes the delayed echo.
    const std::optional<QJsonObject> first = readMessage(client, buffer);
    QVERIFY(first.has_value());
    QCOMPARE(first->value(QStringLiteral("id")).toInteger(), 2);

    const std::optional<QJsonObject> second = readMessage(client, buffer);
    QVERIFY(second.has_value());
    QCOMPARE(second->value(QStringLiteral("id")).toInteger(), 1);
    QCOMPARE(second->value(QStringLiteral("result")).toObject()
                 .value(QStringLiteral("value")).toInt(), 5);

    service.notify(QStringLiteral("appsChanged"));
    const std::optional<QJsonObject> notification = readMessage(client, buffer);
    QVERIFY(notification.has_value());
    QCOMPARE(notification->value(QStringLiteral("type")).toString(), QStringLiteral("notification"));
    QCOMPARE(notification->value(QStringLiteral("method")).toString(), QStringLiteral("appsChanged"));

    client.disconnectFromServer();
}

QTEST_MAIN(TestServiceBase)
#include "test_service_base.moc"
