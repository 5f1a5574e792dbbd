#include "core/ipc/message.h"
#include "core/shared/logging.h"
#include <QJsonDocument>
#include <QtEndian>

#include <cstring>

namespace vanta {

QByteArray IpcMessage::encode(const QJsonObject& json)
{
    const QByteArray payload = QJsonDocument(json).toJson(QJsonDocument::Compact);

    if (payload.size() > kMaxMessageSize) {
        LOG_WARN(vIpc, "Refusing to encode %lld-byte message (max %d)",
                 static_cast<long long>(payload.size()), kMaxMessageSize);
        return {};
    }

    QByteArray frame(kHeaderSize, Qt::Uninitialized);
    qToBigEndian(static_cast<quint32>(payload.size()), frame.data());
    frame.append(payload);
    return frame;
}

IpcMessage::DecodeResult IpcMessage::decode(const QByteArray& buffer)
{
    DecodeResult result;
    if (buffer.size() < kHeaderSize) {
        return result;
    }

    const quint32 payloadLen = qFromBigEndian<quint32>(buffer.constData());
    if (payloadLen > static_cast<quint32>(kMaxMessageSize)) {
        LOG_WARN(vIpc, "Frame length %u exceeds max %d", payloadLen, kMaxMessageSize);
        result.status = DecodeResult::Status::Invalid;
        return result;
    }

    const int frameLen = kHeaderSize + static_cast<int>(payloadLen);
    if (buffer.size() < frameLen) {
        return result;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(
        buffer.mid(kHeaderSize, static_cast<int>(payloadLen)), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        LOG_WARN(vIpc, "Dropping malformed frame: %s",
                 qUtf8Printable(parseError.errorString()));
        result.status = DecodeResult::Status::Invalid;
        return result;
    }

    result.status = DecodeResult::Status::Complete;
    result.json = doc.object();
    result.bytesConsumed = frameLen;
    return result;
}

QJsonObject IpcMessage::makeRequest(uint64_t id, const QString& method, const QJsonObject& params)
{
    QJsonObject json;
    json[QStringLiteral("type")] = QStringLiteral("request");
    json[QStringLiteral("id")] = static_cast<qint64>(id);
    json[QStringLiteral("method")] = method;
    if (!params.isEmpty()) {
        json[QStringLiteral("params")] = params;
    }
    return json;
}

QJsonObject IpcMessage::makeResponse(uint64_t id, const QJsonValue& result)
{
    QJsonObject json;
    json[QStringLiteral("type")] = QStringLiteral("response");
    json[QStringLiteral("id")] = static_cast<qint64>(id);
    json[QStringLiteral("result")] = result;
    return json;
}

QJsonObject IpcMessage::makeError(uint64_t id, IpcErrorCode code, const QString& message)
{
    QJsonObject error;
    error[QStringLiteral("code")] = static_cast<int>(code);
    error[QStringLiteral("codeString")] = ipcErrorCodeToString(code);
    error[QStringLiteral("message")] = message;

    QJsonObject json;
    json[QStringLiteral("type")] = QStringLiteral("error");
    json[QStringLiteral("id")] = static_cast<qint64>(id);
    json[QStringLiteral("error")] = error;
    return json;
}

QJsonObject IpcMessage::makeNotification(const QString& method, const QJsonObject& params)
{
    QJsonObject json;
    json[QStringLiteral("type")] = QStringLiteral("notification");
    json[QStringLiteral("method")] = method;
    if (!params.isEmpty()) {
        json[QStringLiteral("params")] = params;
    }
    return json;
}

uint64_t IpcMessage::requestId(const QJsonObject& request)
{
    return static_cast<uint64_t>(request.value(QStringLiteral("id")).toInteger());
}

QJsonObject IpcMessage::requestParams(const QJsonObject& request)
{
    return request.value(QStringLiteral("params")).toObject();
}

} // namespace vanta
