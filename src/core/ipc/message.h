#pragma once

#include "core/shared/ipc_messages.h"
#include <QByteArray>
#include <QJsonObject>
#include <QJsonValue>

namespace vanta {

// Wire framing for the launcher socket: 4-byte big-endian length followed by
// one compact UTF-8 JSON object.
class IpcMessage {
public:
    static QByteArray encode(const QJsonObject& json);

    struct DecodeResult {
        enum class Status {
            Complete,    // json is valid, bytesConsumed > 0
            Incomplete,  // wait for more bytes
            Invalid,     // oversized frame or non-object payload; drop the peer
        };
        Status status = Status::Incomplete;
        QJsonObject json;
        int bytesConsumed = 0;
    };
    static DecodeResult decode(const QByteArray& buffer);

    static QJsonObject makeRequest(uint64_t id, const QString& method, const QJsonObject& params = {});

    // result may be an object or an array (search returns a list).
    static QJsonObject makeResponse(uint64_t id, const QJsonValue& result);

    static QJsonObject makeError(uint64_t id, IpcErrorCode code, const QString& message);

    static QJsonObject makeNotification(const QString& method, const QJsonObject& params = {});

    static uint64_t requestId(const QJsonObject& request);
    static QJsonObject requestParams(const QJsonObject& request);

    static constexpr int kMaxMessageSize = 16 * 1024 * 1024;
    static constexpr int kHeaderSize = 4;
};

} // namespace vanta
