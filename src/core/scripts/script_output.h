#pragma once

#include "core/shared/types.h"
#include <QByteArray>
#include <optional>

namespace vanta {

// Validates the JSON a script prints on stdout.
//
// The document must be an object with an "items" array. Every item needs a
// string "title"; "subtitle", "icon" and "badge" are optional strings;
// "action" is an optional {type: copy|open|run, value: string} object;
// "urgency" is optional (low|normal|critical, default normal). Unknown keys
// are ignored. On failure `error` receives the reason for debug logging.
std::optional<ScriptOutput> parseScriptOutput(const QByteArray& json, QString* error = nullptr);

} // namespace vanta
