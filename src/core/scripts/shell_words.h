#pragma once

#include <QString>
#include <QStringList>
#include <optional>

namespace vanta {

// POSIX shell word splitting without expansion.
//
// Handles single quotes, double quotes (with \" \\ \$ \` and line
// continuation escapes), backslash escapes outside quotes and '#' comments
// at the start of a word. Returns nullopt on an unterminated quote or a
// trailing backslash; `error` receives a short description.
std::optional<QStringList> splitShellWords(const QString& input, QString* error = nullptr);

} // namespace vanta
