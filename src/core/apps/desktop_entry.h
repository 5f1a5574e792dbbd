#pragma once

#include "core/apps/key_file.h"
#include "core/shared/types.h"
#include <optional>

namespace vanta {

// Parses the [Desktop Entry] group of a .desktop file.
//
// Returns nullopt when the file is unreadable, flagged NoDisplay/Hidden, or
// lacks Name or Exec. The returned entry's `icon` holds the raw Icon value;
// resolution to a file path happens in AppIndex.
class DesktopEntryParser {
public:
    static std::optional<AppEntry> parseFile(const QString& filePath);
    static std::optional<AppEntry> parse(const QString& content, const QString& sourcePath);

private:
    static std::optional<AppEntry> parse(const KeyFile& keyFile, const QString& sourcePath);
};

} // namespace vanta
