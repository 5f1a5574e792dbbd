#pragma once

#include <QJsonObject>
#include <QString>
#include <cstdint>

namespace vanta {

// Per-provider switch and percentage weight (clamped to [10,300] at use).
struct ProviderSettings {
    bool enabled = true;
    uint32_t weight = 100;

    bool operator==(const ProviderSettings& other) const
    {
        return enabled == other.enabled && weight == other.weight;
    }
};

struct SearchSettings {
    ProviderSettings applications;
    ProviderSettings windows;
    ProviderSettings calculator;
    ProviderSettings files;
};

struct FilesSettings {
    bool includeHidden = false;
    int maxDepth = 3;
    QString fileManager = QStringLiteral("default");
    QString fileEditor = QStringLiteral("default");
    bool openDocsInManager = false;

    bool operator==(const FilesSettings& other) const
    {
        return includeHidden == other.includeHidden
            && maxDepth == other.maxDepth
            && fileManager == other.fileManager
            && fileEditor == other.fileEditor
            && openDocsInManager == other.openDocsInManager;
    }
    bool operator!=(const FilesSettings& other) const { return !(*this == other); }
};

struct Settings {
    // General
    int maxResults = 8;

    SearchSettings search;

    // Scripts
    QString scriptsDirectory = QStringLiteral("~/.config/vanta/scripts");
    uint32_t scriptTimeoutMs = 5000;

    FilesSettings files;

    // Sections owned by the UI shell (hotkey, appearance, window chrome).
    // Carried verbatim so a save does not drop them.
    QJsonObject shellSections;
};

} // namespace vanta
