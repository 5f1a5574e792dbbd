#pragma once

#include <QString>

namespace vanta {

// Well-known locations. Every path honours an environment override so tests
// and side-by-side installs can relocate state.
class Paths {
public:
    // $VANTA_CONFIG_DIR, else <GenericConfigLocation>/vanta
    static QString configDir();

    // $VANTA_HOME_DIR, else QDir::homePath()
    static QString homeDir();

    static QString configFilePath();
    static QString historyFilePath();
    static QString iconCacheFilePath();
    static QString themesDir();

    // Expands a leading "~" or "~/" against homeDir().
    static QString expandTilde(const QString& path);
};

} // namespace vanta
