#pragma once

#include <QString>

namespace vanta {

struct InstallResult {
    enum class Status {
        Installed,
        NotFound,
        Unsupported,
        Failed,
    };

    Status status = Status::Installed;
    QString installedPath;
    QString errorMessage;

    bool ok() const { return status == Status::Installed; }
};

// Seam for "install a script from <source>". Implementations may block.
class ScriptInstaller {
public:
    virtual ~ScriptInstaller() = default;
    virtual InstallResult install(const QString& source) = 0;
};

// Installs a single local file. Stylesheets go to the themes directory;
// everything else is copied into the scripts directory and made executable.
// Archives and remote sources are reported as Unsupported.
class LocalScriptInstaller : public ScriptInstaller {
public:
    LocalScriptInstaller(QString scriptsDir, QString themesDir);

    InstallResult install(const QString& source) override;

private:
    QString m_scriptsDir;
    QString m_themesDir;
};

} // namespace vanta
