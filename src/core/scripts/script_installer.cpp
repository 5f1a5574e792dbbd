#include "core/scripts/script_installer.h"
#include "core/shared/logging.h"
#include "core/shared/paths.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>

namespace vanta {

namespace {

InstallResult installFailure(InstallResult::Status status, const QString& message)
{
    InstallResult result;
    result.status = status;
    result.errorMessage = message;
    return result;
}

bool looksRemote(const QString& source)
{
    return source.contains(QLatin1String("://"))
        || source.startsWith(QLatin1String("github.com/"));
}

} // namespace

LocalScriptInstaller::LocalScriptInstaller(QString scriptsDir, QString themesDir)
    : m_scriptsDir(std::move(scriptsDir))
    , m_themesDir(std::move(themesDir))
{
}

InstallResult LocalScriptInstaller::install(const QString& source)
{
    const QString trimmed = source.trimmed();
    if (trimmed.isEmpty()) {
        return installFailure(InstallResult::Status::NotFound, QStringLiteral("No install source given"));
    }

    const QFileInfo info(Paths::expandTilde(trimmed));
    if (!info.exists()) {
        if (looksRemote(trimmed)) {
            LOG_WARN(vScripts, "Remote install not available: %s", qUtf8Printable(trimmed));
            return installFailure(InstallResult::Status::Unsupported,
                                  QStringLiteral("Remote installation is not supported: %1").arg(trimmed));
        }
        return installFailure(InstallResult::Status::NotFound,
                              QStringLiteral("Install source not found: %1").arg(trimmed));
    }
    if (!info.isFile()) {
        return installFailure(InstallResult::Status::Unsupported,
                              QStringLiteral("Only single files can be installed: %1").arg(trimmed));
    }

    const QString suffix = info.suffix().toLower();
    if (suffix == QLatin1String("zip")) {
        return installFailure(InstallResult::Status::Unsupported,
                              QStringLiteral("Archive installation is not supported: %1").arg(info.fileName()));
    }

    const bool isTheme = suffix == QLatin1String("css");
    const QString targetDir = isTheme ? m_themesDir : m_scriptsDir;
    if (!QDir().mkpath(targetDir)) {
        return installFailure(InstallResult::Status::Failed,
                              QStringLiteral("Could not create directory %1").arg(targetDir));
    }

    const QString target = QDir(targetDir).filePath(info.fileName());
    if (QFileInfo(target).canonicalFilePath() == info.canonicalFilePath()) {
        return installFailure(InstallResult::Status::Failed,
                              QStringLiteral("%1 is already installed").arg(info.fileName()));
    }
    if (QFileInfo::exists(target) && !QFile::remove(target)) {
        return installFailure(InstallResult::Status::Failed,
                              QStringLiteral("Could not replace %1").arg(target));
    }
    if (!QFile::copy(info.absoluteFilePath(), target)) {
        return installFailure(InstallResult::Status::Failed,
                              QStringLiteral("Failed to copy local file to %1").arg(target));
    }

    if (!isTheme) {
        const QFile::Permissions mode = QFile::ReadOwner | QFile::WriteOwner | QFile::ExeOwner
            | QFile::ReadUser | QFile::WriteUser | QFile::ExeUser
            | QFile::ReadGroup | QFile::ExeGroup
            | QFile::ReadOther | QFile::ExeOther;
        if (!QFile::setPermissions(target, mode)) {
            return installFailure(InstallResult::Status::Failed,
                                  QStringLiteral("Could not mark %1 executable").arg(target));
        }
    }

    LOG_INFO(vScripts, "Installed %s to %s", qUtf8Printable(info.fileName()), qUtf8Printable(targetDir));

    InstallResult result;
    result.status = InstallResult::Status::Installed;
    result.installedPath = target;
    return result;
}

} // namespace vanta
