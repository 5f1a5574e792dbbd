#include "core/launch/launcher.h"
#include "core/scripts/script_installer.h"
#include "core/scripts/shell_words.h"
#include "core/shared/logging.h"

#include <QElapsedTimer>
#include <QFileInfo>
#include <QProcess>
#include <QRegularExpression>

namespace vanta {

namespace {

constexpr int kClipboardTimeoutMs = 2000;

const QString kFocusPrefix = QStringLiteral("focus:");
const QString kCopyPrefix = QStringLiteral("copy:");
const QString kFillPrefix = QStringLiteral("fill:");
const QString kInstallPrefix = QStringLiteral("install:");
const QString kDefaultTool = QStringLiteral("default");

LaunchResult launchFailure(LaunchResult::Status status, const QString& message)
{
    LaunchResult result;
    result.status = status;
    result.errorMessage = message;
    return result;
}

bool isFieldCode(QChar ch)
{
    switch (ch.unicode()) {
    case 'u': case 'U': case 'f': case 'F':
    case 'd': case 'D': case 'n': case 'N':
    case 'i': case 'c': case 'k': case 'v': case 'm':
        return true;
    default:
        return false;
    }
}

} // namespace

Launcher::Launcher(ScriptInstaller* installer)
    : m_installer(installer)
{
}

QString Launcher::stripFieldCodes(const QString& exec)
{
    QString out;
    out.reserve(exec.size());

    for (int i = 0; i < exec.size(); ++i) {
        const QChar ch = exec.at(i);
        if (ch == QLatin1Char('%') && i + 1 < exec.size()) {
            const QChar next = exec.at(i + 1);
            if (isFieldCode(next)) {
                ++i;
                continue;
            }
            if (next == QLatin1Char('%')) {
                out.append(QLatin1Char('%'));
                ++i;
                continue;
            }
        }
        out.append(ch);
    }

    return out.simplified();
}

QString Launcher::substitutePath(const QString& exec, const QString& path)
{
    const QString quoted = QLatin1Char('"') + path + QLatin1Char('"');
    static const QRegularExpression kPlaceholder(QStringLiteral("%[uUfF]"));
    if (exec.contains(kPlaceholder)) {
        QString out = exec;
        out.replace(kPlaceholder, quoted);
        return out;
    }
    return exec + QLatin1Char(' ') + quoted;
}

LaunchResult Launcher::launch(const QString& exec)
{
    QElapsedTimer timer;
    timer.start();

    const QFileInfo asPath(exec);
    if (!exec.isEmpty() && asPath.isAbsolute() && asPath.isFile()) {
        return openDefault(exec);
    }

    if (exec.startsWith(kFocusPrefix)) {
        return focusWindow(exec.mid(kFocusPrefix.size()));
    }
    if (exec.startsWith(kCopyPrefix)) {
        return copyToClipboard(exec.mid(kCopyPrefix.size()));
    }
    if (exec.startsWith(kFillPrefix)) {
        LaunchResult result;
        result.status = LaunchResult::Status::Filled;
        result.fillQuery = exec.mid(kFillPrefix.size());
        return result;
    }
    if (exec.startsWith(kInstallPrefix)) {
        return install(exec.mid(kInstallPrefix.size()));
    }

    const LaunchResult result = runCommandLine(stripFieldCodes(exec));
    LOG_DEBUG(vCore, "Launch took %lld ms", static_cast<long long>(timer.elapsed()));
    return result;
}

LaunchResult Launcher::runCommandLine(const QString& commandLine)
{
    if (commandLine.isEmpty()) {
        return launchFailure(LaunchResult::Status::InvalidCommand,
                             QStringLiteral("Empty exec command after parsing"));
    }

    QString splitError;
    const std::optional<QStringList> words = splitShellWords(commandLine, &splitError);
    if (!words) {
        return launchFailure(LaunchResult::Status::InvalidCommand,
                             QStringLiteral("Invalid exec command '%1': %2").arg(commandLine, splitError));
    }
    if (words->isEmpty()) {
        return launchFailure(LaunchResult::Status::InvalidCommand, QStringLiteral("Invalid exec command"));
    }

    const QString program = words->first();
    const QStringList args = words->mid(1);
    LOG_INFO(vCore, "Launching: %s %s", qUtf8Printable(program), qUtf8Printable(args.join(QLatin1Char(' '))));

    QString error;
    if (!startDetached(program, args, &error)) {
        return launchFailure(LaunchResult::Status::SpawnFailed,
                             QStringLiteral("Failed to spawn '%1': %2").arg(program, error));
    }
    return LaunchResult{};
}

LaunchResult Launcher::openDefault(const QString& path)
{
    QString error;
    if (!startDetached(QStringLiteral("xdg-open"), {path}, &error)) {
        return launchFailure(LaunchResult::Status::SpawnFailed,
                             QStringLiteral("Failed to open path: %1").arg(error));
    }
    return LaunchResult{};
}

LaunchResult Launcher::focusWindow(const QString& address)
{
    if (address.isEmpty()) {
        return launchFailure(LaunchResult::Status::InvalidCommand, QStringLiteral("Missing window address"));
    }

    QString hyprError;
    QString swayError;
    const bool hypr = startDetached(QStringLiteral("hyprctl"),
                                    {QStringLiteral("dispatch"), QStringLiteral("focuswindow"),
                                     QStringLiteral("address:%1").arg(address)},
                                    &hyprError);
    const bool sway = startDetached(QStringLiteral("swaymsg"),
                                    {QStringLiteral("[con_id=%1] focus").arg(address)},
                                    &swayError);
    if (!hypr && !sway) {
        LOG_WARN(vWindows, "No compositor accepted focus for %s", qUtf8Printable(address));
        return launchFailure(LaunchResult::Status::SpawnFailed,
                             QStringLiteral("Failed to focus window: %1").arg(hyprError));
    }
    return LaunchResult{};
}

LaunchResult Launcher::copyToClipboard(const QString& value)
{
    const QByteArray data = value.toUtf8();
    QString error;
    if (runWithInput(QStringLiteral("wl-copy"), {}, data, &error)) {
        return LaunchResult{};
    }
    LOG_DEBUG(vCore, "wl-copy failed (%s), trying xclip", qUtf8Printable(error));
    if (runWithInput(QStringLiteral("xclip"), {QStringLiteral("-selection"), QStringLiteral("clipboard")},
                     data, &error)) {
        return LaunchResult{};
    }
    return launchFailure(LaunchResult::Status::Failed,
                         QStringLiteral("Failed to copy to clipboard: %1").arg(error));
}

LaunchResult Launcher::install(const QString& source)
{
    if (!m_installer) {
        return launchFailure(LaunchResult::Status::Unsupported,
                             QStringLiteral("Script installation is not available"));
    }
    const InstallResult installed = m_installer->install(source);
    if (installed.ok()) {
        return LaunchResult{};
    }
    LaunchResult::Status status = LaunchResult::Status::Failed;
    if (installed.status == InstallResult::Status::NotFound) {
        status = LaunchResult::Status::NotFound;
    } else if (installed.status == InstallResult::Status::Unsupported) {
        status = LaunchResult::Status::Unsupported;
    }
    return launchFailure(status, installed.errorMessage);
}

LaunchResult Launcher::openWithTool(const QString& path, const QString& toolExec,
                                    const std::vector<AppEntry>& apps)
{
    if (toolExec.isEmpty() || toolExec == kDefaultTool) {
        return openDefault(path);
    }

    for (const AppEntry& app : apps) {
        if (app.exec == toolExec) {
            // %% survives field-code stripping as a literal %
            QString escaped = path;
            escaped.replace(QLatin1Char('%'), QStringLiteral("%%"));
            return runCommandLine(stripFieldCodes(substitutePath(app.exec, escaped)));
        }
    }

    LOG_WARN(vCore, "Custom opener '%s' not found, falling back to default.", qUtf8Printable(toolExec));
    return openDefault(path);
}

LaunchResult Launcher::openPath(const QString& path, const FilesSettings& files,
                                const std::vector<AppEntry>& apps)
{
    const QFileInfo info(path);
    if (path.isEmpty() || !info.exists()) {
        return launchFailure(LaunchResult::Status::NotFound, QStringLiteral("Path does not exist"));
    }
    const QString tool = (info.isDir() || files.openDocsInManager) ? files.fileManager : files.fileEditor;
    return openWithTool(path, tool, apps);
}

LaunchResult Launcher::revealInFileManager(const QString& path, const FilesSettings& files,
                                           const std::vector<AppEntry>& apps)
{
    const QFileInfo info(path);
    if (path.isEmpty() || !info.exists()) {
        return launchFailure(LaunchResult::Status::NotFound, QStringLiteral("Path does not exist"));
    }
    const QString dir = info.isDir() ? info.absoluteFilePath() : info.absolutePath();
    return openWithTool(dir, files.fileManager, apps);
}

LaunchResult Launcher::openWithEditor(const QString& path, const FilesSettings& files,
                                      const std::vector<AppEntry>& apps)
{
    const QFileInfo info(path);
    if (path.isEmpty() || !info.exists()) {
        return launchFailure(LaunchResult::Status::NotFound, QStringLiteral("Path does not exist"));
    }
    if (info.isDir()) {
        return launchFailure(LaunchResult::Status::InvalidCommand,
                             QStringLiteral("Cannot open directory with editor"));
    }
    return openWithTool(path, files.fileEditor, apps);
}

bool Launcher::startDetached(const QString& program, const QStringList& args, QString* error)
{
    QProcess process;
    process.setProgram(program);
    process.setArguments(args);
    process.setStandardInputFile(QProcess::nullDevice());
    process.setStandardOutputFile(QProcess::nullDevice());
    process.setStandardErrorFile(QProcess::nullDevice());
    if (!process.startDetached()) {
        if (error) {
            *error = process.errorString();
        }
        return false;
    }
    return true;
}

bool Launcher::runWithInput(const QString& program, const QStringList& args,
                            const QByteArray& input, QString* error)
{
    QProcess process;
    process.setStandardOutputFile(QProcess::nullDevice());
    process.setStandardErrorFile(QProcess::nullDevice());
    process.start(program, args);
    if (!process.waitForStarted(kClipboardTimeoutMs)) {
        if (error) {
            *error = process.errorString();
        }
        return false;
    }

    process.write(input);
    process.closeWriteChannel();

    if (!process.waitForFinished(kClipboardTimeoutMs)) {
        process.kill();
        process.waitForFinished();
        if (error) {
            *error = QStringLiteral("%1 timed out").arg(program);
        }
        return false;
    }
    if (process.exitStatus() != QProcess::NormalExit || process.exitCode() != 0) {
        if (error) {
            *error = QStringLiteral("%1 exited with code %2").arg(program).arg(process.exitCode());
        }
        return false;
    }
    return true;
}

} // namespace vanta
