#include "core/scripts/script_runner.h"
#include "core/scripts/script_output.h"
#include "core/scripts/shell_words.h"
#include "core/shared/logging.h"

#include <QDir>
#include <QElapsedTimer>
#include <QFile>
#include <QFileInfo>
#include <QMap>
#include <QProcess>

#include <algorithm>

namespace vanta {

namespace {

void appendCapped(QByteArray& buffer, const QByteArray& chunk)
{
    const qint64 room = ScriptRunner::kMaxCaptureBytes - buffer.size();
    if (room <= 0 || chunk.isEmpty()) {
        return;
    }
    buffer.append(chunk.left(static_cast<int>(std::min<qint64>(room, chunk.size()))));
}

// Once a stream's capture is full its pipe is closed; further writes by the
// child fail with EPIPE instead of piling up in QProcess's buffer.
void drainChannel(QProcess& process, QProcess::ProcessChannel channel,
                  QByteArray& buffer, bool& open)
{
    if (!open) {
        return;
    }
    appendCapped(buffer, channel == QProcess::StandardOutput
                             ? process.readAllStandardOutput()
                             : process.readAllStandardError());
    if (buffer.size() >= ScriptRunner::kMaxCaptureBytes) {
        process.closeReadChannel(channel);
        open = false;
        LOG_DEBUG(vScripts, "Capture limit reached on %s",
                  channel == QProcess::StandardOutput ? "stdout" : "stderr");
    }
}

bool isExecutableFile(const QFileInfo& info)
{
    if (!info.isFile()) {
        return false;
    }
    const QFile::Permissions perms = info.permissions();
    return perms & (QFile::ExeOwner | QFile::ExeGroup | QFile::ExeOther);
}

ScriptResult failure(ScriptResult::Status status, const QString& message, const QElapsedTimer& timer)
{
    ScriptResult result;
    result.status = status;
    result.errorMessage = message;
    result.durationMs = static_cast<int>(timer.elapsed());
    return result;
}

} // namespace

QString scriptStatusToString(ScriptResult::Status status)
{
    switch (status) {
    case ScriptResult::Status::Success:          return QStringLiteral("success");
    case ScriptResult::Status::NotFound:         return QStringLiteral("not_found");
    case ScriptResult::Status::InvalidArguments: return QStringLiteral("invalid_arguments");
    case ScriptResult::Status::SpawnFailed:      return QStringLiteral("spawn_failed");
    case ScriptResult::Status::Timeout:          return QStringLiteral("timeout");
    case ScriptResult::Status::NonZeroExit:      return QStringLiteral("non_zero_exit");
    case ScriptResult::Status::NoOutput:         return QStringLiteral("no_output");
    case ScriptResult::Status::InvalidOutput:    return QStringLiteral("invalid_output");
    }
    return QStringLiteral("unknown");
}

ScriptRunner::ScriptRunner(QString scriptsDir)
    : m_scriptsDir(std::move(scriptsDir))
{
}

QString ScriptRunner::keywordFor(const QString& fileName)
{
    const QFileInfo info(fileName);
    const QString stem = info.completeBaseName();
    return stem.isEmpty() ? info.fileName() : stem;
}

std::vector<ScriptEntry> ScriptRunner::discover() const
{
    std::vector<ScriptEntry> entries;
    const QDir dir(m_scriptsDir);
    if (!dir.exists()) {
        LOG_DEBUG(vScripts, "Scripts directory does not exist: %s", qUtf8Printable(m_scriptsDir));
        return entries;
    }
    if (!QFileInfo(m_scriptsDir).isReadable()) {
        LOG_WARN(vScripts, "Could not read scripts dir: %s", qUtf8Printable(m_scriptsDir));
        return entries;
    }

    QMap<QString, ScriptEntry> byKeyword;
    const QFileInfoList files = dir.entryInfoList(QDir::Files | QDir::Hidden, QDir::Name);
    for (const QFileInfo& info : files) {
        if (!isExecutableFile(info)) {
            continue;
        }
        ScriptEntry entry;
        entry.keyword = keywordFor(info.fileName());
        if (entry.keyword.isEmpty()) {
            continue;
        }
        entry.path = info.absoluteFilePath();
        readMetadata(entry.path, entry);
        byKeyword.insert(entry.keyword, entry);
    }

    entries.reserve(static_cast<size_t>(byKeyword.size()));
    for (auto it = byKeyword.constBegin(); it != byKeyword.constEnd(); ++it) {
        entries.push_back(it.value());
    }
    LOG_INFO(vScripts, "Discovered %d scripts", static_cast<int>(entries.size()));
    return entries;
}

void ScriptRunner::readMetadata(const QString& filePath, ScriptEntry& entry)
{
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        return;
    }

    for (int i = 0; i < kMetadataLines && !file.atEnd(); ++i) {
        const QString line = QString::fromUtf8(file.readLine()).trimmed();

        QString content;
        if (line.startsWith(QLatin1Char('#'))) {
            content = line.mid(1).trimmed();
        } else if (line.startsWith(QLatin1String("//"))) {
            content = line.mid(2).trimmed();
        } else {
            continue;
        }

        if (!content.startsWith(QLatin1String("vanta:"))) {
            continue;
        }
        const QString pair = content.mid(6);
        const int eq = pair.indexOf(QLatin1Char('='));
        if (eq < 0) {
            continue;
        }
        const QString key = pair.left(eq).trimmed();
        const QString value = pair.mid(eq + 1).trimmed();
        if (key == QLatin1String("name")) {
            entry.name = value;
        } else if (key == QLatin1String("description")) {
            entry.description = value;
        } else if (key == QLatin1String("icon")) {
            entry.icon = value;
        }
    }
}

std::optional<QString> ScriptRunner::findScript(const QString& keyword) const
{
    const QDir dir(m_scriptsDir);
    if (keyword.isEmpty() || !dir.exists()) {
        return std::nullopt;
    }

    std::optional<QString> found;
    const QFileInfoList files = dir.entryInfoList(QDir::Files | QDir::Hidden, QDir::Name);
    for (const QFileInfo& info : files) {
        if (keywordFor(info.fileName()) == keyword) {
            found = info.absoluteFilePath();
        }
    }
    return found;
}

ScriptResult ScriptRunner::execute(const QString& keyword, const QString& args, int timeoutMs) const
{
    QElapsedTimer timer;
    timer.start();

    const std::optional<QString> scriptPath = findScript(keyword);
    if (!scriptPath) {
        return failure(ScriptResult::Status::NotFound,
                       QStringLiteral("Script '%1' not found").arg(keyword), timer);
    }

    QStringList arguments;
    if (!args.trimmed().isEmpty()) {
        QString splitError;
        const std::optional<QStringList> parsed = splitShellWords(args, &splitError);
        if (!parsed) {
            return failure(ScriptResult::Status::InvalidArguments,
                           QStringLiteral("Invalid script args for '%1': %2").arg(keyword, splitError),
                           timer);
        }
        arguments = *parsed;
    }

    LOG_INFO(vScripts, "Executing script: %s args='%s'", qUtf8Printable(keyword), qUtf8Printable(args));

    QProcess process;
    process.setStandardInputFile(QProcess::nullDevice());
    process.setWorkingDirectory(m_scriptsDir);
    process.start(*scriptPath, arguments);

    if (!process.waitForStarted(std::max(timeoutMs, kPollIntervalMs))) {
        return failure(ScriptResult::Status::SpawnFailed,
                       QStringLiteral("Failed to execute script '%1': %2")
                           .arg(keyword, process.errorString()),
                       timer);
    }

    QByteArray stdoutData;
    QByteArray stderrData;
    bool stdoutOpen = true;
    bool stderrOpen = true;
    bool timedOut = false;

    while (process.state() != QProcess::NotRunning) {
        const qint64 remaining = timeoutMs - timer.elapsed();
        if (remaining <= 0) {
            timedOut = true;
            break;
        }
        process.waitForFinished(static_cast<int>(std::min<qint64>(remaining, kPollIntervalMs)));
        drainChannel(process, QProcess::StandardOutput, stdoutData, stdoutOpen);
        drainChannel(process, QProcess::StandardError, stderrData, stderrOpen);
    }

    if (timedOut) {
        process.kill();
        process.waitForFinished();
        LOG_WARN(vScripts, "Script '%s' timed out after %dms", qUtf8Printable(keyword), timeoutMs);
        return failure(ScriptResult::Status::Timeout,
                       QStringLiteral("Script '%1' timed out after %2ms").arg(keyword).arg(timeoutMs),
                       timer);
    }

    drainChannel(process, QProcess::StandardOutput, stdoutData, stdoutOpen);
    drainChannel(process, QProcess::StandardError, stderrData, stderrOpen);

    if (process.exitStatus() != QProcess::NormalExit || process.exitCode() != 0) {
        const QString stderrText = QString::fromUtf8(stderrData);
        QString message;
        if (stderrText.isEmpty()) {
            message = process.exitStatus() == QProcess::CrashExit
                ? QStringLiteral("Script '%1' was terminated by a signal").arg(keyword)
                : QStringLiteral("Script '%1' exited with code %2").arg(keyword).arg(process.exitCode());
        } else {
            QString firstLine = stderrText.section(QLatin1Char('\n'), 0, 0);
            if (firstLine.endsWith(QLatin1Char('\r'))) {
                firstLine.chop(1);
            }
            message = QStringLiteral("Script '%1' error: %2").arg(keyword, firstLine);
        }
        LOG_DEBUG(vScripts, "Script '%s' stderr: %s",
                  qUtf8Printable(keyword), qUtf8Printable(stderrText.left(500)));
        return failure(ScriptResult::Status::NonZeroExit, message, timer);
    }

    const QByteArray trimmed = stdoutData.trimmed();
    if (trimmed.isEmpty()) {
        return failure(ScriptResult::Status::NoOutput,
                       QStringLiteral("Script '%1' produced no output").arg(keyword), timer);
    }

    QString parseError;
    std::optional<ScriptOutput> output = parseScriptOutput(trimmed, &parseError);
    if (!output) {
        LOG_DEBUG(vScripts, "Script '%s' output invalid JSON: %s -- raw: %s",
                  qUtf8Printable(keyword), qUtf8Printable(parseError),
                  trimmed.left(200).constData());
        return failure(ScriptResult::Status::InvalidOutput,
                       QStringLiteral("Invalid JSON output from '%1'. Run the script manually to debug.")
                           .arg(keyword),
                       timer);
    }

    ScriptResult result;
    result.status = ScriptResult::Status::Success;
    result.output = std::move(output);
    result.durationMs = static_cast<int>(timer.elapsed());
    LOG_INFO(vScripts, "Script '%s' completed: %d items in %d ms",
             qUtf8Printable(keyword), static_cast<int>(result.output->items.size()), result.durationMs);
    return result;
}

} // namespace vanta
