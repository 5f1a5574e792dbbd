#pragma once

#include "core/shared/settings.h"
#include "core/shared/types.h"

#include <QString>
#include <QStringList>
#include <vector>

namespace vanta {

class ScriptInstaller;

struct LaunchResult {
    enum class Status {
        Launched,
        Filled,
        NotFound,
        InvalidCommand,
        SpawnFailed,
        Unsupported,
        Failed,
    };

    Status status = Status::Launched;
    QString errorMessage;
    QString fillQuery;   // set when status == Filled

    bool ok() const { return status == Status::Launched || status == Status::Filled; }
};

// Interprets action descriptors produced by the query engine:
//   <existing file>   open with the desktop default opener
//   focus:<address>   focus a compositor window
//   copy:<value>      put value on the clipboard
//   fill:<query>      hand a replacement query back to the caller
//   install:<source>  forward to the script installer
//   anything else     desktop Exec line, spawned detached
class Launcher {
public:
    explicit Launcher(ScriptInstaller* installer = nullptr);
    virtual ~Launcher() = default;

    LaunchResult launch(const QString& exec);

    // Opens a file with the configured editor (or the file manager when
    // openDocsInManager is set); directories always go to the file manager.
    LaunchResult openPath(const QString& path, const FilesSettings& files,
                          const std::vector<AppEntry>& apps);

    // Opens the directory containing path (or path itself if it is one).
    LaunchResult revealInFileManager(const QString& path, const FilesSettings& files,
                                     const std::vector<AppEntry>& apps);

    LaunchResult openWithEditor(const QString& path, const FilesSettings& files,
                                const std::vector<AppEntry>& apps);

    // Removes freedesktop field codes (%u %F ...), turns %% into %, and
    // collapses runs of whitespace.
    static QString stripFieldCodes(const QString& exec);

    // Replaces %u/%U/%f/%F with the quoted path, or appends the quoted path
    // when the line has no file placeholder.
    static QString substitutePath(const QString& exec, const QString& path);

protected:
    virtual bool startDetached(const QString& program, const QStringList& args, QString* error);
    virtual bool runWithInput(const QString& program, const QStringList& args,
                              const QByteArray& input, QString* error);

private:
    LaunchResult runCommandLine(const QString& commandLine);
    LaunchResult openDefault(const QString& path);
    LaunchResult openWithTool(const QString& path, const QString& toolExec,
                              const std::vector<AppEntry>& apps);
    LaunchResult focusWindow(const QString& address);
    LaunchResult copyToClipboard(const QString& value);
    LaunchResult install(const QString& source);

    ScriptInstaller* m_installer = nullptr;
};

} // namespace vanta
