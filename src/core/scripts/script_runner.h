#pragma once

#include "core/shared/types.h"
#include <QString>
#include <optional>
#include <vector>

namespace vanta {

struct ScriptResult {
    enum class Status {
        Success,
        NotFound,
        InvalidArguments,
        SpawnFailed,
        Timeout,
        NonZeroExit,
        NoOutput,
        InvalidOutput,
    };

    Status status = Status::Success;
    std::optional<ScriptOutput> output;
    QString errorMessage;
    int durationMs = 0;

    bool ok() const { return status == Status::Success; }
};

QString scriptStatusToString(ScriptResult::Status status);

// Discovers and runs user scripts from one directory.
//
// execute() blocks until the script exits or its deadline passes; call it
// from a worker thread. The child gets a closed stdin, both output channels
// are drained while it runs and each is capped at 1 MiB (excess is
// discarded). On timeout the child is killed and reaped.
class ScriptRunner {
public:
    static constexpr qint64 kMaxCaptureBytes = 1024 * 1024;
    static constexpr int kPollIntervalMs = 50;
    static constexpr int kMetadataLines = 5;

    explicit ScriptRunner(QString scriptsDir);

    // Regular executable files directly in the directory, sorted by keyword.
    // When two files share a stem the later one in name order wins.
    std::vector<ScriptEntry> discover() const;

    ScriptResult execute(const QString& keyword, const QString& args, int timeoutMs) const;

    // Reads "# vanta:key=value" / "// vanta:key=value" lines from the head
    // of the file into name, description and icon.
    static void readMetadata(const QString& filePath, ScriptEntry& entry);

    // File stem used as the dispatch keyword ("weather.sh" -> "weather").
    static QString keywordFor(const QString& fileName);

    const QString& scriptsDir() const { return m_scriptsDir; }

private:
    std::optional<QString> findScript(const QString& keyword) const;

    QString m_scriptsDir;
};

} // namespace vanta
