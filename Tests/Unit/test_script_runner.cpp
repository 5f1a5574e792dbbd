#include <QtTest/QtTest>

#include "core/scripts/script_runner.h"

#include <QElapsedTimer>
#include <QFile>
#include <QTemporaryDir>

using vanta::ScriptResult;
using vanta::ScriptRunner;

namespace {

bool writeScript(const QString& dir, const QString& fileName, const QByteArray& body, bool executable = true)
{
    QFile file(dir + QLatin1Char('/') + fileName);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return false;
    }
    file.write(body);
    file.close();

    QFile::Permissions perms = QFile::ReadOwner | QFile::WriteOwner | QFile::ReadUser | QFile::WriteUser;
    if (executable) {
        perms |= QFile::ExeOwner | QFile::ExeUser;
    }
    return file.setPermissions(perms);
}

} // namespace

class TestScriptRunner : public QObject {
    Q_OBJECT

private slots:
    void testDiscoverReadsMetadata();
    void testDiscoverSkipsNonExecutablesAndMissingDir();
    void testDuplicateStemLastWins();
    void testExecuteSuccessWithArgs();
    void testStdinIsClosed();
    void testNotFound();
    void testInvalidArguments();
    void testNonZeroExitReportsFirstStderrLine();
    void testNonZeroExitWithoutStderr();
    void testNoOutput();
    void testInvalidOutput();
    void testTimeoutKillsScript();
    void testOversizedOutputIsCapped();
    void testEndlessWriterStopsAtCapture();
    void testStderrCaptureIsBounded();
};

void TestScriptRunner::testDiscoverReadsMetadata()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    QVERIFY(writeScript(dir.path(), QStringLiteral("weather.sh"),
                        "#!/bin/sh\n"
                        "# vanta:name=Weather\n"
                        "# vanta:description=Current conditions\n"
                        "// vanta:icon=weather-clear\n"
                        "# vanta:unknown=ignored\n"
                        "# vanta:name=Too late\n"));
    QVERIFY(writeScript(dir.path(), QStringLiteral("alpha.py"), "#!/bin/sh\n# vanta:broken line\n"));

    const std::vector<vanta::ScriptEntry> scripts = ScriptRunner(dir.path()).discover();
    QCOMPARE(scripts.size(), size_t(2));

    QCOMPARE(scripts[0].keyword, QStringLiteral("alpha"));
    QVERIFY(!scripts[0].name.has_value());

    const vanta::ScriptEntry& weather = scripts[1];
    QCOMPARE(weather.keyword, QStringLiteral("weather"));
    QCOMPARE(weather.name.value(), QStringLiteral("Weather"));
    QCOMPARE(weather.description.value(), QStringLiteral("Current conditions"));
    QCOMPARE(weather.icon.value(), QStringLiteral("weather-clear"));
    QVERIFY(weather.path.endsWith(QStringLiteral("/weather.sh")));
}

void TestScriptRunner::testDiscoverSkipsNonExecutablesAndMissingDir()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    QVERIFY(writeScript(dir.path(), QStringLiteral("notes.txt"), "plain\n", false));
    QVERIFY(QDir(dir.path()).mkdir(QStringLiteral("subdir.sh")));

    QVERIFY(ScriptRunner(dir.path()).discover().empty());
    QVERIFY(ScriptRunner(dir.path() + QStringLiteral("/missing")).discover().empty());
}

void TestScriptRunner::testDuplicateStemLastWins()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    QVERIFY(writeScript(dir.path(), QStringLiteral("clock.py"),
                        "#!/bin/sh\n# vanta:name=First\necho '{\"items\":[{\"title\":\"py\"}]}'\n"));
    QVERIFY(writeScript(dir.path(), QStringLiteral("clock.sh"),
                        "#!/bin/sh\n# vanta:name=Second\necho '{\"items\":[{\"title\":\"sh\"}]}'\n"));

    const ScriptRunner runner(dir.path());
    const std::vector<vanta::ScriptEntry> scripts = runner.discover();
    QCOMPARE(scripts.size(), size_t(1));
    QCOMPARE(scripts[0].name.value(), QStringLiteral("Second"));

    const ScriptResult result = runner.execute(QStringLiteral("clock"), QString(), 2000);
    QVERIFY2(result.ok(), qPrintable(result.errorMessage));
    QCOMPARE(result.output->items.front().title, QStringLiteral("sh"));
}

void TestScriptRunner::testExecuteSuccessWithArgs()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    QVERIFY(writeScript(dir.path(), QStringLiteral("echoargs.sh"),
                        "#!/bin/sh\n"
                        "printf '{\"items\":[{\"title\":\"%s|%s\",\"badge\":\"%s\"}]}\\n' \"$1\" \"$2\" \"$#\"\n"));

    const ScriptResult result = ScriptRunner(dir.path())
        .execute(QStringLiteral("echoargs"), QStringLiteral("'New York' now"), 2000);
    QVERIFY2(result.ok(), qPrintable(result.errorMessage));
    QCOMPARE(result.status, ScriptResult::Status::Success);
    QCOMPARE(result.output->items.size(), size_t(1));
    QCOMPARE(result.output->items.front().title, QStringLiteral("New York|now"));
    QCOMPARE(result.output->items.front().badge.value(), QStringLiteral("2"));
    QVERIFY(result.durationMs >= 0);
}

void TestScriptRunner::testStdinIsClosed()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    QVERIFY(writeScript(dir.path(), QStringLiteral("reader.sh"),
                        "#!/bin/sh\n"
                        "input=$(cat)\n"
                        "echo \"{\\\"items\\\":[{\\\"title\\\":\\\"read ${#input}\\\"}]}\"\n"));

    const ScriptResult result = ScriptRunner(dir.path()).execute(QStringLiteral("reader"), QString(), 2000);
    QVERIFY2(result.ok(), qPrintable(result.errorMessage));
    QCOMPARE(result.output->items.front().title, QStringLiteral("read 0"));
}

void TestScriptRunner::testNotFound()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());

    const ScriptResult result = ScriptRunner(dir.path()).execute(QStringLiteral("ghost"), QString(), 1000);
    QCOMPARE(result.status, ScriptResult::Status::NotFound);
    QCOMPARE(result.errorMessage, QStringLiteral("Script 'ghost' not found"));
}

void TestScriptRunner::testInvalidArguments()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    QVERIFY(writeScript(dir.path(), QStringLiteral("any.sh"), "#!/bin/sh\necho '{\"items\":[]}'\n"));

    const ScriptResult result = ScriptRunner(dir.path())
        .execute(QStringLiteral("any"), QStringLiteral("\"unterminated"), 1000);
    QCOMPARE(result.status, ScriptResult::Status::InvalidArguments);
    QVERIFY(result.errorMessage.startsWith(QStringLiteral("Invalid script args for 'any'")));
}

void TestScriptRunner::testNonZeroExitReportsFirstStderrLine()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    QVERIFY(writeScript(dir.path(), QStringLiteral("broken.sh"),
                        "#!/bin/sh\necho 'api key missing' >&2\necho 'second line' >&2\nexit 3\n"));

    const ScriptResult result = ScriptRunner(dir.path()).execute(QStringLiteral("broken"), QString(), 2000);
    QCOMPARE(result.status, ScriptResult::Status::NonZeroExit);
    QCOMPARE(result.errorMessage, QStringLiteral("Script 'broken' error: api key missing"));
}

void TestScriptRunner::testNonZeroExitWithoutStderr()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    QVERIFY(writeScript(dir.path(), QStringLiteral("quiet.sh"), "#!/bin/sh\nexit 4\n"));

    const ScriptResult result = ScriptRunner(dir.path()).execute(QStringLiteral("quiet"), QString(), 2000);
    QCOMPARE(result.status, ScriptResult::Status::NonZeroExit);
    QCOMPARE(result.errorMessage, QStringLiteral("Script 'quiet' exited with code 4"));
}

void TestScriptRunner::testNoOutput()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    QVERIFY(writeScript(dir.path(), QStringLiteral("silent.sh"), "#!/bin/sh\necho '   '\n"));

    const ScriptResult result = ScriptRunner(dir.path()).execute(QStringLiteral("silent"), QString(), 2000);
    QCOMPARE(result.status, ScriptResult::Status::NoOutput);
    QCOMPARE(result.errorMessage, QStringLiteral("Script 'silent' produced no output"));
}

void TestScriptRunner::testInvalidOutput()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    QVERIFY(writeScript(dir.path(), QStringLiteral("chatty.sh"), "#!/bin/sh\necho 'hello world'\n"));

    const ScriptResult result = ScriptRunner(dir.path()).execute(QStringLiteral("chatty"), QString(), 2000);
    QCOMPARE(result.status, ScriptResult::Status::InvalidOutput);
    QCOMPARE(result.errorMessage,
             QStringLiteral("Invalid JSON output from 'chatty'. Run the script manually to debug."));
    QVERIFY(!result.errorMessage.contains(QStringLiteral("hello")));
}

void TestScriptRunner::testTimeoutKillsScript()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    QVERIFY(writeScript(dir.path(), QStringLiteral("slow.sh"),
                        "#!/bin/sh\nsleep 10\necho '{\"items\":[]}'\n"));

    QElapsedTimer timer;
    timer.start();
    const ScriptResult result = ScriptRunner(dir.path()).execute(QStringLiteral("slow"), QString(), 300);
    const qint64 elapsed = timer.elapsed();

    QCOMPARE(result.status, ScriptResult::Status::Timeout);
    QCOMPARE(result.errorMessage, QStringLiteral("Script 'slow' timed out after 300ms"));
    QVERIFY2(elapsed < 2000, qPrintable(QStringLiteral("took %1 ms").arg(elapsed)));
}

void TestScriptRunner::testOversizedOutputIsCapped()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    // 2 MiB on stderr must not block the child; stdout still parses.
    QVERIFY(writeScript(dir.path(), QStringLiteral("noisy.sh"),
                        "#!/bin/sh\n"
                        "head -c 2097152 /dev/zero | tr '\\0' 'x' >&2\n"
                        "echo '{\"items\":[{\"title\":\"done\"}]}'\n"));
    QVERIFY(writeScript(dir.path(), QStringLiteral("flood.sh"),
                        "#!/bin/sh\nhead -c 2097152 /dev/zero | tr '\\0' 'x'\n"));

    const ScriptRunner runner(dir.path());
    const ScriptResult noisy = runner.execute(QStringLiteral("noisy"), QString(), 5000);
    QVERIFY2(noisy.ok(), qPrintable(noisy.errorMessage));
    QCOMPARE(noisy.output->items.front().title, QStringLiteral("done"));

    // Either the writer sees the closed pipe, or it finished first and the
    // truncated text fails to parse.
    const ScriptResult flood = runner.execute(QStringLiteral("flood"), QString(), 5000);
    QVERIFY(flood.status == ScriptResult::Status::NonZeroExit
            || flood.status == ScriptResult::Status::InvalidOutput);
}

void TestScriptRunner::testEndlessWriterStopsAtCapture()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    QVERIFY(writeScript(dir.path(), QStringLiteral("endless.sh"), "#!/bin/sh\nyes\n"));

    QElapsedTimer timer;
    timer.start();
    const ScriptResult result = ScriptRunner(dir.path()).execute(QStringLiteral("endless"), QString(), 10000);
    const qint64 elapsed = timer.elapsed();

    QCOMPARE(result.status, ScriptResult::Status::NonZeroExit);
    QVERIFY2(elapsed < 5000, qPrintable(QStringLiteral("took %1 ms").arg(elapsed)));
}

void TestScriptRunner::testStderrCaptureIsBounded()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    QVERIFY(writeScript(dir.path(), QStringLiteral("spew.sh"),
                        "#!/bin/sh\n"
                        "head -c 8388608 /dev/zero | tr '\\0' 'e' >&2\n"
                        "exit 1\n"));

    QElapsedTimer timer;
    timer.start();
    const ScriptResult result = ScriptRunner(dir.path()).execute(QStringLiteral("spew"), QString(), 10000);
    const qint64 elapsed = timer.elapsed();

    QCOMPARE(result.status, ScriptResult::Status::NonZeroExit);
    QVERIFY(result.errorMessage.startsWith(QStringLiteral("Script 'spew' error: eee")));
    QVERIFY(result.errorMessage.size() <= ScriptRunner::kMaxCaptureBytes + 64);
    QVERIFY2(elapsed < 5000, qPrintable(QStringLiteral("took %1 ms").arg(elapsed)));
}

QTEST_MAIN(TestScriptRunner)
#include "test_script_runner.moc"
