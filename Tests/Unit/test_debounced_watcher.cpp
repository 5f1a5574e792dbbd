#include <QtTest/QtTest>

#include "core/fs/debounced_watcher.h"

#include <QDir>
#include <QElapsedTimer>
#include <QFile>
#include <QSignalSpy>
#include <QTemporaryDir>

using vanta::DebouncedWatcher;

namespace {

bool writeFile(const QString& path, const QByteArray& content)
{
    QFile file(path);
    return file.open(QIODevice::WriteOnly | QIODevice::Truncate) && file.write(content) == content.size();
}

} // namespace

class TestDebouncedWatcher : public QObject {
    Q_OBJECT

private slots:
    void testBurstProducesSingleTrigger();
    void testMinimumIntervalBetweenTriggers();
    void testMissingFileWatchedThroughParent();
    void testInPlaceEditOfExistingFile();
    void testNameFiltersIgnoreOtherFiles();
};

void TestDebouncedWatcher::testBurstProducesSingleTrigger()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());

    DebouncedWatcher watcher(0, 150);
    QSignalSpy spy(&watcher, &DebouncedWatcher::triggered);
    watcher.setPaths({dir.path()});

    for (int i = 0; i < 5; ++i) {
        QVERIFY(writeFile(dir.filePath(QStringLiteral("f%1.desktop").arg(i)), "x"));
    }

    QTRY_COMPARE_WITH_TIMEOUT(spy.count(), 1, 5000);
    QTest::qWait(400);
    QCOMPARE(spy.count(), 1);
}

void TestDebouncedWatcher::testMinimumIntervalBetweenTriggers()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());

    DebouncedWatcher watcher(800, 0);
    QSignalSpy spy(&watcher, &DebouncedWatcher::triggered);
    watcher.setPaths({dir.path()});

    QVERIFY(writeFile(dir.filePath(QStringLiteral("a")), "1"));
    QTRY_COMPARE_WITH_TIMEOUT(spy.count(), 1, 5000);

    QElapsedTimer sinceFirst;
    sinceFirst.start();
    QVERIFY(writeFile(dir.filePath(QStringLiteral("b")), "2"));
    QTRY_COMPARE_WITH_TIMEOUT(spy.count(), 2, 5000);
    QVERIFY(sinceFirst.elapsed() >= 600);
}

void TestDebouncedWatcher::testMissingFileWatchedThroughParent()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString config = dir.filePath(QStringLiteral("config.json"));

    DebouncedWatcher watcher(0, 50);
    QSignalSpy spy(&watcher, &DebouncedWatcher::triggered);
    watcher.setPaths({config});
    QCOMPARE(watcher.paths(), QStringList{config});

    QVERIFY(writeFile(config, "{}"));
    QTRY_COMPARE_WITH_TIMEOUT(spy.count(), 1, 5000);

    // Promoted to a direct watch once the file exists.
    QVERIFY(writeFile(config, "{\"general\":{}}"));
    QTRY_COMPARE_WITH_TIMEOUT(spy.count(), 2, 5000);
}

void TestDebouncedWatcher::testInPlaceEditOfExistingFile()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString script = dir.filePath(QStringLiteral("weather.sh"));
    QVERIFY(writeFile(script, "#!/bin/sh\n# vanta:name=Weather\n"));

    DebouncedWatcher watcher(0, 50);
    QSignalSpy spy(&watcher, &DebouncedWatcher::triggered);
    watcher.setPaths({dir.path()});

    QVERIFY(writeFile(script, "#!/bin/sh\n# vanta:name=Forecast\n"));
    QTRY_COMPARE_WITH_TIMEOUT(spy.count(), 1, 5000);

    // The watch on the file survives its first trigger.
    QVERIFY(writeFile(script, "#!/bin/sh\n# vanta:name=Radar\n"));
    QTRY_COMPARE_WITH_TIMEOUT(spy.count(), 2, 5000);
}

void TestDebouncedWatcher::testNameFiltersIgnoreOtherFiles()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString notes = dir.filePath(QStringLiteral("notes.txt"));
    const QString entry = dir.filePath(QStringLiteral("editor.desktop"));
    QVERIFY(writeFile(notes, "a"));

    DebouncedWatcher watcher(0, 50);
    watcher.setNameFilters({QStringLiteral("*.desktop")});
    QSignalSpy spy(&watcher, &DebouncedWatcher::triggered);
    watcher.setPaths({dir.path()});
    QCOMPARE(watcher.nameFilters(), QStringList{QStringLiteral("*.desktop")});

    QVERIFY(writeFile(dir.filePath(QStringLiteral("cache.tmp")), "x"));
    QVERIFY(writeFile(notes, "b"));
    QTest::qWait(400);
    QCOMPARE(spy.count(), 0);

    QVERIFY(writeFile(entry, "[Desktop Entry]\nName=Editor\n"));
    QTRY_COMPARE_WITH_TIMEOUT(spy.count(), 1, 5000);

    QVERIFY(writeFile(entry, "[Desktop Entry]\nName=Text Editor\n"));
    QTRY_COMPARE_WITH_TIMEOUT(spy.count(), 2, 5000);
}

QTEST_MAIN(TestDebouncedWatcher)
#include "test_debounced_watcher.moc"
