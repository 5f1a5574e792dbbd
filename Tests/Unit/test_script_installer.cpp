#include <QtTest/QtTest>

#include "core/scripts/script_installer.h"

#include <QDir>
#include <QFile>
#include <QTemporaryDir>

using vanta::InstallResult;
using vanta::LocalScriptInstaller;

namespace {

bool writeFile(const QString& path, const QByteArray& content)
{
    QDir().mkpath(QFileInfo(path).absolutePath());
    QFile file(path);
    return file.open(QIODevice::WriteOnly | QIODevice::Truncate) && file.write(content) == content.size();
}

QByteArray readFile(const QString& path)
{
    QFile file(path);
    return file.open(QIODevice::ReadOnly) ? file.readAll() : QByteArray();
}

} // namespace

class TestScriptInstaller : public QObject {
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    void testInstallsScriptAsExecutable();
    void testStylesheetGoesToThemes();
    void testReplacesExistingScript();
    void testMissingSource();
    void testRemoteSourceUnsupported();
    void testArchiveUnsupported();
    void testDirectoryUnsupported();
    void testInstallingInstalledFileFails();

private:
    std::unique_ptr<QTemporaryDir> m_dir;
    QString m_scripts;
    QString m_themes;
};

void TestScriptInstaller::init()
{
    m_dir = std::make_unique<QTemporaryDir>();
    QVERIFY(m_dir->isValid());
    m_scripts = m_dir->filePath(QStringLiteral("config/scripts"));
    m_themes = m_dir->filePath(QStringLiteral("config/themes"));
}

void TestScriptInstaller::cleanup()
{
    m_dir.reset();
}

void TestScriptInstaller::testInstallsScriptAsExecutable()
{
    const QString source = m_dir->filePath(QStringLiteral("downloads/weather.sh"));
    QVERIFY(writeFile(source, "#!/bin/sh\necho sunny\n"));

    LocalScriptInstaller installer(m_scripts, m_themes);
    const InstallResult result = installer.install(QStringLiteral("  ") + source + QStringLiteral("\n"));
    QVERIFY(result.ok());

    const QString target = QDir(m_scripts).filePath(QStringLiteral("weather.sh"));
    QCOMPARE(result.installedPath, target);
    QCOMPARE(readFile(target), QByteArray("#!/bin/sh\necho sunny\n"));
    QVERIFY(QFileInfo(target).permissions() & QFile::ExeOwner);
    QVERIFY(QFileInfo(target).permissions() & QFile::ExeOther);
    QVERIFY(QFile::exists(source));
}

void TestScriptInstaller::testStylesheetGoesToThemes()
{
    const QString source = m_dir->filePath(QStringLiteral("downloads/Nord.CSS"));
    QVERIFY(writeFile(source, "body {}"));

    LocalScriptInstaller installer(m_scripts, m_themes);
    const InstallResult result = installer.install(source);
    QVERIFY(result.ok());
    QCOMPARE(result.installedPath, QDir(m_themes).filePath(QStringLiteral("Nord.CSS")));
    QVERIFY(!QFileInfo(result.installedPath).isExecutable());
    QVERIFY(!QDir(m_scripts).exists());
}

void TestScriptInstaller::testReplacesExistingScript()
{
    const QString source = m_dir->filePath(QStringLiteral("downloads/tool.py"));
    QVERIFY(writeFile(source, "v2"));
    QVERIFY(writeFile(QDir(m_scripts).filePath(QStringLiteral("tool.py")), "v1"));

    LocalScriptInstaller installer(m_scripts, m_themes);
    QVERIFY(installer.install(source).ok());
    QCOMPARE(readFile(QDir(m_scripts).filePath(QStringLiteral("tool.py"))), QByteArray("v2"));
}

void TestScriptInstaller::testMissingSource()
{
    LocalScriptInstaller installer(m_scripts, m_themes);
    QCOMPARE(installer.install(QString()).status, InstallResult::Status::NotFound);
    QCOMPARE(installer.install(QStringLiteral("   ")).status, InstallResult::Status::NotFound);

    const InstallResult missing = installer.install(m_dir->filePath(QStringLiteral("nope.sh")));
    QCOMPARE(missing.status, InstallResult::Status::NotFound);
    QVERIFY(missing.errorMessage.contains(QStringLiteral("nope.sh")));
}

void TestScriptInstaller::testRemoteSourceUnsupported()
{
    LocalScriptInstaller installer(m_scripts, m_themes);
    QCOMPARE(installer.install(QStringLiteral("https://github.com/user/vanta-scripts")).status,
             InstallResult::Status::Unsupported);
    QCOMPARE(installer.install(QStringLiteral("github.com/user/vanta-scripts")).status,
             InstallResult::Status::Unsupported);
}

void TestScriptInstaller::testArchiveUnsupported()
{
    const QString source = m_dir->filePath(QStringLiteral("downloads/pack.zip"));
    QVERIFY(writeFile(source, "PK"));

    LocalScriptInstaller installer(m_scripts, m_themes);
    QCOMPARE(installer.install(source).status, InstallResult::Status::Unsupported);
    QVERIFY(!QDir(m_scripts).exists());
}

void TestScriptInstaller::testDirectoryUnsupported()
{
    LocalScriptInstaller installer(m_scripts, m_themes);
    QCOMPARE(installer.install(m_dir->path()).status, InstallResult::Status::Unsupported);
}

void TestScriptInstaller::testInstallingInstalledFileFails()
{
    const QString installed = QDir(m_scripts).filePath(QStringLiteral("x.sh"));
    QVERIFY(writeFile(installed, "echo"));

    LocalScriptInstaller installer(m_scripts, m_themes);
    const InstallResult result = installer.install(installed);
    QCOMPARE(result.status, InstallResult::Status::Failed);
    QCOMPARE(readFile(installed), QByteArray("echo"));
}

QTEST_MAIN(TestScriptInstaller)
#include "test_script_installer.moc"
