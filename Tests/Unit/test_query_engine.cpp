#include <QtTest/QtTest>

#include "core/apps/app_index.h"
#include "core/fs/file_index.h"
#include "core/history/history_store.h"
#include "core/query/query_engine.h"
#include "core/windows/window_snapshot.h"

#include <QDir>
#include <QFile>
#include <QTemporaryDir>

using vanta::AppEntry;
using vanta::QueryEngine;
using vanta::ResultSource;
using vanta::SearchResult;
using vanta::Settings;
using vanta::WindowEntry;

namespace {

class StaticWindowSource : public vanta::WindowSource {
public:
    explicit StaticWindowSource(std::vector<WindowEntry> windows)
        : m_windows(std::move(windows))
    {
    }

    QString name() const override { return QStringLiteral("static"); }
    std::optional<std::vector<WindowEntry>> listWindows() override { return m_windows; }

private:
    std::vector<WindowEntry> m_windows;
};

AppEntry makeApp(const QString& name, const QString& exec, const QString& icon,
                 const std::optional<QString>& wmClass = std::nullopt)
{
    AppEntry app;
    app.name = name;
    app.exec = exec;
    app.icon = icon;
    app.startupWmClass = wmClass;
    return app;
}

const SearchResult* findByTitle(const std::vector<SearchResult>& results, const QString& title)
{
    for (const SearchResult& result : results) {
        if (result.title == title) {
            return &result;
        }
    }
    return nullptr;
}

} // namespace

class TestQueryEngine : public QObject {
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    void testCalculatorResult();
    void testApplicationAndWindowResults();
    void testWindowIconFallbacks();
    void testDisabledProviders();
    void testFileQueryReturnsFilesOnly();
    void testFileQueryDisabled();
    void testInstallMissingSource();
    void testInstallLocalFile();
    void testInstallDirectoryCompletion();
    void testInstallIndexedCandidates();
    void testSuggestionsRankedByUsage();
    void testMetricsRecorded();

private:
    std::unique_ptr<QTemporaryDir> m_home;
    std::unique_ptr<vanta::AppIndex> m_apps;
    std::unique_ptr<vanta::FileIndex> m_files;
    std::unique_ptr<vanta::WindowSnapshot> m_windows;
    std::unique_ptr<vanta::HistoryStore> m_history;
    std::unique_ptr<vanta::SearchMetrics> m_metrics;
    std::unique_ptr<QueryEngine> m_engine;
};

void TestQueryEngine::init()
{
    m_home = std::make_unique<QTemporaryDir>();
    QVERIFY(m_home->isValid());
    const QString home = m_home->path();
    QVERIFY(QDir().mkpath(home + QStringLiteral("/Documents/projects")));
    QFile script(home + QStringLiteral("/weather.sh"));
    QVERIFY(script.open(QIODevice::WriteOnly));
    script.close();

    m_apps = std::make_unique<vanta::AppIndex>(QStringList{});
    m_apps->replace({
        vanta::AppIndex::installScriptEntry(),
        makeApp(QStringLiteral("Firefox"), QStringLiteral("firefox %u"),
                QStringLiteral("/icons/firefox.png"), QStringLiteral("firefox-esr")),
        makeApp(QStringLiteral("Kitty"), QStringLiteral("kitty"), QStringLiteral("/icons/kitty.png")),
        makeApp(QStringLiteral("Files"), QStringLiteral("nautilus --new-window"),
                QStringLiteral("/icons/files.png")),
    });

    m_files = std::make_unique<vanta::FileIndex>(home);
    m_files->rebuild(vanta::FilesSettings());

    WindowEntry browser;
    browser.title = QStringLiteral("Mozilla Firefox");
    browser.windowClass = QStringLiteral("firefox-esr");
    browser.address = QStringLiteral("0xabc");
    browser.workspace = QStringLiteral("2");

    WindowEntry terminal;
    terminal.title = QStringLiteral("~/src");
    terminal.windowClass = QStringLiteral("kitty");
    terminal.address = QStringLiteral("0xdef");
    terminal.workspace = QStringLiteral("1");

    WindowEntry manager;
    manager.title = QStringLiteral("Home");
    manager.windowClass = QStringLiteral("files");
    manager.address = QStringLiteral("0x123");
    manager.workspace = QStringLiteral("3");

    std::vector<std::unique_ptr<vanta::WindowSource>> sources;
    sources.push_back(std::make_unique<StaticWindowSource>(
        std::vector<WindowEntry>{browser, terminal, manager}));
    m_windows = std::make_unique<vanta::WindowSnapshot>(std::move(sources));

    m_history = std::make_unique<vanta::HistoryStore>(m_home->filePath(QStringLiteral(".history.json")));
    m_metrics = std::make_unique<vanta::SearchMetrics>();
    m_engine = std::make_unique<QueryEngine>(*m_apps, *m_files, *m_windows, *m_history, *m_metrics, home);
}

void TestQueryEngine::cleanup()
{
    m_engine.reset();
    m_history.reset();
    m_windows.reset();
    m_files.reset();
    m_apps.reset();
    m_metrics.reset();
    m_home.reset();
}

void TestQueryEngine::testCalculatorResult()
{
    const std::vector<SearchResult> results = m_engine->resolve(QStringLiteral("2+2"), Settings());
    QVERIFY(!results.empty());
    const SearchResult& top = results.front();
    QCOMPARE(top.title, QStringLiteral("= 4"));
    QCOMPARE(top.subtitle.value(), QStringLiteral("Click to Copy"));
    QCOMPARE(top.exec, QStringLiteral("copy:4"));
    QCOMPARE(top.score, QueryEngine::kCalculatorBaseScore);
    QCOMPARE(top.source, ResultSource::Calculator);
}

void TestQueryEngine::testApplicationAndWindowResults()
{
    const std::vector<SearchResult> results = m_engine->resolve(QStringLiteral("fire"), Settings());

    const SearchResult* window = findByTitle(results, QStringLiteral("Mozilla Firefox"));
    QVERIFY(window);
    QCOMPARE(window->exec, QStringLiteral("focus:0xabc"));
    QCOMPARE(window->subtitle.value(), QStringLiteral("Switch to Window (Workspace 2)"));
    QCOMPARE(window->icon.value(), QStringLiteral("/icons/firefox.png"));
    QCOMPARE(window->source, ResultSource::Window);

    const SearchResult* app = findByTitle(results, QStringLiteral("Firefox"));
    QVERIFY(app);
    QCOMPARE(app->source, ResultSource::Application);

    // Windows outrank fuzzy app matches at equal weights.
    QCOMPARE(results.front().title, QStringLiteral("Mozilla Firefox"));
    for (size_t i = 1; i < results.size(); ++i) {
        QVERIFY(results[i - 1].score >= results[i].score);
    }
    QVERIFY(!findByTitle(results, QStringLiteral("~/src")));
}

void TestQueryEngine::testWindowIconFallbacks()
{
    const std::vector<SearchResult> byExec = m_engine->resolve(QStringLiteral("kitty"), Settings());
    const SearchResult* terminal = findByTitle(byExec, QStringLiteral("~/src"));
    QVERIFY(terminal);
    QCOMPARE(terminal->icon.value(), QStringLiteral("/icons/kitty.png"));

    const std::vector<SearchResult> byName = m_engine->resolve(QStringLiteral("home"), Settings());
    const SearchResult* manager = findByTitle(byName, QStringLiteral("Home"));
    QVERIFY(manager);
    QCOMPARE(manager->icon.value(), QStringLiteral("/icons/files.png"));
}

void TestQueryEngine::testDisabledProviders()
{
    Settings settings;
    settings.search.windows.enabled = false;
    settings.search.calculator.enabled = false;

    const std::vector<SearchResult> fire = m_engine->resolve(QStringLiteral("fire"), settings);
    QVERIFY(!findByTitle(fire, QStringLiteral("Mozilla Firefox")));
    QVERIFY(findByTitle(fire, QStringLiteral("Firefox")));

    QVERIFY(m_engine->resolve(QStringLiteral("2+2"), settings).empty());

    settings.search.applications.enabled = false;
    QVERIFY(m_engine->resolve(QStringLiteral("fire"), settings).empty());
}

void TestQueryEngine::testFileQueryReturnsFilesOnly()
{
    const std::vector<SearchResult> results = m_engine->resolve(QStringLiteral("/Doc"), Settings());
    QCOMPARE(results.size(), size_t(1));
    QCOMPARE(results[0].title, QStringLiteral("Documents"));
    QCOMPARE(results[0].source, ResultSource::File);
    QCOMPARE(results[0].icon.value(), QStringLiteral("dir"));

    Settings weighted;
    weighted.search.files.weight = 200;
    const std::vector<SearchResult> boosted = m_engine->resolve(QStringLiteral("~/doc"), weighted);
    QCOMPARE(boosted.size(), size_t(1));
    QCOMPARE(boosted[0].score, vanta::FileIndex::kBaseScore * 2);
}

void TestQueryEngine::testFileQueryDisabled()
{
    Settings settings;
    settings.search.files.enabled = false;
    QVERIFY(m_engine->resolve(QStringLiteral("/Doc"), settings).empty());
}

void TestQueryEngine::testInstallMissingSource()
{
    const QString missing = QStringLiteral("/vanta-test-missing-source");
    QVERIFY(!QFileInfo::exists(missing));

    const std::vector<SearchResult> results =
        m_engine->resolve(QStringLiteral("install ") + missing, Settings());
    QVERIFY(!results.empty());
    const SearchResult& top = results.front();
    QCOMPARE(top.title, QStringLiteral("Install Web Script: ") + missing);
    QCOMPARE(top.exec, QStringLiteral("install:") + missing);
    QCOMPARE(top.icon.value(), QStringLiteral("system-software-install"));
    QCOMPARE(top.score, QueryEngine::kInstallActionScore);
}

void TestQueryEngine::testInstallLocalFile()
{
    const QString path = m_home->filePath(QStringLiteral("weather.sh"));
    const std::vector<SearchResult> results =
        m_engine->resolve(QStringLiteral("install ") + path, Settings());
    QVERIFY(!results.empty());
    QCOMPARE(results.front().title, QStringLiteral("Install Local File: weather.sh"));
    QCOMPARE(results.front().exec, QStringLiteral("install:") + path);

    const SearchResult* completion = findByTitle(results, QStringLiteral("weather.sh"));
    QVERIFY(completion);
    QCOMPARE(completion->exec, QStringLiteral("install:") + path);
    QCOMPARE(completion->score, QueryEngine::kInstallFileScore);
}

void TestQueryEngine::testInstallDirectoryCompletion()
{
    const std::vector<SearchResult> results = m_engine->resolve(QStringLiteral("install ~/Doc"), Settings());
    QVERIFY(!results.empty());
    QCOMPARE(results.front().exec, QStringLiteral("install:~/Doc"));

    const SearchResult* dir = findByTitle(results, QStringLiteral("Documents"));
    QVERIFY(dir);
    QCOMPARE(dir->exec, QStringLiteral("fill:install ~/Documents/"));
    QCOMPARE(dir->icon.value(), QStringLiteral("dir"));
    QCOMPARE(dir->score, QueryEngine::kInstallDirScore);

    const std::vector<SearchResult> inside =
        m_engine->resolve(QStringLiteral("install ~/Documents/"), Settings());
    const SearchResult* projects = findByTitle(inside, QStringLiteral("projects"));
    QVERIFY(projects);
    QCOMPARE(projects->exec, QStringLiteral("fill:install ~/Documents/projects/"));
}

void TestQueryEngine::testInstallIndexedCandidates()
{
    const std::vector<SearchResult> results = m_engine->resolve(QStringLiteral("install weather"), Settings());
    const SearchResult* candidate = findByTitle(results, QStringLiteral("weather.sh"));
    QVERIFY(candidate);
    QCOMPARE(candidate->exec, QStringLiteral("install:") + m_home->filePath(QStringLiteral("weather.sh")));
    QVERIFY(candidate->actions.empty());

    const std::vector<SearchResult> remote =
        m_engine->resolve(QStringLiteral("install https://github.com/u/weather"), Settings());
    QVERIFY(!findByTitle(remote, QStringLiteral("weather.sh")));
    QCOMPARE(remote.front().title, QStringLiteral("Install Web Script: https://github.com/u/weather"));
}

void TestQueryEngine::testSuggestionsRankedByUsage()
{
    m_history->increment(QStringLiteral("kitty"));
    m_history->increment(QStringLiteral("kitty"));
    m_history->increment(QStringLiteral("nautilus --new-window"));

    Settings settings;
    settings.maxResults = 2;
    const std::vector<SearchResult> results = m_engine->suggestions(settings);
    QCOMPARE(results.size(), size_t(2));
    QCOMPARE(results[0].title, QStringLiteral("Kitty"));
    QCOMPARE(results[1].title, QStringLiteral("Files"));

    settings.search.applications.enabled = false;
    QVERIFY(m_engine->suggestions(settings).empty());
}

void TestQueryEngine::testMetricsRecorded()
{
    m_engine->resolve(QStringLiteral("a"), Settings());
    m_engine->resolve(QStringLiteral("b"), Settings());
    m_engine->suggestions(Settings());
    QCOMPARE(m_metrics->search.snapshot().calls, uint64_t(2));
    QCOMPARE(m_metrics->suggestions.snapshot().calls, uint64_t(1));
    QCOMPARE(m_metrics->launch.snapshot().calls, uint64_t(0));
}

QTEST_MAIN(TestQueryEngine)
#include "test_query_engine.moc"
