#include <QtTest/QtTest>

#include <QDir>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTemporaryDir>

#include "pipeline/PipelineProgressTracker.hpp"
#include "pipeline/ProgressStatusReader.hpp"

namespace {

bool writeJson(const QString& path, const QJsonObject& object)
{
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate))
        return false;
    file.write(QJsonDocument(object).toJson());
    return true;
}

QJsonObject archiveDocument(const QString& status, int scanned, int found)
{
    QJsonObject metrics;
    metrics.insert(screener::metric::kStocksScanned, scanned);
    metrics.insert(screener::metric::kOpportunitiesFound, found);
    QJsonObject document;
    document.insert(QStringLiteral("overall_status"), status);
    document.insert(QStringLiteral("start_time"), QStringLiteral("2024-06-28T02:00:00"));
    document.insert(QStringLiteral("execution_time_formatted"), QStringLiteral("1:02:03"));
    document.insert(QStringLiteral("metrics"), metrics);
    document.insert(QStringLiteral("errors"), QJsonArray{QJsonObject{{QStringLiteral("message"), QStringLiteral("x")}}});
    return document;
}

} // namespace

class ProgressStatusReaderTest : public QObject {
    Q_OBJECT

private slots:
    void parsesTrackerDocument();
    void rejectsMalformedDocument();
    void reportsMissingFile();
    void listsHistoryNewestFirst();
    void watchStopsAtTerminalStatus();
    void watchHonoursPollLimitAndCallback();
    void rendersStages();
};

void ProgressStatusReaderTest::parsesTrackerDocument()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("screener_progress.json"));

    PipelineProgressTracker tracker({path, {}});
    tracker.start();
    tracker.beginStage(screener::stage::kInitialization);
    tracker.completeStage(screener::stage::kInitialization);
    tracker.addWarning(QStringLiteral("ABC: stale data"));

    ProgressStatusReader reader(path, dir.filePath(QStringLiteral("history")));
    QString error;
    const std::optional<ProgressStatusReader::Snapshot> snapshot = reader.load(&error);
    QVERIFY2(snapshot.has_value(), qPrintable(error));
    QCOMPARE(snapshot->overallStatus, screener::status::kRunning);
    QCOMPARE(snapshot->overallProgress, 0.52);
    QCOMPARE(snapshot->lastCompletedStage, screener::stage::kInitialization);
    QCOMPARE(snapshot->warningCount, 1);
    QCOMPARE(snapshot->errorCount, 0);
    QVERIFY(!snapshot->isTerminal());
}

void ProgressStatusReaderTest::rejectsMalformedDocument()
{
    QString error;
    QVERIFY(!ProgressStatusReader::parse(QByteArrayLiteral("{ not json"), &error).has_value());
    QVERIFY(error.contains(QStringLiteral("invalid progress document")));

    const std::optional<ProgressStatusReader::Snapshot> empty = ProgressStatusReader::parse(QByteArrayLiteral("{}"));
    QVERIFY(empty.has_value());
    QCOMPARE(empty->overallStatus, screener::status::kPending);
}

void ProgressStatusReaderTest::reportsMissingFile()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    ProgressStatusReader reader(dir.filePath(QStringLiteral("absent.json")), dir.filePath(QStringLiteral("history")));

    QString error;
    QVERIFY(!reader.load(&error).has_value());
    QVERIFY(error.startsWith(QStringLiteral("no progress file at")));
    QVERIFY(reader.history().isEmpty());
}

void ProgressStatusReaderTest::listsHistoryNewestFirst()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    QDir history(dir.path());
    QVERIFY(history.mkpath(QStringLiteral("history")));
    QVERIFY(history.cd(QStringLiteral("history")));

    QVERIFY(writeJson(history.filePath(QStringLiteral("screener_20240626_020000.json")),
                      archiveDocument(screener::status::kComplete, 100, 4)));
    QVERIFY(writeJson(history.filePath(QStringLiteral("screener_20240628_020000.json")),
                      archiveDocument(screener::status::kFailed, 20, 0)));
    QVERIFY(writeJson(history.filePath(QStringLiteral("screener_20240627_020000.json")),
                      archiveDocument(screener::status::kComplete, 90, 6)));
    QFile junk(history.filePath(QStringLiteral("screener_20240629_020000.json")));
    QVERIFY(junk.open(QIODevice::WriteOnly));
    junk.write("garbage");
    junk.close();
    QVERIFY(writeJson(history.filePath(QStringLiteral("other.json")), QJsonObject{}));

    ProgressStatusReader reader(dir.filePath(QStringLiteral("progress.json")), history.path());
    const QVector<ProgressStatusReader::HistoryEntry> all = reader.history();
    QCOMPARE(all.size(), 3);
    QVERIFY(all.at(0).filePath.endsWith(QStringLiteral("screener_20240628_020000.json")));
    QCOMPARE(all.at(0).overallStatus, screener::status::kFailed);
    QCOMPARE(all.at(1).stocksScanned, 90);
    QCOMPARE(all.at(1).opportunitiesFound, 6);
    QCOMPARE(all.at(2).executionTimeFormatted, QStringLiteral("1:02:03"));
    QCOMPARE(all.at(2).errorCount, 1);
    QCOMPARE(all.at(2).startTime, QDateTime(QDate(2024, 6, 28), QTime(2, 0)));

    const QVector<ProgressStatusReader::HistoryEntry> limited = reader.history(2);
    QCOMPARE(limited.size(), 2);
    QCOMPARE(limited.at(1).stocksScanned, 90);
    QVERIFY(reader.history(0).isEmpty());
}

void ProgressStatusReaderTest::watchStopsAtTerminalStatus()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("progress.json"));
    QVERIFY(writeJson(path, QJsonObject{{QStringLiteral("overall_status"), screener::status::kComplete},
                                        {QStringLiteral("overall_progress"), 100.0}}));

    ProgressStatusReader reader(path, {});
    int polls = 0;
    const std::optional<ProgressStatusReader::Snapshot> last = reader.watch(
        1, [&polls](const ProgressStatusReader::Snapshot&) {
            ++polls;
            return true;
        });
    QVERIFY(last.has_value());
    QCOMPARE(polls, 1);
    QVERIFY(last->isTerminal());
    QCOMPARE(last->overallProgress, 100.0);
}

void ProgressStatusReaderTest::watchHonoursPollLimitAndCallback()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("progress.json"));
    QVERIFY(writeJson(path, QJsonObject{{QStringLiteral("overall_status"), screener::status::kRunning}}));

    ProgressStatusReader reader(path, {});
    int polls = 0;
    const auto counting = [&polls](const ProgressStatusReader::Snapshot&) {
        ++polls;
        return true;
    };
    QVERIFY(reader.watch(1, counting, 3).has_value());
    QCOMPARE(polls, 3);

    polls = 0;
    const auto declining = [&polls](const ProgressStatusReader::Snapshot&) {
        ++polls;
        return false;
    };
    QVERIFY(reader.watch(1, declining, 5).has_value());
    QCOMPARE(polls, 1);

    ProgressStatusReader missing(dir.filePath(QStringLiteral("absent.json")), {});
    QVERIFY(!missing.watch(1, counting, 2).has_value());
}

void ProgressStatusReaderTest::rendersStages()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("progress.json"));
    PipelineProgressTracker tracker({path, {}});
    tracker.start();
    tracker.beginStage(screener::stage::kInitialization);
    tracker.completeStage(screener::stage::kInitialization);
    tracker.beginStage(screener::stage::kRegimeDetection, QStringLiteral("fetching index"));
    tracker.incrementMetric(screener::metric::kStocksScanned, 12);

    const std::optional<ProgressStatusReader::Snapshot> snapshot = ProgressStatusReader(path, {}).load();
    QVERIFY(snapshot.has_value());
    const QString text = ProgressStatusReader::render(*snapshot);
    QVERIFY(text.contains(QStringLiteral("Status:   RUNNING")));
    QVERIFY(text.contains(QStringLiteral("Progress: 0.5%")));
    QVERIFY(text.contains(QStringLiteral("Last completed stage: initialization")));
    QVERIFY(text.contains(QStringLiteral("fetching index")));
    QVERIFY(text.contains(QStringLiteral("stocks_scanned=12")));
    for (const QString& stage : screener::stage::ordered())
        QVERIFY(text.contains(stage));
}

QTEST_GUILESS_MAIN(ProgressStatusReaderTest)
#include "ProgressStatusReaderTest.moc"
