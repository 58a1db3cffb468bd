#include <QtTest/QtTest>

#include <QDir>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QSignalSpy>
#include <QTemporaryDir>

#include <memory>

#include "pipeline/PipelineProgressTracker.hpp"

namespace {

class RecordingNotifier final : public NotifierInterface {
public:
    int successCount = 0;
    int failureCount = 0;
    QString lastReportPath;
    QString lastFailure;
    QJsonObject lastProgress;

    bool sendSuccess(const QJsonObject& progress, const QString& reportPath, QString*) override
    {
        ++successCount;
        lastProgress = progress;
        lastReportPath = reportPath;
        return true;
    }

    bool sendFailure(const QString& message, const QJsonObject& progress, QString*) override
    {
        ++failureCount;
        lastFailure = message;
        lastProgress = progress;
        return true;
    }
};

// Manually advanced clock.
struct FakeClock {
    QDateTime current = QDateTime(QDate(2024, 6, 28), QTime(2, 0, 0));
    void advance(int seconds) { current = current.addSecs(seconds); }
};

QJsonObject readDocument(const QString& path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly))
        return {};
    return QJsonDocument::fromJson(file.readAll()).object();
}

void completeAll(PipelineProgressTracker& tracker)
{
    for (const QString& stage : screener::stage::ordered()) {
        QVERIFY(tracker.beginStage(stage));
        QVERIFY(tracker.completeStage(stage));
    }
}

} // namespace

class PipelineProgressTrackerTest : public QObject {
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    void writesInitialDocument();
    void rejectsIllegalTransitions();
    void failedStageNeverReverts();
    void negativeProgressKeepsValue();
    void runningProgressNeverDecreases();
    void reloadShowsLastCompletedStage();
    void weightsOverallProgress();
    void estimatesRemainingTime();
    void notifiesOnceOnSuccess();
    void notifiesOnceOnFailure();
    void markFailedTargetsRunningStage();
    void archivesByStartTime();
    void cancelsRunningStage();
    void tracksMetricsAndMessages();
    void flagsPersistenceFailure();

private:
    std::unique_ptr<QTemporaryDir> m_dir;
    QString progressPath() const { return m_dir->filePath(QStringLiteral("screener_progress.json")); }
};

void PipelineProgressTrackerTest::init()
{
    m_dir = std::make_unique<QTemporaryDir>();
    QVERIFY(m_dir->isValid());
}

void PipelineProgressTrackerTest::cleanup()
{
    m_dir.reset();
}

void PipelineProgressTrackerTest::writesInitialDocument()
{
    PipelineProgressTracker tracker({progressPath(), {}});
    QCOMPARE(tracker.overallStatus(), screener::status::kPending);
    QVERIFY(tracker.start());
    QVERIFY(!tracker.start());

    const QJsonObject document = readDocument(progressPath());
    QCOMPARE(document.value(QStringLiteral("overall_status")).toString(), screener::status::kRunning);
    QCOMPARE(document.value(QStringLiteral("overall_progress")).toDouble(), 0.0);
    QVERIFY(document.value(QStringLiteral("end_time")).isNull());
    QVERIFY(document.value(QStringLiteral("last_completed_stage")).isNull());
    QVERIFY(document.value(QStringLiteral("estimated_remaining_seconds")).isNull());

    const QJsonObject stages = document.value(QStringLiteral("stages")).toObject();
    QCOMPARE(stages.size(), 7);
    const QJsonObject scan = stages.value(screener::stage::kUniverseScan).toObject();
    QCOMPARE(scan.value(QStringLiteral("status")).toString(), screener::status::kPending);
    QCOMPARE(scan.value(QStringLiteral("expected_duration")).toInt(), 30);
    QVERIFY(scan.value(QStringLiteral("start_time")).isNull());

    const QJsonObject metrics = document.value(QStringLiteral("metrics")).toObject();
    QCOMPARE(metrics.value(screener::metric::kStocksScanned).toInt(), 0);
    QCOMPARE(metrics.size(), 4);
    QCOMPARE(tracker.settings().historyDirectory, QDir(m_dir->path()).filePath(QStringLiteral("history")));
}

void PipelineProgressTrackerTest::rejectsIllegalTransitions()
{
    PipelineProgressTracker tracker({progressPath(), {}});
    tracker.start();

    QVERIFY(!tracker.completeStage(screener::stage::kInitialization));
    QCOMPARE(tracker.stageStatus(screener::stage::kInitialization), screener::status::kPending);
    QVERIFY(!tracker.beginStage(QStringLiteral("no_such_stage")));
    QVERIFY(!tracker.updateStage(screener::stage::kInitialization, 10.0, QStringLiteral("paused")));

    QVERIFY(tracker.beginStage(screener::stage::kInitialization));
    QVERIFY(tracker.updateStage(screener::stage::kInitialization, 50.0, screener::status::kRunning));
    QVERIFY(tracker.completeStage(screener::stage::kInitialization));
    QVERIFY(!tracker.beginStage(screener::stage::kInitialization));
    QVERIFY(!tracker.completeStage(screener::stage::kInitialization));
    QVERIFY(!tracker.failStage(screener::stage::kInitialization, QStringLiteral("late")));
    QCOMPARE(tracker.stageStatus(screener::stage::kInitialization), screener::status::kComplete);
}

void PipelineProgressTrackerTest::failedStageNeverReverts()
{
    PipelineProgressTracker tracker({progressPath(), {}});
    tracker.start();
    QVERIFY(tracker.beginStage(screener::stage::kInitialization));
    QVERIFY(tracker.failStage(screener::stage::kInitialization, QStringLiteral("config unreadable")));

    QVERIFY(!tracker.beginStage(screener::stage::kInitialization));
    QVERIFY(!tracker.completeStage(screener::stage::kInitialization));
    QVERIFY(!tracker.updateStage(screener::stage::kInitialization, 100.0, screener::status::kRunning));
    QCOMPARE(tracker.stageStatus(screener::stage::kInitialization), screener::status::kFailed);
    QCOMPARE(tracker.overallStatus(), screener::status::kFailed);

    const QJsonObject document = readDocument(progressPath());
    QCOMPARE(document.value(QStringLiteral("overall_status")).toString(), screener::status::kFailed);
    const QJsonArray errors = document.value(QStringLiteral("errors")).toArray();
    QCOMPARE(errors.size(), 1);
    QCOMPARE(errors.first().toObject().value(QStringLiteral("message")).toString(),
             QStringLiteral("initialization: config unreadable"));
    QVERIFY(!document.value(QStringLiteral("end_time")).isNull());
}

void PipelineProgressTrackerTest::negativeProgressKeepsValue()
{
    PipelineProgressTracker tracker({progressPath(), {}});
    tracker.start();
    QVERIFY(tracker.beginStage(screener::stage::kInitialization));
    QVERIFY(tracker.updateStage(screener::stage::kInitialization, 40.0, screener::status::kRunning));
    QVERIFY(tracker.updateStage(screener::stage::kInitialization, -1.0, screener::status::kRunning, QStringLiteral("still going")));
    QVERIFY(tracker.updateStage(screener::stage::kInitialization, 250.0, screener::status::kRunning));

    const QJsonObject stage = readDocument(progressPath())
                                  .value(QStringLiteral("stages"))
                                  .toObject()
                                  .value(screener::stage::kInitialization)
                                  .toObject();
    QCOMPARE(stage.value(QStringLiteral("progress")).toDouble(), 100.0);

    QVERIFY(tracker.failStage(screener::stage::kInitialization, QStringLiteral("boom")));
    const QJsonObject failed = readDocument(progressPath())
                                   .value(QStringLiteral("stages"))
                                   .toObject()
                                   .value(screener::stage::kInitialization)
                                   .toObject();
    QCOMPARE(failed.value(QStringLiteral("progress")).toDouble(), 100.0);
    QCOMPARE(failed.value(QStringLiteral("status")).toString(), screener::status::kFailed);
}

void PipelineProgressTrackerTest::runningProgressNeverDecreases()
{
    PipelineProgressTracker tracker({progressPath(), {}});
    tracker.start();
    const QString stage = screener::stage::kBatchPrediction;
    QVERIFY(tracker.beginStage(stage));
    QVERIFY(tracker.updateStage(stage, 60.0, screener::status::kRunning, QStringLiteral("6/10")));
    QVERIFY(tracker.updateStage(stage, 30.0, screener::status::kRunning, QStringLiteral("3/10")));

    auto progressOf = [this, &stage]() {
        return readDocument(progressPath())
            .value(QStringLiteral("stages"))
            .toObject()
            .value(stage)
            .toObject()
            .value(QStringLiteral("progress"))
            .toDouble();
    };
    QCOMPARE(progressOf(), 60.0);

    QVERIFY(tracker.updateStage(stage, 75.0, screener::status::kRunning));
    QCOMPARE(progressOf(), 75.0);
    QVERIFY(tracker.completeStage(stage));
    QCOMPARE(progressOf(), 100.0);
}

void PipelineProgressTrackerTest::reloadShowsLastCompletedStage()
{
    {
        PipelineProgressTracker tracker({progressPath(), {}});
        tracker.start();
        tracker.beginStage(screener::stage::kInitialization);
        tracker.completeStage(screener::stage::kInitialization);
        tracker.beginStage(screener::stage::kRegimeDetection);
        tracker.completeStage(screener::stage::kRegimeDetection, QStringLiteral("calm"));
        tracker.beginStage(screener::stage::kUniverseScan, QStringLiteral("scanning"));
        QCOMPARE(tracker.lastCompletedStage(), screener::stage::kRegimeDetection);
    }

    const QJsonObject document = readDocument(progressPath());
    QCOMPARE(document.value(QStringLiteral("last_completed_stage")).toString(), screener::stage::kRegimeDetection);
    const QJsonObject stages = document.value(QStringLiteral("stages")).toObject();
    QCOMPARE(stages.value(screener::stage::kRegimeDetection).toObject().value(QStringLiteral("message")).toString(),
             QStringLiteral("calm"));
    QCOMPARE(stages.value(screener::stage::kUniverseScan).toObject().value(QStringLiteral("status")).toString(),
             screener::status::kRunning);
    QVERIFY(!stages.value(screener::stage::kUniverseScan).toObject().value(QStringLiteral("start_time")).isNull());
}

void PipelineProgressTrackerTest::weightsOverallProgress()
{
    PipelineProgressTracker tracker({progressPath(), {}});
    tracker.start();
    tracker.beginStage(screener::stage::kInitialization);
    tracker.completeStage(screener::stage::kInitialization);
    QCOMPARE(tracker.overallProgress(), 0.52);

    tracker.beginStage(screener::stage::kRegimeDetection);
    tracker.completeStage(screener::stage::kRegimeDetection);
    tracker.beginStage(screener::stage::kUniverseScan);
    tracker.updateStage(screener::stage::kUniverseScan, 50.0, screener::status::kRunning);
    // (2 + 5 + 15) / 382
    QCOMPARE(tracker.overallProgress(), 5.76);
}

void PipelineProgressTrackerTest::estimatesRemainingTime()
{
    auto clock = std::make_shared<FakeClock>();
    PipelineProgressTracker tracker({progressPath(), {}});
    tracker.setClockForTesting([clock]() { return clock->current; });
    tracker.start();
    QVERIFY(!tracker.estimatedRemainingSeconds().has_value());

    tracker.beginStage(screener::stage::kInitialization);
    clock->advance(120);
    tracker.completeStage(screener::stage::kInitialization);
    tracker.beginStage(screener::stage::kRegimeDetection);
    clock->advance(300);
    tracker.completeStage(screener::stage::kRegimeDetection);

    const double fraction = tracker.overallProgress() / 100.0;
    const qint64 expected = qRound64(420.0 * (1.0 - fraction) / fraction);
    const std::optional<qint64> remaining = tracker.estimatedRemainingSeconds();
    QVERIFY(remaining.has_value());
    QCOMPARE(*remaining, expected);

    const QJsonObject document = tracker.toJson();
    QCOMPARE(document.value(QStringLiteral("execution_time_seconds")).toInt(), 420);
    QCOMPARE(document.value(QStringLiteral("execution_time_formatted")).toString(), QStringLiteral("0:07:00"));
    QCOMPARE(static_cast<qint64>(document.value(QStringLiteral("estimated_remaining_seconds")).toDouble()), expected);
    QCOMPARE(document.value(QStringLiteral("estimated_completion_time")).toString(),
             clock->current.addSecs(expected).toString(Qt::ISODate));

    tracker.markFailed(QStringLiteral("stop"));
    QVERIFY(!tracker.estimatedRemainingSeconds().has_value());
}

void PipelineProgressTrackerTest::notifiesOnceOnSuccess()
{
    auto notifier = std::make_shared<RecordingNotifier>();
    PipelineProgressTracker tracker({progressPath(), {}}, notifier);
    QSignalSpy finished(&tracker, &PipelineProgressTracker::pipelineFinished);
    QSignalSpy changed(&tracker, &PipelineProgressTracker::stageChanged);
    tracker.start();
    tracker.setReportPath(QStringLiteral("/reports/pipeline_state_20240628.json"));

    completeAll(tracker);
    QCOMPARE(tracker.overallStatus(), screener::status::kComplete);
    QCOMPARE(tracker.overallProgress(), 100.0);
    QVERIFY(tracker.isFinished());
    QCOMPARE(notifier->successCount, 1);
    QCOMPARE(notifier->failureCount, 0);
    QCOMPARE(notifier->lastReportPath, QStringLiteral("/reports/pipeline_state_20240628.json"));
    QCOMPARE(notifier->lastProgress.value(QStringLiteral("overall_status")).toString(), screener::status::kComplete);
    QCOMPARE(finished.count(), 1);
    QCOMPARE(finished.first().first().toString(), screener::status::kComplete);
    QCOMPARE(changed.count(), 14);

    QVERIFY(!tracker.markFailed(QStringLiteral("after the fact")));
    QCOMPARE(notifier->successCount + notifier->failureCount, 1);
    QCOMPARE(finished.count(), 1);
    QCOMPARE(tracker.overallStatus(), screener::status::kComplete);
}

void PipelineProgressTrackerTest::notifiesOnceOnFailure()
{
    auto notifier = std::make_shared<RecordingNotifier>();
    PipelineProgressTracker tracker({progressPath(), {}}, notifier);
    QSignalSpy finished(&tracker, &PipelineProgressTracker::pipelineFinished);
    tracker.start();
    tracker.beginStage(screener::stage::kInitialization);
    tracker.completeStage(screener::stage::kInitialization);
    tracker.beginStage(screener::stage::kRegimeDetection);

    QVERIFY(tracker.markFailed(QStringLiteral("index feed down")));
    QVERIFY(tracker.failStage(screener::stage::kUniverseScan, QStringLiteral("skipped")));

    QCOMPARE(notifier->failureCount, 1);
    QCOMPARE(notifier->successCount, 0);
    QCOMPARE(notifier->lastFailure, QStringLiteral("index feed down"));
    QCOMPARE(finished.count(), 1);
    QCOMPARE(finished.first().first().toString(), screener::status::kFailed);
}

void PipelineProgressTrackerTest::markFailedTargetsRunningStage()
{
    PipelineProgressTracker tracker({progressPath(), {}});
    tracker.start();
    QVERIFY(tracker.markFailed(QStringLiteral("nothing started")));
    QCOMPARE(tracker.stageStatus(screener::stage::kInitialization), screener::status::kFailed);
    QCOMPARE(tracker.stageStatus(screener::stage::kRegimeDetection), screener::status::kPending);

    PipelineProgressTracker second({m_dir->filePath(QStringLiteral("second.json")), {}});
    second.start();
    second.beginStage(screener::stage::kInitialization);
    second.completeStage(screener::stage::kInitialization);
    second.beginStage(screener::stage::kRegimeDetection);
    QVERIFY(second.markFailed(QStringLiteral("crash")));
    QCOMPARE(second.stageStatus(screener::stage::kRegimeDetection), screener::status::kFailed);
    QCOMPARE(second.stageStatus(screener::stage::kInitialization), screener::status::kComplete);
}

void PipelineProgressTrackerTest::archivesByStartTime()
{
    auto clock = std::make_shared<FakeClock>();
    PipelineProgressTracker tracker({progressPath(), m_dir->filePath(QStringLiteral("archive"))});
    tracker.setClockForTesting([clock]() { return clock->current; });
    tracker.start();
    clock->advance(3600);
    completeAll(tracker);

    const QString expected = QDir(m_dir->filePath(QStringLiteral("archive"))).filePath(QStringLiteral("screener_20240628_020000.json"));
    QCOMPARE(tracker.archivePath(), expected);
    QVERIFY(QFile::exists(expected));

    const QJsonObject archived = readDocument(expected);
    QCOMPARE(archived.value(QStringLiteral("overall_status")).toString(), screener::status::kComplete);
    QCOMPARE(archived.value(QStringLiteral("execution_time_seconds")).toInt(), 3600);
    QCOMPARE(archived.value(QStringLiteral("execution_time_formatted")).toString(), QStringLiteral("1:00:00"));
}

void PipelineProgressTrackerTest::cancelsRunningStage()
{
    PipelineProgressTracker tracker({progressPath(), {}});
    tracker.start();
    QVERIFY(!tracker.requestCancel(screener::stage::kModelRefresh, QStringLiteral("operator")));
    QVERIFY(!tracker.isCancelled(screener::stage::kModelRefresh));

    tracker.beginStage(screener::stage::kInitialization);
    QVERIFY(tracker.requestCancel(screener::stage::kInitialization, QStringLiteral("operator")));
    QVERIFY(tracker.isCancelled(screener::stage::kInitialization));
    const QJsonArray errors = tracker.toJson().value(QStringLiteral("errors")).toArray();
    QCOMPARE(errors.last().toObject().value(QStringLiteral("message")).toString(),
             QStringLiteral("initialization: cancelled: operator"));
}

void PipelineProgressTrackerTest::tracksMetricsAndMessages()
{
    PipelineProgressTracker tracker({progressPath(), {}});
    tracker.start();
    for (int i = 0; i < 5; ++i)
        tracker.incrementMetric(screener::metric::kStocksScanned);
    tracker.incrementMetric(screener::metric::kModelsTrained, 3);
    tracker.setMetric(screener::metric::kOpportunitiesFound, 7);
    tracker.addWarning(QStringLiteral("ABC: 2 missing business days"));
    tracker.addError(QStringLiteral("XYZ: fetch failed"));

    QCOMPARE(tracker.metric(screener::metric::kStocksScanned), 5);
    QCOMPARE(tracker.metric(QStringLiteral("unknown")), 0);

    const QJsonObject document = readDocument(progressPath());
    const QJsonObject metrics = document.value(QStringLiteral("metrics")).toObject();
    QCOMPARE(metrics.value(screener::metric::kModelsTrained).toInt(), 3);
    QCOMPARE(metrics.value(screener::metric::kOpportunitiesFound).toInt(), 7);
    QCOMPARE(document.value(QStringLiteral("warnings")).toArray().size(), 1);
    const QJsonObject error = document.value(QStringLiteral("errors")).toArray().first().toObject();
    QCOMPARE(error.value(QStringLiteral("message")).toString(), QStringLiteral("XYZ: fetch failed"));
    QVERIFY(!error.value(QStringLiteral("timestamp")).toString().isEmpty());
}

void PipelineProgressTrackerTest::flagsPersistenceFailure()
{
    const QString blocker = m_dir->filePath(QStringLiteral("blocker"));
    QFile file(blocker);
    QVERIFY(file.open(QIODevice::WriteOnly));
    file.close();

    PipelineProgressTracker tracker({blocker + QStringLiteral("/progress.json"), {}});
    QVERIFY(!tracker.start());
    QVERIFY(tracker.persistenceFailed());
    QVERIFY(tracker.beginStage(screener::stage::kInitialization));
    QCOMPARE(tracker.stageStatus(screener::stage::kInitialization), screener::status::kRunning);
}

QTEST_GUILESS_MAIN(PipelineProgressTrackerTest)
#include "PipelineProgressTrackerTest.moc"
