#include "PipelineProgressTracker.hpp"

#include <QDir>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonValue>
#include <QLoggingCategory>
#include <QMutexLocker>
#include <QSaveFile>
#include <QtMath>

#include <utility>

#include "utils/DurationFormat.hpp"

Q_LOGGING_CATEGORY(lcProgress, "screener.pipeline.progress")

namespace screener::stage {

QStringList ordered()
{
    return {kInitialization, kRegimeDetection,     kUniverseScan,     kModelRefresh,
            kBatchPrediction, kOpportunityScoring, kReportGeneration};
}

int expectedMinutes(const QString& stage)
{
    static const QMap<QString, int> minutes{
        {kInitialization, 2},    {kRegimeDetection, 5},     {kUniverseScan, 30},      {kModelRefresh, 180},
        {kBatchPrediction, 120}, {kOpportunityScoring, 30}, {kReportGeneration, 15},
    };
    return minutes.value(stage, 0);
}

} // namespace screener::stage

namespace {

constexpr double kProgressEpsilon = 1e-6;

QJsonValue timeOrNull(const QDateTime& value)
{
    return value.isValid() ? QJsonValue(value.toString(Qt::ISODate)) : QJsonValue(QJsonValue::Null);
}

bool isTerminal(const QString& status)
{
    return status == screener::status::kComplete || status == screener::status::kFailed;
}

} // namespace

PipelineProgressTracker::PipelineProgressTracker(const Settings& settings,
                                                 std::shared_ptr<NotifierInterface> notifier, QObject* parent)
    : QObject(parent)
    , m_settings(settings)
    , m_notifier(std::move(notifier))
{
    if (m_settings.historyDirectory.isEmpty())
        m_settings.historyDirectory = QFileInfo(m_settings.progressFile).absoluteDir().filePath(QStringLiteral("history"));

    for (const QString& stage : screener::stage::ordered())
        m_stages.insert(stage, StageState{screener::status::kPending, 0.0, {}, {}, {}});
    for (const QString& name : {screener::metric::kStocksScanned, screener::metric::kModelsTrained,
                                screener::metric::kPredictionsGenerated, screener::metric::kOpportunitiesFound})
        m_metrics.insert(name, 0);
}

PipelineProgressTracker::~PipelineProgressTracker() = default;

void PipelineProgressTracker::setClockForTesting(Clock clock)
{
    QMutexLocker locker(&m_mutex);
    m_clock = std::move(clock);
}

QDateTime PipelineProgressTracker::now() const
{
    return m_clock ? m_clock() : QDateTime::currentDateTime();
}

bool PipelineProgressTracker::start()
{
    QMutexLocker locker(&m_mutex);
    if (m_startTime.isValid()) {
        qCWarning(lcProgress) << "Tracker already started at" << m_startTime.toString(Qt::ISODate);
        return false;
    }
    m_startTime = now();
    qCInfo(lcProgress) << "Pipeline started at" << m_startTime.toString(Qt::ISODate);
    return persistLocked();
}

bool PipelineProgressTracker::isLegalTransition(const QString& from, const QString& to) const
{
    if (from == screener::status::kPending)
        return to == screener::status::kRunning || to == screener::status::kFailed;
    if (from == screener::status::kRunning)
        return to == screener::status::kRunning || to == screener::status::kComplete || to == screener::status::kFailed;
    return false;
}

bool PipelineProgressTracker::updateStage(const QString& stage, double progress, const QString& status,
                                          const QString& message)
{
    Finish finished;
    {
        QMutexLocker locker(&m_mutex);
        auto it = m_stages.find(stage);
        if (it == m_stages.end()) {
            qCWarning(lcProgress) << "Unknown stage" << stage;
            return false;
        }
        StageState& state = it.value();
        if (!isLegalTransition(state.status, status)) {
            qCWarning(lcProgress) << "Rejected transition for" << stage << state.status << "->" << status;
            return false;
        }

        const QDateTime at = now();
        if (!m_startTime.isValid())
            m_startTime = at;
        if (state.status == screener::status::kPending && status == screener::status::kRunning)
            state.startTime = at;
        if (isTerminal(status))
            state.endTime = at;

        if (qIsFinite(progress) && progress >= 0.0) {
            const double bounded = qBound(0.0, progress, 100.0);
            // Concurrent workers may report out of order; a running stage never moves back.
            const bool stillRunning =
                state.status == screener::status::kRunning && status == screener::status::kRunning;
            state.progress = stillRunning ? qMax(state.progress, bounded) : bounded;
        }
        state.status = status;
        state.message = message;
        if (status == screener::status::kComplete) {
            state.progress = 100.0;
            m_lastCompletedStage = stage;
        } else if (status == screener::status::kFailed) {
            m_lastFailureMessage = message.isEmpty() ? QStringLiteral("stage %1 failed").arg(stage) : message;
        }

        qCInfo(lcProgress).noquote() << QStringLiteral("Stage '%1': %2% - %3 - %4")
                                            .arg(stage)
                                            .arg(state.progress, 0, 'f', 0)
                                            .arg(status, message);
        finished = checkFinishedLocked();
        persistLocked();
    }
    emit stageChanged(stage, status);
    finish(finished);
    return true;
}

bool PipelineProgressTracker::beginStage(const QString& stage, const QString& message)
{
    return updateStage(stage, 0.0, screener::status::kRunning, message);
}

bool PipelineProgressTracker::completeStage(const QString& stage, const QString& message)
{
    return updateStage(stage, 100.0, screener::status::kComplete, message);
}

bool PipelineProgressTracker::failStage(const QString& stage, const QString& message)
{
    addError(QStringLiteral("%1: %2").arg(stage, message));
    return updateStage(stage, -1.0, screener::status::kFailed, message);
}

void PipelineProgressTracker::incrementMetric(const QString& name, int delta)
{
    QMutexLocker locker(&m_mutex);
    m_metrics[name] += delta;
    persistLocked();
}

void PipelineProgressTracker::setMetric(const QString& name, int value)
{
    QMutexLocker locker(&m_mutex);
    m_metrics[name] = value;
    persistLocked();
}

int PipelineProgressTracker::metric(const QString& name) const
{
    QMutexLocker locker(&m_mutex);
    return m_metrics.value(name, 0);
}

void PipelineProgressTracker::addError(const QString& message)
{
    QMutexLocker locker(&m_mutex);
    m_errors.append({now(), message});
    qCWarning(lcProgress).noquote() << "Error logged:" << message;
    persistLocked();
}

void PipelineProgressTracker::addWarning(const QString& message)
{
    QMutexLocker locker(&m_mutex);
    m_warnings.append({now(), message});
    qCWarning(lcProgress).noquote() << "Warning logged:" << message;
    persistLocked();
}

bool PipelineProgressTracker::markFailed(const QString& message)
{
    QString target;
    {
        QMutexLocker locker(&m_mutex);
        for (const QString& stage : screener::stage::ordered()) {
            if (m_stages.value(stage).status == screener::status::kRunning) {
                target = stage;
                break;
            }
        }
        if (target.isEmpty()) {
            for (const QString& stage : screener::stage::ordered()) {
                if (m_stages.value(stage).status == screener::status::kPending) {
                    target = stage;
                    break;
                }
            }
        }
    }
    if (target.isEmpty()) {
        qCWarning(lcProgress) << "Cannot mark pipeline failed; every stage is already terminal";
        addError(message);
        return false;
    }
    qCCritical(lcProgress).noquote() << "Pipeline marked as FAILED:" << message;
    return failStage(target, message);
}

void PipelineProgressTracker::setReportPath(const QString& path)
{
    QMutexLocker locker(&m_mutex);
    m_reportPath = path;
    persistLocked();
}

bool PipelineProgressTracker::requestCancel(const QString& stage, const QString& reason)
{
    if (stageStatus(stage) != screener::status::kRunning) {
        qCWarning(lcProgress) << "Cancel ignored; stage" << stage << "is not running";
        return false;
    }
    return failStage(stage, QStringLiteral("cancelled: %1").arg(reason));
}

bool PipelineProgressTracker::isCancelled(const QString& stage) const
{
    return stageStatus(stage) == screener::status::kFailed;
}

QString PipelineProgressTracker::stageStatus(const QString& stage) const
{
    QMutexLocker locker(&m_mutex);
    const auto it = m_stages.constFind(stage);
    return it == m_stages.cend() ? QString() : it.value().status;
}

QString PipelineProgressTracker::overallStatus() const
{
    QMutexLocker locker(&m_mutex);
    return overallStatusLocked();
}

double PipelineProgressTracker::overallProgress() const
{
    QMutexLocker locker(&m_mutex);
    return overallProgressLocked();
}

QString PipelineProgressTracker::lastCompletedStage() const
{
    QMutexLocker locker(&m_mutex);
    return m_lastCompletedStage;
}

std::optional<qint64> PipelineProgressTracker::estimatedRemainingSeconds() const
{
    QMutexLocker locker(&m_mutex);
    return remainingLocked(now());
}

bool PipelineProgressTracker::persistenceFailed() const
{
    QMutexLocker locker(&m_mutex);
    return m_persistenceFailed;
}

bool PipelineProgressTracker::isFinished() const
{
    QMutexLocker locker(&m_mutex);
    return m_finished;
}

QString PipelineProgressTracker::archivePath() const
{
    QMutexLocker locker(&m_mutex);
    return m_archivePath;
}

QJsonObject PipelineProgressTracker::toJson() const
{
    QMutexLocker locker(&m_mutex);
    return toJsonLocked();
}

QString PipelineProgressTracker::overallStatusLocked() const
{
    bool allComplete = true;
    bool anyActive = false;
    for (const StageState& state : m_stages) {
        if (state.status == screener::status::kFailed)
            return screener::status::kFailed;
        if (state.status != screener::status::kComplete)
            allComplete = false;
        if (state.status != screener::status::kPending)
            anyActive = true;
    }
    if (allComplete)
        return screener::status::kComplete;
    if (anyActive || m_startTime.isValid())
        return screener::status::kRunning;
    return screener::status::kPending;
}

double PipelineProgressTracker::overallProgressLocked() const
{
    double weighted = 0.0;
    double total = 0.0;
    for (auto it = m_stages.cbegin(); it != m_stages.cend(); ++it) {
        const double weight = screener::stage::expectedMinutes(it.key());
        weighted += weight * it.value().progress / 100.0;
        total += weight;
    }
    if (total <= 0.0)
        return 0.0;
    return qRound(weighted / total * 10000.0) / 100.0;
}

std::optional<qint64> PipelineProgressTracker::remainingLocked(const QDateTime& at) const
{
    const double fraction = overallProgressLocked() / 100.0;
    if (!m_startTime.isValid() || fraction <= 0.0 || overallStatusLocked() != screener::status::kRunning)
        return std::nullopt;
    const double elapsed = m_startTime.msecsTo(at) / 1000.0;
    const double remaining = elapsed * (1.0 - fraction) / qMax(fraction, kProgressEpsilon);
    return qMax<qint64>(0, qRound64(remaining));
}

QJsonArray PipelineProgressTracker::messagesToJson(const QVector<QPair<QDateTime, QString>>& entries) const
{
    QJsonArray array;
    for (const auto& entry : entries) {
        QJsonObject object;
        object.insert(QStringLiteral("timestamp"), timeOrNull(entry.first));
        object.insert(QStringLiteral("message"), entry.second);
        array.append(object);
    }
    return array;
}

QJsonObject PipelineProgressTracker::toJsonLocked() const
{
    const QDateTime current = now();
    qint64 executionSeconds = 0;
    if (m_startTime.isValid())
        executionSeconds = m_startTime.secsTo(m_endTime.isValid() ? m_endTime : current);

    QJsonObject stages;
    for (const QString& name : screener::stage::ordered()) {
        const StageState state = m_stages.value(name);
        QJsonObject stage;
        stage.insert(QStringLiteral("status"), state.status);
        stage.insert(QStringLiteral("progress"), state.progress);
        stage.insert(QStringLiteral("message"), state.message);
        stage.insert(QStringLiteral("expected_duration"), screener::stage::expectedMinutes(name));
        stage.insert(QStringLiteral("start_time"), timeOrNull(state.startTime));
        stage.insert(QStringLiteral("end_time"), timeOrNull(state.endTime));
        stages.insert(name, stage);
    }

    QJsonObject metrics;
    for (auto it = m_metrics.cbegin(); it != m_metrics.cend(); ++it)
        metrics.insert(it.key(), it.value());

    QJsonObject document;
    document.insert(QStringLiteral("overall_status"), overallStatusLocked());
    document.insert(QStringLiteral("overall_progress"), overallProgressLocked());
    document.insert(QStringLiteral("start_time"), timeOrNull(m_startTime));
    document.insert(QStringLiteral("end_time"), timeOrNull(m_endTime));
    document.insert(QStringLiteral("current_time"), current.toString(Qt::ISODate));
    document.insert(QStringLiteral("execution_time_seconds"), executionSeconds);
    document.insert(QStringLiteral("execution_time_formatted"), screener::utils::formatDuration(executionSeconds));

    const std::optional<qint64> remaining = remainingLocked(current);
    if (remaining) {
        document.insert(QStringLiteral("estimated_remaining_seconds"), *remaining);
        document.insert(QStringLiteral("estimated_remaining_formatted"), screener::utils::formatDuration(*remaining));
        document.insert(QStringLiteral("estimated_completion_time"), current.addSecs(*remaining).toString(Qt::ISODate));
    } else {
        document.insert(QStringLiteral("estimated_remaining_seconds"), QJsonValue(QJsonValue::Null));
        document.insert(QStringLiteral("estimated_remaining_formatted"), QJsonValue(QJsonValue::Null));
        document.insert(QStringLiteral("estimated_completion_time"), QJsonValue(QJsonValue::Null));
    }

    document.insert(QStringLiteral("stages"), stages);
    document.insert(QStringLiteral("last_completed_stage"),
                    m_lastCompletedStage.isEmpty() ? QJsonValue(QJsonValue::Null) : QJsonValue(m_lastCompletedStage));
    document.insert(QStringLiteral("metrics"), metrics);
    document.insert(QStringLiteral("errors"), messagesToJson(m_errors));
    document.insert(QStringLiteral("warnings"), messagesToJson(m_warnings));
    if (!m_reportPath.isEmpty())
        document.insert(QStringLiteral("report_path"), m_reportPath);
    return document;
}

bool PipelineProgressTracker::persistLocked()
{
    const QFileInfo info(m_settings.progressFile);
    if (!QDir().mkpath(info.absolutePath())) {
        qCCritical(lcProgress) << "Cannot create progress directory" << info.absolutePath();
        m_persistenceFailed = true;
        return false;
    }

    QSaveFile file(m_settings.progressFile);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        qCCritical(lcProgress) << "Cannot open progress file" << m_settings.progressFile << file.errorString();
        m_persistenceFailed = true;
        return false;
    }
    file.write(QJsonDocument(toJsonLocked()).toJson(QJsonDocument::Indented));
    if (!file.commit()) {
        qCCritical(lcProgress) << "Failed to save progress to" << m_settings.progressFile << file.errorString();
        m_persistenceFailed = true;
        return false;
    }
    return true;
}

PipelineProgressTracker::Finish PipelineProgressTracker::checkFinishedLocked()
{
    Finish result;
    if (m_finished)
        return result;
    const QString status = overallStatusLocked();
    if (!isTerminal(status))
        return result;

    m_finished = true;
    m_endTime = now();
    result.finished = true;
    result.status = status;
    result.failureMessage = m_lastFailureMessage;
    result.document = toJsonLocked();
    return result;
}

bool PipelineProgressTracker::archive(const QJsonObject& document)
{
    QDateTime key;
    {
        QMutexLocker locker(&m_mutex);
        key = m_startTime.isValid() ? m_startTime : m_endTime;
    }

    QDir dir(m_settings.historyDirectory);
    if (!dir.exists() && !dir.mkpath(QStringLiteral("."))) {
        qCWarning(lcProgress) << "Cannot create history directory" << m_settings.historyDirectory;
        return false;
    }
    const QString path =
        dir.filePath(QStringLiteral("screener_%1.json").arg(key.toString(QStringLiteral("yyyyMMdd_HHmmss"))));
    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        qCWarning(lcProgress) << "Cannot open archive" << path << file.errorString();
        return false;
    }
    file.write(QJsonDocument(document).toJson(QJsonDocument::Indented));
    if (!file.commit()) {
        qCWarning(lcProgress) << "Failed to archive progress to" << path << file.errorString();
        return false;
    }

    QMutexLocker locker(&m_mutex);
    m_archivePath = path;
    qCInfo(lcProgress) << "Progress archived to" << path;
    return true;
}

void PipelineProgressTracker::finish(const Finish& finished)
{
    if (!finished.finished)
        return;

    archive(finished.document);

    if (m_notifier) {
        QString error;
        bool sent = false;
        if (finished.status == screener::status::kComplete) {
            sent = m_notifier->sendSuccess(finished.document,
                                           finished.document.value(QStringLiteral("report_path")).toString(), &error);
        } else {
            sent = m_notifier->sendFailure(finished.failureMessage, finished.document, &error);
        }
        if (!sent)
            qCWarning(lcProgress) << "Notification delivery failed:" << error;
    }

    qCInfo(lcProgress) << "Pipeline finished with status" << finished.status;
    emit pipelineFinished(finished.status);
}
