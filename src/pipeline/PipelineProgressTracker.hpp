#pragma once

#include <QDateTime>
#include <QJsonArray>
#include <QJsonObject>
#include <QMap>
#include <QMutex>
#include <QObject>
#include <QPair>
#include <QString>
#include <QStringList>
#include <QVector>

#include <functional>
#include <memory>
#include <optional>

#include "pipeline/Notifier.hpp"

namespace screener::stage {
inline const QString kInitialization = QStringLiteral("initialization");
inline const QString kRegimeDetection = QStringLiteral("regime_detection");
inline const QString kUniverseScan = QStringLiteral("universe_scan");
inline const QString kModelRefresh = QStringLiteral("model_refresh");
inline const QString kBatchPrediction = QStringLiteral("batch_prediction");
inline const QString kOpportunityScoring = QStringLiteral("opportunity_scoring");
inline const QString kReportGeneration = QStringLiteral("report_generation");

//! Execution order.
QStringList ordered();
//! Expected duration in minutes, used as the stage weight for overall progress.
int expectedMinutes(const QString& stage);
} // namespace screener::stage

namespace screener::status {
inline const QString kPending = QStringLiteral("pending");
inline const QString kRunning = QStringLiteral("running");
inline const QString kComplete = QStringLiteral("complete");
inline const QString kFailed = QStringLiteral("failed");
} // namespace screener::status

namespace screener::metric {
inline const QString kStocksScanned = QStringLiteral("stocks_scanned");
inline const QString kModelsTrained = QStringLiteral("models_trained");
inline const QString kPredictionsGenerated = QStringLiteral("predictions_generated");
inline const QString kOpportunitiesFound = QStringLiteral("opportunities_found");
} // namespace screener::metric

// Owns the pipeline progress document. Every accepted mutation rewrites the
// document in full; the first terminal state notifies once and archives.
// All public methods may be called from worker threads.
class PipelineProgressTracker : public QObject {
    Q_OBJECT

public:
    struct Settings {
        QString progressFile;
        QString historyDirectory; //!< defaults to <progress dir>/history
    };

    using Clock = std::function<QDateTime()>;

    explicit PipelineProgressTracker(const Settings& settings,
                                     std::shared_ptr<NotifierInterface> notifier = {},
                                     QObject* parent = nullptr);
    ~PipelineProgressTracker() override;

    bool start();

    //! Applies one stage transition. Illegal transitions and unknown stages are rejected.
    //! A negative progress keeps the stage's current value; a running stage's
    //! progress only increases until the stage leaves the running state.
    bool updateStage(const QString& stage, double progress, const QString& status, const QString& message = {});
    bool beginStage(const QString& stage, const QString& message = {});
    bool completeStage(const QString& stage, const QString& message = {});
    bool failStage(const QString& stage, const QString& message);

    void incrementMetric(const QString& name, int delta = 1);
    void setMetric(const QString& name, int value);
    int metric(const QString& name) const;

    void addError(const QString& message);
    void addWarning(const QString& message);

    //! Fails the running stage, or the first pending stage when none is running.
    bool markFailed(const QString& message);
    void setReportPath(const QString& path);

    //! Marks a running stage failed so the loop that owns it stops at its next unit.
    bool requestCancel(const QString& stage, const QString& reason);
    bool isCancelled(const QString& stage) const;

    QString overallStatus() const;
    double overallProgress() const;
    QString stageStatus(const QString& stage) const;
    QString lastCompletedStage() const;
    std::optional<qint64> estimatedRemainingSeconds() const;
    bool persistenceFailed() const;
    bool isFinished() const;
    QString archivePath() const;
    const Settings& settings() const { return m_settings; }

    QJsonObject toJson() const;

    void setClockForTesting(Clock clock);

signals:
    void stageChanged(const QString& stage, const QString& status);
    void pipelineFinished(const QString& overallStatus);

private:
    struct StageState {
        QString   status;
        double    progress = 0.0;
        QString   message;
        QDateTime startTime;
        QDateTime endTime;
    };

    struct Finish {
        bool        finished = false;
        QString     status;
        QString     failureMessage;
        QJsonObject document;
    };

    QDateTime now() const;
    bool isLegalTransition(const QString& from, const QString& to) const;
    QString overallStatusLocked() const;
    double overallProgressLocked() const;
    std::optional<qint64> remainingLocked(const QDateTime& at) const;
    QJsonObject toJsonLocked() const;
    QJsonArray messagesToJson(const QVector<QPair<QDateTime, QString>>& entries) const;
    bool persistLocked();
    Finish checkFinishedLocked();
    void finish(const Finish& finish);
    bool archive(const QJsonObject& document);

    Settings                           m_settings;
    std::shared_ptr<NotifierInterface> m_notifier;
    Clock                              m_clock;

    mutable QMutex                     m_mutex;
    QMap<QString, StageState>          m_stages;
    QMap<QString, int>                 m_metrics;
    QVector<QPair<QDateTime, QString>> m_errors;
    QVector<QPair<QDateTime, QString>> m_warnings;
    QDateTime                          m_startTime;
    QDateTime                          m_endTime;
    QString                            m_lastCompletedStage;
    QString                            m_lastFailureMessage;
    QString                            m_reportPath;
    QString                            m_archivePath;
    bool                               m_persistenceFailed = false;
    bool                               m_finished = false;
};
