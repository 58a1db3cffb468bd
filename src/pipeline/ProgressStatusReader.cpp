#include "ProgressStatusReader.hpp"

#include <QDir>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QLoggingCategory>
#include <QStringList>
#include <QTextStream>
#include <QThread>

#include <algorithm>
#include <utility>

#include "pipeline/PipelineProgressTracker.hpp"

Q_LOGGING_CATEGORY(lcStatusReader, "screener.pipeline.status")

bool ProgressStatusReader::Snapshot::isTerminal() const
{
    return overallStatus == screener::status::kComplete || overallStatus == screener::status::kFailed;
}

ProgressStatusReader::ProgressStatusReader(QString progressFile, QString historyDirectory)
    : m_progressFile(std::move(progressFile))
    , m_historyDirectory(std::move(historyDirectory))
{
}

std::optional<ProgressStatusReader::Snapshot> ProgressStatusReader::parse(const QByteArray& data, QString* error)
{
    QJsonParseError parseError{};
    const QJsonDocument document = QJsonDocument::fromJson(data, &parseError);
    if (parseError.error != QJsonParseError::NoError || !document.isObject()) {
        if (error)
            *error = QStringLiteral("invalid progress document: %1").arg(parseError.errorString());
        return std::nullopt;
    }

    const QJsonObject object = document.object();
    Snapshot snapshot;
    snapshot.document = object;
    snapshot.overallStatus = object.value(QStringLiteral("overall_status")).toString(screener::status::kPending);
    snapshot.overallProgress = object.value(QStringLiteral("overall_progress")).toDouble();
    snapshot.lastCompletedStage = object.value(QStringLiteral("last_completed_stage")).toString();
    snapshot.executionTimeFormatted = object.value(QStringLiteral("execution_time_formatted")).toString();
    snapshot.estimatedRemainingFormatted = object.value(QStringLiteral("estimated_remaining_formatted")).toString();
    snapshot.errorCount = object.value(QStringLiteral("errors")).toArray().size();
    snapshot.warningCount = object.value(QStringLiteral("warnings")).toArray().size();
    return snapshot;
}

std::optional<ProgressStatusReader::Snapshot> ProgressStatusReader::load(QString* error) const
{
    QFile file(m_progressFile);
    if (!file.exists()) {
        if (error)
            *error = QStringLiteral("no progress file at %1").arg(m_progressFile);
        return std::nullopt;
    }
    if (!file.open(QIODevice::ReadOnly)) {
        if (error)
            *error = QStringLiteral("cannot open %1: %2").arg(m_progressFile, file.errorString());
        return std::nullopt;
    }
    return parse(file.readAll(), error);
}

QVector<ProgressStatusReader::HistoryEntry> ProgressStatusReader::history(int limit) const
{
    QVector<HistoryEntry> entries;
    const QDir dir(m_historyDirectory);
    if (!dir.exists())
        return entries;

    QStringList files = dir.entryList({QStringLiteral("screener_*.json")}, QDir::Files, QDir::Name);
    std::reverse(files.begin(), files.end());
    for (const QString& name : std::as_const(files)) {
        if (limit >= 0 && entries.size() >= limit)
            break;
        QFile file(dir.filePath(name));
        if (!file.open(QIODevice::ReadOnly)) {
            qCWarning(lcStatusReader) << "Skipping unreadable archive" << file.fileName();
            continue;
        }
        const QJsonDocument document = QJsonDocument::fromJson(file.readAll());
        if (!document.isObject()) {
            qCWarning(lcStatusReader) << "Skipping malformed archive" << file.fileName();
            continue;
        }
        const QJsonObject object = document.object();
        const QJsonObject metrics = object.value(QStringLiteral("metrics")).toObject();

        HistoryEntry entry;
        entry.filePath = file.fileName();
        entry.startTime = QDateTime::fromString(object.value(QStringLiteral("start_time")).toString(), Qt::ISODate);
        entry.overallStatus = object.value(QStringLiteral("overall_status")).toString();
        entry.executionTimeFormatted = object.value(QStringLiteral("execution_time_formatted")).toString();
        entry.stocksScanned = metrics.value(screener::metric::kStocksScanned).toInt();
        entry.opportunitiesFound = metrics.value(screener::metric::kOpportunitiesFound).toInt();
        entry.errorCount = object.value(QStringLiteral("errors")).toArray().size();
        entries.append(entry);
    }
    return entries;
}

std::optional<ProgressStatusReader::Snapshot> ProgressStatusReader::watch(int intervalMs,
                                                                          const WatchCallback& callback,
                                                                          int maxPolls) const
{
    std::optional<Snapshot> last;
    for (int poll = 0; maxPolls < 0 || poll < maxPolls; ++poll) {
        if (poll > 0)
            QThread::msleep(static_cast<unsigned long>(qMax(0, intervalMs)));

        QString error;
        const std::optional<Snapshot> snapshot = load(&error);
        if (!snapshot) {
            qCWarning(lcStatusReader).noquote() << error;
            continue;
        }
        last = snapshot;
        if (callback && !callback(*snapshot))
            break;
        if (snapshot->isTerminal())
            break;
    }
    return last;
}

QString ProgressStatusReader::render(const Snapshot& snapshot)
{
    QString text;
    QTextStream out(&text);
    out << "Status:   " << snapshot.overallStatus.toUpper() << '\n';
    out << "Progress: " << QString::number(snapshot.overallProgress, 'f', 1) << "%\n";
    out << "Elapsed:  " << snapshot.executionTimeFormatted << '\n';
    if (!snapshot.estimatedRemainingFormatted.isEmpty())
        out << "ETA:      " << snapshot.estimatedRemainingFormatted << '\n';
    if (!snapshot.lastCompletedStage.isEmpty())
        out << "Last completed stage: " << snapshot.lastCompletedStage << '\n';

    const QJsonObject stages = snapshot.document.value(QStringLiteral("stages")).toObject();
    for (const QString& name : screener::stage::ordered()) {
        const QJsonObject stage = stages.value(name).toObject();
        out << "  " << name.leftJustified(22) << stage.value(QStringLiteral("status")).toString().leftJustified(10)
            << QString::number(stage.value(QStringLiteral("progress")).toDouble(), 'f', 0).rightJustified(4) << "% "
            << stage.value(QStringLiteral("message")).toString() << '\n';
    }

    const QJsonObject metrics = snapshot.document.value(QStringLiteral("metrics")).toObject();
    out << "Metrics:";
    for (auto it = metrics.constBegin(); it != metrics.constEnd(); ++it)
        out << ' ' << it.key() << '=' << it.value().toInt();
    out << '\n';
    out << "Errors: " << snapshot.errorCount << "  Warnings: " << snapshot.warningCount << '\n';
    out.flush();
    return text;
}
