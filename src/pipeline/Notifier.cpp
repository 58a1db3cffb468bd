#include "Notifier.hpp"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QLoggingCategory>
#include <QMutexLocker>

#include <utility>

Q_LOGGING_CATEGORY(lcNotifier, "screener.pipeline.notify")

namespace {

QJsonObject statisticsOf(const QJsonObject& progress)
{
    QJsonObject stats;
    stats.insert(QStringLiteral("overall_status"), progress.value(QStringLiteral("overall_status")));
    stats.insert(QStringLiteral("execution_time_formatted"), progress.value(QStringLiteral("execution_time_formatted")));
    stats.insert(QStringLiteral("metrics"), progress.value(QStringLiteral("metrics")));
    stats.insert(QStringLiteral("error_count"), progress.value(QStringLiteral("errors")).toArray().size());
    stats.insert(QStringLiteral("warning_count"), progress.value(QStringLiteral("warnings")).toArray().size());
    return stats;
}

} // namespace

bool LogNotifier::sendSuccess(const QJsonObject& progress, const QString& reportPath, QString* errorMessage)
{
    Q_UNUSED(errorMessage);
    const QJsonObject metrics = progress.value(QStringLiteral("metrics")).toObject();
    qCInfo(lcNotifier).noquote() << "Pipeline complete in"
                                 << progress.value(QStringLiteral("execution_time_formatted")).toString()
                                 << "| scanned" << metrics.value(QStringLiteral("stocks_scanned")).toInt()
                                 << "| predictions" << metrics.value(QStringLiteral("predictions_generated")).toInt()
                                 << "| opportunities" << metrics.value(QStringLiteral("opportunities_found")).toInt()
                                 << "| report" << reportPath;
    return true;
}

bool LogNotifier::sendFailure(const QString& message, const QJsonObject& progress, QString* errorMessage)
{
    Q_UNUSED(errorMessage);
    qCCritical(lcNotifier).noquote() << "Pipeline failed after"
                                     << progress.value(QStringLiteral("execution_time_formatted")).toString() << ":"
                                     << message;
    return true;
}

FileNotifier::FileNotifier(QString filePath)
    : m_filePath(std::move(filePath))
{
}

bool FileNotifier::sendSuccess(const QJsonObject& progress, const QString& reportPath, QString* errorMessage)
{
    QJsonObject entry;
    entry.insert(QStringLiteral("type"), QStringLiteral("success"));
    entry.insert(QStringLiteral("timestamp"), QDateTime::currentDateTime().toString(Qt::ISODate));
    entry.insert(QStringLiteral("report_path"), reportPath);
    entry.insert(QStringLiteral("statistics"), statisticsOf(progress));
    return appendLine(entry, errorMessage);
}

bool FileNotifier::sendFailure(const QString& message, const QJsonObject& progress, QString* errorMessage)
{
    QJsonObject entry;
    entry.insert(QStringLiteral("type"), QStringLiteral("failure"));
    entry.insert(QStringLiteral("timestamp"), QDateTime::currentDateTime().toString(Qt::ISODate));
    entry.insert(QStringLiteral("message"), message);
    entry.insert(QStringLiteral("statistics"), statisticsOf(progress));
    return appendLine(entry, errorMessage);
}

bool FileNotifier::appendLine(const QJsonObject& entry, QString* errorMessage)
{
    QMutexLocker locker(&m_mutex);
    const QFileInfo info(m_filePath);
    if (!QDir().mkpath(info.absolutePath())) {
        if (errorMessage)
            *errorMessage = QStringLiteral("cannot create %1").arg(info.absolutePath());
        return false;
    }

    QFile file(m_filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Append)) {
        if (errorMessage)
            *errorMessage = QStringLiteral("cannot open %1: %2").arg(m_filePath, file.errorString());
        return false;
    }
    QByteArray line = QJsonDocument(entry).toJson(QJsonDocument::Compact);
    line.append('\n');
    if (file.write(line) != line.size()) {
        if (errorMessage)
            *errorMessage = QStringLiteral("short write to %1: %2").arg(m_filePath, file.errorString());
        return false;
    }
    return true;
}
