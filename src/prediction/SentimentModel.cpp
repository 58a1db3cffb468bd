#include "SentimentModel.hpp"

#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QLoggingCategory>
#include <QProcess>
#include <QSet>
#include <QStandardPaths>
#include <QtMath>

#include <utility>

Q_LOGGING_CATEGORY(lcSentiment, "screener.prediction.sentiment")

ProcessSentimentModel::ProcessSentimentModel(QString program, QStringList arguments, int timeoutMs)
    : m_program(std::move(program))
    , m_arguments(std::move(arguments))
    , m_timeoutMs(qMax(1, timeoutMs))
{
}

bool ProcessSentimentModel::isReady() const
{
    if (m_program.trimmed().isEmpty())
        return false;
    const QFileInfo info(m_program);
    if (info.isAbsolute())
        return info.isFile() && info.isExecutable();
    return !QStandardPaths::findExecutable(m_program).isEmpty();
}

double ProcessSentimentModel::directionForLabel(const QString& label)
{
    const QString normalized = label.trimmed().toLower();
    if (normalized == QLatin1String("positive"))
        return 1.0;
    if (normalized == QLatin1String("negative"))
        return -1.0;
    return 0.0;
}

SentimentReading ProcessSentimentModel::analyze(const QString& symbol, const QVector<NewsArticle>& articles) const
{
    SentimentReading reading;
    if (articles.isEmpty())
        return reading;

    QSet<QString> sources;
    QJsonArray payloadArticles;
    for (const NewsArticle& article : articles) {
        payloadArticles.append(QJsonObject{{QStringLiteral("title"), article.title},
                                           {QStringLiteral("summary"), article.summary},
                                           {QStringLiteral("source"), article.source}});
        if (!article.source.isEmpty())
            sources.insert(article.source);
    }
    reading.articleCount = articles.size();
    reading.sources = QStringList(sources.cbegin(), sources.cend());
    reading.sources.sort();

    const QJsonObject payload{{QStringLiteral("symbol"), symbol}, {QStringLiteral("articles"), payloadArticles}};

    QProcess process;
    process.setProgram(m_program);
    process.setArguments(m_arguments);
    process.start();
    if (!process.waitForStarted(m_timeoutMs)) {
        qCWarning(lcSentiment) << "Sentiment model failed to start" << m_program << process.errorString();
        reading.ok = false;
        reading.errorMessage = QStringLiteral("cannot start sentiment model: %1").arg(process.errorString());
        return reading;
    }
    process.write(QJsonDocument(payload).toJson(QJsonDocument::Compact));
    process.closeWriteChannel();

    if (!process.waitForFinished(m_timeoutMs)) {
        process.kill();
        process.waitForFinished(1000);
        qCWarning(lcSentiment) << "Sentiment model timed out for" << symbol;
        reading.ok = false;
        reading.errorMessage = QStringLiteral("sentiment model timed out after %1 ms").arg(m_timeoutMs);
        return reading;
    }
    if (process.exitStatus() != QProcess::NormalExit || process.exitCode() != 0) {
        qCWarning(lcSentiment) << "Sentiment model exited with code" << process.exitCode()
                               << process.readAllStandardError();
        reading.ok = false;
        reading.errorMessage = QStringLiteral("sentiment model exited with code %1").arg(process.exitCode());
        return reading;
    }

    QJsonParseError parseError{};
    const QJsonDocument document = QJsonDocument::fromJson(process.readAllStandardOutput(), &parseError);
    if (document.isNull() || !document.isObject()) {
        reading.ok = false;
        reading.errorMessage = QStringLiteral("unreadable sentiment output: %1").arg(parseError.errorString());
        return reading;
    }

    const QJsonObject object = document.object();
    reading.label = object.value(QStringLiteral("label")).toString(QStringLiteral("neutral")).toLower();
    reading.confidencePct = qBound(0.0, object.value(QStringLiteral("confidence")).toDouble(), 100.0);
    reading.direction = directionForLabel(reading.label) * reading.confidencePct / 100.0;
    return reading;
}
