#include "NewsSource.hpp"

#include <QDir>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QLoggingCategory>

#include <utility>

Q_LOGGING_CATEGORY(lcNews, "screener.prediction.news")

DirectoryNewsSource::DirectoryNewsSource(QString directory, int maxAgeDays)
    : m_directory(std::move(directory))
    , m_maxAgeDays(maxAgeDays)
{
}

bool DirectoryNewsSource::isReady() const
{
    return !m_directory.trimmed().isEmpty() && QDir(m_directory).exists();
}

NewsSourceInterface::FetchResult DirectoryNewsSource::fetch(const QString& symbol) const
{
    FetchResult result;
    QFile file(QDir(m_directory).filePath(symbol + QStringLiteral(".json")));
    if (!file.exists()) {
        result.ok = true;
        return result;
    }
    if (!file.open(QIODevice::ReadOnly)) {
        result.errorMessage = QStringLiteral("cannot open %1: %2").arg(file.fileName(), file.errorString());
        return result;
    }

    QJsonParseError parseError{};
    const QJsonDocument document = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (document.isNull() || !document.isArray()) {
        qCWarning(lcNews) << "Corrupt news file" << file.fileName() << parseError.errorString();
        result.errorMessage = QStringLiteral("corrupt news file for %1").arg(symbol);
        return result;
    }

    const QDateTime now = m_referenceTime.isValid() ? m_referenceTime : QDateTime::currentDateTimeUtc();
    for (const QJsonValue& value : document.array()) {
        const QJsonObject object = value.toObject();
        NewsArticle article;
        article.title = object.value(QStringLiteral("title")).toString();
        article.summary = object.value(QStringLiteral("summary")).toString();
        article.source = object.value(QStringLiteral("source")).toString();
        article.publishedAt =
            QDateTime::fromString(object.value(QStringLiteral("published_at")).toString(), Qt::ISODate);
        if (article.title.isEmpty() && article.summary.isEmpty())
            continue;
        if (article.publishedAt.isValid() && m_maxAgeDays > 0 && article.publishedAt.daysTo(now) > m_maxAgeDays)
            continue;
        result.articles.append(article);
    }
    result.ok = true;
    return result;
}
