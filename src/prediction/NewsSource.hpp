#pragma once

#include <QDateTime>
#include <QString>
#include <QVector>

#include "prediction/PredictionTypes.hpp"

class NewsSourceInterface {
public:
    struct FetchResult {
        bool                 ok = false;
        QVector<NewsArticle> articles;
        QString              errorMessage;
    };

    virtual ~NewsSourceInterface() = default;

    virtual bool isReady() const = 0;
    virtual FetchResult fetch(const QString& symbol) const = 0;
    //! Article age is measured from `now`; the wall clock is used until this is set.
    virtual void setReferenceTime(const QDateTime& now) { Q_UNUSED(now); }
};

// Reads "<directory>/<symbol>.json", a JSON array of articles with title,
// summary, source and published_at. A missing file means no news.
class DirectoryNewsSource final : public NewsSourceInterface {
public:
    explicit DirectoryNewsSource(QString directory, int maxAgeDays = 7);

    bool isReady() const override;
    FetchResult fetch(const QString& symbol) const override;

    void setReferenceTime(const QDateTime& now) override { m_referenceTime = now; }

private:
    QString   m_directory;
    int       m_maxAgeDays = 7;
    QDateTime m_referenceTime;
};
