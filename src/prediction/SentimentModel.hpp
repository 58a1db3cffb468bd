#pragma once

#include <QString>
#include <QStringList>
#include <QVector>

#include "prediction/PredictionTypes.hpp"

class SentimentModelInterface {
public:
    virtual ~SentimentModelInterface() = default;

    virtual bool isReady() const = 0;
    //! An empty article list is a neutral reading with article_count 0.
    virtual SentimentReading analyze(const QString& symbol, const QVector<NewsArticle>& articles) const = 0;
};

// Runs an external scoring program per symbol. The program receives
// {"symbol", "articles": [{"title", "summary", "source"}]} on stdin and
// prints {"label", "confidence"} with confidence in percent.
class ProcessSentimentModel final : public SentimentModelInterface {
public:
    ProcessSentimentModel(QString program, QStringList arguments, int timeoutMs = 30000);

    QString program() const { return m_program; }

    bool isReady() const override;
    SentimentReading analyze(const QString& symbol, const QVector<NewsArticle>& articles) const override;

    static double directionForLabel(const QString& label);

private:
    QString     m_program;
    QStringList m_arguments;
    int         m_timeoutMs = 30000;
};
