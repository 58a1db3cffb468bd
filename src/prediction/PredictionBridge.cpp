#include "PredictionBridge.hpp"

#include <QLoggingCategory>

#include <utility>

Q_LOGGING_CATEGORY(lcPredictionBridge, "screener.prediction.bridge")

namespace {

ModelAvailability negotiate(const DirectionModelInterface* direction, const SentimentModelInterface* sentiment,
                            const NewsSourceInterface* news)
{
    ModelAvailability availability;
    availability.directionModelAvailable = direction && direction->isReady();
    availability.sentimentAvailable = sentiment && sentiment->isReady();
    availability.newsAvailable = news && news->isReady();

    if (!availability.directionModelAvailable)
        qCWarning(lcPredictionBridge) << "Direction model unavailable; predictions degrade to remaining models";
    if (!availability.sentimentAvailable)
        qCWarning(lcPredictionBridge) << "Sentiment model unavailable";
    if (!availability.newsAvailable)
        qCWarning(lcPredictionBridge) << "News source unavailable";
    return availability;
}

} // namespace

PredictionBridge::PredictionBridge(std::shared_ptr<DirectionModelInterface> directionModel,
                                   std::shared_ptr<SentimentModelInterface> sentimentModel,
                                   std::shared_ptr<NewsSourceInterface> newsSource,
                                   const TechnicalBaseline::Settings& technical)
    : m_directionModel(std::move(directionModel))
    , m_sentimentModel(std::move(sentimentModel))
    , m_newsSource(std::move(newsSource))
    , m_technical(technical)
    , m_availability(negotiate(m_directionModel.get(), m_sentimentModel.get(), m_newsSource.get()))
{
}

PredictionRecord PredictionBridge::predict(const QString& symbol, const PriceSeries& history) const
{
    PredictionRecord record;
    record.symbol = symbol;
    record.technical = m_technical.evaluate(history);

    if (m_availability.directionModelAvailable) {
        const DirectionForecast forecast = m_directionModel->predict(symbol, history);
        if (forecast.modelTrained) {
            record.directionModel.present = true;
            record.directionModel.direction = qBound(-1.0, forecast.direction, 1.0);
            record.directionModel.confidence = qBound(0.0, forecast.confidence, 1.0);
            record.predictedPrice = forecast.predictedPrice;
            record.availability.directionModelAvailable = true;
        } else {
            record.directionModel.detail = forecast.dataSufficient ? QStringLiteral("no trained model")
                                                                   : QStringLiteral("insufficient history");
        }
    }

    if (m_availability.newsAvailable) {
        const NewsSourceInterface::FetchResult news = m_newsSource->fetch(symbol);
        if (!news.ok) {
            qCWarning(lcPredictionBridge) << "News fetch failed for" << symbol << news.errorMessage;
            record.sentiment.detail = news.errorMessage;
        } else if (!news.articles.isEmpty()) {
            record.availability.newsAvailable = true;
            record.articleCount = news.articles.size();
            if (m_availability.sentimentAvailable) {
                const SentimentReading reading = m_sentimentModel->analyze(symbol, news.articles);
                if (reading.ok && reading.articleCount > 0) {
                    record.sentiment.present = true;
                    record.sentiment.direction = qBound(-1.0, reading.direction, 1.0);
                    record.sentiment.confidence = qBound(0.0, reading.confidencePct / 100.0, 1.0);
                    record.sentiment.detail = reading.sources.join(QStringLiteral(", "));
                    record.sentimentLabel = reading.label;
                    record.availability.sentimentAvailable = true;
                } else if (!reading.ok) {
                    qCWarning(lcPredictionBridge) << "Sentiment failed for" << symbol << reading.errorMessage;
                    record.sentiment.detail = reading.errorMessage;
                }
            }
        }
    }

    return record;
}
