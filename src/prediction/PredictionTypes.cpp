#include "PredictionTypes.hpp"

#include <QJsonValue>

namespace {

QJsonObject componentToJson(const ComponentSignal& component)
{
    QJsonObject object;
    object.insert(QStringLiteral("present"), component.present);
    object.insert(QStringLiteral("direction"), component.direction);
    object.insert(QStringLiteral("confidence"), component.confidence);
    if (!component.detail.isEmpty())
        object.insert(QStringLiteral("detail"), component.detail);
    return object;
}

} // namespace

QJsonObject ModelAvailability::toJson() const
{
    QJsonObject object;
    object.insert(QStringLiteral("direction_model_available"), directionModelAvailable);
    object.insert(QStringLiteral("sentiment_available"), sentimentAvailable);
    object.insert(QStringLiteral("news_available"), newsAvailable);
    return object;
}

int PredictionRecord::presentComponents() const
{
    return (directionModel.present ? 1 : 0) + (sentiment.present ? 1 : 0) + (technical.present ? 1 : 0);
}

QJsonObject PredictionRecord::toJson() const
{
    QJsonObject components;
    components.insert(QStringLiteral("direction_model"), componentToJson(directionModel));
    components.insert(QStringLiteral("sentiment"), componentToJson(sentiment));
    components.insert(QStringLiteral("technical"), componentToJson(technical));

    QJsonObject object;
    object.insert(QStringLiteral("symbol"), symbol);
    object.insert(QStringLiteral("prediction"), signal);
    object.insert(QStringLiteral("direction"), direction);
    object.insert(QStringLiteral("confidence"), confidencePct());
    object.insert(QStringLiteral("predicted_price"),
                  predictedPrice ? QJsonValue(*predictedPrice) : QJsonValue(QJsonValue::Null));
    object.insert(QStringLiteral("sentiment_label"), sentimentLabel);
    object.insert(QStringLiteral("article_count"), articleCount);
    object.insert(QStringLiteral("components"), components);
    object.insert(QStringLiteral("availability"), availability.toJson());
    return object;
}
