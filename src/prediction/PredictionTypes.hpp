#pragma once

#include <QDateTime>
#include <QJsonObject>
#include <QString>
#include <QStringList>
#include <QVector>

#include <optional>

namespace screener::signal {
inline const QString kBuy = QStringLiteral("BUY");
inline const QString kSell = QStringLiteral("SELL");
inline const QString kHold = QStringLiteral("HOLD");
} // namespace screener::signal

struct ModelAvailability {
    bool directionModelAvailable = false;
    bool sentimentAvailable = false;
    bool newsAvailable = false;

    QJsonObject toJson() const;
};

// One model family's contribution to a prediction.
struct ComponentSignal {
    bool    present = false;
    double  direction = 0.0;
    double  confidence = 0.0;
    QString detail;
};

struct DirectionForecast {
    bool                  modelTrained = false;
    bool                  dataSufficient = false;
    double                direction = 0.0;
    double                confidence = 0.0;
    std::optional<double> predictedPrice;
    QString               errorMessage;
};

struct NewsArticle {
    QString   title;
    QString   summary;
    QString   source;
    QDateTime publishedAt;
};

struct SentimentReading {
    bool        ok = true;
    QString     label = QStringLiteral("neutral");
    double      confidencePct = 0.0;
    double      direction = 0.0;
    int         articleCount = 0;
    QStringList sources;
    QString     errorMessage;
};

struct PredictionRecord {
    QString               symbol;
    ComponentSignal       directionModel;
    ComponentSignal       sentiment;
    ComponentSignal       technical;
    double                direction = 0.0;
    double                confidence = 0.0;
    QString               signal = screener::signal::kHold;
    std::optional<double> predictedPrice;
    QString               sentimentLabel = QStringLiteral("neutral");
    int                   articleCount = 0;
    ModelAvailability     availability;

    int presentComponents() const;
    double confidencePct() const { return confidence * 100.0; }

    QJsonObject toJson() const;
};
