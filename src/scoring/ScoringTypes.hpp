#pragma once

#include <QJsonObject>
#include <QMap>
#include <QString>
#include <QStringList>
#include <QVector>

#include <optional>

#include "prediction/PredictionTypes.hpp"

struct RegimeResult;

namespace screener::subscore {
inline const QString kPredictionConfidence = QStringLiteral("prediction_confidence");
inline const QString kTechnicalStrength = QStringLiteral("technical_strength");
inline const QString kIndexAlignment = QStringLiteral("index_alignment");
inline const QString kLiquidity = QStringLiteral("liquidity");
inline const QString kVolatility = QStringLiteral("volatility");
inline const QString kSectorMomentum = QStringLiteral("sector_momentum");

QStringList all();
} // namespace screener::subscore

namespace screener::market {
inline const QString kBullish = QStringLiteral("bullish");
inline const QString kBearish = QStringLiteral("bearish");
inline const QString kNeutral = QStringLiteral("neutral");
} // namespace screener::market

// Indicators computed by the universe scan for one symbol.
struct TechnicalSnapshot {
    double price = 0.0;
    double ma20 = 0.0;
    double ma50 = 0.0;
    double rsi = 50.0;
    double volatility = 0.0; //!< daily return standard deviation
    double avgVolume = 0.0;
    double volumeCv = 0.0;
    double priceVsMa20Pct = 0.0;
    double priceVsMa50Pct = 0.0;

    QJsonObject toJson() const;
};

struct StockCandidate {
    QString           symbol;
    QString           name;
    QString           sector;
    double            marketCap = 0.0;
    double            screeningScore = 0.0; //!< 0-100
    TechnicalSnapshot technical;
};

struct ScoringInput {
    StockCandidate        stock;
    PredictionRecord      prediction;
    QMap<QString, double> macroBetas;
};

struct MarketContext {
    QString direction = screener::market::kNeutral;
    double  confidence = 0.0;
    double  crashRiskScore = 0.0;
    QString regimeLabel;

    //! Direction from the 5-day index return (+/-0.5% bands), confidence saturating at 2%.
    static MarketContext fromRegime(const RegimeResult& regime);
    QJsonObject toJson() const;
};

struct ScoreAdjustment {
    QString name;
    double  amount = 0.0; //!< negative for penalties
    QString reason;
};

struct ScoredOpportunity {
    QString                  symbol;
    QString                  name;
    QString                  sector;
    double                   price = 0.0;
    double                   opportunityScore = 0.0;
    QMap<QString, double>    subScores; //!< raw 0-100 values
    QMap<QString, double>    breakdown; //!< weighted contributions
    double                   baseTotal = 0.0;
    QVector<ScoreAdjustment> adjustments;
    double                   totalAdjustment = 0.0;
    QMap<QString, double>    macroBetas;
    QString                  prediction = screener::signal::kHold;
    double                   confidencePct = 0.0;
    std::optional<double>    predictedPrice;

    int penaltyCount() const;
    int bonusCount() const;

    QJsonObject toJson() const;
};
