#include "ScoringTypes.hpp"

#include <QJsonArray>
#include <QJsonValue>
#include <QtMath>

#include "regime/RegimeTypes.hpp"

namespace screener::subscore {

QStringList all()
{
    return {kPredictionConfidence, kTechnicalStrength, kIndexAlignment, kLiquidity, kVolatility, kSectorMomentum};
}

} // namespace screener::subscore

namespace {

constexpr double kDirectionBand = 0.005;
constexpr double kFullConfidenceMove = 0.02;

QJsonObject mapToJson(const QMap<QString, double>& values)
{
    QJsonObject object;
    for (auto it = values.cbegin(); it != values.cend(); ++it)
        object.insert(it.key(), it.value());
    return object;
}

} // namespace

QJsonObject TechnicalSnapshot::toJson() const
{
    QJsonObject object;
    object.insert(QStringLiteral("price"), price);
    object.insert(QStringLiteral("ma20"), ma20);
    object.insert(QStringLiteral("ma50"), ma50);
    object.insert(QStringLiteral("rsi"), rsi);
    object.insert(QStringLiteral("volatility"), volatility);
    object.insert(QStringLiteral("avg_volume"), avgVolume);
    object.insert(QStringLiteral("volume_cv"), volumeCv);
    object.insert(QStringLiteral("price_vs_ma20"), priceVsMa20Pct);
    object.insert(QStringLiteral("price_vs_ma50"), priceVsMa50Pct);
    return object;
}

MarketContext MarketContext::fromRegime(const RegimeResult& regime)
{
    MarketContext context;
    context.regimeLabel = regime.regimeLabel;
    context.crashRiskScore = qBound(0.0, regime.crashRiskScore, 1.0);

    const double move = regime.indexReturn5d;
    if (!qIsFinite(move))
        return context;
    if (move > kDirectionBand)
        context.direction = screener::market::kBullish;
    else if (move < -kDirectionBand)
        context.direction = screener::market::kBearish;
    context.confidence = qBound(0.0, qAbs(move) / kFullConfidenceMove, 1.0);
    return context;
}

QJsonObject MarketContext::toJson() const
{
    QJsonObject object;
    object.insert(QStringLiteral("index_direction"), direction);
    object.insert(QStringLiteral("confidence"), confidence);
    object.insert(QStringLiteral("crash_risk_score"), crashRiskScore);
    object.insert(QStringLiteral("regime_label"), regimeLabel);
    return object;
}

int ScoredOpportunity::penaltyCount() const
{
    int count = 0;
    for (const ScoreAdjustment& adjustment : adjustments) {
        if (adjustment.amount < 0.0)
            ++count;
    }
    return count;
}

int ScoredOpportunity::bonusCount() const
{
    int count = 0;
    for (const ScoreAdjustment& adjustment : adjustments) {
        if (adjustment.amount > 0.0)
            ++count;
    }
    return count;
}

QJsonObject ScoredOpportunity::toJson() const
{
    QJsonArray adjustmentArray;
    for (const ScoreAdjustment& adjustment : adjustments) {
        QJsonObject entry;
        entry.insert(QStringLiteral("name"), adjustment.name);
        entry.insert(QStringLiteral("amount"), adjustment.amount);
        entry.insert(QStringLiteral("reason"), adjustment.reason);
        adjustmentArray.append(entry);
    }

    QJsonObject object;
    object.insert(QStringLiteral("symbol"), symbol);
    object.insert(QStringLiteral("name"), name);
    object.insert(QStringLiteral("sector"), sector);
    object.insert(QStringLiteral("price"), price);
    object.insert(QStringLiteral("opportunity_score"), opportunityScore);
    object.insert(QStringLiteral("score_breakdown"), mapToJson(breakdown));
    object.insert(QStringLiteral("sub_scores"), mapToJson(subScores));
    object.insert(QStringLiteral("base_total"), baseTotal);
    object.insert(QStringLiteral("adjustments"), adjustmentArray);
    object.insert(QStringLiteral("total_adjustment"), totalAdjustment);
    object.insert(QStringLiteral("macro_betas"), mapToJson(macroBetas));
    object.insert(QStringLiteral("prediction"), prediction);
    object.insert(QStringLiteral("confidence"), confidencePct);
    object.insert(QStringLiteral("predicted_price"),
                  predictedPrice ? QJsonValue(*predictedPrice) : QJsonValue(QJsonValue::Null));
    return object;
}
