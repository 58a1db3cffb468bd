#include "OpportunityScorer.hpp"

#include <QJsonArray>
#include <QLoggingCategory>
#include <QtMath>

#include <algorithm>
#include <utility>

Q_LOGGING_CATEGORY(lcScoring, "screener.scoring")

namespace {

constexpr double kNeutralBeta = 1.0;

double clampUnit(double value)
{
    return qIsFinite(value) ? qBound(0.0, value, 1.0) : 0.0;
}

bool isAligned(const QString& signal, const QString& marketDirection)
{
    return (signal == screener::signal::kBuy && marketDirection == screener::market::kBullish)
        || (signal == screener::signal::kSell && marketDirection == screener::market::kBearish);
}

bool isOpposed(const QString& signal, const QString& marketDirection)
{
    return (signal == screener::signal::kSell && marketDirection == screener::market::kBullish)
        || (signal == screener::signal::kBuy && marketDirection == screener::market::kBearish);
}

double marketBetaOf(const ScoringInput& input, const QString& factor)
{
    const auto it = input.macroBetas.constFind(factor);
    if (it == input.macroBetas.cend() || !qIsFinite(it.value()))
        return kNeutralBeta;
    return it.value();
}

bool scoreDescending(const ScoredOpportunity& lhs, const ScoredOpportunity& rhs)
{
    if (lhs.opportunityScore != rhs.opportunityScore)
        return lhs.opportunityScore > rhs.opportunityScore;
    return lhs.symbol < rhs.symbol;
}

} // namespace

QJsonObject OpportunityScorer::Summary::toJson() const
{
    QJsonArray topArray;
    for (const ScoredOpportunity& opportunity : top) {
        QJsonObject entry;
        entry.insert(QStringLiteral("symbol"), opportunity.symbol);
        entry.insert(QStringLiteral("name"), opportunity.name);
        entry.insert(QStringLiteral("score"), opportunity.opportunityScore);
        entry.insert(QStringLiteral("prediction"), opportunity.prediction);
        entry.insert(QStringLiteral("confidence"), opportunity.confidencePct);
        entry.insert(QStringLiteral("price"), opportunity.price);
        topArray.append(entry);
    }

    QJsonObject object;
    object.insert(QStringLiteral("total_scored"), totalScored);
    object.insert(QStringLiteral("avg_score"), avgScore);
    object.insert(QStringLiteral("high_count"), highCount);
    object.insert(QStringLiteral("medium_count"), mediumCount);
    object.insert(QStringLiteral("low_count"), lowCount);
    object.insert(QStringLiteral("top_opportunities"), topArray);
    return object;
}

OpportunityScorer::OpportunityScorer(const ScoringConfig& config)
    : m_config(config)
{
}

double OpportunityScorer::predictionConfidenceScore(const PredictionRecord& prediction)
{
    double multiplier = 0.5;
    if (prediction.signal == screener::signal::kBuy)
        multiplier = 1.2;
    else if (prediction.signal == screener::signal::kSell)
        multiplier = 0.8;
    return clampUnit(prediction.confidence * multiplier) * 100.0;
}

double OpportunityScorer::technicalStrengthScore(const StockCandidate& stock)
{
    const double rsi = stock.technical.rsi;
    double rsiScore = 0.4;
    if (rsi >= 40.0 && rsi <= 60.0)
        rsiScore = 1.0;
    else if (rsi >= 30.0 && rsi <= 70.0)
        rsiScore = 0.8;
    else if (rsi < 30.0)
        rsiScore = 0.9;

    const double maScore = stock.technical.priceVsMa20Pct > 0.0 ? 1.0 : 0.5;
    const double screenScore = clampUnit(stock.screeningScore / 100.0);
    return clampUnit(rsiScore * 0.3 + maScore * 0.3 + screenScore * 0.4) * 100.0;
}

double OpportunityScorer::indexAlignmentScore(const PredictionRecord& prediction, const MarketContext& market)
{
    double alignment = 0.3;
    if (isAligned(prediction.signal, market.direction))
        alignment = 1.0;
    else if (prediction.signal == screener::signal::kHold || market.direction == screener::market::kNeutral)
        alignment = 0.5;

    const double confidence = clampUnit(market.confidence);
    return clampUnit(alignment * confidence + 0.5 * (1.0 - confidence)) * 100.0;
}

double OpportunityScorer::liquidityScore(const StockCandidate& stock)
{
    const double volume = stock.technical.avgVolume;
    double volumeScore = 0.2;
    if (volume > 5'000'000.0)
        volumeScore = 1.0;
    else if (volume > 2'000'000.0)
        volumeScore = 0.8;
    else if (volume > 1'000'000.0)
        volumeScore = 0.6;
    else if (volume > 500'000.0)
        volumeScore = 0.4;

    const double cap = stock.marketCap;
    double capScore = 0.4;
    if (cap > 10e9)
        capScore = 1.0;
    else if (cap > 5e9)
        capScore = 0.8;
    else if (cap > 1e9)
        capScore = 0.6;

    return clampUnit(volumeScore * 0.6 + capScore * 0.4) * 100.0;
}

double OpportunityScorer::volatilityScore(const StockCandidate& stock, double marketBeta)
{
    const double vol = stock.technical.volatility;
    double volScore = 0.4;
    if (vol < 0.02)
        volScore = 1.0;
    else if (vol < 0.04)
        volScore = 0.8;
    else if (vol < 0.06)
        volScore = 0.6;

    double betaScore = 0.5;
    if (marketBeta >= 0.8 && marketBeta <= 1.3)
        betaScore = 1.0;
    else if (marketBeta >= 0.5 && marketBeta <= 1.5)
        betaScore = 0.8;

    return clampUnit(volScore * 0.7 + betaScore * 0.3) * 100.0;
}

double OpportunityScorer::sectorMomentumScore(const StockCandidate& stock)
{
    return clampUnit(stock.screeningScore / 100.0) * 100.0;
}

QVector<ScoreAdjustment> OpportunityScorer::adjustmentsFor(const ScoringInput& input, const MarketContext& market,
                                                           double marketBeta) const
{
    const ScoringConfig::Adjustments& cfg = m_config.adjustments();
    const TechnicalSnapshot& technical = input.stock.technical;
    const QString& signal = input.prediction.signal;

    QVector<ScoreAdjustment> adjustments;
    auto add = [&adjustments](const QString& name, double amount, const QString& reason) {
        if (!qFuzzyIsNull(amount))
            adjustments.append({name, amount, reason});
    };

    if (technical.avgVolume < cfg.lowVolumeThreshold) {
        add(QStringLiteral("low_volume"), -cfg.lowVolumePenalty,
            QStringLiteral("average volume %1 below %2").arg(technical.avgVolume, 0, 'f', 0)
                .arg(cfg.lowVolumeThreshold, 0, 'f', 0));
    }
    if (technical.volatility > cfg.extremeVolatilityThreshold) {
        add(QStringLiteral("extreme_volatility"), -cfg.extremeVolatilityPenalty,
            QStringLiteral("daily volatility %1 above %2").arg(technical.volatility, 0, 'f', 4)
                .arg(cfg.extremeVolatilityThreshold, 0, 'f', 4));
    }
    if (isOpposed(signal, market.direction) && market.confidence >= cfg.contrarianMinConfidence) {
        add(QStringLiteral("contrarian"), -cfg.contrarianPenalty,
            QStringLiteral("%1 against a %2 index").arg(signal, market.direction));
    }
    if (market.crashRiskScore >= cfg.crashRiskThreshold && marketBeta > cfg.highBetaThreshold) {
        add(QStringLiteral("high_crash_risk"), -cfg.highCrashRiskPenalty,
            QStringLiteral("crash risk %1 with beta %2").arg(market.crashRiskScore, 0, 'f', 2)
                .arg(marketBeta, 0, 'f', 2));
    }
    if (input.stock.screeningScore >= cfg.sectorLeaderThreshold) {
        add(QStringLiteral("sector_leader"), cfg.sectorLeaderBonus,
            QStringLiteral("screening score %1").arg(input.stock.screeningScore, 0, 'f', 1));
    }
    if (isAligned(signal, market.direction) && input.prediction.confidence >= cfg.strongAlignmentConfidence) {
        add(QStringLiteral("strong_index_alignment"), cfg.strongAlignmentBonus,
            QStringLiteral("%1 with a %2 index").arg(signal, market.direction));
    }
    return adjustments;
}

ScoredOpportunity OpportunityScorer::scoreOne(const ScoringInput& input, const MarketContext& market) const
{
    const ScoringConfig::Weights& weights = m_config.weights();
    const double marketBeta = marketBetaOf(input, m_config.adjustments().marketBetaFactor);

    ScoredOpportunity result;
    result.symbol = input.stock.symbol;
    result.name = input.stock.name;
    result.sector = input.stock.sector;
    result.price = input.stock.technical.price;
    result.macroBetas = input.macroBetas;
    result.prediction = input.prediction.signal;
    result.confidencePct = input.prediction.confidencePct();
    result.predictedPrice = input.prediction.predictedPrice;

    const struct {
        const QString& name;
        double         weight;
        double         raw;
    } parts[] = {
        {screener::subscore::kPredictionConfidence, weights.predictionConfidence,
         predictionConfidenceScore(input.prediction)},
        {screener::subscore::kTechnicalStrength, weights.technicalStrength, technicalStrengthScore(input.stock)},
        {screener::subscore::kIndexAlignment, weights.indexAlignment, indexAlignmentScore(input.prediction, market)},
        {screener::subscore::kLiquidity, weights.liquidity, liquidityScore(input.stock)},
        {screener::subscore::kVolatility, weights.volatility, volatilityScore(input.stock, marketBeta)},
        {screener::subscore::kSectorMomentum, weights.sectorMomentum, sectorMomentumScore(input.stock)},
    };

    for (const auto& part : parts) {
        const double weighted = part.weight * part.raw;
        result.subScores.insert(part.name, part.raw);
        result.breakdown.insert(part.name, weighted);
        result.baseTotal += weighted;
    }

    result.adjustments = adjustmentsFor(input, market, marketBeta);
    for (const ScoreAdjustment& adjustment : std::as_const(result.adjustments))
        result.totalAdjustment += adjustment.amount;

    result.opportunityScore = qBound(0.0, result.baseTotal + result.totalAdjustment, 100.0);
    return result;
}

QVector<ScoredOpportunity> OpportunityScorer::score(const QVector<ScoringInput>& inputs,
                                                    const MarketContext& market) const
{
    QVector<ScoredOpportunity> scored;
    scored.reserve(inputs.size());
    for (const ScoringInput& input : inputs)
        scored.append(scoreOne(input, market));
    std::sort(scored.begin(), scored.end(), scoreDescending);
    qCInfo(lcScoring) << "Scored" << scored.size() << "opportunities against a" << market.direction << "index";
    return scored;
}

QVector<ScoredOpportunity> OpportunityScorer::filterTopOpportunities(const QVector<ScoredOpportunity>& scored,
                                                                     double minScore, int topN)
{
    QVector<ScoredOpportunity> filtered;
    for (const ScoredOpportunity& opportunity : scored) {
        if (opportunity.opportunityScore >= minScore)
            filtered.append(opportunity);
    }
    std::sort(filtered.begin(), filtered.end(), scoreDescending);
    if (topN >= 0 && filtered.size() > topN)
        filtered.resize(topN);
    return filtered;
}

OpportunityScorer::Summary OpportunityScorer::summarize(const QVector<ScoredOpportunity>& scored, int topN)
{
    Summary summary;
    summary.totalScored = scored.size();
    double total = 0.0;
    for (const ScoredOpportunity& opportunity : scored) {
        total += opportunity.opportunityScore;
        if (opportunity.opportunityScore >= kHighScore)
            ++summary.highCount;
        else if (opportunity.opportunityScore >= kMediumScore)
            ++summary.mediumCount;
        else
            ++summary.lowCount;
    }
    if (summary.totalScored > 0)
        summary.avgScore = total / summary.totalScored;

    summary.top = scored;
    std::sort(summary.top.begin(), summary.top.end(), scoreDescending);
    if (summary.top.size() > topN)
        summary.top.resize(qMax(0, topN));
    return summary;
}
