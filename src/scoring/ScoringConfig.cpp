#include "ScoringConfig.hpp"

#include <cmath>

namespace {

void readDouble(const QJsonObject& object, const char* key, double& target)
{
    const QString name = QString::fromLatin1(key);
    if (object.contains(name) && object.value(name).isDouble())
        target = object.value(name).toDouble();
}

} // namespace

double ScoringConfig::Weights::sum() const
{
    return predictionConfidence + technicalStrength + indexAlignment + liquidity + volatility + sectorMomentum;
}

ScoringConfig::ScoringConfig(const Weights& weights, const Adjustments& adjustments)
    : m_weights(weights)
    , m_adjustments(adjustments)
{
}

ScoringConfig ScoringConfig::defaults()
{
    return ScoringConfig(Weights{}, Adjustments{});
}

std::optional<ScoringConfig> ScoringConfig::create(const Weights& weights, const Adjustments& adjustments,
                                                   QString* error)
{
    const double values[] = {weights.predictionConfidence, weights.technicalStrength, weights.indexAlignment,
                             weights.liquidity, weights.volatility, weights.sectorMomentum};
    for (double value : values) {
        if (!std::isfinite(value) || value < 0.0) {
            if (error)
                *error = QStringLiteral("scoring weights must be finite and non-negative");
            return std::nullopt;
        }
    }
    const double total = weights.sum();
    if (std::abs(total - 1.0) > kWeightTolerance) {
        if (error)
            *error = QStringLiteral("scoring weights sum to %1, expected 1").arg(total, 0, 'g', 10);
        return std::nullopt;
    }
    const double penalties[] = {adjustments.lowVolumePenalty, adjustments.extremeVolatilityPenalty,
                                adjustments.contrarianPenalty, adjustments.highCrashRiskPenalty,
                                adjustments.sectorLeaderBonus, adjustments.strongAlignmentBonus};
    for (double value : penalties) {
        if (!std::isfinite(value) || value < 0.0) {
            if (error)
                *error = QStringLiteral("adjustment magnitudes must be non-negative");
            return std::nullopt;
        }
    }
    return ScoringConfig(weights, adjustments);
}

std::optional<ScoringConfig> ScoringConfig::fromJson(const QJsonObject& object, QString* error)
{
    Weights weights;
    const QJsonObject w = object.value(QStringLiteral("weights")).toObject();
    readDouble(w, "prediction_confidence", weights.predictionConfidence);
    readDouble(w, "technical_strength", weights.technicalStrength);
    readDouble(w, "index_alignment", weights.indexAlignment);
    readDouble(w, "liquidity", weights.liquidity);
    readDouble(w, "volatility", weights.volatility);
    readDouble(w, "sector_momentum", weights.sectorMomentum);

    Adjustments adjustments;
    const QJsonObject a = object.value(QStringLiteral("adjustments")).toObject();
    readDouble(a, "low_volume_penalty", adjustments.lowVolumePenalty);
    readDouble(a, "low_volume_threshold", adjustments.lowVolumeThreshold);
    readDouble(a, "extreme_volatility_penalty", adjustments.extremeVolatilityPenalty);
    readDouble(a, "extreme_volatility_threshold", adjustments.extremeVolatilityThreshold);
    readDouble(a, "contrarian_penalty", adjustments.contrarianPenalty);
    readDouble(a, "contrarian_min_confidence", adjustments.contrarianMinConfidence);
    readDouble(a, "high_crash_risk_penalty", adjustments.highCrashRiskPenalty);
    readDouble(a, "crash_risk_threshold", adjustments.crashRiskThreshold);
    readDouble(a, "high_beta_threshold", adjustments.highBetaThreshold);
    readDouble(a, "sector_leader_bonus", adjustments.sectorLeaderBonus);
    readDouble(a, "sector_leader_threshold", adjustments.sectorLeaderThreshold);
    readDouble(a, "strong_alignment_bonus", adjustments.strongAlignmentBonus);
    readDouble(a, "strong_alignment_confidence", adjustments.strongAlignmentConfidence);
    if (a.contains(QStringLiteral("market_beta_factor")))
        adjustments.marketBetaFactor = a.value(QStringLiteral("market_beta_factor")).toString();

    return create(weights, adjustments, error);
}

QJsonObject ScoringConfig::toJson() const
{
    QJsonObject weights;
    weights.insert(QStringLiteral("prediction_confidence"), m_weights.predictionConfidence);
    weights.insert(QStringLiteral("technical_strength"), m_weights.technicalStrength);
    weights.insert(QStringLiteral("index_alignment"), m_weights.indexAlignment);
    weights.insert(QStringLiteral("liquidity"), m_weights.liquidity);
    weights.insert(QStringLiteral("volatility"), m_weights.volatility);
    weights.insert(QStringLiteral("sector_momentum"), m_weights.sectorMomentum);

    QJsonObject adjustments;
    adjustments.insert(QStringLiteral("low_volume_penalty"), m_adjustments.lowVolumePenalty);
    adjustments.insert(QStringLiteral("low_volume_threshold"), m_adjustments.lowVolumeThreshold);
    adjustments.insert(QStringLiteral("extreme_volatility_penalty"), m_adjustments.extremeVolatilityPenalty);
    adjustments.insert(QStringLiteral("extreme_volatility_threshold"), m_adjustments.extremeVolatilityThreshold);
    adjustments.insert(QStringLiteral("contrarian_penalty"), m_adjustments.contrarianPenalty);
    adjustments.insert(QStringLiteral("contrarian_min_confidence"), m_adjustments.contrarianMinConfidence);
    adjustments.insert(QStringLiteral("high_crash_risk_penalty"), m_adjustments.highCrashRiskPenalty);
    adjustments.insert(QStringLiteral("crash_risk_threshold"), m_adjustments.crashRiskThreshold);
    adjustments.insert(QStringLiteral("high_beta_threshold"), m_adjustments.highBetaThreshold);
    adjustments.insert(QStringLiteral("sector_leader_bonus"), m_adjustments.sectorLeaderBonus);
    adjustments.insert(QStringLiteral("sector_leader_threshold"), m_adjustments.sectorLeaderThreshold);
    adjustments.insert(QStringLiteral("strong_alignment_bonus"), m_adjustments.strongAlignmentBonus);
    adjustments.insert(QStringLiteral("strong_alignment_confidence"), m_adjustments.strongAlignmentConfidence);
    adjustments.insert(QStringLiteral("market_beta_factor"), m_adjustments.marketBetaFactor);

    QJsonObject object;
    object.insert(QStringLiteral("weights"), weights);
    object.insert(QStringLiteral("adjustments"), adjustments);
    return object;
}
