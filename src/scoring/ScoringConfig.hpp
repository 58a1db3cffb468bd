#pragma once

#include <QJsonObject>
#include <QString>

#include <optional>

// Immutable scoring parameters. Instances only come out of the factories,
// which reject weight sets that are negative or do not sum to 1.
class ScoringConfig {
public:
    struct Weights {
        double predictionConfidence = 0.30;
        double technicalStrength = 0.20;
        double indexAlignment = 0.15;
        double liquidity = 0.15;
        double volatility = 0.10;
        double sectorMomentum = 0.10;

        double sum() const;
    };

    struct Adjustments {
        double lowVolumePenalty = 10.0;
        double lowVolumeThreshold = 500000.0;
        double extremeVolatilityPenalty = 15.0;
        double extremeVolatilityThreshold = 0.06;
        double contrarianPenalty = 10.0;
        double contrarianMinConfidence = 0.5;
        double highCrashRiskPenalty = 10.0;
        double crashRiskThreshold = 0.7;
        double highBetaThreshold = 1.3;
        double sectorLeaderBonus = 5.0;
        double sectorLeaderThreshold = 85.0;
        double strongAlignmentBonus = 5.0;
        double strongAlignmentConfidence = 0.7;
        QString marketBetaFactor = QStringLiteral("xjo");
    };

    static constexpr double kWeightTolerance = 1e-6;

    static ScoringConfig defaults();
    static std::optional<ScoringConfig> create(const Weights& weights, const Adjustments& adjustments,
                                               QString* error = nullptr);
    //! Missing keys keep their defaults; the merged result is validated.
    static std::optional<ScoringConfig> fromJson(const QJsonObject& object, QString* error = nullptr);

    const Weights& weights() const { return m_weights; }
    const Adjustments& adjustments() const { return m_adjustments; }

    QJsonObject toJson() const;

private:
    ScoringConfig(const Weights& weights, const Adjustments& adjustments);

    Weights     m_weights;
    Adjustments m_adjustments;
};
