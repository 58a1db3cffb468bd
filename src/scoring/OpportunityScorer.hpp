#pragma once

#include <QJsonObject>
#include <QVector>

#include "scoring/ScoringConfig.hpp"
#include "scoring/ScoringTypes.hpp"

// Stateless apart from its immutable configuration; safe to share between threads.
class OpportunityScorer {
public:
    struct Summary {
        int                        totalScored = 0;
        double                     avgScore = 0.0;
        int                        highCount = 0;   //!< score >= 80
        int                        mediumCount = 0; //!< 65 <= score < 80
        int                        lowCount = 0;
        QVector<ScoredOpportunity> top;

        QJsonObject toJson() const;
    };

    static constexpr double kHighScore = 80.0;
    static constexpr double kMediumScore = 65.0;

    explicit OpportunityScorer(const ScoringConfig& config = ScoringConfig::defaults());

    const ScoringConfig& config() const { return m_config; }

    ScoredOpportunity scoreOne(const ScoringInput& input, const MarketContext& market) const;
    //! Scores every input and returns them ordered by descending opportunity score.
    QVector<ScoredOpportunity> score(const QVector<ScoringInput>& inputs, const MarketContext& market) const;

    static QVector<ScoredOpportunity> filterTopOpportunities(const QVector<ScoredOpportunity>& scored,
                                                             double minScore = kMediumScore, int topN = 10);
    static Summary summarize(const QVector<ScoredOpportunity>& scored, int topN = 10);

    // Raw sub-scores on a 0-100 scale.
    static double predictionConfidenceScore(const PredictionRecord& prediction);
    static double technicalStrengthScore(const StockCandidate& stock);
    static double indexAlignmentScore(const PredictionRecord& prediction, const MarketContext& market);
    static double liquidityScore(const StockCandidate& stock);
    static double volatilityScore(const StockCandidate& stock, double marketBeta);
    static double sectorMomentumScore(const StockCandidate& stock);

private:
    QVector<ScoreAdjustment> adjustmentsFor(const ScoringInput& input, const MarketContext& market,
                                            double marketBeta) const;

    ScoringConfig m_config;
};
