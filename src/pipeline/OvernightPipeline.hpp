#pragma once

#include <QDate>
#include <QJsonObject>
#include <QString>
#include <QVector>

#include <memory>

#include "beta/MacroBetaCalculator.hpp"
#include "config/PipelineConfig.hpp"
#include "data/DataQualityValidator.hpp"
#include "data/MarketDataSource.hpp"
#include "pipeline/Notifier.hpp"
#include "pipeline/PipelineProgressTracker.hpp"
#include "pipeline/UniverseScanner.hpp"
#include "prediction/BatchPredictor.hpp"
#include "prediction/PredictionBridge.hpp"
#include "regime/MarketRegimeEngine.hpp"
#include "scoring/FactorView.hpp"
#include "scoring/OpportunityScorer.hpp"

// Drives the seven stages through the progress tracker. Every component is
// built once in the constructor and shared by reference across stages.
class OvernightPipeline {
public:
    struct Components {
        std::shared_ptr<MarketDataSourceInterface> marketData;
        std::shared_ptr<DirectionModelInterface>   directionModel;
        std::shared_ptr<SentimentModelInterface>   sentimentModel;
        std::shared_ptr<NewsSourceInterface>       newsSource;
        std::shared_ptr<NotifierInterface>         notifier;
    };

    struct RunResult {
        bool                       ok = false;
        QString                    status;
        QString                    errorMessage;
        QString                    statePath;
        RegimeResult               regime;
        QVector<PredictionRecord>  predictions;
        QVector<ScoredOpportunity> scored;
        QVector<ScoredOpportunity> topOpportunities;
        FactorView::ExportPaths    exports;
    };

    //! Concrete adapters described by the configuration.
    static Components buildComponents(const PipelineConfig& config);

    OvernightPipeline(const PipelineConfig& config, Components components);
    ~OvernightPipeline();

    PipelineProgressTracker& tracker() { return *m_tracker; }
    const ModelAvailability& availability() const { return m_bridge.availability(); }

    RunResult run(const QDate& runDate);

private:
    bool runInitialization(RunResult& result);
    bool runRegimeDetection(const QDate& runDate, RunResult& result);
    bool runUniverseScan(const QDate& runDate, QVector<UniverseScanner::ScannedStock>& stocks,
                         MacroBetaCalculator::BetaReport& betas);
    bool runModelRefresh(const QDate& runDate, const QVector<UniverseScanner::ScannedStock>& stocks);
    bool runBatchPrediction(const QVector<UniverseScanner::ScannedStock>& stocks, RunResult& result);
    bool runScoring(const QVector<UniverseScanner::ScannedStock>& stocks,
                    const MacroBetaCalculator::BetaReport& betas, RunResult& result);
    bool runReportGeneration(const QDate& runDate, RunResult& result);

    bool checkPersistence(RunResult& result);
    RunResult fail(RunResult& result, const QString& message);
    QJsonObject buildStateDocument(const QDate& runDate, const RunResult& result) const;

    PipelineConfig       m_config;
    Components           m_components;
    DataQualityValidator m_validator;
    MarketRegimeEngine   m_regimeEngine;
    MacroBetaCalculator  m_betaCalculator;
    UniverseScanner      m_scanner;
    PredictionBridge     m_bridge;
    BatchPredictor       m_predictor;
    OpportunityScorer    m_scorer;
    FactorView           m_factorView;
    std::unique_ptr<PipelineProgressTracker> m_tracker;
};
