#include "OvernightPipeline.hpp"

#include <QAtomicInt>
#include <QDateTime>
#include <QDir>
#include <QHash>
#include <QJsonArray>
#include <QJsonDocument>
#include <QLoggingCategory>
#include <QSaveFile>
#include <QTimeZone>

#include <utility>

#include "prediction/NewsSource.hpp"
#include "prediction/SentimentModel.hpp"

Q_LOGGING_CATEGORY(lcPipeline, "screener.pipeline")

namespace {

QString availabilityText(const ModelAvailability& availability)
{
    auto flag = [](bool value) { return value ? QStringLiteral("yes") : QStringLiteral("no"); };
    return QStringLiteral("direction model: %1, sentiment: %2, news: %3")
        .arg(flag(availability.directionModelAvailable), flag(availability.sentimentAvailable),
             flag(availability.newsAvailable));
}

double percentOf(int done, int total)
{
    return total > 0 ? 100.0 * done / total : 100.0;
}

} // namespace

OvernightPipeline::Components OvernightPipeline::buildComponents(const PipelineConfig& config)
{
    Components components;
    auto csv = std::make_shared<CsvMarketDataSource>(config.paths.dataDir);
    components.marketData = std::make_shared<TimeoutMarketDataSource>(csv, config.prediction.fetchTimeoutMs,
                                                                      config.prediction.fetchThreads);
    if (config.prediction.directionModelEnabled) {
        components.directionModel =
            std::make_shared<AutoregressiveDirectionModel>(config.paths.modelDir, config.prediction.direction);
    }
    if (!config.prediction.sentimentProgram.isEmpty()) {
        components.sentimentModel = std::make_shared<ProcessSentimentModel>(
            config.prediction.sentimentProgram, config.prediction.sentimentArguments,
            config.prediction.sentimentTimeoutMs);
    }
    components.newsSource =
        std::make_shared<DirectoryNewsSource>(config.paths.newsDir, config.prediction.newsMaxAgeDays);

    if (config.notificationChannel == PipelineConfig::kNotifyFile)
        components.notifier = std::make_shared<FileNotifier>(config.paths.notificationsFile);
    else if (config.notificationChannel == PipelineConfig::kNotifyLog)
        components.notifier = std::make_shared<LogNotifier>();
    return components;
}

OvernightPipeline::OvernightPipeline(const PipelineConfig& config, Components components)
    : m_config(config)
    , m_components(std::move(components))
    , m_validator(m_config.dataQuality)
    , m_regimeEngine(m_components.marketData, m_config.regime)
    , m_betaCalculator(m_components.marketData, m_validator, m_config.macroBeta)
    , m_scanner(m_components.marketData, m_validator, m_config.scan)
    , m_bridge(m_components.directionModel, m_components.sentimentModel, m_components.newsSource,
               m_config.prediction.technical)
    , m_predictor(m_bridge, m_config.prediction.batch)
    , m_scorer(m_config.scoring)
    , m_factorView(m_betaCalculator.factorNames())
    , m_tracker(std::make_unique<PipelineProgressTracker>(
          PipelineProgressTracker::Settings{m_config.paths.progressFile, m_config.paths.historyDir},
          m_components.notifier))
{
}

OvernightPipeline::~OvernightPipeline() = default;

bool OvernightPipeline::checkPersistence(RunResult& result)
{
    if (!m_tracker->persistenceFailed())
        return true;
    fail(result, QStringLiteral("cannot persist progress to %1").arg(m_config.paths.progressFile));
    return false;
}

OvernightPipeline::RunResult OvernightPipeline::fail(RunResult& result, const QString& message)
{
    qCCritical(lcPipeline).noquote() << "Pipeline failure:" << message;
    if (!m_tracker->isFinished())
        m_tracker->markFailed(message);
    result.ok = false;
    result.status = screener::status::kFailed;
    if (result.errorMessage.isEmpty())
        result.errorMessage = message;
    return result;
}

OvernightPipeline::RunResult OvernightPipeline::run(const QDate& runDate)
{
    RunResult result;
    qCInfo(lcPipeline) << "Overnight run for" << runDate.toString(Qt::ISODate) << "over"
                       << m_config.universe.size() << "symbols";

    if (m_components.newsSource)
        m_components.newsSource->setReferenceTime(QDateTime(runDate, QTime(23, 59, 59), QTimeZone::utc()));

    m_tracker->start();
    if (!checkPersistence(result))
        return result;

    if (!runInitialization(result) || !checkPersistence(result))
        return result;
    if (!runRegimeDetection(runDate, result) || !checkPersistence(result))
        return result;

    QVector<UniverseScanner::ScannedStock> stocks;
    MacroBetaCalculator::BetaReport betas;
    if (!runUniverseScan(runDate, stocks, betas))
        return fail(result, QStringLiteral("universe scan cancelled"));
    if (!checkPersistence(result))
        return result;

    if (!runModelRefresh(runDate, stocks))
        return fail(result, QStringLiteral("model refresh cancelled"));
    if (!checkPersistence(result))
        return result;

    if (!runBatchPrediction(stocks, result))
        return fail(result, QStringLiteral("batch prediction cancelled"));
    if (!checkPersistence(result))
        return result;

    if (!runScoring(stocks, betas, result) || !checkPersistence(result))
        return result;
    if (!runReportGeneration(runDate, result))
        return result;

    result.ok = m_tracker->overallStatus() == screener::status::kComplete;
    result.status = m_tracker->overallStatus();
    if (!result.ok)
        return fail(result, QStringLiteral("pipeline ended in status %1").arg(result.status));
    qCInfo(lcPipeline) << "Pipeline complete;" << result.topOpportunities.size() << "top opportunities";
    return result;
}

bool OvernightPipeline::runInitialization(RunResult& result)
{
    const QString& stage = screener::stage::kInitialization;
    m_tracker->beginStage(stage, QStringLiteral("Preparing components"));

    QDir reports(m_config.paths.reportsDir);
    if (!reports.exists() && !reports.mkpath(QStringLiteral("."))) {
        fail(result, QStringLiteral("cannot create reports directory %1").arg(m_config.paths.reportsDir));
        return false;
    }

    const ModelAvailability& availability = m_bridge.availability();
    if (!availability.directionModelAvailable)
        m_tracker->addWarning(QStringLiteral("direction model unavailable; predictions use remaining models"));
    if (!availability.sentimentAvailable)
        m_tracker->addWarning(QStringLiteral("sentiment model unavailable"));
    if (!availability.newsAvailable)
        m_tracker->addWarning(QStringLiteral("news source unavailable"));

    m_tracker->completeStage(stage, availabilityText(availability));
    return true;
}

bool OvernightPipeline::runRegimeDetection(const QDate& runDate, RunResult& result)
{
    const QString& stage = screener::stage::kRegimeDetection;
    m_tracker->beginStage(stage, QStringLiteral("Classifying market regime"));

    result.regime = m_regimeEngine.detect(runDate);
    if (!result.regime.error.isEmpty())
        m_tracker->addWarning(QStringLiteral("regime detection: %1").arg(result.regime.error));
    if (!result.regime.warning.isEmpty())
        m_tracker->addWarning(QStringLiteral("regime detection: %1").arg(result.regime.warning));

    m_tracker->completeStage(stage, QStringLiteral("Regime %1 (%2/%3), crash risk %4")
                                        .arg(result.regime.regimeLabel, result.regime.regimeMethod,
                                             result.regime.volMethod)
                                        .arg(result.regime.crashRiskScore, 0, 'f', 2));
    return true;
}

bool OvernightPipeline::runUniverseScan(const QDate& runDate, QVector<UniverseScanner::ScannedStock>& stocks,
                                        MacroBetaCalculator::BetaReport& betas)
{
    const QString& stage = screener::stage::kUniverseScan;
    m_tracker->beginStage(stage, QStringLiteral("Scanning %1 symbols").arg(m_config.universe.size()));

    const int total = m_config.universe.size();
    QAtomicInt processed(0);
    PipelineProgressTracker* tracker = m_tracker.get();

    const UniverseScanner::ScanResult scan = m_scanner.scan(
        m_config.universe, runDate,
        [tracker, total, &processed, &stage](const UniverseScanner::SymbolReport& report) {
            tracker->incrementMetric(screener::metric::kStocksScanned);
            if (report.outcome == UniverseScanner::Outcome::Failed)
                tracker->addWarning(QStringLiteral("%1: %2").arg(report.symbol, report.reason));
            for (const QString& warning : report.warnings)
                tracker->addWarning(QStringLiteral("%1: %2").arg(report.symbol, warning));
            const int done = processed.fetchAndAddOrdered(1) + 1;
            tracker->updateStage(stage, percentOf(done, total) * 0.9, screener::status::kRunning,
                                 QStringLiteral("Scanned %1/%2").arg(done).arg(total));
        },
        [tracker, &stage]() { return tracker->isCancelled(stage); });
    if (scan.cancelled || m_tracker->isCancelled(stage))
        return false;

    stocks = scan.stocks;
    QStringList symbols;
    for (const UniverseScanner::ScannedStock& stock : stocks)
        symbols.append(stock.candidate.symbol);
    betas = m_betaCalculator.computeBetas(symbols, runDate);
    for (const QString& factor : std::as_const(betas.missingFactors))
        m_tracker->addWarning(QStringLiteral("macro factor %1 unavailable").arg(factor));

    m_tracker->completeStage(stage, QStringLiteral("%1 accepted, %2 rejected, %3 failed")
                                        .arg(stocks.size())
                                        .arg(scan.rejectedSymbols.size())
                                        .arg(scan.failedSymbols.size()));
    return true;
}

bool OvernightPipeline::runModelRefresh(const QDate& runDate, const QVector<UniverseScanner::ScannedStock>& stocks)
{
    const QString& stage = screener::stage::kModelRefresh;
    m_tracker->beginStage(stage, QStringLiteral("Refreshing direction models"));

    DirectionModelInterface* model = m_bridge.directionModel();
    if (!model) {
        m_tracker->completeStage(stage, QStringLiteral("Direction model unavailable; nothing to train"));
        return true;
    }

    int trained = 0;
    int done = 0;
    for (const UniverseScanner::ScannedStock& stock : stocks) {
        if (m_tracker->isCancelled(stage))
            return false;
        const QString& symbol = stock.candidate.symbol;
        ++done;
        if (!model->needsTraining(symbol, runDate))
            continue;
        const DirectionModelInterface::TrainResult training = model->train(symbol, stock.history, runDate);
        if (training.ok) {
            ++trained;
            m_tracker->incrementMetric(screener::metric::kModelsTrained);
        } else {
            m_tracker->addWarning(QStringLiteral("%1: model training failed: %2").arg(symbol, training.errorMessage));
        }
        m_tracker->updateStage(stage, percentOf(done, stocks.size()), screener::status::kRunning,
                               QStringLiteral("Trained %1 models (%2/%3)").arg(trained).arg(done).arg(stocks.size()));
    }

    m_tracker->completeStage(stage, QStringLiteral("Trained %1 models; %2 available")
                                        .arg(trained)
                                        .arg(model->trainedModelCount()));
    return true;
}

bool OvernightPipeline::runBatchPrediction(const QVector<UniverseScanner::ScannedStock>& stocks, RunResult& result)
{
    const QString& stage = screener::stage::kBatchPrediction;
    m_tracker->beginStage(stage, QStringLiteral("Predicting %1 symbols").arg(stocks.size()));

    QVector<BatchPredictor::Candidate> candidates;
    candidates.reserve(stocks.size());
    for (const UniverseScanner::ScannedStock& stock : stocks)
        candidates.append({stock.candidate.symbol, stock.history});

    const int total = candidates.size();
    QAtomicInt processed(0);
    PipelineProgressTracker* tracker = m_tracker.get();
    const BatchPredictor::BatchResult batch = m_predictor.predictBatch(
        candidates,
        [tracker, total, &processed, &stage](const PredictionRecord&) {
            tracker->incrementMetric(screener::metric::kPredictionsGenerated);
            const int done = processed.fetchAndAddOrdered(1) + 1;
            tracker->updateStage(stage, percentOf(done, total), screener::status::kRunning,
                                 QStringLiteral("Predicted %1/%2").arg(done).arg(total));
        },
        [tracker, &stage]() { return tracker->isCancelled(stage); });
    if (batch.cancelled || m_tracker->isCancelled(stage))
        return false;

    result.predictions = batch.predictions;
    const BatchPredictor::Summary summary = BatchPredictor::summarize(batch.predictions);
    m_tracker->completeStage(stage, QStringLiteral("%1 predictions: %2 BUY, %3 SELL, %4 HOLD")
                                        .arg(summary.total)
                                        .arg(summary.buyCount)
                                        .arg(summary.sellCount)
                                        .arg(summary.holdCount));
    return true;
}

bool OvernightPipeline::runScoring(const QVector<UniverseScanner::ScannedStock>& stocks,
                                   const MacroBetaCalculator::BetaReport& betas, RunResult& result)
{
    const QString& stage = screener::stage::kOpportunityScoring;
    m_tracker->beginStage(stage, QStringLiteral("Scoring opportunities"));

    QHash<QString, PredictionRecord> predictions;
    for (const PredictionRecord& record : std::as_const(result.predictions))
        predictions.insert(record.symbol, record);

    QVector<ScoringInput> inputs;
    for (const UniverseScanner::ScannedStock& stock : stocks) {
        const auto it = predictions.constFind(stock.candidate.symbol);
        if (it == predictions.cend()) {
            m_tracker->addWarning(QStringLiteral("%1: no prediction; not scored").arg(stock.candidate.symbol));
            continue;
        }
        inputs.append({stock.candidate, it.value(), betas.betas.value(stock.candidate.symbol)});
    }

    const MarketContext market = MarketContext::fromRegime(result.regime);
    result.scored = m_scorer.score(inputs, market);
    result.topOpportunities = OpportunityScorer::filterTopOpportunities(
        result.scored, m_config.reporting.minOpportunityScore, m_config.reporting.topN);
    m_tracker->setMetric(screener::metric::kOpportunitiesFound, result.topOpportunities.size());

    m_tracker->completeStage(stage, QStringLiteral("Scored %1 stocks; %2 at or above %3")
                                        .arg(result.scored.size())
                                        .arg(result.topOpportunities.size())
                                        .arg(m_config.reporting.minOpportunityScore, 0, 'f', 0));
    return true;
}

bool OvernightPipeline::runReportGeneration(const QDate& runDate, RunResult& result)
{
    const QString& stage = screener::stage::kReportGeneration;
    m_tracker->beginStage(stage, QStringLiteral("Writing reports"));

    QString error;
    const std::optional<FactorView::ExportPaths> exports =
        m_factorView.save(result.scored, m_config.paths.reportsDir, runDate, &error);
    if (!exports) {
        fail(result, QStringLiteral("factor view export failed: %1").arg(error));
        return false;
    }
    result.exports = *exports;

    result.statePath = QDir(m_config.paths.reportsDir)
                           .filePath(QStringLiteral("pipeline_state_%1.json").arg(runDate.toString(QStringLiteral("yyyyMMdd"))));
    QSaveFile file(result.statePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        fail(result, QStringLiteral("cannot open %1: %2").arg(result.statePath, file.errorString()));
        return false;
    }
    file.write(QJsonDocument(buildStateDocument(runDate, result)).toJson(QJsonDocument::Indented));
    if (!file.commit()) {
        fail(result, QStringLiteral("failed to write %1: %2").arg(result.statePath, file.errorString()));
        return false;
    }

    m_tracker->setReportPath(result.statePath);
    if (!checkPersistence(result))
        return false;
    m_tracker->completeStage(stage, QStringLiteral("Reports written to %1").arg(m_config.paths.reportsDir));
    return true;
}

QJsonObject OvernightPipeline::buildStateDocument(const QDate& runDate, const RunResult& result) const
{
    const QJsonObject progress = m_tracker->toJson();
    const BatchPredictor::Summary predictions = BatchPredictor::summarize(result.predictions);
    const OpportunityScorer::Summary scoring = OpportunityScorer::summarize(result.scored, m_config.reporting.topN);

    QJsonObject statistics;
    statistics.insert(QStringLiteral("total_scanned"), m_tracker->metric(screener::metric::kStocksScanned));
    statistics.insert(QStringLiteral("total_scored"), result.scored.size());
    statistics.insert(QStringLiteral("top_opportunities_count"), result.topOpportunities.size());
    statistics.insert(QStringLiteral("models_trained"), m_tracker->metric(screener::metric::kModelsTrained));
    statistics.insert(QStringLiteral("predictions"), predictions.toJson());
    statistics.insert(QStringLiteral("scores"), scoring.toJson());

    QJsonArray top;
    for (const ScoredOpportunity& opportunity : result.topOpportunities)
        top.append(opportunity.toJson());

    QJsonObject exports;
    exports.insert(QStringLiteral("stocks_csv"), result.exports.stocksCsv);
    exports.insert(QStringLiteral("sectors_csv"), result.exports.sectorsCsv);
    exports.insert(QStringLiteral("summary_json"), result.exports.summaryJson);

    QJsonObject market = MarketContext::fromRegime(result.regime).toJson();
    market.insert(QStringLiteral("regime"), result.regime.toJson());

    QJsonObject document;
    document.insert(QStringLiteral("status"), QStringLiteral("success"));
    document.insert(QStringLiteral("run_date"), runDate.toString(Qt::ISODate));
    document.insert(QStringLiteral("timestamp"), QDateTime::currentDateTime().toString(Qt::ISODate));
    document.insert(QStringLiteral("execution_time_formatted"), progress.value(QStringLiteral("execution_time_formatted")));
    document.insert(QStringLiteral("model_availability"), m_bridge.availability().toJson());
    document.insert(QStringLiteral("statistics"), statistics);
    document.insert(QStringLiteral("market_context"), market);
    document.insert(QStringLiteral("top_opportunities"), top);
    document.insert(QStringLiteral("factor_view"), exports);
    document.insert(QStringLiteral("errors"), progress.value(QStringLiteral("errors")));
    document.insert(QStringLiteral("warnings"), progress.value(QStringLiteral("warnings")));
    return document;
}
