#include "PipelineConfig.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QLoggingCategory>

#include "utils/PathUtils.hpp"

Q_LOGGING_CATEGORY(lcConfig, "screener.config")

const QString PipelineConfig::kNotifyLog = QStringLiteral("log");
const QString PipelineConfig::kNotifyFile = QStringLiteral("file");
const QString PipelineConfig::kNotifyNone = QStringLiteral("none");

namespace {

void readInt(const QJsonObject& object, const char* key, int& target)
{
    const QJsonValue value = object.value(QLatin1String(key));
    if (value.isDouble())
        target = value.toInt(target);
}

void readDouble(const QJsonObject& object, const char* key, double& target)
{
    const QJsonValue value = object.value(QLatin1String(key));
    if (value.isDouble())
        target = value.toDouble();
}

void readBool(const QJsonObject& object, const char* key, bool& target)
{
    const QJsonValue value = object.value(QLatin1String(key));
    if (value.isBool())
        target = value.toBool();
}

void readString(const QJsonObject& object, const char* key, QString& target)
{
    const QJsonValue value = object.value(QLatin1String(key));
    if (value.isString())
        target = value.toString();
}

void readPath(const QJsonObject& object, const char* key, const QString& base, QString& target)
{
    const QJsonValue value = object.value(QLatin1String(key));
    if (value.isString() && !value.toString().trimmed().isEmpty())
        target = screener::utils::resolvePath(value.toString(), base);
}

bool readUniverse(const QJsonArray& array, QVector<UniverseEntry>& universe, QString* error)
{
    universe.clear();
    for (const QJsonValue& value : array) {
        UniverseEntry entry;
        if (value.isString()) {
            entry.symbol = value.toString().trimmed();
        } else if (value.isObject()) {
            const QJsonObject object = value.toObject();
            entry.symbol = object.value(QStringLiteral("symbol")).toString().trimmed();
            entry.name = object.value(QStringLiteral("name")).toString();
            entry.sector = object.value(QStringLiteral("sector")).toString();
            entry.marketCap = object.value(QStringLiteral("market_cap")).toDouble();
        }
        if (entry.symbol.isEmpty()) {
            if (error)
                *error = QStringLiteral("universe entry %1 has no symbol").arg(universe.size());
            return false;
        }
        universe.append(entry);
    }
    return true;
}

} // namespace

PipelineConfig PipelineConfig::defaults(const QString& baseDirectory)
{
    PipelineConfig config;
    config.baseDirectory = baseDirectory.isEmpty() ? QDir::currentPath() : baseDirectory;
    const QDir base(config.baseDirectory);
    config.paths.dataDir = base.absoluteFilePath(QStringLiteral("data"));
    config.paths.newsDir = base.absoluteFilePath(QStringLiteral("news"));
    config.paths.modelDir = base.absoluteFilePath(QStringLiteral("models"));
    config.paths.reportsDir = base.absoluteFilePath(QStringLiteral("reports"));
    config.paths.progressFile = base.absoluteFilePath(QStringLiteral("reports/screener_progress.json"));
    config.paths.historyDir = base.absoluteFilePath(QStringLiteral("reports/history"));
    config.paths.notificationsFile = base.absoluteFilePath(QStringLiteral("reports/notifications.jsonl"));
    return config;
}

std::optional<PipelineConfig> PipelineConfig::fromJson(const QJsonObject& object, const QString& baseDirectory,
                                                       QString* error)
{
    PipelineConfig config = defaults(baseDirectory);
    const QString& base = config.baseDirectory;

    const QJsonObject paths = object.value(QStringLiteral("paths")).toObject();
    readPath(paths, "data_dir", base, config.paths.dataDir);
    readPath(paths, "news_dir", base, config.paths.newsDir);
    readPath(paths, "model_dir", base, config.paths.modelDir);
    readPath(paths, "reports_dir", base, config.paths.reportsDir);
    if (paths.contains(QStringLiteral("reports_dir"))) {
        const QDir reports(config.paths.reportsDir);
        config.paths.progressFile = reports.absoluteFilePath(QStringLiteral("screener_progress.json"));
        config.paths.historyDir = reports.absoluteFilePath(QStringLiteral("history"));
        config.paths.notificationsFile = reports.absoluteFilePath(QStringLiteral("notifications.jsonl"));
    }
    readPath(paths, "progress_file", base, config.paths.progressFile);
    readPath(paths, "history_dir", base, config.paths.historyDir);
    readPath(paths, "notifications_file", base, config.paths.notificationsFile);

    if (object.contains(QStringLiteral("universe"))) {
        if (!readUniverse(object.value(QStringLiteral("universe")).toArray(), config.universe, error))
            return std::nullopt;
    }

    const QJsonObject scan = object.value(QStringLiteral("scan")).toObject();
    readInt(scan, "lookback_days", config.scan.lookbackDays);
    readInt(scan, "min_history", config.scan.minHistory);
    readDouble(scan, "min_price", config.scan.minPrice);
    readDouble(scan, "max_price", config.scan.maxPrice);
    readDouble(scan, "min_avg_volume", config.scan.minAvgVolume);
    const QJsonObject sectorWeights = scan.value(QStringLiteral("sector_weights")).toObject();
    for (auto it = sectorWeights.constBegin(); it != sectorWeights.constEnd(); ++it)
        config.scan.sectorWeights.insert(it.key(), it.value().toDouble(1.0));

    const QJsonObject quality = object.value(QStringLiteral("data_quality")).toObject();
    readDouble(quality, "outlier_threshold", config.dataQuality.outlierThreshold);
    readDouble(quality, "split_return_threshold", config.dataQuality.splitReturnThreshold);
    readDouble(quality, "split_volume_multiple", config.dataQuality.splitVolumeMultiple);

    const QJsonObject regime = object.value(QStringLiteral("regime")).toObject();
    readString(regime, "index_symbol", config.regime.indexSymbol);
    readString(regime, "vol_symbol", config.regime.volSymbol);
    readString(regime, "fx_symbol", config.regime.fxSymbol);
    readInt(regime, "lookback_days", config.regime.lookbackDays);
    readInt(regime, "states", config.regime.classifier.states);
    readInt(regime, "max_iterations", config.regime.classifier.maxIterations);
    readBool(regime, "hmm_enabled", config.regime.classifier.hmmEnabled);
    readBool(regime, "gmm_enabled", config.regime.classifier.gmmEnabled);
    readBool(regime, "garch_enabled", config.regime.volatility.garchEnabled);
    readDouble(regime, "ewma_lambda", config.regime.volatility.ewmaLambda);
    readDouble(regime, "crash_blend_weight", config.regime.crashBlendWeight);

    const QJsonObject beta = object.value(QStringLiteral("macro_beta")).toObject();
    readInt(beta, "lookback_days", config.macroBeta.lookbackDays);
    readInt(beta, "min_observations", config.macroBeta.minObservations);
    if (beta.contains(QStringLiteral("factors"))) {
        const QJsonObject factors = beta.value(QStringLiteral("factors")).toObject();
        config.macroBeta.factors.clear();
        for (auto it = factors.constBegin(); it != factors.constEnd(); ++it)
            config.macroBeta.factors.append({it.key(), it.value().toString()});
    }

    const QJsonObject prediction = object.value(QStringLiteral("prediction")).toObject();
    const QJsonObject weights = prediction.value(QStringLiteral("weights")).toObject();
    readDouble(weights, "direction", config.prediction.batch.directionWeight);
    readDouble(weights, "technical", config.prediction.batch.technicalWeight);
    readDouble(weights, "sentiment", config.prediction.batch.sentimentWeight);
    readDouble(prediction, "buy_threshold", config.prediction.batch.buyThreshold);
    readDouble(prediction, "sell_threshold", config.prediction.batch.sellThreshold);
    readInt(prediction, "max_workers", config.prediction.batch.maxWorkers);
    readInt(prediction, "fetch_timeout_ms", config.prediction.fetchTimeoutMs);
    readInt(prediction, "fetch_threads", config.prediction.fetchThreads);
    readInt(prediction, "news_max_age_days", config.prediction.newsMaxAgeDays);
    readBool(prediction, "direction_model_enabled", config.prediction.directionModelEnabled);
    readInt(prediction, "model_max_age_days", config.prediction.direction.maxModelAgeDays);
    readInt(prediction, "model_lags", config.prediction.direction.lags);
    const QJsonObject sentiment = prediction.value(QStringLiteral("sentiment")).toObject();
    readString(sentiment, "program", config.prediction.sentimentProgram);
    readInt(sentiment, "timeout_ms", config.prediction.sentimentTimeoutMs);
    for (const QJsonValue& argument : sentiment.value(QStringLiteral("arguments")).toArray())
        config.prediction.sentimentArguments.append(argument.toString());
    config.scan.maxWorkers = config.prediction.batch.maxWorkers;

    if (object.contains(QStringLiteral("scoring"))) {
        QString scoringError;
        const std::optional<ScoringConfig> scoring =
            ScoringConfig::fromJson(object.value(QStringLiteral("scoring")).toObject(), &scoringError);
        if (!scoring) {
            if (error)
                *error = QStringLiteral("invalid scoring configuration: %1").arg(scoringError);
            return std::nullopt;
        }
        config.scoring = *scoring;
    }

    const QJsonObject reporting = object.value(QStringLiteral("reporting")).toObject();
    readDouble(reporting, "min_opportunity_score", config.reporting.minOpportunityScore);
    readInt(reporting, "top_n", config.reporting.topN);

    const QJsonObject notification = object.value(QStringLiteral("notification")).toObject();
    readString(notification, "channel", config.notificationChannel);

    if (!config.validate(error))
        return std::nullopt;
    return config;
}

std::optional<PipelineConfig> PipelineConfig::load(const QString& filePath, QString* error)
{
    const QString resolved = screener::utils::resolvePath(filePath);
    QFile file(resolved);
    if (!file.open(QIODevice::ReadOnly)) {
        if (error)
            *error = QStringLiteral("cannot open config %1: %2").arg(resolved, file.errorString());
        return std::nullopt;
    }

    QJsonParseError parseError{};
    const QJsonDocument document = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !document.isObject()) {
        if (error)
            *error = QStringLiteral("config %1 is not a JSON object: %2").arg(resolved, parseError.errorString());
        return std::nullopt;
    }

    std::optional<PipelineConfig> config =
        fromJson(document.object(), QFileInfo(resolved).absolutePath(), error);
    if (config) {
        config->configPath = resolved;
        qCInfo(lcConfig) << "Loaded configuration from" << resolved << "with" << config->universe.size()
                         << "symbols";
    }
    return config;
}

bool PipelineConfig::validate(QString* error) const
{
    auto fail = [error](const QString& message) {
        if (error)
            *error = message;
        return false;
    };

    if (universe.isEmpty())
        return fail(QStringLiteral("universe is empty"));
    if (prediction.batch.maxWorkers < 1)
        return fail(QStringLiteral("max_workers must be at least 1"));
    if (prediction.fetchTimeoutMs <= 0)
        return fail(QStringLiteral("fetch_timeout_ms must be positive"));
    if (prediction.fetchThreads < 1)
        return fail(QStringLiteral("fetch_threads must be at least 1"));
    const BatchPredictor::Settings& batch = prediction.batch;
    if (batch.directionWeight < 0.0 || batch.technicalWeight < 0.0 || batch.sentimentWeight < 0.0
        || batch.technicalWeight <= 0.0)
        return fail(QStringLiteral("ensemble weights must be non-negative with a positive technical weight"));
    if (batch.buyThreshold <= batch.sellThreshold)
        return fail(QStringLiteral("buy_threshold must exceed sell_threshold"));
    if (regime.classifier.states < 2)
        return fail(QStringLiteral("regime states must be at least 2"));
    if (regime.classifier.maxIterations < 1)
        return fail(QStringLiteral("regime max_iterations must be at least 1"));
    if (regime.volatility.ewmaLambda <= 0.0 || regime.volatility.ewmaLambda >= 1.0)
        return fail(QStringLiteral("ewma_lambda must lie in (0, 1)"));
    if (regime.crashBlendWeight < 0.0 || regime.crashBlendWeight > 1.0)
        return fail(QStringLiteral("crash_blend_weight must lie in [0, 1]"));
    if (macroBeta.minObservations < 2)
        return fail(QStringLiteral("macro_beta min_observations must be at least 2"));
    if (notificationChannel != kNotifyLog && notificationChannel != kNotifyFile && notificationChannel != kNotifyNone)
        return fail(QStringLiteral("unknown notification channel '%1'").arg(notificationChannel));
    return true;
}

QJsonObject PipelineConfig::toJson() const
{
    QJsonObject pathsObject;
    pathsObject.insert(QStringLiteral("data_dir"), paths.dataDir);
    pathsObject.insert(QStringLiteral("news_dir"), paths.newsDir);
    pathsObject.insert(QStringLiteral("model_dir"), paths.modelDir);
    pathsObject.insert(QStringLiteral("reports_dir"), paths.reportsDir);
    pathsObject.insert(QStringLiteral("progress_file"), paths.progressFile);
    pathsObject.insert(QStringLiteral("history_dir"), paths.historyDir);
    pathsObject.insert(QStringLiteral("notifications_file"), paths.notificationsFile);

    QJsonObject predictionObject;
    predictionObject.insert(QStringLiteral("direction_weight"), prediction.batch.directionWeight);
    predictionObject.insert(QStringLiteral("technical_weight"), prediction.batch.technicalWeight);
    predictionObject.insert(QStringLiteral("sentiment_weight"), prediction.batch.sentimentWeight);
    predictionObject.insert(QStringLiteral("max_workers"), prediction.batch.maxWorkers);
    predictionObject.insert(QStringLiteral("fetch_timeout_ms"), prediction.fetchTimeoutMs);
    predictionObject.insert(QStringLiteral("fetch_threads"), prediction.fetchThreads);

    QJsonObject object;
    object.insert(QStringLiteral("config_path"), configPath);
    object.insert(QStringLiteral("paths"), pathsObject);
    object.insert(QStringLiteral("universe_size"), universe.size());
    object.insert(QStringLiteral("regime_index"), regime.indexSymbol);
    object.insert(QStringLiteral("prediction"), predictionObject);
    object.insert(QStringLiteral("scoring"), scoring.toJson());
    object.insert(QStringLiteral("notification_channel"), notificationChannel);
    return object;
}
