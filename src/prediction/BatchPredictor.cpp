#include "BatchPredictor.hpp"

#include <QFuture>
#include <QLoggingCategory>
#include <QtConcurrent/QtConcurrent>
#include <QtMath>

#include <optional>

Q_LOGGING_CATEGORY(lcBatchPredictor, "screener.prediction.batch")

QJsonObject BatchPredictor::Summary::toJson() const
{
    QJsonObject object;
    object.insert(QStringLiteral("total"), total);
    object.insert(QStringLiteral("buy_count"), buyCount);
    object.insert(QStringLiteral("sell_count"), sellCount);
    object.insert(QStringLiteral("hold_count"), holdCount);
    object.insert(QStringLiteral("avg_confidence"), avgConfidencePct);
    object.insert(QStringLiteral("high_confidence_count"), highConfidenceCount);
    return object;
}

BatchPredictor::BatchPredictor(const PredictionBridge& bridge, const Settings& settings)
    : m_bridge(bridge)
    , m_settings(settings)
{
    m_workerPool.setMaxThreadCount(qMax(1, settings.maxWorkers));
}

BatchPredictor::~BatchPredictor()
{
    m_workerPool.waitForDone();
}

void BatchPredictor::blend(PredictionRecord& record, const Settings& settings)
{
    struct Weighted {
        const ComponentSignal* component;
        double                 weight;
    };
    const Weighted parts[] = {{&record.directionModel, settings.directionWeight},
                              {&record.technical, settings.technicalWeight},
                              {&record.sentiment, settings.sentimentWeight}};

    double weightedDirection = 0.0;
    double weightedConfidence = 0.0;
    double totalWeight = 0.0;
    for (const Weighted& part : parts) {
        if (!part.component->present || part.weight <= 0.0)
            continue;
        weightedDirection += part.weight * part.component->confidence * part.component->direction;
        weightedConfidence += part.weight * part.component->confidence;
        totalWeight += part.weight;
    }

    record.direction = weightedConfidence > 0.0 ? qBound(-1.0, weightedDirection / weightedConfidence, 1.0) : 0.0;
    record.confidence = totalWeight > 0.0 ? qBound(0.0, weightedConfidence / totalWeight, 1.0) : 0.0;
    if (record.direction > settings.buyThreshold)
        record.signal = screener::signal::kBuy;
    else if (record.direction < settings.sellThreshold)
        record.signal = screener::signal::kSell;
    else
        record.signal = screener::signal::kHold;
}

PredictionRecord BatchPredictor::predictOne(const QString& symbol, const PriceSeries& history) const
{
    PredictionRecord record = m_bridge.predict(symbol, history);
    blend(record, m_settings);
    return record;
}

BatchPredictor::BatchResult BatchPredictor::predictBatch(const QVector<Candidate>& candidates,
                                                         const ProgressCallback& progress,
                                                         const CancelCheck& cancelled)
{
    BatchResult result;
    qCInfo(lcBatchPredictor) << "Predicting" << candidates.size() << "symbols with"
                             << m_workerPool.maxThreadCount() << "workers";

    QVector<QFuture<std::optional<PredictionRecord>>> futures;
    futures.reserve(candidates.size());
    for (const Candidate& candidate : candidates) {
        futures.append(QtConcurrent::run(&m_workerPool, [this, candidate, progress, cancelled]() {
            if (cancelled && cancelled())
                return std::optional<PredictionRecord>();
            PredictionRecord record = predictOne(candidate.symbol, candidate.history);
            if (progress)
                progress(record);
            return std::optional<PredictionRecord>(record);
        }));
    }

    for (int i = 0; i < futures.size(); ++i) {
        futures[i].waitForFinished();
        const std::optional<PredictionRecord> record = futures[i].result();
        if (record)
            result.predictions.append(*record);
        else
            result.skippedSymbols.append(candidates.at(i).symbol);
    }

    result.cancelled = !result.skippedSymbols.isEmpty();
    if (result.cancelled) {
        qCWarning(lcBatchPredictor) << "Batch cancelled;" << result.skippedSymbols.size() << "symbols not processed";
    }
    return result;
}

BatchPredictor::Summary BatchPredictor::summarize(const QVector<PredictionRecord>& predictions)
{
    Summary summary;
    summary.total = predictions.size();
    double confidenceSum = 0.0;
    for (const PredictionRecord& record : predictions) {
        if (record.signal == screener::signal::kBuy)
            ++summary.buyCount;
        else if (record.signal == screener::signal::kSell)
            ++summary.sellCount;
        else
            ++summary.holdCount;
        confidenceSum += record.confidencePct();
        if (record.confidencePct() >= 70.0)
            ++summary.highConfidenceCount;
    }
    if (summary.total > 0)
        summary.avgConfidencePct = confidenceSum / summary.total;
    return summary;
}
