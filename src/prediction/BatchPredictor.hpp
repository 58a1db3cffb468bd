#pragma once

#include <QJsonObject>
#include <QString>
#include <QStringList>
#include <QThreadPool>
#include <QVector>

#include <functional>

#include "data/PriceSeries.hpp"
#include "prediction/PredictionBridge.hpp"
#include "prediction/PredictionTypes.hpp"

class BatchPredictor {
public:
    struct Settings {
        double directionWeight = 0.45;
        double technicalWeight = 0.40;
        double sentimentWeight = 0.15;
        double buyThreshold = 0.3;
        double sellThreshold = -0.3;
        int    maxWorkers = 4;
    };

    struct Candidate {
        QString     symbol;
        PriceSeries history;
    };

    struct BatchResult {
        QVector<PredictionRecord> predictions;
        QStringList               skippedSymbols;
        bool                      cancelled = false;
    };

    struct Summary {
        int    total = 0;
        int    buyCount = 0;
        int    sellCount = 0;
        int    holdCount = 0;
        double avgConfidencePct = 0.0;
        int    highConfidenceCount = 0;

        QJsonObject toJson() const;
    };

    //! Invoked from worker threads once per finished symbol.
    using ProgressCallback = std::function<void(const PredictionRecord& record)>;
    //! Polled before each symbol; returning true stops the batch.
    using CancelCheck = std::function<bool()>;

    BatchPredictor(const PredictionBridge& bridge, const Settings& settings);
    ~BatchPredictor();

    const Settings& settings() const { return m_settings; }

    PredictionRecord predictOne(const QString& symbol, const PriceSeries& history) const;
    BatchResult predictBatch(const QVector<Candidate>& candidates, const ProgressCallback& progress = {},
                             const CancelCheck& cancelled = {});

    //! Confidence-weighted merge of the present components into the record's aggregate.
    static void blend(PredictionRecord& record, const Settings& settings);
    static Summary summarize(const QVector<PredictionRecord>& predictions);

private:
    const PredictionBridge& m_bridge;
    Settings                m_settings;
    QThreadPool             m_workerPool;
};
