#pragma once

#include <QDate>
#include <QMap>
#include <QString>
#include <QStringList>
#include <QThreadPool>
#include <QVector>

#include <functional>
#include <memory>

#include "data/DataQualityValidator.hpp"
#include "data/MarketDataSource.hpp"
#include "data/PriceSeries.hpp"
#include "scoring/ScoringTypes.hpp"

struct UniverseEntry {
    QString symbol;
    QString name;
    QString sector;
    double  marketCap = 0.0;
};

// Fetches, validates and screens the configured universe. Per-symbol
// failures are reported in the result and never stop the scan.
class UniverseScanner {
public:
    struct Settings {
        int    lookbackDays = 365;
        int    minHistory = 60;
        double minPrice = 0.5;
        double maxPrice = 1000000.0;
        double minAvgVolume = 100000.0;
        int    volumeWindow = 20;
        QMap<QString, double> sectorWeights; //!< missing sectors weigh 1.0
        int    maxWorkers = 4;
    };

    enum class Outcome {
        Accepted,
        Rejected,
        Failed,
        Skipped,
    };

    struct ScannedStock {
        StockCandidate candidate;
        PriceSeries    history;
    };

    struct SymbolReport {
        QString      symbol;
        Outcome      outcome = Outcome::Skipped;
        QString      reason;
        QStringList  warnings;
        ScannedStock stock;
    };

    struct ScanResult {
        QVector<ScannedStock> stocks;
        QStringList           failedSymbols;
        QStringList           rejectedSymbols;
        QStringList           skippedSymbols;
        bool                  cancelled = false;
    };

    //! Invoked from worker threads once per processed symbol.
    using ProgressCallback = std::function<void(const SymbolReport& report)>;
    using CancelCheck = std::function<bool()>;

    UniverseScanner(std::shared_ptr<MarketDataSourceInterface> source, const DataQualityValidator& validator,
                    const Settings& settings);
    ~UniverseScanner();

    const Settings& settings() const { return m_settings; }

    SymbolReport scanOne(const UniverseEntry& entry, const QDate& asOf) const;
    ScanResult scan(const QVector<UniverseEntry>& universe, const QDate& asOf,
                    const ProgressCallback& progress = {}, const CancelCheck& cancelled = {});

    static TechnicalSnapshot technicals(const PriceSeries& history, int volumeWindow = 20);
    //! 0-100 screen built from liquidity, volume consistency, volatility, trend, technical and sector tiers.
    static double screeningScore(const TechnicalSnapshot& technical, double sectorWeight);

private:
    bool passesFilters(const TechnicalSnapshot& technical, QString* reason) const;

    std::shared_ptr<MarketDataSourceInterface> m_source;
    const DataQualityValidator&                m_validator;
    Settings                                   m_settings;
    QThreadPool                                m_workerPool;
};
