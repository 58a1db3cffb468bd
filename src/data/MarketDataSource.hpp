#pragma once

#include <QDate>
#include <QString>
#include <QStringList>
#include <QThreadPool>

#include <memory>

#include "data/MarketDataFrame.hpp"
#include "data/PriceSeries.hpp"

// Implementations must be safe to call from several worker threads and must
// not mutate shared state: the same request always yields the same answer.
class MarketDataSourceInterface {
public:
    struct SeriesResult {
        bool        ok = false;
        PriceSeries series;
        QString     errorMessage;
    };

    struct FrameResult {
        bool            ok = false;
        MarketDataFrame frame;
        QString         errorMessage;
    };

    virtual ~MarketDataSourceInterface() = default;

    virtual SeriesResult fetch(const QString& symbol, const QDate& start, const QDate& end) = 0;
    virtual FrameResult fetchMany(const QStringList& symbols, const QDate& start, const QDate& end) = 0;
};

// Reads one "<directory>/<symbol>.csv" file per symbol. The header row names
// the columns (Date, Open, High, Low, Close, optional Adj Close, Volume).
class CsvMarketDataSource final : public MarketDataSourceInterface {
public:
    explicit CsvMarketDataSource(QString directory);

    QString directory() const { return m_directory; }
    QString pathForSymbol(const QString& symbol) const;

    SeriesResult fetch(const QString& symbol, const QDate& start, const QDate& end) override;
    FrameResult fetchMany(const QStringList& symbols, const QDate& start, const QDate& end) override;

private:
    QString m_directory;
};

// Applies a wall-clock limit to every call of the wrapped source. The limit
// runs from the moment a pool thread picks the call up. A call that exceeds it
// fails with a timeout message; its late result is dropped and its thread no
// longer counts against the pool size.
class TimeoutMarketDataSource final : public MarketDataSourceInterface {
public:
    static constexpr int kShutdownGraceMs = 2000;

    TimeoutMarketDataSource(std::shared_ptr<MarketDataSourceInterface> inner, int timeoutMs, int maxThreads = 4);
    ~TimeoutMarketDataSource() override;

    int timeoutMs() const { return m_timeoutMs; }
    int maxThreads() const { return m_pool->maxThreadCount(); }

    SeriesResult fetch(const QString& symbol, const QDate& start, const QDate& end) override;
    FrameResult fetchMany(const QStringList& symbols, const QDate& start, const QDate& end) override;

private:
    std::shared_ptr<MarketDataSourceInterface> m_inner;
    int m_timeoutMs = 30000;
    //! Released without waiting when abandoned calls outlive the shutdown grace period.
    std::unique_ptr<QThreadPool> m_pool;
};
