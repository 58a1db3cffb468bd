#include "UniverseScanner.hpp"

#include <QFuture>
#include <QLoggingCategory>
#include <QtConcurrent/QtConcurrent>
#include <QtMath>

#include <utility>

Q_LOGGING_CATEGORY(lcScanner, "screener.pipeline.scan")

namespace {

QVector<double> lastN(const QVector<double>& values, int count)
{
    if (count <= 0 || values.size() <= count)
        return values;
    return values.mid(values.size() - count);
}

QVector<double> finiteOnly(const QVector<double>& values)
{
    QVector<double> result;
    result.reserve(values.size());
    for (double value : values) {
        if (qIsFinite(value))
            result.append(value);
    }
    return result;
}

double liquidityPoints(double avgVolume)
{
    if (avgVolume > 5'000'000.0)
        return 20.0;
    if (avgVolume > 2'000'000.0)
        return 15.0;
    if (avgVolume > 1'000'000.0)
        return 10.0;
    if (avgVolume > 500'000.0)
        return 5.0;
    return 0.0;
}

double consistencyPoints(double cv)
{
    if (cv < 0.3)
        return 20.0;
    if (cv < 0.5)
        return 15.0;
    if (cv < 0.8)
        return 12.0;
    if (cv < 1.2)
        return 8.0;
    return 5.0;
}

double volatilityPoints(double volatility)
{
    if (volatility < 0.02)
        return 15.0;
    if (volatility < 0.03)
        return 12.0;
    if (volatility < 0.04)
        return 9.0;
    if (volatility < 0.06)
        return 6.0;
    return 3.0;
}

double technicalPoints(double rsi, double volatility)
{
    double points = 2.0;
    if (rsi >= 40.0 && rsi <= 60.0)
        points = 8.0;
    else if (rsi >= 30.0 && rsi <= 70.0)
        points = 5.0;
    else if (rsi < 30.0)
        points = 10.0;

    if (volatility < 0.02)
        points += 7.0;
    else if (volatility < 0.04)
        points += 4.0;
    else if (volatility < 0.06)
        points += 2.0;
    return qMin(points, 15.0);
}

} // namespace

UniverseScanner::UniverseScanner(std::shared_ptr<MarketDataSourceInterface> source,
                                 const DataQualityValidator& validator, const Settings& settings)
    : m_source(std::move(source))
    , m_validator(validator)
    , m_settings(settings)
{
    m_workerPool.setMaxThreadCount(qMax(1, settings.maxWorkers));
}

UniverseScanner::~UniverseScanner()
{
    m_workerPool.waitForDone();
}

TechnicalSnapshot UniverseScanner::technicals(const PriceSeries& history, int volumeWindow)
{
    TechnicalSnapshot snapshot;
    if (history.isEmpty())
        return snapshot;

    const QVector<double> closes = screener::series::closes(history);
    QVector<double> volumes;
    volumes.reserve(history.size());
    for (const PriceBar& bar : history)
        volumes.append(bar.volume);

    snapshot.price = closes.constLast();
    snapshot.ma20 = screener::series::mean(lastN(closes, 20));
    snapshot.ma50 = screener::series::mean(lastN(closes, 50));
    snapshot.rsi = screener::series::relativeStrengthIndex(closes, 14);

    const QVector<double> returns = finiteOnly(screener::series::simpleReturns(closes));
    snapshot.volatility = screener::series::sampleStd(lastN(returns, 20));

    const QVector<double> recentVolume = lastN(volumes, volumeWindow);
    snapshot.avgVolume = screener::series::mean(recentVolume);
    snapshot.volumeCv = snapshot.avgVolume > 0.0 ? screener::series::sampleStd(recentVolume) / snapshot.avgVolume : 0.0;

    if (snapshot.ma20 > 0.0)
        snapshot.priceVsMa20Pct = (snapshot.price / snapshot.ma20 - 1.0) * 100.0;
    if (snapshot.ma50 > 0.0)
        snapshot.priceVsMa50Pct = (snapshot.price / snapshot.ma50 - 1.0) * 100.0;
    return snapshot;
}

double UniverseScanner::screeningScore(const TechnicalSnapshot& technical, double sectorWeight)
{
    double score = liquidityPoints(technical.avgVolume);
    score += consistencyPoints(technical.volumeCv);
    score += volatilityPoints(technical.volatility);

    if (technical.price > technical.ma20)
        score += 5.0;
    if (technical.price > technical.ma50)
        score += 5.0;
    if (technical.ma20 > technical.ma50)
        score += 5.0;

    score += technicalPoints(technical.rsi, technical.volatility);
    score += qBound(0.0, (sectorWeight - 0.9) / 0.5 * 15.0, 15.0);
    return qBound(0.0, score, 100.0);
}

bool UniverseScanner::passesFilters(const TechnicalSnapshot& technical, QString* reason) const
{
    if (technical.price < m_settings.minPrice || technical.price > m_settings.maxPrice) {
        if (reason) {
            *reason = QStringLiteral("price %1 outside [%2, %3]")
                          .arg(technical.price, 0, 'f', 2)
                          .arg(m_settings.minPrice, 0, 'f', 2)
                          .arg(m_settings.maxPrice, 0, 'f', 2);
        }
        return false;
    }
    if (technical.avgVolume < m_settings.minAvgVolume) {
        if (reason) {
            *reason = QStringLiteral("average volume %1 below %2")
                          .arg(technical.avgVolume, 0, 'f', 0)
                          .arg(m_settings.minAvgVolume, 0, 'f', 0);
        }
        return false;
    }
    return true;
}

UniverseScanner::SymbolReport UniverseScanner::scanOne(const UniverseEntry& entry, const QDate& asOf) const
{
    SymbolReport report;
    report.symbol = entry.symbol;

    const MarketDataSourceInterface::SeriesResult fetched =
        m_source->fetch(entry.symbol, asOf.addDays(-m_settings.lookbackDays), asOf);
    if (!fetched.ok) {
        report.outcome = Outcome::Failed;
        report.reason = fetched.errorMessage.isEmpty() ? QStringLiteral("fetch failed") : fetched.errorMessage;
        return report;
    }

    const DataQualityValidator::ValidationResult validation = m_validator.validate(fetched.series, entry.symbol);
    report.warnings = validation.warnings;
    if (!validation.isValid) {
        report.outcome = Outcome::Failed;
        report.reason = QStringLiteral("data quality: %1").arg(validation.issues.join(QStringLiteral("; ")));
        return report;
    }
    if (fetched.series.size() < m_settings.minHistory) {
        report.outcome = Outcome::Rejected;
        report.reason = QStringLiteral("only %1 bars, need %2").arg(fetched.series.size()).arg(m_settings.minHistory);
        return report;
    }

    const TechnicalSnapshot technical = technicals(fetched.series, m_settings.volumeWindow);
    QString reason;
    if (!passesFilters(technical, &reason)) {
        report.outcome = Outcome::Rejected;
        report.reason = reason;
        return report;
    }

    StockCandidate& candidate = report.stock.candidate;
    candidate.symbol = entry.symbol;
    candidate.name = entry.name.isEmpty() ? entry.symbol : entry.name;
    candidate.sector = entry.sector;
    candidate.marketCap = entry.marketCap;
    candidate.technical = technical;
    candidate.screeningScore = screeningScore(technical, m_settings.sectorWeights.value(entry.sector, 1.0));
    report.stock.history = fetched.series;
    report.outcome = Outcome::Accepted;
    return report;
}

UniverseScanner::ScanResult UniverseScanner::scan(const QVector<UniverseEntry>& universe, const QDate& asOf,
                                                  const ProgressCallback& progress, const CancelCheck& cancelled)
{
    qCInfo(lcScanner) << "Scanning" << universe.size() << "symbols as of" << asOf.toString(Qt::ISODate);

    QVector<QFuture<SymbolReport>> futures;
    futures.reserve(universe.size());
    for (const UniverseEntry& entry : universe) {
        futures.append(QtConcurrent::run(&m_workerPool, [this, entry, asOf, progress, cancelled]() {
            if (cancelled && cancelled()) {
                SymbolReport skipped;
                skipped.symbol = entry.symbol;
                skipped.outcome = Outcome::Skipped;
                skipped.reason = QStringLiteral("cancelled");
                return skipped;
            }
            SymbolReport report = scanOne(entry, asOf);
            if (progress)
                progress(report);
            return report;
        }));
    }

    ScanResult result;
    for (QFuture<SymbolReport>& future : futures) {
        future.waitForFinished();
        const SymbolReport report = future.result();
        switch (report.outcome) {
        case Outcome::Accepted:
            result.stocks.append(report.stock);
            break;
        case Outcome::Rejected:
            result.rejectedSymbols.append(report.symbol);
            break;
        case Outcome::Failed:
            qCWarning(lcScanner).noquote() << report.symbol << report.reason;
            result.failedSymbols.append(report.symbol);
            break;
        case Outcome::Skipped:
            result.skippedSymbols.append(report.symbol);
            break;
        }
    }
    result.cancelled = !result.skippedSymbols.isEmpty();

    qCInfo(lcScanner) << "Scan finished:" << result.stocks.size() << "accepted," << result.rejectedSymbols.size()
                      << "rejected," << result.failedSymbols.size() << "failed";
    return result;
}
