#include "MarketRegimeEngine.hpp"

#include <QLoggingCategory>
#include <QtMath>

#include <cmath>
#include <utility>
#include <limits>

#include "data/PriceSeries.hpp"

Q_LOGGING_CATEGORY(lcRegime, "screener.regime")

namespace {

QVector<double> forwardFilled(const QVector<double>& values)
{
    QVector<double> result = values;
    double last = std::numeric_limits<double>::quiet_NaN();
    for (double& value : result) {
        if (std::isfinite(value))
            last = value;
        else
            value = last;
    }
    return result;
}

double pctChange(double previous, double current)
{
    if (!std::isfinite(previous) || !std::isfinite(current) || qFuzzyIsNull(previous))
        return std::numeric_limits<double>::quiet_NaN();
    return (current - previous) / previous;
}

} // namespace

MarketRegimeEngine::MarketRegimeEngine(std::shared_ptr<MarketDataSourceInterface> source)
    : MarketRegimeEngine(std::move(source), Settings{})
{
}

MarketRegimeEngine::MarketRegimeEngine(std::shared_ptr<MarketDataSourceInterface> source, const Settings& settings)
    : m_source(std::move(source))
    , m_settings(settings)
{
}

RegimeResult MarketRegimeEngine::detect(const QDate& asOf) const
{
    RegimeResult result;
    result.dataWindow.start = asOf.addDays(-m_settings.lookbackDays);
    result.dataWindow.end = asOf;

    if (!m_source) {
        result.error = QStringLiteral("no market data source");
        return result;
    }

    QStringList symbols{m_settings.indexSymbol, m_settings.fxSymbol};
    const bool hasProxy = !m_settings.volSymbol.trimmed().isEmpty();
    if (hasProxy)
        symbols.append(m_settings.volSymbol);

    const MarketDataSourceInterface::FrameResult fetched =
        m_source->fetchMany(symbols, result.dataWindow.start, result.dataWindow.end);
    if (!fetched.ok) {
        result.error = QStringLiteral("market data fetch failed: %1").arg(fetched.errorMessage);
        qCWarning(lcRegime) << "Regime detection aborted:" << result.error;
        return result;
    }
    if (fetched.frame.isEmpty()) {
        result.error = QStringLiteral("market data fetch returned no rows");
        qCWarning(lcRegime) << "Regime detection aborted:" << result.error;
        return result;
    }

    QString closeError;
    const std::optional<QVector<double>> indexClose = fetched.frame.closeFor(m_settings.indexSymbol, &closeError);
    const std::optional<QVector<double>> fxClose =
        indexClose ? fetched.frame.closeFor(m_settings.fxSymbol, &closeError) : std::nullopt;
    std::optional<QVector<double>> proxyClose;
    if (indexClose && fxClose && hasProxy)
        proxyClose = fetched.frame.closeFor(m_settings.volSymbol, &closeError);
    if (!indexClose || !fxClose || (hasProxy && !proxyClose)) {
        result.error = QStringLiteral("cannot extract close prices: %1").arg(closeError);
        qCWarning(lcRegime) << "Regime detection aborted:" << result.error;
        return result;
    }

    // Align on index trading days; other legs are carried forward over their holidays.
    const QVector<double> fxFilled = forwardFilled(*fxClose);
    const std::optional<QVector<double>> proxyFilled =
        proxyClose ? std::optional<QVector<double>>(forwardFilled(*proxyClose)) : std::nullopt;
    QVector<QDate> dates;
    QVector<double> index;
    QVector<double> fx;
    QVector<double> proxy;
    for (int i = 0; i < fetched.frame.index.size(); ++i) {
        if (!std::isfinite(indexClose->at(i)))
            continue;
        dates.append(fetched.frame.index.at(i));
        index.append(indexClose->at(i));
        fx.append(fxFilled.at(i));
        if (proxyFilled)
            proxy.append(proxyFilled->at(i));
    }

    result.dataWindow.rows = dates.size();
    if (!dates.isEmpty()) {
        result.dataWindow.start = dates.first();
        result.dataWindow.end = dates.last();
    }
    if (dates.size() < m_settings.minRows) {
        result.warning = QStringLiteral("insufficient_data: %1 rows, need %2").arg(dates.size()).arg(m_settings.minRows);
        qCWarning(lcRegime) << "Regime detection skipped:" << result.warning;
        return result;
    }

    const FeatureTable features =
        buildFeatures(dates, index, fx, proxyFilled ? std::optional<QVector<double>>(proxy) : std::nullopt);
    if (features.values.rows() < m_settings.minFeatureRows) {
        result.warning = QStringLiteral("insufficient_features: %1 rows, need %2")
                             .arg(features.values.rows())
                             .arg(m_settings.minFeatureRows);
        qCWarning(lcRegime) << "Regime detection skipped:" << result.warning;
        return result;
    }

    if (index.size() > 5)
        result.indexReturn5d = pctChange(index.at(index.size() - 6), index.last());

    const RegimeClassifier classifier(m_settings.classifier);
    const RegimeClassifier::Fit fit = classifier.classify(features.values, kRealizedVolColumn);
    double highVolProbability = 0.0;
    if (fit.ok) {
        const QStringList labels = RegimeClassifier::stateLabels(fit.lastProbabilities.size());
        int bestState = 0;
        for (int s = 0; s < fit.lastProbabilities.size(); ++s) {
            result.regimeProbabilities[labels.at(s)] += fit.lastProbabilities.at(s);
            if (fit.lastProbabilities.at(s) > fit.lastProbabilities.at(bestState))
                bestState = s;
        }
        result.regimeLabel = labels.at(bestState);
        result.regimeMethod = fit.method;
        highVolProbability = result.probabilityOf(screener::regime::kHighVol);
        if (!fit.converged)
            result.warning = fit.diagnostics.join(QStringLiteral("; "));
    } else {
        result.warning = QStringLiteral("regime classification failed: %1")
                             .arg(fit.diagnostics.join(QStringLiteral("; ")));
        qCWarning(lcRegime) << result.warning;
    }

    QVector<double> returns;
    for (double value : screener::series::simpleReturns(index)) {
        if (std::isfinite(value))
            returns.append(value);
    }
    const VolatilityForecaster forecaster(m_settings.volatility);
    const VolatilityForecaster::Forecast vol = forecaster.forecast(returns);
    if (vol.ok) {
        result.volMethod = vol.method;
        result.vol1d = vol.vol1d;
        result.volAnnual = vol.volAnnual;
    }

    result.crashRiskScore = crashRisk(highVolProbability, features.realizedVol);

    qCInfo(lcRegime) << "Regime" << result.regimeLabel << "via" << result.regimeMethod << "vol" << result.volMethod
                     << "crash risk" << result.crashRiskScore << "rows" << features.values.rows();
    return result;
}

MarketRegimeEngine::FeatureTable MarketRegimeEngine::buildFeatures(const QVector<QDate>& dates,
                                                                   const QVector<double>& index,
                                                                   const QVector<double>& fx,
                                                                   const std::optional<QVector<double>>& proxy) const
{
    const int n = dates.size();
    const double nan = std::numeric_limits<double>::quiet_NaN();

    QVector<double> indexReturn(n, nan);
    QVector<double> fxReturn(n, nan);
    for (int i = 1; i < n; ++i) {
        indexReturn[i] = pctChange(index.at(i - 1), index.at(i));
        fxReturn[i] = pctChange(fx.at(i - 1), fx.at(i));
    }

    QVector<double> level(n, nan);
    if (proxy) {
        level = *proxy;
    } else {
        const QVector<double> rolling = screener::series::rollingStd(indexReturn, m_settings.proxyVolWindow);
        for (int i = 0; i < n; ++i)
            level[i] = rolling.at(i) * std::sqrt(252.0) * 100.0;
    }
    QVector<double> levelChange(n, nan);
    for (int i = 1; i < n; ++i)
        levelChange[i] = pctChange(level.at(i - 1), level.at(i));

    const QVector<double> realized = screener::series::rollingStd(indexReturn, m_settings.realizedVolWindow);

    QVector<int> complete;
    for (int i = 0; i < n; ++i) {
        if (std::isfinite(indexReturn.at(i)) && std::isfinite(fxReturn.at(i)) && std::isfinite(level.at(i))
            && std::isfinite(levelChange.at(i)) && std::isfinite(realized.at(i))) {
            complete.append(i);
        }
    }

    FeatureTable table;
    table.values.resize(complete.size(), 5);
    for (int row = 0; row < complete.size(); ++row) {
        const int i = complete.at(row);
        table.dates.append(dates.at(i));
        table.values(row, 0) = indexReturn.at(i);
        table.values(row, 1) = fxReturn.at(i);
        table.values(row, 2) = level.at(i);
        table.values(row, 3) = levelChange.at(i);
        table.values(row, kRealizedVolColumn) = realized.at(i);
        table.realizedVol.append(realized.at(i));
    }
    return table;
}

double MarketRegimeEngine::crashRisk(double highVolProbability, const QVector<double>& realizedVol) const
{
    double percentile = 0.0;
    if (!realizedVol.isEmpty()) {
        const double current = realizedVol.last();
        int atOrBelow = 0;
        for (double value : realizedVol) {
            if (value <= current)
                ++atOrBelow;
        }
        percentile = static_cast<double>(atOrBelow) / realizedVol.size();
    }
    const double weight = qBound(0.0, m_settings.crashBlendWeight, 1.0);
    return qBound(0.0, weight * highVolProbability + (1.0 - weight) * percentile, 1.0);
}
