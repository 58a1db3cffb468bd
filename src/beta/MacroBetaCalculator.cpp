#include "MacroBetaCalculator.hpp"

#include <QLoggingCategory>

#include <cmath>
#include <utility>

Q_LOGGING_CATEGORY(lcMacroBeta, "screener.beta")

namespace {

// date -> simple return from the previous bar of the same series
QHash<QDate, double> returnsByDate(const PriceSeries& series)
{
    QHash<QDate, double> result;
    for (int i = 1; i < series.size(); ++i) {
        const double previous = series.at(i - 1).close;
        if (!(previous > 0.0) || !std::isfinite(series.at(i).close))
            continue;
        result.insert(series.at(i).date, (series.at(i).close - previous) / previous);
    }
    return result;
}

} // namespace

MacroBetaCalculator::MacroBetaCalculator(std::shared_ptr<MarketDataSourceInterface> source,
                                         const DataQualityValidator& validator)
    : MacroBetaCalculator(std::move(source), validator, Settings{})
{
}

MacroBetaCalculator::MacroBetaCalculator(std::shared_ptr<MarketDataSourceInterface> source,
                                         const DataQualityValidator& validator, const Settings& settings)
    : m_source(std::move(source))
    , m_validator(validator)
    , m_settings(settings)
{
}

QStringList MacroBetaCalculator::factorNames() const
{
    QStringList names;
    for (const FactorDefinition& factor : m_settings.factors)
        names.append(factor.name);
    return names;
}

std::optional<double> MacroBetaCalculator::betaFor(const PriceSeries& stock, const PriceSeries& factor,
                                                   QString* reason) const
{
    const QHash<QDate, double> stockReturns = returnsByDate(stock);
    const QHash<QDate, double> factorReturns = returnsByDate(factor);

    QVector<double> x;
    QVector<double> y;
    for (auto it = stockReturns.cbegin(); it != stockReturns.cend(); ++it) {
        const auto factorIt = factorReturns.constFind(it.key());
        if (factorIt == factorReturns.constEnd())
            continue;
        x.append(factorIt.value());
        y.append(it.value());
    }

    if (x.size() < m_settings.minObservations) {
        if (reason)
            *reason = QStringLiteral("%1 overlapping observations, need %2").arg(x.size()).arg(m_settings.minObservations);
        return std::nullopt;
    }

    const double meanX = screener::series::mean(x);
    const double meanY = screener::series::mean(y);
    double covariance = 0.0;
    double variance = 0.0;
    for (int i = 0; i < x.size(); ++i) {
        covariance += (x.at(i) - meanX) * (y.at(i) - meanY);
        variance += (x.at(i) - meanX) * (x.at(i) - meanX);
    }
    covariance /= (x.size() - 1);
    variance /= (x.size() - 1);

    if (!std::isfinite(variance) || variance < m_settings.varianceEpsilon) {
        if (reason)
            *reason = QStringLiteral("factor variance degenerate (%1)").arg(variance);
        return std::nullopt;
    }
    const double beta = covariance / variance;
    if (!std::isfinite(beta)) {
        if (reason)
            *reason = QStringLiteral("beta not finite");
        return std::nullopt;
    }
    return beta;
}

MacroBetaCalculator::BetaReport MacroBetaCalculator::computeBetas(const QStringList& symbols, const QDate& asOf) const
{
    BetaReport report;
    if (!m_source) {
        report.missingSymbols = symbols;
        return report;
    }

    const QDate start = asOf.addDays(-m_settings.lookbackDays);

    QHash<QString, PriceSeries> factorSeries;
    for (const FactorDefinition& factor : m_settings.factors) {
        const MarketDataSourceInterface::SeriesResult fetched = m_source->fetch(factor.symbol, start, asOf);
        if (!fetched.ok || fetched.series.isEmpty()) {
            qCWarning(lcMacroBeta) << "Factor series unavailable" << factor.name << factor.symbol
                                   << fetched.errorMessage;
            report.missingFactors.append(factor.name);
            continue;
        }
        factorSeries.insert(factor.name, fetched.series);
    }

    for (const QString& symbol : symbols) {
        const MarketDataSourceInterface::SeriesResult fetched = m_source->fetch(symbol, start, asOf);
        if (!fetched.ok) {
            qCWarning(lcMacroBeta) << "Skipping" << symbol << fetched.errorMessage;
            report.missingSymbols.append(symbol);
            continue;
        }
        const DataQualityValidator::ValidationResult validation = m_validator.validate(fetched.series, symbol);
        if (!validation.isValid) {
            report.missingSymbols.append(symbol);
            continue;
        }

        QMap<QString, double> betas;
        for (const FactorDefinition& factor : m_settings.factors) {
            const auto factorIt = factorSeries.constFind(factor.name);
            if (factorIt == factorSeries.constEnd())
                continue;
            QString reason;
            const std::optional<double> beta = betaFor(fetched.series, factorIt.value(), &reason);
            if (beta) {
                betas.insert(factor.name, *beta);
            } else {
                report.undefinedPairs.append(QStringLiteral("%1/%2").arg(symbol, factor.name));
                qCInfo(lcMacroBeta) << "Beta undefined for" << symbol << factor.name << reason;
            }
        }
        if (!betas.isEmpty())
            report.betas.insert(symbol, betas);
    }

    qCInfo(lcMacroBeta) << "Computed betas for" << report.betas.size() << "of" << symbols.size() << "symbols";
    return report;
}

QJsonObject MacroBetaCalculator::betasToJson(const QMap<QString, double>& betas)
{
    QJsonObject object;
    for (auto it = betas.cbegin(); it != betas.cend(); ++it)
        object.insert(it.key(), it.value());
    return object;
}
