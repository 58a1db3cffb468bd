#include "VolatilityForecaster.hpp"

#include <QLoggingCategory>
#include <QtMath>

#include <cmath>
#include <limits>

#include "data/PriceSeries.hpp"
#include "regime/RegimeTypes.hpp"

Q_LOGGING_CATEGORY(lcVolatility, "screener.regime.volatility")

namespace {

constexpr double kMinAlpha = 1e-4;
constexpr double kMaxPersistence = 0.999;

QVector<double> demeaned(const QVector<double>& returns)
{
    const double avg = screener::series::mean(returns);
    QVector<double> result;
    result.reserve(returns.size());
    for (double value : returns)
        result.append(value - avg);
    return result;
}

// Gaussian negative log-likelihood (constants dropped) of a variance-targeted
// GARCH(1,1). Returns +inf outside the admissible region.
double garchObjective(const QVector<double>& r, double sampleVariance, double alpha, double beta,
                      double* lastVariance = nullptr)
{
    if (alpha < kMinAlpha || beta < 0.0 || alpha + beta >= kMaxPersistence)
        return std::numeric_limits<double>::infinity();

    const double omega = sampleVariance * (1.0 - alpha - beta);
    double h = sampleVariance;
    double total = 0.0;
    for (int t = 0; t < r.size(); ++t) {
        if (t > 0)
            h = omega + alpha * r.at(t - 1) * r.at(t - 1) + beta * h;
        if (!(h > 0.0))
            return std::numeric_limits<double>::infinity();
        total += std::log(h) + r.at(t) * r.at(t) / h;
    }
    if (lastVariance)
        *lastVariance = h;
    return total;
}

} // namespace

VolatilityForecaster::VolatilityForecaster(const Settings& settings)
    : m_settings(settings)
{
}

VolatilityForecaster::Forecast VolatilityForecaster::forecast(const QVector<double>& returns) const
{
    if (m_settings.garchEnabled) {
        Forecast garch = fitGarch(returns);
        if (garch.ok)
            return garch;
        qCInfo(lcVolatility) << "GARCH unavailable, using EWMA:" << garch.diagnostic;
        Forecast fallback = ewma(returns);
        fallback.diagnostic = garch.diagnostic;
        return fallback;
    }
    return ewma(returns);
}

VolatilityForecaster::Forecast VolatilityForecaster::fitGarch(const QVector<double>& returns) const
{
    Forecast result;
    result.method = screener::regime::kMethodGarch;
    if (returns.size() < m_settings.garchMinObservations) {
        result.diagnostic = QStringLiteral("garch needs %1 returns, have %2")
                                .arg(m_settings.garchMinObservations)
                                .arg(returns.size());
        return result;
    }

    const QVector<double> r = demeaned(returns);
    double sampleVariance = 0.0;
    for (double value : r)
        sampleVariance += value * value;
    sampleVariance /= r.size();
    if (!(sampleVariance > 0.0)) {
        result.diagnostic = QStringLiteral("garch input has zero variance");
        return result;
    }

    // Coarse grid, then a shrinking pattern search around the best point.
    double bestAlpha = 0.0;
    double bestBeta = 0.0;
    double best = std::numeric_limits<double>::infinity();
    for (double a = 0.02; a <= 0.30; a += 0.02) {
        for (double b = 0.50; b <= 0.98; b += 0.02) {
            const double value = garchObjective(r, sampleVariance, a, b);
            if (value < best) {
                best = value;
                bestAlpha = a;
                bestBeta = b;
            }
        }
    }
    if (!std::isfinite(best)) {
        result.diagnostic = QStringLiteral("garch likelihood not finite");
        return result;
    }

    double step = 0.01;
    bool converged = false;
    for (int iteration = 0; iteration < m_settings.maxIterations; ++iteration) {
        bool improved = false;
        const double candidates[4][2] = {{step, 0.0}, {-step, 0.0}, {0.0, step}, {0.0, -step}};
        for (const auto& delta : candidates) {
            const double value = garchObjective(r, sampleVariance, bestAlpha + delta[0], bestBeta + delta[1]);
            if (value < best - 1e-12) {
                best = value;
                bestAlpha += delta[0];
                bestBeta += delta[1];
                improved = true;
            }
        }
        if (!improved)
            step *= 0.5;
        if (step < m_settings.tolerance) {
            converged = true;
            break;
        }
    }
    if (!converged) {
        result.diagnostic = QStringLiteral("garch optimizer did not converge");
        return result;
    }
    if (bestAlpha + bestBeta > kMaxPersistence - 1e-3) {
        result.diagnostic = QStringLiteral("garch persistence at bound (%1)").arg(bestAlpha + bestBeta);
        return result;
    }

    double lastVariance = sampleVariance;
    garchObjective(r, sampleVariance, bestAlpha, bestBeta, &lastVariance);
    const double omega = sampleVariance * (1.0 - bestAlpha - bestBeta);
    const double next = omega + bestAlpha * r.last() * r.last() + bestBeta * lastVariance;
    if (!(next > 0.0) || !std::isfinite(next)) {
        result.diagnostic = QStringLiteral("garch forecast not positive");
        return result;
    }

    result.ok = true;
    result.omega = omega;
    result.alpha = bestAlpha;
    result.beta = bestBeta;
    result.vol1d = std::sqrt(next);
    result.volAnnual = result.vol1d * std::sqrt(static_cast<double>(m_settings.tradingDaysPerYear));
    return result;
}

VolatilityForecaster::Forecast VolatilityForecaster::ewma(const QVector<double>& returns) const
{
    Forecast result;
    result.method = screener::regime::kMethodEwma;
    if (returns.size() < 2) {
        result.method = screener::regime::kMethodNone;
        result.diagnostic = QStringLiteral("ewma needs at least 2 returns");
        return result;
    }

    const double lambda = qBound(0.0, m_settings.ewmaLambda, 0.9999);
    const int seed = qMin(20, returns.size());
    double variance = 0.0;
    for (int i = 0; i < seed; ++i)
        variance += returns.at(i) * returns.at(i);
    variance /= seed;
    for (int i = seed; i < returns.size(); ++i)
        variance = lambda * variance + (1.0 - lambda) * returns.at(i) * returns.at(i);

    result.ok = true;
    result.vol1d = std::sqrt(variance);
    result.volAnnual = result.vol1d * std::sqrt(static_cast<double>(m_settings.tradingDaysPerYear));
    return result;
}
