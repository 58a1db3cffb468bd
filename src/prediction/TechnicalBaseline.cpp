#include "TechnicalBaseline.hpp"

#include <QtMath>

#include <cmath>

namespace {

double lastFinite(const QVector<double>& values)
{
    for (int i = values.size() - 1; i >= 0; --i) {
        if (std::isfinite(values.at(i)))
            return values.at(i);
    }
    return std::nan("");
}

} // namespace

TechnicalBaseline::TechnicalBaseline(const Settings& settings)
    : m_settings(settings)
{
}

TechnicalBaseline::Signals TechnicalBaseline::breakdown(const PriceSeries& history) const
{
    Signals result;
    const QVector<double> closes = screener::series::closes(history);
    if (closes.size() < 3)
        return result;

    const QVector<double> returns = screener::series::simpleReturns(closes);
    const double dailyStd = screener::series::sampleStd(returns);
    const double last = closes.last();

    const int momentumDays = qMin(m_settings.momentumDays, closes.size() - 1);
    const double past = closes.at(closes.size() - 1 - momentumDays);
    if (dailyStd > 0.0 && past > 0.0) {
        const double move = (last - past) / past;
        result.momentum = std::tanh(move / (dailyStd * std::sqrt(static_cast<double>(momentumDays))));
    }

    const double rsi = screener::series::relativeStrengthIndex(closes, m_settings.rsiPeriod);
    const int shortWindow = qMin(m_settings.shortWindow, closes.size());
    const QVector<double> recent = closes.mid(closes.size() - shortWindow);
    const double shortMean = screener::series::mean(recent);
    const double shortStd = screener::series::sampleStd(recent);
    const double zScore = shortStd > 0.0 ? (last - shortMean) / shortStd : 0.0;
    result.meanReversion = qBound(-1.0, ((50.0 - rsi) / 50.0 + qBound(-1.0, -zScore / 2.0, 1.0)) / 2.0, 1.0);

    const int longWindow = qMin(m_settings.longWindow, closes.size());
    if (longWindow > shortWindow) {
        const double fast = lastFinite(screener::series::rollingMean(closes, shortWindow));
        const double slow = lastFinite(screener::series::rollingMean(closes, longWindow));
        if (std::isfinite(fast) && std::isfinite(slow) && slow > 0.0 && dailyStd > 0.0)
            result.crossover = std::tanh((fast / slow - 1.0) / (dailyStd * std::sqrt(static_cast<double>(shortWindow))));
    }
    return result;
}

ComponentSignal TechnicalBaseline::evaluate(const PriceSeries& history) const
{
    ComponentSignal component;
    component.present = true;

    const Signals s = breakdown(history);
    const double sum = s.momentum + s.meanReversion + s.crossover;
    const double magnitude = std::abs(s.momentum) + std::abs(s.meanReversion) + std::abs(s.crossover);
    component.direction = qBound(-1.0, sum / 3.0, 1.0);

    if (magnitude > 0.0) {
        const double agreement = std::abs(sum) / magnitude;
        const double strength = magnitude / 3.0;
        const double coverage = qMin(1.0, static_cast<double>(history.size()) / m_settings.longWindow);
        component.confidence = qBound(0.0, (0.5 * agreement + 0.5 * strength) * coverage, 1.0);
    }
    component.detail = QStringLiteral("momentum=%1 reversion=%2 crossover=%3")
                           .arg(s.momentum, 0, 'f', 3)
                           .arg(s.meanReversion, 0, 'f', 3)
                           .arg(s.crossover, 0, 'f', 3);
    return component;
}
