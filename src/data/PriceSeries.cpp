#include "PriceSeries.hpp"

#include <QtMath>

#include <cmath>
#include <limits>
#include <numeric>

namespace screener::series {

QVector<double> closes(const PriceSeries& series)
{
    QVector<double> result;
    result.reserve(series.size());
    for (const PriceBar& bar : series)
        result.append(bar.close);
    return result;
}

QVector<double> simpleReturns(const QVector<double>& values)
{
    QVector<double> result;
    if (values.size() < 2)
        return result;
    result.reserve(values.size() - 1);
    for (int i = 1; i < values.size(); ++i) {
        const double previous = values.at(i - 1);
        if (qFuzzyIsNull(previous)) {
            result.append(std::numeric_limits<double>::quiet_NaN());
            continue;
        }
        result.append((values.at(i) - previous) / previous);
    }
    return result;
}

QVector<double> rollingMean(const QVector<double>& values, int window)
{
    QVector<double> result(values.size(), std::numeric_limits<double>::quiet_NaN());
    if (window <= 0)
        return result;
    double sum = 0.0;
    for (int i = 0; i < values.size(); ++i) {
        sum += values.at(i);
        if (i >= window)
            sum -= values.at(i - window);
        if (i + 1 >= window)
            result[i] = sum / window;
    }
    return result;
}

QVector<double> rollingStd(const QVector<double>& values, int window)
{
    QVector<double> result(values.size(), std::numeric_limits<double>::quiet_NaN());
    if (window < 2)
        return result;
    for (int i = window - 1; i < values.size(); ++i) {
        const QVector<double> slice = values.mid(i - window + 1, window);
        result[i] = sampleStd(slice);
    }
    return result;
}

double mean(const QVector<double>& values)
{
    if (values.isEmpty())
        return 0.0;
    return std::accumulate(values.cbegin(), values.cend(), 0.0) / values.size();
}

double sampleStd(const QVector<double>& values)
{
    if (values.size() < 2)
        return 0.0;
    const double avg = mean(values);
    double acc = 0.0;
    for (double value : values) {
        const double diff = value - avg;
        acc += diff * diff;
    }
    return std::sqrt(acc / (values.size() - 1));
}

double relativeStrengthIndex(const QVector<double>& closes, int period)
{
    if (period <= 0 || closes.size() <= period)
        return 50.0;

    double gains = 0.0;
    double losses = 0.0;
    for (int i = closes.size() - period; i < closes.size(); ++i) {
        const double change = closes.at(i) - closes.at(i - 1);
        if (change > 0.0)
            gains += change;
        else
            losses -= change;
    }
    if (qFuzzyIsNull(losses))
        return qFuzzyIsNull(gains) ? 50.0 : 100.0;
    const double rs = (gains / period) / (losses / period);
    return 100.0 - 100.0 / (1.0 + rs);
}

PriceSeries tail(const PriceSeries& series, const QDate& from)
{
    PriceSeries result;
    for (const PriceBar& bar : series) {
        if (bar.date >= from)
            result.append(bar);
    }
    return result;
}

} // namespace screener::series
