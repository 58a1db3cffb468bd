#pragma once

#include <QDate>
#include <QMetaType>
#include <QString>
#include <QVector>

struct PriceBar {
    QDate  date;
    double open = 0.0;
    double high = 0.0;
    double low = 0.0;
    double close = 0.0;
    double volume = 0.0;
};
Q_DECLARE_METATYPE(PriceBar)

using PriceSeries = QVector<PriceBar>;

namespace screener::series {

//! Close column in series order.
QVector<double> closes(const PriceSeries& series);

//! Simple returns; element i covers the pair (i, i + 1).
QVector<double> simpleReturns(const QVector<double>& values);

//! Rolling mean; positions without a full window are NaN.
QVector<double> rollingMean(const QVector<double>& values, int window);

//! Rolling sample standard deviation; NaN before the first full window.
QVector<double> rollingStd(const QVector<double>& values, int window);

double mean(const QVector<double>& values);
double sampleStd(const QVector<double>& values);

//! RSI over the last `period` changes. Returns 50 for short series.
double relativeStrengthIndex(const QVector<double>& closes, int period = 14);

PriceSeries tail(const PriceSeries& series, const QDate& from);

} // namespace screener::series
