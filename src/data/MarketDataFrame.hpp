#pragma once

#include <QDate>
#include <QHash>
#include <QString>
#include <QStringList>
#include <QVector>

#include <optional>

#include "data/PriceSeries.hpp"

// Multi-symbol table with a two-level column key (symbol, field) over one
// shared date index. Cells missing for a symbol hold NaN.
struct MarketDataFrame {
    QVector<QDate> index;
    QHash<QString, QHash<QString, QVector<double>>> columns;

    bool isEmpty() const { return index.isEmpty() || columns.isEmpty(); }
    QStringList symbols() const;
    QStringList fields(const QString& symbol) const;

    //! Close values for `symbol`, preferring "Adj Close" over "Close".
    //! Returns nullopt with `error` set when the symbol or both fields are absent.
    std::optional<QVector<double>> closeFor(const QString& symbol, QString* error = nullptr) const;

    void insertColumn(const QString& symbol, const QString& field, const QVector<double>& values);

    //! Outer join of per-symbol series on their dates.
    static MarketDataFrame fromSeries(const QHash<QString, PriceSeries>& seriesBySymbol);
};

namespace screener::fields {
inline const QString kOpen = QStringLiteral("Open");
inline const QString kHigh = QStringLiteral("High");
inline const QString kLow = QStringLiteral("Low");
inline const QString kClose = QStringLiteral("Close");
inline const QString kAdjClose = QStringLiteral("Adj Close");
inline const QString kVolume = QStringLiteral("Volume");
} // namespace screener::fields
