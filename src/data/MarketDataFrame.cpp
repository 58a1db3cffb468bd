#include "MarketDataFrame.hpp"

#include <QMap>
#include <QSet>

#include <algorithm>
#include <limits>

QStringList MarketDataFrame::symbols() const
{
    QStringList result = columns.keys();
    std::sort(result.begin(), result.end());
    return result;
}

QStringList MarketDataFrame::fields(const QString& symbol) const
{
    QStringList result = columns.value(symbol).keys();
    std::sort(result.begin(), result.end());
    return result;
}

std::optional<QVector<double>> MarketDataFrame::closeFor(const QString& symbol, QString* error) const
{
    const auto symbolIt = columns.constFind(symbol);
    if (symbolIt == columns.constEnd()) {
        if (error)
            *error = QStringLiteral("symbol %1 missing from frame").arg(symbol);
        return std::nullopt;
    }

    const QHash<QString, QVector<double>>& byField = symbolIt.value();
    for (const QString& field : {screener::fields::kAdjClose, screener::fields::kClose}) {
        const auto it = byField.constFind(field);
        if (it != byField.constEnd() && it->size() == index.size())
            return it.value();
    }

    if (error) {
        *error = QStringLiteral("no close field for %1 (available: %2)")
                     .arg(symbol, fields(symbol).join(QStringLiteral(", ")));
    }
    return std::nullopt;
}

void MarketDataFrame::insertColumn(const QString& symbol, const QString& field, const QVector<double>& values)
{
    columns[symbol].insert(field, values);
}

MarketDataFrame MarketDataFrame::fromSeries(const QHash<QString, PriceSeries>& seriesBySymbol)
{
    MarketDataFrame frame;

    QSet<QDate> allDates;
    for (auto it = seriesBySymbol.cbegin(); it != seriesBySymbol.cend(); ++it) {
        for (const PriceBar& bar : it.value())
            allDates.insert(bar.date);
    }
    frame.index = QVector<QDate>(allDates.cbegin(), allDates.cend());
    std::sort(frame.index.begin(), frame.index.end());

    QHash<QDate, int> position;
    for (int i = 0; i < frame.index.size(); ++i)
        position.insert(frame.index.at(i), i);

    const double nan = std::numeric_limits<double>::quiet_NaN();
    for (auto it = seriesBySymbol.cbegin(); it != seriesBySymbol.cend(); ++it) {
        QVector<double> open(frame.index.size(), nan);
        QVector<double> high(frame.index.size(), nan);
        QVector<double> low(frame.index.size(), nan);
        QVector<double> close(frame.index.size(), nan);
        QVector<double> volume(frame.index.size(), nan);
        for (const PriceBar& bar : it.value()) {
            const int row = position.value(bar.date);
            open[row] = bar.open;
            high[row] = bar.high;
            low[row] = bar.low;
            close[row] = bar.close;
            volume[row] = bar.volume;
        }
        frame.insertColumn(it.key(), screener::fields::kOpen, open);
        frame.insertColumn(it.key(), screener::fields::kHigh, high);
        frame.insertColumn(it.key(), screener::fields::kLow, low);
        frame.insertColumn(it.key(), screener::fields::kClose, close);
        frame.insertColumn(it.key(), screener::fields::kVolume, volume);
    }
    return frame;
}
