#include "DataQualityValidator.hpp"

#include <QJsonArray>
#include <QLoggingCategory>
#include <QSet>
#include <QtMath>

#include <algorithm>
#include <cmath>
#include <numeric>
#include <utility>

Q_LOGGING_CATEGORY(lcDataQuality, "screener.data.quality")

namespace {

bool isFinitePositive(double value)
{
    return std::isfinite(value) && value > 0.0;
}

bool isBusinessDay(const QDate& date)
{
    return date.dayOfWeek() <= 5;
}

QJsonArray datesToJson(const QVector<QDate>& dates)
{
    QJsonArray array;
    for (const QDate& date : dates)
        array.append(date.toString(Qt::ISODate));
    return array;
}

} // namespace

QJsonObject DataQualityValidator::ValidationResult::toJson() const
{
    QJsonObject stats;
    stats.insert(QStringLiteral("record_count"), statistics.recordCount);
    if (statistics.recordCount > 0) {
        stats.insert(QStringLiteral("date_range"),
                     QJsonObject{{QStringLiteral("start"), statistics.startDate.toString(Qt::ISODate)},
                                 {QStringLiteral("end"), statistics.endDate.toString(Qt::ISODate)},
                                 {QStringLiteral("days"), static_cast<double>(statistics.spanDays)}});
        stats.insert(QStringLiteral("price_range"),
                     QJsonObject{{QStringLiteral("min"), statistics.priceMin},
                                 {QStringLiteral("max"), statistics.priceMax},
                                 {QStringLiteral("mean"), statistics.priceMean},
                                 {QStringLiteral("std"), statistics.priceStd}});
        stats.insert(QStringLiteral("volume"),
                     QJsonObject{{QStringLiteral("mean"), statistics.volumeMean},
                                 {QStringLiteral("std"), statistics.volumeStd},
                                 {QStringLiteral("total"), statistics.volumeTotal}});
        stats.insert(QStringLiteral("returns"),
                     QJsonObject{{QStringLiteral("mean_daily"), statistics.returnMean},
                                 {QStringLiteral("std_daily"), statistics.returnStd},
                                 {QStringLiteral("min"), statistics.returnMin},
                                 {QStringLiteral("max"), statistics.returnMax}});
    }

    QJsonObject object;
    object.insert(QStringLiteral("symbol"), symbol);
    object.insert(QStringLiteral("is_valid"), isValid);
    object.insert(QStringLiteral("issues"), QJsonArray::fromStringList(issues));
    object.insert(QStringLiteral("warnings"), QJsonArray::fromStringList(warnings));
    object.insert(QStringLiteral("missing_business_days"), missingBusinessDays);
    object.insert(QStringLiteral("outlier_dates"), datesToJson(outlierDates));
    object.insert(QStringLiteral("split_candidates"), datesToJson(splitCandidates));
    object.insert(QStringLiteral("statistics"), stats);
    return object;
}

DataQualityValidator::DataQualityValidator(const Settings& settings)
    : m_settings(settings)
{
}

DataQualityValidator::ValidationResult DataQualityValidator::validate(const PriceSeries& series,
                                                                      const QString& symbol) const
{
    ValidationResult result;
    result.symbol = symbol;

    if (series.isEmpty()) {
        result.issues.append(QStringLiteral("%1: empty price series").arg(symbol));
        return result;
    }

    int missingFields = 0;
    int nonPositive = 0;
    for (const PriceBar& bar : series) {
        if (!bar.date.isValid() || !std::isfinite(bar.open) || !std::isfinite(bar.high) || !std::isfinite(bar.low)
            || !std::isfinite(bar.close) || !std::isfinite(bar.volume)) {
            ++missingFields;
            continue;
        }
        if (!isFinitePositive(bar.open) || !isFinitePositive(bar.high) || !isFinitePositive(bar.low)
            || !isFinitePositive(bar.close)) {
            ++nonPositive;
        }
    }
    if (missingFields > 0)
        result.issues.append(QStringLiteral("%1: %2 rows with missing fields").arg(symbol).arg(missingFields));
    if (nonPositive > 0)
        result.issues.append(QStringLiteral("%1: %2 rows with non-positive prices").arg(symbol).arg(nonPositive));

    result.statistics = computeStatistics(series);

    result.missingBusinessDays = countMissingBusinessDays(series);
    if (result.missingBusinessDays > 0) {
        result.warnings.append(
            QStringLiteral("%1: %2 missing business days").arg(symbol).arg(result.missingBusinessDays));
    }

    result.outlierDates = detectOutliers(series);
    if (!result.outlierDates.isEmpty()) {
        QStringList dates;
        const int reported = qMin(m_settings.maxReportedOutliers, result.outlierDates.size());
        for (int i = 0; i < reported; ++i)
            dates.append(result.outlierDates.at(i).toString(Qt::ISODate));
        result.warnings.append(QStringLiteral("%1: %2 return outliers (z > %3): %4")
                                   .arg(symbol)
                                   .arg(result.outlierDates.size())
                                   .arg(m_settings.outlierThreshold)
                                   .arg(dates.join(QStringLiteral(", "))));
        result.outlierDates.resize(reported);
    }

    result.splitCandidates = detectSplitCandidates(series);
    for (const QDate& date : std::as_const(result.splitCandidates)) {
        result.warnings.append(
            QStringLiteral("%1: potential unadjusted split on %2").arg(symbol, date.toString(Qt::ISODate)));
    }

    result.isValid = result.issues.isEmpty();
    if (!result.isValid)
        qCWarning(lcDataQuality) << "Validation failed for" << symbol << result.issues;
    return result;
}

DataQualityValidator::Statistics DataQualityValidator::computeStatistics(const PriceSeries& series) const
{
    Statistics stats;
    stats.recordCount = series.size();
    if (series.isEmpty())
        return stats;

    stats.startDate = series.first().date;
    stats.endDate = series.last().date;
    stats.spanDays = stats.startDate.daysTo(stats.endDate);

    const QVector<double> closes = screener::series::closes(series);
    const auto [minIt, maxIt] = std::minmax_element(closes.cbegin(), closes.cend());
    stats.priceMin = *minIt;
    stats.priceMax = *maxIt;
    stats.priceMean = screener::series::mean(closes);
    stats.priceStd = screener::series::sampleStd(closes);

    QVector<double> volumes;
    volumes.reserve(series.size());
    for (const PriceBar& bar : series)
        volumes.append(bar.volume);
    stats.volumeMean = screener::series::mean(volumes);
    stats.volumeStd = screener::series::sampleStd(volumes);
    stats.volumeTotal = std::accumulate(volumes.cbegin(), volumes.cend(), 0.0);

    const QVector<double> returns = screener::series::simpleReturns(closes);
    if (!returns.isEmpty()) {
        const auto [retMin, retMax] = std::minmax_element(returns.cbegin(), returns.cend());
        stats.returnMean = screener::series::mean(returns);
        stats.returnStd = screener::series::sampleStd(returns);
        stats.returnMin = *retMin;
        stats.returnMax = *retMax;
    }
    return stats;
}

int DataQualityValidator::countMissingBusinessDays(const PriceSeries& series) const
{
    if (series.size() < 2)
        return 0;

    QSet<QDate> present;
    for (const PriceBar& bar : series)
        present.insert(bar.date);

    int missing = 0;
    for (QDate date = series.first().date; date <= series.last().date; date = date.addDays(1)) {
        if (isBusinessDay(date) && !present.contains(date))
            ++missing;
    }
    return missing;
}

QVector<QDate> DataQualityValidator::detectOutliers(const PriceSeries& series) const
{
    QVector<QDate> outliers;
    const QVector<double> returns = screener::series::simpleReturns(screener::series::closes(series));
    if (returns.size() < 3)
        return outliers;

    const double avg = screener::series::mean(returns);
    const double deviation = screener::series::sampleStd(returns);
    if (deviation <= 0.0 || !std::isfinite(deviation))
        return outliers;

    for (int i = 0; i < returns.size(); ++i) {
        const double z = std::abs((returns.at(i) - avg) / deviation);
        if (z > m_settings.outlierThreshold)
            outliers.append(series.at(i + 1).date);
    }
    return outliers;
}

QVector<QDate> DataQualityValidator::detectSplitCandidates(const PriceSeries& series) const
{
    QVector<QDate> candidates;
    if (series.size() < 2)
        return candidates;

    QVector<double> volumes;
    volumes.reserve(series.size());
    for (const PriceBar& bar : series)
        volumes.append(bar.volume);
    const QVector<double> volumeMean = screener::series::rollingMean(volumes, m_settings.volumeWindow);

    for (int i = 1; i < series.size(); ++i) {
        const double previous = series.at(i - 1).close;
        if (!isFinitePositive(previous))
            continue;
        const double change = (series.at(i).close - previous) / previous;
        const double averageVolume = volumeMean.at(i);
        if (!std::isfinite(averageVolume) || averageVolume <= 0.0)
            continue;
        if (change < m_settings.splitReturnThreshold
            && series.at(i).volume > m_settings.splitVolumeMultiple * averageVolume) {
            candidates.append(series.at(i).date);
        }
    }
    return candidates;
}

PriceSeries DataQualityValidator::adjustForSplits(const PriceSeries& series, const QVector<QDate>& splitDates) const
{
    PriceSeries adjusted = series;
    for (const QDate& splitDate : splitDates) {
        int splitIndex = -1;
        for (int i = 0; i < adjusted.size(); ++i) {
            if (adjusted.at(i).date == splitDate) {
                splitIndex = i;
                break;
            }
        }
        if (splitIndex <= 0) {
            qCWarning(lcDataQuality) << "Split date not adjustable" << splitDate;
            continue;
        }

        const double splitClose = adjusted.at(splitIndex).close;
        const double priorClose = adjusted.at(splitIndex - 1).close;
        if (!isFinitePositive(splitClose) || !isFinitePositive(priorClose))
            continue;
        const double ratio = priorClose / splitClose;
        for (int i = 0; i < splitIndex; ++i) {
            PriceBar& bar = adjusted[i];
            bar.open /= ratio;
            bar.high /= ratio;
            bar.low /= ratio;
            bar.close /= ratio;
            bar.volume *= ratio;
        }
        qCInfo(lcDataQuality) << "Adjusted" << splitIndex << "bars before split on" << splitDate << "ratio" << ratio;
    }
    return adjusted;
}
