#pragma once

#include <QDate>
#include <QJsonObject>
#include <QString>
#include <QStringList>
#include <QVector>

#include "data/PriceSeries.hpp"

class DataQualityValidator {
public:
    struct Settings {
        double outlierThreshold = 3.0;
        int    maxReportedOutliers = 5;
        double splitReturnThreshold = -0.40;
        double splitVolumeMultiple = 2.0;
        int    volumeWindow = 20;
    };

    struct Statistics {
        int    recordCount = 0;
        QDate  startDate;
        QDate  endDate;
        qint64 spanDays = 0;
        double priceMin = 0.0;
        double priceMax = 0.0;
        double priceMean = 0.0;
        double priceStd = 0.0;
        double volumeMean = 0.0;
        double volumeStd = 0.0;
        double volumeTotal = 0.0;
        double returnMean = 0.0;
        double returnStd = 0.0;
        double returnMin = 0.0;
        double returnMax = 0.0;
    };

    struct ValidationResult {
        QString     symbol;
        bool        isValid = false;
        QStringList issues;
        QStringList warnings;
        Statistics  statistics;
        int         missingBusinessDays = 0;
        QVector<QDate> outlierDates;
        QVector<QDate> splitCandidates;

        QJsonObject toJson() const;
    };

    DataQualityValidator() = default;
    explicit DataQualityValidator(const Settings& settings);

    const Settings& settings() const { return m_settings; }

    ValidationResult validate(const PriceSeries& series, const QString& symbol) const;

    QVector<QDate> detectSplitCandidates(const PriceSeries& series) const;

    //! Rescales bars before each confirmed split date. Unknown dates are skipped.
    PriceSeries adjustForSplits(const PriceSeries& series, const QVector<QDate>& splitDates) const;

private:
    Statistics computeStatistics(const PriceSeries& series) const;
    int countMissingBusinessDays(const PriceSeries& series) const;
    QVector<QDate> detectOutliers(const PriceSeries& series) const;

    Settings m_settings;
};
