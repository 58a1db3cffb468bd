#pragma once

#include <QDate>
#include <QHash>
#include <QJsonObject>
#include <QMap>
#include <QString>
#include <QStringList>
#include <QVector>

#include <memory>
#include <optional>

#include "data/DataQualityValidator.hpp"
#include "data/MarketDataSource.hpp"

struct FactorDefinition {
    QString name;
    QString symbol;
};

// symbol -> factor name -> beta. Pairs without a defined beta are absent.
using FactorBetaMap = QHash<QString, QMap<QString, double>>;

class MacroBetaCalculator {
public:
    struct Settings {
        int    lookbackDays = 90;
        int    minObservations = 40;
        double varianceEpsilon = 1e-12;
        QVector<FactorDefinition> factors{{QStringLiteral("xjo"), QStringLiteral("^AXJO")},
                                          {QStringLiteral("lithium"), QStringLiteral("LIT.AX")}};
    };

    struct BetaReport {
        FactorBetaMap betas;
        //! Symbols whose series could not be fetched or failed validation.
        QStringList   missingSymbols;
        //! Factors whose proxy series could not be fetched.
        QStringList   missingFactors;
        //! "symbol/factor" pairs left undefined (too few overlaps or flat factor).
        QStringList   undefinedPairs;
    };

    MacroBetaCalculator(std::shared_ptr<MarketDataSourceInterface> source, const DataQualityValidator& validator);
    MacroBetaCalculator(std::shared_ptr<MarketDataSourceInterface> source, const DataQualityValidator& validator,
                        const Settings& settings);

    const Settings& settings() const { return m_settings; }
    QStringList factorNames() const;

    BetaReport computeBetas(const QStringList& symbols, const QDate& asOf) const;

    //! OLS slope of `stock` on `factor` over dates present in both series.
    //! nullopt when overlap < min observations or factor variance is degenerate.
    std::optional<double> betaFor(const PriceSeries& stock, const PriceSeries& factor, QString* reason = nullptr) const;

    static QJsonObject betasToJson(const QMap<QString, double>& betas);

private:
    std::shared_ptr<MarketDataSourceInterface> m_source;
    const DataQualityValidator& m_validator;
    Settings m_settings;
};
