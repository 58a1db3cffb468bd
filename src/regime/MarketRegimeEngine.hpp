#pragma once

#include <QDate>
#include <QString>
#include <QVector>

#include <memory>
#include <optional>

#include <Eigen/Dense>

#include "data/MarketDataSource.hpp"
#include "regime/RegimeClassifier.hpp"
#include "regime/RegimeTypes.hpp"
#include "regime/VolatilityForecaster.hpp"

class MarketRegimeEngine {
public:
    struct Settings {
        QString indexSymbol = QStringLiteral("^AXJO");
        QString volSymbol;
        QString fxSymbol = QStringLiteral("AUDUSD=X");
        int     lookbackDays = 180;
        int     minRows = 50;
        int     minFeatureRows = 40;
        int     realizedVolWindow = 10;
        int     proxyVolWindow = 20;
        double  crashBlendWeight = 0.5;
        RegimeClassifier::Settings     classifier;
        VolatilityForecaster::Settings volatility;
    };

    explicit MarketRegimeEngine(std::shared_ptr<MarketDataSourceInterface> source);
    MarketRegimeEngine(std::shared_ptr<MarketDataSourceInterface> source, const Settings& settings);

    const Settings& settings() const { return m_settings; }

    //! Classifies the regime over the lookback window ending at `asOf`.
    //! Every failure path yields a result with `error` or `warning` set.
    RegimeResult detect(const QDate& asOf) const;

private:
    struct FeatureTable {
        QVector<QDate>  dates;
        Eigen::MatrixXd values;
        QVector<double> realizedVol;
    };

    static constexpr int kRealizedVolColumn = 4;

    FeatureTable buildFeatures(const QVector<QDate>& dates, const QVector<double>& index,
                               const QVector<double>& fx, const std::optional<QVector<double>>& proxy) const;
    double crashRisk(double highVolProbability, const QVector<double>& realizedVol) const;

    std::shared_ptr<MarketDataSourceInterface> m_source;
    Settings m_settings;
};
