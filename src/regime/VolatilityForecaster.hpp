#pragma once

#include <QString>
#include <QVector>

// One-step-ahead daily volatility. GARCH(1,1) with variance targeting is
// tried first; EWMA of squared returns is used when GARCH is disabled, has
// too few observations or its optimizer does not settle.
class VolatilityForecaster {
public:
    struct Settings {
        bool   garchEnabled = true;
        int    garchMinObservations = 100;
        int    maxIterations = 200;
        double tolerance = 1e-6;
        double ewmaLambda = 0.94;
        int    tradingDaysPerYear = 252;
    };

    struct Forecast {
        bool    ok = false;
        QString method;
        double  vol1d = 0.0;
        double  volAnnual = 0.0;
        double  omega = 0.0;
        double  alpha = 0.0;
        double  beta = 0.0;
        QString diagnostic;
    };

    VolatilityForecaster() = default;
    explicit VolatilityForecaster(const Settings& settings);

    const Settings& settings() const { return m_settings; }

    Forecast forecast(const QVector<double>& returns) const;

    Forecast fitGarch(const QVector<double>& returns) const;
    Forecast ewma(const QVector<double>& returns) const;

private:
    Settings m_settings;
};
