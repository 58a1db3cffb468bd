#pragma once

#include "data/PriceSeries.hpp"
#include "prediction/PredictionTypes.hpp"

// Price-only signal combining momentum, mean reversion (RSI and distance
// from the short moving average) and a moving-average crossover. Confidence
// grows with agreement between the three and with available history.
class TechnicalBaseline {
public:
    struct Settings {
        int momentumDays = 10;
        int shortWindow = 20;
        int longWindow = 50;
        int rsiPeriod = 14;
    };

    struct Signals {
        double momentum = 0.0;
        double meanReversion = 0.0;
        double crossover = 0.0;
    };

    TechnicalBaseline() = default;
    explicit TechnicalBaseline(const Settings& settings);

    const Settings& settings() const { return m_settings; }

    ComponentSignal evaluate(const PriceSeries& history) const;
    Signals breakdown(const PriceSeries& history) const;

private:
    Settings m_settings;
};
