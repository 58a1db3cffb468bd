#pragma once

#include <QDate>
#include <QHash>
#include <QMutex>
#include <QString>
#include <QVector>

#include <optional>

#include "data/PriceSeries.hpp"
#include "prediction/PredictionTypes.hpp"

class DirectionModelInterface {
public:
    struct TrainResult {
        bool    ok = false;
        int     observations = 0;
        double  rSquared = 0.0;
        QString errorMessage;
    };

    virtual ~DirectionModelInterface() = default;

    //! Checked once at startup; a model that is not ready is reported unavailable.
    virtual bool isReady() const = 0;
    virtual int minimumHistory() const = 0;
    virtual DirectionForecast predict(const QString& symbol, const PriceSeries& history) const = 0;
    //! Fits a model on `history` and stamps it as trained on `asOf`.
    virtual TrainResult train(const QString& symbol, const PriceSeries& history, const QDate& asOf) = 0;
    virtual int trainedModelCount() const = 0;
    //! True when the symbol has no usable model as of `today`.
    virtual bool needsTraining(const QString& symbol, const QDate& today) const = 0;
};

// Ridge regression of the next daily return on the previous `lags` returns,
// fitted per symbol and stored as "<modelDirectory>/<symbol>.json".
class AutoregressiveDirectionModel final : public DirectionModelInterface {
public:
    struct Settings {
        int    lags = 5;
        double ridge = 1e-4;
        int    minHistory = 60;
        int    trainingWindow = 500;
        int    maxModelAgeDays = 7;
    };

    struct Coefficients {
        QString         symbol;
        QDate           trainedOn;
        QDate           lastObservation;
        double          intercept = 0.0;
        QVector<double> weights;
        double          residualStd = 0.0;
        double          rSquared = 0.0;
        int             observations = 0;
    };

    explicit AutoregressiveDirectionModel(QString modelDirectory);
    AutoregressiveDirectionModel(QString modelDirectory, const Settings& settings);

    bool isReady() const override;
    int minimumHistory() const override { return m_settings.minHistory; }
    DirectionForecast predict(const QString& symbol, const PriceSeries& history) const override;
    TrainResult train(const QString& symbol, const PriceSeries& history, const QDate& asOf) override;
    int trainedModelCount() const override;

    //! True when no stored model exists or it is older than the age limit.
    bool needsTraining(const QString& symbol, const QDate& today) const override;

    QString modelPath(const QString& symbol) const;

private:
    std::optional<Coefficients> coefficientsFor(const QString& symbol) const;
    bool save(const Coefficients& coefficients, QString* error) const;

    QString  m_directory;
    Settings m_settings;

    mutable QMutex m_mutex;
    mutable QHash<QString, Coefficients> m_cache;
};
