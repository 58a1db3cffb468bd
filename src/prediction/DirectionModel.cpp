#include "DirectionModel.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QLoggingCategory>
#include <QMutexLocker>
#include <QSaveFile>
#include <QtMath>

#include <Eigen/Dense>

#include <cmath>
#include <utility>

Q_LOGGING_CATEGORY(lcDirectionModel, "screener.prediction.model")

namespace {

QVector<double> finiteReturns(const PriceSeries& history)
{
    QVector<double> result;
    for (double value : screener::series::simpleReturns(screener::series::closes(history))) {
        if (std::isfinite(value))
            result.append(value);
    }
    return result;
}

} // namespace

AutoregressiveDirectionModel::AutoregressiveDirectionModel(QString modelDirectory)
    : AutoregressiveDirectionModel(std::move(modelDirectory), Settings{})
{
}

AutoregressiveDirectionModel::AutoregressiveDirectionModel(QString modelDirectory, const Settings& settings)
    : m_directory(std::move(modelDirectory))
    , m_settings(settings)
{
}

bool AutoregressiveDirectionModel::isReady() const
{
    if (m_directory.trimmed().isEmpty())
        return false;
    QDir dir(m_directory);
    if (!dir.exists() && !dir.mkpath(QStringLiteral("."))) {
        qCWarning(lcDirectionModel) << "Model directory not accessible" << m_directory;
        return false;
    }
    return QFileInfo(m_directory).isWritable();
}

QString AutoregressiveDirectionModel::modelPath(const QString& symbol) const
{
    return QDir(m_directory).filePath(symbol + QStringLiteral(".json"));
}

int AutoregressiveDirectionModel::trainedModelCount() const
{
    const QDir dir(m_directory);
    if (!dir.exists())
        return 0;
    return dir.entryList({QStringLiteral("*.json")}, QDir::Files).size();
}

bool AutoregressiveDirectionModel::needsTraining(const QString& symbol, const QDate& today) const
{
    const std::optional<Coefficients> stored = coefficientsFor(symbol);
    if (!stored)
        return true;
    return stored->trainedOn.daysTo(today) > m_settings.maxModelAgeDays;
}

DirectionModelInterface::TrainResult AutoregressiveDirectionModel::train(const QString& symbol,
                                                                         const PriceSeries& history,
                                                                         const QDate& asOf)
{
    TrainResult result;
    if (history.size() < m_settings.minHistory) {
        result.errorMessage = QStringLiteral("%1 rows, need %2").arg(history.size()).arg(m_settings.minHistory);
        return result;
    }

    QVector<double> returns = finiteReturns(history);
    if (returns.size() > m_settings.trainingWindow)
        returns = returns.mid(returns.size() - m_settings.trainingWindow);

    const int lags = qMax(1, m_settings.lags);
    const int samples = returns.size() - lags;
    if (samples <= lags + 1) {
        result.errorMessage = QStringLiteral("too few returns for %1 lags").arg(lags);
        return result;
    }

    Eigen::MatrixXd x(samples, lags + 1);
    Eigen::VectorXd y(samples);
    for (int t = 0; t < samples; ++t) {
        x(t, 0) = 1.0;
        for (int l = 0; l < lags; ++l)
            x(t, l + 1) = returns.at(t + lags - 1 - l);
        y(t) = returns.at(t + lags);
    }

    Eigen::MatrixXd gram = x.transpose() * x;
    gram.diagonal().tail(lags).array() += m_settings.ridge * samples;
    const Eigen::LDLT<Eigen::MatrixXd> solver(gram);
    if (solver.info() != Eigen::Success) {
        result.errorMessage = QStringLiteral("normal equations not solvable");
        return result;
    }
    const Eigen::VectorXd beta = solver.solve(x.transpose() * y);
    if (!beta.allFinite()) {
        result.errorMessage = QStringLiteral("fit produced non-finite coefficients");
        return result;
    }

    const Eigen::VectorXd residuals = y - x * beta;
    const double sse = residuals.squaredNorm();
    const double sst = (y.array() - y.mean()).square().sum();

    Coefficients coefficients;
    coefficients.symbol = symbol;
    coefficients.trainedOn = asOf.isValid() ? asOf : QDate::currentDate();
    coefficients.lastObservation = history.last().date;
    coefficients.intercept = beta(0);
    for (int l = 0; l < lags; ++l)
        coefficients.weights.append(beta(l + 1));
    coefficients.residualStd = std::sqrt(sse / qMax(1, samples - lags - 1));
    coefficients.rSquared = sst > 0.0 ? qBound(0.0, 1.0 - sse / sst, 1.0) : 0.0;
    coefficients.observations = samples;

    QString error;
    if (!save(coefficients, &error)) {
        result.errorMessage = error;
        return result;
    }
    {
        QMutexLocker locker(&m_mutex);
        m_cache.insert(symbol, coefficients);
    }

    result.ok = true;
    result.observations = samples;
    result.rSquared = coefficients.rSquared;
    return result;
}

DirectionForecast AutoregressiveDirectionModel::predict(const QString& symbol, const PriceSeries& history) const
{
    DirectionForecast forecast;
    if (history.size() < m_settings.minHistory) {
        forecast.errorMessage = QStringLiteral("%1 rows, need %2").arg(history.size()).arg(m_settings.minHistory);
        return forecast;
    }
    forecast.dataSufficient = true;

    const std::optional<Coefficients> model = coefficientsFor(symbol);
    if (!model) {
        forecast.errorMessage = QStringLiteral("no trained model for %1").arg(symbol);
        return forecast;
    }

    const QVector<double> returns = finiteReturns(history);
    if (returns.size() < model->weights.size() || !(model->residualStd > 0.0)) {
        forecast.errorMessage = QStringLiteral("model for %1 unusable on this history").arg(symbol);
        return forecast;
    }

    double expected = model->intercept;
    for (int l = 0; l < model->weights.size(); ++l)
        expected += model->weights.at(l) * returns.at(returns.size() - 1 - l);

    const double signalToNoise = expected / model->residualStd;
    const double fitQuality = 0.5 + 0.5 * qBound(0.0, model->rSquared / 0.1, 1.0);

    forecast.modelTrained = true;
    forecast.direction = std::tanh(2.0 * signalToNoise);
    forecast.confidence = qBound(0.0, std::abs(signalToNoise) * fitQuality, 1.0);
    forecast.predictedPrice = history.last().close * (1.0 + expected);
    return forecast;
}

std::optional<AutoregressiveDirectionModel::Coefficients>
AutoregressiveDirectionModel::coefficientsFor(const QString& symbol) const
{
    QMutexLocker locker(&m_mutex);
    const auto cached = m_cache.constFind(symbol);
    if (cached != m_cache.constEnd())
        return cached.value();

    QFile file(modelPath(symbol));
    if (!file.exists() || !file.open(QIODevice::ReadOnly))
        return std::nullopt;

    QJsonParseError parseError{};
    const QJsonDocument document = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (document.isNull() || !document.isObject()) {
        qCWarning(lcDirectionModel) << "Corrupt model file" << file.fileName() << parseError.errorString();
        return std::nullopt;
    }

    const QJsonObject object = document.object();
    Coefficients coefficients;
    coefficients.symbol = symbol;
    coefficients.trainedOn = QDate::fromString(object.value(QStringLiteral("trained_on")).toString(), Qt::ISODate);
    coefficients.lastObservation =
        QDate::fromString(object.value(QStringLiteral("last_observation")).toString(), Qt::ISODate);
    coefficients.intercept = object.value(QStringLiteral("intercept")).toDouble();
    for (const QJsonValue& weight : object.value(QStringLiteral("weights")).toArray())
        coefficients.weights.append(weight.toDouble());
    coefficients.residualStd = object.value(QStringLiteral("residual_std")).toDouble();
    coefficients.rSquared = object.value(QStringLiteral("r_squared")).toDouble();
    coefficients.observations = object.value(QStringLiteral("observations")).toInt();
    if (coefficients.weights.isEmpty() || !coefficients.trainedOn.isValid()) {
        qCWarning(lcDirectionModel) << "Incomplete model file" << file.fileName();
        return std::nullopt;
    }

    m_cache.insert(symbol, coefficients);
    return coefficients;
}

bool AutoregressiveDirectionModel::save(const Coefficients& coefficients, QString* error) const
{
    QDir dir(m_directory);
    if (!dir.exists() && !dir.mkpath(QStringLiteral("."))) {
        if (error)
            *error = QStringLiteral("cannot create %1").arg(m_directory);
        return false;
    }

    QJsonArray weights;
    for (double weight : coefficients.weights)
        weights.append(weight);

    QJsonObject object;
    object.insert(QStringLiteral("symbol"), coefficients.symbol);
    object.insert(QStringLiteral("trained_on"), coefficients.trainedOn.toString(Qt::ISODate));
    object.insert(QStringLiteral("last_observation"), coefficients.lastObservation.toString(Qt::ISODate));
    object.insert(QStringLiteral("intercept"), coefficients.intercept);
    object.insert(QStringLiteral("weights"), weights);
    object.insert(QStringLiteral("residual_std"), coefficients.residualStd);
    object.insert(QStringLiteral("r_squared"), coefficients.rSquared);
    object.insert(QStringLiteral("observations"), coefficients.observations);

    QSaveFile file(modelPath(coefficients.symbol));
    if (!file.open(QIODevice::WriteOnly)) {
        if (error)
            *error = file.errorString();
        return false;
    }
    file.write(QJsonDocument(object).toJson(QJsonDocument::Indented));
    if (!file.commit()) {
        if (error)
            *error = file.errorString();
        return false;
    }
    return true;
}
