#include <QtTest/QtTest>

#include <QFile>
#include <QRandomGenerator>
#include <QTemporaryDir>

#include "prediction/DirectionModel.hpp"

namespace {

PriceSeries noisyHistory(int count, quint32 seed)
{
    QRandomGenerator random(seed);
    PriceSeries series;
    double close = 40.0;
    QDate date(2023, 1, 2);
    double previousReturn = 0.0;
    for (int i = 0; i < count; ++i) {
        const double r = 0.3 * previousReturn + 0.01 * (random.generateDouble() - 0.5);
        close *= 1.0 + r;
        previousReturn = r;
        PriceBar bar;
        bar.date = date.addDays(i);
        bar.open = bar.high = bar.low = bar.close = close;
        bar.volume = 2'000'000.0;
        series.append(bar);
    }
    return series;
}

} // namespace

class DirectionModelTest : public QObject {
    Q_OBJECT

private slots:
    void trainsAndPersistsModel();
    void reloadsStoredModel();
    void ageCountsFromTrainingRunDate();
    void rejectsShortHistory();
    void reportsMissingModel();
    void readinessRequiresDirectory();
};

void DirectionModelTest::trainsAndPersistsModel()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    AutoregressiveDirectionModel model(dir.path());
    QVERIFY(model.isReady());
    QVERIFY(model.needsTraining(QStringLiteral("ABC"), QDate::currentDate()));

    const PriceSeries history = noisyHistory(200, 3);
    const auto trained = model.train(QStringLiteral("ABC"), history, QDate::currentDate());
    QVERIFY2(trained.ok, qPrintable(trained.errorMessage));
    QCOMPARE(trained.observations, 199 - 5);
    QVERIFY(trained.rSquared >= 0.0 && trained.rSquared <= 1.0);
    QVERIFY(QFile::exists(model.modelPath(QStringLiteral("ABC"))));
    QCOMPARE(model.trainedModelCount(), 1);

    QVERIFY(!model.needsTraining(QStringLiteral("ABC"), QDate::currentDate()));
    QVERIFY(model.needsTraining(QStringLiteral("ABC"), QDate::currentDate().addDays(8)));

    const DirectionForecast forecast = model.predict(QStringLiteral("ABC"), history);
    QVERIFY(forecast.modelTrained);
    QVERIFY(forecast.dataSufficient);
    QVERIFY(forecast.direction >= -1.0 && forecast.direction <= 1.0);
    QVERIFY(forecast.confidence >= 0.0 && forecast.confidence <= 1.0);
    QVERIFY(forecast.predictedPrice.has_value());
    QVERIFY(qAbs(*forecast.predictedPrice / history.last().close - 1.0) < 0.1);
}

void DirectionModelTest::reloadsStoredModel()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const PriceSeries history = noisyHistory(150, 9);
    DirectionForecast first;
    {
        AutoregressiveDirectionModel model(dir.path());
        QVERIFY(model.train(QStringLiteral("XYZ"), history, QDate(2024, 6, 28)).ok);
        first = model.predict(QStringLiteral("XYZ"), history);
    }

    const AutoregressiveDirectionModel reloaded(dir.path());
    const DirectionForecast second = reloaded.predict(QStringLiteral("XYZ"), history);
    QVERIFY(second.modelTrained);
    QVERIFY(qAbs(second.direction - first.direction) < 1e-9);
    QVERIFY(qAbs(*second.predictedPrice - *first.predictedPrice) < 1e-9);
}

void DirectionModelTest::ageCountsFromTrainingRunDate()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QDate runDate(2023, 1, 10);
    AutoregressiveDirectionModel model(dir.path());
    QVERIFY(model.train(QStringLiteral("OLD"), noisyHistory(120, 4), runDate).ok);

    QVERIFY(!model.needsTraining(QStringLiteral("OLD"), runDate.addDays(1)));
    QVERIFY(!model.needsTraining(QStringLiteral("OLD"), runDate.addDays(7)));
    QVERIFY(model.needsTraining(QStringLiteral("OLD"), runDate.addDays(8)));

    const AutoregressiveDirectionModel reloaded(dir.path());
    QVERIFY(!reloaded.needsTraining(QStringLiteral("OLD"), runDate.addDays(1)));
}

void DirectionModelTest::rejectsShortHistory()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    AutoregressiveDirectionModel model(dir.path());
    const auto trained = model.train(QStringLiteral("ABC"), noisyHistory(30, 1), QDate(2024, 6, 28));
    QVERIFY(!trained.ok);
    QVERIFY(trained.errorMessage.contains(QStringLiteral("need 60")));

    const DirectionForecast forecast = model.predict(QStringLiteral("ABC"), noisyHistory(30, 1));
    QVERIFY(!forecast.dataSufficient);
    QVERIFY(!forecast.modelTrained);
}

void DirectionModelTest::reportsMissingModel()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const AutoregressiveDirectionModel model(dir.path());
    const DirectionForecast forecast = model.predict(QStringLiteral("NEW"), noisyHistory(100, 5));
    QVERIFY(forecast.dataSufficient);
    QVERIFY(!forecast.modelTrained);
    QVERIFY(forecast.errorMessage.contains(QStringLiteral("no trained model")));
    QCOMPARE(model.trainedModelCount(), 0);
}

void DirectionModelTest::readinessRequiresDirectory()
{
    const AutoregressiveDirectionModel unnamed(QString{});
    QVERIFY(!unnamed.isReady());

    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const AutoregressiveDirectionModel nested(dir.filePath(QStringLiteral("models/v1")));
    QVERIFY(nested.isReady());
}

QTEST_GUILESS_MAIN(DirectionModelTest)
#include "DirectionModelTest.moc"
