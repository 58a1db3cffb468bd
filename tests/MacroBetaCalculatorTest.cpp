#include <QtTest/QtTest>

#include <QHash>

#include <cmath>
#include <memory>

#include "beta/MacroBetaCalculator.hpp"

namespace {

QVector<double> factorReturns(int count)
{
    QVector<double> returns;
    for (int i = 0; i < count; ++i)
        returns.append(0.01 * std::sin(i * 0.7) + 0.002 * std::cos(i * 1.3));
    return returns;
}

PriceSeries seriesFromReturns(const QVector<double>& returns, double scale, const QDate& end)
{
    PriceSeries series;
    QDate date = end.addDays(-(returns.size()));
    double close = 50.0;
    PriceBar first;
    first.date = date;
    first.open = first.high = first.low = first.close = close;
    first.volume = 1000.0;
    series.append(first);
    for (double r : returns) {
        date = date.addDays(1);
        close *= 1.0 + scale * r;
        PriceBar bar;
        bar.date = date;
        bar.open = bar.high = bar.low = bar.close = close;
        bar.volume = 1000.0;
        series.append(bar);
    }
    return series;
}

class MapSource final : public MarketDataSourceInterface {
public:
    QHash<QString, PriceSeries> series;

    SeriesResult fetch(const QString& symbol, const QDate&, const QDate&) override
    {
        SeriesResult result;
        if (!series.contains(symbol)) {
            result.errorMessage = QStringLiteral("unknown symbol %1").arg(symbol);
            return result;
        }
        result.ok = true;
        result.series = series.value(symbol);
        return result;
    }

    FrameResult fetchMany(const QStringList&, const QDate&, const QDate&) override { return {}; }
};

const QDate kAsOf(2024, 6, 28);

} // namespace

class MacroBetaCalculatorTest : public QObject {
    Q_OBJECT

private slots:
    void recoversKnownSlope();
    void omitsFlatFactor();
    void omitsShortOverlap();
    void reportsMissingInputs();
    void listsFactorNames();
};

void MacroBetaCalculatorTest::recoversKnownSlope()
{
    auto source = std::make_shared<MapSource>();
    const QVector<double> returns = factorReturns(80);
    source->series.insert(QStringLiteral("^AXJO"), seriesFromReturns(returns, 1.0, kAsOf));
    source->series.insert(QStringLiteral("LIT.AX"), seriesFromReturns(returns, -1.0, kAsOf));
    source->series.insert(QStringLiteral("PLS"), seriesFromReturns(returns, 1.5, kAsOf));

    const DataQualityValidator validator;
    const MacroBetaCalculator calculator(source, validator);
    const auto report = calculator.computeBetas({QStringLiteral("PLS")}, kAsOf);

    QVERIFY(report.missingSymbols.isEmpty());
    QVERIFY(report.missingFactors.isEmpty());
    QVERIFY(report.undefinedPairs.isEmpty());
    const QMap<QString, double> betas = report.betas.value(QStringLiteral("PLS"));
    QVERIFY(qAbs(betas.value(QStringLiteral("xjo")) - 1.5) < 1e-9);
    QVERIFY(qAbs(betas.value(QStringLiteral("lithium")) + 1.5) < 1e-9);

    const QJsonObject json = MacroBetaCalculator::betasToJson(betas);
    QCOMPARE(json.keys(), QStringList({QStringLiteral("lithium"), QStringLiteral("xjo")}));
}

void MacroBetaCalculatorTest::omitsFlatFactor()
{
    auto source = std::make_shared<MapSource>();
    const QVector<double> returns = factorReturns(80);
    source->series.insert(QStringLiteral("^AXJO"), seriesFromReturns(returns, 1.0, kAsOf));
    source->series.insert(QStringLiteral("LIT.AX"), seriesFromReturns(QVector<double>(80, 0.0), 1.0, kAsOf));
    source->series.insert(QStringLiteral("PLS"), seriesFromReturns(returns, 0.8, kAsOf));

    const DataQualityValidator validator;
    const MacroBetaCalculator calculator(source, validator);
    const auto report = calculator.computeBetas({QStringLiteral("PLS")}, kAsOf);

    const QMap<QString, double> betas = report.betas.value(QStringLiteral("PLS"));
    QVERIFY(betas.contains(QStringLiteral("xjo")));
    QVERIFY(!betas.contains(QStringLiteral("lithium")));
    QCOMPARE(report.undefinedPairs, QStringList{QStringLiteral("PLS/lithium")});

    QString reason;
    QVERIFY(!calculator.betaFor(source->series.value(QStringLiteral("PLS")),
                                source->series.value(QStringLiteral("LIT.AX")), &reason));
    QVERIFY(reason.contains(QStringLiteral("variance")));
}

void MacroBetaCalculatorTest::omitsShortOverlap()
{
    const QVector<double> returns = factorReturns(80);
    const PriceSeries factor = seriesFromReturns(returns, 1.0, kAsOf);
    const PriceSeries stock = seriesFromReturns(returns.mid(60), 1.2, kAsOf);

    auto source = std::make_shared<MapSource>();
    const DataQualityValidator validator;
    const MacroBetaCalculator calculator(source, validator);
    QString reason;
    QVERIFY(!calculator.betaFor(stock, factor, &reason));
    QVERIFY(reason.contains(QStringLiteral("need 40")));
}

void MacroBetaCalculatorTest::reportsMissingInputs()
{
    auto source = std::make_shared<MapSource>();
    const QVector<double> returns = factorReturns(80);
    source->series.insert(QStringLiteral("^AXJO"), seriesFromReturns(returns, 1.0, kAsOf));
    source->series.insert(QStringLiteral("PLS"), seriesFromReturns(returns, 1.1, kAsOf));

    const DataQualityValidator validator;
    const MacroBetaCalculator calculator(source, validator);
    const auto report = calculator.computeBetas({QStringLiteral("PLS"), QStringLiteral("GONE")}, kAsOf);

    QCOMPARE(report.missingFactors, QStringList{QStringLiteral("lithium")});
    QCOMPARE(report.missingSymbols, QStringList{QStringLiteral("GONE")});
    QCOMPARE(report.betas.size(), 1);
    QCOMPARE(report.betas.value(QStringLiteral("PLS")).size(), 1);
}

void MacroBetaCalculatorTest::listsFactorNames()
{
    MacroBetaCalculator::Settings settings;
    settings.factors = {{QStringLiteral("copper"), QStringLiteral("HG=F")}, {QStringLiteral("aud"), QStringLiteral("AUDUSD=X")}};
    const DataQualityValidator validator;
    const MacroBetaCalculator calculator(nullptr, validator, settings);
    QCOMPARE(calculator.factorNames(), QStringList({QStringLiteral("copper"), QStringLiteral("aud")}));

    const auto report = calculator.computeBetas({QStringLiteral("X")}, kAsOf);
    QCOMPARE(report.missingSymbols, QStringList{QStringLiteral("X")});
}

QTEST_GUILESS_MAIN(MacroBetaCalculatorTest)
#include "MacroBetaCalculatorTest.moc"
