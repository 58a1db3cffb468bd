#include <QtTest/QtTest>

#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTemporaryDir>

#include "scoring/FactorView.hpp"

namespace {

ScoredOpportunity opportunity(const QString& symbol, const QString& sector, double score, const QString& prediction)
{
    ScoredOpportunity item;
    item.symbol = symbol;
    item.name = symbol + QStringLiteral(", Inc");
    item.sector = sector;
    item.opportunityScore = score;
    item.prediction = prediction;
    item.confidencePct = 55.0;
    item.baseTotal = score;
    for (const QString& name : screener::subscore::all())
        item.subScores.insert(name, score);
    return item;
}

QStringList readLines(const QString& path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text))
        return {};
    return QString::fromUtf8(file.readAll()).split(QLatin1Char('\n'), Qt::SkipEmptyParts);
}

QVector<ScoredOpportunity> sample()
{
    ScoredOpportunity a = opportunity(QStringLiteral("AAA"), QStringLiteral("Materials"), 80.0, screener::signal::kBuy);
    a.macroBetas.insert(QStringLiteral("xjo"), 1.2);
    a.macroBetas.insert(QStringLiteral("lithium"), 0.8);
    a.adjustments.append({QStringLiteral("sector_leader"), 5.0, QString()});
    a.adjustments.append({QStringLiteral("low_volume"), -10.0, QString()});
    ScoredOpportunity b = opportunity(QStringLiteral("BBB"), QStringLiteral("Materials"), 60.0, screener::signal::kSell);
    b.macroBetas.insert(QStringLiteral("xjo"), 0.6);
    ScoredOpportunity c = opportunity(QStringLiteral("CCC"), QString(), 90.0, screener::signal::kHold);
    c.subScores.remove(screener::subscore::kLiquidity);
    ScoredOpportunity d = opportunity(QStringLiteral("DDD"), QStringLiteral("Energy"), 40.0, screener::signal::kBuy);
    return {a, b, c, d};
}

} // namespace

class FactorViewTest : public QObject {
    Q_OBJECT

private slots:
    void fillsMissingValuesWithZero();
    void sectorAverageEqualsRowMean();
    void summarizesOverall();
    void handlesEmptyInput();
    void exportsThreeFiles();
};

void FactorViewTest::fillsMissingValuesWithZero()
{
    const FactorView view({QStringLiteral("xjo"), QStringLiteral("lithium")});
    const QVector<FactorView::Row> rows = view.rows(sample());
    QCOMPARE(rows.size(), 4);

    const FactorView::Row& a = rows.at(0);
    QCOMPARE(a.penaltyCount, 1);
    QCOMPARE(a.bonusCount, 1);
    QCOMPARE(a.betas.value(QStringLiteral("lithium")), 0.8);

    const FactorView::Row& b = rows.at(1);
    QVERIFY(b.betas.contains(QStringLiteral("lithium")));
    QCOMPARE(b.betas.value(QStringLiteral("lithium")), 0.0);

    const FactorView::Row& c = rows.at(2);
    QCOMPARE(c.subScores.size(), 6);
    QCOMPARE(c.subScores.value(screener::subscore::kLiquidity), 0.0);
    QCOMPARE(c.betas.size(), 2);
}

void FactorViewTest::sectorAverageEqualsRowMean()
{
    const FactorView view({QStringLiteral("xjo"), QStringLiteral("lithium")});
    const QVector<FactorView::Row> rows = view.rows(sample());
    const QVector<FactorView::SectorSummary> sectors = view.sectorSummary(rows);

    QCOMPARE(sectors.size(), 3);
    QCOMPARE(sectors.at(0).sector, QStringLiteral("Unknown"));
    QCOMPARE(sectors.at(1).sector, QStringLiteral("Materials"));
    QCOMPARE(sectors.at(2).sector, QStringLiteral("Energy"));

    const FactorView::SectorSummary& materials = sectors.at(1);
    QCOMPARE(materials.count, 2);
    QVERIFY(qAbs(materials.avgOpportunityScore - 70.0) < 1e-12);
    QVERIFY(qAbs(materials.avgBetas.value(QStringLiteral("xjo")) - 0.9) < 1e-12);
    QVERIFY(qAbs(materials.avgBetas.value(QStringLiteral("lithium")) - 0.4) < 1e-12);
    QCOMPARE(materials.buyCount, 1);
    QCOMPARE(materials.sellCount, 1);

    for (const FactorView::SectorSummary& sector : sectors) {
        double total = 0.0;
        int count = 0;
        for (const FactorView::Row& row : rows) {
            const QString rowSector = row.sector.isEmpty() ? QStringLiteral("Unknown") : row.sector;
            if (rowSector == sector.sector) {
                total += row.opportunityScore;
                ++count;
            }
        }
        QCOMPARE(sector.count, count);
        QVERIFY(qAbs(sector.avgOpportunityScore - total / count) < 1e-12);
    }
}

void FactorViewTest::summarizesOverall()
{
    const FactorView view({QStringLiteral("xjo"), QStringLiteral("lithium")});
    const FactorView::OverallSummary summary = view.overallSummary(view.rows(sample()));
    QCOMPARE(summary.totalStocks, 4);
    QVERIFY(qAbs(summary.avgOpportunityScore - 67.5) < 1e-12);
    QCOMPARE(summary.buyCount, 2);
    QCOMPARE(summary.sellCount, 1);
    QCOMPARE(summary.holdCount, 1);
    QCOMPARE(summary.sectorCount, 3);
    QCOMPARE(summary.topSymbol, QStringLiteral("CCC"));
    QVERIFY(qAbs(summary.avgBetas.value(QStringLiteral("xjo")) - 0.45) < 1e-12);
}

void FactorViewTest::handlesEmptyInput()
{
    const FactorView view({QStringLiteral("xjo")});
    const QVector<FactorView::Row> rows = view.rows({});
    QVERIFY(rows.isEmpty());
    QVERIFY(view.sectorSummary(rows).isEmpty());
    const FactorView::OverallSummary summary = view.overallSummary(rows);
    QCOMPARE(summary.totalStocks, 0);
    QCOMPARE(summary.avgOpportunityScore, 0.0);
    QVERIFY(summary.topSymbol.isEmpty());

    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    QString error;
    const auto paths = view.save({}, dir.path(), QDate(2024, 6, 28), &error);
    QVERIFY2(paths.has_value(), qPrintable(error));
    QCOMPARE(readLines(paths->stocksCsv).size(), 1);
    QCOMPARE(readLines(paths->sectorsCsv).size(), 1);
}

void FactorViewTest::exportsThreeFiles()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const FactorView view({QStringLiteral("xjo"), QStringLiteral("lithium")});
    QString error;
    const auto paths = view.save(sample(), dir.filePath(QStringLiteral("reports")), QDate(2024, 6, 28), &error);
    QVERIFY2(paths.has_value(), qPrintable(error));
    QVERIFY(paths->stocksCsv.endsWith(QStringLiteral("factor_view_stocks_20240628.csv")));
    QVERIFY(paths->sectorsCsv.endsWith(QStringLiteral("factor_view_sectors_20240628.csv")));
    QVERIFY(paths->summaryJson.endsWith(QStringLiteral("factor_view_summary_20240628.json")));

    const QStringList stocks = readLines(paths->stocksCsv);
    QCOMPARE(stocks.size(), 5);
    QVERIFY(stocks.first().startsWith(QStringLiteral("symbol,name,sector,opportunity_score,prediction_confidence")));
    QVERIFY(stocks.first().contains(QStringLiteral("beta_xjo,beta_lithium,prediction,confidence_pct")));
    QVERIFY(stocks.at(1).startsWith(QStringLiteral("AAA,\"AAA, Inc\",Materials,80.00,")));

    const QStringList sectors = readLines(paths->sectorsCsv);
    QCOMPARE(sectors.size(), 4);
    QCOMPARE(sectors.at(0), QStringLiteral("sector,count,avg_opportunity_score,buy_count,sell_count,avg_beta_xjo,avg_beta_lithium"));
    QCOMPARE(sectors.at(2), QStringLiteral("Materials,2,70.00,1,1,0.9000,0.4000"));

    QFile summaryFile(paths->summaryJson);
    QVERIFY(summaryFile.open(QIODevice::ReadOnly));
    const QJsonObject summary = QJsonDocument::fromJson(summaryFile.readAll()).object();
    QCOMPARE(summary.value(QStringLiteral("run_date")).toString(), QStringLiteral("2024-06-28"));
    QCOMPARE(summary.value(QStringLiteral("sectors")).toArray().size(), 3);
    QCOMPARE(summary.value(QStringLiteral("summary")).toObject().value(QStringLiteral("total_stocks")).toInt(), 4);
}

QTEST_GUILESS_MAIN(FactorViewTest)
#include "FactorViewTest.moc"
