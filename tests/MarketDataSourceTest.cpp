#include <QtTest/QtTest>

#include <QDir>
#include <QElapsedTimer>
#include <QFile>
#include <QSemaphore>
#include <QTemporaryDir>
#include <QThread>

#include <cmath>
#include <memory>

#include "data/MarketDataSource.hpp"

namespace {

void writeFile(const QString& path, const QByteArray& contents)
{
    QFile file(path);
    QVERIFY(file.open(QIODevice::WriteOnly | QIODevice::Truncate));
    file.write(contents);
}

class SlowSource final : public MarketDataSourceInterface {
public:
    explicit SlowSource(int delayMs)
        : m_delayMs(delayMs)
    {
    }

    SeriesResult fetch(const QString& symbol, const QDate& start, const QDate&) override
    {
        QThread::msleep(m_delayMs);
        SeriesResult result;
        PriceBar bar;
        bar.date = start;
        bar.open = bar.high = bar.low = bar.close = 10.0;
        bar.volume = 1000.0;
        result.series.append(bar);
        result.ok = !symbol.isEmpty();
        return result;
    }

    FrameResult fetchMany(const QStringList&, const QDate&, const QDate&) override
    {
        QThread::msleep(m_delayMs);
        FrameResult result;
        result.ok = true;
        return result;
    }

private:
    int m_delayMs = 0;
};

// Calls for symbols starting with HANG block until the gate opens.
class GatedSource final : public MarketDataSourceInterface {
public:
    SeriesResult fetch(const QString& symbol, const QDate& start, const QDate&) override
    {
        if (symbol.startsWith(QStringLiteral("HANG")))
            gate.acquire();
        SeriesResult result;
        PriceBar bar;
        bar.date = start;
        bar.open = bar.high = bar.low = bar.close = 20.0;
        bar.volume = 500.0;
        result.series.append(bar);
        result.ok = true;
        return result;
    }

    FrameResult fetchMany(const QStringList&, const QDate&, const QDate&) override
    {
        FrameResult result;
        result.ok = true;
        return result;
    }

    QSemaphore gate;
};

} // namespace

class MarketDataSourceTest : public QObject {
    Q_OBJECT

private slots:
    void readsCsvWithinRange();
    void skipsMalformedAndUnorderedRows();
    void reportsMissingFile();
    void joinsSymbolsOnDates();
    void prefersAdjustedClose();
    void passesThroughFastCalls();
    void timesOutSlowCalls();
    void hungCallsDoNotStarveLaterSymbols();
    void shutdownDoesNotWaitForHungCalls();
};

void MarketDataSourceTest::readsCsvWithinRange()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    writeFile(QDir(dir.path()).filePath(QStringLiteral("AAA.csv")),
              "Date,Open,High,Low,Close,Volume\n"
              "2024-03-01,10,11,9,10.5,1000\n"
              "2024-03-04,10.5,11.5,10,11,1200\n"
              "2024-03-05,11,12,10.5,11.5,1500\n");

    CsvMarketDataSource source(dir.path());
    const auto result = source.fetch(QStringLiteral("AAA"), QDate(2024, 3, 2), QDate(2024, 3, 31));
    QVERIFY2(result.ok, qPrintable(result.errorMessage));
    QCOMPARE(result.series.size(), 2);
    QCOMPARE(result.series.first().date, QDate(2024, 3, 4));
    QCOMPARE(result.series.first().close, 11.0);
    QCOMPARE(result.series.last().volume, 1500.0);
}

void MarketDataSourceTest::skipsMalformedAndUnorderedRows()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    writeFile(QDir(dir.path()).filePath(QStringLiteral("BBB.csv")),
              "date,open,high,low,close,volume\n"
              "2024-03-01,10,11,9,10.5,1000\n"
              "2024-03-04,oops,11.5,10,11,1200\n"
              "2024-02-28,10,11,9,10,900\n"
              "2024-03-05,11,12\n"
              "2024-03-06,11,12,10.5,11.5,1500\n");

    CsvMarketDataSource source(dir.path());
    const auto result = source.fetch(QStringLiteral("BBB"), {}, {});
    QVERIFY(result.ok);
    QCOMPARE(result.series.size(), 2);
    QCOMPARE(result.series.at(1).date, QDate(2024, 3, 6));
}

void MarketDataSourceTest::reportsMissingFile()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    CsvMarketDataSource source(dir.path());
    const auto result = source.fetch(QStringLiteral("NOPE"), {}, {});
    QVERIFY(!result.ok);
    QVERIFY(result.errorMessage.contains(QStringLiteral("no data file")));

    const auto frame = source.fetchMany({QStringLiteral("NOPE")}, {}, {});
    QVERIFY(!frame.ok);
    QVERIFY(!frame.errorMessage.isEmpty());
}

void MarketDataSourceTest::joinsSymbolsOnDates()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    writeFile(QDir(dir.path()).filePath(QStringLiteral("AAA.csv")),
              "Date,Close\n2024-03-01,10\n2024-03-04,11\n");
    writeFile(QDir(dir.path()).filePath(QStringLiteral("BBB.csv")),
              "Date,Close\n2024-03-04,20\n2024-03-05,21\n");

    CsvMarketDataSource source(dir.path());
    const auto result = source.fetchMany({QStringLiteral("AAA"), QStringLiteral("BBB")}, {}, {});
    QVERIFY(result.ok);
    QCOMPARE(result.frame.index.size(), 3);
    QCOMPARE(result.frame.symbols(), QStringList({QStringLiteral("AAA"), QStringLiteral("BBB")}));

    const auto aaa = result.frame.closeFor(QStringLiteral("AAA"));
    QVERIFY(aaa.has_value());
    QCOMPARE(aaa->at(0), 10.0);
    QVERIFY(std::isnan(aaa->at(2)));
    const auto bbb = result.frame.closeFor(QStringLiteral("BBB"));
    QVERIFY(bbb.has_value());
    QVERIFY(std::isnan(bbb->at(0)));
    QCOMPARE(bbb->at(2), 21.0);
}

void MarketDataSourceTest::prefersAdjustedClose()
{
    MarketDataFrame frame;
    frame.index = {QDate(2024, 1, 2), QDate(2024, 1, 3)};
    frame.insertColumn(QStringLiteral("X"), screener::fields::kClose, {10.0, 11.0});
    frame.insertColumn(QStringLiteral("X"), screener::fields::kAdjClose, {9.0, 10.0});
    frame.insertColumn(QStringLiteral("Y"), screener::fields::kVolume, {1.0, 2.0});

    const auto adjusted = frame.closeFor(QStringLiteral("X"));
    QVERIFY(adjusted.has_value());
    QCOMPARE(adjusted->first(), 9.0);

    QString error;
    QVERIFY(!frame.closeFor(QStringLiteral("Y"), &error).has_value());
    QVERIFY(error.contains(QStringLiteral("Volume")));
    QVERIFY(!frame.closeFor(QStringLiteral("Z"), &error).has_value());
    QVERIFY(error.contains(QStringLiteral("missing")));
}

void MarketDataSourceTest::passesThroughFastCalls()
{
    TimeoutMarketDataSource source(std::make_shared<SlowSource>(0), 2000);
    const auto result = source.fetch(QStringLiteral("FAST"), QDate(2024, 1, 2), QDate(2024, 1, 3));
    QVERIFY(result.ok);
    QCOMPARE(result.series.size(), 1);
}

void MarketDataSourceTest::timesOutSlowCalls()
{
    TimeoutMarketDataSource source(std::make_shared<SlowSource>(500), 50);
    const auto result = source.fetch(QStringLiteral("SLOW"), QDate(2024, 1, 2), QDate(2024, 1, 3));
    QVERIFY(!result.ok);
    QVERIFY(result.errorMessage.contains(QStringLiteral("timeout")));

    const auto frame = source.fetchMany({QStringLiteral("SLOW")}, {}, {});
    QVERIFY(!frame.ok);
}

void MarketDataSourceTest::hungCallsDoNotStarveLaterSymbols()
{
    auto inner = std::make_shared<GatedSource>();
    {
        TimeoutMarketDataSource source(inner, 200, 2);
        QCOMPARE(source.maxThreads(), 2);

        for (const QString& symbol : {QStringLiteral("HANG1"), QStringLiteral("HANG2")}) {
            const auto result = source.fetch(symbol, QDate(2024, 1, 2), QDate(2024, 1, 3));
            QVERIFY(!result.ok);
            QVERIFY(result.errorMessage.contains(QStringLiteral("timeout")));
            QVERIFY(result.errorMessage.contains(symbol));
        }

        for (const QString& symbol : {QStringLiteral("AAA"), QStringLiteral("BBB"), QStringLiteral("CCC")}) {
            QElapsedTimer timer;
            timer.start();
            const auto result = source.fetch(symbol, QDate(2024, 1, 2), QDate(2024, 1, 3));
            QVERIFY2(result.ok, qPrintable(result.errorMessage));
            QCOMPARE(result.series.size(), 1);
            QVERIFY(timer.elapsed() < 200);
        }

        inner->gate.release(2);
    }
}

void MarketDataSourceTest::shutdownDoesNotWaitForHungCalls()
{
    auto inner = std::make_shared<GatedSource>();
    QElapsedTimer timer;
    timer.start();
    {
        TimeoutMarketDataSource source(inner, 50, 1);
        const auto result = source.fetch(QStringLiteral("HANG"), QDate(2024, 1, 2), QDate(2024, 1, 3));
        QVERIFY(!result.ok);
    }
    QVERIFY(timer.elapsed() < TimeoutMarketDataSource::kShutdownGraceMs + 5000);
    inner->gate.release();
}

QTEST_GUILESS_MAIN(MarketDataSourceTest)
#include "MarketDataSourceTest.moc"
