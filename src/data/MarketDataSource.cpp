#include "MarketDataSource.hpp"

#include <QAtomicInt>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QLoggingCategory>
#include <QSemaphore>
#include <QSet>
#include <QTextStream>

#include <algorithm>
#include <limits>
#include <utility>

Q_LOGGING_CATEGORY(lcMarketData, "screener.data")

namespace {

struct CsvTable {
    QVector<QDate>                  dates;
    QHash<QString, QVector<double>> fields;
};

QString canonicalField(const QString& header)
{
    const QString key = header.trimmed().toLower();
    if (key == QLatin1String("date") || key == QLatin1String("timestamp"))
        return QStringLiteral("Date");
    if (key == QLatin1String("open"))
        return screener::fields::kOpen;
    if (key == QLatin1String("high"))
        return screener::fields::kHigh;
    if (key == QLatin1String("low"))
        return screener::fields::kLow;
    if (key == QLatin1String("close"))
        return screener::fields::kClose;
    if (key == QLatin1String("adj close") || key == QLatin1String("adj_close"))
        return screener::fields::kAdjClose;
    if (key == QLatin1String("volume"))
        return screener::fields::kVolume;
    return {};
}

QDate parseDate(const QString& raw)
{
    const QString trimmed = raw.trimmed();
    QDate date = QDate::fromString(trimmed, Qt::ISODate);
    if (date.isValid())
        return date;
    const QDateTime timestamp = QDateTime::fromString(trimmed, Qt::ISODate);
    if (timestamp.isValid())
        return timestamp.date();
    return QDateTime::fromString(trimmed, QStringLiteral("yyyy-MM-dd HH:mm:ss")).date();
}

bool readCsvTable(const QString& path, const QDate& start, const QDate& end, CsvTable& table, QString* error)
{
    QFile file(path);
    if (!file.exists()) {
        if (error)
            *error = QStringLiteral("no data file %1").arg(path);
        return false;
    }
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        if (error)
            *error = QStringLiteral("cannot open %1: %2").arg(path, file.errorString());
        return false;
    }

    QTextStream stream(&file);
    if (stream.atEnd()) {
        if (error)
            *error = QStringLiteral("empty data file %1").arg(path);
        return false;
    }

    const QStringList header = stream.readLine().split(QLatin1Char(','));
    QVector<QString> columnFields;
    int dateColumn = -1;
    for (int i = 0; i < header.size(); ++i) {
        const QString field = canonicalField(header.at(i));
        if (field == QLatin1String("Date"))
            dateColumn = i;
        columnFields.append(field == QLatin1String("Date") ? QString() : field);
    }
    if (dateColumn < 0) {
        if (error)
            *error = QStringLiteral("missing Date column in %1").arg(path);
        return false;
    }
    for (const QString& field : std::as_const(columnFields)) {
        if (!field.isEmpty())
            table.fields.insert(field, {});
    }

    QDate previous;
    while (!stream.atEnd()) {
        const QString line = stream.readLine();
        if (line.trimmed().isEmpty())
            continue;
        const QStringList parts = line.split(QLatin1Char(','));
        if (parts.size() != header.size())
            continue;
        const QDate date = parseDate(parts.at(dateColumn));
        if (!date.isValid())
            continue;
        if ((start.isValid() && date < start) || (end.isValid() && date > end))
            continue;
        if (previous.isValid() && date <= previous)
            continue;

        QHash<QString, double> row;
        bool rowOk = true;
        for (int i = 0; i < parts.size() && rowOk; ++i) {
            const QString& field = columnFields.at(i);
            if (field.isEmpty())
                continue;
            bool ok = false;
            const double value = parts.at(i).trimmed().toDouble(&ok);
            if (!ok)
                rowOk = false;
            row.insert(field, value);
        }
        if (!rowOk)
            continue;

        table.dates.append(date);
        for (auto it = row.cbegin(); it != row.cend(); ++it)
            table.fields[it.key()].append(it.value());
        previous = date;
    }
    return true;
}

} // namespace

CsvMarketDataSource::CsvMarketDataSource(QString directory)
    : m_directory(std::move(directory))
{
}

QString CsvMarketDataSource::pathForSymbol(const QString& symbol) const
{
    return QDir(m_directory).filePath(symbol + QStringLiteral(".csv"));
}

MarketDataSourceInterface::SeriesResult CsvMarketDataSource::fetch(const QString& symbol, const QDate& start,
                                                                   const QDate& end)
{
    SeriesResult result;
    CsvTable table;
    if (!readCsvTable(pathForSymbol(symbol), start, end, table, &result.errorMessage))
        return result;

    const auto column = [&table](const QString& field) { return table.fields.value(field); };
    const QVector<double> open = column(screener::fields::kOpen);
    const QVector<double> high = column(screener::fields::kHigh);
    const QVector<double> low = column(screener::fields::kLow);
    const QVector<double> close = column(screener::fields::kClose);
    const QVector<double> volume = column(screener::fields::kVolume);
    if (close.size() != table.dates.size()) {
        result.errorMessage = QStringLiteral("no Close column for %1").arg(symbol);
        return result;
    }

    const double nan = std::numeric_limits<double>::quiet_NaN();
    result.series.reserve(table.dates.size());
    for (int i = 0; i < table.dates.size(); ++i) {
        PriceBar bar;
        bar.date = table.dates.at(i);
        bar.open = i < open.size() ? open.at(i) : nan;
        bar.high = i < high.size() ? high.at(i) : nan;
        bar.low = i < low.size() ? low.at(i) : nan;
        bar.close = close.at(i);
        bar.volume = i < volume.size() ? volume.at(i) : nan;
        result.series.append(bar);
    }
    if (result.series.isEmpty()) {
        result.errorMessage = QStringLiteral("no rows for %1 in %2..%3")
                                  .arg(symbol, start.toString(Qt::ISODate), end.toString(Qt::ISODate));
        return result;
    }
    result.ok = true;
    return result;
}

MarketDataSourceInterface::FrameResult CsvMarketDataSource::fetchMany(const QStringList& symbols, const QDate& start,
                                                                      const QDate& end)
{
    FrameResult result;
    QHash<QString, CsvTable> tables;
    QSet<QDate> allDates;
    for (const QString& symbol : symbols) {
        CsvTable table;
        QString error;
        if (!readCsvTable(pathForSymbol(symbol), start, end, table, &error)) {
            result.errorMessage = error;
            return result;
        }
        for (const QDate& date : std::as_const(table.dates))
            allDates.insert(date);
        tables.insert(symbol, table);
    }

    result.frame.index = QVector<QDate>(allDates.cbegin(), allDates.cend());
    std::sort(result.frame.index.begin(), result.frame.index.end());
    QHash<QDate, int> position;
    for (int i = 0; i < result.frame.index.size(); ++i)
        position.insert(result.frame.index.at(i), i);

    const double nan = std::numeric_limits<double>::quiet_NaN();
    for (auto it = tables.cbegin(); it != tables.cend(); ++it) {
        const CsvTable& table = it.value();
        for (auto fieldIt = table.fields.cbegin(); fieldIt != table.fields.cend(); ++fieldIt) {
            QVector<double> aligned(result.frame.index.size(), nan);
            for (int i = 0; i < table.dates.size(); ++i)
                aligned[position.value(table.dates.at(i))] = fieldIt.value().at(i);
            result.frame.insertColumn(it.key(), fieldIt.key(), aligned);
        }
    }

    if (result.frame.index.isEmpty()) {
        result.errorMessage = QStringLiteral("no rows for %1").arg(symbols.join(QStringLiteral(", ")));
        return result;
    }
    result.ok = true;
    return result;
}

TimeoutMarketDataSource::TimeoutMarketDataSource(std::shared_ptr<MarketDataSourceInterface> inner, int timeoutMs,
                                                 int maxThreads)
    : m_inner(std::move(inner))
    , m_timeoutMs(qMax(1, timeoutMs))
    , m_pool(std::make_unique<QThreadPool>())
{
    m_pool->setMaxThreadCount(qMax(1, maxThreads));
}

TimeoutMarketDataSource::~TimeoutMarketDataSource()
{
    if (!m_pool->waitForDone(kShutdownGraceMs)) {
        qCWarning(lcMarketData) << "Abandoning" << m_pool->activeThreadCount()
                                << "hung market data calls at shutdown";
        // The hung threads keep a pointer to the pool; it lives until process exit.
        m_pool.release();
    }
}

namespace {

enum CallState : int {
    Running = 0,
    Finished = 1,
    Abandoned = 2,
};

template <typename Result>
struct PendingCall {
    QSemaphore started;
    QSemaphore done;
    QAtomicInt state = Running;
    Result     result;
};

template <typename Result, typename Call>
Result runWithTimeout(QThreadPool* pool, int timeoutMs, const QString& label, Call call)
{
    auto pending = std::make_shared<PendingCall<Result>>();
    pool->start([pool, pending, call]() {
        pending->started.release();
        Result result = call();
        if (pending->state.testAndSetOrdered(Running, Finished)) {
            pending->result = std::move(result);
            pending->done.release();
        } else {
            // Take back the slot handed out when the caller gave up on this call.
            pool->reserveThread();
        }
    });

    // Every running call either finishes or is abandoned within timeoutMs, so a
    // queued call always gets a thread.
    pending->started.acquire();
    if (pending->done.tryAcquire(1, timeoutMs))
        return pending->result;

    if (!pending->state.testAndSetOrdered(Running, Abandoned)) {
        pending->done.acquire();
        return pending->result;
    }
    // The hung thread stops counting against maxThreadCount until it returns.
    pool->releaseThread();
    qCWarning(lcMarketData) << "Market data request timed out" << label << "after" << timeoutMs << "ms";
    Result timedOut;
    timedOut.errorMessage = QStringLiteral("timeout after %1 ms fetching %2").arg(timeoutMs).arg(label);
    return timedOut;
}

} // namespace

MarketDataSourceInterface::SeriesResult TimeoutMarketDataSource::fetch(const QString& symbol, const QDate& start,
                                                                       const QDate& end)
{
    if (!m_inner) {
        SeriesResult result;
        result.errorMessage = QStringLiteral("no market data source configured");
        return result;
    }
    auto inner = m_inner;
    return runWithTimeout<SeriesResult>(m_pool.get(), m_timeoutMs, symbol,
                                        [inner, symbol, start, end]() { return inner->fetch(symbol, start, end); });
}

MarketDataSourceInterface::FrameResult TimeoutMarketDataSource::fetchMany(const QStringList& symbols,
                                                                          const QDate& start, const QDate& end)
{
    if (!m_inner) {
        FrameResult result;
        result.errorMessage = QStringLiteral("no market data source configured");
        return result;
    }
    auto inner = m_inner;
    return runWithTimeout<FrameResult>(m_pool.get(), m_timeoutMs, symbols.join(QLatin1Char(',')),
                                       [inner, symbols, start, end]() { return inner->fetchMany(symbols, start, end); });
}
