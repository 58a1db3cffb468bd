#include "FactorView.hpp"

#include <QDir>
#include <QJsonArray>
#include <QJsonDocument>
#include <QLocale>
#include <QLoggingCategory>
#include <QSaveFile>
#include <QSet>
#include <QStringConverter>
#include <QTextStream>

#include <algorithm>
#include <utility>

Q_LOGGING_CATEGORY(lcFactorView, "screener.scoring.factors")

namespace {

const QString kUnassignedSector = QStringLiteral("Unknown");

QString escapeCsv(const QString& value)
{
    QString escaped = value;
    escaped.replace(QStringLiteral("\""), QStringLiteral("\"\""));
    if (escaped.contains(QLatin1Char(',')) || escaped.contains(QLatin1Char('\n')) || escaped.contains(QLatin1Char('"')))
        return QStringLiteral("\"%1\"").arg(escaped);
    return escaped;
}

QString sectorOf(const FactorView::Row& row)
{
    return row.sector.trimmed().isEmpty() ? kUnassignedSector : row.sector;
}

QJsonObject mapToJson(const QMap<QString, double>& values)
{
    QJsonObject object;
    for (auto it = values.cbegin(); it != values.cend(); ++it)
        object.insert(it.key(), it.value());
    return object;
}

bool finishStream(QTextStream& stream, QSaveFile& file, const QString& path, QString* error)
{
    stream.flush();
    if (stream.status() != QTextStream::Ok || !file.commit()) {
        if (error)
            *error = QStringLiteral("failed to write %1: %2").arg(path, file.errorString());
        return false;
    }
    return true;
}

} // namespace

QJsonObject FactorView::OverallSummary::toJson() const
{
    QJsonObject object;
    object.insert(QStringLiteral("total_stocks"), totalStocks);
    object.insert(QStringLiteral("avg_opportunity_score"), avgOpportunityScore);
    object.insert(QStringLiteral("buy_count"), buyCount);
    object.insert(QStringLiteral("sell_count"), sellCount);
    object.insert(QStringLiteral("hold_count"), holdCount);
    object.insert(QStringLiteral("sector_count"), sectorCount);
    object.insert(QStringLiteral("avg_betas"), mapToJson(avgBetas));
    object.insert(QStringLiteral("top_symbol"), topSymbol);
    return object;
}

FactorView::FactorView(QStringList factorNames)
    : m_factorNames(std::move(factorNames))
{
}

QVector<FactorView::Row> FactorView::rows(const QVector<ScoredOpportunity>& scored) const
{
    const QStringList subScoreNames = screener::subscore::all();
    QVector<Row> result;
    result.reserve(scored.size());
    for (const ScoredOpportunity& opportunity : scored) {
        Row row;
        row.symbol = opportunity.symbol;
        row.name = opportunity.name;
        row.sector = opportunity.sector;
        row.opportunityScore = opportunity.opportunityScore;
        for (const QString& name : subScoreNames)
            row.subScores.insert(name, opportunity.subScores.value(name, 0.0));
        row.baseTotal = opportunity.baseTotal;
        row.totalAdjustment = opportunity.totalAdjustment;
        row.penaltyCount = opportunity.penaltyCount();
        row.bonusCount = opportunity.bonusCount();
        for (const QString& factor : m_factorNames)
            row.betas.insert(factor, opportunity.macroBetas.value(factor, 0.0));
        row.prediction = opportunity.prediction;
        row.confidencePct = opportunity.confidencePct;
        result.append(row);
    }
    return result;
}

QVector<FactorView::SectorSummary> FactorView::sectorSummary(const QVector<Row>& rows) const
{
    QMap<QString, SectorSummary> bySector;
    for (const Row& row : rows) {
        const QString sector = sectorOf(row);
        SectorSummary& summary = bySector[sector];
        summary.sector = sector;
        ++summary.count;
        summary.avgOpportunityScore += row.opportunityScore;
        if (row.prediction == screener::signal::kBuy)
            ++summary.buyCount;
        else if (row.prediction == screener::signal::kSell)
            ++summary.sellCount;
        for (const QString& factor : m_factorNames)
            summary.avgBetas[factor] += row.betas.value(factor, 0.0);
    }

    QVector<SectorSummary> result;
    result.reserve(bySector.size());
    for (SectorSummary summary : std::as_const(bySector)) {
        summary.avgOpportunityScore /= summary.count;
        for (auto it = summary.avgBetas.begin(); it != summary.avgBetas.end(); ++it)
            it.value() /= summary.count;
        result.append(summary);
    }
    std::sort(result.begin(), result.end(), [](const SectorSummary& lhs, const SectorSummary& rhs) {
        if (lhs.avgOpportunityScore != rhs.avgOpportunityScore)
            return lhs.avgOpportunityScore > rhs.avgOpportunityScore;
        return lhs.sector < rhs.sector;
    });
    return result;
}

FactorView::OverallSummary FactorView::overallSummary(const QVector<Row>& rows) const
{
    OverallSummary summary;
    summary.totalStocks = rows.size();
    for (const QString& factor : m_factorNames)
        summary.avgBetas.insert(factor, 0.0);
    if (rows.isEmpty())
        return summary;

    QSet<QString> sectors;
    double bestScore = -1.0;
    for (const Row& row : rows) {
        summary.avgOpportunityScore += row.opportunityScore;
        if (row.prediction == screener::signal::kBuy)
            ++summary.buyCount;
        else if (row.prediction == screener::signal::kSell)
            ++summary.sellCount;
        else
            ++summary.holdCount;
        for (const QString& factor : m_factorNames)
            summary.avgBetas[factor] += row.betas.value(factor, 0.0);
        sectors.insert(sectorOf(row));
        if (row.opportunityScore > bestScore) {
            bestScore = row.opportunityScore;
            summary.topSymbol = row.symbol;
        }
    }
    summary.avgOpportunityScore /= rows.size();
    for (auto it = summary.avgBetas.begin(); it != summary.avgBetas.end(); ++it)
        it.value() /= rows.size();
    summary.sectorCount = sectors.size();
    return summary;
}

bool FactorView::writeStocksCsv(const QString& path, const QVector<Row>& rows, QString* error) const
{
    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Text)) {
        if (error)
            *error = QStringLiteral("cannot open %1: %2").arg(path, file.errorString());
        return false;
    }

    const QStringList subScoreNames = screener::subscore::all();
    QStringList header{QStringLiteral("symbol"), QStringLiteral("name"), QStringLiteral("sector"),
                       QStringLiteral("opportunity_score")};
    header << subScoreNames;
    header << QStringLiteral("base_total") << QStringLiteral("total_adjustment") << QStringLiteral("penalty_count")
           << QStringLiteral("bonus_count");
    for (const QString& factor : m_factorNames)
        header << QStringLiteral("beta_%1").arg(factor);
    header << QStringLiteral("prediction") << QStringLiteral("confidence_pct");

    QTextStream stream(&file);
    stream.setLocale(QLocale::c());
    stream.setEncoding(QStringConverter::Utf8);
    stream << header.join(QLatin1Char(',')) << QLatin1Char('\n');

    const QLocale locale = QLocale::c();
    for (const Row& row : rows) {
        stream << escapeCsv(row.symbol) << QLatin1Char(',');
        stream << escapeCsv(row.name) << QLatin1Char(',');
        stream << escapeCsv(row.sector) << QLatin1Char(',');
        stream << locale.toString(row.opportunityScore, 'f', 2) << QLatin1Char(',');
        for (const QString& name : subScoreNames)
            stream << locale.toString(row.subScores.value(name, 0.0), 'f', 2) << QLatin1Char(',');
        stream << locale.toString(row.baseTotal, 'f', 2) << QLatin1Char(',');
        stream << locale.toString(row.totalAdjustment, 'f', 2) << QLatin1Char(',');
        stream << row.penaltyCount << QLatin1Char(',');
        stream << row.bonusCount << QLatin1Char(',');
        for (const QString& factor : m_factorNames)
            stream << locale.toString(row.betas.value(factor, 0.0), 'f', 4) << QLatin1Char(',');
        stream << escapeCsv(row.prediction) << QLatin1Char(',');
        stream << locale.toString(row.confidencePct, 'f', 1);
        stream << QLatin1Char('\n');
    }
    return finishStream(stream, file, path, error);
}

bool FactorView::writeSectorsCsv(const QString& path, const QVector<SectorSummary>& sectors, QString* error) const
{
    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Text)) {
        if (error)
            *error = QStringLiteral("cannot open %1: %2").arg(path, file.errorString());
        return false;
    }

    QStringList header{QStringLiteral("sector"), QStringLiteral("count"), QStringLiteral("avg_opportunity_score"),
                       QStringLiteral("buy_count"), QStringLiteral("sell_count")};
    for (const QString& factor : m_factorNames)
        header << QStringLiteral("avg_beta_%1").arg(factor);

    QTextStream stream(&file);
    stream.setLocale(QLocale::c());
    stream.setEncoding(QStringConverter::Utf8);
    stream << header.join(QLatin1Char(',')) << QLatin1Char('\n');

    const QLocale locale = QLocale::c();
    for (const SectorSummary& sector : sectors) {
        stream << escapeCsv(sector.sector) << QLatin1Char(',');
        stream << sector.count << QLatin1Char(',');
        stream << locale.toString(sector.avgOpportunityScore, 'f', 2) << QLatin1Char(',');
        stream << sector.buyCount << QLatin1Char(',');
        stream << sector.sellCount;
        for (const QString& factor : m_factorNames)
            stream << QLatin1Char(',') << locale.toString(sector.avgBetas.value(factor, 0.0), 'f', 4);
        stream << QLatin1Char('\n');
    }
    return finishStream(stream, file, path, error);
}

std::optional<FactorView::ExportPaths> FactorView::save(const QVector<ScoredOpportunity>& scored,
                                                        const QString& directory, const QDate& runDate,
                                                        QString* error) const
{
    QDir dir(directory);
    if (!dir.exists() && !dir.mkpath(QStringLiteral("."))) {
        if (error)
            *error = QStringLiteral("cannot create reports directory %1").arg(directory);
        return std::nullopt;
    }

    const QString stamp = runDate.toString(QStringLiteral("yyyyMMdd"));
    ExportPaths paths;
    paths.stocksCsv = dir.filePath(QStringLiteral("factor_view_stocks_%1.csv").arg(stamp));
    paths.sectorsCsv = dir.filePath(QStringLiteral("factor_view_sectors_%1.csv").arg(stamp));
    paths.summaryJson = dir.filePath(QStringLiteral("factor_view_summary_%1.json").arg(stamp));

    const QVector<Row> stockRows = rows(scored);
    const QVector<SectorSummary> sectors = sectorSummary(stockRows);
    const OverallSummary overall = overallSummary(stockRows);

    if (!writeStocksCsv(paths.stocksCsv, stockRows, error))
        return std::nullopt;
    if (!writeSectorsCsv(paths.sectorsCsv, sectors, error))
        return std::nullopt;

    QJsonArray sectorArray;
    for (const SectorSummary& sector : sectors) {
        QJsonObject entry;
        entry.insert(QStringLiteral("sector"), sector.sector);
        entry.insert(QStringLiteral("count"), sector.count);
        entry.insert(QStringLiteral("avg_opportunity_score"), sector.avgOpportunityScore);
        entry.insert(QStringLiteral("buy_count"), sector.buyCount);
        entry.insert(QStringLiteral("sell_count"), sector.sellCount);
        entry.insert(QStringLiteral("avg_betas"), mapToJson(sector.avgBetas));
        sectorArray.append(entry);
    }

    QJsonObject document;
    document.insert(QStringLiteral("run_date"), runDate.toString(Qt::ISODate));
    document.insert(QStringLiteral("factors"), QJsonArray::fromStringList(m_factorNames));
    document.insert(QStringLiteral("summary"), overall.toJson());
    document.insert(QStringLiteral("sectors"), sectorArray);

    QSaveFile summaryFile(paths.summaryJson);
    if (!summaryFile.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        if (error)
            *error = QStringLiteral("cannot open %1: %2").arg(paths.summaryJson, summaryFile.errorString());
        return std::nullopt;
    }
    summaryFile.write(QJsonDocument(document).toJson(QJsonDocument::Indented));
    if (!summaryFile.commit()) {
        if (error)
            *error = QStringLiteral("failed to write %1: %2").arg(paths.summaryJson, summaryFile.errorString());
        return std::nullopt;
    }

    qCInfo(lcFactorView) << "Factor view exported for" << stockRows.size() << "stocks and" << sectors.size()
                         << "sectors to" << dir.absolutePath();
    return paths;
}
