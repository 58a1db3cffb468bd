#pragma once

#include <QDate>
#include <QJsonObject>
#include <QMap>
#include <QString>
#include <QStringList>
#include <QVector>

#include <optional>
#include <utility>

#include "scoring/ScoringTypes.hpp"

// Flat per-symbol view over scored opportunities plus rollups derived only
// from the row list. Missing sub-scores and betas enter every aggregate as 0.
class FactorView {
public:
    struct Row {
        QString               symbol;
        QString               name;
        QString               sector;
        double                opportunityScore = 0.0;
        QMap<QString, double> subScores;
        double                baseTotal = 0.0;
        double                totalAdjustment = 0.0;
        int                   penaltyCount = 0;
        int                   bonusCount = 0;
        QMap<QString, double> betas;
        QString               prediction;
        double                confidencePct = 0.0;
    };

    struct SectorSummary {
        QString               sector;
        int                   count = 0;
        double                avgOpportunityScore = 0.0;
        int                   buyCount = 0;
        int                   sellCount = 0;
        QMap<QString, double> avgBetas;
    };

    struct OverallSummary {
        int                   totalStocks = 0;
        double                avgOpportunityScore = 0.0;
        int                   buyCount = 0;
        int                   sellCount = 0;
        int                   holdCount = 0;
        int                   sectorCount = 0;
        QMap<QString, double> avgBetas;
        QString               topSymbol;

        QJsonObject toJson() const;
    };

    struct ExportPaths {
        QString stocksCsv;
        QString sectorsCsv;
        QString summaryJson;
    };

    explicit FactorView(QStringList factorNames);

    const QStringList& factorNames() const { return m_factorNames; }

    QVector<Row> rows(const QVector<ScoredOpportunity>& scored) const;
    QVector<SectorSummary> sectorSummary(const QVector<Row>& rows) const;
    OverallSummary overallSummary(const QVector<Row>& rows) const;

    //! Writes the three exports for runDate into directory; each file is committed atomically.
    std::optional<ExportPaths> save(const QVector<ScoredOpportunity>& scored, const QString& directory,
                                    const QDate& runDate, QString* error = nullptr) const;

private:
    bool writeStocksCsv(const QString& path, const QVector<Row>& rows, QString* error) const;
    bool writeSectorsCsv(const QString& path, const QVector<SectorSummary>& sectors, QString* error) const;

    QStringList m_factorNames;
};
