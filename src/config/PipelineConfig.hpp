#pragma once

#include <QJsonObject>
#include <QString>
#include <QStringList>
#include <QVector>

#include <optional>

#include "beta/MacroBetaCalculator.hpp"
#include "data/DataQualityValidator.hpp"
#include "pipeline/UniverseScanner.hpp"
#include "prediction/BatchPredictor.hpp"
#include "prediction/DirectionModel.hpp"
#include "prediction/TechnicalBaseline.hpp"
#include "regime/MarketRegimeEngine.hpp"
#include "scoring/ScoringConfig.hpp"

// Run configuration. Every field has a default; relative paths resolve
// against the directory of the config file.
struct PipelineConfig {
    struct Paths {
        QString dataDir;
        QString newsDir;
        QString modelDir;
        QString reportsDir;
        QString progressFile;
        QString historyDir;
        QString notificationsFile;
    };

    struct Prediction {
        BatchPredictor::Settings               batch;
        AutoregressiveDirectionModel::Settings direction;
        TechnicalBaseline::Settings            technical;
        bool        directionModelEnabled = true;
        int         fetchTimeoutMs = 30000;
        int         fetchThreads = 8;
        int         newsMaxAgeDays = 7;
        QString     sentimentProgram;
        QStringList sentimentArguments;
        int         sentimentTimeoutMs = 30000;
    };

    struct Reporting {
        double minOpportunityScore = 65.0;
        int    topN = 10;
    };

    static const QString kNotifyLog;
    static const QString kNotifyFile;
    static const QString kNotifyNone;

    QString                      configPath;
    QString                      baseDirectory;
    Paths                        paths;
    QVector<UniverseEntry>       universe;
    UniverseScanner::Settings    scan;
    DataQualityValidator::Settings dataQuality;
    MarketRegimeEngine::Settings regime;
    MacroBetaCalculator::Settings macroBeta;
    Prediction                   prediction;
    ScoringConfig                scoring = ScoringConfig::defaults();
    Reporting                    reporting;
    QString                      notificationChannel = kNotifyLog;

    static PipelineConfig defaults(const QString& baseDirectory);
    static std::optional<PipelineConfig> fromJson(const QJsonObject& object, const QString& baseDirectory,
                                                  QString* error = nullptr);
    static std::optional<PipelineConfig> load(const QString& filePath, QString* error = nullptr);

    //! Structural checks shared by the loader and command-line overrides.
    bool validate(QString* error) const;
    QJsonObject toJson() const;
};
