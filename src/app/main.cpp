#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDate>
#include <QJsonDocument>
#include <QLoggingCategory>
#include <QTextStream>
#include <QtGlobal>

#include <cstdlib>

#include "config/PipelineConfig.hpp"
#include "pipeline/OvernightPipeline.hpp"
#include "utils/PathUtils.hpp"

namespace {

constexpr int kExitFailed = 1;
constexpr int kExitConfigError = 2;

const char* const kMessagePattern =
    "%{time yyyy-MM-dd hh:mm:ss.zzz} %{if-debug}D%{endif}%{if-info}I%{endif}%{if-warning}W%{endif}"
    "%{if-critical}C%{endif}%{if-fatal}F%{endif} [%{category}] %{message}";

int configError(const QString& message)
{
    QTextStream(stderr) << "Configuration error: " << message << Qt::endl;
    return kExitConfigError;
}

} // namespace

int main(int argc, char* argv[])
{
    qSetMessagePattern(QString::fromLatin1(kMessagePattern));

    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName(QStringLiteral("screener"));
    QCoreApplication::setApplicationName(QStringLiteral("overnight-screener"));
    QCoreApplication::setApplicationVersion(QStringLiteral("0.1.0"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Overnight equity screening pipeline"));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addOption({{QStringLiteral("c"), QStringLiteral("config")},
                      QStringLiteral("Pipeline configuration file (default: $SCREENER_CONFIG or config/screener.json)"),
                      QStringLiteral("path")});
    parser.addOption({QStringLiteral("reports-dir"), QStringLiteral("Override the reports directory"),
                      QStringLiteral("path")});
    parser.addOption({QStringLiteral("max-workers"), QStringLiteral("Override the worker pool size"),
                      QStringLiteral("count")});
    parser.addOption({QStringLiteral("run-date"), QStringLiteral("Run date in ISO format (default: today)"),
                      QStringLiteral("date")});
    parser.addOption({QStringLiteral("dry-run"), QStringLiteral("Validate the configuration and exit")});
    parser.addOption({QStringLiteral("log-rules"), QStringLiteral("Logging filter rules, e.g. screener.*.debug=true"),
                      QStringLiteral("rules")});
    parser.process(app);

    if (parser.isSet(QStringLiteral("log-rules"))) {
        QString rules = parser.value(QStringLiteral("log-rules"));
        rules.replace(QLatin1Char(';'), QLatin1Char('\n'));
        QLoggingCategory::setFilterRules(rules);
    }

    QString configPath = parser.value(QStringLiteral("config"));
    if (configPath.isEmpty())
        configPath = qEnvironmentVariable("SCREENER_CONFIG", QStringLiteral("config/screener.json"));

    QString error;
    std::optional<PipelineConfig> config = PipelineConfig::load(configPath, &error);
    if (!config)
        return configError(error);

    if (parser.isSet(QStringLiteral("reports-dir"))) {
        const QString reports = screener::utils::resolvePath(parser.value(QStringLiteral("reports-dir")));
        config->paths.reportsDir = reports;
        config->paths.progressFile = reports + QStringLiteral("/screener_progress.json");
        config->paths.historyDir = reports + QStringLiteral("/history");
        config->paths.notificationsFile = reports + QStringLiteral("/notifications.jsonl");
    }
    if (parser.isSet(QStringLiteral("max-workers"))) {
        bool ok = false;
        const int workers = parser.value(QStringLiteral("max-workers")).toInt(&ok);
        if (!ok)
            return configError(QStringLiteral("--max-workers expects an integer"));
        config->prediction.batch.maxWorkers = workers;
        config->scan.maxWorkers = workers;
    }

    QDate runDate = QDate::currentDate();
    if (parser.isSet(QStringLiteral("run-date"))) {
        runDate = QDate::fromString(parser.value(QStringLiteral("run-date")), Qt::ISODate);
        if (!runDate.isValid())
            return configError(QStringLiteral("--run-date expects YYYY-MM-DD"));
    }

    if (!config->validate(&error))
        return configError(error);

    if (parser.isSet(QStringLiteral("dry-run"))) {
        QTextStream(stdout) << QJsonDocument(config->toJson()).toJson(QJsonDocument::Indented);
        return EXIT_SUCCESS;
    }

    OvernightPipeline pipeline(*config, OvernightPipeline::buildComponents(*config));
    const OvernightPipeline::RunResult result = pipeline.run(runDate);
    if (!result.ok) {
        QTextStream(stderr) << "Pipeline failed: " << result.errorMessage << Qt::endl;
        return kExitFailed;
    }

    QTextStream(stdout) << "Pipeline complete: " << result.topOpportunities.size() << " top opportunities, state "
                        << result.statePath << Qt::endl;
    return EXIT_SUCCESS;
}
