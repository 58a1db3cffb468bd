#include <QCommandLineParser>
#include <QCoreApplication>
#include <QFileInfo>
#include <QTextStream>
#include <QtGlobal>

#include <cstdlib>

#include "config/PipelineConfig.hpp"
#include "pipeline/ProgressStatusReader.hpp"
#include "utils/PathUtils.hpp"

namespace {

void printHistory(const ProgressStatusReader& reader, int limit)
{
    QTextStream out(stdout);
    const QVector<ProgressStatusReader::HistoryEntry> entries = reader.history(limit);
    if (entries.isEmpty()) {
        out << "No archived runs." << Qt::endl;
        return;
    }
    for (const ProgressStatusReader::HistoryEntry& entry : entries) {
        out << entry.startTime.toString(QStringLiteral("yyyy-MM-dd HH:mm:ss")).leftJustified(21)
            << entry.overallStatus.leftJustified(10) << entry.executionTimeFormatted.leftJustified(10)
            << "scanned=" << entry.stocksScanned << " opportunities=" << entry.opportunitiesFound
            << " errors=" << entry.errorCount << Qt::endl;
    }
}

} // namespace

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("screener-status"));
    QCoreApplication::setApplicationVersion(QStringLiteral("0.1.0"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Read-only status of the overnight screener"));
    parser.addHelpOption();
    parser.addOption({{QStringLiteral("c"), QStringLiteral("config")},
                      QStringLiteral("Pipeline configuration file used to locate the progress file"),
                      QStringLiteral("path")});
    parser.addOption({QStringLiteral("progress-file"), QStringLiteral("Progress document to read"),
                      QStringLiteral("path")});
    parser.addOption({QStringLiteral("watch"), QStringLiteral("Poll until the run finishes")});
    parser.addOption({QStringLiteral("interval"), QStringLiteral("Watch interval in seconds"),
                      QStringLiteral("seconds"), QStringLiteral("30")});
    parser.addOption({QStringLiteral("history"), QStringLiteral("List archived runs")});
    parser.addOption({QStringLiteral("limit"), QStringLiteral("Maximum history entries"), QStringLiteral("count"),
                      QStringLiteral("10")});
    parser.process(app);

    QString progressFile;
    QString historyDir;
    QString configPath = parser.value(QStringLiteral("config"));
    if (configPath.isEmpty())
        configPath = qEnvironmentVariable("SCREENER_CONFIG");
    if (!configPath.isEmpty()) {
        QString error;
        const std::optional<PipelineConfig> config = PipelineConfig::load(configPath, &error);
        if (!config) {
            QTextStream(stderr) << "Configuration error: " << error << Qt::endl;
            return 2;
        }
        progressFile = config->paths.progressFile;
        historyDir = config->paths.historyDir;
    }
    if (parser.isSet(QStringLiteral("progress-file"))) {
        progressFile = screener::utils::resolvePath(parser.value(QStringLiteral("progress-file")));
        historyDir.clear();
    }
    if (progressFile.isEmpty())
        progressFile = screener::utils::resolvePath(QStringLiteral("reports/screener_progress.json"));
    if (historyDir.isEmpty())
        historyDir = screener::utils::resolvePath(QStringLiteral("history"), QFileInfo(progressFile).absolutePath());

    const ProgressStatusReader reader(progressFile, historyDir);

    if (parser.isSet(QStringLiteral("history"))) {
        printHistory(reader, parser.value(QStringLiteral("limit")).toInt());
        return EXIT_SUCCESS;
    }

    QTextStream out(stdout);
    if (parser.isSet(QStringLiteral("watch"))) {
        const int intervalMs = qMax(1, parser.value(QStringLiteral("interval")).toInt()) * 1000;
        const std::optional<ProgressStatusReader::Snapshot> last =
            reader.watch(intervalMs, [&out](const ProgressStatusReader::Snapshot& snapshot) {
                out << ProgressStatusReader::render(snapshot) << Qt::endl;
                return true;
            });
        if (!last)
            return EXIT_FAILURE;
        return last->overallStatus == QStringLiteral("failed") ? EXIT_FAILURE : EXIT_SUCCESS;
    }

    QString error;
    const std::optional<ProgressStatusReader::Snapshot> snapshot = reader.load(&error);
    if (!snapshot) {
        QTextStream(stderr) << error << Qt::endl;
        return EXIT_FAILURE;
    }
    out << ProgressStatusReader::render(*snapshot);
    return EXIT_SUCCESS;
}
