#pragma once

#include <QDateTime>
#include <QJsonObject>
#include <QString>
#include <QVector>

#include <functional>
#include <optional>

// Read-only view of the progress document and its history archive.
class ProgressStatusReader {
public:
    struct Snapshot {
        QJsonObject document;
        QString     overallStatus;
        double      overallProgress = 0.0;
        QString     lastCompletedStage;
        QString     executionTimeFormatted;
        QString     estimatedRemainingFormatted;
        int         errorCount = 0;
        int         warningCount = 0;

        bool isTerminal() const;
    };

    struct HistoryEntry {
        QString   filePath;
        QDateTime startTime;
        QString   overallStatus;
        QString   executionTimeFormatted;
        int       stocksScanned = 0;
        int       opportunitiesFound = 0;
        int       errorCount = 0;
    };

    //! Called with each polled snapshot; returning false stops the watch.
    using WatchCallback = std::function<bool(const Snapshot& snapshot)>;

    ProgressStatusReader(QString progressFile, QString historyDirectory);

    std::optional<Snapshot> load(QString* error = nullptr) const;
    //! Newest first, at most limit entries (all when limit < 0).
    QVector<HistoryEntry> history(int limit = -1) const;
    //! Polls until the document reaches a terminal status, the callback declines, or maxPolls is reached.
    std::optional<Snapshot> watch(int intervalMs, const WatchCallback& callback, int maxPolls = -1) const;

    static std::optional<Snapshot> parse(const QByteArray& data, QString* error = nullptr);
    static QString render(const Snapshot& snapshot);

private:
    QString m_progressFile;
    QString m_historyDirectory;
};
