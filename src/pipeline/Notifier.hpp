#pragma once

#include <QJsonObject>
#include <QMutex>
#include <QString>

class NotifierInterface {
public:
    virtual ~NotifierInterface() = default;

    virtual bool sendSuccess(const QJsonObject& progress, const QString& reportPath,
                             QString* errorMessage = nullptr) = 0;
    virtual bool sendFailure(const QString& message, const QJsonObject& progress,
                             QString* errorMessage = nullptr) = 0;
};

// Writes a one-line summary through the logging categories.
class LogNotifier final : public NotifierInterface {
public:
    bool sendSuccess(const QJsonObject& progress, const QString& reportPath,
                     QString* errorMessage = nullptr) override;
    bool sendFailure(const QString& message, const QJsonObject& progress,
                     QString* errorMessage = nullptr) override;
};

// Appends one JSON object per notification to a file.
class FileNotifier final : public NotifierInterface {
public:
    explicit FileNotifier(QString filePath);

    const QString& filePath() const { return m_filePath; }

    bool sendSuccess(const QJsonObject& progress, const QString& reportPath,
                     QString* errorMessage = nullptr) override;
    bool sendFailure(const QString& message, const QJsonObject& progress,
                     QString* errorMessage = nullptr) override;

private:
    bool appendLine(const QJsonObject& entry, QString* errorMessage);

    QString m_filePath;
    QMutex  m_mutex;
};
