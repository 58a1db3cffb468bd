#pragma once

#include <QDate>
#include <QJsonObject>
#include <QMap>
#include <QString>

#include <optional>

namespace screener::regime {
inline const QString kCalm = QStringLiteral("calm");
inline const QString kNormal = QStringLiteral("normal");
inline const QString kHighVol = QStringLiteral("high_vol");
inline const QString kUnknown = QStringLiteral("unknown");

inline const QString kMethodHmm = QStringLiteral("hmm");
inline const QString kMethodGmm = QStringLiteral("gmm");
inline const QString kMethodGarch = QStringLiteral("garch");
inline const QString kMethodEwma = QStringLiteral("ewma");
inline const QString kMethodNone = QStringLiteral("none");
} // namespace screener::regime

struct RegimeDataWindow {
    QDate start;
    QDate end;
    int   rows = 0;
};

struct RegimeResult {
    QString                regimeLabel = screener::regime::kUnknown;
    QString                regimeMethod = screener::regime::kMethodNone;
    QString                volMethod = screener::regime::kMethodNone;
    std::optional<double>  vol1d;
    std::optional<double>  volAnnual;
    QMap<QString, double>  regimeProbabilities;
    double                 crashRiskScore = 0.0;
    double                 indexReturn5d = 0.0;
    RegimeDataWindow       dataWindow;
    QString                error;
    QString                warning;

    bool isKnown() const { return regimeLabel != screener::regime::kUnknown; }
    double probabilityOf(const QString& label) const { return regimeProbabilities.value(label, 0.0); }

    QJsonObject toJson() const;
};
