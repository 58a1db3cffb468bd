#include "RegimeTypes.hpp"

#include <QJsonValue>

QJsonObject RegimeResult::toJson() const
{
    QJsonObject probabilities;
    for (auto it = regimeProbabilities.cbegin(); it != regimeProbabilities.cend(); ++it)
        probabilities.insert(it.key(), it.value());

    QJsonObject window;
    window.insert(QStringLiteral("start"), dataWindow.start.isValid() ? dataWindow.start.toString(Qt::ISODate)
                                                                      : QJsonValue(QJsonValue::Null));
    window.insert(QStringLiteral("end"), dataWindow.end.isValid() ? dataWindow.end.toString(Qt::ISODate)
                                                                  : QJsonValue(QJsonValue::Null));
    window.insert(QStringLiteral("rows"), dataWindow.rows);

    QJsonObject object;
    object.insert(QStringLiteral("regime_label"), regimeLabel);
    object.insert(QStringLiteral("regime_method"), regimeMethod);
    object.insert(QStringLiteral("vol_method"), volMethod);
    object.insert(QStringLiteral("vol_1d"), vol1d ? QJsonValue(*vol1d) : QJsonValue(QJsonValue::Null));
    object.insert(QStringLiteral("vol_annual"), volAnnual ? QJsonValue(*volAnnual) : QJsonValue(QJsonValue::Null));
    object.insert(QStringLiteral("regime_probabilities"), probabilities);
    object.insert(QStringLiteral("crash_risk_score"), crashRiskScore);
    object.insert(QStringLiteral("index_return_5d"), indexReturn5d);
    object.insert(QStringLiteral("data_window"), window);
    if (!error.isEmpty())
        object.insert(QStringLiteral("error"), error);
    if (!warning.isEmpty())
        object.insert(QStringLiteral("warning"), warning);
    return object;
}
