#include "DurationFormat.hpp"

namespace screener::utils {

QString formatDuration(qint64 seconds)
{
    const qint64 total = qMax<qint64>(0, seconds);
    const qint64 hours = total / 3600;
    const qint64 minutes = (total % 3600) / 60;
    const qint64 secs = total % 60;
    return QStringLiteral("%1:%2:%3")
        .arg(hours)
        .arg(minutes, 2, 10, QLatin1Char('0'))
        .arg(secs, 2, 10, QLatin1Char('0'));
}

} // namespace screener::utils
