#pragma once

#include <QString>
#include <QtGlobal>

namespace screener::utils {

//! H:MM:SS with unbounded hours; negative input formats as zero.
QString formatDuration(qint64 seconds);

} // namespace screener::utils
