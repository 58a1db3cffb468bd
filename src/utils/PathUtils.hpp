#pragma once

#include <QString>

namespace screener::utils {

//! Replaces $VAR and ${VAR} with environment values; unknown names are left as written.
QString expandEnvironmentPlaceholders(const QString& text);

//! Expands '~' and environment placeholders, then resolves relative paths against baseDirectory
//! (the current directory when baseDirectory is empty). Returns a cleaned absolute path.
QString resolvePath(const QString& path, const QString& baseDirectory = QString());

} // namespace screener::utils
