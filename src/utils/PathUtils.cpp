#include "PathUtils.hpp"

#include <QByteArray>
#include <QDir>
#include <QFileInfo>
#include <QtGlobal>

namespace {

bool isNameChar(QChar ch)
{
    return ch.isLetterOrNumber() || ch == QLatin1Char('_');
}

QString lookup(const QString& name, const QString& fallback)
{
    const QByteArray bytes = name.toUtf8();
    if (name.isEmpty() || !qEnvironmentVariableIsSet(bytes.constData()))
        return fallback;
    return qEnvironmentVariable(bytes.constData());
}

} // namespace

namespace screener::utils {

QString expandEnvironmentPlaceholders(const QString& text)
{
    QString result;
    result.reserve(text.size());

    int index = 0;
    while (index < text.size()) {
        const QChar ch = text.at(index);
        if (ch != QLatin1Char('$') || index + 1 >= text.size()) {
            result.append(ch);
            ++index;
            continue;
        }

        if (text.at(index + 1) == QLatin1Char('{')) {
            const int close = text.indexOf(QLatin1Char('}'), index + 2);
            if (close < 0) {
                result.append(text.mid(index));
                break;
            }
            const QString name = text.mid(index + 2, close - index - 2);
            result.append(lookup(name, text.mid(index, close - index + 1)));
            index = close + 1;
            continue;
        }

        int end = index + 1;
        while (end < text.size() && isNameChar(text.at(end)))
            ++end;
        if (end == index + 1) {
            result.append(ch);
            ++index;
            continue;
        }
        const QString name = text.mid(index + 1, end - index - 1);
        result.append(lookup(name, text.mid(index, end - index)));
        index = end;
    }
    return result;
}

QString resolvePath(const QString& path, const QString& baseDirectory)
{
    QString expanded = expandEnvironmentPlaceholders(path.trimmed());
    if (expanded.isEmpty())
        return {};

    if (expanded == QStringLiteral("~"))
        expanded = QDir::homePath();
    else if (expanded.startsWith(QStringLiteral("~/")))
        expanded = QDir::homePath() + expanded.mid(1);

    if (QFileInfo(expanded).isRelative()) {
        const QString base = baseDirectory.isEmpty() ? QDir::currentPath() : baseDirectory;
        expanded = QDir(base).absoluteFilePath(expanded);
    }
    return QDir::cleanPath(expanded);
}

} // namespace screener::utils
