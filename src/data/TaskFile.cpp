#include "todo/data/TaskFile.hpp"

#include <QDate>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>
#include <QTextStream>
#include <QTime>
#include <QTimeZone>

#include "todo/core/Logging.hpp"

namespace todo {
namespace data {

namespace {
constexpr auto DATE_FORMAT = "yyyyMMdd";
constexpr auto DATE_TIME_FORMAT = "yyyyMMdd'T'hhmmss";
constexpr auto UTC_DATE_TIME_FORMAT = "yyyyMMdd'T'hhmmss'Z'";
constexpr int FOLD_OCTETS = 75;

QString parameterValue(const QString &parameters, const QString &key)
{
    const QStringList parts = parameters.split(';', Qt::SkipEmptyParts);
    for (const QString &part : parts) {
        const int eq = part.indexOf('=');
        if (eq > 0 && part.left(eq).compare(key, Qt::CaseInsensitive) == 0) {
            QString value = part.mid(eq + 1);
            if (value.startsWith('"') && value.endsWith('"') && value.size() >= 2) {
                value = value.mid(1, value.size() - 2);
            }
            return value;
        }
    }
    return {};
}

// UTF-8 length of the code point starting at pos; *units receives its UTF-16 length.
int utf8Length(const QString &line, int pos, int *units)
{
    const QChar c = line.at(pos);
    if (c.isHighSurrogate() && pos + 1 < line.size() && line.at(pos + 1).isLowSurrogate()) {
        *units = 2;
        return 4;
    }
    *units = 1;
    const ushort code = c.unicode();
    if (code < 0x80) {
        return 1;
    }
    return code < 0x800 ? 2 : 3;
}

// Physical lines stay within FOLD_OCTETS octets, leading space included; code points are never split.
void writeFolded(QTextStream &stream, const QString &line)
{
    int start = 0;
    int octets = 0;
    for (int pos = 0; pos < line.size();) {
        int units = 1;
        const int length = utf8Length(line, pos, &units);
        if (octets + length > FOLD_OCTETS) {
            stream << line.mid(start, pos - start) << "\n ";
            start = pos;
            octets = 1;
        }
        octets += length;
        pos += units;
    }
    stream << line.mid(start) << '\n';
}

bool isDateOnly(const QDateTime &dt)
{
    return dt.timeSpec() == Qt::LocalTime && dt.time() == QTime(0, 0);
}
} // namespace

bool TaskFile::read(const QString &filePath, Task *task, QString *errorMessage)
{
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Cannot open %1: %2").arg(filePath, file.errorString());
        }
        return false;
    }

    QTextStream stream(&file);
    stream.setCodec("UTF-8");

    QStringList lines;
    while (!stream.atEnd()) {
        const QString line = stream.readLine();
        if (!line.isEmpty() && (line.startsWith(' ') || line.startsWith('\t'))) {
            if (!lines.isEmpty()) {
                lines.last() += line.mid(1);
            }
        } else if (!line.isEmpty()) {
            lines << line;
        }
    }

    Task parsed;
    bool inTodo = false;
    bool sawTodo = false;
    QString nestedComponent;

    for (const QString &line : lines) {
        if (!nestedComponent.isEmpty()) {
            parsed.extraProperties << line;
            if (line.compare(QStringLiteral("END:") + nestedComponent, Qt::CaseInsensitive) == 0) {
                nestedComponent.clear();
            }
            continue;
        }
        if (line.compare(QLatin1String("BEGIN:VTODO"), Qt::CaseInsensitive) == 0) {
            if (sawTodo) {
                qCWarning(lcData) << "Ignoring additional VTODO in" << filePath;
                break;
            }
            inTodo = true;
            sawTodo = true;
            continue;
        }
        if (!inTodo) {
            continue;
        }
        if (line.compare(QLatin1String("END:VTODO"), Qt::CaseInsensitive) == 0) {
            inTodo = false;
            continue;
        }
        if (line.startsWith(QLatin1String("BEGIN:"), Qt::CaseInsensitive)) {
            nestedComponent = line.mid(6).toUpper();
            parsed.extraProperties << line;
            continue;
        }

        const int colonIndex = line.indexOf(':');
        if (colonIndex <= 0) {
            continue;
        }

        const QString property = line.left(colonIndex);
        const QString rawValue = line.mid(colonIndex + 1);
        const QString name = property.section(';', 0, 0).toUpper();
        const QString parameters = property.contains(';') ? property.section(';', 1) : QString();
        const bool dateOnlyParam = parameters.contains(QLatin1String("VALUE=DATE"), Qt::CaseInsensitive)
            && !parameters.contains(QLatin1String("VALUE=DATE-TIME"), Qt::CaseInsensitive);

        if (name == QLatin1String("UID")) {
            parsed.uid = decodeText(rawValue);
        } else if (name == QLatin1String("SUMMARY")) {
            parsed.summary = decodeText(rawValue);
        } else if (name == QLatin1String("DESCRIPTION")) {
            parsed.description = decodeText(rawValue);
        } else if (name == QLatin1String("LOCATION")) {
            parsed.location = decodeText(rawValue);
        } else if (name == QLatin1String("DUE")) {
            QDateTime due = parseDateTime(rawValue, dateOnlyParam);
            const QString tzid = parameterValue(parameters, QStringLiteral("TZID"));
            if (due.isValid() && !tzid.isEmpty() && !rawValue.endsWith('Z')) {
                const QTimeZone zone(tzid.toUtf8());
                if (zone.isValid()) {
                    due = QDateTime(due.date(), due.time(), zone).toLocalTime();
                }
            }
            parsed.due = due;
            parsed.rawDue = due.isValid() ? QString() : rawValue;
        } else if (name == QLatin1String("STATUS")) {
            parsed.completed = rawValue.trimmed().compare(QLatin1String("COMPLETED"), Qt::CaseInsensitive) == 0;
        } else if (name == QLatin1String("COMPLETED")) {
            parsed.completedAt = parseDateTime(rawValue, dateOnlyParam);
        } else if (name == QLatin1String("DTSTAMP")) {
            // Rewritten on save.
        } else {
            parsed.extraProperties << line;
        }
    }

    if (!sawTodo) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("%1 does not contain a VTODO component").arg(filePath);
        }
        return false;
    }
    if (parsed.completedAt.isValid()) {
        parsed.completed = true;
    }

    parsed.filename = QFileInfo(filePath).fileName();
    *task = std::move(parsed);
    return true;
}

bool TaskFile::write(const QString &filePath, const Task &task, QString *errorMessage)
{
    QFileInfo info(filePath);
    QDir dir = info.dir();
    if (!dir.exists() && !dir.mkpath(QStringLiteral("."))) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Cannot create directory %1").arg(dir.path());
        }
        return false;
    }

    QSaveFile file(filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Text)) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Cannot write %1: %2").arg(filePath, file.errorString());
        }
        return false;
    }

    QTextStream stream(&file);
    stream.setCodec("UTF-8");

    stream << "BEGIN:VCALENDAR\n";
    stream << "VERSION:2.0\n";
    stream << "PRODID:-//todo//EN\n";
    stream << "BEGIN:VTODO\n";
    writeFolded(stream, QStringLiteral("UID:") + encodeText(task.uid));
    stream << "DTSTAMP:" << formatDateTime(QDateTime::currentDateTimeUtc()) << '\n';
    writeFolded(stream, QStringLiteral("SUMMARY:") + encodeText(task.summary));
    if (!task.description.isEmpty()) {
        writeFolded(stream, QStringLiteral("DESCRIPTION:") + encodeText(task.description));
    }
    if (!task.location.isEmpty()) {
        writeFolded(stream, QStringLiteral("LOCATION:") + encodeText(task.location));
    }
    if (task.due.isValid()) {
        if (isDateOnly(task.due)) {
            stream << "DUE;VALUE=DATE:" << task.due.date().toString(QLatin1String(DATE_FORMAT)) << '\n';
        } else {
            stream << "DUE:" << formatDateTime(task.due) << '\n';
        }
    } else if (!task.rawDue.isEmpty()) {
        writeFolded(stream, QStringLiteral("DUE:") + task.rawDue);
    }
    if (task.completed) {
        stream << "STATUS:COMPLETED\n";
        if (task.completedAt.isValid()) {
            stream << "COMPLETED:" << formatDateTime(task.completedAt) << '\n';
        }
    } else {
        stream << "STATUS:NEEDS-ACTION\n";
    }
    for (const QString &line : task.extraProperties) {
        writeFolded(stream, line);
    }
    stream << "END:VTODO\n";
    stream << "END:VCALENDAR\n";

    stream.flush();
    if (stream.status() != QTextStream::Ok || !file.commit()) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Cannot write %1: %2").arg(filePath, file.errorString());
        }
        return false;
    }
    return true;
}

QString TaskFile::encodeText(const QString &text)
{
    QString encoded = text;
    encoded.replace('\\', "\\\\");
    encoded.replace('\n', "\\n");
    encoded.replace(',', "\\,");
    encoded.replace(';', "\\;");
    return encoded;
}

QString TaskFile::decodeText(const QString &text)
{
    QString decoded;
    decoded.reserve(text.size());
    for (int i = 0; i < text.size(); ++i) {
        const QChar c = text.at(i);
        if (c == '\\' && i + 1 < text.size()) {
            const QChar next = text.at(++i);
            if (next == 'n' || next == 'N') {
                decoded += '\n';
            } else {
                decoded += next;
            }
        } else {
            decoded += c;
        }
    }
    return decoded;
}

QString TaskFile::formatDateTime(const QDateTime &dt)
{
    if (!dt.isValid()) {
        return {};
    }
    return dt.toUTC().toString(QLatin1String(UTC_DATE_TIME_FORMAT));
}

QDateTime TaskFile::parseDateTime(const QString &value, bool dateOnly)
{
    const QString trimmed = value.trimmed();
    if (dateOnly || trimmed.length() == 8) {
        const QDate date = QDate::fromString(trimmed, QLatin1String(DATE_FORMAT));
        return date.isValid() ? date.startOfDay() : QDateTime();
    }
    if (trimmed.endsWith('Z')) {
        QDateTime dt = QDateTime::fromString(trimmed, QLatin1String(UTC_DATE_TIME_FORMAT));
        dt.setTimeSpec(Qt::UTC);
        return dt.isValid() ? dt.toLocalTime() : QDateTime();
    }
    QDateTime dt = QDateTime::fromString(trimmed, QLatin1String(DATE_TIME_FORMAT));
    if (!dt.isValid()) {
        dt = QDateTime::fromString(trimmed, Qt::ISODate);
    }
    return dt;
}

} // namespace data
} // namespace todo
