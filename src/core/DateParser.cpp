#include "todo/core/DateParser.hpp"

#include <QDate>
#include <QRegularExpression>
#include <QTime>

namespace todo {
namespace core {

namespace {
const char *const WEEKDAYS[] = { "monday", "tuesday", "wednesday", "thursday", "friday", "saturday", "sunday" };

int weekdayFromName(const QString &name)
{
    for (int i = 0; i < 7; ++i) {
        const QString day = QLatin1String(WEEKDAYS[i]);
        if (name == day || (name.size() >= 3 && day.startsWith(name))) {
            return i + 1;
        }
    }
    return 0;
}

QDateTime applyOffset(const QDateTime &now, int amount, const QString &unit)
{
    if (unit.startsWith(QLatin1String("minute"))) {
        return now.addSecs(static_cast<qint64>(amount) * 60);
    }
    if (unit.startsWith(QLatin1String("hour"))) {
        return now.addSecs(static_cast<qint64>(amount) * 3600);
    }
    if (unit.startsWith(QLatin1String("day"))) {
        return now.date().addDays(amount).startOfDay();
    }
    if (unit.startsWith(QLatin1String("week"))) {
        return now.date().addDays(static_cast<qint64>(amount) * 7).startOfDay();
    }
    return now.date().addMonths(amount).startOfDay();
}
} // namespace

DateParser::DateParser(QString format, bool humanTime)
    : m_format(std::move(format))
    , m_humanTime(humanTime)
{
}

const QString &DateParser::format() const
{
    return m_format;
}

bool DateParser::humanTime() const
{
    return m_humanTime;
}

bool DateParser::parse(const QString &text, const QDateTime &now, QDateTime *result, QString *errorMessage) const
{
    const QString trimmed = text.trimmed();
    if (trimmed.isEmpty()) {
        *result = QDateTime();
        return true;
    }

    if (m_humanTime) {
        if (auto informal = parseInformal(trimmed, now)) {
            *result = *informal;
            return true;
        }
    }
    if (auto formatted = parseFormatted(trimmed)) {
        *result = *formatted;
        return true;
    }

    if (errorMessage) {
        if (m_humanTime) {
            *errorMessage = QStringLiteral("Time description not recognized: \"%1\"").arg(trimmed);
        } else {
            *errorMessage = QStringLiteral("Expected a date in the format \"%1\", got \"%2\"").arg(m_format, trimmed);
        }
    }
    return false;
}

std::optional<QDateTime> DateParser::parseFormatted(const QString &text) const
{
    QDateTime dt = QDateTime::fromString(text, m_format);
    if (dt.isValid()) {
        return dt;
    }
    const QDate date = QDate::fromString(text, m_format);
    if (date.isValid()) {
        return date.startOfDay();
    }
    dt = QDateTime::fromString(text, m_format + QStringLiteral(" hh:mm"));
    if (dt.isValid()) {
        return dt;
    }
    dt = QDateTime::fromString(text, Qt::ISODate);
    if (dt.isValid()) {
        return dt;
    }
    return std::nullopt;
}

std::optional<QDateTime> DateParser::parseInformal(const QString &text, const QDateTime &now) const
{
    const QString phrase = text.toLower().simplified();
    const QDate today = now.date();

    if (phrase == QLatin1String("now")) {
        return now;
    }
    if (phrase == QLatin1String("today")) {
        return today.startOfDay();
    }
    if (phrase == QLatin1String("tomorrow")) {
        return today.addDays(1).startOfDay();
    }
    if (phrase == QLatin1String("yesterday")) {
        return today.addDays(-1).startOfDay();
    }
    if (phrase == QLatin1String("next week")) {
        return today.addDays(7).startOfDay();
    }
    if (phrase == QLatin1String("next month")) {
        return today.addMonths(1).startOfDay();
    }

    static const QRegularExpression relativeFuture(
        QStringLiteral("^in (\\d+) (minute|hour|day|week|month)s?$"));
    static const QRegularExpression relativePast(
        QStringLiteral("^(\\d+) (minute|hour|day|week|month)s? ago$"));
    static const QRegularExpression weekday(QStringLiteral("^(?:next )?([a-z]+)$"));

    QRegularExpressionMatch match = relativeFuture.match(phrase);
    if (match.hasMatch()) {
        return applyOffset(now, match.captured(1).toInt(), match.captured(2));
    }
    match = relativePast.match(phrase);
    if (match.hasMatch()) {
        return applyOffset(now, -match.captured(1).toInt(), match.captured(2));
    }
    match = weekday.match(phrase);
    if (match.hasMatch()) {
        const int target = weekdayFromName(match.captured(1));
        if (target > 0) {
            int ahead = target - today.dayOfWeek();
            if (ahead <= 0) {
                ahead += 7;
            }
            return today.addDays(ahead).startOfDay();
        }
    }
    return std::nullopt;
}

} // namespace core
} // namespace todo
