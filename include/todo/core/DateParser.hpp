#pragma once

#include <QDateTime>
#include <QString>
#include <optional>

namespace todo {
namespace core {

class DateParser
{
public:
    DateParser(QString format, bool humanTime);

    // Empty text parses to an invalid QDateTime, meaning "no date".
    bool parse(const QString &text, const QDateTime &now, QDateTime *result, QString *errorMessage) const;

    const QString &format() const;
    bool humanTime() const;

private:
    std::optional<QDateTime> parseFormatted(const QString &text) const;
    std::optional<QDateTime> parseInformal(const QString &text, const QDateTime &now) const;

    QString m_format;
    bool m_humanTime = true;
};

} // namespace core
} // namespace todo
