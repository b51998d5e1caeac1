#pragma once

#include <QDateTime>
#include <QString>

#include "todo/data/Task.hpp"

namespace todo {
namespace data {

// Reads and writes a single VTODO per iCalendar file.
class TaskFile
{
public:
    static bool read(const QString &filePath, Task *task, QString *errorMessage);
    static bool write(const QString &filePath, const Task &task, QString *errorMessage);

    static QString encodeText(const QString &text);
    static QString decodeText(const QString &text);
    static QString formatDateTime(const QDateTime &dt);
    static QDateTime parseDateTime(const QString &value, bool dateOnly);
};

} // namespace data
} // namespace todo
