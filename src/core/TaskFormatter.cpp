#include "todo/core/TaskFormatter.hpp"

#include <QStringList>
#include <QTime>

#include "todo/data/TaskList.hpp"

namespace todo {
namespace core {

TaskFormatter::TaskFormatter(QString dateFormat)
    : m_dateFormat(std::move(dateFormat))
{
}

const QString &TaskFormatter::dateFormat() const
{
    return m_dateFormat;
}

QString TaskFormatter::formatDate(const QDateTime &dt) const
{
    if (!dt.isValid()) {
        return {};
    }
    const QDateTime local = dt.toLocalTime();
    QString text = local.toString(m_dateFormat);
    if (local.time() != QTime(0, 0) && !m_dateFormat.contains('h', Qt::CaseInsensitive)) {
        text += QStringLiteral(" ") + local.time().toString(QStringLiteral("hh:mm"));
    }
    return text;
}

bool TaskFormatter::compact(const data::Task &task, const data::TaskList &list, QString *line,
                            QString *errorMessage) const
{
    if (!task.due.isValid() && !task.rawDue.isEmpty()) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("invalid due date \"%1\"").arg(task.rawDue);
        }
        return false;
    }

    QStringList parts;
    parts << (task.completed ? QStringLiteral("[X]") : QStringLiteral("[ ]"));
    if (task.due.isValid()) {
        parts << formatDate(task.due);
    }
    parts << task.summary.simplified();
    parts << QStringLiteral("@") + list.name();
    *line = parts.join(QLatin1Char(' '));
    return true;
}

QString TaskFormatter::detailed(const data::Task &task, const data::TaskList &list) const
{
    QString header;
    QString error;
    if (!compact(task, list, &header, &error)) {
        header = QStringLiteral("%1 @%2 (%3)").arg(task.summary.simplified(), list.name(), error);
    }

    QStringList lines{ header };
    if (!task.description.isEmpty()) {
        lines << QString() << task.description;
    }
    if (!task.location.isEmpty()) {
        lines << QString() << QStringLiteral("Location: %1").arg(task.location);
    }
    if (task.completed && task.completedAt.isValid()) {
        lines << QStringLiteral("Completed: %1").arg(formatDate(task.completedAt));
    }
    return lines.join(QLatin1Char('\n'));
}

} // namespace core
} // namespace todo
