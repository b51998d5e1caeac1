#pragma once

#include <QDateTime>
#include <QString>

#include "todo/data/Task.hpp"

namespace todo {
namespace data {
class TaskList;
}

namespace core {

class TaskFormatter
{
public:
    explicit TaskFormatter(QString dateFormat);

    // Single listing line; fails for records with malformed fields.
    bool compact(const data::Task &task, const data::TaskList &list, QString *line, QString *errorMessage) const;
    QString detailed(const data::Task &task, const data::TaskList &list) const;

    QString formatDate(const QDateTime &dt) const;
    const QString &dateFormat() const;

private:
    QString m_dateFormat;
};

} // namespace core
} // namespace todo
