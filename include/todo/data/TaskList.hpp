#pragma once

#include <QMap>
#include <QString>

#include "todo/data/Task.hpp"

namespace todo {
namespace data {

// A directory holding one task file per record.
class TaskList
{
public:
    explicit TaskList(QString directory);
    ~TaskList() = default;

    static QString nameForDirectory(const QString &directory);

    const QString &name() const;
    const QString &directory() const;

    bool load(QString *errorMessage);

    const QMap<QString, Task> &tasks() const;
    Task *find(const QString &filename);
    const Task *find(const QString &filename) const;

    bool save(Task &task, QString *errorMessage);

private:
    QString m_directory;
    QString m_name;
    QMap<QString, Task> m_tasks;
};

} // namespace data
} // namespace todo
