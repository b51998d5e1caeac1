#pragma once

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QString>
#include <functional>

#include "todo/cli/TaskEditor.hpp"
#include "todo/data/Task.hpp"

namespace todo {
namespace test {

inline data::Task makeTask(const QString &summary, const QDateTime &due = QDateTime())
{
    data::Task task;
    task.summary = summary;
    task.due = due;
    return task;
}

inline data::Task makeCompletedTask(const QString &summary, const QDateTime &completedAt)
{
    data::Task task = makeTask(summary);
    task.completed = true;
    task.completedAt = completedAt;
    return task;
}

inline bool writeFile(const QString &path, const QByteArray &content)
{
    QDir().mkpath(QFileInfo(path).path());
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        return false;
    }
    return file.write(content) == content.size();
}

// Editor double: applies an optional change and answers save or cancel.
class ScriptedEditor : public cli::TaskEditor
{
public:
    explicit ScriptedEditor(bool save, std::function<void(data::Task &)> change = {})
        : m_save(save)
        , m_change(std::move(change))
    {
    }

    bool edit(data::Task &task, const QStringList &availableLists) override
    {
        ++calls;
        seenLists = availableLists;
        if (!m_save) {
            return false;
        }
        if (m_change) {
            m_change(task);
        }
        return true;
    }

    int calls = 0;
    QStringList seenLists;

private:
    bool m_save;
    std::function<void(data::Task &)> m_change;
};

} // namespace test
} // namespace todo
