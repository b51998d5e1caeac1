#include "todo/data/TaskList.hpp"

#include <QDir>
#include <QFileInfo>
#include <QUuid>

#include "todo/core/Logging.hpp"
#include "todo/data/TaskFile.hpp"

namespace todo {
namespace data {

namespace {
constexpr auto TASK_FILE_SUFFIX = ".ics";
}

TaskList::TaskList(QString directory)
    : m_directory(QDir::cleanPath(directory))
    , m_name(nameForDirectory(m_directory))
{
}

QString TaskList::nameForDirectory(const QString &directory)
{
    return QFileInfo(QDir::cleanPath(directory)).fileName();
}

const QString &TaskList::name() const
{
    return m_name;
}

const QString &TaskList::directory() const
{
    return m_directory;
}

bool TaskList::load(QString *errorMessage)
{
    m_tasks.clear();

    QDir dir(m_directory);
    if (!dir.exists() || !QFileInfo(m_directory).isReadable()) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Cannot read list directory %1").arg(m_directory);
        }
        return false;
    }

    const QStringList files = dir.entryList({ QStringLiteral("*") + QLatin1String(TASK_FILE_SUFFIX) },
                                            QDir::Files, QDir::Name);
    for (const QString &fileName : files) {
        Task task;
        QString error;
        if (!TaskFile::read(dir.filePath(fileName), &task, &error)) {
            qCWarning(lcData).noquote() << "Skipping" << dir.filePath(fileName) << "-" << error;
            continue;
        }
        m_tasks.insert(task.filename, std::move(task));
    }
    qCDebug(lcData) << "Loaded" << m_tasks.size() << "tasks from" << m_directory;
    return true;
}

const QMap<QString, Task> &TaskList::tasks() const
{
    return m_tasks;
}

Task *TaskList::find(const QString &filename)
{
    auto it = m_tasks.find(filename);
    if (it == m_tasks.end()) {
        return nullptr;
    }
    return &it.value();
}

const Task *TaskList::find(const QString &filename) const
{
    auto it = m_tasks.constFind(filename);
    if (it == m_tasks.constEnd()) {
        return nullptr;
    }
    return &it.value();
}

bool TaskList::save(Task &task, QString *errorMessage)
{
    if (task.uid.isEmpty()) {
        task.uid = QUuid::createUuid().toString(QUuid::WithoutBraces);
    }
    if (task.filename.isEmpty()) {
        task.filename = task.uid + QLatin1String(TASK_FILE_SUFFIX);
    }

    const QString path = QDir(m_directory).filePath(task.filename);
    if (!TaskFile::write(path, task, errorMessage)) {
        return false;
    }
    qCDebug(lcData) << "Saved" << path;
    m_tasks.insert(task.filename, task);
    return true;
}

} // namespace data
} // namespace todo
