#include "todo/core/TaskQuery.hpp"

#include <algorithm>

#include "todo/data/Collection.hpp"
#include "todo/data/TaskList.hpp"

namespace todo {
namespace core {
namespace TaskQuery {

namespace {
QDateTime effectiveDue(const data::Task &task, const QDateTime &now)
{
    return task.due.isValid() ? task.due : now;
}
} // namespace

bool selectLists(const data::Collection &collection, const QStringList &names,
                 std::vector<data::TaskList *> *selected, QString *errorMessage)
{
    selected->clear();
    if (names.isEmpty()) {
        for (const QString &name : collection.names()) {
            selected->push_back(collection.find(name));
        }
        return true;
    }

    for (const QString &name : names) {
        data::TaskList *list = collection.find(name);
        if (!list) {
            if (errorMessage) {
                *errorMessage = QStringLiteral("Unknown list \"%1\". Available lists are: %2")
                                    .arg(name, collection.names().join(QStringLiteral(", ")));
            }
            selected->clear();
            return false;
        }
        if (std::find(selected->begin(), selected->end(), list) == selected->end()) {
            selected->push_back(list);
        }
    }
    return true;
}

bool isVisible(const data::Task &task, const QDateTime &now)
{
    if (!task.completed) {
        return true;
    }
    if (!task.completedAt.isValid()) {
        return false;
    }
    return task.completedAt > now.addSecs(-RECENTLY_COMPLETED_WINDOW_SECS);
}

bool hasLowerPriority(const ListedTask &lhs, const ListedTask &rhs, const QDateTime &now)
{
    if (lhs.task->completed != rhs.task->completed) {
        return lhs.task->completed;
    }
    const QDateTime lhsDue = effectiveDue(*lhs.task, now);
    const QDateTime rhsDue = effectiveDue(*rhs.task, now);
    if (lhsDue != rhsDue) {
        return lhsDue > rhsDue;
    }
    if (lhs.list->name() != rhs.list->name()) {
        return lhs.list->name() > rhs.list->name();
    }
    return lhs.task->filename > rhs.task->filename;
}

std::vector<ListedTask> collect(const std::vector<data::TaskList *> &lists, const QDateTime &now)
{
    std::vector<ListedTask> result;
    for (data::TaskList *list : lists) {
        const auto &tasks = list->tasks();
        for (auto it = tasks.constBegin(); it != tasks.constEnd(); ++it) {
            if (isVisible(it.value(), now)) {
                result.push_back(ListedTask{ list, &it.value() });
            }
        }
    }
    std::sort(result.begin(), result.end(), [&now](const ListedTask &lhs, const ListedTask &rhs) {
        return hasLowerPriority(rhs, lhs, now);
    });
    return result;
}

} // namespace TaskQuery
} // namespace core
} // namespace todo
