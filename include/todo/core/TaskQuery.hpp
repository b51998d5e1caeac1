#pragma once

#include <QDateTime>
#include <QString>
#include <QStringList>
#include <vector>

#include "todo/data/Task.hpp"

namespace todo {
namespace data {
class Collection;
class TaskList;
}

namespace core {

struct ListedTask
{
    data::TaskList *list = nullptr;
    const data::Task *task = nullptr;
};

namespace TaskQuery {

constexpr qint64 RECENTLY_COMPLETED_WINDOW_SECS = 7 * 24 * 60 * 60;

// Empty names select every list. Unknown names fail, listing the valid ones.
bool selectLists(const data::Collection &collection, const QStringList &names,
                 std::vector<data::TaskList *> *selected, QString *errorMessage);

bool isVisible(const data::Task &task, const QDateTime &now);

// Strict weak order: open before completed, earlier effective due before later,
// then list name and filename ascending. Undated tasks count as due now.
bool hasLowerPriority(const ListedTask &lhs, const ListedTask &rhs, const QDateTime &now);

std::vector<ListedTask> collect(const std::vector<data::TaskList *> &lists, const QDateTime &now);

} // namespace TaskQuery
} // namespace core
} // namespace todo
