#include "todo/data/Task.hpp"

namespace todo {
namespace data {

void Task::markCompleted(const QDateTime &now)
{
    if (completed && completedAt.isValid()) {
        return;
    }
    completed = true;
    completedAt = now;
}

void Task::setCompleted(bool value, const QDateTime &now)
{
    if (value) {
        markCompleted(now);
        return;
    }
    completed = false;
    completedAt = QDateTime();
}

} // namespace data
} // namespace todo
