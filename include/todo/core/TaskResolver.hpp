#pragma once

#include <QString>

namespace todo {
namespace data {
class Collection;
class IdIndex;
class TaskList;
struct Task;
}

namespace core {

enum class ResolveStatus
{
    Found,
    UnknownId,
    Stale,
};

struct ResolvedTask
{
    ResolveStatus status = ResolveStatus::UnknownId;
    data::TaskList *list = nullptr;
    data::Task *task = nullptr;
};

// Turns a position printed by the last listing back into a task.
class TaskResolver
{
public:
    TaskResolver(const data::IdIndex &index, const data::Collection &collection);

    ResolvedTask resolve(int id, QString *errorMessage) const;

private:
    const data::IdIndex &m_index;
    const data::Collection &m_collection;
};

} // namespace core
} // namespace todo
