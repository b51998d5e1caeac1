#include "todo/core/TaskResolver.hpp"

#include "todo/core/Logging.hpp"
#include "todo/data/Collection.hpp"
#include "todo/data/IdIndex.hpp"
#include "todo/data/TaskList.hpp"

namespace todo {
namespace core {

TaskResolver::TaskResolver(const data::IdIndex &index, const data::Collection &collection)
    : m_index(index)
    , m_collection(collection)
{
}

ResolvedTask TaskResolver::resolve(int id, QString *errorMessage) const
{
    ResolvedTask result;
    const auto entry = m_index.entry(id);
    if (!entry) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("No task with id %1").arg(id);
        }
        return result;
    }

    result.status = ResolveStatus::Stale;
    data::TaskList *list = m_collection.find(entry->listName);
    data::Task *task = list ? list->find(entry->filename) : nullptr;
    if (!task) {
        qCDebug(lcCore) << "Stale id" << id << "->" << entry->listName << entry->filename;
        if (errorMessage) {
            *errorMessage = QStringLiteral("Task %1 (%2/%3) no longer exists; run `todo list` to refresh ids")
                                .arg(id)
                                .arg(entry->listName, entry->filename);
        }
        return result;
    }

    result.status = ResolveStatus::Found;
    result.list = list;
    result.task = task;
    return result;
}

} // namespace core
} // namespace todo
