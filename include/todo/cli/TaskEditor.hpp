#pragma once

#include <QStringList>

#include "todo/data/Task.hpp"

namespace todo {
namespace cli {

class TaskEditor
{
public:
    virtual ~TaskEditor() = default;

    // Blocks until the user finishes. Returns false when the edit was cancelled,
    // in which case the task is left untouched.
    virtual bool edit(data::Task &task, const QStringList &availableLists) = 0;
};

} // namespace cli
} // namespace todo
