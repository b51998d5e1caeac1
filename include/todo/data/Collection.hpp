#pragma once

#include <QString>
#include <QStringList>
#include <map>
#include <memory>

#include "todo/data/TaskList.hpp"

namespace todo {
namespace data {

// All task lists matched by the configured path pattern, keyed by list name.
class Collection
{
public:
    Collection();
    ~Collection();

    static std::unique_ptr<Collection> discover(const QString &pattern, QString *errorMessage);
    static QStringList expandPattern(const QString &pattern);

    // Fails if another list already uses the same name.
    bool addList(std::unique_ptr<TaskList> list, QString *errorMessage);

    TaskList *find(const QString &name) const;
    QStringList names() const;
    bool isEmpty() const;

private:
    std::map<QString, std::unique_ptr<TaskList>> m_lists;
};

} // namespace data
} // namespace todo
