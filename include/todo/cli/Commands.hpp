#pragma once

#include <QDateTime>
#include <QString>
#include <QStringList>
#include <QTextStream>
#include <QVector>

namespace todo {
namespace core {
class DateParser;
class TaskFormatter;
}
namespace data {
class Collection;
}

namespace cli {

class TaskEditor;

enum ExitCode
{
    Success = 0,
    Failure = 1,
    UsageError = 2,
    Cancelled = 3,
};

struct CommandContext
{
    data::Collection &collection;
    const core::TaskFormatter &formatter;
    const core::DateParser &dateParser;
    TaskEditor &editor;
    QString idCachePath;
    QTextStream &out;
    QTextStream &err;
    QDateTime now;
};

struct NewTaskOptions
{
    QStringList summary;
    QString listName;
    QString due;
    bool interactive = false;
};

namespace Commands {

bool parseIds(const QStringList &arguments, QVector<int> *ids, QString *errorMessage);

int newTask(CommandContext &context, const NewTaskOptions &options);
int show(CommandContext &context, int id);
int edit(CommandContext &context, int id);
int done(CommandContext &context, const QVector<int> &ids);
int list(CommandContext &context, const QStringList &listNames);

} // namespace Commands
} // namespace cli
} // namespace todo
