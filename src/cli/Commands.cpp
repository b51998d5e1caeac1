#include "todo/cli/Commands.hpp"

#include "todo/cli/TaskEditor.hpp"
#include "todo/core/DateParser.hpp"
#include "todo/core/Logging.hpp"
#include "todo/core/TaskFormatter.hpp"
#include "todo/core/TaskQuery.hpp"
#include "todo/core/TaskResolver.hpp"
#include "todo/data/Collection.hpp"
#include "todo/data/IdIndex.hpp"
#include "todo/data/TaskList.hpp"

namespace todo {
namespace cli {
namespace Commands {

namespace {
int fail(CommandContext &context, ExitCode code, const QString &message)
{
    context.err << "Error: " << message << '\n';
    context.err.flush();
    return code;
}

bool loadIndex(CommandContext &context, data::IdIndex *index)
{
    QString error;
    if (!data::IdIndex::load(context.idCachePath, index, &error)) {
        fail(context, Failure, error);
        return false;
    }
    return true;
}
} // namespace

bool parseIds(const QStringList &arguments, QVector<int> *ids, QString *errorMessage)
{
    ids->clear();
    for (const QString &argument : arguments) {
        bool ok = false;
        const int id = argument.toInt(&ok);
        if (!ok || id < 1) {
            if (errorMessage) {
                *errorMessage = QStringLiteral("Invalid value for ID: \"%1\" is not a positive integer").arg(argument);
            }
            return false;
        }
        ids->append(id);
    }
    return true;
}

int newTask(CommandContext &context, const NewTaskOptions &options)
{
    if (options.listName.isEmpty()) {
        return fail(context, UsageError, QStringLiteral("Missing option \"--list\""));
    }
    data::TaskList *list = context.collection.find(options.listName);
    if (!list) {
        return fail(context, UsageError,
                    QStringLiteral("Invalid value for \"--list\": %1. Available lists are: %2")
                        .arg(options.listName, context.collection.names().join(QStringLiteral(", "))));
    }

    data::Task task;
    task.summary = options.summary.join(QLatin1Char(' '));
    QString error;
    if (!context.dateParser.parse(options.due, context.now, &task.due, &error)) {
        return fail(context, UsageError, QStringLiteral("Invalid value for \"--due\": %1").arg(error));
    }

    if (options.interactive) {
        if (!context.editor.edit(task, context.collection.names())) {
            return fail(context, Cancelled, QStringLiteral("Aborted, task not saved"));
        }
        context.out << '\n';
    }

    if (task.summary.trimmed().isEmpty()) {
        return fail(context, UsageError, QStringLiteral("No SUMMARY specified"));
    }

    if (!list->save(task, &error)) {
        return fail(context, Failure, error);
    }
    context.out << context.formatter.detailed(task, *list) << '\n';
    return Success;
}

int show(CommandContext &context, int id)
{
    data::IdIndex index;
    if (!loadIndex(context, &index)) {
        return Failure;
    }
    QString error;
    const core::ResolvedTask resolved = core::TaskResolver(index, context.collection).resolve(id, &error);
    if (resolved.status != core::ResolveStatus::Found) {
        return fail(context, Failure, error);
    }
    context.out << context.formatter.detailed(*resolved.task, *resolved.list) << '\n';
    return Success;
}

int edit(CommandContext &context, int id)
{
    data::IdIndex index;
    if (!loadIndex(context, &index)) {
        return Failure;
    }
    QString error;
    const core::ResolvedTask resolved = core::TaskResolver(index, context.collection).resolve(id, &error);
    if (resolved.status != core::ResolveStatus::Found) {
        return fail(context, Failure, error);
    }

    data::Task task = *resolved.task;
    if (!context.editor.edit(task, context.collection.names())) {
        qCDebug(lcCli) << "Edit of task" << id << "cancelled";
        return Success;
    }
    if (!resolved.list->save(task, &error)) {
        return fail(context, Failure, error);
    }
    return Success;
}

int done(CommandContext &context, const QVector<int> &ids)
{
    data::IdIndex index;
    if (!loadIndex(context, &index)) {
        return Failure;
    }
    const core::TaskResolver resolver(index, context.collection);

    bool allResolved = true;
    for (int id : ids) {
        QString error;
        const core::ResolvedTask resolved = resolver.resolve(id, &error);
        if (resolved.status != core::ResolveStatus::Found) {
            fail(context, Failure, error);
            allResolved = false;
            continue;
        }
        data::Task task = *resolved.task;
        task.markCompleted(context.now);
        if (!resolved.list->save(task, &error)) {
            return fail(context, Failure, error);
        }
    }
    return allResolved ? Success : Failure;
}

int list(CommandContext &context, const QStringList &listNames)
{
    std::vector<data::TaskList *> lists;
    QString error;
    if (!core::TaskQuery::selectLists(context.collection, listNames, &lists, &error)) {
        return fail(context, UsageError, error);
    }

    const std::vector<core::ListedTask> rows = core::TaskQuery::collect(lists, context.now);
    data::IdIndex index;
    int position = 0;
    for (const core::ListedTask &row : rows) {
        ++position;
        index.insert(position, data::IdEntry{ row.list->name(), row.task->filename });

        QString line;
        QString renderError;
        if (context.formatter.compact(*row.task, *row.list, &line, &renderError)) {
            context.out << QStringLiteral("%1 %2").arg(position, 2).arg(line) << '\n';
        } else {
            context.out << QStringLiteral("Error while showing %1/%2: %3")
                               .arg(row.list->name(), row.task->filename, renderError)
                        << '\n';
        }
    }
    context.out.flush();

    if (!index.save(context.idCachePath, &error)) {
        return fail(context, Failure, error);
    }
    return Success;
}

} // namespace Commands
} // namespace cli
} // namespace todo
