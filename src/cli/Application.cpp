#include "todo/cli/Application.hpp"

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDateTime>

#include "todo/cli/Commands.hpp"
#include "todo/cli/TerminalTaskEditor.hpp"
#include "todo/core/Config.hpp"
#include "todo/core/DateParser.hpp"
#include "todo/core/Logging.hpp"
#include "todo/core/TaskFormatter.hpp"
#include "todo/data/Collection.hpp"

namespace todo {
namespace cli {

namespace {
const QString DEFAULT_COMMAND = QStringLiteral("list");

enum class ParseResult
{
    Ok,
    Help,
    Error,
};

ParseResult parseSubcommand(QCommandLineParser &parser, const QString &name, const QStringList &arguments,
                            QString *errorMessage)
{
    const QCommandLineOption helpOption = parser.addHelpOption();
    if (!parser.parse(QStringList{ name } + arguments)) {
        *errorMessage = parser.errorText();
        return ParseResult::Error;
    }
    if (parser.isSet(helpOption)) {
        return ParseResult::Help;
    }
    return ParseResult::Ok;
}
} // namespace

Application::Application(QTextStream &in, QTextStream &out, QTextStream &err)
    : m_in(in)
    , m_out(out)
    , m_err(err)
{
}

const std::vector<Application::Command> &Application::commands()
{
    static const std::vector<Command> table = {
        { QStringLiteral("new"), QStringLiteral("Create a new task"),
          [](Application &app, const QStringList &arguments) { return app.runNew(arguments); } },
        { QStringLiteral("edit"), QStringLiteral("Edit a task interactively"),
          [](Application &app, const QStringList &arguments) { return app.runEdit(arguments); } },
        { QStringLiteral("show"), QStringLiteral("Show details about a task"),
          [](Application &app, const QStringList &arguments) { return app.runShow(arguments); } },
        { QStringLiteral("done"), QStringLiteral("Mark one or more tasks as done"),
          [](Application &app, const QStringList &arguments) { return app.runDone(arguments); } },
        { QStringLiteral("list"), QStringLiteral("List unfinished and recently finished tasks (default)"),
          [](Application &app, const QStringList &arguments) { return app.runList(arguments); } },
    };
    return table;
}

const Application::Command *Application::findCommand(const QString &name)
{
    for (const Command &command : commands()) {
        if (command.name == name) {
            return &command;
        }
    }
    return nullptr;
}

QString Application::commandsHelp() const
{
    QStringList lines{ QStringLiteral("One of:") };
    for (const Command &command : commands()) {
        lines << QStringLiteral("  %1  %2").arg(command.name, -5).arg(command.description);
    }
    return lines.join(QLatin1Char('\n'));
}

int Application::usageError(const QString &message)
{
    m_err << "Error: " << message << '\n';
    m_err.flush();
    return UsageError;
}

int Application::configurationError(const QString &message)
{
    m_err << "Error: " << message << '\n';
    m_err.flush();
    return Failure;
}

int Application::run(const QStringList &arguments)
{
    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Manage tasks stored as iCalendar files in one or more lists."));
    parser.setOptionsAfterPositionalArgumentsMode(QCommandLineParser::ParseAsPositionalArguments);
    const QCommandLineOption helpOption = parser.addHelpOption();
    const QCommandLineOption versionOption = parser.addVersionOption();
    const QCommandLineOption humanTimeOption(
        QStringLiteral("human-time"),
        QStringLiteral("Accept informal descriptions such as \"tomorrow\" instead of a properly formatted date "
                       "(default)."));
    const QCommandLineOption noHumanTimeOption(QStringLiteral("no-human-time"),
                                               QStringLiteral("Only accept dates in the configured format."));
    const QCommandLineOption configOption({ QStringLiteral("c"), QStringLiteral("config") },
                                          QStringLiteral("Read the configuration from <file>."),
                                          QStringLiteral("file"));
    parser.addOption(humanTimeOption);
    parser.addOption(noHumanTimeOption);
    parser.addOption(configOption);
    parser.addPositionalArgument(QStringLiteral("command"), commandsHelp(), QStringLiteral("[command]"));

    if (!parser.parse(arguments)) {
        return usageError(parser.errorText());
    }
    if (parser.isSet(helpOption)) {
        m_out << parser.helpText();
        m_out.flush();
        return Success;
    }
    if (parser.isSet(versionOption)) {
        m_out << QCoreApplication::applicationName() << ' ' << QCoreApplication::applicationVersion() << '\n';
        m_out.flush();
        return Success;
    }

    QStringList positional = parser.positionalArguments();
    const QString commandName = positional.isEmpty() ? DEFAULT_COMMAND : positional.takeFirst();
    const Command *command = findCommand(commandName);
    if (!command) {
        return usageError(QStringLiteral("No such command \"%1\"").arg(commandName));
    }

    m_configOverride = parser.value(configOption);
    m_humanTime = !parser.isSet(noHumanTimeOption);

    qCDebug(lcCli) << "Running" << commandName << positional;
    const int exitCode = command->handler(*this, positional);
    m_out.flush();
    m_err.flush();
    return exitCode;
}

int Application::execute(const std::function<int(CommandContext &)> &action)
{
    QString error;
    const QString configPath = core::Config::locate(m_configOverride);
    const auto config = core::Config::load(configPath, &error);
    if (!config) {
        return configurationError(error);
    }
    const auto collection = data::Collection::discover(config->path, &error);
    if (!collection) {
        return configurationError(error);
    }

    const core::TaskFormatter formatter(config->dateFormat);
    const core::DateParser dateParser(config->dateFormat, m_humanTime);
    TerminalTaskEditor editor(m_in, m_out, dateParser, formatter);
    CommandContext context{ *collection, formatter, dateParser, editor, config->cachePath,
                            m_out,       m_err,     QDateTime::currentDateTime() };
    return action(context);
}

int Application::runNew(const QStringList &arguments)
{
    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Create a new task with SUMMARY."));
    const QCommandLineOption listOption({ QStringLiteral("l"), QStringLiteral("list") },
                                        QStringLiteral("The list to create the task in."), QStringLiteral("name"));
    const QCommandLineOption dueOption(
        { QStringLiteral("d"), QStringLiteral("due") },
        QStringLiteral("The due date of the task, in the format specified in the configuration file."),
        QStringLiteral("date"));
    const QCommandLineOption interactiveOption({ QStringLiteral("i"), QStringLiteral("interactive") },
                                               QStringLiteral("Go into interactive mode before saving the task."));
    parser.addOption(listOption);
    parser.addOption(dueOption);
    parser.addOption(interactiveOption);
    parser.addPositionalArgument(QStringLiteral("summary"), QStringLiteral("Summary of the task."),
                                 QStringLiteral("new [summary...]"));

    QString error;
    switch (parseSubcommand(parser, QStringLiteral("new"), arguments, &error)) {
    case ParseResult::Error:
        return usageError(error);
    case ParseResult::Help:
        m_out << parser.helpText();
        return Success;
    case ParseResult::Ok:
        break;
    }

    NewTaskOptions options;
    options.summary = parser.positionalArguments();
    options.listName = parser.value(listOption);
    options.due = parser.value(dueOption);
    options.interactive = parser.isSet(interactiveOption);
    return execute([&options](CommandContext &context) { return Commands::newTask(context, options); });
}

int Application::runShow(const QStringList &arguments)
{
    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Show details about a task."));
    parser.addPositionalArgument(QStringLiteral("id"), QStringLiteral("Id from the last listing."),
                                 QStringLiteral("show <id>"));

    QString error;
    switch (parseSubcommand(parser, QStringLiteral("show"), arguments, &error)) {
    case ParseResult::Error:
        return usageError(error);
    case ParseResult::Help:
        m_out << parser.helpText();
        return Success;
    case ParseResult::Ok:
        break;
    }

    QVector<int> ids;
    if (parser.positionalArguments().size() != 1) {
        return usageError(QStringLiteral("show expects exactly one ID"));
    }
    if (!Commands::parseIds(parser.positionalArguments(), &ids, &error)) {
        return usageError(error);
    }
    return execute([&ids](CommandContext &context) { return Commands::show(context, ids.front()); });
}

int Application::runEdit(const QStringList &arguments)
{
    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Edit a task interactively."));
    parser.addPositionalArgument(QStringLiteral("id"), QStringLiteral("Id from the last listing."),
                                 QStringLiteral("edit <id>"));

    QString error;
    switch (parseSubcommand(parser, QStringLiteral("edit"), arguments, &error)) {
    case ParseResult::Error:
        return usageError(error);
    case ParseResult::Help:
        m_out << parser.helpText();
        return Success;
    case ParseResult::Ok:
        break;
    }

    QVector<int> ids;
    if (parser.positionalArguments().size() != 1) {
        return usageError(QStringLiteral("edit expects exactly one ID"));
    }
    if (!Commands::parseIds(parser.positionalArguments(), &ids, &error)) {
        return usageError(error);
    }
    return execute([&ids](CommandContext &context) { return Commands::edit(context, ids.front()); });
}

int Application::runDone(const QStringList &arguments)
{
    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Mark tasks as done."));
    parser.addPositionalArgument(QStringLiteral("ids"), QStringLiteral("Ids from the last listing."),
                                 QStringLiteral("done <id>..."));

    QString error;
    switch (parseSubcommand(parser, QStringLiteral("done"), arguments, &error)) {
    case ParseResult::Error:
        return usageError(error);
    case ParseResult::Help:
        m_out << parser.helpText();
        return Success;
    case ParseResult::Ok:
        break;
    }

    QVector<int> ids;
    if (parser.positionalArguments().isEmpty()) {
        return usageError(QStringLiteral("done expects at least one ID"));
    }
    if (!Commands::parseIds(parser.positionalArguments(), &ids, &error)) {
        return usageError(error);
    }
    return execute([&ids](CommandContext &context) { return Commands::done(context, ids); });
}

int Application::runList(const QStringList &arguments)
{
    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral(
        "List unfinished tasks.\n\n"
        "  - `todo list` shows all unfinished tasks from all lists.\n"
        "  - `todo list work` shows all unfinished tasks from the list `work`."));
    parser.addPositionalArgument(QStringLiteral("lists"), QStringLiteral("Lists to show."),
                                 QStringLiteral("list [lists...]"));

    QString error;
    switch (parseSubcommand(parser, QStringLiteral("list"), arguments, &error)) {
    case ParseResult::Error:
        return usageError(error);
    case ParseResult::Help:
        m_out << parser.helpText();
        return Success;
    case ParseResult::Ok:
        break;
    }

    const QStringList listNames = parser.positionalArguments();
    return execute([&listNames](CommandContext &context) { return Commands::list(context, listNames); });
}

} // namespace cli
} // namespace todo
