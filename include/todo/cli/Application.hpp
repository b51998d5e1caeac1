#pragma once

#include <QString>
#include <QStringList>
#include <QTextStream>
#include <functional>
#include <vector>

namespace todo {
namespace cli {

struct CommandContext;

class Application
{
public:
    Application(QTextStream &in, QTextStream &out, QTextStream &err);

    // arguments[0] is the program name, as in QCoreApplication::arguments().
    int run(const QStringList &arguments);

private:
    struct Command
    {
        QString name;
        QString description;
        std::function<int(Application &, const QStringList &)> handler;
    };

    static const std::vector<Command> &commands();
    static const Command *findCommand(const QString &name);

    int runNew(const QStringList &arguments);
    int runShow(const QStringList &arguments);
    int runEdit(const QStringList &arguments);
    int runDone(const QStringList &arguments);
    int runList(const QStringList &arguments);

    // Loads the configuration and the lists, then runs action against them.
    int execute(const std::function<int(CommandContext &)> &action);

    QString commandsHelp() const;
    int usageError(const QString &message);
    int configurationError(const QString &message);

    QTextStream &m_in;
    QTextStream &m_out;
    QTextStream &m_err;
    QString m_configOverride;
    bool m_humanTime = true;
};

} // namespace cli
} // namespace todo
