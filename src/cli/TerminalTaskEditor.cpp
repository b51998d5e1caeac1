#include "todo/cli/TerminalTaskEditor.hpp"

#include <QDateTime>

#include "todo/core/DateParser.hpp"
#include "todo/core/TaskFormatter.hpp"

namespace todo {
namespace cli {

namespace {
const QString CLEAR_VALUE = QStringLiteral("-");
}

TerminalTaskEditor::TerminalTaskEditor(QTextStream &in, QTextStream &out, const core::DateParser &dateParser,
                                       const core::TaskFormatter &formatter)
    : m_in(in)
    , m_out(out)
    , m_dateParser(dateParser)
    , m_formatter(formatter)
{
}

bool TerminalTaskEditor::edit(data::Task &task, const QStringList &availableLists)
{
    data::Task draft = task;

    m_out << "Editing task. Enter keeps a value, \"-\" clears it, end of input cancels.\n";
    if (!availableLists.isEmpty()) {
        m_out << "Lists: " << availableLists.join(QStringLiteral(", ")) << '\n';
    }

    if (!promptText(QStringLiteral("Summary"), &draft.summary)) {
        return false;
    }
    if (!promptText(QStringLiteral("Description"), &draft.description)) {
        return false;
    }
    if (!promptText(QStringLiteral("Location"), &draft.location)) {
        return false;
    }
    if (!promptDue(&draft)) {
        return false;
    }

    bool completed = draft.completed;
    if (!promptYesNo(QStringLiteral("Completed"), draft.completed, &completed)) {
        return false;
    }
    draft.setCompleted(completed, QDateTime::currentDateTime());

    bool save = false;
    if (!promptYesNo(QStringLiteral("Save"), true, &save) || !save) {
        return false;
    }

    task = std::move(draft);
    return true;
}

bool TerminalTaskEditor::prompt(const QString &label, const QString &current, QString *answer)
{
    m_out << label;
    if (!current.isEmpty()) {
        m_out << " [" << current << ']';
    }
    m_out << ": ";
    m_out.flush();

    const QString line = m_in.readLine();
    if (line.isNull()) {
        m_out << '\n';
        return false;
    }
    *answer = line.trimmed();
    return true;
}

bool TerminalTaskEditor::promptText(const QString &label, QString *value)
{
    QString answer;
    if (!prompt(label, value->simplified(), &answer)) {
        return false;
    }
    if (answer == CLEAR_VALUE) {
        value->clear();
    } else if (!answer.isEmpty()) {
        *value = answer;
    }
    return true;
}

bool TerminalTaskEditor::promptDue(data::Task *task)
{
    const QString current = task->due.isValid() ? m_formatter.formatDate(task->due) : task->rawDue;
    while (true) {
        QString answer;
        if (!prompt(QStringLiteral("Due"), current, &answer)) {
            return false;
        }
        if (answer.isEmpty()) {
            return true;
        }
        if (answer == CLEAR_VALUE) {
            task->due = QDateTime();
            task->rawDue.clear();
            return true;
        }

        QDateTime due;
        QString error;
        if (m_dateParser.parse(answer, QDateTime::currentDateTime(), &due, &error)) {
            task->due = due;
            task->rawDue.clear();
            return true;
        }
        m_out << error << '\n';
    }
}

bool TerminalTaskEditor::promptYesNo(const QString &label, bool defaultValue, bool *answer)
{
    const QString choices = defaultValue ? QStringLiteral("Y/n") : QStringLiteral("y/N");
    while (true) {
        QString reply;
        if (!prompt(label, choices, &reply)) {
            return false;
        }
        const QString normalized = reply.toLower();
        if (normalized.isEmpty()) {
            *answer = defaultValue;
            return true;
        }
        if (normalized == QLatin1String("y") || normalized == QLatin1String("yes")) {
            *answer = true;
            return true;
        }
        if (normalized == QLatin1String("n") || normalized == QLatin1String("no")) {
            *answer = false;
            return true;
        }
    }
}

} // namespace cli
} // namespace todo
