#pragma once

#include <QTextStream>

#include "todo/cli/TaskEditor.hpp"

namespace todo {
namespace core {
class DateParser;
class TaskFormatter;
}

namespace cli {

// Line-oriented form on the terminal: one prompt per field, current value as default.
class TerminalTaskEditor : public TaskEditor
{
public:
    TerminalTaskEditor(QTextStream &in, QTextStream &out, const core::DateParser &dateParser,
                       const core::TaskFormatter &formatter);
    ~TerminalTaskEditor() override = default;

    bool edit(data::Task &task, const QStringList &availableLists) override;

private:
    bool prompt(const QString &label, const QString &current, QString *answer);
    bool promptText(const QString &label, QString *value);
    bool promptDue(data::Task *task);
    bool promptYesNo(const QString &label, bool defaultValue, bool *answer);

    QTextStream &m_in;
    QTextStream &m_out;
    const core::DateParser &m_dateParser;
    const core::TaskFormatter &m_formatter;
};

} // namespace cli
} // namespace todo
