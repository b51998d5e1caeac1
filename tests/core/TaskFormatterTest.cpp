#include <QtTest/QtTest>

#include "TestSupport.hpp"
#include "todo/core/TaskFormatter.hpp"
#include "todo/data/TaskList.hpp"

using namespace todo;
using namespace todo::core;

class TaskFormatterTest : public QObject
{
    Q_OBJECT

private slots:
    void compactOpenTask();
    void compactCompletedTaskWithoutDue();
    void compactShowsTimeOfDay();
    void compactFailsOnMalformedDue();
    void detailedIncludesNotes();
};

void TaskFormatterTest::compactOpenTask()
{
    const TaskFormatter formatter(QStringLiteral("yyyy-MM-dd"));
    const data::TaskList list(QStringLiteral("/lists/work"));
    const data::Task task = test::makeTask(QStringLiteral("Buy\nmilk"), QDate(2026, 10, 20).startOfDay());

    QString line;
    QString error;
    QVERIFY(formatter.compact(task, list, &line, &error));
    QCOMPARE(line, QStringLiteral("[ ] 2026-10-20 Buy milk @work"));
}

void TaskFormatterTest::compactCompletedTaskWithoutDue()
{
    const TaskFormatter formatter(QStringLiteral("yyyy-MM-dd"));
    const data::TaskList list(QStringLiteral("/lists/home"));
    const data::Task task =
        test::makeCompletedTask(QStringLiteral("Fix the fence"), QDateTime(QDate(2026, 10, 16), QTime(10, 0)));

    QString line;
    QString error;
    QVERIFY(formatter.compact(task, list, &line, &error));
    QCOMPARE(line, QStringLiteral("[X] Fix the fence @home"));
}

void TaskFormatterTest::compactShowsTimeOfDay()
{
    const TaskFormatter formatter(QStringLiteral("dd.MM.yyyy"));
    const data::TaskList list(QStringLiteral("/lists/work"));
    const data::Task task =
        test::makeTask(QStringLiteral("Standup"), QDateTime(QDate(2026, 10, 20), QTime(9, 30)));

    QString line;
    QString error;
    QVERIFY(formatter.compact(task, list, &line, &error));
    QCOMPARE(line, QStringLiteral("[ ] 20.10.2026 09:30 Standup @work"));
}

void TaskFormatterTest::compactFailsOnMalformedDue()
{
    const TaskFormatter formatter(QStringLiteral("yyyy-MM-dd"));
    const data::TaskList list(QStringLiteral("/lists/work"));
    data::Task task = test::makeTask(QStringLiteral("Broken"));
    task.rawDue = QStringLiteral("soonish");

    QString line;
    QString error;
    QVERIFY(!formatter.compact(task, list, &line, &error));
    QCOMPARE(error, QStringLiteral("invalid due date \"soonish\""));
}

void TaskFormatterTest::detailedIncludesNotes()
{
    const TaskFormatter formatter(QStringLiteral("yyyy-MM-dd"));
    const data::TaskList list(QStringLiteral("/lists/home"));
    data::Task task = test::makeCompletedTask(QStringLiteral("Paint"), QDateTime(QDate(2026, 10, 16), QTime(10, 0)));
    task.description = QStringLiteral("Two coats");
    task.location = QStringLiteral("Garage");

    QCOMPARE(formatter.detailed(task, list),
             QStringLiteral("[X] Paint @home\n\nTwo coats\n\nLocation: Garage\nCompleted: 2026-10-16 10:00"));
}

QTEST_GUILESS_MAIN(TaskFormatterTest)
#include "TaskFormatterTest.moc"
