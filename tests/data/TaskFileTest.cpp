#include <QtTest/QtTest>

#include "TestSupport.hpp"
#include "todo/data/TaskFile.hpp"

using namespace todo;
using namespace todo::data;

class TaskFileTest : public QObject
{
    Q_OBJECT

private slots:
    void writeAndRead();
    void readsForeignFile();
    void preservesUnknownProperties();
    void keepsUnparsableDue();
    void rejectsFileWithoutTodo();
    void foldsWithoutSplittingCharacters_data();
    void foldsWithoutSplittingCharacters();
};

void TaskFileTest::writeAndRead()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());

    Task task;
    task.uid = QStringLiteral("abc-123");
    task.summary = QStringLiteral("Buy milk, eggs; bread");
    task.description = QStringLiteral("Line one\nLine two");
    task.due = QDateTime(QDate(2026, 10, 20), QTime(14, 30), Qt::UTC);
    task.completed = true;
    task.completedAt = QDateTime(QDate(2026, 10, 18), QTime(9, 0), Qt::UTC);

    const QString path = dir.filePath(QStringLiteral("abc-123.ics"));
    QString error;
    QVERIFY2(TaskFile::write(path, task, &error), qPrintable(error));

    Task loaded;
    QVERIFY2(TaskFile::read(path, &loaded, &error), qPrintable(error));
    QCOMPARE(loaded.filename, QStringLiteral("abc-123.ics"));
    QCOMPARE(loaded.uid, task.uid);
    QCOMPARE(loaded.summary, task.summary);
    QCOMPARE(loaded.description, task.description);
    QCOMPARE(loaded.due, task.due);
    QVERIFY(loaded.completed);
    QCOMPARE(loaded.completedAt, task.completedAt);
}

void TaskFileTest::readsForeignFile()
{
    QTemporaryDir dir;
    const QString path = dir.filePath(QStringLiteral("foreign.ics"));
    QVERIFY(test::writeFile(path,
                            "BEGIN:VCALENDAR\r\n"
                            "VERSION:2.0\r\n"
                            "PRODID:-//Other Client//EN\r\n"
                            "BEGIN:VTODO\r\n"
                            "UID:foreign-1\r\n"
                            "SUMMARY:A rather long summary that a client decided\r\n"
                            "  to fold\r\n"
                            "DUE;VALUE=DATE:20261101\r\n"
                            "STATUS:NEEDS-ACTION\r\n"
                            "END:VTODO\r\n"
                            "END:VCALENDAR\r\n"));

    Task task;
    QString error;
    QVERIFY2(TaskFile::read(path, &task, &error), qPrintable(error));
    QCOMPARE(task.uid, QStringLiteral("foreign-1"));
    QCOMPARE(task.summary, QStringLiteral("A rather long summary that a client decided to fold"));
    QCOMPARE(task.due, QDate(2026, 11, 1).startOfDay());
    QVERIFY(!task.completed);
    QVERIFY(!task.completedAt.isValid());
}

void TaskFileTest::preservesUnknownProperties()
{
    QTemporaryDir dir;
    const QString path = dir.filePath(QStringLiteral("extra.ics"));
    QVERIFY(test::writeFile(path,
                            "BEGIN:VCALENDAR\n"
                            "BEGIN:VTODO\n"
                            "UID:extra-1\n"
                            "SUMMARY:Call plumber\n"
                            "PRIORITY:5\n"
                            "X-CLIENT-COLOR:#ff0000\n"
                            "BEGIN:VALARM\n"
                            "ACTION:DISPLAY\n"
                            "TRIGGER:-PT15M\n"
                            "END:VALARM\n"
                            "END:VTODO\n"
                            "END:VCALENDAR\n"));

    Task task;
    QString error;
    QVERIFY(TaskFile::read(path, &task, &error));
    QCOMPARE(task.extraProperties,
             QStringList({ QStringLiteral("PRIORITY:5"), QStringLiteral("X-CLIENT-COLOR:#ff0000"),
                           QStringLiteral("BEGIN:VALARM"), QStringLiteral("ACTION:DISPLAY"),
                           QStringLiteral("TRIGGER:-PT15M"), QStringLiteral("END:VALARM") }));

    task.summary = QStringLiteral("Call the plumber");
    QVERIFY(TaskFile::write(path, task, &error));

    Task reloaded;
    QVERIFY(TaskFile::read(path, &reloaded, &error));
    QCOMPARE(reloaded.summary, QStringLiteral("Call the plumber"));
    QCOMPARE(reloaded.extraProperties, task.extraProperties);
}

void TaskFileTest::keepsUnparsableDue()
{
    QTemporaryDir dir;
    const QString path = dir.filePath(QStringLiteral("bad-due.ics"));
    QVERIFY(test::writeFile(path,
                            "BEGIN:VCALENDAR\n"
                            "BEGIN:VTODO\n"
                            "UID:bad-due\n"
                            "SUMMARY:Broken\n"
                            "DUE:next-ish\n"
                            "END:VTODO\n"
                            "END:VCALENDAR\n"));

    Task task;
    QString error;
    QVERIFY(TaskFile::read(path, &task, &error));
    QVERIFY(!task.due.isValid());
    QCOMPARE(task.rawDue, QStringLiteral("next-ish"));
}

void TaskFileTest::rejectsFileWithoutTodo()
{
    QTemporaryDir dir;
    const QString path = dir.filePath(QStringLiteral("event.ics"));
    QVERIFY(test::writeFile(path,
                            "BEGIN:VCALENDAR\n"
                            "BEGIN:VEVENT\n"
                            "UID:event-1\n"
                            "SUMMARY:Meeting\n"
                            "END:VEVENT\n"
                            "END:VCALENDAR\n"));

    Task task;
    QString error;
    QVERIFY(!TaskFile::read(path, &task, &error));
    QVERIFY(error.contains(QStringLiteral("VTODO")));
}

void TaskFileTest::foldsWithoutSplittingCharacters_data()
{
    QTest::addColumn<QString>("summary");

    // The emoji's surrogate pair sits on UTF-16 units 73 and 74 of the SUMMARY line.
    QTest::newRow("emoji at fold") << QString(65, QLatin1Char('a')) + QString::fromUtf8("\xF0\x9F\x98\x80 tail");
    QTest::newRow("multi-byte run") << QString(120, QChar(0x00E9)) + QString(60, QChar(0x4E2D));
    QTest::newRow("emoji run") << QString::fromUtf8("\xF0\x9F\x8C\xB1").repeated(50);
}

void TaskFileTest::foldsWithoutSplittingCharacters()
{
    QFETCH(QString, summary);

    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("unicode.ics"));

    Task task;
    task.uid = QStringLiteral("unicode");
    task.summary = summary;
    QString error;
    QVERIFY2(TaskFile::write(path, task, &error), qPrintable(error));

    QFile file(path);
    QVERIFY(file.open(QIODevice::ReadOnly));
    const QList<QByteArray> lines = file.readAll().split('\n');
    for (const QByteArray &line : lines) {
        QVERIFY2(line.size() <= 75, line.constData());
    }

    Task loaded;
    QVERIFY2(TaskFile::read(path, &loaded, &error), qPrintable(error));
    QCOMPARE(loaded.summary, summary);
}

QTEST_GUILESS_MAIN(TaskFileTest)
#include "TaskFileTest.moc"
