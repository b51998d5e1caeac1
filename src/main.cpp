#include <QCoreApplication>
#include <QString>
#include <QTextStream>

#include "version.h"

#include "todo/cli/Application.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication::setApplicationName(QStringLiteral("todo"));
    QCoreApplication::setApplicationVersion(QString::fromLatin1(kTodoVersion));

    QCoreApplication app(argc, argv);

    QTextStream in(stdin);
    QTextStream out(stdout);
    QTextStream err(stderr);

    todo::cli::Application application(in, out, err);
    return application.run(QCoreApplication::arguments());
}
