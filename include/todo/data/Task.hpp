#pragma once

#include <QDateTime>
#include <QString>
#include <QStringList>

namespace todo {
namespace data {

struct Task
{
    QString filename;
    QString uid;
    QString summary;
    QString description;
    QString location;
    QDateTime due;
    // Undecodable DUE value as found on disk; due stays invalid.
    QString rawDue;
    bool completed = false;
    QDateTime completedAt;
    QStringList extraProperties;

    // Keeps an existing completion time; a completed task without one gets now.
    void markCompleted(const QDateTime &now);
    void setCompleted(bool value, const QDateTime &now);
};

} // namespace data
} // namespace todo
