#pragma once

#include <QMap>
#include <QString>
#include <optional>

namespace todo {
namespace data {

struct IdEntry
{
    QString listName;
    QString filename;
};

// Maps the positions printed by the last listing to the tasks behind them.
class IdIndex
{
public:
    static constexpr int FORMAT_VERSION = 1;

    static QString defaultPath();

    // A missing file yields an empty index.
    static bool load(const QString &filePath, IdIndex *index, QString *errorMessage);
    bool save(const QString &filePath, QString *errorMessage) const;

    void insert(int id, IdEntry entry);
    std::optional<IdEntry> entry(int id) const;
    int size() const;
    bool isEmpty() const;

private:
    QMap<int, IdEntry> m_entries;
};

} // namespace data
} // namespace todo
