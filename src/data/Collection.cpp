#include "todo/data/Collection.hpp"

#include <QDir>
#include <QFileInfo>

#include "todo/core/Logging.hpp"

namespace todo {
namespace data {

namespace {
bool hasWildcard(const QString &segment)
{
    return segment.contains('*') || segment.contains('?') || segment.contains('[');
}

QString expandHome(const QString &pattern)
{
    if (pattern == QLatin1String("~")) {
        return QDir::homePath();
    }
    if (pattern.startsWith(QLatin1String("~/"))) {
        return QDir::homePath() + pattern.mid(1);
    }
    return pattern;
}
} // namespace

Collection::Collection() = default;
Collection::~Collection() = default;

QStringList Collection::expandPattern(const QString &pattern)
{
    const QString expanded = expandHome(pattern);
    if (expanded.isEmpty()) {
        return {};
    }

    const bool absolute = QDir::isAbsolutePath(expanded);
    QStringList candidates{ absolute ? QStringLiteral("/") : QString() };

    const QStringList segments = expanded.split('/', Qt::SkipEmptyParts);
    for (const QString &segment : segments) {
        QStringList next;
        for (const QString &base : candidates) {
            const QDir baseDir(base.isEmpty() ? QStringLiteral(".") : base);
            auto join = [&base](const QString &entry) {
                if (base.isEmpty()) {
                    return entry;
                }
                return base.endsWith('/') ? base + entry : base + '/' + entry;
            };

            if (!hasWildcard(segment)) {
                if (segment == QLatin1String(".") || segment == QLatin1String("..")
                    || baseDir.exists(segment)) {
                    next << join(segment);
                }
                continue;
            }

            QDir::Filters filters = QDir::AllEntries | QDir::NoDotAndDotDot;
            if (segment.startsWith('.')) {
                filters |= QDir::Hidden;
            }
            const QStringList entries = baseDir.entryList({ segment }, filters, QDir::Name);
            for (const QString &entry : entries) {
                next << join(entry);
            }
        }
        candidates = next;
        if (candidates.isEmpty()) {
            break;
        }
    }

    return candidates;
}

std::unique_ptr<Collection> Collection::discover(const QString &pattern, QString *errorMessage)
{
    if (pattern.trimmed().isEmpty()) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("No path pattern configured for task lists");
        }
        return nullptr;
    }

    auto collection = std::make_unique<Collection>();
    const QStringList matches = expandPattern(pattern);
    for (const QString &path : matches) {
        if (!QFileInfo(path).isDir()) {
            continue;
        }
        auto list = std::make_unique<TaskList>(path);
        if (!list->load(errorMessage)) {
            return nullptr;
        }
        if (!collection->addList(std::move(list), errorMessage)) {
            return nullptr;
        }
    }
    qCDebug(lcData) << "Discovered lists" << collection->names() << "for pattern" << pattern;
    return collection;
}

bool Collection::addList(std::unique_ptr<TaskList> list, QString *errorMessage)
{
    if (!list) {
        return false;
    }
    const QString name = list->name();
    auto it = m_lists.find(name);
    if (it != m_lists.end()) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Detected two lists named %1 (%2 and %3)")
                                .arg(name, it->second->directory(), list->directory());
        }
        return false;
    }
    m_lists.emplace(name, std::move(list));
    return true;
}

TaskList *Collection::find(const QString &name) const
{
    auto it = m_lists.find(name);
    if (it == m_lists.end()) {
        return nullptr;
    }
    return it->second.get();
}

QStringList Collection::names() const
{
    QStringList result;
    for (const auto &entry : m_lists) {
        result << entry.first;
    }
    return result;
}

bool Collection::isEmpty() const
{
    return m_lists.empty();
}

} // namespace data
} // namespace todo
