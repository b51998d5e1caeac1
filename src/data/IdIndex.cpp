#include "todo/data/IdIndex.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QSaveFile>
#include <QStandardPaths>

#include "todo/core/Logging.hpp"

namespace todo {
namespace data {

namespace {
const QString KEY_VERSION = QStringLiteral("version");
const QString KEY_IDS = QStringLiteral("ids");
const QString KEY_ID = QStringLiteral("id");
const QString KEY_LIST = QStringLiteral("list");
const QString KEY_FILE = QStringLiteral("file");
} // namespace

QString IdIndex::defaultPath()
{
    QString cacheFolder = QStandardPaths::writableLocation(QStandardPaths::GenericCacheLocation);
    if (cacheFolder.isEmpty()) {
        cacheFolder = QDir::homePath() + QStringLiteral("/.cache");
    }
    return cacheFolder + QStringLiteral("/todo/ids.json");
}

bool IdIndex::load(const QString &filePath, IdIndex *index, QString *errorMessage)
{
    index->m_entries.clear();

    QFile file(filePath);
    if (!file.exists()) {
        return true;
    }
    if (!file.open(QIODevice::ReadOnly)) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Cannot read id cache %1: %2").arg(filePath, file.errorString());
        }
        return false;
    }

    QJsonParseError parseError;
    const QJsonDocument document = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !document.isObject()) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Corrupt id cache %1: %2").arg(filePath, parseError.errorString());
        }
        return false;
    }

    const QJsonObject root = document.object();
    const int version = root.value(KEY_VERSION).toInt(-1);
    if (version != FORMAT_VERSION) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Unsupported id cache version %1 in %2").arg(version).arg(filePath);
        }
        return false;
    }

    const QJsonArray ids = root.value(KEY_IDS).toArray();
    for (const QJsonValue &value : ids) {
        const QJsonObject object = value.toObject();
        const int id = object.value(KEY_ID).toInt(0);
        const QString listName = object.value(KEY_LIST).toString();
        const QString filename = object.value(KEY_FILE).toString();
        if (id <= 0 || listName.isEmpty() || filename.isEmpty()) {
            if (errorMessage) {
                *errorMessage = QStringLiteral("Corrupt id cache %1: malformed entry").arg(filePath);
            }
            return false;
        }
        index->m_entries.insert(id, IdEntry{ listName, filename });
    }
    return true;
}

bool IdIndex::save(const QString &filePath, QString *errorMessage) const
{
    QDir dir = QFileInfo(filePath).dir();
    if (!dir.exists() && !dir.mkpath(QStringLiteral("."))) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Cannot create directory %1").arg(dir.path());
        }
        return false;
    }

    QJsonArray ids;
    for (auto it = m_entries.constBegin(); it != m_entries.constEnd(); ++it) {
        QJsonObject object;
        object.insert(KEY_ID, it.key());
        object.insert(KEY_LIST, it.value().listName);
        object.insert(KEY_FILE, it.value().filename);
        ids.append(object);
    }
    QJsonObject root;
    root.insert(KEY_VERSION, FORMAT_VERSION);
    root.insert(KEY_IDS, ids);

    QSaveFile file(filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Cannot write id cache %1: %2").arg(filePath, file.errorString());
        }
        return false;
    }
    file.write(QJsonDocument(root).toJson(QJsonDocument::Compact));
    if (!file.commit()) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Cannot write id cache %1: %2").arg(filePath, file.errorString());
        }
        return false;
    }
    qCDebug(lcData) << "Wrote" << m_entries.size() << "ids to" << filePath;
    return true;
}

void IdIndex::insert(int id, IdEntry entry)
{
    m_entries.insert(id, std::move(entry));
}

std::optional<IdEntry> IdIndex::entry(int id) const
{
    auto it = m_entries.constFind(id);
    if (it == m_entries.constEnd()) {
        return std::nullopt;
    }
    return it.value();
}

int IdIndex::size() const
{
    return m_entries.size();
}

bool IdIndex::isEmpty() const
{
    return m_entries.isEmpty();
}

} // namespace data
} // namespace todo
