#include "todo/core/Config.hpp"

#include <QDir>
#include <QFileInfo>
#include <QSettings>
#include <QStandardPaths>
#include <QVariant>

#include "todo/core/Logging.hpp"
#include "todo/data/IdIndex.hpp"

namespace todo {
namespace core {

namespace {
// QSettings splits unquoted values on commas.
QString stringValue(const QSettings &settings, const QString &key)
{
    const QVariant value = settings.value(key);
    if (value.type() == QVariant::StringList) {
        return value.toStringList().join(QStringLiteral(", "));
    }
    return value.toString();
}
} // namespace

QString Config::locate(const QString &explicitPath)
{
    if (!explicitPath.isEmpty()) {
        return explicitPath;
    }
    const QString fromEnvironment = qEnvironmentVariable("TODO_CONFIG");
    if (!fromEnvironment.isEmpty()) {
        return fromEnvironment;
    }
    QString configFolder = QStandardPaths::writableLocation(QStandardPaths::GenericConfigLocation);
    if (configFolder.isEmpty()) {
        configFolder = QDir::homePath() + QStringLiteral("/.config");
    }
    return configFolder + QStringLiteral("/todo/config.ini");
}

std::optional<Config> Config::load(const QString &filePath, QString *errorMessage)
{
    if (!QFileInfo::exists(filePath)) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("No configuration file found at %1").arg(filePath);
        }
        return std::nullopt;
    }

    QSettings settings(filePath, QSettings::IniFormat);
    if (settings.status() != QSettings::NoError) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Cannot parse configuration file %1").arg(filePath);
        }
        return std::nullopt;
    }

    Config config;
    config.path = stringValue(settings, QStringLiteral("main/path")).trimmed();
    if (config.path.isEmpty()) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("%1: missing required setting main/path").arg(filePath);
        }
        return std::nullopt;
    }

    const QString dateFormat = stringValue(settings, QStringLiteral("main/date_format"));
    if (!dateFormat.isEmpty()) {
        config.dateFormat = dateFormat;
    }

    config.cachePath = stringValue(settings, QStringLiteral("main/cache_path"));
    if (config.cachePath.isEmpty()) {
        config.cachePath = data::IdIndex::defaultPath();
    } else if (config.cachePath.startsWith(QLatin1String("~/"))) {
        config.cachePath = QDir::homePath() + config.cachePath.mid(1);
    }

    qCDebug(lcCore) << "Loaded configuration from" << filePath << "path pattern" << config.path;
    return config;
}

} // namespace core
} // namespace todo
