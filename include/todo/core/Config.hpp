#pragma once

#include <QString>
#include <optional>

namespace todo {
namespace core {

struct Config
{
    QString path;
    QString dateFormat = QStringLiteral("yyyy-MM-dd");
    QString cachePath;

    // --config beats $TODO_CONFIG beats the per-user default.
    static QString locate(const QString &explicitPath);
    static std::optional<Config> load(const QString &filePath, QString *errorMessage);
};

} // namespace core
} // namespace todo
