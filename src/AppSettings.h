#pragma once

#include <QString>

namespace AppSettings {

QString libraryRoot();
void setLibraryRoot(const QString &path);
QString paneFolder(const QString &settingsKey);
void setPaneFolder(const QString &settingsKey, const QString &path);

} // namespace AppSettings
