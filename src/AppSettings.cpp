/************************************************************************\

    Modman - Mod folder manager
    Copyright (C) 2026 Jango73

    This program is free software: you can redistribute it and/or modify
    it under the terms of the GNU General Public License as published by
    the Free Software Foundation, either version 3 of the License, or
    (at your option) any later version.

    This program is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
    GNU General Public License for more details.

    You should have received a copy of the GNU General Public License
    along with this program.  If not, see <https://www.gnu.org/licenses/>.

\************************************************************************/

#include "AppSettings.h"

#include <QSettings>

namespace AppSettings {

namespace {
constexpr char organizationName[] = "Modman";
constexpr char applicationName[] = "Modman";
constexpr char libraryGroup[] = "library";
constexpr char rootPathKey[] = "rootPath";
constexpr char panesGroup[] = "panes";
}

/**
 * @brief Returns the library folder stored by the last session.
 * @return Folder path, or an empty string when none was stored.
 */
QString libraryRoot()
{
    QSettings settings(QSettings::IniFormat, QSettings::UserScope, organizationName, applicationName);
    settings.beginGroup(QLatin1String(libraryGroup));
    return settings.value(QLatin1String(rootPathKey)).toString();
}

void setLibraryRoot(const QString &path)
{
    QSettings settings(QSettings::IniFormat, QSettings::UserScope, organizationName, applicationName);
    settings.beginGroup(QLatin1String(libraryGroup));
    settings.setValue(QLatin1String(rootPathKey), path);
}

QString paneFolder(const QString &settingsKey)
{
    if (settingsKey.isEmpty()) {
        return QString();
    }
    QSettings settings(QSettings::IniFormat, QSettings::UserScope, organizationName, applicationName);
    settings.beginGroup(QLatin1String(panesGroup));
    return settings.value(settingsKey).toString();
}

void setPaneFolder(const QString &settingsKey, const QString &path)
{
    if (settingsKey.isEmpty()) {
        return;
    }
    QSettings settings(QSettings::IniFormat, QSettings::UserScope, organizationName, applicationName);
    settings.beginGroup(QLatin1String(panesGroup));
    settings.setValue(settingsKey, path);
}

} // namespace AppSettings
