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

#include "NameCodec.h"

#include <QFileInfo>

#include "Logging.h"
#include "OperationError.h"
#include "PlatformUtils.h"

namespace NameCodec {

namespace {

const QLatin1String marker("DISABLED_");
const QChar underscore = QLatin1Char('_');

QString trimUnderscores(const QString &name)
{
    int start = 0;
    int end = name.size();
    while (start < end && name.at(start) == underscore) {
        ++start;
    }
    while (end > start && name.at(end - 1) == underscore) {
        --end;
    }
    return name.mid(start, end - start);
}

} // namespace

QString disabledMarker()
{
    return QString(marker);
}

/**
 * @brief Checks whether a raw file name carries the disable marker.
 * @param rawName On-disk base name.
 * @return True if the name starts with "DISABLED_", ignoring case.
 */
bool isDisabled(const QString &rawName)
{
    return rawName.startsWith(marker, Qt::CaseInsensitive);
}

/**
 * @brief Returns the display name of an entry.
 * @param rawName On-disk base name.
 * @return Name without the disable marker and without boundary underscores.
 */
QString effectiveName(const QString &rawName)
{
    if (isDisabled(rawName)) {
        return trimUnderscores(rawName.mid(marker.size()));
    }
    return trimUnderscores(rawName);
}

/**
 * @brief Computes the raw name an entry gets when its state is toggled.
 * @param rawName On-disk base name.
 * @return Marked name for enabled entries, unmarked and trimmed name for
 *         disabled ones.
 */
QString toggledName(const QString &rawName)
{
    if (isDisabled(rawName)) {
        // Boundary underscores go too, even if the original name had them.
        return trimUnderscores(rawName.mid(marker.size()));
    }
    return marker + rawName;
}

/**
 * @brief Toggles the enabled state of a file or folder by renaming it.
 * @param path Path of the entry to toggle.
 * @param newPath Optional output path after the rename.
 * @param error Optional output error (RenameConflict or IOFailure).
 * @return True if the entry was renamed, false if nothing changed on disk.
 */
bool toggle(const QString &path, QString *newPath, OperationError *error)
{
    const QFileInfo info(path);
    const QString targetName = toggledName(info.fileName());
    QString renamedPath;
    if (!PlatformUtils::renamePath(path, targetName, &renamedPath, error)) {
        qCInfo(lcNames) << "toggle refused for" << path;
        return false;
    }
    qCDebug(lcNames) << "toggled" << path << "->" << renamedPath;
    if (newPath) {
        *newPath = renamedPath;
    }
    return true;
}

} // namespace NameCodec
