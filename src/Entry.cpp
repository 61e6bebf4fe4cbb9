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

#include "Entry.h"

#include <QFileInfo>

#include "NameCodec.h"

/**
 * @brief Materializes an entry from file information.
 * @param info File information, read as is.
 * @return Entry, invalid when the file does not exist.
 */
Entry Entry::fromFileInfo(const QFileInfo &info)
{
    Entry entry;
    if (!info.exists()) {
        return entry;
    }
    entry.path = info.absoluteFilePath();
    entry.rawName = info.fileName();
    entry.effectiveName = NameCodec::effectiveName(entry.rawName);
    entry.isDirectory = info.isDir();
    entry.isDisabled = NameCodec::isDisabled(entry.rawName);
    entry.size = info.isDir() ? 0 : info.size();
    entry.modifiedTime = info.lastModified();
    return entry;
}

/**
 * @brief Materializes an entry by querying the file system for a path.
 * @param path Path of the entry.
 * @return Entry, invalid when the path does not exist.
 */
Entry Entry::fromPath(const QString &path)
{
    if (path.isEmpty()) {
        return Entry();
    }
    return fromFileInfo(QFileInfo(path));
}
