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

#include "PlatformUtils.h"

#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>

#include "Logging.h"
#include "OperationError.h"

namespace PlatformUtils {

namespace {

QString comparablePath(const QString &path)
{
    QString comparable = QDir::cleanPath(QDir::fromNativeSeparators(path));
#ifdef Q_OS_WIN
    comparable = comparable.toLower();
#endif
    return comparable;
}

} // namespace

/**
 * @brief Normalizes a path for use as a persistent key.
 * @param path Input path, relative paths resolve against the working folder.
 * @return Absolute path with "." and ".." resolved, using native separators.
 */
QString normalizePath(const QString &path)
{
    const QString trimmed = path.trimmed();
    if (trimmed.isEmpty()) {
        return QString();
    }
    QString normalized = QDir::fromNativeSeparators(trimmed);
    normalized = QDir::cleanPath(QDir(normalized).absolutePath());
#ifdef Q_OS_WIN
    normalized = normalized.toLower();
#endif
    return QDir::toNativeSeparators(normalized);
}

/**
 * @brief Checks whether a path equals a root folder or lies below it.
 * @param path Path to test.
 * @param rootPath Root folder. An empty root contains every path.
 * @return True if path is inside rootPath.
 */
bool isSameOrBelow(const QString &path, const QString &rootPath)
{
    if (rootPath.isEmpty()) {
        return true;
    }
    const QString candidate = comparablePath(path);
    const QString root = comparablePath(rootPath);
    if (candidate == root) {
        return true;
    }
    const QString prefix = root.endsWith(QLatin1Char('/')) ? root : root + QLatin1Char('/');
    return candidate.startsWith(prefix);
}

/**
 * @brief Renames a file or folder within its parent folder.
 * @param path Existing file or folder path.
 * @param newName New name without path separators.
 * @param newPath Optional output path for the renamed entry.
 * @param error Optional output error. RenameConflict when the target exists,
 *        IOFailure for every other failure.
 * @return True if rename succeeds, false otherwise.
 */
bool renamePath(const QString &path, const QString &newName, QString *newPath, OperationError *error)
{
    if (path.isEmpty()) {
        OperationError::report(error, OperationError::IOFailure, path,
                               QCoreApplication::translate("PlatformUtils", "Source not found"));
        return false;
    }
    if (newName.isEmpty()) {
        OperationError::report(error, OperationError::IOFailure, path,
                               QCoreApplication::translate("PlatformUtils", "Name cannot be empty"));
        return false;
    }

    const QChar forwardSlash = QLatin1Char('/');
    const QChar backSlash = QLatin1Char('\\');
    if (newName.contains(forwardSlash) || newName.contains(backSlash)) {
        OperationError::report(error, OperationError::IOFailure, path,
                               QCoreApplication::translate("PlatformUtils", "Name cannot contain path separators"));
        return false;
    }

    const QFileInfo info(path);
    if (!info.exists() && !info.isSymLink()) {
        OperationError::report(error, OperationError::IOFailure, path,
                               QCoreApplication::translate("PlatformUtils", "Source not found"));
        return false;
    }

    QDir parentDir = info.dir();
    const QString targetPath = parentDir.filePath(newName);
    if (QDir::cleanPath(targetPath) == QDir::cleanPath(info.absoluteFilePath())) {
        OperationError::report(error, OperationError::IOFailure, path,
                               QCoreApplication::translate("PlatformUtils", "Name unchanged"));
        return false;
    }
    if (QFileInfo::exists(targetPath)) {
        OperationError::report(error, OperationError::RenameConflict, path,
                               QCoreApplication::translate("PlatformUtils", "Target already exists"));
        return false;
    }

    if (!parentDir.rename(info.fileName(), newName)) {
        qCWarning(lcNames) << "rename failed" << path << "->" << newName;
        OperationError::report(error, OperationError::IOFailure, path,
                               QCoreApplication::translate("PlatformUtils", "Rename failed"));
        return false;
    }

    if (newPath) {
        *newPath = targetPath;
    }
    return true;
}

} // namespace PlatformUtils
