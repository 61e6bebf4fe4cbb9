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

#include "OperationError.h"

/**
 * @brief Converts the error to a map suitable for QML result objects.
 * @return Map with errorKind, path, and error fields.
 */
QVariantMap OperationError::toVariantMap() const
{
    QVariantMap map;
    map.insert("errorKind", kindName(kind));
    map.insert("path", path);
    map.insert("error", message);
    return map;
}

QString OperationError::kindName(Kind kind)
{
    switch (kind) {
    case None:
        return QStringLiteral("None");
    case NotFound:
        return QStringLiteral("NotFound");
    case RenameConflict:
        return QStringLiteral("RenameConflict");
    case IOFailure:
        return QStringLiteral("IOFailure");
    case CorruptStore:
        return QStringLiteral("CorruptStore");
    case PersistFailure:
        return QStringLiteral("PersistFailure");
    }
    return QString();
}

/**
 * @brief Fills an optional error out parameter.
 * @param error Output error, may be null.
 * @param kind Error kind to record.
 * @param path Path the failed operation was applied to.
 * @param message Translated, user facing message.
 */
void OperationError::report(OperationError *error, Kind kind, const QString &path, const QString &message)
{
    if (!error) {
        return;
    }
    error->kind = kind;
    error->path = path;
    error->message = message;
}
