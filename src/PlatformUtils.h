#pragma once

#include <QString>

struct OperationError;

namespace PlatformUtils {

QString normalizePath(const QString &path);
bool isSameOrBelow(const QString &path, const QString &rootPath);
bool renamePath(const QString &path, const QString &newName, QString *newPath, OperationError *error);

} // namespace PlatformUtils
