#pragma once

#include <QString>

struct OperationError;

namespace NameCodec {

QString disabledMarker();
bool isDisabled(const QString &rawName);
QString effectiveName(const QString &rawName);
QString toggledName(const QString &rawName);
bool toggle(const QString &path, QString *newPath, OperationError *error);

} // namespace NameCodec
