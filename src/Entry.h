#pragma once

#include <QDateTime>
#include <QString>

class QFileInfo;

struct Entry {
    QString path;
    QString rawName;
    QString effectiveName;
    bool isDirectory = false;
    bool isDisabled = false;
    qint64 size = 0;
    QDateTime modifiedTime;

    bool isValid() const { return !path.isEmpty(); }

    static Entry fromFileInfo(const QFileInfo &info);
    static Entry fromPath(const QString &path);
};
