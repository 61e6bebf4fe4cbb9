#pragma once

#include <QObject>
#include <QString>
#include <QVector>

#include "Entry.h"

/**
 * @brief Live listing of one observed directory.
 *
 * Handles are positions in the current listing: handle i is the i-th
 * element of children(directory()). They are only valid until the next
 * childrenChanged() emission.
 */
class EntrySource : public QObject
{
    Q_OBJECT

public:
    using QObject::QObject;

    virtual QString directory() const = 0;
    virtual void setDirectory(const QString &path) = 0;

    virtual int count() const = 0;
    virtual QVector<Entry> children(const QString &directoryPath) const = 0;
    virtual int index(const QString &path) const = 0;
    virtual QString filePath(int handle) const = 0;
    virtual Entry entry(int handle) const = 0;

    virtual void refresh() = 0;

signals:
    void childrenChanged(const QString &directoryPath);
};
