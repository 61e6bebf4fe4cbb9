#pragma once

#include <QFileSystemWatcher>
#include <QHash>
#include <QStringList>
#include <QTimer>

#include "EntrySource.h"

class DirectoryEntrySource : public EntrySource
{
    Q_OBJECT

public:
    explicit DirectoryEntrySource(QObject *parent = nullptr);

    QString directory() const override;
    void setDirectory(const QString &path) override;

    int count() const override;
    QVector<Entry> children(const QString &directoryPath) const override;
    int index(const QString &path) const override;
    QString filePath(int handle) const override;
    Entry entry(int handle) const override;

    void refresh() override;

private:
    static QStringList listDirectory(const QString &directoryPath);
    static QString handleKey(const QString &path);
    void scheduleRefresh();
    void updateWatcher();

    QString m_directory;
    QStringList m_paths;
    QHash<QString, int> m_handles;
    QFileSystemWatcher m_watcher;
    QTimer m_refreshTimer;
};
