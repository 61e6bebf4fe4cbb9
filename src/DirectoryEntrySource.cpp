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

#include "DirectoryEntrySource.h"

#include <QDir>
#include <QFileInfo>

#include "Logging.h"

namespace {

constexpr int refreshDelayMs = 150;

} // namespace

/**
 * @brief Constructs the source and wires the directory watcher.
 * @param parent Parent QObject for ownership.
 */
DirectoryEntrySource::DirectoryEntrySource(QObject *parent)
    : EntrySource(parent)
{
    m_refreshTimer.setInterval(refreshDelayMs);
    m_refreshTimer.setSingleShot(true);
    connect(&m_refreshTimer, &QTimer::timeout, this, &DirectoryEntrySource::refresh);

    connect(&m_watcher, &QFileSystemWatcher::directoryChanged, this, [this](const QString &) {
        scheduleRefresh();
    });
}

QString DirectoryEntrySource::directory() const
{
    return m_directory;
}

/**
 * @brief Switches the observed directory and reloads the listing.
 * @param path Directory to observe.
 */
void DirectoryEntrySource::setDirectory(const QString &path)
{
    const QString absolute = path.isEmpty() ? QString() : QDir(path).absolutePath();
    if (absolute == m_directory) {
        return;
    }
    m_directory = absolute;
    updateWatcher();
    refresh();
}

int DirectoryEntrySource::count() const
{
    return m_paths.size();
}

/**
 * @brief Returns the entries of a directory.
 * @param directoryPath Directory to list. For the observed directory the
 *        order matches the handles, other directories are listed on demand.
 * @return Freshly materialized entries, in no particular order.
 */
QVector<Entry> DirectoryEntrySource::children(const QString &directoryPath) const
{
    if (directoryPath.isEmpty()) {
        return {};
    }
    const QStringList paths = QDir(directoryPath).absolutePath() == m_directory
        ? m_paths
        : listDirectory(directoryPath);

    QVector<Entry> entries;
    entries.reserve(paths.size());
    for (const QString &path : paths) {
        entries.append(Entry::fromPath(path));
    }
    return entries;
}

/**
 * @brief Resolves a path to its handle in the current listing.
 * @param path Absolute path of an entry of the observed directory.
 * @return Handle, or -1 if the path is not listed.
 */
int DirectoryEntrySource::index(const QString &path) const
{
    if (path.isEmpty()) {
        return -1;
    }
    return m_handles.value(handleKey(path), -1);
}

QString DirectoryEntrySource::filePath(int handle) const
{
    if (handle < 0 || handle >= m_paths.size()) {
        return QString();
    }
    return m_paths.at(handle);
}

Entry DirectoryEntrySource::entry(int handle) const
{
    return Entry::fromPath(filePath(handle));
}

/**
 * @brief Rescans the observed directory and announces changes.
 */
void DirectoryEntrySource::refresh()
{
    m_refreshTimer.stop();
    const QStringList nextPaths = m_directory.isEmpty() ? QStringList() : listDirectory(m_directory);
    if (nextPaths == m_paths) {
        return;
    }

    m_paths = nextPaths;
    m_handles.clear();
    m_handles.reserve(m_paths.size());
    for (int i = 0; i < m_paths.size(); ++i) {
        m_handles.insert(handleKey(m_paths.at(i)), i);
    }
    qCDebug(lcEntries) << m_directory << "now lists" << m_paths.size() << "entries";
    emit childrenChanged(m_directory);
}

QStringList DirectoryEntrySource::listDirectory(const QString &directoryPath)
{
    const QDir dir(directoryPath);
    if (!dir.exists()) {
        qCWarning(lcEntries) << "directory does not exist" << directoryPath;
        return QStringList();
    }
    const QFileInfoList infos = dir.entryInfoList(QDir::AllEntries | QDir::NoDotAndDotDot, QDir::NoSort);
    QStringList paths;
    paths.reserve(infos.size());
    for (const QFileInfo &info : infos) {
        paths.append(info.absoluteFilePath());
    }
    return paths;
}

QString DirectoryEntrySource::handleKey(const QString &path)
{
    QString key = QDir::cleanPath(QDir(QDir::fromNativeSeparators(path)).absolutePath());
#ifdef Q_OS_WIN
    key = key.toLower();
#endif
    return key;
}

/**
 * @brief Schedules a delayed refresh to coalesce rapid updates.
 */
void DirectoryEntrySource::scheduleRefresh()
{
    if (!m_refreshTimer.isActive()) {
        m_refreshTimer.start();
    }
}

void DirectoryEntrySource::updateWatcher()
{
    const QStringList watched = m_watcher.directories();
    if (!watched.isEmpty()) {
        m_watcher.removePaths(watched);
    }
    if (!m_directory.isEmpty() && QDir(m_directory).exists()) {
        m_watcher.addPath(m_directory);
    }
}
