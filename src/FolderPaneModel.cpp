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

#include "FolderPaneModel.h"

#include <QDir>
#include <QFileInfo>

#include "AppSettings.h"
#include "Logging.h"
#include "NameCodec.h"
#include "OperationError.h"
#include "TagStore.h"
#include "ViewPipeline.h"

/**
 * @brief Constructs an empty pane. Nothing is listed until a folder is set.
 * @param parent Parent QObject for ownership.
 */
FolderPaneModel::FolderPaneModel(QObject *parent)
    : QAbstractListModel(parent)
{
    m_pipeline = new ViewPipeline(&m_entrySource, nullptr, [this]() { resetRows(); }, this);
}

void FolderPaneModel::classBegin()
{
}

/**
 * @brief Falls back to the home folder when QML assigned no folder.
 */
void FolderPaneModel::componentComplete()
{
    if (rootPath().isEmpty()) {
        setRootPath(QDir::homePath());
    }
}

/**
 * @brief Returns the folder currently shown.
 * @return Absolute folder path.
 */
QString FolderPaneModel::rootPath() const
{
    return m_entrySource.directory();
}

/**
 * @brief Navigates to a folder and records it in the history.
 * @param path Folder to show.
 */
void FolderPaneModel::setRootPath(const QString &path)
{
    navigateTo(path, true);
}

QString FolderPaneModel::settingsKey() const
{
    return m_settingsKey;
}

/**
 * @brief Sets the settings key and restores the folder stored under it.
 * @param key Settings key used to persist the shown folder.
 */
void FolderPaneModel::setSettingsKey(const QString &key)
{
    if (key == m_settingsKey) {
        return;
    }
    m_settingsKey = key;
    emit settingsKeyChanged();

    const QString storedPath = AppSettings::paneFolder(m_settingsKey);
    if (!storedPath.isEmpty() && QDir(storedPath).exists() && storedPath != rootPath()) {
        setRootPath(storedPath);
    }
}

QString FolderPaneModel::searchText() const
{
    return m_pipeline->searchText();
}

/**
 * @brief Filters the pane by name or tag.
 * @param text Search text, empty to show everything.
 */
void FolderPaneModel::setSearchText(const QString &text)
{
    const QString previous = m_pipeline->searchText();
    m_pipeline->setSearchText(text);
    if (m_pipeline->searchText() != previous) {
        emit searchTextChanged();
    }
}

TagStore *FolderPaneModel::tagStore() const
{
    return m_tagStore;
}

void FolderPaneModel::setTagStore(TagStore *tagStore)
{
    if (tagStore == m_tagStore) {
        return;
    }
    m_tagStore = tagStore;
    m_pipeline->setTagStore(tagStore);
    emit tagStoreChanged();
}

bool FolderPaneModel::canGoBack() const
{
    return m_history.canGoBack();
}

bool FolderPaneModel::canGoForward() const
{
    return m_history.canGoForward();
}

const ViewPipeline &FolderPaneModel::pipeline() const
{
    return *m_pipeline;
}

/**
 * @brief Returns the number of visible rows.
 * @param parent Parent index (unused for list model).
 * @return Number of rows.
 */
int FolderPaneModel::rowCount(const QModelIndex &parent) const
{
    if (parent.isValid()) {
        return 0;
    }
    return m_pipeline->rowCount();
}

/**
 * @brief Returns data for a given model index and role.
 * @param index Model index to read.
 * @param role Data role identifier.
 * @return Role-specific data for the index.
 */
QVariant FolderPaneModel::data(const QModelIndex &index, int role) const
{
    if (!index.isValid()) {
        return {};
    }
    const Entry entry = m_pipeline->entryAt(index.row());
    if (!entry.isValid()) {
        return {};
    }

    switch (role) {
    case Qt::DisplayRole:
    case FileNameRole:
        return entry.effectiveName;
    case RawNameRole:
        return entry.rawName;
    case FilePathRole:
        return entry.path;
    case IsDirRole:
        return entry.isDirectory;
    case IsDisabledRole:
        return entry.isDisabled;
    case SizeRole:
        return entry.size;
    case ModifiedRole:
        return entry.modifiedTime;
    case TagsRole:
        return m_tagStore ? m_tagStore->tags(entry.path) : QStringList();
    default:
        return {};
    }
}

/**
 * @brief Returns the role names exposed to QML.
 * @return Mapping from role ids to role names.
 */
QHash<int, QByteArray> FolderPaneModel::roleNames() const
{
    return {
        {FileNameRole, "fileName"},
        {RawNameRole, "rawName"},
        {FilePathRole, "filePath"},
        {IsDirRole, "isDir"},
        {IsDisabledRole, "isDisabled"},
        {SizeRole, "size"},
        {ModifiedRole, "modified"},
        {TagsRole, "tags"},
    };
}

/**
 * @brief Rescans the shown folder.
 */
void FolderPaneModel::refresh()
{
    m_entrySource.refresh();
}

/**
 * @brief Activates the entry at the given row.
 * @param row Row index to activate. Folders are entered, files announced.
 */
void FolderPaneModel::activate(int row)
{
    const Entry entry = m_pipeline->entryAt(row);
    if (!entry.isValid()) {
        return;
    }
    if (entry.isDirectory) {
        setRootPath(entry.path);
        emit folderActivated(entry.path);
    } else {
        emit fileActivated(entry.path);
    }
}

/**
 * @brief Navigates to the parent folder of the current root path.
 */
void FolderPaneModel::goUp()
{
    if (rootPath().isEmpty()) {
        return;
    }
    QDir dir(rootPath());
    if (dir.isRoot()) {
        return;
    }
    dir.cdUp();
    setRootPath(dir.absolutePath());
}

void FolderPaneModel::goBack()
{
    const QString path = m_history.back();
    if (!path.isEmpty()) {
        navigateTo(path, false);
    }
}

void FolderPaneModel::goForward()
{
    const QString path = m_history.forward();
    if (!path.isEmpty()) {
        navigateTo(path, false);
    }
}

QString FolderPaneModel::pathForRow(int row) const
{
    return m_pipeline->entryAt(row).path;
}

/**
 * @brief Finds the row currently showing a path.
 * @param path Absolute path of an entry.
 * @return Row index, or -1 when the entry is not visible.
 */
int FolderPaneModel::rowForPath(const QString &path) const
{
    return m_pipeline->rowForPath(path);
}

QStringList FolderPaneModel::tagsForPath(const QString &path) const
{
    return m_tagStore ? m_tagStore->tags(path) : QStringList();
}

/**
 * @brief Enables or disables an entry by renaming it.
 *
 * Tags move with the entry, including those of entries inside a toggled
 * folder. The listing is rescanned before returning so
 * rows never point at the old name.
 *
 * @param path Path of the entry to toggle.
 * @return Result map including ok, newPath, and error fields.
 */
QVariantMap FolderPaneModel::toggle(const QString &path)
{
    QString newPath;
    OperationError error;
    if (!NameCodec::toggle(path, &newPath, &error)) {
        return failure(error);
    }

    QVariantMap result;
    result.insert("ok", true);
    result.insert("path", path);
    result.insert("newPath", newPath);

    OperationError tagError;
    if (m_tagStore && !m_tagStore->movePath(path, newPath, &tagError)) {
        qCWarning(lcPane) << "tags of" << path << "not persisted after toggle";
        result.insert("warning", tagError.message);
    }

    m_entrySource.refresh();
    return result;
}

QVariantMap FolderPaneModel::addTag(const QString &path, const QString &tag)
{
    OperationError error;
    const bool ok = m_tagStore && m_tagStore->addTag(path, tag, &error);
    return tagResult(path, ok, error);
}

QVariantMap FolderPaneModel::removeTag(const QString &path, const QString &tag)
{
    OperationError error;
    const bool ok = m_tagStore && m_tagStore->removeTag(path, tag, &error);
    return tagResult(path, ok, error);
}

QVariantMap FolderPaneModel::clearTags(const QString &path)
{
    OperationError error;
    const bool ok = m_tagStore && m_tagStore->clearTags(path, &error);
    return tagResult(path, ok, error);
}

/**
 * @brief Shows a folder, resetting the search.
 * @param path Folder to show.
 * @param recordHistory True to push the folder onto the history.
 */
void FolderPaneModel::navigateTo(const QString &path, bool recordHistory)
{
    if (path.isEmpty() || !QFileInfo(path).isDir()) {
        return;
    }
    const QString absolute = QDir(path).absolutePath();

    if (recordHistory) {
        m_history.push(absolute);
    }
    emit historyChanged();

    setSearchText(QString());
    if (absolute == rootPath()) {
        return;
    }

    m_entrySource.setDirectory(absolute);
    m_pipeline->setRootPath(absolute);
    AppSettings::setPaneFolder(m_settingsKey, absolute);
    qCDebug(lcPane) << "showing" << absolute;
    emit rootPathChanged();
}

QVariantMap FolderPaneModel::tagResult(const QString &path, bool ok, const OperationError &error)
{
    if (!m_tagStore) {
        OperationError missing;
        missing.kind = OperationError::PersistFailure;
        missing.path = path;
        missing.message = tr("No tag store");
        return failure(missing);
    }
    if (!ok) {
        // The in-memory tags are already updated, only durability is lost.
        return failure(error);
    }
    QVariantMap result;
    result.insert("ok", true);
    result.insert("path", path);
    return result;
}

QVariantMap FolderPaneModel::failure(const OperationError &error)
{
    QVariantMap result = error.toVariantMap();
    result.insert("ok", false);
    qCWarning(lcPane) << OperationError::kindName(error.kind) << error.path << error.message;
    emit operationFailed(result);
    return result;
}

void FolderPaneModel::resetRows()
{
    beginResetModel();
    endResetModel();
}
