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

#include "TagStore.h"

#include <QCoreApplication>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QIODevice>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QJsonValue>
#include <QSaveFile>

#include "Logging.h"
#include "OperationError.h"
#include "PlatformUtils.h"

/**
 * @brief Constructs an empty, unbound tag store.
 * @param parent Parent QObject for ownership.
 */
TagStore::TagStore(QObject *parent)
    : QObject(parent)
{
}

/**
 * @brief Returns the JSON document path backing the store.
 * @return Storage path, empty until load() is called.
 */
QString TagStore::storagePath() const
{
    return m_storagePath;
}

/**
 * @brief Binds the store to a JSON document and reads it.
 * @param storagePath Path of the tag document.
 * @param error Optional output error, set to CorruptStore when the document
 *        cannot be parsed.
 * @return True when the document was read or does not exist yet. On false
 *         the store is empty and stays usable.
 */
bool TagStore::load(const QString &storagePath, OperationError *error)
{
    m_tags.clear();
    if (storagePath != m_storagePath) {
        m_storagePath = storagePath;
        emit storagePathChanged();
    }

    if (!QFileInfo::exists(m_storagePath)) {
        qCDebug(lcTags) << "no tag document at" << m_storagePath;
        return true;
    }

    QFile file(m_storagePath);
    if (!file.open(QIODevice::ReadOnly)) {
        qCWarning(lcTags) << "cannot read tag document" << m_storagePath << file.errorString();
        OperationError::report(error, OperationError::CorruptStore, m_storagePath,
                               QCoreApplication::translate("TagStore", "Cannot read tag file"));
        return false;
    }

    QJsonParseError parseError;
    const QJsonDocument document = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !document.isObject()) {
        qCWarning(lcTags) << "ignoring malformed tag document" << m_storagePath << parseError.errorString();
        OperationError::report(error, OperationError::CorruptStore, m_storagePath,
                               QCoreApplication::translate("TagStore", "Tag file is corrupt"));
        return false;
    }

    const QJsonObject root = document.object();
    for (auto it = root.constBegin(); it != root.constEnd(); ++it) {
        if (!it.value().isArray()) {
            qCWarning(lcTags) << "skipping non-array tags for" << it.key();
            continue;
        }
        QStringList tags;
        const QJsonArray array = it.value().toArray();
        for (const QJsonValue &value : array) {
            if (value.isString()) {
                tags.append(value.toString());
            }
        }
        const QString key = PlatformUtils::normalizePath(it.key());
        tags = distinctTags(m_tags.value(key) + tags);
        if (!key.isEmpty() && !tags.isEmpty()) {
            m_tags.insert(key, tags);
        }
    }
    qCDebug(lcTags) << "loaded tags for" << m_tags.size() << "paths";
    return true;
}

/**
 * @brief Writes the whole document back to disk.
 * @param error Optional output error, set to PersistFailure on failure.
 * @return True if the document was written.
 */
bool TagStore::save(OperationError *error) const
{
    if (m_storagePath.isEmpty()) {
        OperationError::report(error, OperationError::PersistFailure, m_storagePath,
                               QCoreApplication::translate("TagStore", "No tag file configured"));
        return false;
    }

    QJsonObject root;
    for (auto it = m_tags.constBegin(); it != m_tags.constEnd(); ++it) {
        root.insert(it.key(), QJsonArray::fromStringList(it.value()));
    }

    QSaveFile file(m_storagePath);
    if (!file.open(QIODevice::WriteOnly)) {
        qCWarning(lcTags) << "cannot open tag document for writing" << m_storagePath << file.errorString();
        OperationError::report(error, OperationError::PersistFailure, m_storagePath,
                               QCoreApplication::translate("TagStore", "Cannot write tag file"));
        return false;
    }
    const QByteArray bytes = QJsonDocument(root).toJson(QJsonDocument::Indented);
    if (file.write(bytes) != bytes.size() || !file.commit()) {
        qCWarning(lcTags) << "writing tag document failed" << m_storagePath << file.errorString();
        OperationError::report(error, OperationError::PersistFailure, m_storagePath,
                               QCoreApplication::translate("TagStore", "Cannot write tag file"));
        return false;
    }
    return true;
}

/**
 * @brief Returns the tags attached to a path.
 * @param path Path in any form, normalized before lookup.
 * @return Tags in insertion order, empty when none.
 */
QStringList TagStore::tags(const QString &path) const
{
    return m_tags.value(PlatformUtils::normalizePath(path));
}

bool TagStore::hasTags(const QString &path) const
{
    return m_tags.contains(PlatformUtils::normalizePath(path));
}

QStringList TagStore::paths() const
{
    return m_tags.keys();
}

/**
 * @brief Appends a tag to a path and persists the document.
 * @param path Path to tag.
 * @param tag Tag text, trimmed. Blank tags and tags already present are ignored.
 * @param error Optional output error (PersistFailure).
 * @return False only when the document could not be written.
 */
bool TagStore::addTag(const QString &path, const QString &tag, OperationError *error)
{
    const QString key = PlatformUtils::normalizePath(path);
    const QString text = tag.trimmed();
    if (key.isEmpty() || text.isEmpty()) {
        return true;
    }
    QStringList &tags = m_tags[key];
    if (tags.contains(text)) {
        return true;
    }
    tags.append(text);
    return commit(key, error);
}

/**
 * @brief Removes a tag from a path and persists the document.
 * @param path Tagged path.
 * @param tag Tag to remove, trimmed like on add.
 * @param error Optional output error (PersistFailure).
 * @return False only when the document could not be written.
 */
bool TagStore::removeTag(const QString &path, const QString &tag, OperationError *error)
{
    const QString key = PlatformUtils::normalizePath(path);
    const QString text = tag.trimmed();
    auto it = m_tags.find(key);
    if (it == m_tags.end() || !it->contains(text)) {
        return true;
    }
    it->removeAll(text);
    if (it->isEmpty()) {
        m_tags.erase(it);
    }
    return commit(key, error);
}

/**
 * @brief Replaces every tag of a path. An empty list removes the path.
 * @param path Path to update.
 * @param tags New tags, duplicates are dropped.
 * @param error Optional output error (PersistFailure).
 * @return False only when the document could not be written.
 */
bool TagStore::setTags(const QString &path, const QStringList &tags, OperationError *error)
{
    const QString key = PlatformUtils::normalizePath(path);
    if (key.isEmpty()) {
        return true;
    }
    const QStringList next = distinctTags(tags);
    if (next.isEmpty()) {
        m_tags.remove(key);
    } else {
        m_tags.insert(key, next);
    }
    return commit(key, error);
}

bool TagStore::clearTags(const QString &path, OperationError *error)
{
    return setTags(path, QStringList(), error);
}

/**
 * @brief Re-keys the tags of a renamed entry and of everything below it.
 * @param fromPath Path before the rename.
 * @param toPath Path after the rename.
 * @param error Optional output error (PersistFailure).
 * @return False only when the document could not be written.
 */
bool TagStore::movePath(const QString &fromPath, const QString &toPath, OperationError *error)
{
    const QString fromKey = PlatformUtils::normalizePath(fromPath);
    const QString toKey = PlatformUtils::normalizePath(toPath);
    if (fromKey.isEmpty() || toKey.isEmpty() || fromKey == toKey) {
        return true;
    }

    const QString prefix = fromKey.endsWith(QDir::separator()) ? fromKey : fromKey + QDir::separator();
    QHash<QString, QStringList> moved;
    for (auto it = m_tags.begin(); it != m_tags.end();) {
        if (it.key() == fromKey || it.key().startsWith(prefix)) {
            moved.insert(toKey + it.key().mid(fromKey.size()), it.value());
            it = m_tags.erase(it);
        } else {
            ++it;
        }
    }
    if (moved.isEmpty()) {
        return true;
    }
    for (auto it = moved.cbegin(); it != moved.cend(); ++it) {
        m_tags.insert(it.key(), it.value());
    }
    qCDebug(lcTags) << "moved" << moved.size() << "tagged paths from" << fromKey << "to" << toKey;
    return commit(toKey, error);
}

QStringList TagStore::distinctTags(const QStringList &tags)
{
    QStringList result;
    result.reserve(tags.size());
    for (const QString &tag : tags) {
        const QString text = tag.trimmed();
        if (!text.isEmpty() && !result.contains(text)) {
            result.append(text);
        }
    }
    return result;
}

/**
 * @brief Persists the document and announces a change for a path.
 * @param normalizedPath Key that changed.
 * @param error Optional output error (PersistFailure).
 * @return True if the document was written. The in-memory change is kept
 *         and announced either way.
 */
bool TagStore::commit(const QString &normalizedPath, OperationError *error)
{
    OperationError saveError;
    const bool saved = save(&saveError);
    if (!saved) {
        saveError.path = normalizedPath;
        if (error) {
            *error = saveError;
        }
    }
    emit tagsChanged(normalizedPath);
    return saved;
}
