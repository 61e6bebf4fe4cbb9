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

#include "FilterLayer.h"

#include <QDir>
#include <QStringList>

#include "Logging.h"
#include "PlatformUtils.h"
#include "TagStore.h"

/**
 * @brief Constructs a filter over another layer.
 * @param sourceLayer Layer whose rows are filtered.
 * @param tagStore Tags searched alongside names, may be null.
 */
FilterLayer::FilterLayer(ViewLayer *sourceLayer, const TagStore *tagStore)
    : ViewLayer(sourceLayer)
    , m_tagStore(tagStore)
{
}

QString FilterLayer::searchText() const
{
    return m_searchText;
}

/**
 * @brief Sets the search text. Empty text shows every row.
 * @param text Text matched as a case-insensitive substring.
 */
void FilterLayer::setSearchText(const QString &text)
{
    const QString lowered = text.toLower();
    if (lowered == m_searchText) {
        return;
    }
    m_searchText = lowered;
    invalidate();
}

QString FilterLayer::rootPath() const
{
    return m_rootPath;
}

/**
 * @brief Sets the folder the search applies to.
 * @param path Folder path. Entries outside of it are never filtered out.
 */
void FilterLayer::setRootPath(const QString &path)
{
    const QString cleaned = path.isEmpty() ? QString() : QDir::cleanPath(QDir(path).absolutePath());
    if (cleaned == m_rootPath) {
        return;
    }
    m_rootPath = cleaned;
    invalidate();
}

const TagStore *FilterLayer::tagStore() const
{
    return m_tagStore;
}

void FilterLayer::setTagStore(const TagStore *tagStore)
{
    if (tagStore == m_tagStore) {
        return;
    }
    m_tagStore = tagStore;
    invalidate();
}

int FilterLayer::rowCount() const
{
    ensureMapping();
    return m_sourceRows.size();
}

int FilterLayer::mapToSource(int row) const
{
    ensureMapping();
    if (row < 0 || row >= m_sourceRows.size()) {
        return NotFound;
    }
    return m_sourceRows.at(row);
}

int FilterLayer::mapFromSource(int sourceRow) const
{
    ensureMapping();
    if (sourceRow < 0 || sourceRow >= m_rowForSource.size()) {
        return NotFound;
    }
    return m_rowForSource.at(sourceRow);
}

/**
 * @brief Drops the row mapping; it is rebuilt on next access.
 */
void FilterLayer::invalidate()
{
    m_dirty = true;
}

/**
 * @brief Evaluates the search predicate for one source row.
 * @param sourceRow Row of the source layer.
 * @return True if the row stays visible.
 */
bool FilterLayer::acceptsSourceRow(int sourceRow) const
{
    if (m_searchText.isEmpty()) {
        return true;
    }

    const Entry entry = sourceEntry(sourceRow);
    if (!entry.isValid()) {
        return false;
    }
    if (!PlatformUtils::isSameOrBelow(entry.path, m_rootPath)) {
        return true;
    }
    if (entry.effectiveName.contains(m_searchText, Qt::CaseInsensitive)) {
        return true;
    }
    if (!m_tagStore) {
        return false;
    }
    const QStringList tags = m_tagStore->tags(entry.path);
    for (const QString &tag : tags) {
        if (tag.contains(m_searchText, Qt::CaseInsensitive)) {
            return true;
        }
    }
    return false;
}

void FilterLayer::ensureMapping() const
{
    if (!m_dirty) {
        return;
    }
    m_dirty = false;

    const int count = sourceRowCount();
    m_sourceRows.clear();
    m_sourceRows.reserve(count);
    m_rowForSource.fill(NotFound, count);
    for (int sourceRow = 0; sourceRow < count; ++sourceRow) {
        if (acceptsSourceRow(sourceRow)) {
            m_rowForSource[sourceRow] = m_sourceRows.size();
            m_sourceRows.append(sourceRow);
        }
    }
    qCDebug(lcPipeline) << "filter" << m_searchText << "keeps" << m_sourceRows.size() << "of" << count;
}
