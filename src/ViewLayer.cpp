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

#include "ViewLayer.h"

#include "EntrySource.h"

ViewLayer::ViewLayer(EntrySource *entrySource)
    : m_entrySource(entrySource)
{
}

ViewLayer::ViewLayer(ViewLayer *sourceLayer)
    : m_sourceLayer(sourceLayer)
{
}

ViewLayer *ViewLayer::sourceLayer() const
{
    return m_sourceLayer;
}

/**
 * @brief Returns the entry source at the bottom of the chain.
 * @return Entry source reached by walking down, or null if none.
 */
EntrySource *ViewLayer::entrySource() const
{
    const ViewLayer *layer = this;
    while (layer->m_sourceLayer) {
        layer = layer->m_sourceLayer;
    }
    return layer->m_entrySource;
}

/**
 * @brief Resolves a row of this layer to an entry.
 * @param row Row local to this layer.
 * @return Entry materialized from the source, invalid if the row does not
 *         resolve.
 */
Entry ViewLayer::entryAt(int row) const
{
    const int sourceRow = mapToSource(row);
    if (sourceRow == NotFound) {
        return Entry();
    }
    return sourceEntry(sourceRow);
}

QString ViewLayer::pathForRow(int row) const
{
    return entryAt(row).path;
}

/**
 * @brief Finds the row displaying a path.
 * @param path Absolute path of an entry.
 * @return Row in this layer, or NotFound when some layer below hides it.
 */
int ViewLayer::rowForPath(const QString &path) const
{
    int sourceRow = NotFound;
    if (m_sourceLayer) {
        sourceRow = m_sourceLayer->rowForPath(path);
    } else if (m_entrySource) {
        sourceRow = m_entrySource->index(path);
    }
    if (sourceRow < 0) {
        return NotFound;
    }
    return mapFromSource(sourceRow);
}

int ViewLayer::sourceRowCount() const
{
    if (m_sourceLayer) {
        return m_sourceLayer->rowCount();
    }
    return m_entrySource ? m_entrySource->count() : 0;
}

Entry ViewLayer::sourceEntry(int sourceRow) const
{
    if (m_sourceLayer) {
        return m_sourceLayer->entryAt(sourceRow);
    }
    return m_entrySource ? m_entrySource->entry(sourceRow) : Entry();
}
