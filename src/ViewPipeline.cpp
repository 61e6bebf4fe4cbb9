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

#include "ViewPipeline.h"

#include <utility>

#include "EntrySource.h"
#include "Logging.h"
#include "TagStore.h"

/**
 * @brief Builds the layer chain over an entry source.
 * @param entrySource Listing of the observed directory, not owned.
 * @param tagStore Shared tag store, not owned, may be null.
 * @param changeSink Called after every change has been applied to the layers.
 * @param parent Parent QObject for ownership.
 */
ViewPipeline::ViewPipeline(EntrySource *entrySource, TagStore *tagStore, ChangeSink changeSink, QObject *parent)
    : QObject(parent)
    , m_entrySource(entrySource)
    , m_changeSink(std::move(changeSink))
    , m_sortLayer(entrySource)
    , m_filterLayer(&m_sortLayer, nullptr)
{
    if (m_entrySource) {
        connect(m_entrySource, &EntrySource::childrenChanged, this, &ViewPipeline::handleChildrenChanged);
    }
    setTagStore(tagStore);
}

EntrySource *ViewPipeline::entrySource() const
{
    return m_entrySource;
}

TagStore *ViewPipeline::tagStore() const
{
    return m_tagStore;
}

/**
 * @brief Switches the tag store searched by the filter.
 * @param tagStore Tag store, not owned, may be null.
 */
void ViewPipeline::setTagStore(TagStore *tagStore)
{
    if (tagStore == m_tagStore && m_filterLayer.tagStore() == tagStore) {
        return;
    }
    disconnect(m_tagConnection);
    disconnect(m_tagStoreDestroyedConnection);
    m_tagStore = tagStore;
    if (m_tagStore) {
        m_tagConnection = connect(m_tagStore, &TagStore::tagsChanged, this, &ViewPipeline::handleTagsChanged);
        m_tagStoreDestroyedConnection = connect(m_tagStore, &QObject::destroyed, this, &ViewPipeline::handleTagStoreDestroyed);
    }
    m_filterLayer.setTagStore(m_tagStore);
    notify();
}

const SortLayer &ViewPipeline::sortLayer() const
{
    return m_sortLayer;
}

const FilterLayer &ViewPipeline::filterLayer() const
{
    return m_filterLayer;
}

const ViewLayer &ViewPipeline::view() const
{
    return m_filterLayer;
}

QString ViewPipeline::searchText() const
{
    return m_filterLayer.searchText();
}

void ViewPipeline::setSearchText(const QString &text)
{
    if (text.toLower() == m_filterLayer.searchText()) {
        return;
    }
    m_filterLayer.setSearchText(text);
    notify();
}

QString ViewPipeline::rootPath() const
{
    return m_filterLayer.rootPath();
}

void ViewPipeline::setRootPath(const QString &path)
{
    const QString previous = m_filterLayer.rootPath();
    m_filterLayer.setRootPath(path);
    if (m_filterLayer.rootPath() != previous) {
        notify();
    }
}

int ViewPipeline::rowCount() const
{
    return view().rowCount();
}

int ViewPipeline::mapToSource(int row) const
{
    return view().mapToSource(row);
}

Entry ViewPipeline::entryAt(int row) const
{
    return view().entryAt(row);
}

int ViewPipeline::rowForPath(const QString &path) const
{
    return view().rowForPath(path);
}

void ViewPipeline::handleChildrenChanged(const QString &directoryPath)
{
    qCDebug(lcPipeline) << "children changed under" << directoryPath;
    m_sortLayer.invalidate();
    m_filterLayer.invalidate();
    notify();
}

void ViewPipeline::handleTagsChanged(const QString &path)
{
    qCDebug(lcPipeline) << "tags changed for" << path;
    m_filterLayer.invalidate();
    notify();
}

/**
 * @brief Stops searching tags once the shared store is gone.
 */
void ViewPipeline::handleTagStoreDestroyed()
{
    qCDebug(lcPipeline) << "tag store destroyed";
    m_filterLayer.setTagStore(nullptr);
    notify();
}

void ViewPipeline::notify()
{
    if (m_changeSink) {
        m_changeSink();
    }
}
