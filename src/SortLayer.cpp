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

#include "SortLayer.h"

#include <QString>
#include <algorithm>

#include "EntrySource.h"
#include "Logging.h"

namespace {

struct SortKey {
    QString effectiveName;
    QString rawName;
    int sourceRow = 0;
};

bool sortKeyLessThan(const SortKey &left, const SortKey &right)
{
    const int byName = QString::compare(left.effectiveName, right.effectiveName, Qt::CaseInsensitive);
    if (byName != 0) {
        return byName < 0;
    }
    const int byRawName = QString::compare(left.rawName, right.rawName, Qt::CaseSensitive);
    if (byRawName != 0) {
        return byRawName < 0;
    }
    return left.sourceRow < right.sourceRow;
}

} // namespace

/**
 * @brief Constructs a layer ordering the entries of a source by effective name.
 * @param entrySource Source whose handles are this layer's source rows.
 */
SortLayer::SortLayer(EntrySource *entrySource)
    : ViewLayer(entrySource)
{
    invalidate();
}

int SortLayer::rowCount() const
{
    return m_sourceRows.size();
}

int SortLayer::mapToSource(int row) const
{
    if (row < 0 || row >= m_sourceRows.size()) {
        return NotFound;
    }
    return m_sourceRows.at(row);
}

int SortLayer::mapFromSource(int sourceRow) const
{
    if (sourceRow < 0 || sourceRow >= m_rowForSource.size()) {
        return NotFound;
    }
    return m_rowForSource.at(sourceRow);
}

/**
 * @brief Re-sorts immediately from the current source listing.
 */
void SortLayer::invalidate()
{
    m_sourceRows.clear();
    m_rowForSource.clear();

    EntrySource *source = entrySource();
    if (!source) {
        return;
    }

    const QVector<Entry> entries = source->children(source->directory());
    QVector<SortKey> keys;
    keys.reserve(entries.size());
    for (int i = 0; i < entries.size(); ++i) {
        const Entry &entry = entries.at(i);
        if (!entry.isValid()) {
            // Vanished since the last listing; the next change event drops it.
            continue;
        }
        keys.append(SortKey{entry.effectiveName, entry.rawName, i});
    }
    std::sort(keys.begin(), keys.end(), sortKeyLessThan);

    m_sourceRows.reserve(keys.size());
    m_rowForSource.fill(NotFound, entries.size());
    for (const SortKey &key : keys) {
        m_rowForSource[key.sourceRow] = m_sourceRows.size();
        m_sourceRows.append(key.sourceRow);
    }
    qCDebug(lcPipeline) << "sorted" << m_sourceRows.size() << "rows";
}
