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

#include "NavigationHistory.h"

/**
 * @brief Records a visited path.
 *
 * Entries after the cursor are dropped. A path equal to the current entry
 * is not recorded twice.
 *
 * @param path Visited folder path.
 */
void NavigationHistory::push(const QString &path)
{
    if (path.isEmpty()) {
        return;
    }
    if (m_cursor < m_paths.size() - 1) {
        m_paths.erase(m_paths.begin() + m_cursor + 1, m_paths.end());
    }
    if (!m_paths.isEmpty() && m_paths.last() == path) {
        return;
    }
    m_paths.append(path);
    m_cursor = m_paths.size() - 1;
}

/**
 * @brief Moves one step back.
 * @return New current path, or an empty string at the start of history.
 */
QString NavigationHistory::back()
{
    if (!canGoBack()) {
        return QString();
    }
    --m_cursor;
    return m_paths.at(m_cursor);
}

/**
 * @brief Moves one step forward.
 * @return New current path, or an empty string at the end of history.
 */
QString NavigationHistory::forward()
{
    if (!canGoForward()) {
        return QString();
    }
    ++m_cursor;
    return m_paths.at(m_cursor);
}

void NavigationHistory::clear()
{
    m_paths.clear();
    m_cursor = -1;
}

bool NavigationHistory::canGoBack() const
{
    return m_cursor > 0;
}

bool NavigationHistory::canGoForward() const
{
    return m_cursor >= 0 && m_cursor < m_paths.size() - 1;
}

QString NavigationHistory::current() const
{
    if (m_cursor < 0 || m_cursor >= m_paths.size()) {
        return QString();
    }
    return m_paths.at(m_cursor);
}

QStringList NavigationHistory::paths() const
{
    return m_paths;
}

int NavigationHistory::cursor() const
{
    return m_cursor;
}
