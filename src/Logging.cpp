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

#include "Logging.h"

Q_LOGGING_CATEGORY(lcNames, "modman.names")
Q_LOGGING_CATEGORY(lcTags, "modman.tags")
Q_LOGGING_CATEGORY(lcEntries, "modman.entries")
Q_LOGGING_CATEGORY(lcPipeline, "modman.pipeline")
Q_LOGGING_CATEGORY(lcPane, "modman.pane")
