#pragma once

#include <QString>

#include "Entry.h"

class EntrySource;

/**
 * @brief One step of a view pipeline with bidirectional row mapping.
 *
 * A layer sits either directly on an EntrySource (its source rows are
 * source handles) or on another layer (its source rows are that layer's
 * rows). The chain is fixed at construction.
 */
class ViewLayer
{
public:
    static constexpr int NotFound = -1;

    explicit ViewLayer(EntrySource *entrySource);
    explicit ViewLayer(ViewLayer *sourceLayer);
    virtual ~ViewLayer() = default;

    ViewLayer(const ViewLayer &) = delete;
    ViewLayer &operator=(const ViewLayer &) = delete;

    virtual int rowCount() const = 0;
    virtual int mapToSource(int row) const = 0;
    virtual int mapFromSource(int sourceRow) const = 0;
    virtual void invalidate() = 0;

    ViewLayer *sourceLayer() const;
    EntrySource *entrySource() const;

    Entry entryAt(int row) const;
    QString pathForRow(int row) const;
    int rowForPath(const QString &path) const;

protected:
    int sourceRowCount() const;
    Entry sourceEntry(int sourceRow) const;

private:
    EntrySource *m_entrySource = nullptr;
    ViewLayer *m_sourceLayer = nullptr;
};
