#pragma once

#include <QVector>

#include "ViewLayer.h"

class SortLayer : public ViewLayer
{
public:
    explicit SortLayer(EntrySource *entrySource);

    int rowCount() const override;
    int mapToSource(int row) const override;
    int mapFromSource(int sourceRow) const override;
    void invalidate() override;

private:
    QVector<int> m_sourceRows;
    QVector<int> m_rowForSource;
};
