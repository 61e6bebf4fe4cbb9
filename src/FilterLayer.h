#pragma once

#include <QString>
#include <QVector>

#include "ViewLayer.h"

class TagStore;

class FilterLayer : public ViewLayer
{
public:
    FilterLayer(ViewLayer *sourceLayer, const TagStore *tagStore);

    QString searchText() const;
    void setSearchText(const QString &text);

    QString rootPath() const;
    void setRootPath(const QString &path);

    const TagStore *tagStore() const;
    void setTagStore(const TagStore *tagStore);

    int rowCount() const override;
    int mapToSource(int row) const override;
    int mapFromSource(int sourceRow) const override;
    void invalidate() override;

private:
    bool acceptsSourceRow(int sourceRow) const;
    void ensureMapping() const;

    const TagStore *m_tagStore = nullptr;
    QString m_searchText;
    QString m_rootPath;

    mutable bool m_dirty = true;
    mutable QVector<int> m_sourceRows;
    mutable QVector<int> m_rowForSource;
};
