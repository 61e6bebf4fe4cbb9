#pragma once

#include <QMetaObject>
#include <QObject>
#include <QPointer>
#include <functional>

#include "FilterLayer.h"
#include "SortLayer.h"

class EntrySource;
class TagStore;

/**
 * @brief Fixed chain EntrySource -> SortLayer -> FilterLayer for one pane.
 *
 * Change notifications are processed synchronously in chain order, then
 * forwarded to the change sink given at construction.
 */
class ViewPipeline : public QObject
{
    Q_OBJECT

public:
    using ChangeSink = std::function<void()>;

    ViewPipeline(EntrySource *entrySource, TagStore *tagStore, ChangeSink changeSink, QObject *parent = nullptr);

    EntrySource *entrySource() const;
    TagStore *tagStore() const;
    void setTagStore(TagStore *tagStore);

    const SortLayer &sortLayer() const;
    const FilterLayer &filterLayer() const;
    const ViewLayer &view() const;

    QString searchText() const;
    void setSearchText(const QString &text);
    QString rootPath() const;
    void setRootPath(const QString &path);

    int rowCount() const;
    int mapToSource(int row) const;
    Entry entryAt(int row) const;
    int rowForPath(const QString &path) const;

private:
    void handleChildrenChanged(const QString &directoryPath);
    void handleTagsChanged(const QString &path);
    void handleTagStoreDestroyed();
    void notify();

    EntrySource *m_entrySource = nullptr;
    QPointer<TagStore> m_tagStore;
    QMetaObject::Connection m_tagConnection;
    QMetaObject::Connection m_tagStoreDestroyedConnection;
    ChangeSink m_changeSink;
    SortLayer m_sortLayer;
    FilterLayer m_filterLayer;
};
