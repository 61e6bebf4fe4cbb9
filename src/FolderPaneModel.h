#pragma once

#include <QAbstractListModel>
#include <QPointer>
#include <QQmlParserStatus>
#include <QStringList>
#include <QVariantMap>

#include <QtQml/qqml.h>

#include "DirectoryEntrySource.h"
#include "NavigationHistory.h"
#include "TagStore.h"

class ViewPipeline;
struct OperationError;

class FolderPaneModel : public QAbstractListModel, public QQmlParserStatus
{
    Q_OBJECT
    QML_ELEMENT
    Q_INTERFACES(QQmlParserStatus)

    Q_PROPERTY(QString rootPath READ rootPath WRITE setRootPath NOTIFY rootPathChanged)
    Q_PROPERTY(QString settingsKey READ settingsKey WRITE setSettingsKey NOTIFY settingsKeyChanged)
    Q_PROPERTY(QString searchText READ searchText WRITE setSearchText NOTIFY searchTextChanged)
    Q_PROPERTY(TagStore *tagStore READ tagStore WRITE setTagStore NOTIFY tagStoreChanged)
    Q_PROPERTY(bool canGoBack READ canGoBack NOTIFY historyChanged)
    Q_PROPERTY(bool canGoForward READ canGoForward NOTIFY historyChanged)

public:
    enum Role {
        FileNameRole = Qt::UserRole + 1,
        RawNameRole,
        FilePathRole,
        IsDirRole,
        IsDisabledRole,
        SizeRole,
        ModifiedRole,
        TagsRole
    };
    Q_ENUM(Role)

    explicit FolderPaneModel(QObject *parent = nullptr);

    QString rootPath() const;
    void setRootPath(const QString &path);

    QString settingsKey() const;
    void setSettingsKey(const QString &key);

    QString searchText() const;
    void setSearchText(const QString &text);

    TagStore *tagStore() const;
    void setTagStore(TagStore *tagStore);

    bool canGoBack() const;
    bool canGoForward() const;

    const ViewPipeline &pipeline() const;

    void classBegin() override;
    void componentComplete() override;

    int rowCount(const QModelIndex &parent = QModelIndex()) const override;
    QVariant data(const QModelIndex &index, int role = Qt::DisplayRole) const override;
    QHash<int, QByteArray> roleNames() const override;

    Q_INVOKABLE void refresh();
    Q_INVOKABLE void activate(int row);
    Q_INVOKABLE void goUp();
    Q_INVOKABLE void goBack();
    Q_INVOKABLE void goForward();
    Q_INVOKABLE QString pathForRow(int row) const;
    Q_INVOKABLE int rowForPath(const QString &path) const;
    Q_INVOKABLE QStringList tagsForPath(const QString &path) const;
    Q_INVOKABLE QVariantMap toggle(const QString &path);
    Q_INVOKABLE QVariantMap addTag(const QString &path, const QString &tag);
    Q_INVOKABLE QVariantMap removeTag(const QString &path, const QString &tag);
    Q_INVOKABLE QVariantMap clearTags(const QString &path);

signals:
    void rootPathChanged();
    void settingsKeyChanged();
    void searchTextChanged();
    void tagStoreChanged();
    void historyChanged();
    void operationFailed(QVariantMap result);

    void folderActivated(const QString &path);
    void fileActivated(const QString &path);

private:
    void navigateTo(const QString &path, bool recordHistory);
    QVariantMap tagResult(const QString &path, bool ok, const OperationError &error);
    QVariantMap failure(const OperationError &error);
    void resetRows();

    QString m_settingsKey;
    QPointer<TagStore> m_tagStore;
    NavigationHistory m_history;
    DirectoryEntrySource m_entrySource;
    ViewPipeline *m_pipeline = nullptr;
};
