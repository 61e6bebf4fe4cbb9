#pragma once

#include <QHash>
#include <QObject>
#include <QString>
#include <QStringList>
#include <QVariantMap>

#include <QtQml/qqml.h>

struct OperationError;

class TagStore : public QObject
{
    Q_OBJECT
    QML_ELEMENT
    QML_UNCREATABLE("TagStore is provided by the application")

    Q_PROPERTY(QString storagePath READ storagePath NOTIFY storagePathChanged)

public:
    explicit TagStore(QObject *parent = nullptr);

    QString storagePath() const;

    bool load(const QString &storagePath, OperationError *error = nullptr);
    bool save(OperationError *error = nullptr) const;

    Q_INVOKABLE QStringList tags(const QString &path) const;
    Q_INVOKABLE bool hasTags(const QString &path) const;
    QStringList paths() const;

    bool addTag(const QString &path, const QString &tag, OperationError *error = nullptr);
    bool removeTag(const QString &path, const QString &tag, OperationError *error = nullptr);
    bool setTags(const QString &path, const QStringList &tags, OperationError *error = nullptr);
    bool clearTags(const QString &path, OperationError *error = nullptr);
    bool movePath(const QString &fromPath, const QString &toPath, OperationError *error = nullptr);

signals:
    void storagePathChanged();
    void tagsChanged(const QString &path);

private:
    static QStringList distinctTags(const QStringList &tags);
    bool commit(const QString &normalizedPath, OperationError *error);

    QString m_storagePath;
    QHash<QString, QStringList> m_tags;
};
