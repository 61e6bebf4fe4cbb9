#pragma once

#include <QString>
#include <QVariantMap>

struct OperationError {
    enum Kind {
        None = 0,
        NotFound,
        RenameConflict,
        IOFailure,
        CorruptStore,
        PersistFailure
    };

    Kind kind = None;
    QString path;
    QString message;

    bool isError() const { return kind != None; }
    QVariantMap toVariantMap() const;

    static QString kindName(Kind kind);
    static void report(OperationError *error, Kind kind, const QString &path, const QString &message);
};
