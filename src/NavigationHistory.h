#pragma once

#include <QString>
#include <QStringList>

class NavigationHistory
{
public:
    void push(const QString &path);
    QString back();
    QString forward();
    void clear();

    bool canGoBack() const;
    bool canGoForward() const;
    QString current() const;
    QStringList paths() const;
    int cursor() const;

private:
    QStringList m_paths;
    int m_cursor = -1;
};
