#ifndef SQLHELPERS_H
#define SQLHELPERS_H

#include <QString>
#include <QVariant>

// Пустая строка пишется в БД как NULL
inline QVariant nullableText(const QString &value)
{
    const QString trimmed = value.trimmed();
    return trimmed.isEmpty() ? QVariant() : QVariant(trimmed);
}

// 0 - "нет ссылки"
inline QVariant nullableId(int id)
{
    return id > 0 ? QVariant(id) : QVariant();
}

inline int idFromVariant(const QVariant &value)
{
    return value.isNull() ? 0 : value.toInt();
}

#endif // SQLHELPERS_H
