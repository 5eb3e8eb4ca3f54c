#ifndef DATEUTILS_H
#define DATEUTILS_H

#include <QDateTime>
#include <QString>
#include <QVariant>

// Формат хранения в SQLite: совпадает с datetime('now'), сравнивается лексикографически
inline const QString& dbDateTimeFormat()
{
    static const QString format = QStringLiteral("yyyy-MM-dd HH:mm:ss");
    return format;
}

inline QString toDbDateTime(const QDateTime &value)
{
    return value.isValid() ? value.toString(dbDateTimeFormat()) : QString();
}

inline QVariant toDbDateTimeVariant(const QDateTime &value)
{
    return value.isValid() ? QVariant(toDbDateTime(value)) : QVariant();
}

inline QDateTime fromDbDateTime(const QVariant &value)
{
    if (value.isNull()) return QDateTime();

    const QString text = value.toString().trimmed();
    if (text.isEmpty()) return QDateTime();

    QDateTime dt = QDateTime::fromString(text, dbDateTimeFormat());
    if (!dt.isValid()) {
        dt = QDateTime::fromString(text, Qt::ISODate);
    }
    return dt;
}

inline QString toIsoString(const QDateTime &value)
{
    return value.isValid() ? value.toString(Qt::ISODate) : QString();
}

/**
 * @brief Разбор даты из внешнего ввода
 *
 * Принимает DD-MM-YYYY, YYYY-MM-DD, YYYY-MM-DDTHH:MM:SS (также с пробелом
 * вместо T, с долями секунды и суффиксом Z/смещением).
 * @return Невалидный QDateTime, если строку разобрать не удалось
 */
inline QDateTime parseFlexibleDateTime(const QString &input)
{
    const QString text = input.trimmed();
    if (text.isEmpty()) return QDateTime();

    const QDate dmy = QDate::fromString(text, QStringLiteral("dd-MM-yyyy"));
    if (dmy.isValid()) {
        return dmy.startOfDay();
    }

    if (text.size() == 10) {
        const QDate ymd = QDate::fromString(text, Qt::ISODate);
        return ymd.isValid() ? ymd.startOfDay() : QDateTime();
    }

    QString iso = text;
    if (iso.size() > 10 && iso.at(10) == ' ') {
        iso[10] = 'T';
    }

    QDateTime dt = QDateTime::fromString(iso, Qt::ISODateWithMs);
    if (!dt.isValid()) {
        dt = QDateTime::fromString(iso, Qt::ISODate);
    }
    if (!dt.isValid()) return QDateTime();

    if (dt.timeSpec() != Qt::LocalTime) {
        dt = dt.toLocalTime();
    }
    return dt;
}

#endif // DATEUTILS_H
