#ifndef DECIMALUTILS_H
#define DECIMALUTILS_H

#include <QRegularExpression>
#include <QString>
#include <QVariant>

#include <boost/multiprecision/cpp_dec_float.hpp>

#include <exception>
#include <iomanip>
#include <sstream>

using Decimal = boost::multiprecision::cpp_dec_float_50;

inline Decimal decimalFromString(const QString &input)
{
    QString normalized = input.trimmed();
    if (normalized.isEmpty()) {
        return Decimal(0);
    }
    normalized.replace(',', '.');
    try {
        return Decimal(normalized.toStdString());
    } catch (const std::exception&) {
        return Decimal(0);
    }
}

inline Decimal decimalFromVariant(const QVariant &value)
{
    return decimalFromString(value.toString());
}

/**
 * @brief Строгий разбор: в отличие от decimalFromString не подменяет мусор нулём
 */
inline bool tryParseDecimal(const QString &input, Decimal *out)
{
    static const QRegularExpression pattern(
        QStringLiteral("^[+-]?(\\d+(\\.\\d*)?|\\.\\d+)([eE][+-]?\\d+)?$"));

    QString normalized = input.trimmed();
    normalized.replace(',', '.');
    if (normalized.isEmpty() || !pattern.match(normalized).hasMatch()) {
        return false;
    }
    try {
        *out = Decimal(normalized.toStdString());
    } catch (const std::exception&) {
        return false;
    }
    return true;
}

inline QString decimalToString(const Decimal &value, int decimals = 2)
{
    std::ostringstream stream;
    stream << std::fixed << std::setprecision(decimals) << value;
    return QString::fromStdString(stream.str());
}

// Округление "половина от нуля" до places знаков
inline Decimal decimalRound(const Decimal &value, int places)
{
    Decimal scale = 1;
    for (int i = 0; i < places; ++i) {
        scale *= 10;
    }
    Decimal scaled = value * scale;
    Decimal rounded = boost::multiprecision::round(scaled);
    return rounded / scale;
}

/**
 * @brief Запись без хвостовых нулей: 39.9000 -> "39.9", 50.00 -> "50"
 */
inline QString decimalToPlainString(const Decimal &value, int maxDecimals = 10)
{
    QString text = decimalToString(decimalRound(value, maxDecimals), maxDecimals);
    if (text.contains('.')) {
        while (text.endsWith('0')) {
            text.chop(1);
        }
        if (text.endsWith('.')) {
            text.chop(1);
        }
    }
    if (text == "-0") {
        return QStringLiteral("0");
    }
    return text;
}

inline int decimalPlaces(const Decimal &value)
{
    const QString text = decimalToPlainString(value, 10);
    const int dot = text.indexOf('.');
    return dot < 0 ? 0 : text.size() - dot - 1;
}

/**
 * @brief Нормализация цены за единицу закупки
 *
 * Считается с точностью 10 знаков; если после нормализации остаётся
 * больше двух значащих знаков (артефакт float), округляется до копеек.
 * 39.9 и 39.99 остаются как есть, 39.9000000001 становится 39.9.
 */
inline Decimal quantizeUnitPrice(const Decimal &value)
{
    Decimal quantized = decimalRound(value, 10);
    if (decimalPlaces(quantized) > 2) {
        quantized = decimalRound(quantized, 2);
    }
    return quantized;
}

inline Decimal roundMoney(const Decimal &value)
{
    return decimalRound(value, 2);
}

inline QString moneyToString(const Decimal &value)
{
    return decimalToString(roundMoney(value), 2);
}

#endif // DECIMALUTILS_H
