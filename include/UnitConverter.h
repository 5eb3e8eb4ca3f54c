#ifndef UNITCONVERTER_H
#define UNITCONVERTER_H

#include <QHash>
#include <QString>

#include <stdexcept>

#include "DecimalUtils.h"

class UnitConversionError : public std::runtime_error
{
public:
    explicit UnitConversionError(const QString &message)
        : std::runtime_error(message.toStdString())
    {
    }
};

enum class UnitFamily {
    Mass,
    Volume,
    Count
};

/**
 * @brief Порт конвертации единиц измерения
 */
class IUnitConverter
{
public:
    virtual ~IUnitConverter() = default;

    /**
     * @brief Перевести количество из одной единицы в другую
     * @throws UnitConversionError для неизвестной единицы или разных семейств
     */
    virtual Decimal convert(const Decimal &quantity, const QString &fromUnit, const QString &toUnit) const = 0;
};

/**
 * @brief Детерминированная конвертация масса/объём/штуки по фиксированным коэффициентам
 */
class UnitConverter : public IUnitConverter
{
public:
    UnitConverter();

    Decimal convert(const Decimal &quantity, const QString &fromUnit, const QString &toUnit) const override;

    bool isKnownUnit(const QString &unit) const;
    bool areCompatible(const QString &a, const QString &b) const;

    // "KG", "Quilo", "kg " -> "kg"
    QString canonicalUnit(const QString &unit) const;

    /**
     * @brief Сколько базовых единиц порции в одной единице закупки (kg -> g = 1000)
     */
    Decimal unitsPerPurchaseUnit(const QString &purchaseUnit, const QString &portionUnit) const;

private:
    struct UnitInfo {
        UnitFamily family = UnitFamily::Count;
        Decimal factorToBase = 1;
    };

    UnitInfo lookup(const QString &unit) const;

private:
    QHash<QString, QString> m_aliases;
    QHash<QString, UnitInfo> m_units;
};

/**
 * @brief Стоимость одной базовой порции ингредиента
 *
 * costPerBasePortion = (price / unitsPerPurchaseUnit) * basePortionQuantity.
 * Для одинаковых единиц конвертация пропускается; при ошибке конвертации
 * пишется предупреждение и используется price * basePortionQuantity.
 */
Decimal costPerBasePortion(const IUnitConverter &converter,
                           const Decimal &price,
                           const QString &stockUnit,
                           const Decimal &basePortionQuantity,
                           const QString &basePortionUnit);

#endif // UNITCONVERTER_H
