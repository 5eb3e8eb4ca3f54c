#include "UnitConverter.h"

#include <QLoggingCategory>

Q_LOGGING_CATEGORY(unitConv, "service.units")

UnitConverter::UnitConverter()
{
    // базовые единицы: g, ml, un
    m_units.insert("mg", UnitInfo{UnitFamily::Mass, Decimal("0.001")});
    m_units.insert("g",  UnitInfo{UnitFamily::Mass, Decimal(1)});
    m_units.insert("kg", UnitInfo{UnitFamily::Mass, Decimal(1000)});

    m_units.insert("ml", UnitInfo{UnitFamily::Volume, Decimal(1)});
    m_units.insert("l",  UnitInfo{UnitFamily::Volume, Decimal(1000)});

    m_units.insert("un", UnitInfo{UnitFamily::Count, Decimal(1)});
    m_units.insert("dz", UnitInfo{UnitFamily::Count, Decimal(12)});

    const QList<QPair<QString, QString>> aliases = {
        {"mg", "mg"}, {"miligrama", "mg"}, {"miligramas", "mg"},
        {"g", "g"}, {"gr", "g"}, {"grama", "g"}, {"gramas", "g"},
        {"kg", "kg"}, {"quilo", "kg"}, {"quilos", "kg"}, {"quilograma", "kg"}, {"quilogramas", "kg"},
        {"ml", "ml"}, {"mililitro", "ml"}, {"mililitros", "ml"},
        {"l", "l"}, {"lt", "l"}, {"litro", "l"}, {"litros", "l"},
        {"un", "un"}, {"und", "un"}, {"unid", "un"}, {"unidade", "un"}, {"unidades", "un"}, {"pc", "un"},
        {"dz", "dz"}, {"duzia", "dz"}, {"dúzia", "dz"}
    };
    for (const auto &alias : aliases) {
        m_aliases.insert(alias.first, alias.second);
    }
}

QString UnitConverter::canonicalUnit(const QString &unit) const
{
    const QString key = unit.trimmed().toLower();
    return m_aliases.value(key, QString());
}

bool UnitConverter::isKnownUnit(const QString &unit) const
{
    return !canonicalUnit(unit).isEmpty();
}

bool UnitConverter::areCompatible(const QString &a, const QString &b) const
{
    const QString ca = canonicalUnit(a);
    const QString cb = canonicalUnit(b);
    if (ca.isEmpty() || cb.isEmpty()) return false;
    return m_units.value(ca).family == m_units.value(cb).family;
}

UnitConverter::UnitInfo UnitConverter::lookup(const QString &unit) const
{
    const QString canonical = canonicalUnit(unit);
    if (canonical.isEmpty()) {
        throw UnitConversionError(QString("Unknown unit '%1'").arg(unit));
    }
    return m_units.value(canonical);
}

Decimal UnitConverter::convert(const Decimal &quantity, const QString &fromUnit, const QString &toUnit) const
{
    const UnitInfo from = lookup(fromUnit);
    const UnitInfo to = lookup(toUnit);

    if (from.family != to.family) {
        throw UnitConversionError(QString("Cannot convert '%1' to '%2'").arg(fromUnit, toUnit));
    }

    return quantity * from.factorToBase / to.factorToBase;
}

Decimal UnitConverter::unitsPerPurchaseUnit(const QString &purchaseUnit, const QString &portionUnit) const
{
    return convert(Decimal(1), purchaseUnit, portionUnit);
}

Decimal costPerBasePortion(const IUnitConverter &converter,
                           const Decimal &price,
                           const QString &stockUnit,
                           const Decimal &basePortionQuantity,
                           const QString &basePortionUnit)
{
    if (stockUnit.trimmed().compare(basePortionUnit.trimmed(), Qt::CaseInsensitive) == 0) {
        return price * basePortionQuantity;
    }

    try {
        const Decimal units = converter.convert(Decimal(1), stockUnit, basePortionUnit);
        if (units <= 0) {
            throw UnitConversionError(QString("Non-positive ratio %1 -> %2").arg(stockUnit, basePortionUnit));
        }
        return price / units * basePortionQuantity;
    } catch (const UnitConversionError &e) {
        qWarning(unitConv) << "costPerBasePortion: conversion failed, using naive multiplication:" << e.what();
        return price * basePortionQuantity;
    }
}
