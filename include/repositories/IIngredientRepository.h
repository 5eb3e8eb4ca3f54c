#ifndef IINGREDIENTREPOSITORY_H
#define IINGREDIENTREPOSITORY_H

#include <QList>
#include <QMap>
#include <QString>

#include "DecimalUtils.h"

class TransactionContext;

/**
 * @brief Ингредиент склада
 *
 * price - цена за единицу склада (stockUnit), basePortion* - порция, в которой
 * ингредиент указывается в рецептах и допах.
 */
struct Ingredient {
    int id = 0;
    QString name;
    Decimal price = 0;
    Decimal currentStock = 0;
    QString stockUnit = "un";
    Decimal basePortionQuantity = 1;
    QString basePortionUnit = "un";

    bool isValid() const { return id > 0; }
};

/**
 * @brief Результат изменения остатка
 */
enum class StockAdjustment {
    Applied,
    NotFound,
    WouldGoNegative,
    Conflict,       // остаток изменился между чтением и записью
    Failed
};

class IIngredientRepository
{
public:
    virtual ~IIngredientRepository() = default;

    virtual int create(TransactionContext &tx, const Ingredient &ingredient) = 0;
    virtual Ingredient findById(int id) = 0;

    /**
     * @brief Пакетная выборка одним запросом; отсутствующих ID в результате нет
     * @return false при ошибке SQL
     */
    virtual bool findByIds(const QList<int> &ids, QMap<int, Ingredient> *out) = 0;

    /**
     * @brief Прибавить delta к current_stock (compare-and-swap по прочитанному значению)
     *
     * Уменьшение ниже нуля не применяется.
     */
    virtual StockAdjustment adjustStock(TransactionContext &tx, int ingredientId, const Decimal &delta) = 0;
};

#endif // IINGREDIENTREPOSITORY_H
