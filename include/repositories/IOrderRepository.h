#ifndef IORDERREPOSITORY_H
#define IORDERREPOSITORY_H

#include <QDateTime>
#include <QList>
#include <QString>

#include <optional>

#include "DecimalUtils.h"

/**
 * @brief Заголовок заказа (заказы ведёт внешняя система, здесь только чтение)
 */
struct Order {
    int id = 0;
    int userId = 0;
    Decimal totalAmount = 0;
    QString paymentMethod;
    QString status;
    QDateTime createdAt;

    bool isValid() const { return id > 0; }
};

/**
 * @brief Доп или изменение базового рецепта в строке заказа
 *
 * type "extra" - количество порций quantity; type "base" - учитывается только delta > 0.
 */
struct OrderLineExtra {
    int ingredientId = 0;
    QString type;
    Decimal quantity = 0;
    Decimal delta = 0;
    Decimal ingredientPrice = 0;
    QString stockUnit;
    Decimal basePortionQuantity = 1;
    QString basePortionUnit;
};

struct OrderLine {
    int orderItemId = 0;
    int productId = 0;
    Decimal quantity = 0;
    std::optional<Decimal> productCostPrice;   // products.cost_price, если задана
    Decimal recipeCost = 0;                    // SUM(portions * price) по рецепту
    QList<OrderLineExtra> extras;
};

class IOrderRepository
{
public:
    virtual ~IOrderRepository() = default;

    virtual Order findById(int id) = 0;

    /**
     * @brief Строки заказа со стоимостью рецепта и допами
     * @return false при ошибке SQL
     */
    virtual bool findLines(int orderId, QList<OrderLine> *lines) = 0;
};

#endif // IORDERREPOSITORY_H
