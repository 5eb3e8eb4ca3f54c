#include "repositories/OrderRepository.h"
#include "repositories/SqlHelpers.h"
#include "DateUtils.h"

#include <QSqlQuery>
#include <QSqlError>
#include <QLoggingCategory>

Q_LOGGING_CATEGORY(orderRepo, "repository.order")

OrderRepository::OrderRepository(QSqlDatabase db)
    : m_db(db)
{
    if (!m_db.isOpen()) {
        qCritical(orderRepo) << "OrderRepository: Database is not open";
    }
}

bool OrderRepository::executeQuery(QSqlQuery& q, const QString& context) const
{
    if (!q.exec()) {
        qCritical(orderRepo) << "OrderRepository::" << context << "- SQL error:" << q.lastError().text();
        qCritical(orderRepo) << "OrderRepository::" << context << "- SQL:" << q.executedQuery();
        return false;
    }
    return true;
}

Order OrderRepository::findById(int id)
{
    if (id <= 0) return Order();

    QSqlQuery q(m_db);
    q.prepare(R"(
        SELECT id, user_id, total_amount, payment_method, status, created_at
        FROM orders
        WHERE id = :id
    )");
    q.bindValue(":id", id);

    if (!executeQuery(q, "findById")) return Order();
    if (!q.next()) return Order();

    Order o;
    o.id = q.value("id").toInt();
    o.userId = idFromVariant(q.value("user_id"));
    o.totalAmount = decimalFromVariant(q.value("total_amount"));
    o.paymentMethod = q.value("payment_method").toString();
    o.status = q.value("status").toString();
    o.createdAt = fromDbDateTime(q.value("created_at"));
    return o;
}

bool OrderRepository::findLines(int orderId, QList<OrderLine>* lines)
{
    if (orderId <= 0) return false;

    QSqlQuery q(m_db);
    q.prepare(R"(
        SELECT oi.id, oi.product_id, oi.quantity, p.cost_price,
               (SELECT COALESCE(SUM(pi.portions * ing.price), 0)
                FROM product_ingredients pi
                JOIN ingredients ing ON ing.id = pi.ingredient_id
                WHERE pi.product_id = oi.product_id) AS recipe_cost
        FROM order_items oi
        JOIN products p ON p.id = oi.product_id
        WHERE oi.order_id = :order
        ORDER BY oi.id
    )");
    q.bindValue(":order", orderId);

    if (!executeQuery(q, "findLines")) return false;

    while (q.next()) {
        OrderLine line;
        line.orderItemId = q.value("id").toInt();
        line.productId = q.value("product_id").toInt();
        line.quantity = decimalFromVariant(q.value("quantity"));
        if (!q.value("cost_price").isNull()) {
            line.productCostPrice = decimalFromVariant(q.value("cost_price"));
        }
        line.recipeCost = decimalFromVariant(q.value("recipe_cost"));
        lines->append(line);
    }

    for (OrderLine& line : *lines) {
        if (!loadExtras(&line)) return false;
    }
    return true;
}

bool OrderRepository::loadExtras(OrderLine* line)
{
    QSqlQuery q(m_db);
    q.prepare(R"(
        SELECT oie.ingredient_id, oie.type, oie.quantity, oie.delta,
               i.price, i.stock_unit, i.base_portion_quantity, i.base_portion_unit
        FROM order_item_extras oie
        LEFT JOIN ingredients i ON i.id = oie.ingredient_id
        WHERE oie.order_item_id = :item
        ORDER BY oie.id
    )");
    q.bindValue(":item", line->orderItemId);

    if (!executeQuery(q, "loadExtras")) return false;

    while (q.next()) {
        OrderLineExtra extra;
        extra.ingredientId = q.value("ingredient_id").toInt();
        extra.type = q.value("type").toString();
        extra.quantity = decimalFromVariant(q.value("quantity"));
        extra.delta = decimalFromVariant(q.value("delta"));
        extra.ingredientPrice = decimalFromVariant(q.value("price"));
        extra.stockUnit = q.value("stock_unit").toString();
        if (!q.value("base_portion_quantity").isNull()) {
            extra.basePortionQuantity = decimalFromVariant(q.value("base_portion_quantity"));
        }
        extra.basePortionUnit = q.value("base_portion_unit").toString();
        line->extras.append(extra);
    }
    return true;
}
