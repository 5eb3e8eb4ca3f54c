#include "repositories/IngredientRepository.h"
#include "TransactionContext.h"

#include <QSqlQuery>
#include <QSqlError>
#include <QStringList>
#include <QLoggingCategory>

Q_LOGGING_CATEGORY(ingredientRepo, "repository.ingredient")

IngredientRepository::IngredientRepository(QSqlDatabase db)
    : m_db(db)
{
    if (!m_db.isOpen()) {
        qCritical(ingredientRepo) << "IngredientRepository: Database is not open";
    }
}

bool IngredientRepository::executeQuery(QSqlQuery& q, const QString& context) const
{
    if (!q.exec()) {
        qCritical(ingredientRepo) << "IngredientRepository::" << context << "- SQL error:" << q.lastError().text();
        qCritical(ingredientRepo) << "IngredientRepository::" << context << "- SQL:" << q.executedQuery();
        return false;
    }
    return true;
}

Ingredient IngredientRepository::ingredientFromQuery(const QSqlQuery& q) const
{
    Ingredient i;
    i.id = q.value("id").toInt();
    i.name = q.value("name").toString();
    i.price = decimalFromVariant(q.value("price"));
    i.currentStock = decimalFromVariant(q.value("current_stock"));
    i.stockUnit = q.value("stock_unit").toString();
    i.basePortionQuantity = decimalFromVariant(q.value("base_portion_quantity"));
    i.basePortionUnit = q.value("base_portion_unit").toString();
    return i;
}

int IngredientRepository::create(TransactionContext& tx, const Ingredient& ingredient)
{
    if (ingredient.name.trimmed().isEmpty()) return -1;

    QSqlQuery q(tx.database());
    q.prepare(R"(
        INSERT INTO ingredients (name, price, current_stock, stock_unit, base_portion_quantity, base_portion_unit)
        VALUES (:name, :price, :stock, :stock_unit, :portion_qty, :portion_unit)
    )");
    q.bindValue(":name", ingredient.name.trimmed());
    q.bindValue(":price", decimalToPlainString(ingredient.price));
    q.bindValue(":stock", decimalToPlainString(ingredient.currentStock));
    q.bindValue(":stock_unit", ingredient.stockUnit);
    q.bindValue(":portion_qty", decimalToPlainString(ingredient.basePortionQuantity));
    q.bindValue(":portion_unit", ingredient.basePortionUnit);

    if (!executeQuery(q, "create")) return -1;

    const int id = q.lastInsertId().toInt();
    return id > 0 ? id : -1;
}

Ingredient IngredientRepository::findById(int id)
{
    if (id <= 0) return Ingredient();

    QSqlQuery q(m_db);
    q.prepare(R"(
        SELECT id, name, price, current_stock, stock_unit, base_portion_quantity, base_portion_unit
        FROM ingredients
        WHERE id = :id
    )");
    q.bindValue(":id", id);

    if (!executeQuery(q, "findById")) return Ingredient();
    if (!q.next()) return Ingredient();

    return ingredientFromQuery(q);
}

bool IngredientRepository::findByIds(const QList<int>& ids, QMap<int, Ingredient>* out)
{
    if (ids.isEmpty()) return true;

    QStringList placeholders;
    for (int i = 0; i < ids.size(); ++i) placeholders << "?";

    QSqlQuery q(m_db);
    q.prepare(QString(R"(
        SELECT id, name, price, current_stock, stock_unit, base_portion_quantity, base_portion_unit
        FROM ingredients
        WHERE id IN (%1)
    )").arg(placeholders.join(", ")));
    for (int id : ids) q.addBindValue(id);

    if (!executeQuery(q, "findByIds")) return false;

    while (q.next()) {
        const Ingredient i = ingredientFromQuery(q);
        out->insert(i.id, i);
    }
    return true;
}

StockAdjustment IngredientRepository::adjustStock(TransactionContext& tx, int ingredientId, const Decimal& delta)
{
    if (ingredientId <= 0) return StockAdjustment::NotFound;

    QSqlQuery read(tx.database());
    read.prepare("SELECT current_stock FROM ingredients WHERE id = :id");
    read.bindValue(":id", ingredientId);

    if (!executeQuery(read, "adjustStock/read")) return StockAdjustment::Failed;
    if (!read.next()) return StockAdjustment::NotFound;

    // current_stock хранится текстом: сравнение в CAS точное
    const QString expected = read.value(0).toString();
    const Decimal updated = decimalFromString(expected) + delta;
    if (updated < 0) {
        qWarning(ingredientRepo) << "IngredientRepository::adjustStock: ingredient" << ingredientId
                                 << "would go negative:" << expected << "+" << decimalToPlainString(delta);
        return StockAdjustment::WouldGoNegative;
    }

    QSqlQuery write(tx.database());
    write.prepare(R"(
        UPDATE ingredients
        SET current_stock = :updated
        WHERE id = :id AND current_stock = :expected
    )");
    write.bindValue(":updated", decimalToPlainString(updated));
    write.bindValue(":id", ingredientId);
    write.bindValue(":expected", expected);

    if (!executeQuery(write, "adjustStock/write")) return StockAdjustment::Failed;

    if (write.numRowsAffected() == 0) {
        qWarning(ingredientRepo) << "IngredientRepository::adjustStock: concurrent change on ingredient" << ingredientId;
        return StockAdjustment::Conflict;
    }
    return StockAdjustment::Applied;
}
