#ifndef INGREDIENTREPOSITORY_H
#define INGREDIENTREPOSITORY_H

#include <QSqlDatabase>
#include <QSqlQuery>
#include "repositories/IIngredientRepository.h"

class IngredientRepository : public IIngredientRepository
{
public:
    explicit IngredientRepository(QSqlDatabase db);

    int create(TransactionContext& tx, const Ingredient& ingredient) override;
    Ingredient findById(int id) override;
    bool findByIds(const QList<int>& ids, QMap<int, Ingredient>* out) override;
    StockAdjustment adjustStock(TransactionContext& tx, int ingredientId, const Decimal& delta) override;

private:
    Ingredient ingredientFromQuery(const QSqlQuery& q) const;
    bool executeQuery(QSqlQuery& q, const QString& context) const;

private:
    QSqlDatabase m_db;
};

#endif // INGREDIENTREPOSITORY_H
