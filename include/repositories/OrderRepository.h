#ifndef ORDERREPOSITORY_H
#define ORDERREPOSITORY_H

#include <QSqlDatabase>
#include <QSqlQuery>
#include "repositories/IOrderRepository.h"

class OrderRepository : public IOrderRepository
{
public:
    explicit OrderRepository(QSqlDatabase db);

    Order findById(int id) override;
    bool findLines(int orderId, QList<OrderLine>* lines) override;

private:
    bool loadExtras(OrderLine* line);
    bool executeQuery(QSqlQuery& q, const QString& context) const;

private:
    QSqlDatabase m_db;
};

#endif // ORDERREPOSITORY_H
