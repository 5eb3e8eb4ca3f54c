#ifndef FINANCIALMOVEMENTREPOSITORY_H
#define FINANCIALMOVEMENTREPOSITORY_H

#include <QSqlDatabase>
#include <QSqlQuery>
#include <QVariantList>
#include "repositories/IFinancialMovementRepository.h"

class FinancialMovementRepository : public IFinancialMovementRepository
{
public:
    explicit FinancialMovementRepository(QSqlDatabase db);

    int create(TransactionContext& tx, const FinancialMovement& movement) override;
    FinancialMovement findById(int id) override;
    QList<FinancialMovement> find(const MovementFilter& filter, int limit, int offset) override;
    int count(const MovementFilter& filter) override;
    QList<FinancialMovement> findByRelatedEntity(const QString& entityType, int entityId) override;
    bool update(TransactionContext& tx, const FinancialMovement& movement) override;
    bool deleteById(TransactionContext& tx, int id) override;
    int deleteByRelatedEntity(TransactionContext& tx, const QString& entityType, int entityId) override;

    bool sumPaidByType(const QDateTime& from, const QDateTime& to,
                       QMap<MovementType, Decimal>* totals) override;
    bool sumPendingObligations(const QDateTime& from, const QDateTime& to, Decimal* total) override;

private:
    FinancialMovement movementFromQuery(const QSqlQuery& q) const;
    bool executeQuery(QSqlQuery& q, const QString& context) const;

    static QString whereClause(const MovementFilter& filter, QVariantList* params);

private:
    QSqlDatabase m_db;
};

#endif // FINANCIALMOVEMENTREPOSITORY_H
