#ifndef RECURRENCERULEREPOSITORY_H
#define RECURRENCERULEREPOSITORY_H

#include <QSqlDatabase>
#include <QSqlQuery>
#include "repositories/IRecurrenceRuleRepository.h"

class RecurrenceRuleRepository : public IRecurrenceRuleRepository
{
public:
    explicit RecurrenceRuleRepository(QSqlDatabase db);

    int create(TransactionContext& tx, const RecurrenceRule& rule) override;
    RecurrenceRule findById(int id) override;
    QList<RecurrenceRule> findAll(bool activeOnly) override;
    bool update(TransactionContext& tx, const RecurrenceRule& rule) override;
    bool setActive(TransactionContext& tx, int id, bool active) override;
    PeriodClaim claimPeriod(TransactionContext& tx, int ruleId, const QString& periodKey) override;
    bool attachMovement(TransactionContext& tx, int ruleId, const QString& periodKey, int movementId) override;

private:
    RecurrenceRule ruleFromQuery(const QSqlQuery& q) const;
    bool executeQuery(QSqlQuery& q, const QString& context) const;

private:
    QSqlDatabase m_db;
};

#endif // RECURRENCERULEREPOSITORY_H
