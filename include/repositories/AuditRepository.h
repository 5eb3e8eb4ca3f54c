#ifndef AUDITREPOSITORY_H
#define AUDITREPOSITORY_H

#include <QSqlDatabase>
#include <QSqlQuery>
#include "repositories/IAuditRepository.h"

class AuditRepository : public IAuditRepository
{
public:
    explicit AuditRepository(QSqlDatabase db);

    int record(TransactionContext& tx, const AuditEntry& entry) override;
    QList<AuditEntry> findByInvoice(int invoiceId) override;

private:
    AuditEntry entryFromQuery(const QSqlQuery& q) const;
    bool executeQuery(QSqlQuery& q, const QString& context) const;

private:
    QSqlDatabase m_db;
};

#endif // AUDITREPOSITORY_H
