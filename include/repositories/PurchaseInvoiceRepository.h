#ifndef PURCHASEINVOICEREPOSITORY_H
#define PURCHASEINVOICEREPOSITORY_H

#include <QSqlDatabase>
#include <QSqlQuery>
#include <QVariantList>
#include "repositories/IPurchaseInvoiceRepository.h"

class PurchaseInvoiceRepository : public IPurchaseInvoiceRepository
{
public:
    explicit PurchaseInvoiceRepository(QSqlDatabase db);

    int create(TransactionContext& tx, const PurchaseInvoice& invoice) override;
    PurchaseInvoice findById(int id) override;
    QList<PurchaseInvoice> find(const InvoiceFilter& filter, int limit, int offset) override;
    int count(const InvoiceFilter& filter) override;
    QList<PurchaseInvoiceItem> findItems(int invoiceId) override;
    int insertItem(TransactionContext& tx, int invoiceId, const PurchaseInvoiceItem& item) override;
    int deleteItems(TransactionContext& tx, int invoiceId) override;
    bool updateHeader(TransactionContext& tx, const PurchaseInvoice& invoice) override;
    bool updatePaymentStatus(TransactionContext& tx, int invoiceId,
                             PaymentStatus status, const QDateTime& paymentDate) override;
    bool deleteById(TransactionContext& tx, int id) override;

private:
    PurchaseInvoice invoiceFromQuery(const QSqlQuery& q) const;
    PurchaseInvoiceItem itemFromQuery(const QSqlQuery& q) const;
    bool executeQuery(QSqlQuery& q, const QString& context) const;

    static QString whereClause(const InvoiceFilter& filter, QVariantList* params);

private:
    QSqlDatabase m_db;
};

#endif // PURCHASEINVOICEREPOSITORY_H
