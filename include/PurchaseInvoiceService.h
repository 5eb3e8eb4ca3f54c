#ifndef PURCHASEINVOICESERVICE_H
#define PURCHASEINVOICESERVICE_H

#include <QJsonObject>
#include <QObject>
#include <QSqlDatabase>

#include "LedgerService.h"
#include "PurchaseInvoiceTypes.h"
#include "ServiceResult.h"
#include "repositories/IAuditRepository.h"
#include "repositories/IFinancialMovementRepository.h"
#include "repositories/IIngredientRepository.h"
#include "repositories/IPurchaseInvoiceRepository.h"

class PermissionGate;
class TransactionContext;

/**
 * @brief Накладные поставщиков: остатки, связанная расходная запись и журнал изменений
 *
 * Каждая операция - одна транзакция: заголовок, строки, остатки ингредиентов
 * и связанное движение EXPENSE применяются целиком или не применяются вовсе.
 */
class PurchaseInvoiceService : public QObject, public IPurchaseInvoiceDeleter
{
    Q_OBJECT

public:
    explicit PurchaseInvoiceService(
        QSqlDatabase db,
        IPurchaseInvoiceRepository* invoiceRepo,
        IIngredientRepository* ingredientRepo,
        IFinancialMovementRepository* movementRepo,
        IAuditRepository* auditRepo,
        LedgerService* ledger,
        PermissionGate* permissions,
        QObject *parent = nullptr
    );

    ServiceResult<PurchaseInvoice> create(const InvoiceDraft& draft, int userId);
    ServiceResult<PurchaseInvoice> update(int id, const InvoicePatch& patch, int userId);

    /**
     * @brief Удалить накладную с откатом остатков
     *
     * При нехватке остатка возвращает InsufficientStock и список нехваток, ничего не меняя.
     */
    ServiceResult<InvoiceDeletion> deleteInvoice(int invoiceId, int userId) override;

    ServiceResult<PurchaseInvoice> getById(int id);
    ServiceResult<InvoicePage> list(const InvoiceFilter& filter, int page, int pageSize);

    QList<AuditEntry> history(int invoiceId);

    /**
     * @brief Проверка и нормализация строк: цена за единицу, сумма строки, существование ингредиентов
     */
    ServiceResult<QList<PurchaseInvoiceItem>> prepareItems(const QList<InvoiceItemDraft>& drafts);

    static QJsonObject snapshot(const PurchaseInvoice& invoice);

private:
    ServiceResult<bool> applyItems(TransactionContext& tx, int invoiceId, const QList<PurchaseInvoiceItem>& items);
    ServiceResult<bool> reverseItems(TransactionContext& tx, const QList<PurchaseInvoiceItem>& items);
    ServiceResult<bool> syncLinkedExpense(TransactionContext& tx, const PurchaseInvoice& invoice, int userId);
    MovementDraft expenseDraft(const PurchaseInvoice& invoice, int userId) const;
    void writeAudit(TransactionContext& tx, const AuditEntry& entry);

private:
    QSqlDatabase m_db;
    IPurchaseInvoiceRepository* m_invoiceRepo;
    IIngredientRepository* m_ingredientRepo;
    IFinancialMovementRepository* m_movementRepo;
    IAuditRepository* m_auditRepo;
    LedgerService* m_ledger;
    PermissionGate* m_permissions;
};

#endif // PURCHASEINVOICESERVICE_H
