#ifndef LEDGERSERVICE_H
#define LEDGERSERVICE_H

#include <QJsonObject>
#include <QObject>
#include <QSqlDatabase>
#include <QString>

#include "LedgerTypes.h"
#include "PurchaseInvoiceTypes.h"
#include "ServiceResult.h"
#include "repositories/IFinancialMovementRepository.h"
#include "repositories/IPurchaseInvoiceRepository.h"

class ICache;
class IEventPublisher;
class TransactionContext;

/**
 * @brief Каскадное удаление накладной, на которое делегируется удаление связанного движения
 */
class IPurchaseInvoiceDeleter
{
public:
    virtual ~IPurchaseInvoiceDeleter() = default;

    virtual ServiceResult<InvoiceDeletion> deleteInvoice(int invoiceId, int userId) = 0;
};

/**
 * @brief Финансовый журнал: движения, сводки, сверка
 *
 * Методы с TransactionContext присоединяются к транзакции вызывающего и не
 * трогают кэш/события: это делает владелец транзакции после commit.
 */
class LedgerService : public QObject
{
    Q_OBJECT

public:
    explicit LedgerService(
        QSqlDatabase db,
        IFinancialMovementRepository* movementRepo,
        IPurchaseInvoiceRepository* invoiceRepo,
        ICache* cache = nullptr,
        IEventPublisher* events = nullptr,
        QObject *parent = nullptr
    );

    void setInvoiceDeleter(IPurchaseInvoiceDeleter* deleter) { m_invoiceDeleter = deleter; }
    void setPagination(int defaultPageSize, int maxPageSize);
    void setCacheTtl(int seconds) { m_cacheTtlSeconds = seconds; }

    ServiceResult<FinancialMovement> create(const MovementDraft& draft);
    ServiceResult<FinancialMovement> create(const MovementDraft& draft, TransactionContext& tx);

    ServiceResult<FinancialMovement> getById(int id);

    /**
     * @brief Страница движений; pageSize ограничивается [1, maxPageSize]
     */
    ServiceResult<MovementPage> list(const MovementFilter& filter, int page, int pageSize);

    ServiceResult<FinancialMovement> update(int id, const MovementPatch& patch);

    /**
     * @brief Смена статуса оплаты с синхронизацией накладной в той же транзакции
     * @param date Пусто для Paid - текущий момент; для Pending игнорируется
     */
    ServiceResult<FinancialMovement> updatePaymentStatus(int id, const QString& status, const QString& date = QString());

    ServiceResult<FinancialMovement> updateGatewayInfo(int id, const GatewayPatch& patch);
    ServiceResult<FinancialMovement> reconcile(int id, bool reconciled);

    /**
     * @brief Удалить движение; связанное с накладной удаляется через удаление накладной
     */
    ServiceResult<bool> remove(int id, int userId);

    /**
     * @param period this_month, last_month, last_30_days, all (неизвестное значение - all)
     */
    ServiceResult<CashFlowSummary> cashFlowSummary(const QString& period, bool includePending);

    ServiceResult<ReconciliationReport> reconciliationReport(const ReconciliationQuery& query);

    /**
     * @brief Сброс кэшей списка и сводок; ошибки только логируются
     */
    void invalidateCaches();

    void publishEvent(const QString& eventType, const QJsonObject& payload);

    /**
     * @brief Границы периода сводки [from, to); невалидная граница - без ограничения
     * @return Нормализованное имя периода
     */
    static QString resolvePeriod(const QString& period, const QDate& today, QDateTime* from, QDateTime* to);

private:
    ServiceResult<FinancialMovement> buildMovement(const MovementDraft& draft) const;
    ServiceResult<FinancialMovement> applyPatch(FinancialMovement movement, const MovementPatch& patch) const;
    bool syncInvoiceStatus(TransactionContext& tx, const FinancialMovement& movement);
    ServiceResult<FinancialMovement> saveAndReload(FinancialMovement movement, const QString& context);

private:
    QSqlDatabase m_db;
    IFinancialMovementRepository* m_movementRepo;
    IPurchaseInvoiceRepository* m_invoiceRepo;
    ICache* m_cache;
    IEventPublisher* m_events;
    IPurchaseInvoiceDeleter* m_invoiceDeleter = nullptr;

    int m_defaultPageSize = 100;
    int m_maxPageSize = 1000;
    int m_cacheTtlSeconds = 60;
};

#endif // LEDGERSERVICE_H
