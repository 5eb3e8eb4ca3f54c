#ifndef IPURCHASEINVOICEREPOSITORY_H
#define IPURCHASEINVOICEREPOSITORY_H

#include <QDateTime>
#include <QList>
#include <QString>

#include <optional>

#include "DecimalUtils.h"
#include "repositories/IFinancialMovementRepository.h"

class TransactionContext;

/**
 * @brief Строка накладной поставщика
 *
 * quantity - в базовой единице склада ингредиента (именно она попадает в остаток),
 * unitPrice - цена за единицу закупки, totalPrice - сумма, выставленная поставщиком.
 */
struct PurchaseInvoiceItem {
    int id = 0;
    int invoiceId = 0;
    int ingredientId = 0;
    QString ingredientName;
    Decimal quantity = 0;
    Decimal unitPrice = 0;
    Decimal totalPrice = 0;
};

struct PurchaseInvoice {
    int id = 0;
    QString invoiceNumber;
    QString supplierName;
    Decimal totalAmount = 0;
    QDateTime purchaseDate;
    PaymentStatus paymentStatus = PaymentStatus::Pending;
    QString paymentMethod;
    QDateTime paymentDate;
    QString notes;
    int createdBy = 0;
    QString createdByName;
    QDateTime createdAt;
    QDateTime updatedAt;
    QList<PurchaseInvoiceItem> items;

    bool isValid() const { return id > 0; }
};

struct InvoiceFilter {
    QDate startDate;
    QDate endDate;
    QString supplierName;   // поиск по подстроке без учёта регистра
    std::optional<PaymentStatus> paymentStatus;
};

/**
 * @brief Интерфейс репозитория накладных поставщиков
 *
 * Изменяющие методы работают только внутри переданной транзакции.
 */
class IPurchaseInvoiceRepository
{
public:
    virtual ~IPurchaseInvoiceRepository() = default;

    /**
     * @brief Создать заголовок накладной (без строк)
     * @return ID или -1 при ошибке
     */
    virtual int create(TransactionContext &tx, const PurchaseInvoice &invoice) = 0;

    /**
     * @brief Накладная вместе со строками и именем автора
     */
    virtual PurchaseInvoice findById(int id) = 0;

    virtual QList<PurchaseInvoice> find(const InvoiceFilter &filter, int limit, int offset) = 0;
    virtual int count(const InvoiceFilter &filter) = 0;

    virtual QList<PurchaseInvoiceItem> findItems(int invoiceId) = 0;

    /**
     * @return ID строки или -1 при ошибке
     */
    virtual int insertItem(TransactionContext &tx, int invoiceId, const PurchaseInvoiceItem &item) = 0;

    /**
     * @return Число удалённых строк или -1 при ошибке
     */
    virtual int deleteItems(TransactionContext &tx, int invoiceId) = 0;

    /**
     * @brief Обновить поля заголовка (номер, поставщик, сумма, даты, оплата, примечание)
     */
    virtual bool updateHeader(TransactionContext &tx, const PurchaseInvoice &invoice) = 0;

    /**
     * @brief Синхронизация статуса оплаты из связанного движения
     *
     * Для Paid дата оплаты заполняется только если была пустой,
     * для Pending дата очищается.
     * @return false при ошибке SQL или если строка не найдена
     */
    virtual bool updatePaymentStatus(TransactionContext &tx, int invoiceId,
                                     PaymentStatus status, const QDateTime &paymentDate) = 0;

    virtual bool deleteById(TransactionContext &tx, int id) = 0;
};

#endif // IPURCHASEINVOICEREPOSITORY_H
