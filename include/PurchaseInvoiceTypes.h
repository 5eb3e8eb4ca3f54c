#ifndef PURCHASEINVOICETYPES_H
#define PURCHASEINVOICETYPES_H

#include <QList>
#include <QString>

#include <optional>

#include "DecimalUtils.h"
#include "repositories/IPurchaseInvoiceRepository.h"

/**
 * @brief Строка накладной во входных данных
 *
 * quantity - в базовой единице склада; displayQuantity - в единице закупки
 * (например, 2 кг при quantity = 2000 г), используется для расчёта totalPrice.
 */
struct InvoiceItemDraft {
    int ingredientId = 0;
    std::optional<Decimal> quantity;
    std::optional<Decimal> unitPrice;
    std::optional<Decimal> totalPrice;
    std::optional<Decimal> displayQuantity;
};

struct InvoiceDraft {
    QString invoiceNumber;
    QString supplierName;
    std::optional<Decimal> totalAmount;   // сверяется с суммой строк, в БД пишется сумма строк
    QString purchaseDate;                 // пусто - сейчас
    QString paymentStatus;                // пусто - Pending
    QString paymentMethod;
    QString paymentDate;
    QString notes;
    QList<InvoiceItemDraft> items;
};

struct InvoicePatch {
    std::optional<QString> invoiceNumber;
    std::optional<QString> supplierName;
    std::optional<QString> purchaseDate;
    std::optional<QString> paymentStatus;
    std::optional<QString> paymentMethod;
    std::optional<QString> paymentDate;
    std::optional<QString> notes;
    std::optional<QList<InvoiceItemDraft>> items;

    bool isEmpty() const
    {
        return !invoiceNumber && !supplierName && !purchaseDate && !paymentStatus
               && !paymentMethod && !paymentDate && !notes && !(items && !items->isEmpty());
    }
};

/**
 * @brief Нехватка остатка для отката поступления
 */
struct StockShortage {
    int ingredientId = 0;
    QString ingredientName;
    Decimal currentStock = 0;
    Decimal required = 0;
    Decimal shortage = 0;
};

struct InvoiceDeletion {
    int invoiceId = 0;
    int removedMovements = 0;
    QList<StockShortage> shortages;
};

struct InvoicePage {
    QList<PurchaseInvoice> items;
    int total = 0;
    int page = 1;
    int pageSize = 100;
    int totalPages = 0;
};

#endif // PURCHASEINVOICETYPES_H
