#ifndef LEDGERTYPES_H
#define LEDGERTYPES_H

#include <QDate>
#include <QList>
#include <QMetaType>
#include <QString>

#include <optional>

#include "DecimalUtils.h"
#include "repositories/IFinancialMovementRepository.h"

/**
 * @brief Входные данные для создания движения
 *
 * Строковые поля type/paymentStatus/movementDate приходят как есть и
 * проверяются сервисом. value пустой - значение не передано или не разобрано.
 */
struct MovementDraft {
    QString type;
    std::optional<Decimal> value;
    QString category;
    QString subcategory;
    QString description;
    QString movementDate;       // DD-MM-YYYY или ISO; пусто - без даты
    QString paymentStatus;      // пусто - Pending
    QString paymentMethod;
    QString senderReceiver;
    QString relatedEntityType;
    int relatedEntityId = 0;
    QString notes;
    QString paymentGatewayId;
    QString transactionId;
    QString bankAccount;
    int createdBy = 0;
};

/**
 * @brief Частичное обновление движения: заданы только изменяемые поля
 *
 * movementDate = "" очищает дату.
 */
struct MovementPatch {
    std::optional<QString> type;
    std::optional<Decimal> value;
    std::optional<QString> category;
    std::optional<QString> subcategory;
    std::optional<QString> description;
    std::optional<QString> movementDate;
    std::optional<QString> paymentStatus;
    std::optional<QString> paymentMethod;
    std::optional<QString> senderReceiver;
    std::optional<QString> notes;
    std::optional<QString> paymentGatewayId;
    std::optional<QString> transactionId;
    std::optional<QString> bankAccount;

    bool isEmpty() const
    {
        return !type && !value && !category && !subcategory && !description && !movementDate
               && !paymentStatus && !paymentMethod && !senderReceiver && !notes
               && !paymentGatewayId && !transactionId && !bankAccount;
    }
};

struct GatewayPatch {
    std::optional<QString> paymentGatewayId;
    std::optional<QString> transactionId;
    std::optional<QString> bankAccount;

    bool isEmpty() const { return !paymentGatewayId && !transactionId && !bankAccount; }
};

struct MovementPage {
    QList<FinancialMovement> items;
    int total = 0;
    int page = 1;
    int pageSize = 100;
    int totalPages = 0;
};

/**
 * @brief Сводка денежного потока по оплаченным движениям периода
 */
struct CashFlowSummary {
    QString period;
    Decimal totalRevenue = 0;
    Decimal totalExpense = 0;
    Decimal totalCmv = 0;
    Decimal totalTax = 0;
    Decimal grossProfit = 0;
    Decimal netProfit = 0;
    Decimal cashFlow = 0;
    std::optional<Decimal> pendingAmount;
};

struct ReconciliationQuery {
    QDate startDate;
    QDate endDate;
    std::optional<bool> reconciled;
    QString paymentGatewayId;
};

struct ReconciliationReport {
    int totalCount = 0;
    int reconciledCount = 0;
    int unreconciledCount = 0;
    Decimal totalAmount = 0;
    Decimal reconciledAmount = 0;
    Decimal unreconciledAmount = 0;
    QList<FinancialMovement> movements;
};

Q_DECLARE_METATYPE(MovementPage)
Q_DECLARE_METATYPE(CashFlowSummary)

#endif // LEDGERTYPES_H
