#ifndef ORDERSETTLEMENTSERVICE_H
#define ORDERSETTLEMENTSERVICE_H

#include <QDateTime>
#include <QObject>
#include <QSqlDatabase>
#include <QString>

#include <optional>

#include "DecimalUtils.h"
#include "ServiceResult.h"
#include "repositories/IOrderRepository.h"

class ISettingsRepository;
class IUnitConverter;
class LedgerService;
class TransactionContext;

struct SettlementRequest {
    int orderId = 0;
    Decimal orderTotal = 0;
    QString paymentMethod;
    QDateTime paymentDate;   // невалидная - текущий момент
    int createdBy = 0;
};

/**
 * @brief Идентификаторы созданных движений; CMV и комиссии может не быть
 */
struct SettlementResult {
    int revenueId = 0;
    std::optional<int> cmvId;
    std::optional<int> feeId;
    Decimal totalCmv = 0;
    Decimal feeAmount = 0;
};

/**
 * @brief Проводки по оплаченному заказу: выручка, себестоимость, комиссия шлюза
 */
class OrderSettlementService : public QObject
{
    Q_OBJECT

public:
    explicit OrderSettlementService(
        QSqlDatabase db,
        IOrderRepository* orderRepo,
        ISettingsRepository* settingsRepo,
        IUnitConverter* converter,
        LedgerService* ledger,
        QObject *parent = nullptr
    );

    ServiceResult<SettlementResult> registerOrderRevenueAndCmv(const SettlementRequest& request);

    /**
     * @brief То же в транзакции вызывающего; кэш и события остаются на нём
     */
    ServiceResult<SettlementResult> registerOrderRevenueAndCmv(const SettlementRequest& request, TransactionContext& tx);

    /**
     * @brief Провести заказ по данным из таблицы orders
     */
    ServiceResult<SettlementResult> settleOrder(int orderId, int userId);

    ServiceResult<Decimal> computeOrderCmv(int orderId);

    // credit -> "Cartão de Crédito", pix -> "PIX", ...
    static QString paymentSubcategory(const QString& paymentMethod);

private:
    Decimal lineCost(const OrderLine& line) const;
    ServiceResult<Decimal> cmvForLines(int orderId);

private:
    QSqlDatabase m_db;
    IOrderRepository* m_orderRepo;
    ISettingsRepository* m_settingsRepo;
    IUnitConverter* m_converter;
    LedgerService* m_ledger;
};

#endif // ORDERSETTLEMENTSERVICE_H
