#include "OrderSettlementService.h"
#include "DateUtils.h"
#include "JsonCodec.h"
#include "LedgerConstants.h"
#include "LedgerService.h"
#include "TransactionContext.h"
#include "UnitConverter.h"
#include "repositories/ISettingsRepository.h"

#include <QDebug>
#include <QLoggingCategory>

Q_LOGGING_CATEGORY(settlementService, "service.settlement")

OrderSettlementService::OrderSettlementService(
    QSqlDatabase db,
    IOrderRepository* orderRepo,
    ISettingsRepository* settingsRepo,
    IUnitConverter* converter,
    LedgerService* ledger,
    QObject *parent
)
    : QObject(parent)
    , m_db(db)
    , m_orderRepo(orderRepo)
    , m_settingsRepo(settingsRepo)
    , m_converter(converter)
    , m_ledger(ledger)
{
}

QString OrderSettlementService::paymentSubcategory(const QString& paymentMethod)
{
    const QString method = paymentMethod.trimmed().toLower();
    if (method == "credit") return QStringLiteral("Cartão de Crédito");
    if (method == "debit") return QStringLiteral("Cartão de Débito");
    if (method == "pix") return QStringLiteral("PIX");
    if (method == "money" || method == "cash") return QStringLiteral("Dinheiro");

    return paymentMethod.trimmed().isEmpty() ? QStringLiteral("Outros") : paymentMethod.trimmed();
}

Decimal OrderSettlementService::lineCost(const OrderLine& line) const
{
    const Decimal productCost = (line.productCostPrice && *line.productCostPrice > 0)
                                    ? *line.productCostPrice
                                    : line.recipeCost;

    // Допы считаются на строку целиком, без умножения на количество
    Decimal extrasCost = 0;
    for (const OrderLineExtra& extra : line.extras) {
        const Decimal portionCost = costPerBasePortion(*m_converter, extra.ingredientPrice, extra.stockUnit,
                                                       extra.basePortionQuantity, extra.basePortionUnit);
        if (extra.type == "extra") {
            extrasCost += portionCost * extra.quantity;
        } else if (extra.type == "base" && extra.delta > 0) {
            extrasCost += portionCost * extra.delta;
        }
    }

    return productCost * line.quantity + extrasCost;
}

ServiceResult<Decimal> OrderSettlementService::cmvForLines(int orderId)
{
    using Result = ServiceResult<Decimal>;

    QList<OrderLine> lines;
    if (!m_orderRepo->findLines(orderId, &lines)) {
        return Result::failure(ErrorCode::DatabaseError, "Не удалось прочитать позиции заказа");
    }
    if (lines.isEmpty()) {
        return Result::failure(ErrorCode::NotFound, "Заказ не найден или не содержит позиций");
    }

    Decimal total = 0;
    for (const OrderLine& line : lines) {
        total += lineCost(line);
    }
    return Result::success(roundMoney(total));
}

ServiceResult<Decimal> OrderSettlementService::computeOrderCmv(int orderId)
{
    return cmvForLines(orderId);
}

ServiceResult<SettlementResult> OrderSettlementService::registerOrderRevenueAndCmv(const SettlementRequest& request,
                                                                                   TransactionContext& tx)
{
    using Result = ServiceResult<SettlementResult>;

    const ServiceResult<Decimal> cmv = cmvForLines(request.orderId);
    if (!cmv.isOk()) return Result::propagate(cmv);

    PaymentFees fees;
    if (!m_settingsRepo->loadPaymentFees(&fees)) {
        return Result::failure(ErrorCode::DatabaseError, "Не удалось прочитать настройки комиссий");
    }

    const QDateTime paidAt = request.paymentDate.isValid() ? request.paymentDate : QDateTime::currentDateTime();
    const QString orderRef = QString("Pedido #%1").arg(request.orderId);

    MovementDraft base;
    base.movementDate = toIsoString(paidAt);
    base.paymentStatus = "Paid";
    base.relatedEntityType = kRelatedOrder;
    base.relatedEntityId = request.orderId;
    base.createdBy = request.createdBy;

    SettlementResult result;
    result.totalCmv = cmv.value;

    MovementDraft revenue = base;
    revenue.type = "REVENUE";
    revenue.value = request.orderTotal;
    revenue.category = kCategorySales;
    revenue.subcategory = paymentSubcategory(request.paymentMethod);
    revenue.description = "Venda - " + orderRef;
    revenue.paymentMethod = request.paymentMethod;

    const ServiceResult<FinancialMovement> revenueRes = m_ledger->create(revenue, tx);
    if (!revenueRes.isOk()) return Result::propagate(revenueRes);
    result.revenueId = revenueRes.value.id;

    if (result.totalCmv > 0) {
        MovementDraft cmvDraft = base;
        cmvDraft.type = "CMV";
        cmvDraft.value = result.totalCmv;
        cmvDraft.category = kCategoryVariableCosts;
        cmvDraft.subcategory = kSubcategoryConsumedIngredients;
        cmvDraft.description = "CMV - " + orderRef;

        const ServiceResult<FinancialMovement> cmvRes = m_ledger->create(cmvDraft, tx);
        if (!cmvRes.isOk()) return Result::propagate(cmvRes);
        result.cmvId = cmvRes.value.id;
    }

    const Decimal percent = fees.percentFor(request.paymentMethod);
    if (percent > 0) {
        result.feeAmount = roundMoney(request.orderTotal * percent / 100);
    }
    if (result.feeAmount > 0) {
        MovementDraft fee = base;
        fee.type = "EXPENSE";
        fee.value = result.feeAmount;
        fee.category = kCategoryVariableCosts;
        fee.subcategory = kSubcategoryPaymentFees;
        fee.description = QString("Taxa %1 - %2").arg(request.paymentMethod, orderRef);
        fee.paymentMethod = request.paymentMethod;

        const ServiceResult<FinancialMovement> feeRes = m_ledger->create(fee, tx);
        if (!feeRes.isOk()) return Result::propagate(feeRes);
        result.feeId = feeRes.value.id;
    }

    return Result::success(result);
}

ServiceResult<SettlementResult> OrderSettlementService::registerOrderRevenueAndCmv(const SettlementRequest& request)
{
    using Result = ServiceResult<SettlementResult>;

    TransactionContext tx(m_db, "OrderSettlementService::registerOrderRevenueAndCmv");
    if (!tx.isActive()) return Result::failure(ErrorCode::DatabaseError, "Ошибка базы данных");

    const Result result = registerOrderRevenueAndCmv(request, tx);
    if (!result.isOk()) {
        qWarning(settlementService) << "OrderSettlementService: order" << request.orderId
                                    << "not settled -" << errorCodeToString(result.error);
        return result;
    }

    if (!tx.commit()) {
        return Result::failure(ErrorCode::DatabaseError, "Не удалось зафиксировать транзакцию");
    }

    qInfo(settlementService) << "OrderSettlementService: order" << request.orderId
                             << "revenue" << moneyToString(request.orderTotal)
                             << "cmv" << moneyToString(result.value.totalCmv)
                             << "fee" << moneyToString(result.value.feeAmount);

    m_ledger->invalidateCaches();
    m_ledger->publishEvent(kEventMovementCreated, JsonCodec::toJson(result.value));

    return result;
}

ServiceResult<SettlementResult> OrderSettlementService::settleOrder(int orderId, int userId)
{
    const Order order = m_orderRepo->findById(orderId);
    if (!order.isValid()) {
        return ServiceResult<SettlementResult>::failure(ErrorCode::NotFound, "Заказ не найден");
    }

    SettlementRequest request;
    request.orderId = order.id;
    request.orderTotal = order.totalAmount;
    request.paymentMethod = order.paymentMethod;
    request.paymentDate = QDateTime::currentDateTime();
    request.createdBy = userId;
    return registerOrderRevenueAndCmv(request);
}
