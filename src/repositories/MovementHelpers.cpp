#include "repositories/IFinancialMovementRepository.h"
#include "LedgerConstants.h"

#include <QStringList>

bool FinancialMovement::isLinkedToInvoice() const
{
    return relatedEntityType == QLatin1String(kRelatedPurchaseInvoice) && relatedEntityId > 0;
}

QString FinancialMovement::typeString() const
{
    return typeToString(type);
}

QString FinancialMovement::statusString() const
{
    return statusToString(paymentStatus);
}

QString FinancialMovement::typeToString(MovementType type)
{
    switch (type) {
        case MovementType::Revenue: return "REVENUE";
        case MovementType::Expense: return "EXPENSE";
        case MovementType::Cmv: return "CMV";
        case MovementType::Tax: return "TAX";
    }
    return "EXPENSE";
}

QString FinancialMovement::statusToString(PaymentStatus status)
{
    switch (status) {
        case PaymentStatus::Pending: return "Pending";
        case PaymentStatus::Paid: return "Paid";
    }
    return "Pending";
}

std::optional<MovementType> FinancialMovement::typeFromString(const QString &str)
{
    if (str == "REVENUE") return MovementType::Revenue;
    if (str == "EXPENSE") return MovementType::Expense;
    if (str == "CMV") return MovementType::Cmv;
    if (str == "TAX") return MovementType::Tax;
    return std::nullopt;
}

std::optional<PaymentStatus> FinancialMovement::statusFromString(const QString &str)
{
    if (str == "Pending") return PaymentStatus::Pending;
    if (str == "Paid") return PaymentStatus::Paid;
    return std::nullopt;
}

QString MovementFilter::canonicalString() const
{
    QStringList parts;
    parts << "start=" + startDate.toString(Qt::ISODate)
          << "end=" + endDate.toString(Qt::ISODate)
          << "type=" + (type ? FinancialMovement::typeToString(*type) : QString())
          << "category=" + category
          << "status=" + (paymentStatus ? FinancialMovement::statusToString(*paymentStatus) : QString())
          << "related_type=" + relatedEntityType
          << "related_id=" + QString::number(relatedEntityId)
          << "gateway=" + paymentGatewayId
          << "transaction=" + transactionId
          << "bank=" + bankAccount
          << "reconciled=" + (reconciled ? QString(*reconciled ? "1" : "0") : QString());
    return parts.join('|');
}
