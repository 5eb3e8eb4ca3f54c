#include "PermissionGate.h"
#include "repositories/IPurchaseInvoiceRepository.h"
#include "repositories/IUserDirectory.h"

#include <QLoggingCategory>

Q_LOGGING_CATEGORY(permissionLog, "service.permission")

PermissionGate::PermissionGate(IPurchaseInvoiceRepository* invoiceRepo, IUserDirectory* users)
    : m_invoiceRepo(invoiceRepo)
    , m_users(users)
{
}

ServiceResult<bool> PermissionGate::checkPermission(int invoiceId, int userId, const QString& role, InvoiceAction action)
{
    using Result = ServiceResult<bool>;

    const QString normalizedRole = role.trimmed().toLower();

    if (action == InvoiceAction::Delete) {
        if (normalizedRole != "admin") {
            qWarning(permissionLog) << "PermissionGate: user" << userId << "role" << normalizedRole
                                    << "cannot delete invoice" << invoiceId;
            return Result::failure(ErrorCode::PermissionDenied, "Удалять накладные может только администратор");
        }
        return Result::success(true);
    }

    if (normalizedRole == "admin" || normalizedRole == "manager") {
        return Result::success(true);
    }

    const PurchaseInvoice invoice = m_invoiceRepo->findById(invoiceId);
    if (!invoice.isValid()) {
        return Result::failure(ErrorCode::NotFound, "Накладная не найдена");
    }

    if (userId > 0 && invoice.createdBy == userId) {
        return Result::success(true);
    }

    qWarning(permissionLog) << "PermissionGate: user" << userId << "cannot edit invoice" << invoiceId;
    return Result::failure(ErrorCode::PermissionDenied, "Нет прав на изменение накладной");
}

ServiceResult<bool> PermissionGate::checkPermission(int invoiceId, int userId, InvoiceAction action)
{
    const QString role = m_users ? m_users->roleOf(userId) : QString();
    return checkPermission(invoiceId, userId, role, action);
}
