#ifndef PERMISSIONGATE_H
#define PERMISSIONGATE_H

#include <QString>

#include "ServiceResult.h"

class IPurchaseInvoiceRepository;
class IUserDirectory;

enum class InvoiceAction {
    Edit,
    Delete
};

/**
 * @brief Права на изменение накладной
 *
 * delete - только admin; edit - admin, manager или автор накладной.
 * Проверка ничего не меняет в БД.
 */
class PermissionGate
{
public:
    PermissionGate(IPurchaseInvoiceRepository* invoiceRepo, IUserDirectory* users);

    ServiceResult<bool> checkPermission(int invoiceId, int userId, const QString& role, InvoiceAction action);

    /**
     * @brief То же, роль берётся из справочника пользователей
     */
    ServiceResult<bool> checkPermission(int invoiceId, int userId, InvoiceAction action);

private:
    IPurchaseInvoiceRepository* m_invoiceRepo;
    IUserDirectory* m_users;
};

#endif // PERMISSIONGATE_H
