#include "PurchaseInvoiceService.h"
#include "PermissionGate.h"
#include "JsonCodec.h"
#include "DateUtils.h"
#include "LedgerConstants.h"
#include "TransactionContext.h"

#include <QDebug>
#include <QJsonArray>
#include <QLoggingCategory>
#include <QSet>
#include <QStringList>

#include <exception>

Q_LOGGING_CATEGORY(purchaseService, "service.purchase")

PurchaseInvoiceService::PurchaseInvoiceService(
    QSqlDatabase db,
    IPurchaseInvoiceRepository* invoiceRepo,
    IIngredientRepository* ingredientRepo,
    IFinancialMovementRepository* movementRepo,
    IAuditRepository* auditRepo,
    LedgerService* ledger,
    PermissionGate* permissions,
    QObject *parent
)
    : QObject(parent)
    , m_db(db)
    , m_invoiceRepo(invoiceRepo)
    , m_ingredientRepo(ingredientRepo)
    , m_movementRepo(movementRepo)
    , m_auditRepo(auditRepo)
    , m_ledger(ledger)
    , m_permissions(permissions)
{
}

QJsonObject PurchaseInvoiceService::snapshot(const PurchaseInvoice& invoice)
{
    QJsonObject json = JsonCodec::toJson(invoice);
    json.remove("created_at");
    json.remove("updated_at");
    json.remove("created_by_name");
    return json;
}

ServiceResult<QList<PurchaseInvoiceItem>> PurchaseInvoiceService::prepareItems(const QList<InvoiceItemDraft>& drafts)
{
    using Result = ServiceResult<QList<PurchaseInvoiceItem>>;

    if (drafts.isEmpty()) {
        return Result::failure(ErrorCode::InvalidItems, "Накладная должна содержать хотя бы одну строку");
    }

    QList<PurchaseInvoiceItem> items;
    QList<int> ingredientIds;

    for (int i = 0; i < drafts.size(); ++i) {
        const InvoiceItemDraft& d = drafts.at(i);
        const int line = i + 1;

        if (d.ingredientId <= 0) {
            return Result::failure(ErrorCode::InvalidItem, QString("Строка %1: не указан ингредиент").arg(line));
        }
        if (!d.quantity || *d.quantity <= 0) {
            return Result::failure(ErrorCode::InvalidItem, QString("Строка %1: количество должно быть больше нуля").arg(line));
        }
        if (!d.unitPrice || *d.unitPrice <= 0) {
            return Result::failure(ErrorCode::InvalidItem, QString("Строка %1: цена должна быть больше нуля").arg(line));
        }

        PurchaseInvoiceItem item;
        item.ingredientId = d.ingredientId;
        item.quantity = *d.quantity;
        item.unitPrice = quantizeUnitPrice(*d.unitPrice);
        if (item.unitPrice <= 0) {
            return Result::failure(ErrorCode::InvalidUnitPrice, QString("Строка %1: неверная цена за единицу").arg(line));
        }

        if (d.totalPrice) {
            // Сумма поставщика берётся как есть
            item.totalPrice = roundMoney(*d.totalPrice);
        } else if (d.displayQuantity && *d.displayQuantity > 0) {
            item.totalPrice = roundMoney(*d.displayQuantity * item.unitPrice);
        } else {
            item.totalPrice = roundMoney(item.quantity * item.unitPrice);
            qInfo(purchaseService) << "PurchaseInvoiceService::prepareItems: line" << line
                                   << "total derived from base quantity (lower precision)";
        }

        if (item.totalPrice <= 0) {
            return Result::failure(ErrorCode::InvalidTotalPrice, QString("Строка %1: неверная сумма строки").arg(line));
        }

        items.append(item);
        if (!ingredientIds.contains(item.ingredientId)) {
            ingredientIds.append(item.ingredientId);
        }
    }

    QMap<int, Ingredient> found;
    if (!m_ingredientRepo->findByIds(ingredientIds, &found)) {
        return Result::failure(ErrorCode::DatabaseError, "Не удалось проверить ингредиенты");
    }

    QStringList missing;
    for (int id : ingredientIds) {
        if (!found.contains(id)) missing << QString::number(id);
    }
    if (!missing.isEmpty()) {
        return Result::failure(ErrorCode::IngredientNotFound,
                               "Ингредиенты не найдены: " + missing.join(", "));
    }

    for (PurchaseInvoiceItem& item : items) {
        item.ingredientName = found.value(item.ingredientId).name;
    }
    return Result::success(items);
}

ServiceResult<bool> PurchaseInvoiceService::applyItems(TransactionContext& tx, int invoiceId,
                                                       const QList<PurchaseInvoiceItem>& items)
{
    using Result = ServiceResult<bool>;

    for (const PurchaseInvoiceItem& item : items) {
        if (m_invoiceRepo->insertItem(tx, invoiceId, item) < 0) {
            return Result::failure(ErrorCode::DatabaseError, "Не удалось сохранить строку накладной");
        }

        const StockAdjustment res = m_ingredientRepo->adjustStock(tx, item.ingredientId, item.quantity);
        if (res == StockAdjustment::Failed) {
            return Result::failure(ErrorCode::DatabaseError, "Ошибка базы данных");
        }
        if (res != StockAdjustment::Applied) {
            return Result::failure(ErrorCode::StockUpdateError,
                                   QString("Ошибка обновления остатка ингредиента %1").arg(item.ingredientId));
        }
    }
    return Result::success(true);
}

ServiceResult<bool> PurchaseInvoiceService::reverseItems(TransactionContext& tx, const QList<PurchaseInvoiceItem>& items)
{
    using Result = ServiceResult<bool>;

    for (const PurchaseInvoiceItem& item : items) {
        const StockAdjustment res = m_ingredientRepo->adjustStock(tx, item.ingredientId, -item.quantity);
        if (res == StockAdjustment::Failed) {
            return Result::failure(ErrorCode::DatabaseError, "Ошибка базы данных");
        }
        if (res != StockAdjustment::Applied) {
            return Result::failure(ErrorCode::StockReversalError,
                                   QString("Ошибка отката остатка ингредиента %1").arg(item.ingredientId));
        }
    }
    return Result::success(true);
}

MovementDraft PurchaseInvoiceService::expenseDraft(const PurchaseInvoice& invoice, int userId) const
{
    MovementDraft d;
    d.type = "EXPENSE";
    d.value = invoice.totalAmount;
    d.category = kCategoryStockPurchases;
    d.subcategory = kSubcategoryIngredients;
    d.description = QString("Compra - NF %1 - %2").arg(invoice.invoiceNumber, invoice.supplierName);
    d.paymentStatus = FinancialMovement::statusToString(invoice.paymentStatus);
    if (invoice.paymentStatus == PaymentStatus::Paid) {
        d.movementDate = toIsoString(invoice.paymentDate);
    }
    d.paymentMethod = invoice.paymentMethod;
    d.senderReceiver = invoice.supplierName;
    d.relatedEntityType = kRelatedPurchaseInvoice;
    d.relatedEntityId = invoice.id;
    d.notes = invoice.notes;
    d.createdBy = userId;
    return d;
}

void PurchaseInvoiceService::writeAudit(TransactionContext& tx, const AuditEntry& entry)
{
    if (!m_auditRepo) return;

    try {
        if (m_auditRepo->record(tx, entry) < 0) {
            qWarning(purchaseService) << "PurchaseInvoiceService: audit" << AuditEntry::actionToString(entry.action)
                                      << "for invoice" << entry.invoiceId << "not written";
        }
    } catch (const std::exception& e) {
        qWarning(purchaseService) << "PurchaseInvoiceService: audit failed -" << e.what();
    }
}

ServiceResult<PurchaseInvoice> PurchaseInvoiceService::create(const InvoiceDraft& draft, int userId)
{
    using Result = ServiceResult<PurchaseInvoice>;

    PurchaseInvoice invoice;
    invoice.invoiceNumber = draft.invoiceNumber.trimmed();
    invoice.supplierName = draft.supplierName.trimmed();
    invoice.paymentMethod = draft.paymentMethod.trimmed();
    invoice.notes = draft.notes.trimmed();
    invoice.createdBy = userId;

    if (invoice.invoiceNumber.isEmpty()) {
        return Result::failure(ErrorCode::InvalidInvoiceNumber, "Номер накладной обязателен");
    }
    if (invoice.supplierName.isEmpty()) {
        return Result::failure(ErrorCode::InvalidSupplierName, "Поставщик обязателен");
    }
    if (draft.items.isEmpty()) {
        return Result::failure(ErrorCode::InvalidItems, "Накладная должна содержать хотя бы одну строку");
    }

    if (!draft.paymentStatus.trimmed().isEmpty()) {
        const auto status = FinancialMovement::statusFromString(draft.paymentStatus.trimmed());
        if (!status) return Result::failure(ErrorCode::InvalidStatus, "Статус должен быть Pending или Paid");
        invoice.paymentStatus = *status;
    }

    if (draft.purchaseDate.trimmed().isEmpty()) {
        invoice.purchaseDate = QDateTime::currentDateTime();
    } else {
        invoice.purchaseDate = parseFlexibleDateTime(draft.purchaseDate);
        if (!invoice.purchaseDate.isValid()) {
            return Result::failure(ErrorCode::InvalidDate, "Неверная дата закупки");
        }
    }

    if (!draft.paymentDate.trimmed().isEmpty()) {
        invoice.paymentDate = parseFlexibleDateTime(draft.paymentDate);
        if (!invoice.paymentDate.isValid()) {
            return Result::failure(ErrorCode::InvalidDate, "Неверная дата оплаты");
        }
    }
    if (invoice.paymentStatus == PaymentStatus::Paid && !invoice.paymentDate.isValid()) {
        invoice.paymentDate = QDateTime::currentDateTime();
    }

    const ServiceResult<QList<PurchaseInvoiceItem>> prepared = prepareItems(draft.items);
    if (!prepared.isOk()) return Result::propagate(prepared);

    invoice.items = prepared.value;
    invoice.totalAmount = 0;
    for (const PurchaseInvoiceItem& item : invoice.items) {
        invoice.totalAmount += item.totalPrice;
    }
    invoice.totalAmount = roundMoney(invoice.totalAmount);

    if (draft.totalAmount && roundMoney(*draft.totalAmount) != invoice.totalAmount) {
        qWarning(purchaseService) << "PurchaseInvoiceService::create: payload total" << moneyToString(*draft.totalAmount)
                                  << "differs from items total" << moneyToString(invoice.totalAmount);
    }

    TransactionContext tx(m_db, "PurchaseInvoiceService::create");
    if (!tx.isActive()) return Result::failure(ErrorCode::DatabaseError, "Ошибка базы данных");

    invoice.id = m_invoiceRepo->create(tx, invoice);
    if (invoice.id < 0) {
        return Result::failure(ErrorCode::DatabaseError, "Не удалось создать накладную");
    }

    const ServiceResult<bool> applied = applyItems(tx, invoice.id, invoice.items);
    if (!applied.isOk()) return Result::propagate(applied);

    const ServiceResult<FinancialMovement> expense = m_ledger->create(expenseDraft(invoice, userId), tx);
    if (!expense.isOk()) {
        return Result::failure(expense.error, "Ошибка регистрации расхода: " + expense.message);
    }

    AuditEntry audit;
    audit.invoiceId = invoice.id;
    audit.action = AuditAction::Create;
    audit.changedBy = userId;
    audit.newValues = snapshot(invoice);
    writeAudit(tx, audit);

    if (!tx.commit()) {
        return Result::failure(ErrorCode::DatabaseError, "Не удалось зафиксировать транзакцию");
    }

    qInfo(purchaseService) << "PurchaseInvoiceService::create: invoice" << invoice.id
                           << "items" << invoice.items.size() << "total" << moneyToString(invoice.totalAmount);

    m_ledger->invalidateCaches();

    QJsonObject payload;
    payload.insert("invoice_id", invoice.id);
    payload.insert("expense_id", expense.value.id);
    payload.insert("invoice_number", invoice.invoiceNumber);
    payload.insert("total_amount", JsonCodec::money(invoice.totalAmount));
    m_ledger->publishEvent(kEventPurchaseCreated, payload);

    return getById(invoice.id);
}

ServiceResult<bool> PurchaseInvoiceService::syncLinkedExpense(TransactionContext& tx, const PurchaseInvoice& invoice, int userId)
{
    using Result = ServiceResult<bool>;

    FinancialMovement linked;
    const QList<FinancialMovement> related = m_movementRepo->findByRelatedEntity(kRelatedPurchaseInvoice, invoice.id);
    for (const FinancialMovement& m : related) {
        if (m.type == MovementType::Expense) {
            linked = m;
            break;
        }
    }

    if (!linked.isValid()) {
        qWarning(purchaseService) << "PurchaseInvoiceService: linked expense for invoice" << invoice.id
                                  << "missing - recreating";
        const ServiceResult<FinancialMovement> created = m_ledger->create(expenseDraft(invoice, userId), tx);
        if (!created.isOk()) return Result::propagate(created);
        return Result::success(true);
    }

    linked.value = invoice.totalAmount;
    linked.paymentStatus = invoice.paymentStatus;
    linked.movementDate = invoice.paymentStatus == PaymentStatus::Paid ? invoice.paymentDate : QDateTime();
    linked.paymentMethod = invoice.paymentMethod;
    linked.senderReceiver = invoice.supplierName;
    linked.description = QString("Compra - NF %1 - %2").arg(invoice.invoiceNumber, invoice.supplierName);
    linked.notes = invoice.notes;

    if (!m_movementRepo->update(tx, linked)) {
        return Result::failure(ErrorCode::SyncError, "Не удалось обновить связанный расход");
    }
    return Result::success(true);
}

ServiceResult<PurchaseInvoice> PurchaseInvoiceService::update(int id, const InvoicePatch& patch, int userId)
{
    using Result = ServiceResult<PurchaseInvoice>;

    const PurchaseInvoice current = m_invoiceRepo->findById(id);
    if (!current.isValid()) return Result::failure(ErrorCode::NotFound, "Накладная не найдена");

    const ServiceResult<bool> allowed = m_permissions->checkPermission(id, userId, InvoiceAction::Edit);
    if (!allowed.isOk()) return Result::propagate(allowed);

    if (patch.isEmpty()) return Result::failure(ErrorCode::NoUpdates, "Нет полей для обновления");

    PurchaseInvoice updated = current;

    if (patch.invoiceNumber) {
        updated.invoiceNumber = patch.invoiceNumber->trimmed();
        if (updated.invoiceNumber.isEmpty()) {
            return Result::failure(ErrorCode::InvalidInvoiceNumber, "Номер накладной обязателен");
        }
    }
    if (patch.supplierName) {
        updated.supplierName = patch.supplierName->trimmed();
        if (updated.supplierName.isEmpty()) {
            return Result::failure(ErrorCode::InvalidSupplierName, "Поставщик обязателен");
        }
    }
    if (patch.purchaseDate) {
        updated.purchaseDate = parseFlexibleDateTime(*patch.purchaseDate);
        if (!updated.purchaseDate.isValid()) {
            return Result::failure(ErrorCode::InvalidDate, "Неверная дата закупки");
        }
    }
    if (patch.paymentStatus) {
        const auto status = FinancialMovement::statusFromString(patch.paymentStatus->trimmed());
        if (!status) return Result::failure(ErrorCode::InvalidStatus, "Статус должен быть Pending или Paid");
        updated.paymentStatus = *status;
    }
    if (patch.paymentDate) {
        if (patch.paymentDate->trimmed().isEmpty()) {
            updated.paymentDate = QDateTime();
        } else {
            updated.paymentDate = parseFlexibleDateTime(*patch.paymentDate);
            if (!updated.paymentDate.isValid()) {
                return Result::failure(ErrorCode::InvalidDate, "Неверная дата оплаты");
            }
        }
    }
    if (patch.paymentMethod) updated.paymentMethod = patch.paymentMethod->trimmed();
    if (patch.notes) updated.notes = patch.notes->trimmed();

    if (updated.paymentStatus == PaymentStatus::Paid && !updated.paymentDate.isValid()) {
        updated.paymentDate = QDateTime::currentDateTime();
    }
    if (patch.paymentStatus && updated.paymentStatus == PaymentStatus::Pending) {
        updated.paymentDate = QDateTime();
    }

    const bool replaceItems = patch.items && !patch.items->isEmpty();
    QList<PurchaseInvoiceItem> newItems;
    if (replaceItems) {
        const ServiceResult<QList<PurchaseInvoiceItem>> prepared = prepareItems(*patch.items);
        if (!prepared.isOk()) return Result::propagate(prepared);
        newItems = prepared.value;
    }

    // Остаток меняется на разность новых и старых строк: промежуточный откат в минус не считается
    QMap<int, Decimal> netDelta;
    if (replaceItems) {
        for (const PurchaseInvoiceItem& item : current.items) {
            netDelta[item.ingredientId] -= item.quantity;
        }
        for (const PurchaseInvoiceItem& item : newItems) {
            netDelta[item.ingredientId] += item.quantity;
        }

        QMap<int, Ingredient> stock;
        if (!m_ingredientRepo->findByIds(netDelta.keys(), &stock)) {
            return Result::failure(ErrorCode::DatabaseError, "Не удалось прочитать остатки");
        }
        for (auto it = netDelta.constBegin(); it != netDelta.constEnd(); ++it) {
            const Ingredient ingredient = stock.value(it.key());
            const Decimal available = ingredient.isValid() ? ingredient.currentStock : Decimal(0);
            if (it.value() < 0 && available + it.value() < 0) {
                qWarning(purchaseService) << "PurchaseInvoiceService::update: invoice" << id << "ingredient" << it.key()
                                          << "stock" << decimalToPlainString(available)
                                          << "delta" << decimalToPlainString(it.value());
                return Result::failure(ErrorCode::StockReversalError,
                                       QString("Недостаточно остатка ингредиента %1 для отката").arg(it.key()));
            }
        }
    }

    TransactionContext tx(m_db, "PurchaseInvoiceService::update");
    if (!tx.isActive()) return Result::failure(ErrorCode::DatabaseError, "Ошибка базы данных");

    if (replaceItems) {
        if (m_invoiceRepo->deleteItems(tx, id) < 0) {
            return Result::failure(ErrorCode::DatabaseError, "Не удалось удалить строки накладной");
        }
        for (const PurchaseInvoiceItem& item : newItems) {
            if (m_invoiceRepo->insertItem(tx, id, item) < 0) {
                return Result::failure(ErrorCode::DatabaseError, "Не удалось сохранить строку накладной");
            }
        }

        for (auto it = netDelta.constBegin(); it != netDelta.constEnd(); ++it) {
            if (it.value() == 0) continue;

            const StockAdjustment res = m_ingredientRepo->adjustStock(tx, it.key(), it.value());
            if (res == StockAdjustment::Failed) {
                return Result::failure(ErrorCode::DatabaseError, "Ошибка базы данных");
            }
            if (res != StockAdjustment::Applied) {
                const ErrorCode code = it.value() < 0 ? ErrorCode::StockReversalError : ErrorCode::StockUpdateError;
                return Result::failure(code, QString("Ошибка обновления остатка ингредиента %1").arg(it.key()));
            }
        }

        updated.items = newItems;
        updated.totalAmount = 0;
        for (const PurchaseInvoiceItem& item : newItems) {
            updated.totalAmount += item.totalPrice;
        }
        updated.totalAmount = roundMoney(updated.totalAmount);
    }

    if (!m_invoiceRepo->updateHeader(tx, updated)) {
        return Result::failure(ErrorCode::DatabaseError, "Не удалось обновить накладную");
    }

    const ServiceResult<bool> synced = syncLinkedExpense(tx, updated, userId);
    if (!synced.isOk()) return Result::propagate(synced);

    AuditEntry audit;
    audit.invoiceId = id;
    audit.action = AuditAction::Update;
    audit.changedBy = userId;
    audit.oldValues = snapshot(current);
    audit.newValues = snapshot(updated);
    for (auto it = audit.newValues.constBegin(); it != audit.newValues.constEnd(); ++it) {
        if (audit.oldValues.value(it.key()) != it.value()) {
            audit.changedFields << it.key();
        }
    }
    writeAudit(tx, audit);

    if (!tx.commit()) {
        return Result::failure(ErrorCode::DatabaseError, "Не удалось зафиксировать транзакцию");
    }

    qInfo(purchaseService) << "PurchaseInvoiceService::update: invoice" << id << "fields" << audit.changedFields;

    m_ledger->invalidateCaches();

    QJsonObject payload;
    payload.insert("invoice_id", id);
    payload.insert("changed_fields", QJsonArray::fromStringList(audit.changedFields));
    payload.insert("total_amount", JsonCodec::money(updated.totalAmount));
    m_ledger->publishEvent(kEventPurchaseUpdated, payload);

    return getById(id);
}

ServiceResult<InvoiceDeletion> PurchaseInvoiceService::deleteInvoice(int invoiceId, int userId)
{
    using Result = ServiceResult<InvoiceDeletion>;

    const PurchaseInvoice current = m_invoiceRepo->findById(invoiceId);
    if (!current.isValid()) return Result::failure(ErrorCode::NotFound, "Накладная не найдена");

    const ServiceResult<bool> allowed = m_permissions->checkPermission(invoiceId, userId, InvoiceAction::Delete);
    if (!allowed.isOk()) return Result::propagate(allowed);

    // Проверка до любых изменений: откат не должен увести остаток в минус
    QMap<int, Decimal> required;
    for (const PurchaseInvoiceItem& item : current.items) {
        required[item.ingredientId] += item.quantity;
    }

    QMap<int, Ingredient> stock;
    if (!m_ingredientRepo->findByIds(required.keys(), &stock)) {
        return Result::failure(ErrorCode::DatabaseError, "Не удалось прочитать остатки");
    }

    InvoiceDeletion deletion;
    deletion.invoiceId = invoiceId;

    for (auto it = required.constBegin(); it != required.constEnd(); ++it) {
        const Ingredient ingredient = stock.value(it.key());
        const Decimal available = ingredient.isValid() ? ingredient.currentStock : Decimal(0);
        if (available < it.value()) {
            StockShortage s;
            s.ingredientId = it.key();
            s.ingredientName = ingredient.name;
            s.currentStock = available;
            s.required = it.value();
            s.shortage = it.value() - available;
            deletion.shortages.append(s);
        }
    }

    if (!deletion.shortages.isEmpty()) {
        qWarning(purchaseService) << "PurchaseInvoiceService::deleteInvoice: invoice" << invoiceId
                                  << "rejected, shortages:" << deletion.shortages.size();
        return Result::failure(ErrorCode::InsufficientStock,
                               "Недостаточно остатка для отмены поступления", deletion);
    }

    TransactionContext tx(m_db, "PurchaseInvoiceService::deleteInvoice");
    if (!tx.isActive()) return Result::failure(ErrorCode::DatabaseError, "Ошибка базы данных");

    const ServiceResult<bool> reversed = reverseItems(tx, current.items);
    if (!reversed.isOk()) return Result::propagate(reversed);

    deletion.removedMovements = m_movementRepo->deleteByRelatedEntity(tx, kRelatedPurchaseInvoice, invoiceId);
    if (deletion.removedMovements < 0) {
        return Result::failure(ErrorCode::DatabaseError, "Не удалось удалить связанный расход");
    }

    AuditEntry audit;
    audit.invoiceId = invoiceId;
    audit.action = AuditAction::Delete;
    audit.changedBy = userId;
    audit.oldValues = snapshot(current);
    audit.notes = QString("Удалено связанных движений: %1").arg(deletion.removedMovements);
    writeAudit(tx, audit);

    if (m_invoiceRepo->deleteItems(tx, invoiceId) < 0) {
        return Result::failure(ErrorCode::DatabaseError, "Не удалось удалить строки накладной");
    }
    if (!m_invoiceRepo->deleteById(tx, invoiceId)) {
        return Result::failure(ErrorCode::DatabaseError, "Не удалось удалить накладную");
    }

    if (!tx.commit()) {
        return Result::failure(ErrorCode::DatabaseError, "Не удалось зафиксировать транзакцию");
    }

    qInfo(purchaseService) << "PurchaseInvoiceService::deleteInvoice: invoice" << invoiceId
                           << "removed movements" << deletion.removedMovements;

    m_ledger->invalidateCaches();

    QJsonObject payload;
    payload.insert("invoice_id", invoiceId);
    payload.insert("invoice_number", current.invoiceNumber);
    m_ledger->publishEvent(kEventPurchaseDeleted, payload);

    return Result::success(deletion);
}

ServiceResult<PurchaseInvoice> PurchaseInvoiceService::getById(int id)
{
    const PurchaseInvoice invoice = m_invoiceRepo->findById(id);
    if (!invoice.isValid()) {
        return ServiceResult<PurchaseInvoice>::failure(ErrorCode::NotFound, "Накладная не найдена");
    }
    return ServiceResult<PurchaseInvoice>::success(invoice);
}

ServiceResult<InvoicePage> PurchaseInvoiceService::list(const InvoiceFilter& filter, int page, int pageSize)
{
    const int safePage = page < 1 ? 1 : page;
    const int size = qBound(1, pageSize <= 0 ? 100 : pageSize, 1000);

    const int total = m_invoiceRepo->count(filter);
    if (total < 0) {
        return ServiceResult<InvoicePage>::failure(ErrorCode::DatabaseError, "Не удалось получить список накладных");
    }

    InvoicePage result;
    result.page = safePage;
    result.pageSize = size;
    result.total = total;
    result.totalPages = (total + size - 1) / size;
    result.items = m_invoiceRepo->find(filter, size, (safePage - 1) * size);
    return ServiceResult<InvoicePage>::success(result);
}

QList<AuditEntry> PurchaseInvoiceService::history(int invoiceId)
{
    if (!m_auditRepo) return QList<AuditEntry>();
    return m_auditRepo->findByInvoice(invoiceId);
}
