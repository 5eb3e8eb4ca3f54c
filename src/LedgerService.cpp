#include "LedgerService.h"
#include "ICache.h"
#include "EventBus.h"
#include "JsonCodec.h"
#include "DateUtils.h"
#include "LedgerConstants.h"
#include "TransactionContext.h"

#include <QCryptographicHash>
#include <QDebug>
#include <QLoggingCategory>

#include <exception>

Q_LOGGING_CATEGORY(ledgerService, "service.ledger")

LedgerService::LedgerService(
    QSqlDatabase db,
    IFinancialMovementRepository* movementRepo,
    IPurchaseInvoiceRepository* invoiceRepo,
    ICache* cache,
    IEventPublisher* events,
    QObject *parent
)
    : QObject(parent)
    , m_db(db)
    , m_movementRepo(movementRepo)
    , m_invoiceRepo(invoiceRepo)
    , m_cache(cache)
    , m_events(events)
{
}

void LedgerService::setPagination(int defaultPageSize, int maxPageSize)
{
    m_maxPageSize = maxPageSize > 0 ? maxPageSize : 1000;
    m_defaultPageSize = qBound(1, defaultPageSize, m_maxPageSize);
}

ServiceResult<FinancialMovement> LedgerService::buildMovement(const MovementDraft& draft) const
{
    using Result = ServiceResult<FinancialMovement>;

    FinancialMovement m;

    const auto type = FinancialMovement::typeFromString(draft.type.trimmed().toUpper());
    if (!type) {
        return Result::failure(ErrorCode::InvalidType, "Тип должен быть REVENUE, EXPENSE, CMV или TAX");
    }
    m.type = *type;

    if (!draft.value || roundMoney(*draft.value) <= 0) {
        return Result::failure(ErrorCode::InvalidValue, "Значение должно быть больше нуля");
    }
    m.value = roundMoney(*draft.value);

    if (!draft.paymentStatus.trimmed().isEmpty()) {
        const auto status = FinancialMovement::statusFromString(draft.paymentStatus.trimmed());
        if (!status) {
            return Result::failure(ErrorCode::InvalidStatus, "Статус должен быть Pending или Paid");
        }
        m.paymentStatus = *status;
    }

    m.description = draft.description.trimmed();
    if (m.description.isEmpty()) {
        return Result::failure(ErrorCode::InvalidDescription, "Описание обязательно");
    }

    if (!draft.movementDate.trimmed().isEmpty()) {
        m.movementDate = parseFlexibleDateTime(draft.movementDate);
        if (!m.movementDate.isValid()) {
            return Result::failure(ErrorCode::InvalidDate,
                                   "Неверная дата: ожидается DD-MM-YYYY или YYYY-MM-DD[THH:MM:SS]");
        }
    }
    if (m.paymentStatus == PaymentStatus::Paid && !m.movementDate.isValid()) {
        m.movementDate = QDateTime::currentDateTime();
    }

    m.category = draft.category.trimmed();
    m.subcategory = draft.subcategory.trimmed();
    m.paymentMethod = draft.paymentMethod.trimmed();
    m.senderReceiver = draft.senderReceiver.trimmed();
    m.relatedEntityType = draft.relatedEntityType.trimmed();
    m.relatedEntityId = draft.relatedEntityId;
    m.notes = draft.notes.trimmed();
    m.paymentGatewayId = draft.paymentGatewayId.trimmed();
    m.transactionId = draft.transactionId.trimmed();
    m.bankAccount = draft.bankAccount.trimmed();
    m.createdBy = draft.createdBy;

    return Result::success(m);
}

ServiceResult<FinancialMovement> LedgerService::create(const MovementDraft& draft, TransactionContext& tx)
{
    using Result = ServiceResult<FinancialMovement>;

    if (!tx.isActive()) {
        qCritical(ledgerService) << "LedgerService::create: transaction is not active";
        return Result::failure(ErrorCode::DatabaseError, "Ошибка базы данных");
    }

    Result built = buildMovement(draft);
    if (!built.isOk()) {
        qWarning(ledgerService) << "LedgerService::create: rejected -" << errorCodeToString(built.error);
        return built;
    }

    const int id = m_movementRepo->create(tx, built.value);
    if (id < 0) {
        return Result::failure(ErrorCode::DatabaseError, "Не удалось сохранить движение");
    }

    const FinancialMovement saved = m_movementRepo->findById(id);
    if (!saved.isValid()) {
        qCritical(ledgerService) << "LedgerService::create: inserted movement" << id << "not readable";
        return Result::failure(ErrorCode::DatabaseError, "Не удалось прочитать движение");
    }
    return Result::success(saved);
}

ServiceResult<FinancialMovement> LedgerService::create(const MovementDraft& draft)
{
    using Result = ServiceResult<FinancialMovement>;

    TransactionContext tx(m_db, "LedgerService::create");
    if (!tx.isActive()) {
        return Result::failure(ErrorCode::DatabaseError, "Ошибка базы данных");
    }

    Result res = create(draft, tx);
    if (!res.isOk()) return res;

    if (!tx.commit()) {
        return Result::failure(ErrorCode::DatabaseError, "Не удалось зафиксировать транзакцию");
    }

    qInfo(ledgerService) << "LedgerService::create: movement" << res.value.id
                         << res.value.typeString() << moneyToString(res.value.value);

    invalidateCaches();
    publishEvent(kEventMovementCreated, JsonCodec::toJson(res.value));
    return res;
}

ServiceResult<FinancialMovement> LedgerService::getById(int id)
{
    const FinancialMovement m = m_movementRepo->findById(id);
    if (!m.isValid()) {
        return ServiceResult<FinancialMovement>::failure(ErrorCode::NotFound, "Движение не найдено");
    }
    return ServiceResult<FinancialMovement>::success(m);
}

ServiceResult<MovementPage> LedgerService::list(const MovementFilter& filter, int page, int pageSize)
{
    using Result = ServiceResult<MovementPage>;

    const int safePage = page < 1 ? 1 : page;
    const int size = qBound(1, pageSize <= 0 ? m_defaultPageSize : pageSize, m_maxPageSize);

    const QString keySource = filter.canonicalString()
                              + QString("|page=%1|size=%2").arg(safePage).arg(size);
    const QString key = QString(kCacheMovementsListPrefix)
                        + QString::fromLatin1(QCryptographicHash::hash(keySource.toUtf8(),
                                                                       QCryptographicHash::Md5).toHex());

    if (m_cache) {
        QVariant cached;
        if (m_cache->get(key, &cached) && cached.canConvert<MovementPage>()) {
            return Result::success(cached.value<MovementPage>());
        }
    }

    const int total = m_movementRepo->count(filter);
    if (total < 0) {
        return Result::failure(ErrorCode::DatabaseError, "Не удалось получить список движений");
    }

    MovementPage result;
    result.page = safePage;
    result.pageSize = size;
    result.total = total;
    result.totalPages = (total + size - 1) / size;
    result.items = m_movementRepo->find(filter, size, (safePage - 1) * size);

    if (m_cache) {
        m_cache->set(key, QVariant::fromValue(result), m_cacheTtlSeconds);
    }
    return Result::success(result);
}

ServiceResult<FinancialMovement> LedgerService::applyPatch(FinancialMovement m, const MovementPatch& patch) const
{
    using Result = ServiceResult<FinancialMovement>;

    if (patch.type) {
        const auto type = FinancialMovement::typeFromString(patch.type->trimmed().toUpper());
        if (!type) return Result::failure(ErrorCode::InvalidType, "Тип должен быть REVENUE, EXPENSE, CMV или TAX");
        m.type = *type;
    }
    if (patch.value) {
        if (roundMoney(*patch.value) <= 0) {
            return Result::failure(ErrorCode::InvalidValue, "Значение должно быть больше нуля");
        }
        m.value = roundMoney(*patch.value);
    }
    if (patch.paymentStatus) {
        const auto status = FinancialMovement::statusFromString(patch.paymentStatus->trimmed());
        if (!status) return Result::failure(ErrorCode::InvalidStatus, "Статус должен быть Pending или Paid");
        m.paymentStatus = *status;
    }
    if (patch.movementDate) {
        if (patch.movementDate->trimmed().isEmpty()) {
            m.movementDate = QDateTime();
        } else {
            m.movementDate = parseFlexibleDateTime(*patch.movementDate);
            if (!m.movementDate.isValid()) {
                return Result::failure(ErrorCode::InvalidDate, "Неверная дата движения");
            }
        }
    }
    if (patch.description) {
        if (patch.description->trimmed().isEmpty()) {
            return Result::failure(ErrorCode::InvalidDescription, "Описание обязательно");
        }
        m.description = patch.description->trimmed();
    }

    if (patch.category) m.category = patch.category->trimmed();
    if (patch.subcategory) m.subcategory = patch.subcategory->trimmed();
    if (patch.paymentMethod) m.paymentMethod = patch.paymentMethod->trimmed();
    if (patch.senderReceiver) m.senderReceiver = patch.senderReceiver->trimmed();
    if (patch.notes) m.notes = patch.notes->trimmed();
    if (patch.paymentGatewayId) m.paymentGatewayId = patch.paymentGatewayId->trimmed();
    if (patch.transactionId) m.transactionId = patch.transactionId->trimmed();
    if (patch.bankAccount) m.bankAccount = patch.bankAccount->trimmed();

    if (m.paymentStatus == PaymentStatus::Paid && !m.movementDate.isValid()) {
        m.movementDate = QDateTime::currentDateTime();
    }
    return Result::success(m);
}

bool LedgerService::syncInvoiceStatus(TransactionContext& tx, const FinancialMovement& movement)
{
    if (!movement.isLinkedToInvoice()) return true;

    if (!m_invoiceRepo) {
        qCritical(ledgerService) << "LedgerService::syncInvoiceStatus: invoice repository is not set";
        return false;
    }

    if (!m_invoiceRepo->updatePaymentStatus(tx, movement.relatedEntityId,
                                            movement.paymentStatus, movement.movementDate)) {
        qWarning(ledgerService) << "LedgerService::syncInvoiceStatus: invoice" << movement.relatedEntityId
                                << "not updated";
        return false;
    }
    return true;
}

ServiceResult<FinancialMovement> LedgerService::update(int id, const MovementPatch& patch)
{
    using Result = ServiceResult<FinancialMovement>;

    const FinancialMovement current = m_movementRepo->findById(id);
    if (!current.isValid()) {
        return Result::failure(ErrorCode::NotFound, "Движение не найдено");
    }
    if (patch.isEmpty()) {
        return Result::failure(ErrorCode::NoUpdates, "Нет полей для обновления");
    }

    Result patched = applyPatch(current, patch);
    if (!patched.isOk()) return patched;

    TransactionContext tx(m_db, "LedgerService::update");
    if (!tx.isActive()) return Result::failure(ErrorCode::DatabaseError, "Ошибка базы данных");

    if (!m_movementRepo->update(tx, patched.value)) {
        return Result::failure(ErrorCode::DatabaseError, "Не удалось обновить движение");
    }

    if (patch.paymentStatus && !syncInvoiceStatus(tx, patched.value)) {
        return Result::failure(ErrorCode::SyncError, "Не удалось синхронизировать статус накладной");
    }

    if (!tx.commit()) {
        return Result::failure(ErrorCode::DatabaseError, "Не удалось зафиксировать транзакцию");
    }

    qInfo(ledgerService) << "LedgerService::update: movement" << id;
    invalidateCaches();
    return getById(id);
}

ServiceResult<FinancialMovement> LedgerService::updatePaymentStatus(int id, const QString& status, const QString& date)
{
    using Result = ServiceResult<FinancialMovement>;

    const auto newStatus = FinancialMovement::statusFromString(status.trimmed());
    if (!newStatus) {
        return Result::failure(ErrorCode::InvalidStatus, "Статус должен быть Pending или Paid");
    }

    FinancialMovement m = m_movementRepo->findById(id);
    if (!m.isValid()) {
        return Result::failure(ErrorCode::NotFound, "Движение не найдено");
    }

    m.paymentStatus = *newStatus;
    if (*newStatus == PaymentStatus::Paid) {
        if (date.trimmed().isEmpty()) {
            m.movementDate = QDateTime::currentDateTime();
        } else {
            m.movementDate = parseFlexibleDateTime(date);
            if (!m.movementDate.isValid()) {
                return Result::failure(ErrorCode::InvalidDate, "Неверная дата оплаты");
            }
        }
    } else {
        m.movementDate = QDateTime();
    }

    TransactionContext tx(m_db, "LedgerService::updatePaymentStatus");
    if (!tx.isActive()) return Result::failure(ErrorCode::DatabaseError, "Ошибка базы данных");

    if (!m_movementRepo->update(tx, m)) {
        return Result::failure(ErrorCode::DatabaseError, "Не удалось обновить статус");
    }

    if (!syncInvoiceStatus(tx, m)) {
        return Result::failure(ErrorCode::SyncError, "Не удалось синхронизировать статус накладной");
    }

    if (!tx.commit()) {
        return Result::failure(ErrorCode::DatabaseError, "Не удалось зафиксировать транзакцию");
    }

    qInfo(ledgerService) << "LedgerService::updatePaymentStatus: movement" << id << "->" << m.statusString();

    invalidateCaches();

    Result reloaded = getById(id);
    if (reloaded.isOk()) {
        QJsonObject payload;
        payload.insert("id", id);
        payload.insert("payment_status", reloaded.value.statusString());
        payload.insert("movement_date", JsonCodec::dateTime(reloaded.value.movementDate));
        payload.insert("related_entity_type", reloaded.value.relatedEntityType);
        payload.insert("related_entity_id", reloaded.value.relatedEntityId);
        publishEvent(kEventMovementStatusUpdated, payload);
    }
    return reloaded;
}

ServiceResult<FinancialMovement> LedgerService::saveAndReload(FinancialMovement movement, const QString& context)
{
    using Result = ServiceResult<FinancialMovement>;

    TransactionContext tx(m_db, context);
    if (!tx.isActive()) return Result::failure(ErrorCode::DatabaseError, "Ошибка базы данных");

    if (!m_movementRepo->update(tx, movement)) {
        return Result::failure(ErrorCode::DatabaseError, "Не удалось обновить движение");
    }
    if (!tx.commit()) {
        return Result::failure(ErrorCode::DatabaseError, "Не удалось зафиксировать транзакцию");
    }

    invalidateCaches();
    return getById(movement.id);
}

ServiceResult<FinancialMovement> LedgerService::updateGatewayInfo(int id, const GatewayPatch& patch)
{
    using Result = ServiceResult<FinancialMovement>;

    FinancialMovement m = m_movementRepo->findById(id);
    if (!m.isValid()) return Result::failure(ErrorCode::NotFound, "Движение не найдено");
    if (patch.isEmpty()) return Result::failure(ErrorCode::NoUpdates, "Нет полей для обновления");

    if (patch.paymentGatewayId) m.paymentGatewayId = patch.paymentGatewayId->trimmed();
    if (patch.transactionId) m.transactionId = patch.transactionId->trimmed();
    if (patch.bankAccount) m.bankAccount = patch.bankAccount->trimmed();

    return saveAndReload(m, "LedgerService::updateGatewayInfo");
}

ServiceResult<FinancialMovement> LedgerService::reconcile(int id, bool reconciled)
{
    FinancialMovement m = m_movementRepo->findById(id);
    if (!m.isValid()) {
        return ServiceResult<FinancialMovement>::failure(ErrorCode::NotFound, "Движение не найдено");
    }

    m.reconciled = reconciled;
    m.reconciledAt = reconciled ? QDateTime::currentDateTime() : QDateTime();

    return saveAndReload(m, "LedgerService::reconcile");
}

ServiceResult<bool> LedgerService::remove(int id, int userId)
{
    using Result = ServiceResult<bool>;

    const FinancialMovement m = m_movementRepo->findById(id);
    if (!m.isValid()) return Result::failure(ErrorCode::NotFound, "Движение не найдено");

    if (m.isLinkedToInvoice()) {
        if (!m_invoiceDeleter) {
            qCritical(ledgerService) << "LedgerService::remove: invoice deleter is not set";
            return Result::failure(ErrorCode::InternalError, "Внутренняя ошибка");
        }

        qInfo(ledgerService) << "LedgerService::remove: movement" << id
                             << "belongs to invoice" << m.relatedEntityId << "- deleting invoice";
        const ServiceResult<InvoiceDeletion> deletion = m_invoiceDeleter->deleteInvoice(m.relatedEntityId, userId);
        if (!deletion.isOk()) {
            return Result::failure(deletion.error, deletion.message);
        }
        return Result::success(true);
    }

    TransactionContext tx(m_db, "LedgerService::remove");
    if (!tx.isActive()) return Result::failure(ErrorCode::DatabaseError, "Ошибка базы данных");

    if (!m_movementRepo->deleteById(tx, id)) {
        return Result::failure(ErrorCode::DatabaseError, "Не удалось удалить движение");
    }
    if (!tx.commit()) {
        return Result::failure(ErrorCode::DatabaseError, "Не удалось зафиксировать транзакцию");
    }

    qInfo(ledgerService) << "LedgerService::remove: movement" << id;
    invalidateCaches();
    return Result::success(true);
}

QString LedgerService::resolvePeriod(const QString& period, const QDate& today, QDateTime* from, QDateTime* to)
{
    const QString p = period.trimmed().toLower();
    const QDate firstOfMonth(today.year(), today.month(), 1);

    if (p == "this_month") {
        *from = firstOfMonth.startOfDay();
        *to = firstOfMonth.addMonths(1).startOfDay();
        return p;
    }
    if (p == "last_month") {
        *from = firstOfMonth.addMonths(-1).startOfDay();
        *to = firstOfMonth.startOfDay();
        return p;
    }
    if (p == "last_30_days") {
        *from = today.addDays(-30).startOfDay();
        *to = QDateTime();
        return p;
    }

    *from = QDateTime();
    *to = QDateTime();
    return QStringLiteral("all");
}

ServiceResult<CashFlowSummary> LedgerService::cashFlowSummary(const QString& period, bool includePending)
{
    using Result = ServiceResult<CashFlowSummary>;

    QDateTime from;
    QDateTime to;
    const QString resolved = resolvePeriod(period, QDate::currentDate(), &from, &to);
    const QString key = QString(kCacheCashFlowPrefix) + resolved + ":" + (includePending ? "1" : "0");

    if (m_cache) {
        QVariant cached;
        if (m_cache->get(key, &cached) && cached.canConvert<CashFlowSummary>()) {
            return Result::success(cached.value<CashFlowSummary>());
        }
    }

    QMap<MovementType, Decimal> totals;
    if (!m_movementRepo->sumPaidByType(from, to, &totals)) {
        return Result::failure(ErrorCode::DatabaseError, "Не удалось рассчитать сводку");
    }

    CashFlowSummary s;
    s.period = resolved;
    s.totalRevenue = totals.value(MovementType::Revenue, Decimal(0));
    s.totalExpense = totals.value(MovementType::Expense, Decimal(0));
    s.totalCmv = totals.value(MovementType::Cmv, Decimal(0));
    s.totalTax = totals.value(MovementType::Tax, Decimal(0));
    s.grossProfit = s.totalRevenue - s.totalCmv;
    s.netProfit = s.grossProfit - s.totalExpense - s.totalTax;
    s.cashFlow = s.totalRevenue - s.totalExpense - s.totalCmv - s.totalTax;

    if (includePending) {
        Decimal pending = 0;
        if (!m_movementRepo->sumPendingObligations(from, to, &pending)) {
            return Result::failure(ErrorCode::DatabaseError, "Не удалось рассчитать ожидаемые платежи");
        }
        s.pendingAmount = pending;
    }

    if (m_cache) {
        m_cache->set(key, QVariant::fromValue(s), m_cacheTtlSeconds);
    }
    return Result::success(s);
}

ServiceResult<ReconciliationReport> LedgerService::reconciliationReport(const ReconciliationQuery& query)
{
    MovementFilter filter;
    filter.paymentStatus = PaymentStatus::Paid;
    filter.startDate = query.startDate;
    filter.endDate = query.endDate;
    filter.reconciled = query.reconciled;
    filter.paymentGatewayId = query.paymentGatewayId.trimmed();

    ReconciliationReport report;
    report.movements = m_movementRepo->find(filter, -1, 0);

    for (const FinancialMovement& m : report.movements) {
        ++report.totalCount;
        report.totalAmount += m.value;
        if (m.reconciled) {
            ++report.reconciledCount;
            report.reconciledAmount += m.value;
        } else {
            ++report.unreconciledCount;
            report.unreconciledAmount += m.value;
        }
    }

    return ServiceResult<ReconciliationReport>::success(report);
}

void LedgerService::invalidateCaches()
{
    if (!m_cache) return;

    try {
        m_cache->invalidatePrefix(kCacheMovementsPrefix);
    } catch (const std::exception& e) {
        qWarning(ledgerService) << "LedgerService::invalidateCaches: failed -" << e.what();
    }
}

void LedgerService::publishEvent(const QString& eventType, const QJsonObject& payload)
{
    if (!m_events) return;

    try {
        m_events->publish(eventType, payload);
    } catch (const std::exception& e) {
        qWarning(ledgerService) << "LedgerService::publishEvent:" << eventType << "failed -" << e.what();
    }
}
