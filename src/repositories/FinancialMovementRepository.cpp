#include "repositories/FinancialMovementRepository.h"
#include "repositories/SqlHelpers.h"
#include "TransactionContext.h"
#include "DateUtils.h"
#include "DecimalUtils.h"
#include "LedgerConstants.h"

#include <QSqlQuery>
#include <QSqlError>
#include <QStringList>
#include <QLoggingCategory>

Q_LOGGING_CATEGORY(movementRepo, "repository.movement")

namespace {

const char* kSelectColumns = R"(
    SELECT fm.id, fm.type, fm.value, fm.category, fm.subcategory, fm.description,
           fm.movement_date, fm.payment_status, fm.payment_method, fm.sender_receiver,
           fm.related_entity_type, fm.related_entity_id, fm.notes,
           fm.payment_gateway_id, fm.transaction_id, fm.bank_account,
           fm.reconciled, fm.reconciled_at, fm.created_at, fm.updated_at,
           fm.created_by, u.full_name AS created_by_name
    FROM financial_movements fm
    LEFT JOIN users u ON u.id = fm.created_by
)";

void bindAll(QSqlQuery& q, const QVariantList& params)
{
    for (const QVariant& p : params) q.addBindValue(p);
}

} // namespace

FinancialMovementRepository::FinancialMovementRepository(QSqlDatabase db)
    : m_db(db)
{
    if (!m_db.isOpen()) {
        qCritical(movementRepo) << "FinancialMovementRepository: Database is not open";
    }
}

bool FinancialMovementRepository::executeQuery(QSqlQuery& q, const QString& context) const
{
    if (!q.exec()) {
        qCritical(movementRepo) << "FinancialMovementRepository::" << context << "- SQL error:" << q.lastError().text();
        qCritical(movementRepo) << "FinancialMovementRepository::" << context << "- SQL:" << q.executedQuery();
        return false;
    }
    return true;
}

FinancialMovement FinancialMovementRepository::movementFromQuery(const QSqlQuery& q) const
{
    FinancialMovement m;
    m.id = q.value("id").toInt();
    m.type = FinancialMovement::typeFromString(q.value("type").toString()).value_or(MovementType::Expense);
    m.value = decimalFromVariant(q.value("value"));
    m.category = q.value("category").toString();
    m.subcategory = q.value("subcategory").toString();
    m.description = q.value("description").toString();
    m.movementDate = fromDbDateTime(q.value("movement_date"));
    m.paymentStatus = FinancialMovement::statusFromString(q.value("payment_status").toString())
                          .value_or(PaymentStatus::Pending);
    m.paymentMethod = q.value("payment_method").toString();
    m.senderReceiver = q.value("sender_receiver").toString();
    m.relatedEntityType = q.value("related_entity_type").toString();
    m.relatedEntityId = idFromVariant(q.value("related_entity_id"));
    m.notes = q.value("notes").toString();
    m.paymentGatewayId = q.value("payment_gateway_id").toString();
    m.transactionId = q.value("transaction_id").toString();
    m.bankAccount = q.value("bank_account").toString();
    m.reconciled = q.value("reconciled").toInt() == 1;
    m.reconciledAt = fromDbDateTime(q.value("reconciled_at"));
    m.createdAt = fromDbDateTime(q.value("created_at"));
    m.updatedAt = fromDbDateTime(q.value("updated_at"));
    m.createdBy = idFromVariant(q.value("created_by"));
    m.createdByName = q.value("created_by_name").toString();
    return m;
}

QString FinancialMovementRepository::whereClause(const MovementFilter& filter, QVariantList* params)
{
    QStringList conditions;

    if (filter.startDate.isValid()) {
        conditions << "fm.movement_date >= ?";
        params->append(toDbDateTime(filter.startDate.startOfDay()));
    }
    if (filter.endDate.isValid()) {
        conditions << "fm.movement_date < ?";
        params->append(toDbDateTime(filter.endDate.addDays(1).startOfDay()));
    }
    if (filter.type) {
        conditions << "fm.type = ?";
        params->append(FinancialMovement::typeToString(*filter.type));
    }
    if (!filter.category.isEmpty()) {
        conditions << "fm.category = ?";
        params->append(filter.category);
    }
    if (filter.paymentStatus) {
        conditions << "fm.payment_status = ?";
        params->append(FinancialMovement::statusToString(*filter.paymentStatus));
    }
    if (!filter.relatedEntityType.isEmpty()) {
        conditions << "fm.related_entity_type = ?";
        params->append(filter.relatedEntityType);
    }
    if (filter.relatedEntityId > 0) {
        conditions << "fm.related_entity_id = ?";
        params->append(filter.relatedEntityId);
    }
    if (!filter.paymentGatewayId.isEmpty()) {
        conditions << "fm.payment_gateway_id = ?";
        params->append(filter.paymentGatewayId);
    }
    if (!filter.transactionId.isEmpty()) {
        conditions << "fm.transaction_id = ?";
        params->append(filter.transactionId);
    }
    if (!filter.bankAccount.isEmpty()) {
        conditions << "fm.bank_account = ?";
        params->append(filter.bankAccount);
    }
    if (filter.reconciled) {
        conditions << "fm.reconciled = ?";
        params->append(*filter.reconciled ? 1 : 0);
    }

    return conditions.isEmpty() ? QString() : " WHERE " + conditions.join(" AND ");
}

int FinancialMovementRepository::create(TransactionContext& tx, const FinancialMovement& movement)
{
    if (movement.description.trimmed().isEmpty()) {
        qWarning(movementRepo) << "FinancialMovementRepository::create: empty description";
        return -1;
    }

    const QString now = toDbDateTime(QDateTime::currentDateTime());

    QSqlQuery q(tx.database());
    q.prepare(R"(
        INSERT INTO financial_movements (
            type, value, category, subcategory, description,
            movement_date, payment_status, payment_method, sender_receiver,
            related_entity_type, related_entity_id, notes,
            payment_gateway_id, transaction_id, bank_account,
            reconciled, reconciled_at, created_at, updated_at, created_by
        )
        VALUES (
            :type, :value, :category, :subcategory, :description,
            :movement_date, :status, :method, :sender,
            :related_type, :related_id, :notes,
            :gateway, :transaction, :bank,
            0, NULL, :created_at, :updated_at, :created_by
        )
    )");
    q.bindValue(":type", movement.typeString());
    q.bindValue(":value", moneyToString(movement.value));
    q.bindValue(":category", nullableText(movement.category));
    q.bindValue(":subcategory", nullableText(movement.subcategory));
    q.bindValue(":description", movement.description.trimmed());
    q.bindValue(":movement_date", toDbDateTimeVariant(movement.movementDate));
    q.bindValue(":status", movement.statusString());
    q.bindValue(":method", nullableText(movement.paymentMethod));
    q.bindValue(":sender", nullableText(movement.senderReceiver));
    q.bindValue(":related_type", nullableText(movement.relatedEntityType));
    q.bindValue(":related_id", nullableId(movement.relatedEntityId));
    q.bindValue(":notes", nullableText(movement.notes));
    q.bindValue(":gateway", nullableText(movement.paymentGatewayId));
    q.bindValue(":transaction", nullableText(movement.transactionId));
    q.bindValue(":bank", nullableText(movement.bankAccount));
    q.bindValue(":created_at", now);
    q.bindValue(":updated_at", now);
    q.bindValue(":created_by", nullableId(movement.createdBy));

    if (!executeQuery(q, "create")) return -1;

    const int id = q.lastInsertId().toInt();
    return id > 0 ? id : -1;
}

FinancialMovement FinancialMovementRepository::findById(int id)
{
    if (id <= 0) return FinancialMovement();

    QSqlQuery q(m_db);
    q.prepare(QString(kSelectColumns) + " WHERE fm.id = ?");
    q.addBindValue(id);

    if (!executeQuery(q, "findById")) return FinancialMovement();
    if (!q.next()) return FinancialMovement();

    return movementFromQuery(q);
}

QList<FinancialMovement> FinancialMovementRepository::find(const MovementFilter& filter, int limit, int offset)
{
    QList<FinancialMovement> res;
    QVariantList params;
    const QString where = whereClause(filter, &params);

    QSqlQuery q(m_db);
    q.prepare(QString(kSelectColumns) + where + R"(
        ORDER BY (fm.movement_date IS NULL), fm.movement_date DESC, fm.created_at DESC, fm.id DESC
        LIMIT ? OFFSET ?
    )");
    bindAll(q, params);
    q.addBindValue(limit < 0 ? -1 : limit);
    q.addBindValue(offset < 0 ? 0 : offset);

    if (!executeQuery(q, "find")) return res;
    while (q.next()) res.append(movementFromQuery(q));
    return res;
}

int FinancialMovementRepository::count(const MovementFilter& filter)
{
    QVariantList params;
    const QString where = whereClause(filter, &params);

    QSqlQuery q(m_db);
    q.prepare("SELECT COUNT(*) FROM financial_movements fm" + where);
    bindAll(q, params);

    if (!executeQuery(q, "count")) return -1;
    if (!q.next()) return -1;
    return q.value(0).toInt();
}

QList<FinancialMovement> FinancialMovementRepository::findByRelatedEntity(const QString& entityType, int entityId)
{
    QList<FinancialMovement> res;
    if (entityType.isEmpty() || entityId <= 0) return res;

    QSqlQuery q(m_db);
    q.prepare(QString(kSelectColumns) + R"(
        WHERE fm.related_entity_type = ? AND fm.related_entity_id = ?
        ORDER BY fm.id
    )");
    q.addBindValue(entityType);
    q.addBindValue(entityId);

    if (!executeQuery(q, "findByRelatedEntity")) return res;
    while (q.next()) res.append(movementFromQuery(q));
    return res;
}

bool FinancialMovementRepository::update(TransactionContext& tx, const FinancialMovement& movement)
{
    if (movement.id <= 0) return false;

    QSqlQuery q(tx.database());
    q.prepare(R"(
        UPDATE financial_movements
        SET type = :type,
            value = :value,
            category = :category,
            subcategory = :subcategory,
            description = :description,
            movement_date = :movement_date,
            payment_status = :status,
            payment_method = :method,
            sender_receiver = :sender,
            notes = :notes,
            payment_gateway_id = :gateway,
            transaction_id = :transaction,
            bank_account = :bank,
            reconciled = :reconciled,
            reconciled_at = :reconciled_at,
            updated_at = :updated_at
        WHERE id = :id
    )");
    q.bindValue(":id", movement.id);
    q.bindValue(":type", movement.typeString());
    q.bindValue(":value", moneyToString(movement.value));
    q.bindValue(":category", nullableText(movement.category));
    q.bindValue(":subcategory", nullableText(movement.subcategory));
    q.bindValue(":description", movement.description.trimmed());
    q.bindValue(":movement_date", toDbDateTimeVariant(movement.movementDate));
    q.bindValue(":status", movement.statusString());
    q.bindValue(":method", nullableText(movement.paymentMethod));
    q.bindValue(":sender", nullableText(movement.senderReceiver));
    q.bindValue(":notes", nullableText(movement.notes));
    q.bindValue(":gateway", nullableText(movement.paymentGatewayId));
    q.bindValue(":transaction", nullableText(movement.transactionId));
    q.bindValue(":bank", nullableText(movement.bankAccount));
    q.bindValue(":reconciled", movement.reconciled ? 1 : 0);
    q.bindValue(":reconciled_at", toDbDateTimeVariant(movement.reconciledAt));
    q.bindValue(":updated_at", toDbDateTime(QDateTime::currentDateTime()));

    if (!executeQuery(q, "update")) return false;
    return q.numRowsAffected() > 0;
}

bool FinancialMovementRepository::deleteById(TransactionContext& tx, int id)
{
    if (id <= 0) return false;

    QSqlQuery q(tx.database());
    q.prepare("DELETE FROM financial_movements WHERE id = :id");
    q.bindValue(":id", id);

    if (!executeQuery(q, "deleteById")) return false;
    return q.numRowsAffected() > 0;
}

int FinancialMovementRepository::deleteByRelatedEntity(TransactionContext& tx, const QString& entityType, int entityId)
{
    if (entityType.isEmpty() || entityId <= 0) return -1;

    QSqlQuery q(tx.database());
    q.prepare("DELETE FROM financial_movements WHERE related_entity_type = :type AND related_entity_id = :id");
    q.bindValue(":type", entityType);
    q.bindValue(":id", entityId);

    if (!executeQuery(q, "deleteByRelatedEntity")) return -1;
    return q.numRowsAffected();
}

bool FinancialMovementRepository::sumPaidByType(const QDateTime& from, const QDateTime& to,
                                                QMap<MovementType, Decimal>* totals)
{
    QStringList conditions = {"payment_status = 'Paid'", "movement_date IS NOT NULL"};
    QVariantList params;
    if (from.isValid()) {
        conditions << "movement_date >= ?";
        params << toDbDateTime(from);
    }
    if (to.isValid()) {
        conditions << "movement_date < ?";
        params << toDbDateTime(to);
    }

    QSqlQuery q(m_db);
    q.prepare("SELECT type, value FROM financial_movements WHERE " + conditions.join(" AND "));
    bindAll(q, params);

    if (!executeQuery(q, "sumPaidByType")) return false;

    QMap<MovementType, Decimal> sums;
    while (q.next()) {
        const auto type = FinancialMovement::typeFromString(q.value("type").toString());
        if (!type) continue;
        sums[*type] += decimalFromVariant(q.value("value"));
    }
    for (auto it = sums.constBegin(); it != sums.constEnd(); ++it) {
        totals->insert(it.key(), roundMoney(it.value()));
    }
    return true;
}

bool FinancialMovementRepository::sumPendingObligations(const QDateTime& from, const QDateTime& to, Decimal* total)
{
    QStringList conditions = {"payment_status = 'Pending'", "type IN ('EXPENSE', 'TAX')"};
    QVariantList params;
    if (from.isValid()) {
        conditions << "COALESCE(movement_date, created_at) >= ?";
        params << toDbDateTime(from);
    }
    if (to.isValid()) {
        conditions << "COALESCE(movement_date, created_at) < ?";
        params << toDbDateTime(to);
    }

    QSqlQuery q(m_db);
    q.prepare("SELECT value FROM financial_movements WHERE " + conditions.join(" AND "));
    bindAll(q, params);

    if (!executeQuery(q, "sumPendingObligations")) return false;

    Decimal sum = 0;
    while (q.next()) {
        sum += decimalFromVariant(q.value("value"));
    }
    *total = roundMoney(sum);
    return true;
}
