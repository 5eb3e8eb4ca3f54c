#include "repositories/AuditRepository.h"
#include "repositories/SqlHelpers.h"
#include "TransactionContext.h"
#include "DateUtils.h"

#include <QJsonDocument>
#include <QSqlQuery>
#include <QSqlError>
#include <QLoggingCategory>

Q_LOGGING_CATEGORY(auditRepo, "repository.audit")

namespace {

QString toCompactJson(const QJsonObject& obj)
{
    if (obj.isEmpty()) return QString();
    return QString::fromUtf8(QJsonDocument(obj).toJson(QJsonDocument::Compact));
}

QJsonObject fromJsonText(const QVariant& value)
{
    const QByteArray raw = value.toString().toUtf8();
    if (raw.isEmpty()) return QJsonObject();
    return QJsonDocument::fromJson(raw).object();
}

} // namespace

QString AuditEntry::actionToString(AuditAction action)
{
    switch (action) {
        case AuditAction::Create: return "CREATE";
        case AuditAction::Update: return "UPDATE";
        case AuditAction::Delete: return "DELETE";
    }
    return "UPDATE";
}

AuditAction AuditEntry::actionFromString(const QString &str)
{
    if (str == "CREATE") return AuditAction::Create;
    if (str == "DELETE") return AuditAction::Delete;
    return AuditAction::Update;
}

AuditRepository::AuditRepository(QSqlDatabase db)
    : m_db(db)
{
    if (!m_db.isOpen()) {
        qCritical(auditRepo) << "AuditRepository: Database is not open";
    }
}

bool AuditRepository::executeQuery(QSqlQuery& q, const QString& context) const
{
    if (!q.exec()) {
        qCritical(auditRepo) << "AuditRepository::" << context << "- SQL error:" << q.lastError().text();
        qCritical(auditRepo) << "AuditRepository::" << context << "- SQL:" << q.executedQuery();
        return false;
    }
    return true;
}

AuditEntry AuditRepository::entryFromQuery(const QSqlQuery& q) const
{
    AuditEntry e;
    e.id = q.value("id").toInt();
    e.invoiceId = q.value("purchase_invoice_id").toInt();
    e.action = AuditEntry::actionFromString(q.value("action_type").toString());
    e.changedBy = idFromVariant(q.value("changed_by"));
    e.oldValues = fromJsonText(q.value("old_values"));
    e.newValues = fromJsonText(q.value("new_values"));
    const QString fields = q.value("changed_fields").toString();
    e.changedFields = fields.isEmpty() ? QStringList() : fields.split(',');
    e.notes = q.value("notes").toString();
    e.createdAt = fromDbDateTime(q.value("created_at"));
    return e;
}

int AuditRepository::record(TransactionContext& tx, const AuditEntry& entry)
{
    if (entry.invoiceId <= 0) return -1;

    QSqlQuery q(tx.database());
    q.prepare(R"(
        INSERT INTO purchase_invoice_audit (
            purchase_invoice_id, action_type, changed_by,
            old_values, new_values, changed_fields, notes, created_at
        )
        VALUES (:invoice, :action, :changed_by, :old_values, :new_values, :fields, :notes, :created_at)
    )");
    q.bindValue(":invoice", entry.invoiceId);
    q.bindValue(":action", AuditEntry::actionToString(entry.action));
    q.bindValue(":changed_by", nullableId(entry.changedBy));
    q.bindValue(":old_values", nullableText(toCompactJson(entry.oldValues)));
    q.bindValue(":new_values", nullableText(toCompactJson(entry.newValues)));
    q.bindValue(":fields", nullableText(entry.changedFields.join(',')));
    q.bindValue(":notes", nullableText(entry.notes));
    q.bindValue(":created_at", toDbDateTime(QDateTime::currentDateTime()));

    if (!executeQuery(q, "record")) return -1;

    const int id = q.lastInsertId().toInt();
    return id > 0 ? id : -1;
}

QList<AuditEntry> AuditRepository::findByInvoice(int invoiceId)
{
    QList<AuditEntry> res;
    if (invoiceId <= 0) return res;

    QSqlQuery q(m_db);
    q.prepare(R"(
        SELECT id, purchase_invoice_id, action_type, changed_by,
               old_values, new_values, changed_fields, notes, created_at
        FROM purchase_invoice_audit
        WHERE purchase_invoice_id = :invoice
        ORDER BY id
    )");
    q.bindValue(":invoice", invoiceId);

    if (!executeQuery(q, "findByInvoice")) return res;
    while (q.next()) res.append(entryFromQuery(q));
    return res;
}
