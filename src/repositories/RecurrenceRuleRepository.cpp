#include "repositories/RecurrenceRuleRepository.h"
#include "repositories/SqlHelpers.h"
#include "TransactionContext.h"
#include "DateUtils.h"

#include <QSqlQuery>
#include <QSqlError>
#include <QLoggingCategory>

Q_LOGGING_CATEGORY(recurrenceRepo, "repository.recurrence")

QString RecurrenceRule::recurrenceTypeString() const
{
    return recurrenceTypeToString(recurrenceType);
}

QString RecurrenceRule::recurrenceTypeToString(RecurrenceType type)
{
    switch (type) {
        case RecurrenceType::Monthly: return "MONTHLY";
        case RecurrenceType::Weekly: return "WEEKLY";
        case RecurrenceType::Yearly: return "YEARLY";
    }
    return "MONTHLY";
}

std::optional<RecurrenceType> RecurrenceRule::recurrenceTypeFromString(const QString &str)
{
    const QString upper = str.trimmed().toUpper();
    if (upper == "MONTHLY") return RecurrenceType::Monthly;
    if (upper == "WEEKLY") return RecurrenceType::Weekly;
    if (upper == "YEARLY") return RecurrenceType::Yearly;
    return std::nullopt;
}

RecurrenceRuleRepository::RecurrenceRuleRepository(QSqlDatabase db)
    : m_db(db)
{
    if (!m_db.isOpen()) {
        qCritical(recurrenceRepo) << "RecurrenceRuleRepository: Database is not open";
    }
}

bool RecurrenceRuleRepository::executeQuery(QSqlQuery& q, const QString& context) const
{
    if (!q.exec()) {
        qCritical(recurrenceRepo) << "RecurrenceRuleRepository::" << context << "- SQL error:" << q.lastError().text();
        qCritical(recurrenceRepo) << "RecurrenceRuleRepository::" << context << "- SQL:" << q.executedQuery();
        return false;
    }
    return true;
}

RecurrenceRule RecurrenceRuleRepository::ruleFromQuery(const QSqlQuery& q) const
{
    RecurrenceRule r;
    r.id = q.value("id").toInt();
    r.name = q.value("name").toString();
    r.description = q.value("description").toString();
    r.type = FinancialMovement::typeFromString(q.value("type").toString()).value_or(MovementType::Expense);
    r.category = q.value("category").toString();
    r.subcategory = q.value("subcategory").toString();
    r.value = decimalFromVariant(q.value("value"));
    r.recurrenceType = RecurrenceRule::recurrenceTypeFromString(q.value("recurrence_type").toString())
                           .value_or(RecurrenceType::Monthly);
    r.recurrenceDay = q.value("recurrence_day").toInt();
    r.senderReceiver = q.value("sender_receiver").toString();
    r.notes = q.value("notes").toString();
    r.isActive = q.value("is_active").toInt() == 1;
    r.createdBy = idFromVariant(q.value("created_by"));
    r.createdAt = fromDbDateTime(q.value("created_at"));
    r.updatedAt = fromDbDateTime(q.value("updated_at"));
    return r;
}

int RecurrenceRuleRepository::create(TransactionContext& tx, const RecurrenceRule& rule)
{
    if (rule.name.trimmed().isEmpty()) return -1;

    const QString now = toDbDateTime(QDateTime::currentDateTime());

    QSqlQuery q(tx.database());
    q.prepare(R"(
        INSERT INTO recurrence_rules (
            name, description, type, category, subcategory, value,
            recurrence_type, recurrence_day, sender_receiver, notes,
            is_active, created_by, created_at, updated_at
        )
        VALUES (:name, :description, :type, :category, :subcategory, :value,
                :recurrence_type, :recurrence_day, :sender, :notes,
                :active, :created_by, :created_at, :updated_at)
    )");
    q.bindValue(":name", rule.name.trimmed());
    q.bindValue(":description", nullableText(rule.description));
    q.bindValue(":type", FinancialMovement::typeToString(rule.type));
    q.bindValue(":category", nullableText(rule.category));
    q.bindValue(":subcategory", nullableText(rule.subcategory));
    q.bindValue(":value", moneyToString(rule.value));
    q.bindValue(":recurrence_type", rule.recurrenceTypeString());
    q.bindValue(":recurrence_day", rule.recurrenceDay);
    q.bindValue(":sender", nullableText(rule.senderReceiver));
    q.bindValue(":notes", nullableText(rule.notes));
    q.bindValue(":active", rule.isActive ? 1 : 0);
    q.bindValue(":created_by", nullableId(rule.createdBy));
    q.bindValue(":created_at", now);
    q.bindValue(":updated_at", now);

    if (!executeQuery(q, "create")) return -1;

    const int id = q.lastInsertId().toInt();
    return id > 0 ? id : -1;
}

RecurrenceRule RecurrenceRuleRepository::findById(int id)
{
    if (id <= 0) return RecurrenceRule();

    QSqlQuery q(m_db);
    q.prepare("SELECT * FROM recurrence_rules WHERE id = :id");
    q.bindValue(":id", id);

    if (!executeQuery(q, "findById")) return RecurrenceRule();
    if (!q.next()) return RecurrenceRule();

    return ruleFromQuery(q);
}

QList<RecurrenceRule> RecurrenceRuleRepository::findAll(bool activeOnly)
{
    QList<RecurrenceRule> res;

    QSqlQuery q(m_db);
    q.prepare(activeOnly
              ? "SELECT * FROM recurrence_rules WHERE is_active = 1 ORDER BY name, id"
              : "SELECT * FROM recurrence_rules ORDER BY name, id");

    if (!executeQuery(q, "findAll")) return res;
    while (q.next()) res.append(ruleFromQuery(q));
    return res;
}

bool RecurrenceRuleRepository::update(TransactionContext& tx, const RecurrenceRule& rule)
{
    if (rule.id <= 0) return false;

    QSqlQuery q(tx.database());
    q.prepare(R"(
        UPDATE recurrence_rules
        SET name = :name,
            description = :description,
            type = :type,
            category = :category,
            subcategory = :subcategory,
            value = :value,
            recurrence_type = :recurrence_type,
            recurrence_day = :recurrence_day,
            sender_receiver = :sender,
            notes = :notes,
            is_active = :active,
            updated_at = :updated_at
        WHERE id = :id
    )");
    q.bindValue(":id", rule.id);
    q.bindValue(":name", rule.name.trimmed());
    q.bindValue(":description", nullableText(rule.description));
    q.bindValue(":type", FinancialMovement::typeToString(rule.type));
    q.bindValue(":category", nullableText(rule.category));
    q.bindValue(":subcategory", nullableText(rule.subcategory));
    q.bindValue(":value", moneyToString(rule.value));
    q.bindValue(":recurrence_type", rule.recurrenceTypeString());
    q.bindValue(":recurrence_day", rule.recurrenceDay);
    q.bindValue(":sender", nullableText(rule.senderReceiver));
    q.bindValue(":notes", nullableText(rule.notes));
    q.bindValue(":active", rule.isActive ? 1 : 0);
    q.bindValue(":updated_at", toDbDateTime(QDateTime::currentDateTime()));

    if (!executeQuery(q, "update")) return false;
    return q.numRowsAffected() > 0;
}

bool RecurrenceRuleRepository::setActive(TransactionContext& tx, int id, bool active)
{
    if (id <= 0) return false;

    QSqlQuery q(tx.database());
    q.prepare("UPDATE recurrence_rules SET is_active = :active, updated_at = :updated_at WHERE id = :id");
    q.bindValue(":active", active ? 1 : 0);
    q.bindValue(":updated_at", toDbDateTime(QDateTime::currentDateTime()));
    q.bindValue(":id", id);

    if (!executeQuery(q, "setActive")) return false;
    return q.numRowsAffected() > 0;
}

PeriodClaim RecurrenceRuleRepository::claimPeriod(TransactionContext& tx, int ruleId, const QString& periodKey)
{
    if (ruleId <= 0 || periodKey.isEmpty()) return PeriodClaim::Failed;

    QSqlQuery q(tx.database());
    q.prepare(R"(
        INSERT OR IGNORE INTO recurrence_generations (rule_id, period_key, created_at)
        VALUES (:rule, :period, :created_at)
    )");
    q.bindValue(":rule", ruleId);
    q.bindValue(":period", periodKey);
    q.bindValue(":created_at", toDbDateTime(QDateTime::currentDateTime()));

    if (!executeQuery(q, "claimPeriod")) return PeriodClaim::Failed;
    return q.numRowsAffected() > 0 ? PeriodClaim::Claimed : PeriodClaim::AlreadyGenerated;
}

bool RecurrenceRuleRepository::attachMovement(TransactionContext& tx, int ruleId, const QString& periodKey, int movementId)
{
    QSqlQuery q(tx.database());
    q.prepare(R"(
        UPDATE recurrence_generations
        SET movement_id = :movement
        WHERE rule_id = :rule AND period_key = :period
    )");
    q.bindValue(":movement", movementId);
    q.bindValue(":rule", ruleId);
    q.bindValue(":period", periodKey);

    if (!executeQuery(q, "attachMovement")) return false;
    return q.numRowsAffected() > 0;
}
