#include "RecurrenceService.h"
#include "DateUtils.h"
#include "LedgerConstants.h"
#include "LedgerService.h"
#include "TransactionContext.h"

#include <QDebug>
#include <QLoggingCategory>

Q_LOGGING_CATEGORY(recurrenceService, "service.recurrence")

RecurrenceService::RecurrenceService(
    QSqlDatabase db,
    IRecurrenceRuleRepository* ruleRepo,
    LedgerService* ledger,
    QObject *parent
)
    : QObject(parent)
    , m_db(db)
    , m_ruleRepo(ruleRepo)
    , m_ledger(ledger)
{
}

QDate RecurrenceService::dueDate(RecurrenceType type, int recurrenceDay, int year, int month, int week)
{
    switch (type) {
        case RecurrenceType::Monthly: {
            const QDate first(year, month, 1);
            if (!first.isValid()) return QDate();
            const int day = qBound(1, recurrenceDay, first.daysInMonth());
            return QDate(year, month, day);
        }
        case RecurrenceType::Weekly: {
            // 4 января всегда лежит в первой ISO-неделе года
            const QDate jan4(year, 1, 4);
            if (!jan4.isValid()) return QDate();
            const QDate monday = jan4.addDays(1 - jan4.dayOfWeek());
            return monday.addDays(qint64(week - 1) * 7 + (recurrenceDay - 1));
        }
        case RecurrenceType::Yearly: {
            const QDate jan1(year, 1, 1);
            if (!jan1.isValid()) return QDate();
            const QDate date = jan1.addDays(recurrenceDay - 1);
            return date.year() == year ? date : QDate(year, 12, 31);
        }
    }
    return QDate();
}

QString RecurrenceService::periodKey(RecurrenceType type, int year, int month, int week)
{
    switch (type) {
        case RecurrenceType::Monthly:
            return QString("M:%1-%2").arg(year, 4, 10, QChar('0')).arg(month, 2, 10, QChar('0'));
        case RecurrenceType::Weekly:
            return QString("W:%1-%2").arg(year, 4, 10, QChar('0')).arg(week, 2, 10, QChar('0'));
        case RecurrenceType::Yearly:
            return QString("Y:%1").arg(year, 4, 10, QChar('0'));
    }
    return QString();
}

ServiceResult<bool> RecurrenceService::validateRule(const RecurrenceRule& rule) const
{
    using Result = ServiceResult<bool>;

    if (rule.name.trimmed().isEmpty()) {
        return Result::failure(ErrorCode::InvalidName, "Название правила обязательно");
    }
    if (rule.type != MovementType::Expense && rule.type != MovementType::Tax) {
        return Result::failure(ErrorCode::InvalidType, "Тип должен быть EXPENSE или TAX");
    }
    if (rule.value <= 0) {
        return Result::failure(ErrorCode::InvalidValue, "Значение должно быть больше нуля");
    }

    int maxDay = 31;
    if (rule.recurrenceType == RecurrenceType::Weekly) maxDay = 7;
    else if (rule.recurrenceType == RecurrenceType::Yearly) maxDay = 365;

    if (rule.recurrenceDay < 1 || rule.recurrenceDay > maxDay) {
        return Result::failure(ErrorCode::InvalidRecurrenceDay,
                               QString("День повторения для %1 должен быть от 1 до %2")
                                   .arg(rule.recurrenceTypeString()).arg(maxDay));
    }
    return Result::success(true);
}

ServiceResult<RecurrenceRule> RecurrenceService::createRule(const RecurrenceRuleDraft& draft, int userId)
{
    using Result = ServiceResult<RecurrenceRule>;

    RecurrenceRule rule;
    rule.name = draft.name.trimmed();
    rule.description = draft.description.trimmed();
    rule.category = draft.category.trimmed();
    rule.subcategory = draft.subcategory.trimmed();
    rule.senderReceiver = draft.senderReceiver.trimmed();
    rule.notes = draft.notes.trimmed();
    rule.createdBy = userId;

    if (rule.name.isEmpty()) {
        return Result::failure(ErrorCode::InvalidName, "Название правила обязательно");
    }

    const auto type = FinancialMovement::typeFromString(draft.type.trimmed().toUpper());
    if (!type) return Result::failure(ErrorCode::InvalidType, "Тип должен быть EXPENSE или TAX");
    rule.type = *type;

    const auto recurrenceType = RecurrenceRule::recurrenceTypeFromString(draft.recurrenceType);
    if (!recurrenceType) {
        return Result::failure(ErrorCode::InvalidRecurrenceType, "Тип повторения должен быть MONTHLY, WEEKLY или YEARLY");
    }
    rule.recurrenceType = *recurrenceType;

    if (!draft.recurrenceDay) {
        return Result::failure(ErrorCode::InvalidRecurrenceDay, "День повторения обязателен");
    }
    rule.recurrenceDay = *draft.recurrenceDay;

    if (!draft.value) return Result::failure(ErrorCode::InvalidValue, "Значение должно быть больше нуля");
    rule.value = roundMoney(*draft.value);

    const ServiceResult<bool> valid = validateRule(rule);
    if (!valid.isOk()) return Result::propagate(valid);

    TransactionContext tx(m_db, "RecurrenceService::createRule");
    if (!tx.isActive()) return Result::failure(ErrorCode::DatabaseError, "Ошибка базы данных");

    rule.id = m_ruleRepo->create(tx, rule);
    if (rule.id < 0) return Result::failure(ErrorCode::DatabaseError, "Не удалось создать правило");

    if (!tx.commit()) {
        return Result::failure(ErrorCode::DatabaseError, "Не удалось зафиксировать транзакцию");
    }

    qInfo(recurrenceService) << "RecurrenceService::createRule:" << rule.id << rule.name << rule.recurrenceTypeString();
    return Result::success(m_ruleRepo->findById(rule.id));
}

ServiceResult<QList<RecurrenceRule>> RecurrenceService::listRules(bool activeOnly)
{
    return ServiceResult<QList<RecurrenceRule>>::success(m_ruleRepo->findAll(activeOnly));
}

ServiceResult<RecurrenceRule> RecurrenceService::updateRule(int id, const RecurrenceRulePatch& patch)
{
    using Result = ServiceResult<RecurrenceRule>;

    RecurrenceRule rule = m_ruleRepo->findById(id);
    if (!rule.isValid()) return Result::failure(ErrorCode::NotFound, "Правило не найдено");

    if (patch.isEmpty()) return Result::failure(ErrorCode::NoUpdates, "Нет полей для обновления");

    if (patch.name) rule.name = patch.name->trimmed();
    if (patch.description) rule.description = patch.description->trimmed();
    if (patch.category) rule.category = patch.category->trimmed();
    if (patch.subcategory) rule.subcategory = patch.subcategory->trimmed();
    if (patch.senderReceiver) rule.senderReceiver = patch.senderReceiver->trimmed();
    if (patch.notes) rule.notes = patch.notes->trimmed();
    if (patch.isActive) rule.isActive = *patch.isActive;
    if (patch.recurrenceDay) rule.recurrenceDay = *patch.recurrenceDay;
    if (patch.value) rule.value = roundMoney(*patch.value);

    if (patch.type) {
        const auto type = FinancialMovement::typeFromString(patch.type->trimmed().toUpper());
        if (!type) return Result::failure(ErrorCode::InvalidType, "Тип должен быть EXPENSE или TAX");
        rule.type = *type;
    }
    if (patch.recurrenceType) {
        const auto recurrenceType = RecurrenceRule::recurrenceTypeFromString(*patch.recurrenceType);
        if (!recurrenceType) {
            return Result::failure(ErrorCode::InvalidRecurrenceType, "Тип повторения должен быть MONTHLY, WEEKLY или YEARLY");
        }
        rule.recurrenceType = *recurrenceType;
    }

    const ServiceResult<bool> valid = validateRule(rule);
    if (!valid.isOk()) return Result::propagate(valid);

    TransactionContext tx(m_db, "RecurrenceService::updateRule");
    if (!tx.isActive()) return Result::failure(ErrorCode::DatabaseError, "Ошибка базы данных");

    if (!m_ruleRepo->update(tx, rule)) {
        return Result::failure(ErrorCode::DatabaseError, "Не удалось обновить правило");
    }
    if (!tx.commit()) {
        return Result::failure(ErrorCode::DatabaseError, "Не удалось зафиксировать транзакцию");
    }

    qInfo(recurrenceService) << "RecurrenceService::updateRule:" << id;
    return Result::success(m_ruleRepo->findById(id));
}

ServiceResult<bool> RecurrenceService::deactivateRule(int id)
{
    using Result = ServiceResult<bool>;

    const RecurrenceRule rule = m_ruleRepo->findById(id);
    if (!rule.isValid()) return Result::failure(ErrorCode::NotFound, "Правило не найдено");

    TransactionContext tx(m_db, "RecurrenceService::deactivateRule");
    if (!tx.isActive()) return Result::failure(ErrorCode::DatabaseError, "Ошибка базы данных");

    if (!m_ruleRepo->setActive(tx, id, false)) {
        return Result::failure(ErrorCode::DatabaseError, "Не удалось деактивировать правило");
    }
    if (!tx.commit()) {
        return Result::failure(ErrorCode::DatabaseError, "Не удалось зафиксировать транзакцию");
    }

    qInfo(recurrenceService) << "RecurrenceService::deactivateRule:" << id;
    return Result::success(true);
}

bool RecurrenceService::generateForRule(const RecurrenceRule& rule, RecurrenceRunReport* report)
{
    const bool weekly = rule.recurrenceType == RecurrenceType::Weekly;
    const int year = weekly ? report->weekYear : report->year;

    if (weekly) {
        // 28 декабря всегда в последней ISO-неделе года
        const int weeksInYear = QDate(year, 12, 28).weekNumber();
        if (report->week > weeksInYear) {
            report->errors << QString("Правило %1: в %2 году %3 недели").arg(rule.id).arg(year).arg(weeksInYear);
            return false;
        }
    }

    const QString key = periodKey(rule.recurrenceType, year, report->month, report->week);
    const QDate due = dueDate(rule.recurrenceType, rule.recurrenceDay, year, report->month, report->week);
    if (!due.isValid()) {
        report->errors << QString("Правило %1: не удалось вычислить дату").arg(rule.id);
        return false;
    }

    TransactionContext tx(m_db, "RecurrenceService::generate");
    if (!tx.isActive()) {
        report->errors << QString("Правило %1: ошибка базы данных").arg(rule.id);
        return false;
    }

    const PeriodClaim claim = m_ruleRepo->claimPeriod(tx, rule.id, key);
    if (claim == PeriodClaim::AlreadyGenerated) {
        qDebug(recurrenceService) << "RecurrenceService: rule" << rule.id << "already generated for" << key;
        report->skippedCount++;
        return false;
    }
    if (claim == PeriodClaim::Failed) {
        report->errors << QString("Правило %1: ошибка базы данных").arg(rule.id);
        return false;
    }

    MovementDraft draft;
    draft.type = FinancialMovement::typeToString(rule.type);
    draft.value = rule.value;
    draft.category = !rule.category.isEmpty()
                         ? rule.category
                         : QString(rule.type == MovementType::Tax ? kCategoryTaxes : kCategoryFixedCosts);
    draft.subcategory = rule.subcategory.isEmpty() ? rule.name : rule.subcategory;
    draft.description = rule.description.isEmpty()
                            ? QString("%1 - %2").arg(rule.name, rule.recurrenceTypeString())
                            : rule.description;
    draft.movementDate = due.toString(Qt::ISODate);
    draft.paymentStatus = "Pending";
    draft.senderReceiver = rule.senderReceiver;
    draft.relatedEntityType = kRelatedRecurrenceRule;
    draft.relatedEntityId = rule.id;
    draft.notes = rule.notes;
    draft.createdBy = rule.createdBy;

    const ServiceResult<FinancialMovement> created = m_ledger->create(draft, tx);
    if (!created.isOk()) {
        report->errors << QString("Правило %1 (%2): %3").arg(rule.id).arg(rule.name, created.message);
        return false;
    }

    if (!m_ruleRepo->attachMovement(tx, rule.id, key, created.value.id)) {
        report->errors << QString("Правило %1: ошибка базы данных").arg(rule.id);
        return false;
    }

    if (!tx.commit()) {
        report->errors << QString("Правило %1: не удалось зафиксировать транзакцию").arg(rule.id);
        return false;
    }

    qInfo(recurrenceService) << "RecurrenceService: rule" << rule.id << "period" << key
                             << "movement" << created.value.id << "due" << due;
    return true;
}

ServiceResult<RecurrenceRunReport> RecurrenceService::generate(std::optional<int> year,
                                                               std::optional<int> month,
                                                               std::optional<int> week,
                                                               const QDate& today)
{
    using Result = ServiceResult<RecurrenceRunReport>;

    const QDate current = today.isValid() ? today : QDate::currentDate();
    int isoYear = 0;
    const int currentWeek = current.weekNumber(&isoYear);

    RecurrenceRunReport report;
    report.year = year.value_or(current.year());
    report.month = month.value_or(current.month());
    report.week = week.value_or(currentWeek);
    report.weekYear = (week || year) ? report.year : isoYear;

    if (report.year < 1 || report.year > 9999) {
        return Result::failure(ErrorCode::InvalidDate, "Неверный год");
    }
    if (report.month < 1 || report.month > 12) {
        return Result::failure(ErrorCode::InvalidDate, "Месяц должен быть от 1 до 12");
    }
    if (report.week < 1 || report.week > 53) {
        return Result::failure(ErrorCode::InvalidDate, "Неделя должна быть от 1 до 53");
    }

    const QList<RecurrenceRule> rules = m_ruleRepo->findAll(true);
    for (const RecurrenceRule& rule : rules) {
        if (generateForRule(rule, &report)) {
            report.generatedCount++;
        }
    }

    for (const QString& error : report.errors) {
        qWarning(recurrenceService) << "RecurrenceService::generate:" << error;
    }
    qInfo(recurrenceService) << "RecurrenceService::generate:" << report.year << report.month
                             << "week" << report.weekYear << report.week
                             << "generated" << report.generatedCount << "skipped" << report.skippedCount;

    if (report.generatedCount > 0) {
        m_ledger->invalidateCaches();
    }

    return Result::success(report);
}
