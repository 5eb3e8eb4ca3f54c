#ifndef RECURRENCESERVICE_H
#define RECURRENCESERVICE_H

#include <QDate>
#include <QList>
#include <QObject>
#include <QSqlDatabase>
#include <QString>
#include <QStringList>

#include <optional>

#include "DecimalUtils.h"
#include "ServiceResult.h"
#include "repositories/IRecurrenceRuleRepository.h"

class LedgerService;

struct RecurrenceRuleDraft {
    QString name;
    QString description;
    QString type;              // EXPENSE или TAX
    QString category;
    QString subcategory;
    std::optional<Decimal> value;
    QString recurrenceType;    // MONTHLY, WEEKLY, YEARLY
    std::optional<int> recurrenceDay;
    QString senderReceiver;
    QString notes;
};

struct RecurrenceRulePatch {
    std::optional<QString> name;
    std::optional<QString> description;
    std::optional<QString> type;
    std::optional<QString> category;
    std::optional<QString> subcategory;
    std::optional<Decimal> value;
    std::optional<QString> recurrenceType;
    std::optional<int> recurrenceDay;
    std::optional<QString> senderReceiver;
    std::optional<QString> notes;
    std::optional<bool> isActive;

    bool isEmpty() const
    {
        return !name && !description && !type && !category && !subcategory && !value
               && !recurrenceType && !recurrenceDay && !senderReceiver && !notes && !isActive;
    }
};

struct RecurrenceRunReport {
    int year = 0;
    int month = 0;
    int week = 0;
    int weekYear = 0;           // ISO-год недели; на стыке лет отличается от year
    int generatedCount = 0;
    int skippedCount = 0;
    QStringList errors;
};

/**
 * @brief Периодические обязательства и их генерация в журнал
 *
 * Каждое правило генерирует не больше одного движения на период; повторный
 * запуск за тот же период ничего не создаёт.
 */
class RecurrenceService : public QObject
{
    Q_OBJECT

public:
    explicit RecurrenceService(
        QSqlDatabase db,
        IRecurrenceRuleRepository* ruleRepo,
        LedgerService* ledger,
        QObject *parent = nullptr
    );

    ServiceResult<RecurrenceRule> createRule(const RecurrenceRuleDraft& draft, int userId);
    ServiceResult<QList<RecurrenceRule>> listRules(bool activeOnly);
    ServiceResult<RecurrenceRule> updateRule(int id, const RecurrenceRulePatch& patch);

    /**
     * @brief Мягкое удаление: правило остаётся, но не генерирует движения
     */
    ServiceResult<bool> deactivateRule(int id);

    /**
     * @brief Сгенерировать движения по активным правилам за период
     *
     * Не заданные year/month/week берутся из today (пустая дата - текущая).
     * Неделя по умолчанию берётся вместе с ISO-годом: 1 января может
     * относиться к 53-й неделе прошлого года. Ошибка одного правила попадает
     * в errors и не останавливает остальные.
     */
    ServiceResult<RecurrenceRunReport> generate(std::optional<int> year = std::nullopt,
                                                std::optional<int> month = std::nullopt,
                                                std::optional<int> week = std::nullopt,
                                                const QDate& today = QDate());

    /**
     * @brief Дата платежа по правилу
     *
     * MONTHLY - день обрезается до конца месяца; WEEKLY - понедельник ISO-недели
     * плюс (day - 1); YEARLY - 1 января плюс (day - 1), не позже 31 декабря.
     */
    static QDate dueDate(RecurrenceType type, int recurrenceDay, int year, int month, int week);

    // "M:2026-10", "W:2026-42", "Y:2026"
    static QString periodKey(RecurrenceType type, int year, int month, int week);

private:
    ServiceResult<bool> validateRule(const RecurrenceRule& rule) const;
    bool generateForRule(const RecurrenceRule& rule, RecurrenceRunReport* report);

private:
    QSqlDatabase m_db;
    IRecurrenceRuleRepository* m_ruleRepo;
    LedgerService* m_ledger;
};

#endif // RECURRENCESERVICE_H
