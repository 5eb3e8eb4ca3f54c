#ifndef IRECURRENCERULEREPOSITORY_H
#define IRECURRENCERULEREPOSITORY_H

#include <QDateTime>
#include <QList>
#include <QString>

#include <optional>

#include "DecimalUtils.h"
#include "repositories/IFinancialMovementRepository.h"

class TransactionContext;

enum class RecurrenceType {
    Monthly,
    Weekly,
    Yearly
};

/**
 * @brief Шаблон периодического обязательства
 *
 * recurrenceDay: MONTHLY 1-31 (обрезается до последнего дня месяца),
 * WEEKLY 1-7 (день ISO-недели), YEARLY 1-365.
 */
struct RecurrenceRule {
    int id = 0;
    QString name;
    QString description;
    MovementType type = MovementType::Expense;
    QString category;
    QString subcategory;
    Decimal value = 0;
    RecurrenceType recurrenceType = RecurrenceType::Monthly;
    int recurrenceDay = 1;
    QString senderReceiver;
    QString notes;
    bool isActive = true;
    int createdBy = 0;
    QDateTime createdAt;
    QDateTime updatedAt;

    bool isValid() const { return id > 0; }

    QString recurrenceTypeString() const;
    static QString recurrenceTypeToString(RecurrenceType type);
    static std::optional<RecurrenceType> recurrenceTypeFromString(const QString &str);
};

/**
 * @brief Результат захвата периода генерации
 */
enum class PeriodClaim {
    Claimed,
    AlreadyGenerated,
    Failed
};

class IRecurrenceRuleRepository
{
public:
    virtual ~IRecurrenceRuleRepository() = default;

    virtual int create(TransactionContext &tx, const RecurrenceRule &rule) = 0;
    virtual RecurrenceRule findById(int id) = 0;
    virtual QList<RecurrenceRule> findAll(bool activeOnly) = 0;
    virtual bool update(TransactionContext &tx, const RecurrenceRule &rule) = 0;
    virtual bool setActive(TransactionContext &tx, int id, bool active) = 0;

    /**
     * @brief Атомарно занять пару (правило, период)
     *
     * Уникальность обеспечивается ограничением UNIQUE(rule_id, period_key),
     * повторный запуск получает AlreadyGenerated.
     */
    virtual PeriodClaim claimPeriod(TransactionContext &tx, int ruleId, const QString &periodKey) = 0;

    virtual bool attachMovement(TransactionContext &tx, int ruleId, const QString &periodKey, int movementId) = 0;
};

#endif // IRECURRENCERULEREPOSITORY_H
