#ifndef IFINANCIALMOVEMENTREPOSITORY_H
#define IFINANCIALMOVEMENTREPOSITORY_H

#include <QDateTime>
#include <QList>
#include <QMap>
#include <QString>

#include <optional>

#include "DecimalUtils.h"

class TransactionContext;

/**
 * @brief Тип движения (дебет/кредит задаются неявно через тип)
 */
enum class MovementType {
    Revenue,
    Expense,
    Cmv,
    Tax
};

enum class PaymentStatus {
    Pending,
    Paid
};

/**
 * @brief Одна строка финансового журнала
 *
 * movementDate пустая - движение ещё не реализовано (для Pending может
 * хранить ожидаемую дату). Для Paid дата обязательна.
 */
struct FinancialMovement {
    int id = 0;
    MovementType type = MovementType::Expense;
    Decimal value = 0;
    QString category;
    QString subcategory;
    QString description;
    QDateTime movementDate;
    PaymentStatus paymentStatus = PaymentStatus::Pending;
    QString paymentMethod;
    QString senderReceiver;
    QString relatedEntityType;
    int relatedEntityId = 0;
    QString notes;
    QString paymentGatewayId;
    QString transactionId;
    QString bankAccount;
    bool reconciled = false;
    QDateTime reconciledAt;
    QDateTime createdAt;
    QDateTime updatedAt;
    int createdBy = 0;
    QString createdByName;

    bool isValid() const { return id > 0; }
    bool isLinkedToInvoice() const;

    QString typeString() const;
    QString statusString() const;
    static QString typeToString(MovementType type);
    static QString statusToString(PaymentStatus status);
    static std::optional<MovementType> typeFromString(const QString &str);
    static std::optional<PaymentStatus> statusFromString(const QString &str);
};

/**
 * @brief Фильтр выборки движений
 *
 * Диапазон дат: movementDate >= startDate и < endDate + 1 день.
 */
struct MovementFilter {
    QDate startDate;
    QDate endDate;
    std::optional<MovementType> type;
    QString category;
    std::optional<PaymentStatus> paymentStatus;
    QString relatedEntityType;
    int relatedEntityId = 0;
    QString paymentGatewayId;
    QString transactionId;
    QString bankAccount;
    std::optional<bool> reconciled;

    // Нормализованная запись для ключа кэша (порядок полей фиксирован)
    QString canonicalString() const;
};

class IFinancialMovementRepository
{
public:
    virtual ~IFinancialMovementRepository() = default;

    /**
     * @return ID созданного движения или -1 при ошибке
     */
    virtual int create(TransactionContext &tx, const FinancialMovement &movement) = 0;

    virtual FinancialMovement findById(int id) = 0;

    /**
     * @param limit -1 без ограничения
     */
    virtual QList<FinancialMovement> find(const MovementFilter &filter, int limit, int offset) = 0;

    /**
     * @return Количество строк или -1 при ошибке
     */
    virtual int count(const MovementFilter &filter) = 0;

    virtual QList<FinancialMovement> findByRelatedEntity(const QString &entityType, int entityId) = 0;

    /**
     * @brief Полное обновление изменяемых полей строки
     */
    virtual bool update(TransactionContext &tx, const FinancialMovement &movement) = 0;

    virtual bool deleteById(TransactionContext &tx, int id) = 0;

    /**
     * @return Число удалённых строк или -1 при ошибке
     */
    virtual int deleteByRelatedEntity(TransactionContext &tx, const QString &entityType, int entityId) = 0;

    /**
     * @brief Суммы оплаченных движений по типам за [from, to)
     *
     * Пустая граница - без ограничения. Учитываются только строки с movementDate.
     */
    virtual bool sumPaidByType(const QDateTime &from, const QDateTime &to,
                               QMap<MovementType, Decimal> *totals) = 0;

    /**
     * @brief Сумма неоплаченных EXPENSE+TAX; дата - movementDate, иначе createdAt
     */
    virtual bool sumPendingObligations(const QDateTime &from, const QDateTime &to, Decimal *total) = 0;
};

#endif // IFINANCIALMOVEMENTREPOSITORY_H
