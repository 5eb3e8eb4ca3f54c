#ifndef IAUDITREPOSITORY_H
#define IAUDITREPOSITORY_H

#include <QDateTime>
#include <QJsonObject>
#include <QList>
#include <QString>
#include <QStringList>

class TransactionContext;

enum class AuditAction {
    Create,
    Update,
    Delete
};

/**
 * @brief Запись журнала изменений накладной (только добавление)
 */
struct AuditEntry {
    int id = 0;
    int invoiceId = 0;
    AuditAction action = AuditAction::Create;
    int changedBy = 0;
    QJsonObject oldValues;
    QJsonObject newValues;
    QStringList changedFields;
    QString notes;
    QDateTime createdAt;

    bool isValid() const { return id > 0; }

    static QString actionToString(AuditAction action);
    static AuditAction actionFromString(const QString &str);
};

class IAuditRepository
{
public:
    virtual ~IAuditRepository() = default;

    /**
     * @return ID записи или -1 при ошибке
     */
    virtual int record(TransactionContext &tx, const AuditEntry &entry) = 0;

    virtual QList<AuditEntry> findByInvoice(int invoiceId) = 0;
};

#endif // IAUDITREPOSITORY_H
