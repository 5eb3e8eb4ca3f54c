#ifndef SETTINGSREPOSITORY_H
#define SETTINGSREPOSITORY_H

#include <QSqlDatabase>
#include <QSqlQuery>
#include "repositories/ISettingsRepository.h"

class SettingsRepository : public ISettingsRepository
{
public:
    explicit SettingsRepository(QSqlDatabase db);

    bool loadPaymentFees(PaymentFees* fees) override;

private:
    bool executeQuery(QSqlQuery& q, const QString& context) const;

private:
    QSqlDatabase m_db;
};

#endif // SETTINGSREPOSITORY_H
