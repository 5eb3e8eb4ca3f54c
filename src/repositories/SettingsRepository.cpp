#include "repositories/SettingsRepository.h"

#include <QSqlQuery>
#include <QSqlError>
#include <QLoggingCategory>

Q_LOGGING_CATEGORY(settingsRepo, "repository.settings")

Decimal PaymentFees::percentFor(const QString &paymentMethod) const
{
    const QString method = paymentMethod.trimmed().toLower();
    if (method == "credit") return credit;
    if (method == "debit") return debit;
    if (method == "pix") return pix;
    if (method == "ifood") return ifood;
    if (method == "uber_eats" || method == "uber") return uberEats;
    return Decimal(0);
}

SettingsRepository::SettingsRepository(QSqlDatabase db)
    : m_db(db)
{
    if (!m_db.isOpen()) {
        qCritical(settingsRepo) << "SettingsRepository: Database is not open";
    }
}

bool SettingsRepository::executeQuery(QSqlQuery& q, const QString& context) const
{
    if (!q.exec()) {
        qCritical(settingsRepo) << "SettingsRepository::" << context << "- SQL error:" << q.lastError().text();
        qCritical(settingsRepo) << "SettingsRepository::" << context << "- SQL:" << q.executedQuery();
        return false;
    }
    return true;
}

bool SettingsRepository::loadPaymentFees(PaymentFees* fees)
{
    QSqlQuery q(m_db);
    q.prepare(R"(
        SELECT fee_credit, fee_debit, fee_pix, fee_ifood, fee_uber_eats
        FROM app_settings
        WHERE id = (SELECT MAX(id) FROM app_settings)
    )");

    if (!executeQuery(q, "loadPaymentFees")) return false;

    *fees = PaymentFees();
    if (!q.next()) return true;

    fees->credit = decimalFromVariant(q.value("fee_credit"));
    fees->debit = decimalFromVariant(q.value("fee_debit"));
    fees->pix = decimalFromVariant(q.value("fee_pix"));
    fees->ifood = decimalFromVariant(q.value("fee_ifood"));
    fees->uberEats = decimalFromVariant(q.value("fee_uber_eats"));
    return true;
}
