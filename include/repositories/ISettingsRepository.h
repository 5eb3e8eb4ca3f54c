#ifndef ISETTINGSREPOSITORY_H
#define ISETTINGSREPOSITORY_H

#include <QString>

#include "DecimalUtils.h"

/**
 * @brief Комиссии платёжных шлюзов, в процентах от суммы заказа
 */
struct PaymentFees {
    Decimal credit = 0;
    Decimal debit = 0;
    Decimal pix = 0;
    Decimal ifood = 0;
    Decimal uberEats = 0;

    /**
     * @brief Процент для способа оплаты; 0 - комиссии нет (в т.ч. наличные)
     */
    Decimal percentFor(const QString &paymentMethod) const;
};

class ISettingsRepository
{
public:
    virtual ~ISettingsRepository() = default;

    /**
     * @brief Последняя строка app_settings; без строк - все комиссии 0
     * @return false при ошибке SQL
     */
    virtual bool loadPaymentFees(PaymentFees *fees) = 0;
};

#endif // ISETTINGSREPOSITORY_H
