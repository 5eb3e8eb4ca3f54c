#ifndef JSONCODEC_H
#define JSONCODEC_H

#include <QJsonArray>
#include <QJsonObject>
#include <QJsonValue>
#include <QString>

#include <optional>

#include "DecimalUtils.h"
#include "LedgerTypes.h"
#include "PurchaseInvoiceTypes.h"
#include "ServiceResult.h"
#include "repositories/IAuditRepository.h"
#include "repositories/IRecurrenceRuleRepository.h"

struct SettlementResult;
struct RecurrenceRunReport;
struct RecurrenceRuleDraft;

/**
 * @brief Внешний JSON-контракт
 *
 * Даты - ISO-8601, денежные суммы - строки с двумя знаками ("150.00"),
 * количества и цены за единицу - строки без хвостовых нулей.
 */
class JsonCodec
{
public:
    static QJsonValue money(const Decimal &value);
    static QJsonValue quantity(const Decimal &value);
    static QJsonValue dateTime(const QDateTime &value);

    static QJsonObject toJson(const FinancialMovement &movement);
    static QJsonObject toJson(const MovementPage &page);
    static QJsonObject toJson(const CashFlowSummary &summary);
    static QJsonObject toJson(const ReconciliationReport &report);

    static QJsonObject toJson(const PurchaseInvoiceItem &item);
    static QJsonObject toJson(const PurchaseInvoice &invoice);
    static QJsonObject toJson(const InvoicePage &page);
    static QJsonObject toJson(const StockShortage &shortage);
    static QJsonObject toJson(const InvoiceDeletion &deletion);
    static QJsonObject toJson(const AuditEntry &entry);

    static QJsonObject toJson(const SettlementResult &result);
    static QJsonObject toJson(const RecurrenceRule &rule);
    static QJsonObject toJson(const RecurrenceRunReport &report);

    static QJsonObject successEnvelope(const QJsonValue &data);
    static QJsonObject errorEnvelope(ErrorCode code, const QString &message);

    /**
     * @brief {success, error, message} при ошибке или {success, data} при успехе
     */
    template <typename T>
    static QJsonObject envelope(const ServiceResult<T> &result)
    {
        if (!result.isOk()) {
            return errorEnvelope(result.error, result.message);
        }
        return successEnvelope(toJson(result.value));
    }

    // Число или строка "39,90"; std::nullopt - значение отсутствует или не разобрано
    static std::optional<Decimal> decimalFromJson(const QJsonValue &value);

    static MovementDraft movementDraftFromJson(const QJsonObject &json);
    static MovementPatch movementPatchFromJson(const QJsonObject &json);
    static InvoiceDraft invoiceDraftFromJson(const QJsonObject &json);
    static InvoicePatch invoicePatchFromJson(const QJsonObject &json);
    static RecurrenceRuleDraft recurrenceRuleDraftFromJson(const QJsonObject &json);

private:
    static QList<InvoiceItemDraft> itemDraftsFromJson(const QJsonArray &items);
};

#endif // JSONCODEC_H
