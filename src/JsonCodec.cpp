#include "JsonCodec.h"
#include "DateUtils.h"
#include "OrderSettlementService.h"
#include "RecurrenceService.h"

namespace {

QJsonValue textOrNull(const QString &value)
{
    return value.isEmpty() ? QJsonValue() : QJsonValue(value);
}

QJsonValue idOrNull(int id)
{
    return id > 0 ? QJsonValue(id) : QJsonValue();
}

// null и отсутствующий ключ в патче различаются: null очищает поле
std::optional<QString> optionalText(const QJsonObject &json, const QString &key)
{
    if (!json.contains(key)) return std::nullopt;
    const QJsonValue value = json.value(key);
    if (value.isNull()) return QString();
    if (value.isDouble()) return QString::number(value.toDouble(), 'g', 15);
    return value.toString();
}

QString text(const QJsonObject &json, const QString &key)
{
    return optionalText(json, key).value_or(QString());
}

int intValue(const QJsonObject &json, const QString &key)
{
    const QJsonValue value = json.value(key);
    if (value.isString()) return value.toString().trimmed().toInt();
    return value.toInt();
}

}

QJsonValue JsonCodec::money(const Decimal &value)
{
    return moneyToString(value);
}

QJsonValue JsonCodec::quantity(const Decimal &value)
{
    return decimalToPlainString(value);
}

QJsonValue JsonCodec::dateTime(const QDateTime &value)
{
    return value.isValid() ? QJsonValue(toIsoString(value)) : QJsonValue();
}

QJsonObject JsonCodec::toJson(const FinancialMovement &m)
{
    QJsonObject json;
    json.insert("id", m.id);
    json.insert("type", m.typeString());
    json.insert("value", money(m.value));
    json.insert("category", textOrNull(m.category));
    json.insert("subcategory", textOrNull(m.subcategory));
    json.insert("description", m.description);
    json.insert("movement_date", dateTime(m.movementDate));
    json.insert("payment_status", m.statusString());
    json.insert("payment_method", textOrNull(m.paymentMethod));
    json.insert("sender_receiver", textOrNull(m.senderReceiver));
    json.insert("related_entity_type", textOrNull(m.relatedEntityType));
    json.insert("related_entity_id", idOrNull(m.relatedEntityId));
    json.insert("notes", textOrNull(m.notes));
    json.insert("payment_gateway_id", textOrNull(m.paymentGatewayId));
    json.insert("transaction_id", textOrNull(m.transactionId));
    json.insert("bank_account", textOrNull(m.bankAccount));
    json.insert("reconciled", m.reconciled);
    json.insert("reconciled_at", dateTime(m.reconciledAt));
    json.insert("created_at", dateTime(m.createdAt));
    json.insert("updated_at", dateTime(m.updatedAt));
    json.insert("created_by", idOrNull(m.createdBy));
    json.insert("created_by_name", textOrNull(m.createdByName));
    return json;
}

QJsonObject JsonCodec::toJson(const MovementPage &page)
{
    QJsonArray items;
    for (const FinancialMovement &m : page.items) {
        items.append(toJson(m));
    }

    QJsonObject pagination;
    pagination.insert("total", page.total);
    pagination.insert("page", page.page);
    pagination.insert("page_size", page.pageSize);
    pagination.insert("total_pages", page.totalPages);

    QJsonObject json;
    json.insert("items", items);
    json.insert("pagination", pagination);
    return json;
}

QJsonObject JsonCodec::toJson(const CashFlowSummary &summary)
{
    QJsonObject json;
    json.insert("period", summary.period);
    json.insert("total_revenue", money(summary.totalRevenue));
    json.insert("total_expense", money(summary.totalExpense));
    json.insert("total_cmv", money(summary.totalCmv));
    json.insert("total_tax", money(summary.totalTax));
    json.insert("gross_profit", money(summary.grossProfit));
    json.insert("net_profit", money(summary.netProfit));
    json.insert("cash_flow", money(summary.cashFlow));
    if (summary.pendingAmount) {
        json.insert("pending_amount", money(*summary.pendingAmount));
    }
    return json;
}

QJsonObject JsonCodec::toJson(const ReconciliationReport &report)
{
    QJsonObject summary;
    summary.insert("total_count", report.totalCount);
    summary.insert("reconciled_count", report.reconciledCount);
    summary.insert("unreconciled_count", report.unreconciledCount);
    summary.insert("total_amount", money(report.totalAmount));
    summary.insert("reconciled_amount", money(report.reconciledAmount));
    summary.insert("unreconciled_amount", money(report.unreconciledAmount));

    QJsonArray movements;
    for (const FinancialMovement &m : report.movements) {
        movements.append(toJson(m));
    }

    QJsonObject json;
    json.insert("summary", summary);
    json.insert("movements", movements);
    return json;
}

QJsonObject JsonCodec::toJson(const PurchaseInvoiceItem &item)
{
    QJsonObject json;
    json.insert("id", idOrNull(item.id));
    json.insert("ingredient_id", item.ingredientId);
    json.insert("ingredient_name", textOrNull(item.ingredientName));
    json.insert("quantity", quantity(item.quantity));
    json.insert("unit_price", quantity(item.unitPrice));
    json.insert("total_price", money(item.totalPrice));
    return json;
}

QJsonObject JsonCodec::toJson(const PurchaseInvoice &invoice)
{
    QJsonArray items;
    for (const PurchaseInvoiceItem &item : invoice.items) {
        items.append(toJson(item));
    }

    QJsonObject json;
    json.insert("id", invoice.id);
    json.insert("invoice_number", invoice.invoiceNumber);
    json.insert("supplier_name", invoice.supplierName);
    json.insert("total_amount", money(invoice.totalAmount));
    json.insert("purchase_date", dateTime(invoice.purchaseDate));
    json.insert("payment_status", FinancialMovement::statusToString(invoice.paymentStatus));
    json.insert("payment_method", textOrNull(invoice.paymentMethod));
    json.insert("payment_date", dateTime(invoice.paymentDate));
    json.insert("notes", textOrNull(invoice.notes));
    json.insert("created_by", idOrNull(invoice.createdBy));
    json.insert("created_by_name", textOrNull(invoice.createdByName));
    json.insert("created_at", dateTime(invoice.createdAt));
    json.insert("updated_at", dateTime(invoice.updatedAt));
    json.insert("items", items);
    return json;
}

QJsonObject JsonCodec::toJson(const InvoicePage &page)
{
    QJsonArray items;
    for (const PurchaseInvoice &invoice : page.items) {
        items.append(toJson(invoice));
    }

    QJsonObject pagination;
    pagination.insert("total", page.total);
    pagination.insert("page", page.page);
    pagination.insert("page_size", page.pageSize);
    pagination.insert("total_pages", page.totalPages);

    QJsonObject json;
    json.insert("items", items);
    json.insert("pagination", pagination);
    return json;
}

QJsonObject JsonCodec::toJson(const StockShortage &shortage)
{
    QJsonObject json;
    json.insert("ingredient_id", shortage.ingredientId);
    json.insert("ingredient_name", textOrNull(shortage.ingredientName));
    json.insert("current_stock", quantity(shortage.currentStock));
    json.insert("required", quantity(shortage.required));
    json.insert("shortage", quantity(shortage.shortage));
    return json;
}

QJsonObject JsonCodec::toJson(const InvoiceDeletion &deletion)
{
    QJsonObject json;
    json.insert("invoice_id", deletion.invoiceId);
    json.insert("removed_movements", deletion.removedMovements);
    if (!deletion.shortages.isEmpty()) {
        QJsonArray shortages;
        for (const StockShortage &s : deletion.shortages) {
            shortages.append(toJson(s));
        }
        json.insert("shortages", shortages);
    }
    return json;
}

QJsonObject JsonCodec::toJson(const AuditEntry &entry)
{
    QJsonObject json;
    json.insert("id", entry.id);
    json.insert("purchase_invoice_id", entry.invoiceId);
    json.insert("action_type", AuditEntry::actionToString(entry.action));
    json.insert("changed_by", idOrNull(entry.changedBy));
    json.insert("old_values", entry.oldValues.isEmpty() ? QJsonValue() : QJsonValue(entry.oldValues));
    json.insert("new_values", entry.newValues.isEmpty() ? QJsonValue() : QJsonValue(entry.newValues));
    json.insert("changed_fields", QJsonArray::fromStringList(entry.changedFields));
    json.insert("notes", textOrNull(entry.notes));
    json.insert("created_at", dateTime(entry.createdAt));
    return json;
}

QJsonObject JsonCodec::toJson(const SettlementResult &result)
{
    QJsonObject json;
    json.insert("revenue_id", result.revenueId);
    json.insert("cmv_id", result.cmvId ? QJsonValue(*result.cmvId) : QJsonValue());
    json.insert("payment_fee_id", result.feeId ? QJsonValue(*result.feeId) : QJsonValue());
    json.insert("total_cmv", money(result.totalCmv));
    json.insert("fee_amount", money(result.feeAmount));
    return json;
}

QJsonObject JsonCodec::toJson(const RecurrenceRule &rule)
{
    QJsonObject json;
    json.insert("id", rule.id);
    json.insert("name", rule.name);
    json.insert("description", textOrNull(rule.description));
    json.insert("type", FinancialMovement::typeToString(rule.type));
    json.insert("category", textOrNull(rule.category));
    json.insert("subcategory", textOrNull(rule.subcategory));
    json.insert("value", money(rule.value));
    json.insert("recurrence_type", rule.recurrenceTypeString());
    json.insert("recurrence_day", rule.recurrenceDay);
    json.insert("sender_receiver", textOrNull(rule.senderReceiver));
    json.insert("notes", textOrNull(rule.notes));
    json.insert("is_active", rule.isActive);
    json.insert("created_by", idOrNull(rule.createdBy));
    json.insert("created_at", dateTime(rule.createdAt));
    json.insert("updated_at", dateTime(rule.updatedAt));
    return json;
}

QJsonObject JsonCodec::toJson(const RecurrenceRunReport &report)
{
    QJsonObject json;
    json.insert("year", report.year);
    json.insert("month", report.month);
    json.insert("week", report.week);
    json.insert("week_year", report.weekYear);
    json.insert("generated_count", report.generatedCount);
    json.insert("skipped_count", report.skippedCount);
    json.insert("errors", QJsonArray::fromStringList(report.errors));
    return json;
}

QJsonObject JsonCodec::successEnvelope(const QJsonValue &data)
{
    QJsonObject json;
    json.insert("success", true);
    json.insert("data", data);
    return json;
}

QJsonObject JsonCodec::errorEnvelope(ErrorCode code, const QString &message)
{
    QJsonObject json;
    json.insert("success", false);
    json.insert("error", errorCodeToString(code));
    json.insert("message", message);
    return json;
}

std::optional<Decimal> JsonCodec::decimalFromJson(const QJsonValue &value)
{
    if (value.isDouble()) {
        // 15 значащих цифр: убирает хвост двоичного представления double
        return Decimal(QString::number(value.toDouble(), 'g', 15).toStdString());
    }
    if (value.isString()) {
        Decimal parsed;
        if (tryParseDecimal(value.toString(), &parsed)) return parsed;
    }
    return std::nullopt;
}

MovementDraft JsonCodec::movementDraftFromJson(const QJsonObject &json)
{
    MovementDraft d;
    d.type = text(json, "type");
    d.value = decimalFromJson(json.value("value"));
    d.category = text(json, "category");
    d.subcategory = text(json, "subcategory");
    d.description = text(json, "description");
    d.movementDate = text(json, "movement_date");
    d.paymentStatus = text(json, "payment_status");
    d.paymentMethod = text(json, "payment_method");
    d.senderReceiver = text(json, "sender_receiver");
    d.relatedEntityType = text(json, "related_entity_type");
    d.relatedEntityId = intValue(json, "related_entity_id");
    d.notes = text(json, "notes");
    d.paymentGatewayId = text(json, "payment_gateway_id");
    d.transactionId = text(json, "transaction_id");
    d.bankAccount = text(json, "bank_account");
    return d;
}

MovementPatch JsonCodec::movementPatchFromJson(const QJsonObject &json)
{
    MovementPatch p;
    p.type = optionalText(json, "type");
    if (json.contains("value")) {
        // Неразбираемое значение превращается в 0 и отклоняется сервисом как INVALID_VALUE
        p.value = decimalFromJson(json.value("value")).value_or(Decimal(0));
    }
    p.category = optionalText(json, "category");
    p.subcategory = optionalText(json, "subcategory");
    p.description = optionalText(json, "description");
    p.movementDate = optionalText(json, "movement_date");
    p.paymentStatus = optionalText(json, "payment_status");
    p.paymentMethod = optionalText(json, "payment_method");
    p.senderReceiver = optionalText(json, "sender_receiver");
    p.notes = optionalText(json, "notes");
    p.paymentGatewayId = optionalText(json, "payment_gateway_id");
    p.transactionId = optionalText(json, "transaction_id");
    p.bankAccount = optionalText(json, "bank_account");
    return p;
}

QList<InvoiceItemDraft> JsonCodec::itemDraftsFromJson(const QJsonArray &items)
{
    QList<InvoiceItemDraft> drafts;
    for (const QJsonValue &value : items) {
        const QJsonObject item = value.toObject();
        InvoiceItemDraft d;
        d.ingredientId = intValue(item, "ingredient_id");
        d.quantity = decimalFromJson(item.value("quantity"));
        d.unitPrice = decimalFromJson(item.value("unit_price"));
        d.totalPrice = decimalFromJson(item.value("total_price"));
        d.displayQuantity = decimalFromJson(item.value("display_quantity"));
        drafts.append(d);
    }
    return drafts;
}

InvoiceDraft JsonCodec::invoiceDraftFromJson(const QJsonObject &json)
{
    InvoiceDraft d;
    d.invoiceNumber = text(json, "invoice_number");
    d.supplierName = text(json, "supplier_name");
    d.totalAmount = decimalFromJson(json.value("total_amount"));
    d.purchaseDate = text(json, "purchase_date");
    d.paymentStatus = text(json, "payment_status");
    d.paymentMethod = text(json, "payment_method");
    d.paymentDate = text(json, "payment_date");
    d.notes = text(json, "notes");
    d.items = itemDraftsFromJson(json.value("items").toArray());
    return d;
}

InvoicePatch JsonCodec::invoicePatchFromJson(const QJsonObject &json)
{
    InvoicePatch p;
    p.invoiceNumber = optionalText(json, "invoice_number");
    p.supplierName = optionalText(json, "supplier_name");
    p.purchaseDate = optionalText(json, "purchase_date");
    p.paymentStatus = optionalText(json, "payment_status");
    p.paymentMethod = optionalText(json, "payment_method");
    p.paymentDate = optionalText(json, "payment_date");
    p.notes = optionalText(json, "notes");
    if (json.value("items").isArray()) {
        p.items = itemDraftsFromJson(json.value("items").toArray());
    }
    return p;
}

RecurrenceRuleDraft JsonCodec::recurrenceRuleDraftFromJson(const QJsonObject &json)
{
    RecurrenceRuleDraft d;
    d.name = text(json, "name");
    d.description = text(json, "description");
    d.type = text(json, "type");
    d.category = text(json, "category");
    d.subcategory = text(json, "subcategory");
    d.value = decimalFromJson(json.value("value"));
    d.recurrenceType = text(json, "recurrence_type");
    if (json.contains("recurrence_day") && !json.value("recurrence_day").isNull()) {
        d.recurrenceDay = intValue(json, "recurrence_day");
    }
    d.senderReceiver = text(json, "sender_receiver");
    d.notes = text(json, "notes");
    return d;
}
