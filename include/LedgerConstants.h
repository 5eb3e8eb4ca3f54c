#ifndef LEDGERCONSTANTS_H
#define LEDGERCONSTANTS_H

// Категории по умолчанию (значения хранятся в БД как есть)
constexpr const char* kCategorySales = "Vendas";
constexpr const char* kCategoryVariableCosts = "Custos Variáveis";
constexpr const char* kCategoryFixedCosts = "Custos Fixos";
constexpr const char* kCategoryTaxes = "Tributos";
constexpr const char* kCategoryStockPurchases = "Compras de Estoque";

constexpr const char* kSubcategoryIngredients = "Ingredientes";
constexpr const char* kSubcategoryConsumedIngredients = "Ingredientes Consumidos";
constexpr const char* kSubcategoryPaymentFees = "Taxas de Pagamento";

// Полиморфная обратная ссылка financial_movements.related_entity_type
constexpr const char* kRelatedPurchaseInvoice = "purchase_invoice";
constexpr const char* kRelatedRecurrenceRule = "recurrence_rule";
constexpr const char* kRelatedOrder = "order";

// Префиксы ключей кэша
constexpr const char* kCacheMovementsPrefix = "financial_movements:";
constexpr const char* kCacheMovementsListPrefix = "financial_movements:list:";
constexpr const char* kCacheCashFlowPrefix = "financial_movements:cash_flow:";

// События
constexpr const char* kEventMovementCreated = "financial_movement.created";
constexpr const char* kEventMovementStatusUpdated = "financial_movement.payment_status_updated";
constexpr const char* kEventPurchaseCreated = "purchase.created";
constexpr const char* kEventPurchaseUpdated = "purchase.updated";
constexpr const char* kEventPurchaseDeleted = "purchase.deleted";

#endif // LEDGERCONSTANTS_H
