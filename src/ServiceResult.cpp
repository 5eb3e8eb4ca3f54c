#include "ServiceResult.h"

QString errorCodeToString(ErrorCode code)
{
    switch (code) {
        case ErrorCode::None:                  return QString();
        case ErrorCode::InvalidValue:          return "INVALID_VALUE";
        case ErrorCode::InvalidType:           return "INVALID_TYPE";
        case ErrorCode::InvalidStatus:         return "INVALID_STATUS";
        case ErrorCode::InvalidDate:           return "INVALID_DATE";
        case ErrorCode::InvalidItem:           return "INVALID_ITEM";
        case ErrorCode::InvalidItems:          return "INVALID_ITEMS";
        case ErrorCode::InvalidUnitPrice:      return "INVALID_UNIT_PRICE";
        case ErrorCode::InvalidTotalPrice:     return "INVALID_TOTAL_PRICE";
        case ErrorCode::InvalidDescription:    return "INVALID_DESCRIPTION";
        case ErrorCode::InvalidInvoiceNumber:  return "INVALID_INVOICE_NUMBER";
        case ErrorCode::InvalidSupplierName:   return "INVALID_SUPPLIER_NAME";
        case ErrorCode::InvalidName:           return "INVALID_NAME";
        case ErrorCode::InvalidRecurrenceType: return "INVALID_RECURRENCE_TYPE";
        case ErrorCode::InvalidRecurrenceDay:  return "INVALID_RECURRENCE_DAY";
        case ErrorCode::IngredientNotFound:    return "INGREDIENT_NOT_FOUND";
        case ErrorCode::StockUpdateError:      return "STOCK_UPDATE_ERROR";
        case ErrorCode::StockReversalError:    return "STOCK_REVERSAL_ERROR";
        case ErrorCode::InsufficientStock:     return "INSUFFICIENT_STOCK";
        case ErrorCode::PermissionDenied:      return "PERMISSION_DENIED";
        case ErrorCode::NotFound:              return "NOT_FOUND";
        case ErrorCode::NoUpdates:             return "NO_UPDATES";
        case ErrorCode::SyncError:             return "SYNC_ERROR";
        case ErrorCode::DatabaseError:         return "DATABASE_ERROR";
        case ErrorCode::InternalError:         return "INTERNAL_ERROR";
    }
    return "INTERNAL_ERROR";
}
