#ifndef SERVICERESULT_H
#define SERVICERESULT_H

#include <QString>

#include <utility>

/**
 * @brief Закрытый набор ошибок сервисного слоя
 *
 * Строковые коды (INVALID_VALUE и т.п.) появляются только на границе,
 * через errorCodeToString.
 */
enum class ErrorCode {
    None,
    InvalidValue,
    InvalidType,
    InvalidStatus,
    InvalidDate,
    InvalidItem,
    InvalidItems,
    InvalidUnitPrice,
    InvalidTotalPrice,
    InvalidDescription,
    InvalidInvoiceNumber,
    InvalidSupplierName,
    InvalidName,
    InvalidRecurrenceType,
    InvalidRecurrenceDay,
    IngredientNotFound,
    StockUpdateError,
    StockReversalError,
    InsufficientStock,
    PermissionDenied,
    NotFound,
    NoUpdates,
    SyncError,
    DatabaseError,
    InternalError
};

QString errorCodeToString(ErrorCode code);

template <typename T>
struct ServiceResult {
    ErrorCode error = ErrorCode::None;
    QString message;
    T value{};

    bool isOk() const { return error == ErrorCode::None; }

    static ServiceResult success(T payload)
    {
        ServiceResult r;
        r.value = std::move(payload);
        return r;
    }

    static ServiceResult failure(ErrorCode code, const QString &text)
    {
        ServiceResult r;
        r.error = code;
        r.message = text;
        return r;
    }

    // Ошибка с полезной нагрузкой (например, отчёт о нехватке остатков)
    static ServiceResult failure(ErrorCode code, const QString &text, T payload)
    {
        ServiceResult r;
        r.error = code;
        r.message = text;
        r.value = std::move(payload);
        return r;
    }

    template <typename U>
    static ServiceResult propagate(const ServiceResult<U> &other)
    {
        return failure(other.error, other.message);
    }
};

#endif // SERVICERESULT_H
