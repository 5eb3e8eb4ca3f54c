#include "repositories/PurchaseInvoiceRepository.h"
#include "repositories/SqlHelpers.h"
#include "TransactionContext.h"
#include "DateUtils.h"

#include <QSqlQuery>
#include <QSqlError>
#include <QStringList>
#include <QLoggingCategory>

Q_LOGGING_CATEGORY(invoiceRepo, "repository.invoice")

namespace {

const char* kSelectInvoice = R"(
    SELECT pi.id, pi.invoice_number, pi.supplier_name, pi.total_amount,
           pi.purchase_date, pi.payment_status, pi.payment_method, pi.payment_date,
           pi.notes, pi.created_by, pi.created_at, pi.updated_at,
           u.full_name AS created_by_name
    FROM purchase_invoices pi
    LEFT JOIN users u ON u.id = pi.created_by
)";

} // namespace

PurchaseInvoiceRepository::PurchaseInvoiceRepository(QSqlDatabase db)
    : m_db(db)
{
    if (!m_db.isOpen()) {
        qCritical(invoiceRepo) << "PurchaseInvoiceRepository: Database is not open";
    }
}

bool PurchaseInvoiceRepository::executeQuery(QSqlQuery& q, const QString& context) const
{
    if (!q.exec()) {
        qCritical(invoiceRepo) << "PurchaseInvoiceRepository::" << context << "- SQL error:" << q.lastError().text();
        qCritical(invoiceRepo) << "PurchaseInvoiceRepository::" << context << "- SQL:" << q.executedQuery();
        return false;
    }
    return true;
}

PurchaseInvoice PurchaseInvoiceRepository::invoiceFromQuery(const QSqlQuery& q) const
{
    PurchaseInvoice inv;
    inv.id = q.value("id").toInt();
    inv.invoiceNumber = q.value("invoice_number").toString();
    inv.supplierName = q.value("supplier_name").toString();
    inv.totalAmount = decimalFromVariant(q.value("total_amount"));
    inv.purchaseDate = fromDbDateTime(q.value("purchase_date"));
    inv.paymentStatus = FinancialMovement::statusFromString(q.value("payment_status").toString())
                            .value_or(PaymentStatus::Pending);
    inv.paymentMethod = q.value("payment_method").toString();
    inv.paymentDate = fromDbDateTime(q.value("payment_date"));
    inv.notes = q.value("notes").toString();
    inv.createdBy = idFromVariant(q.value("created_by"));
    inv.createdByName = q.value("created_by_name").toString();
    inv.createdAt = fromDbDateTime(q.value("created_at"));
    inv.updatedAt = fromDbDateTime(q.value("updated_at"));
    return inv;
}

PurchaseInvoiceItem PurchaseInvoiceRepository::itemFromQuery(const QSqlQuery& q) const
{
    PurchaseInvoiceItem item;
    item.id = q.value("id").toInt();
    item.invoiceId = q.value("purchase_invoice_id").toInt();
    item.ingredientId = q.value("ingredient_id").toInt();
    item.ingredientName = q.value("ingredient_name").toString();
    item.quantity = decimalFromVariant(q.value("quantity"));
    item.unitPrice = decimalFromVariant(q.value("unit_price"));
    item.totalPrice = decimalFromVariant(q.value("total_price"));
    return item;
}

QString PurchaseInvoiceRepository::whereClause(const InvoiceFilter& filter, QVariantList* params)
{
    QStringList conditions;

    if (filter.startDate.isValid()) {
        conditions << "pi.purchase_date >= ?";
        params->append(toDbDateTime(filter.startDate.startOfDay()));
    }
    if (filter.endDate.isValid()) {
        conditions << "pi.purchase_date < ?";
        params->append(toDbDateTime(filter.endDate.addDays(1).startOfDay()));
    }
    if (!filter.supplierName.trimmed().isEmpty()) {
        conditions << "UPPER(pi.supplier_name) LIKE UPPER(?)";
        params->append("%" + filter.supplierName.trimmed() + "%");
    }
    if (filter.paymentStatus) {
        conditions << "pi.payment_status = ?";
        params->append(FinancialMovement::statusToString(*filter.paymentStatus));
    }

    return conditions.isEmpty() ? QString() : " WHERE " + conditions.join(" AND ");
}

int PurchaseInvoiceRepository::create(TransactionContext& tx, const PurchaseInvoice& invoice)
{
    if (invoice.invoiceNumber.trimmed().isEmpty() || invoice.supplierName.trimmed().isEmpty()) return -1;

    const QString now = toDbDateTime(QDateTime::currentDateTime());

    QSqlQuery q(tx.database());
    q.prepare(R"(
        INSERT INTO purchase_invoices (
            invoice_number, supplier_name, total_amount, purchase_date,
            payment_status, payment_method, payment_date, notes,
            created_by, created_at, updated_at
        )
        VALUES (:number, :supplier, :total, :purchase_date,
                :status, :method, :payment_date, :notes,
                :created_by, :created_at, :updated_at)
    )");
    q.bindValue(":number", invoice.invoiceNumber.trimmed());
    q.bindValue(":supplier", invoice.supplierName.trimmed());
    q.bindValue(":total", moneyToString(invoice.totalAmount));
    q.bindValue(":purchase_date", toDbDateTimeVariant(invoice.purchaseDate));
    q.bindValue(":status", FinancialMovement::statusToString(invoice.paymentStatus));
    q.bindValue(":method", nullableText(invoice.paymentMethod));
    q.bindValue(":payment_date", toDbDateTimeVariant(invoice.paymentDate));
    q.bindValue(":notes", nullableText(invoice.notes));
    q.bindValue(":created_by", nullableId(invoice.createdBy));
    q.bindValue(":created_at", now);
    q.bindValue(":updated_at", now);

    if (!executeQuery(q, "create")) return -1;

    const int id = q.lastInsertId().toInt();
    return id > 0 ? id : -1;
}

PurchaseInvoice PurchaseInvoiceRepository::findById(int id)
{
    if (id <= 0) return PurchaseInvoice();

    QSqlQuery q(m_db);
    q.prepare(QString(kSelectInvoice) + " WHERE pi.id = ?");
    q.addBindValue(id);

    if (!executeQuery(q, "findById")) return PurchaseInvoice();
    if (!q.next()) return PurchaseInvoice();

    PurchaseInvoice inv = invoiceFromQuery(q);
    inv.items = findItems(inv.id);
    return inv;
}

QList<PurchaseInvoice> PurchaseInvoiceRepository::find(const InvoiceFilter& filter, int limit, int offset)
{
    QList<PurchaseInvoice> res;
    QVariantList params;
    const QString where = whereClause(filter, &params);

    QSqlQuery q(m_db);
    q.prepare(QString(kSelectInvoice) + where + R"(
        ORDER BY pi.purchase_date DESC, pi.created_at DESC, pi.id DESC
        LIMIT ? OFFSET ?
    )");
    for (const QVariant& p : params) q.addBindValue(p);
    q.addBindValue(limit < 0 ? -1 : limit);
    q.addBindValue(offset < 0 ? 0 : offset);

    if (!executeQuery(q, "find")) return res;
    while (q.next()) res.append(invoiceFromQuery(q));

    for (PurchaseInvoice& inv : res) {
        inv.items = findItems(inv.id);
    }
    return res;
}

int PurchaseInvoiceRepository::count(const InvoiceFilter& filter)
{
    QVariantList params;
    const QString where = whereClause(filter, &params);

    QSqlQuery q(m_db);
    q.prepare("SELECT COUNT(*) FROM purchase_invoices pi" + where);
    for (const QVariant& p : params) q.addBindValue(p);

    if (!executeQuery(q, "count")) return -1;
    if (!q.next()) return -1;
    return q.value(0).toInt();
}

QList<PurchaseInvoiceItem> PurchaseInvoiceRepository::findItems(int invoiceId)
{
    QList<PurchaseInvoiceItem> res;
    if (invoiceId <= 0) return res;

    QSqlQuery q(m_db);
    q.prepare(R"(
        SELECT pii.id, pii.purchase_invoice_id, pii.ingredient_id, i.name AS ingredient_name,
               pii.quantity, pii.unit_price, pii.total_price
        FROM purchase_invoice_items pii
        LEFT JOIN ingredients i ON i.id = pii.ingredient_id
        WHERE pii.purchase_invoice_id = :invoice
        ORDER BY pii.id
    )");
    q.bindValue(":invoice", invoiceId);

    if (!executeQuery(q, "findItems")) return res;
    while (q.next()) res.append(itemFromQuery(q));
    return res;
}

int PurchaseInvoiceRepository::insertItem(TransactionContext& tx, int invoiceId, const PurchaseInvoiceItem& item)
{
    if (invoiceId <= 0 || item.ingredientId <= 0) return -1;

    QSqlQuery q(tx.database());
    q.prepare(R"(
        INSERT INTO purchase_invoice_items (purchase_invoice_id, ingredient_id, quantity, unit_price, total_price)
        VALUES (:invoice, :ingredient, :qty, :unit_price, :total_price)
    )");
    q.bindValue(":invoice", invoiceId);
    q.bindValue(":ingredient", item.ingredientId);
    q.bindValue(":qty", decimalToPlainString(item.quantity));
    q.bindValue(":unit_price", decimalToPlainString(item.unitPrice));
    q.bindValue(":total_price", moneyToString(item.totalPrice));

    if (!executeQuery(q, "insertItem")) return -1;

    const int id = q.lastInsertId().toInt();
    return id > 0 ? id : -1;
}

int PurchaseInvoiceRepository::deleteItems(TransactionContext& tx, int invoiceId)
{
    if (invoiceId <= 0) return -1;

    QSqlQuery q(tx.database());
    q.prepare("DELETE FROM purchase_invoice_items WHERE purchase_invoice_id = :invoice");
    q.bindValue(":invoice", invoiceId);

    if (!executeQuery(q, "deleteItems")) return -1;
    return q.numRowsAffected();
}

bool PurchaseInvoiceRepository::updateHeader(TransactionContext& tx, const PurchaseInvoice& invoice)
{
    if (invoice.id <= 0) return false;

    QSqlQuery q(tx.database());
    q.prepare(R"(
        UPDATE purchase_invoices
        SET invoice_number = :number,
            supplier_name = :supplier,
            total_amount = :total,
            purchase_date = :purchase_date,
            payment_status = :status,
            payment_method = :method,
            payment_date = :payment_date,
            notes = :notes,
            updated_at = :updated_at
        WHERE id = :id
    )");
    q.bindValue(":id", invoice.id);
    q.bindValue(":number", invoice.invoiceNumber.trimmed());
    q.bindValue(":supplier", invoice.supplierName.trimmed());
    q.bindValue(":total", moneyToString(invoice.totalAmount));
    q.bindValue(":purchase_date", toDbDateTimeVariant(invoice.purchaseDate));
    q.bindValue(":status", FinancialMovement::statusToString(invoice.paymentStatus));
    q.bindValue(":method", nullableText(invoice.paymentMethod));
    q.bindValue(":payment_date", toDbDateTimeVariant(invoice.paymentDate));
    q.bindValue(":notes", nullableText(invoice.notes));
    q.bindValue(":updated_at", toDbDateTime(QDateTime::currentDateTime()));

    if (!executeQuery(q, "updateHeader")) return false;
    return q.numRowsAffected() > 0;
}

bool PurchaseInvoiceRepository::updatePaymentStatus(TransactionContext& tx, int invoiceId,
                                                    PaymentStatus status, const QDateTime& paymentDate)
{
    if (invoiceId <= 0) return false;

    QSqlQuery q(tx.database());
    if (status == PaymentStatus::Paid) {
        q.prepare(R"(
            UPDATE purchase_invoices
            SET payment_status = 'Paid',
                payment_date = COALESCE(payment_date, :payment_date),
                updated_at = :updated_at
            WHERE id = :id
        )");
        q.bindValue(":payment_date", toDbDateTimeVariant(paymentDate.isValid() ? paymentDate
                                                                              : QDateTime::currentDateTime()));
    } else {
        q.prepare(R"(
            UPDATE purchase_invoices
            SET payment_status = 'Pending',
                payment_date = NULL,
                updated_at = :updated_at
            WHERE id = :id
        )");
    }
    q.bindValue(":updated_at", toDbDateTime(QDateTime::currentDateTime()));
    q.bindValue(":id", invoiceId);

    if (!executeQuery(q, "updatePaymentStatus")) return false;
    return q.numRowsAffected() > 0;
}

bool PurchaseInvoiceRepository::deleteById(TransactionContext& tx, int id)
{
    if (id <= 0) return false;

    QSqlQuery q(tx.database());
    q.prepare("DELETE FROM purchase_invoices WHERE id = :id");
    q.bindValue(":id", id);

    if (!executeQuery(q, "deleteById")) return false;
    return q.numRowsAffected() > 0;
}
