#include "MigrationRunner.h"
#include <QSqlQuery>
#include <QSqlError>
#include <QDebug>
#include <QLoggingCategory>
#include <QStringList>

Q_LOGGING_CATEGORY(migration, "migration")

MigrationRunner::MigrationRunner(QSqlDatabase db, QObject *parent)
    : QObject(parent)
    , m_db(db)
{
}

bool MigrationRunner::runMigrations()
{
    if (!m_db.isOpen()) {
        qCritical(migration) << "MigrationRunner: Database is not open";
        return false;
    }

    const QStringList requiredTables = {
        "users",
        "ingredients",
        "financial_movements",
        "purchase_invoices",
        "purchase_invoice_items",
        "purchase_invoice_audit",
        "recurrence_rules",
        "recurrence_generations"
    };

    QStringList missing;
    for (const QString &tableName : requiredTables) {
        if (!tableExists(tableName)) missing << tableName;
    }

    if (missing.isEmpty()) {
        qInfo(migration) << "MigrationRunner: Schema is up to date";
    } else {
        qInfo(migration) << "MigrationRunner: Missing tables" << missing << "- migration needed";
    }

    if (!m_db.transaction()) {
        qCritical(migration) << "MigrationRunner: Cannot start transaction:" << m_db.lastError().text();
        return false;
    }

    if (!createAllTables()) {
        qCritical(migration) << "MigrationRunner: Failed to create tables";
        m_db.rollback();
        return false;
    }

    if (!createIndexes()) {
        qCritical(migration) << "MigrationRunner: Failed to create indexes";
        m_db.rollback();
        return false;
    }

    if (!m_db.commit()) {
        qCritical(migration) << "MigrationRunner: Cannot commit transaction:" << m_db.lastError().text();
        m_db.rollback();
        return false;
    }

    qInfo(migration) << "MigrationRunner: Migrations completed successfully";
    return true;
}

bool MigrationRunner::tableExists(const QString &tableName)
{
    QSqlQuery query(m_db);
    query.prepare("SELECT name FROM sqlite_master WHERE type='table' AND name=?");
    query.addBindValue(tableName);

    if (!query.exec()) {
        qWarning(migration) << "MigrationRunner: Cannot check table existence:" << query.lastError().text();
        return false;
    }

    return query.next();
}

bool MigrationRunner::createAllTables()
{
    return createUsersTable() &&
           createIngredientsTable() &&
           createProductTables() &&
           createOrderTables() &&
           createAppSettingsTable() &&
           createFinancialMovementsTable() &&
           createPurchaseInvoiceTables() &&
           createAuditTable() &&
           createRecurrenceTables();
}

bool MigrationRunner::createUsersTable()
{
    QString sql = R"(
        CREATE TABLE IF NOT EXISTS users (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            full_name TEXT NOT NULL,
            role TEXT NOT NULL DEFAULT 'attendant',
            created_at TEXT NOT NULL DEFAULT (datetime('now'))
        )
    )";

    return executeQuery(sql, "createUsersTable");
}

bool MigrationRunner::createIngredientsTable()
{
    // current_stock - TEXT: остаток сравнивается точно при обновлении
    QString sql = R"(
        CREATE TABLE IF NOT EXISTS ingredients (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            name TEXT NOT NULL,
            price NUMERIC NOT NULL DEFAULT 0,
            current_stock TEXT NOT NULL DEFAULT '0',
            stock_unit TEXT NOT NULL DEFAULT 'un',
            base_portion_quantity NUMERIC NOT NULL DEFAULT 1,
            base_portion_unit TEXT NOT NULL DEFAULT 'un',
            created_at TEXT NOT NULL DEFAULT (datetime('now'))
        )
    )";

    return executeQuery(sql, "createIngredientsTable");
}

bool MigrationRunner::createProductTables()
{
    const QString products = R"(
        CREATE TABLE IF NOT EXISTS products (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            name TEXT NOT NULL,
            price NUMERIC NOT NULL DEFAULT 0,
            cost_price NUMERIC,
            created_at TEXT NOT NULL DEFAULT (datetime('now'))
        )
    )";

    const QString recipe = R"(
        CREATE TABLE IF NOT EXISTS product_ingredients (
            product_id INTEGER NOT NULL,
            ingredient_id INTEGER NOT NULL,
            portions NUMERIC NOT NULL DEFAULT 0,
            PRIMARY KEY (product_id, ingredient_id),
            FOREIGN KEY (product_id) REFERENCES products(id) ON DELETE CASCADE,
            FOREIGN KEY (ingredient_id) REFERENCES ingredients(id)
        )
    )";

    return executeQuery(products, "createProductTables: products") &&
           executeQuery(recipe, "createProductTables: product_ingredients");
}

bool MigrationRunner::createOrderTables()
{
    const QString orders = R"(
        CREATE TABLE IF NOT EXISTS orders (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            user_id INTEGER,
            total_amount TEXT NOT NULL DEFAULT '0',
            payment_method TEXT,
            status TEXT NOT NULL DEFAULT 'pending',
            created_at TEXT NOT NULL DEFAULT (datetime('now')),
            FOREIGN KEY (user_id) REFERENCES users(id)
        )
    )";

    const QString items = R"(
        CREATE TABLE IF NOT EXISTS order_items (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            order_id INTEGER NOT NULL,
            product_id INTEGER NOT NULL,
            quantity NUMERIC NOT NULL DEFAULT 1,
            FOREIGN KEY (order_id) REFERENCES orders(id) ON DELETE CASCADE,
            FOREIGN KEY (product_id) REFERENCES products(id)
        )
    )";

    const QString extras = R"(
        CREATE TABLE IF NOT EXISTS order_item_extras (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            order_item_id INTEGER NOT NULL,
            ingredient_id INTEGER NOT NULL,
            type TEXT NOT NULL DEFAULT 'extra' CHECK(type IN ('extra', 'base')),
            quantity NUMERIC NOT NULL DEFAULT 0,
            delta NUMERIC NOT NULL DEFAULT 0,
            FOREIGN KEY (order_item_id) REFERENCES order_items(id) ON DELETE CASCADE,
            FOREIGN KEY (ingredient_id) REFERENCES ingredients(id)
        )
    )";

    return executeQuery(orders, "createOrderTables: orders") &&
           executeQuery(items, "createOrderTables: order_items") &&
           executeQuery(extras, "createOrderTables: order_item_extras");
}

bool MigrationRunner::createAppSettingsTable()
{
    QString sql = R"(
        CREATE TABLE IF NOT EXISTS app_settings (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            fee_credit NUMERIC NOT NULL DEFAULT 0,
            fee_debit NUMERIC NOT NULL DEFAULT 0,
            fee_pix NUMERIC NOT NULL DEFAULT 0,
            fee_ifood NUMERIC NOT NULL DEFAULT 0,
            fee_uber_eats NUMERIC NOT NULL DEFAULT 0,
            created_at TEXT NOT NULL DEFAULT (datetime('now'))
        )
    )";

    return executeQuery(sql, "createAppSettingsTable");
}

bool MigrationRunner::createFinancialMovementsTable()
{
    // Денежные суммы - TEXT: SUM() в SQLite считает в double, итоги считаются в Decimal
    QString sql = R"(
        CREATE TABLE IF NOT EXISTS financial_movements (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            type TEXT NOT NULL CHECK(type IN ('REVENUE', 'EXPENSE', 'CMV', 'TAX')),
            value TEXT NOT NULL CHECK(CAST(value AS REAL) > 0),
            category TEXT,
            subcategory TEXT,
            description TEXT NOT NULL,
            movement_date TEXT,
            payment_status TEXT NOT NULL DEFAULT 'Pending' CHECK(payment_status IN ('Pending', 'Paid')),
            payment_method TEXT,
            sender_receiver TEXT,
            related_entity_type TEXT,
            related_entity_id INTEGER,
            notes TEXT,
            payment_gateway_id TEXT,
            transaction_id TEXT,
            bank_account TEXT,
            reconciled INTEGER NOT NULL DEFAULT 0 CHECK(reconciled IN (0, 1)),
            reconciled_at TEXT,
            created_at TEXT NOT NULL DEFAULT (datetime('now')),
            updated_at TEXT NOT NULL DEFAULT (datetime('now')),
            created_by INTEGER,
            FOREIGN KEY (created_by) REFERENCES users(id) ON DELETE SET NULL
        )
    )";

    return executeQuery(sql, "createFinancialMovementsTable");
}

bool MigrationRunner::createPurchaseInvoiceTables()
{
    const QString invoices = R"(
        CREATE TABLE IF NOT EXISTS purchase_invoices (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            invoice_number TEXT NOT NULL,
            supplier_name TEXT NOT NULL,
            total_amount TEXT NOT NULL DEFAULT '0',
            purchase_date TEXT NOT NULL,
            payment_status TEXT NOT NULL DEFAULT 'Pending' CHECK(payment_status IN ('Pending', 'Paid')),
            payment_method TEXT,
            payment_date TEXT,
            notes TEXT,
            created_by INTEGER,
            created_at TEXT NOT NULL DEFAULT (datetime('now')),
            updated_at TEXT NOT NULL DEFAULT (datetime('now')),
            FOREIGN KEY (created_by) REFERENCES users(id) ON DELETE SET NULL
        )
    )";

    const QString items = R"(
        CREATE TABLE IF NOT EXISTS purchase_invoice_items (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            purchase_invoice_id INTEGER NOT NULL,
            ingredient_id INTEGER NOT NULL,
            quantity TEXT NOT NULL,
            unit_price TEXT NOT NULL,
            total_price TEXT NOT NULL,
            created_at TEXT NOT NULL DEFAULT (datetime('now')),
            FOREIGN KEY (purchase_invoice_id) REFERENCES purchase_invoices(id) ON DELETE CASCADE,
            FOREIGN KEY (ingredient_id) REFERENCES ingredients(id)
        )
    )";

    return executeQuery(invoices, "createPurchaseInvoiceTables: purchase_invoices") &&
           executeQuery(items, "createPurchaseInvoiceTables: purchase_invoice_items");
}

bool MigrationRunner::createAuditTable()
{
    // Без внешнего ключа: запись DELETE переживает саму накладную
    QString sql = R"(
        CREATE TABLE IF NOT EXISTS purchase_invoice_audit (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            purchase_invoice_id INTEGER NOT NULL,
            action_type TEXT NOT NULL CHECK(action_type IN ('CREATE', 'UPDATE', 'DELETE')),
            changed_by INTEGER,
            old_values TEXT,
            new_values TEXT,
            changed_fields TEXT,
            notes TEXT,
            created_at TEXT NOT NULL DEFAULT (datetime('now'))
        )
    )";

    return executeQuery(sql, "createAuditTable");
}

bool MigrationRunner::createRecurrenceTables()
{
    const QString rules = R"(
        CREATE TABLE IF NOT EXISTS recurrence_rules (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            name TEXT NOT NULL,
            description TEXT,
            type TEXT NOT NULL CHECK(type IN ('EXPENSE', 'TAX')),
            category TEXT,
            subcategory TEXT,
            value TEXT NOT NULL CHECK(CAST(value AS REAL) > 0),
            recurrence_type TEXT NOT NULL CHECK(recurrence_type IN ('MONTHLY', 'WEEKLY', 'YEARLY')),
            recurrence_day INTEGER NOT NULL,
            sender_receiver TEXT,
            notes TEXT,
            is_active INTEGER NOT NULL DEFAULT 1 CHECK(is_active IN (0, 1)),
            created_by INTEGER,
            created_at TEXT NOT NULL DEFAULT (datetime('now')),
            updated_at TEXT NOT NULL DEFAULT (datetime('now')),
            FOREIGN KEY (created_by) REFERENCES users(id) ON DELETE SET NULL
        )
    )";

    const QString generations = R"(
        CREATE TABLE IF NOT EXISTS recurrence_generations (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            rule_id INTEGER NOT NULL,
            period_key TEXT NOT NULL,
            movement_id INTEGER,
            created_at TEXT NOT NULL DEFAULT (datetime('now')),
            UNIQUE(rule_id, period_key),
            FOREIGN KEY (rule_id) REFERENCES recurrence_rules(id) ON DELETE CASCADE
        )
    )";

    return executeQuery(rules, "createRecurrenceTables: recurrence_rules") &&
           executeQuery(generations, "createRecurrenceTables: recurrence_generations");
}

bool MigrationRunner::createIndexes()
{
    bool success = true;

    success &= executeQuery(
        "CREATE INDEX IF NOT EXISTS idx_movements_type ON financial_movements(type)",
        "createIndexes: movements_type"
    );
    success &= executeQuery(
        "CREATE INDEX IF NOT EXISTS idx_movements_date ON financial_movements(movement_date)",
        "createIndexes: movements_date"
    );
    success &= executeQuery(
        "CREATE INDEX IF NOT EXISTS idx_movements_status ON financial_movements(payment_status)",
        "createIndexes: movements_status"
    );
    success &= executeQuery(
        "CREATE INDEX IF NOT EXISTS idx_movements_related ON financial_movements(related_entity_type, related_entity_id)",
        "createIndexes: movements_related"
    );
    success &= executeQuery(
        "CREATE INDEX IF NOT EXISTS idx_movements_reconciled ON financial_movements(reconciled)",
        "createIndexes: movements_reconciled"
    );

    success &= executeQuery(
        "CREATE INDEX IF NOT EXISTS idx_invoices_supplier ON purchase_invoices(supplier_name)",
        "createIndexes: invoices_supplier"
    );
    success &= executeQuery(
        "CREATE INDEX IF NOT EXISTS idx_invoices_date ON purchase_invoices(purchase_date)",
        "createIndexes: invoices_date"
    );
    success &= executeQuery(
        "CREATE INDEX IF NOT EXISTS idx_invoice_items_invoice ON purchase_invoice_items(purchase_invoice_id)",
        "createIndexes: invoice_items_invoice"
    );
    success &= executeQuery(
        "CREATE INDEX IF NOT EXISTS idx_invoice_items_ingredient ON purchase_invoice_items(ingredient_id)",
        "createIndexes: invoice_items_ingredient"
    );
    success &= executeQuery(
        "CREATE INDEX IF NOT EXISTS idx_audit_invoice ON purchase_invoice_audit(purchase_invoice_id)",
        "createIndexes: audit_invoice"
    );

    success &= executeQuery(
        "CREATE INDEX IF NOT EXISTS idx_order_items_order ON order_items(order_id)",
        "createIndexes: order_items_order"
    );
    success &= executeQuery(
        "CREATE INDEX IF NOT EXISTS idx_order_item_extras_item ON order_item_extras(order_item_id)",
        "createIndexes: order_item_extras_item"
    );

    success &= executeQuery(
        "CREATE INDEX IF NOT EXISTS idx_recurrence_rules_active ON recurrence_rules(is_active)",
        "createIndexes: recurrence_rules_active"
    );

    return success;
}

bool MigrationRunner::executeQuery(const QString &sql, const QString &errorContext)
{
    QSqlQuery query(m_db);

    if (!query.exec(sql)) {
        QString context = errorContext.isEmpty() ? "executeQuery" : errorContext;
        qCritical(migration) << "MigrationRunner:" << context << "- SQL error:" << query.lastError().text();
        qCritical(migration) << "MigrationRunner:" << context << "- SQL:" << sql;
        return false;
    }

    return true;
}
