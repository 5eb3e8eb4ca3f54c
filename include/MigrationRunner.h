#ifndef MIGRATIONRUNNER_H
#define MIGRATIONRUNNER_H

#include <QObject>
#include <QSqlDatabase>
#include <QString>

/**
 * @brief Создание схемы журнала, накладных и справочников
 *
 * Все таблицы создаются через IF NOT EXISTS в одной транзакции, повторный запуск безопасен.
 */
class MigrationRunner : public QObject
{
    Q_OBJECT

public:
    explicit MigrationRunner(QSqlDatabase db, QObject *parent = nullptr);

    bool runMigrations();

    bool tableExists(const QString &tableName);

private:
    QSqlDatabase m_db;

    bool createAllTables();

    bool createUsersTable();
    bool createIngredientsTable();
    bool createProductTables();
    bool createOrderTables();
    bool createAppSettingsTable();
    bool createFinancialMovementsTable();
    bool createPurchaseInvoiceTables();
    bool createAuditTable();
    bool createRecurrenceTables();

    bool createIndexes();

    bool executeQuery(const QString &sql, const QString &errorContext = "");
};

#endif // MIGRATIONRUNNER_H
