#include "AppConfig.h"
#include "DbManager.h"
#include "EventBus.h"
#include "JsonCodec.h"
#include "LedgerService.h"
#include "MemoryCache.h"
#include "MigrationRunner.h"
#include "OrderSettlementService.h"
#include "PermissionGate.h"
#include "PurchaseInvoiceService.h"
#include "RecurrenceService.h"
#include "UnitConverter.h"

#include "repositories/AuditRepository.h"
#include "repositories/FinancialMovementRepository.h"
#include "repositories/IngredientRepository.h"
#include "repositories/OrderRepository.h"
#include "repositories/PurchaseInvoiceRepository.h"
#include "repositories/RecurrenceRuleRepository.h"
#include "repositories/SettingsRepository.h"
#include "repositories/UserRepository.h"

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QJsonDocument>
#include <QTextStream>

#include <optional>

namespace {

int printJson(const QJsonObject &json)
{
    QTextStream out(stdout);
    out << QJsonDocument(json).toJson(QJsonDocument::Indented);
    out.flush();
    return json.value("success").toBool() ? 0 : 1;
}

int usageError(const QString &message)
{
    QTextStream err(stderr);
    err << "ledgerctl: " << message << "\n";
    return 2;
}

std::optional<int> intOption(const QCommandLineParser &parser, const QString &name, bool *ok)
{
    if (!parser.isSet(name)) return std::nullopt;
    bool parsed = false;
    const int value = parser.value(name).toInt(&parsed);
    if (!parsed) {
        *ok = false;
        return std::nullopt;
    }
    return value;
}

}

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("kitchen_ledger");
    QCoreApplication::setApplicationVersion("1.0.0");

    QCommandLineParser parser;
    parser.setApplicationDescription("Финансовый журнал и пополнение склада ресторана");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("command",
        "migrate | generate-recurrences | cash-flow | reconciliation | settle-order");

    parser.addOptions({
        {"config", "INI-файл настроек.", "path"},
        {"db", "Путь к базе SQLite.", "path"},
        {"year", "Год генерации.", "year"},
        {"month", "Месяц генерации (1-12).", "month"},
        {"week", "ISO-неделя генерации.", "week"},
        {"period", "this_month | last_month | last_30_days | all.", "period", "this_month"},
        {"include-pending", "Добавить сумму неоплаченных обязательств."},
        {"start", "Начало периода сверки (YYYY-MM-DD).", "date"},
        {"end", "Конец периода сверки (YYYY-MM-DD).", "date"},
        {"reconciled", "Фильтр по признаку сверки (true/false).", "flag"},
        {"gateway", "Идентификатор платёжного шлюза.", "id"},
        {"order", "Номер заказа.", "id"},
        {"user", "Пользователь, от имени которого выполняется операция.", "id"},
    });

    parser.process(app);

    const QStringList args = parser.positionalArguments();
    if (args.size() != 1) {
        return usageError("ожидается одна команда, см. --help");
    }
    const QString command = args.first();

    AppConfig config = AppConfig::load(parser.value("config"));
    if (parser.isSet("db")) {
        config.databasePath = parser.value("db");
    }
    config.applyLoggingRules();

    DbManager& dbManager = DbManager::instance();
    if (!dbManager.initialize(config.databasePath)) {
        return printJson(JsonCodec::errorEnvelope(ErrorCode::DatabaseError, "Не удалось открыть базу данных"));
    }

    MigrationRunner migrationRunner(dbManager.database());
    if (!migrationRunner.runMigrations()) {
        dbManager.close();
        return printJson(JsonCodec::errorEnvelope(ErrorCode::DatabaseError, "Не удалось выполнить миграции"));
    }

    if (command == "migrate") {
        QJsonObject data;
        data.insert("database", dbManager.databasePath());
        return printJson(JsonCodec::successEnvelope(data));
    }

    const QSqlDatabase db = dbManager.database();

    FinancialMovementRepository movementRepo(db);
    PurchaseInvoiceRepository invoiceRepo(db);
    IngredientRepository ingredientRepo(db);
    AuditRepository auditRepo(db);
    OrderRepository orderRepo(db);
    SettingsRepository settingsRepo(db);
    RecurrenceRuleRepository ruleRepo(db);
    UserRepository userRepo(db);

    MemoryCache cache(config.cacheTtlSeconds);
    EventBus events;
    UnitConverter converter;

    LedgerService ledger(db, &movementRepo, &invoiceRepo, &cache, &events);
    ledger.setPagination(config.defaultPageSize, config.maxPageSize);
    ledger.setCacheTtl(config.cacheTtlSeconds);

    PermissionGate permissions(&invoiceRepo, &userRepo);
    PurchaseInvoiceService purchases(db, &invoiceRepo, &ingredientRepo, &movementRepo, &auditRepo,
                                     &ledger, &permissions);
    ledger.setInvoiceDeleter(&purchases);

    OrderSettlementService settlement(db, &orderRepo, &settingsRepo, &converter, &ledger);
    RecurrenceService recurrence(db, &ruleRepo, &ledger);

    bool ok = true;

    if (command == "generate-recurrences") {
        const std::optional<int> year = intOption(parser, "year", &ok);
        const std::optional<int> month = intOption(parser, "month", &ok);
        const std::optional<int> week = intOption(parser, "week", &ok);
        if (!ok) return usageError("--year, --month и --week должны быть числами");

        return printJson(JsonCodec::envelope(recurrence.generate(year, month, week)));
    }

    if (command == "cash-flow") {
        return printJson(JsonCodec::envelope(
            ledger.cashFlowSummary(parser.value("period"), parser.isSet("include-pending"))));
    }

    if (command == "reconciliation") {
        ReconciliationQuery query;
        if (parser.isSet("start")) {
            query.startDate = QDate::fromString(parser.value("start"), Qt::ISODate);
            if (!query.startDate.isValid()) return usageError("неверная дата --start");
        }
        if (parser.isSet("end")) {
            query.endDate = QDate::fromString(parser.value("end"), Qt::ISODate);
            if (!query.endDate.isValid()) return usageError("неверная дата --end");
        }
        if (parser.isSet("reconciled")) {
            const QString flag = parser.value("reconciled").trimmed().toLower();
            query.reconciled = (flag == "true" || flag == "1" || flag == "yes");
        }
        query.paymentGatewayId = parser.value("gateway");

        return printJson(JsonCodec::envelope(ledger.reconciliationReport(query)));
    }

    if (command == "settle-order") {
        const std::optional<int> orderId = intOption(parser, "order", &ok);
        const std::optional<int> userId = intOption(parser, "user", &ok);
        if (!ok || !orderId) return usageError("--order обязателен и должен быть числом");

        return printJson(JsonCodec::envelope(settlement.settleOrder(*orderId, userId.value_or(0))));
    }

    return usageError("неизвестная команда " + command);
}
