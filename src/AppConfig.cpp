#include "AppConfig.h"

#include <QDir>
#include <QLoggingCategory>
#include <QSettings>
#include <QStandardPaths>

Q_LOGGING_CATEGORY(configLog, "config")

namespace {

QString resolveConfigPath(const QString &explicitPath)
{
    if (!explicitPath.isEmpty()) return explicitPath;

    const QString fromEnv = qEnvironmentVariable("KITCHEN_LEDGER_CONFIG");
    if (!fromEnv.isEmpty()) return fromEnv;

    return QStandardPaths::writableLocation(QStandardPaths::AppConfigLocation) + "/kitchen_ledger.ini";
}

QString defaultDatabasePath()
{
    const QString dataPath = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    QDir dir;
    if (!dir.exists(dataPath)) {
        dir.mkpath(dataPath);
    }
    return dataPath + "/kitchen_ledger.db";
}

int positiveOr(const QVariant &value, int fallback)
{
    bool ok = false;
    const int v = value.toInt(&ok);
    return ok && v > 0 ? v : fallback;
}

} // namespace

AppConfig AppConfig::load(const QString &configPath)
{
    AppConfig cfg;
    const QString path = resolveConfigPath(configPath);

    QSettings settings(path, QSettings::IniFormat);
    if (settings.status() != QSettings::NoError) {
        qWarning(configLog) << "AppConfig: cannot read" << path << "- using defaults";
    }

    cfg.databasePath = settings.value("database/path").toString();
    cfg.cacheTtlSeconds = positiveOr(settings.value("cache/ttl_seconds"), 60);
    cfg.defaultPageSize = positiveOr(settings.value("ledger/default_page_size"), 100);
    cfg.maxPageSize = positiveOr(settings.value("ledger/max_page_size"), 1000);
    cfg.loggingRules = settings.value("logging/rules").toString();

    const QString dbFromEnv = qEnvironmentVariable("KITCHEN_LEDGER_DB");
    if (!dbFromEnv.isEmpty()) {
        cfg.databasePath = dbFromEnv;
    }
    if (cfg.databasePath.isEmpty()) {
        cfg.databasePath = defaultDatabasePath();
    }

    if (cfg.defaultPageSize > cfg.maxPageSize) {
        cfg.defaultPageSize = cfg.maxPageSize;
    }

    qInfo(configLog) << "AppConfig: loaded from" << path << "database:" << cfg.databasePath;
    return cfg;
}

void AppConfig::applyLoggingRules() const
{
    if (loggingRules.isEmpty()) return;

    // В INI правила удобно писать через ';'
    QString rules = loggingRules;
    rules.replace(';', '\n');
    QLoggingCategory::setFilterRules(rules);
}
