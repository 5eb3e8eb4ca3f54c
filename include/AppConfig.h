#ifndef APPCONFIG_H
#define APPCONFIG_H

#include <QString>

/**
 * @brief Настройки приложения из INI-файла (QSettings) и переменных окружения
 *
 * Путь к файлу: явный аргумент, иначе KITCHEN_LEDGER_CONFIG, иначе
 * <AppConfigLocation>/kitchen_ledger.ini. KITCHEN_LEDGER_DB переопределяет путь к БД.
 */
struct AppConfig {
    QString databasePath;
    int cacheTtlSeconds = 60;
    int defaultPageSize = 100;
    int maxPageSize = 1000;
    QString loggingRules;

    static AppConfig load(const QString &configPath = QString());

    // Применить logging/rules к QLoggingCategory
    void applyLoggingRules() const;
};

#endif // APPCONFIG_H
