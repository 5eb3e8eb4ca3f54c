#ifndef DBMANAGER_H
#define DBMANAGER_H

#include <QObject>
#include <QSqlDatabase>
#include <QString>

/**
 * @brief Единственное именованное подключение к SQLite
 */
class DbManager : public QObject
{
    Q_OBJECT

public:
    static DbManager& instance();

    /**
     * @brief Открыть базу и включить внешние ключи
     * @param path Пусто - <AppDataLocation>/kitchen_ledger.db
     */
    bool initialize(const QString& path = QString());
    bool isOpen() const;

    QSqlDatabase database() const;
    QString databasePath() const;

    void close();

private:
    explicit DbManager();
    ~DbManager() override = default;

    DbManager(const DbManager&) = delete;
    DbManager& operator=(const DbManager&) = delete;

private:
    QSqlDatabase m_db;
    QString m_databasePath;

private:
    bool enableForeignKeys();
};

#endif // DBMANAGER_H
