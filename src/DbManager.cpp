#include "DbManager.h"

#include <QStandardPaths>
#include <QDir>
#include <QFileInfo>
#include <QDebug>
#include <QLoggingCategory>
#include <QSqlQuery>
#include <QSqlError>

Q_LOGGING_CATEGORY(dbLog, "db")

DbManager& DbManager::instance()
{
    static DbManager instance;
    return instance;
}

DbManager::DbManager()
{
    const QString dataPath = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    m_databasePath = dataPath + "/kitchen_ledger.db";
}

bool DbManager::initialize(const QString& path)
{
    if (!path.trimmed().isEmpty()) {
        m_databasePath = path.trimmed();
    }

    if (m_databasePath != ":memory:") {
        const QString dir = QFileInfo(m_databasePath).absolutePath();
        if (!QDir().mkpath(dir)) {
            qCritical(dbLog) << "DbManager: Cannot create directory" << dir;
            return false;
        }
    }

    const QString connName = "KitchenLedgerConnection";
    if (QSqlDatabase::contains(connName)) {
        m_db = QSqlDatabase::database(connName, false);
    } else {
        m_db = QSqlDatabase::addDatabase("QSQLITE", connName);
    }

    qDebug(dbLog) << "DbManager: Available SQL drivers:" << QSqlDatabase::drivers();

    m_db.setDatabaseName(m_databasePath);

    if (!m_db.open()) {
        qCritical(dbLog) << "DbManager: Cannot open database:" << m_db.lastError().text();
        qCritical(dbLog) << "DbManager: Database path:" << m_databasePath;
        return false;
    }

    qInfo(dbLog) << "DbManager: Database opened successfully at" << m_databasePath;

    if (!enableForeignKeys()) {
        qCritical(dbLog) << "DbManager: Cannot enable foreign keys";
        return false;
    }

    return true;
}

bool DbManager::isOpen() const
{
    return m_db.isOpen();
}

QSqlDatabase DbManager::database() const
{
    return m_db;
}

QString DbManager::databasePath() const
{
    return m_databasePath;
}

void DbManager::close()
{
    if (m_db.isOpen()) {
        m_db.close();
        qInfo(dbLog) << "DbManager: Database connection closed";
    }
}

bool DbManager::enableForeignKeys()
{
    QSqlQuery query(m_db);
    if (!query.exec("PRAGMA foreign_keys = ON")) {
        qCritical(dbLog) << "DbManager: Cannot enable foreign keys:" << query.lastError().text();
        return false;
    }

    if (query.exec("PRAGMA foreign_keys")) {
        if (query.next()) {
            const int fkEnabled = query.value(0).toInt();
            if (fkEnabled == 1) {
                qDebug(dbLog) << "DbManager: Foreign keys enabled";
                return true;
            }
        }
    }

    qWarning(dbLog) << "DbManager: Foreign keys check failed";
    return false;
}
