#include "repositories/UserRepository.h"
#include "TransactionContext.h"

#include <QSqlQuery>
#include <QSqlError>
#include <QLoggingCategory>

Q_LOGGING_CATEGORY(userRepo, "repository.user")

UserRepository::UserRepository(QSqlDatabase db)
    : m_db(db)
{
    if (!m_db.isOpen()) {
        qCritical(userRepo) << "UserRepository: Database is not open";
    }
}

bool UserRepository::executeQuery(QSqlQuery& q, const QString& context) const
{
    if (!q.exec()) {
        qCritical(userRepo) << "UserRepository::" << context << "- SQL error:" << q.lastError().text();
        qCritical(userRepo) << "UserRepository::" << context << "- SQL:" << q.executedQuery();
        return false;
    }
    return true;
}

int UserRepository::create(TransactionContext& tx, const User& user)
{
    if (user.fullName.trimmed().isEmpty()) return -1;

    QSqlQuery q(tx.database());
    q.prepare("INSERT INTO users (full_name, role) VALUES (:name, :role)");
    q.bindValue(":name", user.fullName.trimmed());
    q.bindValue(":role", user.role.trimmed().toLower());

    if (!executeQuery(q, "create")) return -1;

    const int id = q.lastInsertId().toInt();
    return id > 0 ? id : -1;
}

User UserRepository::findById(int id)
{
    if (id <= 0) return User();

    QSqlQuery q(m_db);
    q.prepare("SELECT id, full_name, role FROM users WHERE id = :id");
    q.bindValue(":id", id);

    if (!executeQuery(q, "findById")) return User();
    if (!q.next()) return User();

    User u;
    u.id = q.value("id").toInt();
    u.fullName = q.value("full_name").toString();
    u.role = q.value("role").toString().toLower();
    return u;
}

QString UserRepository::roleOf(int userId)
{
    return findById(userId).role;
}

QString UserRepository::displayName(int userId)
{
    return findById(userId).fullName;
}
