#ifndef USERREPOSITORY_H
#define USERREPOSITORY_H

#include <QSqlDatabase>
#include <QSqlQuery>
#include "repositories/IUserDirectory.h"

class UserRepository : public IUserDirectory
{
public:
    explicit UserRepository(QSqlDatabase db);

    int create(TransactionContext& tx, const User& user);
    User findById(int id);

    QString roleOf(int userId) override;
    QString displayName(int userId) override;

private:
    bool executeQuery(QSqlQuery& q, const QString& context) const;

private:
    QSqlDatabase m_db;
};

#endif // USERREPOSITORY_H
