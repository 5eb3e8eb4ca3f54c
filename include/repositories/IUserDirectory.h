#ifndef IUSERDIRECTORY_H
#define IUSERDIRECTORY_H

#include <QString>

class TransactionContext;

struct User {
    int id = 0;
    QString fullName;
    QString role;   // admin, manager, attendant, customer

    bool isValid() const { return id > 0; }
};

/**
 * @brief Справочник пользователей: роль и отображаемое имя
 */
class IUserDirectory
{
public:
    virtual ~IUserDirectory() = default;

    /**
     * @return Роль в нижнем регистре или пустая строка, если пользователя нет
     */
    virtual QString roleOf(int userId) = 0;
    virtual QString displayName(int userId) = 0;
};

#endif // IUSERDIRECTORY_H
