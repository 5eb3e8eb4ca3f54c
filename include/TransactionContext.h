#ifndef TRANSACTIONCONTEXT_H
#define TRANSACTIONCONTEXT_H

#include <QSqlDatabase>
#include <QString>

/**
 * @brief Явная транзакция одной единицы работы
 *
 * Начинается в конструкторе, откатывается в деструкторе, если не был
 * выполнен commit(). Передаётся в каждый изменяющий метод репозитория,
 * глобального "открытого" соединения нет.
 */
class TransactionContext
{
public:
    explicit TransactionContext(QSqlDatabase db, const QString &context = QString());
    ~TransactionContext();

    TransactionContext(const TransactionContext&) = delete;
    TransactionContext& operator=(const TransactionContext&) = delete;

    bool isActive() const { return m_active; }

    bool commit();
    void rollback();

    QSqlDatabase database() const { return m_db; }
    QString context() const { return m_context; }

private:
    QSqlDatabase m_db;
    QString m_context;
    bool m_active = false;
};

#endif // TRANSACTIONCONTEXT_H
