#include "TransactionContext.h"

#include <QSqlError>
#include <QLoggingCategory>

Q_LOGGING_CATEGORY(txLog, "db.transaction")

TransactionContext::TransactionContext(QSqlDatabase db, const QString &context)
    : m_db(db)
    , m_context(context)
{
    if (!m_db.isOpen()) {
        qCritical(txLog) << "TransactionContext:" << m_context << "- database is not open";
        return;
    }

    m_active = m_db.transaction();
    if (!m_active) {
        qCritical(txLog) << "TransactionContext:" << m_context << "- transaction() failed:"
                         << m_db.lastError().text();
    }
}

TransactionContext::~TransactionContext()
{
    if (m_active) {
        qDebug(txLog) << "TransactionContext:" << m_context << "- not committed, rolling back";
        rollback();
    }
}

bool TransactionContext::commit()
{
    if (!m_active) {
        qWarning(txLog) << "TransactionContext:" << m_context << "- commit() on inactive transaction";
        return false;
    }

    if (!m_db.commit()) {
        qCritical(txLog) << "TransactionContext:" << m_context << "- commit() failed:"
                         << m_db.lastError().text();
        rollback();
        return false;
    }

    m_active = false;
    return true;
}

void TransactionContext::rollback()
{
    if (!m_active) return;

    if (!m_db.rollback()) {
        qCritical(txLog) << "TransactionContext:" << m_context << "- rollback() failed:"
                         << m_db.lastError().text();
    }
    m_active = false;
}
