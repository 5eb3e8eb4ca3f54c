#ifndef MEMORYCACHE_H
#define MEMORYCACHE_H

#include <QHash>
#include <QMutex>

#include "ICache.h"

/**
 * @brief Потокобезопасный кэш в памяти процесса с TTL
 */
class MemoryCache : public ICache
{
public:
    explicit MemoryCache(int defaultTtlSeconds = 60);

    bool get(const QString &key, QVariant *value) override;
    void set(const QString &key, const QVariant &value, int ttlSeconds = 0) override;
    int invalidatePrefix(const QString &prefix) override;

    void clear();
    int size() const;

    quint64 hits() const;
    quint64 misses() const;

private:
    struct Entry {
        QVariant value;
        qint64 expiresAtMs = 0;
    };

    mutable QMutex m_mutex;
    QHash<QString, Entry> m_entries;
    int m_defaultTtlSeconds;
    quint64 m_hits = 0;
    quint64 m_misses = 0;
};

#endif // MEMORYCACHE_H
