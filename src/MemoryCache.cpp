#include "MemoryCache.h"

#include <QDateTime>
#include <QMutexLocker>
#include <QLoggingCategory>

Q_LOGGING_CATEGORY(cacheLog, "cache.memory")

MemoryCache::MemoryCache(int defaultTtlSeconds)
    : m_defaultTtlSeconds(defaultTtlSeconds > 0 ? defaultTtlSeconds : 60)
{
}

bool MemoryCache::get(const QString &key, QVariant *value)
{
    QMutexLocker locker(&m_mutex);

    auto it = m_entries.find(key);
    if (it == m_entries.end()) {
        ++m_misses;
        return false;
    }

    if (it->expiresAtMs <= QDateTime::currentMSecsSinceEpoch()) {
        m_entries.erase(it);
        ++m_misses;
        return false;
    }

    ++m_hits;
    *value = it->value;
    return true;
}

void MemoryCache::set(const QString &key, const QVariant &value, int ttlSeconds)
{
    const int ttl = ttlSeconds > 0 ? ttlSeconds : m_defaultTtlSeconds;

    QMutexLocker locker(&m_mutex);
    Entry entry;
    entry.value = value;
    entry.expiresAtMs = QDateTime::currentMSecsSinceEpoch() + qint64(ttl) * 1000;
    m_entries.insert(key, entry);
}

int MemoryCache::invalidatePrefix(const QString &prefix)
{
    QMutexLocker locker(&m_mutex);

    int removed = 0;
    for (auto it = m_entries.begin(); it != m_entries.end();) {
        if (it.key().startsWith(prefix)) {
            it = m_entries.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }

    if (removed > 0) {
        qDebug(cacheLog) << "MemoryCache: invalidated" << removed << "keys with prefix" << prefix;
    }
    return removed;
}

void MemoryCache::clear()
{
    QMutexLocker locker(&m_mutex);
    m_entries.clear();
}

int MemoryCache::size() const
{
    QMutexLocker locker(&m_mutex);
    return m_entries.size();
}

quint64 MemoryCache::hits() const
{
    QMutexLocker locker(&m_mutex);
    return m_hits;
}

quint64 MemoryCache::misses() const
{
    QMutexLocker locker(&m_mutex);
    return m_misses;
}
