#ifndef ICACHE_H
#define ICACHE_H

#include <QString>
#include <QVariant>

/**
 * @brief Порт кэша чтения
 *
 * Только оптимизация: источник истины всегда БД.
 */
class ICache
{
public:
    virtual ~ICache() = default;

    /**
     * @return true и значение в value, если ключ есть и не истёк
     */
    virtual bool get(const QString &key, QVariant *value) = 0;

    /**
     * @param ttlSeconds <= 0 - TTL по умолчанию
     */
    virtual void set(const QString &key, const QVariant &value, int ttlSeconds = 0) = 0;

    /**
     * @return Число удалённых ключей
     */
    virtual int invalidatePrefix(const QString &prefix) = 0;
};

#endif // ICACHE_H
