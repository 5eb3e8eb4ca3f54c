#ifndef EVENTBUS_H
#define EVENTBUS_H

#include <QJsonObject>
#include <QObject>
#include <QString>

/**
 * @brief Порт публикации доменных событий (fire-and-forget)
 */
class IEventPublisher
{
public:
    virtual ~IEventPublisher() = default;

    virtual void publish(const QString &eventType, const QJsonObject &payload) = 0;
};

/**
 * @brief Внутрипроцессная шина событий на сигналах Qt
 */
class EventBus : public QObject, public IEventPublisher
{
    Q_OBJECT

public:
    explicit EventBus(QObject *parent = nullptr);

    void publish(const QString &eventType, const QJsonObject &payload) override;

    quint64 publishedCount() const { return m_published; }

signals:
    void eventPublished(const QString &eventType, const QJsonObject &payload);

private:
    quint64 m_published = 0;
};

#endif // EVENTBUS_H
