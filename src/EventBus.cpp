#include "EventBus.h"

#include <QDateTime>
#include <QLoggingCategory>

Q_LOGGING_CATEGORY(eventsLog, "events")

EventBus::EventBus(QObject *parent)
    : QObject(parent)
{
}

void EventBus::publish(const QString &eventType, const QJsonObject &payload)
{
    QJsonObject envelope = payload;
    if (!envelope.contains("timestamp")) {
        envelope.insert("timestamp", QDateTime::currentDateTime().toString(Qt::ISODate));
    }

    ++m_published;
    qDebug(eventsLog) << "EventBus: publish" << eventType;
    emit eventPublished(eventType, envelope);
}
