#define BOOST_TEST_DYN_LINK
#include <boost/test/unit_test.hpp>

#include "TestDatabase.h"

#include <QThread>

#include "EventBus.h"
#include "MemoryCache.h"

BOOST_AUTO_TEST_SUITE(cache)

BOOST_AUTO_TEST_CASE(testHitAndMiss)
{
  MemoryCache cache(60);
  QVariant value;

  BOOST_CHECK(! cache.get("financial_movements:list", &value));
  cache.set("financial_movements:list", QVariant(QString("payload")));
  BOOST_REQUIRE(cache.get("financial_movements:list", &value));
  BOOST_CHECK_EQUAL(QString("payload"), value.toString());

  BOOST_CHECK_EQUAL(1u, cache.hits());
  BOOST_CHECK_EQUAL(1u, cache.misses());
}

BOOST_AUTO_TEST_CASE(testInvalidatePrefix)
{
  MemoryCache cache;
  cache.set("financial_movements:a", 1);
  cache.set("financial_movements:b", 2);
  cache.set("settings:fees", 3);

  BOOST_CHECK_EQUAL(2, cache.invalidatePrefix("financial_movements:"));
  BOOST_CHECK_EQUAL(1, cache.size());
  BOOST_CHECK_EQUAL(0, cache.invalidatePrefix("financial_movements:"));

  QVariant value;
  BOOST_CHECK(cache.get("settings:fees", &value));
  BOOST_CHECK_EQUAL(3, value.toInt());
}

BOOST_AUTO_TEST_CASE(testEntryExpires)
{
  MemoryCache cache;
  cache.set("short", 1, 1);
  QThread::msleep(1100);

  QVariant value;
  BOOST_CHECK(! cache.get("short", &value));
  BOOST_CHECK_EQUAL(0, cache.size());
}

BOOST_AUTO_TEST_CASE(testClear)
{
  MemoryCache cache;
  cache.set("a", 1);
  cache.set("b", 2);
  cache.clear();
  BOOST_CHECK_EQUAL(0, cache.size());
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(events)

BOOST_AUTO_TEST_CASE(testPublishAddsTimestamp)
{
  EventBus bus;
  QString seenType;
  QJsonObject seenPayload;
  QObject::connect(&bus, &EventBus::eventPublished,
                   [&](const QString& type, const QJsonObject& payload) {
                     seenType = type;
                     seenPayload = payload;
                   });

  QJsonObject payload;
  payload.insert("invoice_id", 7);
  bus.publish("purchase.created", payload);

  BOOST_CHECK_EQUAL(QString("purchase.created"), seenType);
  BOOST_CHECK_EQUAL(7, seenPayload.value("invoice_id").toInt());
  BOOST_CHECK(! seenPayload.value("timestamp").toString().isEmpty());
  BOOST_CHECK_EQUAL(1u, bus.publishedCount());
}

BOOST_AUTO_TEST_CASE(testPublishKeepsExplicitTimestamp)
{
  EventBus bus;
  QJsonObject seenPayload;
  QObject::connect(&bus, &EventBus::eventPublished,
                   [&](const QString&, const QJsonObject& payload) { seenPayload = payload; });

  QJsonObject payload;
  payload.insert("timestamp", "2026-10-18T10:00:00");
  bus.publish("financial_movement.created", payload);

  BOOST_CHECK_EQUAL(QString("2026-10-18T10:00:00"), seenPayload.value("timestamp").toString());
}

BOOST_AUTO_TEST_SUITE_END()
