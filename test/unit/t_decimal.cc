#define BOOST_TEST_DYN_LINK
#include <boost/test/unit_test.hpp>

#include "TestDatabase.h"

#include "DateUtils.h"
#include "DecimalUtils.h"

BOOST_AUTO_TEST_SUITE(decimal)

BOOST_AUTO_TEST_CASE(testQuantizeUnitPriceDropsFloatArtifacts)
{
  BOOST_CHECK_EQUAL("39.9", plain(quantizeUnitPrice(Decimal("39.9000000001"))));
  BOOST_CHECK_EQUAL("39.9", plain(quantizeUnitPrice(Decimal("39.9"))));
  BOOST_CHECK_EQUAL("39.99", plain(quantizeUnitPrice(Decimal("39.99"))));
  BOOST_CHECK_EQUAL("25", plain(quantizeUnitPrice(Decimal("25.00"))));
}

BOOST_AUTO_TEST_CASE(testQuantizeUnitPriceRoundsLongFractions)
{
  BOOST_CHECK_EQUAL("12.35", plain(quantizeUnitPrice(Decimal("12.345"))));
  BOOST_CHECK_EQUAL("0.33", plain(quantizeUnitPrice(Decimal(1) / 3)));
}

BOOST_AUTO_TEST_CASE(testRoundMoneyHalfAwayFromZero)
{
  BOOST_CHECK_EQUAL("2.68", money(Decimal("2.675")));
  BOOST_CHECK_EQUAL("-1.01", money(Decimal("-1.005")));
  BOOST_CHECK_EQUAL("150.00", money(Decimal(150)));
  BOOST_CHECK_EQUAL("0.00", money(Decimal("0.004")));
}

BOOST_AUTO_TEST_CASE(testPlainStringTrimsZeros)
{
  BOOST_CHECK_EQUAL("50", plain(Decimal("50.00")));
  BOOST_CHECK_EQUAL("0.5", plain(Decimal("0.500")));
  BOOST_CHECK_EQUAL("0", plain(Decimal(0)));
  BOOST_CHECK_EQUAL("2000", plain(Decimal(2000)));
}

BOOST_AUTO_TEST_CASE(testDecimalPlaces)
{
  BOOST_CHECK_EQUAL(2, decimalPlaces(Decimal("1.250")));
  BOOST_CHECK_EQUAL(0, decimalPlaces(Decimal("7")));
  BOOST_CHECK_EQUAL(10, decimalPlaces(Decimal("39.9000000001")));
}

BOOST_AUTO_TEST_CASE(testTryParseDecimal)
{
  Decimal value;
  BOOST_CHECK(tryParseDecimal("39,90", &value));
  BOOST_CHECK_EQUAL("39.9", plain(value));

  BOOST_CHECK(tryParseDecimal(" -12.5 ", &value));
  BOOST_CHECK_EQUAL("-12.5", plain(value));

  BOOST_CHECK(! tryParseDecimal("abc", &value));
  BOOST_CHECK(! tryParseDecimal("", &value));
  BOOST_CHECK(! tryParseDecimal("1.2.3", &value));
}

BOOST_AUTO_TEST_CASE(testDecimalFromStringAcceptsComma)
{
  BOOST_CHECK_EQUAL("0", plain(decimalFromString("  ")));
  BOOST_CHECK_EQUAL("10.5", plain(decimalFromString("10,5")));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(dates)

BOOST_AUTO_TEST_CASE(testParseDayMonthYear)
{
  const QDateTime dt = parseFlexibleDateTime("18-10-2026");
  BOOST_REQUIRE(dt.isValid());
  BOOST_CHECK(dt.date() == QDate(2026, 10, 18));
  BOOST_CHECK(dt.time() == QTime(0, 0));
}

BOOST_AUTO_TEST_CASE(testParseIsoForms)
{
  BOOST_CHECK(parseFlexibleDateTime("2026-10-18").date() == QDate(2026, 10, 18));

  const QDateTime withTime = parseFlexibleDateTime("2026-10-18T14:30:00");
  BOOST_REQUIRE(withTime.isValid());
  BOOST_CHECK(withTime.time() == QTime(14, 30));

  const QDateTime withSpace = parseFlexibleDateTime("2026-10-18 09:15:00");
  BOOST_REQUIRE(withSpace.isValid());
  BOOST_CHECK(withSpace.time() == QTime(9, 15));
}

BOOST_AUTO_TEST_CASE(testParseRejectsGarbage)
{
  BOOST_CHECK(! parseFlexibleDateTime("").isValid());
  BOOST_CHECK(! parseFlexibleDateTime("garbage").isValid());
  BOOST_CHECK(! parseFlexibleDateTime("31-02-2026").isValid());
  BOOST_CHECK(! parseFlexibleDateTime("2026-13-01").isValid());
}

BOOST_AUTO_TEST_CASE(testDbDateTimeFormat)
{
  const QDateTime dt(QDate(2026, 1, 5), QTime(7, 8, 9));
  BOOST_CHECK_EQUAL(QString("2026-01-05 07:08:09"), toDbDateTime(dt));
  BOOST_CHECK(fromDbDateTime(QVariant("2026-01-05 07:08:09")) == dt);
  BOOST_CHECK(toDbDateTimeVariant(QDateTime()).isNull());
  BOOST_CHECK(! fromDbDateTime(QVariant()).isValid());
}

BOOST_AUTO_TEST_SUITE_END()
