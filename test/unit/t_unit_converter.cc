#define BOOST_TEST_DYN_LINK
#include <boost/test/unit_test.hpp>

#include "TestDatabase.h"

#include "UnitConverter.h"

struct converter_fixture {
  UnitConverter converter;
};

BOOST_FIXTURE_TEST_SUITE(unit_converter, converter_fixture)

BOOST_AUTO_TEST_CASE(testConvertWithinFamily)
{
  BOOST_CHECK_EQUAL("1000", plain(converter.convert(Decimal(1), "kg", "g")));
  BOOST_CHECK_EQUAL("0.5", plain(converter.convert(Decimal(500), "g", "kg")));
  BOOST_CHECK_EQUAL("2000", plain(converter.convert(Decimal(2), "L", "ml")));
  BOOST_CHECK_EQUAL("36", plain(converter.convert(Decimal(3), "dz", "un")));
  BOOST_CHECK_EQUAL("250", plain(converter.convert(Decimal("0.25"), "g", "mg")));
}

BOOST_AUTO_TEST_CASE(testAliasesAreCaseInsensitive)
{
  BOOST_CHECK_EQUAL(QString("kg"), converter.canonicalUnit("Quilo"));
  BOOST_CHECK_EQUAL(QString("l"), converter.canonicalUnit(" LITRO "));
  BOOST_CHECK_EQUAL(QString("un"), converter.canonicalUnit("Unidade"));
  BOOST_CHECK_EQUAL("1000", plain(converter.convert(Decimal(1), "Litros", "ML")));
  BOOST_CHECK(converter.canonicalUnit("caixa").isEmpty());
}

BOOST_AUTO_TEST_CASE(testIncompatibleUnitsThrow)
{
  BOOST_CHECK_THROW(converter.convert(Decimal(1), "kg", "ml"), UnitConversionError);
  BOOST_CHECK_THROW(converter.convert(Decimal(1), "un", "g"), UnitConversionError);
  BOOST_CHECK_THROW(converter.convert(Decimal(1), "caixa", "un"), UnitConversionError);
}

BOOST_AUTO_TEST_CASE(testCompatibility)
{
  BOOST_CHECK(converter.isKnownUnit("mg"));
  BOOST_CHECK(! converter.isKnownUnit("pacote"));
  BOOST_CHECK(converter.areCompatible("g", "kg"));
  BOOST_CHECK(converter.areCompatible("ml", "Litro"));
  BOOST_CHECK(! converter.areCompatible("g", "ml"));
  BOOST_CHECK(! converter.areCompatible("g", "pacote"));
}

BOOST_AUTO_TEST_CASE(testUnitsPerPurchaseUnit)
{
  BOOST_CHECK_EQUAL("1000", plain(converter.unitsPerPurchaseUnit("kg", "g")));
  BOOST_CHECK_EQUAL("12", plain(converter.unitsPerPurchaseUnit("dz", "un")));
}

BOOST_AUTO_TEST_CASE(testCostPerBasePortion)
{
  // 25.00 за кг, порция 100 г
  BOOST_CHECK_EQUAL("2.5", plain(costPerBasePortion(converter, Decimal(25), "kg", Decimal(100), "g")));

  // 8.00 за литр, порция 50 мл
  BOOST_CHECK_EQUAL("0.4", plain(costPerBasePortion(converter, Decimal(8), "l", Decimal(50), "ml")));
}

BOOST_AUTO_TEST_CASE(testCostPerBasePortionSameUnit)
{
  BOOST_CHECK_EQUAL("6", plain(costPerBasePortion(converter, Decimal(3), "un", Decimal(2), "UN")));
}

BOOST_AUTO_TEST_CASE(testCostPerBasePortionFallsBackOnConversionError)
{
  // kg -> ml не конвертируется: price * basePortionQuantity
  BOOST_CHECK_EQUAL("8", plain(costPerBasePortion(converter, Decimal(4), "kg", Decimal(2), "ml")));
}

BOOST_AUTO_TEST_SUITE_END()
