#define BOOST_TEST_DYN_LINK
#include <boost/test/unit_test.hpp>

#include "TestDatabase.h"

#include <QJsonDocument>

#include "JsonCodec.h"
#include "OrderSettlementService.h"
#include "RecurrenceService.h"

namespace {

QJsonObject parse(const char* text)
{
  return QJsonDocument::fromJson(QByteArray(text)).object();
}

}

BOOST_AUTO_TEST_SUITE(json_codec)

BOOST_AUTO_TEST_CASE(testErrorEnvelope)
{
  const ServiceResult<FinancialMovement> failed =
    ServiceResult<FinancialMovement>::failure(ErrorCode::InvalidValue, "Значение должно быть больше нуля");

  const QJsonObject json = JsonCodec::envelope(failed);
  BOOST_CHECK(! json.value("success").toBool());
  BOOST_CHECK_EQUAL(QString("INVALID_VALUE"), json.value("error").toString());
  BOOST_CHECK(! json.contains("data"));
}

BOOST_AUTO_TEST_CASE(testSuccessEnvelopeWithMovement)
{
  FinancialMovement m;
  m.id = 12;
  m.type = MovementType::Cmv;
  m.value = Decimal("28");
  m.description = "CMV - Pedido #3";
  m.paymentStatus = PaymentStatus::Paid;
  m.movementDate = QDateTime(QDate(2026, 10, 18), QTime(20, 15));

  const QJsonObject json = JsonCodec::envelope(ServiceResult<FinancialMovement>::success(m));
  BOOST_CHECK(json.value("success").toBool());

  const QJsonObject data = json.value("data").toObject();
  BOOST_CHECK_EQUAL(12, data.value("id").toInt());
  BOOST_CHECK_EQUAL(QString("CMV"), data.value("type").toString());
  BOOST_CHECK_EQUAL(QString("28.00"), data.value("value").toString());
  BOOST_CHECK_EQUAL(QString("Paid"), data.value("payment_status").toString());
  BOOST_CHECK_EQUAL(QString("2026-10-18T20:15:00"), data.value("movement_date").toString());
  BOOST_CHECK(data.value("category").isNull());
  BOOST_CHECK(data.value("related_entity_id").isNull());
  BOOST_CHECK(! data.value("reconciled").toBool());
}

BOOST_AUTO_TEST_CASE(testCashFlowKeys)
{
  CashFlowSummary s;
  s.period = "this_month";
  s.totalRevenue = Decimal(1000);
  s.netProfit = Decimal("449.5");

  QJsonObject json = JsonCodec::toJson(s);
  BOOST_CHECK_EQUAL(QString("1000.00"), json.value("total_revenue").toString());
  BOOST_CHECK_EQUAL(QString("449.50"), json.value("net_profit").toString());
  BOOST_CHECK(! json.contains("pending_amount"));

  s.pendingAmount = Decimal(80);
  json = JsonCodec::toJson(s);
  BOOST_CHECK_EQUAL(QString("80.00"), json.value("pending_amount").toString());
}

BOOST_AUTO_TEST_CASE(testPageHasPagination)
{
  MovementPage page;
  page.total = 5;
  page.page = 2;
  page.pageSize = 2;
  page.totalPages = 3;

  const QJsonObject pagination = JsonCodec::toJson(page).value("pagination").toObject();
  BOOST_CHECK_EQUAL(5, pagination.value("total").toInt());
  BOOST_CHECK_EQUAL(2, pagination.value("page_size").toInt());
  BOOST_CHECK_EQUAL(3, pagination.value("total_pages").toInt());
}

BOOST_AUTO_TEST_CASE(testDeletionListsShortages)
{
  InvoiceDeletion deletion;
  deletion.invoiceId = 4;

  BOOST_CHECK(! JsonCodec::toJson(deletion).contains("shortages"));

  StockShortage s;
  s.ingredientId = 2;
  s.ingredientName = "Farinha";
  s.currentStock = Decimal(100);
  s.required = Decimal(2000);
  s.shortage = Decimal(1900);
  deletion.shortages << s;

  const QJsonArray shortages = JsonCodec::toJson(deletion).value("shortages").toArray();
  BOOST_REQUIRE_EQUAL(1, shortages.size());
  BOOST_CHECK_EQUAL(QString("1900"), shortages.at(0).toObject().value("shortage").toString());
}

BOOST_AUTO_TEST_CASE(testSettlementAndRunReport)
{
  SettlementResult result;
  result.revenueId = 10;
  result.cmvId = 11;
  result.totalCmv = Decimal(28);

  const QJsonObject settlement = JsonCodec::toJson(result);
  BOOST_CHECK_EQUAL(11, settlement.value("cmv_id").toInt());
  BOOST_CHECK(settlement.value("payment_fee_id").isNull());
  BOOST_CHECK_EQUAL(QString("0.00"), settlement.value("fee_amount").toString());

  RecurrenceRunReport report;
  report.year = 2026;
  report.month = 10;
  report.generatedCount = 2;
  report.errors << "Правило 3: ошибка базы данных";

  const QJsonObject run = JsonCodec::toJson(report);
  BOOST_CHECK_EQUAL(2, run.value("generated_count").toInt());
  BOOST_CHECK_EQUAL(1, run.value("errors").toArray().size());
}

BOOST_AUTO_TEST_CASE(testDecimalFromJson)
{
  BOOST_CHECK_EQUAL("39.9", plain(*JsonCodec::decimalFromJson(QJsonValue(39.9))));
  BOOST_CHECK_EQUAL("39.9", plain(*JsonCodec::decimalFromJson(QJsonValue("39,90"))));
  BOOST_CHECK_EQUAL("0.1", plain(*JsonCodec::decimalFromJson(QJsonValue(0.1))));
  BOOST_CHECK(! JsonCodec::decimalFromJson(QJsonValue("abc")));
  BOOST_CHECK(! JsonCodec::decimalFromJson(QJsonValue()));
  BOOST_CHECK(! JsonCodec::decimalFromJson(QJsonValue(true)));
}

BOOST_AUTO_TEST_CASE(testMovementDraftFromJson)
{
  const MovementDraft d = JsonCodec::movementDraftFromJson(parse(R"({
    "type": "expense",
    "value": "150,00",
    "description": "Gás",
    "movement_date": "18-10-2026",
    "related_entity_id": "7"
  })"));

  BOOST_CHECK_EQUAL(QString("expense"), d.type);
  BOOST_REQUIRE(d.value);
  BOOST_CHECK_EQUAL("150", plain(*d.value));
  BOOST_CHECK_EQUAL(QString("18-10-2026"), d.movementDate);
  BOOST_CHECK_EQUAL(7, d.relatedEntityId);
  BOOST_CHECK(d.paymentStatus.isEmpty());

  const MovementDraft missing = JsonCodec::movementDraftFromJson(parse(R"({"type": "TAX"})"));
  BOOST_CHECK(! missing.value);
}

BOOST_AUTO_TEST_CASE(testMovementPatchFromJson)
{
  const MovementPatch p = JsonCodec::movementPatchFromJson(parse(R"({
    "value": "not a number",
    "movement_date": null
  })"));

  BOOST_REQUIRE(p.value);
  BOOST_CHECK_EQUAL("0", plain(*p.value));
  BOOST_REQUIRE(p.movementDate);
  BOOST_CHECK(p.movementDate->isEmpty());
  BOOST_CHECK(! p.description);
  BOOST_CHECK(! p.isEmpty());

  BOOST_CHECK(JsonCodec::movementPatchFromJson(QJsonObject()).isEmpty());
}

BOOST_AUTO_TEST_CASE(testInvoiceDraftFromJson)
{
  const InvoiceDraft d = JsonCodec::invoiceDraftFromJson(parse(R"({
    "invoice_number": "NF-100",
    "supplier_name": "Atacadão",
    "total_amount": 50,
    "items": [
      {"ingredient_id": 3, "quantity": 2000, "unit_price": 25.0, "display_quantity": 2},
      {"ingredient_id": "4", "quantity": "1,5", "unit_price": "39.9000000001", "total_price": 59.85}
    ]
  })"));

  BOOST_CHECK_EQUAL(QString("NF-100"), d.invoiceNumber);
  BOOST_REQUIRE_EQUAL(2, d.items.size());
  BOOST_CHECK_EQUAL(3, d.items.at(0).ingredientId);
  BOOST_CHECK_EQUAL("2", plain(*d.items.at(0).displayQuantity));
  BOOST_CHECK(! d.items.at(0).totalPrice);
  BOOST_CHECK_EQUAL(4, d.items.at(1).ingredientId);
  BOOST_CHECK_EQUAL("1.5", plain(*d.items.at(1).quantity));
  BOOST_CHECK_EQUAL("39.9000000001", plain(*d.items.at(1).unitPrice));
}

BOOST_AUTO_TEST_CASE(testInvoicePatchItemsOnlyWhenArray)
{
  const InvoicePatch withItems = JsonCodec::invoicePatchFromJson(parse(R"({"items": []})"));
  BOOST_REQUIRE(withItems.items);
  BOOST_CHECK(withItems.isEmpty());

  const InvoicePatch notes = JsonCodec::invoicePatchFromJson(parse(R"({"notes": "ok", "items": "x"})"));
  BOOST_CHECK(! notes.items);
  BOOST_CHECK(! notes.isEmpty());
}

BOOST_AUTO_TEST_CASE(testRecurrenceRuleDraftFromJson)
{
  const RecurrenceRuleDraft d = JsonCodec::recurrenceRuleDraftFromJson(parse(R"({
    "name": "Aluguel",
    "type": "EXPENSE",
    "value": 2500,
    "recurrence_type": "MONTHLY",
    "recurrence_day": 10
  })"));
  BOOST_REQUIRE(d.recurrenceDay);
  BOOST_CHECK_EQUAL(10, *d.recurrenceDay);
  BOOST_CHECK_EQUAL("2500", plain(*d.value));

  const RecurrenceRuleDraft noDay = JsonCodec::recurrenceRuleDraftFromJson(parse(R"({"recurrence_day": null})"));
  BOOST_CHECK(! noDay.recurrenceDay);
}

BOOST_AUTO_TEST_SUITE_END()
