#define BOOST_TEST_DYN_LINK
#include <boost/test/unit_test.hpp>

#include "TestDatabase.h"

#include "LedgerConstants.h"
#include "LedgerService.h"
#include "RecurrenceService.h"
#include "repositories/FinancialMovementRepository.h"
#include "repositories/PurchaseInvoiceRepository.h"
#include "repositories/RecurrenceRuleRepository.h"

BOOST_AUTO_TEST_SUITE(recurrence_schedule)

BOOST_AUTO_TEST_CASE(testMonthlyDayIsClampedToMonthEnd)
{
  BOOST_CHECK(RecurrenceService::dueDate(RecurrenceType::Monthly, 31, 2026, 2, 1) == QDate(2026, 2, 28));
  BOOST_CHECK(RecurrenceService::dueDate(RecurrenceType::Monthly, 31, 2028, 2, 1) == QDate(2028, 2, 29));
  BOOST_CHECK(RecurrenceService::dueDate(RecurrenceType::Monthly, 31, 2026, 4, 1) == QDate(2026, 4, 30));
  BOOST_CHECK(RecurrenceService::dueDate(RecurrenceType::Monthly, 5, 2026, 10, 1) == QDate(2026, 10, 5));
}

BOOST_AUTO_TEST_CASE(testWeeklyUsesIsoWeek)
{
  const QDate monday = RecurrenceService::dueDate(RecurrenceType::Weekly, 1, 2026, 1, 42);
  BOOST_CHECK(monday == QDate(2026, 10, 12));

  const QDate wednesday = RecurrenceService::dueDate(RecurrenceType::Weekly, 3, 2026, 1, 42);
  BOOST_CHECK(wednesday == QDate(2026, 10, 14));
  BOOST_CHECK_EQUAL(42, wednesday.weekNumber());
  BOOST_CHECK_EQUAL(3, wednesday.dayOfWeek());

  // неделя 1 2026 начинается в 2025 году
  BOOST_CHECK(RecurrenceService::dueDate(RecurrenceType::Weekly, 1, 2026, 1, 1) == QDate(2025, 12, 29));
}

BOOST_AUTO_TEST_CASE(testYearlyCountsFromFirstOfJanuary)
{
  BOOST_CHECK(RecurrenceService::dueDate(RecurrenceType::Yearly, 1, 2026, 1, 1) == QDate(2026, 1, 1));
  BOOST_CHECK(RecurrenceService::dueDate(RecurrenceType::Yearly, 100, 2026, 1, 1) == QDate(2026, 4, 10));
  BOOST_CHECK(RecurrenceService::dueDate(RecurrenceType::Yearly, 365, 2026, 1, 1) == QDate(2026, 12, 31));
  BOOST_CHECK(RecurrenceService::dueDate(RecurrenceType::Yearly, 365, 2028, 1, 1) == QDate(2028, 12, 30));
  BOOST_CHECK(RecurrenceService::dueDate(RecurrenceType::Yearly, 366, 2026, 1, 1) == QDate(2026, 12, 31));
}

BOOST_AUTO_TEST_CASE(testPeriodKeys)
{
  BOOST_CHECK_EQUAL(QString("M:2026-03"), RecurrenceService::periodKey(RecurrenceType::Monthly, 2026, 3, 11));
  BOOST_CHECK_EQUAL(QString("W:2026-07"), RecurrenceService::periodKey(RecurrenceType::Weekly, 2026, 2, 7));
  BOOST_CHECK_EQUAL(QString("Y:2026"), RecurrenceService::periodKey(RecurrenceType::Yearly, 2026, 12, 52));
}

BOOST_AUTO_TEST_SUITE_END()

struct recurrence_fixture : TestDatabase {
  recurrence_fixture()
    : movements(db)
    , invoices(db)
    , rules(db)
    , ledger(db, &movements, &invoices)
    , service(db, &rules, &ledger)
  {
    ownerId = addUser("Fabio", "manager");
  }

  RecurrenceRule addRule(const QString& name, const QString& type, const QString& recurrenceType,
                         int day, const char* value, const QString& category = QString())
  {
    RecurrenceRuleDraft d;
    d.name = name;
    d.type = type;
    d.recurrenceType = recurrenceType;
    d.recurrenceDay = day;
    d.value = Decimal(value);
    d.category = category;
    const ServiceResult<RecurrenceRule> res = service.createRule(d, ownerId);
    BOOST_REQUIRE_MESSAGE(res.isOk(), res.message.toStdString());
    return res.value;
  }

  FinancialMovement generatedFor(int ruleId)
  {
    const QList<FinancialMovement> found = movements.findByRelatedEntity(kRelatedRecurrenceRule, ruleId);
    BOOST_REQUIRE_EQUAL(1, found.size());
    return found.first();
  }

  FinancialMovementRepository movements;
  PurchaseInvoiceRepository invoices;
  RecurrenceRuleRepository rules;
  LedgerService ledger;
  RecurrenceService service;

  int ownerId = 0;
};

BOOST_FIXTURE_TEST_SUITE(recurrence_generation, recurrence_fixture)

BOOST_AUTO_TEST_CASE(testGenerateCreatesPendingMovements)
{
  const RecurrenceRule rent = addRule("Aluguel", "EXPENSE", "MONTHLY", 31, "2500");
  const RecurrenceRule tax = addRule("IPTU", "tax", "yearly", 100, "1200");

  const ServiceResult<RecurrenceRunReport> res = service.generate(2026, 2, 7);
  BOOST_REQUIRE(res.isOk());
  BOOST_CHECK_EQUAL(2, res.value.generatedCount);
  BOOST_CHECK_EQUAL(0, res.value.skippedCount);
  BOOST_CHECK(res.value.errors.isEmpty());

  const FinancialMovement rentMovement = generatedFor(rent.id);
  BOOST_CHECK(rentMovement.type == MovementType::Expense);
  BOOST_CHECK_EQUAL("2500.00", money(rentMovement.value));
  BOOST_CHECK(rentMovement.movementDate.date() == QDate(2026, 2, 28));
  BOOST_CHECK(rentMovement.paymentStatus == PaymentStatus::Pending);
  BOOST_CHECK_EQUAL(QString(kCategoryFixedCosts), rentMovement.category);
  BOOST_CHECK_EQUAL(QString("Aluguel"), rentMovement.subcategory);
  BOOST_CHECK_EQUAL(QString("Aluguel - MONTHLY"), rentMovement.description);
  BOOST_CHECK_EQUAL(ownerId, rentMovement.createdBy);

  const FinancialMovement taxMovement = generatedFor(tax.id);
  BOOST_CHECK(taxMovement.type == MovementType::Tax);
  BOOST_CHECK_EQUAL(QString(kCategoryTaxes), taxMovement.category);
  BOOST_CHECK(taxMovement.movementDate.date() == QDate(2026, 4, 10));

  BOOST_CHECK_EQUAL(2, countRows("recurrence_generations", "movement_id IS NOT NULL"));
}

BOOST_AUTO_TEST_CASE(testGenerateIsIdempotentPerPeriod)
{
  addRule("Aluguel", "EXPENSE", "MONTHLY", 10, "2500");
  addRule("IPTU", "TAX", "YEARLY", 100, "1200");
  addRule("Limpeza", "EXPENSE", "WEEKLY", 1, "150", "Serviços");

  const ServiceResult<RecurrenceRunReport> first = service.generate(2026, 2, 7);
  BOOST_REQUIRE(first.isOk());
  BOOST_CHECK_EQUAL(3, first.value.generatedCount);

  const ServiceResult<RecurrenceRunReport> again = service.generate(2026, 2, 7);
  BOOST_REQUIRE(again.isOk());
  BOOST_CHECK_EQUAL(0, again.value.generatedCount);
  BOOST_CHECK_EQUAL(3, again.value.skippedCount);
  BOOST_CHECK_EQUAL(3, countRows("financial_movements"));

  // новый месяц в той же неделе и году: только месячное правило
  const ServiceResult<RecurrenceRunReport> march = service.generate(2026, 3, 7);
  BOOST_REQUIRE(march.isOk());
  BOOST_CHECK_EQUAL(1, march.value.generatedCount);
  BOOST_CHECK_EQUAL(2, march.value.skippedCount);
  BOOST_CHECK_EQUAL(4, countRows("financial_movements"));
  BOOST_CHECK_EQUAL(1, countRows("financial_movements", "category = 'Serviços'"));
}

BOOST_AUTO_TEST_CASE(testDeactivatedRuleIsSkipped)
{
  const RecurrenceRule rent = addRule("Aluguel", "EXPENSE", "MONTHLY", 10, "2500");
  addRule("Internet", "EXPENSE", "MONTHLY", 15, "120");

  BOOST_REQUIRE(service.deactivateRule(rent.id).isOk());
  BOOST_CHECK_EQUAL(1, service.listRules(true).value.size());
  BOOST_CHECK_EQUAL(2, service.listRules(false).value.size());

  const ServiceResult<RecurrenceRunReport> res = service.generate(2026, 10, 42);
  BOOST_REQUIRE(res.isOk());
  BOOST_CHECK_EQUAL(1, res.value.generatedCount);
  BOOST_CHECK_EQUAL(0, countRows("financial_movements", QString("related_entity_id = %1").arg(rent.id)));

  BOOST_CHECK_EQUAL(ErrorCode::NotFound, service.deactivateRule(999).error);
}

BOOST_AUTO_TEST_CASE(testGenerateRejectsBadPeriod)
{
  BOOST_CHECK_EQUAL(ErrorCode::InvalidDate, service.generate(2026, 13, 1).error);
  BOOST_CHECK_EQUAL(ErrorCode::InvalidDate, service.generate(2026, 0, 1).error);
  BOOST_CHECK_EQUAL(ErrorCode::InvalidDate, service.generate(2026, 1, 54).error);
  BOOST_CHECK_EQUAL(ErrorCode::InvalidDate, service.generate(2026, 1, 0).error);
  BOOST_CHECK(service.generate(2026, 12, 53).isOk());
}

BOOST_AUTO_TEST_CASE(testDefaultPeriodOnNewYearsDay)
{
  const RecurrenceRule rent = addRule("Aluguel", "EXPENSE", "MONTHLY", 10, "2500");
  const RecurrenceRule tax = addRule("IPTU", "TAX", "YEARLY", 100, "1200");
  const RecurrenceRule cleaning = addRule("Limpeza", "EXPENSE", "WEEKLY", 1, "150");

  // 2027-01-01 - пятница 53-й ISO-недели 2026 года
  const ServiceResult<RecurrenceRunReport> res =
    service.generate(std::nullopt, std::nullopt, std::nullopt, QDate(2027, 1, 1));
  BOOST_REQUIRE_MESSAGE(res.isOk(), res.message.toStdString());
  BOOST_CHECK_EQUAL(3, res.value.generatedCount);
  BOOST_CHECK(res.value.errors.isEmpty());
  BOOST_CHECK_EQUAL(2027, res.value.year);
  BOOST_CHECK_EQUAL(53, res.value.week);
  BOOST_CHECK_EQUAL(2026, res.value.weekYear);

  BOOST_CHECK(generatedFor(rent.id).movementDate.date() == QDate(2027, 1, 10));
  BOOST_CHECK(generatedFor(tax.id).movementDate.date() == QDate(2027, 4, 10));
  BOOST_CHECK(generatedFor(cleaning.id).movementDate.date() == QDate(2026, 12, 28));
  BOOST_CHECK_EQUAL(1, countRows("recurrence_generations", "period_key = 'W:2026-53'"));
  BOOST_CHECK_EQUAL(1, countRows("recurrence_generations", "period_key = 'M:2027-01'"));
}

BOOST_AUTO_TEST_CASE(testDefaultPeriodInLastDaysOfDecember)
{
  const RecurrenceRule rent = addRule("Aluguel", "EXPENSE", "MONTHLY", 10, "2500");
  const RecurrenceRule cleaning = addRule("Limpeza", "EXPENSE", "WEEKLY", 3, "150");

  // 2025-12-31 - среда 1-й ISO-недели 2026 года
  const ServiceResult<RecurrenceRunReport> res =
    service.generate(std::nullopt, std::nullopt, std::nullopt, QDate(2025, 12, 31));
  BOOST_REQUIRE_MESSAGE(res.isOk(), res.message.toStdString());
  BOOST_CHECK_EQUAL(2, res.value.generatedCount);
  BOOST_CHECK_EQUAL(1, res.value.week);
  BOOST_CHECK_EQUAL(2026, res.value.weekYear);

  BOOST_CHECK(generatedFor(rent.id).movementDate.date() == QDate(2025, 12, 10));
  BOOST_CHECK(generatedFor(cleaning.id).movementDate.date() == QDate(2025, 12, 31));
  BOOST_CHECK_EQUAL(1, countRows("recurrence_generations", "period_key = 'W:2026-01'"));
  BOOST_CHECK_EQUAL(0, countRows("recurrence_generations", "period_key = 'W:2025-01'"));
}

BOOST_AUTO_TEST_CASE(testWeekMissingInYearFailsOnlyWeeklyRules)
{
  addRule("Aluguel", "EXPENSE", "MONTHLY", 10, "2500");
  addRule("Limpeza", "EXPENSE", "WEEKLY", 1, "150");

  // в 2027 году 52 недели
  const ServiceResult<RecurrenceRunReport> res = service.generate(2027, 1, 53);
  BOOST_REQUIRE(res.isOk());
  BOOST_CHECK_EQUAL(1, res.value.generatedCount);
  BOOST_CHECK_EQUAL(1, res.value.errors.size());
  BOOST_CHECK_EQUAL(1, countRows("financial_movements"));
}

BOOST_AUTO_TEST_CASE(testCreateRuleValidation)
{
  RecurrenceRuleDraft d;
  d.name = "Aluguel";
  d.type = "EXPENSE";
  d.recurrenceType = "MONTHLY";
  d.recurrenceDay = 5;
  d.value = Decimal(100);

  RecurrenceRuleDraft bad = d;
  bad.name = " ";
  BOOST_CHECK_EQUAL(ErrorCode::InvalidName, service.createRule(bad, ownerId).error);

  bad = d;
  bad.type = "REVENUE";
  BOOST_CHECK_EQUAL(ErrorCode::InvalidType, service.createRule(bad, ownerId).error);

  bad = d;
  bad.recurrenceType = "DAILY";
  BOOST_CHECK_EQUAL(ErrorCode::InvalidRecurrenceType, service.createRule(bad, ownerId).error);

  bad = d;
  bad.recurrenceDay.reset();
  BOOST_CHECK_EQUAL(ErrorCode::InvalidRecurrenceDay, service.createRule(bad, ownerId).error);

  bad = d;
  bad.recurrenceDay = 32;
  BOOST_CHECK_EQUAL(ErrorCode::InvalidRecurrenceDay, service.createRule(bad, ownerId).error);

  bad = d;
  bad.recurrenceType = "WEEKLY";
  bad.recurrenceDay = 8;
  BOOST_CHECK_EQUAL(ErrorCode::InvalidRecurrenceDay, service.createRule(bad, ownerId).error);

  bad = d;
  bad.value.reset();
  BOOST_CHECK_EQUAL(ErrorCode::InvalidValue, service.createRule(bad, ownerId).error);

  bad = d;
  bad.value = Decimal(0);
  BOOST_CHECK_EQUAL(ErrorCode::InvalidValue, service.createRule(bad, ownerId).error);

  BOOST_CHECK_EQUAL(0, countRows("recurrence_rules"));
  BOOST_CHECK(service.createRule(d, ownerId).isOk());
}

BOOST_AUTO_TEST_CASE(testUpdateRule)
{
  const RecurrenceRule rule = addRule("Internet", "EXPENSE", "MONTHLY", 15, "120");

  RecurrenceRulePatch patch;
  patch.value = Decimal("129.90");
  patch.recurrenceDay = 20;
  const ServiceResult<RecurrenceRule> res = service.updateRule(rule.id, patch);
  BOOST_REQUIRE_MESSAGE(res.isOk(), res.message.toStdString());
  BOOST_CHECK_EQUAL("129.90", money(res.value.value));
  BOOST_CHECK_EQUAL(20, res.value.recurrenceDay);

  BOOST_REQUIRE(service.generate(2026, 10, 42).isOk());
  const FinancialMovement m = generatedFor(rule.id);
  BOOST_CHECK_EQUAL("129.90", money(m.value));
  BOOST_CHECK(m.movementDate.date() == QDate(2026, 10, 20));

  BOOST_CHECK_EQUAL(ErrorCode::NoUpdates, service.updateRule(rule.id, RecurrenceRulePatch()).error);
  BOOST_CHECK_EQUAL(ErrorCode::NotFound, service.updateRule(rule.id + 10, patch).error);

  RecurrenceRulePatch badDay;
  badDay.recurrenceDay = 0;
  BOOST_CHECK_EQUAL(ErrorCode::InvalidRecurrenceDay, service.updateRule(rule.id, badDay).error);
}

BOOST_AUTO_TEST_SUITE_END()
