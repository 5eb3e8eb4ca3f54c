#define BOOST_TEST_DYN_LINK
#include <boost/test/unit_test.hpp>

#include "TestDatabase.h"

#include "EventBus.h"
#include "LedgerConstants.h"
#include "LedgerService.h"
#include "MemoryCache.h"
#include "PermissionGate.h"
#include "PurchaseInvoiceService.h"
#include "repositories/AuditRepository.h"
#include "repositories/FinancialMovementRepository.h"
#include "repositories/PurchaseInvoiceRepository.h"

struct invoice_fixture : TestDatabase {
  invoice_fixture()
    : movements(db)
    , invoices(db)
    , ingredients(db)
    , audit(db)
    , users(db)
    , ledger(db, &movements, &invoices, &cache, &bus)
    , gate(&invoices, &users)
    , service(db, &invoices, &ingredients, &movements, &audit, &ledger, &gate)
  {
    ledger.setInvoiceDeleter(&service);

    adminId = addUser("Ana", "admin");
    managerId = addUser("Bruno", "manager");
    clerkId = addUser("Carla", "attendant");
    otherClerkId = addUser("Davi", "attendant");

    flourId = addIngredient("Farinha", "0.025", "500", "g", "100", "g");
    cheeseId = addIngredient("Queijo", "10.50", "0", "un");
  }

  static InvoiceItemDraft item(int ingredientId, const char* quantity, const char* unitPrice,
                               const char* displayQuantity = nullptr)
  {
    InvoiceItemDraft d;
    d.ingredientId = ingredientId;
    d.quantity = Decimal(quantity);
    d.unitPrice = Decimal(unitPrice);
    if (displayQuantity) d.displayQuantity = Decimal(displayQuantity);
    return d;
  }

  InvoiceDraft draft(const QString& number, const QList<InvoiceItemDraft>& items)
  {
    InvoiceDraft d;
    d.invoiceNumber = number;
    d.supplierName = "Atacadão";
    d.purchaseDate = "2026-10-01";
    d.items = items;
    return d;
  }

  PurchaseInvoice createFlourInvoice(int userId)
  {
    const ServiceResult<PurchaseInvoice> res =
      service.create(draft("NF-100", {item(flourId, "2000", "25.00", "2")}), userId);
    BOOST_REQUIRE_MESSAGE(res.isOk(), res.message.toStdString());
    return res.value;
  }

  FinancialMovement linkedExpense(int invoiceId)
  {
    const QList<FinancialMovement> related = movements.findByRelatedEntity(kRelatedPurchaseInvoice, invoiceId);
    BOOST_REQUIRE_EQUAL(1, related.size());
    return related.first();
  }

  FinancialMovementRepository movements;
  PurchaseInvoiceRepository invoices;
  IngredientRepository ingredients;
  AuditRepository audit;
  UserRepository users;
  MemoryCache cache;
  EventBus bus;
  LedgerService ledger;
  PermissionGate gate;
  PurchaseInvoiceService service;

  int adminId = 0;
  int managerId = 0;
  int clerkId = 0;
  int otherClerkId = 0;
  int flourId = 0;
  int cheeseId = 0;
};

BOOST_FIXTURE_TEST_SUITE(purchase_invoice, invoice_fixture)

BOOST_AUTO_TEST_CASE(testCreateUsesDisplayQuantityForLineTotal)
{
  const PurchaseInvoice invoice = createFlourInvoice(clerkId);

  BOOST_REQUIRE_EQUAL(1, invoice.items.size());
  BOOST_CHECK_EQUAL("50.00", money(invoice.items.first().totalPrice));
  BOOST_CHECK_EQUAL("25", plain(invoice.items.first().unitPrice));
  BOOST_CHECK_EQUAL("2000", plain(invoice.items.first().quantity));
  BOOST_CHECK_EQUAL("50.00", money(invoice.totalAmount));
  BOOST_CHECK_EQUAL("2500", plain(stockOf(flourId)));
}

BOOST_AUTO_TEST_CASE(testCreateTotalIsSumOfItems)
{
  InvoiceDraft d = draft("NF-200", {item(flourId, "2000", "25.00", "2"), item(cheeseId, "3", "10.50")});
  d.totalAmount = Decimal("999.99");

  const ServiceResult<PurchaseInvoice> res = service.create(d, clerkId);
  BOOST_REQUIRE_MESSAGE(res.isOk(), res.message.toStdString());

  BOOST_CHECK_EQUAL("81.50", money(res.value.totalAmount));
  BOOST_CHECK_EQUAL("3", plain(stockOf(cheeseId)));

  const FinancialMovement expense = linkedExpense(res.value.id);
  BOOST_CHECK(expense.type == MovementType::Expense);
  BOOST_CHECK_EQUAL("81.50", money(expense.value));
  BOOST_CHECK_EQUAL(QString(kCategoryStockPurchases), expense.category);
  BOOST_CHECK_EQUAL(QString("Compra - NF NF-200 - Atacadão"), expense.description);
  BOOST_CHECK(expense.paymentStatus == PaymentStatus::Pending);
  BOOST_CHECK(! expense.movementDate.isValid());
  BOOST_CHECK_EQUAL(clerkId, expense.createdBy);
}

BOOST_AUTO_TEST_CASE(testCreatePaidInvoiceCreatesPaidExpense)
{
  InvoiceDraft d = draft("NF-300", {item(cheeseId, "2", "10")});
  d.paymentStatus = "Paid";
  d.paymentDate = "10-10-2026";
  d.paymentMethod = "pix";

  const ServiceResult<PurchaseInvoice> res = service.create(d, clerkId);
  BOOST_REQUIRE_MESSAGE(res.isOk(), res.message.toStdString());
  BOOST_CHECK(res.value.paymentDate.date() == QDate(2026, 10, 10));

  const FinancialMovement expense = linkedExpense(res.value.id);
  BOOST_CHECK(expense.paymentStatus == PaymentStatus::Paid);
  BOOST_CHECK(expense.movementDate.date() == QDate(2026, 10, 10));
  BOOST_CHECK_EQUAL(QString("pix"), expense.paymentMethod);
}

BOOST_AUTO_TEST_CASE(testUnitPriceFloatArtifactIsDropped)
{
  const ServiceResult<PurchaseInvoice> res =
    service.create(draft("NF-400", {item(cheeseId, "1", "39.9000000001")}), clerkId);
  BOOST_REQUIRE(res.isOk());

  BOOST_CHECK_EQUAL(QString("39.9"), scalar("SELECT unit_price FROM purchase_invoice_items").toString());
  BOOST_CHECK_EQUAL("39.90", money(res.value.totalAmount));
}

BOOST_AUTO_TEST_CASE(testSupplierLineTotalTakenAsIs)
{
  InvoiceItemDraft line = item(cheeseId, "2", "25");
  line.totalPrice = Decimal("49.99");

  const ServiceResult<PurchaseInvoice> res = service.create(draft("NF-500", {line}), clerkId);
  BOOST_REQUIRE(res.isOk());
  BOOST_CHECK_EQUAL("49.99", money(res.value.totalAmount));
}

BOOST_AUTO_TEST_CASE(testMissingIngredientsAreListed)
{
  const ServiceResult<PurchaseInvoice> res =
    service.create(draft("NF-600", {item(flourId, "10", "1"), item(998, "1", "1"), item(999, "1", "1")}), clerkId);

  BOOST_CHECK_EQUAL(ErrorCode::IngredientNotFound, res.error);
  BOOST_CHECK(res.message.contains("998, 999"));
  BOOST_CHECK_EQUAL(0, countRows("purchase_invoices"));
  BOOST_CHECK_EQUAL(0, countRows("financial_movements"));
  BOOST_CHECK_EQUAL("500", plain(stockOf(flourId)));
}

BOOST_AUTO_TEST_CASE(testCreateValidation)
{
  InvoiceDraft d = draft("", {item(cheeseId, "1", "1")});
  BOOST_CHECK_EQUAL(ErrorCode::InvalidInvoiceNumber, service.create(d, clerkId).error);

  d.invoiceNumber = "NF-1";
  d.supplierName = "  ";
  BOOST_CHECK_EQUAL(ErrorCode::InvalidSupplierName, service.create(d, clerkId).error);

  d.supplierName = "Atacadão";
  d.items.clear();
  BOOST_CHECK_EQUAL(ErrorCode::InvalidItems, service.create(d, clerkId).error);

  d.items = {item(cheeseId, "0", "1")};
  BOOST_CHECK_EQUAL(ErrorCode::InvalidItem, service.create(d, clerkId).error);

  d.items = {item(cheeseId, "1", "-2")};
  BOOST_CHECK_EQUAL(ErrorCode::InvalidItem, service.create(d, clerkId).error);

  d.items = {item(cheeseId, "1", "0.001")};
  BOOST_CHECK_EQUAL(ErrorCode::InvalidUnitPrice, service.create(d, clerkId).error);

  d.items = {item(cheeseId, "1", "1")};
  d.paymentStatus = "Quitado";
  BOOST_CHECK_EQUAL(ErrorCode::InvalidStatus, service.create(d, clerkId).error);

  d.paymentStatus.clear();
  d.purchaseDate = "2026-02-30";
  BOOST_CHECK_EQUAL(ErrorCode::InvalidDate, service.create(d, clerkId).error);

  BOOST_CHECK_EQUAL(0, countRows("purchase_invoices"));
}

BOOST_AUTO_TEST_CASE(testDeleteRestoresStockAndRemovesExpense)
{
  const PurchaseInvoice invoice = createFlourInvoice(clerkId);
  BOOST_CHECK_EQUAL("2500", plain(stockOf(flourId)));

  const ServiceResult<InvoiceDeletion> res = service.deleteInvoice(invoice.id, adminId);
  BOOST_REQUIRE_MESSAGE(res.isOk(), res.message.toStdString());
  BOOST_CHECK_EQUAL(1, res.value.removedMovements);

  BOOST_CHECK_EQUAL("500", plain(stockOf(flourId)));
  BOOST_CHECK_EQUAL(0, countRows("purchase_invoices"));
  BOOST_CHECK_EQUAL(0, countRows("purchase_invoice_items"));
  BOOST_CHECK_EQUAL(0, countRows("financial_movements"));

  const QList<AuditEntry> entries = service.history(invoice.id);
  BOOST_REQUIRE_EQUAL(2, entries.size());
  BOOST_CHECK(entries.at(0).action == AuditAction::Create);
  BOOST_CHECK(entries.at(1).action == AuditAction::Delete);
  BOOST_CHECK_EQUAL(QString("Удалено связанных движений: 1"), entries.at(1).notes);
  BOOST_CHECK_EQUAL(QString("NF-100"), entries.at(1).oldValues.value("invoice_number").toString());
}

BOOST_AUTO_TEST_CASE(testDeleteRejectedWhenStockWasConsumed)
{
  const PurchaseInvoice invoice = createFlourInvoice(clerkId);
  exec("UPDATE ingredients SET current_stock = '100' WHERE id = ?", {flourId});

  const ServiceResult<InvoiceDeletion> res = service.deleteInvoice(invoice.id, adminId);
  BOOST_CHECK_EQUAL(ErrorCode::InsufficientStock, res.error);
  BOOST_REQUIRE_EQUAL(1, res.value.shortages.size());

  const StockShortage& s = res.value.shortages.first();
  BOOST_CHECK_EQUAL(flourId, s.ingredientId);
  BOOST_CHECK_EQUAL(QString("Farinha"), s.ingredientName);
  BOOST_CHECK_EQUAL("100", plain(s.currentStock));
  BOOST_CHECK_EQUAL("2000", plain(s.required));
  BOOST_CHECK_EQUAL("1900", plain(s.shortage));

  BOOST_CHECK_EQUAL("100", plain(stockOf(flourId)));
  BOOST_CHECK_EQUAL(1, countRows("purchase_invoices"));
  BOOST_CHECK_EQUAL(1, countRows("financial_movements"));
  BOOST_CHECK_EQUAL(1, service.history(invoice.id).size());
}

BOOST_AUTO_TEST_CASE(testOnlyAdminDeletes)
{
  const PurchaseInvoice invoice = createFlourInvoice(clerkId);

  BOOST_CHECK_EQUAL(ErrorCode::PermissionDenied, service.deleteInvoice(invoice.id, managerId).error);
  BOOST_CHECK_EQUAL(ErrorCode::PermissionDenied, service.deleteInvoice(invoice.id, clerkId).error);
  BOOST_CHECK_EQUAL(ErrorCode::NotFound, service.deleteInvoice(invoice.id + 50, adminId).error);
  BOOST_CHECK_EQUAL(1, countRows("purchase_invoices"));
}

BOOST_AUTO_TEST_CASE(testEditPermissions)
{
  const PurchaseInvoice invoice = createFlourInvoice(clerkId);

  InvoicePatch patch;
  patch.notes = QString("entregue pela manhã");

  BOOST_CHECK(service.update(invoice.id, patch, clerkId).isOk());
  BOOST_CHECK(service.update(invoice.id, patch, managerId).isOk());
  BOOST_CHECK_EQUAL(ErrorCode::PermissionDenied, service.update(invoice.id, patch, otherClerkId).error);

  BOOST_CHECK_EQUAL(ErrorCode::NoUpdates, service.update(invoice.id, InvoicePatch(), clerkId).error);
  BOOST_CHECK_EQUAL(ErrorCode::NotFound, service.update(invoice.id + 50, patch, adminId).error);
}

BOOST_AUTO_TEST_CASE(testUpdateReplacesItems)
{
  const PurchaseInvoice invoice = createFlourInvoice(clerkId);

  InvoicePatch patch;
  patch.items = QList<InvoiceItemDraft>{item(flourId, "1000", "25.00", "1"), item(cheeseId, "4", "10")};

  const ServiceResult<PurchaseInvoice> res = service.update(invoice.id, patch, clerkId);
  BOOST_REQUIRE_MESSAGE(res.isOk(), res.message.toStdString());

  BOOST_CHECK_EQUAL(2, res.value.items.size());
  BOOST_CHECK_EQUAL("65.00", money(res.value.totalAmount));
  BOOST_CHECK_EQUAL("1500", plain(stockOf(flourId)));
  BOOST_CHECK_EQUAL("4", plain(stockOf(cheeseId)));
  BOOST_CHECK_EQUAL("65.00", money(linkedExpense(invoice.id).value));

  const QList<AuditEntry> entries = service.history(invoice.id);
  BOOST_REQUIRE_EQUAL(2, entries.size());
  BOOST_CHECK(entries.at(1).action == AuditAction::Update);
  BOOST_CHECK(entries.at(1).changedFields.contains("total_amount"));
  BOOST_CHECK(entries.at(1).changedFields.contains("items"));
  BOOST_CHECK(! entries.at(1).changedFields.contains("supplier_name"));
}

BOOST_AUTO_TEST_CASE(testUpdateReplaceFailsWhenStockWasConsumed)
{
  const PurchaseInvoice invoice = createFlourInvoice(clerkId);
  exec("UPDATE ingredients SET current_stock = '10' WHERE id = ?", {flourId});

  InvoicePatch patch;
  patch.items = QList<InvoiceItemDraft>{item(cheeseId, "1", "5")};

  BOOST_CHECK_EQUAL(ErrorCode::StockReversalError, service.update(invoice.id, patch, clerkId).error);
  BOOST_CHECK_EQUAL("10", plain(stockOf(flourId)));
  BOOST_CHECK_EQUAL("0", plain(stockOf(cheeseId)));
  BOOST_CHECK_EQUAL("50.00", money(service.getById(invoice.id).value.totalAmount));
}

BOOST_AUTO_TEST_CASE(testUpdatePriceAfterStockWasConsumed)
{
  const PurchaseInvoice invoice = createFlourInvoice(clerkId);
  exec("UPDATE ingredients SET current_stock = '500' WHERE id = ?", {flourId});

  // Та же партия муки, поправлена только цена: остаток не меняется
  InvoicePatch patch;
  patch.items = QList<InvoiceItemDraft>{item(flourId, "2000", "26.00", "2")};

  const ServiceResult<PurchaseInvoice> res = service.update(invoice.id, patch, clerkId);
  BOOST_REQUIRE_MESSAGE(res.isOk(), res.message.toStdString());
  BOOST_CHECK_EQUAL("52.00", money(res.value.totalAmount));
  BOOST_CHECK_EQUAL("500", plain(stockOf(flourId)));
  BOOST_CHECK_EQUAL("52.00", money(linkedExpense(invoice.id).value));

  // Уменьшение партии в пределах остатка тоже допустимо: 500 - 300 = 200
  patch.items = QList<InvoiceItemDraft>{item(flourId, "1700", "26.00", "1.7")};
  BOOST_REQUIRE(service.update(invoice.id, patch, clerkId).isOk());
  BOOST_CHECK_EQUAL("200", plain(stockOf(flourId)));
}

BOOST_AUTO_TEST_CASE(testUpdateStatusSyncsExpense)
{
  const PurchaseInvoice invoice = createFlourInvoice(clerkId);

  InvoicePatch paid;
  paid.paymentStatus = QString("Paid");
  paid.paymentDate = QString("2026-10-05");

  const ServiceResult<PurchaseInvoice> res = service.update(invoice.id, paid, clerkId);
  BOOST_REQUIRE_MESSAGE(res.isOk(), res.message.toStdString());
  BOOST_CHECK(res.value.paymentStatus == PaymentStatus::Paid);

  FinancialMovement expense = linkedExpense(invoice.id);
  BOOST_CHECK(expense.paymentStatus == PaymentStatus::Paid);
  BOOST_CHECK(expense.movementDate.date() == QDate(2026, 10, 5));

  InvoicePatch pending;
  pending.paymentStatus = QString("Pending");
  const ServiceResult<PurchaseInvoice> back = service.update(invoice.id, pending, clerkId);
  BOOST_REQUIRE(back.isOk());
  BOOST_CHECK(! back.value.paymentDate.isValid());

  expense = linkedExpense(invoice.id);
  BOOST_CHECK(expense.paymentStatus == PaymentStatus::Pending);
  BOOST_CHECK(! expense.movementDate.isValid());
}

BOOST_AUTO_TEST_CASE(testUpdateRecreatesMissingExpense)
{
  const PurchaseInvoice invoice = createFlourInvoice(clerkId);
  exec("DELETE FROM financial_movements");

  InvoicePatch patch;
  patch.supplierName = QString("Makro");
  BOOST_REQUIRE(service.update(invoice.id, patch, adminId).isOk());

  const FinancialMovement expense = linkedExpense(invoice.id);
  BOOST_CHECK_EQUAL("50.00", money(expense.value));
  BOOST_CHECK_EQUAL(QString("Makro"), expense.senderReceiver);
}

BOOST_AUTO_TEST_CASE(testLedgerStatusChangeSyncsInvoice)
{
  const PurchaseInvoice invoice = createFlourInvoice(clerkId);
  const FinancialMovement expense = linkedExpense(invoice.id);

  BOOST_REQUIRE(ledger.updatePaymentStatus(expense.id, "Paid", "07-10-2026").isOk());
  PurchaseInvoice synced = service.getById(invoice.id).value;
  BOOST_CHECK(synced.paymentStatus == PaymentStatus::Paid);
  BOOST_CHECK(synced.paymentDate.date() == QDate(2026, 10, 7));

  BOOST_REQUIRE(ledger.updatePaymentStatus(expense.id, "Pending").isOk());
  synced = service.getById(invoice.id).value;
  BOOST_CHECK(synced.paymentStatus == PaymentStatus::Pending);
  BOOST_CHECK(! synced.paymentDate.isValid());
}

BOOST_AUTO_TEST_CASE(testLedgerRemoveDeletesWholeInvoice)
{
  const PurchaseInvoice invoice = createFlourInvoice(clerkId);
  const FinancialMovement expense = linkedExpense(invoice.id);

  BOOST_CHECK_EQUAL(ErrorCode::PermissionDenied, ledger.remove(expense.id, clerkId).error);
  BOOST_CHECK_EQUAL(1, countRows("purchase_invoices"));

  BOOST_REQUIRE(ledger.remove(expense.id, adminId).isOk());
  BOOST_CHECK_EQUAL(0, countRows("purchase_invoices"));
  BOOST_CHECK_EQUAL(0, countRows("financial_movements"));
  BOOST_CHECK_EQUAL("500", plain(stockOf(flourId)));
}

BOOST_AUTO_TEST_CASE(testListFiltersBySupplier)
{
  createFlourInvoice(clerkId);

  InvoiceDraft other = draft("NF-900", {item(cheeseId, "1", "10")});
  other.supplierName = "Laticínios Serra";
  BOOST_REQUIRE(service.create(other, clerkId).isOk());

  InvoiceFilter filter;
  filter.supplierName = "serra";
  const ServiceResult<InvoicePage> page = service.list(filter, 1, 10);
  BOOST_REQUIRE(page.isOk());
  BOOST_REQUIRE_EQUAL(1, page.value.total);
  BOOST_CHECK_EQUAL(QString("NF-900"), page.value.items.first().invoiceNumber);

  BOOST_CHECK_EQUAL(2, service.list(InvoiceFilter(), 0, 0).value.total);
}

BOOST_AUTO_TEST_CASE(testCreatePublishesEvent)
{
  QString lastType;
  QObject::connect(&bus, &EventBus::eventPublished,
                   [&](const QString& type, const QJsonObject&) { lastType = type; });

  createFlourInvoice(clerkId);
  BOOST_CHECK_EQUAL(QString(kEventPurchaseCreated), lastType);
}

BOOST_AUTO_TEST_SUITE_END()
