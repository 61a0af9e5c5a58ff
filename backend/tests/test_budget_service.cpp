#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "../src/core/BudgetService.hpp"
#include "../src/crypto/KeyStore.hpp"
#include "test_helpers.hpp"

using test_helpers::TempDir;
using Catch::Matchers::WithinAbs;

TEST_CASE("BudgetService - encrypted items", "[core][service]") {
    TempDir tmp;
    KeyStore keys(tmp.file("budget_key.key"));
    FieldCipher cipher(keys.loadOrCreate());
    Storage db(tmp.file("budgets.db"));
    BudgetService svc(db, cipher);

    REQUIRE(db.createBudget("Groceries"));
    auto budget = db.getBudgets()[0].id;

    SECTION("plaintext never reaches storage") {
        svc.addItem(budget, "Milk", "3.50");

        auto rows = db.getItems(budget);
        REQUIRE(rows.size() == 1);
        REQUIRE(rows[0].description_token != "Milk");
        REQUIRE(rows[0].description_token.find("Milk") == std::string::npos);
        REQUIRE(rows[0].amount_token.find("3.50") == std::string::npos);
    }

    SECTION("listing decrypts and totals") {
        svc.addItem(budget, "Milk", "3.50");
        svc.addItem(budget, "Bread", "2.25");

        auto listing = svc.listItems(budget);
        REQUIRE(listing.items.size() == 2);
        REQUIRE(listing.items[0].description.value() == "Milk");
        REQUIRE(listing.items[0].amount_text.value() == "3.50");
        REQUIRE(listing.items[1].description.value() == "Bread");
        REQUIRE(listing.failedRows == 0);
        REQUIRE_THAT(listing.total, WithinAbs(5.75, 1e-9));
    }

    SECTION("invalid amounts are rejected on add") {
        REQUIRE_THROWS_AS(svc.addItem(budget, "Milk", "three fifty"), InvalidAmount);
        REQUIRE_THROWS_AS(svc.addItem(budget, "Milk", ""), InvalidAmount);
        REQUIRE(db.getItems(budget).empty());
    }

    SECTION("edit re-encrypts both fields") {
        auto id = svc.addItem(budget, "Milk", "3.50");
        auto before = db.getItems(budget)[0];

        REQUIRE(svc.editItem(budget, id, "Oat milk", "4.10"));

        auto after = db.getItems(budget)[0];
        REQUIRE(after.description_token != before.description_token);
        REQUIRE(after.amount_token != before.amount_token);

        auto listing = svc.listItems(budget);
        REQUIRE(listing.items[0].description.value() == "Oat milk");
        REQUIRE_THAT(listing.total, WithinAbs(4.10, 1e-9));
    }

    SECTION("edit with same values still replaces tokens") {
        auto id = svc.addItem(budget, "Milk", "3.50");
        auto before = db.getItems(budget)[0];
        REQUIRE(svc.editItem(budget, id, "Milk", "3.50"));
        REQUIRE(db.getItems(budget)[0].description_token != before.description_token);
    }

    SECTION("items are scoped to their budget") {
        REQUIRE(db.createBudget("Rent"));
        auto rent = db.getBudgets()[1].id;
        auto id = svc.addItem(rent, "March", "900");

        REQUIRE_FALSE(svc.editItem(budget, id, "x", "1"));
        REQUIRE_FALSE(svc.deleteItem(budget, id));
        REQUIRE(svc.deleteItem(rent, id));
        REQUIRE(db.getItems(rent).empty());
    }
}

TEST_CASE("BudgetService - reopen with the same key", "[core][service][scenario]") {
    TempDir tmp;
    const std::string keyPath = tmp.file("budget_key.key");
    const std::string dbPath = tmp.file("budgets.db");

    {
        KeyStore keys(keyPath);
        FieldCipher cipher(keys.loadOrCreate());
        Storage db(dbPath);
        BudgetService svc(db, cipher);

        REQUIRE(db.createBudget("Groceries"));
        svc.addItem(db.getBudgets()[0].id, "Milk", "3.50");
    }

    KeyStore keys(keyPath);
    FieldCipher cipher(keys.loadOrCreate());
    REQUIRE_FALSE(keys.createdNewKey());
    Storage db(dbPath);
    BudgetService svc(db, cipher);

    auto budgets = db.getBudgets();
    REQUIRE(budgets.size() == 1);
    REQUIRE(budgets[0].name == "Groceries");

    auto listing = svc.listItems(budgets[0].id);
    REQUIRE(listing.items.size() == 1);
    REQUIRE(listing.items[0].description.value() == "Milk");
    REQUIRE(listing.items[0].amount_text.value() == "3.50");
    REQUIRE_THAT(listing.total, WithinAbs(3.50, 1e-9));
}

TEST_CASE("BudgetService - damaged rows", "[core][service][scenario]") {
    TempDir tmp;
    KeyStore keys(tmp.file("budget_key.key"));
    FieldCipher cipher(keys.loadOrCreate());
    Storage db(tmp.file("budgets.db"));
    BudgetService svc(db, cipher);

    REQUIRE(db.createBudget("Groceries"));
    auto budget = db.getBudgets()[0].id;
    svc.addItem(budget, "Milk", "3.50");
    auto broken = svc.addItem(budget, "Cheese", "7.00");
    svc.addItem(budget, "Bread", "2.25");

    SECTION("corrupted token only affects its own row") {
        auto row = db.getItems(budget)[1];
        std::string corrupt = row.amount_token;
        corrupt[5] = corrupt[5] == 'A' ? 'B' : 'A';
        db.updateItem(broken, row.description_token, corrupt);

        auto listing = svc.listItems(budget);
        REQUIRE(listing.items.size() == 3);
        REQUIRE(listing.failedRows == 1);

        REQUIRE(listing.items[0].fullyDecrypted());
        REQUIRE(listing.items[2].fullyDecrypted());

        const auto& bad = listing.items[1];
        REQUIRE(bad.id == broken);
        REQUIRE(bad.description.value() == "Cheese");
        REQUIRE_FALSE(bad.amount_text.ok());
        REQUIRE_FALSE(bad.amountValid);

        REQUIRE_THAT(listing.total, WithinAbs(5.75, 1e-9));
    }

    SECTION("corrupted description shows the marker") {
        auto row = db.getItems(budget)[1];
        db.updateItem(broken, "garbage", row.amount_token);

        auto listing = svc.listItems(budget);
        REQUIRE(listing.items[1].descriptionForDisplay() == DECRYPT_ERROR_MARKER);
        REQUIRE(listing.items[1].amountValid);
        REQUIRE_THAT(listing.total, WithinAbs(12.75, 1e-9));
    }

    SECTION("token from a foreign key") {
        FieldCipher foreign(SecretKey::generate());
        db.updateItem(broken, foreign.encrypt("Cheese"), foreign.encrypt("7.00"));

        auto listing = svc.listItems(budget);
        REQUIRE(listing.failedRows == 1);
        REQUIRE(listing.items[1].description.error().kind == DecryptErrorKind::AuthenticationFailed);
        REQUIRE_THAT(listing.total, WithinAbs(5.75, 1e-9));
    }

    SECTION("authentic but non-numeric amount is flagged") {
        auto row = db.getItems(budget)[1];
        db.updateItem(broken, row.description_token, cipher.encrypt("seven"));

        auto listing = svc.listItems(budget);
        REQUIRE(listing.items[1].amount_text.ok());
        REQUIRE_FALSE(listing.items[1].amountValid);
        REQUIRE(listing.failedRows == 1);
        REQUIRE_THAT(listing.total, WithinAbs(5.75, 1e-9));
    }
}

TEST_CASE("parseAmount", "[core]") {
    double v = 0;
    REQUIRE(parseAmount("3.50", v));
    REQUIRE_THAT(v, WithinAbs(3.5, 1e-12));
    REQUIRE(parseAmount(" -12 ", v));
    REQUIRE_THAT(v, WithinAbs(-12.0, 1e-12));
    REQUIRE(parseAmount("1e2", v));
    REQUIRE_THAT(v, WithinAbs(100.0, 1e-12));

    REQUIRE_FALSE(isValidAmount(""));
    REQUIRE_FALSE(isValidAmount("   "));
    REQUIRE_FALSE(isValidAmount("abc"));
    REQUIRE_FALSE(isValidAmount("3.50 EUR"));
    REQUIRE_FALSE(isValidAmount("inf"));
    REQUIRE_FALSE(isValidAmount("nan"));
    REQUIRE_FALSE(isValidAmount("0x10"));
    REQUIRE_FALSE(isValidAmount("1e999"));
    REQUIRE_FALSE(isValidAmount("."));
}
