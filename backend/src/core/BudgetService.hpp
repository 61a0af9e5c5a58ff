#pragma once
#include <string>
#include <cstdint>
#include <stdexcept>
#include "Item.hpp"
#include "../storage/Storage.hpp"
#include "../crypto/FieldCipher.hpp"

class InvalidAmount : public std::invalid_argument {
public:
    explicit InvalidAmount(const std::string& text)
        : std::invalid_argument("not a valid amount: '" + text + "'") {}
};

// Encrypts item fields on the way into Storage and decrypts them on the way out.
// Budgets themselves (names, rename, delete) go straight to Storage.
class BudgetService {
public:
    BudgetService(Storage& storage, const FieldCipher& cipher);

    // Throws InvalidAmount if amount doesn't parse. Returns the new item id.
    std::int64_t addItem(std::int64_t budgetId, const std::string& description, const std::string& amount);

    // false when itemId is not part of budgetId. Throws InvalidAmount.
    bool editItem(std::int64_t budgetId, std::int64_t itemId, const std::string& description, const std::string& amount);

    // false when itemId is not part of budgetId
    bool deleteItem(std::int64_t budgetId, std::int64_t itemId);

    // Never throws on bad tokens: failed fields are reported per row.
    BudgetListing listItems(std::int64_t budgetId) const;

    Storage& storage() { return store; }
    const FieldCipher& cipher() const { return fieldCipher; }

private:
    Storage& store;
    const FieldCipher& fieldCipher;

    bool itemInBudget(std::int64_t budgetId, std::int64_t itemId) const;
};
