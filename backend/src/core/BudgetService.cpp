#include "BudgetService.hpp"
#include <spdlog/spdlog.h>

BudgetService::BudgetService(Storage& storage, const FieldCipher& cipher)
    : store(storage), fieldCipher(cipher)
{
}

std::int64_t BudgetService::addItem(std::int64_t budgetId, const std::string& description, const std::string& amount) {
    if (!isValidAmount(amount)) {
        spdlog::warn("Rejected item for budget id={}: amount does not parse", budgetId);
        throw InvalidAmount(amount);
    }

    return store.addItem(budgetId, fieldCipher.encrypt(description), fieldCipher.encrypt(amount));
}

bool BudgetService::editItem(std::int64_t budgetId, std::int64_t itemId, const std::string& description, const std::string& amount) {
    if (!itemInBudget(budgetId, itemId)) {
        spdlog::warn("Edit refused: item id={} is not in budget id={}", itemId, budgetId);
        return false;
    }

    if (!isValidAmount(amount)) {
        spdlog::warn("Rejected edit of item id={}: amount does not parse", itemId);
        throw InvalidAmount(amount);
    }

    // Both tokens are replaced; nothing of the old ciphertext survives
    store.updateItem(itemId, fieldCipher.encrypt(description), fieldCipher.encrypt(amount));
    return true;
}

bool BudgetService::deleteItem(std::int64_t budgetId, std::int64_t itemId) {
    if (!itemInBudget(budgetId, itemId)) {
        spdlog::warn("Delete refused: item id={} is not in budget id={}", itemId, budgetId);
        return false;
    }

    store.deleteItem(itemId);
    return true;
}

BudgetListing BudgetService::listItems(std::int64_t budgetId) const {
    BudgetListing listing;

    for (const auto& row : store.getItems(budgetId)) {
        ItemView v;
        v.id = row.id;
        v.description = fieldCipher.decrypt(row.description_token);
        v.amount_text = fieldCipher.decrypt(row.amount_token);

        if (v.amount_text.ok() && parseAmount(v.amount_text.value(), v.amount)) {
            v.amountValid = true;
            listing.total += v.amount;
        }

        if (!v.fullyDecrypted() || !v.amountValid) {
            ++listing.failedRows;
            spdlog::warn("Item id={} in budget id={} could not be fully read (description: {}, amount: {})",
                row.id, budgetId,
                v.description.ok() ? "ok" : toString(v.description.error().kind),
                v.amount_text.ok() ? (v.amountValid ? "ok" : "unparsable") : toString(v.amount_text.error().kind));
        }

        listing.items.push_back(std::move(v));
    }

    spdlog::debug("Listed {} items for budget id={} ({} with errors)", listing.items.size(), budgetId, listing.failedRows);
    return listing;
}

bool BudgetService::itemInBudget(std::int64_t budgetId, std::int64_t itemId) const {
    for (const auto& row : store.getItems(budgetId))
        if (row.id == itemId) return true;
    return false;
}
