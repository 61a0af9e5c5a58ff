#pragma once
#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <stdexcept>
#include "../core/Budget.hpp"

struct sqlite3;

class StorageError : public std::runtime_error {
public:
    explicit StorageError(const std::string& msg) : std::runtime_error(msg) {}
};

// Storage keeps budgets and items in a SQLite database.
//
// Schema:
//   budgets(id INTEGER PRIMARY KEY AUTOINCREMENT, name TEXT UNIQUE)
//   items(id INTEGER PRIMARY KEY AUTOINCREMENT, budget_id INTEGER,
//         description TEXT, amount TEXT,
//         FOREIGN KEY(budget_id) REFERENCES budgets(id) ON DELETE CASCADE)
//
// description and amount hold encrypted tokens. Storage never looks inside them.
// Every write commits on its own.
class Storage {
public:
    explicit Storage(const std::string& dbFile = "secure_budgets.db");
    ~Storage();

    Storage(const Storage&) = delete;
    Storage& operator=(const Storage&) = delete;

    // BUDGETS
    // create/rename return false when the name is already taken
    bool createBudget(const std::string& name);
    std::vector<Budget> getBudgets() const;
    std::optional<Budget> findBudget(std::int64_t budgetId) const;
    bool renameBudget(std::int64_t budgetId, const std::string& newName);
    void deleteBudget(std::int64_t budgetId);

    // ITEMS (tokens only)
    std::int64_t addItem(std::int64_t budgetId, const std::string& descToken, const std::string& amountToken);
    std::vector<StoredItem> getItems(std::int64_t budgetId) const;
    void updateItem(std::int64_t itemId, const std::string& descToken, const std::string& amountToken);
    void deleteItem(std::int64_t itemId);

    const std::string& path() const { return dbPath; }

private:
    std::string dbPath;
    sqlite3* db = nullptr;

    void exec(const char* sql);
    void createTables();
};
