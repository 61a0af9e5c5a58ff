#include "Storage.hpp"
#include <sqlite3.h>
#include <spdlog/spdlog.h>

namespace {

// Owns one prepared statement; finalized on scope exit.
class Statement {
public:
    Statement(sqlite3* db, const char* sql) : db(db) {
        if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            std::string msg = sqlite3_errmsg(db);
            spdlog::error("Failed to prepare statement: {}", msg);
            throw StorageError("prepare failed: " + msg);
        }
    }

    ~Statement() { sqlite3_finalize(stmt); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    void bind(int idx, std::int64_t v) {
        check(sqlite3_bind_int64(stmt, idx, v), "bind");
    }

    void bind(int idx, const std::string& v) {
        check(sqlite3_bind_text(stmt, idx, v.c_str(), static_cast<int>(v.size()), SQLITE_TRANSIENT), "bind");
    }

    // SQLITE_ROW, SQLITE_DONE or SQLITE_CONSTRAINT_*; anything else throws
    int step() {
        int rc = sqlite3_step(stmt);
        if (rc == SQLITE_ROW || rc == SQLITE_DONE || (rc & 0xFF) == SQLITE_CONSTRAINT)
            return rc;
        std::string msg = sqlite3_errmsg(db);
        spdlog::error("Statement failed: {}", msg);
        throw StorageError("step failed: " + msg);
    }

    // For statements where any constraint failure is unexpected
    void run() {
        int rc = step();
        if (rc != SQLITE_DONE) {
            std::string msg = sqlite3_errmsg(db);
            spdlog::error("Write rejected: {}", msg);
            throw StorageError("write rejected: " + msg);
        }
    }

    std::int64_t columnInt(int col) const { return sqlite3_column_int64(stmt, col); }

    std::string columnText(int col) const {
        const unsigned char* t = sqlite3_column_text(stmt, col);
        int n = sqlite3_column_bytes(stmt, col);
        return t ? std::string(reinterpret_cast<const char*>(t), static_cast<std::size_t>(n)) : std::string();
    }

private:
    sqlite3* db;
    sqlite3_stmt* stmt = nullptr;

    void check(int rc, const char* what) {
        if (rc != SQLITE_OK) {
            std::string msg = sqlite3_errmsg(db);
            throw StorageError(std::string(what) + " failed: " + msg);
        }
    }
};

} // namespace

Storage::Storage(const std::string& dbFile)
    : dbPath(dbFile)
{
    spdlog::info("Opening budget database '{}'", dbPath);

    if (sqlite3_open(dbPath.c_str(), &db) != SQLITE_OK) {
        std::string msg = db ? sqlite3_errmsg(db) : "out of memory";
        sqlite3_close(db);
        db = nullptr;
        spdlog::error("Failed to open '{}': {}", dbPath, msg);
        throw StorageError("cannot open database '" + dbPath + "': " + msg);
    }

    sqlite3_extended_result_codes(db, 1);

    try {
        exec("PRAGMA foreign_keys = ON;");
        createTables();
    }
    catch (...) {
        sqlite3_close(db);
        db = nullptr;
        throw;
    }
}

Storage::~Storage() {
    if (db) {
        sqlite3_close(db);
        spdlog::debug("Closed budget database '{}'", dbPath);
    }
}

void Storage::exec(const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown error";
        sqlite3_free(err);
        spdlog::error("SQL failed: {}", msg);
        throw StorageError(msg);
    }
}

void Storage::createTables() {
    exec(
        "CREATE TABLE IF NOT EXISTS budgets ("
        "  id INTEGER PRIMARY KEY AUTOINCREMENT,"
        "  name TEXT UNIQUE"
        ");");
    exec(
        "CREATE TABLE IF NOT EXISTS items ("
        "  id INTEGER PRIMARY KEY AUTOINCREMENT,"
        "  budget_id INTEGER,"
        "  description TEXT,"
        "  amount TEXT,"
        "  FOREIGN KEY(budget_id) REFERENCES budgets(id) ON DELETE CASCADE"
        ");");
}

bool Storage::createBudget(const std::string& name) {
    Statement st(db, "INSERT INTO budgets (name) VALUES (?)");
    st.bind(1, name);

    if (st.step() != SQLITE_DONE) {
        spdlog::warn("Budget '{}' not created: name already exists", name);
        return false;
    }

    spdlog::info("Created budget '{}' (id={})", name, sqlite3_last_insert_rowid(db));
    return true;
}

std::vector<Budget> Storage::getBudgets() const {
    Statement st(db, "SELECT id, name FROM budgets ORDER BY id");
    std::vector<Budget> out;
    while (st.step() == SQLITE_ROW)
        out.push_back(Budget{st.columnInt(0), st.columnText(1)});
    return out;
}

std::optional<Budget> Storage::findBudget(std::int64_t budgetId) const {
    Statement st(db, "SELECT id, name FROM budgets WHERE id = ?");
    st.bind(1, budgetId);
    if (st.step() == SQLITE_ROW)
        return Budget{st.columnInt(0), st.columnText(1)};
    return std::nullopt;
}

bool Storage::renameBudget(std::int64_t budgetId, const std::string& newName) {
    Statement st(db, "UPDATE budgets SET name = ? WHERE id = ?");
    st.bind(1, newName);
    st.bind(2, budgetId);

    if (st.step() != SQLITE_DONE) {
        spdlog::warn("Budget id={} not renamed: '{}' already exists", budgetId, newName);
        return false;
    }

    spdlog::info("Renamed budget id={} to '{}'", budgetId, newName);
    return true;
}

void Storage::deleteBudget(std::int64_t budgetId) {
    Statement st(db, "DELETE FROM budgets WHERE id = ?");
    st.bind(1, budgetId);
    st.run();
    spdlog::info("Deleted budget id={} and its items", budgetId);
}

std::int64_t Storage::addItem(std::int64_t budgetId, const std::string& descToken, const std::string& amountToken) {
    Statement st(db, "INSERT INTO items (budget_id, description, amount) VALUES (?, ?, ?)");
    st.bind(1, budgetId);
    st.bind(2, descToken);
    st.bind(3, amountToken);
    st.run();

    std::int64_t id = sqlite3_last_insert_rowid(db);
    spdlog::info("Added item id={} to budget id={}", id, budgetId);
    return id;
}

std::vector<StoredItem> Storage::getItems(std::int64_t budgetId) const {
    Statement st(db, "SELECT id, budget_id, description, amount FROM items WHERE budget_id = ? ORDER BY id");
    st.bind(1, budgetId);

    std::vector<StoredItem> out;
    while (st.step() == SQLITE_ROW) {
        StoredItem it;
        it.id = st.columnInt(0);
        it.budget_id = st.columnInt(1);
        it.description_token = st.columnText(2);
        it.amount_token = st.columnText(3);
        out.push_back(std::move(it));
    }

    spdlog::debug("Fetched {} items for budget id={}", out.size(), budgetId);
    return out;
}

void Storage::updateItem(std::int64_t itemId, const std::string& descToken, const std::string& amountToken) {
    Statement st(db, "UPDATE items SET description = ?, amount = ? WHERE id = ?");
    st.bind(1, descToken);
    st.bind(2, amountToken);
    st.bind(3, itemId);
    st.run();
    spdlog::info("Updated item id={}", itemId);
}

void Storage::deleteItem(std::int64_t itemId) {
    Statement st(db, "DELETE FROM items WHERE id = ?");
    st.bind(1, itemId);
    st.run();
    spdlog::info("Deleted item id={}", itemId);
}
