#include "Menu.hpp"
#include <sstream>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <algorithm>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

std::vector<std::string> splitCommand(const std::string& line) {
    std::vector<std::string> out;
    std::istringstream iss(line);
    std::string word;
    while (iss >> word) out.push_back(word);
    return out;
}

bool parseId(const std::string& text, std::int64_t& id) {
    if (text.empty()) return false;
    errno = 0;
    char* end = nullptr;
    long long v = std::strtoll(text.c_str(), &end, 10);
    if (*end != '\0' || errno == ERANGE) return false;
    id = v;
    return true;
}

static std::string upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return (char)std::toupper(c); });
    return s;
}

Menu::Menu(BudgetService& svc, std::istream& input, std::ostream& output)
    : service(svc), storage(svc.storage()), in(input), out(output)
{
}

bool Menu::readLine(const std::string& prompt, std::string& line) {
    if (inputClosed) return false;
    out << prompt;
    out.flush();
    if (!std::getline(in, line)) {
        inputClosed = true;
        spdlog::debug("Input closed");
        return false;
    }
    return true;
}

void Menu::run() {
    spdlog::info("Menu session started");

    while (!inputClosed) {
        out << "\n=== Encrypted Budget Manager ===\n"
            "1. Create New Budget\n"
            "2. Manage Existing Budgets (Open/Rename/Delete)\n"
            "3. Exit\n";

        std::string choice;
        if (!readLine("Select option: ", choice)) break;

        if (choice == "1") createBudget();
        else if (choice == "2") manageBudgets();
        else if (choice == "3") {
            out << "Goodbye.\n";
            break;
        }
    }

    spdlog::info("Menu session ended");
}

void Menu::createBudget() {
    std::string name;
    if (!readLine("Enter unique budget name: ", name)) return;

    if (storage.createBudget(name))
        out << "Budget '" << name << "' created.\n";
    else
        out << "Error: Budget name already exists.\n";
}

void Menu::manageBudgets() {
    while (!inputClosed) {
        auto budgets = storage.getBudgets();
        if (budgets.empty()) {
            out << "\nNo budgets found.\n";
            return;
        }

        out << "\n--- Available Budgets ---\n";
        for (const auto& b : budgets)
            out << "ID: " << b.id << " | Name: " << b.name << "\n";
        out << "-------------------------\n"
            "Actions: [O]pen ID, [R]ename ID, [D]elete ID, [B]ack\n";

        std::string line;
        if (!readLine("Command (e.g., 'O 1'): ", line)) return;

        auto cmd = splitCommand(line);
        if (cmd.empty()) continue;

        std::string action = upper(cmd[0]);
        if (action == "B") break;

        if (cmd.size() < 2) {
            out << "Please provide an ID (e.g., 'O 5').\n";
            continue;
        }

        std::int64_t id;
        if (!parseId(cmd[1], id)) {
            out << "Invalid input.\n";
            continue;
        }

        auto selected = std::find_if(budgets.begin(), budgets.end(),
            [id](const Budget& b) { return b.id == id; });
        if (selected == budgets.end()) {
            out << "Invalid Budget ID.\n";
            continue;
        }

        if (action == "O") {
            manageSingleBudget(selected->id, selected->name);
        }
        else if (action == "R") {
            std::string newName;
            if (!readLine("Rename '" + selected->name + "' to: ", newName)) return;
            if (storage.renameBudget(id, newName)) out << "Budget renamed.\n";
            else out << "Name already exists.\n";
        }
        else if (action == "D") {
            std::string confirm;
            if (!readLine("Are you sure you want to DELETE '" + selected->name +
                "' and ALL its encrypted items? (y/n): ", confirm)) return;
            if (confirm == "y" || confirm == "Y") {
                storage.deleteBudget(id);
                out << "Budget deleted.\n";
            }
        }
        else {
            out << "Unknown action.\n";
        }
    }
}

void Menu::printListing(const BudgetListing& listing) {
    out << fmt::format("{:<4} | {:<30} | {:>10}\n", "ID", "Description", "Amount");
    out << std::string(50, '-') << "\n";

    for (const auto& it : listing.items) {
        if (it.amountValid)
            out << fmt::format("{:<4} | {:<30} | {:>10.2f}\n", it.id, it.descriptionForDisplay(), it.amount);
        else
            out << fmt::format("{:<4} | {:<30} | {:>10}\n", it.id, it.descriptionForDisplay(), "Error");
    }

    out << std::string(50, '-') << "\n";
    out << fmt::format("{:<4} | {:<30} | {:>10.2f}\n", "", "TOTAL", listing.total);
}

void Menu::promptItemFields(std::string& description, std::string& amount) {
    if (!readLine("Description: ", description)) return;
    while (readLine("Amount: ", amount)) {
        if (isValidAmount(amount)) return;
        out << "Amount must be a number (e.g. 3.50).\n";
    }
}

void Menu::manageSingleBudget(std::int64_t budgetId, const std::string& budgetName) {
    while (!inputClosed) {
        out << "\n>>> Managing: " << budgetName << " <<<\n";

        BudgetListing listing = service.listItems(budgetId);
        printListing(listing);

        out << "\nActions: [A]dd Item, [E]dit Item ID, [D]elete Item ID, [B]ack\n";

        std::string line;
        if (!readLine("Command: ", line)) return;

        auto cmd = splitCommand(line);
        if (cmd.empty()) continue;

        std::string action = upper(cmd[0]);

        if (action == "B") {
            break;
        }
        else if (action == "A") {
            std::string desc, amt;
            promptItemFields(desc, amt);
            if (inputClosed) return;
            service.addItem(budgetId, desc, amt);
        }
        else if (action == "E" || action == "D") {
            if (cmd.size() < 2) {
                out << "Please provide an Item ID.\n";
                continue;
            }

            std::int64_t itemId;
            if (!parseId(cmd[1], itemId)) {
                out << "Invalid ID format.\n";
                continue;
            }

            bool known = std::any_of(listing.items.begin(), listing.items.end(),
                [itemId](const ItemView& v) { return v.id == itemId; });
            if (!known) {
                out << "Item ID not found in this budget.\n";
                continue;
            }

            if (action == "E") {
                std::string desc, amt;
                out << "New values for item " << itemId << ":\n";
                promptItemFields(desc, amt);
                if (inputClosed) return;
                if (service.editItem(budgetId, itemId, desc, amt)) out << "Item updated.\n";
            }
            else {
                if (service.deleteItem(budgetId, itemId)) out << "Item deleted.\n";
            }
        }
        else {
            out << "Unknown action.\n";
        }
    }
}
