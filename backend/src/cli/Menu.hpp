#pragma once
#include <iostream>
#include <string>
#include <vector>
#include <cstdint>
#include "../core/BudgetService.hpp"

// Text menu over a budget database. Input and output streams are injected so
// a whole session can be scripted.
class Menu {
public:
    Menu(BudgetService& service, std::istream& in = std::cin, std::ostream& out = std::cout);

    // Runs until the user picks Exit or input ends.
    void run();

private:
    BudgetService& service;
    Storage& storage;
    std::istream& in;
    std::ostream& out;
    bool inputClosed = false;

    void createBudget();
    void manageBudgets();
    void manageSingleBudget(std::int64_t budgetId, const std::string& budgetName);

    void printListing(const BudgetListing& listing);
    void promptItemFields(std::string& description, std::string& amount);

    // false once input is exhausted
    bool readLine(const std::string& prompt, std::string& line);
};

std::vector<std::string> splitCommand(const std::string& line);
bool parseId(const std::string& text, std::int64_t& id);
