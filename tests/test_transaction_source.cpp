#include <catch2/catch.hpp>
#include "data/transaction_source.hpp"
#include <stdexcept>

using namespace budget::data;
using Catch::Matchers::WithinAbs;

namespace {

Transaction make_expense(int owner, const Date& date, double amount) {
    Transaction t;
    t.owner_id = owner;
    t.category = "Food";
    t.subcategory = "Groceries";
    t.amount = amount;
    t.occurred_on = date;
    return t;
}

} // namespace

TEST_CASE("Expenses are validated at the boundary", "[TransactionSource]") {
    InMemoryTransactionSource source;

    REQUIRE_THROWS_AS(source.add_expense(make_expense(1, Date(2024, 3, 1), 0.0)), std::invalid_argument);
    REQUIRE_THROWS_AS(source.add_expense(make_expense(1, Date(2024, 3, 1), -12.5)), std::invalid_argument);

    Transaction no_category = make_expense(1, Date(2024, 3, 1), 10.0);
    no_category.category.clear();
    REQUIRE_THROWS_AS(source.add_expense(no_category), std::invalid_argument);

    REQUIRE(source.num_expenses() == 0);
}

TEST_CASE("Expense ids", "[TransactionSource]") {
    InMemoryTransactionSource source;

    REQUIRE(source.add_expense(make_expense(1, Date(2024, 3, 1), 10.0)) == 1);
    REQUIRE(source.add_expense(make_expense(1, Date(2024, 3, 2), 10.0)) == 2);

    Transaction explicit_id = make_expense(1, Date(2024, 3, 3), 10.0);
    explicit_id.id = 40;
    REQUIRE(source.add_expense(explicit_id) == 40);
    REQUIRE(source.add_expense(make_expense(1, Date(2024, 3, 4), 10.0)) == 41);
}

TEST_CASE("Expense queries filter by owner and range", "[TransactionSource]") {
    InMemoryTransactionSource source;
    source.add_expense(make_expense(1, Date(2024, 2, 29), 10.0));
    source.add_expense(make_expense(1, Date(2024, 3, 1), 20.0));
    source.add_expense(make_expense(2, Date(2024, 3, 5), 30.0));
    source.add_expense(make_expense(1, Date(2024, 3, 31), 40.0));

    auto march = source.expenses(1, DateRange::month(YearMonth(2024, 3)));
    REQUIRE(march.size() == 2);
    REQUIRE(march[0].amount == 20.0);
    REQUIRE(march[1].amount == 40.0);

    REQUIRE(source.expenses(2, DateRange::month(YearMonth(2024, 3))).size() == 1);
    REQUIRE(source.expenses(3, DateRange::month(YearMonth(2024, 3))).empty());
}

TEST_CASE("Budget entries are upserted", "[TransactionSource]") {
    InMemoryTransactionSource source;

    BudgetEntry entry;
    entry.owner_id = 1;
    entry.category = "Food";
    entry.subcategory = "Groceries";
    entry.planned_amount = 400.0;
    entry.month = 3;
    entry.year = 2024;

    REQUIRE_FALSE(source.set_budget(entry));

    entry.planned_amount = 450.0;
    REQUIRE(source.set_budget(entry));
    REQUIRE(source.num_budget_entries() == 1);

    auto entries = source.budget_entries(1, 3, 2024);
    REQUIRE(entries.size() == 1);
    REQUIRE(entries[0].planned_amount == 450.0);

    REQUIRE(source.budget_entries(1, 4, 2024).empty());

    SECTION("Zero plan is allowed, negative is not") {
        entry.subcategory = "Dining Out & Catering";
        entry.planned_amount = 0.0;
        REQUIRE_NOTHROW(source.set_budget(entry));

        entry.planned_amount = -1.0;
        REQUIRE_THROWS_AS(source.set_budget(entry), std::invalid_argument);
    }
}

TEST_CASE("Income totals", "[TransactionSource]") {
    InMemoryTransactionSource source;

    IncomeRecord salary;
    salary.owner_id = 1;
    salary.source = "Salary";
    salary.amount = 3000.0;
    salary.occurred_on = Date(2024, 3, 1);
    source.add_income(salary);

    salary.amount = 250.0;
    salary.source = "Bonus";
    salary.occurred_on = Date(2024, 3, 28);
    source.add_income(salary);

    salary.occurred_on = Date(2024, 4, 1);
    source.add_income(salary);

    REQUIRE_THAT(source.income_total(1, DateRange::month(YearMonth(2024, 3))), WithinAbs(3250.0, 1e-12));
    REQUIRE(source.income_total(2, DateRange::month(YearMonth(2024, 3))) == 0.0);
    REQUIRE(source.num_income() == 3);

    salary.amount = 0.0;
    REQUIRE_THROWS_AS(source.add_income(salary), std::invalid_argument);
}

TEST_CASE("Budget copy into the next month", "[TransactionSource]") {
    InMemoryTransactionSource source;

    BudgetEntry groceries;
    groceries.owner_id = 1;
    groceries.category = "Food";
    groceries.subcategory = "Groceries";
    groceries.planned_amount = 450.0;
    groceries.month = 12;
    groceries.year = 2024;
    source.set_budget(groceries);

    BudgetEntry rent = groceries;
    rent.category = "Housing";
    rent.subcategory = "Other Housing Expenses";
    rent.planned_amount = 1200.0;
    source.set_budget(rent);

    BudgetEntry existing = groceries;
    existing.planned_amount = 300.0;
    existing.month = 1;
    existing.year = 2025;
    source.set_budget(existing);

    SECTION("December rolls into January") {
        auto result = source.copy_budget_to_next_month(1, 12, 2024);
        REQUIRE(result.success);
        REQUIRE(result.entries_copied == 2);
        REQUIRE(result.target == YearMonth(2025, 1));

        auto january = source.budget_entries(1, 1, 2025);
        REQUIRE(january.size() == 2);
        REQUIRE(january[0].subcategory == "Groceries");
        REQUIRE(january[0].planned_amount == 450.0);
        REQUIRE(january[1].planned_amount == 1200.0);

        REQUIRE(source.budget_entries(1, 12, 2024).size() == 2);
        REQUIRE(source.num_budget_entries() == 4);
    }

    SECTION("Month without a budget") {
        auto result = source.copy_budget_to_next_month(1, 6, 2024);
        REQUIRE_FALSE(result.success);
        REQUIRE(result.entries_copied == 0);
        REQUIRE_FALSE(result.message.empty());
        REQUIRE(source.budget_entries(1, 7, 2024).empty());

        REQUIRE_FALSE(source.copy_budget_to_next_month(2, 12, 2024).success);
    }

    SECTION("Invalid month") {
        REQUIRE_THROWS_AS(source.copy_budget_to_next_month(1, 13, 2024), std::invalid_argument);
    }
}
