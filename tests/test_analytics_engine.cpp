/**
 * @file test_analytics_engine.cpp
 * @brief Integration tests for the AnalyticsEngine facade
 */

#include <catch2/catch.hpp>
#include "analytics/analytics_engine.hpp"
#include "data/transaction_source.hpp"
#include <stdexcept>

using namespace budget;
using namespace budget::analytics;
using Catch::Matchers::WithinAbs;

namespace {

const data::Date kToday(2024, 6, 15);

void add_expense(data::InMemoryTransactionSource& source, int owner, const std::string& date,
                 const std::string& category, const std::string& subcategory, double amount) {
    data::Transaction t;
    t.owner_id = owner;
    t.occurred_on = data::Date::parse(date);
    t.category = category;
    t.subcategory = subcategory;
    t.amount = amount;
    source.add_expense(t);
}

void add_budget(data::InMemoryTransactionSource& source, const std::string& category,
                const std::string& subcategory, double planned, int month, int year) {
    data::BudgetEntry e;
    e.owner_id = 1;
    e.category = category;
    e.subcategory = subcategory;
    e.planned_amount = planned;
    e.month = month;
    e.year = year;
    source.set_budget(e);
}

void add_income(data::InMemoryTransactionSource& source, const std::string& date, double amount) {
    data::IncomeRecord r;
    r.owner_id = 1;
    r.source = "Salary";
    r.amount = amount;
    r.occurred_on = data::Date::parse(date);
    source.add_income(r);
}

/**
 * Owner 1: rent rising 1000/1100/1200 from April to June, groceries in
 * May and June only, an old December row outside every window and a
 * row after "today". Owner 2 has unrelated spending.
 */
data::InMemoryTransactionSource make_source() {
    data::InMemoryTransactionSource source;

    add_expense(source, 1, "2023-12-01", "Housing", "Other Housing Expenses", 5000.0);
    add_expense(source, 1, "2024-04-01", "Housing", "Other Housing Expenses", 1000.0);
    add_expense(source, 1, "2024-05-01", "Housing", "Other Housing Expenses", 1100.0);
    add_expense(source, 1, "2024-06-01", "Housing", "Other Housing Expenses", 1200.0);

    add_expense(source, 1, "2024-05-04", "Food", "Groceries", 100.0);
    add_expense(source, 1, "2024-05-11", "Food", "Groceries", 100.0);
    add_expense(source, 1, "2024-05-18", "Food", "Groceries", 100.0);
    add_expense(source, 1, "2024-05-25", "Food", "Groceries", 100.0);
    add_expense(source, 1, "2024-06-01", "Food", "Groceries", 500.0);
    add_expense(source, 1, "2024-06-08", "Food", "Dining Out & Catering", 60.0);
    add_expense(source, 1, "2024-06-20", "Food", "Groceries", 9999.0);  // after today

    add_expense(source, 2, "2024-06-02", "Food", "Groceries", 700.0);

    add_budget(source, "Housing", "Other Housing Expenses", 1200.0, 6, 2024);
    add_budget(source, "Food", "Groceries", 400.0, 6, 2024);
    add_budget(source, "Entertainment", "Cinema", 50.0, 6, 2024);

    add_income(source, "2024-06-01", 2000.0);
    add_income(source, "2024-05-01", 2000.0);

    return source;
}

AnalyticsConfig family_config() {
    return AnalyticsConfig::defaults();
}

} // namespace

TEST_CASE("Engine construction", "[AnalyticsEngine]") {
    data::InMemoryTransactionSource source;

    SECTION("Clock is injectable") {
        AnalyticsEngine engine(source, family_config(), [] { return kToday; });
        REQUIRE(engine.today() == kToday);
    }

    SECTION("Invalid configuration is rejected") {
        AnalyticsConfig bad = family_config();
        bad.anomaly.threshold = -1.0;
        REQUIRE_THROWS_AS(AnalyticsEngine(source, bad), std::invalid_argument);
    }

    SECTION("Empty clock is rejected") {
        REQUIRE_THROWS_AS(AnalyticsEngine(source, family_config(), AnalyticsEngine::Clock()),
                          std::invalid_argument);
    }
}

TEST_CASE("Engine forecast", "[AnalyticsEngine]") {
    auto source = make_source();
    AnalyticsEngine engine(source, family_config(), [] { return kToday; });

    SECTION("All categories") {
        auto result = engine.forecast(1);
        REQUIRE(result.success);
        REQUIRE(result.analysis_period == "2024-04 to 2024-06");

        const auto& housing = result.predictions.at("Housing");
        REQUIRE(housing.months_analyzed == 3);
        REQUIRE_THAT(housing.predicted_amount, WithinAbs(1200.0, 1e-9));
        REQUIRE(housing.trend == Trend::INCREASING);

        // May 400, June 560 (the row after today is excluded)
        const auto& food = result.predictions.at("Food");
        REQUIRE(food.months_analyzed == 2);
        REQUIRE_THAT(food.moving_average, WithinAbs(480.0, 1e-9));
        REQUIRE_THAT(food.slope, WithinAbs(160.0, 1e-9));
    }

    SECTION("Single category with too little history") {
        auto result = engine.forecast(1, std::string("Food"));
        REQUIRE_FALSE(result.success);
        REQUIRE(result.error == AnalyticsError::INSUFFICIENT_HISTORY);
    }

    SECTION("Owner without data") {
        auto result = engine.forecast(3);
        REQUIRE_FALSE(result.success);
        REQUIRE(result.error == AnalyticsError::INSUFFICIENT_HISTORY);
    }

    SECTION("Shorter lookback window") {
        AnalyticsConfig config = family_config();
        config.forecast.lookback_months = 2;
        AnalyticsEngine short_engine(source, config, [] { return kToday; });
        REQUIRE_FALSE(short_engine.forecast(1).success);
    }
}

TEST_CASE("Engine anomaly detection", "[AnalyticsEngine]") {
    auto source = make_source();
    AnalyticsEngine engine(source, family_config(), [] { return kToday; });

    // Food sample: 100, 100, 100, 100, 500, 60 -> mean 160, z(500) ~ 2.2
    auto report = engine.detect_anomalies(1);
    REQUIRE(report.success);
    REQUIRE(report.anomalies_found == 1);
    REQUIRE(report.anomalies[0].amount == 500.0);
    REQUIRE(report.anomalies[0].date == data::Date(2024, 6, 1));

    SECTION("Explicit threshold") {
        REQUIRE(engine.detect_anomalies(1, 3.0).anomalies_found == 0);
        REQUIRE_THROWS_AS(engine.detect_anomalies(1, 0.0), std::invalid_argument);
    }

    SECTION("No transactions in the window") {
        auto empty = engine.detect_anomalies(42);
        REQUIRE_FALSE(empty.success);
        REQUIRE(empty.error == AnalyticsError::NO_TRANSACTIONS);
    }
}

TEST_CASE("Engine budget comparison", "[AnalyticsEngine]") {
    auto source = make_source();
    AnalyticsEngine engine(source, family_config(), [] { return kToday; });

    auto rows = engine.compare_budget(1, 6, 2024);
    REQUIRE(rows.size() == 3);

    REQUIRE(rows[0].category == "Entertainment");
    REQUIRE(rows[0].actual_amount == 0.0);

    REQUIRE(rows[1].category == "Food");
    REQUIRE(rows[1].subcategory == "Groceries");
    // June groceries through the end of the month, including the 20th
    REQUIRE_THAT(rows[1].actual_amount, WithinAbs(10499.0, 1e-9));
    REQUIRE(rows[1].status == BudgetStatus::OVER_BUDGET);

    REQUIRE(rows[2].category == "Housing");
    REQUIRE(rows[2].status == BudgetStatus::ON_TRACK);

    SECTION("Category rollup") {
        auto rollup = engine.compare_budget_by_category(1, 6, 2024);
        REQUIRE(rollup.size() == 3);
        REQUIRE(rollup[1].subcategory.empty());
    }

    SECTION("Month without a budget") {
        REQUIRE(engine.compare_budget(1, 5, 2024).empty());
        REQUIRE(engine.compare_budget_by_category(1, 5, 2024).empty());
    }

    SECTION("Invalid month") {
        REQUIRE_THROWS_AS(engine.compare_budget(1, 13, 2024), std::invalid_argument);
    }
}

TEST_CASE("Engine recommendations", "[AnalyticsEngine]") {
    auto source = make_source();
    AnalyticsEngine engine(source, family_config(), [] { return kToday; });

    SECTION("Month with a budget") {
        auto report = engine.recommend(1, 6, 2024);
        REQUIRE(report.success);

        bool groceries_alert = false;
        bool housing_optimization = false;
        bool savings_goal = false;
        for (const auto& r : report.recommendations) {
            if (r.kind == RecommendationKind::OVER_BUDGET && r.subcategory == "Groceries")
                groceries_alert = true;
            if (r.kind == RecommendationKind::OPTIMIZATION && r.category == "Housing")
                housing_optimization = true;
            if (r.kind == RecommendationKind::SAVINGS_GOAL)
                savings_goal = true;
        }

        REQUIRE(groceries_alert);
        REQUIRE_FALSE(housing_optimization);  // essential by default
        REQUIRE(savings_goal);                // spending exceeds income
    }

    SECTION("Month without a budget") {
        auto report = engine.recommend(1, 5, 2024);
        REQUIRE_FALSE(report.success);
        REQUIRE(report.error == AnalyticsError::NO_BUDGET_CONFIGURED);
    }
}

TEST_CASE("Engine reporting helpers", "[AnalyticsEngine]") {
    auto source = make_source();
    AnalyticsEngine engine(source, family_config(), [] { return kToday; });

    SECTION("Monthly balance") {
        auto balance = engine.monthly_balance(1, 5, 2024);
        REQUIRE_THAT(balance.income_total, WithinAbs(2000.0, 1e-9));
        REQUIRE_THAT(balance.expense_total, WithinAbs(1500.0, 1e-9));
        REQUIRE_THAT(balance.balance, WithinAbs(500.0, 1e-9));
        REQUIRE_THAT(balance.savings_rate, WithinAbs(25.0, 1e-9));

        auto no_income = engine.monthly_balance(1, 4, 2024);
        REQUIRE(no_income.savings_rate == 0.0);
    }

    SECTION("Monthly trend is zero-filled") {
        auto trend = engine.monthly_trend(1, 4);
        REQUIRE(trend.size() == 4);
        REQUIRE(trend[0].period == data::YearMonth(2024, 3));
        REQUIRE(trend[0].total_amount == 0.0);
        REQUIRE_THAT(trend[1].total_amount, WithinAbs(1000.0, 1e-9));
        REQUIRE_THAT(trend[2].total_amount, WithinAbs(1500.0, 1e-9));
        REQUIRE_THAT(trend[3].total_amount, WithinAbs(1760.0, 1e-9));
        REQUIRE(trend[3].count == 3);

        REQUIRE_THROWS_AS(engine.monthly_trend(1, 0), std::invalid_argument);
    }

    SECTION("Expense summary") {
        auto summary = engine.expense_summary(1, 6, 2024);
        REQUIRE(summary.size() == 2);
        REQUIRE(summary[0].category == "Food");
        REQUIRE_THAT(summary[0].total_amount, WithinAbs(10559.0, 1e-9));
        REQUIRE(summary[0].count == 3);
        REQUIRE(summary[1].category == "Housing");
    }
}
