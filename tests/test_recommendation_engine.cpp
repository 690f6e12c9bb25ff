/**
 * @file test_recommendation_engine.cpp
 * @brief Unit tests for rule-based savings recommendations
 */

#include <catch2/catch.hpp>
#include "analytics/recommendation_engine.hpp"
#include <stdexcept>

using namespace budget::analytics;
using Catch::Matchers::WithinAbs;

namespace {

RecommendationConfig family_config() {
    return RecommendationConfig();
}

std::vector<Recommendation> of_kind(const RecommendationReport& report, RecommendationKind kind) {
    std::vector<Recommendation> out;
    for (const auto& r : report.recommendations) {
        if (r.kind == kind)
            out.push_back(r);
    }
    return out;
}

// Income 5000, expenses 4000: savings rate 20%, no savings goal
const Balance kHealthy = BalanceCalculator::compute(5000.0, 4000.0);

} // namespace

TEST_CASE("Balance calculation", "[RecommendationEngine]") {
    auto b = BalanceCalculator::compute(4000.0, 3800.0);
    REQUIRE_THAT(b.balance, WithinAbs(200.0, 1e-12));
    REQUIRE_THAT(b.savings_rate, WithinAbs(5.0, 1e-9));

    auto none = BalanceCalculator::compute(0.0, 250.0);
    REQUIRE(none.savings_rate == 0.0);
    REQUIRE(none.balance == -250.0);
}

TEST_CASE("Over-budget alerts", "[RecommendationEngine]") {
    RecommendationEngine engine(family_config());

    std::vector<ComparisonRow> rows = {
        BudgetComparator::make_row("Food", "Groceries", 500.0, 600.0),
        BudgetComparator::make_row("Entertainment", "Cinema", 40.0, 70.0),
        BudgetComparator::make_row("Pets", "Grooming", 0.0, 30.0),
        BudgetComparator::make_row("Housing", "Electricity", 100.0, 100.0),
    };

    auto report = engine.recommend(rows, kHealthy);
    REQUIRE(report.success);

    auto alerts = of_kind(report, RecommendationKind::OVER_BUDGET);
    REQUIRE(alerts.size() == 3);

    SECTION("Half of the overspend is suggested") {
        REQUIRE(alerts[0].category == "Food");
        REQUIRE(alerts[0].subcategory == "Groceries");
        REQUIRE_THAT(alerts[0].suggested_amount, WithinAbs(50.0, 1e-12));
        REQUIRE(to_string(alerts[0].kind) == "Over Budget Alert");
    }

    SECTION("Priority follows the overspend ratio") {
        REQUIRE(alerts[0].priority == Priority::MEDIUM);  // 20% over
        REQUIRE(alerts[1].priority == Priority::HIGH);    // 75% over
        REQUIRE(alerts[2].priority == Priority::HIGH);    // no plan at all
        REQUIRE_THAT(alerts[2].suggested_amount, WithinAbs(15.0, 1e-12));
    }
}

TEST_CASE("Optimization opportunities", "[RecommendationEngine]") {
    RecommendationEngine engine(family_config());

    std::vector<ComparisonRow> rows = {
        BudgetComparator::make_row("Housing", "Other Housing Expenses", 1200.0, 1200.0),
        BudgetComparator::make_row("Insurance", "Health Insurance", 250.0, 250.0),
        BudgetComparator::make_row("Food", "Groceries", 500.0, 450.0),
        BudgetComparator::make_row("Food", "Dining Out & Catering", 150.0, 120.0),
        BudgetComparator::make_row("Transportation", "Fuel/Gasoline", 200.0, 120.0),
        BudgetComparator::make_row("Entertainment", "Cinema", 50.0, 40.0),
        BudgetComparator::make_row("Pets", "Pet Toys", 30.0, 0.0),
    };

    auto report = engine.recommend(rows, kHealthy);
    auto opportunities = of_kind(report, RecommendationKind::OPTIMIZATION);

    REQUIRE(opportunities.size() == 3);

    SECTION("Largest non-essential lines, ties in comparator order") {
        REQUIRE(opportunities[0].subcategory == "Groceries");
        REQUIRE(opportunities[1].subcategory == "Dining Out & Catering");
        REQUIRE(opportunities[2].subcategory == "Fuel/Gasoline");
    }

    SECTION("Fifteen percent of actual spending is suggested") {
        REQUIRE_THAT(opportunities[0].suggested_amount, WithinAbs(67.5, 1e-9));
        REQUIRE_THAT(opportunities[1].suggested_amount, WithinAbs(18.0, 1e-9));
        REQUIRE(opportunities[0].priority == Priority::MEDIUM);
    }

    SECTION("Essential categories are never suggested") {
        for (const auto& r : opportunities) {
            REQUIRE(r.category != "Housing");
            REQUIRE(r.category != "Insurance");
        }
    }

    SECTION("Total potential savings sums every suggestion") {
        REQUIRE(report.recommendations.size() == 3);
        REQUIRE_THAT(report.total_potential_savings, WithinAbs(67.5 + 18.0 + 18.0, 1e-9));
    }
}

TEST_CASE("Rows with no spending are not candidates", "[RecommendationEngine]") {
    RecommendationEngine engine(family_config());

    std::vector<ComparisonRow> rows = {
        BudgetComparator::make_row("Pets", "Pet Toys", 30.0, 0.0),
        BudgetComparator::make_row("Housing", "Electricity", 100.0, 90.0),
    };

    auto report = engine.recommend(rows, kHealthy);
    REQUIRE(report.success);
    REQUIRE(report.recommendations.empty());
    REQUIRE(report.total_potential_savings == 0.0);
}

TEST_CASE("Savings goal", "[RecommendationEngine]") {
    RecommendationEngine engine(family_config());
    std::vector<ComparisonRow> rows = {
        BudgetComparator::make_row("Housing", "Electricity", 100.0, 100.0),
    };

    SECTION("Below target") {
        auto report = engine.recommend(rows, BalanceCalculator::compute(4000.0, 3800.0));
        auto goals = of_kind(report, RecommendationKind::SAVINGS_GOAL);

        REQUIRE(goals.size() == 1);
        REQUIRE(goals[0].category == "Savings");
        REQUIRE(goals[0].priority == Priority::HIGH);
        REQUIRE_THAT(goals[0].suggested_amount, WithinAbs(200.0, 1e-9));
        REQUIRE_THAT(report.current_savings_rate, WithinAbs(5.0, 1e-9));
    }

    SECTION("Exactly on target") {
        auto report = engine.recommend(rows, BalanceCalculator::compute(4000.0, 3600.0));
        REQUIRE(of_kind(report, RecommendationKind::SAVINGS_GOAL).empty());
    }

    SECTION("No income") {
        auto report = engine.recommend(rows, BalanceCalculator::compute(0.0, 100.0));
        auto goals = of_kind(report, RecommendationKind::SAVINGS_GOAL);
        REQUIRE(goals.size() == 1);
        REQUIRE(report.current_savings_rate == 0.0);
        REQUIRE(goals[0].suggested_amount >= 0.0);
    }

    SECTION("Configured target") {
        RecommendationConfig config = family_config();
        config.savings_target_pct = 50.0;
        RecommendationEngine strict(config);

        auto report = strict.recommend(rows, BalanceCalculator::compute(1000.0, 700.0));
        auto goals = of_kind(report, RecommendationKind::SAVINGS_GOAL);
        REQUIRE(goals.size() == 1);
        REQUIRE_THAT(goals[0].suggested_amount, WithinAbs(200.0, 1e-9));
    }
}

TEST_CASE("No budget configured", "[RecommendationEngine]") {
    RecommendationEngine engine(family_config());

    auto report = engine.recommend({}, BalanceCalculator::compute(1000.0, 950.0));

    REQUIRE_FALSE(report.success);
    REQUIRE(report.error == AnalyticsError::NO_BUDGET_CONFIGURED);
    REQUIRE(report.recommendations.empty());
    REQUIRE_FALSE(report.message.empty());
}

TEST_CASE("RecommendationConfig", "[RecommendationEngine]") {
    SECTION("Default essential set") {
        RecommendationConfig config;
        REQUIRE(config.essential_categories == std::set<std::string>{"Housing", "Insurance", "Loans"});

        std::vector<ComparisonRow> rows = {
            BudgetComparator::make_row("Housing", "Other Housing Expenses", 1500.0, 1400.0),
        };

        RecommendationEngine engine;
        auto report = engine.recommend(rows, kHealthy);
        REQUIRE(report.success);
        REQUIRE(of_kind(report, RecommendationKind::OPTIMIZATION).empty());
    }

    SECTION("Empty list in JSON clears the essential set") {
        auto config = RecommendationConfig::from_json({{"essential_categories", nlohmann::json::array()}});
        REQUIRE(config.essential_categories.empty());
    }

    SECTION("From JSON") {
        auto config = RecommendationConfig::from_json(
            {{"reduction_fraction", 0.2}, {"top_n", 5}, {"essential_categories", nlohmann::json::array({"Taxes"})}});
        REQUIRE(config.reduction_fraction == 0.2);
        REQUIRE(config.top_n == 5);
        REQUIRE(config.savings_target_pct == 10.0);
        REQUIRE(config.essential_categories == std::set<std::string>{"Taxes"});
    }

    SECTION("Invalid values") {
        REQUIRE_THROWS_AS(RecommendationConfig::from_json({{"reduction_fraction", 1.5}}), std::invalid_argument);
        REQUIRE_THROWS_AS(RecommendationConfig::from_json({{"top_n", -1}}), std::invalid_argument);
        REQUIRE_THROWS_AS(RecommendationConfig::from_json({{"savings_target_pct", 120.0}}), std::invalid_argument);
    }
}
