/**
 * @file recommendation_engine.hpp
 * @brief Savings suggestions derived from a budget comparison.
 *
 * Three independent rule passes, concatenated without de-duplication:
 *
 * 1. Over-budget alert for every row with actual > planned; suggests
 *    cutting half of the overspend. High priority when the overspend
 *    exceeds high_priority_overspend_ratio of the plan (or the plan is 0).
 * 2. Optimization opportunity for the top_n rows by actual spending
 *    outside the essential categories; suggests cutting
 *    reduction_fraction of the actual amount.
 * 3. Savings-rate goal when the savings rate is below savings_target_pct;
 *    suggests the extra amount needed to reach the target, never negative.
 */

#ifndef BUDGET_ANALYTICS_RECOMMENDATION_ENGINE_HPP
#define BUDGET_ANALYTICS_RECOMMENDATION_ENGINE_HPP

#include "analytics/analytics_error.hpp"
#include "analytics/balance_calculator.hpp"
#include "analytics/budget_comparator.hpp"

#include <set>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace budget
{
    namespace analytics
    {

        /**
         * @struct RecommendationConfig
         * @brief Rule parameters
         */
        struct RecommendationConfig
        {
            double reduction_fraction = 0.15;           ///< Share of actual spending suggested as a cut
            int top_n = 3;                              ///< Optimization candidates considered
            double savings_target_pct = 10.0;           ///< Target savings rate in percent
            double high_priority_overspend_ratio = 0.5; ///< overspend / planned above this is High
            std::set<std::string> essential_categories = {"Housing", "Insurance", "Loans"}; ///< Excluded from optimization suggestions

            /**
             * @brief Create configuration from JSON, defaulting missing fields.
             *
             * "essential_categories", when present, replaces the default set.
             */
            static RecommendationConfig from_json(const nlohmann::json &j);

            nlohmann::json to_json() const;

            /**
             * @throws std::invalid_argument If a fraction is outside [0, 1],
             *         top_n is negative or the target is outside [0, 100].
             */
            void validate() const;
        };

        /**
         * @enum RecommendationKind
         * @brief Rule that produced a recommendation.
         */
        enum class RecommendationKind
        {
            OVER_BUDGET,  ///< Spending exceeded the plan
            OPTIMIZATION, ///< Large discretionary spending
            SAVINGS_GOAL  ///< Savings rate below target
        };

        /**
         * @enum Priority
         * @brief Urgency shown to the owner.
         */
        enum class Priority
        {
            HIGH,
            MEDIUM,
            LOW
        };

        /** @brief "Over Budget Alert", "Optimization Opportunity" or "Savings Goal". */
        std::string to_string(RecommendationKind kind);

        /** @brief "High", "Medium" or "Low". */
        std::string to_string(Priority priority);

        /**
         * @struct Recommendation
         * @brief One quantified suggestion.
         */
        struct Recommendation
        {
            std::string category;
            std::string subcategory;
            RecommendationKind kind = RecommendationKind::OVER_BUDGET;
            Priority priority = Priority::MEDIUM;
            std::string message;    ///< What was observed
            std::string suggestion; ///< What to do about it
            double suggested_amount = 0.0;
        };

        /**
         * @struct RecommendationReport
         * @brief All recommendations for a month.
         */
        struct RecommendationReport
        {
            bool success = false;
            AnalyticsError error = AnalyticsError::NONE;
            std::string message;
            std::vector<Recommendation> recommendations;
            double total_potential_savings = 0.0; ///< Sum of suggested_amount
            double current_savings_rate = 0.0;

            void print_summary() const;
        };

        /**
         * @class RecommendationEngine
         * @brief Rule-based savings recommendations.
         *
         * Usage:
         * @code
         *   RecommendationEngine engine(config);
         *   auto rows = BudgetComparator::compare(budget, actuals);
         *   auto report = engine.recommend(rows, BalanceCalculator::compute(income, spent));
         * @endcode
         *
         * Thread safety: Instances are immutable after construction.
         */
        class RecommendationEngine
        {
        public:
            explicit RecommendationEngine(const RecommendationConfig &config = RecommendationConfig());

            /**
             * @brief Run all rule passes.
             * @param rows Subcategory-level comparison of the month.
             * @param balance Income and expenses of the same month.
             * @return success = false with NO_BUDGET_CONFIGURED when rows is empty.
             */
            RecommendationReport recommend(const std::vector<ComparisonRow> &rows,
                                           const Balance &balance) const;

            const RecommendationConfig &config() const { return config_; }

        private:
            void add_over_budget_alerts(const std::vector<ComparisonRow> &rows,
                                        std::vector<Recommendation> &out) const;

            void add_optimization_opportunities(const std::vector<ComparisonRow> &rows,
                                                std::vector<Recommendation> &out) const;

            void add_savings_goal(const Balance &balance,
                                  std::vector<Recommendation> &out) const;

            RecommendationConfig config_;
        };

    } // namespace analytics
} // namespace budget

#endif // BUDGET_ANALYTICS_RECOMMENDATION_ENGINE_HPP
