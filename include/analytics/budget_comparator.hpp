/**
 * @file budget_comparator.hpp
 * @brief Budget-vs-actual comparison for one month.
 *
 * The budget plan drives the join: every budgeted (category, subcategory)
 * yields exactly one row, with its actual spending or 0 when nothing was
 * spent. Spending on subcategories without a budget entry is not reported.
 *
 *   difference = planned - actual
 *   percentage = actual / planned * 100   (0 when planned == 0)
 *   status     = OVER_BUDGET if actual > planned, ON_TRACK otherwise
 */

#ifndef BUDGET_ANALYTICS_BUDGET_COMPARATOR_HPP
#define BUDGET_ANALYTICS_BUDGET_COMPARATOR_HPP

#include "analytics/aggregator.hpp"
#include "data/transaction.hpp"

#include <string>
#include <vector>

namespace budget
{
    namespace analytics
    {

        /**
         * @enum BudgetStatus
         * @brief Whether spending stayed within the plan.
         */
        enum class BudgetStatus
        {
            ON_TRACK,   ///< actual <= planned
            OVER_BUDGET ///< actual > planned
        };

        /** @brief "On Track" or "Over Budget". */
        std::string to_string(BudgetStatus status);

        /**
         * @struct ComparisonRow
         * @brief Planned and actual spending of one budget line.
         */
        struct ComparisonRow
        {
            std::string category;
            std::string subcategory; ///< Empty for category-level rollups
            double planned_amount = 0.0;
            double actual_amount = 0.0;
            double difference = 0.0;
            double percentage = 0.0;
            BudgetStatus status = BudgetStatus::ON_TRACK;
        };

        /**
         * @struct BudgetSummary
         * @brief Totals over a set of comparison rows.
         */
        struct BudgetSummary
        {
            double total_planned = 0.0;
            double total_actual = 0.0;
            double total_difference = 0.0;
            int over_budget_count = 0;
        };

        /**
         * @class BudgetComparator
         * @brief Left join of a monthly budget plan against actual spending.
         *
         * Thread safety: All methods are static and pure.
         */
        class BudgetComparator
        {
        public:
            /**
             * @brief Compare a budget plan with aggregated spending.
             * @param budget Entries of one owner for one month.
             * @param actuals Series for the same month, grouped by SUBCATEGORY.
             * @return One row per budget entry, ordered by (category, subcategory).
             * @throws std::invalid_argument If the entries span more than one month
             *         or repeat a (category, subcategory) key.
             */
            static std::vector<ComparisonRow> compare(const std::vector<data::BudgetEntry> &budget,
                                                      const MonthlySeries &actuals);

            /**
             * @brief Sum rows per category and recompute the derived fields.
             * @return One row per category with an empty subcategory, category ascending.
             */
            static std::vector<ComparisonRow> rollup_by_category(const std::vector<ComparisonRow> &rows);

            /**
             * @brief Build a row and derive difference, percentage and status.
             */
            static ComparisonRow make_row(const std::string &category,
                                          const std::string &subcategory,
                                          double planned,
                                          double actual);

            static BudgetSummary summarize(const std::vector<ComparisonRow> &rows);

            /**
             * @brief Print a comparison table to stdout.
             */
            static void print_report(const std::vector<ComparisonRow> &rows, const std::string &title);
        };

    } // namespace analytics
} // namespace budget

#endif // BUDGET_ANALYTICS_BUDGET_COMPARATOR_HPP
