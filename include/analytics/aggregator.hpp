/**
 * @file aggregator.hpp
 * @brief Time-bucketed aggregation of expense transactions.
 *
 * Groups raw expenses into per-month, per-category (optionally
 * per-subcategory) sums and counts. Every other analytics component
 * consumes either this monthly series or the per-category transaction
 * index produced here.
 *
 * Output series are ordered ascending by period, then category, then
 * subcategory. An empty match is an empty series, never an error.
 */

#ifndef BUDGET_ANALYTICS_AGGREGATOR_HPP
#define BUDGET_ANALYTICS_AGGREGATOR_HPP

#include "data/period.hpp"
#include "data/transaction.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace budget
{
    namespace analytics
    {

        /**
         * @enum GroupBy
         * @brief Granularity of the aggregation key below the period.
         */
        enum class GroupBy
        {
            CATEGORY,   ///< Key is (period, category)
            SUBCATEGORY ///< Key is (period, category, subcategory)
        };

        /**
         * @struct AggregationQuery
         * @brief Which transactions to aggregate and how to key them.
         */
        struct AggregationQuery
        {
            int owner_id = 0;
            std::optional<std::string> category; ///< Restrict to one category if set
            data::DateRange range;               ///< Inclusive date window
            GroupBy group_by = GroupBy::CATEGORY;

            /**
             * @brief One calendar month.
             * @throws std::invalid_argument If month is outside 1-12.
             */
            static AggregationQuery for_month(int owner_id, int month, int year);

            /**
             * @brief The N calendar months ending with the anchor's month.
             * @throws std::invalid_argument If months < 1.
             */
            static AggregationQuery trailing(int owner_id, int months, const data::Date &anchor);

            bool matches(const data::Transaction &transaction) const;
        };

        /**
         * @struct MonthlyAggregate
         * @brief One bucket of a monthly series.
         */
        struct MonthlyAggregate
        {
            data::YearMonth period;
            std::string category;
            std::string subcategory; ///< Empty unless grouped by SUBCATEGORY
            double total_amount = 0.0;
            int count = 0;
        };

        using MonthlySeries = std::vector<MonthlyAggregate>;

        /**
         * @struct CategoryTotal
         * @brief Total spending of one category across a series.
         */
        struct CategoryTotal
        {
            std::string category;
            double total_amount = 0.0;
            int count = 0;
        };

        /**
         * @struct PeriodTotal
         * @brief Total spending of one month across all categories.
         */
        struct PeriodTotal
        {
            data::YearMonth period;
            double total_amount = 0.0;
            int count = 0;
        };

        /**
         * @class Aggregator
         * @brief Stateless grouping of transactions into monthly buckets.
         *
         * Usage:
         * @code
         *   auto query = AggregationQuery::trailing(owner, 6, Date::today());
         *   MonthlySeries series = Aggregator::aggregate(expenses, query);
         * @endcode
         *
         * Thread safety: All methods are static and pure.
         */
        class Aggregator
        {
        public:
            /**
             * @brief Sum and count the transactions matching a query.
             * @param transactions Raw expenses; rows outside the query are ignored.
             * @param query Owner, window, optional category and key granularity.
             * @return Series ordered by (period, category, subcategory).
             */
            static MonthlySeries aggregate(const std::vector<data::Transaction> &transactions,
                                           const AggregationQuery &query);

            /**
             * @brief Positions of transactions grouped by category.
             * @return Category (ascending) -> indices into transactions, in input order.
             */
            static std::map<std::string, std::vector<size_t>> index_by_category(
                const std::vector<data::Transaction> &transactions);

            /**
             * @brief Collapse a series to per-category totals, category ascending.
             */
            static std::vector<CategoryTotal> category_totals(const MonthlySeries &series);

            /**
             * @brief Collapse a series to per-month totals, period ascending.
             */
            static std::vector<PeriodTotal> period_totals(const MonthlySeries &series);

            /**
             * @brief Distinct categories in a series, ascending.
             */
            static std::vector<std::string> categories(const MonthlySeries &series);
        };

    } // namespace analytics
} // namespace budget

#endif // BUDGET_ANALYTICS_AGGREGATOR_HPP
