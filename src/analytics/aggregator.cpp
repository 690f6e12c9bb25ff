/**
 * @file aggregator.cpp
 * @brief Implementation of the Aggregator.
 */

#include "analytics/aggregator.hpp"

#include <set>
#include <tuple>

namespace budget
{
    namespace analytics
    {

        // ===================================================================
        // AggregationQuery
        // ===================================================================

        AggregationQuery AggregationQuery::for_month(int owner_id, int month, int year)
        {
            AggregationQuery query;
            query.owner_id = owner_id;
            query.range = data::DateRange::month(data::YearMonth(year, month));
            return query;
        }

        AggregationQuery AggregationQuery::trailing(int owner_id, int months, const data::Date &anchor)
        {
            AggregationQuery query;
            query.owner_id = owner_id;
            query.range = data::DateRange::trailing_months(anchor, months);
            return query;
        }

        bool AggregationQuery::matches(const data::Transaction &transaction) const
        {
            if (transaction.owner_id != owner_id)
                return false;
            if (!range.contains(transaction.occurred_on))
                return false;
            if (category && transaction.category != *category)
                return false;
            return true;
        }

        // ===================================================================
        // Aggregator
        // ===================================================================

        MonthlySeries Aggregator::aggregate(const std::vector<data::Transaction> &transactions,
                                            const AggregationQuery &query)
        {
            // (period index, category, subcategory) keeps the required output order
            using Key = std::tuple<int, std::string, std::string>;
            std::map<Key, MonthlyAggregate> buckets;

            for (const auto &t : transactions)
            {
                if (!query.matches(t))
                    continue;

                data::YearMonth period = t.occurred_on.year_month();
                std::string sub = query.group_by == GroupBy::SUBCATEGORY ? t.subcategory : std::string();
                Key key(period.index(), t.category, sub);

                auto it = buckets.find(key);
                if (it == buckets.end())
                {
                    MonthlyAggregate bucket;
                    bucket.period = period;
                    bucket.category = t.category;
                    bucket.subcategory = sub;
                    it = buckets.emplace(key, bucket).first;
                }

                it->second.total_amount += t.amount;
                it->second.count += 1;
            }

            MonthlySeries series;
            series.reserve(buckets.size());
            for (const auto &entry : buckets)
            {
                series.push_back(entry.second);
            }
            return series;
        }

        std::map<std::string, std::vector<size_t>> Aggregator::index_by_category(
            const std::vector<data::Transaction> &transactions)
        {
            std::map<std::string, std::vector<size_t>> index;
            for (size_t i = 0; i < transactions.size(); ++i)
            {
                index[transactions[i].category].push_back(i);
            }
            return index;
        }

        std::vector<CategoryTotal> Aggregator::category_totals(const MonthlySeries &series)
        {
            std::map<std::string, CategoryTotal> totals;
            for (const auto &row : series)
            {
                auto &t = totals[row.category];
                t.category = row.category;
                t.total_amount += row.total_amount;
                t.count += row.count;
            }

            std::vector<CategoryTotal> out;
            out.reserve(totals.size());
            for (const auto &entry : totals)
            {
                out.push_back(entry.second);
            }
            return out;
        }

        std::vector<PeriodTotal> Aggregator::period_totals(const MonthlySeries &series)
        {
            std::map<int, PeriodTotal> totals;
            for (const auto &row : series)
            {
                auto &t = totals[row.period.index()];
                t.period = row.period;
                t.total_amount += row.total_amount;
                t.count += row.count;
            }

            std::vector<PeriodTotal> out;
            out.reserve(totals.size());
            for (const auto &entry : totals)
            {
                out.push_back(entry.second);
            }
            return out;
        }

        std::vector<std::string> Aggregator::categories(const MonthlySeries &series)
        {
            std::set<std::string> names;
            for (const auto &row : series)
            {
                names.insert(row.category);
            }
            return std::vector<std::string>(names.begin(), names.end());
        }

    } // namespace analytics
} // namespace budget
