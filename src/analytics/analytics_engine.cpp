/**
 * @file analytics_engine.cpp
 * @brief Implementation of the AnalyticsEngine facade.
 */

#include "analytics/analytics_engine.hpp"

#include <map>
#include <stdexcept>
#include <utility>

namespace budget
{
    namespace analytics
    {

        AnalyticsEngine::AnalyticsEngine(const data::TransactionSource &source,
                                         const AnalyticsConfig &config,
                                         Clock clock)
            : source_(source),
              config_(config),
              clock_(std::move(clock)),
              forecaster_(config.forecast),
              detector_(config.anomaly),
              recommender_(config.recommendation)
        {
            config_.validate();

            if (!clock_)
            {
                throw std::invalid_argument("AnalyticsEngine requires a clock");
            }
        }

        // ===================================================================
        // Core operations
        // ===================================================================

        ForecastResult AnalyticsEngine::forecast(int owner_id,
                                                 const std::optional<std::string> &category) const
        {
            auto query = AggregationQuery::trailing(owner_id, config_.forecast.lookback_months, today());
            auto expenses = source_.expenses(owner_id, query.range);

            MonthlySeries series = Aggregator::aggregate(expenses, query);
            return forecaster_.forecast(series, category);
        }

        AnomalyReport AnalyticsEngine::detect_anomalies(int owner_id) const
        {
            return detect_anomalies(owner_id, config_.anomaly.threshold);
        }

        AnomalyReport AnalyticsEngine::detect_anomalies(int owner_id, double threshold) const
        {
            auto range = data::DateRange::trailing_months(today(), config_.anomaly.lookback_months);
            return detector_.detect(source_.expenses(owner_id, range), threshold);
        }

        std::vector<ComparisonRow> AnalyticsEngine::compare_budget(int owner_id, int month, int year) const
        {
            auto query = AggregationQuery::for_month(owner_id, month, year);
            query.group_by = GroupBy::SUBCATEGORY;

            auto budget = source_.budget_entries(owner_id, month, year);
            if (budget.empty())
            {
                return {};
            }

            MonthlySeries actuals = Aggregator::aggregate(source_.expenses(owner_id, query.range), query);
            return BudgetComparator::compare(budget, actuals);
        }

        std::vector<ComparisonRow> AnalyticsEngine::compare_budget_by_category(int owner_id, int month, int year) const
        {
            return BudgetComparator::rollup_by_category(compare_budget(owner_id, month, year));
        }

        RecommendationReport AnalyticsEngine::recommend(int owner_id, int month, int year) const
        {
            auto rows = compare_budget(owner_id, month, year);
            return recommender_.recommend(rows, monthly_balance(owner_id, month, year));
        }

        // ===================================================================
        // Reporting helpers
        // ===================================================================

        Balance AnalyticsEngine::monthly_balance(int owner_id, int month, int year) const
        {
            auto range = data::DateRange::month(data::YearMonth(year, month));

            double spent = 0.0;
            for (const auto &t : source_.expenses(owner_id, range))
            {
                spent += t.amount;
            }

            return BalanceCalculator::compute(source_.income_total(owner_id, range), spent);
        }

        std::vector<PeriodTotal> AnalyticsEngine::monthly_trend(int owner_id, int months) const
        {
            auto query = AggregationQuery::trailing(owner_id, months, today());
            auto observed = Aggregator::period_totals(
                Aggregator::aggregate(source_.expenses(owner_id, query.range), query));

            std::map<int, PeriodTotal> by_index;
            for (const auto &p : observed)
            {
                by_index[p.period.index()] = p;
            }

            std::vector<PeriodTotal> trend;
            data::YearMonth first = query.range.start.year_month();
            for (int i = 0; i < months; ++i)
            {
                data::YearMonth period = first.plus_months(i);

                auto it = by_index.find(period.index());
                if (it != by_index.end())
                {
                    trend.push_back(it->second);
                }
                else
                {
                    PeriodTotal empty;
                    empty.period = period;
                    trend.push_back(empty);
                }
            }

            return trend;
        }

        std::vector<CategoryTotal> AnalyticsEngine::expense_summary(int owner_id, int month, int year) const
        {
            auto query = AggregationQuery::for_month(owner_id, month, year);
            return Aggregator::category_totals(
                Aggregator::aggregate(source_.expenses(owner_id, query.range), query));
        }

    } // namespace analytics
} // namespace budget
