/**
 * @file analytics_engine.hpp
 * @brief Caller-facing facade over the analytics components.
 *
 * Reads snapshots from a TransactionSource, aggregates them and hands the
 * result to the forecaster, anomaly detector, budget comparator and
 * recommendation engine. Trailing windows are anchored at the date
 * returned by the injected clock.
 */

#ifndef BUDGET_ANALYTICS_ANALYTICS_ENGINE_HPP
#define BUDGET_ANALYTICS_ANALYTICS_ENGINE_HPP

#include "analytics/aggregator.hpp"
#include "analytics/anomaly_detector.hpp"
#include "analytics/balance_calculator.hpp"
#include "analytics/budget_comparator.hpp"
#include "analytics/forecaster.hpp"
#include "analytics/recommendation_engine.hpp"
#include "data/data_loader.hpp"
#include "data/transaction_source.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace budget
{
    namespace analytics
    {

        /**
         * @class AnalyticsEngine
         * @brief Per-owner analytics over a read-only transaction source.
         *
         * Usage:
         * @code
         *   data::InMemoryTransactionSource source;
         *   DataLoader::load_into(source, "expenses.csv", "income.csv", "budget.csv");
         *
         *   AnalyticsEngine engine(source, AnalyticsConfig::defaults());
         *   auto forecast = engine.forecast(owner_id);
         *   auto anomalies = engine.detect_anomalies(owner_id, 2.5);
         *   auto advice = engine.recommend(owner_id, 3, 2024);
         * @endcode
         *
         * The engine keeps a reference to the source, which must outlive it.
         *
         * Thread safety: All methods are const; safe for concurrent use as
         * long as the source is not mutated.
         */
        class AnalyticsEngine
        {
        public:
            using Clock = std::function<data::Date()>;

            /**
             * @param source Expense, income and budget snapshots.
             * @param config Component parameters; validated here.
             * @param clock Supplies "today"; the system local date by default.
             * @throws std::invalid_argument If config fails validation or clock is empty.
             */
            AnalyticsEngine(const data::TransactionSource &source,
                            const AnalyticsConfig &config = AnalyticsConfig::defaults(),
                            Clock clock = &data::Date::today);

            ~AnalyticsEngine() = default;

            // ----------------------------------------------------------------
            // Core operations
            // ----------------------------------------------------------------

            /**
             * @brief Forecast next month from the trailing forecast window.
             * @param category Restrict to one category; all categories otherwise.
             */
            ForecastResult forecast(int owner_id,
                                    const std::optional<std::string> &category = std::nullopt) const;

            /**
             * @brief Scan the trailing anomaly window with the configured threshold.
             */
            AnomalyReport detect_anomalies(int owner_id) const;

            /**
             * @brief Scan the trailing anomaly window with an explicit threshold.
             * @throws std::invalid_argument If threshold <= 0.
             */
            AnomalyReport detect_anomalies(int owner_id, double threshold) const;

            /**
             * @brief Budget-vs-actual rows for one month, one per budget entry.
             * @return Empty if the owner has no budget for that month.
             * @throws std::invalid_argument If month is outside 1-12.
             */
            std::vector<ComparisonRow> compare_budget(int owner_id, int month, int year) const;

            /**
             * @brief compare_budget() rolled up to one row per category.
             */
            std::vector<ComparisonRow> compare_budget_by_category(int owner_id, int month, int year) const;

            /**
             * @brief Savings recommendations for one month.
             * @return success = false with NO_BUDGET_CONFIGURED if no budget exists.
             */
            RecommendationReport recommend(int owner_id, int month, int year) const;

            // ----------------------------------------------------------------
            // Reporting helpers
            // ----------------------------------------------------------------

            /**
             * @brief Income, expenses and savings rate of one month.
             */
            Balance monthly_balance(int owner_id, int month, int year) const;

            /**
             * @brief Total spending per calendar month, oldest first.
             *
             * Covers the `months` months ending with the current month; months
             * without spending appear with a zero total.
             *
             * @throws std::invalid_argument If months < 1.
             */
            std::vector<PeriodTotal> monthly_trend(int owner_id, int months = 6) const;

            /**
             * @brief Spending per category in one month, category ascending.
             */
            std::vector<CategoryTotal> expense_summary(int owner_id, int month, int year) const;

            data::Date today() const { return clock_(); }

            const AnalyticsConfig &config() const { return config_; }

        private:
            const data::TransactionSource &source_;
            AnalyticsConfig config_;
            Clock clock_;

            Forecaster forecaster_;
            AnomalyDetector detector_;
            RecommendationEngine recommender_;
        };

    } // namespace analytics
} // namespace budget

#endif // BUDGET_ANALYTICS_ANALYTICS_ENGINE_HPP
