/**
 * @file forecaster.hpp
 * @brief Next-month spending forecast from a trailing monthly series.
 *
 * The forecast for a category is a moving average of its most recent
 * months plus the least-squares trend over every month in the window:
 *
 *   prediction = mean(last k amounts) + slope(all amounts)
 *   confidence = clamp(100 - variance / MA * scale, 0, 100)
 *
 * where k = min(moving_average_window, points) and variance is the
 * population variance of all amounts. A zero moving average yields zero
 * confidence. The trend label is "increasing" only for a strictly positive
 * slope; a flat series is labelled "decreasing".
 *
 * Single-category and all-category requests run through the same routine
 * over a set of categories.
 */

#ifndef BUDGET_ANALYTICS_FORECASTER_HPP
#define BUDGET_ANALYTICS_FORECASTER_HPP

#include "analytics/aggregator.hpp"
#include "analytics/analytics_error.hpp"

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace budget
{
    namespace analytics
    {

        /**
         * @struct ForecastConfig
         * @brief Parameters of the forecasting heuristic.
         */
        struct ForecastConfig
        {
            int lookback_months = 6;         ///< Trailing calendar months fed to the forecaster
            int min_history_months = 3;      ///< Distinct months required in the requested scope
            int min_points_per_category = 2; ///< Categories with fewer points are skipped
            int moving_average_window = 3;   ///< Most recent months averaged for the baseline
            double confidence_scale = 20.0;  ///< Multiplier on variance / MA

            /**
             * @brief Create configuration from JSON, defaulting missing fields.
             */
            static ForecastConfig from_json(const nlohmann::json &j);

            nlohmann::json to_json() const;

            /**
             * @throws std::invalid_argument If any count is < 1 or the scale is negative.
             */
            void validate() const;
        };

        /**
         * @enum Trend
         * @brief Direction of the least-squares slope.
         */
        enum class Trend
        {
            INCREASING, ///< slope > 0
            DECREASING  ///< slope <= 0
        };

        /** @brief "increasing" or "decreasing". */
        std::string to_string(Trend trend);

        /**
         * @struct CategoryForecast
         * @brief Forecast for one category.
         */
        struct CategoryForecast
        {
            std::string category;
            double predicted_amount = 0.0;
            double confidence = 0.0;         ///< Always in [0, 100]
            double historical_average = 0.0; ///< Mean of every month analysed
            double moving_average = 0.0;
            double slope = 0.0;
            Trend trend = Trend::DECREASING;
            int months_analyzed = 0;
        };

        /**
         * @struct ForecastResult
         * @brief Per-category forecasts plus their total.
         */
        struct ForecastResult
        {
            bool success = false;
            AnalyticsError error = AnalyticsError::NONE;
            std::string message;
            std::map<std::string, CategoryForecast> predictions; ///< Keyed by category
            double total_predicted = 0.0;
            std::string analysis_period; ///< "YYYY-MM to YYYY-MM", empty if no data

            /**
             * @brief Print a prediction table to stdout.
             */
            void print_summary() const;
        };

        /**
         * @class Forecaster
         * @brief Moving-average-plus-trend forecaster.
         *
         * Usage:
         * @code
         *   Forecaster forecaster;
         *   auto result = forecaster.forecast(series);           // all categories
         *   auto food = forecaster.forecast(series, "Food");     // one category
         * @endcode
         *
         * Thread safety: Instances are immutable after construction.
         */
        class Forecaster
        {
        public:
            explicit Forecaster(const ForecastConfig &config = ForecastConfig());

            /**
             * @brief Forecast next month's spending.
             * @param series Monthly series at CATEGORY or SUBCATEGORY granularity.
             * @param category Restrict to one category; all categories otherwise.
             * @return Result with success = false and INSUFFICIENT_HISTORY when the
             *         scope spans fewer than min_history_months distinct months or
             *         no category has enough points.
             */
            ForecastResult forecast(const MonthlySeries &series,
                                    const std::optional<std::string> &category = std::nullopt) const;

            /**
             * @brief Forecast one category from its chronologically ordered amounts.
             * @throws std::invalid_argument If amounts is empty.
             */
            CategoryForecast forecast_category(const std::string &category,
                                               const std::vector<double> &amounts) const;

            const ForecastConfig &config() const { return config_; }

        private:
            ForecastResult forecast_categories(const MonthlySeries &series,
                                               const std::set<std::string> &scope) const;

            ForecastConfig config_;
        };

    } // namespace analytics
} // namespace budget

#endif // BUDGET_ANALYTICS_FORECASTER_HPP
