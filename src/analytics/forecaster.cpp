/**
 * @file forecaster.cpp
 * @brief Implementation of the Forecaster.
 */

#include "analytics/forecaster.hpp"
#include "analytics/statistics.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <stdexcept>

namespace budget
{
    namespace analytics
    {

        // ===================================================================
        // ForecastConfig
        // ===================================================================

        ForecastConfig ForecastConfig::from_json(const nlohmann::json &j)
        {
            ForecastConfig config;
            config.lookback_months = j.value("lookback_months", 6);
            config.min_history_months = j.value("min_history_months", 3);
            config.min_points_per_category = j.value("min_points_per_category", 2);
            config.moving_average_window = j.value("moving_average_window", 3);
            config.confidence_scale = j.value("confidence_scale", 20.0);
            config.validate();
            return config;
        }

        nlohmann::json ForecastConfig::to_json() const
        {
            return nlohmann::json{
                {"lookback_months", lookback_months},
                {"min_history_months", min_history_months},
                {"min_points_per_category", min_points_per_category},
                {"moving_average_window", moving_average_window},
                {"confidence_scale", confidence_scale}};
        }

        void ForecastConfig::validate() const
        {
            if (lookback_months < 1)
            {
                throw std::invalid_argument(
                    "forecast.lookback_months must be >= 1, got: " + std::to_string(lookback_months));
            }
            if (min_history_months < 1)
            {
                throw std::invalid_argument(
                    "forecast.min_history_months must be >= 1, got: " + std::to_string(min_history_months));
            }
            if (min_points_per_category < 1)
            {
                throw std::invalid_argument(
                    "forecast.min_points_per_category must be >= 1, got: " + std::to_string(min_points_per_category));
            }
            if (moving_average_window < 1)
            {
                throw std::invalid_argument(
                    "forecast.moving_average_window must be >= 1, got: " + std::to_string(moving_average_window));
            }
            if (confidence_scale < 0.0)
            {
                throw std::invalid_argument(
                    "forecast.confidence_scale must be non-negative, got: " + std::to_string(confidence_scale));
            }
        }

        std::string to_string(Trend trend)
        {
            return trend == Trend::INCREASING ? "increasing" : "decreasing";
        }

        // ===================================================================
        // ForecastResult
        // ===================================================================

        void ForecastResult::print_summary() const
        {
            std::cout << "\n=== Next Month Forecast ===\n";

            if (!success)
            {
                std::cout << "Forecast unavailable: " << message << "\n";
                return;
            }

            std::cout << "Analysis period: " << analysis_period << "\n";
            std::cout << std::string(78, '-') << "\n";
            std::cout << std::left << std::setw(24) << "Category"
                      << std::right << std::setw(14) << "Predicted"
                      << std::setw(16) << "Hist. Average"
                      << std::setw(12) << "Trend"
                      << std::setw(12) << "Confidence" << "\n";
            std::cout << std::string(78, '-') << "\n";

            for (const auto &entry : predictions)
            {
                const auto &p = entry.second;
                std::cout << std::left << std::setw(24) << p.category
                          << std::right << std::fixed << std::setprecision(2)
                          << std::setw(14) << p.predicted_amount
                          << std::setw(16) << p.historical_average
                          << std::setw(12) << to_string(p.trend)
                          << std::setw(11) << std::setprecision(1) << p.confidence << "%\n";
            }

            std::cout << std::string(78, '-') << "\n";
            std::cout << "Total predicted: " << std::fixed << std::setprecision(2)
                      << total_predicted << "\n";
        }

        // ===================================================================
        // Forecaster
        // ===================================================================

        Forecaster::Forecaster(const ForecastConfig &config)
            : config_(config)
        {
            config_.validate();
        }

        ForecastResult Forecaster::forecast(const MonthlySeries &series,
                                            const std::optional<std::string> &category) const
        {
            std::set<std::string> scope;
            if (category)
            {
                scope.insert(*category);
            }
            else
            {
                for (const auto &name : Aggregator::categories(series))
                {
                    scope.insert(name);
                }
            }

            return forecast_categories(series, scope);
        }

        CategoryForecast Forecaster::forecast_category(const std::string &category,
                                                       const std::vector<double> &amounts) const
        {
            if (amounts.empty())
            {
                throw std::invalid_argument("Cannot forecast category '" + category + "' without data");
            }

            Eigen::VectorXd y = to_eigen(amounts);
            const Eigen::Index n = y.size();
            const Eigen::Index window = std::min<Eigen::Index>(config_.moving_average_window, n);

            CategoryForecast f;
            f.category = category;
            f.months_analyzed = static_cast<int>(n);
            f.moving_average = y.tail(window).mean();
            f.slope = ols_slope(y);
            f.historical_average = mean(y);
            f.predicted_amount = f.moving_average + f.slope;
            f.trend = f.slope > 0.0 ? Trend::INCREASING : Trend::DECREASING;

            if (f.moving_average == 0.0)
            {
                f.confidence = 0.0;
            }
            else
            {
                double dispersion = safe_ratio(population_variance(y), f.moving_average);
                f.confidence = clamp(100.0 - dispersion * config_.confidence_scale, 0.0, 100.0);
            }

            return f;
        }

        ForecastResult Forecaster::forecast_categories(const MonthlySeries &series,
                                                       const std::set<std::string> &scope) const
        {
            ForecastResult result;

            // category -> period index -> amount; folds subcategory rows together
            std::map<std::string, std::map<int, double>> by_category;
            std::set<int> periods;

            for (const auto &row : series)
            {
                if (!scope.count(row.category))
                    continue;
                by_category[row.category][row.period.index()] += row.total_amount;
                periods.insert(row.period.index());
            }

            if (!periods.empty())
            {
                result.analysis_period = data::YearMonth::from_index(*periods.begin()).to_string() +
                                         " to " +
                                         data::YearMonth::from_index(*periods.rbegin()).to_string();
            }

            if (static_cast<int>(periods.size()) < config_.min_history_months)
            {
                result.error = AnalyticsError::INSUFFICIENT_HISTORY;
                result.message = "Need at least " + std::to_string(config_.min_history_months) +
                                 " months of expense data for predictions (found " +
                                 std::to_string(periods.size()) + ")";
                return result;
            }

            for (const auto &entry : by_category)
            {
                if (static_cast<int>(entry.second.size()) < config_.min_points_per_category)
                    continue;

                std::vector<double> amounts;
                amounts.reserve(entry.second.size());
                for (const auto &point : entry.second)
                {
                    amounts.push_back(point.second);
                }

                CategoryForecast f = forecast_category(entry.first, amounts);
                result.total_predicted += f.predicted_amount;
                result.predictions.emplace(entry.first, f);
            }

            if (result.predictions.empty())
            {
                result.error = AnalyticsError::INSUFFICIENT_HISTORY;
                result.message = "No category has at least " +
                                 std::to_string(config_.min_points_per_category) +
                                 " months of expense data";
                return result;
            }

            result.success = true;
            result.message = "Predictions generated for " + std::to_string(result.predictions.size()) +
                             " categor" + (result.predictions.size() == 1 ? "y" : "ies");
            return result;
        }

    } // namespace analytics
} // namespace budget
