/**
 * @file statistics.hpp
 * @brief Descriptive statistics shared by the forecaster and anomaly detector.
 *
 * Population (divide by n) moments and an ordinary least-squares slope
 * against a 0-based index. Every division by a quantity that can be zero
 * goes through safe_ratio(), so no NaN or Inf is produced for finite input.
 */

#ifndef BUDGET_ANALYTICS_STATISTICS_HPP
#define BUDGET_ANALYTICS_STATISTICS_HPP

#include <Eigen/Dense>
#include <vector>

namespace budget
{
    namespace analytics
    {

        /**
         * @brief Copy a std::vector into an Eigen vector.
         */
        Eigen::VectorXd to_eigen(const std::vector<double> &values);

        /**
         * @brief Arithmetic mean.
         * @throws std::invalid_argument If values is empty.
         */
        double mean(const Eigen::VectorXd &values);

        /**
         * @brief Population variance, sum((x - mean)^2) / n.
         * @throws std::invalid_argument If values is empty.
         */
        double population_variance(const Eigen::VectorXd &values);

        /**
         * @brief Square root of population_variance().
         */
        double population_std_dev(const Eigen::VectorXd &values);

        /**
         * @brief OLS slope of values regressed on x = 0, 1, ..., n-1.
         * @return Slope per index step; 0.0 for fewer than 2 values.
         */
        double ols_slope(const Eigen::VectorXd &values);

        /**
         * @brief numerator / denominator, or fallback when denominator is 0.
         */
        double safe_ratio(double numerator, double denominator, double fallback = 0.0);

        /**
         * @brief Clamp value into [lower, upper].
         */
        double clamp(double value, double lower, double upper);

    } // namespace analytics
} // namespace budget

#endif // BUDGET_ANALYTICS_STATISTICS_HPP
