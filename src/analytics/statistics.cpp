/**
 * @file statistics.cpp
 * @brief Implementation of the shared descriptive statistics.
 */

#include "analytics/statistics.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace budget
{
    namespace analytics
    {

        Eigen::VectorXd to_eigen(const std::vector<double> &values)
        {
            Eigen::VectorXd out(static_cast<Eigen::Index>(values.size()));
            for (size_t i = 0; i < values.size(); ++i)
            {
                out(static_cast<Eigen::Index>(i)) = values[i];
            }
            return out;
        }

        double mean(const Eigen::VectorXd &values)
        {
            if (values.size() == 0)
            {
                throw std::invalid_argument("Cannot compute mean of an empty series");
            }
            return values.mean();
        }

        double population_variance(const Eigen::VectorXd &values)
        {
            double mu = mean(values);
            return (values.array() - mu).square().mean();
        }

        double population_std_dev(const Eigen::VectorXd &values)
        {
            return std::sqrt(population_variance(values));
        }

        double ols_slope(const Eigen::VectorXd &values)
        {
            const Eigen::Index n = values.size();
            if (n < 2)
            {
                return 0.0;
            }

            Eigen::VectorXd x = Eigen::VectorXd::LinSpaced(n, 0.0, static_cast<double>(n - 1));
            Eigen::VectorXd x_centered = x.array() - x.mean();
            Eigen::VectorXd y_centered = values.array() - values.mean();

            return safe_ratio(x_centered.dot(y_centered), x_centered.squaredNorm());
        }

        double safe_ratio(double numerator, double denominator, double fallback)
        {
            if (denominator == 0.0)
            {
                return fallback;
            }
            return numerator / denominator;
        }

        double clamp(double value, double lower, double upper)
        {
            return std::max(lower, std::min(upper, value));
        }

    } // namespace analytics
} // namespace budget
