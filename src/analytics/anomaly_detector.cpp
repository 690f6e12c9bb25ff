/**
 * @file anomaly_detector.cpp
 * @brief Implementation of the AnomalyDetector.
 */

#include "analytics/anomaly_detector.hpp"
#include "analytics/aggregator.hpp"
#include "analytics/statistics.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace budget
{
    namespace analytics
    {

        // ===================================================================
        // AnomalyConfig
        // ===================================================================

        AnomalyConfig AnomalyConfig::from_json(const nlohmann::json &j)
        {
            AnomalyConfig config;
            config.lookback_months = j.value("lookback_months", 3);
            config.threshold = j.value("threshold", 2.0);
            config.min_transactions = j.value("min_transactions", 5);
            config.range_sigma = j.value("range_sigma", 2.0);
            config.high_severity_z = j.value("high_severity_z", 3.0);
            config.validate();
            return config;
        }

        nlohmann::json AnomalyConfig::to_json() const
        {
            return nlohmann::json{
                {"lookback_months", lookback_months},
                {"threshold", threshold},
                {"min_transactions", min_transactions},
                {"range_sigma", range_sigma},
                {"high_severity_z", high_severity_z}};
        }

        void AnomalyConfig::validate() const
        {
            if (lookback_months < 1)
            {
                throw std::invalid_argument(
                    "anomaly.lookback_months must be >= 1, got: " + std::to_string(lookback_months));
            }
            if (threshold <= 0.0)
            {
                throw std::invalid_argument(
                    "anomaly.threshold must be positive, got: " + std::to_string(threshold));
            }
            if (min_transactions < 2)
            {
                throw std::invalid_argument(
                    "anomaly.min_transactions must be >= 2, got: " + std::to_string(min_transactions));
            }
            if (range_sigma < 0.0)
            {
                throw std::invalid_argument(
                    "anomaly.range_sigma must be non-negative, got: " + std::to_string(range_sigma));
            }
        }

        std::string to_string(Severity severity)
        {
            return severity == Severity::HIGH ? "High" : "Medium";
        }

        std::string ExpectedRange::to_string() const
        {
            std::ostringstream ss;
            ss << std::fixed << std::setprecision(2) << lower << " - " << upper;
            return ss.str();
        }

        // ===================================================================
        // AnomalyReport
        // ===================================================================

        void AnomalyReport::print_summary() const
        {
            std::cout << "\n=== Unusual Spending ===\n";

            if (!success)
            {
                std::cout << message << "\n";
                return;
            }

            std::cout << message << "\n";
            if (anomalies.empty())
            {
                return;
            }

            std::cout << std::string(86, '-') << "\n";
            for (const auto &a : anomalies)
            {
                std::cout << std::left << std::setw(12) << a.date.to_string()
                          << std::setw(20) << a.category
                          << std::setw(24) << a.subcategory
                          << std::right << std::fixed << std::setprecision(2)
                          << std::setw(12) << a.amount
                          << "  z=" << a.deviation
                          << "  " << to_string(a.severity) << "\n";
                std::cout << "    expected range: " << a.expected_range.to_string() << "\n";
            }
            std::cout << std::string(86, '-') << "\n";
        }

        // ===================================================================
        // AnomalyDetector
        // ===================================================================

        AnomalyDetector::AnomalyDetector(const AnomalyConfig &config)
            : config_(config)
        {
            config_.validate();
        }

        AnomalyReport AnomalyDetector::detect(const std::vector<data::Transaction> &transactions) const
        {
            return detect(transactions, config_.threshold);
        }

        AnomalyReport AnomalyDetector::detect(const std::vector<data::Transaction> &transactions,
                                              double threshold) const
        {
            if (!(threshold > 0.0))
            {
                throw std::invalid_argument(
                    "Anomaly threshold must be positive, got: " + std::to_string(threshold));
            }

            AnomalyReport report;

            if (transactions.empty())
            {
                report.error = AnalyticsError::NO_TRANSACTIONS;
                report.message = "No transactions found in the last " +
                                 std::to_string(config_.lookback_months) + " months";
                return report;
            }

            // (input position, anomaly) so ties on amount keep input order
            std::vector<std::pair<size_t, Anomaly>> flagged;

            for (const auto &group : Aggregator::index_by_category(transactions))
            {
                const auto &rows = group.second;
                if (static_cast<int>(rows.size()) < config_.min_transactions)
                    continue;

                Eigen::VectorXd amounts(static_cast<Eigen::Index>(rows.size()));
                for (size_t i = 0; i < rows.size(); ++i)
                {
                    amounts(static_cast<Eigen::Index>(i)) = transactions[rows[i]].amount;
                }

                double mu = mean(amounts);
                double sigma = population_std_dev(amounts);
                if (sigma == 0.0)
                    continue;

                report.baselines.push_back({group.first, mu, sigma, static_cast<int>(rows.size())});

                for (size_t pos : rows)
                {
                    const auto &t = transactions[pos];
                    double z = std::abs(t.amount - mu) / sigma;
                    if (!(z > threshold))
                        continue;

                    Anomaly a;
                    a.transaction_id = t.id;
                    a.category = t.category;
                    a.subcategory = t.subcategory;
                    a.amount = t.amount;
                    a.date = t.occurred_on;
                    a.description = t.description;
                    a.expected_range.lower = mu - config_.range_sigma * sigma;
                    a.expected_range.upper = mu + config_.range_sigma * sigma;
                    a.deviation = z;
                    a.severity = z > config_.high_severity_z ? Severity::HIGH : Severity::MEDIUM;

                    flagged.emplace_back(pos, a);
                }
            }

            std::sort(flagged.begin(), flagged.end(),
                      [](const std::pair<size_t, Anomaly> &lhs, const std::pair<size_t, Anomaly> &rhs)
                      {
                          if (lhs.second.amount != rhs.second.amount)
                              return lhs.second.amount > rhs.second.amount;
                          return lhs.first < rhs.first;
                      });

            report.anomalies.reserve(flagged.size());
            for (auto &entry : flagged)
            {
                report.anomalies.push_back(std::move(entry.second));
            }

            report.success = true;
            report.anomalies_found = static_cast<int>(report.anomalies.size());
            report.message = report.anomalies_found > 0
                                 ? "Found " + std::to_string(report.anomalies_found) + " unusual transaction(s)"
                                 : "No unusual spending detected";
            return report;
        }

    } // namespace analytics
} // namespace budget
