/**
 * @file anomaly_detector.hpp
 * @brief Z-score detection of unusual individual expenses.
 *
 * Each category is tested independently against its own sample of raw
 * transactions. A category is skipped when it has fewer than
 * min_transactions rows or when its population standard deviation is
 * exactly zero. A transaction is flagged when
 *
 *   z = |amount - mean| / std > threshold   (strict)
 *
 * and is reported with the expected range mean +/- range_sigma * std.
 * Flagged transactions are sorted by amount descending; ties keep the
 * order of the input.
 */

#ifndef BUDGET_ANALYTICS_ANOMALY_DETECTOR_HPP
#define BUDGET_ANALYTICS_ANOMALY_DETECTOR_HPP

#include "analytics/analytics_error.hpp"
#include "data/transaction.hpp"

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace budget
{
    namespace analytics
    {

        /**
         * @struct AnomalyConfig
         * @brief Parameters of the anomaly test.
         */
        struct AnomalyConfig
        {
            int lookback_months = 3;      ///< Trailing calendar months sampled
            double threshold = 2.0;       ///< Default z-score threshold
            int min_transactions = 5;     ///< Minimum sample per category
            double range_sigma = 2.0;     ///< Half-width of the expected range in std devs
            double high_severity_z = 3.0; ///< z above which severity is High

            static AnomalyConfig from_json(const nlohmann::json &j);

            nlohmann::json to_json() const;

            /**
             * @throws std::invalid_argument On non-positive threshold or window,
             *         or a minimum sample below 2.
             */
            void validate() const;
        };

        /**
         * @enum Severity
         * @brief How far outside the category's usual range a transaction lies.
         */
        enum class Severity
        {
            MEDIUM, ///< threshold < z <= high_severity_z
            HIGH    ///< z > high_severity_z
        };

        /** @brief "Medium" or "High". */
        std::string to_string(Severity severity);

        /**
         * @struct ExpectedRange
         * @brief Interval [lower, upper] of usual amounts for a category.
         */
        struct ExpectedRange
        {
            double lower = 0.0;
            double upper = 0.0;

            std::string to_string() const;
        };

        /**
         * @struct Anomaly
         * @brief A flagged transaction.
         */
        struct Anomaly
        {
            int transaction_id = 0;
            std::string category;
            std::string subcategory;
            double amount = 0.0;
            data::Date date;
            std::string description;
            ExpectedRange expected_range;
            double deviation = 0.0; ///< z-score
            Severity severity = Severity::MEDIUM;
        };

        /**
         * @struct CategoryBaseline
         * @brief Sample statistics of a category that passed the size and variance checks.
         */
        struct CategoryBaseline
        {
            std::string category;
            double mean = 0.0;
            double std_dev = 0.0;
            int sample_size = 0;
        };

        /**
         * @struct AnomalyReport
         * @brief Outcome of an anomaly scan.
         *
         * success is false only when the scanned transaction set was empty.
         */
        struct AnomalyReport
        {
            bool success = false;
            AnalyticsError error = AnalyticsError::NONE;
            std::string message;
            int anomalies_found = 0;
            std::vector<Anomaly> anomalies;
            std::vector<CategoryBaseline> baselines; ///< Category ascending

            void print_summary() const;
        };

        /**
         * @class AnomalyDetector
         * @brief Per-category z-score outlier detector.
         *
         * Usage:
         * @code
         *   AnomalyDetector detector;
         *   auto report = detector.detect(last_three_months_expenses, 2.5);
         * @endcode
         *
         * Thread safety: Instances are immutable after construction.
         */
        class AnomalyDetector
        {
        public:
            explicit AnomalyDetector(const AnomalyConfig &config = AnomalyConfig());

            /**
             * @brief Scan with the configured threshold.
             */
            AnomalyReport detect(const std::vector<data::Transaction> &transactions) const;

            /**
             * @brief Scan with an explicit threshold.
             * @param transactions Raw expenses of one owner within the lookback window.
             * @param threshold z-score threshold; must be positive.
             * @throws std::invalid_argument If threshold <= 0.
             */
            AnomalyReport detect(const std::vector<data::Transaction> &transactions,
                                 double threshold) const;

            const AnomalyConfig &config() const { return config_; }

        private:
            AnomalyConfig config_;
        };

    } // namespace analytics
} // namespace budget

#endif // BUDGET_ANALYTICS_ANOMALY_DETECTOR_HPP
