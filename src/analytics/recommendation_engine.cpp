/**
 * @file recommendation_engine.cpp
 * @brief Implementation of the RecommendationEngine.
 */

#include "analytics/recommendation_engine.hpp"
#include "analytics/statistics.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace budget
{
    namespace analytics
    {

        namespace
        {
            std::string format_amount(double value)
            {
                std::ostringstream ss;
                ss << "$" << std::fixed << std::setprecision(2) << value;
                return ss.str();
            }

            std::string line_name(const ComparisonRow &row)
            {
                return row.subcategory.empty() ? row.category : row.category + " - " + row.subcategory;
            }
        } // namespace

        // ===================================================================
        // RecommendationConfig
        // ===================================================================

        RecommendationConfig RecommendationConfig::from_json(const nlohmann::json &j)
        {
            RecommendationConfig config;
            config.reduction_fraction = j.value("reduction_fraction", 0.15);
            config.top_n = j.value("top_n", 3);
            config.savings_target_pct = j.value("savings_target_pct", 10.0);
            config.high_priority_overspend_ratio = j.value("high_priority_overspend_ratio", 0.5);

            if (j.contains("essential_categories"))
            {
                config.essential_categories.clear();
                for (const auto &name : j.at("essential_categories").get<std::vector<std::string>>())
                {
                    config.essential_categories.insert(name);
                }
            }

            config.validate();
            return config;
        }

        nlohmann::json RecommendationConfig::to_json() const
        {
            return nlohmann::json{
                {"reduction_fraction", reduction_fraction},
                {"top_n", top_n},
                {"savings_target_pct", savings_target_pct},
                {"high_priority_overspend_ratio", high_priority_overspend_ratio},
                {"essential_categories", std::vector<std::string>(essential_categories.begin(),
                                                                  essential_categories.end())}};
        }

        void RecommendationConfig::validate() const
        {
            if (reduction_fraction < 0.0 || reduction_fraction > 1.0)
            {
                throw std::invalid_argument(
                    "recommendation.reduction_fraction must be in [0, 1], got: " + std::to_string(reduction_fraction));
            }
            if (top_n < 0)
            {
                throw std::invalid_argument(
                    "recommendation.top_n must be non-negative, got: " + std::to_string(top_n));
            }
            if (savings_target_pct < 0.0 || savings_target_pct > 100.0)
            {
                throw std::invalid_argument(
                    "recommendation.savings_target_pct must be in [0, 100], got: " + std::to_string(savings_target_pct));
            }
            if (high_priority_overspend_ratio < 0.0)
            {
                throw std::invalid_argument(
                    "recommendation.high_priority_overspend_ratio must be non-negative, got: " +
                    std::to_string(high_priority_overspend_ratio));
            }
        }

        std::string to_string(RecommendationKind kind)
        {
            switch (kind)
            {
            case RecommendationKind::OVER_BUDGET:
                return "Over Budget Alert";
            case RecommendationKind::OPTIMIZATION:
                return "Optimization Opportunity";
            case RecommendationKind::SAVINGS_GOAL:
                return "Savings Goal";
            }
            return "Unknown";
        }

        std::string to_string(Priority priority)
        {
            switch (priority)
            {
            case Priority::HIGH:
                return "High";
            case Priority::MEDIUM:
                return "Medium";
            case Priority::LOW:
                return "Low";
            }
            return "Unknown";
        }

        // ===================================================================
        // RecommendationReport
        // ===================================================================

        void RecommendationReport::print_summary() const
        {
            std::cout << "\n=== Savings Recommendations ===\n";

            if (!success)
            {
                std::cout << message << "\n";
                return;
            }

            std::cout << "Potential monthly savings: " << format_amount(total_potential_savings) << "\n";
            std::cout << "Current savings rate:      " << std::fixed << std::setprecision(1)
                      << current_savings_rate << "%\n";
            std::cout << std::string(60, '-') << "\n";

            for (const auto &r : recommendations)
            {
                std::cout << "[" << to_string(r.priority) << "] " << to_string(r.kind)
                          << ": " << r.category << "\n";
                std::cout << "    " << r.message << "\n";
                std::cout << "    " << r.suggestion << "\n";
            }
        }

        // ===================================================================
        // RecommendationEngine
        // ===================================================================

        RecommendationEngine::RecommendationEngine(const RecommendationConfig &config)
            : config_(config)
        {
            config_.validate();
        }

        RecommendationReport RecommendationEngine::recommend(const std::vector<ComparisonRow> &rows,
                                                             const Balance &balance) const
        {
            RecommendationReport report;
            report.current_savings_rate = balance.savings_rate;

            if (rows.empty())
            {
                report.error = AnalyticsError::NO_BUDGET_CONFIGURED;
                report.message = "Please set up a budget for this month first to get recommendations";
                return report;
            }

            add_over_budget_alerts(rows, report.recommendations);
            add_optimization_opportunities(rows, report.recommendations);
            add_savings_goal(balance, report.recommendations);

            for (const auto &r : report.recommendations)
            {
                report.total_potential_savings += r.suggested_amount;
            }

            report.success = true;
            report.message = "Generated " + std::to_string(report.recommendations.size()) + " recommendations";
            return report;
        }

        void RecommendationEngine::add_over_budget_alerts(const std::vector<ComparisonRow> &rows,
                                                          std::vector<Recommendation> &out) const
        {
            for (const auto &row : rows)
            {
                if (!(row.actual_amount > row.planned_amount))
                    continue;

                double overspend = row.actual_amount - row.planned_amount;

                // No plan at all counts as an unbounded overspend ratio
                bool high = row.planned_amount == 0.0 ||
                            overspend / row.planned_amount > config_.high_priority_overspend_ratio;

                Recommendation r;
                r.category = row.category;
                r.subcategory = row.subcategory;
                r.kind = RecommendationKind::OVER_BUDGET;
                r.priority = high ? Priority::HIGH : Priority::MEDIUM;
                r.suggested_amount = overspend / 2.0;
                r.message = "You're over budget in " + line_name(row) + " by " + format_amount(overspend);
                r.suggestion = "Try to reduce spending here by " + format_amount(r.suggested_amount) +
                               " next month";
                out.push_back(r);
            }
        }

        void RecommendationEngine::add_optimization_opportunities(const std::vector<ComparisonRow> &rows,
                                                                  std::vector<Recommendation> &out) const
        {
            std::vector<ComparisonRow> candidates;
            for (const auto &row : rows)
            {
                if (config_.essential_categories.count(row.category))
                    continue;
                if (row.actual_amount <= 0.0)
                    continue;
                candidates.push_back(row);
            }

            std::stable_sort(candidates.begin(), candidates.end(),
                             [](const ComparisonRow &lhs, const ComparisonRow &rhs)
                             { return lhs.actual_amount > rhs.actual_amount; });

            size_t limit = std::min(candidates.size(), static_cast<size_t>(config_.top_n));
            for (size_t i = 0; i < limit; ++i)
            {
                const auto &row = candidates[i];

                Recommendation r;
                r.category = row.category;
                r.subcategory = row.subcategory;
                r.kind = RecommendationKind::OPTIMIZATION;
                r.priority = Priority::MEDIUM;
                r.suggested_amount = row.actual_amount * config_.reduction_fraction;

                std::ostringstream pct;
                pct << std::fixed << std::setprecision(0) << config_.reduction_fraction * 100.0 << "%";

                r.message = line_name(row) + " is one of your largest expenses at " +
                            format_amount(row.actual_amount);
                r.suggestion = "Reducing it by " + pct.str() + " would save " +
                               format_amount(r.suggested_amount) + " per month";
                out.push_back(r);
            }
        }

        void RecommendationEngine::add_savings_goal(const Balance &balance,
                                                    std::vector<Recommendation> &out) const
        {
            if (!(balance.savings_rate < config_.savings_target_pct))
                return;

            double target = balance.income_total * config_.savings_target_pct / 100.0;

            Recommendation r;
            r.category = "Savings";
            r.kind = RecommendationKind::SAVINGS_GOAL;
            r.priority = Priority::HIGH;
            r.suggested_amount = std::max(0.0, target - balance.balance);

            std::ostringstream rates;
            rates << std::fixed << std::setprecision(1) << balance.savings_rate << "%, below the "
                  << config_.savings_target_pct << "% target";

            r.message = "Your savings rate is " + rates.str();
            r.suggestion = "Set aside an additional " + format_amount(r.suggested_amount) +
                           " per month to reach the target";
            out.push_back(r);
        }

    } // namespace analytics
} // namespace budget
