/**
 * @file budget_comparator.cpp
 * @brief Implementation of the BudgetComparator.
 */

#include "analytics/budget_comparator.hpp"
#include "analytics/statistics.hpp"

#include <iomanip>
#include <iostream>
#include <map>
#include <stdexcept>
#include <utility>

namespace budget
{
    namespace analytics
    {

        std::string to_string(BudgetStatus status)
        {
            return status == BudgetStatus::OVER_BUDGET ? "Over Budget" : "On Track";
        }

        std::vector<ComparisonRow> BudgetComparator::compare(const std::vector<data::BudgetEntry> &budget,
                                                             const MonthlySeries &actuals)
        {
            using Key = std::pair<std::string, std::string>;

            std::map<Key, double> spent;
            for (const auto &row : actuals)
            {
                spent[Key(row.category, row.subcategory)] += row.total_amount;
            }

            std::map<Key, double> planned;
            for (size_t i = 0; i < budget.size(); ++i)
            {
                const auto &entry = budget[i];
                if (entry.month != budget.front().month || entry.year != budget.front().year)
                {
                    throw std::invalid_argument(
                        "Budget entries must belong to a single month, found " +
                        budget.front().period().to_string() + " and " + entry.period().to_string());
                }

                Key key(entry.category, entry.subcategory);
                if (!planned.emplace(key, entry.planned_amount).second)
                {
                    throw std::invalid_argument(
                        "Duplicate budget entry for " + entry.category + "/" + entry.subcategory);
                }
            }

            std::vector<ComparisonRow> rows;
            rows.reserve(planned.size());
            for (const auto &entry : planned)
            {
                auto it = spent.find(entry.first);
                double actual = it != spent.end() ? it->second : 0.0;
                rows.push_back(make_row(entry.first.first, entry.first.second, entry.second, actual));
            }
            return rows;
        }

        std::vector<ComparisonRow> BudgetComparator::rollup_by_category(const std::vector<ComparisonRow> &rows)
        {
            std::map<std::string, std::pair<double, double>> totals;
            for (const auto &row : rows)
            {
                auto &t = totals[row.category];
                t.first += row.planned_amount;
                t.second += row.actual_amount;
            }

            std::vector<ComparisonRow> out;
            out.reserve(totals.size());
            for (const auto &entry : totals)
            {
                out.push_back(make_row(entry.first, "", entry.second.first, entry.second.second));
            }
            return out;
        }

        ComparisonRow BudgetComparator::make_row(const std::string &category,
                                                 const std::string &subcategory,
                                                 double planned,
                                                 double actual)
        {
            ComparisonRow row;
            row.category = category;
            row.subcategory = subcategory;
            row.planned_amount = planned;
            row.actual_amount = actual;
            row.difference = planned - actual;
            row.percentage = safe_ratio(actual, planned) * 100.0;
            row.status = actual > planned ? BudgetStatus::OVER_BUDGET : BudgetStatus::ON_TRACK;
            return row;
        }

        BudgetSummary BudgetComparator::summarize(const std::vector<ComparisonRow> &rows)
        {
            BudgetSummary s;
            for (const auto &row : rows)
            {
                s.total_planned += row.planned_amount;
                s.total_actual += row.actual_amount;
                if (row.status == BudgetStatus::OVER_BUDGET)
                    ++s.over_budget_count;
            }
            s.total_difference = s.total_planned - s.total_actual;
            return s;
        }

        void BudgetComparator::print_report(const std::vector<ComparisonRow> &rows, const std::string &title)
        {
            std::cout << "\n=== " << title << " ===\n";

            if (rows.empty())
            {
                std::cout << "No budget set for this period\n";
                return;
            }

            std::cout << std::string(96, '-') << "\n";
            std::cout << std::left << std::setw(22) << "Category"
                      << std::setw(26) << "Subcategory"
                      << std::right << std::setw(11) << "Planned"
                      << std::setw(11) << "Actual"
                      << std::setw(11) << "Diff"
                      << std::setw(14) << "Status" << "\n";
            std::cout << std::string(96, '-') << "\n";

            for (const auto &row : rows)
            {
                std::cout << std::left << std::setw(22) << row.category
                          << std::setw(26) << row.subcategory
                          << std::right << std::fixed << std::setprecision(2)
                          << std::setw(11) << row.planned_amount
                          << std::setw(11) << row.actual_amount
                          << std::setw(11) << row.difference
                          << std::setw(14) << to_string(row.status) << "\n";
            }

            auto s = summarize(rows);
            std::cout << std::string(96, '-') << "\n";
            std::cout << "Planned: " << std::fixed << std::setprecision(2) << s.total_planned
                      << "  Actual: " << s.total_actual
                      << "  Remaining: " << s.total_difference
                      << "  Over budget lines: " << s.over_budget_count << "\n";
        }

    } // namespace analytics
} // namespace budget
