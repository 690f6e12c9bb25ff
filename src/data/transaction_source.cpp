/**
 * @file transaction_source.cpp
 * @brief Implementation of InMemoryTransactionSource
 */

#include "data/transaction_source.hpp"
#include <algorithm>

namespace budget
{
    namespace data
    {

        int InMemoryTransactionSource::add_expense(const Transaction &expense)
        {
            expense.validate();

            Transaction stored = expense;
            if (stored.id <= 0)
            {
                stored.id = next_expense_id_;
            }
            next_expense_id_ = std::max(next_expense_id_, stored.id) + 1;

            expenses_.push_back(stored);
            return stored.id;
        }

        int InMemoryTransactionSource::add_income(const IncomeRecord &income)
        {
            income.validate();

            IncomeRecord stored = income;
            if (stored.id <= 0)
            {
                stored.id = next_income_id_;
            }
            next_income_id_ = std::max(next_income_id_, stored.id) + 1;

            income_.push_back(stored);
            return stored.id;
        }

        bool InMemoryTransactionSource::set_budget(const BudgetEntry &entry)
        {
            entry.validate();

            auto it = std::find_if(budgets_.begin(), budgets_.end(),
                                   [&entry](const BudgetEntry &b)
                                   {
                                       return b.owner_id == entry.owner_id &&
                                              b.category == entry.category &&
                                              b.subcategory == entry.subcategory &&
                                              b.month == entry.month &&
                                              b.year == entry.year;
                                   });

            if (it != budgets_.end())
            {
                it->planned_amount = entry.planned_amount;
                return true;
            }

            budgets_.push_back(entry);
            return false;
        }

        BudgetCopyResult InMemoryTransactionSource::copy_budget_to_next_month(
            int owner_id, int month, int year)
        {
            YearMonth source_month(year, month);

            BudgetCopyResult result;
            result.target = source_month.plus_months(1);

            auto entries = budget_entries(owner_id, month, year);
            if (entries.empty())
            {
                result.message = "No budget found for " + source_month.to_string();
                return result;
            }

            for (auto entry : entries)
            {
                entry.month = result.target.month;
                entry.year = result.target.year;
                set_budget(entry);
                ++result.entries_copied;
            }

            result.success = true;
            result.message = "Copied " + std::to_string(result.entries_copied) +
                             " budget entries to " + result.target.to_string();
            return result;
        }

        std::vector<Transaction> InMemoryTransactionSource::expenses(
            int owner_id, const DateRange &range) const
        {
            std::vector<Transaction> out;
            for (const auto &e : expenses_)
            {
                if (e.owner_id == owner_id && range.contains(e.occurred_on))
                    out.push_back(e);
            }
            return out;
        }

        std::vector<BudgetEntry> InMemoryTransactionSource::budget_entries(
            int owner_id, int month, int year) const
        {
            std::vector<BudgetEntry> out;
            for (const auto &b : budgets_)
            {
                if (b.owner_id == owner_id && b.month == month && b.year == year)
                    out.push_back(b);
            }
            return out;
        }

        double InMemoryTransactionSource::income_total(
            int owner_id, const DateRange &range) const
        {
            double total = 0.0;
            for (const auto &i : income_)
            {
                if (i.owner_id == owner_id && range.contains(i.occurred_on))
                    total += i.amount;
            }
            return total;
        }

    } // namespace data
} // namespace budget
