/**
 * @file transaction.cpp
 * @brief Boundary validation for transaction records
 */

#include "data/transaction.hpp"
#include <cmath>
#include <stdexcept>

namespace budget {
namespace data {

void Transaction::validate() const
{
    if (!std::isfinite(amount) || amount <= 0.0)
    {
        throw std::invalid_argument(
            "Expense amount must be positive, got: " + std::to_string(amount) +
            " (id " + std::to_string(id) + ")");
    }
    if (category.empty())
    {
        throw std::invalid_argument("Expense category cannot be empty (id " + std::to_string(id) + ")");
    }
}

void IncomeRecord::validate() const
{
    if (!std::isfinite(amount) || amount <= 0.0)
    {
        throw std::invalid_argument(
            "Income amount must be positive, got: " + std::to_string(amount) +
            " (id " + std::to_string(id) + ")");
    }
    if (source.empty())
    {
        throw std::invalid_argument("Income source cannot be empty (id " + std::to_string(id) + ")");
    }
}

void BudgetEntry::validate() const
{
    if (!std::isfinite(planned_amount) || planned_amount < 0.0)
    {
        throw std::invalid_argument(
            "Planned amount must be non-negative, got: " + std::to_string(planned_amount) +
            " for " + category + "/" + subcategory);
    }
    if (month < 1 || month > 12)
    {
        throw std::invalid_argument("Budget month must be in 1-12, got: " + std::to_string(month));
    }
    if (category.empty())
    {
        throw std::invalid_argument("Budget category cannot be empty");
    }
}

} // namespace data
} // namespace budget
