/**
 * @file balance_calculator.cpp
 * @brief Implementation of the BalanceCalculator.
 */

#include "analytics/balance_calculator.hpp"
#include "analytics/statistics.hpp"

#include <iomanip>
#include <iostream>

namespace budget
{
    namespace analytics
    {

        Balance BalanceCalculator::compute(double income_total, double expense_total)
        {
            Balance b;
            b.income_total = income_total;
            b.expense_total = expense_total;
            b.balance = income_total - expense_total;
            b.savings_rate = safe_ratio(b.balance, income_total) * 100.0;
            return b;
        }

        void Balance::print_summary() const
        {
            std::cout << "\n=== Monthly Balance ===\n";
            std::cout << std::fixed << std::setprecision(2);
            std::cout << "Total income:   " << income_total << "\n";
            std::cout << "Total expenses: " << expense_total << "\n";
            std::cout << "Balance:        " << balance << "\n";
            std::cout << "Savings rate:   " << std::setprecision(1) << savings_rate << "%\n";
        }

    } // namespace analytics
} // namespace budget
