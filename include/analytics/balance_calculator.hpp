/**
 * @file balance_calculator.hpp
 * @brief Monthly income, expenses and savings rate.
 */

#ifndef BUDGET_ANALYTICS_BALANCE_CALCULATOR_HPP
#define BUDGET_ANALYTICS_BALANCE_CALCULATOR_HPP

namespace budget
{
    namespace analytics
    {

        /**
         * @struct Balance
         * @brief Income against expenses for one period.
         */
        struct Balance
        {
            double income_total = 0.0;
            double expense_total = 0.0;
            double balance = 0.0;      ///< income_total - expense_total
            double savings_rate = 0.0; ///< balance / income_total * 100, 0 without income

            void print_summary() const;
        };

        /**
         * @class BalanceCalculator
         * @brief Derives Balance from period totals.
         */
        class BalanceCalculator
        {
        public:
            static Balance compute(double income_total, double expense_total);
        };

    } // namespace analytics
} // namespace budget

#endif // BUDGET_ANALYTICS_BALANCE_CALCULATOR_HPP
