/**
 * @file transaction_source.hpp
 * @brief Read-only interface to the persistence layer
 *
 * The analytics layer never owns transaction storage. It reads immutable
 * snapshots through this interface, filtered by owner and period, and
 * computes everything else on demand.
 *
 * Thread Safety: Implementations must be safe for concurrent read-only
 * calls and must hand out consistent snapshots.
 */

#pragma once

#include "data/period.hpp"
#include "data/transaction.hpp"
#include <string>
#include <vector>

namespace budget
{
    namespace data
    {

        /**
         * @class TransactionSource
         * @brief Abstract base class for transaction, income and budget queries
         *
         * Usage Example:
         * @code
         * InMemoryTransactionSource source;
         * source.add_expense(expense);
         * auto rows = source.expenses(owner_id, DateRange::month(YearMonth(2024, 3)));
         * @endcode
         */
        class TransactionSource
        {
        public:
            virtual ~TransactionSource() = default;

            /**
             * @brief Expenses of one owner whose date falls in range
             * @param owner_id Owner account
             * @param range Closed date interval
             * @return Expense rows in recording order
             */
            virtual std::vector<Transaction> expenses(
                int owner_id, const DateRange &range) const = 0;

            /**
             * @brief Budget plan of one owner for one month
             * @return Entries for (owner_id, month, year), one per subcategory
             */
            virtual std::vector<BudgetEntry> budget_entries(
                int owner_id, int month, int year) const = 0;

            /**
             * @brief Sum of income of one owner whose date falls in range
             */
            virtual double income_total(
                int owner_id, const DateRange &range) const = 0;
        };

        /**
         * @struct BudgetCopyResult
         * @brief Outcome of copying one month's plan into the following month
         */
        struct BudgetCopyResult
        {
            bool success = false;
            std::string message;
            int entries_copied = 0;
            YearMonth target;
        };

        /**
         * @class InMemoryTransactionSource
         * @brief Vector-backed TransactionSource used by the CLI and tests
         *
         * Enforces the collaborator-side invariants: amounts must be positive,
         * planned amounts non-negative, and budget entries are upserted on
         * (owner_id, category, subcategory, month, year).
         *
         * Mutating operations are not thread-safe.
         */
        class InMemoryTransactionSource : public TransactionSource
        {
        public:
            InMemoryTransactionSource() = default;
            ~InMemoryTransactionSource() override = default;

            /**
             * @brief Record an expense
             * @param expense Expense row; an id of 0 is replaced by the next free id
             * @return Id under which the expense is stored
             * @throws std::invalid_argument if the expense fails validation
             */
            int add_expense(const Transaction &expense);

            /**
             * @brief Record an income entry
             * @return Id under which the income is stored
             * @throws std::invalid_argument if the income fails validation
             */
            int add_income(const IncomeRecord &income);

            /**
             * @brief Insert or replace a budget entry
             * @return true if an existing entry was replaced
             * @throws std::invalid_argument if the entry fails validation
             */
            bool set_budget(const BudgetEntry &entry);

            /**
             * @brief Copy every budget entry of (month, year) into the next month
             *
             * Entries already present in the target month are overwritten.
             * December rolls into January of the following year.
             *
             * @return success = false when the source month has no budget
             * @throws std::invalid_argument if month is outside 1-12
             */
            BudgetCopyResult copy_budget_to_next_month(int owner_id, int month, int year);

            std::vector<Transaction> expenses(
                int owner_id, const DateRange &range) const override;

            std::vector<BudgetEntry> budget_entries(
                int owner_id, int month, int year) const override;

            double income_total(
                int owner_id, const DateRange &range) const override;

            size_t num_expenses() const { return expenses_.size(); }
            size_t num_income() const { return income_.size(); }
            size_t num_budget_entries() const { return budgets_.size(); }

            /** @brief All stored expenses regardless of owner or date */
            const std::vector<Transaction> &all_expenses() const { return expenses_; }

        private:
            std::vector<Transaction> expenses_;
            std::vector<IncomeRecord> income_;
            std::vector<BudgetEntry> budgets_;
            int next_expense_id_ = 1;
            int next_income_id_ = 1;
        };

    } // namespace data
} // namespace budget
