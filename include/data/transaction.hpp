#pragma once

#include <string>
#include <vector>
#include "data/period.hpp"

namespace budget {
namespace data {

/**
 * @struct Transaction
 * @brief A single expense as recorded by the owner.
 *
 * Snapshot handed to the analytics layer by the persistence collaborator.
 * The analytics layer never mutates it.
 */
struct Transaction {
    int id = 0;
    int owner_id = 0;
    std::string category;
    std::string subcategory;
    double amount = 0.0;               ///< Always > 0
    Date occurred_on;
    std::string description;
    std::vector<std::string> tags;

    /**
     * @brief Boundary validation
     * @throws std::invalid_argument if amount <= 0 or category is empty
     */
    void validate() const;
};

/**
 * @struct IncomeRecord
 * @brief Money received by the owner. Income has no subcategory.
 */
struct IncomeRecord {
    int id = 0;
    int owner_id = 0;
    std::string source;
    double amount = 0.0;
    Date occurred_on;
    std::string description;

    void validate() const;
};

/**
 * @struct BudgetEntry
 * @brief Planned spending for one subcategory in one month.
 *
 * At most one entry exists per (owner_id, category, subcategory, month, year).
 */
struct BudgetEntry {
    int owner_id = 0;
    std::string category;
    std::string subcategory;
    double planned_amount = 0.0;       ///< Always >= 0
    int month = 1;
    int year = 1970;

    YearMonth period() const { return YearMonth(year, month); }

    /**
     * @throws std::invalid_argument if planned_amount < 0, the month is
     *         outside 1-12 or category is empty
     */
    void validate() const;
};

} // namespace data
} // namespace budget
