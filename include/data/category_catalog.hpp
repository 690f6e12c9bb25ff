/**
 * @file category_catalog.hpp
 * @brief Expense category taxonomy
 *
 * Provides the mapping from expense categories to their subcategories,
 * the set of essential (non-discretionary) categories and the list of
 * income sources. The analytics layer has no compiled-in knowledge of
 * the taxonomy; it receives the essential set from here via configuration.
 */

#ifndef BUDGET_DATA_CATEGORY_CATALOG_HPP
#define BUDGET_DATA_CATEGORY_CATALOG_HPP

#include <set>
#include <string>
#include <utility>
#include <vector>
#include <unordered_map>
#include <nlohmann/json.hpp>

namespace budget {
namespace data {

/**
 * @class CategoryCatalog
 * @brief Category -> subcategory taxonomy with essential-category flags
 *
 * Purpose:
 * - Hold the user-facing list of expense categories and subcategories.
 * - Flag categories excluded from "reduce spending" suggestions.
 * - List the income sources offered when recording income.
 *
 * Thread safety:
 * - Instances are safe for concurrent read-only access after construction.
 *
 * Usage example:
 * @code
 * // CSV rows are: category,subcategory
 * auto catalog = CategoryCatalog::from_csv("data/config/categories.csv");
 * bool known = catalog.contains("Food", "Groceries");
 * @endcode
 */
class CategoryCatalog {
public:
    using CategoryList = std::vector<std::pair<std::string, std::vector<std::string>>>;

    /**
     * @brief Default constructor
     * Creates an empty catalog.
     */
    CategoryCatalog() = default;

    /**
     * @brief Construct from an ordered category list
     * @param categories Category names with their subcategories, in display order
     * @param essential Names of essential categories (each must be listed in categories)
     * @param income_sources Income source names
     * @throws std::invalid_argument on empty or duplicate names, or unknown essential categories
     */
    CategoryCatalog(const CategoryList& categories,
                    const std::set<std::string>& essential = {},
                    const std::vector<std::string>& income_sources = {});

    /**
     * @brief Factory: create catalog from CSV file
     * @param filepath Path to CSV file where each row is: category,subcategory
     * @param delimiter Field delimiter (default: ',')
     * @return CategoryCatalog with no essential categories
     * @throws std::runtime_error on IO errors or if no rows are found
     */
    static CategoryCatalog from_csv(const std::string& filepath, char delimiter = ',');

    /**
     * @brief Factory: create catalog from JSON
     * @param j JSON object with format:
     *        {"categories": {"Food": ["Groceries", ...], ...},
     *         "essential": ["Housing"], "income_sources": ["Salary"]}
     * @throws std::invalid_argument on missing fields
     */
    static CategoryCatalog from_json(const nlohmann::json& j);

    /**
     * @brief The family budget taxonomy shipped with the application
     *
     * Twelve categories; Housing, Insurance and Loans are essential.
     */
    static CategoryCatalog default_catalog();

    /**
     * @brief Category names in insertion order
     */
    const std::vector<std::string>& get_categories() const { return category_names_; }

    /**
     * @brief Subcategories of a category
     * @throws std::out_of_range if category not present
     */
    const std::vector<std::string>& get_subcategories(const std::string& category) const;

    /**
     * @brief Check whether a category (and optionally a subcategory of it) exists
     */
    bool contains(const std::string& category, const std::string& subcategory = "") const;

    const std::set<std::string>& essential_categories() const { return essential_; }

    bool is_essential(const std::string& category) const { return essential_.count(category) > 0; }

    const std::vector<std::string>& income_sources() const { return income_sources_; }

    /**
     * @brief Serialize catalog to JSON (same shape as from_json)
     */
    nlohmann::json to_json() const;

    size_t size() const { return category_names_.size(); }

    bool empty() const { return category_names_.empty(); }

private:
    std::vector<std::string> category_names_;                                   ///< Categories in order
    std::unordered_map<std::string, std::vector<std::string>> subcategories_;   ///< Category -> subcategories
    std::set<std::string> essential_;                                           ///< Essential categories
    std::vector<std::string> income_sources_;                                   ///< Income sources
};

} // namespace data
} // namespace budget

#endif // BUDGET_DATA_CATEGORY_CATALOG_HPP
