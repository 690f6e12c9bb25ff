/**
 * @file data_loader.hpp
 * @brief Data loading and parsing utilities
 *
 * Provides functionality to load expenses, income and budget plans from
 * CSV files and analytics configuration from JSON files.
 */

#ifndef DATA_LOADER_HPP
#define DATA_LOADER_HPP

#include "data/transaction.hpp"
#include "data/transaction_source.hpp"
#include "analytics/forecaster.hpp"
#include "analytics/anomaly_detector.hpp"
#include "analytics/recommendation_engine.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <cstdint>
#include <fstream>


namespace budget {

/**
 * @struct AnalyticsConfig
 * @brief Complete analytics engine configuration
 *
 * Example configuration:
 * @code{.json}
 * {
 *   "forecast": { "lookback_months": 6 },
 *   "anomaly": { "threshold": 2.5 },
 *   "recommendation": { "reduction_fraction": 0.15 },
 *   "categories": { "essential": ["Housing", "Insurance", "Loans"] }
 * }
 * @endcode
 */
struct AnalyticsConfig {
    analytics::ForecastConfig forecast;
    analytics::AnomalyConfig anomaly;
    analytics::RecommendationConfig recommendation;

    /**
     * @brief Defaults, with the essential set taken from the default category catalog
     */
    static AnalyticsConfig defaults();

    /**
     * @brief Load from JSON object; missing sections keep their defaults
     * @throws std::invalid_argument if a value fails validation
     */
    static AnalyticsConfig from_json(const nlohmann::json& j);

    /**
     * @brief Load complete configuration from JSON file
     */
    static AnalyticsConfig load_from_file(const std::string& config_path);

    nlohmann::json to_json() const;

    void validate() const;
};

/**
 * @struct SyntheticDataset
 * @brief Generated demo data for one owner
 */
struct SyntheticDataset {
    std::vector<data::Transaction> expenses;
    std::vector<data::IncomeRecord> income;
    std::vector<data::BudgetEntry> budget;
};

/**
 * @class DataLoader
 * @brief Loads expenses, income and budgets from CSV files
 *
 * Expected headers:
 * - expenses: id,owner_id,date,category,subcategory,amount,description,tags
 * - income:   id,owner_id,date,source,amount,description
 * - budget:   owner_id,year,month,category,subcategory,planned_amount
 *
 * Rows with an invalid date or a non-positive amount are skipped with a
 * warning on stderr.
 */
class DataLoader {
public:
    /**
     * @brief Constructor
     */
    DataLoader() = default;

    /**
     * @brief Destructor
     */
    ~DataLoader() = default;

    // ========================================================================
    // CSV Loading Methods
    // ========================================================================

    /**
     * @brief Load expenses from CSV file
     *
     * Expected format:
     * id,owner_id,date,category,subcategory,amount,description,tags
     * 1,1,2024-03-02,Food,Groceries,84.20,Weekly shop,family;weekly
     *
     * @param filepath Path to CSV file
     * @return Expense rows in file order
     * @throws std::runtime_error if file cannot be loaded
     */
    static std::vector<data::Transaction> load_expenses_csv(const std::string& filepath);

    /**
     * @brief Load income from CSV file
     * @param filepath Path to CSV file
     * @return Income rows in file order
     * @throws std::runtime_error if file cannot be loaded
     */
    static std::vector<data::IncomeRecord> load_income_csv(const std::string& filepath);

    /**
     * @brief Load budget plans from CSV file
     * @param filepath Path to CSV file
     * @return Budget entries in file order
     * @throws std::runtime_error if file cannot be loaded
     */
    static std::vector<data::BudgetEntry> load_budget_csv(const std::string& filepath);

    /**
     * @brief Fill an in-memory source from CSV files
     * @param source Destination
     * @param expenses_path Expenses CSV (required)
     * @param income_path Income CSV (skipped if empty)
     * @param budget_path Budget CSV (skipped if empty)
     */
    static void load_into(data::InMemoryTransactionSource& source,
                          const std::string& expenses_path,
                          const std::string& income_path = "",
                          const std::string& budget_path = "");

    // ========================================================================
    // Configuration Loading
    // ========================================================================

    /**
     * @brief Load JSON configuration file
     * @param filepath Path to JSON config file
     * @return JSON object
     * @throws std::runtime_error if file cannot be loaded
     */
    static nlohmann::json load_json(const std::string& filepath);

    /**
     * @brief Load complete analytics configuration
     * @param config_path Path to config JSON file
     * @return AnalyticsConfig struct
     */
    static AnalyticsConfig load_config(const std::string& config_path);

    // ========================================================================
    // Data Generation (for testing)
    // ========================================================================

    /**
     * @brief Generate synthetic household data for testing
     * @param owner_id Owner of the generated rows
     * @param months Number of calendar months to generate
     * @param last_month Final month generated
     * @param seed Random seed (same seed, same data)
     * @return Expenses, salary income and a budget plan for every month
     */
    static SyntheticDataset generate_synthetic_data(
        int owner_id,
        int months,
        const data::YearMonth& last_month,
        std::uint32_t seed = 42
    );

    // ========================================================================
    // Save Methods (for the synthetic data generator)
    // ========================================================================

    static void save_expenses_csv(const std::vector<data::Transaction>& expenses, const std::string& filepath);

    static void save_income_csv(const std::vector<data::IncomeRecord>& income, const std::string& filepath);

    static void save_budget_csv(const std::vector<data::BudgetEntry>& budget, const std::string& filepath);

private:
    // ========================
    // Private Helper Methods
    // ========================

    /**
     * @brief Parse CSV line into tokens
     * @param line CSV line string
     * @return Vector of tokens
     */
    static std::vector<std::string> parse_csv_line(const std::string& line);

    /**
     * @brief Trim whitespace from string
     * @param str Input string
     * @return Trimmed string
     */
    static std::string trim(const std::string& str);

    /**
     * @brief Convert string to double safely
     * @param str String representation of number
     * @return Double value, or NaN if conversion fails or the value is infinite
     */
    static double safe_stod(const std::string& str);

    /**
     * @brief Convert string to int safely
     * @return Integer value, or fallback if conversion fails
     */
    static int safe_stoi(const std::string& str, int fallback);

    /**
     * @brief Split a ';'-separated tag list
     */
    static std::vector<std::string> split_tags(const std::string& str);

    /**
     * @brief Quote a CSV field if it contains a delimiter or quote
     */
    static std::string csv_field(const std::string& str);

    /**
     * @brief Open a file for writing, creating parent directories
     */
    static std::ofstream open_for_writing(const std::string& filepath);
};

} // namespace budget

#endif // DATA_LOADER_HPP
