/**
 * @file main.cpp
 * @brief Main entry point for the Family Budget Analytics engine
 *
 * Command-line application that loads expenses, income and budget plans,
 * then runs balance, forecast, anomaly, budget comparison and
 * recommendation reports for one owner.
 */

#include "analytics/analytics_engine.hpp"
#include "data/category_catalog.hpp"
#include "data/data_loader.hpp"
#include "data/transaction_source.hpp"
#include <iostream>
#include <string>
#include <exception>
#include <iomanip>
#include <chrono>
#include <set>
#include <optional>
#include <stdexcept>

using namespace budget;

/**
 * @brief Print usage information
 */
void print_usage(const char *program_name)
{
    std::cout << "Family Budget Analytics v1.0.0\n"
              << "Usage: " << program_name << " [OPTIONS]\n\n"
              << "Options:\n"
              << "  --expenses PATH       Expenses CSV file (required)\n"
              << "  --income PATH         Income CSV file\n"
              << "  --budget PATH         Budget plan CSV file\n"
              << "  --config PATH         Analytics configuration JSON file\n"
              << "  --categories PATH     Category catalog (JSON or CSV)\n"
              << "  --owner ID            Owner to analyse (default: 1)\n"
              << "  --month M --year Y    Month for balance, budget and recommendations\n"
              << "                        (default: month of --as-of)\n"
              << "  --as-of YYYY-MM-DD    Reference date for trailing windows (default: today)\n"
              << "  --category NAME       Forecast a single category\n"
              << "  --threshold Z         Anomaly z-score threshold (default: from config)\n"
              << "  --verbose             Enable verbose logging\n"
              << "  --help, -h            Show this help message\n"
              << "\nExample:\n"
              << "  " << program_name << " --expenses data/expenses.csv --income data/income.csv"
              << " --budget data/budget.csv --as-of 2024-06-30 --verbose\n"
              << std::endl;
}

/**
 * @brief Print banner
 */
void print_banner()
{
    std::cout << "\n"
              << "================================================================\n"
              << "       Family Budget Analytics v1.0.0                          \n"
              << "       Forecasts, Anomalies and Savings Recommendations        \n"
              << "================================================================\n"
              << std::endl;
}

/**
 * @brief Parse an integer argument
 * @throws std::invalid_argument with the flag name on failure
 */
int parse_int_arg(const std::string &flag, const std::string &value)
{
    int parsed = 0;
    size_t consumed = 0;
    try
    {
        parsed = std::stoi(value, &consumed);
    }
    catch (const std::logic_error &)
    {
        throw std::invalid_argument("Invalid value for " + flag + ": '" + value + "'");
    }

    if (consumed != value.size())
    {
        throw std::invalid_argument("Invalid value for " + flag + ": '" + value + "'");
    }
    return parsed;
}

/**
 * @brief Parse a floating-point argument
 * @throws std::invalid_argument with the flag name on failure
 */
double parse_double_arg(const std::string &flag, const std::string &value)
{
    double parsed = 0;
    size_t consumed = 0;
    try
    {
        parsed = std::stod(value, &consumed);
    }
    catch (const std::logic_error &)
    {
        throw std::invalid_argument("Invalid value for " + flag + ": '" + value + "'");
    }

    if (consumed != value.size())
    {
        throw std::invalid_argument("Invalid value for " + flag + ": '" + value + "'");
    }
    return parsed;
}

/**
 * @brief Parse command-line arguments
 */
struct CommandLineArgs
{
    std::string expenses_path;
    std::string income_path;
    std::string budget_path;
    std::string config_path;
    std::string categories_path;
    std::string owner = "1";
    std::string month;
    std::string year;
    std::string as_of;
    std::string category;
    std::string threshold;
    bool verbose = false;
    bool show_help = false;

    static CommandLineArgs parse(int argc, char *argv[])
    {
        CommandLineArgs args;

        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];

            if (arg == "--help" || arg == "-h")
            {
                args.show_help = true;
            }
            else if (arg == "--expenses" && i + 1 < argc)
            {
                args.expenses_path = argv[++i];
            }
            else if (arg == "--income" && i + 1 < argc)
            {
                args.income_path = argv[++i];
            }
            else if (arg == "--budget" && i + 1 < argc)
            {
                args.budget_path = argv[++i];
            }
            else if (arg == "--config" && i + 1 < argc)
            {
                args.config_path = argv[++i];
            }
            else if (arg == "--categories" && i + 1 < argc)
            {
                args.categories_path = argv[++i];
            }
            else if (arg == "--owner" && i + 1 < argc)
            {
                args.owner = argv[++i];
            }
            else if (arg == "--month" && i + 1 < argc)
            {
                args.month = argv[++i];
            }
            else if (arg == "--year" && i + 1 < argc)
            {
                args.year = argv[++i];
            }
            else if (arg == "--as-of" && i + 1 < argc)
            {
                args.as_of = argv[++i];
            }
            else if (arg == "--category" && i + 1 < argc)
            {
                args.category = argv[++i];
            }
            else if (arg == "--threshold" && i + 1 < argc)
            {
                args.threshold = argv[++i];
            }
            else if (arg == "--verbose")
            {
                args.verbose = true;
            }
            else
            {
                std::cerr << "Warning: Unknown argument: " << arg << std::endl;
            }
        }

        return args;
    }

    bool is_valid() const
    {
        // --month and --year go together
        return !show_help && !expenses_path.empty() && month.empty() == year.empty();
    }
};

/**
 * @brief Load the category catalog named on the command line, or the default one
 */
data::CategoryCatalog load_catalog(const std::string &path)
{
    if (path.empty())
    {
        return data::CategoryCatalog::default_catalog();
    }

    if (path.size() >= 5 && path.compare(path.size() - 5, 5, ".json") == 0)
    {
        return data::CategoryCatalog::from_json(DataLoader::load_json(path));
    }

    return data::CategoryCatalog::from_csv(path);
}

/**
 * @brief Main execution function
 */
int run(const CommandLineArgs &args)
{
    auto start_time = std::chrono::high_resolution_clock::now();

    try
    {
        // ====================================================================
        // 1. Load Configuration
        // ====================================================================
        std::cout << "[1/7] Loading configuration..." << std::endl;

        auto catalog = load_catalog(args.categories_path);

        AnalyticsConfig config = args.config_path.empty()
                                     ? AnalyticsConfig::defaults()
                                     : DataLoader::load_config(args.config_path);

        // A catalog named on the command line decides which categories are essential
        if (!args.categories_path.empty())
        {
            config.recommendation.essential_categories = catalog.essential_categories();
        }

        const int owner_id = parse_int_arg("--owner", args.owner);
        const data::Date as_of = args.as_of.empty() ? data::Date::today() : data::Date::parse(args.as_of);
        const data::YearMonth period = args.month.empty()
                                           ? as_of.year_month()
                                           : data::YearMonth(parse_int_arg("--year", args.year),
                                                             parse_int_arg("--month", args.month));

        if (args.verbose)
        {
            std::cout << "  - Owner: " << owner_id << "\n";
            std::cout << "  - As of: " << as_of.to_string() << "\n";
            std::cout << "  - Report month: " << period.to_string() << "\n";
            std::cout << "  - Categories: " << catalog.size() << " (essential: ";
            for (const auto &name : config.recommendation.essential_categories)
            {
                std::cout << name << " ";
            }
            std::cout << ")\n";
            std::cout << "  - Configuration: " << config.to_json().dump() << "\n";
        }

        // ====================================================================
        // 2. Load Transactions
        // ====================================================================
        std::cout << "[2/7] Loading transactions..." << std::endl;

        data::InMemoryTransactionSource source;
        DataLoader::load_into(source, args.expenses_path, args.income_path, args.budget_path);

        std::cout << "  - Loaded " << source.num_expenses() << " expenses, "
                  << source.num_income() << " income entries, "
                  << source.num_budget_entries() << " budget entries" << std::endl;

        std::set<std::string> unknown;
        for (const auto &t : source.all_expenses())
        {
            if (!catalog.contains(t.category))
            {
                unknown.insert(t.category);
            }
        }
        for (const auto &name : unknown)
        {
            std::cerr << "Warning: category '" << name << "' is not in the catalog" << std::endl;
        }

        analytics::AnalyticsEngine engine(source, config, [as_of]()
                                          { return as_of; });

        // ====================================================================
        // 3. Monthly Balance
        // ====================================================================
        std::cout << "[3/7] Computing monthly balance..." << std::endl;

        auto balance = engine.monthly_balance(owner_id, period.month, period.year);
        balance.print_summary();

        if (args.verbose)
        {
            std::cout << "\n  Spending by category (" << period.to_string() << "):\n";
            for (const auto &total : engine.expense_summary(owner_id, period.month, period.year))
            {
                std::cout << "  " << std::setw(24) << std::left << total.category
                          << std::right << std::setw(12) << std::fixed << std::setprecision(2)
                          << total.total_amount << "  (" << total.count << " transactions)\n";
            }

            std::cout << "\n  Monthly trend:\n";
            for (const auto &month_total : engine.monthly_trend(owner_id, config.forecast.lookback_months))
            {
                std::cout << "  " << month_total.period.to_string() << "  "
                          << std::setw(12) << std::fixed << std::setprecision(2)
                          << month_total.total_amount << "\n";
            }
        }

        // ====================================================================
        // 4. Forecast
        // ====================================================================
        std::cout << "\n[4/7] Forecasting next month..." << std::endl;

        std::optional<std::string> category;
        if (!args.category.empty())
        {
            category = args.category;
        }

        auto forecast = engine.forecast(owner_id, category);
        forecast.print_summary();

        // ====================================================================
        // 5. Anomaly Detection
        // ====================================================================
        std::cout << "\n[5/7] Detecting unusual expenses..." << std::endl;

        auto anomalies = args.threshold.empty()
                             ? engine.detect_anomalies(owner_id)
                             : engine.detect_anomalies(owner_id, parse_double_arg("--threshold", args.threshold));
        anomalies.print_summary();

        // ====================================================================
        // 6. Budget Comparison
        // ====================================================================
        std::cout << "\n[6/7] Comparing budget with actual spending..." << std::endl;

        auto rows = engine.compare_budget(owner_id, period.month, period.year);
        if (rows.empty())
        {
            std::cout << "  No budget configured for " << period.to_string() << "\n";
        }
        else
        {
            analytics::BudgetComparator::print_report(rows, "BUDGET VS ACTUAL (" + period.to_string() + ")");
            analytics::BudgetComparator::print_report(
                analytics::BudgetComparator::rollup_by_category(rows), "BY CATEGORY");
        }

        // ====================================================================
        // 7. Recommendations
        // ====================================================================
        std::cout << "\n[7/7] Generating recommendations..." << std::endl;

        auto recommendations = engine.recommend(owner_id, period.month, period.year);
        recommendations.print_summary();

        // ====================================================================
        // Summary
        // ====================================================================
        auto end_time = std::chrono::high_resolution_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
                            end_time - start_time)
                            .count();

        std::cout << "\n================================================================\n";
        std::cout << "Analysis completed successfully in "
                  << duration << " ms\n";
        std::cout << "================================================================\n"
                  << std::endl;

        return 0;
    }
    catch (const std::exception &e)
    {
        std::cerr << "\nError: " << e.what() << std::endl;
        return 1;
    }
}

/**
 * @brief Main function
 */
int main(int argc, char *argv[])
{
    // Parse command-line arguments
    auto args = CommandLineArgs::parse(argc, argv);

    // Show help if requested or invalid args
    if (args.show_help || !args.is_valid())
    {
        print_banner();
        print_usage(argv[0]);
        return args.show_help ? 0 : 1;
    }

    // Print banner
    print_banner();

    // Run analysis
    return run(args);
}
