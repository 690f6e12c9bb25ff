/**
 * @file generate_synthetic_transactions.cpp
 * @brief Generate synthetic household expenses, income and budgets
 */

#include "analytics/aggregator.hpp"
#include "data/data_loader.hpp"
#include <iostream>
#include <iomanip>
#include <stdexcept>

using namespace budget;

int main(int argc, char* argv[]) {
    std::cout << "\n=== Synthetic Transaction Generator ===\n" << std::endl;

    std::string output_dir = "data";
    int owner_id = 1;
    int months = 12;
    std::uint32_t seed = 42;
    data::YearMonth last_month = data::Date::today().year_month();

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--output" && i + 1 < argc) {
                output_dir = argv[++i];
            } else if (arg == "--owner" && i + 1 < argc) {
                owner_id = std::stoi(argv[++i]);
            } else if (arg == "--months" && i + 1 < argc) {
                months = std::stoi(argv[++i]);
            } else if (arg == "--last-month" && i + 1 < argc) {
                // YYYY-MM
                last_month = data::Date::parse(std::string(argv[++i]) + "-01").year_month();
            } else if (arg == "--seed" && i + 1 < argc) {
                seed = static_cast<std::uint32_t>(std::stoul(argv[++i]));
            } else if (arg == "--help") {
                std::cout << "Usage: " << argv[0] << " [OPTIONS]\n"
                          << "Options:\n"
                          << "  --output DIR         Output directory (default: data)\n"
                          << "  --owner ID           Owner id of the generated rows (default: 1)\n"
                          << "  --months N           Calendar months to generate (default: 12)\n"
                          << "  --last-month YYYY-MM Final month generated (default: current month)\n"
                          << "  --seed N             Random seed (default: 42)\n"
                          << "  --help               Show this help\n";
                return 0;
            }
        }

        std::cout << "Owner: " << owner_id << std::endl;
        std::cout << "Months: " << months << " (ending " << last_month.to_string() << ")" << std::endl;

        auto dataset = DataLoader::generate_synthetic_data(owner_id, months, last_month, seed);

        std::string expenses_file = output_dir + "/expenses.csv";
        std::string income_file = output_dir + "/income.csv";
        std::string budget_file = output_dir + "/budget.csv";

        std::cout << "Saving to " << output_dir << "/..." << std::endl;
        DataLoader::save_expenses_csv(dataset.expenses, expenses_file);
        DataLoader::save_income_csv(dataset.income, income_file);
        DataLoader::save_budget_csv(dataset.budget, budget_file);

        // Print summary statistics
        std::cout << "\n=== Generated Data Summary ===\n";
        std::cout << "Expenses: " << dataset.expenses.size() << "\n";
        std::cout << "Income entries: " << dataset.income.size() << "\n";
        std::cout << "Budget entries: " << dataset.budget.size() << "\n";

        analytics::AggregationQuery query;
        query.owner_id = owner_id;
        query.range = data::DateRange::trailing_months(last_month.last_day(), months);
        auto series = analytics::Aggregator::aggregate(dataset.expenses, query);

        std::cout << "\nSpending by Category:\n";
        std::cout << std::string(50, '-') << "\n";
        std::cout << std::setw(24) << std::left << "Category"
                  << std::setw(14) << std::right << "Total"
                  << std::setw(12) << "Count" << "\n";
        std::cout << std::string(50, '-') << "\n";

        for (const auto& total : analytics::Aggregator::category_totals(series)) {
            std::cout << std::setw(24) << std::left << total.category
                      << std::setw(14) << std::right << std::fixed << std::setprecision(2)
                      << total.total_amount
                      << std::setw(12) << total.count << "\n";
        }
        std::cout << std::string(50, '-') << "\n";

        std::cout << "\nData generation complete!\n" << std::endl;
        std::cout << "You can now run:\n";
        std::cout << "  ./build/bin/budget_analytics_cli --expenses " << expenses_file
                  << " --income " << income_file << " --budget " << budget_file
                  << " --as-of " << last_month.last_day().to_string() << " --verbose\n";
        std::cout << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "\nError: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
