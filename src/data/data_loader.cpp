/**
 * @file data_loader.cpp
 * @brief Implementation of DataLoader class and configuration structures
 */

#include "data/data_loader.hpp"
#include "data/category_catalog.hpp"
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <random>
#include <sstream>

namespace budget
{

    // =============================================
    // Configuration Structures
    // =============================================

    AnalyticsConfig AnalyticsConfig::defaults()
    {
        AnalyticsConfig config;
        config.recommendation.essential_categories =
            data::CategoryCatalog::default_catalog().essential_categories();
        return config;
    }

    AnalyticsConfig AnalyticsConfig::from_json(const nlohmann::json &j)
    {
        AnalyticsConfig config = defaults();

        if (j.contains("forecast"))
        {
            config.forecast = analytics::ForecastConfig::from_json(j["forecast"]);
        }

        if (j.contains("anomaly"))
        {
            config.anomaly = analytics::AnomalyConfig::from_json(j["anomaly"]);
        }

        if (j.contains("recommendation"))
        {
            auto essential = config.recommendation.essential_categories;
            config.recommendation = analytics::RecommendationConfig::from_json(j["recommendation"]);
            if (!j["recommendation"].contains("essential_categories"))
            {
                config.recommendation.essential_categories = essential;
            }
        }

        if (j.contains("categories") && j["categories"].contains("essential"))
        {
            config.recommendation.essential_categories.clear();
            for (const auto &name : j["categories"]["essential"].get<std::vector<std::string>>())
            {
                config.recommendation.essential_categories.insert(name);
            }
        }

        config.validate();
        return config;
    }

    AnalyticsConfig AnalyticsConfig::load_from_file(const std::string &config_path)
    {
        return DataLoader::load_config(config_path);
    }

    nlohmann::json AnalyticsConfig::to_json() const
    {
        nlohmann::json j;
        j["forecast"] = forecast.to_json();
        j["anomaly"] = anomaly.to_json();
        j["recommendation"] = recommendation.to_json();
        return j;
    }

    void AnalyticsConfig::validate() const
    {
        forecast.validate();
        anomaly.validate();
        recommendation.validate();
    }

    // ===========================
    // CSV Loading - Expenses
    // ===========================

    namespace
    {
        // Column position by header name, or -1 when absent
        int column_index(const std::vector<std::string> &header, const std::string &name)
        {
            for (size_t i = 0; i < header.size(); ++i)
            {
                if (header[i] == name)
                    return static_cast<int>(i);
            }
            return -1;
        }

        std::string field_at(const std::vector<std::string> &fields, int index)
        {
            if (index < 0 || index >= static_cast<int>(fields.size()))
                return "";
            return fields[index];
        }

        void require_columns(const std::vector<std::string> &header,
                             const std::vector<std::string> &names,
                             const std::string &filepath)
        {
            for (const auto &name : names)
            {
                if (column_index(header, name) < 0)
                {
                    throw std::runtime_error("CSV file " + filepath + " is missing required column '" + name + "'");
                }
            }
        }
    } // namespace

    std::vector<data::Transaction> DataLoader::load_expenses_csv(const std::string &filepath)
    {
        std::ifstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open file: " + filepath);
        }

        std::string line;

        // Read header line
        if (!std::getline(file, line))
        {
            throw std::runtime_error("Empty CSV file: " + filepath);
        }

        auto header = parse_csv_line(line);
        for (auto &h : header)
        {
            h = trim(h);
        }
        require_columns(header, {"date", "category", "amount"}, filepath);

        const int col_id = column_index(header, "id");
        const int col_owner = column_index(header, "owner_id");
        const int col_date = column_index(header, "date");
        const int col_category = column_index(header, "category");
        const int col_subcategory = column_index(header, "subcategory");
        const int col_amount = column_index(header, "amount");
        const int col_description = column_index(header, "description");
        const int col_tags = column_index(header, "tags");

        std::vector<data::Transaction> expenses;
        int line_number = 1;

        while (std::getline(file, line))
        {
            ++line_number;
            if (trim(line).empty())
                continue;

            auto fields = parse_csv_line(line);

            std::string date = trim(field_at(fields, col_date));
            if (!data::Date::is_valid(date))
            {
                std::cerr << "Warning: " << filepath << ":" << line_number
                          << ": skipping row with invalid date '" << date << "'\n";
                continue;
            }

            data::Transaction t;
            t.id = safe_stoi(field_at(fields, col_id), 0);
            t.owner_id = safe_stoi(field_at(fields, col_owner), 1);
            t.occurred_on = data::Date::parse(date);
            t.category = trim(field_at(fields, col_category));
            t.subcategory = trim(field_at(fields, col_subcategory));
            t.amount = safe_stod(field_at(fields, col_amount));
            t.description = trim(field_at(fields, col_description));
            t.tags = split_tags(field_at(fields, col_tags));

            if (std::isnan(t.amount) || t.amount <= 0.0 || t.category.empty())
            {
                std::cerr << "Warning: " << filepath << ":" << line_number
                          << ": skipping row with invalid amount or category\n";
                continue;
            }

            expenses.push_back(t);
        }

        file.close();
        return expenses;
    }

    // ===========================
    // CSV Loading - Income
    // ===========================

    std::vector<data::IncomeRecord> DataLoader::load_income_csv(const std::string &filepath)
    {
        std::ifstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open file: " + filepath);
        }

        std::string line;
        if (!std::getline(file, line))
        {
            throw std::runtime_error("Empty CSV file: " + filepath);
        }

        auto header = parse_csv_line(line);
        for (auto &h : header)
        {
            h = trim(h);
        }
        require_columns(header, {"date", "source", "amount"}, filepath);

        const int col_id = column_index(header, "id");
        const int col_owner = column_index(header, "owner_id");
        const int col_date = column_index(header, "date");
        const int col_source = column_index(header, "source");
        const int col_amount = column_index(header, "amount");
        const int col_description = column_index(header, "description");

        std::vector<data::IncomeRecord> income;
        int line_number = 1;

        while (std::getline(file, line))
        {
            ++line_number;
            if (trim(line).empty())
                continue;

            auto fields = parse_csv_line(line);

            std::string date = trim(field_at(fields, col_date));
            if (!data::Date::is_valid(date))
            {
                std::cerr << "Warning: " << filepath << ":" << line_number
                          << ": skipping row with invalid date '" << date << "'\n";
                continue;
            }

            data::IncomeRecord r;
            r.id = safe_stoi(field_at(fields, col_id), 0);
            r.owner_id = safe_stoi(field_at(fields, col_owner), 1);
            r.occurred_on = data::Date::parse(date);
            r.source = trim(field_at(fields, col_source));
            r.amount = safe_stod(field_at(fields, col_amount));
            r.description = trim(field_at(fields, col_description));

            if (std::isnan(r.amount) || r.amount <= 0.0 || r.source.empty())
            {
                std::cerr << "Warning: " << filepath << ":" << line_number
                          << ": skipping row with invalid amount or source\n";
                continue;
            }

            income.push_back(r);
        }

        file.close();
        return income;
    }

    // ===========================
    // CSV Loading - Budget
    // ===========================

    std::vector<data::BudgetEntry> DataLoader::load_budget_csv(const std::string &filepath)
    {
        std::ifstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open file: " + filepath);
        }

        std::string line;
        if (!std::getline(file, line))
        {
            throw std::runtime_error("Empty CSV file: " + filepath);
        }

        auto header = parse_csv_line(line);
        for (auto &h : header)
        {
            h = trim(h);
        }
        require_columns(header, {"year", "month", "category", "planned_amount"}, filepath);

        const int col_owner = column_index(header, "owner_id");
        const int col_year = column_index(header, "year");
        const int col_month = column_index(header, "month");
        const int col_category = column_index(header, "category");
        const int col_subcategory = column_index(header, "subcategory");
        const int col_planned = column_index(header, "planned_amount");

        std::vector<data::BudgetEntry> budget;
        int line_number = 1;

        while (std::getline(file, line))
        {
            ++line_number;
            if (trim(line).empty())
                continue;

            auto fields = parse_csv_line(line);

            data::BudgetEntry e;
            e.owner_id = safe_stoi(field_at(fields, col_owner), 1);
            e.year = safe_stoi(field_at(fields, col_year), 0);
            e.month = safe_stoi(field_at(fields, col_month), 0);
            e.category = trim(field_at(fields, col_category));
            e.subcategory = trim(field_at(fields, col_subcategory));
            e.planned_amount = safe_stod(field_at(fields, col_planned));

            if (e.month < 1 || e.month > 12 || e.year <= 0)
            {
                std::cerr << "Warning: " << filepath << ":" << line_number
                          << ": skipping row with invalid month/year\n";
                continue;
            }
            if (std::isnan(e.planned_amount) || e.planned_amount < 0.0 || e.category.empty())
            {
                std::cerr << "Warning: " << filepath << ":" << line_number
                          << ": skipping row with invalid planned amount or category\n";
                continue;
            }

            budget.push_back(e);
        }

        file.close();
        return budget;
    }

    void DataLoader::load_into(data::InMemoryTransactionSource &source,
                               const std::string &expenses_path,
                               const std::string &income_path,
                               const std::string &budget_path)
    {
        for (const auto &e : load_expenses_csv(expenses_path))
        {
            source.add_expense(e);
        }

        if (!income_path.empty())
        {
            for (const auto &i : load_income_csv(income_path))
            {
                source.add_income(i);
            }
        }

        if (!budget_path.empty())
        {
            for (const auto &b : load_budget_csv(budget_path))
            {
                if (source.set_budget(b))
                {
                    std::cerr << "Warning: duplicate budget entry for " << b.category << "/"
                              << b.subcategory << " in " << b.period().to_string()
                              << " replaced by later row\n";
                }
            }
        }
    }

    // ================
    // JSON Loading
    // ================

    nlohmann::json DataLoader::load_json(const std::string &filepath)
    {
        std::ifstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open JSON file: " + filepath);
        }

        nlohmann::json j;
        try
        {
            file >> j;
        }
        catch (const nlohmann::json::exception &e)
        {
            throw std::runtime_error("JSON parsing error: " + std::string(e.what()));
        }

        file.close();
        return j;
    }

    AnalyticsConfig DataLoader::load_config(const std::string &config_path)
    {
        auto j = load_json(config_path);

        try
        {
            return AnalyticsConfig::from_json(j);
        }
        catch (const nlohmann::json::exception &e)
        {
            throw std::runtime_error("Invalid configuration in " + config_path + ": " + std::string(e.what()));
        }
    }

    // ===========================
    // Synthetic Data Generation
    // ===========================

    SyntheticDataset DataLoader::generate_synthetic_data(
        int owner_id,
        int months,
        const data::YearMonth &last_month,
        std::uint32_t seed)
    {
        if (months < 1)
        {
            throw std::invalid_argument("Expected months >= 1, got: " + std::to_string(months));
        }

        struct Profile
        {
            const char *category;
            const char *subcategory;
            int per_month;  ///< Transactions per month
            double mean;    ///< Mean transaction amount
            double stddev;  ///< Transaction amount dispersion
            double planned; ///< Monthly budget
        };

        static const Profile kProfiles[] = {
            {"Housing", "Other Housing Expenses", 1, 1200.0, 0.0, 1200.0},
            {"Housing", "Electricity", 1, 90.0, 15.0, 100.0},
            {"Insurance", "Health Insurance", 1, 250.0, 0.0, 250.0},
            {"Food", "Groceries", 4, 120.0, 25.0, 450.0},
            {"Food", "Dining Out & Catering", 3, 45.0, 15.0, 120.0},
            {"Transportation", "Fuel/Gasoline", 4, 50.0, 10.0, 220.0},
            {"Entertainment", "Cinema", 2, 25.0, 5.0, 40.0},
            {"Personal Care", "Clothing", 1, 80.0, 40.0, 100.0}};

        std::mt19937 gen(seed);
        std::uniform_real_distribution<double> spike(0.0, 1.0);

        SyntheticDataset dataset;
        int expense_id = 1;
        int income_id = 1;

        auto round_cents = [](double x) { return std::round(x * 100.0) / 100.0; };

        for (int m = months - 1; m >= 0; --m)
        {
            data::YearMonth period = last_month.plus_months(-m);
            int last_day = data::days_in_month(period.year, period.month);
            std::uniform_int_distribution<int> day_dist(1, last_day);

            for (const auto &p : kProfiles)
            {
                std::normal_distribution<double> amount_dist(p.mean, p.stddev > 0.0 ? p.stddev : 1e-9);

                for (int k = 0; k < p.per_month; ++k)
                {
                    double amount = p.stddev > 0.0 ? amount_dist(gen) : p.mean;

                    // Occasional outlier so the anomaly scan has something to find
                    if (p.per_month > 1 && spike(gen) < 0.04)
                    {
                        amount *= 4.0;
                    }

                    data::Transaction t;
                    t.id = expense_id++;
                    t.owner_id = owner_id;
                    t.category = p.category;
                    t.subcategory = p.subcategory;
                    t.amount = std::max(1.0, round_cents(amount));
                    t.occurred_on = data::Date(period.year, period.month, p.per_month == 1 ? 1 : day_dist(gen));
                    t.description = std::string(p.subcategory) + " " + period.to_string();
                    dataset.expenses.push_back(t);
                }

                data::BudgetEntry b;
                b.owner_id = owner_id;
                b.category = p.category;
                b.subcategory = p.subcategory;
                b.planned_amount = p.planned;
                b.month = period.month;
                b.year = period.year;
                dataset.budget.push_back(b);
            }

            data::IncomeRecord salary;
            salary.id = income_id++;
            salary.owner_id = owner_id;
            salary.source = "Salary";
            salary.amount = 4200.0;
            salary.occurred_on = data::Date(period.year, period.month, 1);
            salary.description = "Monthly salary";
            dataset.income.push_back(salary);
        }

        std::stable_sort(dataset.expenses.begin(), dataset.expenses.end(),
                         [](const data::Transaction &a, const data::Transaction &b)
                         { return a.occurred_on < b.occurred_on; });

        return dataset;
    }

    // ==================
    // Save Methods
    // ==================

    void DataLoader::save_expenses_csv(const std::vector<data::Transaction> &expenses, const std::string &filepath)
    {
        std::ofstream file = open_for_writing(filepath);

        file << "id,owner_id,date,category,subcategory,amount,description,tags\n";

        for (const auto &e : expenses)
        {
            std::string tags;
            for (size_t i = 0; i < e.tags.size(); ++i)
            {
                if (i > 0)
                    tags += ";";
                tags += e.tags[i];
            }

            file << e.id << "," << e.owner_id << "," << e.occurred_on.to_string() << ","
                 << csv_field(e.category) << "," << csv_field(e.subcategory) << ","
                 << std::fixed << std::setprecision(2) << e.amount << ","
                 << csv_field(e.description) << "," << csv_field(tags) << "\n";
        }

        file.close();
    }

    void DataLoader::save_income_csv(const std::vector<data::IncomeRecord> &income, const std::string &filepath)
    {
        std::ofstream file = open_for_writing(filepath);

        file << "id,owner_id,date,source,amount,description\n";

        for (const auto &r : income)
        {
            file << r.id << "," << r.owner_id << "," << r.occurred_on.to_string() << ","
                 << csv_field(r.source) << ","
                 << std::fixed << std::setprecision(2) << r.amount << ","
                 << csv_field(r.description) << "\n";
        }

        file.close();
    }

    void DataLoader::save_budget_csv(const std::vector<data::BudgetEntry> &budget, const std::string &filepath)
    {
        std::ofstream file = open_for_writing(filepath);

        file << "owner_id,year,month,category,subcategory,planned_amount\n";

        for (const auto &b : budget)
        {
            file << b.owner_id << "," << b.year << "," << b.month << ","
                 << csv_field(b.category) << "," << csv_field(b.subcategory) << ","
                 << std::fixed << std::setprecision(2) << b.planned_amount << "\n";
        }

        file.close();
    }

    // =======================
    // Private Helper Methods
    // =======================

    std::vector<std::string> DataLoader::parse_csv_line(const std::string &line)
    {
        std::vector<std::string> tokens;
        std::string token;
        bool in_quotes = false;

        for (char c : line)
        {
            if (c == '"')
            {
                in_quotes = !in_quotes;
            }
            else if (c == ',' && !in_quotes)
            {
                tokens.push_back(token);
                token.clear();
            }
            else if (c != '\r')
            {
                token += c;
            }
        }

        tokens.push_back(token);
        return tokens;
    }

    std::string DataLoader::trim(const std::string &str)
    {
        size_t first = str.find_first_not_of(" \t\r\n");
        if (first == std::string::npos)
            return "";

        size_t last = str.find_last_not_of(" \t\r\n");
        return str.substr(first, last - first + 1);
    }

    double DataLoader::safe_stod(const std::string &str)
    {
        std::string trimmed = trim(str);
        if (trimmed.empty() || trimmed == "nan" || trimmed == "NaN")
        {
            return std::numeric_limits<double>::quiet_NaN();
        }

        try
        {
            size_t consumed = 0;
            double value = std::stod(trimmed, &consumed);
            if (consumed != trimmed.size() || !std::isfinite(value))
            {
                return std::numeric_limits<double>::quiet_NaN();
            }
            return value;
        }
        catch (const std::invalid_argument &)
        {
            return std::numeric_limits<double>::quiet_NaN();
        }
        catch (const std::out_of_range &)
        {
            return std::numeric_limits<double>::quiet_NaN();
        }
    }

    int DataLoader::safe_stoi(const std::string &str, int fallback)
    {
        std::string trimmed = trim(str);
        if (trimmed.empty())
        {
            return fallback;
        }

        try
        {
            return std::stoi(trimmed);
        }
        catch (const std::invalid_argument &)
        {
            return fallback;
        }
        catch (const std::out_of_range &)
        {
            return fallback;
        }
    }

    std::vector<std::string> DataLoader::split_tags(const std::string &str)
    {
        std::vector<std::string> tags;
        std::stringstream ss(str);
        std::string item;
        while (std::getline(ss, item, ';'))
        {
            item = trim(item);
            if (!item.empty())
                tags.push_back(item);
        }
        return tags;
    }

    std::string DataLoader::csv_field(const std::string &str)
    {
        std::string clean = str;
        std::replace(clean.begin(), clean.end(), '"', '\'');
        if (clean.find(',') != std::string::npos)
        {
            return "\"" + clean + "\"";
        }
        return clean;
    }

    std::ofstream DataLoader::open_for_writing(const std::string &filepath)
    {
        std::filesystem::path path(filepath);
        if (path.has_parent_path())
        {
            std::filesystem::create_directories(path.parent_path());
        }

        std::ofstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open file for writing: " + filepath);
        }
        return file;
    }

} // namespace budget
