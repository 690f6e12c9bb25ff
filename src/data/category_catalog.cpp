/**
 * @file category_catalog.cpp
 * @brief Implementation of CategoryCatalog
 */

#include "data/category_catalog.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace budget {
namespace data {

// Trim helpers (left/right)
static inline std::string ltrim(std::string s)
{
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](unsigned char ch) { return !std::isspace(ch); }));
    return s;
}

static inline std::string rtrim(std::string s)
{
    s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); }).base(), s.end());
    return s;
}

static inline std::string trim(std::string s)
{
    return ltrim(rtrim(std::move(s)));
}

CategoryCatalog::CategoryCatalog(const CategoryList& categories,
                                 const std::set<std::string>& essential,
                                 const std::vector<std::string>& income_sources)
    : income_sources_(income_sources)
{
    for (const auto& entry : categories)
    {
        const std::string name = trim(entry.first);
        if (name.empty())
        {
            throw std::invalid_argument("CategoryCatalog: empty category name");
        }
        if (subcategories_.count(name))
        {
            throw std::invalid_argument("CategoryCatalog: duplicate category '" + name + "'");
        }

        std::vector<std::string> subs;
        subs.reserve(entry.second.size());
        for (const auto& raw : entry.second)
        {
            const std::string sub = trim(raw);
            if (sub.empty())
            {
                throw std::invalid_argument("CategoryCatalog: empty subcategory in '" + name + "'");
            }
            if (std::find(subs.begin(), subs.end(), sub) == subs.end())
            {
                subs.push_back(sub);
            }
        }

        category_names_.push_back(name);
        subcategories_[name] = std::move(subs);
    }

    for (const auto& e : essential)
    {
        if (!subcategories_.count(e))
        {
            throw std::invalid_argument("CategoryCatalog: essential category '" + e + "' is not in the catalog");
        }
        essential_.insert(e);
    }
}

CategoryCatalog CategoryCatalog::from_csv(const std::string& filepath, char delimiter)
{
    std::ifstream file(filepath);
    if (!file.is_open())
    {
        throw std::runtime_error("CategoryCatalog::from_csv: could not open file: " + filepath);
    }

    std::string line;

    // Header is always skipped
    if (!std::getline(file, line))
    {
        throw std::runtime_error("CategoryCatalog::from_csv: empty file: " + filepath);
    }

    CategoryList categories;

    while (std::getline(file, line))
    {
        if (line.empty())
            continue;

        std::vector<std::string> fields;
        std::stringstream ss(line);
        std::string item;
        while (std::getline(ss, item, delimiter))
        {
            fields.push_back(trim(item));
        }

        if (fields.size() < 2 || fields[0].empty() || fields[1].empty())
        {
            continue;
        }

        auto it = std::find_if(categories.begin(), categories.end(),
                               [&fields](const CategoryList::value_type& c) { return c.first == fields[0]; });
        if (it == categories.end())
        {
            categories.push_back({fields[0], {fields[1]}});
        }
        else
        {
            it->second.push_back(fields[1]);
        }
    }

    file.close();

    if (categories.empty())
    {
        throw std::runtime_error("CategoryCatalog::from_csv: no valid rows found in: " + filepath);
    }

    return CategoryCatalog(categories);
}

CategoryCatalog CategoryCatalog::from_json(const nlohmann::json& j)
{
    if (!j.contains("categories") || !j.at("categories").is_object())
    {
        throw std::invalid_argument("CategoryCatalog::from_json: JSON must contain a 'categories' object");
    }

    CategoryList categories;
    for (auto it = j.at("categories").begin(); it != j.at("categories").end(); ++it)
    {
        categories.push_back({it.key(), it.value().get<std::vector<std::string>>()});
    }

    std::set<std::string> essential;
    if (j.contains("essential"))
    {
        for (const auto& e : j.at("essential").get<std::vector<std::string>>())
        {
            essential.insert(e);
        }
    }

    std::vector<std::string> income_sources = j.value("income_sources", std::vector<std::string>{});

    return CategoryCatalog(categories, essential, income_sources);
}

CategoryCatalog CategoryCatalog::default_catalog()
{
    CategoryList categories = {
        {"Children", {"Childcare", "Medical & Consultations", "School Supplies & Toys",
                      "School Tuition", "Children's Food", "Children's Entertainment"}},
        {"Entertainment", {"Concerts", "Theatre & Opera", "Cinema", "Music (CDs, Downloads, etc.)",
                           "Sports Events", "Video/DVD (Purchase)", "Video/DVD (Rental)", "Books"}},
        {"Food", {"Dining Out & Catering", "Groceries", "Fruits & Vegetables", "Meat & Deli",
                  "Fish & Seafood"}},
        {"Gifts and Charity", {"Religious Donations", "Gifts", "Gift 1", "Gift 2"}},
        {"Housing", {"Cable/Satellite", "Electricity", "Gas", "House Cleaning",
                     "Home Maintenance & Repairs", "Utilities", "Natural Gas/Oil",
                     "Internet Service", "Mobile Phone", "Landline Phone",
                     "Other Housing Expenses", "Waste Removal & Recycling",
                     "Water & Bottled Water"}},
        {"Insurance", {"Health Insurance", "Home Insurance", "Life Insurance"}},
        {"Loans", {"Personal Loan", "Overdraft", "Credit Card", "Personal Debt", "Student Loan"}},
        {"Personal Care", {"Clothing", "Hygiene Products", "Hair Salon & Manicure",
                           "Fitness & Beauty Salon", "Medical & Consultations"}},
        {"Pets", {"Pet Food", "Grooming", "Veterinary & Medicine", "Pet Toys"}},
        {"Savings or Investments", {"Investments", "Retirement Account"}},
        {"Taxes", {"Federal Taxes", "Local Taxes", "State Taxes"}},
        {"Transportation", {"Public Transport & Taxi", "Fuel/Gasoline", "Car Insurance",
                            "License & Registration", "Car Maintenance", "Parking",
                            "Vehicle Taxes"}}};

    std::vector<std::string> income_sources = {
        "Salary", "Bonus", "Freelance/Business", "Rental Income",
        "Investments", "Gifts & Inheritance", "Other Income"};

    return CategoryCatalog(categories, {"Housing", "Insurance", "Loans"}, income_sources);
}

const std::vector<std::string>& CategoryCatalog::get_subcategories(const std::string& category) const
{
    auto it = subcategories_.find(category);
    if (it == subcategories_.end())
    {
        throw std::out_of_range("CategoryCatalog: category not found: " + category);
    }
    return it->second;
}

bool CategoryCatalog::contains(const std::string& category, const std::string& subcategory) const
{
    auto it = subcategories_.find(category);
    if (it == subcategories_.end())
        return false;
    if (subcategory.empty())
        return true;
    return std::find(it->second.begin(), it->second.end(), subcategory) != it->second.end();
}

nlohmann::json CategoryCatalog::to_json() const
{
    nlohmann::json j;
    j["categories"] = nlohmann::json::object();
    for (const auto& name : category_names_)
    {
        j["categories"][name] = subcategories_.at(name);
    }
    j["essential"] = std::vector<std::string>(essential_.begin(), essential_.end());
    j["income_sources"] = income_sources_;
    return j;
}

} // namespace data
} // namespace budget
