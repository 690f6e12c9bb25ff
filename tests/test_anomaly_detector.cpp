/**
 * @file test_anomaly_detector.cpp
 * @brief Unit tests for z-score anomaly detection
 */

#include <catch2/catch.hpp>
#include "analytics/anomaly_detector.hpp"
#include <cmath>
#include <stdexcept>

using namespace budget;
using namespace budget::analytics;
using Catch::Matchers::WithinAbs;

namespace {

std::vector<data::Transaction> series(const std::string& category, const std::vector<double>& amounts,
                                      int first_id = 1) {
    std::vector<data::Transaction> out;
    for (size_t i = 0; i < amounts.size(); ++i) {
        data::Transaction t;
        t.id = first_id + static_cast<int>(i);
        t.owner_id = 1;
        t.category = category;
        t.subcategory = "Sub";
        t.amount = amounts[i];
        t.occurred_on = data::Date(2024, 3, 1 + static_cast<int>(i));
        t.description = category + " #" + std::to_string(t.id);
        out.push_back(t);
    }
    return out;
}

void append(std::vector<data::Transaction>& to, const std::vector<data::Transaction>& from) {
    to.insert(to.end(), from.begin(), from.end());
}

} // namespace

TEST_CASE("Strict threshold comparison", "[AnomalyDetector]") {
    // mean 180, std 160, z(500) = 2.0
    auto tx = series("Food", {100.0, 100.0, 100.0, 100.0, 500.0});
    AnomalyDetector detector;

    SECTION("z equal to the threshold is not flagged") {
        auto report = detector.detect(tx, 2.0);
        REQUIRE(report.success);
        REQUIRE(report.anomalies_found == 0);
        REQUIRE(report.anomalies.empty());

        REQUIRE(report.baselines.size() == 1);
        REQUIRE_THAT(report.baselines[0].mean, WithinAbs(180.0, 1e-9));
        REQUIRE_THAT(report.baselines[0].std_dev, WithinAbs(160.0, 1e-9));
        REQUIRE(report.baselines[0].sample_size == 5);
    }

    SECTION("Lower threshold flags the outlier") {
        auto report = detector.detect(tx, 1.9);
        REQUIRE(report.anomalies_found == 1);

        const auto& a = report.anomalies[0];
        REQUIRE(a.transaction_id == 5);
        REQUIRE(a.category == "Food");
        REQUIRE(a.subcategory == "Sub");
        REQUIRE(a.amount == 500.0);
        REQUIRE(a.date == data::Date(2024, 3, 5));
        REQUIRE(a.description == "Food #5");
        REQUIRE_THAT(a.deviation, WithinAbs(2.0, 1e-9));
        REQUIRE_THAT(a.expected_range.lower, WithinAbs(-140.0, 1e-9));
        REQUIRE_THAT(a.expected_range.upper, WithinAbs(500.0, 1e-9));
        REQUIRE(a.severity == Severity::MEDIUM);
    }
}

TEST_CASE("Severity levels", "[AnomalyDetector]") {
    AnomalyDetector detector;

    SECTION("z of exactly 3 is Medium") {
        // one outlier among ten: z = sqrt(9) = 3
        auto tx = series("Food", {10, 10, 10, 10, 10, 10, 10, 10, 10, 1000});
        auto report = detector.detect(tx);
        REQUIRE(report.anomalies_found == 1);
        REQUIRE_THAT(report.anomalies[0].deviation, WithinAbs(3.0, 1e-9));
        REQUIRE(report.anomalies[0].severity == Severity::MEDIUM);
    }

    SECTION("z above 3 is High") {
        std::vector<double> amounts(19, 10.0);
        amounts.push_back(1000.0);
        auto report = detector.detect(series("Food", amounts));
        REQUIRE(report.anomalies_found == 1);
        REQUIRE_THAT(report.anomalies[0].deviation, WithinAbs(std::sqrt(19.0), 1e-9));
        REQUIRE(report.anomalies[0].severity == Severity::HIGH);
        REQUIRE(to_string(report.anomalies[0].severity) == "High");
    }
}

TEST_CASE("Categories that are never tested", "[AnomalyDetector]") {
    AnomalyDetector detector;

    SECTION("Fewer than five transactions") {
        auto report = detector.detect(series("Pets", {1.0, 1.0, 1.0, 5000.0}), 0.5);
        REQUIRE(report.success);
        REQUIRE(report.anomalies.empty());
        REQUIRE(report.baselines.empty());
    }

    SECTION("Zero variance") {
        auto report = detector.detect(series("Insurance", {250.0, 250.0, 250.0, 250.0, 250.0, 250.0}), 0.1);
        REQUIRE(report.success);
        REQUIRE(report.anomalies.empty());
        REQUIRE(report.baselines.empty());
    }
}

TEST_CASE("Categories are tested independently", "[AnomalyDetector]") {
    // Housing amounts would dominate a pooled sample
    std::vector<data::Transaction> tx;
    append(tx, series("Housing", {1200, 1210, 1190, 1200, 1205}, 1));
    append(tx, series("Food", {40, 40, 40, 40, 40, 160}, 10));

    auto report = AnomalyDetector().detect(tx);

    REQUIRE(report.anomalies_found == 1);
    REQUIRE(report.anomalies[0].category == "Food");
    REQUIRE(report.anomalies[0].amount == 160.0);
    REQUIRE(report.baselines.size() == 2);
    REQUIRE(report.baselines[0].category == "Food");
    REQUIRE(report.baselines[1].category == "Housing");
}

TEST_CASE("Anomalies sorted by amount descending", "[AnomalyDetector]") {
    // one outlier among six: z = sqrt(5) > 2
    std::vector<data::Transaction> tx;
    append(tx, series("Entertainment", {20, 20, 20, 20, 20, 300}, 1));
    append(tx, series("Food", {50, 50, 50, 50, 50, 300}, 10));
    append(tx, series("Transportation", {100, 100, 100, 100, 100, 900}, 20));

    auto report = AnomalyDetector().detect(tx);

    REQUIRE(report.anomalies_found == 3);
    REQUIRE(report.anomalies[0].amount == 900.0);
    REQUIRE(report.anomalies[0].category == "Transportation");

    // equal amounts keep input order
    REQUIRE(report.anomalies[1].category == "Entertainment");
    REQUIRE(report.anomalies[2].category == "Food");
}

TEST_CASE("Empty input and bad thresholds", "[AnomalyDetector]") {
    AnomalyDetector detector;

    auto report = detector.detect({});
    REQUIRE_FALSE(report.success);
    REQUIRE(report.error == AnalyticsError::NO_TRANSACTIONS);
    REQUIRE(report.anomalies_found == 0);

    auto tx = series("Food", {1, 2, 3, 4, 5});
    REQUIRE_THROWS_AS(detector.detect(tx, 0.0), std::invalid_argument);
    REQUIRE_THROWS_AS(detector.detect(tx, -1.0), std::invalid_argument);
}

TEST_CASE("AnomalyConfig", "[AnomalyDetector]") {
    auto config = AnomalyConfig::from_json({{"threshold", 2.5}, {"min_transactions", 8}});
    REQUIRE(config.threshold == 2.5);
    REQUIRE(config.min_transactions == 8);
    REQUIRE(config.lookback_months == 3);

    REQUIRE_THROWS_AS(AnomalyConfig::from_json({{"threshold", 0.0}}), std::invalid_argument);
    REQUIRE_THROWS_AS(AnomalyConfig::from_json({{"min_transactions", 1}}), std::invalid_argument);

    SECTION("Configured threshold is the default for detect()") {
        auto tx = series("Food", {100.0, 100.0, 100.0, 100.0, 500.0});
        AnomalyConfig low;
        low.threshold = 1.5;
        REQUIRE(AnomalyDetector(low).detect(tx).anomalies_found == 1);
        REQUIRE(AnomalyDetector().detect(tx).anomalies_found == 0);
    }
}
