/**
 * @file analytics_error.hpp
 * @brief Failure kinds reported in analytics results.
 *
 * Expected, user-fixable failures (not enough history, no budget) are
 * reported through result structs carrying success = false, one of these
 * kinds and a message. Invalid arguments throw std::invalid_argument.
 */

#ifndef BUDGET_ANALYTICS_ANALYTICS_ERROR_HPP
#define BUDGET_ANALYTICS_ANALYTICS_ERROR_HPP

#include <string>

namespace budget
{
    namespace analytics
    {

        /**
         * @enum AnalyticsError
         * @brief Reason an analytics operation returned success = false.
         */
        enum class AnalyticsError
        {
            NONE,                 ///< Operation succeeded
            NO_TRANSACTIONS,      ///< No transactions in the lookback window
            INSUFFICIENT_HISTORY, ///< Fewer monthly data points than forecasting requires
            NO_BUDGET_CONFIGURED  ///< No budget entries for the requested month
        };

        inline std::string to_string(AnalyticsError error)
        {
            switch (error)
            {
            case AnalyticsError::NONE:
                return "None";
            case AnalyticsError::NO_TRANSACTIONS:
                return "NoTransactions";
            case AnalyticsError::INSUFFICIENT_HISTORY:
                return "InsufficientHistory";
            case AnalyticsError::NO_BUDGET_CONFIGURED:
                return "NoBudgetConfigured";
            }
            return "Unknown";
        }

    } // namespace analytics
} // namespace budget

#endif // BUDGET_ANALYTICS_ANALYTICS_ERROR_HPP
