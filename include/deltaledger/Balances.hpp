#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "deltaledger/EntityStore.hpp"

namespace deltaledger {

// Minor currency units.
struct AccountBalance {
    int64_t cleared = 0;    // Cleared and Reconciled transactions
    int64_t uncleared = 0;  // everything else

    int64_t total() const { return cleared + uncleared; }
};

// Transactions dated excludeDate ("YYYY-MM-DD") are left out, which keeps
// same-day pending activity out of the figures.
AccountBalance accountBalance(const EntityStore& store, const std::string& accountId,
                              const std::optional<std::string>& excludeDate = std::nullopt);

// Balance as the account register shows it: today's transactions (UTC) excluded.
AccountBalance currentAccountBalance(const EntityStore& store, const std::string& accountId);

// Current UTC date as "YYYY-MM-DD".
std::string todayUtc();

struct CategoryMonthSummary {
    std::string categoryId;
    std::string categoryName;
    int64_t budgeted = 0;
    int64_t outflow = 0;  // absolute sum of negative amounts
};

// Categories with a positive budgeted amount in the monthly budget for month
// ("YYYY-MM"), sorted by category name. Split transactions count per split
// category. Empty when the month has no budget.
std::vector<CategoryMonthSummary> monthlySummary(const EntityStore& store, const std::string& month);

} // namespace deltaledger
