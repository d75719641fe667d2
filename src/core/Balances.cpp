#include "deltaledger/Balances.hpp"

#include <algorithm>
#include <chrono>
#include <ctime>
#include <map>
#include <utility>

namespace deltaledger {

namespace {

bool startsWith(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

} // namespace

AccountBalance accountBalance(const EntityStore& store, const std::string& accountId,
                              const std::optional<std::string>& excludeDate) {
    AccountBalance balance;
    for (const Entity* e : store.entities(EntityKind::Transaction)) {
        const auto& txn = e->as<Transaction>();
        if (txn.accountId != accountId) continue;
        if (excludeDate && txn.date == *excludeDate) continue;
        if (txn.cleared == ClearedState::Uncleared) {
            balance.uncleared += txn.amount;
        } else {
            balance.cleared += txn.amount;
        }
    }
    return balance;
}

AccountBalance currentAccountBalance(const EntityStore& store, const std::string& accountId) {
    return accountBalance(store, accountId, todayUtc());
}

std::string todayUtc() {
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm utc{};
#if defined(_WIN32)
    gmtime_s(&utc, &now);
#else
    gmtime_r(&now, &utc);
#endif
    char buf[16];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d", &utc);
    return buf;
}

std::vector<CategoryMonthSummary> monthlySummary(const EntityStore& store, const std::string& month) {
    const Entity* budget = nullptr;
    for (const Entity* e : store.entities(EntityKind::MonthlyBudget)) {
        if (startsWith(e->as<MonthlyBudget>().month, month)) {
            budget = e;
            break;
        }
    }
    if (!budget) return {};

    // categoryId -> outflow for the month
    std::map<std::string, int64_t> outflow;
    for (const Entity* e : store.entities(EntityKind::Transaction)) {
        const auto& txn = e->as<Transaction>();
        if (!startsWith(txn.date, month)) continue;
        if (txn.subTransactions.empty()) {
            if (txn.categoryId && txn.amount < 0) outflow[*txn.categoryId] -= txn.amount;
            continue;
        }
        for (const auto& split : txn.subTransactions) {
            if (split.categoryId && split.amount < 0) outflow[*split.categoryId] -= split.amount;
        }
    }

    std::vector<CategoryMonthSummary> out;
    for (const Entity* e : store.entities(EntityKind::MonthlyCategoryBudget)) {
        const auto& line = e->as<MonthlyCategoryBudget>();
        if (line.parentMonthlyBudgetId != budget->entityId || line.budgeted <= 0) continue;
        const Entity* category = store.find(EntityKind::SubCategory, line.categoryId);
        if (!category) continue;

        CategoryMonthSummary row;
        row.categoryId = line.categoryId;
        row.categoryName = category->as<SubCategory>().name;
        row.budgeted = line.budgeted;
        if (auto it = outflow.find(line.categoryId); it != outflow.end()) row.outflow = it->second;
        out.push_back(std::move(row));
    }
    std::sort(out.begin(), out.end(), [](const CategoryMonthSummary& a, const CategoryMonthSummary& b) {
        return a.categoryName < b.categoryName;
    });
    return out;
}

} // namespace deltaledger
