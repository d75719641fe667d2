#include "deltaledger/Balances.hpp"

#include <iostream>
#include <string>
#include "deltaledger/SnapshotLoader.hpp"
#include "TestSupport.hpp"

using namespace deltaledger;
using namespace testsupport;

static json txn(const std::string& id, const std::string& date, int64_t amount, const std::string& cleared,
                const std::string& categoryId = "") {
    json t = transactionRecord(id, "A-5", amount);
    t["date"] = date;
    t["cleared"] = cleared;
    if (!categoryId.empty()) t["categoryId"] = categoryId;
    return t;
}

int main() {
    json split = txn("t5", "2025-08-20", -9000, "Cleared");
    split["subTransactions"] = json::array({{{"entityId", "s1"}, {"amount", -6000}, {"categoryId", "food"}},
                                            {{"entityId", "s2"}, {"amount", -3000}, {"categoryId", "fun"}}});
    json deleted = txn("t6", "2025-08-21", -100000, "Cleared", "food");
    deleted["isTombstone"] = true;

    json snapshot = {
        {"masterCategories",
         json::array({{{"entityId", "m1"}, {"entityVersion", "A-1"}, {"name", "Everyday"},
                       {"subCategories", json::array({{{"entityId", "food"}, {"entityVersion", "A-1"}, {"name", "Food"}},
                                                      {{"entityId", "fun"}, {"entityVersion", "A-1"}, {"name", "Fun"}},
                                                      {{"entityId", "rent"}, {"entityVersion", "A-1"}, {"name", "Rent"}}})}}})},
        {"monthlyBudgets",
         json::array({{{"entityId", "mb-08"}, {"entityVersion", "A-2"}, {"month", "2025-08-01"},
                       {"monthlySubCategoryBudgets",
                        json::array({{{"entityId", "l1"}, {"entityVersion", "A-2"}, {"categoryId", "food"}, {"budgeted", 40000}},
                                     {{"entityId", "l2"}, {"entityVersion", "A-2"}, {"categoryId", "fun"}, {"budgeted", 5000}},
                                     {{"entityId", "l3"}, {"entityVersion", "A-2"}, {"categoryId", "rent"}, {"budgeted", 0}}})}}})},
        {"transactions", json::array({txn("t1", "2025-08-02", -2500, "Cleared", "food"),
                                      txn("t2", "2025-08-03", -1500, "Reconciled", "food"),
                                      txn("t3", "2025-08-04", 300000, "Uncleared"),
                                      txn("t4", "2025-07-30", -700, "Uncleared", "food"),
                                      split, deleted})}};

    EntityStore store;
    SnapshotLoader::parseInto(store, snapshot.dump());

    AccountBalance balance = accountBalance(store, "acct1");
    expect(balance.cleared == -2500 - 1500 - 9000, "cleared and reconciled");
    expect(balance.uncleared == 300000 - 700, "uncleared");
    expect(balance.total() == balance.cleared + balance.uncleared, "total");

    AccountBalance excluding = accountBalance(store, "acct1", std::string("2025-08-04"));
    expect(excluding.uncleared == -700, "same-day transaction excluded");
    expect(accountBalance(store, "nobody").total() == 0, "unknown account");

    const std::string today = todayUtc();
    expect(today.size() == 10 && today[4] == '-' && today[7] == '-', "today formatted as a date");
    EntityStore withToday;
    SnapshotLoader::parseInto(withToday, json{{"transactions", json::array({txn("t1", "2025-08-02", -2500, "Cleared"),
                                                                            txn("t2", today, -400, "Cleared"),
                                                                            txn("t3", today, 900, "Uncleared")})}}
                                             .dump());
    AccountBalance current = currentAccountBalance(withToday, "acct1");
    expect(current.cleared == -2500 && current.uncleared == 0, "current balance leaves out today");
    expect(accountBalance(withToday, "acct1").total() == -2500 - 400 + 900, "plain balance keeps today");

    auto summary = monthlySummary(store, "2025-08");
    expect(summary.size() == 2, "zero-budget category left out");
    expect(summary[0].categoryName == "Food" && summary[0].budgeted == 40000, "food line");
    expect(summary[0].outflow == 2500 + 1500 + 6000, "food outflow includes its split");
    expect(summary[1].categoryName == "Fun" && summary[1].outflow == 3000, "fun outflow from split");
    expect(monthlySummary(store, "2025-09").empty(), "month without budget");

    std::cout << "All tests passed." << std::endl;
    return 0;
}
