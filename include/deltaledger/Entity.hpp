#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>

namespace deltaledger {

using Counter = uint64_t;

// (writerTag, counter) stamp serialized as "A-86". Counters are minted so
// that they are totally ordered across writers.
struct EntityVersion {
    std::string writerTag;
    Counter counter = 0;

    std::string toString() const;

    // Accepts "A-86" and the composite form "A-11,B-63" (highest counter wins).
    // Throws std::invalid_argument on anything else.
    static EntityVersion parse(const std::string& text);

    bool operator==(const EntityVersion& other) const {
        return writerTag == other.writerTag && counter == other.counter;
    }
    bool operator!=(const EntityVersion& other) const { return !(*this == other); }
};

bool isValidWriterTag(const std::string& tag);

// Order matches the alternatives of EntityFields.
enum class EntityKind {
    Account,
    Payee,
    PayeeRenamingRule,
    MasterCategory,
    SubCategory,
    MonthlyBudget,
    MonthlyCategoryBudget,
    Transaction,
    ScheduledTransaction
};

const std::vector<EntityKind>& allEntityKinds();

// Discriminator used in delta items ("transaction", "masterCategory", ...).
const char* entityTypeName(EntityKind kind);

// Snapshot key holding the records of a kind ("transactions", ...).
const char* snapshotKey(EntityKind kind);

// Unknown discriminators yield std::nullopt.
std::optional<EntityKind> parseEntityType(const std::string& name);

enum class ClearedState { Uncleared, Cleared, Reconciled };

const char* clearedStateName(ClearedState state);
ClearedState parseClearedState(const std::string& name);

struct Account {
    std::string accountName;
    std::string accountType;
    bool onBudget = true;
    bool hidden = false;
    int64_t sortableIndex = 0;
    std::optional<std::string> note;
};

struct Payee {
    std::string name;
    bool enabled = true;
    std::optional<std::string> autoFillCategoryId;
};

// Maps an imported payee string onto a standardized payee.
struct PayeeRenamingRule {
    std::string operand;
    std::string op = "Contains";
    std::string targetPayeeId;
};

struct MasterCategory {
    std::string name;
    std::string type = "OUTFLOW";
    int64_t sortableIndex = 0;
    bool expanded = true;
    bool deleteable = true;
};

struct SubCategory {
    std::string name;
    std::string masterCategoryId;
    std::string type = "OUTFLOW";
    int64_t sortableIndex = 0;
};

struct MonthlyBudget {
    std::string month;
    std::optional<std::string> note;
};

struct MonthlyCategoryBudget {
    std::string parentMonthlyBudgetId;
    std::string categoryId;
    int64_t budgeted = 0;
    std::optional<std::string> overspendingHandling;
    std::optional<std::string> note;
};

struct SubTransaction {
    std::string entityId;
    int64_t amount = 0;
    std::optional<std::string> categoryId;
    std::optional<std::string> payeeId;
    std::optional<std::string> memo;
};

// Amounts are integer minor currency units.
struct Transaction {
    std::string accountId;
    std::string date;
    int64_t amount = 0;
    std::optional<std::string> payeeId;
    std::optional<std::string> categoryId;
    ClearedState cleared = ClearedState::Uncleared;
    bool accepted = true;
    std::optional<std::string> memo;
    std::vector<SubTransaction> subTransactions;
};

struct ScheduledTransaction {
    std::string frequency;
    int64_t amount = 0;
    std::optional<std::string> accountId;
    std::optional<std::string> payeeId;
    std::optional<std::string> categoryId;
    std::optional<std::string> date;
    std::optional<std::string> memo;
};

using EntityFields = std::variant<Account,
                                  Payee,
                                  PayeeRenamingRule,
                                  MasterCategory,
                                  SubCategory,
                                  MonthlyBudget,
                                  MonthlyCategoryBudget,
                                  Transaction,
                                  ScheduledTransaction>;

struct Entity {
    std::string entityId;
    EntityVersion entityVersion;
    bool isTombstone = false;
    EntityFields fields;
    // Fields this build does not know about, written back verbatim.
    nlohmann::json extras = nlohmann::json::object();

    EntityKind kind() const { return static_cast<EntityKind>(fields.index()); }

    template <typename T>
    T& as() { return std::get<T>(fields); }

    template <typename T>
    const T& as() const { return std::get<T>(fields); }
};

// Entity of the given kind with default field values.
Entity makeEntity(EntityKind kind, const std::string& entityId);

enum class FieldCheck { Required, Lenient };

// Parse one record (envelope + fields). Throws std::invalid_argument when the
// envelope or, under FieldCheck::Required, a required field is missing or
// has the wrong type.
Entity entityFromJson(EntityKind kind, const nlohmann::json& record, FieldCheck check = FieldCheck::Required);

// Serialize envelope + full field set. withType adds the "entityType" key
// used by delta items.
nlohmann::json entityToJson(const Entity& entity, bool withType);

// Field-by-field equality, envelope included.
bool sameRevision(const Entity& a, const Entity& b);

} // namespace deltaledger
