#include "deltaledger/Entity.hpp"

#include <algorithm>
#include <cctype>
#include <limits>
#include <set>
#include <stdexcept>

using json = nlohmann::json;

namespace deltaledger {

namespace {

const char* const kEnvelopeKeys[] = {"entityId", "entityVersion", "isTombstone", "entityType"};

// Reads typed fields out of one record and remembers which keys it consumed,
// so the leftovers can be kept as extras.
class FieldReader {
public:
    FieldReader(const json& record, FieldCheck check) : record_(record), check_(check) {
        for (const char* key : kEnvelopeKeys) consumed_.insert(key);
    }

    std::string str(const char* key) {
        auto value = optStr(key);
        if (!value) {
            if (check_ == FieldCheck::Lenient) return {};
            throw std::invalid_argument(std::string("missing required field '") + key + "'");
        }
        return *value;
    }

    std::string strOr(const char* key, const std::string& fallback) {
        auto value = optStr(key);
        return value ? *value : fallback;
    }

    std::optional<std::string> optStr(const char* key) {
        consumed_.insert(key);
        auto it = record_.find(key);
        if (it == record_.end() || it->is_null()) return std::nullopt;
        if (!it->is_string()) {
            if (check_ == FieldCheck::Lenient) return std::nullopt;
            throw std::invalid_argument(std::string("field '") + key + "' must be a string");
        }
        return it->get<std::string>();
    }

    int64_t integer(const char* key) {
        auto value = optInteger(key);
        if (!value) {
            if (check_ == FieldCheck::Lenient) return 0;
            throw std::invalid_argument(std::string("missing required field '") + key + "'");
        }
        return *value;
    }

    int64_t integerOr(const char* key, int64_t fallback) {
        auto value = optInteger(key);
        return value ? *value : fallback;
    }

    bool boolOr(const char* key, bool fallback) {
        consumed_.insert(key);
        auto it = record_.find(key);
        if (it == record_.end() || it->is_null()) return fallback;
        if (!it->is_boolean()) {
            if (check_ == FieldCheck::Lenient) return fallback;
            throw std::invalid_argument(std::string("field '") + key + "' must be a boolean");
        }
        return it->get<bool>();
    }

    const json* array(const char* key) {
        consumed_.insert(key);
        auto it = record_.find(key);
        if (it == record_.end() || it->is_null()) return nullptr;
        if (!it->is_array()) {
            if (check_ == FieldCheck::Lenient) return nullptr;
            throw std::invalid_argument(std::string("field '") + key + "' must be an array");
        }
        return &*it;
    }

    json rest() const {
        json out = json::object();
        for (auto it = record_.begin(); it != record_.end(); ++it) {
            if (!consumed_.count(it.key())) out[it.key()] = it.value();
        }
        return out;
    }

private:
    std::optional<int64_t> optInteger(const char* key) {
        consumed_.insert(key);
        auto it = record_.find(key);
        if (it == record_.end() || it->is_null()) return std::nullopt;
        const bool fits = it->is_number_integer() &&
                          !(it->is_number_unsigned() &&
                            it->get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max()));
        if (!fits) {
            if (check_ == FieldCheck::Lenient) return std::nullopt;
            throw std::invalid_argument(std::string("field '") + key + "' must be a 64-bit signed integer");
        }
        return it->get<int64_t>();
    }

    const json& record_;
    FieldCheck check_;
    std::set<std::string> consumed_;
};

void putOptional(json& out, const char* key, const std::optional<std::string>& value) {
    if (value) out[key] = *value;
}

SubTransaction readSplit(const json& node, FieldCheck check) {
    if (!node.is_object()) throw std::invalid_argument("sub-transaction must be an object");
    FieldReader r(node, check);
    SubTransaction split;
    split.entityId = r.str("entityId");
    split.amount = r.integer("amount");
    split.categoryId = r.optStr("categoryId");
    split.payeeId = r.optStr("payeeId");
    split.memo = r.optStr("memo");
    return split;
}

EntityFields readFields(EntityKind kind, FieldReader& r, FieldCheck check) {
    switch (kind) {
    case EntityKind::Account: {
        Account a;
        a.accountName = r.str("accountName");
        a.accountType = r.str("accountType");
        a.onBudget = r.boolOr("onBudget", true);
        a.hidden = r.boolOr("hidden", false);
        a.sortableIndex = r.integerOr("sortableIndex", 0);
        a.note = r.optStr("note");
        return a;
    }
    case EntityKind::Payee: {
        Payee p;
        p.name = r.str("name");
        p.enabled = r.boolOr("enabled", true);
        p.autoFillCategoryId = r.optStr("autoFillCategoryId");
        return p;
    }
    case EntityKind::PayeeRenamingRule: {
        PayeeRenamingRule rule;
        rule.operand = r.str("operand");
        rule.op = r.strOr("operator", "Contains");
        rule.targetPayeeId = r.str("targetPayeeId");
        return rule;
    }
    case EntityKind::MasterCategory: {
        MasterCategory m;
        m.name = r.str("name");
        m.type = r.strOr("type", "OUTFLOW");
        m.sortableIndex = r.integerOr("sortableIndex", 0);
        m.expanded = r.boolOr("expanded", true);
        m.deleteable = r.boolOr("deleteable", true);
        return m;
    }
    case EntityKind::SubCategory: {
        SubCategory c;
        c.name = r.str("name");
        c.masterCategoryId = r.str("masterCategoryId");
        c.type = r.strOr("type", "OUTFLOW");
        c.sortableIndex = r.integerOr("sortableIndex", 0);
        return c;
    }
    case EntityKind::MonthlyBudget: {
        MonthlyBudget mb;
        mb.month = r.str("month");
        mb.note = r.optStr("note");
        return mb;
    }
    case EntityKind::MonthlyCategoryBudget: {
        MonthlyCategoryBudget line;
        line.parentMonthlyBudgetId = r.str("parentMonthlyBudgetId");
        line.categoryId = r.str("categoryId");
        line.budgeted = r.integer("budgeted");
        line.overspendingHandling = r.optStr("overspendingHandling");
        line.note = r.optStr("note");
        return line;
    }
    case EntityKind::Transaction: {
        Transaction t;
        t.accountId = r.str("accountId");
        t.date = r.str("date");
        t.amount = r.integer("amount");
        t.payeeId = r.optStr("payeeId");
        t.categoryId = r.optStr("categoryId");
        if (check == FieldCheck::Lenient) {
            try {
                t.cleared = parseClearedState(r.strOr("cleared", "Uncleared"));
            } catch (const std::invalid_argument&) {
                t.cleared = ClearedState::Uncleared;
            }
        } else {
            t.cleared = parseClearedState(r.strOr("cleared", "Uncleared"));
        }
        t.accepted = r.boolOr("accepted", true);
        t.memo = r.optStr("memo");
        if (const json* splits = r.array("subTransactions")) {
            for (const auto& node : *splits) t.subTransactions.push_back(readSplit(node, check));
        }
        return t;
    }
    case EntityKind::ScheduledTransaction: {
        ScheduledTransaction s;
        s.frequency = r.str("frequency");
        s.amount = r.integer("amount");
        s.accountId = r.optStr("accountId");
        s.payeeId = r.optStr("payeeId");
        s.categoryId = r.optStr("categoryId");
        s.date = r.optStr("date");
        s.memo = r.optStr("memo");
        return s;
    }
    }
    throw std::invalid_argument("unhandled entity kind");
}

struct FieldWriter {
    json& out;

    void operator()(const Account& a) const {
        out["accountName"] = a.accountName;
        out["accountType"] = a.accountType;
        out["onBudget"] = a.onBudget;
        out["hidden"] = a.hidden;
        out["sortableIndex"] = a.sortableIndex;
        putOptional(out, "note", a.note);
    }
    void operator()(const Payee& p) const {
        out["name"] = p.name;
        out["enabled"] = p.enabled;
        putOptional(out, "autoFillCategoryId", p.autoFillCategoryId);
    }
    void operator()(const PayeeRenamingRule& rule) const {
        out["operand"] = rule.operand;
        out["operator"] = rule.op;
        out["targetPayeeId"] = rule.targetPayeeId;
    }
    void operator()(const MasterCategory& m) const {
        out["name"] = m.name;
        out["type"] = m.type;
        out["sortableIndex"] = m.sortableIndex;
        out["expanded"] = m.expanded;
        out["deleteable"] = m.deleteable;
    }
    void operator()(const SubCategory& c) const {
        out["name"] = c.name;
        out["masterCategoryId"] = c.masterCategoryId;
        out["type"] = c.type;
        out["sortableIndex"] = c.sortableIndex;
    }
    void operator()(const MonthlyBudget& mb) const {
        out["month"] = mb.month;
        putOptional(out, "note", mb.note);
    }
    void operator()(const MonthlyCategoryBudget& line) const {
        out["parentMonthlyBudgetId"] = line.parentMonthlyBudgetId;
        out["categoryId"] = line.categoryId;
        out["budgeted"] = line.budgeted;
        putOptional(out, "overspendingHandling", line.overspendingHandling);
        putOptional(out, "note", line.note);
    }
    void operator()(const Transaction& t) const {
        out["accountId"] = t.accountId;
        out["date"] = t.date;
        out["amount"] = t.amount;
        putOptional(out, "payeeId", t.payeeId);
        putOptional(out, "categoryId", t.categoryId);
        out["cleared"] = clearedStateName(t.cleared);
        out["accepted"] = t.accepted;
        putOptional(out, "memo", t.memo);
        if (!t.subTransactions.empty()) {
            json splits = json::array();
            for (const auto& split : t.subTransactions) {
                json s = {{"entityId", split.entityId}, {"amount", split.amount}};
                putOptional(s, "categoryId", split.categoryId);
                putOptional(s, "payeeId", split.payeeId);
                putOptional(s, "memo", split.memo);
                splits.push_back(std::move(s));
            }
            out["subTransactions"] = std::move(splits);
        }
    }
    void operator()(const ScheduledTransaction& s) const {
        out["frequency"] = s.frequency;
        out["amount"] = s.amount;
        putOptional(out, "accountId", s.accountId);
        putOptional(out, "payeeId", s.payeeId);
        putOptional(out, "categoryId", s.categoryId);
        putOptional(out, "date", s.date);
        putOptional(out, "memo", s.memo);
    }
};

struct KindInfo {
    EntityKind kind;
    const char* typeName;
    const char* snapshotKey;
};

const KindInfo kKinds[] = {
    {EntityKind::Account, "account", "accounts"},
    {EntityKind::Payee, "payee", "payees"},
    {EntityKind::PayeeRenamingRule, "payeeRenamingRule", "payeeRenamingRules"},
    {EntityKind::MasterCategory, "masterCategory", "masterCategories"},
    {EntityKind::SubCategory, "category", "categories"},
    {EntityKind::MonthlyBudget, "monthlyBudget", "monthlyBudgets"},
    {EntityKind::MonthlyCategoryBudget, "monthlyCategoryBudget", "monthlyCategoryBudgets"},
    {EntityKind::Transaction, "transaction", "transactions"},
    {EntityKind::ScheduledTransaction, "scheduledTransaction", "scheduledTransactions"},
};

const KindInfo& infoFor(EntityKind kind) {
    for (const auto& info : kKinds) {
        if (info.kind == kind) return info;
    }
    throw std::invalid_argument("unhandled entity kind");
}

} // namespace

bool isValidWriterTag(const std::string& tag) {
    if (tag.empty()) return false;
    return std::all_of(tag.begin(), tag.end(), [](unsigned char c) { return c >= 'A' && c <= 'Z'; });
}

std::string EntityVersion::toString() const {
    return writerTag + "-" + std::to_string(counter);
}

EntityVersion EntityVersion::parse(const std::string& text) {
    std::optional<EntityVersion> best;
    size_t start = 0;
    while (start <= text.size()) {
        size_t comma = text.find(',', start);
        std::string part = text.substr(start, comma == std::string::npos ? std::string::npos : comma - start);
        // trim
        auto first = part.find_first_not_of(' ');
        auto last = part.find_last_not_of(' ');
        part = first == std::string::npos ? std::string() : part.substr(first, last - first + 1);

        auto dash = part.find('-');
        if (dash == std::string::npos || dash + 1 >= part.size()) {
            throw std::invalid_argument("invalid version stamp '" + text + "'");
        }
        EntityVersion v;
        v.writerTag = part.substr(0, dash);
        std::string digits = part.substr(dash + 1);
        if (!isValidWriterTag(v.writerTag) ||
            !std::all_of(digits.begin(), digits.end(), [](unsigned char c) { return std::isdigit(c) != 0; }) ||
            digits.size() > 19) {
            throw std::invalid_argument("invalid version stamp '" + text + "'");
        }
        v.counter = std::stoull(digits);
        if (!best || v.counter > best->counter ||
            (v.counter == best->counter && v.writerTag > best->writerTag)) {
            best = v;
        }
        if (comma == std::string::npos) break;
        start = comma + 1;
    }
    if (!best) throw std::invalid_argument("invalid version stamp '" + text + "'");
    return *best;
}

const std::vector<EntityKind>& allEntityKinds() {
    static const std::vector<EntityKind> kinds = [] {
        std::vector<EntityKind> out;
        for (const auto& info : kKinds) out.push_back(info.kind);
        return out;
    }();
    return kinds;
}

const char* entityTypeName(EntityKind kind) { return infoFor(kind).typeName; }

const char* snapshotKey(EntityKind kind) { return infoFor(kind).snapshotKey; }

std::optional<EntityKind> parseEntityType(const std::string& name) {
    for (const auto& info : kKinds) {
        if (name == info.typeName) return info.kind;
    }
    if (name == "payeeStringCondition") return EntityKind::PayeeRenamingRule;
    return std::nullopt;
}

const char* clearedStateName(ClearedState state) {
    switch (state) {
    case ClearedState::Cleared: return "Cleared";
    case ClearedState::Reconciled: return "Reconciled";
    case ClearedState::Uncleared: break;
    }
    return "Uncleared";
}

ClearedState parseClearedState(const std::string& name) {
    if (name == "Uncleared") return ClearedState::Uncleared;
    if (name == "Cleared") return ClearedState::Cleared;
    if (name == "Reconciled") return ClearedState::Reconciled;
    throw std::invalid_argument("invalid cleared state '" + name + "'");
}

Entity makeEntity(EntityKind kind, const std::string& entityId) {
    Entity e;
    e.entityId = entityId;
    switch (kind) {
    case EntityKind::Account: e.fields = Account{}; break;
    case EntityKind::Payee: e.fields = Payee{}; break;
    case EntityKind::PayeeRenamingRule: e.fields = PayeeRenamingRule{}; break;
    case EntityKind::MasterCategory: e.fields = MasterCategory{}; break;
    case EntityKind::SubCategory: e.fields = SubCategory{}; break;
    case EntityKind::MonthlyBudget: e.fields = MonthlyBudget{}; break;
    case EntityKind::MonthlyCategoryBudget: e.fields = MonthlyCategoryBudget{}; break;
    case EntityKind::Transaction: e.fields = Transaction{}; break;
    case EntityKind::ScheduledTransaction: e.fields = ScheduledTransaction{}; break;
    }
    return e;
}

Entity entityFromJson(EntityKind kind, const json& record, FieldCheck check) {
    if (!record.is_object()) throw std::invalid_argument("record is not an object");

    auto id = record.find("entityId");
    if (id == record.end() || !id->is_string() || id->get<std::string>().empty()) {
        throw std::invalid_argument("missing required field 'entityId'");
    }
    auto version = record.find("entityVersion");
    if (version == record.end() || !version->is_string()) {
        throw std::invalid_argument("missing required field 'entityVersion'");
    }
    auto tombstone = record.find("isTombstone");
    if (tombstone != record.end() && !tombstone->is_null() && !tombstone->is_boolean()) {
        throw std::invalid_argument("field 'isTombstone' must be a boolean");
    }

    Entity e;
    e.entityId = id->get<std::string>();
    e.entityVersion = EntityVersion::parse(version->get<std::string>());
    e.isTombstone = tombstone != record.end() && tombstone->is_boolean() && tombstone->get<bool>();

    FieldReader reader(record, check);
    e.fields = readFields(kind, reader, check);
    e.extras = reader.rest();
    return e;
}

json entityToJson(const Entity& entity, bool withType) {
    json out = entity.extras.is_object() ? entity.extras : json::object();
    std::visit(FieldWriter{out}, entity.fields);
    if (withType) out["entityType"] = entityTypeName(entity.kind());
    out["entityId"] = entity.entityId;
    out["entityVersion"] = entity.entityVersion.toString();
    out["isTombstone"] = entity.isTombstone;
    return out;
}

bool sameRevision(const Entity& a, const Entity& b) {
    return a.kind() == b.kind() && entityToJson(a, false) == entityToJson(b, false);
}

} // namespace deltaledger
