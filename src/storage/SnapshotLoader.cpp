#include "deltaledger/SnapshotLoader.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>
#include "deltaledger/Errors.hpp"
#include "deltaledger/FileSystem.hpp"
#include "deltaledger/Layout.hpp"

using json = nlohmann::json;

namespace deltaledger {

namespace {

const json* kindArray(const json& doc, const char* key) {
    auto it = doc.find(key);
    if (it == doc.end() || it->is_null()) return nullptr;
    if (!it->is_array()) throw MalformedSnapshotError(std::string("'") + key + "' is not an array");
    return &*it;
}

std::string describe(const json& record) {
    auto id = record.is_object() ? record.find("entityId") : record.end();
    if (record.is_object() && id != record.end() && id->is_string()) return id->get<std::string>();
    return "<no id>";
}

bool isTombstoneRecord(const json& record) {
    if (!record.is_object()) return false;
    auto it = record.find("isTombstone");
    return it != record.end() && it->is_boolean() && it->get<bool>();
}

// Tombstones left by compaction may carry only the envelope.
void addRecord(EntityStore& store, EntityKind kind, const json& record) {
    Entity entity;
    try {
        entity = entityFromJson(kind, record, isTombstoneRecord(record) ? FieldCheck::Lenient : FieldCheck::Required);
    } catch (const std::invalid_argument& e) {
        throw MalformedSnapshotError(std::string(entityTypeName(kind)) + " " + describe(record) + ": " + e.what());
    }
    if (store.findRevision(kind, entity.entityId)) {
        throw MalformedSnapshotError(std::string("duplicate ") + entityTypeName(kind) + " id " + entity.entityId);
    }
    Counter counter = entity.entityVersion.counter;
    store.applyRevision(entity);
    if (counter > store.report().snapshotKnowledge) store.report().snapshotKnowledge = counter;
}

// Parents may carry their children inline. A child without a parent
// reference inherits the enclosing parent's id.
void addWithChildren(EntityStore& store, EntityKind parentKind, const json& record,
                     const char* childrenKey, EntityKind childKind, const char* parentRef) {
    if (!record.is_object()) {
        throw MalformedSnapshotError(std::string(entityTypeName(parentKind)) + " record is not an object");
    }
    json parent = record;
    json children;
    if (auto it = parent.find(childrenKey); it != parent.end()) {
        children = std::move(*it);
        parent.erase(childrenKey);
    }
    addRecord(store, parentKind, parent);

    if (children.is_null()) return;
    if (!children.is_array()) {
        throw MalformedSnapshotError(std::string("'") + childrenKey + "' of " + describe(record) + " is not an array");
    }
    for (auto child : children) {
        if (child.is_object() && !child.contains(parentRef)) child[parentRef] = parent["entityId"];
        addRecord(store, childKind, child);
    }
}

} // namespace

SnapshotLoader::SnapshotLoader(std::shared_ptr<FileSystem> fs) : fs_(std::move(fs)) {}

EntityStore SnapshotLoader::load(const std::string& rootDir) const {
    const std::string path = layout::snapshotPath(rootDir);
    if (!fs_->exists(path)) throw MalformedSnapshotError("snapshot not found at " + path);

    std::string text;
    try {
        text = fs_->readFile(path);
    } catch (const FileSystemError& e) {
        throw MalformedSnapshotError(e.what());
    }

    EntityStore store(rootDir);
    parseInto(store, text);
    std::cerr << "SnapshotLoader: loaded " << store.revisionCount() << " entities from " << path
              << " knowledge=" << store.report().snapshotKnowledge << "\n";
    return store;
}

void SnapshotLoader::parseInto(EntityStore& store, const std::string& text) {
    json doc = json::parse(text, nullptr, false);
    if (doc.is_discarded()) throw MalformedSnapshotError("invalid JSON");
    if (!doc.is_object()) throw MalformedSnapshotError("root is not an object");

    for (EntityKind kind : allEntityKinds()) {
        const json* records = kindArray(doc, snapshotKey(kind));
        if (!records) continue;
        for (const auto& record : *records) {
            if (kind == EntityKind::MasterCategory) {
                addWithChildren(store, kind, record, "subCategories", EntityKind::SubCategory, "masterCategoryId");
            } else if (kind == EntityKind::MonthlyBudget) {
                addWithChildren(store, kind, record, "monthlySubCategoryBudgets",
                                EntityKind::MonthlyCategoryBudget, "parentMonthlyBudgetId");
            } else {
                addRecord(store, kind, record);
            }
        }
    }
    store.report().knowledge = store.report().snapshotKnowledge;
}

} // namespace deltaledger
