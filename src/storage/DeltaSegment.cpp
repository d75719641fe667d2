#include "deltaledger/DeltaSegment.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <stdexcept>
#include "deltaledger/FileSystem.hpp"
#include "deltaledger/Layout.hpp"

using json = nlohmann::json;

namespace deltaledger {

namespace {

bool parseDecimal(const std::string& digits, Counter& out) {
    if (digits.empty() || digits.size() > 19) return false;
    if (!std::all_of(digits.begin(), digits.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) return false;
    out = std::stoull(digits);
    return true;
}

std::string headerString(const json& doc, const char* key) {
    auto it = doc.find(key);
    return it != doc.end() && it->is_string() ? it->get<std::string>() : std::string();
}

const char* const kRequiredEnvelope[] = {"entityType", "entityId", "entityVersion", "isTombstone"};

} // namespace

std::string segmentFileName(const CounterRange& range) {
    return std::to_string(range.start) + "_" + std::to_string(range.end) + layout::kSegmentExtension;
}

std::optional<CounterRange> parseSegmentFileName(const std::string& name) {
    const std::string ext = layout::kSegmentExtension;
    if (name.size() <= ext.size() || name.compare(name.size() - ext.size(), ext.size(), ext) != 0) {
        return std::nullopt;
    }
    std::string base = name.substr(0, name.size() - ext.size());
    auto underscore = base.find('_');
    if (underscore == std::string::npos || base.find('_', underscore + 1) != std::string::npos) return std::nullopt;

    CounterRange range;
    if (!parseDecimal(base.substr(0, underscore), range.start)) return std::nullopt;
    if (!parseDecimal(base.substr(underscore + 1), range.end)) return std::nullopt;
    if (range.start == 0 || range.start > range.end) return std::nullopt;
    return range;
}

std::vector<SegmentRef> listSegments(const FileSystem& fs, const std::string& writerDir, const std::string& writerGuid) {
    std::vector<SegmentRef> out;
    for (const auto& name : fs.listDirectory(writerDir)) {
        auto range = parseSegmentFileName(name);
        if (!range) {
            if (name.size() > 6 && name.compare(name.size() - 6, 6, layout::kSegmentExtension) == 0) {
                std::cerr << "DeltaSegment: ignoring badly named segment " << layout::join(writerDir, name) << "\n";
            }
            continue;
        }
        out.push_back(SegmentRef{writerGuid, name, layout::join(writerDir, name), *range});
    }
    return out;
}

DeltaSegment parseDeltaSegment(const std::string& fileName, const CounterRange& range, const std::string& text) {
    json doc = json::parse(text, nullptr, false);
    if (doc.is_discarded()) throw MalformedDeltaError(fileName, "invalid JSON");
    if (!doc.is_object()) throw MalformedDeltaError(fileName, "root is not an object");

    auto items = doc.find("items");
    if (items == doc.end() || !items->is_array()) throw MalformedDeltaError(fileName, "missing 'items' array");

    DeltaSegment segment;
    segment.range = range;
    segment.deviceGuid = headerString(doc, "deviceGuid");
    segment.shortDeviceId = headerString(doc, "shortDeviceId");
    segment.publishTime = headerString(doc, "publishTime");
    if (auto fv = headerString(doc, "formatVersion"); !fv.empty()) segment.formatVersion = fv;

    size_t position = 0;
    for (const auto& item : *items) {
        const std::string where = "item " + std::to_string(position++);
        if (!item.is_object()) throw MalformedDeltaError(fileName, where + " is not an object");
        for (const char* key : kRequiredEnvelope) {
            if (!item.contains(key)) {
                throw MalformedDeltaError(fileName, where + " is missing '" + key + "'");
            }
        }
        const auto& type = item["entityType"];
        const auto& id = item["entityId"];
        if (!type.is_string() || !id.is_string() || !item["isTombstone"].is_boolean()) {
            throw MalformedDeltaError(fileName, where + " has a malformed envelope");
        }

        auto kind = parseEntityType(type.get<std::string>());
        if (!kind) {
            segment.unknownRecords.emplace_back(type.get<std::string>(), id.get<std::string>());
            continue;
        }

        const bool tombstone = item["isTombstone"].get<bool>();
        Entity entity;
        try {
            entity = entityFromJson(*kind, item, tombstone ? FieldCheck::Lenient : FieldCheck::Required);
        } catch (const std::invalid_argument& e) {
            throw MalformedDeltaError(fileName, where + " (" + id.get<std::string>() + "): " + e.what());
        }
        if (!range.contains(entity.entityVersion.counter)) {
            throw MalformedDeltaError(fileName, where + " is stamped " + entity.entityVersion.toString() +
                                                    " outside the segment range");
        }
        segment.items.push_back(std::move(entity));
    }
    return segment;
}

std::string serializeDeltaSegment(const DeltaSegment& segment) {
    json items = json::array();
    for (const auto& entity : segment.items) items.push_back(entityToJson(entity, true));

    json doc = {
        {"deviceGuid", segment.deviceGuid},
        {"shortDeviceId", segment.shortDeviceId},
        {"startVersion", segment.range.start},
        {"endVersion", segment.range.end},
        {"formatVersion", segment.formatVersion},
        {"publishTime", segment.publishTime},
        {"items", std::move(items)}
    };
    return doc.dump(2);
}

} // namespace deltaledger
