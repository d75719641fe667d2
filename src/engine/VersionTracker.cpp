#include "deltaledger/VersionTracker.hpp"

#include <algorithm>
#include <array>
#include <iomanip>
#include <iostream>
#include <limits>
#include <random>
#include <set>
#include <sstream>
#include <utility>
#include "deltaledger/FileSystem.hpp"
#include "deltaledger/Layout.hpp"

using json = nlohmann::json;

namespace deltaledger {

namespace {

// RFC4122 version 4, upper case.
std::string generateGuid() {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    std::array<uint8_t, 16> id{};
    for (auto& b : id) b = static_cast<uint8_t>(rng());
    id[6] = (id[6] & 0x0F) | 0x40;
    id[8] = (id[8] & 0x3F) | 0x80;

    std::ostringstream oss;
    for (size_t i = 0; i < id.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) oss << "-";
        oss << std::uppercase << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(id[i]);
    }
    return oss.str();
}

Counter readCounter(const json& j, const char* key, const std::string& path, bool required) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        if (required) throw DeviceMetadataCorruptError(path, std::string("missing '") + key + "'");
        return 0;
    }
    if (it->is_number_unsigned()) return it->get<Counter>();
    if (it->is_number_integer() && it->get<int64_t>() >= 0) return static_cast<Counter>(it->get<int64_t>());
    throw DeviceMetadataCorruptError(path, std::string("'") + key + "' is not a non-negative integer");
}

const char* const kKnownMetaKeys[] = {"deviceGuid", "shortDeviceId", "friendlyName", "knowledge",
                                      "knowledgeInFullSnapshot", "hasFullKnowledge", "formatVersion"};

} // namespace

json WriterRecord::toJson() const {
    json out = extras.is_object() ? extras : json::object();
    out["deviceGuid"] = writerGuid;
    out["shortDeviceId"] = writerTag;
    out["friendlyName"] = friendlyName;
    out["knowledge"] = knowledge;
    out["knowledgeInFullSnapshot"] = knowledgeInFullSnapshot;
    out["hasFullKnowledge"] = hasFullKnowledge;
    out["formatVersion"] = formatVersion;
    return out;
}

WriterRecord WriterRecord::fromJson(const json& j, const std::string& path) {
    if (!j.is_object()) throw DeviceMetadataCorruptError(path, "root is not an object");

    WriterRecord r;
    auto guid = j.find("deviceGuid");
    if (guid == j.end() || !guid->is_string() || guid->get<std::string>().empty()) {
        throw DeviceMetadataCorruptError(path, "missing 'deviceGuid'");
    }
    r.writerGuid = guid->get<std::string>();

    auto tag = j.find("shortDeviceId");
    if (tag == j.end() || !tag->is_string() || !isValidWriterTag(tag->get<std::string>())) {
        throw DeviceMetadataCorruptError(path, "missing or invalid 'shortDeviceId'");
    }
    r.writerTag = tag->get<std::string>();

    r.knowledge = readCounter(j, "knowledge", path, true);
    r.knowledgeInFullSnapshot = readCounter(j, "knowledgeInFullSnapshot", path, false);

    if (auto full = j.find("hasFullKnowledge"); full != j.end() && !full->is_null()) {
        if (!full->is_boolean()) throw DeviceMetadataCorruptError(path, "'hasFullKnowledge' is not a boolean");
        r.hasFullKnowledge = full->get<bool>();
    }
    if (auto name = j.find("friendlyName"); name != j.end() && name->is_string()) {
        r.friendlyName = name->get<std::string>();
    }
    if (auto fv = j.find("formatVersion"); fv != j.end() && fv->is_string()) {
        r.formatVersion = fv->get<std::string>();
    }

    for (auto it = j.begin(); it != j.end(); ++it) {
        bool known = std::any_of(std::begin(kKnownMetaKeys), std::end(kKnownMetaKeys),
                                 [&](const char* k) { return it.key() == k; });
        if (!known) r.extras[it.key()] = it.value();
    }
    return r;
}

Counter globalKnowledge(const std::vector<WriterRecord>& writers, const std::vector<std::string>& segmentFileNames) {
    Counter known = 0;
    for (const auto& w : writers) known = std::max(known, w.knowledge);
    for (const auto& name : segmentFileNames) {
        if (auto range = parseSegmentFileName(name)) known = std::max(known, range->end);
    }
    return known;
}

std::string writerTagForIndex(std::size_t index) {
    std::string tag;
    ++index;
    while (index > 0) {
        --index;
        tag.insert(tag.begin(), static_cast<char>('A' + index % 26));
        index /= 26;
    }
    return tag;
}

VersionTracker::VersionTracker(std::string rootDir, std::shared_ptr<FileSystem> fs, std::string formatVersion)
    : rootDir_(std::move(rootDir)), fs_(std::move(fs)), formatVersion_(std::move(formatVersion)) {}

WriterScan VersionTracker::scan() const {
    WriterScan out;
    const std::string devices = layout::devicesDir(rootDir_);
    if (!fs_->exists(devices)) return out;

    auto names = fs_->listDirectory(devices);
    std::sort(names.begin(), names.end());
    for (const auto& name : names) {
        const std::string dir = layout::join(devices, name);
        if (!fs_->isDirectory(dir)) continue;

        try {
            out.writers.push_back(readWriter(name));
        } catch (const DeviceMetadataCorruptError& e) {
            std::cerr << "VersionTracker: skipping writer " << name << ": " << e.what() << "\n";
            out.skipped.push_back(e);
        }

        try {
            auto segments = listSegments(*fs_, dir, name);
            out.segments.insert(out.segments.end(), segments.begin(), segments.end());
        } catch (const FileSystemError& e) {
            std::cerr << "VersionTracker: cannot list segments of writer " << name << ": " << e.what() << "\n";
            out.unreadableDirs.push_back(dir);
        }
    }
    return out;
}

Counter VersionTracker::globalKnowledge() const {
    WriterScan s = scan();
    std::vector<std::string> names;
    names.reserve(s.segments.size());
    for (const auto& seg : s.segments) names.push_back(seg.fileName);
    return deltaledger::globalKnowledge(s.writers, names);
}

WriterRecord VersionTracker::registerWriter(const std::string& friendlyName) {
    WriterScan s = scan();
    std::set<std::string> usedTags;
    for (const auto& w : s.writers) usedTags.insert(w.writerTag);

    std::size_t index = 0;
    while (usedTags.count(writerTagForIndex(index))) ++index;

    WriterRecord record;
    do {
        record.writerGuid = generateGuid();
    } while (fs_->exists(layout::writerDir(rootDir_, record.writerGuid)));
    record.writerTag = writerTagForIndex(index);
    record.friendlyName = friendlyName.empty() ? "Writer " + record.writerTag : friendlyName;
    record.formatVersion = formatVersion_;

    fs_->createDirectories(layout::writerDir(rootDir_, record.writerGuid));
    writeRecord(record);
    std::cerr << "VersionTracker: registered writer " << record.writerTag << " guid=" << record.writerGuid << "\n";
    return record;
}

CounterRange VersionTracker::mintRange(const WriterRecord& writer, std::size_t count, Counter floor) const {
    if (count == 0) throw std::invalid_argument("cannot mint an empty counter range");

    WriterScan s;
    try {
        s = scan();
    } catch (const FileSystemError& e) {
        throw WriteConflictError(std::string("cannot establish global knowledge: ") + e.what());
    }
    if (!s.unreadableDirs.empty()) {
        throw WriteConflictError("cannot establish global knowledge: unreadable writer directory " +
                                 s.unreadableDirs.front());
    }
    bool own = std::any_of(s.writers.begin(), s.writers.end(),
                           [&](const WriterRecord& w) { return w.writerGuid == writer.writerGuid; });
    if (!own) {
        throw WriteConflictError("metadata of writer " + writer.writerGuid + " is not readable");
    }

    std::vector<std::string> names;
    for (const auto& seg : s.segments) names.push_back(seg.fileName);
    const Counter known = std::max(deltaledger::globalKnowledge(s.writers, names), floor);
    if (known > std::numeric_limits<Counter>::max() - count) {
        throw WriteConflictError("counter space exhausted");
    }
    return CounterRange{known + 1, known + static_cast<Counter>(count)};
}

WriterRecord VersionTracker::readWriter(const std::string& writerGuid) const {
    const std::string path = layout::metadataPath(rootDir_, writerGuid);
    if (!fs_->exists(path)) throw DeviceMetadataCorruptError(path, "missing");

    std::string text;
    try {
        text = fs_->readFile(path);
    } catch (const FileSystemError& e) {
        throw DeviceMetadataCorruptError(path, e.what());
    }
    json j = json::parse(text, nullptr, false);
    if (j.is_discarded()) throw DeviceMetadataCorruptError(path, "invalid JSON");

    WriterRecord record = WriterRecord::fromJson(j, path);
    if (record.writerGuid != writerGuid) {
        throw DeviceMetadataCorruptError(path, "deviceGuid " + record.writerGuid + " does not match its directory");
    }
    return record;
}

std::vector<WriterRecord> VersionTracker::listWriters() const {
    return scan().writers;
}

std::optional<WriterRecord> VersionTracker::activeWriter() const {
    std::optional<WriterRecord> best;
    for (auto& w : scan().writers) {
        if (!best || w.knowledge > best->knowledge ||
            (w.knowledge == best->knowledge && w.writerTag < best->writerTag)) {
            best = std::move(w);
        }
    }
    return best;
}

void VersionTracker::updateKnowledge(WriterRecord& writer, Counter end, bool hasFullKnowledge) {
    WriterRecord updated = writer;
    updated.knowledge = std::max(updated.knowledge, end);
    updated.hasFullKnowledge = hasFullKnowledge;
    writeRecord(updated);
    writer = std::move(updated);
}

void VersionTracker::writeRecord(const WriterRecord& writer) {
    fs_->writeFileAtomic(layout::metadataPath(rootDir_, writer.writerGuid), writer.toJson().dump(2));
}

} // namespace deltaledger
