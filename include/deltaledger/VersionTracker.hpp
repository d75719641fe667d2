#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "deltaledger/DeltaSegment.hpp"
#include "deltaledger/Entity.hpp"
#include "deltaledger/Errors.hpp"

namespace deltaledger {

class FileSystem;

// Contents of devices/<guid>/<guid>.meta.
struct WriterRecord {
    std::string writerGuid;
    std::string writerTag;
    std::string friendlyName;
    Counter knowledge = 0;
    Counter knowledgeInFullSnapshot = 0;
    bool hasFullKnowledge = false;
    std::string formatVersion = "1";
    nlohmann::json extras = nlohmann::json::object();

    nlohmann::json toJson() const;

    // Throws DeviceMetadataCorruptError (path names the source).
    static WriterRecord fromJson(const nlohmann::json& j, const std::string& path);
};

// Everything found under <root>/devices in one pass.
struct WriterScan {
    std::vector<WriterRecord> writers;
    std::vector<SegmentRef> segments;
    std::vector<DeviceMetadataCorruptError> skipped;
    // Writer directories whose segments could not be listed.
    std::vector<std::string> unreadableDirs;
};

// Highest of every recorded knowledge value and every segment end counter
// implied by a segment file name. Names that are not segments are ignored.
Counter globalKnowledge(const std::vector<WriterRecord>& writers, const std::vector<std::string>& segmentFileNames);

// A, B, ... Z, AA, AB, ...
std::string writerTagForIndex(std::size_t index);

class VersionTracker {
public:
    VersionTracker(std::string rootDir, std::shared_ptr<FileSystem> fs, std::string formatVersion = "1");

    // Tolerates missing or corrupt metadata (recorded in skipped). A missing
    // devices directory yields an empty scan.
    WriterScan scan() const;

    Counter globalKnowledge() const;

    // New GUID, next unused tag, knowledge 0. Writes the metadata record.
    WriterRecord registerWriter(const std::string& friendlyName = "");

    // start = max(global knowledge, floor) + 1, end = start + count - 1.
    // floor is the highest counter the caller has seen, which covers counters
    // embodied only by the snapshot. Throws WriteConflictError when global
    // knowledge cannot be established or the writer's own metadata is not
    // readable.
    CounterRange mintRange(const WriterRecord& writer, std::size_t count, Counter floor = 0) const;

    // Throws DeviceMetadataCorruptError when missing or unreadable.
    WriterRecord readWriter(const std::string& writerGuid) const;

    std::vector<WriterRecord> listWriters() const;

    // Readable writer with the highest knowledge; ties go to the lower tag.
    std::optional<WriterRecord> activeWriter() const;

    // Raises writer.knowledge to end and rewrites its metadata atomically.
    void updateKnowledge(WriterRecord& writer, Counter end, bool hasFullKnowledge);

    void writeRecord(const WriterRecord& writer);

    const std::string& rootDir() const { return rootDir_; }

private:
    std::string rootDir_;
    std::shared_ptr<FileSystem> fs_;
    std::string formatVersion_;
};

} // namespace deltaledger
