#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include "deltaledger/Entity.hpp"
#include "deltaledger/Errors.hpp"

namespace deltaledger {

class FileSystem;

// Inclusive counter range.
struct CounterRange {
    Counter start = 0;
    Counter end = 0;

    std::size_t size() const { return static_cast<std::size_t>(end - start + 1); }
    bool contains(Counter c) const { return c >= start && c <= end; }
};

// "<start>_<end>.delta"
std::string segmentFileName(const CounterRange& range);

// std::nullopt unless name is "<decimal>_<decimal>.delta" with start <= end.
std::optional<CounterRange> parseSegmentFileName(const std::string& name);

// A segment file found on disk, identified by its writer directory.
struct SegmentRef {
    std::string writerGuid;
    std::string fileName;
    std::string path;
    CounterRange range;
};

// Segment files directly inside one writer directory. Other names are ignored.
std::vector<SegmentRef> listSegments(const FileSystem& fs, const std::string& writerDir, const std::string& writerGuid);

struct DeltaSegment {
    std::string deviceGuid;
    std::string shortDeviceId;
    CounterRange range;
    std::string formatVersion = "1";
    std::string publishTime;
    std::vector<Entity> items;
    // Records of kinds this build does not know; skipped individually.
    std::vector<UnknownEntityTypeError> unknownRecords;
};

// Parses a segment body. Throws MalformedDeltaError on bad JSON, a missing
// envelope field, an invalid known-kind record, or an item stamped outside
// range.
DeltaSegment parseDeltaSegment(const std::string& fileName, const CounterRange& range, const std::string& text);

std::string serializeDeltaSegment(const DeltaSegment& segment);

} // namespace deltaledger
