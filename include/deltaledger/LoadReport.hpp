#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include "deltaledger/Entity.hpp"
#include "deltaledger/Errors.hpp"

namespace deltaledger {

// What a load did beyond the happy path. Recoverable errors are kept by value.
struct LoadReport {
    Counter snapshotKnowledge = 0;  // highest counter embodied by the snapshot
    Counter knowledge = 0;          // highest counter incorporated by this load

    std::vector<std::string> appliedSegments;
    std::vector<MalformedDeltaError> skippedSegments;
    std::vector<UnknownEntityTypeError> skippedRecords;
    std::vector<DeviceMetadataCorruptError> skippedWriters;
    std::vector<VersionGapError> versionGaps;

    std::size_t staleRecords = 0;
    std::size_t overlappingCounters = 0;

    // True when no segment had to be skipped.
    bool complete() const { return skippedSegments.empty(); }
};

} // namespace deltaledger
