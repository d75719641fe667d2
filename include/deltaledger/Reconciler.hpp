#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "deltaledger/DeltaSegment.hpp"
#include "deltaledger/EntityStore.hpp"
#include "deltaledger/Options.hpp"

namespace deltaledger {

class FileSystem;

// One entity revision taken from a segment, tagged with where it came from
// so ordering never depends on discovery order.
struct MutationRecord {
    Entity revision;
    std::string writerGuid;
    std::string segment;
    std::size_t position = 0;
};

// Folds delta segments from every writer onto a snapshot-populated store.
class Reconciler {
public:
    Reconciler(std::shared_ptr<FileSystem> fs, Options options);

    // Segment files under each writer directory (devices/<guid>).
    std::vector<SegmentRef> discoverSegments(const std::vector<std::string>& writerDirs) const;

    // Reads, parses, merges and folds segments. With upTo set, only segments
    // whose end counter is <= *upTo take part. Under DeltaPolicy::Strict a
    // malformed segment aborts with MalformedDeltaError.
    void reconcile(EntityStore& store, std::vector<SegmentRef> segments,
                   std::optional<Counter> upTo = std::nullopt) const;

    // All records of all segments sorted by counter, then writer tag, writer
    // guid, segment and position.
    static std::vector<MutationRecord> merge(const std::vector<std::pair<SegmentRef, DeltaSegment>>& segments);

    // Applies records in order. Records must already be merged.
    static void fold(EntityStore& store, const std::vector<MutationRecord>& records);

private:
    std::shared_ptr<FileSystem> fs_;
    Options options_;
};

} // namespace deltaledger
