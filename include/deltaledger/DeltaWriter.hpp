#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include "deltaledger/DeltaSegment.hpp"
#include "deltaledger/EntityStore.hpp"
#include "deltaledger/Options.hpp"

namespace deltaledger {

class FileSystem;

struct CommitResult {
    bool written = false;  // false when the dirty set was empty
    CounterRange range;
    std::string writerGuid;
    std::string segmentPath;
    std::size_t entityCount = 0;
};

// Turns a store's dirty set into one new segment under the committing
// writer's directory and advances that writer's knowledge.
class DeltaWriter {
public:
    DeltaWriter(std::shared_ptr<FileSystem> fs, Options options);

    // Either the segment and the updated metadata both land, or neither
    // does and the store is left untouched. Throws WriteConflictError when
    // no safe counter range can be minted, CommitError on I/O failure.
    CommitResult commit(EntityStore& store, const std::string& writerGuid) const;

private:
    std::shared_ptr<FileSystem> fs_;
    Options options_;
};

// Timestamp written into segment headers.
std::string publishTimeNow();

} // namespace deltaledger
