#pragma once

#include <memory>
#include <string>
#include "deltaledger/EntityStore.hpp"

namespace deltaledger {

class FileSystem;

// Reads <root>/data/Full.snapshot into a fresh EntityStore.
class SnapshotLoader {
public:
    explicit SnapshotLoader(std::shared_ptr<FileSystem> fs);

    // Throws MalformedSnapshotError when the file is missing, unreadable,
    // not JSON, or a record misses a required field.
    EntityStore load(const std::string& rootDir) const;

    // Parses snapshot text into store. Ids must be unique within a kind.
    static void parseInto(EntityStore& store, const std::string& text);

private:
    std::shared_ptr<FileSystem> fs_;
};

} // namespace deltaledger
