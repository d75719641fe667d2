//DeltaLedger.hpp
#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "deltaledger/DeltaWriter.hpp"
#include "deltaledger/EntityStore.hpp"
#include "deltaledger/Errors.hpp"
#include "deltaledger/FileSystem.hpp"
#include "deltaledger/Options.hpp"
#include "deltaledger/VersionTracker.hpp"

namespace deltaledger {

// One budget directory: data/Full.snapshot plus devices/<guid>/ per writer.
class DeltaLedger {
public:
    explicit DeltaLedger(const std::string& rootDir,
                         Options options = Options::fromEnvironment(),
                         std::shared_ptr<FileSystem> fs = defaultFileSystem());

    // Snapshot plus every readable segment from every writer.
    EntityStore loadState() const;

    // Snapshot plus segments ending at or below target. target must be one
    // of availableVersions(), otherwise std::invalid_argument.
    EntityStore loadStateUpTo(Counter target) const;

    // 0 followed by every segment end counter, ascending, no duplicates.
    std::vector<Counter> availableVersions() const;

    // Writes the store's dirty set as one segment of writerGuid.
    CommitResult commit(EntityStore& store, const std::string& writerGuid) const;

    WriterRecord registerWriter(const std::string& friendlyName = "");

    // Throws LoadError when no writer metadata is readable.
    WriterRecord activeWriter() const;

    Counter globalKnowledge() const;

    const VersionTracker& tracker() const { return tracker_; }
    const Options& options() const { return options_; }
    const std::string& rootDir() const { return rootDir_; }

private:
    EntityStore load(std::optional<Counter> upTo) const;

    std::string rootDir_;
    Options options_;
    std::shared_ptr<FileSystem> fs_;
    VersionTracker tracker_;
};

// The two entry points collaborators use.
EntityStore loadState(const std::string& rootDir, const Options& options = Options::fromEnvironment());
CommitResult commit(EntityStore& store, const std::string& writerGuid,
                    const Options& options = Options::fromEnvironment());

} // namespace deltaledger
