#include "DeltaLedger.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>
#include "deltaledger/Layout.hpp"
#include "deltaledger/Reconciler.hpp"
#include "deltaledger/SnapshotLoader.hpp"

namespace deltaledger {

DeltaLedger::DeltaLedger(const std::string& rootDir, Options options, std::shared_ptr<FileSystem> fs)
    : rootDir_(rootDir),
      options_(std::move(options)),
      fs_(std::move(fs)),
      tracker_(rootDir_, fs_, options_.formatVersion) {}

EntityStore DeltaLedger::load(std::optional<Counter> upTo) const {
    EntityStore store = SnapshotLoader(fs_).load(rootDir_);

    WriterScan scan = tracker_.scan();
    LoadReport& report = store.report();
    for (const auto& skipped : scan.skipped) report.skippedWriters.push_back(skipped);
    for (const auto& dir : scan.unreadableDirs) {
        report.skippedWriters.emplace_back(dir, "segments could not be listed");
    }

    Reconciler(fs_, options_).reconcile(store, std::move(scan.segments), upTo);
    return store;
}

EntityStore DeltaLedger::loadState() const {
    return load(std::nullopt);
}

EntityStore DeltaLedger::loadStateUpTo(Counter target) const {
    auto versions = availableVersions();
    if (!std::binary_search(versions.begin(), versions.end(), target)) {
        throw std::invalid_argument("version " + std::to_string(target) + " is not available");
    }
    return load(target);
}

std::vector<Counter> DeltaLedger::availableVersions() const {
    std::vector<Counter> versions{0};
    for (const auto& seg : tracker_.scan().segments) versions.push_back(seg.range.end);
    std::sort(versions.begin(), versions.end());
    versions.erase(std::unique(versions.begin(), versions.end()), versions.end());
    return versions;
}

CommitResult DeltaLedger::commit(EntityStore& store, const std::string& writerGuid) const {
    if (store.rootDir() != rootDir_) {
        throw CommitError("store was loaded from " + store.rootDir() + ", not " + rootDir_);
    }
    return DeltaWriter(fs_, options_).commit(store, writerGuid);
}

WriterRecord DeltaLedger::registerWriter(const std::string& friendlyName) {
    fs_->createDirectories(layout::devicesDir(rootDir_));
    return tracker_.registerWriter(friendlyName);
}

WriterRecord DeltaLedger::activeWriter() const {
    auto writer = tracker_.activeWriter();
    if (!writer) throw LoadError("no readable writer metadata under " + layout::devicesDir(rootDir_));
    return *writer;
}

Counter DeltaLedger::globalKnowledge() const {
    return tracker_.globalKnowledge();
}

EntityStore loadState(const std::string& rootDir, const Options& options) {
    return DeltaLedger(rootDir, options).loadState();
}

CommitResult commit(EntityStore& store, const std::string& writerGuid, const Options& options) {
    return DeltaLedger(store.rootDir(), options).commit(store, writerGuid);
}

} // namespace deltaledger
