#include "deltaledger/DeltaWriter.hpp"

#include <algorithm>
#include <chrono>
#include <ctime>
#include <iostream>
#include <utility>
#include <vector>
#include "deltaledger/Errors.hpp"
#include "deltaledger/FileSystem.hpp"
#include "deltaledger/Layout.hpp"
#include "deltaledger/VersionTracker.hpp"

namespace deltaledger {

std::string publishTimeNow() {
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm utc{};
#if defined(_WIN32)
    gmtime_s(&utc, &now);
#else
    gmtime_r(&now, &utc);
#endif
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &utc);
    return buf;
}

DeltaWriter::DeltaWriter(std::shared_ptr<FileSystem> fs, Options options)
    : fs_(std::move(fs)), options_(std::move(options)) {}

CommitResult DeltaWriter::commit(EntityStore& store, const std::string& writerGuid) const {
    CommitResult result;
    result.writerGuid = writerGuid;
    if (!store.isDirty()) return result;

    VersionTracker tracker(store.rootDir(), fs_, options_.formatVersion);

    WriterRecord writer;
    try {
        writer = tracker.readWriter(writerGuid);
    } catch (const DeviceMetadataCorruptError& e) {
        throw WriteConflictError(e.what());
    }

    std::vector<Entity> stamped = store.dirtyEntities();
    const Counter floor = store.report().knowledge;
    const CounterRange range = tracker.mintRange(writer, stamped.size(), floor);

    Counter next = range.start;
    for (auto& entity : stamped) {
        entity.entityVersion = EntityVersion{writer.writerTag, next++};
    }

    DeltaSegment segment;
    segment.deviceGuid = writer.writerGuid;
    segment.shortDeviceId = writer.writerTag;
    segment.range = range;
    segment.formatVersion = options_.formatVersion;
    segment.publishTime = publishTimeNow();
    segment.items = stamped;
    const std::string body = serializeDeltaSegment(segment);

    const std::string dir = layout::writerDir(store.rootDir(), writerGuid);
    const std::string path = layout::join(dir, segmentFileName(range));

    if (options_.verifyBeforeWrite) {
        Counter now = 0;
        try {
            now = tracker.globalKnowledge();
        } catch (const FileSystemError& e) {
            throw WriteConflictError(std::string("cannot re-check global knowledge: ") + e.what());
        }
        if (std::max(now, floor) != range.start - 1) {
            throw WriteConflictError("global knowledge moved from " + std::to_string(range.start - 1) + " to " +
                                     std::to_string(now) + " while committing");
        }
    }
    if (fs_->exists(path)) throw WriteConflictError("segment " + path + " already exists");

    try {
        fs_->writeFileAtomic(path, body);
    } catch (const FileSystemError& e) {
        throw CommitError(std::string("cannot write segment: ") + e.what());
    }

    // A writer that incorporated everything before this range now knows
    // everything up to its end.
    const bool full = store.report().complete() && store.report().knowledge == range.start - 1;
    writer.knowledgeInFullSnapshot = store.report().snapshotKnowledge;
    try {
        tracker.updateKnowledge(writer, range.end, full);
    } catch (const FileSystemError& e) {
        std::cerr << "DeltaWriter: metadata update failed, removing " << path << "\n";
        if (!fs_->removeFile(path)) {
            std::cerr << "DeltaWriter: could not remove " << path << "\n";
        }
        throw CommitError(std::string("cannot update writer metadata: ") + e.what());
    }

    store.acceptCommit(stamped);

    result.written = true;
    result.range = range;
    result.segmentPath = path;
    result.entityCount = stamped.size();
    std::cerr << "DeltaWriter: committed " << result.entityCount << " entities as " << segmentFileName(range)
              << " writer=" << writer.writerTag << "\n";
    return result;
}

} // namespace deltaledger
