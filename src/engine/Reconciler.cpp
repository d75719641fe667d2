#include "deltaledger/Reconciler.hpp"

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <tuple>
#include <utility>
#include "deltaledger/FileSystem.hpp"

namespace deltaledger {

namespace {

bool segmentOrder(const SegmentRef& a, const SegmentRef& b) {
    return std::tie(a.range.start, a.range.end, a.writerGuid, a.fileName) <
           std::tie(b.range.start, b.range.end, b.writerGuid, b.fileName);
}

std::string segmentLabel(const SegmentRef& ref) {
    return ref.writerGuid + "/" + ref.fileName;
}

// Segments are expected to continue where the previous one stopped. Gaps
// are reported, never fatal: another writer's segments may simply not have
// arrived yet.
void checkContinuity(const std::vector<SegmentRef>& ordered, LoadReport& report) {
    Counter expected = report.snapshotKnowledge + 1;
    for (const auto& ref : ordered) {
        if (ref.range.start > expected) {
            VersionGapError gap(segmentLabel(ref), expected, ref.range.start);
            std::cerr << "Reconciler: " << gap.what() << "\n";
            report.versionGaps.push_back(gap);
        } else if (ref.range.start < expected && expected > report.snapshotKnowledge + 1) {
            std::cerr << "Reconciler: segment " << segmentLabel(ref) << " overlaps counters already covered\n";
        }
        expected = std::max(expected, ref.range.end + 1);
    }
}

} // namespace

Reconciler::Reconciler(std::shared_ptr<FileSystem> fs, Options options)
    : fs_(std::move(fs)), options_(std::move(options)) {}

std::vector<SegmentRef> Reconciler::discoverSegments(const std::vector<std::string>& writerDirs) const {
    std::vector<SegmentRef> out;
    for (const auto& dir : writerDirs) {
        const std::string guid = std::filesystem::path(dir).filename().string();
        auto found = listSegments(*fs_, dir, guid);
        out.insert(out.end(), found.begin(), found.end());
    }
    return out;
}

void Reconciler::reconcile(EntityStore& store, std::vector<SegmentRef> segments, std::optional<Counter> upTo) const {
    LoadReport& report = store.report();

    if (upTo) {
        segments.erase(std::remove_if(segments.begin(), segments.end(),
                                      [&](const SegmentRef& ref) { return ref.range.end > *upTo; }),
                       segments.end());
    }
    std::sort(segments.begin(), segments.end(), segmentOrder);
    checkContinuity(segments, report);

    std::vector<std::pair<SegmentRef, DeltaSegment>> parsed;
    parsed.reserve(segments.size());
    for (const auto& ref : segments) {
        try {
            std::string text;
            try {
                text = fs_->readFile(ref.path);
            } catch (const FileSystemError& e) {
                throw MalformedDeltaError(segmentLabel(ref), e.what());
            }
            DeltaSegment segment = parseDeltaSegment(segmentLabel(ref), ref.range, text);
            for (const auto& unknown : segment.unknownRecords) {
                std::cerr << "Reconciler: skipping record in " << segmentLabel(ref) << ": " << unknown.what() << "\n";
                report.skippedRecords.push_back(unknown);
            }
            parsed.emplace_back(ref, std::move(segment));
        } catch (const MalformedDeltaError& e) {
            if (options_.deltaPolicy == DeltaPolicy::Strict) {
                std::cerr << "Reconciler: aborting on " << e.what() << "\n";
                throw;
            }
            std::cerr << "Reconciler: skipping segment: " << e.what() << "\n";
            report.skippedSegments.push_back(e);
        }
    }

    auto records = merge(parsed);
    fold(store, records);

    for (const auto& entry : parsed) {
        report.appliedSegments.push_back(segmentLabel(entry.first));
        report.knowledge = std::max(report.knowledge, entry.first.range.end);
    }
    std::cerr << "Reconciler: applied " << parsed.size() << " segments (" << records.size()
              << " records), skipped " << report.skippedSegments.size() << ", knowledge=" << report.knowledge << "\n";
}

std::vector<MutationRecord> Reconciler::merge(const std::vector<std::pair<SegmentRef, DeltaSegment>>& segments) {
    std::vector<MutationRecord> records;
    for (const auto& entry : segments) {
        std::size_t position = 0;
        for (const auto& item : entry.second.items) {
            records.push_back(MutationRecord{item, entry.first.writerGuid, entry.first.fileName, position++});
        }
    }
    std::sort(records.begin(), records.end(), [](const MutationRecord& a, const MutationRecord& b) {
        return std::tie(a.revision.entityVersion.counter, a.revision.entityVersion.writerTag, a.writerGuid,
                        a.segment, a.position) <
               std::tie(b.revision.entityVersion.counter, b.revision.entityVersion.writerTag, b.writerGuid,
                        b.segment, b.position);
    });
    return records;
}

void Reconciler::fold(EntityStore& store, const std::vector<MutationRecord>& records) {
    LoadReport& report = store.report();
    for (const auto& record : records) {
        switch (store.applyRevision(record.revision)) {
        case EntityStore::ApplyOutcome::Inserted:
        case EntityStore::ApplyOutcome::Replaced:
            break;
        case EntityStore::ApplyOutcome::Stale:
            ++report.staleRecords;
            break;
        case EntityStore::ApplyOutcome::Conflict:
            ++report.overlappingCounters;
            std::cerr << "Reconciler: counter " << record.revision.entityVersion.toString() << " for "
                      << record.revision.entityId << " in " << record.writerGuid << "/" << record.segment
                      << " was already used by another revision; keeping the first\n";
            break;
        }
    }
}

} // namespace deltaledger
