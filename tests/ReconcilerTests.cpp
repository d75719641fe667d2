#include "deltaledger/Reconciler.hpp"

#include <algorithm>
#include <iostream>
#include <optional>
#include <string>
#include <vector>
#include "deltaledger/SnapshotLoader.hpp"
#include "deltaledger/VersionTracker.hpp"
#include "TestSupport.hpp"

using namespace deltaledger;
using namespace testsupport;

namespace {

// Every revision in the store, tombstones included, as one JSON document.
json dumpStore(const EntityStore& store) {
    json out = json::object();
    for (EntityKind kind : allEntityKinds()) {
        json list = json::array();
        for (const Entity* e : store.entities(kind)) list.push_back(entityToJson(*e, false));
        out[snapshotKey(kind)] = list;
    }
    return out;
}

EntityStore reconcileWith(const std::string& root, std::vector<SegmentRef> segments, Options options = Options(),
                          std::optional<Counter> upTo = std::nullopt) {
    auto fs = defaultFileSystem();
    EntityStore store = SnapshotLoader(fs).load(root);
    Reconciler(fs, options).reconcile(store, std::move(segments), upTo);
    return store;
}

std::vector<SegmentRef> allSegments(const std::string& root) {
    return VersionTracker(root, defaultFileSystem()).scan().segments;
}

json txnItem(const std::string& id, const std::string& version, int64_t amount) {
    return deltaItem("transaction", transactionRecord(id, version, amount));
}

json tombstoneItem(const std::string& type, const std::string& id, const std::string& version) {
    return json{{"entityType", type}, {"entityId", id}, {"entityVersion", version}, {"isTombstone", true}};
}

void writeBaseSnapshot(const std::string& root) {
    writeSnapshot(root, json{{"accounts", json::array({{{"entityId", "acct1"}, {"entityVersion", "A-2"},
                                                        {"accountName", "Checking"}, {"accountType", "Checking"}}})},
                             {"transactions", json::array({transactionRecord("t1", "A-10", 0)})}});
}

} // namespace

int main() {
    {
        // Zero segments reproduce the snapshot
        TempDir dir("reconcile-empty");
        writeBaseSnapshot(dir.path());
        EntityStore plain = SnapshotLoader(defaultFileSystem()).load(dir.path());
        EntityStore reconciled = reconcileWith(dir.path(), {});
        expect(dumpStore(plain) == dumpStore(reconciled), "zero segments equal the snapshot");
        expect(reconciled.report().knowledge == 10, "knowledge stays at the snapshot");
        expect(reconciled.report().complete(), "nothing skipped");
    }

    {
        // Counter 15 beats counter 10 regardless of author
        TempDir dir("reconcile-lww");
        const std::string root = dir.path();
        writeBaseSnapshot(root);
        writeSegment(root, "GUID-B", "B", 11, 15, json::array({txnItem("t1", "B-15", 20000)}));
        EntityStore store = reconcileWith(root, allSegments(root));
        const Entity* t1 = store.find(EntityKind::Transaction, "t1");
        expect(t1 && t1->as<Transaction>().amount == 20000, "counter 15 wins");
        expect(t1->entityVersion.writerTag == "B" && t1->entityVersion.counter == 15, "stamp follows revision");
        expect(store.report().knowledge == 15, "knowledge raised to segment end");
        expect(store.report().appliedSegments.size() == 1, "one applied segment");

        // A record older than the snapshot's copy is ignored
        writeSegment(root, "GUID-C", "C", 16, 16, json::array({txnItem("t1", "C-16", 7)}));
        writeSegment(root, "GUID-A", "A", 5, 5, json::array({txnItem("t1", "A-5", 999)}));
        EntityStore again = reconcileWith(root, allSegments(root));
        expect(again.find(EntityKind::Transaction, "t1")->as<Transaction>().amount == 7, "counter 16 wins");
        expect(again.report().staleRecords == 1, "record below the snapshot counter is stale");
    }

    {
        // Discovery order does not matter
        TempDir dir("reconcile-order");
        const std::string root = dir.path();
        writeBaseSnapshot(root);
        json memo = transactionRecord("t1", "B-16", 20000);
        memo["memo"] = "weekly shop";
        writeSegment(root, "GUID-A", "A", 11, 15,
                     json::array({txnItem("t2", "A-12", -300), txnItem("t1", "A-15", 20000)}));
        writeSegment(root, "GUID-B", "B", 16, 17,
                     json::array({deltaItem("transaction", memo), tombstoneItem("transaction", "t2", "B-17")}));
        writeSegment(root, "GUID-C", "C", 18, 18, json::array({txnItem("t3", "C-18", 4200)}));
        writeSegment(root, "GUID-A", "A", 19, 20, json::array({txnItem("t1", "A-20", 5)}));

        std::vector<SegmentRef> segments = allSegments(root);
        expect(segments.size() == 4, "four segments discovered");
        auto discovered = Reconciler(defaultFileSystem(), Options())
                              .discoverSegments({layout::writerDir(root, "GUID-A"), layout::writerDir(root, "GUID-C")});
        expect(discovered.size() == 3, "segments of the listed writers only");
        expect(std::all_of(discovered.begin(), discovered.end(),
                           [](const SegmentRef& s) { return s.writerGuid == "GUID-A" || s.writerGuid == "GUID-C"; }),
               "writer guid taken from the directory");
        std::sort(segments.begin(), segments.end(),
                  [](const SegmentRef& a, const SegmentRef& b) { return a.path < b.path; });

        const json expected = dumpStore(reconcileWith(root, segments));
        int permutations = 0;
        do {
            expect(dumpStore(reconcileWith(root, segments)) == expected, "permutation changes the result");
            ++permutations;
        } while (std::next_permutation(segments.begin(), segments.end(),
                                       [](const SegmentRef& a, const SegmentRef& b) { return a.path < b.path; }));
        expect(permutations == 24, "all orders tried");

        for (unsigned seed = 1; seed <= 5; ++seed) {
            auto shuffled = std::make_shared<ShuffledFileSystem>(seed);
            EntityStore store = SnapshotLoader(shuffled).load(root);
            Reconciler reconciler(shuffled, Options());
            reconciler.reconcile(store, VersionTracker(root, shuffled).scan().segments);
            expect(dumpStore(store) == expected, "shuffled listing changes the result");
        }

        EntityStore store = reconcileWith(root, segments);
        const auto& t1 = store.find(EntityKind::Transaction, "t1")->as<Transaction>();
        expect(t1.amount == 5 && !t1.memo, "whole-record replace at counter 20");
        expect(store.find(EntityKind::Transaction, "t2") == nullptr, "tombstone removes t2");
        expect(store.findRevision(EntityKind::Transaction, "t2")->entityVersion.counter == 17, "tombstone kept");
        expect(store.find(EntityKind::Transaction, "t3") != nullptr, "t3 added");
        expect(store.report().versionGaps.empty(), "contiguous segments");
        expect(store.report().knowledge == 20, "knowledge 20");

        // Version isolation
        EntityStore at17 = reconcileWith(root, segments, Options(), Counter(17));
        expect(*at17.find(EntityKind::Transaction, "t1")->as<Transaction>().memo == "weekly shop", "state at 17");
        expect(at17.find(EntityKind::Transaction, "t3") == nullptr, "t3 not yet written at 17");
        expect(at17.report().knowledge == 17, "knowledge capped");
    }

    {
        // Tombstone at the highest counter survives a richer earlier revision
        TempDir dir("reconcile-tombstone");
        const std::string root = dir.path();
        writeBaseSnapshot(root);
        json rich = transactionRecord("t1", "A-11", 12345);
        rich["memo"] = "rich";
        rich["payeeId"] = "p1";
        writeSegment(root, "GUID-A", "A", 11, 11, json::array({deltaItem("transaction", rich)}));
        writeSegment(root, "GUID-B", "B", 12, 12, json::array({tombstoneItem("transaction", "t1", "B-12")}));
        for (int i = 0; i < 2; ++i) {
            EntityStore store = reconcileWith(root, allSegments(root));
            expect(store.find(EntityKind::Transaction, "t1") == nullptr, "t1 deleted");
            expect(store.find("t1") == nullptr, "t1 deleted for every kind");
        }
    }

    {
        // Malformed segments: skip by default, abort under Strict
        TempDir dir("reconcile-malformed");
        const std::string root = dir.path();
        writeBaseSnapshot(root);
        writeSegment(root, "GUID-A", "A", 11, 11, json::array({txnItem("t1", "A-11", 1)}));
        writeText(layout::join(layout::writerDir(root, "GUID-B"), "12_12.delta"), "{ \"items\": [ truncated");
        writeSegment(root, "GUID-C", "C", 13, 13, json::array({txnItem("t1", "C-13", 3)}));
        writeSegment(root, "GUID-C", "C", 14, 14, json::array({txnItem("t1", "C-99", 4)}));

        EntityStore store = reconcileWith(root, allSegments(root));
        expect(store.find(EntityKind::Transaction, "t1")->as<Transaction>().amount == 3, "valid segments applied");
        expect(store.report().skippedSegments.size() == 2, "bad JSON and out-of-range stamp skipped");
        expect(!store.report().complete(), "load is incomplete");
        expect(store.report().knowledge == 13, "knowledge excludes skipped segments");

        Options strict;
        strict.deltaPolicy = DeltaPolicy::Strict;
        bool threw = false;
        try {
            reconcileWith(root, allSegments(root), strict);
        } catch (const MalformedDeltaError& e) {
            threw = e.segment().find("12_12.delta") != std::string::npos;
        }
        expect(threw, "strict policy aborts on the first bad segment");
    }

    {
        // Unknown kinds skip one record, not the segment
        TempDir dir("reconcile-unknown");
        const std::string root = dir.path();
        writeBaseSnapshot(root);
        writeSegment(root, "GUID-A", "A", 11, 12,
                     json::array({json{{"entityType", "budgetGoal"}, {"entityId", "g1"}, {"entityVersion", "A-11"},
                                       {"isTombstone", false}, {"target", 100}},
                                  txnItem("t1", "A-12", 42)}));
        EntityStore store = reconcileWith(root, allSegments(root));
        expect(store.find(EntityKind::Transaction, "t1")->as<Transaction>().amount == 42, "known record applied");
        expect(store.report().skippedRecords.size() == 1, "unknown record reported");
        expect(store.report().skippedRecords[0].entityType() == "budgetGoal", "type named");
        expect(store.report().complete(), "segment not skipped");
    }

    {
        // Gaps are warnings; the segment still applies
        TempDir dir("reconcile-gap");
        const std::string root = dir.path();
        writeBaseSnapshot(root);
        writeSegment(root, "GUID-A", "A", 11, 12, json::array({txnItem("t1", "A-12", 1)}));
        writeSegment(root, "GUID-B", "B", 20, 20, json::array({txnItem("t1", "B-20", 2)}));
        EntityStore store = reconcileWith(root, allSegments(root));
        expect(store.report().versionGaps.size() == 1, "one gap");
        expect(store.report().versionGaps[0].expectedStart() == 13 &&
                   store.report().versionGaps[0].actualStart() == 20,
               "gap bounds");
        expect(store.find(EntityKind::Transaction, "t1")->as<Transaction>().amount == 2, "gap segment applied");
    }

    {
        // Two writers stamped the same counter: lower tag wins in any order
        TempDir dir("reconcile-overlap");
        const std::string root = dir.path();
        writeBaseSnapshot(root);
        writeSegment(root, "GUID-B", "B", 11, 11, json::array({txnItem("t1", "B-11", 2)}));
        writeSegment(root, "GUID-A", "A", 11, 11, json::array({txnItem("t1", "A-11", 1)}));
        std::vector<SegmentRef> segments = allSegments(root);
        EntityStore forward = reconcileWith(root, segments);
        std::reverse(segments.begin(), segments.end());
        EntityStore backward = reconcileWith(root, segments);
        expect(forward.find(EntityKind::Transaction, "t1")->as<Transaction>().amount == 1, "tag A wins");
        expect(dumpStore(forward) == dumpStore(backward), "overlap resolution is order independent");
        expect(forward.report().overlappingCounters == 1, "overlap counted");
    }

    std::cout << "All tests passed." << std::endl;
    return 0;
}
