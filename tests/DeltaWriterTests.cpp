#include "deltaledger/DeltaWriter.hpp"

#include <iostream>
#include <string>
#include "deltaledger/Reconciler.hpp"
#include "deltaledger/SnapshotLoader.hpp"
#include "deltaledger/VersionTracker.hpp"
#include "TestSupport.hpp"

using namespace deltaledger;
using namespace testsupport;

namespace {

// Lets another writer publish a segment between minting and writing: the
// second listing of the devices directory drops a foreign segment in first.
class RacingFileSystem : public LocalFileSystem {
public:
    explicit RacingFileSystem(std::string root) : root_(std::move(root)) {}

    std::vector<std::string> listDirectory(const std::string& path) const override {
        if (path == layout::devicesDir(root_) && ++devicesListings_ == 2) {
            writeSegment(root_, "GUID-RIVAL", "Z", 100, 100, json::array());
        }
        return LocalFileSystem::listDirectory(path);
    }

private:
    std::string root_;
    mutable int devicesListings_ = 0;
};

EntityStore loadAll(const std::string& root, const std::shared_ptr<FileSystem>& fs) {
    EntityStore store = SnapshotLoader(fs).load(root);
    Reconciler(fs, Options()).reconcile(store, VersionTracker(root, fs).scan().segments);
    return store;
}

void prepare(const std::string& root) {
    writeSnapshot(root, json{{"transactions", json::array({transactionRecord("t1", "A-10", 0),
                                                           transactionRecord("t2", "A-9", 100)})}});
}

void touch(EntityStore& store, const std::string& id, const std::string& memo) {
    store.mutate(EntityKind::Transaction, id, [&](Entity& e) { e.as<Transaction>().memo = memo; });
}

} // namespace

int main() {
    {
        TempDir dir("writer");
        const std::string root = dir.path();
        prepare(root);
        auto fs = defaultFileSystem();
        VersionTracker tracker(root, fs);
        WriterRecord a = tracker.registerWriter("Desktop");

        EntityStore store = loadAll(root, fs);
        DeltaWriter writer(fs, Options());

        CommitResult none = writer.commit(store, a.writerGuid);
        expect(!none.written, "clean store writes nothing");
        expect(fs->listDirectory(layout::writerDir(root, a.writerGuid)).size() == 1, "only metadata present");

        touch(store, "t2", "second");
        touch(store, "t1", "first");
        CommitResult result = writer.commit(store, a.writerGuid);
        expect(result.written && result.entityCount == 2, "two entities committed");
        expect(result.range.start == 11 && result.range.end == 12, "range above snapshot knowledge");
        expect(result.segmentPath == layout::join(layout::writerDir(root, a.writerGuid), "11_12.delta"),
               "segment named by its range");
        expect(!store.isDirty(), "dirty set cleared");
        expect(store.find(EntityKind::Transaction, "t1")->entityVersion.toString() == "A-11", "t1 stamped first");
        expect(store.find(EntityKind::Transaction, "t2")->entityVersion.toString() == "A-12", "t2 stamped second");

        json doc = json::parse(readText(result.segmentPath));
        expect(doc["deviceGuid"] == a.writerGuid && doc["shortDeviceId"] == "A", "segment header");
        expect(doc["startVersion"] == 11 && doc["endVersion"] == 12, "segment bounds");
        expect(doc["items"].size() == 2 && doc["items"][0]["entityType"] == "transaction", "segment items");
        expect(doc["items"][0]["memo"] == "first" && doc["items"][0]["amount"] == 0, "full field set written");
        expect(!doc["publishTime"].get<std::string>().empty(), "publish time");

        WriterRecord after = tracker.readWriter(a.writerGuid);
        expect(after.knowledge == 12, "writer knowledge advanced");
        expect(after.hasFullKnowledge, "complete load gives full knowledge");
        expect(after.knowledgeInFullSnapshot == 10, "snapshot knowledge recorded");
        expect(tracker.globalKnowledge() == 12, "global knowledge reflects the commit");

        EntityStore reloaded = loadAll(root, fs);
        expect(*reloaded.find(EntityKind::Transaction, "t1")->as<Transaction>().memo == "first", "reload sees commit");

        // Unknown writer
        touch(store, "t1", "again");
        bool threw = false;
        try {
            writer.commit(store, "NO-SUCH-GUID");
        } catch (const WriteConflictError&) {
            threw = true;
        }
        expect(threw, "unknown writer cannot commit");
        expect(store.isDirty(), "failed commit keeps the dirty set");
    }

    {
        // Metadata write fails: segment removed, store untouched
        TempDir dir("writer-rollback");
        const std::string root = dir.path();
        prepare(root);
        auto faulty = std::make_shared<FaultyFileSystem>(".meta");
        faulty->armed = false;
        WriterRecord a = VersionTracker(root, faulty).registerWriter();
        faulty->armed = true;

        EntityStore store = loadAll(root, faulty);
        touch(store, "t1", "lost");
        bool threw = false;
        try {
            DeltaWriter(faulty, Options()).commit(store, a.writerGuid);
        } catch (const WriteConflictError&) {
            threw = false;
        } catch (const CommitError&) {
            threw = true;
        }
        expect(threw, "metadata failure is a CommitError");
        expect(!faulty->exists(layout::join(layout::writerDir(root, a.writerGuid), "11_11.delta")),
               "segment rolled back");
        expect(store.isDirty(), "dirty set kept");
        expect(store.find(EntityKind::Transaction, "t1")->entityVersion.counter == 10, "entity not stamped");
        expect(VersionTracker(root, faulty).readWriter(a.writerGuid).knowledge == 0, "metadata unchanged");
        expect(VersionTracker(root, faulty).globalKnowledge() == 0, "no counters consumed");

        faulty->armed = false;
        CommitResult retry = DeltaWriter(faulty, Options()).commit(store, a.writerGuid);
        expect(retry.written && retry.range.start == 11, "retry reuses the range");
    }

    {
        // Another writer published between minting and writing
        TempDir dir("writer-race");
        const std::string root = dir.path();
        prepare(root);
        WriterRecord a = VersionTracker(root, defaultFileSystem()).registerWriter();
        EntityStore store = loadAll(root, defaultFileSystem());
        touch(store, "t1", "race");

        auto racing = std::make_shared<RacingFileSystem>(root);
        bool threw = false;
        try {
            DeltaWriter(racing, Options()).commit(store, a.writerGuid);
        } catch (const WriteConflictError&) {
            threw = true;
        }
        expect(threw, "moved knowledge is a write conflict");
        expect(store.isDirty(), "store still dirty after conflict");
        expect(VersionTracker(root, defaultFileSystem()).readWriter(a.writerGuid).knowledge == 0,
               "no knowledge recorded");

        // Next attempt mints above the rival's segment
        CommitResult result = DeltaWriter(defaultFileSystem(), Options()).commit(store, a.writerGuid);
        expect(result.range.start == 101, "mint above the rival");
        expect(!VersionTracker(root, defaultFileSystem()).readWriter(a.writerGuid).hasFullKnowledge,
               "store loaded before the rival has partial knowledge");
    }

    {
        // A load that skipped a segment never claims full knowledge
        TempDir dir("writer-partial");
        const std::string root = dir.path();
        prepare(root);
        WriterRecord a = VersionTracker(root, defaultFileSystem()).registerWriter();
        writeText(layout::join(layout::writerDir(root, "GUID-B"), "11_11.delta"), "garbage");
        EntityStore store = loadAll(root, defaultFileSystem());
        expect(!store.report().complete(), "segment skipped");
        touch(store, "t2", "partial");
        CommitResult result = DeltaWriter(defaultFileSystem(), Options()).commit(store, a.writerGuid);
        expect(result.range.start == 12, "skipped segment still counts toward global knowledge");
        WriterRecord after = VersionTracker(root, defaultFileSystem()).readWriter(a.writerGuid);
        expect(after.knowledge == 12 && !after.hasFullKnowledge, "partial knowledge recorded");
    }

    std::cout << "All tests passed." << std::endl;
    return 0;
}
