#include "gtest/gtest.h"
#include "storage/errors.h"
#include "storage/memory_metadata_repository.h"

#include <atomic>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <thread>
#include <vector>

using namespace chunkvault;

class MetadataRepositoryTest : public ::testing::Test {
protected:
    StorageNode node(const std::string &id, uint64_t capacity = 10000) {
        StorageNode n;
        n.id = id;
        n.name = "name-" + id;
        n.host = "host-" + id;
        n.port = 7000;
        n.capacity = capacity;
        n.available = capacity;
        n.lastHeartbeat = 100;
        n.createdAt = 100;
        return n;
    }

    File file(const std::string &id, const std::string &name = "report.pdf",
              const std::string &checksum = "abc", std::time_t createdAt = 100) {
        File f;
        f.id = id;
        f.name = name;
        f.size = 3000;
        f.checksum = checksum;
        f.owner = "alice";
        f.createdAt = createdAt;
        f.updatedAt = createdAt;
        return f;
    }

    Chunk chunk(const std::string &id, const std::string &fileId, const std::string &nodeId,
                unsigned int ordinal, uint64_t size = 1000,
                ChunkStatus status = ChunkStatus::Completed) {
        Chunk c;
        c.id = id;
        c.fileId = fileId;
        c.nodeId = nodeId;
        c.ordinal = ordinal;
        c.objectKey = makeObjectKey(fileId, ordinal, id);
        c.size = size;
        c.checksum = "sum-" + std::to_string(ordinal);
        c.status = status;
        return c;
    }

    MemoryMetadataRepository repo;
};

TEST_F(MetadataRepositoryTest, NodeNamesAndIdsAreUnique) {
    repo.insertNode(node("n1"));
    EXPECT_THROW(repo.insertNode(node("n1")), InvalidInputError);
    StorageNode sameName = node("n2");
    sameName.name = "name-n1";
    EXPECT_THROW(repo.insertNode(sameName), InvalidInputError);
    ASSERT_TRUE(repo.findNodeByName("name-n1").has_value());
    EXPECT_EQ(repo.findNodeByName("name-n1")->id, "n1");
    EXPECT_FALSE(repo.findNode("n2").has_value());
}

TEST_F(MetadataRepositoryTest, UnknownNodeOperationsThrow) {
    EXPECT_THROW(repo.touchHeartbeat("ghost", 5), NotFoundError);
    EXPECT_THROW(repo.setNodeActive("ghost", false), NotFoundError);
    EXPECT_THROW(repo.adjustAvailable("ghost", 1), NotFoundError);
    EXPECT_THROW(repo.recomputeAvailable("ghost"), NotFoundError);
    EXPECT_FALSE(repo.deleteNode("ghost"));
}

TEST_F(MetadataRepositoryTest, AdjustAvailableClampsAndDeactivates) {
    repo.insertNode(node("n1", 1000));
    EXPECT_EQ(repo.adjustAvailable("n1", -400), 600u);
    EXPECT_EQ(repo.adjustAvailable("n1", 10000), 1000u);
    EXPECT_TRUE(repo.findNode("n1")->isActive);
    EXPECT_EQ(repo.adjustAvailable("n1", -5000), 0u);
    EXPECT_FALSE(repo.findNode("n1")->isActive);
}

TEST_F(MetadataRepositoryTest, RecomputeCountsStoredReplicasOnly) {
    repo.insertNode(node("n1", 5000));
    repo.insertFile(file("f1"));
    repo.insertChunk(chunk("c0", "f1", "n1", 0, 1000, ChunkStatus::Completed));
    repo.insertChunk(chunk("c1", "f1", "n1", 1, 1000, ChunkStatus::Corrupted));
    repo.insertChunk(chunk("c2", "f1", "n1", 2, 1000, ChunkStatus::Deleted));
    repo.insertChunk(chunk("c3", "f1", "n1", 3, 1000, ChunkStatus::Uploading));
    repo.adjustAvailable("n1", -4999);
    EXPECT_EQ(repo.recomputeAvailable("n1"), 3000u);
    EXPECT_EQ(repo.findNode("n1")->available, 3000u);

    // Completing the in-flight row charges it exactly once.
    repo.completeReplica("c3", "sum-3", 100);
    EXPECT_EQ(repo.findNode("n1")->available, 2000u);
    EXPECT_EQ(repo.recomputeAvailable("n1"), 2000u);
}

TEST_F(MetadataRepositoryTest, CorruptedUploadIsChargedOnce) {
    repo.insertNode(node("n1", 5000));
    repo.insertFile(file("f1"));
    repo.insertChunk(chunk("c0", "f1", "n1", 0, 1000, ChunkStatus::Uploading));
    EXPECT_TRUE(repo.recordVerification("c0", "bad", 100, true).isCorrupted());
    EXPECT_EQ(repo.findNode("n1")->available, 4000u);
    // Already corrupted: no second charge.
    repo.recordVerification("c0", "bad", 200, true);
    EXPECT_EQ(repo.findNode("n1")->available, 4000u);
    EXPECT_EQ(repo.recomputeAvailable("n1"), 4000u);
}

TEST_F(MetadataRepositoryTest, FileIdentityIsUnique) {
    EXPECT_TRUE(repo.insertFile(file("f1", "a.txt", "sum")));
    EXPECT_FALSE(repo.insertFile(file("f2", "a.txt", "sum")));
    EXPECT_FALSE(repo.insertFile(file("f1", "b.txt", "sum")));
    EXPECT_TRUE(repo.insertFile(file("f3", "a.txt", "other")));
    File otherOwner = file("f4", "a.txt", "sum");
    otherOwner.owner = "bob";
    EXPECT_TRUE(repo.insertFile(otherOwner));
    ASSERT_TRUE(repo.findFileByIdentity("a.txt", "sum", "bob").has_value());
    EXPECT_EQ(repo.findFileByIdentity("a.txt", "sum", "bob")->id, "f4");
}

TEST_F(MetadataRepositoryTest, ListFilesNewestFirst) {
    repo.insertFile(file("f-old", "a", "1", 10));
    repo.insertFile(file("f-new", "b", "2", 30));
    repo.insertFile(file("f-mid-b", "c", "3", 20));
    repo.insertFile(file("f-mid-a", "d", "4", 20));
    auto files = repo.listFiles();
    ASSERT_EQ(files.size(), 4u);
    EXPECT_EQ(files[0].id, "f-new");
    EXPECT_EQ(files[1].id, "f-mid-a");
    EXPECT_EQ(files[2].id, "f-mid-b");
    EXPECT_EQ(files[3].id, "f-old");
}

TEST_F(MetadataRepositoryTest, DeleteFileCascades) {
    repo.insertNode(node("n1"));
    repo.insertFile(file("f1"));
    repo.insertFile(file("f2", "other"));
    repo.insertChunk(chunk("c0", "f1", "n1", 0));
    repo.insertChunk(chunk("c1", "f2", "n1", 0));
    repo.appendVersion("f1", 3000, "abc", "alice", "", 100);
    EXPECT_TRUE(repo.deleteFile("f1"));
    EXPECT_FALSE(repo.findChunk("c0").has_value());
    EXPECT_TRUE(repo.findChunk("c1").has_value());
    EXPECT_TRUE(repo.versionsForFile("f1").empty());
    EXPECT_FALSE(repo.deleteFile("f1"));
}

TEST_F(MetadataRepositoryTest, ChunkReferencesAndDuplicates) {
    repo.insertNode(node("n1"));
    repo.insertFile(file("f1"));
    EXPECT_THROW(repo.insertChunk(chunk("c0", "ghost", "n1", 0)), InvalidInputError);
    EXPECT_THROW(repo.insertChunk(chunk("c0", "f1", "ghost", 0)), InvalidInputError);
    repo.insertChunk(chunk("c0", "f1", "n1", 0));
    EXPECT_THROW(repo.insertChunk(chunk("c0", "f1", "n1", 1)), InvalidInputError);
    // Second live replica of the same key on the same node.
    EXPECT_THROW(repo.insertChunk(chunk("c1", "f1", "n1", 0)), InvalidInputError);

    Chunk dead = *repo.findChunk("c0");
    dead.status = ChunkStatus::Deleted;
    repo.updateChunk(dead);
    EXPECT_NO_THROW(repo.insertChunk(chunk("c1", "f1", "n1", 0)));
}

TEST_F(MetadataRepositoryTest, ChunksSortedByOrdinalThenNode) {
    repo.insertNode(node("b"));
    repo.insertNode(node("a"));
    repo.insertFile(file("f1"));
    repo.insertChunk(chunk("x1", "f1", "b", 1));
    repo.insertChunk(chunk("x2", "f1", "a", 1));
    repo.insertChunk(chunk("x3", "f1", "b", 0));
    auto chunks = repo.chunksForFile("f1");
    ASSERT_EQ(chunks.size(), 3u);
    EXPECT_EQ(chunks[0].id, "x3");
    EXPECT_EQ(chunks[1].id, "x2");
    EXPECT_EQ(chunks[2].id, "x1");
    auto key = repo.chunksForKey("f1", 1);
    ASSERT_EQ(key.size(), 2u);
    EXPECT_EQ(key[0].nodeId, "a");
    EXPECT_EQ(repo.chunksOnNode("b").size(), 2u);
}

TEST_F(MetadataRepositoryTest, CompleteReplicaChargesOnce) {
    repo.insertNode(node("n1", 5000));
    repo.insertFile(file("f1"));
    repo.insertChunk(chunk("c0", "f1", "n1", 0, 1200, ChunkStatus::Uploading));
    Chunk done = repo.completeReplica("c0", "sum-0", 500);
    EXPECT_EQ(done.status, ChunkStatus::Completed);
    EXPECT_EQ(done.storedChecksum, "sum-0");
    ASSERT_TRUE(done.lastVerifiedAt.has_value());
    EXPECT_EQ(*done.lastVerifiedAt, 500);
    EXPECT_EQ(repo.findNode("n1")->available, 3800u);
    repo.completeReplica("c0", "sum-0", 600);
    EXPECT_EQ(repo.findNode("n1")->available, 3800u);
    EXPECT_THROW(repo.completeReplica("missing", "", 0), NotFoundError);
}

TEST_F(MetadataRepositoryTest, DesignatePrimaryKeepsOnePerKey) {
    repo.insertNode(node("n1"));
    repo.insertNode(node("n2"));
    repo.insertFile(file("f1"));
    repo.insertChunk(chunk("a", "f1", "n1", 0));
    repo.insertChunk(chunk("b", "f1", "n2", 0));
    repo.insertChunk(chunk("c", "f1", "n1", 1));
    repo.designatePrimary("a");
    repo.designatePrimary("c");
    repo.designatePrimary("b");
    EXPECT_FALSE(repo.findChunk("a")->isPrimary);
    EXPECT_TRUE(repo.findChunk("b")->isPrimary);
    EXPECT_TRUE(repo.findChunk("c")->isPrimary);
}

TEST_F(MetadataRepositoryTest, RecordVerification) {
    repo.insertNode(node("n1"));
    repo.insertFile(file("f1"));
    repo.insertChunk(chunk("c0", "f1", "n1", 0));
    Chunk ok = repo.recordVerification("c0", "sum-0", 700, false);
    EXPECT_EQ(ok.status, ChunkStatus::Completed);
    Chunk bad = repo.recordVerification("c0", "junk", 800, true);
    EXPECT_TRUE(bad.isCorrupted());
    EXPECT_EQ(repo.findChunk("c0")->storedChecksum, "junk");
    // Verification never clears the corrupted flag.
    EXPECT_TRUE(repo.recordVerification("c0", "sum-0", 900, false).isCorrupted());
}

TEST_F(MetadataRepositoryTest, DeleteNodeRefusedWhileItOwnsChunks) {
    repo.insertNode(node("n1"));
    repo.insertFile(file("f1"));
    repo.insertChunk(chunk("c0", "f1", "n1", 0));
    EXPECT_FALSE(repo.deleteNode("n1"));
    Chunk c = *repo.findChunk("c0");
    c.status = ChunkStatus::Deleted;
    repo.updateChunk(c);
    EXPECT_TRUE(repo.deleteNode("n1"));
    EXPECT_FALSE(repo.findChunk("c0").has_value());
}

TEST_F(MetadataRepositoryTest, VersionNumbersIncrease) {
    repo.insertFile(file("f1"));
    EXPECT_THROW(repo.appendVersion("ghost", 1, "x", "", "", 0), NotFoundError);
    auto v1 = repo.appendVersion("f1", 10, "a", "alice", "first", 100);
    auto v2 = repo.appendVersion("f1", 20, "b", "alice", "", 200);
    EXPECT_EQ(v1.versionNumber, 1u);
    EXPECT_EQ(v2.versionNumber, 2u);
    auto list = repo.versionsForFile("f1");
    ASSERT_EQ(list.size(), 2u);
    EXPECT_EQ(list[0].id, v2.id);
    EXPECT_EQ(repo.findVersion(v1.id)->notes, "first");
}

TEST_F(MetadataRepositoryTest, ConcurrentAppendsAreGapFree) {
    repo.insertFile(file("f1"));
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([this] {
            for (int i = 0; i < 25; ++i) repo.appendVersion("f1", 1, "x", "t", "", 0);
        });
    }
    for (auto &t : threads) t.join();
    auto list = repo.versionsForFile("f1");
    ASSERT_EQ(list.size(), 200u);
    for (size_t i = 0; i < list.size(); ++i) {
        EXPECT_EQ(list[i].versionNumber, 200u - i);
    }
}

TEST_F(MetadataRepositoryTest, ChunkKeyLockSerializes) {
    std::atomic<int> inside{0};
    std::atomic<int> maxInside{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 6; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < 50; ++i) {
                auto lock = repo.lockChunkKey("f1", 0);
                int now = ++inside;
                int seen = maxInside.load();
                while (now > seen && !maxInside.compare_exchange_weak(seen, now)) {
                }
                --inside;
            }
        });
    }
    for (auto &t : threads) t.join();
    EXPECT_EQ(maxInside.load(), 1);
}

TEST_F(MetadataRepositoryTest, SnapshotRoundTrip) {
    std::string path = (std::filesystem::temp_directory_path() / "chunkvault_snapshot_test.yaml").string();
    std::remove(path.c_str());

    repo.insertNode(node("n1", 5000));
    File f = file("f1", "notes: with colon.txt");
    f.isDeleted = true;
    f.deletedAt = 444;
    f.contentType = "text/plain";
    repo.insertFile(f);
    Chunk c = chunk("c0", "f1", "n1", 0, 1000, ChunkStatus::Uploading);
    repo.insertChunk(c);
    repo.completeReplica("c0", "sum-0", 555);
    repo.designatePrimary("c0");
    repo.appendVersion("f1", 3000, "abc", "alice", "nightly", 600);
    repo.saveSnapshot(path);

    MemoryMetadataRepository loaded;
    ASSERT_TRUE(loaded.loadSnapshot(path));
    auto n = loaded.findNode("n1");
    ASSERT_TRUE(n.has_value());
    EXPECT_EQ(n->available, 4000u);
    EXPECT_EQ(n->port, 7000);
    auto lf = loaded.findFile("f1");
    ASSERT_TRUE(lf.has_value());
    EXPECT_EQ(lf->name, "notes: with colon.txt");
    EXPECT_TRUE(lf->isDeleted);
    ASSERT_TRUE(lf->deletedAt.has_value());
    EXPECT_EQ(*lf->deletedAt, 444);
    auto lc = loaded.findChunk("c0");
    ASSERT_TRUE(lc.has_value());
    EXPECT_EQ(lc->status, ChunkStatus::Completed);
    EXPECT_TRUE(lc->isPrimary);
    EXPECT_EQ(lc->objectKey, c.objectKey);
    auto versions = loaded.versionsForFile("f1");
    ASSERT_EQ(versions.size(), 1u);
    EXPECT_EQ(versions[0].notes, "nightly");
    std::remove(path.c_str());
}

TEST_F(MetadataRepositoryTest, SnapshotMissingOrMalformed) {
    std::string path = (std::filesystem::temp_directory_path() / "chunkvault_bad_snapshot.yaml").string();
    std::remove(path.c_str());
    EXPECT_FALSE(repo.loadSnapshot(path));

    {
        std::ofstream out(path);
        out << "chunks:\n  - id: c0\n    status: vanished\n";
    }
    EXPECT_THROW(repo.loadSnapshot(path), InvalidInputError);
    EXPECT_TRUE(repo.listChunks().empty());

    {
        std::ofstream out(path);
        out << "nodes: [ {id: n1, capacity: lots} ]\n";
    }
    EXPECT_THROW(repo.loadSnapshot(path), InvalidInputError);
    EXPECT_TRUE(repo.listNodes().empty());
    std::remove(path.c_str());
}
