#include "mocks/mock_object_store.h"
#include "store_fixture.h"
#include "storage/errors.h"

using namespace chunkvault;
using ::testing::_;
using ::testing::Throw;

class ChunkVerifierTest : public StoreFixture {
protected:
    void SetUp() override {
        StoreFixture::SetUp();
        a = addNode("a", 100000);
        b = addNode("b", 100000);
        c = addNode("c", 100000);
        data = generate_pseudo_random_data(4096, 21);
        file = makeFile("f", data);
        result = coordinator->write(file.id, 0, data, 3);
        ASSERT_EQ(result.achieved, 3u);
    }

    Chunk replicaOn(const StorageNode &node) {
        for (const auto &r : repo.chunksForKey(file.id, 0)) {
            if (r.nodeId == node.id) return r;
        }
        ADD_FAILURE() << "no replica on " << node.name;
        return Chunk{};
    }

    StorageNode a, b, c;
    std::vector<std::byte> data;
    File file;
    WriteResult result;
};

TEST_F(ChunkVerifierTest, HealthyReplicaPasses) {
    Chunk r = replicaOn(a);
    EXPECT_TRUE(verifier->verify(r.id));
    Chunk after = *repo.findChunk(r.id);
    EXPECT_EQ(after.status, ChunkStatus::Completed);
    EXPECT_EQ(after.storedChecksum, r.checksum);
    EXPECT_EQ(MetricsRegistry::instance().counterValue("chunkvault_chunk_verifications_total",
                                                       {{"result", "ok"}}),
              1.0);
}

TEST_F(ChunkVerifierTest, TamperedReplicaMarkedCorruptedSiblingsUntouched) {
    Chunk bad = replicaOn(b);
    ASSERT_TRUE(memory->corruptObject(b.address(), bad.objectKey));

    std::vector<Chunk> reportedSiblings;
    std::string reported;
    verifier->setCorruptionHandler([&](const Chunk &corrupted, const std::vector<Chunk> &siblings) {
        reported = corrupted.id;
        reportedSiblings = siblings;
    });

    EXPECT_FALSE(verifier->verify(bad.id));
    Chunk after = *repo.findChunk(bad.id);
    EXPECT_TRUE(after.isCorrupted());
    EXPECT_NE(after.storedChecksum, after.checksum);
    EXPECT_EQ(reported, bad.id);
    ASSERT_EQ(reportedSiblings.size(), 2u);
    for (const auto &s : reportedSiblings) {
        EXPECT_NE(s.nodeId, b.id);
        EXPECT_EQ(repo.findChunk(s.id)->status, ChunkStatus::Completed);
    }

    // Already corrupted: the handler is not called again.
    reported.clear();
    EXPECT_FALSE(verifier->verify(bad.id));
    EXPECT_TRUE(reported.empty());
}

TEST_F(ChunkVerifierTest, MissingObjectCountsAsCorrupted) {
    Chunk r = replicaOn(c);
    ASSERT_TRUE(memory->deleteObject(c.address(), r.objectKey));
    EXPECT_FALSE(verifier->verify(r.id));
    Chunk after = *repo.findChunk(r.id);
    EXPECT_TRUE(after.isCorrupted());
    EXPECT_TRUE(after.storedChecksum.empty());
}

TEST_F(ChunkVerifierTest, UnreachableNodeChangesNothing) {
    Chunk r = replicaOn(a);
    faulty->failReads(a.address());
    try {
        verifier->verify(r.id);
        FAIL() << "expected NodeUnavailableError";
    } catch (const NodeUnavailableError &e) {
        EXPECT_EQ(e.nodeId(), a.id);
    }
    Chunk after = *repo.findChunk(r.id);
    EXPECT_EQ(after.status, ChunkStatus::Completed);
    EXPECT_EQ(after.lastVerifiedAt, r.lastVerifiedAt);
    EXPECT_EQ(registry->health().state(a.id), NodeState::SUSPECT);
}

TEST_F(ChunkVerifierTest, RequireHealthyThrowsCorruptChunk) {
    Chunk r = replicaOn(a);
    EXPECT_NO_THROW(verifier->requireHealthy(r.id));
    memory->corruptObject(a.address(), r.objectKey);
    try {
        verifier->requireHealthy(r.id);
        FAIL() << "expected CorruptChunkError";
    } catch (const CorruptChunkError &e) {
        EXPECT_EQ(e.chunkId(), r.id);
    }
}

TEST_F(ChunkVerifierTest, UnknownOrDeletedChunkNotFound) {
    EXPECT_THROW(verifier->verify("ghost"), NotFoundError);
    Chunk r = replicaOn(a);
    r.status = ChunkStatus::Deleted;
    repo.updateChunk(r);
    EXPECT_THROW(verifier->verify(r.id), NotFoundError);
}

TEST_F(ChunkVerifierTest, VerifyFileAndVerifyAll) {
    Chunk bad = replicaOn(b);
    memory->corruptObject(b.address(), bad.objectKey);
    faulty->failReads(c.address());

    EXPECT_EQ(verifier->verifyFile(file.id), 1u);
    EXPECT_EQ(MetricsRegistry::instance().gaugeValue("chunkvault_chunks_corrupted"), 1.0);
    EXPECT_THROW(verifier->verifyFile("ghost"), NotFoundError);

    // Corrupted replicas are no longer swept.
    ChunkVerifier::Summary summary = verifier->verifyAll();
    EXPECT_EQ(summary.checked, 2u);
    EXPECT_EQ(summary.corrupted, 0u);
    EXPECT_EQ(summary.unavailable, 1u);
    EXPECT_EQ(MetricsRegistry::instance().gaugeValue("chunkvault_chunks_corrupted"), 1.0);
}

TEST_F(ChunkVerifierTest, TransportErrorFromClientIsUnavailable) {
    auto mock = std::make_shared<MockObjectStoreClient>();
    ChunkVerifier mocked(repo, *registry, mock);
    EXPECT_CALL(*mock, getObject(a.address(), _))
        .WillOnce(Throw(ObjectStoreError("connection refused")));
    Chunk r = replicaOn(a);
    EXPECT_THROW(mocked.verify(r.id), NodeUnavailableError);
    EXPECT_EQ(MetricsRegistry::instance().counterValue("chunkvault_chunk_verifications_total",
                                                       {{"result", "unavailable"}}),
              1.0);
}
