#include "store_fixture.h"
#include "storage/errors.h"

using namespace chunkvault;

class FileAssemblerTest : public StoreFixture {
protected:
    void SetUp() override {
        StoreFixture::SetUp();
        addNode("a", 1000000);
        addNode("b", 1000000);
        addNode("c", 1000000);
        data = generate_pseudo_random_data(10000, 31);
    }

    std::string asString(const std::vector<std::byte> &bytes) {
        return std::string(reinterpret_cast<const char *>(bytes.data()), bytes.size());
    }

    std::vector<Chunk> completed(const std::string &fileId, unsigned int ordinal) {
        std::vector<Chunk> out;
        for (auto &c : repo.chunksForKey(fileId, ordinal)) {
            if (c.status == ChunkStatus::Completed) out.push_back(std::move(c));
        }
        return out;
    }

    void corruptAll(const std::string &fileId, unsigned int ordinal) {
        for (const auto &c : completed(fileId, ordinal)) {
            memory->corruptObject(repo.findNode(c.nodeId)->address(), c.objectKey);
        }
    }

    std::vector<std::byte> data;
};

TEST_F(FileAssemblerTest, RoundTrip) {
    File f = uploadBytes("blob.bin", data).file;
    EXPECT_EQ(assembler->readAll(f.id), data);

    std::ostringstream out;
    EXPECT_EQ(assembler->read(f.id, out), data.size());
    EXPECT_EQ(out.str(), asString(data));
    EXPECT_EQ(MetricsRegistry::instance().counterValue("chunkvault_file_reads_total", {{"result", "ok"}}),
              2.0);
}

TEST_F(FileAssemblerTest, EmptyFileRoundTrip) {
    File f = uploadBytes("empty.bin", {}).file;
    EXPECT_TRUE(assembler->readAll(f.id).empty());
    std::ostringstream out;
    EXPECT_EQ(assembler->read(f.id, out), 0u);
}

TEST_F(FileAssemblerTest, FallsBackWhenPrimaryIsCorrupted) {
    File f = uploadBytes("blob.bin", data).file;
    Chunk primary;
    for (const auto &c : completed(f.id, 1)) {
        if (c.isPrimary) primary = c;
    }
    ASSERT_FALSE(primary.id.empty());
    memory->corruptObject(repo.findNode(primary.nodeId)->address(), primary.objectKey);

    EXPECT_EQ(assembler->readAll(f.id), data);
    EXPECT_TRUE(repo.findChunk(primary.id)->isCorrupted());
}

TEST_F(FileAssemblerTest, FallsBackWhenPrimaryNodeIsDown) {
    File f = uploadBytes("blob.bin", data).file;
    for (const auto &c : completed(f.id, 0)) {
        if (c.isPrimary) faulty->failReads(repo.findNode(c.nodeId)->address());
    }
    EXPECT_EQ(assembler->readAll(f.id), data);
}

TEST_F(FileAssemblerTest, MissingOrdinalIsIncomplete) {
    File f = uploadBytes("blob.bin", data).file;
    for (const auto &c : completed(f.id, 1)) repo.deleteChunk(c.id);
    EXPECT_THROW(assembler->readAll(f.id), IncompleteFileError);
    EXPECT_EQ(MetricsRegistry::instance().counterValue("chunkvault_file_reads_total",
                                                       {{"result", "IncompleteFile"}}),
              1.0);
}

TEST_F(FileAssemblerTest, TrailingOrdinalMissingIsIncomplete) {
    File f = uploadBytes("blob.bin", data).file;
    for (const auto &c : completed(f.id, 2)) repo.deleteChunk(c.id);
    // Ordinals 0..1 are contiguous, but their sizes fall short of the file.
    EXPECT_THROW(assembler->readAll(f.id), IncompleteFileError);
}

TEST_F(FileAssemblerTest, EveryReplicaCorruptedIsIncomplete) {
    File f = uploadBytes("blob.bin", data).file;
    corruptAll(f.id, 0);
    std::ostringstream out;
    try {
        assembler->read(f.id, out);
        FAIL() << "expected IncompleteFileError";
    } catch (const IncompleteFileError &e) {
        EXPECT_EQ(e.bytesDelivered(), 0u);
    }
    EXPECT_TRUE(out.str().empty());
    EXPECT_TRUE(completed(f.id, 0).empty());
}

TEST_F(FileAssemblerTest, WholeFileDigestMismatchIsIntegrityFailure) {
    File f = uploadBytes("blob.bin", data).file;
    File wrong = *repo.findFile(f.id);
    wrong.checksum = digestBytes(generate_pseudo_random_data(10, 1));
    repo.updateFile(wrong);

    std::ostringstream out;
    try {
        assembler->read(f.id, out);
        FAIL() << "expected IntegrityFailureError";
    } catch (const IntegrityFailureError &e) {
        EXPECT_EQ(e.expected(), wrong.checksum);
        EXPECT_EQ(e.actual(), f.checksum);
    }
    // Buffered reads never hand out unvalidated bytes.
    EXPECT_TRUE(out.str().empty());
}

TEST_F(FileAssemblerTest, UnknownOrDeletedFileNotFound) {
    EXPECT_THROW(assembler->readAll("ghost"), NotFoundError);
    File f = uploadBytes("blob.bin", data).file;
    files->softDelete(f.id);
    EXPECT_THROW(assembler->readAll(f.id), NotFoundError);
}

TEST_F(FileAssemblerTest, LargeFilesAreStreamed) {
    config.maxBufferedReadBytes = 4096;
    rebuild();
    File f = uploadBytes("blob.bin", data).file;
    std::ostringstream out;
    EXPECT_EQ(assembler->read(f.id, out), data.size());
    EXPECT_EQ(out.str(), asString(data));
}

TEST_F(FileAssemblerTest, StreamingReportsDeliveredBytesOnGap) {
    config.maxBufferedReadBytes = 4096;
    rebuild();
    File f = uploadBytes("blob.bin", data).file;
    corruptAll(f.id, 2);
    std::ostringstream out;
    try {
        assembler->read(f.id, out);
        FAIL() << "expected IncompleteFileError";
    } catch (const IncompleteFileError &e) {
        EXPECT_EQ(e.bytesDelivered(), 8192u);
    }
    EXPECT_EQ(out.str().size(), 8192u);
}

TEST_F(FileAssemblerTest, StreamingChecksWholeFileAfterLastByte) {
    config.maxBufferedReadBytes = 4096;
    rebuild();
    File f = uploadBytes("blob.bin", data).file;
    File wrong = *repo.findFile(f.id);
    wrong.checksum = std::string(64, '0');
    repo.updateFile(wrong);
    std::ostringstream out;
    EXPECT_THROW(assembler->read(f.id, out), IntegrityFailureError);
    EXPECT_EQ(out.str().size(), data.size());
}

TEST_F(FileAssemblerTest, FailingOutputStreamIsStreamError) {
    File f = uploadBytes("blob.bin", data).file;
    std::ostringstream out;
    out.setstate(std::ios::badbit);
    EXPECT_THROW(assembler->read(f.id, out), StreamError);
}
