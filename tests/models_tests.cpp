#include "gtest/gtest.h"
#include "storage/errors.h"
#include "storage/models.h"

#include <set>

using namespace chunkvault;

TEST(Models, ChunkStatusText) {
    for (auto s : {ChunkStatus::Uploading, ChunkStatus::Completed, ChunkStatus::Corrupted,
                   ChunkStatus::Deleted}) {
        EXPECT_EQ(chunkStatusFromString(chunkStatusToString(s)), s);
    }
    EXPECT_STREQ(chunkStatusToString(ChunkStatus::Corrupted), "corrupted");
    EXPECT_THROW(chunkStatusFromString("lost"), InvalidInputError);
}

TEST(Models, NodeAddress) {
    StorageNode tcp;
    tcp.host = "10.0.0.5";
    tcp.port = 7000;
    EXPECT_EQ(tcp.address(), "10.0.0.5:7000");
    StorageNode dir;
    dir.host = "/var/chunkvault/nodes/a";
    EXPECT_EQ(dir.address(), "/var/chunkvault/nodes/a");
}

TEST(Models, FileCategory) {
    File f;
    EXPECT_EQ(fileCategory(f), "other");
    f.contentType = "image/png";
    EXPECT_EQ(fileCategory(f), "image");
    f.contentType = "text/plain";
    EXPECT_EQ(fileCategory(f), "document");
    f.contentType = "application/pdf";
    EXPECT_EQ(fileCategory(f), "document");
    f.contentType = "application/zip";
    EXPECT_EQ(fileCategory(f), "archive");
    f.contentType = "video/mp4";
    EXPECT_EQ(fileCategory(f), "other");
}

TEST(Models, HumanReadableSize) {
    EXPECT_EQ(humanReadableSize(0), "0.00 B");
    EXPECT_EQ(humanReadableSize(1536), "1.50 KB");
    EXPECT_EQ(humanReadableSize(5ULL * 1024 * 1024 * 1024), "5.00 GB");
}

TEST(Models, GeneratedIdsAreUniqueUuids) {
    std::set<std::string> seen;
    for (int i = 0; i < 200; ++i) {
        std::string id = generateId();
        ASSERT_EQ(id.size(), 36u);
        EXPECT_EQ(id[8], '-');
        EXPECT_EQ(id[14], '4');
        EXPECT_TRUE(seen.insert(id).second);
    }
}

TEST(Models, ObjectKey) {
    EXPECT_EQ(makeObjectKey("f1", 3, "c9"), "f1/3/c9");
}

TEST(Models, ErrorCodes) {
    IncompleteFileError e("gap", 4096);
    EXPECT_EQ(e.code(), ErrorCode::IncompleteFile);
    EXPECT_STREQ(errorCodeName(e.code()), "IncompleteFile");
    EXPECT_EQ(e.bytesDelivered(), 4096u);
    InsufficientCapacityError cap("short", 1, 3);
    EXPECT_EQ(cap.eligible(), 1u);
    EXPECT_EQ(cap.requested(), 3u);
    const StorageError &base = cap;
    EXPECT_STREQ(errorCodeName(base.code()), "InsufficientCapacity");
}
