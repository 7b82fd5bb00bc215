#include "gtest/gtest.h"
#include "storage/errors.h"
#include "utilities/chunker.hpp"
#include "utilities/stress_utils.hpp"

#include <sstream>
#include <string>
#include <vector>

using namespace chunkvault;

namespace {

std::vector<ChunkPiece> cutAll(const std::string &content, uint64_t chunkSize) {
    std::istringstream in(content);
    ChunkReader reader(in, chunkSize, 1024, 1024 * 1024);
    std::vector<ChunkPiece> pieces;
    while (auto piece = reader.next()) {
        pieces.push_back(std::move(*piece));
    }
    EXPECT_EQ(reader.bytesRead(), content.size());
    return pieces;
}

std::string join(const std::vector<ChunkPiece> &pieces) {
    std::string out;
    for (const auto &p : pieces) {
        out.append(reinterpret_cast<const char *>(p.bytes.data()), p.bytes.size());
    }
    return out;
}

} // namespace

TEST(Chunker, CountsAndSizes) {
    std::string content = generate_pseudo_random_string(10000, 1);
    auto pieces = cutAll(content, 4096);
    ASSERT_EQ(pieces.size(), 3u);
    EXPECT_EQ(pieces.size(), expectedChunkCount(content.size(), 4096));
    EXPECT_EQ(pieces[0].bytes.size(), 4096u);
    EXPECT_EQ(pieces[1].bytes.size(), 4096u);
    EXPECT_EQ(pieces[2].bytes.size(), 10000u - 8192u);
    for (size_t i = 0; i < pieces.size(); ++i) {
        EXPECT_EQ(pieces[i].ordinal, i);
    }
    EXPECT_EQ(join(pieces), content);
}

TEST(Chunker, ExactMultipleHasNoTrailingEmptyChunk) {
    std::string content = generate_pseudo_random_string(8192, 2);
    auto pieces = cutAll(content, 4096);
    ASSERT_EQ(pieces.size(), 2u);
    EXPECT_EQ(expectedChunkCount(8192, 4096), 2u);
    EXPECT_EQ(pieces[1].bytes.size(), 4096u);
    EXPECT_EQ(join(pieces), content);
}

TEST(Chunker, EmptyInputYieldsOneEmptyChunk) {
    auto pieces = cutAll("", 4096);
    ASSERT_EQ(pieces.size(), 1u);
    EXPECT_EQ(pieces[0].ordinal, 0u);
    EXPECT_TRUE(pieces[0].bytes.empty());
    EXPECT_EQ(expectedChunkCount(0, 4096), 1u);
}

TEST(Chunker, SmallerThanOneChunk) {
    auto pieces = cutAll("hello", 1024);
    ASSERT_EQ(pieces.size(), 1u);
    EXPECT_EQ(join(pieces), "hello");
}

TEST(Chunker, ChunkSizeValidation) {
    EXPECT_THROW(validateChunkSize(0, 1024, 4096), InvalidInputError);
    EXPECT_THROW(validateChunkSize(1000, 1024, 4096), InvalidInputError);
    EXPECT_THROW(validateChunkSize(8192, 1024, 4096), InvalidInputError);
    EXPECT_THROW(validateChunkSize(1024, 0, 4096), InvalidInputError);
    EXPECT_NO_THROW(validateChunkSize(4096, 1024, 4096));

    std::istringstream in("x");
    EXPECT_THROW(ChunkReader(in, 1000, 1024, 4096), InvalidInputError);
}

TEST(Chunker, NextAfterEndKeepsReturningNothing) {
    std::istringstream in("abc");
    ChunkReader reader(in, 1024, 1024, 4096);
    EXPECT_TRUE(reader.next().has_value());
    EXPECT_FALSE(reader.next().has_value());
    EXPECT_FALSE(reader.next().has_value());
}
