#include <gtest/gtest.h>
#include <string>

#include "storage/local_data_source.hpp"
#include "test_helpers.hpp"

namespace {

using namespace chunkworker::core;
using chunkworker::storage::LocalDataSource;
using chunkworker::test::TempDir;
using chunkworker::test::datasetOf;
using chunkworker::test::writeFile;

TEST(LocalDataSourceTest, ChunkPathLayout) {
    LocalDataSource source("/data");
    const DataChunk chunk = chunkworker::test::chunkFor(datasetOf(0x11), 0, 35);
    EXPECT_EQ(source.chunkPath(chunk),
              "/data/dataset_id=" + std::string(64, '1') + "/block_range=0_35/");
    EXPECT_EQ(source.makeRef(chunk).path, source.chunkPath(chunk));
}

TEST(LocalDataSourceTest, ParsesDirectoryNames) {
    EXPECT_EQ(LocalDataSource::parseRangeDirName("block_range=36_94"), BlockRange(36, 94));
    EXPECT_FALSE(LocalDataSource::parseRangeDirName("block_range=94_36").has_value());
    EXPECT_FALSE(LocalDataSource::parseRangeDirName("block_range=5_5").has_value());
    EXPECT_FALSE(LocalDataSource::parseRangeDirName("block_range=1-2").has_value());
    EXPECT_FALSE(LocalDataSource::parseRangeDirName("range=1_2").has_value());
    EXPECT_FALSE(LocalDataSource::parseRangeDirName("block_range=99999999999999999999_1").has_value());

    EXPECT_EQ(LocalDataSource::parseDatasetDirName("dataset_id=" + std::string(64, 'a')), datasetOf(0xaa));
    EXPECT_FALSE(LocalDataSource::parseDatasetDirName("dataset_id=abc").has_value());
    EXPECT_FALSE(LocalDataSource::parseDatasetDirName("tmp").has_value());
}

TEST(LocalDataSourceTest, MissingDirectoryHasNoChunks) {
    TempDir dir("local_missing");
    LocalDataSource source(dir.file("not_there"));
    EXPECT_TRUE(source.discoverLocalChunks().empty());
}

TEST(LocalDataSourceTest, DiscoversChunksAndSkipsStrayEntries) {
    TempDir dir("local_discover");
    LocalDataSource source(dir.path().string());
    const DatasetId ds = datasetOf(0x11);

    const std::string first = source.chunkPath(ds, BlockRange(0, 35));
    const std::string second = source.chunkPath(ds, BlockRange(36, 94));
    writeFile(first + "blocks.parquet", "b");
    writeFile(first + "logs.parquet", "l");
    writeFile(second + "blocks.parquet", "b2");
    writeFile(second + "half.parquet.part", "partial");
    writeFile(dir.path() / "lost+found" / "junk", "x");
    writeFile(dir.path() / ("dataset_id=" + std::string(64, '1')) / "not_a_range" / "x", "x");
    writeFile(dir.path() / "catalogue.sqlite", "not a directory");

    auto chunks = source.discoverLocalChunks();
    ASSERT_EQ(chunks.size(), 2u);

    EXPECT_EQ(chunks[0].blockRange, BlockRange(0, 35));
    EXPECT_EQ(chunks[0].id, deriveChunkId(ds, BlockRange(0, 35)));
    ASSERT_EQ(chunks[0].files.size(), 2u);
    EXPECT_EQ(chunks[0].files.at("blocks.parquet"), first + "blocks.parquet");

    EXPECT_EQ(chunks[1].blockRange, BlockRange(36, 94));
    EXPECT_EQ(chunks[1].files.size(), 1u);
    EXPECT_EQ(chunks[1].files.count("half.parquet.part"), 0u);
}

} // namespace
