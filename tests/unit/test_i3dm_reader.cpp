#include <gtest/gtest.h>
#include "core/format/i3dm_reader.h"
#include "core/format/errors.h"
#include "utils/i3dm_builder.h"

using namespace I3dm::Core::Format;
using namespace I3dm::Test;

class I3dmReaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        builder.featureTable["INSTANCES_LENGTH"] = 2;
        builder.setBinaryProperty<float>("POSITION", {0, 0, 0, 1, 1, 1});
    }

    I3dmBuilder builder;
};

TEST_F(I3dmReaderTest, ReadsEmbeddedTile) {
    builder.batchTable = {{"height", {10, 20}}};
    auto buffer = builder.build();

    I3dmTile tile = readI3dmTile(buffer);
    ASSERT_TRUE(tile.featureTable);
    EXPECT_TRUE(tile.featureTable->hasProperty("POSITION"));
    EXPECT_EQ(tile.featureTable->binary().size() % 8, 0u);
    EXPECT_TRUE(tile.hasEmbeddedGltf());
    EXPECT_EQ(tile.gltf, builder.gltf);
    EXPECT_TRUE(tile.gltfUri.empty());
    EXPECT_EQ(tile.batchTableJson["height"][1], 20);
    EXPECT_EQ(tile.byteOffset, buffer.size());
}

TEST_F(I3dmReaderTest, ReadsUriTile) {
    builder.setGltfUri("models/tree.glb");
    auto buffer = builder.build();

    I3dmTile tile = readI3dmTile(buffer);
    EXPECT_FALSE(tile.hasEmbeddedGltf());
    EXPECT_EQ(tile.gltfUri, "models/tree.glb");
    EXPECT_TRUE(tile.gltf.empty());
    EXPECT_TRUE(tile.batchTableJson.is_null());
}

TEST_F(I3dmReaderTest, UriPaddingIsTrimmed) {
    std::string uri = "tree.glb";
    uri.push_back('\0');
    uri += "   ";
    builder.gltfFormat = 0;
    builder.gltf.assign(uri.begin(), uri.end());
    auto buffer = builder.build();

    EXPECT_EQ(readI3dmTile(buffer).gltfUri, "tree.glb");
}

TEST_F(I3dmReaderTest, BatchTableBinaryIsSkipped) {
    builder.batchTable = {{"id", {{"byteOffset", 0}}}};
    builder.batchTableBinary = {1, 2, 3, 4, 5, 6, 7, 8};
    auto buffer = builder.build();

    I3dmTile tile = readI3dmTile(buffer);
    EXPECT_EQ(tile.gltf, builder.gltf);
    EXPECT_EQ(tile.byteOffset, buffer.size());
}

TEST_F(I3dmReaderTest, TruncatedSection) {
    auto buffer = builder.build();
    buffer.resize(buffer.size() - 1);
    EXPECT_THROW(readI3dmTile(buffer), MalformedTileError);
}

TEST_F(I3dmReaderTest, InvalidFeatureTableJson) {
    auto buffer = builder.build();
    buffer[I3dmBuilder::HEADER_LENGTH] = '[';
    buffer[I3dmBuilder::HEADER_LENGTH + 1] = '}';
    EXPECT_THROW(readI3dmTile(buffer), MalformedTileError);
}

TEST_F(I3dmReaderTest, StrictByteLength) {
    auto buffer = builder.build();
    setHeaderField(buffer, 8, static_cast<uint32_t>(buffer.size() + 100));

    EXPECT_NO_THROW(readI3dmTile(buffer));

    ReaderOptions options;
    options.strictByteLength = true;
    EXPECT_THROW(readI3dmTile(buffer, 0, options), MalformedTileError);
}

TEST_F(I3dmReaderTest, HeaderErrorsPropagate) {
    builder.magic = "cmpt";
    auto buffer = builder.build();
    EXPECT_THROW(readI3dmTile(buffer), FormatError);
}

TEST_F(I3dmReaderTest, StringFromBytes) {
    const uint8_t text[] = {'a', 'b', ' ', 0, ' '};
    EXPECT_EQ(getStringFromBytes(text, sizeof(text)), "ab");
    const uint8_t blank[] = {' ', 0};
    EXPECT_EQ(getStringFromBytes(blank, sizeof(blank)), "");
}
