#include <gtest/gtest.h>
#include "core/format/i3dm_header.h"
#include "core/format/errors.h"
#include "utils/i3dm_builder.h"

using namespace I3dm::Core::Format;
using namespace I3dm::Test;

class I3dmHeaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        builder.featureTable["INSTANCES_LENGTH"] = 0;
    }

    I3dmBuilder builder;
};

TEST_F(I3dmHeaderTest, ReadsAllFields) {
    builder.batchTable = {{"name", nlohmann::json::array()}};
    auto buffer = builder.build();

    size_t offset = 0;
    I3dmHeader header = readI3dmHeader(buffer.data(), buffer.size(), offset);

    EXPECT_EQ(offset, I3dmHeader::BYTE_LENGTH);
    EXPECT_EQ(header.version, 1u);
    EXPECT_EQ(header.byteLength, buffer.size());
    EXPECT_GT(header.featureTableJsonByteLength, 0u);
    EXPECT_EQ(header.featureTableJsonByteLength % 8, 0u);
    EXPECT_EQ(header.featureTableBinaryByteLength, 0u);
    EXPECT_GT(header.batchTableJsonByteLength, 0u);
    EXPECT_EQ(header.batchTableBinaryByteLength, 0u);
    EXPECT_EQ(header.gltfByteLength, builder.gltf.size());
    EXPECT_EQ(header.gltfFormat, GltfFormat::EMBEDDED);
}

TEST_F(I3dmHeaderTest, ReadsFromByteOffset) {
    auto tile = builder.build();
    std::vector<uint8_t> buffer(12, 0xAB);
    buffer.insert(buffer.end(), tile.begin(), tile.end());

    size_t offset = 12;
    I3dmHeader header = readI3dmHeader(buffer.data(), buffer.size(), offset);
    EXPECT_EQ(offset, 12 + I3dmHeader::BYTE_LENGTH);
    EXPECT_EQ(header.byteLength, tile.size());
}

TEST_F(I3dmHeaderTest, UriFormat) {
    builder.setGltfUri("model.glb");
    auto buffer = builder.build();
    size_t offset = 0;
    EXPECT_EQ(readI3dmHeader(buffer.data(), buffer.size(), offset).gltfFormat, GltfFormat::URI);
}

TEST_F(I3dmHeaderTest, WrongMagic) {
    builder.magic = "b3dm";
    auto buffer = builder.build();
    size_t offset = 0;
    EXPECT_THROW(readI3dmHeader(buffer.data(), buffer.size(), offset), FormatError);
    EXPECT_EQ(offset, 0u);
}

TEST_F(I3dmHeaderTest, WrongVersion) {
    for (uint32_t version : {0u, 2u, 0xFFFFFFFFu}) {
        builder.version = version;
        auto buffer = builder.build();
        size_t offset = 0;
        EXPECT_THROW(readI3dmHeader(buffer.data(), buffer.size(), offset), UnsupportedVersionError)
            << "version " << version;
    }
}

TEST_F(I3dmHeaderTest, MagicCheckedBeforeVersion) {
    builder.magic = "pnts";
    builder.version = 7;
    auto buffer = builder.build();
    size_t offset = 0;
    EXPECT_THROW(readI3dmHeader(buffer.data(), buffer.size(), offset), FormatError);
}

TEST_F(I3dmHeaderTest, ZeroFeatureTableJsonLength) {
    auto buffer = builder.build();
    setHeaderField(buffer, 12, 0);
    size_t offset = 0;
    EXPECT_THROW(readI3dmHeader(buffer.data(), buffer.size(), offset), MalformedTileError);
}

TEST_F(I3dmHeaderTest, ZeroGltfLength) {
    auto buffer = builder.build();
    setHeaderField(buffer, 28, 0);
    size_t offset = 0;
    EXPECT_THROW(readI3dmHeader(buffer.data(), buffer.size(), offset), MalformedTileError);
}

TEST_F(I3dmHeaderTest, UnsupportedGltfFormat) {
    builder.gltfFormat = 2;
    auto buffer = builder.build();
    size_t offset = 0;
    EXPECT_THROW(readI3dmHeader(buffer.data(), buffer.size(), offset), UnsupportedPayloadFormatError);
}

TEST_F(I3dmHeaderTest, TruncatedHeader) {
    auto buffer = builder.build();
    buffer.resize(20);
    size_t offset = 0;
    EXPECT_THROW(readI3dmHeader(buffer.data(), buffer.size(), offset), MalformedTileError);
}

TEST_F(I3dmHeaderTest, ByteLengthIsInformational) {
    auto buffer = builder.build();
    setHeaderField(buffer, 8, 12345678);
    size_t offset = 0;
    EXPECT_EQ(readI3dmHeader(buffer.data(), buffer.size(), offset).byteLength, 12345678u);
}

TEST_F(I3dmHeaderTest, ErrorsDeriveFromI3dmError) {
    builder.magic = "xxxx";
    auto buffer = builder.build();
    size_t offset = 0;
    EXPECT_THROW(readI3dmHeader(buffer.data(), buffer.size(), offset), I3dmError);
}
