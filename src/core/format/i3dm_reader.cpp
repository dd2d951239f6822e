#include "i3dm_reader.h"
#include "errors.h"
#include "../../log.h"
#include <fmt/format.h>

namespace I3dm::Core::Format {

namespace {

void checkSection(const char* name, std::size_t offset, std::size_t length, std::size_t size) {
    if (offset > size || length > size - offset) {
        throw MalformedTileError(fmt::format(
            "Invalid i3dm {} offset {} length {} buffer length {}", name, offset, length, size));
    }
}

nlohmann::json parseJsonSection(const char* name, const uint8_t* data, std::size_t length) {
    std::string text = getStringFromBytes(data, length);
    try {
        return nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        throw MalformedTileError(fmt::format("Error when parsing {} JSON: {}", name, e.what()));
    }
}

}

std::string getStringFromBytes(const uint8_t* data, std::size_t length) {
    std::string text(reinterpret_cast<const char*>(data), length);
    std::size_t end = text.find_last_not_of(std::string(" \0", 2));
    if (end == std::string::npos) {
        return std::string();
    }
    text.resize(end + 1);
    return text;
}

I3dmTile readI3dmTile(const uint8_t* data, std::size_t size, std::size_t byteOffset,
                      const ReaderOptions& options) {
    std::size_t tileStart = byteOffset;

    I3dmTile tile;
    tile.header = readI3dmHeader(data, size, byteOffset);
    const I3dmHeader& header = tile.header;

    if (options.strictByteLength && header.byteLength > size - tileStart) {
        throw MalformedTileError(fmt::format(
            "The i3dm is invalid because the total data available ({}) is less than the byteLength in its header ({})",
            size - tileStart, header.byteLength));
    }
    if (header.byteLength > size - tileStart) {
        LOG_W("i3dm byteLength %u exceeds the %zu bytes available", header.byteLength, size - tileStart);
    }

    checkSection("feature table JSON", byteOffset, header.featureTableJsonByteLength, size);
    nlohmann::json featureTableJson =
        parseJsonSection("feature table", data + byteOffset, header.featureTableJsonByteLength);
    byteOffset += header.featureTableJsonByteLength;

    checkSection("feature table binary", byteOffset, header.featureTableBinaryByteLength, size);
    std::vector<uint8_t> featureTableBinary(data + byteOffset,
                                            data + byteOffset + header.featureTableBinaryByteLength);
    byteOffset += header.featureTableBinaryByteLength;

    tile.featureTable = std::make_unique<JsonFeatureTable>(std::move(featureTableJson),
                                                           std::move(featureTableBinary));

    if (header.batchTableJsonByteLength > 0) {
        checkSection("batch table JSON", byteOffset, header.batchTableJsonByteLength, size);
        tile.batchTableJson = parseJsonSection("batch table", data + byteOffset, header.batchTableJsonByteLength);
        byteOffset += header.batchTableJsonByteLength;
    }

    // Binary batch tables are not supported, the section is skipped
    checkSection("batch table binary", byteOffset, header.batchTableBinaryByteLength, size);
    if (header.batchTableBinaryByteLength > 0) {
        LOG_D("skipping %u bytes of batch table binary", header.batchTableBinaryByteLength);
    }
    byteOffset += header.batchTableBinaryByteLength;

    checkSection("glTF", byteOffset, header.gltfByteLength, size);
    if (header.gltfFormat == GltfFormat::URI) {
        tile.gltfUri = getStringFromBytes(data + byteOffset, header.gltfByteLength);
        if (tile.gltfUri.empty()) {
            throw MalformedTileError("i3dm glTF uri is empty");
        }
    } else {
        tile.gltf.assign(data + byteOffset, data + byteOffset + header.gltfByteLength);
    }
    byteOffset += header.gltfByteLength;

    tile.byteOffset = byteOffset;
    LOG_D("read i3dm %s", header.toString().c_str());
    return tile;
}

}
