#pragma once

#include "feature_table.h"
#include "i3dm_header.h"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace I3dm::Core::Format {

struct ReaderOptions {
    bool strictByteLength = false;          // Require header byteLength to fit the buffer
};

/**
 * Sections of one i3dm tile. The batch table binary is skipped.
 */
struct I3dmTile {
    I3dmHeader header;
    std::unique_ptr<JsonFeatureTable> featureTable;
    nlohmann::json batchTableJson;          // null when the tile has no batch table
    std::vector<uint8_t> gltf;              // embedded glTF bytes (gltfFormat == EMBEDDED)
    std::string gltfUri;                    // glTF uri (gltfFormat == URI)
    std::size_t byteOffset = 0;             // first byte after the tile

    bool hasEmbeddedGltf() const { return header.gltfFormat == GltfFormat::EMBEDDED; }
};

/**
 * Read header and sections of an i3dm tile starting at byteOffset.
 *
 * @throws the header errors of readI3dmHeader, MalformedTileError when a
 *         section lies outside the buffer or a table is not valid JSON
 */
I3dmTile readI3dmTile(const uint8_t* data, std::size_t size, std::size_t byteOffset = 0,
                      const ReaderOptions& options = ReaderOptions());

inline I3dmTile readI3dmTile(const std::vector<uint8_t>& buffer, std::size_t byteOffset = 0,
                             const ReaderOptions& options = ReaderOptions()) {
    return readI3dmTile(buffer.data(), buffer.size(), byteOffset, options);
}

// Decode a string section, dropping the trailing NUL and space padding.
std::string getStringFromBytes(const uint8_t* data, std::size_t length);

}
