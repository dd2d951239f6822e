#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace I3dm::Core::Format {

enum class GltfFormat : uint32_t {
    URI = 0,
    EMBEDDED = 1
};

/**
 * Fixed-size header of an Instanced 3D Model tile.
 *
 * Layout (little-endian u32 after the 4-byte magic):
 * version, byteLength, featureTableJSONByteLength, featureTableBinaryByteLength,
 * batchTableJSONByteLength, batchTableBinaryByteLength, gltfByteLength, gltfFormat.
 */
struct I3dmHeader {
    static constexpr char MAGIC[4] = {'i', '3', 'd', 'm'};
    static constexpr uint32_t VERSION = 1;
    static constexpr std::size_t BYTE_LENGTH = 36;

    uint32_t version = 0;
    uint32_t byteLength = 0;
    uint32_t featureTableJsonByteLength = 0;
    uint32_t featureTableBinaryByteLength = 0;
    uint32_t batchTableJsonByteLength = 0;
    uint32_t batchTableBinaryByteLength = 0;
    uint32_t gltfByteLength = 0;
    GltfFormat gltfFormat = GltfFormat::URI;

    std::string toString() const;
};

/**
 * Read the i3dm header starting at byteOffset.
 *
 * @param data Tile bytes
 * @param size Number of bytes available in data
 * @param byteOffset In: offset of the magic. Out: first byte after the header.
 * @throws FormatError, UnsupportedVersionError, MalformedTileError,
 *         UnsupportedPayloadFormatError
 */
I3dmHeader readI3dmHeader(const uint8_t* data, std::size_t size, std::size_t& byteOffset);

// Little-endian u32 at data + offset; caller guarantees 4 readable bytes.
uint32_t readUint32LE(const uint8_t* data, std::size_t offset);

// Magic tag at offset as a printable string (non-printable bytes escaped).
std::string readMagic(const uint8_t* data, std::size_t size, std::size_t offset);

}
