#include "i3dm_header.h"
#include "errors.h"
#include <cctype>
#include <cstring>
#include <fmt/format.h>

namespace I3dm::Core::Format {

uint32_t readUint32LE(const uint8_t* data, std::size_t offset) {
    const uint8_t* p = data + offset;
    return static_cast<uint32_t>(p[0]) |
           (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) |
           (static_cast<uint32_t>(p[3]) << 24);
}

std::string readMagic(const uint8_t* data, std::size_t size, std::size_t offset) {
    std::string magic;
    for (std::size_t i = offset; i < offset + 4 && i < size; ++i) {
        unsigned char c = data[i];
        if (std::isprint(c)) {
            magic.push_back(static_cast<char>(c));
        } else {
            magic += fmt::format("\\x{:02x}", c);
        }
    }
    return magic;
}

std::string I3dmHeader::toString() const {
    return fmt::format("[version={}, byteLength={}, featureTable={}+{}, batchTable={}+{}, gltf={} ({})]",
                       version, byteLength,
                       featureTableJsonByteLength, featureTableBinaryByteLength,
                       batchTableJsonByteLength, batchTableBinaryByteLength,
                       gltfByteLength,
                       gltfFormat == GltfFormat::EMBEDDED ? "embedded" : "uri");
}

I3dmHeader readI3dmHeader(const uint8_t* data, std::size_t size, std::size_t& byteOffset) {
    if (data == nullptr || byteOffset > size || size - byteOffset < I3dmHeader::BYTE_LENGTH) {
        throw MalformedTileError(fmt::format(
            "Invalid Instanced 3D Model. Header needs {} bytes at offset {}, buffer has {}.",
            I3dmHeader::BYTE_LENGTH, byteOffset, size));
    }

    if (std::memcmp(data + byteOffset, I3dmHeader::MAGIC, sizeof(I3dmHeader::MAGIC)) != 0) {
        throw FormatError(fmt::format(
            "Invalid Instanced 3D Model. Expected magic=i3dm. Read magic={}",
            readMagic(data, size, byteOffset)));
    }
    std::size_t offset = byteOffset + sizeof(uint32_t);

    I3dmHeader header;
    header.version = readUint32LE(data, offset);
    if (header.version != I3dmHeader::VERSION) {
        throw UnsupportedVersionError(fmt::format(
            "Only Instanced 3D Model version 1 is supported. Version {} is not.", header.version));
    }
    offset += sizeof(uint32_t);

    // Informational only
    header.byteLength = readUint32LE(data, offset);
    offset += sizeof(uint32_t);

    header.featureTableJsonByteLength = readUint32LE(data, offset);
    if (header.featureTableJsonByteLength == 0) {
        throw MalformedTileError("featureTableJSONByteLength is zero, the feature table must be defined.");
    }
    offset += sizeof(uint32_t);

    header.featureTableBinaryByteLength = readUint32LE(data, offset);
    offset += sizeof(uint32_t);

    header.batchTableJsonByteLength = readUint32LE(data, offset);
    offset += sizeof(uint32_t);

    header.batchTableBinaryByteLength = readUint32LE(data, offset);
    offset += sizeof(uint32_t);

    header.gltfByteLength = readUint32LE(data, offset);
    if (header.gltfByteLength == 0) {
        throw MalformedTileError("glTF byte length is zero, i3dm must have a glTF to instance.");
    }
    offset += sizeof(uint32_t);

    uint32_t gltfFormat = readUint32LE(data, offset);
    if (gltfFormat != static_cast<uint32_t>(GltfFormat::URI) &&
        gltfFormat != static_cast<uint32_t>(GltfFormat::EMBEDDED)) {
        throw UnsupportedPayloadFormatError(fmt::format(
            "Only glTF format 0 (uri) or 1 (embedded) are supported. Format {} is not.", gltfFormat));
    }
    header.gltfFormat = static_cast<GltfFormat>(gltfFormat);
    offset += sizeof(uint32_t);

    byteOffset = offset;
    return header;
}

}
