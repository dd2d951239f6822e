#pragma once

#include <cstdint>
#include <cstring>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace I3dm::Test {

template<class T>
void put_val(std::vector<uint8_t>& buf, T val) {
    buf.insert(buf.end(), (uint8_t*)&val, (uint8_t*)&val + sizeof(T));
}

/**
 * Writes i3dm tiles for tests. Sections are padded to 8 bytes.
 */
struct I3dmBuilder {
    std::string magic = "i3dm";
    uint32_t version = 1;
    nlohmann::json featureTable = nlohmann::json::object();
    std::vector<uint8_t> featureTableBinary;
    nlohmann::json batchTable;                      // null: no batch table
    std::vector<uint8_t> batchTableBinary;
    uint32_t gltfFormat = 1;
    std::vector<uint8_t> gltf = {'g', 'l', 'T', 'F', 2, 0, 0, 0};

    static constexpr size_t HEADER_LENGTH = 36;

    // Append values to the feature table binary and return their byteOffset
    template<class T>
    uint32_t appendBinary(const std::vector<T>& values) {
        while (featureTableBinary.size() % sizeof(T) != 0) {
            featureTableBinary.push_back(0);
        }
        uint32_t offset = static_cast<uint32_t>(featureTableBinary.size());
        for (const T& v : values) {
            put_val(featureTableBinary, v);
        }
        return offset;
    }

    template<class T>
    void setBinaryProperty(const std::string& name, const std::vector<T>& values,
                           const char* componentType = nullptr) {
        nlohmann::json ref;
        ref["byteOffset"] = appendBinary(values);
        if (componentType) {
            ref["componentType"] = componentType;
        }
        featureTable[name] = ref;
    }

    void setGltfUri(const std::string& uri) {
        gltfFormat = 0;
        gltf.assign(uri.begin(), uri.end());
    }

    static std::string padded(std::string text, size_t alignment = 8) {
        while (text.size() % alignment != 0) {
            text.push_back(' ');
        }
        return text;
    }

    std::vector<uint8_t> build() const {
        std::string ftJson = padded(featureTable.dump());
        std::string btJson = batchTable.is_null() ? std::string() : padded(batchTable.dump());
        std::vector<uint8_t> ftBin = featureTableBinary;
        while (ftBin.size() % 8 != 0) {
            ftBin.push_back(0);
        }

        uint32_t total = static_cast<uint32_t>(HEADER_LENGTH + ftJson.size() + ftBin.size() +
                                               btJson.size() + batchTableBinary.size() + gltf.size());

        std::vector<uint8_t> buf;
        buf.insert(buf.end(), magic.begin(), magic.end());
        put_val(buf, version);
        put_val(buf, total);
        put_val(buf, static_cast<uint32_t>(ftJson.size()));
        put_val(buf, static_cast<uint32_t>(ftBin.size()));
        put_val(buf, static_cast<uint32_t>(btJson.size()));
        put_val(buf, static_cast<uint32_t>(batchTableBinary.size()));
        put_val(buf, static_cast<uint32_t>(gltf.size()));
        put_val(buf, gltfFormat);
        buf.insert(buf.end(), ftJson.begin(), ftJson.end());
        buf.insert(buf.end(), ftBin.begin(), ftBin.end());
        buf.insert(buf.end(), btJson.begin(), btJson.end());
        buf.insert(buf.end(), batchTableBinary.begin(), batchTableBinary.end());
        buf.insert(buf.end(), gltf.begin(), gltf.end());
        return buf;
    }
};

// Overwrite the little-endian u32 header field at byte offset
inline void setHeaderField(std::vector<uint8_t>& buf, size_t offset, uint32_t value) {
    std::memcpy(buf.data() + offset, &value, sizeof(value));
}

}
