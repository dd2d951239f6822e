#include "feature_table.h"
#include "errors.h"
#include <cmath>
#include <cstring>
#include <limits>
#include <fmt/format.h>

namespace I3dm::Core::Format {

namespace {

template <class T>
double read_val(const uint8_t* p) {
    T val;
    std::memcpy(&val, p, sizeof(T));
    return static_cast<double>(val);
}

double readComponent(const uint8_t* p, ComponentType type) {
    switch (type) {
        case ComponentType::BYTE: return read_val<int8_t>(p);
        case ComponentType::UNSIGNED_BYTE: return read_val<uint8_t>(p);
        case ComponentType::SHORT: return read_val<int16_t>(p);
        case ComponentType::UNSIGNED_SHORT: return read_val<uint16_t>(p);
        case ComponentType::INT: return read_val<int32_t>(p);
        case ComponentType::UNSIGNED_INT: return read_val<uint32_t>(p);
        case ComponentType::FLOAT: return read_val<float>(p);
        case ComponentType::DOUBLE: return read_val<double>(p);
    }
    return 0.0;
}

template <class T>
bool fitsInteger(double v) {
    return v >= static_cast<double>(std::numeric_limits<T>::min()) &&
           v <= static_cast<double>(std::numeric_limits<T>::max()) &&
           std::floor(v) == v;
}

// Inline JSON numbers must be representable in the component type the caller reads them as
bool fitsComponentType(double v, ComponentType type) {
    switch (type) {
        case ComponentType::BYTE: return fitsInteger<int8_t>(v);
        case ComponentType::UNSIGNED_BYTE: return fitsInteger<uint8_t>(v);
        case ComponentType::SHORT: return fitsInteger<int16_t>(v);
        case ComponentType::UNSIGNED_SHORT: return fitsInteger<uint16_t>(v);
        case ComponentType::INT: return fitsInteger<int32_t>(v);
        case ComponentType::UNSIGNED_INT: return fitsInteger<uint32_t>(v);
        case ComponentType::FLOAT:
            return std::isfinite(v) && std::abs(v) <= static_cast<double>(std::numeric_limits<float>::max());
        case ComponentType::DOUBLE: return std::isfinite(v);
    }
    return false;
}

void checkComponentCount(const std::string& name, std::size_t componentCount) {
    if (componentCount == 0 || componentCount > PropertyValue::MAX_COMPONENTS) {
        throw std::invalid_argument(fmt::format(
            "Feature table property {} requested with {} components (1..{} supported)",
            name, componentCount, PropertyValue::MAX_COMPONENTS));
    }
}

}

std::size_t componentTypeSize(ComponentType type) {
    switch (type) {
        case ComponentType::BYTE:
        case ComponentType::UNSIGNED_BYTE: return 1;
        case ComponentType::SHORT:
        case ComponentType::UNSIGNED_SHORT: return 2;
        case ComponentType::INT:
        case ComponentType::UNSIGNED_INT:
        case ComponentType::FLOAT: return 4;
        case ComponentType::DOUBLE: return 8;
    }
    return 0;
}

const char* componentTypeName(ComponentType type) {
    switch (type) {
        case ComponentType::BYTE: return "BYTE";
        case ComponentType::UNSIGNED_BYTE: return "UNSIGNED_BYTE";
        case ComponentType::SHORT: return "SHORT";
        case ComponentType::UNSIGNED_SHORT: return "UNSIGNED_SHORT";
        case ComponentType::INT: return "INT";
        case ComponentType::UNSIGNED_INT: return "UNSIGNED_INT";
        case ComponentType::FLOAT: return "FLOAT";
        case ComponentType::DOUBLE: return "DOUBLE";
    }
    return "UNKNOWN";
}

std::optional<ComponentType> componentTypeFromName(const std::string& name) {
    static const ComponentType all[] = {
        ComponentType::BYTE, ComponentType::UNSIGNED_BYTE,
        ComponentType::SHORT, ComponentType::UNSIGNED_SHORT,
        ComponentType::INT, ComponentType::UNSIGNED_INT,
        ComponentType::FLOAT, ComponentType::DOUBLE
    };
    for (ComponentType type : all) {
        if (name == componentTypeName(type)) {
            return type;
        }
    }
    return std::nullopt;
}

JsonFeatureTable::JsonFeatureTable(nlohmann::json json, std::vector<uint8_t> binary)
    : json_(std::move(json)), binary_(std::move(binary)) {
    if (!json_.is_object()) {
        throw MalformedTileError("Feature table JSON must be an object");
    }
}

const nlohmann::json* JsonFeatureTable::find(const std::string& name) const {
    auto it = json_.find(name);
    if (it == json_.end() || it->is_null()) {
        return nullptr;
    }
    return &(*it);
}

bool JsonFeatureTable::hasProperty(const std::string& name) const {
    return find(name) != nullptr;
}

PropertyValue JsonFeatureTable::readBinary(const std::string& name, const nlohmann::json& ref,
                                           std::size_t elementIndex, ComponentType componentType,
                                           std::size_t componentCount) const {
    const nlohmann::json& byteOffsetJson = ref["byteOffset"];
    if (!byteOffsetJson.is_number_integer()) {
        throw MalformedTileError(fmt::format("Feature table property {} has an invalid byteOffset", name));
    }
    int64_t byteOffset = byteOffsetJson.get<int64_t>();
    if (byteOffset < 0) {
        throw MalformedTileError(fmt::format("Feature table property {} has a negative byteOffset", name));
    }

    ComponentType type = componentType;
    auto typeIt = ref.find("componentType");
    if (typeIt != ref.end()) {
        std::optional<ComponentType> declared;
        if (typeIt->is_string()) {
            declared = componentTypeFromName(typeIt->get<std::string>());
        }
        if (!declared) {
            throw MalformedTileError(fmt::format(
                "Feature table property {} has an unknown componentType {}", name, typeIt->dump()));
        }
        type = *declared;
    }

    std::size_t elementSize = componentTypeSize(type);
    std::size_t begin = static_cast<std::size_t>(byteOffset) + elementIndex * componentCount * elementSize;
    std::size_t end = begin + componentCount * elementSize;
    if (end > binary_.size()) {
        throw MalformedTileError(fmt::format(
            "Feature table property {} reads bytes [{}, {}) past the binary body of {} bytes",
            name, begin, end, binary_.size()));
    }

    PropertyValue value;
    value.size = componentCount;
    for (std::size_t c = 0; c < componentCount; ++c) {
        value.components[c] = readComponent(binary_.data() + begin + c * elementSize, type);
    }
    return value;
}

PropertyValue JsonFeatureTable::readInline(const std::string& name, const nlohmann::json& value,
                                           std::size_t elementIndex, ComponentType componentType,
                                           std::size_t componentCount) const {
    PropertyValue result;
    result.size = componentCount;

    const nlohmann::json* components[PropertyValue::MAX_COMPONENTS] = {};
    if (value.is_number()) {
        if (componentCount != 1 || elementIndex != 0) {
            throw MalformedTileError(fmt::format(
                "Feature table property {} is a scalar but {} components were requested for element {}",
                name, componentCount, elementIndex));
        }
        components[0] = &value;
    } else if (value.is_array()) {
        std::size_t begin = elementIndex * componentCount;
        if (begin + componentCount > value.size()) {
            throw MalformedTileError(fmt::format(
                "Feature table property {} has {} values, element {} needs {}",
                name, value.size(), elementIndex, begin + componentCount));
        }
        for (std::size_t c = 0; c < componentCount; ++c) {
            components[c] = &value[begin + c];
        }
    } else {
        throw MalformedTileError(fmt::format("Feature table property {} is neither a number, array nor binary reference", name));
    }

    for (std::size_t c = 0; c < componentCount; ++c) {
        if (!components[c]->is_number()) {
            throw MalformedTileError(fmt::format("Feature table property {} contains a non-numeric value", name));
        }
        double v = components[c]->get<double>();
        if (!fitsComponentType(v, componentType)) {
            throw MalformedTileError(fmt::format("Feature table property {} value {} does not fit {}",
                                                 name, v, componentTypeName(componentType)));
        }
        result.components[c] = v;
    }
    return result;
}

std::optional<PropertyValue> JsonFeatureTable::getGlobalProperty(const std::string& name,
                                                                 ComponentType componentType,
                                                                 std::size_t componentCount) const {
    checkComponentCount(name, componentCount);
    const nlohmann::json* value = find(name);
    if (!value) {
        return std::nullopt;
    }
    if (value->is_object() && value->contains("byteOffset")) {
        return readBinary(name, *value, 0, componentType, componentCount);
    }
    return readInline(name, *value, 0, componentType, componentCount);
}

std::optional<PropertyValue> JsonFeatureTable::getProperty(const std::string& name,
                                                           std::size_t featureIndex,
                                                           ComponentType componentType,
                                                           std::size_t componentCount) const {
    checkComponentCount(name, componentCount);
    const nlohmann::json* value = find(name);
    if (!value) {
        return std::nullopt;
    }
    if (featureIndex >= featuresLength()) {
        throw IndexOutOfRangeError(fmt::format(
            "Feature index {} of property {} is out of range [0, {})", featureIndex, name, featuresLength()));
    }
    if (value->is_object() && value->contains("byteOffset")) {
        return readBinary(name, *value, featureIndex, componentType, componentCount);
    }
    return readInline(name, *value, featureIndex, componentType, componentCount);
}

}
