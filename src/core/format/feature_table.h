#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace I3dm::Core::Format {

enum class ComponentType {
    BYTE,
    UNSIGNED_BYTE,
    SHORT,
    UNSIGNED_SHORT,
    INT,
    UNSIGNED_INT,
    FLOAT,
    DOUBLE
};

std::size_t componentTypeSize(ComponentType type);
const char* componentTypeName(ComponentType type);
std::optional<ComponentType> componentTypeFromName(const std::string& name);

/**
 * A scalar or short numeric tuple read from a feature table.
 * Every component type fits a double without loss.
 */
struct PropertyValue {
    static constexpr std::size_t MAX_COMPONENTS = 4;

    std::array<double, MAX_COMPONENTS> components{};
    std::size_t size = 0;

    double operator[](std::size_t i) const { return components[i]; }
    double scalar() const { return components[0]; }
};

/**
 * Named global and per-feature properties of a tile.
 *
 * Absence of a property is reported as std::nullopt so callers can apply their
 * own fallback policy per semantic.
 */
class FeatureTable {
public:
    virtual ~FeatureTable() = default;

    virtual bool hasProperty(const std::string& name) const = 0;

    virtual std::optional<PropertyValue> getGlobalProperty(const std::string& name,
                                                           ComponentType componentType,
                                                           std::size_t componentCount = 1) const = 0;

    virtual std::optional<PropertyValue> getProperty(const std::string& name,
                                                     std::size_t featureIndex,
                                                     ComponentType componentType,
                                                     std::size_t componentCount = 1) const = 0;

    std::size_t featuresLength() const { return featuresLength_; }
    void setFeaturesLength(std::size_t length) { featuresLength_ = length; }

private:
    std::size_t featuresLength_ = 0;
};

/**
 * Feature table backed by its JSON header and binary body.
 *
 * A semantic is either an inline JSON number/array or an object
 * {"byteOffset": n, "componentType": "..."} addressing the binary body.
 */
class JsonFeatureTable : public FeatureTable {
public:
    JsonFeatureTable(nlohmann::json json, std::vector<uint8_t> binary);

    bool hasProperty(const std::string& name) const override;

    std::optional<PropertyValue> getGlobalProperty(const std::string& name,
                                                   ComponentType componentType,
                                                   std::size_t componentCount = 1) const override;

    std::optional<PropertyValue> getProperty(const std::string& name,
                                             std::size_t featureIndex,
                                             ComponentType componentType,
                                             std::size_t componentCount = 1) const override;

    const nlohmann::json& json() const { return json_; }
    const std::vector<uint8_t>& binary() const { return binary_; }

private:
    const nlohmann::json* find(const std::string& name) const;

    PropertyValue readBinary(const std::string& name, const nlohmann::json& ref,
                             std::size_t elementIndex, ComponentType componentType,
                             std::size_t componentCount) const;

    // Inline values are range-checked against componentType
    PropertyValue readInline(const std::string& name, const nlohmann::json& value,
                             std::size_t elementIndex, ComponentType componentType,
                             std::size_t componentCount) const;

    nlohmann::json json_;
    std::vector<uint8_t> binary_;
};

}
