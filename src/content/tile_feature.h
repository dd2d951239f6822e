#pragma once

#include <cstdint>
#include <string>
#include <glm/glm.hpp>
#include <nlohmann/json.hpp>

namespace I3dm::Content {

class InstancedModelContent;

/**
 * Lightweight handle to one feature (batch id) of a tile content.
 * Styling and properties are forwarded to the content's batch table resources.
 */
class TileFeature {
public:
    TileFeature(InstancedModelContent& content, uint32_t batchId)
        : content_(&content), batchId_(batchId) {}

    uint32_t batchId() const { return batchId_; }
    InstancedModelContent& content() const { return *content_; }

    bool show() const;
    void setShow(bool show);

    glm::vec4 color() const;
    void setColor(const glm::vec4& color);

    bool hasProperty(const std::string& name) const;
    nlohmann::json getProperty(const std::string& name) const;

private:
    InstancedModelContent* content_;
    uint32_t batchId_;
};

}
