#include "tile_feature.h"
#include "instanced_model_content.h"

namespace I3dm::Content {

bool TileFeature::show() const {
    return content_->batchTableResources().getShow(batchId_);
}

void TileFeature::setShow(bool show) {
    content_->batchTableResources().setShow(batchId_, show);
}

glm::vec4 TileFeature::color() const {
    return content_->batchTableResources().getColor(batchId_);
}

void TileFeature::setColor(const glm::vec4& color) {
    content_->batchTableResources().setColor(batchId_, color);
}

bool TileFeature::hasProperty(const std::string& name) const {
    return content_->hasProperty(name);
}

nlohmann::json TileFeature::getProperty(const std::string& name) const {
    return content_->batchTableResources().getProperty(batchId_, name);
}

}
