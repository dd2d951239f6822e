#pragma once

#include "collaborators.h"
#include "content_lifecycle.h"
#include "promise.h"
#include "tile_feature.h"
#include "../core/format/i3dm_reader.h"
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include <glm/glm.hpp>

namespace I3dm::Content {

/**
 * Content of an Instanced 3D Model (i3dm) tile.
 *
 * request() fetches the tile through the scheduler, initialize() decodes it and
 * hands the instances to a ModelInstanceCollection. Readiness is reported
 * through readyToProcessPromise() (instances and batch table created) and
 * readyPromise() (collection ready to render).
 */
class InstancedModelContent {
public:
    InstancedModelContent(const Tileset& tileset, const Tile& tile, std::string url,
                          RequestScheduler& scheduler, ContentResourceFactory& resourceFactory,
                          const Core::Format::ReaderOptions& readerOptions = Core::Format::ReaderOptions());
    ~InstancedModelContent();

    InstancedModelContent(const InstancedModelContent&) = delete;
    InstancedModelContent& operator=(const InstancedModelContent&) = delete;

    ContentState state() const { return lifecycle_->state(); }
    const std::string& url() const { return url_; }

    Promise<InstancedModelContent*> readyToProcessPromise() const { return lifecycle_->readyToProcessPromise(); }
    Promise<InstancedModelContent*> readyPromise() const { return lifecycle_->readyPromise(); }

    // Number of instances; 0 until initialized
    std::size_t featuresLength() const;

    bool hasProperty(const std::string& name) const;

    /**
     * Feature of a batch id. Features are created on first access and cached.
     * @throws IndexOutOfRangeError unless 0 <= batchId < featuresLength()
     */
    TileFeature& getFeature(int64_t batchId);

    bool featurePropertiesDirty() const { return featurePropertiesDirty_; }
    void setFeaturePropertiesDirty(bool dirty) { featurePropertiesDirty_ = dirty; }

    /**
     * Schedule the fetch of the tile.
     * @return false when the scheduler is at capacity; the state stays UNLOADED
     */
    bool request();

    /**
     * Decode a tile buffer and create the batch table resources and the
     * instance collection. Parse errors are thrown to the caller and leave the
     * state untouched.
     */
    void initialize(const ByteBuffer& buffer, std::size_t byteOffset = 0);

    // Tint every feature with color, or reset them to white when disabled
    void applyDebugSettings(bool enabled, const glm::vec4& color);

    /**
     * Advance the collaborators for one frame. During a render pass commands of
     * the instance collection go through the batch table's styling sink.
     */
    void update(const FrameState& frameState, DrawCommandSink& commandSink);

    bool isDestroyed() const { return lifecycle_->isDestroyed(); }
    void destroy();

    // @throws std::logic_error before initialize or after destroy
    BatchTableResources& batchTableResources() const;

private:
    void createFeatures();
    void onFetchSucceeded(const ByteBuffer& buffer);
    void onFetchFailed(std::exception_ptr error);
    void checkNotDestroyed(const char* operation) const;

    const Tileset& tileset_;
    const Tile& tile_;
    std::string url_;
    RequestScheduler& scheduler_;
    ContentResourceFactory& resourceFactory_;
    Core::Format::ReaderOptions readerOptions_;

    std::shared_ptr<ContentLifecycle> lifecycle_;
    std::function<void()> cancelFetch_;
    std::unique_ptr<BatchTableResources> batchTableResources_;
    std::unique_ptr<ModelInstanceCollection> modelInstanceCollection_;
    std::vector<TileFeature> features_;
    bool featurePropertiesDirty_ = false;
};

}
