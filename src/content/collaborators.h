#pragma once

#include "promise.h"
#include "../core/instancing/instance_builder.h"
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <glm/glm.hpp>
#include <nlohmann/json.hpp>

namespace I3dm::Content {

using ByteBuffer = std::vector<uint8_t>;

// ========== Network scheduling ==========

enum class RequestType {
    TILES3D,
    OTHER
};

struct TileRequest {
    std::string url;
    std::string server;
    RequestType type = RequestType::TILES3D;
    double distance = 0.0;              // Distance of the tile to the camera, used for priority
};

struct PendingFetch {
    Promise<ByteBuffer> response;
    std::function<void()> cancel;       // Optional
};

/**
 * Schedules tile fetches. Returns std::nullopt when the scheduler is at capacity
 * and the caller must retry on a later frame.
 */
class RequestScheduler {
public:
    virtual ~RequestScheduler() = default;
    virtual std::optional<PendingFetch> schedule(const TileRequest& request) = 0;
};

// ========== Tileset bookkeeping ==========

// Oriented bounding box: center and three half-axis columns
struct BoundingVolume {
    glm::dvec3 center = glm::dvec3(0.0);
    glm::dmat3 halfAxes = glm::dmat3(1.0);
};

struct Tileset {
    std::string baseUrl;
};

struct Tile {
    double distanceToCamera = 0.0;
    std::string requestServer;
    BoundingVolume contentBoundingVolume;
};

// ========== Frame and draw commands ==========

struct FrameState {
    struct Passes {
        bool render = false;
        bool pick = false;
    };
    Passes passes;
    uint64_t frameNumber = 0;
};

struct DrawCommand {
    const void* owner = nullptr;
    uint64_t id = 0;
};

class DrawCommandSink {
public:
    virtual ~DrawCommandSink() = default;
    virtual void addCommand(const DrawCommand& command) = 0;
};

// ========== Batch table and instanced model ==========

/**
 * Per-feature styling resources of a tile (show/color/properties).
 */
class BatchTableResources {
public:
    virtual ~BatchTableResources() = default;

    virtual bool hasProperty(const std::string& name) const = 0;
    virtual nlohmann::json getProperty(uint32_t batchId, const std::string& name) const = 0;

    virtual void setShow(uint32_t batchId, bool show) = 0;
    virtual bool getShow(uint32_t batchId) const = 0;
    virtual void setColor(uint32_t batchId, const glm::vec4& color) = 0;
    virtual glm::vec4 getColor(uint32_t batchId) const = 0;
    virtual void setAllColor(const glm::vec4& color) = 0;

    virtual void update(const FrameState& frameState) = 0;

    /**
     * Sink that applies per-feature styling to render commands before forwarding
     * them to downstream.
     */
    virtual DrawCommandSink& commandSink(DrawCommandSink& downstream) = 0;
};

struct ModelInstanceCollectionOptions {
    std::vector<Core::Instancing::Instance> instances;
    BatchTableResources* batchTableResources = nullptr;
    BoundingVolume boundingVolume;
    bool cull = false;
    RequestType requestType = RequestType::TILES3D;
    std::string url;                    // glTF url, set for uri payloads
    ByteBuffer gltf;                    // glTF bytes, set for embedded payloads
    std::string basePath;               // Resolves relative resources of an embedded glTF
};

/**
 * Renderer-side collection drawing one model once per instance.
 */
class ModelInstanceCollection {
public:
    virtual ~ModelInstanceCollection() = default;

    virtual std::size_t length() const = 0;

    // Settles once the model's own geometry and shaders are ready
    virtual Promise<ModelInstanceCollection*> readyPromise() const = 0;

    virtual void update(const FrameState& frameState, DrawCommandSink& commandSink) = 0;
};

class ContentResourceFactory {
public:
    virtual ~ContentResourceFactory() = default;

    virtual std::unique_ptr<BatchTableResources> createBatchTableResources(
        std::size_t featuresLength, const nlohmann::json& batchTableJson) = 0;

    virtual std::unique_ptr<ModelInstanceCollection> createModelInstanceCollection(
        ModelInstanceCollectionOptions options) = 0;
};

}
