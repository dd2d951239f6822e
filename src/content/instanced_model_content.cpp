#include "instanced_model_content.h"
#include "url.h"
#include "../core/format/errors.h"
#include "../core/instancing/instance_builder.h"
#include "../log.h"
#include <fmt/format.h>
#include <stdexcept>

namespace I3dm::Content {

using Core::Format::ContentDestroyedError;
using Core::Format::IndexOutOfRangeError;
using Core::Format::NetworkFetchError;

namespace {

const glm::vec4 WHITE(1.0f, 1.0f, 1.0f, 1.0f);

std::exception_ptr destroyedError(const std::string& url) {
    return std::make_exception_ptr(ContentDestroyedError(
        fmt::format("tile content {} was destroyed before it became ready", url)));
}

// Transport failures are reported as NetworkFetchError with the original cause nested
std::exception_ptr wrapNetworkError(std::exception_ptr error, const std::string& url) {
    try {
        std::rethrow_exception(error);
    } catch (const NetworkFetchError&) {
        return error;
    } catch (const std::exception& e) {
        try {
            std::throw_with_nested(NetworkFetchError(fmt::format("fetch of {} failed: {}", url, e.what())));
        } catch (const NetworkFetchError&) {
            return std::current_exception();
        }
    } catch (...) {
        try {
            std::throw_with_nested(NetworkFetchError(fmt::format("fetch of {} failed", url)));
        } catch (const NetworkFetchError&) {
            return std::current_exception();
        }
    }
    return error;
}

std::string describe(std::exception_ptr error) {
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "unknown error";
    }
}

}

InstancedModelContent::InstancedModelContent(const Tileset& tileset, const Tile& tile, std::string url,
                                             RequestScheduler& scheduler, ContentResourceFactory& resourceFactory,
                                             const Core::Format::ReaderOptions& readerOptions)
    : tileset_(tileset),
      tile_(tile),
      url_(std::move(url)),
      scheduler_(scheduler),
      resourceFactory_(resourceFactory),
      readerOptions_(readerOptions),
      lifecycle_(std::make_shared<ContentLifecycle>()) {}

InstancedModelContent::~InstancedModelContent() {
    destroy();
}

void InstancedModelContent::checkNotDestroyed(const char* operation) const {
    if (lifecycle_->isDestroyed()) {
        throw std::logic_error(fmt::format("{}() called on destroyed tile content {}", operation, url_));
    }
}

std::size_t InstancedModelContent::featuresLength() const {
    return modelInstanceCollection_ ? modelInstanceCollection_->length() : 0;
}

bool InstancedModelContent::hasProperty(const std::string& name) const {
    return batchTableResources_ && batchTableResources_->hasProperty(name);
}

BatchTableResources& InstancedModelContent::batchTableResources() const {
    checkNotDestroyed("batchTableResources");
    if (!batchTableResources_) {
        throw std::logic_error(fmt::format("tile content {} is not initialized", url_));
    }
    return *batchTableResources_;
}

void InstancedModelContent::createFeatures() {
    std::size_t length = featuresLength();
    if (!features_.empty() || length == 0) {
        return;
    }
    features_.reserve(length);
    for (std::size_t i = 0; i < length; ++i) {
        features_.emplace_back(*this, static_cast<uint32_t>(i));
    }
}

TileFeature& InstancedModelContent::getFeature(int64_t batchId) {
    std::size_t length = featuresLength();
    if (batchId < 0 || static_cast<uint64_t>(batchId) >= length) {
        throw IndexOutOfRangeError(fmt::format(
            "batchId is required and between zero and featuresLength - 1 ({}), got {}.",
            static_cast<int64_t>(length) - 1, batchId));
    }
    createFeatures();
    return features_[static_cast<std::size_t>(batchId)];
}

bool InstancedModelContent::request() {
    checkNotDestroyed("request");
    if (lifecycle_->state() != ContentState::UNLOADED) {
        throw std::logic_error(fmt::format("request() on tile content {} in state {}",
                                           url_, toString(lifecycle_->state())));
    }

    TileRequest request;
    request.url = url_;
    request.server = tile_.requestServer;
    request.type = RequestType::TILES3D;
    request.distance = tile_.distanceToCamera;

    std::optional<PendingFetch> pending = scheduler_.schedule(request);
    if (!pending) {
        LOG_D("request of %s deferred, scheduler at capacity", url_.c_str());
        return false;
    }

    lifecycle_->beginLoading();
    cancelFetch_ = pending->cancel;

    // The lifecycle outlives this object; `this` is only used while not destroyed
    std::shared_ptr<ContentLifecycle> lifecycle = lifecycle_;
    std::string url = url_;
    pending->response.then(
        [this, lifecycle, url](const ByteBuffer& buffer) {
            if (lifecycle->isDestroyed()) {
                lifecycle->fail(destroyedError(url));
                return;
            }
            onFetchSucceeded(buffer);
        },
        [this, lifecycle, url](std::exception_ptr error) {
            if (lifecycle->isDestroyed()) {
                lifecycle->fail(destroyedError(url));
                return;
            }
            onFetchFailed(error);
        });
    return true;
}

void InstancedModelContent::onFetchSucceeded(const ByteBuffer& buffer) {
    cancelFetch_ = nullptr;
    try {
        initialize(buffer);
    } catch (const std::exception& e) {
        LOG_E("failed to load i3dm %s: %s", url_.c_str(), e.what());
        lifecycle_->fail(std::current_exception());
    } catch (...) {
        LOG_E("failed to load i3dm %s: unknown error", url_.c_str());
        lifecycle_->fail(std::current_exception());
    }
}

void InstancedModelContent::onFetchFailed(std::exception_ptr error) {
    cancelFetch_ = nullptr;
    std::exception_ptr cause = wrapNetworkError(error, url_);
    LOG_E("%s", describe(cause).c_str());
    lifecycle_->fail(cause);
}

void InstancedModelContent::initialize(const ByteBuffer& buffer, std::size_t byteOffset) {
    checkNotDestroyed("initialize");
    ContentState state = lifecycle_->state();
    if (state != ContentState::UNLOADED && state != ContentState::LOADING) {
        throw std::logic_error(fmt::format("initialize() on tile content {} in state {}", url_, toString(state)));
    }

    Core::Format::I3dmTile tile = Core::Format::readI3dmTile(buffer, byteOffset, readerOptions_);
    std::vector<Core::Instancing::Instance> instances =
        Core::Instancing::InstanceBuilder::build(*tile.featureTable);
    std::size_t instancesLength = instances.size();

    std::unique_ptr<BatchTableResources> batchTable =
        resourceFactory_.createBatchTableResources(instancesLength, tile.batchTableJson);

    ModelInstanceCollectionOptions options;
    options.instances = std::move(instances);
    options.batchTableResources = batchTable.get();
    options.boundingVolume = tile_.contentBoundingVolume;
    options.cull = false;
    options.requestType = RequestType::TILES3D;
    if (tile.hasEmbeddedGltf()) {
        options.gltf = std::move(tile.gltf);
        options.basePath = url_;
    } else {
        options.url = joinUrls(tileset_.baseUrl, tile.gltfUri);
    }

    std::unique_ptr<ModelInstanceCollection> collection =
        resourceFactory_.createModelInstanceCollection(std::move(options));

    batchTableResources_ = std::move(batchTable);
    modelInstanceCollection_ = std::move(collection);
    LOG_I("i3dm %s: %zu instances, glTF %s", url_.c_str(), instancesLength,
          tile.hasEmbeddedGltf() ? "embedded" : tile.gltfUri.c_str());

    lifecycle_->beginProcessing(this);

    std::shared_ptr<ContentLifecycle> lifecycle = lifecycle_;
    modelInstanceCollection_->readyPromise().then(
        [this, lifecycle](ModelInstanceCollection*) {
            if (lifecycle->isDestroyed() || lifecycle->state() != ContentState::PROCESSING) {
                return;
            }
            lifecycle->finishReady(this);
        },
        [lifecycle](std::exception_ptr error) {
            if (lifecycle->state() != ContentState::PROCESSING) {
                return;
            }
            LOG_E("instanced model failed: %s", describe(error).c_str());
            lifecycle->fail(error);
        });
}

void InstancedModelContent::applyDebugSettings(bool enabled, const glm::vec4& color) {
    batchTableResources().setAllColor(enabled ? color : WHITE);
}

void InstancedModelContent::update(const FrameState& frameState, DrawCommandSink& commandSink) {
    checkNotDestroyed("update");
    if (!modelInstanceCollection_) {
        return;
    }

    // In PROCESSING update() moves resource loading forward, in READY it emits commands
    DrawCommandSink& sink = frameState.passes.render
        ? batchTableResources_->commandSink(commandSink)
        : commandSink;
    batchTableResources_->update(frameState);
    modelInstanceCollection_->update(frameState, sink);
}

void InstancedModelContent::destroy() {
    if (lifecycle_->isDestroyed()) {
        return;
    }
    lifecycle_->markDestroyed();

    features_.clear();
    modelInstanceCollection_.reset();
    batchTableResources_.reset();

    switch (lifecycle_->state()) {
        case ContentState::LOADING:
            // The fetch continuation rejects the ready signal once the fetch settles
            if (cancelFetch_) {
                std::function<void()> cancel = std::move(cancelFetch_);
                cancelFetch_ = nullptr;
                cancel();
            }
            break;
        case ContentState::PROCESSING:
            lifecycle_->fail(destroyedError(url_));
            break;
        default:
            break;
    }
}

}
