#pragma once

#include "promise.h"
#include <exception>

namespace I3dm::Content {

class InstancedModelContent;

enum class ContentState {
    UNLOADED,
    LOADING,
    PROCESSING,
    READY,
    FAILED
};

const char* toString(ContentState state);

/**
 * Load state of one tile content and its two readiness signals.
 *
 * UNLOADED -> LOADING -> PROCESSING -> READY, with FAILED reachable from
 * LOADING and PROCESSING. READY and FAILED are terminal. readyToProcess
 * resolves on entering PROCESSING; ready resolves on READY and rejects on FAILED.
 * Illegal transitions throw std::logic_error.
 */
class ContentLifecycle {
public:
    ContentState state() const { return state_; }
    bool isDestroyed() const { return destroyed_; }

    Promise<InstancedModelContent*> readyToProcessPromise() const { return readyToProcess_.promise(); }
    Promise<InstancedModelContent*> readyPromise() const { return ready_.promise(); }

    // UNLOADED -> LOADING
    void beginLoading();

    // UNLOADED | LOADING -> PROCESSING; UNLOADED covers buffers handed to initialize directly
    void beginProcessing(InstancedModelContent* content);

    // PROCESSING -> READY
    void finishReady(InstancedModelContent* content);

    // LOADING | PROCESSING -> FAILED
    void fail(std::exception_ptr cause);

    void markDestroyed() { destroyed_ = true; }

private:
    void transition(ContentState to, bool allowed);

    ContentState state_ = ContentState::UNLOADED;
    bool destroyed_ = false;
    Deferred<InstancedModelContent*> readyToProcess_;
    Deferred<InstancedModelContent*> ready_;
};

}
