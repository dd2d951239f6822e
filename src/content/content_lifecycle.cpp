#include "content_lifecycle.h"
#include "../log.h"
#include <fmt/format.h>
#include <stdexcept>

namespace I3dm::Content {

const char* toString(ContentState state) {
    switch (state) {
        case ContentState::UNLOADED: return "UNLOADED";
        case ContentState::LOADING: return "LOADING";
        case ContentState::PROCESSING: return "PROCESSING";
        case ContentState::READY: return "READY";
        case ContentState::FAILED: return "FAILED";
    }
    return "UNKNOWN";
}

void ContentLifecycle::transition(ContentState to, bool allowed) {
    if (!allowed) {
        throw std::logic_error(fmt::format("Illegal content state transition {} -> {}",
                                           toString(state_), toString(to)));
    }
    LOG_D("content state %s -> %s", toString(state_), toString(to));
    state_ = to;
}

void ContentLifecycle::beginLoading() {
    transition(ContentState::LOADING, state_ == ContentState::UNLOADED);
}

void ContentLifecycle::beginProcessing(InstancedModelContent* content) {
    transition(ContentState::PROCESSING,
               state_ == ContentState::UNLOADED || state_ == ContentState::LOADING);
    readyToProcess_.resolve(content);
}

void ContentLifecycle::finishReady(InstancedModelContent* content) {
    transition(ContentState::READY, state_ == ContentState::PROCESSING);
    ready_.resolve(content);
}

void ContentLifecycle::fail(std::exception_ptr cause) {
    transition(ContentState::FAILED,
               state_ == ContentState::LOADING || state_ == ContentState::PROCESSING);
    ready_.reject(cause);
}

}
