#pragma once

#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace I3dm::Content {

template <class T>
class Deferred;

namespace detail {

template <class T>
struct PromiseState {
    enum class Status { PENDING, RESOLVED, REJECTED };

    Status status = Status::PENDING;
    std::optional<T> value;
    std::exception_ptr error;
    std::vector<std::function<void(const T&)>> onResolved;
    std::vector<std::function<void(std::exception_ptr)>> onRejected;
};

}

/**
 * Read side of a one-shot completion signal.
 *
 * Single-threaded: continuations run on the thread that settles the signal, in
 * registration order. A continuation registered after settlement runs immediately.
 */
template <class T>
class Promise {
public:
    using ResolveCallback = std::function<void(const T&)>;
    using RejectCallback = std::function<void(std::exception_ptr)>;

    const Promise& then(ResolveCallback onResolved, RejectCallback onRejected = RejectCallback()) const {
        auto& s = *state_;
        switch (s.status) {
            case detail::PromiseState<T>::Status::PENDING:
                if (onResolved) s.onResolved.push_back(std::move(onResolved));
                if (onRejected) s.onRejected.push_back(std::move(onRejected));
                break;
            case detail::PromiseState<T>::Status::RESOLVED:
                if (onResolved) onResolved(*s.value);
                break;
            case detail::PromiseState<T>::Status::REJECTED:
                if (onRejected) onRejected(s.error);
                break;
        }
        return *this;
    }

    const Promise& otherwise(RejectCallback onRejected) const {
        return then(ResolveCallback(), std::move(onRejected));
    }

    bool isPending() const { return state_->status == detail::PromiseState<T>::Status::PENDING; }
    bool isResolved() const { return state_->status == detail::PromiseState<T>::Status::RESOLVED; }
    bool isRejected() const { return state_->status == detail::PromiseState<T>::Status::REJECTED; }

    const T& value() const {
        if (!isResolved()) {
            throw std::logic_error("Promise::value() on a promise that is not resolved");
        }
        return *state_->value;
    }

    std::exception_ptr error() const { return state_->error; }

private:
    friend class Deferred<T>;

    explicit Promise(std::shared_ptr<detail::PromiseState<T>> state) : state_(std::move(state)) {}

    std::shared_ptr<detail::PromiseState<T>> state_;
};

/**
 * Write side of a one-shot completion signal. Settling twice throws std::logic_error.
 */
template <class T>
class Deferred {
public:
    Deferred() : state_(std::make_shared<detail::PromiseState<T>>()) {}

    Promise<T> promise() const { return Promise<T>(state_); }

    bool isSettled() const { return state_->status != detail::PromiseState<T>::Status::PENDING; }

    void resolve(T value) {
        checkPending("resolve");
        auto& s = *state_;
        s.status = detail::PromiseState<T>::Status::RESOLVED;
        s.value = std::move(value);
        auto callbacks = std::move(s.onResolved);
        s.onResolved.clear();
        s.onRejected.clear();
        for (auto& callback : callbacks) {
            callback(*s.value);
        }
    }

    void reject(std::exception_ptr error) {
        checkPending("reject");
        auto& s = *state_;
        s.status = detail::PromiseState<T>::Status::REJECTED;
        s.error = error;
        auto callbacks = std::move(s.onRejected);
        s.onResolved.clear();
        s.onRejected.clear();
        for (auto& callback : callbacks) {
            callback(error);
        }
    }

    template <class E>
    void reject(const E& error) {
        reject(std::make_exception_ptr(error));
    }

private:
    void checkPending(const char* operation) const {
        if (isSettled()) {
            throw std::logic_error(std::string("Deferred::") + operation + " on an already settled signal");
        }
    }

    std::shared_ptr<detail::PromiseState<T>> state_;
};

}
