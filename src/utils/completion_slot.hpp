#pragma once

#include <exception>
#include <functional>
#include <future>
#include <utility>
#include <vector>

namespace agentbench::utils {

// One-shot result channel shared by several racing completion paths.
// The first Resolve/Reject settles the slot and runs every registered
// cancel hook; later attempts are rejected and return false.
template <typename T>
class CompletionSlot {
public:
    using CancelHook = std::function<void()>;

    CompletionSlot()
        : future_(promise_.get_future()) {}

    CompletionSlot(const CompletionSlot&) = delete;
    CompletionSlot& operator=(const CompletionSlot&) = delete;

    // Hooks registered after settlement run immediately.
    void OnSettle(CancelHook hook) {
        if (settled_) {
            hook();
            return;
        }
        hooks_.push_back(std::move(hook));
    }

    bool Resolve(T value) {
        if (!Claim()) {
            return false;
        }
        promise_.set_value(std::move(value));
        RunHooks();
        return true;
    }

    bool Reject(std::exception_ptr error) {
        if (!Claim()) {
            return false;
        }
        promise_.set_exception(std::move(error));
        RunHooks();
        return true;
    }

    bool Settled() const { return settled_; }

    // Returns the value or rethrows the rejection. Callable once.
    T Take() { return future_.get(); }

private:
    bool Claim() {
        if (settled_) {
            return false;
        }
        settled_ = true;
        return true;
    }

    void RunHooks() {
        auto hooks = std::move(hooks_);
        hooks_.clear();
        for (auto& hook : hooks) {
            if (hook) {
                hook();
            }
        }
    }

    std::promise<T> promise_;
    std::future<T> future_;
    std::vector<CancelHook> hooks_;
    bool settled_ = false;
};

}  // namespace agentbench::utils
