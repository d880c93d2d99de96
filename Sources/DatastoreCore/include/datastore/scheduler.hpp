#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>

namespace datastore {

// ============================================================================
// Scheduler interface - where `changed` notifications are delivered
// ============================================================================
//
// A commit never calls observers directly. The change bubbler hands every
// notification to the database's scheduler in commit order, and the host
// decides when the queued work runs:
// - queued_scheduler: the host drains it from its own loop (default)
// - callback_scheduler: forwards to an existing event loop's post function
//
// Implementations must run callbacks in the order they were invoked.

struct scheduler {
    virtual ~scheduler() = default;

    // Queue the given function on this scheduler's execution context.
    virtual void invoke(std::function<void()>&& fn) = 0;

    // Check if the caller is currently on this scheduler's thread/context.
    [[nodiscard]] virtual bool is_on_thread() const noexcept = 0;

    // Check if invoke() is currently possible.
    // May return false if the event loop isn't running.
    [[nodiscard]] virtual bool can_invoke() const noexcept = 0;
};

using shared_scheduler = std::shared_ptr<scheduler>;

// ============================================================================
// Queued scheduler - FIFO of pending callbacks drained by the host
// ============================================================================
//
// Captures the thread ID at construction (assumed to be the thread that runs
// transactions) and queues work until process_pending() is called.

class queued_scheduler : public scheduler {
public:
    queued_scheduler() : owner_thread_id_(std::this_thread::get_id()) {}

    void invoke(std::function<void()>&& fn) override;

    /// Run queued callbacks, including ones queued while draining.
    /// Returns the number of callbacks run. An exception thrown by a callback
    /// propagates; callbacks queued behind it stay pending.
    size_t process_pending();

    /// Number of callbacks waiting to run.
    [[nodiscard]] size_t pending() const;

    [[nodiscard]] bool is_on_thread() const noexcept override {
        return std::this_thread::get_id() == owner_thread_id_;
    }

    [[nodiscard]] bool can_invoke() const noexcept override {
        return true;
    }

private:
    std::thread::id owner_thread_id_;
    mutable std::mutex mutex_;
    std::queue<std::function<void()>> queue_;
};

// ============================================================================
// Callback scheduler - adapts a host event loop's post function
// ============================================================================

class callback_scheduler : public scheduler {
public:
    using post_fn = std::function<void(std::function<void()>&&)>;

    explicit callback_scheduler(post_fn post,
                                std::function<bool()> is_on_thread_fn = nullptr,
                                std::function<bool()> can_invoke_fn = nullptr)
        : post_(std::move(post))
        , is_on_thread_fn_(std::move(is_on_thread_fn))
        , can_invoke_fn_(std::move(can_invoke_fn))
    {}

    void invoke(std::function<void()>&& fn) override {
        post_(std::move(fn));
    }

    [[nodiscard]] bool is_on_thread() const noexcept override {
        return is_on_thread_fn_ ? is_on_thread_fn_() : true;
    }

    [[nodiscard]] bool can_invoke() const noexcept override {
        return post_ && (!can_invoke_fn_ || can_invoke_fn_());
    }

private:
    post_fn post_;
    std::function<bool()> is_on_thread_fn_;
    std::function<bool()> can_invoke_fn_;
};

namespace default_scheduler {

    // Get the default scheduler for a new database
    inline shared_scheduler make_default() {
        return std::make_shared<queued_scheduler>();
    }

} // namespace default_scheduler

} // namespace datastore
