#include "datastore/scheduler.hpp"

namespace datastore {

void queued_scheduler::invoke(std::function<void()>&& fn) {
    std::lock_guard<std::mutex> lock(mutex_);
    queue_.push(std::move(fn));
}

size_t queued_scheduler::process_pending() {
    size_t ran = 0;
    while (true) {
        std::function<void()> fn;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (queue_.empty()) break;
            fn = std::move(queue_.front());
            queue_.pop();
        }
        ++ran;
        if (fn) fn();
    }
    return ran;
}

size_t queued_scheduler::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

} // namespace datastore
