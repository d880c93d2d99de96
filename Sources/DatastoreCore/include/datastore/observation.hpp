#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace datastore {

// ============================================================================
// notification_token - Retains an observation until destroyed (move-only)
// ============================================================================

class notification_token {
public:
    notification_token() = default;

    explicit notification_token(std::function<void()> unregister_fn)
        : unregister_(std::move(unregister_fn)) {}

    ~notification_token() {
        unregister();
    }

    notification_token(const notification_token&) = delete;
    notification_token& operator=(const notification_token&) = delete;

    notification_token(notification_token&& other) noexcept
        : unregister_(std::move(other.unregister_)) {
        other.unregister_ = nullptr;
    }

    notification_token& operator=(notification_token&& other) noexcept {
        if (this != &other) {
            unregister();
            unregister_ = std::move(other.unregister_);
            other.unregister_ = nullptr;
        }
        return *this;
    }

    /// Explicitly unregister the observation
    void unregister() {
        if (unregister_) {
            unregister_();
            unregister_ = nullptr;
        }
    }

    /// Returns true if this token still holds an active observation
    [[nodiscard]] bool is_valid() const noexcept {
        return unregister_ != nullptr;
    }

    explicit operator bool() const noexcept {
        return is_valid();
    }

private:
    std::function<void()> unregister_;
};

// ============================================================================
// signal - Ordered list of observers for one notification channel
// ============================================================================
//
// Observers run in connection order. emit() snapshots the observer list, so
// an observer may connect or disconnect others (or itself) while running.
// Tokens stay safe to destroy after the signal itself is gone.

template<typename... Args>
class signal {
public:
    using callback_t = std::function<void(Args...)>;
    using observer_id = uint64_t;

    signal() : state_(std::make_shared<state>()) {}

    signal(const signal&) = delete;
    signal& operator=(const signal&) = delete;

    [[nodiscard]] notification_token connect(callback_t callback) {
        observer_id id;
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            id = state_->next_id++;
            state_->observers.emplace_back(id, std::move(callback));
        }
        std::weak_ptr<state> weak = state_;
        return notification_token([weak, id] {
            if (auto s = weak.lock()) {
                s->remove(id);
            }
        });
    }

    void emit(Args... args) const {
        std::vector<std::pair<observer_id, callback_t>> observers;
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            observers = state_->observers;
        }
        for (auto& [id, callback] : observers) {
            // Skip observers disconnected by an earlier callback of this emit
            if (state_->contains(id)) {
                callback(args...);
            }
        }
    }

    [[nodiscard]] size_t observer_count() const {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->observers.size();
    }

    void disconnect_all() {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->observers.clear();
    }

private:
    struct state {
        mutable std::mutex mutex;
        std::vector<std::pair<observer_id, callback_t>> observers;
        observer_id next_id = 1;

        void remove(observer_id id) {
            std::lock_guard<std::mutex> lock(mutex);
            for (auto it = observers.begin(); it != observers.end(); ++it) {
                if (it->first == id) {
                    observers.erase(it);
                    return;
                }
            }
        }

        bool contains(observer_id id) const {
            std::lock_guard<std::mutex> lock(mutex);
            for (const auto& entry : observers) {
                if (entry.first == id) return true;
            }
            return false;
        }
    };

    std::shared_ptr<state> state_;
};

} // namespace datastore
