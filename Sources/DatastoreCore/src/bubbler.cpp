#include "datastore/bubbler.hpp"
#include "datastore/db_object.hpp"
#include "datastore/log.hpp"

namespace datastore {

change_bubbler::change_bubbler(shared_scheduler scheduler)
    : scheduler_(std::move(scheduler))
{}

std::vector<notification> change_bubbler::plan(const change_set& changes) {
    std::vector<notification> result;
    for (const auto& entry : changes.entries) {
        auto args = make_changed_args(entry.object, entry.changes);
        result.push_back({entry.object, args});

        // Parents are captured now; a later detach must not reroute this commit
        for (auto* ancestor = entry.object->parent(); ancestor; ancestor = ancestor->parent()) {
            result.push_back({ancestor->shared_from_this(), args});
        }
    }
    return result;
}

void change_bubbler::dispatch(const change_set& changes) {
    if (changes.empty()) return;

    auto notifications = plan(changes);
    if (!scheduler_->can_invoke()) {
        LOG_WARN("change_bubbler", "Scheduler cannot invoke, dropping %zu notifications",
                 notifications.size());
        return;
    }

    LOG_DEBUG("change_bubbler", "Scheduling %zu notifications for %zu objects",
              notifications.size(), changes.entries.size());
    for (auto& n : notifications) {
        scheduler_->invoke([receiver = std::move(n.receiver), args = std::move(n.args)] {
            receiver->changed().emit(*receiver, args);
        });
    }
}

} // namespace datastore
