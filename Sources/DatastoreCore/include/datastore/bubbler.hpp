#pragma once

#ifdef __cplusplus

#include "changes.hpp"
#include "scheduler.hpp"
#include "transaction.hpp"
#include <memory>
#include <vector>

namespace datastore {

/// One pending `changed` emission: `receiver` fires with `args`.
struct notification {
    std::shared_ptr<db_object> receiver;
    changed_args args;
};

// ============================================================================
// change_bubbler - Turns a committed change_set into `changed` emissions
// ============================================================================
//
// For every changed object, in commit order: the object's own direct
// notification, then the same args republished by each ancestor up to the
// root. The whole sequence is handed to the scheduler, so observers run after
// transact() has returned.

class change_bubbler {
public:
    explicit change_bubbler(shared_scheduler scheduler);

    /// The notifications a commit produces, in delivery order.
    static std::vector<notification> plan(const change_set& changes);

    /// Plan and enqueue the notifications for `changes`.
    void dispatch(const change_set& changes);

    const shared_scheduler& get_scheduler() const noexcept { return scheduler_; }

private:
    shared_scheduler scheduler_;
};

} // namespace datastore

#endif // __cplusplus
