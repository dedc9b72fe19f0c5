#include "confirmation.hpp"
#include "errors.hpp"
#include <kj/debug.h>

#include <utility>

namespace protocol {

QueuedConfirmation::~QueuedConfirmation() noexcept(false) {
    for (auto& entry : pending_) {
        if (entry.second.fulfiller->isWaiting()) {
            entry.second.fulfiller->reject(
                make_error(ErrorCode::UserRejected, "Confirmation surface closed"));
        }
    }
}

kj::Promise<bool> QueuedConfirmation::request_approval(uint64_t correlation_id,
                                                       const Json& transaction) {
    prune();
    auto paf = kj::newPromiseAndFulfiller<bool>();
    pending_.emplace(correlation_id, Pending{transaction, kj::mv(paf.fulfiller)});
    KJ_LOG(INFO, "awaiting approval", correlation_id);
    return kj::mv(paf.promise);
}

std::vector<uint64_t> QueuedConfirmation::pending_ids() {
    prune();
    std::vector<uint64_t> ids;
    ids.reserve(pending_.size());
    for (const auto& entry : pending_) {
        ids.push_back(entry.first);
    }
    return ids;
}

std::optional<Json> QueuedConfirmation::transaction(uint64_t correlation_id) {
    prune();
    auto it = pending_.find(correlation_id);
    if (it == pending_.end()) return std::nullopt;
    return it->second.transaction;
}

bool QueuedConfirmation::approve(uint64_t correlation_id) {
    return decide(correlation_id, true);
}

bool QueuedConfirmation::reject(uint64_t correlation_id) {
    return decide(correlation_id, false);
}

bool QueuedConfirmation::decide(uint64_t correlation_id, bool approved) {
    prune();
    auto it = pending_.find(correlation_id);
    if (it == pending_.end()) return false;

    auto fulfiller = kj::mv(it->second.fulfiller);
    pending_.erase(it);
    fulfiller->fulfill(kj::cp(approved));

    KJ_LOG(INFO, "confirmation decided", correlation_id, approved);
    return true;
}

void QueuedConfirmation::prune() {
    for (auto it = pending_.begin(); it != pending_.end();) {
        if (it->second.fulfiller->isWaiting()) {
            ++it;
        } else {
            it = pending_.erase(it);
        }
    }
}

} // namespace protocol
