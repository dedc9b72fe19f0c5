#ifndef WB_PROTOCOL_CONFIRMATION_HPP
#define WB_PROTOCOL_CONFIRMATION_HPP

#include "envelope.hpp"

#include <kj/async.h>

#include <cstdint>
#include <map>
#include <optional>
#include <vector>

namespace protocol {

// -----------------------------------------------------------------------------
// ConfirmationSurface - Asks the user to approve a transaction
// -----------------------------------------------------------------------------
class ConfirmationSurface {
public:
    virtual ~ConfirmationSurface() = default;

    // Resolves true on approval, false on rejection.
    virtual kj::Promise<bool> request_approval(uint64_t correlation_id,
                                               const Json& transaction) = 0;
};

// -----------------------------------------------------------------------------
// QueuedConfirmation - Undecided approvals held for a UI to drive
//
// Requests whose promise was dropped by the asker (e.g. on its own
// timeout) are pruned and can no longer be decided.
// -----------------------------------------------------------------------------
class QueuedConfirmation : public ConfirmationSurface {
public:
    QueuedConfirmation() = default;
    ~QueuedConfirmation() noexcept(false);

    QueuedConfirmation(const QueuedConfirmation&) = delete;
    QueuedConfirmation& operator=(const QueuedConfirmation&) = delete;

    kj::Promise<bool> request_approval(uint64_t correlation_id,
                                       const Json& transaction) override;

    // Correlation ids still awaiting a decision, oldest first per id.
    std::vector<uint64_t> pending_ids();
    std::optional<Json> transaction(uint64_t correlation_id);

    // Both return false when nothing is waiting under that id.
    bool approve(uint64_t correlation_id);
    bool reject(uint64_t correlation_id);

private:
    struct Pending {
        Json transaction;
        kj::Own<kj::PromiseFulfiller<bool>> fulfiller;
    };

    bool decide(uint64_t correlation_id, bool approved);
    void prune();

    // Ids are per-page, so two pages may share one.
    std::multimap<uint64_t, Pending> pending_;
};

} // namespace protocol

#endif // WB_PROTOCOL_CONFIRMATION_HPP
