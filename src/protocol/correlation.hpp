#ifndef WB_PROTOCOL_CORRELATION_HPP
#define WB_PROTOCOL_CORRELATION_HPP

#include "envelope.hpp"

#include <kj/async.h>
#include <kj/time.h>

#include <cstdint>
#include <map>
#include <optional>

namespace protocol {

// -----------------------------------------------------------------------------
// PendingEntry - One in-flight request on the page side
// -----------------------------------------------------------------------------
struct PendingEntry {
    uint64_t      id = 0;
    kj::TimePoint created_at = kj::origin<kj::TimePoint>();

    // onResolve / onReject
    kj::Own<kj::PromiseFulfiller<Json>> fulfiller;

    // Wraps the entry's deadline timer; cancelling it cancels the timer.
    kj::Own<kj::Canceler> deadline;
};

// -----------------------------------------------------------------------------
// CorrelationTable - Pending entries keyed by correlation ID
//
// resolve() and reject() are the only two writers. Each removes the entry
// before touching its continuation, so whichever runs first settles the
// request and the other finds nothing.
// -----------------------------------------------------------------------------
class CorrelationTable {
public:
    CorrelationTable() = default;
    ~CorrelationTable() noexcept(false);

    CorrelationTable(const CorrelationTable&) = delete;
    CorrelationTable& operator=(const CorrelationTable&) = delete;

    // Throws std::logic_error if the id is already registered.
    void register_entry(PendingEntry entry);

    // Returns false if the id is unknown or already settled.
    bool resolve(uint64_t id, Json value);
    bool reject(uint64_t id, kj::Exception error);

    // Rejects every outstanding entry with a copy of `error`.
    std::size_t reject_all(const kj::Exception& error);

    bool contains(uint64_t id) const;
    std::size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    std::optional<kj::TimePoint> created_at(uint64_t id) const;

private:
    // Atomic check-and-remove
    std::optional<PendingEntry> take(uint64_t id);

    std::map<uint64_t, PendingEntry> entries_;
};

} // namespace protocol

#endif // WB_PROTOCOL_CORRELATION_HPP
