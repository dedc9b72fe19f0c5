#include "correlation.hpp"

#include <stdexcept>
#include <string>

namespace protocol {

CorrelationTable::~CorrelationTable() noexcept(false) {}

void CorrelationTable::register_entry(PendingEntry entry) {
    uint64_t id = entry.id;
    auto inserted = entries_.emplace(id, std::move(entry));
    if (!inserted.second) {
        throw std::logic_error("correlation id already registered: " + std::to_string(id));
    }
}

std::optional<PendingEntry> CorrelationTable::take(uint64_t id) {
    auto node = entries_.extract(id);
    if (node.empty()) return std::nullopt;
    return std::move(node.mapped());
}

bool CorrelationTable::resolve(uint64_t id, Json value) {
    auto entry = take(id);
    if (!entry) return false;

    if (entry->deadline) entry->deadline->cancel("request settled");
    entry->fulfiller->fulfill(std::move(value));
    return true;
}

bool CorrelationTable::reject(uint64_t id, kj::Exception error) {
    auto entry = take(id);
    if (!entry) return false;

    if (entry->deadline) entry->deadline->cancel("request settled");
    entry->fulfiller->reject(kj::mv(error));
    return true;
}

std::size_t CorrelationTable::reject_all(const kj::Exception& error) {
    std::size_t count = 0;
    while (!entries_.empty()) {
        uint64_t id = entries_.begin()->first;
        if (reject(id, kj::cp(error))) ++count;
    }
    return count;
}

bool CorrelationTable::contains(uint64_t id) const {
    return entries_.find(id) != entries_.end();
}

std::optional<kj::TimePoint> CorrelationTable::created_at(uint64_t id) const {
    auto it = entries_.find(id);
    if (it == entries_.end()) return std::nullopt;
    return it->second.created_at;
}

} // namespace protocol
