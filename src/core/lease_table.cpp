/**
 * @file lease_table.cpp
 * @brief LeaseTable implementation.
 *
 * @copyright Copyright (c) 2024 PubSubD Contributors
 * @license MIT License
 */

#include "pubsubd/core/lease_table.hpp"
#include "pubsubd/utils/uuid.hpp"

namespace pubsubd {
namespace core {

std::string LeaseTable::create(BacklogEntry entry, TimePoint expiry) {
    std::string ackId = utils::UUIDGenerator::compact();
    while (leases_.count(ackId) > 0) {
        ackId = utils::UUIDGenerator::compact();
    }

    byExpiry_.emplace(expiry, ackId);
    leases_.emplace(ackId, Lease{ackId, std::move(entry), expiry});
    return ackId;
}

bool LeaseTable::remove(const std::string& ackId) {
    auto it = leases_.find(ackId);
    if (it == leases_.end()) {
        return false;
    }
    byExpiry_.erase({it->second.expiry, ackId});
    leases_.erase(it);
    return true;
}

bool LeaseTable::setExpiry(const std::string& ackId, TimePoint expiry) {
    auto it = leases_.find(ackId);
    if (it == leases_.end()) {
        return false;
    }
    byExpiry_.erase({it->second.expiry, ackId});
    it->second.expiry = expiry;
    byExpiry_.emplace(expiry, ackId);
    return true;
}

std::vector<BacklogEntry> LeaseTable::takeExpired(TimePoint now) {
    std::vector<BacklogEntry> expired;

    auto it = byExpiry_.begin();
    while (it != byExpiry_.end() && it->first <= now) {
        auto leaseIt = leases_.find(it->second);
        if (leaseIt != leases_.end()) {
            expired.push_back(std::move(leaseIt->second.entry));
            leases_.erase(leaseIt);
        }
        it = byExpiry_.erase(it);
    }

    return expired;
}

void LeaseTable::clear() {
    leases_.clear();
    byExpiry_.clear();
}

}  // namespace core
}  // namespace pubsubd
