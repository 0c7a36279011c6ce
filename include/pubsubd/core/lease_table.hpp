/**
 * @file lease_table.hpp
 * @brief In-flight deliveries of one subscription, keyed by ack id.
 *
 * The lease table is the authority on outstanding deliveries. Each lease
 * owns the backlog entry it was created from; acknowledging removes it,
 * expiry hands the entry back so it can be requeued.
 *
 * @copyright Copyright (c) 2024 PubSubD Contributors
 * @license MIT License
 */

#pragma once

#include "pubsubd/core/export.hpp"
#include "pubsubd/core/backlog.hpp"

#include <chrono>
#include <set>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace pubsubd {
namespace core {

/**
 * @brief One outstanding delivery attempt.
 */
struct Lease {
    std::string ack_id;
    BacklogEntry entry;
    std::chrono::steady_clock::time_point expiry;
};

/**
 * @class LeaseTable
 * @brief Ack id -> Lease map with an expiry-ordered index.
 *
 * Not thread-safe: the owning Subscription serializes access.
 */
class PUBSUBD_CORE_API LeaseTable {
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;

    /**
     * @brief Create a lease under a fresh single-use ack id.
     * @return The ack id.
     */
    std::string create(BacklogEntry entry, TimePoint expiry);

    /**
     * @brief Remove a lease (acknowledgment).
     * @return False if the ack id is unknown (stale, superseded or never issued).
     */
    bool remove(const std::string& ackId);

    /**
     * @brief Move a lease's expiry.
     * @return False if the ack id is unknown.
     */
    bool setExpiry(const std::string& ackId, TimePoint expiry);

    /**
     * @brief Remove every lease whose expiry is at or before @p now.
     * @return The released entries, earliest expiry first.
     */
    std::vector<BacklogEntry> takeExpired(TimePoint now);

    /**
     * @brief Visit live leases in unspecified order.
     */
    template<typename Fn>
    void forEach(Fn&& fn) const {
        for (const auto& [id, lease] : leases_) {
            fn(lease);
        }
    }

    size_t size() const { return leases_.size(); }
    bool empty() const { return leases_.empty(); }
    void clear();

private:
    std::unordered_map<std::string, Lease> leases_;
    std::set<std::pair<TimePoint, std::string>> byExpiry_;
};

}  // namespace core
}  // namespace pubsubd
