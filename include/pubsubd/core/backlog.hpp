/**
 * @file backlog.hpp
 * @brief Per-subscription FIFO of messages awaiting (re)delivery.
 *
 * The backlog itself carries no lock; the owning Subscription mutates it
 * together with its lease table under one mutex so that a message is never
 * in both places at once.
 *
 * @copyright Copyright (c) 2024 PubSubD Contributors
 * @license MIT License
 */

#pragma once

#include "pubsubd/core/types.hpp"

#include <cstdint>
#include <deque>
#include <optional>

namespace pubsubd {
namespace core {

/**
 * @brief A message waiting for delivery on one subscription.
 */
struct BacklogEntry {
    MessagePtr message;
    int32_t delivery_attempts = 0;  ///< Leases created from this entry so far
};

/**
 * @brief Counters for a backlog.
 */
struct BacklogStats {
    size_t current_depth = 0;
    uint64_t total_enqueued = 0;   ///< First-time entries from publish fan-out
    uint64_t total_requeued = 0;   ///< Entries returned by lease expiry
    uint64_t total_dequeued = 0;
    size_t high_watermark = 0;
};

/**
 * @class Backlog
 * @brief FIFO of BacklogEntry. Not thread-safe.
 */
class Backlog {
public:
    /**
     * @brief Append a freshly published message.
     */
    void push(MessagePtr message) {
        entries_.push_back(BacklogEntry{std::move(message), 0});
        stats_.total_enqueued++;
        updateWatermark();
    }

    /**
     * @brief Return an expired entry at the tail so other entries get a turn.
     */
    void requeue(BacklogEntry entry) {
        entries_.push_back(std::move(entry));
        stats_.total_requeued++;
        updateWatermark();
    }

    /**
     * @brief Take the entry at the front.
     * @return The entry, or nullopt if the backlog is empty.
     */
    std::optional<BacklogEntry> pop() {
        if (entries_.empty()) {
            return std::nullopt;
        }
        BacklogEntry entry = std::move(entries_.front());
        entries_.pop_front();
        stats_.total_dequeued++;
        return entry;
    }

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    /**
     * @brief Drop every entry. Counters are kept.
     */
    void clear() { entries_.clear(); }

    /**
     * @brief Visit entries front to back without removing them.
     */
    template<typename Fn>
    void forEach(Fn&& fn) const {
        for (const auto& entry : entries_) {
            fn(entry);
        }
    }

    BacklogStats stats() const {
        BacklogStats result = stats_;
        result.current_depth = entries_.size();
        return result;
    }

private:
    void updateWatermark() {
        if (entries_.size() > stats_.high_watermark) {
            stats_.high_watermark = entries_.size();
        }
    }

    std::deque<BacklogEntry> entries_;
    BacklogStats stats_;
};

}  // namespace core
}  // namespace pubsubd
