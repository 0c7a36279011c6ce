/**
 * @file message_log.hpp
 * @brief Per-topic append-only message sequence.
 *
 * The log assigns message ids (a per-topic sequence number) and keeps a
 * bounded window of the most recent messages. Backlog entries and leases
 * hold their own references, so trimming the window never loses a message
 * that still awaits acknowledgment.
 *
 * @copyright Copyright (c) 2024 PubSubD Contributors
 * @license MIT License
 */

#pragma once

#include "pubsubd/core/export.hpp"
#include "pubsubd/core/types.hpp"

#include <chrono>
#include <cstdint>
#include <deque>

namespace pubsubd {
namespace core {

/**
 * @class MessageLog
 * @brief Append-only log of one topic.
 *
 * Not thread-safe: the owning topic serializes access.
 */
class PUBSUBD_CORE_API MessageLog {
public:
    /**
     * @param retention Messages kept in the inspection window (0 = keep none).
     */
    explicit MessageLog(uint32_t retention = 1000);

    /**
     * @brief Stamp, number and append a message.
     * @return The stored, now immutable, message.
     */
    MessagePtr append(const OutgoingMessage& msg,
                      std::chrono::system_clock::time_point publishTime);

    uint64_t totalAppended() const { return next_sequence_ - 1; }
    size_t retainedCount() const { return window_.size(); }
    size_t retainedBytes() const { return retained_bytes_; }

private:
    uint32_t retention_;
    uint64_t next_sequence_ = 1;
    std::deque<MessagePtr> window_;
    size_t retained_bytes_ = 0;
};

}  // namespace core
}  // namespace pubsubd
