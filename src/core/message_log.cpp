/**
 * @file message_log.cpp
 * @brief MessageLog implementation.
 *
 * @copyright Copyright (c) 2024 PubSubD Contributors
 * @license MIT License
 */

#include "pubsubd/core/message_log.hpp"

#include <string>

namespace pubsubd {
namespace core {

MessageLog::MessageLog(uint32_t retention)
    : retention_(retention)
{}

MessagePtr MessageLog::append(const OutgoingMessage& msg,
                              std::chrono::system_clock::time_point publishTime) {
    uint64_t seq = next_sequence_++;

    auto stored = std::make_shared<Message>();
    stored->message_id = std::to_string(seq);
    stored->data = msg.data;
    stored->attributes = msg.attributes;
    stored->publish_time = publishTime;
    MessagePtr ptr = std::move(stored);

    if (retention_ == 0) {
        return ptr;
    }

    while (window_.size() >= retention_) {
        retained_bytes_ -= window_.front()->data.size();
        window_.pop_front();
    }
    window_.push_back(ptr);
    retained_bytes_ += ptr->data.size();

    return ptr;
}

}  // namespace core
}  // namespace pubsubd
