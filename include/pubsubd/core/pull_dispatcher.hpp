/**
 * @file pull_dispatcher.hpp
 * @brief Serves Pull requests against a subscription's backlog.
 *
 * @copyright Copyright (c) 2024 PubSubD Contributors
 * @license MIT License
 */

#pragma once

#include "pubsubd/core/export.hpp"
#include "pubsubd/core/cancellation.hpp"
#include "pubsubd/core/registry.hpp"
#include "pubsubd/core/status.hpp"
#include "pubsubd/core/types.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace pubsubd {
namespace core {

/**
 * @brief Pull admission and wait limits.
 */
struct PullOptions {
    uint32_t max_outstanding_pulls = 16;   ///< Concurrent Pull calls per subscription
    int64_t max_pull_wait_ms = 30000;      ///< Bound of a blocking wait
    int32_t max_messages_per_pull = 1000;  ///< Clamp for max_messages
};

/**
 * @class PullDispatcher
 * @brief Drains and leases backlog entries for Pull callers.
 *
 * A Pull first takes one of the subscription's admission slots (failing
 * fast with UNAVAILABLE when none is free), then drains and leases up to
 * the requested count. With return_immediately unset and nothing to
 * deliver, the call waits, still holding its slot but no subscription
 * lock, until an entry arrives, the token is cancelled, or the wait
 * bound elapses.
 */
class PUBSUBD_CORE_API PullDispatcher {
public:
    PullDispatcher(std::shared_ptr<Registry> registry, PullOptions options = {});

    /**
     * @param subscription Subscription name.
     * @param maxMessages Upper bound on messages returned (> 0).
     * @param returnImmediately Never wait when true.
     * @param out Leased messages; may be empty on success.
     * @param token Optional cancellation of the waiting phase.
     * @return NOT_FOUND, INVALID_ARGUMENT, UNAVAILABLE, CANCELLED or OK.
     */
    Status pull(const std::string& subscription,
                int32_t maxMessages,
                bool returnImmediately,
                std::vector<ReceivedMessage>& out,
                CancellationToken* token = nullptr);

    const PullOptions& options() const { return options_; }

private:
    std::shared_ptr<Registry> registry_;
    PullOptions options_;
};

}  // namespace core
}  // namespace pubsubd
