/**
 * @file completed_reactor.hpp
 * @brief Unary reactor for handlers that finish synchronously.
 *
 * @copyright Copyright (c) 2024 PubSubD Contributors
 * @license MIT License
 */

#pragma once

#include <grpcpp/grpcpp.h>

namespace pubsubd {
namespace services {

/**
 * @class CompletedReactor
 * @brief Finishes with a status computed before the reactor is created.
 */
class CompletedReactor : public grpc::ServerUnaryReactor {
public:
    explicit CompletedReactor(const grpc::Status& status) {
        Finish(status);
    }

    void OnDone() override {
        delete this;
    }
};

}  // namespace services
}  // namespace pubsubd
