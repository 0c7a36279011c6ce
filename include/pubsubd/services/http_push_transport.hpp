/**
 * @file http_push_transport.hpp
 * @brief PushTransport that POSTs JSON envelopes to HTTP endpoints.
 *
 * @copyright Copyright (c) 2024 PubSubD Contributors
 * @license MIT License
 */

#pragma once

#include "pubsubd/services/export.hpp"
#include "pubsubd/core/push_transport.hpp"

#include <atomic>
#include <cstdint>
#include <map>
#include <string>

namespace pubsubd {
namespace services {

/**
 * @brief Parsed push endpoint URL.
 */
struct PushEndpoint {
    std::string scheme;  ///< "http" or "https"
    std::string host;
    int port = 0;
    std::string path;    ///< Always starts with '/'
};

/**
 * @class HttpPushTransport
 * @brief Delivers push messages over HTTP using cpp-httplib.
 *
 * The request body is a JSON envelope:
 * @code
 * {"message": {"data": "<base64>", "attributes": {...},
 *              "message_id": "1", "messageId": "1",
 *              "publish_time": "...", "publishTime": "..."},
 *  "subscription": "projects/p/subscriptions/s"}
 * @endcode
 * An "x-goog-version" push attribute of "v1beta1" selects the older
 * envelope without the camelCase duplicates and publish time.
 *
 * https endpoints require a build with OpenSSL; server certificates are
 * verified against the system trust store.
 *
 * Status 102, 200, 201, 202 and 204 count as accepted. Any other status,
 * a connection error or a timeout counts as a failed delivery.
 */
class PUBSUBD_SERVICES_API HttpPushTransport : public core::PushTransport {
public:
    HttpPushTransport() = default;
    ~HttpPushTransport() override = default;

    bool deliver(const core::PushRequest& request) override;

    /**
     * @brief Accepts absolute http URLs, and https URLs when built with TLS.
     */
    bool supportsEndpoint(const std::string& endpoint) const override;

    /**
     * @brief Whether this build links OpenSSL and can push over https.
     */
    static bool tlsEnabled();

    /**
     * @brief Split an http(s) URL into its parts.
     * @return false if the URL is not absolute http or https.
     */
    static bool parseEndpoint(const std::string& url, PushEndpoint& out);

    /**
     * @brief Serialize the push envelope for one message.
     */
    static std::string buildPushBody(const std::string& subscription,
                                     const core::ReceivedMessage& received,
                                     const std::map<std::string, std::string>& pushAttributes);

    /**
     * @brief Whether an HTTP status acknowledges the message.
     */
    static bool isSuccessStatus(int status);

    uint64_t totalRequests() const { return totalRequests_.load(); }

private:
    std::atomic<uint64_t> totalRequests_{0};
};

}  // namespace services
}  // namespace pubsubd
