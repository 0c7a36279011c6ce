/**
 * @file http_push_transport.cpp
 * @brief HttpPushTransport implementation.
 *
 * @copyright Copyright (c) 2024 PubSubD Contributors
 * @license MIT License
 */

#include "pubsubd/services/http_push_transport.hpp"
#include "pubsubd/utils/base64.hpp"
#include "pubsubd/utils/logger.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <regex>
#include <sstream>

namespace pubsubd {
namespace services {

using json = nlohmann::json;

namespace {

const char* kVersionAttribute = "x-goog-version";

// RFC 3339 in UTC with millisecond precision.
std::string formatTimestamp(std::chrono::system_clock::time_point time) {
    auto timeT = std::chrono::system_clock::to_time_t(time);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        time.time_since_epoch()) % 1000;

    std::tm tmBuf{};
    gmtime_r(&timeT, &tmBuf);

    std::ostringstream oss;
    oss << std::put_time(&tmBuf, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

}  // namespace

bool HttpPushTransport::parseEndpoint(const std::string& url, PushEndpoint& out) {
    static const std::regex urlRegex(R"(^(https?)://([^:/?#]+)(?::(\d{1,5}))?([/?].*)?$)");

    std::smatch match;
    if (!std::regex_match(url, match, urlRegex)) {
        return false;
    }

    out.scheme = match[1].str();
    out.host = match[2].str();
    out.port = match[3].str().empty() ? (out.scheme == "https" ? 443 : 80)
                                      : std::stoi(match[3].str());
    out.path = match[4].str();
    if (out.path.empty() || out.path[0] != '/') {
        out.path = "/" + out.path;
    }
    return out.port > 0 && out.port <= 65535;
}

bool HttpPushTransport::tlsEnabled() {
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
    return true;
#else
    return false;
#endif
}

bool HttpPushTransport::supportsEndpoint(const std::string& endpoint) const {
    PushEndpoint parsed;
    if (!parseEndpoint(endpoint, parsed)) {
        return false;
    }
    return parsed.scheme == "http" || tlsEnabled();
}

std::string HttpPushTransport::buildPushBody(const std::string& subscription,
                                             const core::ReceivedMessage& received,
                                             const std::map<std::string, std::string>& pushAttributes) {
    const core::Message& message = *received.message;

    auto version = pushAttributes.find(kVersionAttribute);
    bool legacy = version != pushAttributes.end() && version->second == "v1beta1";

    json payload = {
        {"data", utils::Base64::encode(message.data)},
        {"attributes", json::object()},
        {"message_id", message.message_id}
    };
    for (const auto& [key, value] : message.attributes) {
        payload["attributes"][key] = value;
    }

    if (!legacy) {
        std::string publishTime = formatTimestamp(message.publish_time);
        payload["messageId"] = message.message_id;
        payload["publish_time"] = publishTime;
        payload["publishTime"] = publishTime;
    }

    json envelope = {
        {"message", payload},
        {"subscription", subscription}
    };
    return envelope.dump();
}

bool HttpPushTransport::isSuccessStatus(int status) {
    switch (status) {
        case 102:
        case 200:
        case 201:
        case 202:
        case 204:
            return true;
        default:
            return false;
    }
}

bool HttpPushTransport::deliver(const core::PushRequest& request) {
    totalRequests_++;

    PushEndpoint endpoint;
    if (!parseEndpoint(request.config.push_endpoint, endpoint)) {
        LOG_WARN("HttpPush", "Invalid push endpoint for {}: {}",
                 request.subscription, request.config.push_endpoint);
        return false;
    }
    if (endpoint.scheme == "https" && !tlsEnabled()) {
        LOG_WARN("HttpPush", "Cannot push to {}: built without TLS support",
                 request.config.push_endpoint);
        return false;
    }

    auto timeout = std::chrono::duration_cast<std::chrono::seconds>(request.timeout);
    time_t timeoutSec = std::max<time_t>(1, static_cast<time_t>(timeout.count()));

    httplib::Client client(endpoint.scheme + "://" + endpoint.host + ":" +
                           std::to_string(endpoint.port));
    if (!client.is_valid()) {
        LOG_WARN("HttpPush", "Cannot create client for {}", request.config.push_endpoint);
        return false;
    }
    client.set_connection_timeout(timeoutSec, 0);
    client.set_read_timeout(timeoutSec, 0);
    client.set_write_timeout(timeoutSec, 0);

    std::string body = buildPushBody(request.subscription, request.message,
                                     request.config.attributes);

    httplib::Result res = client.Post(endpoint.path, body, "application/json");
    if (!res) {
        LOG_WARN("HttpPush", "POST {} failed: {}", request.config.push_endpoint,
                 httplib::to_string(res.error()));
        return false;
    }

    if (!isSuccessStatus(res->status)) {
        LOG_WARN("HttpPush", "POST {} returned HTTP {} for message {}",
                 request.config.push_endpoint, res->status,
                 request.message.message->message_id);
        return false;
    }

    LOG_TRACE("HttpPush", "Delivered message {} to {} (HTTP {})",
              request.message.message->message_id, request.config.push_endpoint, res->status);
    return true;
}

}  // namespace services
}  // namespace pubsubd
