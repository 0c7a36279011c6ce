/**
 * @file base64.hpp
 * @brief RFC 4648 base64 codec.
 *
 * Used for push-delivery payloads (JSON cannot carry raw bytes) and for
 * opaque list page tokens.
 *
 * @copyright Copyright (c) 2024 PubSubD Contributors
 * @license MIT License
 */

#pragma once

#include "pubsubd/utils/export.hpp"

#include <string>

namespace pubsubd {
namespace utils {

/**
 * @class Base64
 * @brief Standard-alphabet base64 with '=' padding.
 *
 * Usage:
 * @code
 * std::string text = Base64::encode("hello");   // "aGVsbG8="
 *
 * std::string raw;
 * if (!Base64::decode(text, raw)) { ... }       // malformed input
 * @endcode
 */
class PUBSUBD_UTILS_API Base64 {
public:
    static std::string encode(const std::string& data);

    /**
     * @brief Decode @p text into @p out.
     * @return False if @p text is not padded base64; @p out is then unspecified.
     */
    static bool decode(const std::string& text, std::string& out);
};

}  // namespace utils
}  // namespace pubsubd
