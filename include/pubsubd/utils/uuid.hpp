/**
 * @file uuid.hpp
 * @brief Random identifiers for acknowledgment tokens and generated names.
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
 * @class UUIDGenerator
 * @brief Thread-safe RFC 4122 version 4 UUID generator.
 *
 * Usage:
 * @code
 * std::string id = UUIDGenerator::generate();
 * // "550e8400-e29b-41d4-a716-446655440000"
 *
 * std::string token = UUIDGenerator::compact();
 * // "550e8400e29b41d4a716446655440000"
 * @endcode
 */
class PUBSUBD_UTILS_API UUIDGenerator {
public:
    /**
     * @brief Canonical 8-4-4-4-12 form.
     */
    static std::string generate();

    /**
     * @brief 32 hex digits without separators.
     */
    static std::string compact();
};

}  // namespace utils
}  // namespace pubsubd
