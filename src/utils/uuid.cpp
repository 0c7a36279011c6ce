/**
 * @file uuid.cpp
 * @brief UUIDGenerator implementation.
 *
 * @copyright Copyright (c) 2024 PubSubD Contributors
 * @license MIT License
 */

#include "pubsubd/utils/uuid.hpp"

#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>
#include <utility>

namespace pubsubd {
namespace utils {

namespace {

// Two random 64-bit halves with version (4) and variant (10xx) bits set.
std::pair<uint64_t, uint64_t> randomHalves() {
    thread_local std::random_device rd;
    thread_local std::mt19937_64 gen(rd());
    thread_local std::uniform_int_distribution<uint64_t> dist;

    uint64_t ab = dist(gen);
    uint64_t cd = dist(gen);

    ab = (ab & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    cd = (cd & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;
    return {ab, cd};
}

}  // namespace

std::string UUIDGenerator::generate() {
    auto [ab, cd] = randomHalves();

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    oss << std::setw(8) << ((ab >> 32) & 0xFFFFFFFF) << "-";
    oss << std::setw(4) << ((ab >> 16) & 0xFFFF) << "-";
    oss << std::setw(4) << (ab & 0xFFFF) << "-";
    oss << std::setw(4) << ((cd >> 48) & 0xFFFF) << "-";
    oss << std::setw(12) << (cd & 0xFFFFFFFFFFFFULL);
    return oss.str();
}

std::string UUIDGenerator::compact() {
    auto [ab, cd] = randomHalves();

    std::ostringstream oss;
    oss << std::hex << std::setfill('0')
        << std::setw(16) << ab
        << std::setw(16) << cd;
    return oss.str();
}

}  // namespace utils
}  // namespace pubsubd
