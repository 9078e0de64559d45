/**
 * @file address_format.hpp
 * @brief MAC and IPv4 text formatting helpers.
 *
 * Discovery packets carry raw 6-byte MACs and 4-byte IPv4 addresses, while
 * the management API reports MACs as bare hex strings ("245A4CDD6616").
 * Both end up in the same lowercase colon-hex form.
 *
 * @copyright Copyright (c) 2024 UBNT Discovery Contributors
 * @license MIT License
 */

#pragma once

#include "ubnt/utils/export.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace ubnt {
namespace utils {

constexpr size_t MAC_LENGTH = 6;
constexpr size_t IPV4_LENGTH = 4;

/**
 * @brief Format 6 raw bytes as "aa:bb:cc:dd:ee:ff".
 */
UBNT_UTILS_API std::string formatMac(const uint8_t* bytes);

/**
 * @brief Format 4 raw bytes (network order) as dotted decimal.
 */
UBNT_UTILS_API std::string formatIpv4(const uint8_t* bytes);

/**
 * @brief Normalize a textual MAC to lowercase colon-hex.
 *
 * Accepts bare hex ("245A4CDD6616") as well as ':', '-' or '.' separated
 * forms.
 *
 * @return The normalized MAC, or nullopt when the input does not hold
 *         exactly 12 hex digits.
 */
UBNT_UTILS_API std::optional<std::string> normalizeMac(const std::string& text);

}  // namespace utils
}  // namespace ubnt
