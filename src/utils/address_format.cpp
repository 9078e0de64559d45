/**
 * @file address_format.cpp
 * @brief MAC and IPv4 text formatting.
 *
 * @copyright Copyright (c) 2024 UBNT Discovery Contributors
 * @license MIT License
 */

#include "ubnt/utils/address_format.hpp"

#include <cctype>
#include <iomanip>
#include <sstream>

namespace ubnt {
namespace utils {

std::string formatMac(const uint8_t* bytes) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (size_t i = 0; i < MAC_LENGTH; ++i) {
        if (i > 0) {
            oss << ':';
        }
        oss << std::setw(2) << static_cast<unsigned>(bytes[i]);
    }
    return oss.str();
}

std::string formatIpv4(const uint8_t* bytes) {
    return std::to_string(bytes[0]) + "." +
           std::to_string(bytes[1]) + "." +
           std::to_string(bytes[2]) + "." +
           std::to_string(bytes[3]);
}

std::optional<std::string> normalizeMac(const std::string& text) {
    std::string digits;
    digits.reserve(MAC_LENGTH * 2);

    for (char c : text) {
        if (c == ':' || c == '-' || c == '.') {
            continue;
        }
        if (!std::isxdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
        digits.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }

    if (digits.size() != MAC_LENGTH * 2) {
        return std::nullopt;
    }

    std::string result;
    result.reserve(MAC_LENGTH * 3 - 1);
    for (size_t i = 0; i < digits.size(); i += 2) {
        if (i > 0) {
            result.push_back(':');
        }
        result.append(digits, i, 2);
    }
    return result;
}

}  // namespace utils
}  // namespace ubnt
