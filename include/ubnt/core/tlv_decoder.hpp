/**
 * @file tlv_decoder.hpp
 * @brief Decoder for UBNT discovery advertisement packets.
 *
 * Packet layout (all integers big-endian):
 *
 *   +---------+---------+----------------+
 *   | version | command | payload length |   header, 4 bytes
 *   |  (u8)   |  (u8)   |     (u16)      |
 *   +---------+---------+----------------+
 *   | tag (u8) | length (u16) | value ... |   repeated TLVs
 *   +----------+--------------+-----------+
 *
 * Decoding is best-effort: unknown tags are skipped and a truncated TLV ends
 * parsing without discarding the fields already extracted.
 *
 * @copyright Copyright (c) 2024 UBNT Discovery Contributors
 * @license MIT License
 */

#pragma once

#include "ubnt/core/device_record.hpp"
#include "ubnt/core/export.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace ubnt {
namespace core {

constexpr size_t HEADER_SIZE = 4;
constexpr size_t TLV_HEADER_SIZE = 3;

/// Discovery request sent to every device: version 1, command 0, empty payload.
constexpr std::array<uint8_t, 4> REQUEST_PAYLOAD = {0x01, 0x00, 0x00, 0x00};

/**
 * @enum TlvTag
 * @brief Tags understood by the decoder. Anything else is skipped.
 */
enum class TlvTag : uint8_t {
    HW_ADDR = 0x01,
    IP_INFO = 0x02,
    FW_VERSION = 0x03,
    ADDR_ENTRY = 0x04,
    MAC_ADDRESS = 0x05,
    UPTIME = 0x0a,
    HOSTNAME = 0x0b,
    PLATFORM = 0x0c,
    MODEL = 0x14
};

/**
 * @struct PacketHeader
 * @brief The fixed 4-byte packet header.
 */
struct UBNT_CORE_API PacketHeader {
    uint8_t version = 0;
    uint8_t command = 0;
    uint16_t payload_length = 0;
};

/**
 * @brief Parse the packet header.
 * @return nullopt when @p data is null or shorter than HEADER_SIZE.
 */
UBNT_CORE_API std::optional<PacketHeader> parseHeader(const uint8_t* data, size_t length);

/**
 * @brief Decode one datagram into a partial record.
 *
 * The returned record has an empty `source_ip`; the caller stamps it.
 *
 * @return nullopt when the header cannot be parsed. Never throws.
 */
UBNT_CORE_API std::optional<DeviceRecord> decode(const uint8_t* data, size_t length);

UBNT_CORE_API std::optional<DeviceRecord> decode(const std::vector<uint8_t>& datagram);

}  // namespace core
}  // namespace ubnt
