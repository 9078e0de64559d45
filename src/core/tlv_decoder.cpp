/**
 * @file tlv_decoder.cpp
 * @brief UBNT discovery packet decoding.
 *
 * @copyright Copyright (c) 2024 UBNT Discovery Contributors
 * @license MIT License
 */

#include "ubnt/core/tlv_decoder.hpp"
#include "ubnt/utils/address_format.hpp"
#include "ubnt/utils/logger.hpp"

#include <algorithm>
#include <string>

namespace ubnt {
namespace core {

namespace {

uint16_t readU16(const uint8_t* p) {
    return static_cast<uint16_t>((p[0] << 8) | p[1]);
}

uint32_t readU32(const uint8_t* p) {
    return (static_cast<uint32_t>(p[0]) << 24) |
           (static_cast<uint32_t>(p[1]) << 16) |
           (static_cast<uint32_t>(p[2]) << 8) |
           static_cast<uint32_t>(p[3]);
}

std::string readString(const uint8_t* p, size_t length) {
    return std::string(reinterpret_cast<const char*>(p), length);
}

// Applies one TLV to the record. Fixed-width values of the wrong size are
// ignored; the entry has already been consumed by the caller.
void applyTlv(uint8_t tag, const uint8_t* value, size_t length, DeviceRecord& record) {
    switch (static_cast<TlvTag>(tag)) {
        case TlvTag::HW_ADDR:
            if (length == utils::MAC_LENGTH) {
                record.hw_addr = utils::formatMac(value);
                return;
            }
            break;

        case TlvTag::IP_INFO:
            if (length == utils::MAC_LENGTH + utils::IPV4_LENGTH) {
                record.ip_info = std::vector<std::string>{
                    utils::formatMac(value) + ";" +
                    utils::formatIpv4(value + utils::MAC_LENGTH)};
                return;
            }
            break;

        case TlvTag::FW_VERSION:
            record.fw_version = readString(value, length);
            return;

        case TlvTag::ADDR_ENTRY:
            if (length == utils::IPV4_LENGTH) {
                record.addr_entry = utils::formatIpv4(value);
                return;
            }
            break;

        case TlvTag::MAC_ADDRESS:
            if (length == utils::MAC_LENGTH) {
                record.mac_address = utils::formatMac(value);
                return;
            }
            break;

        case TlvTag::UPTIME:
            if (length == 4) {
                record.uptime = readU32(value);
                return;
            }
            break;

        case TlvTag::HOSTNAME:
            record.hostname = readString(value, length);
            return;

        case TlvTag::PLATFORM:
            record.platform = readString(value, length);
            return;

        case TlvTag::MODEL:
            record.model = readString(value, length);
            return;

        default:
            LOG_TRACE("Decoder", "Skipping reserved tag {} ({} bytes)",
                      static_cast<int>(tag), length);
            return;
    }

    LOG_DEBUG("Decoder", "Ignoring tag {} with unexpected length {}",
              static_cast<int>(tag), length);
}

}  // namespace

std::optional<PacketHeader> parseHeader(const uint8_t* data, size_t length) {
    if (data == nullptr || length < HEADER_SIZE) {
        return std::nullopt;
    }

    PacketHeader header;
    header.version = data[0];
    header.command = data[1];
    header.payload_length = readU16(data + 2);
    return header;
}

std::optional<DeviceRecord> decode(const uint8_t* data, size_t length) {
    auto header = parseHeader(data, length);
    if (!header) {
        return std::nullopt;
    }

    DeviceRecord record;
    record.signature_version = std::to_string(header->version);

    const size_t available = length - HEADER_SIZE;
    const size_t payloadLength = std::min<size_t>(header->payload_length, available);
    const uint8_t* cursor = data + HEADER_SIZE;
    const uint8_t* end = cursor + payloadLength;

    while (cursor < end) {
        const size_t remaining = static_cast<size_t>(end - cursor);
        if (remaining < TLV_HEADER_SIZE) {
            LOG_DEBUG("Decoder", "Truncated TLV header ({} bytes left)", remaining);
            break;
        }

        const uint8_t tag = cursor[0];
        const size_t valueLength = readU16(cursor + 1);
        if (valueLength > remaining - TLV_HEADER_SIZE) {
            LOG_DEBUG("Decoder", "TLV {} claims {} bytes, only {} left",
                      static_cast<int>(tag), valueLength, remaining - TLV_HEADER_SIZE);
            break;
        }

        applyTlv(tag, cursor + TLV_HEADER_SIZE, valueLength, record);
        cursor += TLV_HEADER_SIZE + valueLength;
    }

    return record;
}

std::optional<DeviceRecord> decode(const std::vector<uint8_t>& datagram) {
    if (datagram.empty()) {
        return std::nullopt;
    }
    return decode(datagram.data(), datagram.size());
}

}  // namespace core
}  // namespace ubnt
