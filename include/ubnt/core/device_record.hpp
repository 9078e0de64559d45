/**
 * @file device_record.hpp
 * @brief One discovered device, merged from UDP and HTTP sources.
 *
 * @copyright Copyright (c) 2024 UBNT Discovery Contributors
 * @license MIT License
 */

#pragma once

#include "ubnt/core/export.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace ubnt {
namespace core {

/**
 * @enum Service
 * @brief Management services detected by the HTTP prober.
 */
enum class Service {
    PROTECT
};

inline const char* serviceToString(Service service) {
    switch (service) {
        case Service::PROTECT: return "Protect";
        default: return "unknown";
    }
}

/**
 * @struct DeviceRecord
 * @brief Facts known about one discovery source.
 *
 * Identity is `source_ip`. Every other field is optional: a device shows
 * up with whatever subset of facts could be determined.
 */
struct UBNT_CORE_API DeviceRecord {
    std::string source_ip;                             ///< Sender of the datagram
    std::optional<std::string> hw_addr;                ///< TLV 0x01, or API "mac"
    std::optional<std::vector<std::string>> ip_info;   ///< TLV 0x02 "mac;ip"
    std::optional<std::string> addr_entry;             ///< TLV 0x04
    std::optional<std::string> fw_version;             ///< TLV 0x03
    std::optional<std::string> mac_address;            ///< TLV 0x05
    std::optional<uint32_t> uptime;                    ///< TLV 0x0a, seconds
    std::optional<std::string> hostname;               ///< TLV 0x0b, or API "name"
    std::optional<std::string> platform;               ///< TLV 0x0c, or API hardware.shortname
    std::optional<std::string> model;                  ///< TLV 0x14
    std::optional<std::string> signature_version;      ///< Header version byte
    std::map<Service, bool> services;
    std::optional<std::string> direct_connect_domain;
    std::optional<bool> is_sso_enabled;
    std::optional<bool> is_single_user;

    DeviceRecord() = default;
    explicit DeviceRecord(std::string ip) : source_ip(std::move(ip)) {}

    /**
     * @brief Merge a newer decode of the same source into this record.
     *
     * Non-null fields of @p newer overwrite; null fields leave the current
     * value in place. `ip_info` is replaced as a whole, never appended.
     */
    void mergeFrom(const DeviceRecord& newer);

    bool operator==(const DeviceRecord& other) const;
    bool operator!=(const DeviceRecord& other) const { return !(*this == other); }
};

/**
 * @brief JSON view of a record; absent fields are rendered as null.
 */
UBNT_CORE_API nlohmann::json toJson(const DeviceRecord& record);

}  // namespace core
}  // namespace ubnt
