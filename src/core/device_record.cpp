/**
 * @file device_record.cpp
 * @brief DeviceRecord merge and JSON rendering.
 *
 * @copyright Copyright (c) 2024 UBNT Discovery Contributors
 * @license MIT License
 */

#include "ubnt/core/device_record.hpp"

namespace ubnt {
namespace core {

namespace {

template<typename T>
void takeIfSet(std::optional<T>& target, const std::optional<T>& source) {
    if (source) {
        target = source;
    }
}

template<typename T>
nlohmann::json optionalToJson(const std::optional<T>& value) {
    if (!value) {
        return nullptr;
    }
    return nlohmann::json(*value);
}

}  // namespace

void DeviceRecord::mergeFrom(const DeviceRecord& newer) {
    takeIfSet(hw_addr, newer.hw_addr);
    takeIfSet(ip_info, newer.ip_info);
    takeIfSet(addr_entry, newer.addr_entry);
    takeIfSet(fw_version, newer.fw_version);
    takeIfSet(mac_address, newer.mac_address);
    takeIfSet(uptime, newer.uptime);
    takeIfSet(hostname, newer.hostname);
    takeIfSet(platform, newer.platform);
    takeIfSet(model, newer.model);
    takeIfSet(signature_version, newer.signature_version);
    takeIfSet(direct_connect_domain, newer.direct_connect_domain);
    takeIfSet(is_sso_enabled, newer.is_sso_enabled);
    takeIfSet(is_single_user, newer.is_single_user);

    for (const auto& [service, present] : newer.services) {
        services[service] = present;
    }
}

bool DeviceRecord::operator==(const DeviceRecord& other) const {
    return source_ip == other.source_ip &&
           hw_addr == other.hw_addr &&
           ip_info == other.ip_info &&
           addr_entry == other.addr_entry &&
           fw_version == other.fw_version &&
           mac_address == other.mac_address &&
           uptime == other.uptime &&
           hostname == other.hostname &&
           platform == other.platform &&
           model == other.model &&
           signature_version == other.signature_version &&
           services == other.services &&
           direct_connect_domain == other.direct_connect_domain &&
           is_sso_enabled == other.is_sso_enabled &&
           is_single_user == other.is_single_user;
}

nlohmann::json toJson(const DeviceRecord& record) {
    nlohmann::json services = nlohmann::json::object();
    for (const auto& [service, present] : record.services) {
        services[serviceToString(service)] = present;
    }

    return nlohmann::json{
        {"source_ip", record.source_ip},
        {"hw_addr", optionalToJson(record.hw_addr)},
        {"ip_info", optionalToJson(record.ip_info)},
        {"addr_entry", optionalToJson(record.addr_entry)},
        {"fw_version", optionalToJson(record.fw_version)},
        {"mac_address", optionalToJson(record.mac_address)},
        {"uptime", optionalToJson(record.uptime)},
        {"hostname", optionalToJson(record.hostname)},
        {"platform", optionalToJson(record.platform)},
        {"model", optionalToJson(record.model)},
        {"signature_version", optionalToJson(record.signature_version)},
        {"services", services},
        {"direct_connect_domain", optionalToJson(record.direct_connect_domain)},
        {"is_sso_enabled", optionalToJson(record.is_sso_enabled)},
        {"is_single_user", optionalToJson(record.is_single_user)},
    };
}

}  // namespace core
}  // namespace ubnt
