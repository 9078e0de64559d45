/**
 * @file http_prober.hpp
 * @brief Probes a device's HTTPS management API.
 *
 * Two independent requests per address:
 *   - the service-presence endpoint, where "401 Unauthorized" means the
 *     service is installed;
 *   - the system-info endpoint, a JSON document with platform, name and
 *     MAC of the console.
 *
 * Every outcome is returned as a value. Nothing here throws for network
 * or payload failures.
 *
 * @copyright Copyright (c) 2024 UBNT Discovery Contributors
 * @license MIT License
 */

#pragma once

#include "ubnt/core/device_record.hpp"
#include "ubnt/core/export.hpp"
#include "ubnt/net/http_client.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ubnt {
namespace core {

/**
 * @struct ProbeConfig
 * @brief Endpoints and timeouts used by the prober.
 */
struct UBNT_CORE_API ProbeConfig {
    std::string scheme = "https";
    std::string service_path = "/proxy/protect/api";
    std::string system_info_path = "/api/system";
    std::chrono::milliseconds connect_timeout{5000};
    std::chrono::milliseconds total_timeout{10000};
};

/**
 * @enum ProbeOutcome
 * @brief Classification of a system-info fetch.
 */
enum class ProbeOutcome {
    SUCCESS,       ///< 2xx JSON object parsed
    UNREACHABLE,   ///< No HTTP response (connect error, timeout)
    UNAUTHORIZED,  ///< HTTP 401
    MALFORMED      ///< Other status, non-JSON content, or unparsable body
};

inline const char* probeOutcomeToString(ProbeOutcome outcome) {
    switch (outcome) {
        case ProbeOutcome::SUCCESS: return "SUCCESS";
        case ProbeOutcome::UNREACHABLE: return "UNREACHABLE";
        case ProbeOutcome::UNAUTHORIZED: return "UNAUTHORIZED";
        case ProbeOutcome::MALFORMED: return "MALFORMED";
        default: return "UNKNOWN";
    }
}

/**
 * @struct SystemInfo
 * @brief Fields extracted from a successful system-info document.
 *
 * Each field is set only when the document carried it with the expected type.
 */
struct UBNT_CORE_API SystemInfo {
    std::optional<std::string> platform;               ///< hardware.shortname
    std::optional<std::string> hostname;               ///< name, spaces -> '-'
    std::optional<std::string> hw_addr;                ///< mac, colon-hex
    std::optional<std::string> direct_connect_domain;
    std::optional<bool> is_sso_enabled;
    std::optional<bool> is_single_user;
};

struct UBNT_CORE_API SystemInfoResult {
    ProbeOutcome outcome = ProbeOutcome::UNREACHABLE;
    long http_status = 0;
    SystemInfo info;  ///< Meaningful only for SUCCESS

    bool succeeded() const { return outcome == ProbeOutcome::SUCCESS; }
};

/**
 * @struct ProbeResult
 * @brief Both probes for one address.
 */
struct UBNT_CORE_API ProbeResult {
    std::string address;
    std::optional<bool> protect;  ///< nullopt when the service could not be determined
    SystemInfoResult system;
};

/**
 * @class HttpProber
 * @brief Builds probe requests, runs them through an HttpClient and
 *        interprets the responses.
 */
class UBNT_CORE_API HttpProber {
public:
    /**
     * @throws std::invalid_argument if @p client is null or either timeout
     *         in @p config is not positive.
     */
    explicit HttpProber(std::shared_ptr<net::HttpClient> client,
                        ProbeConfig config = ProbeConfig());

    /**
     * @brief Run both probes against one address.
     */
    ProbeResult probe(const std::string& address);

    /**
     * @brief Run both probes against every address in one concurrent batch.
     * @return One result per address, in input order.
     */
    std::vector<ProbeResult> probeAll(const std::vector<std::string>& addresses);

    /**
     * @brief Fetch only the system-info document.
     */
    SystemInfoResult probeSystemInfo(const std::string& address);

    std::string serviceUrl(const std::string& address) const;
    std::string systemInfoUrl(const std::string& address) const;

    const ProbeConfig& config() const { return config_; }

    /**
     * @brief Map a service-presence response to the Protect flag.
     * @return true for 401, false for any other status, nullopt when no
     *         response was received.
     */
    static std::optional<bool> interpretServiceResponse(const net::HttpResponse& response);

    /**
     * @brief Classify a system-info response and extract its fields.
     */
    static SystemInfoResult interpretSystemInfo(const net::HttpResponse& response);

private:
    net::HttpRequest makeRequest(const std::string& url) const;

    std::shared_ptr<net::HttpClient> client_;
    ProbeConfig config_;
};

/**
 * @brief Merge a probe result into the record for the same address.
 *
 * System-info fields overwrite, except `hw_addr` which is only filled when
 * the record has none. `services[Protect]` is set when it was determined.
 */
UBNT_CORE_API void applyProbeResult(DeviceRecord& record, const ProbeResult& result);

}  // namespace core
}  // namespace ubnt
