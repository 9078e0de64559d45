/**
 * @file scan_orchestrator.hpp
 * @brief Runs one discovery scan end to end.
 *
 * A scan moves through IDLE -> SENDING -> COLLECTING -> PROBING -> DONE:
 *   - SENDING: the discovery request goes to one address or the broadcast
 *     address.
 *   - COLLECTING: replies are decoded and merged until the timeout, or
 *     until the target answered in an address-targeted scan.
 *   - PROBING: every source address is probed over HTTP in one batch and
 *     the results are merged into the matching records.
 *
 * @copyright Copyright (c) 2024 UBNT Discovery Contributors
 * @license MIT License
 */

#pragma once

#include "ubnt/core/device_record.hpp"
#include "ubnt/core/export.hpp"
#include "ubnt/core/http_prober.hpp"
#include "ubnt/core/tlv_decoder.hpp"
#include "ubnt/net/socket_factory.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace ubnt {
namespace core {

/**
 * @struct ScanConfig
 * @brief Immutable settings for a ScanOrchestrator.
 */
struct UBNT_CORE_API ScanConfig {
    uint16_t discovery_port = net::DISCOVERY_PORT;
    std::string broadcast_address = "255.255.255.255";
    std::vector<uint8_t> request_payload{REQUEST_PAYLOAD.begin(), REQUEST_PAYLOAD.end()};
    size_t queue_limit = 256;
    std::chrono::milliseconds poll_interval{100};

    /// Probe the target of an address-targeted scan even if it never answered UDP.
    bool probe_silent_target = true;
};

/**
 * @enum ScanState
 * @brief Phase of the current (or last) scan.
 */
enum class ScanState {
    IDLE,
    SENDING,
    COLLECTING,
    PROBING,
    DONE
};

inline const char* scanStateToString(ScanState state) {
    switch (state) {
        case ScanState::IDLE: return "IDLE";
        case ScanState::SENDING: return "SENDING";
        case ScanState::COLLECTING: return "COLLECTING";
        case ScanState::PROBING: return "PROBING";
        case ScanState::DONE: return "DONE";
        default: return "UNKNOWN";
    }
}

/**
 * @class ScanOrchestrator
 * @brief Combines UDP discovery with HTTP enrichment.
 *
 * Usage:
 * @code
 * auto prober = std::make_shared<HttpProber>(std::make_shared<net::CurlHttpClient>());
 * ScanOrchestrator scanner(ScanConfig(), prober);
 * for (const auto& device : scanner.scan(std::chrono::seconds(5))) {
 *     std::cout << device.source_ip << "\n";
 * }
 * @endcode
 *
 * One scan at a time per instance.
 */
class UBNT_CORE_API ScanOrchestrator {
public:
    ScanOrchestrator(ScanConfig config, std::shared_ptr<HttpProber> prober);

    ScanOrchestrator(const ScanOrchestrator&) = delete;
    ScanOrchestrator& operator=(const ScanOrchestrator&) = delete;

    /**
     * @brief Discover devices.
     *
     * @param timeout Collection window.
     * @param address Target address, or empty for a broadcast sweep.
     * @return Devices in the order they were first seen.
     * @throws std::invalid_argument if @p timeout is negative.
     * @throws net::SocketError if the scan socket cannot be set up.
     *
     * If the scan fails after it started, state() returns to IDLE before
     * the exception propagates.
     */
    std::vector<DeviceRecord> scan(std::chrono::milliseconds timeout,
                                   const std::string& address = "");

    ScanState state() const { return state_.load(); }

    const ScanConfig& config() const { return config_; }

private:
    void setState(ScanState state);
    std::vector<DeviceRecord> runScan(std::chrono::milliseconds timeout,
                                      const std::string& address);

    ScanConfig config_;
    std::shared_ptr<HttpProber> prober_;
    std::atomic<ScanState> state_{ScanState::IDLE};
};

}  // namespace core
}  // namespace ubnt
