/**
 * @file scan_orchestrator.cpp
 * @brief ScanOrchestrator implementation.
 *
 * @copyright Copyright (c) 2024 UBNT Discovery Contributors
 * @license MIT License
 */

#include "ubnt/core/scan_orchestrator.hpp"
#include "ubnt/core/discovery_responder.hpp"
#include "ubnt/utils/logger.hpp"

#include <algorithm>
#include <stdexcept>

namespace ubnt {
namespace core {

ScanOrchestrator::ScanOrchestrator(ScanConfig config, std::shared_ptr<HttpProber> prober)
    : config_(std::move(config))
    , prober_(std::move(prober))
{
    if (!prober_) {
        throw std::invalid_argument("ScanOrchestrator requires a prober");
    }
}

void ScanOrchestrator::setState(ScanState state) {
    state_.store(state);
    LOG_TRACE("Scanner", "State -> {}", scanStateToString(state));
}

std::vector<DeviceRecord> ScanOrchestrator::scan(std::chrono::milliseconds timeout,
                                                 const std::string& address) {
    if (timeout.count() < 0) {
        throw std::invalid_argument("scan timeout must not be negative");
    }

    try {
        return runScan(timeout, address);
    } catch (const std::exception& e) {
        LOG_ERROR("Scanner", "Scan failed in state {}: {}",
                  scanStateToString(state_.load()), e.what());
        setState(ScanState::IDLE);
        throw;
    }
}

std::vector<DeviceRecord> ScanOrchestrator::runScan(std::chrono::milliseconds timeout,
                                                    const std::string& address) {
    const bool targeted = !address.empty();

    // Declared before the responder so the receiver thread is joined first.
    net::UdpSocket socket = net::createSocket(config_.discovery_port);
    setState(ScanState::SENDING);

    DiscoveryResponder responder(config_.queue_limit, config_.poll_interval);
    if (!responder.start(socket)) {
        throw net::SocketError("Failed to start discovery receiver", socket.getLastError());
    }

    net::SocketAddress destination(targeted ? address : config_.broadcast_address,
                                   config_.discovery_port);
    int sent = socket.sendTo(destination, config_.request_payload.data(),
                             config_.request_payload.size());
    if (sent < 0) {
        LOG_ERROR("Scanner", "Failed to send discovery request to {}: {}",
                  destination.toString(), socket.getLastError());
    } else {
        LOG_DEBUG("Scanner", "Sent discovery request to {} from port {}",
                  destination.toString(), socket.getLocalPort());
    }

    setState(ScanState::COLLECTING);
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        if (targeted && responder.hasRecord(address)) {
            LOG_DEBUG("Scanner", "Target {} answered, ending collection early", address);
            break;
        }

        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            break;
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        responder.drainFor(std::min(remaining, config_.poll_interval));
    }

    responder.stop();
    responder.drainPending();
    socket.close();

    std::vector<DeviceRecord> records = responder.takeRecords();
    LOG_INFO("Scanner", "Collected {} device(s)", records.size());

    setState(ScanState::PROBING);

    std::vector<std::string> addresses;
    addresses.reserve(records.size() + 1);
    for (const auto& record : records) {
        addresses.push_back(record.source_ip);
    }

    const bool targetAnswered = std::any_of(records.begin(), records.end(),
        [&address](const DeviceRecord& record) { return record.source_ip == address; });
    const bool probeSilentTarget =
        targeted && config_.probe_silent_target && !targetAnswered;
    if (probeSilentTarget) {
        LOG_DEBUG("Scanner", "No UDP answer from {}, probing HTTP only", address);
        addresses.push_back(address);
    }

    std::vector<ProbeResult> results = prober_->probeAll(addresses);

    for (size_t i = 0; i < records.size() && i < results.size(); ++i) {
        applyProbeResult(records[i], results[i]);
    }

    if (probeSilentTarget && !results.empty() && results.back().system.succeeded()) {
        DeviceRecord record(address);
        applyProbeResult(record, results.back());
        records.push_back(std::move(record));
        LOG_INFO("Scanner", "Found {} through its management API", address);
    }

    setState(ScanState::DONE);
    return records;
}

}  // namespace core
}  // namespace ubnt
