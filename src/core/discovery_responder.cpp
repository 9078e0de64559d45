/**
 * @file discovery_responder.cpp
 * @brief DiscoveryResponder implementation.
 *
 * @copyright Copyright (c) 2024 UBNT Discovery Contributors
 * @license MIT License
 */

#include "ubnt/core/discovery_responder.hpp"
#include "ubnt/core/tlv_decoder.hpp"
#include "ubnt/utils/logger.hpp"

namespace ubnt {
namespace core {

DiscoveryResponder::DiscoveryResponder(size_t queueLimit,
                                       std::chrono::milliseconds pollInterval)
    : pollInterval_(pollInterval)
    , queue_(queueLimit)
{}

DiscoveryResponder::~DiscoveryResponder() {
    stop();
}

bool DiscoveryResponder::start(net::UdpSocket& socket) {
    if (running_.load()) {
        LOG_WARN("Responder", "Already running");
        return false;
    }

    if (!socket.isValid()) {
        LOG_ERROR("Responder", "Socket not valid");
        return false;
    }

    running_.store(true);
    receiverThread_ = std::thread(&DiscoveryResponder::receiverLoop, this, &socket);

    LOG_DEBUG("Responder", "Listening on port {}", socket.getLocalPort());
    return true;
}

void DiscoveryResponder::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    if (receiverThread_.joinable()) {
        receiverThread_.join();
    }

    const QueueStats stats = queue_.getStats();
    if (stats.dropped > 0) {
        LOG_WARN("Responder", "Dropped {} datagrams (queue limit {})",
                 stats.dropped, stats.limit);
    }
    LOG_DEBUG("Responder", "Stopped after {} datagrams", stats.total_enqueued);
}

bool DiscoveryResponder::submit(Datagram datagram) {
    PushResult result = queue_.push(std::move(datagram));
    if (result == PushResult::DROPPED_NEWEST) {
        LOG_TRACE("Responder", "Queue full, datagram dropped");
        return false;
    }
    return result != PushResult::CLOSED;
}

void DiscoveryResponder::receiverLoop(net::UdpSocket* socket) {
    LOG_DEBUG("Responder", "Receiver thread started");

    std::vector<uint8_t> buffer(MAX_DATAGRAM_SIZE);
    const int timeoutMs = static_cast<int>(pollInterval_.count());

    while (running_.load()) {
        net::SocketAddress sender;
        int received = socket->receiveFrom(buffer.data(), buffer.size(), timeoutMs, sender);

        if (received > 0) {
            Datagram datagram;
            datagram.payload.assign(buffer.begin(), buffer.begin() + received);
            datagram.source_ip = sender.ip;
            datagram.source_port = sender.port;
            submit(std::move(datagram));
        } else if (received < 0 && running_.load()) {
            LOG_ERROR("Responder", "Receive error: {}", socket->getLastError());
        }
    }

    LOG_DEBUG("Responder", "Receiver thread stopped");
}

size_t DiscoveryResponder::drainFor(std::chrono::milliseconds maxWait) {
    auto first = queue_.popFor(maxWait);
    if (!first) {
        return 0;
    }
    process(*first);
    return 1 + drainPending();
}

size_t DiscoveryResponder::drainPending() {
    size_t processed = 0;
    while (auto datagram = queue_.tryPop()) {
        process(*datagram);
        ++processed;
    }
    return processed;
}

void DiscoveryResponder::process(const Datagram& datagram) {
    if (datagram.payload.empty()) {
        return;
    }

    auto decoded = decode(datagram.payload);
    if (!decoded) {
        LOG_DEBUG("Responder", "Undecodable {}-byte datagram from {}",
                  datagram.payload.size(), datagram.source_ip);
        return;
    }
    decoded->source_ip = datagram.source_ip;

    auto it = index_.find(datagram.source_ip);
    if (it != index_.end()) {
        records_[it->second].mergeFrom(*decoded);
        LOG_TRACE("Responder", "Updated record for {}", datagram.source_ip);
        return;
    }

    index_.emplace(datagram.source_ip, records_.size());
    records_.push_back(std::move(*decoded));
    LOG_DEBUG("Responder", "New device at {}", datagram.source_ip);
}

bool DiscoveryResponder::hasRecord(const std::string& ip) const {
    return index_.count(ip) > 0;
}

const DeviceRecord* DiscoveryResponder::find(const std::string& ip) const {
    auto it = index_.find(ip);
    if (it == index_.end()) {
        return nullptr;
    }
    return &records_[it->second];
}

std::vector<DeviceRecord> DiscoveryResponder::snapshot() const {
    return records_;
}

std::vector<DeviceRecord> DiscoveryResponder::takeRecords() {
    std::vector<DeviceRecord> result = std::move(records_);
    records_.clear();
    index_.clear();
    return result;
}

}  // namespace core
}  // namespace ubnt
