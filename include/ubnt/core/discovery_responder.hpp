/**
 * @file discovery_responder.hpp
 * @brief Collects discovery replies and merges them into device records.
 *
 * A receiver thread reads datagrams off the scan socket and pushes them
 * into a bounded queue. The scan thread drains that queue, decodes each
 * datagram and merges the result into the record set, so the records have
 * exactly one writer.
 *
 * @copyright Copyright (c) 2024 UBNT Discovery Contributors
 * @license MIT License
 */

#pragma once

#include "ubnt/core/bounded_queue.hpp"
#include "ubnt/core/device_record.hpp"
#include "ubnt/core/export.hpp"
#include "ubnt/net/udp_socket.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace ubnt {
namespace core {

/**
 * @struct Datagram
 * @brief One received UDP datagram.
 */
struct UBNT_CORE_API Datagram {
    std::vector<uint8_t> payload;
    std::string source_ip;
    uint16_t source_port = 0;
};

/**
 * @class DiscoveryResponder
 * @brief Receive side of a discovery scan.
 *
 * Only start(), stop() and submit() may be called from threads other than
 * the consumer. Everything that reads or drains records belongs to the
 * consumer thread.
 */
class UBNT_CORE_API DiscoveryResponder {
public:
    static constexpr size_t MAX_DATAGRAM_SIZE = 65535;

    /**
     * @param queueLimit Maximum datagrams held between receiver and consumer.
     * @param pollInterval Receive timeout of the receiver thread; bounds how
     *        long stop() waits for it.
     */
    explicit DiscoveryResponder(size_t queueLimit = 256,
                                std::chrono::milliseconds pollInterval = std::chrono::milliseconds(100));
    ~DiscoveryResponder();

    DiscoveryResponder(const DiscoveryResponder&) = delete;
    DiscoveryResponder& operator=(const DiscoveryResponder&) = delete;

    /**
     * @brief Start the receiver thread on @p socket.
     *
     * The socket must outlive the responder or a call to stop().
     *
     * @return False if already running or the socket is invalid.
     */
    bool start(net::UdpSocket& socket);

    /**
     * @brief Stop and join the receiver thread. Queued datagrams are kept.
     */
    void stop();

    bool isRunning() const { return running_.load(); }

    /**
     * @brief Queue a datagram for the consumer.
     * @return False if the queue is full or closed and the datagram was dropped.
     */
    bool submit(Datagram datagram);

    /**
     * @brief Wait up to @p maxWait for a datagram, then process everything queued.
     * @return Number of datagrams processed.
     */
    size_t drainFor(std::chrono::milliseconds maxWait);

    /**
     * @brief Process all queued datagrams without waiting.
     * @return Number of datagrams processed.
     */
    size_t drainPending();

    bool hasRecord(const std::string& ip) const;

    /**
     * @brief Record for @p ip, or nullptr. Invalidated by the next drain.
     */
    const DeviceRecord* find(const std::string& ip) const;

    /**
     * @brief Copy of the current records in first-observed order.
     */
    std::vector<DeviceRecord> snapshot() const;

    /**
     * @brief Move the records out, leaving the responder empty.
     */
    std::vector<DeviceRecord> takeRecords();

    size_t recordCount() const { return records_.size(); }

    QueueStats queueStats() const { return queue_.getStats(); }

private:
    void receiverLoop(net::UdpSocket* socket);
    void process(const Datagram& datagram);

    std::chrono::milliseconds pollInterval_;
    BoundedQueue<Datagram> queue_;

    std::atomic<bool> running_{false};
    std::thread receiverThread_;

    // Consumer-owned
    std::vector<DeviceRecord> records_;
    std::unordered_map<std::string, size_t> index_;
};

}  // namespace core
}  // namespace ubnt
