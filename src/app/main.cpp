/**
 * @file main.cpp
 * @brief ubnt-discover entry point
 *
 * Thin executable wiring the library components together:
 * - ScanOrchestrator for UDP discovery plus HTTP enrichment
 * - LivenessChecker for --check-alive
 */

#include <ubnt/app/config.hpp>
#include <ubnt/core/device_record.hpp>
#include <ubnt/core/http_prober.hpp>
#include <ubnt/core/liveness_checker.hpp>
#include <ubnt/core/scan_orchestrator.hpp>
#include <ubnt/net/http_client.hpp>
#include <ubnt/net/platform.hpp>
#include <ubnt/utils/logger.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace ubnt;
using namespace ubnt::app;

namespace {

constexpr int EXIT_OK = 0;
constexpr int EXIT_FATAL = 1;
constexpr int EXIT_NOT_ALIVE = 2;

std::string orDash(const std::optional<std::string>& value) {
    return value ? *value : "-";
}

std::string servicesColumn(const core::DeviceRecord& record) {
    std::string text;
    for (const auto& [service, present] : record.services) {
        if (!present) {
            continue;
        }
        if (!text.empty()) {
            text += ",";
        }
        text += core::serviceToString(service);
    }
    return text.empty() ? "-" : text;
}

void printTable(const std::vector<core::DeviceRecord>& devices) {
    std::cout << std::left
              << std::setw(16) << "ADDRESS"
              << std::setw(19) << "HW ADDRESS"
              << std::setw(12) << "PLATFORM"
              << std::setw(24) << "HOSTNAME"
              << std::setw(20) << "FIRMWARE"
              << "SERVICES\n";

    for (const auto& device : devices) {
        std::cout << std::setw(16) << device.source_ip
                  << std::setw(19) << orDash(device.hw_addr)
                  << std::setw(12) << orDash(device.platform)
                  << std::setw(24) << orDash(device.hostname)
                  << std::setw(20) << orDash(device.fw_version)
                  << servicesColumn(device) << "\n";
    }
}

void printJson(const std::vector<core::DeviceRecord>& devices) {
    nlohmann::json array = nlohmann::json::array();
    for (const auto& device : devices) {
        array.push_back(core::toJson(device));
    }
    std::cout << array.dump(2) << "\n";
}

}  // namespace

int main(int argc, char* argv[]) {
    Config config = parseArgs(argc, argv);

    if (config.help) {
        printUsage(argv[0], config.invalid ? std::cerr : std::cout);
        return config.invalid ? EXIT_FATAL : EXIT_OK;
    }

    utils::Logger::instance().setLevel(utils::parseLogLevel(config.log_level));

    try {
        net::SocketInitializer socketInit;

        core::ProbeConfig probeConfig;
        probeConfig.total_timeout = std::chrono::milliseconds(config.http_timeout_ms);
        if (probeConfig.connect_timeout > probeConfig.total_timeout) {
            probeConfig.connect_timeout = probeConfig.total_timeout;
        }

        auto prober = std::make_shared<core::HttpProber>(
            std::make_shared<net::CurlHttpClient>(), probeConfig);

        if (!config.check_alive.empty()) {
            core::LivenessChecker checker(prober);
            bool alive = checker.isAlive(config.check_alive);
            std::cout << config.check_alive << (alive ? " is alive\n" : " is not reachable\n");
            return alive ? EXIT_OK : EXIT_NOT_ALIVE;
        }

        core::ScanConfig scanConfig;
        scanConfig.discovery_port = config.port;
        scanConfig.broadcast_address = config.broadcast_addr;

        core::ScanOrchestrator scanner(scanConfig, prober);

        LOG_INFO("Main", "Scanning {} for {} ms",
                 config.address.empty() ? scanConfig.broadcast_address : config.address,
                 config.timeout_ms);

        auto devices = scanner.scan(std::chrono::milliseconds(config.timeout_ms), config.address);

        if (config.json) {
            printJson(devices);
        } else {
            printTable(devices);
        }
        return EXIT_OK;

    } catch (const std::exception& e) {
        LOG_ERROR("Main", "Fatal error: {}", e.what());
        return EXIT_FATAL;
    }
}
