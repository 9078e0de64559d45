/**
 * @file config.hpp
 * @brief ubnt-discover configuration and CLI parsing
 */

#pragma once

#include <cstdint>
#include <cstring>
#include <iostream>
#include <stdexcept>
#include <string>

namespace ubnt {
namespace app {

/**
 * @brief Command line configuration
 */
struct Config {
    int64_t timeout_ms = 5000;                       ///< UDP collection window
    std::string address;                             ///< Target address, empty = broadcast sweep
    uint16_t port = 10001;                           ///< Discovery port
    std::string broadcast_addr = "255.255.255.255";
    int64_t http_timeout_ms = 10000;                 ///< Total timeout per HTTP request
    std::string check_alive;                         ///< Run a liveness check on this address
    bool json = false;
    std::string log_level = "INFO";
    bool help = false;
    bool invalid = false;                            ///< Parsing failed; usage should be shown
};

/**
 * @brief Print usage information
 * @param program_name Name of the executable
 */
inline void printUsage(const char* program_name, std::ostream& out = std::cout) {
    out << "ubnt-discover - find UBNT devices on the local network\n\n"
        << "Usage: " << program_name << " [OPTIONS]\n\n"
        << "Options:\n"
        << "  --timeout <ms>        Discovery collection window (default: 5000)\n"
        << "  --address <ip>        Query a single device instead of broadcasting\n"
        << "  --port <port>         Discovery port (default: 10001)\n"
        << "  --broadcast <ip>      Broadcast address for sweeps (default: 255.255.255.255)\n"
        << "  --http-timeout <ms>   Per-request HTTP timeout (default: 10000)\n"
        << "  --check-alive <ip>    Only check whether the device's API answers\n"
        << "  --json                Print devices as JSON\n"
        << "  --log-level <level>   TRACE, DEBUG, INFO, WARN, ERROR, FATAL, OFF (default: INFO)\n"
        << "  --help, -h            Show this help message\n\n"
        << "Exit status: 0 on success, 1 on error, 2 if --check-alive finds the host unreachable.\n\n"
        << "Example:\n"
        << "  " << program_name << " --timeout 3000\n"
        << "  " << program_name << " --address 192.168.1.1 --json\n"
        << "  " << program_name << " --check-alive 192.168.1.1\n";
}

/**
 * @brief Parse command line arguments
 * @param argc Argument count
 * @param argv Argument values
 * @return Parsed configuration. On error `help` and `invalid` are set.
 */
inline Config parseArgs(int argc, char* argv[]) {
    Config config;

    auto fail = [&config](const std::string& message) {
        std::cerr << "Error: " << message << "\n";
        config.help = true;
        config.invalid = true;
        return config;
    };

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
            config.help = true;
            return config;
        }

        if (std::strcmp(arg, "--json") == 0) {
            config.json = true;
            continue;
        }

        // Options that require a value
        if (i + 1 >= argc) {
            return fail(std::string("Option ") + arg + " requires a value");
        }

        const char* value = argv[++i];

        try {
            if (std::strcmp(arg, "--timeout") == 0) {
                config.timeout_ms = std::stoll(value);
            } else if (std::strcmp(arg, "--address") == 0) {
                config.address = value;
            } else if (std::strcmp(arg, "--port") == 0) {
                int port = std::stoi(value);
                if (port < 0 || port > 65535) {
                    return fail(std::string("Port out of range: ") + value);
                }
                config.port = static_cast<uint16_t>(port);
            } else if (std::strcmp(arg, "--broadcast") == 0) {
                config.broadcast_addr = value;
            } else if (std::strcmp(arg, "--http-timeout") == 0) {
                int64_t httpTimeout = std::stoll(value);
                if (httpTimeout <= 0) {
                    return fail(std::string("HTTP timeout must be positive: ") + value);
                }
                config.http_timeout_ms = httpTimeout;
            } else if (std::strcmp(arg, "--check-alive") == 0) {
                config.check_alive = value;
            } else if (std::strcmp(arg, "--log-level") == 0) {
                config.log_level = value;
            } else {
                return fail(std::string("Unknown option ") + arg);
            }
        } catch (const std::logic_error&) {
            return fail(std::string("Invalid value for ") + arg + ": " + value);
        }
    }

    return config;
}

} // namespace app
} // namespace ubnt
