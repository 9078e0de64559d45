/**
 * @file http_client.hpp
 * @brief HTTP client seam used by the device probers.
 *
 * Requests are submitted as a batch and run concurrently; every request
 * yields exactly one HttpResponse, in the same order, whether or not the
 * transfer succeeded. Transport failures are reported in the response
 * rather than thrown.
 *
 * @copyright Copyright (c) 2024 UBNT Discovery Contributors
 * @license MIT License
 */

#pragma once

#include "ubnt/net/export.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace ubnt {
namespace net {

/**
 * @enum TransportError
 * @brief Why a request did not produce an HTTP response.
 */
enum class TransportError {
    NONE,            ///< An HTTP response was received
    CONNECT_FAILED,  ///< Refused, unreachable, or name resolution failed
    TIMEOUT,         ///< Connect or total timeout elapsed
    OTHER            ///< TLS, protocol, or client setup failure
};

inline const char* transportErrorToString(TransportError error) {
    switch (error) {
        case TransportError::NONE: return "none";
        case TransportError::CONNECT_FAILED: return "connect failed";
        case TransportError::TIMEOUT: return "timeout";
        case TransportError::OTHER: return "other";
        default: return "unknown";
    }
}

/**
 * @struct HttpRequest
 * @brief A single GET request.
 */
struct UBNT_NET_API HttpRequest {
    std::string url;
    std::chrono::milliseconds connect_timeout{5000};
    std::chrono::milliseconds total_timeout{10000};
    bool verify_tls = false;  ///< Devices present self-signed certificates
};

/**
 * @struct HttpResponse
 * @brief Outcome of one request.
 */
struct UBNT_NET_API HttpResponse {
    TransportError error = TransportError::OTHER;
    long status = 0;              ///< HTTP status, 0 when no response
    std::string content_type;     ///< Content-Type header value, may be empty
    std::string body;
    std::string error_message;

    bool received() const { return error == TransportError::NONE; }
};

/**
 * @class HttpClient
 * @brief Abstract HTTP transport.
 */
class UBNT_NET_API HttpClient {
public:
    virtual ~HttpClient() = default;

    /**
     * @brief Run all requests concurrently and wait for every one to finish.
     * @return One response per request, in request order.
     */
    virtual std::vector<HttpResponse> performAll(const std::vector<HttpRequest>& requests) = 0;

    /**
     * @brief Convenience wrapper for a single request.
     */
    HttpResponse perform(const HttpRequest& request);
};

/**
 * @class CurlHttpClient
 * @brief libcurl implementation driving all transfers from one multi handle.
 *
 * The calling thread runs the event loop; no worker threads are spawned.
 */
class UBNT_NET_API CurlHttpClient : public HttpClient {
public:
    CurlHttpClient();
    ~CurlHttpClient() override;

    CurlHttpClient(const CurlHttpClient&) = delete;
    CurlHttpClient& operator=(const CurlHttpClient&) = delete;

    std::vector<HttpResponse> performAll(const std::vector<HttpRequest>& requests) override;

    bool isInitialized() const { return initialized_; }

private:
    bool initialized_;
};

}  // namespace net
}  // namespace ubnt
