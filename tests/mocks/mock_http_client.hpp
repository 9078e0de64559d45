/**
 * @file mock_http_client.hpp
 * @brief GMock HttpClient plus helpers for canned responses.
 */

#pragma once

#include <gmock/gmock.h>
#include <ubnt/net/http_client.hpp>

#include <map>
#include <string>
#include <vector>

namespace ubnt {
namespace mocks {

class MockHttpClient : public net::HttpClient {
public:
    MOCK_METHOD(std::vector<net::HttpResponse>, performAll,
                (const std::vector<net::HttpRequest>& requests), (override));
};

inline net::HttpResponse statusResponse(long status) {
    net::HttpResponse response;
    response.error = net::TransportError::NONE;
    response.status = status;
    return response;
}

inline net::HttpResponse jsonResponse(const std::string& body, long status = 200) {
    net::HttpResponse response = statusResponse(status);
    response.content_type = "application/json; charset=utf-8";
    response.body = body;
    return response;
}

inline net::HttpResponse htmlResponse(const std::string& body, long status = 200) {
    net::HttpResponse response = statusResponse(status);
    response.content_type = "text/html";
    response.body = body;
    return response;
}

inline net::HttpResponse transportFailure(net::TransportError error) {
    net::HttpResponse response;
    response.error = error;
    response.error_message = net::transportErrorToString(error);
    return response;
}

/**
 * @brief Answers each request from a URL table; unknown URLs fail to connect.
 *
 * Usage:
 * @code
 * EXPECT_CALL(*client, performAll(_)).WillRepeatedly(::testing::Invoke(RespondByUrl(routes)));
 * @endcode
 */
class RespondByUrl {
public:
    explicit RespondByUrl(std::map<std::string, net::HttpResponse> routes)
        : routes_(std::move(routes))
    {}

    std::vector<net::HttpResponse> operator()(const std::vector<net::HttpRequest>& requests) const {
        std::vector<net::HttpResponse> responses;
        responses.reserve(requests.size());
        for (const auto& request : requests) {
            auto it = routes_.find(request.url);
            responses.push_back(it != routes_.end()
                ? it->second
                : transportFailure(net::TransportError::CONNECT_FAILED));
        }
        return responses;
    }

private:
    std::map<std::string, net::HttpResponse> routes_;
};

}  // namespace mocks
}  // namespace ubnt
