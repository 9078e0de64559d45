/**
 * @file http_client.cpp
 * @brief libcurl multi-handle HTTP client.
 *
 * @copyright Copyright (c) 2024 UBNT Discovery Contributors
 * @license MIT License
 */

#include "ubnt/net/http_client.hpp"
#include "ubnt/utils/logger.hpp"

#include <curl/curl.h>

#include <cstdlib>
#include <memory>
#include <mutex>

namespace ubnt {
namespace net {

namespace {

bool ensureCurlGlobalInit() {
    static std::once_flag flag;
    static bool initialized = false;
    std::call_once(flag, []() {
        initialized = (curl_global_init(CURL_GLOBAL_DEFAULT) == 0);
        if (initialized) {
            std::atexit([]() { curl_global_cleanup(); });
        }
    });
    return initialized;
}

size_t appendBody(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    auto* buffer = static_cast<std::string*>(userdata);
    buffer->append(ptr, total);
    return total;
}

TransportError classify(CURLcode code) {
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT:
            return TransportError::TIMEOUT;
        case CURLE_COULDNT_CONNECT:
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_SEND_ERROR:
        case CURLE_RECV_ERROR:
        case CURLE_GOT_NOTHING:
            return TransportError::CONNECT_FAILED;
        default:
            return TransportError::OTHER;
    }
}

struct Transfer {
    size_t index = 0;
    CURL* handle = nullptr;
    std::string body;
    char errorBuffer[CURL_ERROR_SIZE];
};

// Owns the multi handle and every easy handle attached to it.
class MultiSession {
public:
    MultiSession() : multi_(curl_multi_init()) {}

    ~MultiSession() {
        for (auto& transfer : transfers_) {
            if (transfer->handle) {
                if (multi_) {
                    curl_multi_remove_handle(multi_, transfer->handle);
                }
                curl_easy_cleanup(transfer->handle);
            }
        }
        if (multi_) {
            curl_multi_cleanup(multi_);
        }
    }

    MultiSession(const MultiSession&) = delete;
    MultiSession& operator=(const MultiSession&) = delete;

    CURLM* get() const { return multi_; }

    Transfer* add(size_t index, const HttpRequest& request, HttpResponse& response) {
        auto transfer = std::make_unique<Transfer>();
        transfer->index = index;
        transfer->errorBuffer[0] = '\0';
        transfer->handle = curl_easy_init();
        if (!transfer->handle) {
            response.error = TransportError::OTHER;
            response.error_message = "curl_easy_init failed";
            return nullptr;
        }

        CURL* h = transfer->handle;
        curl_easy_setopt(h, CURLOPT_URL, request.url.c_str());
        curl_easy_setopt(h, CURLOPT_HTTPGET, 1L);
        curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(h, CURLOPT_MAXREDIRS, 3L);
        curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT_MS,
                         static_cast<long>(request.connect_timeout.count()));
        curl_easy_setopt(h, CURLOPT_TIMEOUT_MS,
                         static_cast<long>(request.total_timeout.count()));
        curl_easy_setopt(h, CURLOPT_SSL_VERIFYPEER, request.verify_tls ? 1L : 0L);
        curl_easy_setopt(h, CURLOPT_SSL_VERIFYHOST, request.verify_tls ? 2L : 0L);
        curl_easy_setopt(h, CURLOPT_ERRORBUFFER, transfer->errorBuffer);
        curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, appendBody);
        curl_easy_setopt(h, CURLOPT_WRITEDATA, &transfer->body);
        curl_easy_setopt(h, CURLOPT_PRIVATE, static_cast<void*>(transfer.get()));

        CURLMcode mc = curl_multi_add_handle(multi_, h);
        if (mc != CURLM_OK) {
            response.error = TransportError::OTHER;
            response.error_message = curl_multi_strerror(mc);
            curl_easy_cleanup(h);
            transfer->handle = nullptr;
            return nullptr;
        }

        transfers_.push_back(std::move(transfer));
        return transfers_.back().get();
    }

private:
    CURLM* multi_;
    std::vector<std::unique_ptr<Transfer>> transfers_;
};

void completeTransfer(Transfer& transfer, CURLcode result, HttpResponse& response) {
    if (result != CURLE_OK) {
        response.error = classify(result);
        response.error_message = transfer.errorBuffer[0] != '\0'
            ? std::string(transfer.errorBuffer)
            : std::string(curl_easy_strerror(result));
        return;
    }

    long status = 0;
    curl_easy_getinfo(transfer.handle, CURLINFO_RESPONSE_CODE, &status);
    char* contentType = nullptr;
    curl_easy_getinfo(transfer.handle, CURLINFO_CONTENT_TYPE, &contentType);

    response.error = TransportError::NONE;
    response.status = status;
    response.content_type = contentType ? contentType : "";
    response.body = std::move(transfer.body);
}

void collectFinished(CURLM* multi, std::vector<HttpResponse>& responses) {
    int queued = 0;
    while (CURLMsg* msg = curl_multi_info_read(multi, &queued)) {
        if (msg->msg != CURLMSG_DONE) {
            continue;
        }

        char* priv = nullptr;
        curl_easy_getinfo(msg->easy_handle, CURLINFO_PRIVATE, &priv);
        auto* transfer = reinterpret_cast<Transfer*>(priv);
        if (!transfer) {
            continue;
        }

        completeTransfer(*transfer, msg->data.result, responses[transfer->index]);
        LOG_TRACE("HttpClient", "Request #{} finished: status {} ({})",
                  transfer->index, responses[transfer->index].status,
                  transportErrorToString(responses[transfer->index].error));
    }
}

}  // namespace

HttpResponse HttpClient::perform(const HttpRequest& request) {
    auto responses = performAll({request});
    if (responses.empty()) {
        HttpResponse response;
        response.error_message = "no response produced";
        return response;
    }
    return std::move(responses.front());
}

CurlHttpClient::CurlHttpClient()
    : initialized_(ensureCurlGlobalInit())
{
    if (!initialized_) {
        LOG_ERROR("HttpClient", "Failed to initialize libcurl");
    }
}

CurlHttpClient::~CurlHttpClient() = default;

std::vector<HttpResponse> CurlHttpClient::performAll(const std::vector<HttpRequest>& requests) {
    std::vector<HttpResponse> responses(requests.size());
    if (requests.empty()) {
        return responses;
    }

    if (!initialized_) {
        for (auto& response : responses) {
            response.error_message = "libcurl not initialized";
        }
        return responses;
    }

    MultiSession session;
    if (!session.get()) {
        LOG_ERROR("HttpClient", "curl_multi_init failed");
        for (auto& response : responses) {
            response.error_message = "curl_multi_init failed";
        }
        return responses;
    }

    for (size_t i = 0; i < requests.size(); ++i) {
        if (!session.add(i, requests[i], responses[i])) {
            LOG_WARN("HttpClient", "Could not start request to {}: {}",
                     requests[i].url, responses[i].error_message);
        }
    }

    int running = 0;
    do {
        CURLMcode mc = curl_multi_perform(session.get(), &running);
        if (mc != CURLM_OK) {
            LOG_ERROR("HttpClient", "curl_multi_perform failed: {}", curl_multi_strerror(mc));
            break;
        }

        collectFinished(session.get(), responses);

        if (running > 0) {
            mc = curl_multi_wait(session.get(), nullptr, 0, 100, nullptr);
            if (mc != CURLM_OK) {
                LOG_ERROR("HttpClient", "curl_multi_wait failed: {}", curl_multi_strerror(mc));
                break;
            }
        }
    } while (running > 0);

    return responses;
}

}  // namespace net
}  // namespace ubnt
