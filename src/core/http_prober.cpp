/**
 * @file http_prober.cpp
 * @brief HttpProber implementation.
 *
 * @copyright Copyright (c) 2024 UBNT Discovery Contributors
 * @license MIT License
 */

#include "ubnt/core/http_prober.hpp"
#include "ubnt/utils/address_format.hpp"
#include "ubnt/utils/logger.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace ubnt {
namespace core {

namespace {

constexpr long HTTP_UNAUTHORIZED = 401;

bool isJsonContentType(const std::string& contentType) {
    std::string mime = contentType.substr(0, contentType.find(';'));
    std::transform(mime.begin(), mime.end(), mime.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    auto first = mime.find_first_not_of(" \t");
    auto last = mime.find_last_not_of(" \t");
    if (first == std::string::npos) {
        return false;
    }
    mime = mime.substr(first, last - first + 1);

    return mime == "application/json" ||
           (mime.size() > 5 && mime.compare(mime.size() - 5, 5, "+json") == 0);
}

std::optional<std::string> stringField(const nlohmann::json& object, const char* key) {
    auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

std::optional<bool> boolField(const nlohmann::json& object, const char* key) {
    auto it = object.find(key);
    if (it == object.end() || !it->is_boolean()) {
        return std::nullopt;
    }
    return it->get<bool>();
}

SystemInfo extractSystemInfo(const nlohmann::json& document) {
    SystemInfo info;

    auto hardware = document.find("hardware");
    if (hardware != document.end() && hardware->is_object()) {
        info.platform = stringField(*hardware, "shortname");
    }

    if (auto name = stringField(document, "name")) {
        std::replace(name->begin(), name->end(), ' ', '-');
        info.hostname = std::move(name);
    }

    if (auto mac = stringField(document, "mac")) {
        info.hw_addr = utils::normalizeMac(*mac);
        if (!info.hw_addr) {
            LOG_DEBUG("Prober", "Ignoring unparsable MAC '{}'", *mac);
        }
    }

    info.direct_connect_domain = stringField(document, "directConnectDomain");
    info.is_sso_enabled = boolField(document, "isSsoEnabled");
    info.is_single_user = boolField(document, "isSingleUser");
    return info;
}

}  // namespace

HttpProber::HttpProber(std::shared_ptr<net::HttpClient> client, ProbeConfig config)
    : client_(std::move(client))
    , config_(std::move(config))
{
    if (!client_) {
        throw std::invalid_argument("HttpProber requires an HTTP client");
    }
    // A zero timeout means "wait forever" to libcurl
    if (config_.connect_timeout.count() <= 0 || config_.total_timeout.count() <= 0) {
        throw std::invalid_argument("HTTP probe timeouts must be positive");
    }
}

std::string HttpProber::serviceUrl(const std::string& address) const {
    return config_.scheme + "://" + address + config_.service_path;
}

std::string HttpProber::systemInfoUrl(const std::string& address) const {
    return config_.scheme + "://" + address + config_.system_info_path;
}

net::HttpRequest HttpProber::makeRequest(const std::string& url) const {
    net::HttpRequest request;
    request.url = url;
    request.connect_timeout = config_.connect_timeout;
    request.total_timeout = config_.total_timeout;
    request.verify_tls = false;
    return request;
}

ProbeResult HttpProber::probe(const std::string& address) {
    auto results = probeAll({address});
    return std::move(results.front());
}

std::vector<ProbeResult> HttpProber::probeAll(const std::vector<std::string>& addresses) {
    std::vector<ProbeResult> results;
    if (addresses.empty()) {
        return results;
    }

    // Two requests per address: [2i] service, [2i+1] system info
    std::vector<net::HttpRequest> requests;
    requests.reserve(addresses.size() * 2);
    for (const auto& address : addresses) {
        requests.push_back(makeRequest(serviceUrl(address)));
        requests.push_back(makeRequest(systemInfoUrl(address)));
    }

    LOG_DEBUG("Prober", "Probing {} addresses ({} requests)",
              addresses.size(), requests.size());

    std::vector<net::HttpResponse> responses = client_->performAll(requests);
    responses.resize(requests.size());

    results.reserve(addresses.size());
    for (size_t i = 0; i < addresses.size(); ++i) {
        ProbeResult result;
        result.address = addresses[i];
        result.protect = interpretServiceResponse(responses[2 * i]);
        result.system = interpretSystemInfo(responses[2 * i + 1]);

        LOG_DEBUG("Prober", "{}: protect={} system={} (HTTP {})",
                  result.address,
                  result.protect ? (*result.protect ? "true" : "false") : "unknown",
                  probeOutcomeToString(result.system.outcome),
                  result.system.http_status);

        results.push_back(std::move(result));
    }
    return results;
}

SystemInfoResult HttpProber::probeSystemInfo(const std::string& address) {
    net::HttpResponse response = client_->perform(makeRequest(systemInfoUrl(address)));
    SystemInfoResult result = interpretSystemInfo(response);
    LOG_DEBUG("Prober", "{}: system={} (HTTP {})",
              address, probeOutcomeToString(result.outcome), result.http_status);
    return result;
}

std::optional<bool> HttpProber::interpretServiceResponse(const net::HttpResponse& response) {
    if (!response.received()) {
        return std::nullopt;
    }
    return response.status == HTTP_UNAUTHORIZED;
}

SystemInfoResult HttpProber::interpretSystemInfo(const net::HttpResponse& response) {
    SystemInfoResult result;
    result.http_status = response.status;

    if (!response.received()) {
        result.outcome = ProbeOutcome::UNREACHABLE;
        return result;
    }

    if (response.status == HTTP_UNAUTHORIZED) {
        result.outcome = ProbeOutcome::UNAUTHORIZED;
        return result;
    }

    if (response.status < 200 || response.status >= 300) {
        result.outcome = ProbeOutcome::MALFORMED;
        return result;
    }

    if (!isJsonContentType(response.content_type)) {
        LOG_DEBUG("Prober", "Unexpected content type '{}'", response.content_type);
        result.outcome = ProbeOutcome::MALFORMED;
        return result;
    }

    nlohmann::json document = nlohmann::json::parse(response.body, nullptr, false);
    if (document.is_discarded() || !document.is_object()) {
        result.outcome = ProbeOutcome::MALFORMED;
        return result;
    }

    result.outcome = ProbeOutcome::SUCCESS;
    result.info = extractSystemInfo(document);
    return result;
}

void applyProbeResult(DeviceRecord& record, const ProbeResult& result) {
    if (result.protect) {
        record.services[Service::PROTECT] = *result.protect;
    }

    if (!result.system.succeeded()) {
        return;
    }

    const SystemInfo& info = result.system.info;
    if (info.platform) {
        record.platform = info.platform;
    }
    if (info.hostname) {
        record.hostname = info.hostname;
    }
    if (info.hw_addr && !record.hw_addr) {
        record.hw_addr = info.hw_addr;
    }
    if (info.direct_connect_domain) {
        record.direct_connect_domain = info.direct_connect_domain;
    }
    if (info.is_sso_enabled) {
        record.is_sso_enabled = info.is_sso_enabled;
    }
    if (info.is_single_user) {
        record.is_single_user = info.is_single_user;
    }
}

}  // namespace core
}  // namespace ubnt
