#include "keyprobe/lookup_client.hpp"
#include "keyprobe/error.hpp"
#include "keyprobe/logging.hpp"
#include "keyprobe/metrics.hpp"
#include <boost/json.hpp>
#include <string>
#include <utility>

namespace keyprobe {

std::optional<std::string> extract_key(const boost::json::value& payload) {
    const boost::json::object* object = payload.if_object();
    if (!object) {
        return std::nullopt;
    }

    auto it = object->find("key");
    if (it == object->end() || !it->value().is_string()) {
        return std::nullopt;
    }

    const boost::json::string& key = it->value().get_string();
    return std::string(key.data(), key.size());
}

ChecksumLookupClient::ChecksumLookupClient(std::shared_ptr<HttpClient> http_client, Endpoint endpoint)
    : http_client_(std::move(http_client)),
      endpoint_(std::move(endpoint)) {
    if (!http_client_) {
        throw InvalidArgumentError("Null pointer: http_client", "ChecksumLookupClient");
    }
}

boost::json::object ChecksumLookupClient::build_request(const std::string& checksum) {
    boost::json::object root;
    root["checksum"] = checksum;
    return root;
}

LookupResult ChecksumLookupClient::parse_response(const std::string& body) {
    boost::json::error_code ec;
    boost::json::value payload = boost::json::parse(body, ec);
    if (ec) {
        return std::nullopt;
    }

    LookupResponse response;
    response.key = extract_key(payload);
    response.payload = std::move(payload);
    return response;
}

LookupResult ChecksumLookupClient::submit(const std::string& checksum) {
    Metrics::getInstance().increment_counter(METRIC_LOOKUP_REQUESTS);

    HttpResponse response;
    if (!http_client_->send_request("POST", endpoint_, build_request(checksum), response)) {
        Metrics::getInstance().increment_counter(METRIC_LOOKUP_FAILURES);
        LOG_ERROR("Encountered a network error for checksum " + checksum + ": " + response.error);
        return std::nullopt;
    }

    if (!response.ok()) {
        Metrics::getInstance().increment_counter(METRIC_LOOKUP_FAILURES);
        LOG_ERROR("Received non-OK status " + std::to_string(response.status) + " for checksum " + checksum);
        return std::nullopt;
    }

    LookupResult result = parse_response(response.body);
    if (!result) {
        Metrics::getInstance().increment_counter(METRIC_LOOKUP_FAILURES);
        LOG_ERROR("Received malformed response body for checksum " + checksum);
        return std::nullopt;
    }

    LOG_TRACE("Lookup for " + checksum + " returned " + boost::json::serialize(result->payload));
    return result;
}

} // namespace keyprobe
