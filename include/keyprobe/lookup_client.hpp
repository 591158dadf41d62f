#ifndef KEYPROBE_LOOKUP_CLIENT_HPP
#define KEYPROBE_LOOKUP_CLIENT_HPP

#include <memory>
#include <optional>
#include <string>
#include <boost/json.hpp>
#include "keyprobe/http_client.hpp"

namespace keyprobe {

// Successful answer from the lookup service
struct LookupResponse {
    // Set only when the payload carries "key" as a JSON string
    std::optional<std::string> key;
    // Full decoded body, kept for display
    boost::json::value payload;
};

// Empty on any failed submission
using LookupResult = std::optional<LookupResponse>;

// Submits a single checksum. Implementations keep no state between calls.
class LookupClient {
public:
    virtual ~LookupClient() = default;

    virtual LookupResult submit(const std::string& checksum) = 0;
};

std::optional<std::string> extract_key(const boost::json::value& payload);

class ChecksumLookupClient : public LookupClient {
public:
    ChecksumLookupClient(std::shared_ptr<HttpClient> http_client, Endpoint endpoint);

    LookupResult submit(const std::string& checksum) override;

    const Endpoint& endpoint() const { return endpoint_; }

    static boost::json::object build_request(const std::string& checksum);
    // Empty when the body is not valid JSON
    static LookupResult parse_response(const std::string& body);

private:
    std::shared_ptr<HttpClient> http_client_;
    Endpoint endpoint_;
};

} // namespace keyprobe

#endif // KEYPROBE_LOOKUP_CLIENT_HPP
