#ifndef KEYPROBE_HTTP_CLIENT_HPP
#define KEYPROBE_HTTP_CLIENT_HPP

#include <cstdint>
#include <memory>
#include <string>
#include <boost/asio/ssl/context.hpp>
#include <boost/json.hpp>

namespace keyprobe {

// A parsed http:// or https:// URL
struct Endpoint {
    std::string scheme;
    std::string host;
    uint16_t port = 80;
    std::string target = "/";

    bool use_ssl() const { return scheme == "https"; }
    std::string to_string() const;
};

// Throws InvalidArgumentError for anything that is not an absolute
// http(s) URL with a host.
Endpoint parse_endpoint(const std::string& url);

struct HttpResponse {
    unsigned status = 0;
    std::string body;
    // Transport error description when send_request returned false
    std::string error;

    bool ok() const { return status >= 200 && status < 300; }
};

class HttpClient {
public:
    HttpClient();
    virtual ~HttpClient() = default;

    // One blocking request/response exchange on a fresh connection.
    // Returns false on transport failure (resolve, connect, TLS, I/O) with
    // response.error set; any HTTP status counts as a completed exchange.
    virtual bool send_request(
        const std::string& method,
        const Endpoint& endpoint,
        const std::string& body,
        HttpResponse& response);

    bool send_request(
        const std::string& method,
        const Endpoint& endpoint,
        const boost::json::object& body,
        HttpResponse& response);

private:
    std::shared_ptr<boost::asio::ssl::context> ssl_context_;
};

} // namespace keyprobe

#endif // KEYPROBE_HTTP_CLIENT_HPP
