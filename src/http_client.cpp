#include "keyprobe/http_client.hpp"
#include "keyprobe/error.hpp"
#include "keyprobe/logging.hpp"
#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/json.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <algorithm>
#include <cctype>
#include <string>

namespace beast = boost::beast;
namespace http = beast::http;
namespace asio = boost::asio;
namespace ssl = asio::ssl;
using tcp = asio::ip::tcp;

namespace keyprobe {

namespace {

constexpr const char* USER_AGENT = "keyprobe/1.0";

bool is_digits(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); });
}

http::request<http::string_body> build_request(
    const std::string& method,
    const Endpoint& endpoint,
    const std::string& body) {

    http::verb verb = http::string_to_verb(method);
    if (verb == http::verb::unknown) {
        throw InvalidArgumentError("Unsupported HTTP method: " + method, "build_request");
    }

    http::request<http::string_body> req{verb, endpoint.target, 11};
    req.set(http::field::host, endpoint.host);
    req.set(http::field::user_agent, USER_AGENT);
    req.set(http::field::content_type, "application/json");
    req.set(http::field::accept, "application/json");
    req.body() = body;
    req.prepare_payload();
    return req;
}

} // namespace

std::string Endpoint::to_string() const {
    std::string result = scheme + "://" + host;
    bool default_port = (use_ssl() && port == 443) || (!use_ssl() && port == 80);
    if (!default_port) {
        result += ":" + std::to_string(port);
    }
    return result + target;
}

Endpoint parse_endpoint(const std::string& url) {
    auto scheme_end = url.find("://");
    KEYPROBE_CHECK_ARGUMENT(scheme_end != std::string::npos, "URL has no scheme: " + url);

    Endpoint endpoint;
    endpoint.scheme = url.substr(0, scheme_end);
    std::transform(endpoint.scheme.begin(), endpoint.scheme.end(), endpoint.scheme.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    KEYPROBE_CHECK_ARGUMENT(endpoint.scheme == "http" || endpoint.scheme == "https",
                            "Unsupported URL scheme: " + endpoint.scheme);

    std::string rest = url.substr(scheme_end + 3);
    auto authority_end = rest.find_first_of("/?#");
    std::string authority = rest.substr(0, authority_end);
    KEYPROBE_CHECK_ARGUMENT(authority.find('@') == std::string::npos,
                            "Credentials in URL are not supported: " + url);

    if (authority_end == std::string::npos) {
        endpoint.target = "/";
    } else {
        std::string target = rest.substr(authority_end);
        // Fragments never go on the wire
        auto fragment = target.find('#');
        if (fragment != std::string::npos) {
            target.erase(fragment);
        }
        endpoint.target = (target.empty() || target[0] != '/') ? "/" + target : target;
    }

    std::string port_text;
    if (!authority.empty() && authority[0] == '[') {
        auto close = authority.find(']');
        KEYPROBE_CHECK_ARGUMENT(close != std::string::npos, "Unterminated IPv6 host: " + url);
        endpoint.host = authority.substr(1, close - 1);
        std::string after = authority.substr(close + 1);
        if (!after.empty()) {
            KEYPROBE_CHECK_ARGUMENT(after[0] == ':', "Malformed host: " + url);
            port_text = after.substr(1);
            KEYPROBE_CHECK_ARGUMENT(!port_text.empty(), "Empty port in URL: " + url);
        }
    } else {
        auto colon = authority.find(':');
        endpoint.host = authority.substr(0, colon);
        if (colon != std::string::npos) {
            port_text = authority.substr(colon + 1);
            KEYPROBE_CHECK_ARGUMENT(!port_text.empty(), "Empty port in URL: " + url);
        }
    }
    KEYPROBE_CHECK_ARGUMENT(!endpoint.host.empty(), "URL has no host: " + url);

    if (port_text.empty()) {
        endpoint.port = endpoint.use_ssl() ? 443 : 80;
    } else {
        KEYPROBE_CHECK_ARGUMENT(is_digits(port_text) && port_text.size() <= 5, "Invalid port: " + port_text);
        unsigned long port = std::stoul(port_text);
        KEYPROBE_CHECK_ARGUMENT(port > 0 && port <= 65535, "Port out of range: " + port_text);
        endpoint.port = static_cast<uint16_t>(port);
    }

    return endpoint;
}

HttpClient::HttpClient()
    : ssl_context_(std::make_shared<ssl::context>(ssl::context::tls_client)) {
    ssl_context_->set_default_verify_paths();
    ssl_context_->set_verify_mode(ssl::verify_peer);
}

bool HttpClient::send_request(
    const std::string& method,
    const Endpoint& endpoint,
    const std::string& body,
    HttpResponse& response) {

    response = HttpResponse{};

    try {
        LOG_DEBUG("Sending HTTP " + method + " request to " + endpoint.to_string());

        auto req = build_request(method, endpoint, body);

        asio::io_context ioc;
        tcp::resolver resolver(ioc);
        auto const results = resolver.resolve(endpoint.host, std::to_string(endpoint.port));

        beast::flat_buffer buffer;
        http::response<http::string_body> res;

        if (endpoint.use_ssl()) {
            beast::ssl_stream<beast::tcp_stream> stream(ioc, *ssl_context_);

            // SNI, required by most virtual-hosted TLS endpoints
            if (!SSL_set_tlsext_host_name(stream.native_handle(), endpoint.host.c_str())) {
                beast::error_code ec{static_cast<int>(::ERR_get_error()), asio::error::get_ssl_category()};
                throw beast::system_error{ec};
            }
            stream.set_verify_callback(ssl::host_name_verification(endpoint.host));

            beast::get_lowest_layer(stream).connect(results);
            stream.handshake(ssl::stream_base::client);

            http::write(stream, req);
            http::read(stream, buffer, res);

            beast::error_code ec;
            stream.shutdown(ec);
            if (ec && ec != asio::error::eof && ec != ssl::error::stream_truncated) {
                LOG_DEBUG("TLS shutdown: " + ec.message());
            }
        } else {
            beast::tcp_stream stream(ioc);
            stream.connect(results);

            http::write(stream, req);
            http::read(stream, buffer, res);

            beast::error_code ec;
            stream.socket().shutdown(tcp::socket::shutdown_both, ec);
            if (ec && ec != beast::errc::not_connected) {
                LOG_DEBUG("Socket shutdown: " + ec.message());
            }
        }

        response.status = res.result_int();
        response.body = std::move(res.body());
        LOG_DEBUG("HTTP request completed with status " + std::to_string(response.status));
        return true;

    } catch (const std::exception& e) {
        response.error = e.what();
        LOG_DEBUG("HTTP request to " + endpoint.to_string() + " failed: " + response.error);
        return false;
    }
}

bool HttpClient::send_request(
    const std::string& method,
    const Endpoint& endpoint,
    const boost::json::object& body,
    HttpResponse& response) {

    return send_request(method, endpoint, boost::json::serialize(body), response);
}

} // namespace keyprobe
