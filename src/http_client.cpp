#include "http_client.hpp"
#include "util.hpp"

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>

#ifdef PRODUCT_SYNC_HAS_SSL
#include <boost/beast/ssl.hpp>
#include <boost/asio/ssl.hpp>
#endif

#include <chrono>
#include <iostream>
#include <stdexcept>

namespace beast = boost::beast;
namespace http  = beast::http;
namespace net   = boost::asio;
using tcp       = net::ip::tcp;

namespace product_sync {

namespace {

http::request<http::string_body>
buildBeastRequest(const HttpRequest& request, const UrlParts& parts,
                  const std::string& userAgent)
{
    const http::verb verb = http::string_to_verb(request.method);
    if (verb == http::verb::unknown) {
        throw std::invalid_argument("Unsupported HTTP method: " + request.method);
    }

    http::request<http::string_body> req{verb, parts.target, 11};
    req.set(http::field::host, parts.host);
    req.set(http::field::accept, "application/json");
    req.set(http::field::user_agent, userAgent);
    if (!request.contentType.empty()) {
        req.set(http::field::content_type, request.contentType);
    }
    for (const auto& [name, value] : request.headers) {
        req.set(name, value);
    }
    req.body() = request.body;
    req.prepare_payload();
    return req;
}

HttpResponse toResponse(http::response<http::string_body>& res) {
    HttpResponse response;
    response.httpStatus = res.result_int();
    for (const auto& field : res) {
        const auto name  = field.name_string();
        const auto value = field.value();
        response.headers[toLower(std::string(name.data(), name.size()))] =
            std::string(value.data(), value.size());
    }
    response.body = std::move(res.body());
    return response;
}

} // namespace

std::string HttpResponse::header(const std::string& name) const {
    auto it = headers.find(toLower(name));
    return it == headers.end() ? std::string() : it->second;
}

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

BeastHttpSender::BeastHttpSender(std::string userAgent, int timeoutMs)
    : mUserAgent(std::move(userAgent))
    , mTimeoutMs(timeoutMs) {}

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

HttpResponse BeastHttpSender::send(const HttpRequest& request) {
    if (mVerbose) {
        std::cerr << "[HttpClient] " << request.method << " " << request.url << "\n";
        if (!request.body.empty()) {
            if (request.body.size() <= 300) {
                std::cerr << "[HttpClient] Body: " << request.body << "\n";
            } else {
                std::cerr << "[HttpClient] Body: " << request.body.substr(0, 300)
                          << " ...(truncated)\n";
            }
        }
    }

    const bool useSsl = parseUrl(request.url).scheme == "https";
    return useSsl ? doHttpsRequest(request) : doHttpRequest(request);
}

// ---------------------------------------------------------------------------
// Plain HTTP
// ---------------------------------------------------------------------------

HttpResponse BeastHttpSender::doHttpRequest(const HttpRequest& request) {
    const auto parts = parseUrl(request.url);

    net::io_context ioc;
    tcp::resolver   resolver(ioc);
    beast::tcp_stream stream(ioc);

    try {
        // Resolve + connect with timeout.
        auto const results = resolver.resolve(parts.host, parts.port);
        stream.expires_after(std::chrono::milliseconds(mTimeoutMs));
        stream.connect(results);

        auto req = buildBeastRequest(request, parts, mUserAgent);
        http::write(stream, req);

        beast::flat_buffer buffer;
        http::response<http::string_body> res;
        stream.expires_after(std::chrono::milliseconds(mTimeoutMs));
        http::read(stream, buffer, res);

        HttpResponse response = toResponse(res);

        if (mVerbose) {
            std::cerr << "[HttpClient] HTTP " << response.httpStatus << "\n";
        }

        // Graceful shutdown (non-critical errors are swallowed).
        beast::error_code ec;
        stream.socket().shutdown(tcp::socket::shutdown_both, ec);

        return response;
    } catch (const boost::system::system_error& e) {
        throw std::runtime_error(request.method + " " + request.url +
                                 " failed: " + e.what());
    }
}

// ---------------------------------------------------------------------------
// HTTPS (compiled only when OpenSSL is available)
// ---------------------------------------------------------------------------

HttpResponse BeastHttpSender::doHttpsRequest(const HttpRequest& request) {
#ifdef PRODUCT_SYNC_HAS_SSL
    namespace ssl = net::ssl;

    const auto parts = parseUrl(request.url);

    net::io_context ioc;
    ssl::context    ctx(ssl::context::tlsv12_client);
    ctx.set_default_verify_paths();
    ctx.set_verify_mode(ssl::verify_peer);

    tcp::resolver resolver(ioc);
    beast::ssl_stream<beast::tcp_stream> stream(ioc, ctx);

    // SNI hostname.
    if (!SSL_set_tlsext_host_name(stream.native_handle(), parts.host.c_str())) {
        throw std::runtime_error("Failed to set SNI hostname");
    }

    try {
        auto const results = resolver.resolve(parts.host, parts.port);
        beast::get_lowest_layer(stream).expires_after(
            std::chrono::milliseconds(mTimeoutMs));
        beast::get_lowest_layer(stream).connect(results);

        stream.handshake(ssl::stream_base::client);

        auto req = buildBeastRequest(request, parts, mUserAgent);
        http::write(stream, req);

        beast::flat_buffer buffer;
        http::response<http::string_body> res;
        beast::get_lowest_layer(stream).expires_after(
            std::chrono::milliseconds(mTimeoutMs));
        http::read(stream, buffer, res);

        HttpResponse response = toResponse(res);

        if (mVerbose) {
            std::cerr << "[HttpClient] HTTPS " << response.httpStatus << "\n";
        }

        beast::error_code ec;
        stream.shutdown(ec);

        return response;
    } catch (const boost::system::system_error& e) {
        throw std::runtime_error(request.method + " " + request.url +
                                 " failed: " + e.what());
    }
#else
    throw std::runtime_error("HTTPS not supported: built without OpenSSL (" +
                             request.url + ")");
#endif
}

} // namespace product_sync
