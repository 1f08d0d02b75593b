#include "infra/http/TlsHttpClient.hpp"

#include <chrono>
#include <sstream>
#include <stdexcept>
#include <string>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/rfc2818_verification.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>

#include <openssl/err.h>

#include "common/Log.hpp"
#include "domain/Errors.hpp"

namespace infra::http {
namespace {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;

constexpr int kMaxRedirects = 5;

domain::FeedError makeError(const std::string& host, const std::string& target, const std::string& message,
                            domain::ErrorKind kind = domain::ErrorKind::TransientNetwork) {
    std::ostringstream oss;
    oss << "HTTPS GET https://" << host << target << " failed: " << message;
    return domain::FeedError(kind, oss.str());
}

struct ParsedLocation {
    std::string host;
    std::string target;
};

ParsedLocation parseRedirectLocation(const std::string& location, const std::string& currentHost) {
    if (location.empty()) {
        throw std::runtime_error("redirect response missing Location header");
    }

    ParsedLocation result{};
    if (location.rfind("https://", 0) == 0) {
        const std::string withoutScheme = location.substr(std::string{"https://"}.size());
        const auto slashPos = withoutScheme.find('/');
        std::string hostPart = slashPos == std::string::npos ? withoutScheme : withoutScheme.substr(0, slashPos);
        if (hostPart.empty()) {
            throw std::runtime_error("redirect URL missing host");
        }
        const auto colonPos = hostPart.find(':');
        if (colonPos != std::string::npos) {
            const std::string portPart = hostPart.substr(colonPos + 1);
            if (portPart != "443") {
                throw std::runtime_error("redirect to unsupported HTTPS port: " + portPart);
            }
            hostPart = hostPart.substr(0, colonPos);
        }
        result.host = hostPart;
        result.target = slashPos == std::string::npos ? std::string{"/"} : withoutScheme.substr(slashPos);
    } else if (location.rfind("http://", 0) == 0) {
        throw std::runtime_error("insecure redirect to HTTP is not supported");
    } else {
        result.host = currentHost;
        result.target = location.front() == '/' ? location : "/" + location;
    }
    return result;
}

http::response<http::string_body> performRequest(const std::string& host, const std::string& target, int timeoutSec) {
    if (timeoutSec <= 0) {
        throw makeError(host, target, "timeout must be positive", domain::ErrorKind::Configuration);
    }

    net::io_context ioc;
    ssl::context sslContext(ssl::context::tls_client);
    sslContext.set_default_verify_paths();
    sslContext.set_verify_mode(ssl::verify_peer);

    ssl::stream<beast::tcp_stream> stream(ioc, sslContext);
    stream.set_verify_callback(ssl::rfc2818_verification(host));

    if (!SSL_set_tlsext_host_name(stream.native_handle(), host.c_str())) {
        const unsigned long err = ::ERR_get_error();
        const char* reason = err != 0 ? ::ERR_reason_error_string(err) : nullptr;
        std::ostringstream oss;
        oss << "failed to set SNI hostname to '" << host << "'";
        if (reason != nullptr) {
            oss << ": " << reason;
        }
        throw makeError(host, target, oss.str());
    }

    auto resolver = net::ip::tcp::resolver(ioc);
    beast::error_code ec;
    auto const results = resolver.resolve(host, "443", ec);
    if (ec) {
        throw makeError(host, target, "DNS resolution error: " + ec.message());
    }

    auto& lowestLayer = beast::get_lowest_layer(stream);
    lowestLayer.expires_after(std::chrono::seconds(timeoutSec));
    lowestLayer.connect(results, ec);
    if (ec) {
        throw makeError(host, target, "connection error: " + ec.message());
    }

    lowestLayer.expires_after(std::chrono::seconds(timeoutSec));
    stream.handshake(ssl::stream_base::client, ec);
    if (ec) {
        throw makeError(host, target, "TLS handshake error: " + ec.message());
    }

    http::request<http::empty_body> req{http::verb::get, target, 11};
    req.set(http::field::host, host);
    req.set(http::field::user_agent, "mdi-collector/1.0");
    req.set(http::field::accept, "application/json");
    req.set(http::field::connection, "close");

    http::write(stream, req, ec);
    if (ec) {
        throw makeError(host, target, "write error: " + ec.message());
    }

    beast::flat_buffer buffer;
    http::response_parser<http::string_body> parser;
    parser.body_limit(64 * 1024 * 1024);
    lowestLayer.expires_after(std::chrono::seconds(timeoutSec));
    http::read(stream, buffer, parser, ec);
    if (ec) {
        throw makeError(host, target, "read error: " + ec.message());
    }

    stream.shutdown(ec);
    if (ec == net::error::eof || ec == ssl::error::stream_truncated) {
        ec = {};
    }
    if (ec) {
        // The response is complete; a failed TLS close does not invalidate it.
        LOG_DEBUG("TlsHttpClient shutdown for " << host << " reported: " << ec.message());
    }

    return parser.release();
}

}  // namespace

JsonResponse https_get_json_response(const std::string& host, const std::string& target, int timeout_sec) {
    if (host.empty()) {
        throw domain::FeedError(domain::ErrorKind::Configuration, "HTTPS GET requires a non-empty host");
    }

    std::string currentHost = host;
    std::string currentTarget = target.empty() ? std::string{"/"} : target;
    if (currentTarget.front() != '/') {
        currentTarget.insert(currentTarget.begin(), '/');
    }

    for (int redirectCount = 0; redirectCount <= kMaxRedirects; ++redirectCount) {
        auto response = performRequest(currentHost, currentTarget, timeout_sec);
        const auto status = static_cast<unsigned>(response.result_int());
        if (status == 301U || status == 302U) {
            try {
                const auto parsed =
                    parseRedirectLocation(std::string(response.base()[http::field::location]), currentHost);
                currentHost = parsed.host;
                currentTarget = parsed.target;
                continue;
            } catch (const std::runtime_error& redirectError) {
                throw makeError(currentHost, currentTarget, redirectError.what(), domain::ErrorKind::Protocol);
            }
        }

        JsonResponse result{};
        result.status = status;
        result.body = std::move(response.body());
        result.final_host = currentHost;
        result.final_target = currentTarget;
        if (auto it = response.base().find("X-MBX-USED-WEIGHT-1M"); it != response.base().end()) {
            result.used_weight_header = std::string{it->value()};
        } else if (auto legacy = response.base().find("X-MBX-USED-WEIGHT"); legacy != response.base().end()) {
            result.used_weight_header = std::string{legacy->value()};
        }
        return result;
    }

    throw makeError(currentHost, currentTarget, "too many redirects", domain::ErrorKind::Protocol);
}

void raise_for_status(const JsonResponse& response) {
    if (response.status < 400U) {
        return;
    }
    const auto status = static_cast<int>(response.status);
    std::string detail = response.body.substr(0, 256);
    throw domain::FeedError(domain::classify_http_status(status),
                            "HTTPS GET https://" + response.final_host + response.final_target + " returned HTTP " +
                                std::to_string(status) + (detail.empty() ? "" : ": " + detail),
                            status);
}

HttpGet default_http_get(int timeout_sec) {
    return [timeout_sec](const std::string& host, const std::string& target) {
        return https_get_json_response(host, target, timeout_sec);
    };
}

}  // namespace infra::http
