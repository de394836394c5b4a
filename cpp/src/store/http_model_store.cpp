#include "fedrelay/store/http_model_store.hpp"
#include "fedrelay/error.hpp"
#include "fedrelay/logging.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <boost/none.hpp>

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <algorithm>
#include <cctype>
#include <optional>

namespace beast = boost::beast;
namespace http = beast::http;
namespace asio = boost::asio;
namespace ssl = asio::ssl;
using tcp = asio::ip::tcp;

namespace fedrelay::store {

// =============================================================================
// Endpoint parsing
// =============================================================================

HttpEndpoint HttpEndpoint::parse(const std::string& url) {
    HttpEndpoint ep;

    const auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos) {
        throw InvalidParameterError("Storage URL has no scheme: '" + url + "'", __func__);
    }
    ep.scheme = url.substr(0, scheme_end);
    std::transform(ep.scheme.begin(), ep.scheme.end(), ep.scheme.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (ep.scheme != "http" && ep.scheme != "https") {
        throw InvalidParameterError("Unsupported storage URL scheme '" + ep.scheme + "'", __func__,
                                    "Use http:// or https://");
    }
    ep.port = ep.use_ssl() ? 443 : 80;

    const auto authority_begin = scheme_end + 3;
    const auto path_begin = url.find('/', authority_begin);
    std::string authority = url.substr(authority_begin, path_begin == std::string::npos
                                                            ? std::string::npos
                                                            : path_begin - authority_begin);
    ep.base_path = path_begin == std::string::npos ? "/" : url.substr(path_begin);
    if (ep.base_path.back() != '/') {
        ep.base_path.push_back('/');
    }

    std::optional<std::string> port_str;
    if (!authority.empty() && authority.front() == '[') {
        const auto close = authority.find(']');
        if (close == std::string::npos) {
            throw InvalidParameterError("Unterminated IPv6 address in storage URL: '" + url + "'", __func__);
        }
        const std::string rest = authority.substr(close + 1);
        if (!rest.empty()) {
            if (rest.front() != ':') {
                throw InvalidParameterError("Unexpected text after IPv6 address in storage URL: '" + url + "'",
                                            __func__);
            }
            port_str = rest.substr(1);
        }
        authority = authority.substr(1, close - 1);
    } else {
        const auto colon = authority.rfind(':');
        if (colon != std::string::npos) {
            port_str = authority.substr(colon + 1);
            authority = authority.substr(0, colon);
        }
    }

    if (port_str) {
        try {
            size_t consumed = 0;
            int port = std::stoi(*port_str, &consumed);
            if (consumed != port_str->size() || port <= 0 || port > 65535) {
                throw std::out_of_range(*port_str);
            }
            ep.port = static_cast<uint16_t>(port);
        } catch (const std::exception&) {
            throw InvalidParameterError("Invalid port '" + *port_str + "' in storage URL", __func__);
        }
    }
    if (authority.empty()) {
        throw InvalidParameterError("Storage URL has no host: '" + url + "'", __func__);
    }
    ep.host = authority;
    return ep;
}

std::string HttpEndpoint::authority() const {
    std::string out = host.find(':') == std::string::npos ? host : "[" + host + "]";
    if (port != default_port()) {
        out += ":" + std::to_string(port);
    }
    return out;
}

// =============================================================================
// Transport
// =============================================================================

namespace {

// Runs one async operation to completion so the stream's expiry applies.
// Synchronous Beast calls ignore tcp_stream timeouts.
template <typename Initiate>
void run_op(asio::io_context& ioc, Initiate&& initiate) {
    beast::error_code result;
    initiate([&result](beast::error_code ec, auto&&...) { result = ec; });
    ioc.restart();
    ioc.run();
    if (result) {
        throw beast::system_error(result);
    }
}

// The parser's default response body limit is 8 MB, well under a real model.
template <typename Stream, typename Request, typename Response>
void exchange(asio::io_context& ioc, Stream& stream, Request& req, Response& res, uint64_t max_body_bytes) {
    beast::flat_buffer buffer;
    run_op(ioc, [&](auto handler) { http::async_write(stream, req, std::move(handler)); });

    http::response_parser<typename Response::body_type> parser;
    if (max_body_bytes == 0) {
        parser.body_limit(boost::none);
    } else {
        parser.body_limit(max_body_bytes);
    }
    run_op(ioc, [&](auto handler) { http::async_read(stream, buffer, parser, std::move(handler)); });
    res = parser.release();
}

std::string body_snippet(const std::vector<uint8_t>& body) {
    const size_t n = std::min<size_t>(body.size(), 200);
    std::string s(body.begin(), body.begin() + static_cast<std::ptrdiff_t>(n));
    for (auto& c : s) {
        if (!std::isprint(static_cast<unsigned char>(c))) c = ' ';
    }
    return s;
}

} // namespace

HttpModelStore::HttpModelStore(HttpStoreOptions options)
    : options_(std::move(options)),
      endpoint_(HttpEndpoint::parse(options_.base_url)) {
    if (endpoint_.use_ssl()) {
        ssl_context_ = std::make_unique<ssl::context>(ssl::context::tls_client);
        ssl_context_->set_default_verify_paths();
        ssl_context_->set_verify_mode(options_.verify_peer ? ssl::verify_peer : ssl::verify_none);
    }
    LOG_INFO("HTTP model store at {}", describe());
}

HttpModelStore::~HttpModelStore() = default;

std::string HttpModelStore::url_for(const std::string& key) const {
    return endpoint_.scheme + "://" + endpoint_.authority() + endpoint_.base_path + key;
}

std::string HttpModelStore::describe() const {
    return url_for("");
}

HttpModelStore::Response HttpModelStore::send(Request& req) {
    asio::io_context ioc;
    tcp::resolver resolver(ioc);
    Response res;

    tcp::resolver::results_type endpoints;
    run_op(ioc, [&](auto handler) {
        resolver.async_resolve(endpoint_.host, std::to_string(endpoint_.port),
            [&endpoints, handler = std::move(handler)](beast::error_code ec,
                                                       tcp::resolver::results_type results) mutable {
                endpoints = std::move(results);
                handler(ec);
            });
    });

    if (endpoint_.use_ssl()) {
        beast::ssl_stream<beast::tcp_stream> stream(ioc, *ssl_context_);
        if (!SSL_set_tlsext_host_name(stream.native_handle(), endpoint_.host.c_str())) {
            throw beast::system_error(beast::error_code(static_cast<int>(::ERR_get_error()),
                                                        asio::error::get_ssl_category()));
        }
        auto& lowest = beast::get_lowest_layer(stream);
        lowest.expires_after(options_.timeout);
        run_op(ioc, [&](auto handler) { lowest.async_connect(endpoints, std::move(handler)); });
        run_op(ioc, [&](auto handler) { stream.async_handshake(ssl::stream_base::client, std::move(handler)); });
        exchange(ioc, stream, req, res, options_.max_body_bytes);

        // Many servers drop the connection without close_notify; the response
        // is already complete at this point.
        lowest.expires_after(std::chrono::seconds(2));
        try {
            run_op(ioc, [&](auto handler) { stream.async_shutdown(std::move(handler)); });
        } catch (const beast::system_error& e) {
            LOG_DEBUG("TLS shutdown: {}", e.what());
        }
    } else {
        beast::tcp_stream stream(ioc);
        stream.expires_after(options_.timeout);
        run_op(ioc, [&](auto handler) { stream.async_connect(endpoints, std::move(handler)); });
        exchange(ioc, stream, req, res, options_.max_body_bytes);

        beast::error_code ec;
        stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    }
    return res;
}

// =============================================================================
// ModelStore
// =============================================================================

FetchResult HttpModelStore::get(const std::string& key) {
    const std::string target = endpoint_.base_path + key;
    Request req{http::verb::get, target, 11};
    req.set(http::field::host, endpoint_.authority());
    req.set(http::field::user_agent, "fedrelay/" BOOST_BEAST_VERSION_STRING);
    req.set(http::field::accept, "application/octet-stream");
    if (!options_.bearer_token.empty()) {
        req.set(http::field::authorization, "Bearer " + options_.bearer_token);
    }
    req.prepare_payload();

    Response res;
    try {
        LOG_DEBUG("GET {}", url_for(key));
        res = send(req);
    } catch (const std::exception& e) {
        throw StorageReadError("GET " + url_for(key) + " failed: " + e.what(), "HttpModelStore");
    }

    const int status = static_cast<int>(res.result_int());
    if (status < 200 || status >= 300) {
        LOG_DEBUG("GET {} returned status {}", url_for(key), status);
        return FetchResult::not_found(status);
    }
    return FetchResult::with_bytes(std::move(res.body()), status);
}

PutResult HttpModelStore::put(const std::string& key, const Bytes& bytes, const Headers& headers) {
    const std::string target = endpoint_.base_path + key;
    Request req{http::verb::put, target, 11};
    req.set(http::field::host, endpoint_.authority());
    req.set(http::field::user_agent, "fedrelay/" BOOST_BEAST_VERSION_STRING);
    req.set(http::field::content_type, "application/octet-stream");
    for (const auto& [name, value] : headers) {
        req.set(name, value);
    }
    if (!options_.bearer_token.empty()) {
        req.set(http::field::authorization, "Bearer " + options_.bearer_token);
    }
    req.body() = bytes;
    req.prepare_payload();

    Response res;
    try {
        LOG_DEBUG("PUT {} ({} bytes)", url_for(key), bytes.size());
        res = send(req);
    } catch (const std::exception& e) {
        throw FedRelayException(ErrorCode::STORAGE_WRITE_FAILURE,
                                "PUT " + url_for(key) + " failed: " + e.what(), "HttpModelStore");
    }

    const int status = static_cast<int>(res.result_int());
    if (status < 200 || status >= 300) {
        return PutResult::failure(status, "Failed with status " + std::to_string(status) + ": " +
                                              std::string(res.reason()) + " " + body_snippet(res.body()));
    }

    auto location = res.find(http::field::location);
    if (location != res.end() && !location->value().empty()) {
        return PutResult::success(std::string(location->value()), status);
    }
    return PutResult::success(url_for(key), status);
}

} // namespace fedrelay::store
