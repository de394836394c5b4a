#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include <boost/asio/ssl.hpp>
#include <boost/beast/http.hpp>

#include "fedrelay/store/model_store.hpp"

namespace fedrelay::store {

struct HttpEndpoint {
    std::string scheme;      // "http" or "https"
    std::string host;        // IPv6 literals without brackets
    uint16_t port = 80;
    std::string base_path;   // always ends with '/'

    bool use_ssl() const { return scheme == "https"; }
    uint16_t default_port() const { return use_ssl() ? 443 : 80; }

    // host[:port] as written in URLs and the Host header; IPv6 hosts bracketed.
    std::string authority() const;

    // Parses http(s)://host[:port][/path] and http(s)://[v6addr][:port][/path].
    // Throws InvalidParameterError.
    static HttpEndpoint parse(const std::string& url);
};

struct HttpStoreOptions {
    std::string base_url;
    std::string bearer_token;
    std::chrono::milliseconds timeout{30000};
    bool verify_peer = true;
    // Largest response body accepted. 0 = no limit.
    uint64_t max_body_bytes = 256ull * 1024 * 1024;
};

/**
 * Model store on a remote relay (e.g. a Solid pod container) reached over
 * HTTP(S). GET <base>/<key> fetches, PUT <base>/<key> replaces the object.
 * Any non-2xx GET status reads back as NotFound carrying that status; a 2xx
 * with an empty body is Found with no bytes. Transport errors, including a
 * body over max_body_bytes, throw StorageReadError.
 */
class HttpModelStore : public ModelStore {
public:
    explicit HttpModelStore(HttpStoreOptions options);
    ~HttpModelStore() override;

    FetchResult get(const std::string& key) override;
    PutResult put(const std::string& key, const Bytes& bytes, const Headers& headers) override;
    std::string describe() const override;

    std::string url_for(const std::string& key) const;

private:
    using Request = boost::beast::http::request<boost::beast::http::vector_body<uint8_t>>;
    using Response = boost::beast::http::response<boost::beast::http::vector_body<uint8_t>>;

    Response send(Request& req);

    HttpStoreOptions options_;
    HttpEndpoint endpoint_;
    std::unique_ptr<boost::asio::ssl::context> ssl_context_;
};

} // namespace fedrelay::store
