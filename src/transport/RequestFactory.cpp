#include "RequestFactory.hpp"

#include <openssl/evp.h>

#include <stdexcept>

namespace b2core::RequestFactory {

namespace {

void set_common_headers(http::request<http::string_body>& req, const HttpTarget& target,
                        std::string_view authorization) {
    req.set(http::field::host, host_header(target));
    req.set(http::field::user_agent, USER_AGENT);
    if (!authorization.empty()) {
        req.set(http::field::authorization, authorization);
    }
    // One exchange per connection; the body source reads until the peer closes.
    req.keep_alive(false);
}

}  // namespace

std::string host_header(const HttpTarget& target) {
    std::string host = target.host;
    if (!target.port.empty() && target.port != "80" && target.port != "443") {
        host += ":" + target.port;
    }
    return host;
}

HttpTarget target_from_url(std::string_view url, std::chrono::seconds connect_timeout) {
    std::string_view rest = url;
    if (auto scheme_end = rest.find("://"); scheme_end != std::string_view::npos) {
        std::string_view scheme = rest.substr(0, scheme_end);
        if (scheme == "https") {
            throw std::invalid_argument("https is not supported by the plain TCP transport: " +
                                        std::string(url));
        }
        if (scheme != "http") {
            throw std::invalid_argument("unsupported URL scheme: " + std::string(url));
        }
        rest.remove_prefix(scheme_end + 3);
    }
    if (auto slash = rest.find('/'); slash != std::string_view::npos) {
        if (slash + 1 != rest.size()) {
            throw std::invalid_argument("base URL must not carry a path: " + std::string(url));
        }
        rest = rest.substr(0, slash);
    }

    HttpTarget target;
    target.connect_timeout = connect_timeout;
    if (auto colon = rest.rfind(':'); colon != std::string_view::npos) {
        target.port = std::string(rest.substr(colon + 1));
        rest = rest.substr(0, colon);
        if (target.port.empty()) {
            throw std::invalid_argument("empty port in URL: " + std::string(url));
        }
    }
    if (rest.empty()) {
        throw std::invalid_argument("no host in URL: " + std::string(url));
    }
    target.host = std::string(rest);
    return target;
}

std::string basic_authorization(std::string_view key_id, std::string_view application_key) {
    std::string plain;
    plain.reserve(key_id.size() + 1 + application_key.size());
    plain.append(key_id).append(":").append(application_key);

    // EVP_EncodeBlock writes 4 bytes per 3 input bytes plus a NUL terminator.
    std::string encoded(4 * ((plain.size() + 2) / 3) + 1, '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(encoded.data()),
                                  reinterpret_cast<const unsigned char*>(plain.data()),
                                  static_cast<int>(plain.size()));
    if (written < 0) {
        throw std::runtime_error("base64 encoding of credentials failed");
    }
    encoded.resize(static_cast<size_t>(written));

    return "Basic " + encoded;
}

http::request<http::string_body> make_get_request(const HttpTarget& target,
                                                  std::string_view path,
                                                  std::string_view authorization) {
    http::request<http::string_body> req{http::verb::get, path, 11};
    set_common_headers(req, target, authorization);
    return req;
}

http::request<http::string_body> make_json_request(const HttpTarget& target,
                                                   std::string_view path,
                                                   std::string_view authorization,
                                                   const json::value& body) {
    http::request<http::string_body> req{http::verb::post, path, 11};
    set_common_headers(req, target, authorization);
    req.set(http::field::content_type, "application/json");
    req.body() = json::serialize(body);
    req.prepare_payload();
    return req;
}

}  // namespace b2core::RequestFactory
