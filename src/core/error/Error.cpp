#include "Error.hpp"

#include <array>
#include <string_view>

#include <boost/asio/error.hpp>
#include <boost/beast/core/error.hpp>

namespace b2core {

namespace {

std::string describe(unsigned http_status, const ApiErrorMessage& msg) {
    std::string out = "API error " + std::to_string(http_status);
    if (!msg.code.empty()) {
        out += " (" + msg.code + ")";
    }
    if (!msg.message.empty()) {
        out += ": " + msg.message;
    }
    return out;
}

template <class T>
T field_or(const json::object& obj, std::string_view key, T fallback) {
    auto it = obj.find(key);
    if (it == obj.end() || it->value().is_null()) return fallback;
    return json::value_to<T>(it->value());
}

}  // namespace

// ============================================================================
// TransportError
// ============================================================================

TransportError::TransportError(const std::string& what, boost::system::error_code ec)
    : Error(ec ? what + ": " + ec.message() : what), ec_(ec) {}

bool TransportError::should_obtain_new_authentication() const noexcept {
    namespace error = asio::error;
    return ec_ == error::connection_refused || ec_ == error::connection_reset ||
           ec_ == error::connection_aborted || ec_ == error::broken_pipe ||
           ec_ == error::not_connected || ec_ == error::timed_out ||
           ec_ == beast::error::timeout;
}

// ============================================================================
// ApiErrorMessage
// ============================================================================

ApiErrorMessage tag_invoke(const json::value_to_tag<ApiErrorMessage>&, const json::value& jv) {
    const auto& obj = jv.as_object();
    ApiErrorMessage msg;
    msg.status = field_or<std::uint32_t>(obj, "status", 0);
    msg.code = field_or<std::string>(obj, "code", {});
    msg.message = field_or<std::string>(obj, "message", {});
    return msg;
}

// ============================================================================
// ApiError
// ============================================================================

ApiError::ApiError(unsigned http_status, ApiErrorMessage message)
    : Error(describe(http_status, message)),
      http_status_(http_status),
      message_(std::move(message)) {}

bool ApiError::is_service_unavailable() const noexcept {
    return message_.status >= 500 && message_.status <= 599;
}

bool ApiError::is_too_many_requests() const noexcept { return message_.status == 429; }

bool ApiError::should_back_off() const noexcept {
    switch (message_.status) {
        case 408:
        case 429:
        case 503:
            return true;
        default:
            return false;
    }
}

bool ApiError::is_conflict() const noexcept { return message_.status == 409; }

bool ApiError::is_cap_exceeded() const noexcept { return message_.code == "cap_exceeded"; }

bool ApiError::is_credentials_issue() const {
    static constexpr std::array<std::string_view, 5> messages = {
        "B2 has not been enabled for this account",
        "User is in B2 suspend",
        "Cannot authorize domain site license account",
        "Invalid authorization",
        "Account is missing a mobile phone number. Please update account settings.",
    };
    for (auto m : messages) {
        if (message_.message == m) return true;
    }
    return false;
}

bool ApiError::is_wrong_credentials() const noexcept { return message_.code == "bad_auth_token"; }

bool ApiError::is_expired_authentication() const noexcept {
    return message_.status == 401 && message_.code == "expired_auth_token";
}

bool ApiError::is_authorization_issue() const {
    if (is_expired_authentication()) return true;

    const std::string& m = message_.message;
    if (m.starts_with("Account ") && m.ends_with(" does not exist")) return true;
    if (m.starts_with("Bucket is not authorized: ")) return true;

    static constexpr std::array<std::string_view, 4> messages = {
        "Invalid authorization token",
        "Authorization token for wrong cluster",
        "Not authorized",
        "AccountId bad",
    };
    for (auto candidate : messages) {
        if (m == candidate) return true;
    }
    return false;
}

bool ApiError::should_obtain_new_authentication() const {
    return is_authorization_issue() || is_service_unavailable();
}

}  // namespace b2core
