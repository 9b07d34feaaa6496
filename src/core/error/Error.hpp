#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

#include <boost/system/error_code.hpp>

#include "Types.hpp"

namespace b2core {

/**
 * @brief Root of every failure the core reports.
 *
 * @details
 * Precondition violations (polling a finished decoder, overlapping advances) are
 * `std::logic_error` instead, so that `catch (const b2core::Error&)` only ever sees
 * recoverable conditions.
 */
class Error : public std::runtime_error {
   public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Failure below the core: resolve, connect, read or write.
 */
class TransportError : public Error {
   public:
    explicit TransportError(const std::string& what, boost::system::error_code ec = {});

    const boost::system::error_code& code() const noexcept { return ec_; }

    // True for connection level failures after which a fresh authorization should be
    // obtained (refused, reset, aborted, broken pipe, not connected, timed out).
    bool should_obtain_new_authentication() const noexcept;

   private:
    boost::system::error_code ec_;
};

/**
 * @brief Malformed body bytes or a value that does not match the expected schema.
 */
class DecodeError : public Error {
   public:
    using Error::Error;
};

/**
 * @brief The error object the service returns in the body of a non-success response.
 */
struct ApiErrorMessage {
    std::uint32_t status = 0;
    std::string code;
    std::string message;
};

ApiErrorMessage tag_invoke(const json::value_to_tag<ApiErrorMessage>&, const json::value& jv);

/**
 * @brief A well-formed error response from the service.
 *
 * @details
 * The classification helpers mirror the service's documented error codes. They only
 * classify; the core never acts on them (no retries, no backoff).
 */
class ApiError : public Error {
   public:
    ApiError(unsigned http_status, ApiErrorMessage message);

    unsigned http_status() const noexcept { return http_status_; }
    std::uint32_t status() const noexcept { return message_.status; }
    const std::string& code() const noexcept { return message_.code; }
    const std::string& message() const noexcept { return message_.message; }

    bool is_service_unavailable() const noexcept;
    bool is_too_many_requests() const noexcept;
    bool should_back_off() const noexcept;
    bool is_conflict() const noexcept;
    bool is_cap_exceeded() const noexcept;

    bool is_credentials_issue() const;
    bool is_wrong_credentials() const noexcept;
    bool is_expired_authentication() const noexcept;
    bool is_authorization_issue() const;
    bool should_obtain_new_authentication() const;

   private:
    unsigned http_status_;
    ApiErrorMessage message_;
};

/**
 * @brief A single-flight wait whose leader never completed.
 */
class AbortedError : public Error {
   public:
    using Error::Error;
};

}  // namespace b2core
