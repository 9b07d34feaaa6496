#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "Types.hpp"

namespace b2core {

/**
 * @brief What an authorization may do. A set bucket or prefix restricts it to that
 * bucket or to file names with that prefix.
 */
struct Allowed {
    std::vector<std::string> capabilities;
    std::optional<std::string> bucket_id;
    std::optional<std::string> bucket_name;
    std::optional<std::string> name_prefix;

    bool has_capability(std::string_view capability) const noexcept;

    bool operator==(const Allowed&) const = default;
};

/**
 * @brief The credential every API call is made with, as returned by the account
 * authorization call. Compared by value.
 */
struct Authorization {
    std::string account_id;
    std::string authorization_token;
    std::string api_url;
    std::string download_url;
    std::size_t recommended_part_size = 0;
    std::size_t absolute_minimum_part_size = 0;
    Allowed allowed;

    bool operator==(const Authorization&) const = default;
};

/**
 * @brief Application key id and secret used to obtain an Authorization.
 */
struct Credentials {
    std::string key_id;
    std::string application_key;

    // Value of the Authorization header of the account authorization call.
    std::string basic_auth_header() const;
};

Allowed tag_invoke(const json::value_to_tag<Allowed>&, const json::value& jv);
Authorization tag_invoke(const json::value_to_tag<Authorization>&, const json::value& jv);

// Accepts {"id": ..., "key": ...} as well as a two element array [id, key].
Credentials tag_invoke(const json::value_to_tag<Credentials>&, const json::value& jv);

}  // namespace b2core
