#include "Authorization.hpp"

#include <algorithm>
#include <stdexcept>

#include "RequestFactory.hpp"

namespace b2core {

namespace {

template <class T>
std::optional<T> optional_field(const json::object& obj, std::string_view key) {
    auto it = obj.find(key);
    if (it == obj.end() || it->value().is_null()) return std::nullopt;
    return json::value_to<T>(it->value());
}

template <class T>
T required_field(const json::object& obj, std::string_view key) {
    auto it = obj.find(key);
    if (it == obj.end()) {
        throw std::invalid_argument("missing field \"" + std::string(key) + "\"");
    }
    return json::value_to<T>(it->value());
}

}  // namespace

bool Allowed::has_capability(std::string_view capability) const noexcept {
    return std::find(capabilities.begin(), capabilities.end(), capability) !=
           capabilities.end();
}

std::string Credentials::basic_auth_header() const {
    return RequestFactory::basic_authorization(key_id, application_key);
}

Allowed tag_invoke(const json::value_to_tag<Allowed>&, const json::value& jv) {
    const auto& obj = jv.as_object();
    Allowed allowed;
    allowed.capabilities =
        optional_field<std::vector<std::string>>(obj, "capabilities")
            .value_or(std::vector<std::string>{});
    allowed.bucket_id = optional_field<std::string>(obj, "bucketId");
    allowed.bucket_name = optional_field<std::string>(obj, "bucketName");
    allowed.name_prefix = optional_field<std::string>(obj, "namePrefix");
    return allowed;
}

Authorization tag_invoke(const json::value_to_tag<Authorization>&, const json::value& jv) {
    const auto& obj = jv.as_object();
    Authorization auth;
    auth.account_id = required_field<std::string>(obj, "accountId");
    auth.authorization_token = required_field<std::string>(obj, "authorizationToken");
    auth.api_url = required_field<std::string>(obj, "apiUrl");
    auth.download_url = required_field<std::string>(obj, "downloadUrl");
    auth.recommended_part_size = required_field<std::size_t>(obj, "recommendedPartSize");
    auth.absolute_minimum_part_size =
        required_field<std::size_t>(obj, "absoluteMinimumPartSize");
    auth.allowed = required_field<Allowed>(obj, "allowed");
    return auth;
}

Credentials tag_invoke(const json::value_to_tag<Credentials>&, const json::value& jv) {
    if (const auto* arr = jv.if_array()) {
        if (arr->size() != 2) {
            throw std::invalid_argument("credentials array must hold exactly id and key");
        }
        return Credentials{json::value_to<std::string>(arr->at(0)),
                           json::value_to<std::string>(arr->at(1))};
    }
    const auto& obj = jv.as_object();
    return Credentials{required_field<std::string>(obj, "id"),
                       required_field<std::string>(obj, "key")};
}

}  // namespace b2core
