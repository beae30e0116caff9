#pragma once

#include "db/connection_config.hpp"

#include <map>
#include <string>

namespace mongoacl {

inline constexpr const char* kUriScheme = "mongodb";

/**
 * @brief Build the connection URI: mongodb://host:port[/?opt=v&opt=v]
 *
 * Options, each only when its field is set:
 *   retrywrites=<bool>  retry_writes explicitly true/false
 *   ssl=true            ssl toggle on
 *   replicaSet=<name>   non-empty replica set
 *
 * Credentials are never embedded; they are applied to the client separately.
 */
[[nodiscard]] std::string build_connection_uri(const ConnectionConfig& config);

/**
 * @brief Query options of a URI as key → value (empty if none)
 */
[[nodiscard]] std::map<std::string, std::string> parse_uri_options(const std::string& uri);

} // namespace mongoacl
