#include "db/connection_uri.hpp"
#include "core/utils.hpp"

#include <format>

namespace mongoacl {

namespace {

void append_option(std::string& arguments, const std::string& option) {
    if (arguments.empty()) {
        arguments = "/?" + option;
    } else {
        arguments += "&" + option;
    }
}

} // anonymous namespace

std::string build_connection_uri(const ConnectionConfig& config) {
    std::string arguments;
    if (config.retry_writes.has_value()) {
        append_option(arguments, std::format("retrywrites={}", utils::booltostr(*config.retry_writes)));
    }
    if (config.ssl) {
        append_option(arguments, "ssl=true");
    }
    if (!config.replica_set.empty()) {
        append_option(arguments, "replicaSet=" + config.replica_set);
    }
    return std::format("{}://{}:{}{}", kUriScheme, config.host, config.port, arguments);
}

std::map<std::string, std::string> parse_uri_options(const std::string& uri) {
    std::map<std::string, std::string> options;
    const auto query = uri.find('?');
    if (query == std::string::npos) return options;

    size_t pos = query + 1;
    while (pos < uri.size()) {
        size_t end = uri.find('&', pos);
        if (end == std::string::npos) end = uri.size();
        const std::string pair = uri.substr(pos, end - pos);
        const auto eq = pair.find('=');
        if (eq != std::string::npos) {
            options[pair.substr(0, eq)] = pair.substr(eq + 1);
        } else if (!pair.empty()) {
            options[pair] = "";
        }
        pos = end + 1;
    }
    return options;
}

} // namespace mongoacl
