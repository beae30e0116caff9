#include "db/connection_config.hpp"
#include "core/utils.hpp"

#include <format>

namespace mongoacl {

Result<ConnectionConfig> make_connection_config(const ConnectionSettings& settings) {
    using R = Result<ConnectionConfig>;

    if (settings.host.empty()) {
        return R::error(ErrorCategory::CONFIG_ERROR, "connection.host must not be empty");
    }
    const auto port = utils::try_parse_int<int>(settings.port);
    if (!port || *port < 1 || *port > 65535) {
        return R::error(ErrorCategory::CONFIG_ERROR,
            std::format("connection.port must be 1-65535, got '{}'", settings.port));
    }

    auto source = resolve_credential_source(settings);
    if (source.is_error()) return R::error_from(source);

    ConnectionConfig config;
    config.host = settings.host;
    config.port = settings.port;
    config.database = settings.database;
    config.username = settings.username;
    config.password = settings.password;
    config.ssl = settings.ssl;
    config.insecure_skip_verify = settings.insecure_skip_verify;
    config.replica_set = settings.replica_set;
    config.retry_writes = settings.retry_writes;
    config.credentials = std::move(source.value());
    return R::ok(std::move(config));
}

} // namespace mongoacl
