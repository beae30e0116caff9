#include "db/mongoc_client.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <format>
#include <mutex>

#include <fcntl.h>
#include <unistd.h>

namespace mongoacl {

namespace {

constexpr const char* kAppName = "mongo-acl";

// mongoc_init() once per process, mongoc_cleanup() at exit
void ensure_mongoc_initialized() {
    static std::once_flag once;
    std::call_once(once, [] {
        mongoc_init();
        std::atexit(mongoc_cleanup);
    });
}

// Owns a stack bson_t that libmongoc always initializes (even on error)
struct ScopedReply {
    bson_t doc;
    ~ScopedReply() { bson_destroy(&doc); }
};

Result<BsonPtr> to_bson(const Document& doc) {
    std::string json;
    try {
        json = doc.dump();
    } catch (const nlohmann::json::type_error& e) {
        return Result<BsonPtr>::error(ErrorCategory::INTERNAL_ERROR,
            std::format("cannot encode command as JSON: {}", e.what()));
    }
    bson_error_t error;
    BsonPtr bson(bson_new_from_json(reinterpret_cast<const uint8_t*>(json.data()),
                                    static_cast<ssize_t>(json.size()), &error));
    if (!bson) {
        return Result<BsonPtr>::error(ErrorCategory::INTERNAL_ERROR,
            std::format("cannot encode command as BSON: {}", error.message));
    }
    return Result<BsonPtr>::ok(std::move(bson));
}

Result<Document> to_document(const bson_t* bson) {
    char* json = bson_as_relaxed_extended_json(bson, nullptr);
    if (!json) {
        return Result<Document>::error(ErrorCategory::INTERNAL_ERROR,
            "cannot decode server reply");
    }
    std::unique_ptr<char, decltype(&bson_free)> guard(json, &bson_free);
    try {
        return Result<Document>::ok(Document::parse(json));
    } catch (const nlohmann::json::parse_error& e) {
        return Result<Document>::error(ErrorCategory::INTERNAL_ERROR,
            std::format("cannot parse server reply: {}", e.what()));
    }
}

Result<std::string> write_private_file(const std::filesystem::path& path, const std::string& content) {
    const int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0600);
    if (fd < 0) {
        return Result<std::string>::error(ErrorCategory::INTERNAL_ERROR,
            std::format("cannot create {}: {}", path.string(), std::strerror(errno)));
    }
    size_t written = 0;
    while (written < content.size()) {
        const ssize_t n = ::write(fd, content.data() + written, content.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            const int saved = errno;
            ::close(fd);
            return Result<std::string>::error(ErrorCategory::INTERNAL_ERROR,
                std::format("cannot write {}: {}", path.string(), std::strerror(saved)));
        }
        written += static_cast<size_t>(n);
    }
    ::close(fd);
    return Result<std::string>::ok(path.string());
}

} // anonymous namespace

// ============================================================================
// TlsMaterialFiles
// ============================================================================

Result<std::unique_ptr<TlsMaterialFiles>> TlsMaterialFiles::create(const TlsPolicy& policy) {
    using R = Result<std::unique_ptr<TlsMaterialFiles>>;

    std::error_code ec;
    auto tmp = std::filesystem::temp_directory_path(ec);
    if (ec) tmp = "/tmp";

    std::string pattern = (tmp / "mongo-acl-XXXXXX").string();
    if (!::mkdtemp(pattern.data())) {
        return R::error(ErrorCategory::INTERNAL_ERROR,
            std::format("cannot create TLS material directory: {}", std::strerror(errno)));
    }

    std::unique_ptr<TlsMaterialFiles> files(new TlsMaterialFiles(pattern));

    const std::string ca = policy.ca_bundle_pem();
    if (!ca.empty()) {
        auto path = write_private_file(files->dir_ / kCaFileName, ca);
        if (path.is_error()) return R::error_from(path);
        files->ca_file_ = std::move(path.value());
    }

    const std::string client = policy.client_pem();
    if (!client.empty()) {
        auto path = write_private_file(files->dir_ / "client.pem", client);
        if (path.is_error()) return R::error_from(path);
        files->pem_file_ = std::move(path.value());
    }

    return R::ok(std::move(files));
}

TlsMaterialFiles::~TlsMaterialFiles() {
    std::error_code ec;
    std::filesystem::remove_all(dir_, ec);
    if (ec) {
        utils::log::warn(std::format("Cannot remove TLS material directory {}: {}",
            dir_.string(), ec.message()));
    }
}

// ============================================================================
// MongocClient
// ============================================================================

Result<std::unique_ptr<MongocClient>> MongocClient::create(
    const std::string& uri,
    const ClientCredentials& credentials,
    const std::optional<TlsPolicy>& tls) {
    using R = Result<std::unique_ptr<MongocClient>>;

    ensure_mongoc_initialized();

    bson_error_t error;
    MongocUriPtr mongo_uri(mongoc_uri_new_with_error(uri.c_str(), &error));
    if (!mongo_uri) {
        return R::error(ErrorCategory::CONFIG_ERROR,
            std::format("invalid connection URI: {}", error.message));
    }

    if (!credentials.username.empty()) {
        if (!mongoc_uri_set_username(mongo_uri.get(), credentials.username.c_str()) ||
            !mongoc_uri_set_password(mongo_uri.get(), credentials.password.c_str()) ||
            !mongoc_uri_set_auth_source(mongo_uri.get(), credentials.auth_source.c_str())) {
            return R::error(ErrorCategory::CONFIG_ERROR,
                "connection.username/password/database: rejected by driver");
        }
    }

    std::unique_ptr<TlsMaterialFiles> tls_files;
    if (tls) {
        mongoc_uri_set_option_as_bool(mongo_uri.get(), MONGOC_URI_TLS, true);
        auto files = TlsMaterialFiles::create(*tls);
        if (files.is_error()) return R::error_from(files);
        tls_files = std::move(files.value());
    }

    MongocClientPtr client(mongoc_client_new_from_uri_with_error(mongo_uri.get(), &error));
    if (!client) {
        return R::error(ErrorCategory::CONFIG_ERROR,
            std::format("cannot create client: {}", error.message));
    }
    mongoc_client_set_error_api(client.get(), MONGOC_ERROR_API_VERSION_2);
    mongoc_client_set_appname(client.get(), kAppName);

    if (tls) {
        mongoc_ssl_opt_t ssl_opts = *mongoc_ssl_opt_get_default();
        if (!tls_files->ca_file().empty()) ssl_opts.ca_file = tls_files->ca_file().c_str();
        if (!tls_files->pem_file().empty()) ssl_opts.pem_file = tls_files->pem_file().c_str();
        ssl_opts.weak_cert_validation = !tls->verify_server_certificate();
        ssl_opts.allow_invalid_hostname = !tls->verify_server_certificate();
        mongoc_client_set_ssl_opts(client.get(), &ssl_opts);
    }

    return R::ok(std::unique_ptr<MongocClient>(
        new MongocClient(std::move(client), std::move(tls_files))));
}

Result<Document> MongocClient::run_command(const std::string& database,
                                           const Document& command,
                                           const OperationContext& ctx) {
    using R = Result<Document>;

    auto guard = ctx.check(std::format("command '{}'",
        command.empty() ? std::string("?") : command.begin().key()));
    if (guard.is_error()) return R::error_from(guard);

    Document wire = command;
    if (const auto remaining = ctx.remaining_ms()) {
        wire["maxTimeMS"] = std::max<int64_t>(*remaining, 1);
    }

    auto bson = to_bson(wire);
    if (bson.is_error()) return R::error_from(bson);

    ScopedReply reply;
    bson_error_t error;
    if (!mongoc_client_command_simple(client_.get(), database.c_str(), bson.value().get(),
                                      nullptr, &reply.doc, &error)) {
        return R::error(ErrorCategory::SERVER_ERROR, error.message);
    }
    return to_document(&reply.doc);
}

Result<int64_t> MongocClient::delete_one(const std::string& database,
                                         const std::string& collection,
                                         const Document& filter,
                                         const OperationContext& ctx) {
    using R = Result<int64_t>;

    auto guard = ctx.check(std::format("delete from {}.{}", database, collection));
    if (guard.is_error()) return R::error_from(guard);

    auto bson = to_bson(filter);
    if (bson.is_error()) return R::error_from(bson);

    Document options = Document::object();
    if (const auto remaining = ctx.remaining_ms()) {
        options["maxTimeMS"] = std::max<int64_t>(*remaining, 1);
    }
    auto opts = to_bson(options);
    if (opts.is_error()) return R::error_from(opts);

    std::unique_ptr<mongoc_collection_t, decltype(&mongoc_collection_destroy)> coll(
        mongoc_client_get_collection(client_.get(), database.c_str(), collection.c_str()),
        &mongoc_collection_destroy);

    ScopedReply reply;
    bson_error_t error;
    if (!mongoc_collection_delete_one(coll.get(), bson.value().get(), opts.value().get(),
                                      &reply.doc, &error)) {
        return R::error(ErrorCategory::SERVER_ERROR, error.message);
    }

    bson_iter_t iter;
    if (bson_iter_init_find(&iter, &reply.doc, "deletedCount") && BSON_ITER_HOLDS_NUMBER(&iter)) {
        return R::ok(bson_iter_as_int64(&iter));
    }
    return R::ok(0);
}

} // namespace mongoacl
