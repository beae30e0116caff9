#pragma once

#include "db/imongo_client.hpp"
#include "tls/tls_policy.hpp"

#include <mongoc/mongoc.h>

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace mongoacl {

struct MongocUriDeleter { void operator()(mongoc_uri_t* p) const { if (p) mongoc_uri_destroy(p); } };
struct MongocClientDeleter { void operator()(mongoc_client_t* p) const { if (p) mongoc_client_destroy(p); } };
struct BsonDeleter { void operator()(bson_t* p) const { if (p) bson_destroy(p); } };

using MongocUriPtr = std::unique_ptr<mongoc_uri_t, MongocUriDeleter>;
using MongocClientPtr = std::unique_ptr<mongoc_client_t, MongocClientDeleter>;
using BsonPtr = std::unique_ptr<bson_t, BsonDeleter>;

/**
 * @brief Authentication applied to the client (never embedded in the URI)
 */
struct ClientCredentials {
    std::string username;
    std::string password;
    std::string auth_source;
};

/**
 * @brief Private on-disk copy of TLS material
 *
 * libmongoc only accepts CA and client certificates as file paths. The
 * directory is created 0700, files 0600, and everything is removed when
 * the owning client is destroyed.
 */
class TlsMaterialFiles {
public:
    [[nodiscard]] static Result<std::unique_ptr<TlsMaterialFiles>> create(const TlsPolicy& policy);

    ~TlsMaterialFiles();
    TlsMaterialFiles(const TlsMaterialFiles&) = delete;
    TlsMaterialFiles& operator=(const TlsMaterialFiles&) = delete;

    [[nodiscard]] const std::string& ca_file() const { return ca_file_; }
    [[nodiscard]] const std::string& pem_file() const { return pem_file_; }

private:
    explicit TlsMaterialFiles(std::filesystem::path dir) : dir_(std::move(dir)) {}

    std::filesystem::path dir_;
    std::string ca_file_;   // empty when no CA
    std::string pem_file_;  // empty when no client certificate
};

/**
 * @brief IMongoClient backed by libmongoc
 *
 * Construction is lazy: libmongoc does not contact the server until the
 * first command.
 */
class MongocClient : public IMongoClient {
public:
    [[nodiscard]] static Result<std::unique_ptr<MongocClient>> create(
        const std::string& uri,
        const ClientCredentials& credentials,
        const std::optional<TlsPolicy>& tls);

    ~MongocClient() override = default;
    MongocClient(const MongocClient&) = delete;
    MongocClient& operator=(const MongocClient&) = delete;

    Result<Document> run_command(const std::string& database, const Document& command,
                                 const OperationContext& ctx) override;

    Result<int64_t> delete_one(const std::string& database, const std::string& collection,
                               const Document& filter, const OperationContext& ctx) override;

private:
    MongocClient(MongocClientPtr client, std::unique_ptr<TlsMaterialFiles> tls_files)
        : tls_files_(std::move(tls_files)), client_(std::move(client)) {}

    // Declared first so the files outlive the client that references them
    std::unique_ptr<TlsMaterialFiles> tls_files_;
    MongocClientPtr client_;
};

} // namespace mongoacl
