#pragma once

#include "core/error.hpp"
#include "core/operation_context.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>

namespace mongoacl {

/// Command and reply documents. Ordered: the command name must stay the first key.
using Document = nlohmann::ordered_json;

/**
 * @brief Abstract handle to a MongoDB deployment
 *
 * Owned by the caller and passed into each operation. Every call is a single
 * blocking server round trip bounded by the operation context.
 * Implementations are not thread-safe.
 */
class IMongoClient {
public:
    virtual ~IMongoClient() = default;

    /**
     * @brief Run a database command
     * @param database Database the command runs against
     * @param command Command document (first key is the command name)
     * @param ctx Cancellation context; its deadline is forwarded as maxTimeMS
     * @return Server reply, or SERVER_ERROR carrying the server's message
     */
    [[nodiscard]] virtual Result<Document> run_command(
        const std::string& database, const Document& command,
        const OperationContext& ctx) = 0;

    /**
     * @brief Delete at most one document matching `filter`
     * @return Number of documents deleted (0 or 1)
     */
    [[nodiscard]] virtual Result<int64_t> delete_one(
        const std::string& database, const std::string& collection,
        const Document& filter, const OperationContext& ctx) = 0;
};

} // namespace mongoacl
