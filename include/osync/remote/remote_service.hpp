#pragma once

#include "osync/core/result.hpp"
#include "osync/sync/types.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace osync::remote {

/**
 * @brief One page of a delta pull
 */
struct DeltaBatch {
    std::vector<sync::RemoteRecord> records;
    std::string next_token; ///< Resume point after this page
    bool has_more = false;
};

/**
 * @brief Records submitted in one push request
 *
 * With `conditional` set the remote rejects any record whose base_revision
 * is not the entity's current revision (PushOutcome::Kind::Conflict).
 */
struct PushRequest {
    std::vector<sync::ChangeRecord> records;
    bool conditional = false;
};

/**
 * @brief Per-record answer to a push
 *
 * The remote processes each entity's records in order and stops at the first
 * one it does not accept; the entity's remaining records come back Deferred.
 */
struct PushOutcome {
    enum class Kind {
        Acked,
        ValidationError,
        TransientError,
        Conflict,
        Deferred
    };

    Kind kind = Kind::Acked;
    std::uint64_t sequence = 0;
    std::string client_id;
    std::string revision;   ///< Acked only
    Timestamp last_updated = 0;
    std::string message;
};

const char* to_string(PushOutcome::Kind kind) noexcept;

/**
 * @brief The remote data service as seen by the sync engine
 *
 * Request-level failures come back as Error values: Network for transport
 * problems and timeouts, Auth for rejected credentials. Implementations must
 * treat a record whose client_id they already applied as a duplicate and
 * answer with the original outcome.
 */
class RemoteDataService {
public:
    virtual ~RemoteDataService() = default;

    /// Version string of the remote, e.g. "2.40.1".
    virtual Result<std::string> get_server_info(std::chrono::milliseconds timeout) = 0;

    /// Changes of `collection` after `token`; an empty token asks for a full snapshot.
    virtual Result<DeltaBatch> fetch_deltas(const std::string& collection,
                                            const std::string& token,
                                            std::chrono::milliseconds timeout) = 0;

    /// One outcome per submitted record, in request order.
    virtual Result<std::vector<PushOutcome>> push_batch(const PushRequest& request,
                                                        std::chrono::milliseconds timeout) = 0;
};

} // namespace osync::remote
