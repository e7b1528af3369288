#pragma once

/**
 * @file memory_remote.hpp
 * @brief In-process RemoteDataService
 *
 * WHY THIS FILE EXISTS:
 * Offline-first behavior is only interesting when the network misbehaves.
 * This remote keeps entities in memory and lets tests and demos inject the
 * failures a real deployment sees: unreachable service, expired credentials,
 * lost acknowledgements, transient per-record errors, validation rejections
 * and concurrent edits by other clients.
 *
 * SEMANTICS:
 * - Revisions are per-entity counters rendered as strings ("1", "2", ...)
 * - Delta tokens are positions in a global change log; "" means snapshot
 * - Duplicate client_ids are answered from the stored outcome, not re-applied
 * - A conditional push checks base revisions against the state before the
 *   request, so several queued edits of one entity can share a batch
 * - A Delete keeps a tombstone so later pulls report the deletion
 *
 * THREAD SAFETY:
 * Every method locks one internal mutex. Injected latency is slept outside it.
 */

#include "osync/core/clock.hpp"
#include "osync/remote/remote_service.hpp"

#include <atomic>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <unordered_map>

namespace osync::remote {

class InMemoryRemoteService : public RemoteDataService {
public:
    /// Returns a rejection message for records the remote refuses.
    using Validator = std::function<std::optional<std::string>(const sync::ChangeRecord&)>;

    explicit InMemoryRemoteService(const Clock& clock, std::string version = "2.40.0");

    Result<std::string> get_server_info(std::chrono::milliseconds timeout) override;
    Result<DeltaBatch> fetch_deltas(const std::string& collection,
                                    const std::string& token,
                                    std::chrono::milliseconds timeout) override;
    Result<std::vector<PushOutcome>> push_batch(const PushRequest& request,
                                                std::chrono::milliseconds timeout) override;

    // ─── Remote-side state ──────────────────────────────

    /// Write by another client. Returns the stored record with its new revision.
    sync::RemoteRecord put_remote(const std::string& entity_type,
                                  const std::string& entity_id,
                                  sync::json payload,
                                  std::optional<Timestamp> last_updated = std::nullopt);
    sync::RemoteRecord delete_remote(const std::string& entity_type,
                                     const std::string& entity_id,
                                     std::optional<Timestamp> last_updated = std::nullopt);

    std::optional<sync::RemoteRecord> get(const std::string& entity_type, const std::string& entity_id) const;
    std::vector<sync::RemoteRecord> list(const std::string& entity_type) const;

    // ─── Failure injection ──────────────────────────────

    void set_version(std::string version);
    void set_reachable(bool reachable);
    void set_auth_valid(bool valid);
    void set_latency(std::chrono::milliseconds latency);
    void set_page_size(std::size_t page_size);
    void set_validator(Validator validator);

    void fail_next_probes(std::size_t count, ErrorKind kind = ErrorKind::Network);
    void fail_next_pulls(std::size_t count, ErrorKind kind = ErrorKind::Network);
    void fail_next_pushes(std::size_t count, ErrorKind kind = ErrorKind::Network);

    /// The next `count` records answer TransientError without being applied.
    void fail_next_records(std::size_t count);

    /// The next `count` push requests are applied but answered with a Network error.
    void drop_next_acks(std::size_t count);

    // ─── Observation ────────────────────────────────────

    std::size_t apply_count() const;
    std::size_t push_calls() const;
    std::size_t fetch_calls() const;
    std::vector<std::size_t> push_batch_sizes() const;
    std::vector<std::string> requested_tokens() const;

private:
    struct Stored {
        sync::RemoteRecord record;
        std::uint64_t change_index = 0;
        std::uint64_t revision = 0;
    };

    using EntityKey = std::pair<std::string, std::string>;

    /// Per-request bookkeeping: entities stopped early, and revisions before the request wrote them.
    struct BatchState {
        std::set<EntityKey> halted;
        std::map<EntityKey, std::string> revision_before;
    };

    Result<void> enter_locked(std::size_t& injected, ErrorKind kind, const char* what);
    void simulate_latency(std::chrono::milliseconds timeout, bool& timed_out) const;
    sync::RemoteRecord write_locked(const std::string& entity_type,
                                    const std::string& entity_id,
                                    sync::json payload,
                                    bool deleted,
                                    Timestamp last_updated,
                                    const std::string& origin_client_id);
    PushOutcome apply_locked(const sync::ChangeRecord& record, bool conditional, BatchState& state);

    const Clock& clock_;
    mutable std::mutex mutex_;

    std::string version_;
    bool reachable_ = true;
    bool auth_valid_ = true;
    std::chrono::milliseconds latency_{0};
    std::size_t page_size_ = 100;
    Validator validator_;

    std::size_t failing_probes_ = 0;
    ErrorKind probe_failure_ = ErrorKind::Network;
    std::size_t failing_pulls_ = 0;
    ErrorKind pull_failure_ = ErrorKind::Network;
    std::size_t failing_pushes_ = 0;
    ErrorKind push_failure_ = ErrorKind::Network;
    std::size_t failing_records_ = 0;
    std::size_t dropped_acks_ = 0;

    std::map<EntityKey, Stored> entities_;
    std::unordered_map<std::string, PushOutcome> applied_; ///< client_id → outcome
    std::uint64_t change_counter_ = 0;

    std::size_t apply_count_ = 0;
    std::size_t push_calls_ = 0;
    std::size_t fetch_calls_ = 0;
    std::vector<std::size_t> push_batch_sizes_;
    std::vector<std::string> requested_tokens_;
};

} // namespace osync::remote
