#pragma once

#include "osync/core/clock.hpp"
#include "osync/core/result.hpp"
#include "osync/events/event_bus.hpp"
#include "osync/remote/remote_service.hpp"
#include "osync/storage/local_persistence.hpp"
#include "osync/sync/change_tracker.hpp"
#include "osync/sync/config.hpp"
#include "osync/sync/conflict.hpp"
#include "osync/sync/delta_store.hpp"
#include "osync/sync/entity_store.hpp"
#include "osync/sync/session.hpp"
#include "osync/sync/types.hpp"
#include "osync/version/feature_matrix.hpp"
#include "osync/version/version_probe.hpp"

#include <boost/asio/thread_pool.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <future>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace osync::sync {

/**
 * @brief Per-session options for SyncEngine::run()
 */
struct RunOptions {
    /// Forget the pull cursors of the session's collections and pull full snapshots.
    bool full_resync = false;

    /// Limit push and pull to these entity types. Empty means every configured
    /// collection and every pending record.
    std::vector<std::string> collections;
};

/**
 * @brief Drives push, pull and reconciliation sessions
 *
 * run() posts a session to the engine's worker thread and returns a shared
 * future; while that session runs every run() call returns the same future.
 * Sessions of all engines in the process are serialized by one mutex.
 *
 * Remotes without conditional push cannot reject a stale base revision, so
 * before pushing to them the engine pulls the collections of pending edits
 * and reconciles what changed remotely.
 *
 * cancel() and pause() are cooperative: the request being sent completes and
 * its outcome is recorded before the session stops.
 */
class SyncEngine {
public:
    SyncEngine(SyncConfig config,
               storage::LocalPersistence& persistence,
               remote::RemoteDataService& remote,
               events::EventBus& bus,
               const Clock& clock = system_clock());
    ~SyncEngine();

    SyncEngine(const SyncEngine&) = delete;
    SyncEngine& operator=(const SyncEngine&) = delete;

    /// Options are ignored when a session is already running.
    std::shared_future<SessionResult> run(RunOptions options = {});
    void cancel();
    void pause();

    [[nodiscard]] SessionState state() const noexcept { return state_.load(); }
    [[nodiscard]] bool is_syncing() const;
    [[nodiscard]] std::optional<Timestamp> last_sync_time() const;
    [[nodiscard]] std::optional<SessionResult> last_result() const;
    [[nodiscard]] std::optional<version::RemoteCapability> capability() const;
    [[nodiscard]] const SyncConfig& config() const noexcept { return config_; }

    Result<std::vector<ConflictRecord>> unresolved_conflicts() const;

    /// InvalidState while a session is running.
    Result<ConflictRecord> resolve_conflict(const std::string& conflict_id, ConflictOutcome outcome);

    ChangeTracker& tracker() noexcept { return tracker_; }
    EntityStore& entities() noexcept { return entities_; }
    DeltaStore& deltas() noexcept { return deltas_; }

private:
    struct SessionContext;

    SessionResult execute(const std::string& session_id, const RunOptions& options);
    Result<void> run_phases(SessionContext& ctx);

    Result<void> probe_phase(SessionContext& ctx);
    Result<void> check_remote_before_push(SessionContext& ctx, const std::vector<ChangeRecord>& pending);
    Result<void> push_phase(SessionContext& ctx);
    Result<void> push_chunk(SessionContext& ctx, const std::vector<ChangeRecord>& chunk);
    Result<void> pull_phase(SessionContext& ctx);
    Result<void> pull_collection(SessionContext& ctx, const std::string& collection);
    Result<void> reconcile_parked(SessionContext& ctx);
    void finalize(SessionContext& ctx, SessionResult& result);

    Result<void> transition(SessionContext& ctx, SessionState next);
    Result<void> revert_in_flight(const std::vector<ChangeRecord>& records, const std::string& reason);
    std::optional<version::FeatureId> missing_feature(const SessionContext& ctx, const std::string& entity_type) const;
    std::optional<Error> interruption(const SessionContext& ctx) const;
    std::optional<Error> wait_backoff(SessionContext& ctx, std::uint32_t attempt);
    void record_issue(SessionContext& ctx, const ChangeRecord& record, ErrorKind kind, std::string message);

    SyncConfig config_;
    const Clock& clock_;
    storage::LocalPersistence& persistence_;
    remote::RemoteDataService& remote_;
    events::EventBus& bus_;

    ChangeTracker tracker_;
    EntityStore entities_;
    DeltaStore deltas_;
    ConflictResolver resolver_;
    version::VersionProbe probe_;

    std::atomic<SessionState> state_{SessionState::Idle};
    std::atomic<bool> cancel_requested_{false};
    std::atomic<bool> pause_requested_{false};

    mutable std::mutex mutex_;
    std::condition_variable wake_;
    bool running_ = false;
    std::shared_future<SessionResult> current_;
    std::optional<SessionResult> last_result_;
    std::optional<Timestamp> last_sync_time_;
    std::optional<version::RemoteCapability> capability_;
    std::mt19937_64 rng_;

    boost::asio::thread_pool pool_{1};
};

} // namespace osync::sync
