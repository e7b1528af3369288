#include "osync/sync/engine.hpp"

#include "osync/core/ids.hpp"
#include "osync/events/events.hpp"

#include <boost/asio/post.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <map>
#include <set>
#include <utility>

namespace osync::sync {
namespace {

using EntityKey = std::pair<std::string, std::string>;

/// One session at a time across every engine in the process.
std::mutex& session_mutex() {
    static std::mutex mutex;
    return mutex;
}

EntityKey entity_key(const ChangeRecord& record) {
    return {record.entity_type, record.entity_id};
}

} // namespace

struct SyncEngine::SessionContext {
    SessionContext(std::string session_id, const Clock& clock)
        : session(std::move(session_id), clock) {}

    SyncSession session;
    version::RemoteCapability capability;
    version::ProtocolVariant protocol;
    std::vector<SyncIssue> issues;
    std::map<EntityKey, ErrorKind> halted; ///< Entities whose remaining records wait for the next session
    std::size_t pending_total = 0;
    std::optional<std::chrono::steady_clock::time_point> deadline;

    std::set<std::string> scope;          ///< Entity types of a RunOptions subset; empty for all
    std::vector<std::string> collections; ///< Collections pulled this session
    bool full_resync = false;

    bool in_scope(const std::string& entity_type) const {
        return scope.empty() || scope.count(entity_type) != 0;
    }
};

SyncEngine::SyncEngine(SyncConfig config,
                       storage::LocalPersistence& persistence,
                       remote::RemoteDataService& remote,
                       events::EventBus& bus,
                       const Clock& clock)
    : config_(std::move(config)),
      clock_(clock),
      persistence_(persistence),
      remote_(remote),
      bus_(bus),
      tracker_(persistence, clock),
      entities_(persistence),
      deltas_(persistence, clock),
      resolver_(persistence, tracker_, clock),
      probe_(remote, clock, config_.request_timeout),
      rng_(std::random_device{}()) {}

SyncEngine::~SyncEngine() {
    cancel();
    pool_.join();
}

std::shared_future<SessionResult> SyncEngine::run(RunOptions options) {
    std::lock_guard lock(mutex_);
    if (running_) {
        return current_;
    }

    cancel_requested_ = false;
    pause_requested_ = false;
    running_ = true;

    const auto session_id = generate_uuid();
    auto task = std::make_shared<std::packaged_task<SessionResult()>>(
        [this, session_id, options = std::move(options)] { return execute(session_id, options); });
    current_ = task->get_future().share();
    boost::asio::post(pool_, [task] { (*task)(); });
    return current_;
}

void SyncEngine::cancel() {
    cancel_requested_ = true;
    std::lock_guard lock(mutex_);
    wake_.notify_all();
}

void SyncEngine::pause() {
    pause_requested_ = true;
    std::lock_guard lock(mutex_);
    wake_.notify_all();
}

bool SyncEngine::is_syncing() const {
    std::lock_guard lock(mutex_);
    return running_;
}

std::optional<Timestamp> SyncEngine::last_sync_time() const {
    std::lock_guard lock(mutex_);
    return last_sync_time_;
}

std::optional<SessionResult> SyncEngine::last_result() const {
    std::lock_guard lock(mutex_);
    return last_result_;
}

std::optional<version::RemoteCapability> SyncEngine::capability() const {
    std::lock_guard lock(mutex_);
    return capability_;
}

Result<std::vector<ConflictRecord>> SyncEngine::unresolved_conflicts() const {
    return resolver_.unresolved();
}

Result<ConflictRecord> SyncEngine::resolve_conflict(const std::string& conflict_id, ConflictOutcome outcome) {
    std::unique_lock session_lock(session_mutex(), std::try_to_lock);
    if (!session_lock.owns_lock()) {
        return Err<ConflictRecord>(ErrorKind::InvalidState, "cannot resolve conflicts while a sync session runs");
    }

    auto resolved = resolver_.resolve(conflict_id, outcome);
    if (resolved.is_ok()) {
        bus_.emit(events::ConflictResolvedEvent{"", resolved.value(), clock_.now()});
    }
    return resolved;
}

SessionResult SyncEngine::execute(const std::string& session_id, const RunOptions& options) {
    std::unique_lock session_lock(session_mutex());

    SessionContext ctx(session_id, clock_);
    if (config_.session_timeout.count() > 0) {
        ctx.deadline = std::chrono::steady_clock::now() + config_.session_timeout;
    }
    ctx.full_resync = options.full_resync;
    ctx.scope.insert(options.collections.begin(), options.collections.end());
    ctx.collections = options.collections.empty() ? config_.collections : options.collections;

    SessionResult result;
    result.session_id = session_id;
    result.started_at = clock_.now();

    // Whatever escapes a phase still ends the session through finalize(), so run() stays usable.
    Result<void> status = Ok();
    try {
        status = run_phases(ctx);
    } catch (const std::exception& e) {
        spdlog::error("[SyncEngine] session={} aborted by exception: {}", session_id, e.what());
        status = Err<void>(ErrorKind::InvalidState, std::string("session aborted: ") + e.what());
    } catch (...) {
        spdlog::error("[SyncEngine] session={} aborted by a non-standard exception", session_id);
        status = Err<void>(ErrorKind::InvalidState, "session aborted by a non-standard exception");
    }
    if (status.is_ok()) {
        result.outcome = SessionOutcome::Completed;
    } else {
        const auto& error = status.error();
        result.error = error;
        const auto previous = ctx.session.state();

        Result<void> moved = Ok();
        if (error.kind == ErrorKind::Auth || (error.kind == ErrorKind::Cancelled && pause_requested_)) {
            result.outcome = SessionOutcome::Paused;
            moved = ctx.session.mark_paused(error.message);
        } else if (error.kind == ErrorKind::Cancelled) {
            result.outcome = SessionOutcome::Cancelled;
        } else if (error.kind == ErrorKind::Timeout) {
            result.outcome = SessionOutcome::TimedOut;
        } else {
            result.outcome = SessionOutcome::Failed;
            moved = ctx.session.mark_failed(error.message);
        }
        if (moved.is_error()) {
            spdlog::warn("[SyncEngine] session={} {}", session_id, moved.error().message);
        }
        if (ctx.session.state() != previous) {
            state_ = ctx.session.state();
            bus_.emit(events::SyncStateChangedEvent{session_id, previous, ctx.session.state(), clock_.now()});
        }
        spdlog::warn("[SyncEngine] session={} ended {}: {}", session_id, to_string(result.outcome), error.message);
    }

    finalize(ctx, result);
    return result;
}

Result<void> SyncEngine::run_phases(SessionContext& ctx) {
    if (auto res = ctx.session.start(); res.is_error()) {
        return res;
    }
    state_ = SessionState::Probing;
    bus_.emit(events::SyncStateChangedEvent{ctx.session.session_id(), SessionState::Idle,
                                            SessionState::Probing, clock_.now()});

    for (const auto& collection : ctx.scope) {
        if (std::find(config_.collections.begin(), config_.collections.end(), collection) ==
            config_.collections.end()) {
            return Err<void>(ErrorKind::InvalidArgument, "collection '" + collection + "' is not configured");
        }
    }

    auto recovered = tracker_.recover();
    if (recovered.is_error()) {
        return Err<void>(recovered.error());
    }
    auto pending = tracker_.pending_count();
    if (pending.is_error()) {
        return Err<void>(pending.error());
    }
    bus_.emit(events::SyncSessionStartedEvent{ctx.session.session_id(), pending.value(), clock_.now()});

    if (auto res = probe_phase(ctx); res.is_error()) {
        return res;
    }
    if (auto stop = interruption(ctx)) {
        return Err<void>(*stop);
    }

    if (ctx.full_resync) {
        for (const auto& collection : ctx.collections) {
            if (auto res = deltas_.reset_cursor(collection); res.is_error()) {
                return res;
            }
        }
        spdlog::info("[SyncEngine] session={} full resync of {} collection(s)", ctx.session.session_id(),
                     ctx.collections.size());
    }

    if (auto res = transition(ctx, SessionState::Pushing); res.is_error()) {
        return res;
    }
    if (auto res = push_phase(ctx); res.is_error()) {
        return res;
    }
    if (auto stop = interruption(ctx)) {
        return Err<void>(*stop);
    }

    if (auto res = transition(ctx, SessionState::Pulling); res.is_error()) {
        return res;
    }
    if (auto res = pull_phase(ctx); res.is_error()) {
        return res;
    }

    if (auto res = transition(ctx, SessionState::Reconciling); res.is_error()) {
        return res;
    }
    return reconcile_parked(ctx);
}

Result<void> SyncEngine::probe_phase(SessionContext& ctx) {
    auto probed = probe_.probe();
    if (probed.is_ok()) {
        ctx.capability = probed.value();
        if (auto res = deltas_.save_capability(ctx.capability); res.is_error()) {
            spdlog::warn("[SyncEngine] failed to cache capability: {}", res.error().message);
        }
    } else if (probed.error().kind == ErrorKind::Auth) {
        return Err<void>(probed.error());
    } else {
        auto cached = deltas_.load_capability();
        if (cached.is_error()) {
            spdlog::warn("[SyncEngine] cached capability unreadable: {}", cached.error().message);
        }
        ctx.capability = probe_.fallback(cached.is_ok() ? cached.value() : std::nullopt);
        spdlog::warn("[SyncEngine] version probe failed ({}); assuming {}", probed.error().message,
                     ctx.capability.version().to_string());
    }

    ctx.protocol = version::FeatureMatrix::select_protocol(ctx.capability, config_.batch_size);
    {
        std::lock_guard lock(mutex_);
        capability_ = ctx.capability;
    }
    spdlog::info("[SyncEngine] remote {}{}: batch={} delta_pull={} conditional_push={}",
                 ctx.capability.version().to_string(), ctx.capability.stale ? " (stale)" : "",
                 ctx.protocol.batch_size, ctx.protocol.delta_pull, ctx.protocol.conditional_push);
    return Ok();
}

Result<void> SyncEngine::check_remote_before_push(SessionContext& ctx, const std::vector<ChangeRecord>& pending) {
    std::set<std::string> collections;
    for (const auto& record : pending) {
        // Creates have nothing on the remote to collide with.
        if (!record.base_revision.empty() && ctx.in_scope(record.entity_type) &&
            !missing_feature(ctx, record.entity_type)) {
            collections.insert(record.entity_type);
        }
    }
    if (collections.empty()) {
        return Ok();
    }

    spdlog::info("[SyncEngine] remote {} cannot reject stale edits; pulling {} collection(s) before pushing",
                 ctx.capability.version().to_string(), collections.size());
    for (const auto& collection : collections) {
        if (auto stop = interruption(ctx)) {
            return Err<void>(*stop);
        }
        if (auto res = pull_collection(ctx, collection); res.is_error()) {
            return res;
        }
    }
    return reconcile_parked(ctx);
}

Result<void> SyncEngine::push_phase(SessionContext& ctx) {
    auto snapshot = tracker_.snapshot_pending();
    if (snapshot.is_error()) {
        return Err<void>(snapshot.error());
    }
    if (!ctx.protocol.conditional_push) {
        if (auto res = check_remote_before_push(ctx, snapshot.value()); res.is_error()) {
            return res;
        }
        // Reconciliation may have dropped or requeued records.
        snapshot = tracker_.snapshot_pending();
        if (snapshot.is_error()) {
            return Err<void>(snapshot.error());
        }
    }

    std::vector<ChangeRecord> records;
    for (auto& record : snapshot.value()) {
        if (ctx.in_scope(record.entity_type)) {
            records.push_back(std::move(record));
        }
    }
    ctx.pending_total = records.size();

    std::map<EntityKey, bool> blocked;
    std::vector<ChangeRecord> chunk;
    for (const auto& record : records) {
        const auto key = entity_key(record);

        if (auto it = ctx.halted.find(key); it != ctx.halted.end()) {
            record_issue(ctx, record, it->second, "deferred behind an earlier change of the entity");
            ++ctx.session.stats().skipped;
            continue;
        }

        if (auto feature = missing_feature(ctx, record.entity_type)) {
            record_issue(ctx, record, ErrorKind::VersionIncompatible,
                         std::string("requires ") + version::FeatureMatrix::feature_name(*feature) +
                         ", remote is " + ctx.capability.version().to_string());
            ++ctx.session.stats().skipped;
            ctx.halted[key] = ErrorKind::VersionIncompatible;
            continue;
        }

        auto known = blocked.find(key);
        if (known == blocked.end()) {
            auto queue = tracker_.entity_queue(record.entity_type, record.entity_id);
            if (queue.is_error()) {
                return Err<void>(queue.error());
            }
            const bool conflicted = std::any_of(queue.value().begin(), queue.value().end(),
                [](const ChangeRecord& r) { return r.status == ChangeStatus::Conflicted; });
            const bool failed = std::any_of(queue.value().begin(), queue.value().end(),
                [](const ChangeRecord& r) { return r.status == ChangeStatus::Failed; });
            known = blocked.emplace(key, conflicted || failed).first;
            if (conflicted || failed) {
                ctx.halted[key] = conflicted ? ErrorKind::ConflictUnresolved : ErrorKind::Validation;
            }
        }
        if (known->second) {
            const auto kind = ctx.halted[key];
            record_issue(ctx, record, kind,
                         kind == ErrorKind::ConflictUnresolved ? "entity waits for conflict resolution"
                                                               : "entity blocked by a rejected change");
            ++ctx.session.stats().skipped;
            continue;
        }

        chunk.push_back(record);
        if (chunk.size() >= ctx.protocol.batch_size) {
            if (auto stop = interruption(ctx)) {
                return Err<void>(*stop);
            }
            if (auto res = push_chunk(ctx, chunk); res.is_error()) {
                return res;
            }
            chunk.clear();
        }
    }

    if (!chunk.empty()) {
        if (auto stop = interruption(ctx)) {
            return Err<void>(*stop);
        }
        return push_chunk(ctx, chunk);
    }
    return Ok();
}

Result<void> SyncEngine::push_chunk(SessionContext& ctx, const std::vector<ChangeRecord>& chunk) {
    std::vector<ChangeRecord> in_flight;
    for (const auto& record : chunk) {
        // An entity may have been halted by an earlier outcome of this chunk's predecessors.
        if (auto it = ctx.halted.find(entity_key(record)); it != ctx.halted.end()) {
            record_issue(ctx, record, it->second, "deferred behind an earlier change of the entity");
            ++ctx.session.stats().skipped;
            continue;
        }
        if (auto res = tracker_.mark_in_flight(record.sequence); res.is_error()) {
            if (auto reverted = revert_in_flight(in_flight, res.error().message); reverted.is_error()) {
                spdlog::error("[SyncEngine] {}", reverted.error().message);
            }
            return res;
        }
        // Earlier acks may have rebased the record since the snapshot.
        auto current = tracker_.get(record.sequence);
        if (current.is_error()) {
            in_flight.push_back(record);
            if (auto reverted = revert_in_flight(in_flight, current.error().message); reverted.is_error()) {
                spdlog::error("[SyncEngine] {}", reverted.error().message);
            }
            return Err<void>(current.error());
        }
        in_flight.push_back(current.value());
    }

    const auto policy = config_.retry_policy();
    std::uint32_t retries = 0;
    while (!in_flight.empty()) {
        remote::PushRequest request{in_flight, ctx.protocol.conditional_push};
        auto response = remote_.push_batch(request, config_.request_timeout);

        std::vector<ChangeRecord> retry;
        std::string retry_reason;
        std::set<EntityKey> transient; ///< Entities whose records go out again with the retry
        if (response.is_error()) {
            const auto& error = response.error();
            if (!error.retryable()) {
                if (auto reverted = revert_in_flight(in_flight, error.message); reverted.is_error()) {
                    spdlog::error("[SyncEngine] {}", reverted.error().message);
                }
                return Err<void>(error);
            }
            retry = in_flight;
            retry_reason = error.message;
        } else {
            std::map<std::uint64_t, const remote::PushOutcome*> by_sequence;
            for (const auto& outcome : response.value()) {
                by_sequence[outcome.sequence] = &outcome;
            }

            for (const auto& record : in_flight) {
                const auto found = by_sequence.find(record.sequence);
                if (found == by_sequence.end()) {
                    retry.push_back(record);
                    retry_reason = "no outcome reported for seq " + std::to_string(record.sequence);
                    continue;
                }
                const auto& outcome = *found->second;
                const auto key = entity_key(record);

                Result<void> marked = Ok();
                switch (outcome.kind) {
                    case remote::PushOutcome::Kind::Acked:
                        marked = tracker_.mark_acked(record.sequence, outcome.revision, outcome.last_updated);
                        ++ctx.session.stats().pushed;
                        break;
                    case remote::PushOutcome::Kind::ValidationError:
                        marked = tracker_.mark_failed(record.sequence, outcome.message);
                        ++ctx.session.stats().failed;
                        ctx.halted[key] = ErrorKind::Validation;
                        record_issue(ctx, record, ErrorKind::Validation, outcome.message);
                        bus_.emit(events::ChangeRecordFailedEvent{ctx.session.session_id(), record.sequence,
                                                                  record.entity_type, record.entity_id,
                                                                  ErrorKind::Validation, outcome.message,
                                                                  clock_.now()});
                        break;
                    case remote::PushOutcome::Kind::Conflict:
                        // Stays Pending; the pull brings the remote value for reconciliation.
                        marked = tracker_.mark_pending(record.sequence, outcome.message);
                        ctx.halted[key] = ErrorKind::ConflictUnresolved;
                        break;
                    case remote::PushOutcome::Kind::Deferred: {
                        if (transient.count(key) != 0) {
                            // Held back behind a transient failure; stays InFlight for the retry.
                            retry.push_back(record);
                            break;
                        }
                        marked = tracker_.mark_pending(record.sequence, outcome.message);
                        const auto halted = ctx.halted.find(key);
                        const auto kind = halted != ctx.halted.end() ? halted->second : ErrorKind::Network;
                        ctx.halted.emplace(key, kind);
                        record_issue(ctx, record, kind, "deferred by remote: " + outcome.message);
                        ++ctx.session.stats().skipped;
                        break;
                    }
                    case remote::PushOutcome::Kind::TransientError:
                        transient.insert(key);
                        retry.push_back(record);
                        retry_reason = outcome.message;
                        break;
                }
                if (marked.is_error()) {
                    return marked;
                }
            }
        }

        bus_.emit(events::SyncProgressEvent{ctx.session.session_id(), SessionState::Pushing,
                                            chunk.front().entity_type, ctx.session.stats().pushed,
                                            ctx.pending_total, clock_.now()});

        in_flight = std::move(retry);
        if (in_flight.empty()) {
            break;
        }
        if (policy.exhausted(retries)) {
            for (const auto& record : in_flight) {
                record_issue(ctx, record, ErrorKind::Network, retry_reason);
            }
            if (auto reverted = revert_in_flight(in_flight, retry_reason); reverted.is_error()) {
                spdlog::error("[SyncEngine] {}", reverted.error().message);
            }
            return Err<void>(ErrorKind::Network, "push gave up after " + std::to_string(retries) +
                                                 " retries: " + retry_reason);
        }
        ++retries;
        spdlog::debug("[SyncEngine] retrying {} record(s), attempt {}: {}", in_flight.size(), retries, retry_reason);
        if (auto stop = wait_backoff(ctx, retries)) {
            if (auto reverted = revert_in_flight(in_flight, stop->message); reverted.is_error()) {
                spdlog::error("[SyncEngine] {}", reverted.error().message);
            }
            return Err<void>(*stop);
        }
        for (auto& record : in_flight) {
            // Each retry is another attempt; the copy is refreshed because acks may have rebased it.
            auto marked = tracker_.mark_in_flight(record.sequence);
            auto current = marked.is_ok() ? tracker_.get(record.sequence) : Err<ChangeRecord>(marked.error());
            if (current.is_error()) {
                if (auto reverted = revert_in_flight(in_flight, current.error().message); reverted.is_error()) {
                    spdlog::error("[SyncEngine] {}", reverted.error().message);
                }
                return Err<void>(current.error());
            }
            record = current.value();
        }
    }
    return Ok();
}

Result<void> SyncEngine::pull_phase(SessionContext& ctx) {
    for (const auto& collection : ctx.collections) {
        if (auto stop = interruption(ctx)) {
            return Err<void>(*stop);
        }

        if (auto feature = missing_feature(ctx, collection)) {
            SyncIssue issue;
            issue.entity_type = collection;
            issue.kind = ErrorKind::VersionIncompatible;
            issue.message = std::string("pull skipped, requires ") + version::FeatureMatrix::feature_name(*feature);
            ctx.issues.push_back(std::move(issue));
            continue;
        }

        if (auto res = pull_collection(ctx, collection); res.is_error()) {
            return res;
        }
    }
    return Ok();
}

Result<void> SyncEngine::pull_collection(SessionContext& ctx, const std::string& collection) {
    auto cursor = deltas_.get_cursor(collection);
    if (cursor.is_error()) {
        return Err<void>(cursor.error());
    }
    std::string token = ctx.protocol.delta_pull && cursor.value() ? cursor.value()->token : std::string();

    const auto policy = config_.retry_policy();
    std::size_t pulled = 0;
    for (;;) {
        if (auto stop = interruption(ctx)) {
            return Err<void>(*stop);
        }

        auto page = remote_.fetch_deltas(collection, token, config_.request_timeout);
        std::uint32_t retries = 0;
        while (page.is_error() && page.error().retryable()) {
            if (policy.exhausted(retries)) {
                return Err<void>(ErrorKind::Network, "pull of " + collection + " gave up after " +
                                                     std::to_string(retries) + " retries: " +
                                                     page.error().message);
            }
            ++retries;
            if (auto stop = wait_backoff(ctx, retries)) {
                return Err<void>(*stop);
            }
            page = remote_.fetch_deltas(collection, token, config_.request_timeout);
        }
        if (page.is_error()) {
            return Err<void>(page.error());
        }
        const auto& delta = page.value();

        storage::WriteBatch tail;
        // A newer pull supersedes whatever an earlier session parked for the entity.
        for (const auto& record : delta.records) {
            deltas_.stage_unpark(tail, record.entity_type, record.entity_id);
        }
        if (!delta.next_token.empty()) {
            auto staged = deltas_.stage_cursor(tail, collection, delta.next_token);
            if (staged.is_error()) {
                return Err<void>(staged.error());
            }
        }

        auto parked = tracker_.apply_pulled(delta.records,
            [this](storage::WriteBatch& batch, const RemoteRecord& record) {
                deltas_.stage_park(batch, record);
            },
            tail);
        if (parked.is_error()) {
            return Err<void>(parked.error());
        }

        pulled += delta.records.size();
        ctx.session.stats().pulled += delta.records.size();
        bus_.emit(events::SyncProgressEvent{ctx.session.session_id(), SessionState::Pulling, collection,
                                            pulled, 0, clock_.now()});

        if (!delta.has_more) {
            break;
        }
        if (delta.next_token.empty()) {
            return Err<void>(ErrorKind::InvalidState, "remote reported more " + collection + " without a token");
        }
        token = delta.next_token;
    }

    spdlog::debug("[SyncEngine] pulled {} record(s) of {}", pulled, collection);
    return Ok();
}

Result<void> SyncEngine::reconcile_parked(SessionContext& ctx) {
    auto parked = deltas_.parked();
    if (parked.is_error()) {
        return Err<void>(parked.error());
    }

    for (const auto& remote : parked.value()) {
        if (auto stop = interruption(ctx)) {
            return Err<void>(*stop);
        }

        storage::WriteBatch unpark;
        deltas_.stage_unpark(unpark, remote.entity_type, remote.entity_id);

        auto queue = tracker_.entity_queue(remote.entity_type, remote.entity_id);
        if (queue.is_error()) {
            return Err<void>(queue.error());
        }
        const auto& records = queue.value();

        if (records.empty()) {
            auto applied = tracker_.apply_pulled({remote},
                [this](storage::WriteBatch& batch, const RemoteRecord& record) {
                    deltas_.stage_park(batch, record);
                },
                unpark);
            if (applied.is_error()) {
                return Err<void>(applied.error());
            }
            continue;
        }

        const bool blocked = std::any_of(records.begin(), records.end(), [](const ChangeRecord& r) {
            return r.status == ChangeStatus::Conflicted || r.status == ChangeStatus::Failed;
        });
        if (blocked) {
            // Stays parked until the entity is unblocked.
            continue;
        }

        const auto oldest = std::find_if(records.begin(), records.end(), [](const ChangeRecord& r) {
            return r.status == ChangeStatus::Pending;
        });
        if (oldest == records.end()) {
            continue;
        }

        if (oldest->base_revision == remote.revision) {
            if (auto res = persistence_.commit(unpark); res.is_error()) {
                return res;
            }
            continue;
        }

        auto cursor = deltas_.get_cursor(remote.entity_type);
        const std::string cursor_token = cursor.is_ok() && cursor.value() ? cursor.value()->token : std::string();

        auto conflict = resolver_.reconcile(*oldest, remote, config_.conflict_policy, cursor_token, unpark);
        if (conflict.is_error()) {
            return Err<void>(conflict.error());
        }
        ++ctx.session.stats().conflicted;

        const auto& record = conflict.value();
        bus_.emit(events::ConflictDetectedEvent{ctx.session.session_id(), record, clock_.now()});
        if (record.outcome == ConflictOutcome::Unresolved) {
            record_issue(ctx, *oldest, ErrorKind::ConflictUnresolved,
                         "conflict " + record.id + " waits for manual resolution");
        } else {
            bus_.emit(events::ConflictResolvedEvent{ctx.session.session_id(), record, clock_.now()});
        }
    }
    return Ok();
}

void SyncEngine::finalize(SessionContext& ctx, SessionResult& result) {
    const auto& session_id = ctx.session.session_id();

    if (auto collected = tracker_.collect_garbage(); collected.is_error()) {
        spdlog::warn("[SyncEngine] session={} garbage collection failed: {}", session_id,
                     collected.error().message);
    }
    if (auto collected = resolver_.collect_resolved(); collected.is_error()) {
        spdlog::warn("[SyncEngine] session={} conflict cleanup failed: {}", session_id,
                     collected.error().message);
    }

    std::set<std::string> unresolved;
    if (auto conflicts = resolver_.unresolved(); conflicts.is_ok()) {
        for (const auto& conflict : conflicts.value()) {
            unresolved.insert(conflict.entity_id);
        }
    }
    std::set<std::string> failed;
    if (auto records = tracker_.records(ChangeStatus::Failed); records.is_ok()) {
        for (const auto& record : records.value()) {
            failed.insert(record.entity_id);
        }
    }

    result.finished_at = clock_.now();
    result.stats = ctx.session.stats();
    result.issues = std::move(ctx.issues);
    result.unresolved_entities.assign(unresolved.begin(), unresolved.end());
    result.failed_entities.assign(failed.begin(), failed.end());
    result.capability = ctx.capability;

    if (auto archived = deltas_.archive_session(result); archived.is_error()) {
        spdlog::error("[SyncEngine] session={} could not be archived: {}", session_id, archived.error().message);
    }

    const auto previous = ctx.session.state();
    ctx.session.finish();
    state_ = SessionState::Idle;
    bus_.emit(events::SyncStateChangedEvent{session_id, previous, SessionState::Idle, clock_.now()});

    {
        std::lock_guard lock(mutex_);
        last_result_ = result;
        if (result.succeeded()) {
            last_sync_time_ = result.finished_at;
        }
        running_ = false;
    }

    spdlog::info("[SyncEngine] session={} {} pushed={} pulled={} conflicted={} failed={} skipped={}",
                 session_id, to_string(result.outcome), result.stats.pushed, result.stats.pulled,
                 result.stats.conflicted, result.stats.failed, result.stats.skipped);
    bus_.emit(events::SyncSessionCompletedEvent{result, clock_.now()});
}

Result<void> SyncEngine::transition(SessionContext& ctx, SessionState next) {
    const auto previous = ctx.session.state();
    if (auto res = ctx.session.transition_to(next); res.is_error()) {
        return res;
    }
    state_ = next;
    bus_.emit(events::SyncStateChangedEvent{ctx.session.session_id(), previous, next, clock_.now()});
    return Ok();
}

Result<void> SyncEngine::revert_in_flight(const std::vector<ChangeRecord>& records, const std::string& reason) {
    Result<void> first = Ok();
    for (const auto& record : records) {
        auto res = tracker_.mark_pending(record.sequence, reason);
        if (res.is_error() && first.is_ok()) {
            first = res;
        }
    }
    return first;
}

std::optional<version::FeatureId> SyncEngine::missing_feature(const SessionContext& ctx,
                                                              const std::string& entity_type) const {
    const auto feature = config_.required_features.find(entity_type);
    if (feature == config_.required_features.end() ||
        version::FeatureMatrix::supports(feature->second, ctx.capability)) {
        return std::nullopt;
    }
    return feature->second;
}

std::optional<Error> SyncEngine::interruption(const SessionContext& ctx) const {
    if (pause_requested_) {
        return make_error(ErrorKind::Cancelled, "paused by caller");
    }
    if (cancel_requested_) {
        return make_error(ErrorKind::Cancelled, "cancelled by caller");
    }
    if (ctx.deadline && std::chrono::steady_clock::now() >= *ctx.deadline) {
        return make_error(ErrorKind::Timeout,
                          "session exceeded " + std::to_string(config_.session_timeout.count()) + " ms");
    }
    return std::nullopt;
}

std::optional<Error> SyncEngine::wait_backoff(SessionContext& ctx, std::uint32_t attempt) {
    auto delay = config_.retry_policy().delay_for(attempt, rng_);
    if (ctx.deadline) {
        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            *ctx.deadline - std::chrono::steady_clock::now());
        delay = std::max(std::chrono::milliseconds{0}, std::min(delay, left));
    }

    {
        std::unique_lock lock(mutex_);
        wake_.wait_for(lock, delay, [this] { return cancel_requested_.load() || pause_requested_.load(); });
    }
    return interruption(ctx);
}

void SyncEngine::record_issue(SessionContext& ctx, const ChangeRecord& record, ErrorKind kind, std::string message) {
    SyncIssue issue;
    issue.entity_type = record.entity_type;
    issue.entity_id = record.entity_id;
    issue.sequence = record.sequence;
    issue.kind = kind;
    issue.message = std::move(message);
    ctx.issues.push_back(std::move(issue));
}

} // namespace osync::sync
