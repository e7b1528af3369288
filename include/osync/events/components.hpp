/**
 * @file components.hpp
 * @brief Reusable event-driven components
 *
 * WHY THIS FILE EXISTS:
 * Ready-made subscribers for the engine's events. Attach them to the bus
 * handed to SyncEngine and every session is logged and counted.
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 * SyncEngine engine(..., bus);
 *
 * A component unsubscribes when it is destroyed, so it may be shorter-lived
 * than the bus.
 */

#pragma once

#include "osync/events/event_bus.hpp"
#include "osync/events/events.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>
#include <vector>

namespace osync::events {

/**
 * @brief Logger component - logs session lifecycle and record problems
 *
 * USAGE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * // Now every session is logged!
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) {
        subscriptions_.push_back(bus.subscribe_scoped<SyncStateChangedEvent>(
            [this](const SyncStateChangedEvent& e) { on_state_changed(e); }));
        subscriptions_.push_back(bus.subscribe_scoped<SyncSessionStartedEvent>(
            [this](const SyncSessionStartedEvent& e) { on_session_started(e); }));
        subscriptions_.push_back(bus.subscribe_scoped<SyncSessionCompletedEvent>(
            [this](const SyncSessionCompletedEvent& e) { on_session_completed(e); }));
        subscriptions_.push_back(bus.subscribe_scoped<SyncProgressEvent>(
            [this](const SyncProgressEvent& e) { on_progress(e); }));
        subscriptions_.push_back(bus.subscribe_scoped<ChangeRecordFailedEvent>(
            [this](const ChangeRecordFailedEvent& e) { on_record_failed(e); }));
        subscriptions_.push_back(bus.subscribe_scoped<ConflictDetectedEvent>(
            [this](const ConflictDetectedEvent& e) { on_conflict_detected(e); }));
        subscriptions_.push_back(bus.subscribe_scoped<ConflictResolvedEvent>(
            [this](const ConflictResolvedEvent& e) { on_conflict_resolved(e); }));
    }

    // Handlers capture `this`.
    LoggerComponent(const LoggerComponent&) = delete;
    LoggerComponent& operator=(const LoggerComponent&) = delete;

private:
    void on_state_changed(const SyncStateChangedEvent& e) {
        spdlog::debug("[SyncState] session={} {} -> {}",
                      e.session_id, sync::to_string(e.from), sync::to_string(e.to));
    }

    void on_session_started(const SyncSessionStartedEvent& e) {
        spdlog::info("[SyncStarted] session={} pending={}", e.session_id, e.pending_records);
    }

    void on_session_completed(const SyncSessionCompletedEvent& e) {
        const auto& r = e.result;
        spdlog::info("[SyncCompleted] session={} outcome={} pushed={} pulled={} conflicted={} failed={} "
                     "skipped={} duration={}ms",
                     r.session_id, sync::to_string(r.outcome), r.stats.pushed, r.stats.pulled,
                     r.stats.conflicted, r.stats.failed, r.stats.skipped, r.finished_at - r.started_at);
        if (r.error.has_value()) {
            spdlog::warn("[SyncCompleted] session={} error={} ({})",
                         r.session_id, r.error->message, to_string(r.error->kind));
        }
    }

    void on_progress(const SyncProgressEvent& e) {
        spdlog::debug("[SyncProgress] session={} phase={} collection={} {}/{}",
                      e.session_id, sync::to_string(e.phase), e.collection, e.completed, e.total);
    }

    void on_record_failed(const ChangeRecordFailedEvent& e) {
        spdlog::warn("[RecordFailed] session={} seq={} entity={}/{} kind={} message={}",
                     e.session_id, e.sequence, e.entity_type, e.entity_id, to_string(e.kind), e.message);
    }

    void on_conflict_detected(const ConflictDetectedEvent& e) {
        spdlog::warn("[ConflictDetected] session={} id={} entity={}/{} kind={} local_seq={} remote_rev={}",
                     e.session_id, e.conflict.id, e.conflict.entity_type, e.conflict.entity_id,
                     sync::to_string(e.conflict.kind), e.conflict.local_change.sequence,
                     e.conflict.remote_snapshot.revision);
    }

    void on_conflict_resolved(const ConflictResolvedEvent& e) {
        spdlog::info("[ConflictResolved] session={} id={} entity={}/{} policy={} outcome={}",
                     e.session_id, e.conflict.id, e.conflict.entity_type, e.conflict.entity_id,
                     sync::to_string(e.conflict.policy), sync::to_string(e.conflict.outcome));
    }

    std::vector<Subscription> subscriptions_;
};

/**
 * @brief Metrics component - tracks statistics
 *
 * USAGE:
 * MetricsComponent metrics(bus);
 * // Later...
 * auto& stats = metrics.get_stats();
 * std::cout << "Records pushed: " << stats.records_pushed << "\n";
 */
class MetricsComponent {
public:
    struct Stats {
        std::atomic<uint64_t> sessions_started{0};
        std::atomic<uint64_t> sessions_completed{0};
        std::atomic<uint64_t> sessions_failed{0};
        std::atomic<uint64_t> sessions_interrupted{0};
        std::atomic<uint64_t> records_pushed{0};
        std::atomic<uint64_t> records_pulled{0};
        std::atomic<uint64_t> records_failed{0};
        std::atomic<uint64_t> conflicts_detected{0};
        std::atomic<uint64_t> conflicts_resolved{0};
    };

    explicit MetricsComponent(EventBus& bus) {
        subscriptions_.push_back(bus.subscribe_scoped<SyncSessionStartedEvent>(
            [this](const SyncSessionStartedEvent&) { stats_.sessions_started++; }));
        subscriptions_.push_back(bus.subscribe_scoped<SyncSessionCompletedEvent>(
            [this](const SyncSessionCompletedEvent& e) { on_session_completed(e); }));
        subscriptions_.push_back(bus.subscribe_scoped<ChangeRecordFailedEvent>(
            [this](const ChangeRecordFailedEvent&) { stats_.records_failed++; }));
        subscriptions_.push_back(bus.subscribe_scoped<ConflictDetectedEvent>(
            [this](const ConflictDetectedEvent&) { stats_.conflicts_detected++; }));
        subscriptions_.push_back(bus.subscribe_scoped<ConflictResolvedEvent>(
            [this](const ConflictResolvedEvent&) { stats_.conflicts_resolved++; }));
    }

    MetricsComponent(const MetricsComponent&) = delete;
    MetricsComponent& operator=(const MetricsComponent&) = delete;

    const Stats& get_stats() const {
        return stats_;
    }

    void print_stats() const {
        spdlog::info("═══════════════════════════════════════");
        spdlog::info("Sync Statistics:");
        spdlog::info("  Sessions started:   {}", stats_.sessions_started.load());
        spdlog::info("  Sessions completed: {}", stats_.sessions_completed.load());
        spdlog::info("  Sessions failed:    {}", stats_.sessions_failed.load());
        spdlog::info("  Sessions stopped:   {}", stats_.sessions_interrupted.load());
        spdlog::info("  Records pushed:     {}", stats_.records_pushed.load());
        spdlog::info("  Records pulled:     {}", stats_.records_pulled.load());
        spdlog::info("  Records failed:     {}", stats_.records_failed.load());
        spdlog::info("  Conflicts det.:     {}", stats_.conflicts_detected.load());
        spdlog::info("  Conflicts res.:     {}", stats_.conflicts_resolved.load());
        spdlog::info("═══════════════════════════════════════");
    }

private:
    void on_session_completed(const SyncSessionCompletedEvent& e) {
        switch (e.result.outcome) {
            case sync::SessionOutcome::Completed:
                stats_.sessions_completed++;
                break;
            case sync::SessionOutcome::Failed:
                stats_.sessions_failed++;
                break;
            default:
                stats_.sessions_interrupted++;
                break;
        }
        stats_.records_pushed += e.result.stats.pushed;
        stats_.records_pulled += e.result.stats.pulled;
    }

    Stats stats_;
    std::vector<Subscription> subscriptions_; ///< Destroyed first, before stats_
};

} // namespace osync::events
