/**
 * @file offline_sync_demo.cpp
 * @brief Offline edits, a flaky remote, and a conflict
 *
 * WHAT IT SHOWS:
 * - Changes queued while the remote is unreachable survive in the journal
 * - The next session pushes them once the remote is back
 * - An edit racing a remote write is reconciled by the configured policy
 * - Logger and metrics components observe everything through the EventBus
 *
 * USAGE:
 *   offline_sync_demo [config.json] [journal-path]
 */

#include "osync/events/components.hpp"
#include "osync/events/event_bus.hpp"
#include "osync/remote/memory_remote.hpp"
#include "osync/storage/journal_store.hpp"
#include "osync/sync/config.hpp"
#include "osync/sync/engine.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <filesystem>

using namespace osync;
using namespace osync::events;
using namespace osync::sync;

namespace fs = std::filesystem;

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::info);
    spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");

    SyncConfig config;
    config.collections = {"patients"};
    config.backoff_base = std::chrono::milliseconds{100};
    config.backoff_cap = std::chrono::milliseconds{400};
    if (argc > 1) {
        auto loaded = load_config(argv[1]);
        if (loaded.is_error()) {
            spdlog::error("Failed to load config {}: {}", argv[1], loaded.error().message);
            return 1;
        }
        config = loaded.value();
    }

    const fs::path journal_path = argc > 2 ? fs::path(argv[2]) : fs::temp_directory_path() / "osync_demo.journal";
    auto store = storage::JournalStore::open(journal_path);
    if (store.is_error()) {
        spdlog::error("Failed to open journal {}: {}", journal_path.string(), store.error().message);
        return 1;
    }

    EventBus bus;
    LoggerComponent logger(bus);
    MetricsComponent metrics(bus);

    remote::InMemoryRemoteService remote(system_clock());
    remote.put_remote("patients", "p-100", json{{"name", "Existing patient"}, {"ward", "A"}});

    SyncEngine engine(config, *store.value(), remote, bus);

    // ─── Offline: edits queue locally ───────────────────
    remote.set_reachable(false);
    for (const auto* name : {"Ada", "Grace", "Linus"}) {
        auto queued = engine.tracker().append("patients", std::string("p-") + name, Operation::Create,
                                              json{{"name", name}, {"ward", "B"}});
        if (queued.is_error()) {
            spdlog::error("append failed: {}", queued.error().message);
            return 1;
        }
    }

    auto offline = engine.run().get();
    spdlog::info("Offline session: {} ({})", to_string(offline.outcome),
                 offline.error ? offline.error->message : "no error");

    // ─── Back online ────────────────────────────────────
    remote.set_reachable(true);
    auto online = engine.run().get();
    spdlog::info("Online session: {} pushed={} pulled={}", to_string(online.outcome), online.stats.pushed,
                 online.stats.pulled);

    // ─── A concurrent edit by another client ────────────
    auto edited = engine.tracker().append("patients", "p-100", Operation::Update,
                                          json{{"name", "Existing patient"}, {"ward", "C"}});
    if (edited.is_error()) {
        spdlog::error("append failed: {}", edited.error().message);
        return 1;
    }
    remote.put_remote("patients", "p-100", json{{"name", "Existing patient"}, {"ward", "ICU"}});

    auto reconciled = engine.run().get();
    spdlog::info("Conflict session: {} conflicted={} unresolved={}", to_string(reconciled.outcome),
                 reconciled.stats.conflicted, reconciled.unresolved_entities.size());

    if (auto conflicts = engine.unresolved_conflicts(); conflicts.is_ok()) {
        for (const auto& conflict : conflicts.value()) {
            auto resolved = engine.resolve_conflict(conflict.id, ConflictOutcome::ResolvedMerged);
            if (resolved.is_error()) {
                spdlog::warn("Could not resolve {}: {}", conflict.id, resolved.error().message);
            }
        }
    }

    if (auto entity = engine.entities().get("patients", "p-100"); entity.is_ok() && entity.value()) {
        spdlog::info("p-100 is now {} at revision {}", entity.value()->payload.dump(), entity.value()->revision);
    }

    // ─── Full resync: forget cursors, pull everything ───
    RunOptions full;
    full.full_resync = true;
    auto resynced = engine.run(full).get();
    spdlog::info("Full resync: {} pulled={}", to_string(resynced.outcome), resynced.stats.pulled);

    metrics.print_stats();
    return 0;
}
