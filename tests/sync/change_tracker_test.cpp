#include "osync/storage/memory_store.hpp"
#include "osync/sync/change_tracker.hpp"
#include "osync/sync/delta_store.hpp"
#include "osync/sync/entity_store.hpp"

#include <gtest/gtest.h>

#include <set>
#include <thread>

using osync::ErrorKind;
using osync::ManualClock;
using osync::storage::MemoryStore;
using osync::storage::WriteBatch;
using osync::sync::ChangeRecord;
using osync::sync::ChangeStatus;
using osync::sync::ChangeTracker;
using osync::sync::EntityStore;
using osync::sync::json;
using osync::sync::Operation;
using osync::sync::RemoteRecord;

namespace {

RemoteRecord remote_record(const std::string& id, const std::string& revision, json payload, osync::Timestamp at) {
    RemoteRecord record;
    record.entity_type = "patients";
    record.entity_id = id;
    record.revision = revision;
    record.last_updated = at;
    record.payload = std::move(payload);
    return record;
}

} // namespace

TEST(ChangeTrackerTest, AppendAssignsMonotonicSequencesAndClientIds) {
    MemoryStore store;
    ManualClock clock{1000};
    ChangeTracker tracker(store, clock);

    auto first = tracker.append("patients", "p1", Operation::Create, json{{"name", "Ada"}});
    auto second = tracker.append("patients", "p2", Operation::Create, json{{"name", "Bo"}});
    ASSERT_TRUE(first.is_ok());
    ASSERT_TRUE(second.is_ok());

    EXPECT_EQ(first.value().sequence, 1u);
    EXPECT_EQ(second.value().sequence, 2u);
    EXPECT_NE(first.value().client_id, second.value().client_id);
    EXPECT_EQ(first.value().status, ChangeStatus::Pending);
    EXPECT_EQ(first.value().created_at, 1000);
    EXPECT_TRUE(first.value().base_revision.empty());

    auto pending = tracker.snapshot_pending();
    ASSERT_TRUE(pending.is_ok());
    ASSERT_EQ(pending.value().size(), 2u);
    EXPECT_EQ(pending.value()[0].entity_id, "p1");
    EXPECT_EQ(pending.value()[1].entity_id, "p2");
}

TEST(ChangeTrackerTest, AppendUpdatesLocalEntityOptimistically) {
    MemoryStore store;
    ManualClock clock{1000};
    ChangeTracker tracker(store, clock);
    EntityStore entities(store);

    ASSERT_TRUE(entities.apply_remote(remote_record("p1", "4", json{{"name", "Ada"}}, 500)).is_ok());
    auto queued = tracker.append("patients", "p1", Operation::Update, json{{"name", "Ada L."}});
    ASSERT_TRUE(queued.is_ok());
    EXPECT_EQ(queued.value().base_revision, "4");

    auto entity = entities.get("patients", "p1");
    ASSERT_TRUE(entity.is_ok());
    ASSERT_TRUE(entity.value().has_value());
    EXPECT_EQ(entity.value()->payload["name"], "Ada L.");
    EXPECT_EQ(entity.value()->revision, "4");

    ASSERT_TRUE(tracker.append("patients", "p1", Operation::Delete, json()).is_ok());
    entity = entities.get("patients", "p1");
    ASSERT_TRUE(entity.is_ok());
    EXPECT_TRUE(entity.value()->deleted);
    EXPECT_TRUE(entity.value()->payload.is_null());
}

TEST(ChangeTrackerTest, AppendRejectsInvalidInput) {
    MemoryStore store;
    ManualClock clock;
    ChangeTracker tracker(store, clock);

    auto no_id = tracker.append("patients", "", Operation::Create, json{{"a", 1}});
    ASSERT_TRUE(no_id.is_error());
    EXPECT_EQ(no_id.error().kind, ErrorKind::InvalidArgument);

    auto bad_type = tracker.append("pa/tients", "p1", Operation::Create, json{{"a", 1}});
    EXPECT_TRUE(bad_type.is_error());

    auto no_payload = tracker.append("patients", "p1", Operation::Update, json());
    EXPECT_TRUE(no_payload.is_error());

    auto pending = tracker.pending_count();
    ASSERT_TRUE(pending.is_ok());
    EXPECT_EQ(pending.value(), 0u);
}

TEST(ChangeTrackerTest, SequenceSurvivesRestartAndGarbageCollection) {
    MemoryStore store;
    ManualClock clock;

    {
        ChangeTracker tracker(store, clock);
        ASSERT_TRUE(tracker.append("patients", "p1", Operation::Create, json{{"a", 1}}).is_ok());
        ASSERT_TRUE(tracker.append("patients", "p2", Operation::Create, json{{"a", 2}}).is_ok());
        ASSERT_TRUE(tracker.mark_in_flight(1).is_ok());
        ASSERT_TRUE(tracker.mark_acked(1, "1", 10).is_ok());
        ASSERT_TRUE(tracker.mark_in_flight(2).is_ok());
        ASSERT_TRUE(tracker.mark_acked(2, "1", 10).is_ok());
        auto removed = tracker.collect_garbage();
        ASSERT_TRUE(removed.is_ok());
        EXPECT_EQ(removed.value(), 2u);
    }

    ChangeTracker restarted(store, clock);
    auto next = restarted.append("patients", "p3", Operation::Create, json{{"a", 3}});
    ASSERT_TRUE(next.is_ok());
    EXPECT_EQ(next.value().sequence, 3u);
}

TEST(ChangeTrackerTest, EnforcesStatusTransitions) {
    MemoryStore store;
    ManualClock clock;
    ChangeTracker tracker(store, clock);
    ASSERT_TRUE(tracker.append("patients", "p1", Operation::Create, json{{"a", 1}}).is_ok());

    auto early_ack = tracker.mark_acked(1, "1", 0);
    ASSERT_TRUE(early_ack.is_error());
    EXPECT_EQ(early_ack.error().kind, ErrorKind::InvalidState);

    ASSERT_TRUE(tracker.mark_in_flight(1).is_ok());
    ASSERT_TRUE(tracker.mark_pending(1, std::string("timeout")).is_ok());
    ASSERT_TRUE(tracker.mark_in_flight(1).is_ok());

    auto record = tracker.get(1);
    ASSERT_TRUE(record.is_ok());
    EXPECT_EQ(record.value().attempts, 2u);
    EXPECT_EQ(record.value().last_error.value_or(""), "timeout");

    ASSERT_TRUE(tracker.mark_acked(1, "1", 0).is_ok());
    EXPECT_TRUE(tracker.mark_pending(1).is_error());
    EXPECT_TRUE(tracker.mark_failed(1, "late").is_error());

    auto missing = tracker.mark_in_flight(99);
    ASSERT_TRUE(missing.is_error());
    EXPECT_EQ(missing.error().kind, ErrorKind::NotFound);
}

TEST(ChangeTrackerTest, AckRebasesLaterChangesOfTheEntity) {
    MemoryStore store;
    ManualClock clock;
    ChangeTracker tracker(store, clock);
    EntityStore entities(store);

    ASSERT_TRUE(tracker.append("patients", "p1", Operation::Create, json{{"v", 1}}).is_ok());
    ASSERT_TRUE(tracker.append("patients", "p1", Operation::Update, json{{"v", 2}}).is_ok());
    ASSERT_TRUE(tracker.append("patients", "p2", Operation::Create, json{{"v", 1}}).is_ok());

    ASSERT_TRUE(tracker.mark_in_flight(1).is_ok());
    ASSERT_TRUE(tracker.mark_acked(1, "1", 77).is_ok());

    auto later = tracker.get(2);
    ASSERT_TRUE(later.is_ok());
    EXPECT_EQ(later.value().base_revision, "1");

    auto other = tracker.get(3);
    ASSERT_TRUE(other.is_ok());
    EXPECT_TRUE(other.value().base_revision.empty());

    auto entity = entities.get("patients", "p1");
    ASSERT_TRUE(entity.is_ok());
    EXPECT_EQ(entity.value()->revision, "1");
    EXPECT_EQ(entity.value()->payload["v"], 2);
}

TEST(ChangeTrackerTest, RecoverReturnsInFlightRecordsToPending) {
    MemoryStore store;
    ManualClock clock;

    {
        ChangeTracker tracker(store, clock);
        ASSERT_TRUE(tracker.append("patients", "p1", Operation::Create, json{{"a", 1}}).is_ok());
        ASSERT_TRUE(tracker.append("patients", "p2", Operation::Create, json{{"a", 2}}).is_ok());
        ASSERT_TRUE(tracker.mark_in_flight(1).is_ok());
        // Process dies here with seq 1 on the wire.
    }

    ChangeTracker tracker(store, clock);
    auto recovered = tracker.recover();
    ASSERT_TRUE(recovered.is_ok());
    EXPECT_EQ(recovered.value(), 1u);

    auto record = tracker.get(1);
    ASSERT_TRUE(record.is_ok());
    EXPECT_EQ(record.value().status, ChangeStatus::Pending);
    EXPECT_TRUE(record.value().last_error.has_value());

    auto pending = tracker.pending_count();
    ASSERT_TRUE(pending.is_ok());
    EXPECT_EQ(pending.value(), 2u);
}

TEST(ChangeTrackerTest, FailedRecordBlocksEntityUntilAcknowledged) {
    MemoryStore store;
    ManualClock clock;
    ChangeTracker tracker(store, clock);

    ASSERT_TRUE(tracker.append("patients", "p1", Operation::Create, json{{"a", 1}}).is_ok());
    ASSERT_TRUE(tracker.mark_in_flight(1).is_ok());
    ASSERT_TRUE(tracker.mark_failed(1, "name is required").is_ok());

    auto blocked = tracker.is_blocked("patients", "p1");
    ASSERT_TRUE(blocked.is_ok());
    EXPECT_TRUE(blocked.value());

    auto failed = tracker.records(ChangeStatus::Failed);
    ASSERT_TRUE(failed.is_ok());
    ASSERT_EQ(failed.value().size(), 1u);
    EXPECT_EQ(failed.value()[0].last_error.value_or(""), "name is required");

    ASSERT_TRUE(tracker.acknowledge_failure(1).is_ok());
    blocked = tracker.is_blocked("patients", "p1");
    ASSERT_TRUE(blocked.is_ok());
    EXPECT_FALSE(blocked.value());
    EXPECT_TRUE(tracker.get(1).is_error());
}

TEST(ChangeTrackerTest, AcknowledgeFailureRequiresFailedRecord) {
    MemoryStore store;
    ManualClock clock;
    ChangeTracker tracker(store, clock);
    ASSERT_TRUE(tracker.append("patients", "p1", Operation::Create, json{{"a", 1}}).is_ok());

    auto result = tracker.acknowledge_failure(1);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::InvalidState);
}

TEST(ChangeTrackerTest, SnapshotIsStableAgainstConcurrentAppends) {
    MemoryStore store;
    ManualClock clock;
    ChangeTracker tracker(store, clock);
    for (int i = 0; i < 10; ++i) {
        ASSERT_TRUE(tracker.append("patients", "p" + std::to_string(i), Operation::Create, json{{"i", i}}).is_ok());
    }

    auto snapshot = tracker.snapshot_pending();
    ASSERT_TRUE(snapshot.is_ok());

    std::thread writer([&tracker] {
        for (int i = 10; i < 60; ++i) {
            auto res = tracker.append("patients", "p" + std::to_string(i), Operation::Create, json{{"i", i}});
            EXPECT_TRUE(res.is_ok());
        }
    });
    for (const auto& record : snapshot.value()) {
        ASSERT_TRUE(tracker.mark_in_flight(record.sequence).is_ok());
        ASSERT_TRUE(tracker.mark_acked(record.sequence, "1", 0).is_ok());
    }
    writer.join();

    EXPECT_EQ(snapshot.value().size(), 10u);
    auto pending = tracker.snapshot_pending();
    ASSERT_TRUE(pending.is_ok());
    ASSERT_EQ(pending.value().size(), 50u);

    std::set<std::uint64_t> sequences;
    for (const auto& record : pending.value()) {
        EXPECT_GT(record.sequence, 10u);
        sequences.insert(record.sequence);
    }
    EXPECT_EQ(sequences.size(), 50u);
}

TEST(ChangeTrackerTest, ApplyPulledParksEntitiesWithLocalChanges) {
    MemoryStore store;
    ManualClock clock;
    ChangeTracker tracker(store, clock);
    EntityStore entities(store);

    ASSERT_TRUE(tracker.append("patients", "p1", Operation::Create, json{{"v", "local"}}).is_ok());

    std::vector<RemoteRecord> parked;
    WriteBatch tail;
    tail.put("cursor/patients", "marker");
    auto count = tracker.apply_pulled(
        {remote_record("p1", "3", json{{"v", "remote"}}, 10), remote_record("p2", "1", json{{"v", "fresh"}}, 10)},
        [&parked](WriteBatch&, const RemoteRecord& record) { parked.push_back(record); },
        tail);
    ASSERT_TRUE(count.is_ok());
    EXPECT_EQ(count.value(), 1u);
    ASSERT_EQ(parked.size(), 1u);
    EXPECT_EQ(parked[0].entity_id, "p1");

    auto kept = entities.get("patients", "p1");
    ASSERT_TRUE(kept.is_ok());
    EXPECT_EQ(kept.value()->payload["v"], "local");

    auto applied = entities.get("patients", "p2");
    ASSERT_TRUE(applied.is_ok());
    ASSERT_TRUE(applied.value().has_value());
    EXPECT_EQ(applied.value()->revision, "1");

    auto marker = store.get("cursor/patients");
    ASSERT_TRUE(marker.is_ok());
    EXPECT_EQ(marker.value().value_or(""), "marker");
}

TEST(ChangeTrackerTest, RequeueReplacesRecordWithFreshIdentity) {
    MemoryStore store;
    ManualClock clock{100};
    ChangeTracker tracker(store, clock);
    EntityStore entities(store);

    auto original = tracker.append("patients", "p1", Operation::Update, json{{"v", "mine"}});
    ASSERT_TRUE(original.is_ok());

    clock.advance(50);
    auto requeued = tracker.requeue(1, Operation::Update, json{{"v", "mine"}}, "7", 120);
    ASSERT_TRUE(requeued.is_ok());
    ASSERT_TRUE(requeued.value().has_value());

    const auto& replacement = *requeued.value();
    EXPECT_EQ(replacement.sequence, 2u);
    EXPECT_NE(replacement.client_id, original.value().client_id);
    EXPECT_EQ(replacement.base_revision, "7");
    EXPECT_EQ(replacement.status, ChangeStatus::Pending);
    EXPECT_TRUE(tracker.get(1).is_error());

    auto entity = entities.get("patients", "p1");
    ASSERT_TRUE(entity.is_ok());
    EXPECT_EQ(entity.value()->revision, "7");
    EXPECT_EQ(entity.value()->payload["v"], "mine");
}

TEST(ChangeTrackerTest, RequeueWithLaterChangesOnlyRebases) {
    MemoryStore store;
    ManualClock clock;
    ChangeTracker tracker(store, clock);

    ASSERT_TRUE(tracker.append("patients", "p1", Operation::Update, json{{"v", 1}}).is_ok());
    ASSERT_TRUE(tracker.append("patients", "p1", Operation::Update, json{{"v", 2}}).is_ok());

    auto requeued = tracker.requeue(1, Operation::Update, json{{"v", 1}}, "5", 0);
    ASSERT_TRUE(requeued.is_ok());
    EXPECT_FALSE(requeued.value().has_value());

    auto queue = tracker.entity_queue("patients", "p1");
    ASSERT_TRUE(queue.is_ok());
    ASSERT_EQ(queue.value().size(), 1u);
    EXPECT_EQ(queue.value()[0].sequence, 2u);
    EXPECT_EQ(queue.value()[0].base_revision, "5");
}

TEST(ChangeTrackerTest, YieldToRemoteAdoptsRemoteValue) {
    MemoryStore store;
    ManualClock clock;
    ChangeTracker tracker(store, clock);
    EntityStore entities(store);

    ASSERT_TRUE(tracker.append("patients", "p1", Operation::Update, json{{"v", "mine"}}).is_ok());
    ASSERT_TRUE(tracker.yield_to_remote(1, remote_record("p1", "9", json{{"v", "theirs"}}, 500)).is_ok());

    auto pending = tracker.pending_count();
    ASSERT_TRUE(pending.is_ok());
    EXPECT_EQ(pending.value(), 0u);

    auto entity = entities.get("patients", "p1");
    ASSERT_TRUE(entity.is_ok());
    EXPECT_EQ(entity.value()->payload["v"], "theirs");
    EXPECT_EQ(entity.value()->revision, "9");
}

TEST(ChangeTrackerTest, RebaseAndDiscardMoveBaseRevision) {
    MemoryStore store;
    ManualClock clock;
    ChangeTracker tracker(store, clock);

    ASSERT_TRUE(tracker.append("patients", "p1", Operation::Update, json{{"v", 1}}).is_ok());
    ASSERT_TRUE(tracker.append("patients", "p1", Operation::Update, json{{"v", 2}}).is_ok());

    ASSERT_TRUE(tracker.rebase("patients", "p1", "3").is_ok());
    EXPECT_EQ(tracker.get(1).value().base_revision, "3");
    EXPECT_EQ(tracker.get(2).value().base_revision, "3");

    ASSERT_TRUE(tracker.discard(1, "4").is_ok());
    EXPECT_TRUE(tracker.get(1).is_error());
    EXPECT_EQ(tracker.get(2).value().base_revision, "4");
}

TEST(ChangeTrackerTest, ConflictedRecordKeepsConflictId) {
    MemoryStore store;
    ManualClock clock;
    ChangeTracker tracker(store, clock);

    ASSERT_TRUE(tracker.append("patients", "p1", Operation::Update, json{{"v", 1}}).is_ok());
    WriteBatch extra;
    extra.put("conflict/c-1", "{}");
    ASSERT_TRUE(tracker.mark_conflicted(1, "c-1", extra).is_ok());

    auto record = tracker.get(1);
    ASSERT_TRUE(record.is_ok());
    EXPECT_EQ(record.value().status, ChangeStatus::Conflicted);
    EXPECT_EQ(record.value().conflict_id.value_or(""), "c-1");
    EXPECT_TRUE(store.get("conflict/c-1").value().has_value());

    auto pending = tracker.snapshot_pending();
    ASSERT_TRUE(pending.is_ok());
    EXPECT_TRUE(pending.value().empty());
}
