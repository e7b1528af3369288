#include "osync/storage/memory_store.hpp"
#include "osync/sync/change_tracker.hpp"
#include "osync/sync/conflict.hpp"
#include "osync/sync/delta_store.hpp"
#include "osync/sync/entity_store.hpp"

#include <gtest/gtest.h>

using osync::ErrorKind;
using osync::ManualClock;
using osync::storage::MemoryStore;
using osync::storage::WriteBatch;
using osync::sync::ChangeRecord;
using osync::sync::ChangeStatus;
using osync::sync::ChangeTracker;
using osync::sync::ConflictKind;
using osync::sync::ConflictOutcome;
using osync::sync::ConflictPolicy;
using osync::sync::ConflictResolver;
using osync::sync::DeltaStore;
using osync::sync::EntityStore;
using osync::sync::json;
using osync::sync::Operation;
using osync::sync::RemoteRecord;

namespace {

ChangeRecord make_local(Operation operation, json payload, osync::Timestamp created_at, std::string client_id = "b") {
    ChangeRecord record;
    record.sequence = 1;
    record.client_id = std::move(client_id);
    record.entity_type = "patients";
    record.entity_id = "p1";
    record.operation = operation;
    record.payload = std::move(payload);
    record.created_at = created_at;
    record.base_revision = "1";
    return record;
}

RemoteRecord make_remote(json payload, osync::Timestamp last_updated, bool deleted = false) {
    RemoteRecord record;
    record.entity_type = "patients";
    record.entity_id = "p1";
    record.revision = "2";
    record.last_updated = last_updated;
    record.payload = deleted ? json() : std::move(payload);
    record.deleted = deleted;
    record.origin_client_id = "a";
    return record;
}

} // namespace

TEST(ConflictResolverTest, LastWriteWinsChoosesNewest) {
    auto local = make_local(Operation::Update, json{{"name", "old"}}, 100);
    auto remote = make_remote(json{{"name", "new"}}, 200);

    auto decision = ConflictResolver::decide(local, remote, ConflictPolicy::LastWriteWins);
    EXPECT_EQ(decision.outcome, ConflictOutcome::ResolvedRemote);
    EXPECT_EQ(decision.kind, ConflictKind::UpdateUpdate);

    local.created_at = 300;
    decision = ConflictResolver::decide(local, remote, ConflictPolicy::LastWriteWins);
    EXPECT_EQ(decision.outcome, ConflictOutcome::ResolvedLocal);
}

TEST(ConflictResolverTest, LastWriteWinsTieBreaksOnClientId) {
    auto remote = make_remote(json{{"name", "r"}}, 200);

    auto higher = make_local(Operation::Update, json{{"name", "l"}}, 200, "b");
    EXPECT_EQ(ConflictResolver::decide(higher, remote, ConflictPolicy::LastWriteWins).outcome,
              ConflictOutcome::ResolvedLocal);

    auto lower = make_local(Operation::Update, json{{"name", "l"}}, 200, "0");
    EXPECT_EQ(ConflictResolver::decide(lower, remote, ConflictPolicy::LastWriteWins).outcome,
              ConflictOutcome::ResolvedRemote);
}

TEST(ConflictResolverTest, DecisionIsDeterministic) {
    auto local = make_local(Operation::Update, json{{"name", "l"}}, 150);
    auto remote = make_remote(json{{"name", "r"}}, 150);

    const auto first = ConflictResolver::decide(local, remote, ConflictPolicy::LastWriteWins);
    for (int i = 0; i < 10; ++i) {
        EXPECT_EQ(ConflictResolver::decide(local, remote, ConflictPolicy::LastWriteWins).outcome, first.outcome);
    }
}

TEST(ConflictResolverTest, FixedPoliciesIgnoreTimestamps) {
    auto local = make_local(Operation::Update, json{{"name", "l"}}, 900);
    auto remote = make_remote(json{{"name", "r"}}, 100);

    EXPECT_EQ(ConflictResolver::decide(local, remote, ConflictPolicy::RemoteWins).outcome,
              ConflictOutcome::ResolvedRemote);
    EXPECT_EQ(ConflictResolver::decide(local, remote, ConflictPolicy::LocalWins).outcome,
              ConflictOutcome::ResolvedLocal);
    EXPECT_EQ(ConflictResolver::decide(local, remote, ConflictPolicy::Manual).outcome,
              ConflictOutcome::Unresolved);
}

TEST(ConflictResolverTest, ClassifiesDeleteConflicts) {
    auto update = make_local(Operation::Update, json{{"name", "l"}}, 100);
    auto removal = make_local(Operation::Delete, json(), 100);
    auto remote_update = make_remote(json{{"name", "r"}}, 100);
    auto remote_delete = make_remote(json(), 100, true);

    EXPECT_EQ(ConflictResolver::classify(update, remote_delete), ConflictKind::UpdateDelete);
    EXPECT_EQ(ConflictResolver::classify(removal, remote_update), ConflictKind::DeleteUpdate);
    EXPECT_EQ(ConflictResolver::classify(update, remote_update), ConflictKind::UpdateUpdate);

    // Both sides deleted: settles on the remote tombstone whatever the policy.
    EXPECT_EQ(ConflictResolver::decide(removal, remote_delete, ConflictPolicy::Manual).outcome,
              ConflictOutcome::ResolvedRemote);
}

TEST(ConflictResolverTest, MergeCombinesFieldsWithLocalPrecedence) {
    auto local = make_local(Operation::Update, json{{"name", "Ada"}, {"age", 36}}, 100);
    auto remote = make_remote(json{{"name", "Ada B."}, {"city", "London"}}, 200);

    auto decision = ConflictResolver::decide(local, remote, ConflictPolicy::Merge);
    ASSERT_EQ(decision.outcome, ConflictOutcome::ResolvedMerged);
    ASSERT_TRUE(decision.merged.has_value());
    EXPECT_EQ((*decision.merged)["name"], "Ada");
    EXPECT_EQ((*decision.merged)["age"], 36);
    EXPECT_EQ((*decision.merged)["city"], "London");

    // Deletions fall back to last-write-wins.
    auto remote_delete = make_remote(json(), 200, true);
    auto fallback = ConflictResolver::decide(local, remote_delete, ConflictPolicy::Merge);
    EXPECT_EQ(fallback.outcome, ConflictOutcome::ResolvedRemote);
    EXPECT_FALSE(fallback.merged.has_value());
}

TEST(ConflictResolverTest, MergeFillsNullLocalFieldsFromRemote) {
    auto local = make_local(Operation::Update, json{{"name", "Ada"}, {"city", nullptr}}, 100);
    auto remote = make_remote(json{{"name", "Ada B."}, {"city", "London"}}, 200);

    const auto merged = ConflictResolver::merge(local.payload, remote.payload);
    EXPECT_EQ(merged["name"], "Ada");
    EXPECT_EQ(merged["city"], "London");

    // Null on both sides stays null.
    const auto both_null = ConflictResolver::merge(json{{"ward", nullptr}}, json{{"ward", nullptr}});
    EXPECT_TRUE(both_null["ward"].is_null());
}

TEST(ConflictResolverTest, ReconcileRemoteWinsAdoptsRemoteAndUnparks) {
    MemoryStore store;
    ManualClock clock{500};
    ChangeTracker tracker(store, clock);
    DeltaStore deltas(store, clock);
    EntityStore entities(store);
    ConflictResolver resolver(store, tracker, clock);

    auto queued = tracker.append("patients", "p1", Operation::Update, json{{"name", "mine"}});
    ASSERT_TRUE(queued.is_ok());
    const auto remote = make_remote(json{{"name", "theirs"}}, 900);

    WriteBatch park;
    deltas.stage_park(park, remote);
    ASSERT_TRUE(store.commit(park).is_ok());

    WriteBatch unpark;
    deltas.stage_unpark(unpark, "patients", "p1");
    auto conflict = resolver.reconcile(queued.value(), remote, ConflictPolicy::LastWriteWins, "14", unpark);
    ASSERT_TRUE(conflict.is_ok());
    EXPECT_EQ(conflict.value().outcome, ConflictOutcome::ResolvedRemote);
    EXPECT_EQ(conflict.value().cursor_token, "14");
    EXPECT_EQ(conflict.value().resolved_at.value_or(0), 500);
    EXPECT_FALSE(conflict.value().id.empty());

    auto entity = entities.get("patients", "p1");
    ASSERT_TRUE(entity.is_ok());
    EXPECT_EQ(entity.value()->payload["name"], "theirs");
    EXPECT_EQ(entity.value()->revision, "2");

    EXPECT_TRUE(tracker.get(queued.value().sequence).is_error());
    EXPECT_TRUE(deltas.parked().value().empty());

    auto collected = resolver.collect_resolved();
    ASSERT_TRUE(collected.is_ok());
    EXPECT_EQ(collected.value(), 1u);
}

TEST(ConflictResolverTest, ReconcileLocalWinsRequeuesOnRemoteRevision) {
    MemoryStore store;
    ManualClock clock{1000};
    ChangeTracker tracker(store, clock);
    EntityStore entities(store);
    ConflictResolver resolver(store, tracker, clock);

    auto queued = tracker.append("patients", "p1", Operation::Update, json{{"name", "mine"}});
    ASSERT_TRUE(queued.is_ok());

    auto conflict = resolver.reconcile(queued.value(), make_remote(json{{"name", "theirs"}}, 10),
                                       ConflictPolicy::LastWriteWins, "");
    ASSERT_TRUE(conflict.is_ok());
    EXPECT_EQ(conflict.value().outcome, ConflictOutcome::ResolvedLocal);

    auto pending = tracker.snapshot_pending();
    ASSERT_TRUE(pending.is_ok());
    ASSERT_EQ(pending.value().size(), 1u);
    EXPECT_NE(pending.value()[0].client_id, queued.value().client_id);
    EXPECT_EQ(pending.value()[0].base_revision, "2");
    EXPECT_EQ(pending.value()[0].payload["name"], "mine");

    auto entity = entities.get("patients", "p1");
    ASSERT_TRUE(entity.is_ok());
    EXPECT_EQ(entity.value()->payload["name"], "mine");
    EXPECT_EQ(entity.value()->revision, "2");
}

TEST(ConflictResolverTest, ReconcileDeleteAgainstRemoteUpdateRequeuesDelete) {
    MemoryStore store;
    ManualClock clock{1000};
    ChangeTracker tracker(store, clock);
    ConflictResolver resolver(store, tracker, clock);

    auto queued = tracker.append("patients", "p1", Operation::Delete, json());
    ASSERT_TRUE(queued.is_ok());

    auto conflict = resolver.reconcile(queued.value(), make_remote(json{{"name", "theirs"}}, 10),
                                       ConflictPolicy::LocalWins, "");
    ASSERT_TRUE(conflict.is_ok());
    EXPECT_EQ(conflict.value().kind, ConflictKind::DeleteUpdate);

    auto pending = tracker.snapshot_pending();
    ASSERT_TRUE(pending.is_ok());
    ASSERT_EQ(pending.value().size(), 1u);
    EXPECT_EQ(pending.value()[0].operation, Operation::Delete);
}

TEST(ConflictResolverTest, ManualConflictBlocksUntilResolved) {
    MemoryStore store;
    ManualClock clock{1000};
    ChangeTracker tracker(store, clock);
    EntityStore entities(store);
    ConflictResolver resolver(store, tracker, clock);

    auto queued = tracker.append("patients", "p1", Operation::Update, json{{"name", "mine"}, {"age", 3}});
    ASSERT_TRUE(queued.is_ok());

    auto conflict = resolver.reconcile(queued.value(), make_remote(json{{"name", "theirs"}, {"city", "Oslo"}}, 10),
                                       ConflictPolicy::Manual, "3");
    ASSERT_TRUE(conflict.is_ok());
    EXPECT_EQ(conflict.value().outcome, ConflictOutcome::Unresolved);
    EXPECT_FALSE(conflict.value().resolved_at.has_value());

    auto record = tracker.get(queued.value().sequence);
    ASSERT_TRUE(record.is_ok());
    EXPECT_EQ(record.value().status, ChangeStatus::Conflicted);
    EXPECT_TRUE(tracker.is_blocked("patients", "p1").value());

    auto open = resolver.unresolved();
    ASSERT_TRUE(open.is_ok());
    ASSERT_EQ(open.value().size(), 1u);
    const auto id = open.value()[0].id;

    auto rejected = resolver.resolve(id, ConflictOutcome::Unresolved);
    ASSERT_TRUE(rejected.is_error());
    EXPECT_EQ(rejected.error().kind, ErrorKind::InvalidArgument);

    clock.advance(10);
    auto resolved = resolver.resolve(id, ConflictOutcome::ResolvedMerged);
    ASSERT_TRUE(resolved.is_ok());
    EXPECT_EQ(resolved.value().outcome, ConflictOutcome::ResolvedMerged);
    EXPECT_EQ(resolved.value().resolved_at.value_or(0), 1010);

    EXPECT_FALSE(tracker.is_blocked("patients", "p1").value());
    auto pending = tracker.snapshot_pending();
    ASSERT_TRUE(pending.is_ok());
    ASSERT_EQ(pending.value().size(), 1u);
    EXPECT_EQ(pending.value()[0].payload["name"], "mine");
    EXPECT_EQ(pending.value()[0].payload["city"], "Oslo");

    auto entity = entities.get("patients", "p1");
    ASSERT_TRUE(entity.is_ok());
    EXPECT_EQ(entity.value()->payload["city"], "Oslo");

    auto again = resolver.resolve(id, ConflictOutcome::ResolvedLocal);
    ASSERT_TRUE(again.is_error());
    EXPECT_EQ(again.error().kind, ErrorKind::InvalidState);

    auto missing = resolver.resolve("no-such-conflict", ConflictOutcome::ResolvedLocal);
    ASSERT_TRUE(missing.is_error());
    EXPECT_EQ(missing.error().kind, ErrorKind::NotFound);
}
