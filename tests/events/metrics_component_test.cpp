#include "osync/events/event_bus.hpp"
#include "osync/events/components.hpp"
#include "osync/events/events.hpp"

#include <gtest/gtest.h>

using osync::events::ChangeRecordFailedEvent;
using osync::events::ConflictDetectedEvent;
using osync::events::ConflictResolvedEvent;
using osync::events::EventBus;
using osync::events::LoggerComponent;
using osync::events::MetricsComponent;
using osync::events::SyncSessionCompletedEvent;
using osync::events::SyncSessionStartedEvent;
using osync::sync::ConflictRecord;
using osync::sync::SessionOutcome;
using osync::sync::SessionResult;

TEST(MetricsComponentTest, TracksSessionAndRecordCounters) {
    EventBus bus;
    MetricsComponent metrics(bus);

    bus.emit(SyncSessionStartedEvent{"session-1", 4, 0});

    SessionResult completed;
    completed.session_id = "session-1";
    completed.outcome = SessionOutcome::Completed;
    completed.stats.pushed = 3;
    completed.stats.pulled = 7;
    bus.emit(SyncSessionCompletedEvent{completed, 10});

    SessionResult failed;
    failed.outcome = SessionOutcome::Failed;
    bus.emit(SyncSessionCompletedEvent{failed, 20});

    SessionResult paused;
    paused.outcome = SessionOutcome::Paused;
    bus.emit(SyncSessionCompletedEvent{paused, 30});

    ChangeRecordFailedEvent rejected;
    rejected.sequence = 2;
    bus.emit(rejected);

    bus.emit(ConflictDetectedEvent{"session-1", ConflictRecord{}, 0});
    bus.emit(ConflictResolvedEvent{"session-1", ConflictRecord{}, 0});

    const auto& stats = metrics.get_stats();
    EXPECT_EQ(stats.sessions_started.load(), 1u);
    EXPECT_EQ(stats.sessions_completed.load(), 1u);
    EXPECT_EQ(stats.sessions_failed.load(), 1u);
    EXPECT_EQ(stats.sessions_interrupted.load(), 1u);
    EXPECT_EQ(stats.records_pushed.load(), 3u);
    EXPECT_EQ(stats.records_pulled.load(), 7u);
    EXPECT_EQ(stats.records_failed.load(), 1u);
    EXPECT_EQ(stats.conflicts_detected.load(), 1u);
    EXPECT_EQ(stats.conflicts_resolved.load(), 1u);
}

TEST(LoggerComponentTest, SubscribesToEverySyncEvent) {
    EventBus bus;
    LoggerComponent logger(bus);

    EXPECT_EQ(bus.subscriber_count<osync::events::SyncStateChangedEvent>(), 1u);
    EXPECT_EQ(bus.subscriber_count<SyncSessionStartedEvent>(), 1u);
    EXPECT_EQ(bus.subscriber_count<SyncSessionCompletedEvent>(), 1u);
    EXPECT_EQ(bus.subscriber_count<osync::events::SyncProgressEvent>(), 1u);
    EXPECT_EQ(bus.subscriber_count<ChangeRecordFailedEvent>(), 1u);
    EXPECT_EQ(bus.subscriber_count<ConflictDetectedEvent>(), 1u);
    EXPECT_EQ(bus.subscriber_count<ConflictResolvedEvent>(), 1u);

    SessionResult result;
    result.error = osync::make_error(osync::ErrorKind::Network, "unreachable");
    EXPECT_NO_THROW(bus.emit(SyncSessionCompletedEvent{result, 0}));
}

TEST(MetricsComponentTest, DestroyedComponentStopsReceivingEvents) {
    EventBus bus;
    {
        MetricsComponent metrics(bus);
        LoggerComponent logger(bus);
        EXPECT_EQ(bus.subscriber_count<SyncSessionStartedEvent>(), 2u);
    }

    EXPECT_EQ(bus.subscriber_count<SyncSessionStartedEvent>(), 0u);
    EXPECT_EQ(bus.subscriber_count<ConflictDetectedEvent>(), 0u);
    EXPECT_NO_THROW(bus.emit(SyncSessionStartedEvent{"session-2", 1, 0}));
    EXPECT_EQ(bus.handler_failures(), 0u);
}
