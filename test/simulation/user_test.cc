#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include "../../src/simulation/user.h"

#include <cstdint>
#include <memory>
#include <random>
#include <vector>

using namespace Reloaded;
using ::testing::_;
using ::testing::Return;

namespace {

// First seed whose first draw picks the action
uint64_t SeedFor(SocialAction action) {
    for (uint64_t seed = 0;; ++seed) {
        std::mt19937_64 rng(seed);
        if (ChooseSocialAction(rng) == action) return seed;
    }
}

} // namespace

class MockClient : public Client {
public:
    MOCK_METHOD(RegisterOutcome, Register, (const std::string& localpart), (override));
    MOCK_METHOD(LoginOutcome, Login, (const std::string& localpart), (override));
    MOCK_METHOD(std::optional<SyncResponse>, Sync, (MessageHandler on_message), (override));
    MOCK_METHOD(std::vector<SyncEvent>, ReadSyncEvents, (), (override));
    MOCK_METHOD(std::optional<RoomId>, CreateRoom, (), (override));
    MOCK_METHOD(bool, JoinRoom, (const RoomId& room_id), (override));
    MOCK_METHOD(std::optional<std::string>, SendMessage, (const RoomId& room_id, const std::string& text), (override));
    MOCK_METHOD(std::optional<RoomId>, AddFriend, (const std::string& localpart), (override));
    MOCK_METHOD(bool, UpdateStatus, (), (override));
    MOCK_METHOD(bool, Logout, (), (override));
    MOCK_METHOD(void, Reset, (), (override));
    MOCK_METHOD(std::string, LastError, (), (const, override));
};

class UserTest : public ::testing::Test {
protected:
    void SetUp() override {
        channel_ = std::make_shared<EventChannel>();
        auto client = std::make_unique<::testing::NiceMock<MockClient>>();
        client_ = client.get();
        ON_CALL(*client_, LastError()).WillByDefault(Return("boom"));
        user_ = std::make_unique<User>("user_0_1", "test.local", std::move(client), channel_);
    }

    // Everything sent so far, in order
    std::vector<Event> Drain() {
        channel_->Interrupt();
        std::vector<Event> events;
        Event e;
        while (true) {
            channel_->Receive(e);
            if (std::holds_alternative<event::Finish>(e)) break;
            events.push_back(e);
        }
        return events;
    }

    // Socialize with the given action on the next Act()
    ActContext Forced(SocialAction action) {
        rng_.seed(SeedFor(action));
        ActContext ctx;
        ctx.peers = &peers_;
        ctx.rng = &rng_;
        return ctx;
    }

    void BringToSyncing(SyncResponse response = {}) {
        EXPECT_CALL(*client_, Register("user_0_1")).WillOnce(Return(RegisterOutcome::kOk));
        EXPECT_CALL(*client_, Login("user_0_1")).WillOnce(Return(LoginOutcome::kOk));
        EXPECT_CALL(*client_, Sync(_)).WillOnce([this, response](MessageHandler handler) {
            on_message_ = std::move(handler);
            return std::optional<SyncResponse>(response);
        });
        ASSERT_EQ(user_->Act(ctx_), StepOutcome::kAdvanced);
        ASSERT_EQ(user_->Act(ctx_), StepOutcome::kAdvanced);
        ASSERT_EQ(user_->Act(ctx_), StepOutcome::kAdvanced);
        ASSERT_EQ(user_->Status(), UserStatus::kSyncing);
        Drain();
    }

    std::shared_ptr<EventChannel> channel_;
    ::testing::NiceMock<MockClient>* client_ = nullptr;
    std::unique_ptr<User> user_;
    ActContext ctx_;
    MessageHandler on_message_;
    std::mt19937_64 rng_;
    std::vector<std::string> peers_{"user_0_1", "user_1_1"};
};

TEST_F(UserTest, IdentityFromLocalpartAndDomain) {
    EXPECT_EQ(user_->id(), "@user_0_1:test.local");
    EXPECT_EQ(user_->Status(), UserStatus::kUnregistered);
}

TEST_F(UserTest, RegisterOkMovesToUnauthenticated) {
    EXPECT_CALL(*client_, Register("user_0_1")).WillOnce(Return(RegisterOutcome::kOk));
    EXPECT_EQ(user_->Act(ctx_), StepOutcome::kAdvanced);
    EXPECT_EQ(user_->Status(), UserStatus::kUnauthenticated);

    auto events = Drain();
    ASSERT_EQ(events.size(), 1u);
    auto* duration = std::get_if<event::RequestDuration>(&events[0]);
    ASSERT_NE(duration, nullptr);
    EXPECT_EQ(duration->kind, ActionKind::kRegister);
}

TEST_F(UserTest, RegisterAlreadyExistsMovesToUnauthenticated) {
    EXPECT_CALL(*client_, Register(_)).WillOnce(Return(RegisterOutcome::kAlreadyExists));
    EXPECT_EQ(user_->Act(ctx_), StepOutcome::kAdvanced);
    EXPECT_EQ(user_->Status(), UserStatus::kUnauthenticated);
}

TEST_F(UserTest, RegisterFailureStaysAndRecordsError) {
    EXPECT_CALL(*client_, Register(_)).WillOnce(Return(RegisterOutcome::kFailed));
    EXPECT_EQ(user_->Act(ctx_), StepOutcome::kFailed);
    EXPECT_EQ(user_->Status(), UserStatus::kUnregistered);

    auto events = Drain();
    ASSERT_EQ(events.size(), 1u);
    auto* error = std::get_if<event::Error>(&events[0]);
    ASSERT_NE(error, nullptr);
    EXPECT_EQ(error->kind, ActionKind::kRegister);
    EXPECT_EQ(error->cause, "boom");
}

TEST_F(UserTest, LoginWithoutAccountRegressesToUnregistered) {
    EXPECT_CALL(*client_, Register(_)).WillOnce(Return(RegisterOutcome::kAlreadyExists));
    EXPECT_CALL(*client_, Login(_)).WillOnce(Return(LoginOutcome::kNotRegistered));
    user_->Act(ctx_);
    EXPECT_EQ(user_->Act(ctx_), StepOutcome::kRegressed);
    EXPECT_EQ(user_->Status(), UserStatus::kUnregistered);
}

TEST_F(UserTest, LoginFailureStays) {
    EXPECT_CALL(*client_, Register(_)).WillOnce(Return(RegisterOutcome::kOk));
    EXPECT_CALL(*client_, Login(_)).WillOnce(Return(LoginOutcome::kFailed));
    user_->Act(ctx_);
    EXPECT_EQ(user_->Act(ctx_), StepOutcome::kFailed);
    EXPECT_EQ(user_->Status(), UserStatus::kUnauthenticated);
}

TEST_F(UserTest, SyncQueuesInvitesAndKeepsJoinedRooms) {
    SyncResponse response;
    response.joined_rooms = {"!a:test.local", "!b:test.local", "!a:test.local"};
    response.invited_rooms = {"!c:test.local"};
    BringToSyncing(response);

    EXPECT_EQ(user_->Rooms(), (std::vector<RoomId>{"!a:test.local", "!b:test.local"}));
    EXPECT_EQ(user_->PendingEvents(), 1u);
}

TEST_F(UserTest, ReceiptHandlerEmitsMessageReceived) {
    BringToSyncing();
    ASSERT_TRUE(on_message_);
    on_message_("$event1:test.local");

    auto events = Drain();
    ASSERT_EQ(events.size(), 1u);
    auto* received = std::get_if<event::MessageReceived>(&events[0]);
    ASSERT_NE(received, nullptr);
    EXPECT_EQ(received->event_id, "$event1:test.local");
}

TEST_F(UserTest, ReactsToNewestPendingEventFirst) {
    BringToSyncing();
    EXPECT_CALL(*client_, ReadSyncEvents())
        .WillOnce(Return(std::vector<SyncEvent>{
            SyncEvent::Invite("!invite:test.local"),
            SyncEvent::Message("!chat:test.local", "$e:test.local", "hi")}))
        .WillRepeatedly(Return(std::vector<SyncEvent>{}));

    {
        ::testing::InSequence seq;
        EXPECT_CALL(*client_, SendMessage("!chat:test.local", _))
            .WillOnce(Return(std::optional<std::string>("$reply:test.local")));
        EXPECT_CALL(*client_, JoinRoom("!invite:test.local")).WillOnce(Return(true));
    }

    EXPECT_EQ(user_->Act(ctx_), StepOutcome::kAdvanced);
    EXPECT_EQ(user_->PendingEvents(), 1u);
    EXPECT_EQ(user_->Act(ctx_), StepOutcome::kAdvanced);
    EXPECT_EQ(user_->PendingEvents(), 0u);
    EXPECT_EQ(user_->Rooms(), std::vector<RoomId>{"!invite:test.local"});

    auto events = Drain();
    bool reply_announced = false;
    for (const auto& e : events) {
        if (auto* sent = std::get_if<event::MessageSent>(&e)) {
            reply_announced = sent->event_id == "$reply:test.local";
        }
    }
    EXPECT_TRUE(reply_announced);
}

TEST_F(UserTest, RoomCreatedIsAbsorbedWithoutReaction) {
    BringToSyncing();
    EXPECT_CALL(*client_, ReadSyncEvents())
        .WillOnce(Return(std::vector<SyncEvent>{
            SyncEvent::RoomCreated("!mine:test.local"),
            SyncEvent::Invite("!other:test.local")}));
    EXPECT_CALL(*client_, JoinRoom("!other:test.local")).WillOnce(Return(true));

    user_->Act(ctx_);
    EXPECT_EQ(user_->Rooms(), (std::vector<RoomId>{"!mine:test.local", "!other:test.local"}));
    EXPECT_EQ(user_->PendingEvents(), 0u);
}

TEST_F(UserTest, FailedJoinStillConsumesTheInvite) {
    SyncResponse response;
    response.invited_rooms = {"!gone:test.local"};
    BringToSyncing(response);
    EXPECT_CALL(*client_, JoinRoom("!gone:test.local")).WillOnce(Return(false));

    EXPECT_EQ(user_->Act(ctx_), StepOutcome::kFailed);
    EXPECT_EQ(user_->PendingEvents(), 0u);
    EXPECT_TRUE(user_->Rooms().empty());
}

TEST_F(UserTest, StopSignalLogsOutThenRestarts) {
    SyncResponse response;
    CancellationToken stop = response.cancel;
    BringToSyncing(response);

    stop.Cancel();
    EXPECT_CALL(*client_, ReadSyncEvents()).Times(0);
    EXPECT_EQ(user_->Act(ctx_), StepOutcome::kAdvanced);
    EXPECT_EQ(user_->Status(), UserStatus::kLoggedOut);

    EXPECT_CALL(*client_, Reset()).Times(1);
    EXPECT_EQ(user_->Act(ctx_), StepOutcome::kAdvanced);
    EXPECT_EQ(user_->Status(), UserStatus::kUnauthenticated);
}

TEST_F(UserTest, CancelledTickCommitsNothing) {
    EXPECT_CALL(*client_, Register(_)).WillOnce(Return(RegisterOutcome::kOk));
    ActContext cancelled;
    cancelled.cancel.Cancel();

    EXPECT_EQ(user_->Act(cancelled), StepOutcome::kCancelled);
    EXPECT_EQ(user_->Status(), UserStatus::kUnregistered);
    EXPECT_TRUE(Drain().empty());
}

TEST_F(UserTest, CancelledReactionKeepsEventQueued) {
    SyncResponse response;
    response.invited_rooms = {"!later:test.local"};
    BringToSyncing(response);
    EXPECT_CALL(*client_, JoinRoom("!later:test.local")).WillRepeatedly(Return(true));

    ActContext cancelled;
    cancelled.cancel.Cancel();
    EXPECT_EQ(user_->Act(cancelled), StepOutcome::kCancelled);
    EXPECT_EQ(user_->PendingEvents(), 1u);
    EXPECT_TRUE(user_->Rooms().empty());

    EXPECT_EQ(user_->Act(ctx_), StepOutcome::kAdvanced);
    EXPECT_EQ(user_->PendingEvents(), 0u);
    EXPECT_EQ(user_->Rooms(), std::vector<RoomId>{"!later:test.local"});
}

TEST_F(UserTest, BootstrapRetriesUntilSyncing) {
    EXPECT_CALL(*client_, Register(_))
        .WillOnce(Return(RegisterOutcome::kFailed))
        .WillOnce(Return(RegisterOutcome::kOk));
    EXPECT_CALL(*client_, Login(_)).WillOnce(Return(LoginOutcome::kOk));
    EXPECT_CALL(*client_, Sync(_)).WillOnce(Return(std::optional<SyncResponse>(SyncResponse{})));

    EXPECT_TRUE(user_->Bootstrap(2));
    EXPECT_EQ(user_->Status(), UserStatus::kSyncing);
}

TEST_F(UserTest, BootstrapGivesUpAfterAttempts) {
    EXPECT_CALL(*client_, Register(_)).Times(3).WillRepeatedly(Return(RegisterOutcome::kFailed));
    EXPECT_FALSE(user_->Bootstrap(3));
    EXPECT_EQ(user_->Status(), UserStatus::kUnregistered);
}

TEST_F(UserTest, WiringCreatesAndJoinsRooms) {
    BringToSyncing();
    EXPECT_CALL(*client_, CreateRoom()).WillOnce(Return(std::optional<RoomId>("!own:test.local")));
    EXPECT_CALL(*client_, JoinRoom("!peer:test.local")).WillOnce(Return(true));

    EXPECT_EQ(user_->CreateRoom(), std::optional<RoomId>("!own:test.local"));
    EXPECT_TRUE(user_->JoinRoom("!peer:test.local"));
    EXPECT_EQ(user_->Rooms(), (std::vector<RoomId>{"!own:test.local", "!peer:test.local"}));
}

TEST_F(UserTest, LogoutStopsSyncAndNextActLogsOut) {
    SyncResponse response;
    CancellationToken stop = response.cancel;
    BringToSyncing(response);
    EXPECT_CALL(*client_, Logout()).WillOnce(Return(true));

    EXPECT_EQ(user_->Act(Forced(SocialAction::kLogout)), StepOutcome::kAdvanced);
    EXPECT_TRUE(stop.IsCancelled());
    EXPECT_FALSE(user_->Ready());
    EXPECT_EQ(user_->Status(), UserStatus::kSyncing);

    auto events = Drain();
    ASSERT_EQ(events.size(), 1u);
    auto* duration = std::get_if<event::RequestDuration>(&events[0]);
    ASSERT_NE(duration, nullptr);
    EXPECT_EQ(duration->kind, ActionKind::kLogout);

    EXPECT_EQ(user_->Act(ctx_), StepOutcome::kAdvanced);
    EXPECT_EQ(user_->Status(), UserStatus::kLoggedOut);
}

TEST_F(UserTest, FailedLogoutKeepsSyncing) {
    SyncResponse response;
    CancellationToken stop = response.cancel;
    BringToSyncing(response);
    EXPECT_CALL(*client_, Logout()).WillOnce(Return(false));

    EXPECT_EQ(user_->Act(Forced(SocialAction::kLogout)), StepOutcome::kFailed);
    EXPECT_FALSE(stop.IsCancelled());
    EXPECT_TRUE(user_->Ready());
}

TEST_F(UserTest, UpdateStatusRecordsDuration) {
    BringToSyncing();
    EXPECT_CALL(*client_, UpdateStatus()).WillOnce(Return(true));

    EXPECT_EQ(user_->Act(Forced(SocialAction::kUpdateStatus)), StepOutcome::kAdvanced);
    auto events = Drain();
    ASSERT_EQ(events.size(), 1u);
    auto* duration = std::get_if<event::RequestDuration>(&events[0]);
    ASSERT_NE(duration, nullptr);
    EXPECT_EQ(duration->kind, ActionKind::kUpdateStatus);
}

TEST_F(UserTest, AddFriendInvitesAnotherUserAndKeepsTheRoom) {
    BringToSyncing();
    EXPECT_CALL(*client_, AddFriend("user_0_1")).Times(0);
    EXPECT_CALL(*client_, AddFriend("user_1_1"))
        .WillOnce(Return(std::optional<RoomId>("!friends:test.local")));

    EXPECT_EQ(user_->Act(Forced(SocialAction::kAddFriend)), StepOutcome::kAdvanced);
    EXPECT_EQ(user_->Rooms(), std::vector<RoomId>{"!friends:test.local"});

    auto events = Drain();
    ASSERT_EQ(events.size(), 1u);
    auto* duration = std::get_if<event::RequestDuration>(&events[0]);
    ASSERT_NE(duration, nullptr);
    EXPECT_EQ(duration->kind, ActionKind::kAddFriend);
}

TEST_F(UserTest, SendMessageGoesToAKnownRoom) {
    SyncResponse response;
    response.joined_rooms = {"!chat:test.local"};
    BringToSyncing(response);
    EXPECT_CALL(*client_, SendMessage("!chat:test.local", _))
        .WillOnce(Return(std::optional<std::string>("$sent:test.local")));

    EXPECT_EQ(user_->Act(Forced(SocialAction::kSendMessage)), StepOutcome::kAdvanced);
    auto events = Drain();
    ASSERT_EQ(events.size(), 2u);
    auto* duration = std::get_if<event::RequestDuration>(&events[0]);
    ASSERT_NE(duration, nullptr);
    EXPECT_EQ(duration->kind, ActionKind::kSendMessage);
    auto* sent = std::get_if<event::MessageSent>(&events[1]);
    ASSERT_NE(sent, nullptr);
    EXPECT_EQ(sent->event_id, "$sent:test.local");
}

TEST_F(UserTest, SendMessageWithoutRoomsFailsQuietly) {
    BringToSyncing();
    EXPECT_CALL(*client_, SendMessage(_, _)).Times(0);

    EXPECT_EQ(user_->Act(Forced(SocialAction::kSendMessage)), StepOutcome::kFailed);
    EXPECT_TRUE(Drain().empty());
}

TEST_F(UserTest, ForgottenRoomIsNoLongerUsed) {
    BringToSyncing();
    EXPECT_CALL(*client_, CreateRoom()).WillOnce(Return(std::optional<RoomId>("!lonely:test.local")));
    ASSERT_TRUE(user_->CreateRoom().has_value());
    user_->ForgetRoom("!lonely:test.local");
    EXPECT_TRUE(user_->Rooms().empty());
}

TEST_F(UserTest, BootstrapRestartsALoggedOutUser) {
    SyncResponse response;
    CancellationToken stop = response.cancel;
    BringToSyncing(response);
    stop.Cancel();

    EXPECT_CALL(*client_, Reset()).Times(1);
    EXPECT_CALL(*client_, Login(_)).WillOnce(Return(LoginOutcome::kOk));
    EXPECT_CALL(*client_, Sync(_)).WillOnce(Return(std::optional<SyncResponse>(SyncResponse{})));
    EXPECT_TRUE(user_->Bootstrap(1));
    EXPECT_TRUE(user_->Ready());
}

TEST_F(UserTest, CommitsCountOnlyLiveTicks) {
    EXPECT_CALL(*client_, Register(_)).WillRepeatedly(Return(RegisterOutcome::kOk));
    ActContext cancelled;
    cancelled.cancel.Cancel();

    EXPECT_EQ(user_->Commits(), 0u);
    user_->Act(cancelled);
    EXPECT_EQ(user_->Commits(), 0u);
    user_->Act(ctx_);
    EXPECT_EQ(user_->Commits(), 1u);
}

TEST_F(UserTest, ExclusiveClaim) {
    EXPECT_TRUE(user_->TryAcquire());
    EXPECT_FALSE(user_->TryAcquire());
    user_->Release();
    EXPECT_TRUE(user_->TryAcquire());
}

TEST(SocialActionTest, NestedBernoulliDistribution) {
    std::mt19937_64 rng(1234);
    constexpr int kDraws = 200000;
    int counts[4] = {0, 0, 0, 0};
    for (int i = 0; i < kDraws; ++i) {
        counts[static_cast<int>(ChooseSocialAction(rng))]++;
    }
    auto share = [&](SocialAction action) {
        return static_cast<double>(counts[static_cast<int>(action)]) / kDraws;
    };

    // 1/50, then 1/25 of the rest, then 1/3 of the rest
    EXPECT_NEAR(share(SocialAction::kLogout), 0.02, 0.003);
    EXPECT_NEAR(share(SocialAction::kUpdateStatus), 0.98 / 25.0, 0.004);
    EXPECT_NEAR(share(SocialAction::kAddFriend), 0.98 * 24.0 / 25.0 / 3.0, 0.006);
    EXPECT_NEAR(share(SocialAction::kSendMessage), 0.98 * 24.0 / 25.0 * 2.0 / 3.0, 0.006);
}
