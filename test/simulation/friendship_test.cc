#include <gtest/gtest.h>
#include "../../src/simulation/friendship.h"
#include "../../src/client/local_homeserver.h"

#include <algorithm>
#include <atomic>
#include <memory>
#include <random>
#include <vector>

using namespace Reloaded;

namespace {

// Rejects the first join of every room
class FlakyJoinClient : public LocalClient {
public:
    explicit FlakyJoinClient(std::shared_ptr<LocalHomeserver> server) : LocalClient(std::move(server)) {}

    bool JoinRoom(const RoomId& room_id) override {
        if (attempted_.insert(room_id).second) {
            return false;
        }
        return LocalClient::JoinRoom(room_id);
    }

private:
    absl::btree_set<RoomId> attempted_;
};

uint64_t SeedFor(SocialAction action) {
    for (uint64_t seed = 0;; ++seed) {
        std::mt19937_64 rng(seed);
        if (ChooseSocialAction(rng) == action) return seed;
    }
}

} // namespace

TEST(FriendshipTargetTest, CeilOfRatioTimesPossiblePairs) {
    EXPECT_EQ(FriendshipGraph::Target(4, 0.5), 3u);
    EXPECT_EQ(FriendshipGraph::Target(3, 1.0), 3u);
    EXPECT_EQ(FriendshipGraph::Target(10, 0.1), 5u);
    EXPECT_EQ(FriendshipGraph::Target(10, 0.01), 1u);
    EXPECT_EQ(FriendshipGraph::Target(1, 1.0), 0u);
    EXPECT_EQ(FriendshipGraph::Target(0, 0.5), 0u);
}

TEST(FriendshipTargetTest, ExactProductIsNotRoundedUp) {
    // 0.55 * 780 is slightly above 429 in double arithmetic
    EXPECT_EQ(FriendshipGraph::Target(40, 0.55), 429u);
    EXPECT_EQ(FriendshipGraph::Target(40, 0.551), 430u);
    EXPECT_EQ(FriendshipGraph::Target(100, 0.3), 1485u);
}

TEST(FriendshipSamplingTest, ExactCountNoSelfPairsNoDuplicates) {
    std::mt19937_64 rng(7);
    const double ratios[] = {0.05, 0.3, 0.5, 0.51, 0.9, 1.0};
    for (size_t n = 2; n <= 30; n += 7) {
        for (double r : ratios) {
            size_t target = FriendshipGraph::Target(n, r);
            absl::btree_set<Friendship> empty;
            std::vector<Friendship> pairs = FriendshipGraph::SamplePairs(n, target, empty, rng);

            ASSERT_EQ(pairs.size(), target) << "n=" << n << " r=" << r;
            absl::btree_set<Friendship> unique(pairs.begin(), pairs.end());
            EXPECT_EQ(unique.size(), pairs.size());
            for (const auto& [a, b] : pairs) {
                EXPECT_LT(a, b);
                EXPECT_LT(b, n);
            }
        }
    }
}

TEST(FriendshipSamplingTest, SkipsExistingPairs) {
    std::mt19937_64 rng(11);
    absl::btree_set<Friendship> existing;
    for (size_t b = 1; b < 8; ++b) existing.insert(MakeFriendship(0, b));

    // 8 users: 28 pairs, 7 taken; both the sparse and the dense path
    for (size_t count : {5u, 21u}) {
        auto pairs = FriendshipGraph::SamplePairs(8, count, existing, rng);
        ASSERT_EQ(pairs.size(), count);
        for (const auto& pair : pairs) {
            EXPECT_FALSE(existing.contains(pair));
        }
    }
}

TEST(FriendshipSamplingTest, NeverExceedsPossiblePairs) {
    std::mt19937_64 rng(3);
    absl::btree_set<Friendship> existing = {{0, 1}, {0, 2}};
    auto pairs = FriendshipGraph::SamplePairs(3, 10, existing, rng);
    ASSERT_EQ(pairs.size(), 1u);
    EXPECT_EQ(pairs[0], Friendship(1, 2));
}

class FriendshipGraphTest : public ::testing::Test {
protected:
    void SetUp() override {
        LocalHomeserverOptions options;
        options.server_name = "test.local";
        server_ = std::make_shared<LocalHomeserver>(options);
        channel_ = std::make_shared<EventChannel>();
    }

    void AddUsers(size_t count, bool bootstrap = true) {
        for (size_t i = 0; i < count; ++i) {
            auto user = std::make_shared<User>("user_" + std::to_string(users_.size()) + "_1",
                    "test.local", std::make_unique<LocalClient>(server_), channel_);
            if (bootstrap) {
                ASSERT_TRUE(user->Bootstrap(1));
            }
            users_.push_back(std::move(user));
        }
    }

    std::shared_ptr<LocalHomeserver> server_;
    std::shared_ptr<EventChannel> channel_;
    std::vector<std::shared_ptr<User>> users_;
};

TEST_F(FriendshipGraphTest, CompleteGraphOfThreeSharesRooms) {
    AddUsers(3);
    FriendshipGraph graph(FriendshipOptions{4, 3});

    EXPECT_EQ(graph.Extend(users_, 1.0), 3u);
    EXPECT_EQ(graph.size(), 3u);

    for (const auto& user : users_) {
        EXPECT_EQ(user->Rooms().size(), 2u) << user->id();
    }
    for (const auto& [a, b] : graph.pairs()) {
        auto rooms_a = users_[a]->Rooms();
        auto rooms_b = users_[b]->Rooms();
        bool shared = std::any_of(rooms_a.begin(), rooms_a.end(), [&rooms_b](const RoomId& room) {
            return std::find(rooms_b.begin(), rooms_b.end(), room) != rooms_b.end();
        });
        EXPECT_TRUE(shared) << a << "-" << b;
    }
    EXPECT_EQ(server_->RoomCount(), 3u);
}

TEST_F(FriendshipGraphTest, GrowsMonotonicallyWithPopulation) {
    AddUsers(4);
    FriendshipGraph graph(FriendshipOptions{2, 1});

    EXPECT_EQ(graph.Extend(users_, 0.5), 3u);
    absl::btree_set<Friendship> before = graph.pairs();

    // Already at target
    EXPECT_EQ(graph.Extend(users_, 0.5), 0u);

    AddUsers(2);
    graph.Extend(users_, 0.5);
    EXPECT_EQ(graph.size(), FriendshipGraph::Target(6, 0.5));
    for (const auto& pair : before) {
        EXPECT_TRUE(graph.Contains(pair.second, pair.first));
    }
}

TEST_F(FriendshipGraphTest, FailedConnectionsAreDropped) {
    // Every request is rejected, nobody reaches Syncing
    LocalHomeserverOptions options;
    options.server_name = "test.local";
    options.failure_rate = 1.0;
    server_ = std::make_shared<LocalHomeserver>(options);
    AddUsers(3, false);
    FriendshipGraph graph(FriendshipOptions{2, 2, 1});

    EXPECT_EQ(graph.Extend(users_, 1.0), 0u);
    EXPECT_EQ(graph.size(), 0u);
    EXPECT_EQ(server_->RoomCount(), 0u);
}

TEST_F(FriendshipGraphTest, LoggedOutUserIsRecoveredBeforeWiring) {
    AddUsers(3);
    User& leaver = *users_[2];

    std::mt19937_64 rng(SeedFor(SocialAction::kLogout));
    ActContext ctx;
    ctx.rng = &rng;
    ASSERT_EQ(leaver.Act(ctx), StepOutcome::kAdvanced);
    EXPECT_FALSE(leaver.Ready());
    ASSERT_EQ(leaver.Act(ctx), StepOutcome::kAdvanced);
    ASSERT_EQ(leaver.Act(ctx), StepOutcome::kAdvanced);
    ASSERT_EQ(leaver.Status(), UserStatus::kUnauthenticated);

    FriendshipGraph graph(FriendshipOptions{4, 3, 3});
    EXPECT_EQ(graph.Extend(users_, 1.0), 3u);
    EXPECT_EQ(graph.size(), FriendshipGraph::Target(3, 1.0));
    EXPECT_TRUE(leaver.Ready());

    EXPECT_EQ(server_->RoomCount(), 3u);
    for (const auto& user : users_) {
        auto rooms = user->Rooms();
        EXPECT_EQ(rooms.size(), 2u) << user->id();
        for (const auto& room : rooms) {
            EXPECT_EQ(server_->RoomMembers(room).size(), 2u) << room;
        }
    }
}

TEST_F(FriendshipGraphTest, FailedJoinIsRetriedInTheSameRoom) {
    for (size_t i = 0; i < 3; ++i) {
        auto user = std::make_shared<User>("user_" + std::to_string(i) + "_1", "test.local",
                std::make_unique<FlakyJoinClient>(server_), channel_);
        ASSERT_TRUE(user->Bootstrap(1));
        users_.push_back(std::move(user));
    }
    FriendshipGraph graph(FriendshipOptions{1, 2, 1});

    EXPECT_EQ(graph.Extend(users_, 1.0), 3u);
    // One room per pair, no abandoned rooms
    EXPECT_EQ(server_->RoomCount(), 3u);
    for (const auto& user : users_) {
        EXPECT_EQ(user->Rooms().size(), 2u) << user->id();
    }
}

TEST_F(FriendshipGraphTest, RoomOfAnUnjoinablePairIsForgotten) {
    for (size_t i = 0; i < 2; ++i) {
        auto user = std::make_shared<User>("user_" + std::to_string(i) + "_1", "test.local",
                std::make_unique<FlakyJoinClient>(server_), channel_);
        ASSERT_TRUE(user->Bootstrap(1));
        users_.push_back(std::move(user));
    }
    // A single attempt never gets past the rejected first join
    FriendshipGraph graph(FriendshipOptions{1, 1, 1});

    EXPECT_EQ(graph.Extend(users_, 1.0), 0u);
    for (const auto& user : users_) {
        EXPECT_TRUE(user->Rooms().empty()) << user->id();
    }
}

TEST_F(FriendshipGraphTest, ReportsProgress) {
    AddUsers(4);
    FriendshipGraph graph;
    std::atomic<size_t> calls{0};
    std::atomic<size_t> last_total{0};
    graph.Extend(users_, 1.0, [&](Phase phase, size_t, size_t total) {
        EXPECT_EQ(phase, Phase::kInitFriendships);
        last_total = total;
        calls++;
    });
    EXPECT_EQ(calls.load(), 6u);
    EXPECT_EQ(last_total.load(), 6u);
}
