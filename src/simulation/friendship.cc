#include "friendship.h"

#include <algorithm>
#include <atomic>
#include <cmath>
#include <future>

#include <glog/logging.h>

#include "common/task_pool.h"
#include "common/time_utils.h"

namespace Reloaded {

namespace {

constexpr double kTargetEpsilon = 1e-9;
// Resampling rounds after the first one, replacing pairs that failed to connect
constexpr size_t kReplacementRounds = 2;

} // namespace

FriendshipGraph::FriendshipGraph(FriendshipOptions options) : options_(options) {}

size_t FriendshipGraph::Target(size_t population, double ratio) {
	if (population < 2) {
		return 0;
	}
	const size_t possible = population * (population - 1) / 2;
	// Absorbs the rounding of ratio * possible, 0.55 * 780 is 429.00000000000006
	double exact = ratio * static_cast<double>(possible);
	size_t target = static_cast<size_t>(std::ceil(exact - kTargetEpsilon * std::max(1.0, exact)));
	return std::min(target, possible);
}

std::vector<Friendship> FriendshipGraph::SamplePairs(size_t population, size_t count,
		const absl::btree_set<Friendship>& existing, std::mt19937_64& rng) {
	std::vector<Friendship> sampled;
	if (population < 2 || count == 0) {
		return sampled;
	}
	const size_t possible = population * (population - 1) / 2;
	count = std::min(count, possible - std::min(existing.size(), possible));

	if ((existing.size() + count) * 2 <= possible) {
		absl::btree_set<Friendship> drawn;
		std::uniform_int_distribution<size_t> dist(0, population - 1);
		while (sampled.size() < count) {
			size_t a = dist(rng);
			size_t b = dist(rng);
			if (a == b) {
				continue;
			}
			Friendship pair = MakeFriendship(a, b);
			if (existing.contains(pair) || !drawn.insert(pair).second) {
				continue;
			}
			sampled.push_back(pair);
		}
		return sampled;
	}

	// Dense graph: rejection would mostly redraw known pairs
	std::vector<Friendship> absent;
	absent.reserve(possible - existing.size());
	for (size_t a = 0; a < population; ++a) {
		for (size_t b = a + 1; b < population; ++b) {
			if (!existing.contains(Friendship{a, b})) {
				absent.emplace_back(a, b);
			}
		}
	}
	std::shuffle(absent.begin(), absent.end(), rng);
	absent.resize(count);
	return absent;
}

size_t FriendshipGraph::Extend(const std::vector<std::shared_ptr<User>>& users, double ratio,
		const ProgressCallback& progress) {
	const size_t target = Target(users.size(), ratio);
	if (pairs_.size() >= target) {
		VLOG(1) << "Friendship graph already at " << pairs_.size() << "/" << target;
		if (progress) progress(Phase::kInitFriendships, 0, 0);
		return 0;
	}

	size_t added = 0;
	for (size_t round = 0; round <= kReplacementRounds && pairs_.size() < target; ++round) {
		std::vector<Friendship> candidates = SamplePairs(users.size(), target - pairs_.size(),
				pairs_, ThreadLocalRng());
		if (round == 0) {
			LOG(INFO) << "Creating " << candidates.size() << " friendships (target " << target << ")";
		} else {
			LOG(INFO) << "Replacing " << candidates.size() << " dropped friendships, round " << round;
		}
		added += ConnectRound(users, candidates, progress);
	}

	if (pairs_.size() < target) {
		LOG(WARNING) << "Friendship target missed: " << pairs_.size() << "/" << target;
	}
	LOG(INFO) << "Friendships: " << pairs_.size() << " (" << added << " new)";
	return added;
}

size_t FriendshipGraph::ConnectRound(const std::vector<std::shared_ptr<User>>& users,
		const std::vector<Friendship>& candidates, const ProgressCallback& progress) {
	TaskPool pool(options_.room_creation_throughput);
	std::atomic<size_t> done{0};
	std::vector<std::future<bool>> results;
	results.reserve(candidates.size());
	for (const Friendship& pair : candidates) {
		User* first = users[pair.first].get();
		User* second = users[pair.second].get();
		results.push_back(pool.Submit([this, first, second, &done, &progress, total = candidates.size()]() {
			bool connected = Connect(*first, *second);
			size_t current = ++done;
			if (progress) progress(Phase::kInitFriendships, current, total);
			return connected;
		}));
	}

	// Single writer: only this thread touches the set
	size_t added = 0;
	for (size_t i = 0; i < candidates.size(); ++i) {
		if (results[i].get()) {
			pairs_.insert(candidates[i]);
			added++;
		} else {
			LOG(WARNING) << "Dropping friendship between " << users[candidates[i].first]->id()
				<< " and " << users[candidates[i].second]->id();
		}
	}
	pool.Stop();
	return added;
}

bool FriendshipGraph::Connect(User& first, User& second) const {
	// The run phase may have logged either user out
	if (!first.Bootstrap(options_.user_recovery_attempts)) {
		VLOG(1) << first.id() << " couldn't get back to syncing";
		return false;
	}
	if (!second.Bootstrap(options_.user_recovery_attempts)) {
		VLOG(1) << second.id() << " couldn't get back to syncing";
		return false;
	}

	std::optional<RoomId> room;
	for (size_t attempt = 0; attempt < options_.room_creation_retry_attempts; ++attempt) {
		if (!room) {
			room = first.CreateRoom();
			if (!room) {
				VLOG(1) << first.id() << " couldn't create a room, attempt " << (attempt + 1);
				continue;
			}
		}
		if (second.JoinRoom(*room)) {
			return true;
		}
		VLOG(1) << second.id() << " couldn't join " << *room << ", attempt " << (attempt + 1);
	}
	if (room) {
		// Nobody would ever receive what the creator sends there
		first.ForgetRoom(*room);
	}
	return false;
}

} // namespace Reloaded
