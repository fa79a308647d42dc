#ifndef RELOADED_FRIENDSHIP_H_
#define RELOADED_FRIENDSHIP_H_

#include <memory>
#include <random>
#include <utility>
#include <vector>

#include "absl/container/btree_set.h"

#include "progress_tracker.h"
#include "user.h"

namespace Reloaded {

// Unordered pair of population indices, stored as (smaller, larger)
using Friendship = std::pair<size_t, size_t>;

inline Friendship MakeFriendship(size_t a, size_t b) {
	return a < b ? Friendship{a, b} : Friendship{b, a};
}

struct FriendshipOptions {
	// Connect operations in flight at once
	size_t room_creation_throughput = 50;
	// Connect attempts per pair before the pair is given up for this step
	size_t room_creation_retry_attempts = 3;
	// Bootstrap attempts for a user that left Syncing during the run phase
	size_t user_recovery_attempts = 3;
};

/**
 * Social graph of the population. Every friendship is a room shared by both
 * users. The set only grows, pairs are unique and never self-pairs.
 */
class FriendshipGraph {
	public:
		explicit FriendshipGraph(FriendshipOptions options = {});

		// ceil(ratio * n(n-1)/2)
		static size_t Target(size_t population, double ratio);

		/**
		 * Draws `count` distinct pairs over `population` users absent from
		 * `existing`. Rejection sampling while the resulting graph stays at most
		 * half complete, shuffled enumeration of the absent pairs above that.
		 */
		static std::vector<Friendship> SamplePairs(size_t population, size_t count,
				const absl::btree_set<Friendship>& existing, std::mt19937_64& rng);

		/**
		 * Grows the graph towards Target(users.size(), ratio), connecting new
		 * pairs concurrently. Users that logged out are brought back to Syncing
		 * first. Pairs whose connection keeps failing are dropped and replaced by
		 * freshly sampled ones for a bounded number of rounds.
		 * @return Number of friendships added
		 */
		size_t Extend(const std::vector<std::shared_ptr<User>>& users, double ratio,
				const ProgressCallback& progress = nullptr);

		size_t size() const { return pairs_.size(); }
		bool Contains(size_t a, size_t b) const { return pairs_.contains(MakeFriendship(a, b)); }
		const absl::btree_set<Friendship>& pairs() const { return pairs_; }

	private:
		// Connects one sample, single writer of pairs_
		size_t ConnectRound(const std::vector<std::shared_ptr<User>>& users,
				const std::vector<Friendship>& candidates, const ProgressCallback& progress);
		bool Connect(User& first, User& second) const;

		FriendshipOptions options_;
		absl::btree_set<Friendship> pairs_;
};

} // namespace Reloaded

#endif // RELOADED_FRIENDSHIP_H_
