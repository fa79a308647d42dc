#ifndef RELOADED_USER_H_
#define RELOADED_USER_H_

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <variant>
#include <vector>

#include "absl/synchronization/mutex.h"

#include "client/client.h"
#include "common/cancellation.h"
#include "events.h"

namespace Reloaded {

/**
 * Rooms and inbound events of a user whose background sync is running
 */
struct SyncSession {
	explicit SyncSession(CancellationToken stop) : cancel(std::move(stop)) {}

	absl::Mutex mu;
	// Insertion ordered, each room at most once
	std::vector<RoomId> rooms ABSL_GUARDED_BY(mu);
	// Invites and messages waiting for a reaction, newest last
	std::vector<SyncEvent> pending ABSL_GUARDED_BY(mu);
	// Stop handle of the background sync
	const CancellationToken cancel;

	// Returns false if the room was already known
	bool AddRoom(const RoomId& room_id) ABSL_EXCLUSIVE_LOCKS_REQUIRED(mu);
};

namespace state {

struct Unregistered {};
struct Unauthenticated {};
struct LoggedIn {};
struct Syncing {
	std::shared_ptr<SyncSession> session;
};
struct LoggedOut {};

} // namespace state

using UserState = std::variant<state::Unregistered, state::Unauthenticated, state::LoggedIn,
	  state::Syncing, state::LoggedOut>;

// Mirrors the alternatives of UserState
enum class UserStatus {
	kUnregistered,
	kUnauthenticated,
	kLoggedIn,
	kSyncing,
	kLoggedOut,
};

const char* UserStatusName(UserStatus status);

enum class StepOutcome {
	// The state moved forward or the social action went through
	kAdvanced,
	// The call failed, state kept for the next opportunity
	kFailed,
	// Login found no account, back to Unregistered
	kRegressed,
	// The tick deadline passed before the result was committed
	kCancelled,
};

enum class SocialAction {
	kLogout,
	kUpdateStatus,
	kAddFriend,
	kSendMessage,
};

/**
 * Nested Bernoulli trials: 1/50 log out, else 1/25 update status, else 1/3 add
 * a friend, else send a message.
 */
SocialAction ChooseSocialAction(std::mt19937_64& rng);

struct ActContext {
	// Cancelled when the tick deadline passes
	CancellationToken cancel;
	// Localparts of the whole population, read-only while ticking
	const std::vector<std::string>* peers = nullptr;
	// Source of the social choices, the thread's generator when unset
	std::mt19937_64* rng = nullptr;
};

/**
 * One simulated user. Each Act() performs exactly one externally visible
 * operation for the current lifecycle state and commits the resulting state
 * only if the tick was not cancelled meanwhile.
 */
class User {
	public:
		User(std::string localpart, const std::string& domain, std::unique_ptr<Client> client,
				std::shared_ptr<EventChannel> channel);
		~User();

		User(const User&) = delete;
		User& operator=(const User&) = delete;

		const std::string& localpart() const { return localpart_; }
		const std::string& id() const { return user_id_; }

		StepOutcome Act(const ActContext& ctx);

		/**
		 * Drives register -> login -> sync until the user is Ready(). Each
		 * attempt runs the pipeline until a call fails to move it forward. A
		 * user that logged out goes through reset and login again.
		 * @return true once the user is Ready()
		 */
		bool Bootstrap(size_t attempts);

		// Syncing with a live background sync
		bool Ready() const;

		//********* Friendship wiring. Rooms joined or created here are added to the
		// room set right away when the user is Syncing
		std::optional<RoomId> CreateRoom();
		bool JoinRoom(const RoomId& room_id);
		// Stops talking in a room nobody else joined
		void ForgetRoom(const RoomId& room_id);

		UserStatus Status() const;
		std::vector<RoomId> Rooms() const;
		size_t PendingEvents() const;

		// Number of committed Act() results. Waits for a commit in progress.
		uint64_t Commits() const;

		// A user is driven by at most one task; the scheduler claims it first
		bool TryAcquire();
		void Release();

	private:
		struct Transition {
			UserState next;
			StepOutcome outcome;
			std::vector<Event> events;
			// Runs under the state lock right before the state is replaced
			std::function<void()> on_commit;
		};

		Transition OnUnregistered(state::Unregistered current)
			ABSL_EXCLUSIVE_LOCKS_REQUIRED(client_mu_);
		Transition OnUnauthenticated(state::Unauthenticated current)
			ABSL_EXCLUSIVE_LOCKS_REQUIRED(client_mu_);
		Transition OnLoggedIn(state::LoggedIn current)
			ABSL_EXCLUSIVE_LOCKS_REQUIRED(client_mu_);
		Transition OnSyncing(state::Syncing current, const ActContext& ctx)
			ABSL_EXCLUSIVE_LOCKS_REQUIRED(client_mu_);
		Transition OnLoggedOut(state::LoggedOut current)
			ABSL_EXCLUSIVE_LOCKS_REQUIRED(client_mu_);

		// Reaction to the newest pending event
		Transition React(state::Syncing current, const SyncEvent& pending)
			ABSL_EXCLUSIVE_LOCKS_REQUIRED(client_mu_);
		Transition Socialize(state::Syncing current, const ActContext& ctx)
			ABSL_EXCLUSIVE_LOCKS_REQUIRED(client_mu_);

		// Checks the tick, replaces the state and emits the events under mu_
		StepOutcome Commit(Transition transition, const CancellationToken& cancel);
		std::shared_ptr<SyncSession> Session() const;
		void Emit(Event event);

		const std::string localpart_;
		const std::string user_id_;
		std::shared_ptr<EventChannel> channel_;

		// Serializes calls on the client
		absl::Mutex client_mu_;
		std::unique_ptr<Client> client_ ABSL_PT_GUARDED_BY(client_mu_);

		mutable absl::Mutex mu_;
		UserState state_ ABSL_GUARDED_BY(mu_);
		uint64_t commits_ ABSL_GUARDED_BY(mu_) = 0;

		std::atomic<bool> busy_{false};
};

} // namespace Reloaded

#endif // RELOADED_USER_H_
