#ifndef RELOADED_LOCAL_HOMESERVER_H_
#define RELOADED_LOCAL_HOMESERVER_H_

#include <chrono>
#include <deque>
#include <memory>
#include <random>
#include <string>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/container/flat_hash_set.h"
#include "absl/synchronization/mutex.h"

#include "client.h"

namespace Reloaded {

struct LocalHomeserverOptions {
	std::string server_name = "localhost";
	// Upper bound of the uniformly drawn delay added to every request
	std::chrono::milliseconds latency{0};
	// Probability that a request fails before reaching the server state
	double failure_rate = 0.0;
	uint64_t seed = 0;
};

/**
 * In-process homeserver: accounts, rooms with membership and one inbound
 * buffer per account. Thread-safe; shared by every LocalClient of a run.
 */
class LocalHomeserver {
	public:
		explicit LocalHomeserver(LocalHomeserverOptions options = {});

		const std::string& server_name() const { return options_.server_name; }

		//********* Request surface used by LocalClient
		RegisterOutcome RegisterAccount(const std::string& localpart);
		LoginOutcome Authenticate(const std::string& localpart);

		/**
		 * Opens a sync session for an account. Messages buffered while the account
		 * was not syncing get their receipt fired before this returns.
		 */
		SyncResponse StartSync(const std::string& localpart, MessageHandler on_message,
				CancellationToken cancel);
		void StopSync(const std::string& localpart);
		std::vector<SyncEvent> DrainInbox(const std::string& localpart);

		std::optional<RoomId> CreateRoom(const std::string& creator);
		bool Invite(const RoomId& room_id, const std::string& localpart);
		bool Join(const std::string& localpart, const RoomId& room_id);
		std::optional<std::string> Post(const std::string& sender, const RoomId& room_id,
				const std::string& text);
		bool SetPresence(const std::string& localpart);

		//********* Fault injection shared by all clients
		// Sleeps for the simulated request latency
		void SimulateLatency();
		// Returns true when this request should fail
		bool InjectFailure();

		//********* Introspection
		bool IsRegistered(const std::string& localpart) const;
		std::vector<std::string> RoomMembers(const RoomId& room_id) const;
		size_t AccountCount() const;
		size_t RoomCount() const;
		size_t MessageCount() const;

	private:
		struct Account {
			absl::flat_hash_set<RoomId> joined;
			absl::flat_hash_set<RoomId> invited;
			std::deque<SyncEvent> inbox;
			// Messages delivered while no sync session was active
			std::vector<std::string> unreceipted;
			bool syncing = false;
			MessageHandler on_message;
			CancellationToken session;
			std::string presence;
		};

		struct Room {
			std::string creator;
			absl::flat_hash_set<std::string> members;
		};

		LocalHomeserverOptions options_;

		mutable absl::Mutex mu_;
		absl::flat_hash_map<std::string, Account> accounts_ ABSL_GUARDED_BY(mu_);
		absl::flat_hash_map<RoomId, Room> rooms_ ABSL_GUARDED_BY(mu_);
		size_t next_room_ ABSL_GUARDED_BY(mu_) = 0;
		size_t next_event_ ABSL_GUARDED_BY(mu_) = 0;

		absl::Mutex rng_mu_;
		std::mt19937_64 rng_ ABSL_GUARDED_BY(rng_mu_);
};

/**
 * Client bound to a LocalHomeserver
 */
class LocalClient : public Client {
	public:
		explicit LocalClient(std::shared_ptr<LocalHomeserver> server);
		~LocalClient() override;

		RegisterOutcome Register(const std::string& localpart) override;
		LoginOutcome Login(const std::string& localpart) override;
		std::optional<SyncResponse> Sync(MessageHandler on_message) override;
		std::vector<SyncEvent> ReadSyncEvents() override;
		std::optional<RoomId> CreateRoom() override;
		bool JoinRoom(const RoomId& room_id) override;
		std::optional<std::string> SendMessage(const RoomId& room_id, const std::string& text) override;
		std::optional<RoomId> AddFriend(const std::string& localpart) override;
		bool UpdateStatus() override;
		bool Logout() override;
		void Reset() override;
		std::string LastError() const override;

	private:
		// Latency plus fault injection; false means the request failed
		bool BeginRequest(const char* what);
		bool RequireSession(const char* what);

		std::shared_ptr<LocalHomeserver> server_;
		std::string localpart_;
		bool logged_in_ = false;
		std::optional<CancellationToken> sync_;

		mutable absl::Mutex error_mu_;
		std::string last_error_ ABSL_GUARDED_BY(error_mu_);
		void SetError(std::string error);
};

} // namespace Reloaded

#endif // RELOADED_LOCAL_HOMESERVER_H_
