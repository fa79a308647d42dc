#ifndef RELOADED_CLIENT_H_
#define RELOADED_CLIENT_H_

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "common/cancellation.h"

namespace Reloaded {

using RoomId = std::string;

enum class RegisterOutcome {
	kOk,
	kAlreadyExists,
	kFailed,
};

enum class LoginOutcome {
	kOk,
	kNotRegistered,
	kFailed,
};

/**
 * Inbound event observed by a client's background sync
 */
struct SyncEvent {
	enum class Type {
		kInvite,
		kMessage,
		kRoomCreated,
	};

	Type type;
	RoomId room_id;
	// Message only
	std::string event_id;
	std::string text;

	static SyncEvent Invite(RoomId room) {
		return SyncEvent{Type::kInvite, std::move(room), "", ""};
	}
	static SyncEvent Message(RoomId room, std::string event_id, std::string text) {
		return SyncEvent{Type::kMessage, std::move(room), std::move(event_id), std::move(text)};
	}
	static SyncEvent RoomCreated(RoomId room) {
		return SyncEvent{Type::kRoomCreated, std::move(room), "", ""};
	}
};

struct SyncResponse {
	std::vector<RoomId> joined_rooms;
	std::vector<RoomId> invited_rooms;
	// Stops the background sync. Shared by the client and its owner, either
	// side may request the stop.
	CancellationToken cancel;
};

// Invoked by the background sync for every message sent by another user
using MessageHandler = std::function<void(const std::string& event_id)>;

/**
 * Protocol client owned by a single simulated user. Calls on one instance are
 * never issued concurrently; every call except ReadSyncEvents and Reset may
 * hit the network.
 */
class Client {
public:
	virtual ~Client() = default;

	virtual RegisterOutcome Register(const std::string& localpart) = 0;
	virtual LoginOutcome Login(const std::string& localpart) = 0;

	/**
	 * Starts the background sync
	 * @param on_message Receipt handler for messages from other users
	 * @return Rooms known at sync start, nullopt on failure
	 */
	virtual std::optional<SyncResponse> Sync(MessageHandler on_message) = 0;

	/**
	 * Drains events buffered by the background sync since the last call
	 */
	virtual std::vector<SyncEvent> ReadSyncEvents() = 0;

	virtual std::optional<RoomId> CreateRoom() = 0;
	virtual bool JoinRoom(const RoomId& room_id) = 0;

	/**
	 * @return Server assigned event id, nullopt on failure
	 */
	virtual std::optional<std::string> SendMessage(const RoomId& room_id, const std::string& text) = 0;

	// Creates a room and invites the given user into it
	virtual std::optional<RoomId> AddFriend(const std::string& localpart) = 0;

	virtual bool UpdateStatus() = 0;
	virtual bool Logout() = 0;

	// Drops session state so the owner can log in again
	virtual void Reset() = 0;

	// Cause of the most recent failed call
	virtual std::string LastError() const = 0;
};

} // namespace Reloaded

#endif // RELOADED_CLIENT_H_
