#include "user.h"

#include <algorithm>
#include <chrono>
#include <type_traits>

#include <glog/logging.h>

#include "client/homeserver_url.h"
#include "common/time_utils.h"

namespace Reloaded {

namespace {

using Clock = std::chrono::steady_clock;

constexpr size_t kMessageLength = 50;

Event Elapsed(ActionKind kind, Clock::time_point start) {
	return event::RequestDuration{kind,
		std::chrono::duration_cast<std::chrono::microseconds>(Clock::now() - start)};
}

std::string RandomText() {
	static constexpr char kAlphabet[] =
		"ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789";
	std::uniform_int_distribution<size_t> dist(0, sizeof(kAlphabet) - 2);
	std::string text(kMessageLength, ' ');
	for (char& c : text) {
		c = kAlphabet[dist(ThreadLocalRng())];
	}
	return text;
}

} // namespace

bool SyncSession::AddRoom(const RoomId& room_id) {
	if (std::find(rooms.begin(), rooms.end(), room_id) != rooms.end()) {
		return false;
	}
	rooms.push_back(room_id);
	return true;
}

const char* UserStatusName(UserStatus status) {
	switch (status) {
		case UserStatus::kUnregistered:
			return "unregistered";
		case UserStatus::kUnauthenticated:
			return "unauthenticated";
		case UserStatus::kLoggedIn:
			return "logged_in";
		case UserStatus::kSyncing:
			return "syncing";
		case UserStatus::kLoggedOut:
			return "logged_out";
	}
	return "unknown";
}

SocialAction ChooseSocialAction(std::mt19937_64& rng) {
	if (std::bernoulli_distribution(1.0 / 50.0)(rng)) {
		return SocialAction::kLogout;
	}
	if (std::bernoulli_distribution(1.0 / 25.0)(rng)) {
		return SocialAction::kUpdateStatus;
	}
	if (std::bernoulli_distribution(1.0 / 3.0)(rng)) {
		return SocialAction::kAddFriend;
	}
	return SocialAction::kSendMessage;
}

User::User(std::string localpart, const std::string& domain, std::unique_ptr<Client> client,
		std::shared_ptr<EventChannel> channel)
	: localpart_(std::move(localpart)),
	user_id_(MakeUserId(localpart_, domain)),
	channel_(std::move(channel)),
	client_(std::move(client)),
	state_(state::Unregistered{}) {}

User::~User() {
	absl::MutexLock lock(&client_mu_);
	client_.reset();
}

//----------------------------------------------------------------------------
// Lifecycle
//----------------------------------------------------------------------------

StepOutcome User::Act(const ActContext& ctx) {
	absl::MutexLock client_lock(&client_mu_);
	UserState current;
	{
		absl::MutexLock lock(&mu_);
		current = state_;
	}

	Transition transition = std::visit([this, &ctx](auto s) -> Transition {
		using T = std::decay_t<decltype(s)>;
		if constexpr (std::is_same_v<T, state::Unregistered>) {
			return OnUnregistered(std::move(s));
		} else if constexpr (std::is_same_v<T, state::Unauthenticated>) {
			return OnUnauthenticated(std::move(s));
		} else if constexpr (std::is_same_v<T, state::LoggedIn>) {
			return OnLoggedIn(std::move(s));
		} else if constexpr (std::is_same_v<T, state::Syncing>) {
			return OnSyncing(std::move(s), ctx);
		} else {
			return OnLoggedOut(std::move(s));
		}
	}, std::move(current));

	return Commit(std::move(transition), ctx.cancel);
}

StepOutcome User::Commit(Transition transition, const CancellationToken& cancel) {
	absl::MutexLock lock(&mu_);
	if (cancel.IsCancelled()) {
		VLOG(2) << "User " << user_id_ << " missed the tick deadline, result discarded";
		return StepOutcome::kCancelled;
	}
	if (transition.on_commit) {
		transition.on_commit();
	}
	state_ = std::move(transition.next);
	commits_++;
	for (auto& event : transition.events) {
		Emit(std::move(event));
	}
	return transition.outcome;
}

void User::Emit(Event event) {
	channel_->Send(std::move(event));
}

User::Transition User::OnUnregistered(state::Unregistered current) {
	Clock::time_point start = Clock::now();
	RegisterOutcome outcome = client_->Register(localpart_);
	switch (outcome) {
		case RegisterOutcome::kOk:
			return Transition{state::Unauthenticated{}, StepOutcome::kAdvanced,
				{Elapsed(ActionKind::kRegister, start)}, nullptr};
		case RegisterOutcome::kAlreadyExists:
			VLOG(1) << "Client already registered, proceed to login " << user_id_;
			return Transition{state::Unauthenticated{}, StepOutcome::kAdvanced, {}, nullptr};
		case RegisterOutcome::kFailed:
			break;
	}
	std::string cause = client_->LastError();
	LOG(WARNING) << "Failed to register " << user_id_ << ": " << cause;
	return Transition{current, StepOutcome::kFailed,
		{event::Error{ActionKind::kRegister, cause}}, nullptr};
}

User::Transition User::OnUnauthenticated(state::Unauthenticated current) {
	Clock::time_point start = Clock::now();
	LoginOutcome outcome = client_->Login(localpart_);
	switch (outcome) {
		case LoginOutcome::kOk:
			return Transition{state::LoggedIn{}, StepOutcome::kAdvanced,
				{Elapsed(ActionKind::kLogin, start)}, nullptr};
		case LoginOutcome::kNotRegistered:
			LOG(WARNING) << "Login of " << user_id_ << " found no account, registering again";
			return Transition{state::Unregistered{}, StepOutcome::kRegressed,
				{event::Error{ActionKind::kLogin, "not registered"}}, nullptr};
		case LoginOutcome::kFailed:
			break;
	}
	std::string cause = client_->LastError();
	LOG(WARNING) << "Failed to login " << user_id_ << ": " << cause;
	return Transition{current, StepOutcome::kFailed,
		{event::Error{ActionKind::kLogin, cause}}, nullptr};
}

User::Transition User::OnLoggedIn(state::LoggedIn current) {
	Clock::time_point start = Clock::now();
	std::shared_ptr<EventChannel> channel = channel_;
	std::optional<SyncResponse> response = client_->Sync(
			[channel](const std::string& event_id) {
				channel->Send(event::MessageReceived{event_id});
			});
	if (!response) {
		std::string cause = client_->LastError();
		LOG(WARNING) << "Failed to start sync for " << user_id_ << ": " << cause;
		return Transition{current, StepOutcome::kFailed,
			{event::Error{ActionKind::kSync, cause}}, nullptr};
	}

	auto session = std::make_shared<SyncSession>(response->cancel);
	{
		absl::MutexLock lock(&session->mu);
		for (const auto& room_id : response->joined_rooms) {
			session->AddRoom(room_id);
		}
		for (const auto& room_id : response->invited_rooms) {
			session->pending.push_back(SyncEvent::Invite(room_id));
		}
	}
	VLOG(1) << "User is now syncing: " << user_id_;
	return Transition{state::Syncing{std::move(session)}, StepOutcome::kAdvanced,
		{Elapsed(ActionKind::kSync, start)}, nullptr};
}

User::Transition User::OnSyncing(state::Syncing current, const ActContext& ctx) {
	if (current.session->cancel.IsCancelled()) {
		VLOG(1) << "Sync of " << user_id_ << " stopped, user is logged out";
		return Transition{state::LoggedOut{}, StepOutcome::kAdvanced, {}, nullptr};
	}

	// Absorbed right away; an unreacted event stays queued, so a cancelled tick
	// leaves the session restartable.
	std::vector<SyncEvent> inbound = client_->ReadSyncEvents();
	std::optional<SyncEvent> newest;
	{
		absl::MutexLock lock(&current.session->mu);
		for (auto& ev : inbound) {
			if (ev.type == SyncEvent::Type::kRoomCreated) {
				current.session->AddRoom(ev.room_id);
			} else {
				current.session->pending.push_back(std::move(ev));
			}
		}
		if (!current.session->pending.empty()) {
			newest = current.session->pending.back();
		}
	}

	if (newest) {
		return React(std::move(current), *newest);
	}
	return Socialize(std::move(current), ctx);
}

User::Transition User::React(state::Syncing current, const SyncEvent& pending) {
	std::shared_ptr<SyncSession> session = current.session;
	Clock::time_point start = Clock::now();
	Transition transition{current, StepOutcome::kAdvanced, {}, nullptr};

	if (pending.type == SyncEvent::Type::kInvite) {
		bool joined = client_->JoinRoom(pending.room_id);
		if (joined) {
			transition.events.push_back(Elapsed(ActionKind::kJoinRoom, start));
		} else {
			std::string cause = client_->LastError();
			LOG(WARNING) << "User " << user_id_ << " couldn't join room " << pending.room_id << ": " << cause;
			transition.outcome = StepOutcome::kFailed;
			transition.events.push_back(event::Error{ActionKind::kJoinRoom, cause});
		}
		RoomId room_id = pending.room_id;
		transition.on_commit = [session, room_id, joined]() {
			absl::MutexLock lock(&session->mu);
			if (!session->pending.empty()) {
				session->pending.pop_back();
			}
			if (joined) {
				session->AddRoom(room_id);
			}
		};
		return transition;
	}

	// Message: reply in the same room
	std::optional<std::string> event_id = client_->SendMessage(pending.room_id, RandomText());
	if (event_id) {
		transition.events.push_back(Elapsed(ActionKind::kSendMessage, start));
		transition.events.push_back(event::MessageSent{*event_id});
	} else {
		std::string cause = client_->LastError();
		LOG(WARNING) << "User " << user_id_ << " couldn't reply in room " << pending.room_id << ": " << cause;
		transition.outcome = StepOutcome::kFailed;
		transition.events.push_back(event::Error{ActionKind::kSendMessage, cause});
	}
	transition.on_commit = [session]() {
		absl::MutexLock lock(&session->mu);
		if (!session->pending.empty()) {
			session->pending.pop_back();
		}
	};
	return transition;
}

User::Transition User::Socialize(state::Syncing current, const ActContext& ctx) {
	std::shared_ptr<SyncSession> session = current.session;
	Transition transition{current, StepOutcome::kAdvanced, {}, nullptr};
	std::mt19937_64& rng = ctx.rng != nullptr ? *ctx.rng : ThreadLocalRng();
	SocialAction action = ChooseSocialAction(rng);

	auto record = [this, &transition](ActionKind kind, Clock::time_point start, bool ok) {
		if (ok) {
			transition.events.push_back(Elapsed(kind, start));
			return;
		}
		std::string cause = client_->LastError();
		LOG(WARNING) << "User " << user_id_ << " failed to " << ActionKindName(kind) << ": " << cause;
		transition.outcome = StepOutcome::kFailed;
		transition.events.push_back(event::Error{kind, cause});
	};

	if (action == SocialAction::kAddFriend) {
		std::optional<std::string> peer;
		if (ctx.peers != nullptr && ctx.peers->size() > 1) {
			std::uniform_int_distribution<size_t> dist(0, ctx.peers->size() - 1);
			while (!peer || *peer == localpart_) {
				peer = (*ctx.peers)[dist(rng)];
			}
		}
		if (!peer) {
			// Nobody to befriend yet
			action = SocialAction::kSendMessage;
		} else {
			Clock::time_point start = Clock::now();
			std::optional<RoomId> room = client_->AddFriend(*peer);
			record(ActionKind::kAddFriend, start, room.has_value());
			if (room) {
				RoomId room_id = *room;
				transition.on_commit = [session, room_id]() {
					absl::MutexLock lock(&session->mu);
					session->AddRoom(room_id);
				};
			}
			return transition;
		}
	}

	switch (action) {
		case SocialAction::kLogout: {
			Clock::time_point start = Clock::now();
			bool ok = client_->Logout();
			record(ActionKind::kLogout, start, ok);
			if (ok) {
				// Picked up by the next call, which moves the user to LoggedOut
				transition.on_commit = [session]() { session->cancel.Cancel(); };
			}
			break;
		}
		case SocialAction::kUpdateStatus: {
			Clock::time_point start = Clock::now();
			record(ActionKind::kUpdateStatus, start, client_->UpdateStatus());
			break;
		}
		case SocialAction::kSendMessage: {
			std::optional<RoomId> room_id;
			{
				absl::MutexLock lock(&session->mu);
				if (!session->rooms.empty()) {
					std::uniform_int_distribution<size_t> dist(0, session->rooms.size() - 1);
					room_id = session->rooms[dist(rng)];
				}
			}
			if (!room_id) {
				VLOG(2) << "User " << user_id_ << " has no room to talk in";
				transition.outcome = StepOutcome::kFailed;
				break;
			}
			Clock::time_point start = Clock::now();
			std::optional<std::string> event_id = client_->SendMessage(*room_id, RandomText());
			record(ActionKind::kSendMessage, start, event_id.has_value());
			if (event_id) {
				transition.events.push_back(event::MessageSent{*event_id});
			}
			break;
		}
		case SocialAction::kAddFriend:
			break;
	}
	return transition;
}

User::Transition User::OnLoggedOut(state::LoggedOut current) {
	(void)current;
	client_->Reset();
	VLOG(1) << "Session of " << user_id_ << " reset, logging in again";
	return Transition{state::Unauthenticated{}, StepOutcome::kAdvanced, {}, nullptr};
}

bool User::Bootstrap(size_t attempts) {
	ActContext ctx;
	for (size_t attempt = 0; attempt < attempts; ++attempt) {
		while (!Ready()) {
			if (Act(ctx) != StepOutcome::kAdvanced) {
				break;
			}
		}
		if (Ready()) {
			return true;
		}
		VLOG(1) << "Attempt " << (attempt + 1) << "/" << attempts << " to init " << user_id_ << " failed";
	}
	return false;
}

//----------------------------------------------------------------------------
// Friendship wiring
//----------------------------------------------------------------------------

std::optional<RoomId> User::CreateRoom() {
	absl::MutexLock client_lock(&client_mu_);
	Clock::time_point start = Clock::now();
	std::optional<RoomId> room = client_->CreateRoom();
	if (!room) {
		Emit(event::Error{ActionKind::kCreateRoom, client_->LastError()});
		return std::nullopt;
	}
	Emit(Elapsed(ActionKind::kCreateRoom, start));
	// The creator is a member right away
	if (std::shared_ptr<SyncSession> session = Session()) {
		absl::MutexLock lock(&session->mu);
		session->AddRoom(*room);
	}
	return room;
}

bool User::JoinRoom(const RoomId& room_id) {
	absl::MutexLock client_lock(&client_mu_);
	Clock::time_point start = Clock::now();
	if (!client_->JoinRoom(room_id)) {
		Emit(event::Error{ActionKind::kJoinRoom, client_->LastError()});
		return false;
	}
	Emit(Elapsed(ActionKind::kJoinRoom, start));
	if (std::shared_ptr<SyncSession> session = Session()) {
		absl::MutexLock lock(&session->mu);
		session->AddRoom(room_id);
	}
	return true;
}

void User::ForgetRoom(const RoomId& room_id) {
	std::shared_ptr<SyncSession> session = Session();
	if (!session) {
		return;
	}
	absl::MutexLock lock(&session->mu);
	session->rooms.erase(std::remove(session->rooms.begin(), session->rooms.end(), room_id),
			session->rooms.end());
}

//----------------------------------------------------------------------------
// Introspection
//----------------------------------------------------------------------------

bool User::Ready() const {
	std::shared_ptr<SyncSession> session = Session();
	return session != nullptr && !session->cancel.IsCancelled();
}

std::shared_ptr<SyncSession> User::Session() const {
	absl::MutexLock lock(&mu_);
	if (const auto* syncing = std::get_if<state::Syncing>(&state_)) {
		return syncing->session;
	}
	return nullptr;
}

UserStatus User::Status() const {
	absl::MutexLock lock(&mu_);
	return static_cast<UserStatus>(state_.index());
}

std::vector<RoomId> User::Rooms() const {
	std::shared_ptr<SyncSession> session = Session();
	if (!session) {
		return {};
	}
	absl::MutexLock lock(&session->mu);
	return session->rooms;
}

size_t User::PendingEvents() const {
	std::shared_ptr<SyncSession> session = Session();
	if (!session) {
		return 0;
	}
	absl::MutexLock lock(&session->mu);
	return session->pending.size();
}

uint64_t User::Commits() const {
	absl::MutexLock lock(&mu_);
	return commits_;
}

bool User::TryAcquire() {
	bool expected = false;
	return busy_.compare_exchange_strong(expected, true);
}

void User::Release() {
	busy_.store(false);
}

} // namespace Reloaded
