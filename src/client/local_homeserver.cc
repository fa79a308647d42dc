#include "local_homeserver.h"

#include <thread>
#include <utility>

#include <glog/logging.h>

namespace Reloaded {

namespace {

using Receipt = std::pair<MessageHandler, std::string>;

void FireReceipts(const std::vector<Receipt>& receipts) {
	for (const auto& [handler, event_id] : receipts) {
		if (handler) {
			handler(event_id);
		}
	}
}

} // namespace

//----------------------------------------------------------------------------
// LocalHomeserver
//----------------------------------------------------------------------------

LocalHomeserver::LocalHomeserver(LocalHomeserverOptions options)
	: options_(std::move(options)),
	rng_(options_.seed ? options_.seed : std::random_device{}()) {
	VLOG(1) << "[LocalHomeserver]: " << options_.server_name
		<< " latency=" << options_.latency.count() << "ms failure_rate=" << options_.failure_rate;
}

void LocalHomeserver::SimulateLatency() {
	if (options_.latency.count() <= 0) {
		return;
	}
	int64_t delay_ms;
	{
		absl::MutexLock lock(&rng_mu_);
		delay_ms = std::uniform_int_distribution<int64_t>(0, options_.latency.count())(rng_);
	}
	std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
}

bool LocalHomeserver::InjectFailure() {
	if (options_.failure_rate <= 0.0) {
		return false;
	}
	absl::MutexLock lock(&rng_mu_);
	return std::bernoulli_distribution(options_.failure_rate)(rng_);
}

RegisterOutcome LocalHomeserver::RegisterAccount(const std::string& localpart) {
	absl::MutexLock lock(&mu_);
	if (accounts_.contains(localpart)) {
		return RegisterOutcome::kAlreadyExists;
	}
	accounts_.emplace(localpart, Account{});
	return RegisterOutcome::kOk;
}

LoginOutcome LocalHomeserver::Authenticate(const std::string& localpart) {
	absl::MutexLock lock(&mu_);
	return accounts_.contains(localpart) ? LoginOutcome::kOk : LoginOutcome::kNotRegistered;
}

SyncResponse LocalHomeserver::StartSync(const std::string& localpart, MessageHandler on_message,
		CancellationToken cancel) {
	SyncResponse response;
	std::vector<Receipt> receipts;
	{
		absl::MutexLock lock(&mu_);
		Account& account = accounts_[localpart];
		account.syncing = true;
		account.on_message = std::move(on_message);
		account.session = cancel;
		response.joined_rooms.assign(account.joined.begin(), account.joined.end());
		response.invited_rooms.assign(account.invited.begin(), account.invited.end());
		for (auto& event_id : account.unreceipted) {
			receipts.emplace_back(account.on_message, std::move(event_id));
		}
		account.unreceipted.clear();
	}
	response.cancel = std::move(cancel);
	FireReceipts(receipts);
	return response;
}

void LocalHomeserver::StopSync(const std::string& localpart) {
	absl::MutexLock lock(&mu_);
	auto it = accounts_.find(localpart);
	if (it == accounts_.end()) {
		return;
	}
	it->second.syncing = false;
	it->second.on_message = nullptr;
}

std::vector<SyncEvent> LocalHomeserver::DrainInbox(const std::string& localpart) {
	absl::MutexLock lock(&mu_);
	std::vector<SyncEvent> events;
	auto it = accounts_.find(localpart);
	if (it == accounts_.end()) {
		return events;
	}
	auto& inbox = it->second.inbox;
	events.assign(std::make_move_iterator(inbox.begin()), std::make_move_iterator(inbox.end()));
	inbox.clear();
	return events;
}

std::optional<RoomId> LocalHomeserver::CreateRoom(const std::string& creator) {
	absl::MutexLock lock(&mu_);
	auto it = accounts_.find(creator);
	if (it == accounts_.end()) {
		return std::nullopt;
	}
	RoomId room_id = "!room" + std::to_string(next_room_++) + ":" + options_.server_name;
	Room& room = rooms_[room_id];
	room.creator = creator;
	room.members.insert(creator);
	it->second.joined.insert(room_id);
	it->second.inbox.push_back(SyncEvent::RoomCreated(room_id));
	return room_id;
}

bool LocalHomeserver::Invite(const RoomId& room_id, const std::string& localpart) {
	absl::MutexLock lock(&mu_);
	auto room = rooms_.find(room_id);
	auto account = accounts_.find(localpart);
	if (room == rooms_.end() || account == accounts_.end()) {
		return false;
	}
	if (room->second.members.contains(localpart)) {
		return true;
	}
	if (account->second.invited.insert(room_id).second) {
		account->second.inbox.push_back(SyncEvent::Invite(room_id));
	}
	return true;
}

bool LocalHomeserver::Join(const std::string& localpart, const RoomId& room_id) {
	absl::MutexLock lock(&mu_);
	auto room = rooms_.find(room_id);
	auto account = accounts_.find(localpart);
	if (room == rooms_.end() || account == accounts_.end()) {
		return false;
	}
	room->second.members.insert(localpart);
	account->second.invited.erase(room_id);
	account->second.joined.insert(room_id);
	return true;
}

std::optional<std::string> LocalHomeserver::Post(const std::string& sender, const RoomId& room_id,
		const std::string& text) {
	std::vector<Receipt> receipts;
	std::string event_id;
	{
		absl::MutexLock lock(&mu_);
		auto room = rooms_.find(room_id);
		if (room == rooms_.end() || !room->second.members.contains(sender)) {
			return std::nullopt;
		}
		event_id = "$event" + std::to_string(next_event_++) + ":" + options_.server_name;
		for (const auto& member : room->second.members) {
			if (member == sender) {
				continue;
			}
			Account& account = accounts_[member];
			account.inbox.push_back(SyncEvent::Message(room_id, event_id, text));
			if (account.syncing && !account.session.IsCancelled()) {
				receipts.emplace_back(account.on_message, event_id);
			} else {
				account.unreceipted.push_back(event_id);
			}
		}
	}
	FireReceipts(receipts);
	return event_id;
}

bool LocalHomeserver::SetPresence(const std::string& localpart) {
	absl::MutexLock lock(&mu_);
	auto it = accounts_.find(localpart);
	if (it == accounts_.end()) {
		return false;
	}
	it->second.presence = it->second.presence == "online" ? "unavailable" : "online";
	return true;
}

bool LocalHomeserver::IsRegistered(const std::string& localpart) const {
	absl::MutexLock lock(&mu_);
	return accounts_.contains(localpart);
}

std::vector<std::string> LocalHomeserver::RoomMembers(const RoomId& room_id) const {
	absl::MutexLock lock(&mu_);
	std::vector<std::string> members;
	auto it = rooms_.find(room_id);
	if (it != rooms_.end()) {
		members.assign(it->second.members.begin(), it->second.members.end());
	}
	return members;
}

size_t LocalHomeserver::AccountCount() const {
	absl::MutexLock lock(&mu_);
	return accounts_.size();
}

size_t LocalHomeserver::RoomCount() const {
	absl::MutexLock lock(&mu_);
	return rooms_.size();
}

size_t LocalHomeserver::MessageCount() const {
	absl::MutexLock lock(&mu_);
	return next_event_;
}

//----------------------------------------------------------------------------
// LocalClient
//----------------------------------------------------------------------------

LocalClient::LocalClient(std::shared_ptr<LocalHomeserver> server)
	: server_(std::move(server)) {}

LocalClient::~LocalClient() {
	if (sync_.has_value()) {
		sync_->Cancel();
		server_->StopSync(localpart_);
	}
}

void LocalClient::SetError(std::string error) {
	absl::MutexLock lock(&error_mu_);
	last_error_ = std::move(error);
}

std::string LocalClient::LastError() const {
	absl::MutexLock lock(&error_mu_);
	return last_error_;
}

bool LocalClient::BeginRequest(const char* what) {
	server_->SimulateLatency();
	if (server_->InjectFailure()) {
		SetError(std::string(what) + ": request timed out");
		return false;
	}
	return true;
}

bool LocalClient::RequireSession(const char* what) {
	if (!logged_in_) {
		SetError(std::string(what) + ": not logged in");
		return false;
	}
	return BeginRequest(what);
}

RegisterOutcome LocalClient::Register(const std::string& localpart) {
	if (!BeginRequest("register")) {
		return RegisterOutcome::kFailed;
	}
	return server_->RegisterAccount(localpart);
}

LoginOutcome LocalClient::Login(const std::string& localpart) {
	if (!BeginRequest("login")) {
		return LoginOutcome::kFailed;
	}
	LoginOutcome outcome = server_->Authenticate(localpart);
	if (outcome == LoginOutcome::kOk) {
		localpart_ = localpart;
		logged_in_ = true;
	} else {
		SetError("login: unknown user " + localpart);
	}
	return outcome;
}

std::optional<SyncResponse> LocalClient::Sync(MessageHandler on_message) {
	if (!RequireSession("sync")) {
		return std::nullopt;
	}
	if (sync_.has_value()) {
		sync_->Cancel();
	}
	CancellationToken token;
	sync_ = token;
	return server_->StartSync(localpart_, std::move(on_message), token);
}

std::vector<SyncEvent> LocalClient::ReadSyncEvents() {
	if (!sync_.has_value() || sync_->IsCancelled()) {
		return {};
	}
	return server_->DrainInbox(localpart_);
}

std::optional<RoomId> LocalClient::CreateRoom() {
	if (!RequireSession("create_room")) {
		return std::nullopt;
	}
	auto room = server_->CreateRoom(localpart_);
	if (!room) {
		SetError("create_room: rejected");
	}
	return room;
}

bool LocalClient::JoinRoom(const RoomId& room_id) {
	if (!RequireSession("join_room")) {
		return false;
	}
	if (!server_->Join(localpart_, room_id)) {
		SetError("join_room: unknown room " + room_id);
		return false;
	}
	return true;
}

std::optional<std::string> LocalClient::SendMessage(const RoomId& room_id, const std::string& text) {
	if (!RequireSession("send_message")) {
		return std::nullopt;
	}
	auto event_id = server_->Post(localpart_, room_id, text);
	if (!event_id) {
		SetError("send_message: not a member of " + room_id);
	}
	return event_id;
}

std::optional<RoomId> LocalClient::AddFriend(const std::string& localpart) {
	if (!RequireSession("add_friend")) {
		return std::nullopt;
	}
	auto room = server_->CreateRoom(localpart_);
	if (!room) {
		SetError("add_friend: room creation rejected");
		return std::nullopt;
	}
	if (!server_->Invite(*room, localpart)) {
		SetError("add_friend: unknown user " + localpart);
		return std::nullopt;
	}
	return room;
}

bool LocalClient::UpdateStatus() {
	if (!RequireSession("update_status")) {
		return false;
	}
	return server_->SetPresence(localpart_);
}

bool LocalClient::Logout() {
	if (!RequireSession("logout")) {
		return false;
	}
	if (sync_.has_value()) {
		sync_->Cancel();
	}
	server_->StopSync(localpart_);
	logged_in_ = false;
	return true;
}

void LocalClient::Reset() {
	if (sync_.has_value()) {
		sync_->Cancel();
		server_->StopSync(localpart_);
		sync_.reset();
	}
	logged_in_ = false;
	SetError("");
}

} // namespace Reloaded
