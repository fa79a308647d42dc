#include "events.h"

#include <glog/logging.h>

namespace Reloaded {

const char* ActionKindName(ActionKind kind) {
	switch (kind) {
		case ActionKind::kRegister:
			return "register";
		case ActionKind::kLogin:
			return "login";
		case ActionKind::kSync:
			return "sync";
		case ActionKind::kCreateRoom:
			return "create_room";
		case ActionKind::kJoinRoom:
			return "join_room";
		case ActionKind::kSendMessage:
			return "send_message";
		case ActionKind::kAddFriend:
			return "add_friend";
		case ActionKind::kUpdateStatus:
			return "update_status";
		case ActionKind::kLogout:
			return "logout";
	}
	return "unknown";
}

void EventChannel::Send(Event event) {
	if (IsClosed()) {
		LOG(ERROR) << "Event sent after the metrics channel was closed";
		throw ChannelClosedError();
	}
	queue_.blockingWrite(std::move(event));
}

void EventChannel::Receive(Event& event) {
	queue_.blockingRead(event);
}

} // namespace Reloaded
