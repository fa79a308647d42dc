#ifndef RELOADED_EVENTS_H_
#define RELOADED_EVENTS_H_

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <string>
#include <variant>

#include "folly/MPMCQueue.h"

namespace Reloaded {

// Note: if you add a kind, extend kAllActionKinds and ActionKindName as well
enum class ActionKind {
	kRegister,
	kLogin,
	kSync,
	kCreateRoom,
	kJoinRoom,
	kSendMessage,
	kAddFriend,
	kUpdateStatus,
	kLogout,
};

constexpr ActionKind kAllActionKinds[] = {
	ActionKind::kRegister, ActionKind::kLogin, ActionKind::kSync,
	ActionKind::kCreateRoom, ActionKind::kJoinRoom, ActionKind::kSendMessage,
	ActionKind::kAddFriend, ActionKind::kUpdateStatus, ActionKind::kLogout,
};

const char* ActionKindName(ActionKind kind);

namespace event {

struct RequestDuration {
	ActionKind kind;
	std::chrono::microseconds duration;
};

struct Error {
	ActionKind kind;
	std::string cause;
};

struct MessageSent {
	std::string event_id;
};

struct MessageReceived {
	std::string event_id;
};

struct AllMessagesSent {};

struct Finish {};

} // namespace event

using Event = std::variant<event::RequestDuration, event::Error, event::MessageSent,
	  event::MessageReceived, event::AllMessagesSent, event::Finish>;

/**
 * Raised when a producer sends after the channel was closed. Metrics integrity
 * can no longer be guaranteed, so it is not caught inside the simulation.
 */
class ChannelClosedError : public std::runtime_error {
	public:
		ChannelClosedError() : std::runtime_error("event channel closed") {}
};

/**
 * Bounded many-producer / single-consumer event channel. Events from one
 * producer are received in send order.
 */
class EventChannel {
	public:
		explicit EventChannel(size_t capacity = 1 << 16) : queue_(capacity) {}

		// Blocks while the channel is full
		void Send(Event event);

		// Blocks until an event is available
		void Receive(Event& event);

		// Queues a Finish even on a closed channel so a blocked consumer returns
		void Interrupt() { queue_.blockingWrite(event::Finish{}); }

		// Producers sending after Close() get ChannelClosedError
		void Close() { closed_.store(true, std::memory_order_release); }
		bool IsClosed() const { return closed_.load(std::memory_order_acquire); }

	private:
		folly::MPMCQueue<Event> queue_;
		std::atomic<bool> closed_{false};
};

} // namespace Reloaded

#endif // RELOADED_EVENTS_H_
