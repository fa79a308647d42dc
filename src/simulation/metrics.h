#ifndef RELOADED_METRICS_H_
#define RELOADED_METRICS_H_

#include <atomic>
#include <cstdint>
#include <future>
#include <map>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "absl/container/flat_hash_set.h"
#include "absl/synchronization/mutex.h"

#include "events.h"

namespace Reloaded {

struct LatencySummary {
	double min_us = 0.0;
	double average_us = 0.0;
	double p50_us = 0.0;
	double p90_us = 0.0;
	double p95_us = 0.0;
	double p99_us = 0.0;
	double max_us = 0.0;
	size_t count = 0;

	// Nearest-rank percentiles over an unsorted sample
	static LatencySummary Compute(std::vector<int64_t> latencies_us);
};

struct ActionMetrics {
	size_t requests = 0;
	size_t errors = 0;
	LatencySummary latency;
	// Distinct failure cause -> occurrences
	std::map<std::string, size_t> error_causes;
};

struct MessageMetrics {
	size_t sent = 0;
	size_t received = 0;
	// Receipts for ids never announced as sent during this step
	size_t orphan_receipts = 0;
	size_t duplicate_receipts = 0;
	size_t outstanding = 0;
};

struct MetricsReport {
	std::map<ActionKind, ActionMetrics> actions;
	MessageMetrics messages;
	bool all_messages_sent = false;
};

/**
 * Aggregation rules applied to the event stream. Not thread-safe; Metrics owns
 * the only instance fed from the channel.
 */
class EventAggregator {
	public:
		// Returns false once a Finish event was applied
		bool Apply(const Event& event);

		bool AllMessagesReceived() const;
		MetricsReport Snapshot() const;

	private:
		struct ActionSeries {
			std::vector<int64_t> latencies_us;
			size_t errors = 0;
			std::map<std::string, size_t> error_causes;
		};

		std::map<ActionKind, ActionSeries> series_;
		size_t sent_ = 0;
		size_t duplicate_receipts_ = 0;
		absl::flat_hash_set<std::string> outstanding_;
		absl::flat_hash_set<std::string> delivered_;
		absl::flat_hash_set<std::string> orphans_;
		bool all_messages_sent_ = false;
};

/**
 * Single consumer of the event channel for one step. Run() starts the read
 * loop, which ends on a Finish event and yields the step's report.
 */
class Metrics {
	public:
		explicit Metrics(std::shared_ptr<EventChannel> channel);
		~Metrics();

		Metrics(const Metrics&) = delete;
		Metrics& operator=(const Metrics&) = delete;

		std::future<MetricsReport> Run();

		// Point-in-time: every sent id was received and the send phase is over
		bool AllMessagesReceived() const;

	private:
		void ReadEventsLoop(std::promise<MetricsReport> promise);

		std::shared_ptr<EventChannel> channel_;
		std::thread consumer_;
		std::atomic<bool> finished_{false};

		mutable absl::Mutex mu_;
		EventAggregator aggregator_ ABSL_GUARDED_BY(mu_);
};

} // namespace Reloaded

#endif // RELOADED_METRICS_H_
