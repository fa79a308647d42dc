#include "metrics.h"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <type_traits>

#include <glog/logging.h>

namespace Reloaded {

LatencySummary LatencySummary::Compute(std::vector<int64_t> latencies_us) {
	LatencySummary s{};
	if (latencies_us.empty()) {
		return s;
	}

	std::sort(latencies_us.begin(), latencies_us.end());
	s.count = latencies_us.size();
	s.min_us = static_cast<double>(latencies_us.front());
	s.max_us = static_cast<double>(latencies_us.back());
	const long double sum = std::accumulate(
		latencies_us.begin(), latencies_us.end(), static_cast<long double>(0.0L));
	s.average_us = static_cast<double>(sum / static_cast<long double>(s.count));

	auto percentile = [&](double p) -> double {
		const double rank = std::ceil(p * static_cast<double>(s.count));
		size_t idx = (rank <= 1.0) ? 0 : static_cast<size_t>(rank - 1.0);
		if (idx >= s.count) idx = s.count - 1;
		return static_cast<double>(latencies_us[idx]);
	};

	s.p50_us = percentile(0.50);
	s.p90_us = percentile(0.90);
	s.p95_us = percentile(0.95);
	s.p99_us = percentile(0.99);
	return s;
}

//----------------------------------------------------------------------------
// EventAggregator
//----------------------------------------------------------------------------

bool EventAggregator::Apply(const Event& event) {
	bool keep_running = true;
	std::visit([this, &keep_running](const auto& e) {
		using T = std::decay_t<decltype(e)>;
		if constexpr (std::is_same_v<T, event::RequestDuration>) {
			series_[e.kind].latencies_us.push_back(e.duration.count());
		} else if constexpr (std::is_same_v<T, event::Error>) {
			ActionSeries& series = series_[e.kind];
			series.errors++;
			series.error_causes[e.cause]++;
		} else if constexpr (std::is_same_v<T, event::MessageSent>) {
			sent_++;
			// The receipt may overtake the send notification
			if (orphans_.erase(e.event_id) > 0) {
				delivered_.insert(e.event_id);
			} else {
				outstanding_.insert(e.event_id);
			}
		} else if constexpr (std::is_same_v<T, event::MessageReceived>) {
			if (outstanding_.erase(e.event_id) > 0) {
				delivered_.insert(e.event_id);
			} else if (delivered_.contains(e.event_id)) {
				duplicate_receipts_++;
			} else if (!orphans_.insert(e.event_id).second) {
				duplicate_receipts_++;
			}
		} else if constexpr (std::is_same_v<T, event::AllMessagesSent>) {
			all_messages_sent_ = true;
		} else if constexpr (std::is_same_v<T, event::Finish>) {
			keep_running = false;
		}
	}, event);
	return keep_running;
}

bool EventAggregator::AllMessagesReceived() const {
	return all_messages_sent_ && outstanding_.empty();
}

MetricsReport EventAggregator::Snapshot() const {
	MetricsReport report;
	for (const auto& [kind, series] : series_) {
		ActionMetrics& metrics = report.actions[kind];
		metrics.latency = LatencySummary::Compute(series.latencies_us);
		metrics.errors = series.errors;
		metrics.requests = series.latencies_us.size() + series.errors;
		metrics.error_causes = series.error_causes;
	}
	report.messages.sent = sent_;
	report.messages.received = delivered_.size();
	report.messages.orphan_receipts = orphans_.size();
	report.messages.duplicate_receipts = duplicate_receipts_;
	report.messages.outstanding = outstanding_.size();
	report.all_messages_sent = all_messages_sent_;
	return report;
}

//----------------------------------------------------------------------------
// Metrics
//----------------------------------------------------------------------------

Metrics::Metrics(std::shared_ptr<EventChannel> channel)
	: channel_(std::move(channel)) {}

Metrics::~Metrics() {
	if (consumer_.joinable()) {
		// Unblock the read loop if the owner never sent Finish
		if (!finished_.load()) {
			channel_->Interrupt();
		}
		consumer_.join();
	}
}

std::future<MetricsReport> Metrics::Run() {
	std::promise<MetricsReport> promise;
	std::future<MetricsReport> future = promise.get_future();
	consumer_ = std::thread(&Metrics::ReadEventsLoop, this, std::move(promise));
	return future;
}

bool Metrics::AllMessagesReceived() const {
	absl::MutexLock lock(&mu_);
	return aggregator_.AllMessagesReceived();
}

void Metrics::ReadEventsLoop(std::promise<MetricsReport> promise) {
	Event event;
	size_t applied = 0;
	while (true) {
		channel_->Receive(event);
		absl::MutexLock lock(&mu_);
		applied++;
		if (!aggregator_.Apply(event)) {
			break;
		}
	}
	VLOG(1) << "[Metrics]: Read loop finished after " << applied << " events";
	finished_.store(true);
	absl::MutexLock lock(&mu_);
	promise.set_value(aggregator_.Snapshot());
}

} // namespace Reloaded
