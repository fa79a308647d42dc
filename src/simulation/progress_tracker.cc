#include "progress_tracker.h"

#include <iomanip>

#include <glog/logging.h>

namespace Reloaded {

const char* PhaseName(Phase phase) {
	switch (phase) {
		case Phase::kInitUsers:
			return "init users";
		case Phase::kInitFriendships:
			return "init friendships";
		case Phase::kRunning:
			return "running";
		case Phase::kTearDown:
			return "tear down";
	}
	return "unknown";
}

ProgressTracker::ProgressTracker(std::chrono::milliseconds log_interval)
	: log_interval_(log_interval) {}

void ProgressTracker::Update(Phase phase, size_t done, size_t total) {
	absl::MutexLock lock(&mu_);
	auto now = Clock::now();
	if (!started_ || phase != phase_) {
		started_ = true;
		phase_ = phase;
		phase_start_ = now;
		last_log_time_ = now;
	}

	bool complete = done >= total;
	if (now - last_log_time_ < log_interval_ && !complete) {
		return;
	}

	double progress_pct = total > 0 ? (100.0 * done) / total : 100.0;
	double elapsed = std::chrono::duration<double>(now - phase_start_).count();
	double rate = done / (elapsed > 0 ? elapsed : 1.0);

	LOG(INFO) << "[" << PhaseName(phase) << "] " << std::fixed << std::setprecision(1)
		<< progress_pct << "% (" << done << "/" << total << ") "
		<< "Rate: " << std::setprecision(2) << rate << " /sec";
	last_log_time_ = now;
}

ProgressCallback ProgressTracker::AsCallback() {
	return [this](Phase phase, size_t done, size_t total) { Update(phase, done, total); };
}

} // namespace Reloaded
