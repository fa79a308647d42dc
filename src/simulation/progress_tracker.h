#ifndef RELOADED_PROGRESS_TRACKER_H_
#define RELOADED_PROGRESS_TRACKER_H_

#include <chrono>
#include <functional>

#include "absl/synchronization/mutex.h"

namespace Reloaded {

enum class Phase {
	kInitUsers,
	kInitFriendships,
	kRunning,
	kTearDown,
};

const char* PhaseName(Phase phase);

// Observer of a step's phases; called from worker threads
using ProgressCallback = std::function<void(Phase phase, size_t done, size_t total)>;

/**
 * Default progress observer. Logs at most once per interval per phase, plus
 * once when a phase completes.
 */
class ProgressTracker {
	public:
		explicit ProgressTracker(std::chrono::milliseconds log_interval = std::chrono::milliseconds(5000));

		void Update(Phase phase, size_t done, size_t total);

		ProgressCallback AsCallback();

	private:
		using Clock = std::chrono::steady_clock;

		const std::chrono::milliseconds log_interval_;

		absl::Mutex mu_;
		Phase phase_ ABSL_GUARDED_BY(mu_) = Phase::kInitUsers;
		bool started_ ABSL_GUARDED_BY(mu_) = false;
		Clock::time_point phase_start_ ABSL_GUARDED_BY(mu_);
		Clock::time_point last_log_time_ ABSL_GUARDED_BY(mu_);
};

} // namespace Reloaded

#endif // RELOADED_PROGRESS_TRACKER_H_
