#ifndef RELOADED_SIMULATION_H_
#define RELOADED_SIMULATION_H_

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "client/client.h"
#include "common/configuration.h"
#include "common/task_pool.h"
#include "events.h"
#include "friendship.h"
#include "metrics.h"
#include "progress_tracker.h"
#include "user.h"

namespace Reloaded {

struct SimulationOptions {
	std::string homeserver_url = "localhost";
	size_t total_steps = 1;
	size_t users_per_step = 10;
	double friendship_ratio = 0.1;
	std::chrono::milliseconds step_duration{60000};
	std::chrono::milliseconds tick_duration{1000};
	size_t max_users_per_tick = 100;
	std::chrono::milliseconds waiting_period{30000};
	// 0 means twice the users acting per tick
	size_t worker_threads = 0;

	bool retry_enabled = true;
	size_t user_creation_retry_attempts = 3;
	size_t room_creation_retry_attempts = 3;
	size_t user_creation_throughput = 50;
	size_t room_creation_throughput = 50;

	static SimulationOptions FromConfig(const ReloadedConfig& config);
};

/**
 * Snapshot handed to the reporting side at the end of every step
 */
struct StepReport {
	uint64_t execution_id = 0;
	size_t step = 0;
	std::string homeserver;
	size_t users = 0;
	size_t friendships = 0;
	size_t ticks = 0;
	MetricsReport metrics;
};

struct TickRecord {
	std::chrono::steady_clock::time_point start;
	// Users sampled for the tick
	size_t acting = 0;
	// Tasks still running when the deadline passed
	size_t timed_out = 0;
};

using ClientFactory = std::function<std::unique_ptr<Client>()>;
using ReportSink = std::function<void(const StepReport& report)>;

/**
 * Step driver: bootstrap new users, extend the friendship graph, run the tick
 * loop for the step duration, wait for outstanding messages, report.
 * Population and friendships persist across steps, metrics are per step.
 */
class Simulation {
	public:
		Simulation(SimulationOptions options, ClientFactory client_factory, uint64_t execution_id);
		~Simulation();

		Simulation(const Simulation&) = delete;
		Simulation& operator=(const Simulation&) = delete;

		void SetProgressCallback(ProgressCallback progress) { progress_ = std::move(progress); }
		void SetReportSink(ReportSink sink) { report_sink_ = std::move(sink); }

		/**
		 * Runs every configured step, or fewer when a stop is requested.
		 * Throws ChannelClosedError when the metrics channel fails.
		 * @return Number of steps that produced a report
		 */
		size_t Run();

		StepReport RunStep(size_t step);

		// Cooperative: the current tick finishes, no further step starts
		void RequestStop() { stop_requested_.store(true); }
		bool StopRequested() const { return stop_requested_.load(); }

		//********* Step phases, public for tests
		/**
		 * Creates `count` users concurrently and appends those reaching Syncing
		 * @return Number of users added
		 */
		size_t BootstrapUsers(size_t count);

		size_t ExtendFriendships();

		/**
		 * Tick loop for one step duration. Sends AllMessagesSent when done.
		 * @return Number of ticks executed
		 */
		size_t RunTicks();

		// Polls until every sent message was received or the waiting period ends
		void WaitForMessages(const Metrics& metrics);

		const std::vector<std::shared_ptr<User>>& users() const { return users_; }
		const FriendshipGraph& friendships() const { return friendships_; }
		const std::string& domain() const { return domain_; }
		uint64_t execution_id() const { return execution_id_; }
		const std::shared_ptr<EventChannel>& channel() const { return channel_; }
		// Ticks of the most recent RunTicks()
		const std::vector<TickRecord>& ticks() const { return ticks_; }

	private:
		// Users acting this tick, each already claimed through TryAcquire
		std::vector<std::shared_ptr<User>> SampleTick();
		// @return Number of tasks not finished by the deadline
		size_t RunTick(const std::vector<std::shared_ptr<User>>& sampled,
				std::chrono::steady_clock::time_point deadline);
		void ReportProgress(Phase phase, size_t done, size_t total) const;

		const SimulationOptions options_;
		const ClientFactory client_factory_;
		const uint64_t execution_id_;
		std::string domain_;
		std::string url_;

		std::shared_ptr<EventChannel> channel_;
		std::vector<std::shared_ptr<User>> users_;
		// Localparts of users_, replaced after each bootstrap
		std::shared_ptr<const std::vector<std::string>> localparts_;
		size_t next_ordinal_ = 0;
		FriendshipGraph friendships_;

		std::unique_ptr<TaskPool> tick_pool_;
		std::vector<TickRecord> ticks_;
		std::atomic<bool> stop_requested_{false};

		ProgressCallback progress_;
		ReportSink report_sink_;
};

} // namespace Reloaded

#endif // RELOADED_SIMULATION_H_
