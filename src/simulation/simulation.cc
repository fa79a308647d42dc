#include "simulation.h"

#include <algorithm>
#include <exception>
#include <future>
#include <numeric>
#include <thread>
#include <tuple>

#include <glog/logging.h>

#include "client/homeserver_url.h"
#include "common/time_utils.h"

namespace Reloaded {

namespace {

using Clock = std::chrono::steady_clock;

constexpr std::chrono::milliseconds kTearDownPoll{1000};

// Gives a claimed user back to the sampler when the task ends, however it ends
class UserLease {
	public:
		explicit UserLease(User& user) : user_(user) {}
		~UserLease() { user_.Release(); }

		UserLease(const UserLease&) = delete;
		UserLease& operator=(const UserLease&) = delete;

	private:
		User& user_;
};

} // namespace

SimulationOptions SimulationOptions::FromConfig(const ReloadedConfig& config) {
	SimulationOptions options;
	options.homeserver_url = config.simulation.homeserver_url.get();
	options.total_steps = config.simulation.total_steps.get();
	options.users_per_step = config.simulation.users_per_step.get();
	options.friendship_ratio = config.simulation.friendship_ratio.get();
	options.step_duration = std::chrono::milliseconds(config.simulation.step_duration_ms.get());
	options.tick_duration = std::chrono::milliseconds(config.simulation.tick_duration_ms.get());
	options.max_users_per_tick = config.simulation.max_users_to_act_per_tick.get();
	options.waiting_period = std::chrono::seconds(config.simulation.waiting_period_secs.get());
	options.worker_threads = config.simulation.worker_threads.get();
	options.retry_enabled = config.retry.retry_request_config.get();
	options.user_creation_retry_attempts = config.retry.user_creation_retry_attempts.get();
	options.room_creation_retry_attempts = config.retry.room_creation_retry_attempts.get();
	options.user_creation_throughput = config.throughput.user_creation_throughput.get();
	options.room_creation_throughput = config.throughput.room_creation_throughput.get();
	return options;
}

Simulation::Simulation(SimulationOptions options, ClientFactory client_factory, uint64_t execution_id)
	: options_(std::move(options)),
	client_factory_(std::move(client_factory)),
	execution_id_(execution_id),
	channel_(std::make_shared<EventChannel>()),
	localparts_(std::make_shared<const std::vector<std::string>>()),
	friendships_(FriendshipOptions{options_.room_creation_throughput,
			options_.retry_enabled ? options_.room_creation_retry_attempts : 1,
			options_.retry_enabled ? options_.user_creation_retry_attempts : 1}) {
	std::tie(domain_, url_) = ParseHomeserver(options_.homeserver_url);
	size_t workers = options_.worker_threads > 0 ? options_.worker_threads
		: options_.max_users_per_tick * 2;
	tick_pool_ = std::make_unique<TaskPool>(workers);
	VLOG(1) << "Simulation " << execution_id_ << " against " << url_ << " with "
		<< tick_pool_->size() << " tick workers";
}

Simulation::~Simulation() {
	// Stragglers hold users alive until they return
	tick_pool_->Stop();
}

size_t Simulation::Run() {
	size_t reported = 0;
	for (size_t step = 1; step <= options_.total_steps; ++step) {
		if (StopRequested()) {
			LOG(INFO) << "Stop requested, skipping remaining steps";
			break;
		}
		LOG(INFO) << "Running step " << step << "/" << options_.total_steps;
		StepReport report = RunStep(step);
		reported++;
		if (report_sink_) {
			report_sink_(report);
		}
	}
	// Every spawned task has returned before the channel closes
	tick_pool_->Stop();
	channel_->Close();
	return reported;
}

StepReport Simulation::RunStep(size_t step) {
	Metrics metrics(channel_);
	std::future<MetricsReport> handle = metrics.Run();

	// Warm up
	BootstrapUsers(options_.users_per_step);
	ExtendFriendships();

	// Running
	size_t ticks = RunTicks();
	WaitForMessages(metrics);
	channel_->Send(event::Finish{});

	StepReport report;
	report.execution_id = execution_id_;
	report.step = step;
	report.homeserver = options_.homeserver_url;
	report.users = users_.size();
	report.friendships = friendships_.size();
	report.ticks = ticks;
	report.metrics = handle.get();
	return report;
}

//----------------------------------------------------------------------------
// Warm up
//----------------------------------------------------------------------------

size_t Simulation::BootstrapUsers(size_t count) {
	const size_t attempts = options_.retry_enabled ? options_.user_creation_retry_attempts : 1;
	const size_t first_ordinal = next_ordinal_;
	next_ordinal_ += count;

	LOG(INFO) << "Creating " << count << " users";
	std::vector<std::shared_ptr<User>> created;
	created.reserve(count);
	for (size_t i = 0; i < count; ++i) {
		created.push_back(std::make_shared<User>(MakeLocalpart(first_ordinal + i, execution_id_),
				domain_, client_factory_(), channel_));
	}

	std::vector<std::future<bool>> results;
	results.reserve(count);
	{
		TaskPool pool(options_.user_creation_throughput);
		std::atomic<size_t> done{0};
		for (const auto& user : created) {
			User* raw = user.get();
			results.push_back(pool.Submit([this, raw, attempts, count, &done]() {
				bool ok = raw->Bootstrap(attempts);
				ReportProgress(Phase::kInitUsers, ++done, count);
				return ok;
			}));
		}
		for (auto& result : results) {
			result.wait();
		}
	}

	size_t added = 0;
	auto localparts = std::make_shared<std::vector<std::string>>(*localparts_);
	for (size_t i = 0; i < count; ++i) {
		if (!results[i].get()) {
			LOG(WARNING) << "Couldn't init user " << created[i]->id() << " after "
				<< attempts << " attempts, dropped from this step";
			continue;
		}
		localparts->push_back(created[i]->localpart());
		users_.push_back(std::move(created[i]));
		added++;
	}
	localparts_ = std::move(localparts);
	LOG(INFO) << "Users: " << users_.size() << " (" << added << " new)";
	return added;
}

size_t Simulation::ExtendFriendships() {
	return friendships_.Extend(users_, options_.friendship_ratio, progress_);
}

//----------------------------------------------------------------------------
// Running
//----------------------------------------------------------------------------

size_t Simulation::RunTicks() {
	ticks_.clear();
	const Clock::time_point step_start = Clock::now();
	const size_t expected_ticks = std::max<size_t>(1,
			options_.step_duration.count() / std::max<int64_t>(1, options_.tick_duration.count()));

	while (!StopRequested()) {
		TickRecord record;
		record.start = Clock::now();
		const Clock::time_point deadline = record.start + options_.tick_duration;

		std::vector<std::shared_ptr<User>> sampled = SampleTick();
		record.acting = sampled.size();
		record.timed_out = RunTick(sampled, deadline);
		ticks_.push_back(record);

		VLOG(2) << "Tick " << ticks_.size() << ": " << record.acting << " users, "
			<< record.timed_out << " timed out";
		ReportProgress(Phase::kRunning, std::min(ticks_.size(), expected_ticks), expected_ticks);

		// Pace the load when the batch finished early
		if (Clock::now() < deadline) {
			std::this_thread::sleep_until(deadline);
		}
		if (Clock::now() - step_start >= options_.step_duration) {
			break;
		}
	}

	channel_->Send(event::AllMessagesSent{});
	return ticks_.size();
}

std::vector<std::shared_ptr<User>> Simulation::SampleTick() {
	std::vector<size_t> order(users_.size());
	std::iota(order.begin(), order.end(), 0);
	std::shuffle(order.begin(), order.end(), ThreadLocalRng());

	std::vector<std::shared_ptr<User>> sampled;
	for (size_t index : order) {
		if (sampled.size() >= options_.max_users_per_tick) {
			break;
		}
		// Skips users whose call from an earlier tick has not returned yet
		if (users_[index]->TryAcquire()) {
			sampled.push_back(users_[index]);
		}
	}
	return sampled;
}

size_t Simulation::RunTick(const std::vector<std::shared_ptr<User>>& sampled,
		Clock::time_point deadline) {
	ActContext ctx;
	ctx.peers = localparts_.get();

	std::vector<std::future<StepOutcome>> tasks;
	std::vector<uint64_t> commits_before;
	tasks.reserve(sampled.size());
	commits_before.reserve(sampled.size());
	for (const auto& user : sampled) {
		// Claimed users have no call in flight, the counter is stable here
		commits_before.push_back(user->Commits());
		tasks.push_back(tick_pool_->Submit([user, ctx, peers = localparts_]() {
			UserLease lease(*user);
			if (ctx.cancel.IsCancelled()) {
				return StepOutcome::kCancelled;
			}
			return user->Act(ctx);
		}));
	}

	std::vector<size_t> finished;
	std::vector<size_t> late;
	for (size_t i = 0; i < tasks.size(); ++i) {
		if (tasks[i].wait_until(deadline) == std::future_status::ready) {
			finished.push_back(i);
		} else {
			late.push_back(i);
		}
	}
	// Whatever is still running commits nothing from here on
	ctx.cancel.Cancel();

	// A commit that won the race against Cancel() has emitted everything once
	// Commits() returns; only tasks that never committed count as timed out.
	size_t timed_out = 0;
	for (size_t i : late) {
		if (sampled[i]->Commits() == commits_before[i]) {
			timed_out++;
		} else {
			VLOG(2) << sampled[i]->id() << " committed right at the tick deadline";
		}
	}

	for (size_t i : finished) {
		// Rethrows ChannelClosedError
		StepOutcome outcome = tasks[i].get();
		VLOG(3) << sampled[i]->id() << " -> " << UserStatusName(sampled[i]->Status())
			<< (outcome == StepOutcome::kAdvanced ? "" : " (no progress)");
	}
	return timed_out;
}

//----------------------------------------------------------------------------
// Tear down
//----------------------------------------------------------------------------

void Simulation::WaitForMessages(const Metrics& metrics) {
	const Clock::time_point start = Clock::now();
	const Clock::time_point until = start + options_.waiting_period;
	const size_t total_secs = static_cast<size_t>(
			std::chrono::duration_cast<std::chrono::seconds>(options_.waiting_period).count());

	while (!metrics.AllMessagesReceived()) {
		Clock::time_point now = Clock::now();
		if (now >= until) {
			LOG(WARNING) << "Waiting period elapsed with messages still outstanding";
			break;
		}
		if (StopRequested()) {
			LOG(INFO) << "Stop requested, not waiting for outstanding messages";
			break;
		}
		std::this_thread::sleep_until(std::min(until, now + kTearDownPoll));
		size_t waited = static_cast<size_t>(
				std::chrono::duration_cast<std::chrono::seconds>(Clock::now() - start).count());
		ReportProgress(Phase::kTearDown, std::min(waited, total_secs), total_secs);
	}
	VLOG(1) << "Tear down finished after "
		<< std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start).count() << "ms";
}

void Simulation::ReportProgress(Phase phase, size_t done, size_t total) const {
	if (progress_) {
		progress_(phase, done, total);
	}
}

} // namespace Reloaded
