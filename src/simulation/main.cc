#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <thread>

#include <cxxopts.hpp>
#include <glog/logging.h>

#include "client/homeserver_url.h"
#include "client/local_homeserver.h"
#include "common/configuration.h"
#include "common/time_utils.h"
#include "report/result_writer.h"
#include "report/users_state.h"
#include "simulation/progress_tracker.h"
#include "simulation/simulation.h"

namespace {

std::atomic<bool> g_stop_requested{false};

void LogConfiguration(const Reloaded::ReloadedConfig& config) {
	LOG(INFO) << "\n\n===== Reloaded ====="
		<< "\n\t  Homeserver: " << config.simulation.homeserver_url.get()
		<< "\n\t  Steps: " << config.simulation.total_steps.get()
		<< "\n\t  Users per step: " << config.simulation.users_per_step.get()
		<< "\n\t  Friendship ratio: " << config.simulation.friendship_ratio.get()
		<< "\n\t  Step duration: " << config.simulation.step_duration_ms.get() << " ms"
		<< "\n\t  Tick duration: " << config.simulation.tick_duration_ms.get() << " ms"
		<< "\n\t  Max users per tick: " << config.simulation.max_users_to_act_per_tick.get()
		<< "\n\t  Waiting period: " << config.simulation.waiting_period_secs.get() << " s"
		<< "\n\t  Retry: " << (config.retry.retry_request_config.get() ? "on" : "off")
		<< " (users " << config.retry.user_creation_retry_attempts.get()
		<< ", rooms " << config.retry.room_creation_retry_attempts.get() << ")"
		<< "\n\t  Throughput: users " << config.throughput.user_creation_throughput.get()
		<< ", rooms " << config.throughput.room_creation_throughput.get()
		<< "\n\t  Output: " << config.simulation.output_dir.get();
}

} // namespace

int main(int argc, char* argv[]) {
	// Initialize logging
	google::InitGoogleLogging(argv[0]);
	google::InstallFailureSignalHandler();
	FLAGS_logtostderr = 1; // log only to console, no files.

	cxxopts::Options options("reloaded", "Synthetic load generator for federated chat homeservers");
	options.add_options()
		("c,config", "YAML configuration file", cxxopts::value<std::string>())
		("s,homeserver", "Homeserver domain or url", cxxopts::value<std::string>())
		("steps", "Number of steps", cxxopts::value<size_t>())
		("users_per_step", "Users added every step", cxxopts::value<size_t>())
		("friendship_ratio", "Share of all possible friendships to create", cxxopts::value<double>())
		("output_dir", "Directory for step reports", cxxopts::value<std::string>())
		("l,log_level", "Log level", cxxopts::value<int>()->default_value("0"))
		("h,help", "Print usage");

	cxxopts::ParseResult result;
	try {
		result = options.parse(argc, argv);
	} catch (const std::exception& e) {
		LOG(ERROR) << "Invalid arguments: " << e.what();
		return 1;
	}
	if (result.count("help")) {
		std::cout << options.help() << std::endl;
		return 0;
	}
	FLAGS_v = result["log_level"].as<int>();

	Reloaded::Configuration& configuration = Reloaded::Configuration::getInstance();
	if (result.count("config") && !configuration.loadFromFile(result["config"].as<std::string>())) {
		for (const auto& error : configuration.getValidationErrors()) {
			LOG(ERROR) << "Configuration: " << error;
		}
		return 1;
	}

	Reloaded::ReloadedConfig& config = configuration.config();
	if (result.count("homeserver")) config.simulation.homeserver_url.set(result["homeserver"].as<std::string>());
	if (result.count("steps")) config.simulation.total_steps.set(result["steps"].as<size_t>());
	if (result.count("users_per_step")) config.simulation.users_per_step.set(result["users_per_step"].as<size_t>());
	if (result.count("friendship_ratio")) config.simulation.friendship_ratio.set(result["friendship_ratio"].as<double>());
	if (result.count("output_dir")) config.simulation.output_dir.set(result["output_dir"].as<std::string>());

	if (!configuration.validate()) {
		for (const auto& error : configuration.getValidationErrors()) {
			LOG(ERROR) << "Configuration: " << error;
		}
		return 1;
	}
	LogConfiguration(config);

	// In-process homeserver standing in for the server under test
	Reloaded::LocalHomeserverOptions server_options;
	server_options.server_name = Reloaded::ParseHomeserver(config.simulation.homeserver_url.get()).first;
	server_options.latency = std::chrono::milliseconds(config.homeserver.latency_ms.get());
	server_options.failure_rate = config.homeserver.failure_rate.get();
	server_options.seed = config.homeserver.seed.get();
	auto server = std::make_shared<Reloaded::LocalHomeserver>(server_options);

	const std::string& users_filename = config.state.users_filename.get();
	Reloaded::UsersState users_state = Reloaded::UsersState::Load(users_filename);
	size_t previous_users = users_state.TotalUsers(config.simulation.homeserver_url.get());
	if (previous_users > 0) {
		LOG(INFO) << previous_users << " users already created against this homeserver by earlier runs";
	}

	const uint64_t execution_id = Reloaded::TimeNowMs();
	Reloaded::Simulation simulation(Reloaded::SimulationOptions::FromConfig(config),
			[server]() { return std::make_unique<Reloaded::LocalClient>(server); }, execution_id);

	Reloaded::ProgressTracker progress;
	simulation.SetProgressCallback(progress.AsCallback());

	Reloaded::ResultWriter writer(config.simulation.output_dir.get());
	simulation.SetReportSink([&writer](const Reloaded::StepReport& report) {
		writer.Write(report);
	});

	std::signal(SIGINT, [](int) { g_stop_requested.store(true); });
	std::signal(SIGTERM, [](int) { g_stop_requested.store(true); });
	std::atomic<bool> finished{false};
	std::thread stop_watcher([&simulation, &finished]() {
		while (!finished.load()) {
			if (g_stop_requested.load()) {
				LOG(INFO) << "Received shutdown signal, finishing the current step";
				simulation.RequestStop();
				return;
			}
			std::this_thread::sleep_for(std::chrono::milliseconds(100));
		}
	});

	int exit_code = 0;
	try {
		size_t steps = simulation.Run();
		LOG(INFO) << "Finished " << steps << " step(s) of execution " << execution_id;
	} catch (const Reloaded::ChannelClosedError& e) {
		LOG(ERROR) << "Metrics channel failed, aborting: " << e.what();
		exit_code = 1;
	}
	finished.store(true);
	stop_watcher.join();

	Reloaded::SavedUserState saved;
	saved.homeserver_url = config.simulation.homeserver_url.get();
	saved.amount = simulation.users().size();
	for (const auto& [first, second] : simulation.friendships().pairs()) {
		saved.friendships.emplace_back(simulation.users()[first]->localpart(),
				simulation.users()[second]->localpart());
	}
	users_state.AddUsers(execution_id, std::move(saved));
	if (!users_state.Save(users_filename)) {
		LOG(WARNING) << "Users state not saved, counters of this run are lost";
	}

	return exit_code;
}
