#include "task_pool.h"
#include <glog/logging.h>

namespace Reloaded {

TaskPool::TaskPool(size_t num_threads) {
	if (num_threads == 0) {
		num_threads = 1;
	}
	for (size_t i = 0; i < num_threads; ++i) {
		workers_.emplace_back(&TaskPool::WorkerThread, this);
	}
	VLOG(3) << "[TaskPool]: Constructed with " << num_threads << " workers";
}

TaskPool::~TaskPool() {
	Stop();
}

void TaskPool::Stop() {
	{
		std::lock_guard<std::mutex> lock(queue_mutex_);
		stop_ = true;
	}
	condition_.notify_all();

	for (auto& worker : workers_) {
		if (worker.joinable()) {
			worker.join();
		}
	}
}

void TaskPool::WorkerThread() {
	while (true) {
		std::function<void()> task;

		{
			std::unique_lock<std::mutex> lock(queue_mutex_);
			condition_.wait(lock, [this] { return stop_ || !tasks_.empty(); });

			if (stop_ && tasks_.empty()) {
				return;
			}

			task = std::move(tasks_.front());
			tasks_.pop();
		}

		// packaged_task stores exceptions in the future
		task();
	}
}

} // namespace Reloaded
