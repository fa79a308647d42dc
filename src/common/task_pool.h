#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <type_traits>
#include <vector>

namespace Reloaded {

/**
 * Fixed-size worker pool. The worker count doubles as the concurrency cap for
 * whatever is submitted to it, so a pool of N runs at most N tasks at once.
 */
class TaskPool {
public:
	explicit TaskPool(size_t num_threads = 4);
	~TaskPool();

	TaskPool(const TaskPool&) = delete;
	TaskPool& operator=(const TaskPool&) = delete;

	// Execute callable asynchronously
	template<typename Callable>
	auto Submit(Callable&& callable)
		-> std::future<typename std::invoke_result<Callable>::type> {
		using ReturnType = typename std::invoke_result<Callable>::type;

		auto task = std::make_shared<std::packaged_task<ReturnType()>>(
				std::forward<Callable>(callable));

		auto future = task->get_future();

		{
			std::lock_guard<std::mutex> lock(queue_mutex_);
			tasks_.emplace([task]() { (*task)(); });
		}

		condition_.notify_one();
		return future;
	}

	size_t size() const { return workers_.size(); }

	// Drains queued tasks, then joins the workers
	void Stop();

private:
	void WorkerThread();

	std::vector<std::thread> workers_;
	std::queue<std::function<void()>> tasks_;
	std::mutex queue_mutex_;
	std::condition_variable condition_;
	std::atomic<bool> stop_{false};
};

} // namespace Reloaded
