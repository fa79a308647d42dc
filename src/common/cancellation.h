#pragma once

#include <atomic>
#include <memory>

namespace Reloaded {

/**
 * Shared stop flag. Copies observe the same flag; whoever holds a copy may
 * request the stop, every holder polls it without blocking.
 */
class CancellationToken {
public:
	CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

	void Cancel() const { flag_->store(true, std::memory_order_release); }

	bool IsCancelled() const { return flag_->load(std::memory_order_acquire); }

	bool SharesStateWith(const CancellationToken& other) const {
		return flag_ == other.flag_;
	}

private:
	std::shared_ptr<std::atomic<bool>> flag_;
};

} // namespace Reloaded
