#pragma once

#include <chrono>
#include <cstdint>
#include <random>

namespace Reloaded {

// Milliseconds since the unix epoch; doubles as the execution id of a run
inline uint64_t TimeNowMs() {
	return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
			std::chrono::system_clock::now().time_since_epoch()).count());
}

inline std::mt19937_64& ThreadLocalRng() {
	static thread_local std::mt19937_64 gen(std::random_device{}());
	return gen;
}

} // namespace Reloaded
