#pragma once

#include <algorithm>
#include <cstdint>

// Bounded retry with exponential backoff.  Attempts are counted from 1 for the first retry.
struct RetryPolicy {
	unsigned int max_retries;
	unsigned int backoff_ms;
	unsigned int backoff_factor;
	unsigned int backoff_max_ms;

	bool exhausted(unsigned int attempt) const {
		return attempt > max_retries;
	}

	unsigned int delay_ms(unsigned int attempt) const {
		uint64_t delay = backoff_ms;
		for (unsigned int i = 1; i < attempt && delay < backoff_max_ms; i++)
			delay *= std::max(1U, backoff_factor);
		return static_cast<unsigned int>(std::min<uint64_t>(delay, backoff_max_ms));
	}
};
