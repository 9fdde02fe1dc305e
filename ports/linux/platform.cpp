#include <chrono>
#include <thread>

#include "platform.hpp"

static const std::chrono::steady_clock::time_point boot_time = std::chrono::steady_clock::now();

void Platform::delay_ms(unsigned ms) {
	std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

uint64_t Platform::uptime_ms() {
	return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - boot_time).count();
}
