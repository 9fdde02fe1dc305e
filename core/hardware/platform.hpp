#pragma once

#include <cstdint>

class Platform {
public:
	static void delay_ms(unsigned ms);
	static uint64_t uptime_ms();
};
