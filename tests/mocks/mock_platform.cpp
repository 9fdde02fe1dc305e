#include "platform.hpp"

#include "CppUTestExt/MockSupport.h"

void Platform::delay_ms(unsigned ms)
{
	mock().actualCall("delay_ms").withParameter("ms", ms);
}

uint64_t Platform::uptime_ms()
{
	return 0;
}
