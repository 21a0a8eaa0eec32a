// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "TimerEvent.hxx"

void
TimerEvent::Schedule(std::chrono::steady_clock::duration d) noexcept
{
	const auto us = std::chrono::duration_cast<std::chrono::microseconds>(d);

	struct timeval tv;
	tv.tv_sec = us.count() / 1000000;
	tv.tv_usec = us.count() % 1000000;

	::evtimer_add(&event, &tv);
}
