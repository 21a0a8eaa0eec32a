// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Loop.hxx"
#include "util/BindMethod.hxx"

#include <chrono>

#include <event.h>

/**
 * Invoke an event callback after a certain amount of time.
 */
class TimerEvent final {
	struct event event;

	using Callback = BoundMethod<void() noexcept>;
	const Callback callback;

public:
	TimerEvent(EventLoop &loop, Callback _callback) noexcept
		:callback(_callback)
	{
		::evtimer_assign(&event, loop.Get(), TimerCallback, this);
	}

	~TimerEvent() noexcept {
		Cancel();
	}

	TimerEvent(const TimerEvent &) = delete;
	TimerEvent &operator=(const TimerEvent &) = delete;

	bool IsPending() const noexcept {
		return ::evtimer_pending(&event, nullptr);
	}

	void Schedule(std::chrono::steady_clock::duration d) noexcept;

	void Cancel() noexcept {
		::evtimer_del(&event);
	}

private:
	static void TimerCallback(evutil_socket_t, short, void *ctx) noexcept {
		auto &t = *(TimerEvent *)ctx;
		t.callback();
	}
};
