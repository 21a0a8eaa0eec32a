// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "DeferEvent.hxx"

#include <boost/intrusive/list.hpp>

#include <event.h>

/**
 * Wrapper for a struct event_base, plus a list of #DeferEvent
 * instances which are run before and after each libevent iteration.
 */
class EventLoop {
	struct event_base *const event_base;

	boost::intrusive::list<DeferEvent,
			       boost::intrusive::member_hook<DeferEvent,
							     DeferEvent::SiblingsHook,
							     &DeferEvent::siblings>,
			       boost::intrusive::constant_time_size<false>> defer;

	bool quit = false;

public:
	EventLoop();
	~EventLoop() noexcept;

	EventLoop(const EventLoop &other) = delete;
	EventLoop &operator=(const EventLoop &other) = delete;

	struct event_base *Get() noexcept {
		return event_base;
	}

	/**
	 * Run the loop until Break() is called or until there are no
	 * more registered events.
	 */
	void Dispatch() noexcept {
		quit = false;

		RunDeferred();
		while (!quit && Loop(EVLOOP_ONCE) && !quit)
			RunDeferred();
	}

	bool LoopNonBlock() noexcept {
		return RunDeferred() && Loop(EVLOOP_NONBLOCK) && RunDeferred();
	}

	bool LoopOnce() noexcept {
		return RunDeferred() && Loop(EVLOOP_ONCE) && RunDeferred();
	}

	void Break() noexcept {
		quit = true;
		::event_base_loopbreak(event_base);
	}

	void Defer(DeferEvent &e) noexcept;
	void CancelDefer(DeferEvent &e) noexcept;

private:
	bool Loop(int flags) noexcept {
		return ::event_base_loop(event_base, flags) == 0;
	}

	bool RunDeferred() noexcept;
};
