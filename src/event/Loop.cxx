// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Loop.hxx"

#include <cassert>
#include <stdexcept>

EventLoop::EventLoop()
	:event_base(::event_base_new())
{
	if (event_base == nullptr)
		throw std::runtime_error("event_base_new() failed");
}

EventLoop::~EventLoop() noexcept
{
	assert(defer.empty());

	::event_base_free(event_base);
}

void
EventLoop::Defer(DeferEvent &e) noexcept
{
	defer.push_back(e);
}

void
EventLoop::CancelDefer(DeferEvent &e) noexcept
{
	defer.erase(defer.iterator_to(e));
}

bool
EventLoop::RunDeferred() noexcept
{
	while (!defer.empty() && !quit)
		defer.pop_front_and_dispose([](DeferEvent *e){
			e->OnDeferred();
		});

	return true;
}
