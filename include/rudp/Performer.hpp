#pragma once

// Copyright © 2021 Michael Thornburgh
// SPDX-License-Identifier: MIT

#include "RunLoop.hpp"

#include <mutex>

namespace com { namespace arena {

// Hands tasks from any thread to the thread running runLoop, in order.
class Performer : public Object {
public:
	Performer(RunLoop *runLoop);
	~Performer();

	// Answers false if this performer has been closed and task was dropped.
	bool perform(const Task &task, bool wait = false);

	// Run task now if called on the run loop's thread, otherwise perform() it.
	bool performOrRun(const Task &task);

	size_t getPendingCount();

	void close();

protected:
	struct Item;

	void onSignaled();
	void fireItems();

	RunLoop         *m_runLoop;
	int              m_pipe[2];
	std::mutex       m_mutex;
	std::queue<std::shared_ptr<Item> > m_items;
	std::atomic_bool m_signaled;
	std::atomic_bool m_closed;
};

} } // namespace com::arena
